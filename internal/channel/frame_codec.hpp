#pragma once

#include <string>
#include <string_view>

#include "upload/manager/v1/channel.pb.h"

namespace upload::channel {

/*
  JSON form of the channel frames, for text transports:

    {"type":"chunk","chunk_index":3,"chunk_data":"<base64>","chunk_digest":"..."}
    {"type":"cancel"}

  Unknown keys are ignored. Anything that is not a JSON object carrying a
  non-empty "type" is MalformedFrame.
*/
upload::manager::v1::ClientFrame DecodeClientFrame(std::string_view text);

std::string EncodeServerFrame(const upload::manager::v1::ServerFrame& frame);

} // namespace upload::channel
