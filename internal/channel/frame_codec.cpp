#include "frame_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace upload::channel {

using upload::manager::v1::ClientFrame;
using upload::manager::v1::ServerFrame;

ClientFrame DecodeClientFrame(std::string_view text) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  ClientFrame frame;
  auto        status = google::protobuf::util::JsonStringToMessage(std::string(text), &frame, options);
  if (!status.ok()) {
    throw util::MalformedFrame("malformed frame: " + std::string(status.message()));
  }
  if (frame.type().empty()) {
    throw util::MalformedFrame("malformed frame: missing type");
  }
  return frame;
}

std::string EncodeServerFrame(const ServerFrame& frame) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(frame, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("encode server frame: " + std::string(status.message()));
  }
  return json;
}

} // namespace upload::channel
