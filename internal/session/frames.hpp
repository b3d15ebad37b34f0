#pragma once

#include <exception>
#include <string>
#include <vector>

#include "internal/db/model/session_record.hpp"
#include "upload/manager/v1/channel.pb.h"

namespace upload::session {

using upload::manager::v1::ServerFrame;

inline constexpr const char* kSessionInfoFrame     = "session_info";
inline constexpr const char* kProgressFrame        = "progress";
inline constexpr const char* kUploadCompleteFrame  = "upload_complete";
inline constexpr const char* kUploadCancelledFrame = "upload_cancelled";
inline constexpr const char* kErrorFrame           = "error";

inline constexpr const char* kChunkMessage  = "chunk";
inline constexpr const char* kCancelMessage = "cancel";

ServerFrame MakeSessionInfoFrame(const db::model::SessionRecord& session, const std::vector<uint32_t>& missing_chunks);

ServerFrame MakeProgressFrame(uint32_t received_chunks, uint32_t total_chunks, uint32_t chunk_index);

// data: {video_id, filename, size, path}
ServerFrame MakeCompleteFrame(const db::model::SessionRecord& session);

ServerFrame MakeCancelledFrame(const db::model::SessionRecord& session);

// data: {code, retryable, fatal}; message carries e.what()
ServerFrame MakeErrorFrame(const std::exception& e, bool retryable = false, bool fatal = false);

} // namespace upload::session
