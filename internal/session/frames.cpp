#include "frames.hpp"

#include <google/protobuf/util/time_util.h>

#include "internal/model/session_state.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace upload::session {

namespace {

using google::protobuf::Struct;
using google::protobuf::Value;

void SetString(Struct* data, const std::string& key, const std::string& value) {
  (*data->mutable_fields())[key].set_string_value(value);
}

void SetNumber(Struct* data, const std::string& key, double value) {
  (*data->mutable_fields())[key].set_number_value(value);
}

void SetBool(Struct* data, const std::string& key, bool value) {
  (*data->mutable_fields())[key].set_bool_value(value);
}

ServerFrame Frame(const char* type) {
  ServerFrame frame;
  frame.set_type(type);
  frame.mutable_data();
  return frame;
}

} // namespace

ServerFrame MakeSessionInfoFrame(const db::model::SessionRecord& session, const std::vector<uint32_t>& missing_chunks) {
  auto  frame = Frame(kSessionInfoFrame);
  auto* data  = frame.mutable_data();

  SetString(data, "video_id", session.artifact_id);
  SetString(data, "filename", session.filename);
  SetNumber(data, "file_size", static_cast<double>(session.file_size));
  SetNumber(data, "chunk_size", session.chunk_size);
  SetNumber(data, "total_chunks", session.total_chunks);
  SetNumber(data, "received_chunks", session.received_chunks);
  SetString(data, "status", std::string(model::StatusName(session.status)));
  SetString(data, "expires_at", google::protobuf::util::TimeUtil::ToString(util::MillisToProto(session.expires_at_ms)));

  auto* missing = (*data->mutable_fields())["missing_chunks"].mutable_list_value();
  for (auto index : missing_chunks) {
    missing->add_values()->set_number_value(index);
  }
  return frame;
}

ServerFrame MakeProgressFrame(uint32_t received_chunks, uint32_t total_chunks, uint32_t chunk_index) {
  auto  frame = Frame(kProgressFrame);
  auto* data  = frame.mutable_data();

  SetNumber(data, "progress", total_chunks == 0 ? 0.0 : static_cast<double>(received_chunks) / total_chunks);
  SetNumber(data, "received_chunks", received_chunks);
  SetNumber(data, "total_chunks", total_chunks);
  SetNumber(data, "chunk_index", chunk_index);
  return frame;
}

ServerFrame MakeCompleteFrame(const db::model::SessionRecord& session) {
  auto  frame = Frame(kUploadCompleteFrame);
  auto* data  = frame.mutable_data();

  SetString(data, "video_id", session.artifact_id);
  SetString(data, "filename", session.filename);
  SetNumber(data, "size", static_cast<double>(session.file_size));
  SetString(data, "path", session.artifact_path);
  return frame;
}

ServerFrame MakeCancelledFrame(const db::model::SessionRecord& session) {
  auto frame = Frame(kUploadCancelledFrame);
  SetString(frame.mutable_data(), "video_id", session.artifact_id);
  SetNumber(frame.mutable_data(), "received_chunks", session.received_chunks);
  return frame;
}

ServerFrame MakeErrorFrame(const std::exception& e, bool retryable, bool fatal) {
  auto  frame = Frame(kErrorFrame);
  auto* data  = frame.mutable_data();

  frame.set_message(e.what());
  SetString(data, "code", util::ErrorCode(e));
  SetBool(data, "retryable", retryable);
  SetBool(data, "fatal", fatal);
  return frame;
}

} // namespace upload::session
