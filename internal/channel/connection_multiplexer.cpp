#include "connection_multiplexer.hpp"

#include <stdexcept>

#include "frame_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/session/frames.hpp"
#include "internal/util/errors.hpp"

namespace upload::channel {

using upload::manager::v1::ClientFrame;
using observability::IntField;
using observability::StringField;

ConnectionMultiplexer::ConnectionMultiplexer(std::shared_ptr<session::SessionTable> sessions, MultiplexerOptions options)
    : sessions_(std::move(sessions)), options_(options) {
  if (!sessions_) {
    throw std::invalid_argument("ConnectionMultiplexer: session table is required");
  }
}

void ConnectionMultiplexer::Bind(const std::shared_ptr<Connection>& connection, const std::string& token) {
  auto machine = sessions_->Acquire(token);
  auto info    = machine->Describe();

  std::shared_ptr<Connection> replaced;
  std::size_t                 live = 0;
  {
    std::lock_guard lock(mutex_);

    if (auto it = by_connection_.find(connection->Id()); it != by_connection_.end()) {
      auto bound = by_token_.find(it->second.token);
      if (bound != by_token_.end() && bound->second == connection->Id()) {
        by_token_.erase(bound);
      }
      by_connection_.erase(it);
    }

    if (auto bound = by_token_.find(token); bound != by_token_.end()) {
      if (auto old = by_connection_.find(bound->second); old != by_connection_.end()) {
        replaced = old->second.connection;
        by_connection_.erase(old);
      }
      by_token_.erase(bound);
    }

    by_connection_[connection->Id()] = Binding{connection, token, machine, 0};
    by_token_[token]                 = connection->Id();
    live                             = by_connection_.size();
  }

  if (replaced) {
    UPLOAD_LOG_INFO("connection replaced", {StringField("connection", replaced->Id()), StringField("by", connection->Id())});
    replaced->Close(kReplaced);
  }
  PublishLiveConnections(live);

  UPLOAD_LOG_INFO("connection bound", {StringField("connection", connection->Id()), observability::TokenField("session", token)});
  if (!connection->Send(info)) {
    UPLOAD_LOG_DEBUG("session_info not delivered", {StringField("connection", connection->Id())});
  }
}

bool ConnectionMultiplexer::Dispatch(const Connection& connection, const ClientFrame& frame) {
  if (frame.type().empty()) {
    return RecordMalformed(connection, "missing type");
  }

  std::shared_ptr<session::UploadStateMachine> machine;
  std::shared_ptr<Connection>                  target;
  {
    std::lock_guard lock(mutex_);
    auto            it = by_connection_.find(connection.Id());
    if (it == by_connection_.end()) {
      return false;
    }
    machine = it->second.machine;
    target  = it->second.connection;
  }

  observability::ScopedLogContext log_context{StringField("connection", connection.Id())};
  observability::SpanScope span("upload.dispatch");
  span.SetAttribute("type", frame.type());

  const auto frames = machine->Handle(frame);

  bool ok = true;
  for (const auto& out : frames) {
    ok = ok && out.type() != session::kErrorFrame;
    if (!target->Send(out)) {
      UPLOAD_LOG_DEBUG("frame not delivered", {StringField("type", out.type())});
      break;
    }
  }
  observability::Metrics::Instance().RecordRequest("Upload", ok);
  return true;
}

bool ConnectionMultiplexer::DispatchRaw(const Connection& connection, std::string_view text) {
  ClientFrame frame;
  try {
    frame = DecodeClientFrame(text);
  } catch (const util::MalformedFrame& e) {
    return RecordMalformed(connection, e.what());
  }
  return Dispatch(connection, frame);
}

bool ConnectionMultiplexer::RecordMalformed(const Connection& connection, std::string_view error) {
  std::shared_ptr<Connection> to_close;
  uint32_t                    count = 0;
  std::size_t                 live  = 0;
  {
    std::lock_guard lock(mutex_);
    auto            it = by_connection_.find(connection.Id());
    if (it == by_connection_.end()) {
      return false;
    }

    count = ++it->second.malformed;
    if (count > options_.malformed_message_threshold) {
      to_close = it->second.connection;
      by_token_.erase(it->second.token);
      by_connection_.erase(it);
      live = by_connection_.size();
    }
  }

  UPLOAD_LOG_WARN("malformed frame ignored", {StringField("connection", connection.Id()), IntField("count", count), StringField("error", error)});
  observability::Metrics::Instance().RecordMalformedFrame(to_close != nullptr);
  if (!to_close) {
    return true;
  }

  UPLOAD_LOG_WARN("closing connection after repeated malformed frames", {StringField("connection", connection.Id())});
  to_close->Close(kMalformed);
  PublishLiveConnections(live);
  return false;
}

void ConnectionMultiplexer::Unbind(const Connection& connection, std::string_view reason) {
  std::size_t live = 0;
  {
    std::lock_guard lock(mutex_);
    auto            it = by_connection_.find(connection.Id());
    if (it == by_connection_.end()) {
      return;
    }

    auto bound = by_token_.find(it->second.token);
    if (bound != by_token_.end() && bound->second == connection.Id()) {
      by_token_.erase(bound);
    }
    by_connection_.erase(it);
    live = by_connection_.size();
  }

  UPLOAD_LOG_INFO("connection unbound", {StringField("connection", connection.Id()), StringField("reason", reason)});
  PublishLiveConnections(live);
}

std::size_t ConnectionMultiplexer::LiveConnections() const {
  std::lock_guard lock(mutex_);
  return by_connection_.size();
}

std::string ConnectionMultiplexer::BoundToken(const Connection& connection) const {
  std::lock_guard lock(mutex_);
  auto            it = by_connection_.find(connection.Id());
  return it == by_connection_.end() ? std::string{} : it->second.token;
}

void ConnectionMultiplexer::PublishLiveConnections(std::size_t live) const {
  observability::Metrics::Instance().SetLiveConnections(static_cast<std::int64_t>(live));
}

} // namespace upload::channel
