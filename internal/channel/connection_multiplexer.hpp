#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "connection.hpp"
#include "internal/session/session_table.hpp"

namespace upload::channel {

struct MultiplexerOptions {
  // malformed frames tolerated per connection; one more closes it
  uint32_t malformed_message_threshold = 8;
};

/*
  Binds live connections to session state machines.

  At most one connection per token. A second Bind() for a token replaces
  the first: the old connection is unbound and closed with reason
  "replaced". Unbinding never cancels the session.

  Frames for a session are handled by its state machine under the
  machine's mutex; the binding tables here are only touched under mutex_,
  which is never held across a Send or a registry call.
*/
class ConnectionMultiplexer {
 public:
  static constexpr std::string_view kReplaced  = "replaced";
  static constexpr std::string_view kMalformed = "malformed_message_threshold";

  ConnectionMultiplexer(std::shared_ptr<session::SessionTable> sessions, MultiplexerOptions options = {});

  // NotFound / Expired / SessionNotActive reject the bind.
  // On success session_info has been sent on the connection.
  void Bind(const std::shared_ptr<Connection>& connection, const std::string& token);

  // false when the connection is not (or no longer) bound
  bool Dispatch(const Connection& connection, const upload::manager::v1::ClientFrame& frame);

  // JSON text frame; malformed envelopes are counted and dropped.
  bool DispatchRaw(const Connection& connection, std::string_view text);

  void Unbind(const Connection& connection, std::string_view reason);

  std::size_t LiveConnections() const;

  // token currently bound to the connection, "" if none
  std::string BoundToken(const Connection& connection) const;

 private:
  struct Binding {
    std::shared_ptr<Connection>                  connection;
    std::string                                  token;
    std::shared_ptr<session::UploadStateMachine> machine;
    uint32_t                                     malformed = 0;
  };

  // true when the connection stays open
  bool RecordMalformed(const Connection& connection, std::string_view error);
  void PublishLiveConnections(std::size_t live) const;

  std::shared_ptr<session::SessionTable> sessions_;
  MultiplexerOptions                     options_;

  mutable std::mutex                           mutex_;
  std::unordered_map<std::string, Binding>     by_connection_;
  std::unordered_map<std::string, std::string> by_token_;
};

} // namespace upload::channel
