#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "internal/channel/connection.hpp"
#include "internal/db/model/session_record.hpp"
#include "service_context.hpp"
#include "upload/manager/v1.hpp"

namespace upload::service {

/*
  Transport-independent session API.

  subject is the caller identity handed over by the transport; an empty
  subject is Unauthorized. Sessions owned by someone else are reported as
  NotFound.
*/
class UploadService {
 public:
  explicit UploadService(ServiceContext ctx);

  upload::manager::v1::CreateSessionResponse CreateSession(const std::string& subject,
                                                           const upload::manager::v1::CreateSessionRequest& req);

  upload::manager::v1::UploadSession GetSession(const std::string& subject, const upload::manager::v1::GetSessionRequest& req);

  // Idempotent for cancelled / expired sessions.
  void CancelSession(const std::string& subject, const upload::manager::v1::CancelSessionRequest& req);

  // Checks ownership and binds the connection; session_info is sent on success.
  void OpenChannel(const std::string& subject, const std::string& token, const std::shared_ptr<channel::Connection>& connection);

  // false once the connection has been unbound (replaced, or closed for abuse)
  bool Dispatch(const channel::Connection& connection, const upload::manager::v1::ClientFrame& frame);

  void CloseChannel(const channel::Connection& connection, std::string_view reason);

 private:
  db::model::SessionRecord OwnedSession(const std::string& subject, const std::string& token);

  ServiceContext ctx_;
};

upload::manager::v1::UploadSession ToUploadSession(const db::model::SessionRecord& record);

} // namespace upload::service
