#pragma once

#include <string_view>

#include "upload/manager/v1/types.pb.h"

namespace upload::model {

using upload::manager::v1::SessionStatus;

/*
  Session lifecycle.

      active ──► completing ──► completed
        ▲            │
        └────────────┘   (finalize failed)
      active ──► cancelled
      active ──► expired

  completed / cancelled / expired are terminal.
*/

constexpr bool IsTerminal(SessionStatus status) {
  return status == upload::manager::v1::SESSION_STATUS_COMPLETED || status == upload::manager::v1::SESSION_STATUS_CANCELLED ||
         status == upload::manager::v1::SESSION_STATUS_EXPIRED;
}

constexpr bool CanTransition(SessionStatus from, SessionStatus to) {
  using namespace upload::manager::v1;

  if (IsTerminal(from)) {
    return false;
  }
  switch (from) {
    case SESSION_STATUS_ACTIVE:
      return to == SESSION_STATUS_ACTIVE || to == SESSION_STATUS_COMPLETING || to == SESSION_STATUS_CANCELLED || to == SESSION_STATUS_EXPIRED;
    case SESSION_STATUS_COMPLETING:
      return to == SESSION_STATUS_COMPLETED || to == SESSION_STATUS_ACTIVE;
    default:
      return false;
  }
}

constexpr std::string_view StatusName(SessionStatus status) {
  using namespace upload::manager::v1;

  switch (status) {
    case SESSION_STATUS_ACTIVE:
      return "active";
    case SESSION_STATUS_COMPLETING:
      return "completing";
    case SESSION_STATUS_COMPLETED:
      return "completed";
    case SESSION_STATUS_CANCELLED:
      return "cancelled";
    case SESSION_STATUS_EXPIRED:
      return "expired";
    default:
      return "unspecified";
  }
}

} // namespace upload::model
