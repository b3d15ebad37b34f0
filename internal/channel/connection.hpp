#pragma once

#include <string>
#include <string_view>

#include "upload/manager/v1/channel.pb.h"

namespace upload::channel {

/*
  One live duplex connection as seen by the multiplexer.

  Send may be called from any thread; implementations serialize writes.
  Close must unblock whoever is reading from the connection.
*/
class Connection {
 public:
  virtual ~Connection() = default;

  virtual const std::string& Id() const = 0;

  // false once the peer is gone or the connection was closed
  virtual bool Send(const upload::manager::v1::ServerFrame& frame) = 0;

  virtual void Close(std::string_view reason) = 0;
};

} // namespace upload::channel
