#pragma once

#include <cstdint>
#include <memory>

namespace upload::registry { class SessionRegistry; }
namespace upload::session { class SessionTable; }
namespace upload::channel { class ConnectionMultiplexer; }

namespace upload::service {

/*
  Dependency container shared by the services.
*/
struct ServiceContext {
  std::shared_ptr<upload::registry::SessionRegistry>       registry;
  std::shared_ptr<upload::session::SessionTable>           sessions;
  std::shared_ptr<upload::channel::ConnectionMultiplexer>  multiplexer;

  // used when CreateSession asks for chunk_size 0
  uint32_t default_chunk_size = 1024 * 1024;
};

}
