#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace upload::util {

/*
  Identifier helpers

  Artifact ids are RFC4122 v4 UUIDs in canonical text form.
  Session tokens are 32 bytes from the OS entropy source, base64url encoded
  without padding (43 characters).
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

std::string GenerateSessionToken();

} // namespace upload::util
