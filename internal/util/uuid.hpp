#pragma once

#include <cstddef>
#include <string>

namespace flotilla::util {

// Random RFC 4122 version 4 UUID in canonical lowercase form, used as the
// backend id.
std::string NewUuid();

// 2 * bytes lowercase hex characters.
std::string RandomToken(std::size_t bytes);

} // namespace flotilla::util
