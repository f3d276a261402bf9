#pragma once

#include <cstdint>
#include <string>

namespace flotilla::db::model {

struct KeyLockRecord {
  std::string cluster;
  std::string key;
  std::string backend_id;
  std::string tag;
  uint64_t    acquired_at_ms = 0;
};

} // namespace flotilla::db::model
