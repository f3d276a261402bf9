#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace flotilla::db::model {

/*
  One row of the append-only event table.

  id is assigned by the repository on append and is strictly increasing
  within one store, which makes it usable as a subscription cursor.
*/
struct EventRecord {
  uint64_t                   id           = 0;
  uint64_t                   timestamp_ms = 0;
  std::optional<std::string> key;
  std::string                kind;
  std::string                payload_json;
};

} // namespace flotilla::db::model
