#pragma once

#include <cstdint>

#include "internal/util/address.hpp"

namespace vesting::db::model {

enum class Role : uint8_t {
  kAdmin   = 1,
  kManager = 2,
};

/*
  Role membership row. seq preserves insertion order so listings are
  stable across removals.
*/
struct RoleMemberRecord {
  Role          role = Role::kManager;
  util::Address member;
  uint64_t      seq        = 0;
  uint64_t      granted_at = 0;
};

} // namespace vesting::db::model
