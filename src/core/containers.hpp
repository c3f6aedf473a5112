#pragma once

#include <ankerl/unordered_dense.h>

namespace conduit::core {

// Container aliases over ankerl::unordered_dense.
// Dense storage with vector-like iterator invalidation (invalidates on insertion).
//
// Usage:
//   conduit::core::fast_map<std::string, CacheSlot> slots;
//   conduit::core::fast_set<std::string> visited;

template <typename Key, typename Value>
using fast_map = ankerl::unordered_dense::map<Key, Value>;

template <typename Key>
using fast_set = ankerl::unordered_dense::set<Key>;

}  // namespace conduit::core
