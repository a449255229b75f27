#pragma once

#include <ankerl/unordered_dense.h>

namespace warden::core {

// Container aliases backed by ankerl::unordered_dense.
// Dense storage with fast iteration; iterators invalidate on insertion
// (like std::vector), so never hold one across an insert.
//
// Usage:
//   warden::core::fast_map<std::string, TokenBucket> buckets;
//   warden::core::fast_set<std::string> allowed_hosts;

template <typename Key, typename Value>
using fast_map = ankerl::unordered_dense::map<Key, Value>;

template <typename Key>
using fast_set = ankerl::unordered_dense::set<Key>;

}  // namespace warden::core
