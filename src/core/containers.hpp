#pragma once

#include <ankerl/unordered_dense.h>

namespace wren::core {

// Hash container aliases over ankerl::unordered_dense.
// Dense storage keeps iteration cheap for the small per-node and
// per-request maps this library builds. Iterators invalidate on insertion,
// like std::vector.
//
// Usage:
//   wren::core::fast_map<std::string, std::unique_ptr<RouteNode>> children;
//   wren::core::fast_set<std::string> seen_names;

template <typename Key, typename Value>
using fast_map = ankerl::unordered_dense::map<Key, Value>;

template <typename Key>
using fast_set = ankerl::unordered_dense::set<Key>;

}  // namespace wren::core
