#pragma once

#include <ankerl/unordered_dense.h>

namespace switchback::core {

// Hash container aliases backed by ankerl::unordered_dense.
// Dense storage: iteration is contiguous, and insertion invalidates
// iterators like std::vector does.
//
// Usage:
//   switchback::core::fast_map<std::string, size_t> index_by_name;

template <typename Key, typename Value>
using fast_map = ankerl::unordered_dense::map<Key, Value>;

template <typename Key>
using fast_set = ankerl::unordered_dense::set<Key>;

}  // namespace switchback::core
