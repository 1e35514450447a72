/* Twine
 * Copyright 2026 The Twine Authors.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#pragma once

#include "twine/util/util_fwd.hpp"
#include "twine/common.hpp"
#include <boost/functional/hash.hpp>
#include <cstdint>
#include <functional>
#include <ostream>

/**
 * Twine module containing the list-ordered multimap, Ordered_multimap, and the stable-handle slab it is built on,
 * Ordered_arena.
 *
 * Ordered_multimap is a hash multimap that remembers two orders at once.  The *global order* is the order in which
 * (key, value) pairs were appended, across all keys; iterating the map walks it.  The *key-local order* is the order
 * of one key's values; get_all() walks it.  Both are doubly linked lists threaded through arena slots, so insertion
 * and removal anywhere are O(1), and lookup by key is one hash probe.
 *
 * Nothing here is thread-safe: one thread at a time, as with standard containers.  Iterators detect (and throw on)
 * use after a structural mutation of their container; see error::Code::S_ITERATOR_INVALIDATED.
 */
namespace twine::container
{

// Types.

// Find doc headers near the bodies of these compound types.

struct Arena_handle;
template<typename Payload>
class Ordered_arena;
template<typename Key, typename Value, typename Hash = boost::hash<Key>, typename Pred = std::equal_to<Key>>
class Ordered_multimap;
template<typename Map>
class Ordered_multimap_entry;
template<typename Map>
class Ordered_multimap_occupied_entry;
template<typename Map>
class Ordered_multimap_vacant_entry;

// Free functions.

/**
 * Returns `true` if and only if the two handles have equal index and generation.
 *
 * @relatesalso Arena_handle
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 * @return See above.
 */
bool operator==(const Arena_handle& val1, const Arena_handle& val2);

/**
 * Negation of the similar `==`.
 *
 * @relatesalso Arena_handle
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 * @return See above.
 */
bool operator!=(const Arena_handle& val1, const Arena_handle& val2);

/**
 * Hash for `boost::hash` (and boost.unordered containers) of handles.
 *
 * @relatesalso Arena_handle
 * @param val
 *        Object.
 * @return See above.
 */
size_t hash_value(const Arena_handle& val);

/**
 * Prints the handle as `[<index>@<generation>]`, or `[null]`.
 *
 * @relatesalso Arena_handle
 * @param os
 *        Stream to print to.
 * @param val
 *        Object.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Arena_handle& val);

/**
 * Equivalent to `val1.swap(val2)`.
 *
 * @relatesalso Ordered_arena
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 */
template<typename Payload>
void swap(Ordered_arena<Payload>& val1, Ordered_arena<Payload>& val2);

/**
 * Returns `true` if and only if the two maps have the same set of keys, and for each key the same sequence of
 * values in key-local order.  How the keys' values interleave in global order does not matter.
 *
 * @relatesalso Ordered_multimap
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 * @return See above.
 */
template<typename Key, typename Value, typename Hash, typename Pred>
bool operator==(const Ordered_multimap<Key, Value, Hash, Pred>& val1,
                const Ordered_multimap<Key, Value, Hash, Pred>& val2);

/**
 * Negation of the similar `==`.
 *
 * @relatesalso Ordered_multimap
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 * @return See above.
 */
template<typename Key, typename Value, typename Hash, typename Pred>
bool operator!=(const Ordered_multimap<Key, Value, Hash, Pred>& val1,
                const Ordered_multimap<Key, Value, Hash, Pred>& val2);

/**
 * Prints the map's pairs in global order, as in `{a: 1, b: 2, a: 3}`.  `Key` and `Value` must be `ostream`-printable.
 *
 * @relatesalso Ordered_multimap
 * @param os
 *        Stream to print to.
 * @param val
 *        Object.
 * @return `os`.
 */
template<typename Key, typename Value, typename Hash, typename Pred>
std::ostream& operator<<(std::ostream& os, const Ordered_multimap<Key, Value, Hash, Pred>& val);

/**
 * Equivalent to `val1.swap(val2)`.
 *
 * @relatesalso Ordered_multimap
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 */
template<typename Key, typename Value, typename Hash, typename Pred>
void swap(Ordered_multimap<Key, Value, Hash, Pred>& val1, Ordered_multimap<Key, Value, Hash, Pred>& val2);

} // namespace twine::container
