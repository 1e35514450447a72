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

#include "twine/container/container_fwd.hpp"
#include "twine/container/ordered_arena.hpp"
#include "twine/container/ordered_multimap_entry.hpp"
#include "twine/container/detail/chain_iterator.hpp"
#include "twine/container/error/error.hpp"
#include "twine/error/error.hpp"
#include "twine/log/log.hpp"
#include <boost/unordered_map.hpp>
#include <boost/range/iterator_range.hpp>
#include <boost/range/algorithm/equal.hpp>
#include <cassert>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <ostream>
#include <utility>
#include <vector>

namespace twine::container
{

// Types.

/**
 * Hash multimap that keeps insertion order twice over: the *global order* of all (key, value) pairs across keys,
 * and the *key-local order* of each key's values.  Think of a sequence of pairs, such as HTTP headers or the lines
 * of an INI section, that also needs O(1) lookup by key.
 *
 * ### Semantics ###
 *   - append() adds a pair at the end of the global order and at the end of its key's values.  It never removes.
 *   - insert() is the set-like replace: the key is left with one value, the new one, which takes over the global
 *     position of the key's first value; all previous values are returned.
 *   - remove() removes a key's first value; remove_all() all of them.  A key exists if and only if it has at least
 *     one value, so removing its last value removes the key.
 *   - Iterating the map (begin(), iter(), pairs()) walks `(key, value)` pairs in global order; values() walks the
 *     values in global order; keys() walks each live key once, in the order the keys were created; get_all()
 *     walks one key's values in key-local order.  All these are bidirectional.
 *   - Two maps are equal if they have the same keys and each key has the same value sequence; how the keys
 *     interleave globally does not matter.  A copy, though, reproduces the global order exactly.
 *
 * Absence of a key is never an error: the result is empty (null pointer, empty `optional`, empty range/vector).
 * The only failures are bad handles passed to value_at() and remove_at() (error::Code::S_INVALID_INDEX,
 * error::Code::S_STALE_HANDLE) and too-small capacities passed to pack_to(); these follow the twine::error
 * convention.
 *
 * ### Iterator invalidation ###
 * Any structural change (anything that adds or removes a pair or a key, clear(), pack_to()) invalidates all
 * iterators and ranges; stepping or dereferencing one afterwards throws twine::error::Runtime_error with
 * error::Code::S_ITERATOR_INVALIDATED.  Modifying a value in place (through get_mut(), values_mut(), an entry...)
 * is not structural.  An insert() onto a key with exactly one value only overwrites it, so it is not structural
 * either.  Entries (entry()) are not checked; an entry must not be used after such a change, made by itself
 * or not.
 *
 * ### Logging ###
 * With a non-null `log::Logger`, key creation and deletion, reserve_keys()/reserve_values(), pack_to() and clear()
 * are logged at TRACE; emitted errors at WARNING.  Only indices and counts are logged, never keys or values.
 *
 * ### Thread safety ###
 * Same as for standard containers.
 *
 * @internal
 * ### Implementation ###
 * Two Ordered_arena: one of `Key_slot`s (one per live key) and one of `Value_node`s (one per pair).  The value
 * arena's own global order *is* the map's global order.  Each `Value_node` additionally carries the key-local
 * links and the index of its `Key_slot`; each `Key_slot` carries its chain's head, tail and length.  The hash index
 * maps each key to the handle of its `Key_slot`.  The key object itself lives only in the index's node (which
 * boost.unordered never moves); `Key_slot::m_key` points to it.
 *
 * Every removal of a pair goes through unlink_value(), which also deletes the key when its last value goes.
 * @endinternal
 *
 * @tparam Key_t
 *         Key type.  Must be hashable by `Hash_t` and comparable by `Pred_t`.  Copy-constructible if any operation
 *         that returns keys by value (flatten(), drain(), remove_entry() while other values remain) or copying of
 *         the map is used.
 * @tparam Value_t
 *         Value type.  Must be move-constructible; equality-comparable for `==`; copy-constructible for copying.
 * @tparam Hash_t
 *         Hasher type.  Default: `boost::hash<Key_t>`.
 * @tparam Pred_t
 *         Equality predicate type.  Default: `std::equal_to<Key_t>`.
 */
template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
class Ordered_multimap
{
public:
  // Types.

  /// Convenience alias for template arg.
  using Key = Key_t;

  /// Convenience alias for template arg.
  using Value = Value_t;

  /// Convenience alias for template arg.
  using Hash = Hash_t;

  /// Convenience alias for template arg.
  using Pred = Pred_t;

  /// Expresses sizes/lengths/indices.
  using size_type = std::size_t;

  /// Identifies one stored pair for its lifetime; see value_at(), remove_at(), the iterators' `handle()`.
  using Value_handle = Arena_handle;

  /// A pair by value, as in flatten() and `from_pairs()`.
  using Pair = std::pair<Key, Value>;

  /// A pair by reference, as in front(), back().
  using Const_pair_ref = std::pair<const Key&, const Value&>;

  /// Result of front(), back().
  using Const_pair_ref_opt = std::optional<Const_pair_ref>;

  /// Result of remove() and friends.
  using Value_opt = std::optional<Value>;

  /// Result of insert(), remove_all() and friends.
  using Value_vector = std::vector<Value>;

  /// Result of remove_entry().
  using Pair_opt = std::optional<Pair>;

  /// A key with all its values.
  using Key_values = std::pair<Key, Value_vector>;

  /// Result of remove_entry_all().
  using Key_values_opt = std::optional<Key_values>;

  /// Result of flatten(), drain().
  using Pair_vector = std::vector<Pair>;

  /// Result of pack_to(): old value index to new Value_handle; see Ordered_arena::pack_to().
  using Remap = std::vector<Value_handle>;

  /// Result of entry().
  using Entry = Ordered_multimap_entry<Ordered_multimap>;

  /// See entry().
  using Occupied_entry = Ordered_multimap_occupied_entry<Ordered_multimap>;

  /// See entry().
  using Vacant_entry = Ordered_multimap_vacant_entry<Ordered_multimap>;

private:
  // Types.  These are here in the middle of public block due to inability to forward-declare aliases.

  struct Key_slot;
  struct Value_node;
  template<bool IS_CONST>
  struct Pair_walk;
  template<bool IS_CONST>
  struct Value_walk;
  struct Key_walk;
  template<bool IS_CONST>
  struct Key_local_walk;

public:
  // Types (continued).

  /// Iterator over `(key, mutable value)` pairs in global order; dereferences to a pair of references.
  using Iterator = detail::Chain_iterator<Ordered_multimap, Pair_walk<false>>;

  /// Iterator over `(key, value)` pairs in global order; dereferences to a pair of references.
  using Const_iterator = detail::Chain_iterator<const Ordered_multimap, Pair_walk<true>>;

  /// Reverse of #Iterator.
  using Reverse_iterator = std::reverse_iterator<Iterator>;

  /// Reverse of #Const_iterator.
  using Const_reverse_iterator = std::reverse_iterator<Const_iterator>;

  /// Iterator over mutable values in global order.
  using Value_iterator = detail::Chain_iterator<Ordered_multimap, Value_walk<false>>;

  /// Iterator over values in global order.
  using Const_value_iterator = detail::Chain_iterator<const Ordered_multimap, Value_walk<true>>;

  /// Iterator over the live keys in order of creation.
  using Key_iterator = detail::Chain_iterator<const Ordered_multimap, Key_walk>;

  /// Iterator over one key's mutable values in key-local order.
  using Key_local_iterator = detail::Chain_iterator<Ordered_multimap, Key_local_walk<false>>;

  /// Iterator over one key's values in key-local order.
  using Const_key_local_iterator = detail::Chain_iterator<const Ordered_multimap, Key_local_walk<true>>;

  /// Range counterpart of #Iterator.
  using Range = boost::iterator_range<Iterator>;

  /// Range counterpart of #Const_iterator.
  using Const_range = boost::iterator_range<Const_iterator>;

  /// Range counterpart of #Value_iterator.
  using Value_range = boost::iterator_range<Value_iterator>;

  /// Range counterpart of #Const_value_iterator.
  using Const_value_range = boost::iterator_range<Const_value_iterator>;

  /// Range counterpart of #Key_iterator.
  using Key_range = boost::iterator_range<Key_iterator>;

  /// Range counterpart of #Key_local_iterator.
  using Key_local_range = boost::iterator_range<Key_local_iterator>;

  /// Range counterpart of #Const_key_local_iterator.
  using Const_key_local_range = boost::iterator_range<Const_key_local_iterator>;

  /// For container compliance (hence the irregular capitalization): #Iterator type.
  using iterator = Iterator;

  /// For container compliance (hence the irregular capitalization): #Const_iterator type.
  using const_iterator = Const_iterator;

  /// For container compliance (hence the irregular capitalization): #Pair type.
  using value_type = Pair;

  /// For container compliance (hence the irregular capitalization): #Key type.
  using key_type = Key;

  /// For container compliance (hence the irregular capitalization): #Value type.
  using mapped_type = Value;

  // Constructors/destructor.

  /**
   * Constructs empty structure.
   *
   * @param logger
   *        Logger for TRACE output and emitted errors; null to not log.
   * @param n_buckets
   *        Number of buckets for the hash index.  Special value -1 (default) means use boost.unordered's default.
   * @param hasher
   *        Hasher instance.
   * @param pred
   *        Equality predicate instance.
   */
  explicit Ordered_multimap(log::Logger* logger = nullptr,
                            size_type n_buckets = size_type(-1),
                            const Hash& hasher = Hash(),
                            const Pred& pred = Pred());

  /**
   * Constructs structure with the given pairs, as if by append() of each, in order.
   *
   * @param pairs
   *        Pairs to append.
   * @param logger
   *        See other ctor.
   * @param n_buckets
   *        See other ctor.
   * @param hasher
   *        See other ctor.
   * @param pred
   *        See other ctor.
   */
  Ordered_multimap(std::initializer_list<Pair> pairs,
                   log::Logger* logger = nullptr,
                   size_type n_buckets = size_type(-1),
                   const Hash& hasher = Hash(),
                   const Pred& pred = Pred());

  /**
   * Constructs a copy of `src`, with the same global order and key-local orders.  Handles are not carried over.
   *
   * @param src
   *        Source object.
   */
  Ordered_multimap(const Ordered_multimap& src);

  /**
   * Constructs `*this` by taking over the contents of `src`, which becomes empty.
   *
   * @param src
   *        Source object.
   */
  Ordered_multimap(Ordered_multimap&& src);

  // Methods.

  /**
   * Makes `*this` a copy of `src`; see copy ctor.
   *
   * @param src
   *        Source object.
   * @return `*this`.
   */
  Ordered_multimap& operator=(const Ordered_multimap& src);

  /**
   * Takes over the contents of `src`, which becomes empty.
   *
   * @param src
   *        Source object.
   * @return `*this`.
   */
  Ordered_multimap& operator=(Ordered_multimap&& src);

  /**
   * Swaps contents (including loggers) with `other`.  Constant-time.
   *
   * @param other
   *        Other object.
   */
  void swap(Ordered_multimap& other);

  /**
   * Builds a map by append()ing each pair of `pairs`, in order.
   *
   * @tparam Pair_range
   *         Range (in the boost.range sense) whose elements have `first` and `second` convertible to #Key and
   *         #Value.
   * @param pairs
   *        Pairs.
   * @param logger
   *        See ctor.
   * @return See above.
   */
  template<typename Pair_range>
  static Ordered_multimap from_pairs(const Pair_range& pairs, log::Logger* logger = nullptr);

  /**
   * Adds the pair at the end of the global order and at the end of the key's values.
   *
   * @param key
   *        Key; moved into the map only if new.
   * @param value
   *        Value.
   * @return Handle of the new pair.
   */
  Value_handle append(Key key, Value value);

  /**
   * Replaces the key's values with the single `value`: if the key exists, `value` overwrites its first value in
   * place (keeping that pair's global position), and the rest of its values are removed; if not, same as append().
   *
   * @param key
   *        Key.
   * @param value
   *        Value.
   * @return All of the key's previous values in key-local order; empty if the key was absent.
   */
  Value_vector insert(Key key, Value value);

  /**
   * Synonym of insert().
   *
   * @param key
   *        See insert().
   * @param value
   *        See insert().
   * @return See insert().
   */
  Value_vector insert_all(Key key, Value value);

  /**
   * Removes the key's first value; the key goes away with its last value.
   *
   * @param key
   *        Key.
   * @return The removed value; empty if the key was absent.
   */
  Value_opt remove(const Key& key);

  /**
   * Removes the key with all its values.
   *
   * @param key
   *        Key.
   * @return The removed values in key-local order; empty if the key was absent.
   */
  Value_vector remove_all(const Key& key);

  /**
   * Like remove(), but also yields the key: the stored key itself if the removed value was the last one, else a copy.
   *
   * @param key
   *        Key.
   * @return See above; empty if the key was absent.
   */
  Pair_opt remove_entry(const Key& key);

  /**
   * Like remove_all(), but also yields the stored key.
   *
   * @param key
   *        Key.
   * @return See above; empty if the key was absent.
   */
  Key_values_opt remove_entry_all(const Key& key);

  /**
   * Removes every pair for which `pred(key, value)` is `false`, in one pass over the global order.  `pred` may
   * modify the value.
   *
   * @tparam Retain_pred
   *         Callable as `bool (const Key&, Value&)`.
   * @param pred
   *        See above.
   */
  template<typename Retain_pred>
  void retain(Retain_pred&& pred);

  /**
   * append()s each pair in `[first, last)`, in order.
   *
   * @tparam Pair_iter
   *         Iterator whose dereference has `first` and `second` convertible to #Key and #Value.
   * @param first
   *        Start of range.
   * @param last
   *        End of range.
   */
  template<typename Pair_iter>
  void extend(Pair_iter first, Pair_iter last);

  /**
   * append()s each pair in `pairs`, in order.
   *
   * @tparam Pair_range
   *         See from_pairs().
   * @param pairs
   *        Pairs.
   */
  template<typename Pair_range>
  void extend(const Pair_range& pairs);

  /**
   * Looks up the key once, returning a handle to it through which its values can be examined and modified, or
   * through which it can be inserted.
   *
   * @param key
   *        Key; kept in the vacant entry, if absent.
   * @return See above.
   */
  Entry entry(Key key);

  /**
   * Returns pointer to the key's first value, or null if absent.
   *
   * @param key
   *        Key.
   * @return See above.
   */
  const Value* get(const Key& key) const;

  /**
   * Returns pointer to the key's first value, or null if absent.
   *
   * @param key
   *        Key.
   * @return See above.
   */
  Value* get(const Key& key);

  /**
   * Synonym of non-`const` get().
   *
   * @param key
   *        Key.
   * @return See above.
   */
  Value* get_mut(const Key& key);

  /**
   * Range over the key's values in key-local order; empty if absent.
   *
   * @param key
   *        Key.
   * @return See above.
   */
  Const_key_local_range get_all(const Key& key) const;

  /**
   * Range over the key's mutable values in key-local order; empty if absent.
   *
   * @param key
   *        Key.
   * @return See above.
   */
  Key_local_range get_all_mut(const Key& key);

  /**
   * Returns pointer to the value of the pair identified by `handle`.
   *
   * @param handle
   *        Handle from append() or an iterator's `handle()`.
   * @param err_code
   *        See twine::error.  error::Code generated: S_INVALID_INDEX, S_STALE_HANDLE.
   * @return See above; null on error.
   */
  Value* value_at(const Value_handle& handle, Error_code* err_code = 0);

  /**
   * `const` counterpart of the other value_at().
   *
   * @param handle
   *        See other value_at().
   * @param err_code
   *        See other value_at().
   * @return See other value_at().
   */
  const Value* value_at(const Value_handle& handle, Error_code* err_code = 0) const;

  /**
   * Removes the pair identified by `handle`; the key goes away with its last value.
   *
   * @param handle
   *        See value_at().
   * @param err_code
   *        See value_at().
   * @return The removed value; empty on error.
   */
  Value_opt remove_at(const Value_handle& handle, Error_code* err_code = 0);

  /**
   * Whether the key is present.
   *
   * @param key
   *        Key.
   * @return See above.
   */
  bool contains_key(const Key& key) const;

  /**
   * Number of values of the key; 0 if absent.
   *
   * @param key
   *        Key.
   * @return See above.
   */
  size_type entry_len(const Key& key) const;

  /**
   * Number of distinct keys.
   * @return See above.
   */
  size_type keys_len() const;

  /**
   * Number of pairs.
   * @return See above.
   */
  size_type values_len() const;

  /**
   * Synonym of values_len().
   * @return See above.
   */
  size_type size() const;

  /**
   * `size() == 0`.
   * @return See above.
   */
  bool empty() const;

  /**
   * Number of keys storable without reallocating the key arena.
   * @return See above.
   */
  size_type keys_capacity() const;

  /**
   * Number of pairs storable without reallocating the value arena.
   * @return See above.
   */
  size_type values_capacity() const;

  /**
   * Makes room for `additional` more keys (key arena and hash index).
   *
   * @param additional
   *        Number of keys.
   */
  void reserve_keys(size_type additional);

  /**
   * Makes room for `additional` more pairs.
   *
   * @param additional
   *        Number of pairs.
   */
  void reserve_values(size_type additional);

  /**
   * Compacts both arenas (see Ordered_arena::pack_to()) to the given capacities.  Every handle is invalidated.
   *
   * @param keys_capacity
   *        Key arena capacity afterwards; at least keys_len().
   * @param values_capacity
   *        Value arena capacity afterwards; at least values_len().
   * @param err_code
   *        See twine::error.  error::Code generated: S_PACK_CAPACITY_TOO_SMALL (nothing is changed then).
   * @return Maps pre-pack value index (`Value_handle::m_index`) to the new handle; empty on error.
   */
  Remap pack_to(size_type keys_capacity, size_type values_capacity, Error_code* err_code = 0);

  /**
   * `pack_to(keys_len(), values_len())`, which cannot fail.
   *
   * @return See pack_to().
   */
  Remap pack_to_fit();

  /// Removes everything; capacities are kept.
  void clear();

  /**
   * Removes everything, returning the pairs in global order.
   *
   * @return See above.
   */
  Pair_vector drain();

  /**
   * Copies out the pairs in global order.  `from_pairs(flatten())` equals `*this` with the same global order.
   *
   * @return See above.
   */
  Pair_vector flatten() const;

  /**
   * First pair in global order.
   * @return See above; empty if empty().
   */
  Const_pair_ref_opt front() const;

  /**
   * Last pair in global order.
   * @return See above; empty if empty().
   */
  Const_pair_ref_opt back() const;

  /**
   * Returns first pair in global order, or end() if empty.
   * @return See above.
   */
  Iterator begin();

  /**
   * Returns past-the-end iterator.
   * @return See above.
   */
  Iterator end();

  /**
   * Returns first pair in global order, or end() if empty.
   * @return See above.
   */
  Const_iterator begin() const;

  /**
   * Returns past-the-end iterator.
   * @return See above.
   */
  Const_iterator end() const;

  /**
   * Synonym of `begin() const`.
   * @return See above.
   */
  Const_iterator cbegin() const;

  /**
   * Synonym of `end() const`.
   * @return See above.
   */
  Const_iterator cend() const;

  /**
   * Returns last pair in global order, going backwards.
   * @return See above.
   */
  Reverse_iterator rbegin();

  /**
   * Returns past-the-first, going backwards.
   * @return See above.
   */
  Reverse_iterator rend();

  /**
   * Returns last pair in global order, going backwards.
   * @return See above.
   */
  Const_reverse_iterator crbegin() const;

  /**
   * Returns past-the-first, going backwards.
   * @return See above.
   */
  Const_reverse_iterator crend() const;

  /**
   * All pairs in global order.
   * @return See above.
   */
  Const_range iter() const;

  /**
   * All pairs, with mutable values, in global order.
   * @return See above.
   */
  Range iter_mut();

  /**
   * Synonym of iter().
   * @return See above.
   */
  Const_range pairs() const;

  /**
   * Live keys, each once, in the order they were created.
   * @return See above.
   */
  Key_range keys() const;

  /**
   * All values in global order.
   * @return See above.
   */
  Const_value_range values() const;

  /**
   * All values, mutable, in global order.
   * @return See above.
   */
  Value_range values_mut();

  /**
   * Structural-mutation counter; see class doc header.  Iterators compare against it.
   * @return See above.
   */
  uint64_t epoch() const;

  /**
   * Returns copy of the hasher.
   * @return See above.
   */
  Hash hash_function() const;

  /**
   * Returns copy of the equality predicate.
   * @return See above.
   */
  Pred key_eq() const;

  /**
   * Logger in use; may be null.
   * @return See above.
   */
  log::Logger* get_logger() const;

  /**
   * Sets the logger.
   * @param logger
   *        Logger; may be null.
   */
  void set_logger(log::Logger* logger);

private:
  // Friends.

  /// Entries operate on the internals directly, after their single lookup.
  friend Occupied_entry;

  /// Ditto.
  friend Vacant_entry;

  // Constants.

  /// Arena index meaning "none," as in Ordered_arena.
  static constexpr size_type S_NO_INDEX = size_type(-1);

  // Types.

  /// Key-optional, for unlink_value().
  using Key_opt = std::optional<Key>;

  /// The hash index: key to the handle of its Key_slot.
  using Index = boost::unordered_map<Key, Arena_handle, Hash, Pred>;

  /// Metadata of one live key.
  struct Key_slot
  {
    // Data.

    /// Points to the key stored in #m_index.
    const Key* m_key = nullptr;

    /// Value arena index of the key's first value.
    size_type m_head = S_NO_INDEX;

    /// Value arena index of the key's last value.
    size_type m_tail = S_NO_INDEX;

    /// Number of values; positive.
    size_type m_length = 0;
  }; // struct Key_slot

  /// One stored pair.
  struct Value_node
  {
    // Data.

    /// The value.
    Value m_value;

    /// Key arena index of the key.
    size_type m_key_index;

    /// Value arena index of the previous value of the same key.
    size_type m_key_prev;

    /// Value arena index of the next value of the same key.
    size_type m_key_next;
  }; // struct Value_node

  /// The key arena.
  using Key_arena = Ordered_arena<Key_slot>;

  /// The value arena.
  using Value_arena = Ordered_arena<Value_node>;

  /// Walk policy (see detail::Chain_iterator) for pairs in global order.
  template<bool IS_CONST>
  struct Pair_walk
  {
    using Owner = std::conditional_t<IS_CONST, const Ordered_multimap, Ordered_multimap>;
    using value_type = Pair;
    using reference = std::pair<const Key&, std::conditional_t<IS_CONST, const Value&, Value&>>;
    using Const_walk = Pair_walk<true>;

    static reference deref(Owner& map, size_type idx)
    {
      auto& node = map.m_values.at_index(idx);
      return reference(*(map.m_keys.at_index(node.m_key_index).m_key), node.m_value);
    }
    static size_type next(Owner& map, size_type idx) { return map.m_values.next_index(idx); }
    static size_type prev(Owner& map, size_type idx) { return map.m_values.prev_index(idx); }
    static size_type last(Owner& map, size_type) { return map.m_values.tail_index(); }
    static Value_handle handle(Owner& map, size_type idx) { return map.m_values.handle_at_index(idx); }
  }; // struct Pair_walk

  /// Walk policy for values in global order.
  template<bool IS_CONST>
  struct Value_walk
  {
    using Owner = std::conditional_t<IS_CONST, const Ordered_multimap, Ordered_multimap>;
    using value_type = Value;
    using reference = std::conditional_t<IS_CONST, const Value&, Value&>;
    using Const_walk = Value_walk<true>;

    static reference deref(Owner& map, size_type idx) { return map.m_values.at_index(idx).m_value; }
    static size_type next(Owner& map, size_type idx) { return map.m_values.next_index(idx); }
    static size_type prev(Owner& map, size_type idx) { return map.m_values.prev_index(idx); }
    static size_type last(Owner& map, size_type) { return map.m_values.tail_index(); }
    static Value_handle handle(Owner& map, size_type idx) { return map.m_values.handle_at_index(idx); }
  }; // struct Value_walk

  /// Walk policy for keys in creation order.  `handle()` yields the key arena handle, not useful to the user.
  struct Key_walk
  {
    using Owner = const Ordered_multimap;
    using value_type = Key;
    using reference = const Key&;
    using Const_walk = Key_walk;

    static reference deref(Owner& map, size_type idx) { return *(map.m_keys.at_index(idx).m_key); }
    static size_type next(Owner& map, size_type idx) { return map.m_keys.next_index(idx); }
    static size_type prev(Owner& map, size_type idx) { return map.m_keys.prev_index(idx); }
    static size_type last(Owner& map, size_type) { return map.m_keys.tail_index(); }
    static Arena_handle handle(Owner& map, size_type idx) { return map.m_keys.handle_at_index(idx); }
  }; // struct Key_walk

  /// Walk policy for one key's values in key-local order.  The anchor index is that of the key's Key_slot.
  template<bool IS_CONST>
  struct Key_local_walk
  {
    using Owner = std::conditional_t<IS_CONST, const Ordered_multimap, Ordered_multimap>;
    using value_type = Value;
    using reference = std::conditional_t<IS_CONST, const Value&, Value&>;
    using Const_walk = Key_local_walk<true>;

    static reference deref(Owner& map, size_type idx) { return map.m_values.at_index(idx).m_value; }
    static size_type next(Owner& map, size_type idx) { return map.m_values.at_index(idx).m_key_next; }
    static size_type prev(Owner& map, size_type idx) { return map.m_values.at_index(idx).m_key_prev; }
    static size_type last(Owner& map, size_type key_idx) { return map.m_keys.at_index(key_idx).m_tail; }
    static Value_handle handle(Owner& map, size_type idx) { return map.m_values.handle_at_index(idx); }
  }; // struct Key_local_walk

  // Methods.

  /**
   * Creates the key (which must be absent) with `value` as its only value.
   *
   * @param key
   *        Key.
   * @param value
   *        Value.
   * @return Handle of the new pair.
   */
  Value_handle append_new_key(Key&& key, Value&& value);

  /**
   * Appends `value` to the existing key at the given key arena index.
   *
   * @param key_idx
   *        Key arena index.
   * @param value
   *        Value.
   * @return Handle of the new pair.
   */
  Value_handle append_at_key_slot(size_type key_idx, Value&& value);

  /**
   * insert() for the existing key at the given key arena index.
   *
   * @param key_idx
   *        Key arena index.
   * @param value
   *        Value.
   * @return See insert().
   */
  Value_vector insert_at_key_slot(size_type key_idx, Value&& value);

  /**
   * remove_all() for the existing key at the given key arena index.
   *
   * @param key_idx
   *        Key arena index.
   * @param last_key
   *        See unlink_value().
   * @return See remove_all().
   */
  Value_vector remove_all_at_key_slot(size_type key_idx, Key_opt* last_key);

  /**
   * The one place a pair is removed: unlinks the value node at `value_idx` from its key's chain and from the
   * global order, and, if that was the key's last value, deletes the key from the key arena and the index.
   *
   * @param value_idx
   *        Value arena index of a live node.
   * @param last_key
   *        If not null, and the key is deleted, the key is moved out of the index into `*last_key`.
   * @return The value.
   */
  Value unlink_value(size_type value_idx, Key_opt* last_key = nullptr);

  /**
   * Range over the values of the existing key at the given key arena index.
   *
   * @param key_idx
   *        Key arena index.
   * @return See above.
   */
  Key_local_range key_local_range(size_type key_idx);

  /**
   * Range over the values of the existing key at the given key arena index.
   *
   * @param key_idx
   *        Key arena index.
   * @return See above.
   */
  Const_key_local_range key_local_range(size_type key_idx) const;

  /**
   * Key arena index of `key`, or #S_NO_INDEX if absent.
   *
   * @param key
   *        Key.
   * @return See above.
   */
  size_type key_index(const Key& key) const;

  /**
   * pack_to() minus the capacity check.
   *
   * @param keys_capacity
   *        See pack_to().
   * @param values_capacity
   *        See pack_to().
   * @return See pack_to().
   */
  Remap pack_impl(size_type keys_capacity, size_type values_capacity);

  // Data.

  /// Logger; may be null.  The arenas hold the same pointer.
  log::Logger* m_logger;

  /// See class doc header.
  Index m_index;

  /// See class doc header.
  Key_arena m_keys;

  /// See class doc header.  Its global order is ours.
  Value_arena m_values;
}; // class Ordered_multimap

// Template implementations.

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Ordered_multimap(log::Logger* logger, size_type n_buckets,
                                                                   const Hash& hasher, const Pred& pred) :
  m_logger(logger),
  m_index((n_buckets == size_type(-1))
            ? boost::unordered::detail::default_bucket_count
            : n_buckets,
          hasher, pred),
  m_keys(logger),
  m_values(logger)
{
  // Nothing else.
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Ordered_multimap(std::initializer_list<Pair> pairs,
                                                                   log::Logger* logger, size_type n_buckets,
                                                                   const Hash& hasher, const Pred& pred) :
  Ordered_multimap(logger, n_buckets, hasher, pred)
{
  extend(pairs.begin(), pairs.end());
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Ordered_multimap(const Ordered_multimap& src) :
  Ordered_multimap(src.m_logger, src.m_index.bucket_count(), src.hash_function(), src.key_eq())
{
  m_keys.reserve(src.keys_len());
  m_values.reserve(src.values_len());
  for (size_type idx = src.m_values.head_index(); idx != S_NO_INDEX; idx = src.m_values.next_index(idx))
  {
    const auto& node = src.m_values.at_index(idx);
    append(*(src.m_keys.at_index(node.m_key_index).m_key), node.m_value);
  }
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Ordered_multimap(Ordered_multimap&& src) :
  Ordered_multimap(src.m_logger, size_type(-1), src.hash_function(), src.key_eq())
{
  swap(src);
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>&
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::operator=(const Ordered_multimap& src)
{
  if (&src != this)
  {
    Ordered_multimap copy(src);
    swap(copy);
  }
  return *this;
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>&
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::operator=(Ordered_multimap&& src)
{
  if (&src != this)
  {
    clear();
    swap(src);
  }
  return *this;
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
void Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::swap(Ordered_multimap& other)
{
  using std::swap;

  if (&other != this)
  {
    // Index nodes do not move in a swap, so the Key_slot key pointers stay correct.
    swap(m_logger, other.m_logger);
    m_index.swap(other.m_index);
    m_keys.swap(other.m_keys);
    m_values.swap(other.m_values);
  }
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
template<typename Pair_range>
Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::from_pairs(const Pair_range& pairs, log::Logger* logger) // Static.
{
  Ordered_multimap map(logger);
  map.extend(pairs);
  return map;
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Value_handle
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::append(Key key, Value value)
{
  const auto key_idx = key_index(key);
  return (key_idx == S_NO_INDEX) ? append_new_key(std::move(key), std::move(value))
                                 : append_at_key_slot(key_idx, std::move(value));
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Value_vector
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::insert(Key key, Value value)
{
  const auto key_idx = key_index(key);
  if (key_idx == S_NO_INDEX)
  {
    append_new_key(std::move(key), std::move(value));
    return Value_vector();
  }
  // else
  return insert_at_key_slot(key_idx, std::move(value));
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Value_vector
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::insert_all(Key key, Value value)
{
  return insert(std::move(key), std::move(value));
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Value_opt
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::remove(const Key& key)
{
  const auto key_idx = key_index(key);
  if (key_idx == S_NO_INDEX)
  {
    return std::nullopt;
  }
  // else
  return unlink_value(m_keys.at_index(key_idx).m_head);
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Value_vector
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::remove_all(const Key& key)
{
  const auto key_idx = key_index(key);
  if (key_idx == S_NO_INDEX)
  {
    return Value_vector();
  }
  // else
  return remove_all_at_key_slot(key_idx, nullptr);
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Pair_opt
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::remove_entry(const Key& key)
{
  const auto key_idx = key_index(key);
  if (key_idx == S_NO_INDEX)
  {
    return std::nullopt;
  }
  // else
  Key_opt last_key;
  auto value = unlink_value(m_keys.at_index(key_idx).m_head, &last_key);
  if (last_key)
  {
    return Pair(std::move(*last_key), std::move(value));
  }
  // else: Key is still there (and so is its Key_slot); copy it.
  return Pair(*(m_keys.at_index(key_idx).m_key), std::move(value));
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Key_values_opt
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::remove_entry_all(const Key& key)
{
  const auto key_idx = key_index(key);
  if (key_idx == S_NO_INDEX)
  {
    return std::nullopt;
  }
  // else
  Key_opt last_key;
  auto values = remove_all_at_key_slot(key_idx, &last_key);
  assert(last_key);
  return Key_values(std::move(*last_key), std::move(values));
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
template<typename Retain_pred>
void Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::retain(Retain_pred&& pred)
{
  TWINE_LOG_SET_CONTEXT(m_logger, Twine_log_component::S_CONTAINER);

  size_type n_removed = 0;
  size_type idx = m_values.head_index();
  while (idx != S_NO_INDEX)
  {
    const auto next_idx = m_values.next_index(idx);
    auto& node = m_values.at_index(idx);
    const Key& key = *(m_keys.at_index(node.m_key_index).m_key);
    if (!pred(key, node.m_value))
    {
      unlink_value(idx);
      ++n_removed;
    }
    idx = next_idx;
  }

  TWINE_LOG_TRACE("Multimap [" << this << "]: retain removed [" << n_removed << "] values; "
                  "[" << values_len() << "] values in [" << keys_len() << "] keys remain.");
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
template<typename Pair_iter>
void Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::extend(Pair_iter first, Pair_iter last)
{
  for (; first != last; ++first)
  {
    const auto& pair = *first;
    append(pair.first, pair.second);
  }
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
template<typename Pair_range>
void Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::extend(const Pair_range& pairs)
{
  extend(boost::begin(pairs), boost::end(pairs));
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Entry
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::entry(Key key)
{
  const auto key_idx = key_index(key);
  if (key_idx == S_NO_INDEX)
  {
    return Entry(Vacant_entry(this, std::move(key)));
  }
  // else
  return Entry(Occupied_entry(this, key_idx));
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
const typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Value*
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::get(const Key& key) const
{
  const auto key_idx = key_index(key);
  return (key_idx == S_NO_INDEX) ? nullptr : &(m_values.at_index(m_keys.at_index(key_idx).m_head).m_value);
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Value*
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::get(const Key& key)
{
  return const_cast<Value*>(const_cast<const Ordered_multimap*>(this)->get(key));
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Value*
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::get_mut(const Key& key)
{
  return get(key);
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Const_key_local_range
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::get_all(const Key& key) const
{
  const auto key_idx = key_index(key);
  if (key_idx == S_NO_INDEX)
  {
    return Const_key_local_range(Const_key_local_iterator(this, S_NO_INDEX),
                                 Const_key_local_iterator(this, S_NO_INDEX));
  }
  // else
  return key_local_range(key_idx);
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Key_local_range
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::get_all_mut(const Key& key)
{
  const auto key_idx = key_index(key);
  if (key_idx == S_NO_INDEX)
  {
    return Key_local_range(Key_local_iterator(this, S_NO_INDEX), Key_local_iterator(this, S_NO_INDEX));
  }
  // else
  return key_local_range(key_idx);
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Value*
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::value_at(const Value_handle& handle, Error_code* err_code)
{
  TWINE_ERROR_EXEC_AND_THROW_ON_ERROR(Value*, value_at, handle, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  const auto node = m_values.get(handle, err_code);
  return node ? &node->m_value : nullptr;
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
const typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Value*
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::value_at(const Value_handle& handle, Error_code* err_code) const
{
  TWINE_ERROR_EXEC_AND_THROW_ON_ERROR(const Value*, value_at, handle, _1);

  const auto node = m_values.get(handle, err_code);
  return node ? &node->m_value : nullptr;
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Value_opt
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::remove_at(const Value_handle& handle, Error_code* err_code)
{
  TWINE_ERROR_EXEC_AND_THROW_ON_ERROR(Value_opt, remove_at, handle, _1);

  if (!m_values.get(handle, err_code)) // This emits the error, if any.
  {
    return std::nullopt;
  }
  // else
  return unlink_value(handle.m_index);
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
bool Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::contains_key(const Key& key) const
{
  return m_index.find(key) != m_index.end();
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::size_type
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::entry_len(const Key& key) const
{
  const auto key_idx = key_index(key);
  return (key_idx == S_NO_INDEX) ? 0 : m_keys.at_index(key_idx).m_length;
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::size_type
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::keys_len() const
{
  return m_keys.size();
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::size_type
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::values_len() const
{
  return m_values.size();
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::size_type
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::size() const
{
  return values_len();
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
bool Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::empty() const
{
  return m_values.empty();
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::size_type
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::keys_capacity() const
{
  return m_keys.capacity();
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::size_type
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::values_capacity() const
{
  return m_values.capacity();
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
void Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::reserve_keys(size_type additional)
{
  m_index.reserve(m_index.size() + additional);
  m_keys.reserve(additional);
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
void Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::reserve_values(size_type additional)
{
  m_values.reserve(additional);
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Remap
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::pack_to(size_type keys_capacity, size_type values_capacity,
                                                            Error_code* err_code)
{
  TWINE_ERROR_EXEC_AND_THROW_ON_ERROR(Remap, pack_to, keys_capacity, values_capacity, _1);
  TWINE_LOG_SET_CONTEXT(m_logger, Twine_log_component::S_CONTAINER);

  if ((keys_capacity < keys_len()) || (values_capacity < values_len()))
  {
    TWINE_LOG_WARNING("Multimap [" << this << "]: cannot pack [" << keys_len() << "] keys and "
                      "[" << values_len() << "] values into capacities "
                      "[" << keys_capacity << "] and [" << values_capacity << "].");
    TWINE_ERROR_EMIT_ERROR(error::Code::S_PACK_CAPACITY_TOO_SMALL);
    return Remap();
  }
  // else
  err_code->clear();

  return pack_impl(keys_capacity, values_capacity);
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Remap
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::pack_to_fit()
{
  return pack_impl(keys_len(), values_len());
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Remap
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::pack_impl(size_type keys_capacity, size_type values_capacity)
{
  /* Pack each arena; then every index stored inside the payloads (and the index's key handles) refers to
   * pre-pack positions, so translate them through the remaps. */
  const auto key_remap = m_keys.pack_to(keys_capacity);
  auto value_remap = m_values.pack_to(values_capacity);

  const auto remap_value_idx = [&](size_type idx) -> size_type
  {
    return (idx == S_NO_INDEX) ? S_NO_INDEX : value_remap[idx].m_index;
  };

  for (size_type idx = m_keys.head_index(); idx != S_NO_INDEX; idx = m_keys.next_index(idx))
  {
    auto& slot = m_keys.at_index(idx);
    slot.m_head = remap_value_idx(slot.m_head);
    slot.m_tail = remap_value_idx(slot.m_tail);
  }
  for (size_type idx = m_values.head_index(); idx != S_NO_INDEX; idx = m_values.next_index(idx))
  {
    auto& node = m_values.at_index(idx);
    node.m_key_index = key_remap[node.m_key_index].m_index;
    node.m_key_prev = remap_value_idx(node.m_key_prev);
    node.m_key_next = remap_value_idx(node.m_key_next);
  }
  for (auto& key_and_handle : m_index)
  {
    key_and_handle.second = key_remap[key_and_handle.second.m_index];
  }

  return value_remap;
} // Ordered_multimap::pack_impl()

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
void Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::clear()
{
  m_values.clear();
  m_keys.clear();
  m_index.clear();
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Pair_vector
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::drain()
{
  Pair_vector pairs;
  pairs.reserve(values_len());
  for (size_type idx = m_values.head_index(); idx != S_NO_INDEX; idx = m_values.next_index(idx))
  {
    auto& node = m_values.at_index(idx);
    pairs.emplace_back(*(m_keys.at_index(node.m_key_index).m_key), std::move(node.m_value));
  }

  clear();
  return pairs;
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Pair_vector
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::flatten() const
{
  Pair_vector pairs;
  pairs.reserve(values_len());
  for (const auto& pair : *this)
  {
    pairs.emplace_back(pair.first, pair.second);
  }
  return pairs;
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Const_pair_ref_opt
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::front() const
{
  if (empty())
  {
    return std::nullopt;
  }
  // else
  return Pair_walk<true>::deref(*this, m_values.head_index());
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Const_pair_ref_opt
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::back() const
{
  if (empty())
  {
    return std::nullopt;
  }
  // else
  return Pair_walk<true>::deref(*this, m_values.tail_index());
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Iterator
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::begin()
{
  return Iterator(this, m_values.head_index());
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Iterator
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::end()
{
  return Iterator(this, S_NO_INDEX);
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Const_iterator
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::begin() const
{
  return Const_iterator(this, m_values.head_index());
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Const_iterator
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::end() const
{
  return Const_iterator(this, S_NO_INDEX);
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Const_iterator
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::cbegin() const
{
  return begin();
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Const_iterator
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::cend() const
{
  return end();
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Reverse_iterator
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::rbegin()
{
  return Reverse_iterator(end());
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Reverse_iterator
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::rend()
{
  return Reverse_iterator(begin());
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Const_reverse_iterator
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::crbegin() const
{
  return Const_reverse_iterator(cend());
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Const_reverse_iterator
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::crend() const
{
  return Const_reverse_iterator(cbegin());
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Const_range
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::iter() const
{
  return Const_range(begin(), end());
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Range
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::iter_mut()
{
  return Range(begin(), end());
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Const_range
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::pairs() const
{
  return iter();
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Key_range
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::keys() const
{
  return Key_range(Key_iterator(this, m_keys.head_index()), Key_iterator(this, S_NO_INDEX));
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Const_value_range
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::values() const
{
  return Const_value_range(Const_value_iterator(this, m_values.head_index()),
                           Const_value_iterator(this, S_NO_INDEX));
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Value_range
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::values_mut()
{
  return Value_range(Value_iterator(this, m_values.head_index()), Value_iterator(this, S_NO_INDEX));
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
uint64_t Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::epoch() const
{
  // Each arena's epoch only grows, so the sum changes whenever either does.
  return m_keys.epoch() + m_values.epoch();
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Hash
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::hash_function() const
{
  return m_index.hash_function();
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Pred
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::key_eq() const
{
  return m_index.key_eq();
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
log::Logger* Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::get_logger() const
{
  return m_logger;
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
void Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::set_logger(log::Logger* logger)
{
  m_logger = logger;
  m_keys.set_logger(logger);
  m_values.set_logger(logger);
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Value_handle
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::append_new_key(Key&& key, Value&& value)
{
  TWINE_LOG_SET_CONTEXT(m_logger, Twine_log_component::S_CONTAINER);

  const auto key_handle = m_keys.allocate_at_tail(Key_slot());
  auto index_it = m_index.end();
  Value_handle handle;
  try
  {
    const auto result = m_index.emplace(std::move(key), key_handle);
    assert(result.second);
    index_it = result.first;
    m_keys.at_index(key_handle.m_index).m_key = &(index_it->first);

    handle = append_at_key_slot(key_handle.m_index, std::move(value));
  }
  catch (...)
  {
    // A key never exists without a value: take it back out, then let the caller see the exception.
    if (index_it != m_index.end())
    {
      m_index.erase(index_it);
    }
    m_keys.remove_at_index(key_handle.m_index);
    throw;
  }

  TWINE_LOG_TRACE("Multimap [" << this << "]: created key slot " << key_handle << "; "
                  "[" << keys_len() << "] keys now.");
  return handle;
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Value_handle
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::append_at_key_slot(size_type key_idx, Value&& value)
{
  auto& slot = m_keys.at_index(key_idx);
  const auto handle = m_values.allocate_at_tail(Value_node{ std::move(value), key_idx, slot.m_tail, S_NO_INDEX });

  if (slot.m_tail == S_NO_INDEX)
  {
    slot.m_head = handle.m_index;
  }
  else
  {
    m_values.at_index(slot.m_tail).m_key_next = handle.m_index;
  }
  slot.m_tail = handle.m_index;
  ++slot.m_length;

  return handle;
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Value_vector
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::insert_at_key_slot(size_type key_idx, Value&& value)
{
  const auto& slot = m_keys.at_index(key_idx);
  const size_type head_idx = slot.m_head;

  Value_vector old_values;
  old_values.reserve(slot.m_length);

  // The head keeps its node, hence its global position; only its value changes.
  auto& head = m_values.at_index(head_idx);
  old_values.push_back(std::exchange(head.m_value, std::move(value)));

  // The rest go.  The head stays, so the key (and `slot`) survive all this.
  size_type idx = head.m_key_next;
  while (idx != S_NO_INDEX)
  {
    const auto next_idx = m_values.at_index(idx).m_key_next;
    old_values.push_back(unlink_value(idx));
    idx = next_idx;
  }

  assert(slot.m_length == 1);
  return old_values;
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Value_vector
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::remove_all_at_key_slot(size_type key_idx, Key_opt* last_key)
{
  Value_vector values;
  values.reserve(m_keys.at_index(key_idx).m_length);

  // Careful: the Key_slot is gone after the last iteration.
  size_type idx = m_keys.at_index(key_idx).m_head;
  while (idx != S_NO_INDEX)
  {
    const auto next_idx = m_values.at_index(idx).m_key_next;
    values.push_back(unlink_value(idx, last_key));
    idx = next_idx;
  }

  return values;
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Value
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::unlink_value(size_type value_idx, Key_opt* last_key)
{
  TWINE_LOG_SET_CONTEXT(m_logger, Twine_log_component::S_CONTAINER);

  const auto& node = m_values.at_index(value_idx);
  const auto key_idx = node.m_key_index;
  auto& slot = m_keys.at_index(key_idx);

  // Patch the key-local chain around the node.
  if (node.m_key_prev == S_NO_INDEX)
  {
    slot.m_head = node.m_key_next;
  }
  else
  {
    m_values.at_index(node.m_key_prev).m_key_next = node.m_key_next;
  }
  if (node.m_key_next == S_NO_INDEX)
  {
    slot.m_tail = node.m_key_prev;
  }
  else
  {
    m_values.at_index(node.m_key_next).m_key_prev = node.m_key_prev;
  }

  // The arena takes care of the global chain.  `node` is gone after this.
  Value value(std::move(m_values.remove_at_index(value_idx).m_value));

  assert(slot.m_length != 0);
  if (--slot.m_length == 0)
  {
    const auto index_it = m_index.find(*slot.m_key);
    assert(index_it != m_index.end());

    m_keys.remove_at_index(key_idx); // `slot` is gone after this.
    if (last_key)
    {
      *last_key = std::move(m_index.extract(index_it).key());
    }
    else
    {
      m_index.erase(index_it);
    }

    TWINE_LOG_TRACE("Multimap [" << this << "]: deleted key slot [" << key_idx << "] with its last value; "
                    "[" << keys_len() << "] keys remain.");
  }

  return value;
} // Ordered_multimap::unlink_value()

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Key_local_range
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::key_local_range(size_type key_idx)
{
  return Key_local_range(Key_local_iterator(this, m_keys.at_index(key_idx).m_head, key_idx),
                         Key_local_iterator(this, S_NO_INDEX, key_idx));
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::Const_key_local_range
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::key_local_range(size_type key_idx) const
{
  return Const_key_local_range(Const_key_local_iterator(this, m_keys.at_index(key_idx).m_head, key_idx),
                               Const_key_local_iterator(this, S_NO_INDEX, key_idx));
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::size_type
  Ordered_multimap<Key_t, Value_t, Hash_t, Pred_t>::key_index(const Key& key) const
{
  const auto index_it = m_index.find(key);
  return (index_it == m_index.end()) ? S_NO_INDEX : index_it->second.m_index;
}

template<typename Key, typename Value, typename Hash, typename Pred>
bool operator==(const Ordered_multimap<Key, Value, Hash, Pred>& val1,
                const Ordered_multimap<Key, Value, Hash, Pred>& val2)
{
  if ((val1.keys_len() != val2.keys_len()) || (val1.values_len() != val2.values_len()))
  {
    return false;
  }
  // else
  for (const auto& key : val1.keys())
  {
    if (!boost::range::equal(val1.get_all(key), val2.get_all(key)))
    {
      return false;
    }
  }
  return true;
}

template<typename Key, typename Value, typename Hash, typename Pred>
bool operator!=(const Ordered_multimap<Key, Value, Hash, Pred>& val1,
                const Ordered_multimap<Key, Value, Hash, Pred>& val2)
{
  return !(val1 == val2);
}

template<typename Key, typename Value, typename Hash, typename Pred>
std::ostream& operator<<(std::ostream& os, const Ordered_multimap<Key, Value, Hash, Pred>& val)
{
  os << '{';
  bool first = true;
  for (const auto& pair : val)
  {
    if (!first)
    {
      os << ", ";
    }
    first = false;
    os << pair.first << ": " << pair.second;
  }
  return os << '}';
}

template<typename Key, typename Value, typename Hash, typename Pred>
void swap(Ordered_multimap<Key, Value, Hash, Pred>& val1, Ordered_multimap<Key, Value, Hash, Pred>& val2)
{
  val1.swap(val2);
}

} // namespace twine::container
