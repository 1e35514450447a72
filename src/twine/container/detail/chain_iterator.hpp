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

#include "twine/container/arena_handle.hpp"
#include "twine/container/error/error.hpp"
#include "twine/error/error.hpp"
#include <boost/iterator/iterator_facade.hpp>
#include <type_traits>

namespace twine::container::detail
{

// Types.

/**
 * Bidirectional iterator over a doubly linked chain of slot indices inside a container: the global order of an
 * Ordered_arena, or one key's chain inside an Ordered_multimap, etc.  What the chain is, and what dereferencing
 * yields, is decided by the `Walk` policy; this class adds the bookkeeping: the current index, the past-the-end
 * sentinel, and invalidation checking.
 *
 * At construction the iterator memorizes `owner->epoch()`.  Every dereference, increment and decrement compares
 * the owner's current epoch with it and throws twine::error::Runtime_error with error::Code::S_ITERATOR_INVALIDATED
 * on mismatch: the owner has been structurally mutated since.  Comparison does not check.
 *
 * `Walk` must supply:
 *   - `value_type`, `reference`;
 *   - `using Const_walk = ...`: the `Walk` of the corresponding const iterator (for the mutable-to-const conversion);
 *   - `static reference deref(Owner&, size_t idx)`;
 *   - `static size_t next(Owner&, size_t idx)`, `static size_t prev(Owner&, size_t idx)`;
 *   - `static size_t last(Owner&, size_t anchor_idx)`: the index an end iterator decrements to;
 *   - `static Arena_handle handle(Owner&, size_t idx)`.
 *
 * @tparam Owner
 *         The container type, `const`-qualified for const iterators.
 * @tparam Walk
 *         See above.
 */
template<typename Owner, typename Walk>
class Chain_iterator :
  public boost::iterator_facade<Chain_iterator<Owner, Walk>,
                                typename Walk::value_type,
                                boost::bidirectional_traversal_tag,
                                typename Walk::reference>
{
public:
  // Constants.

  /// Index meaning past-the-end (or, for `anchor_idx`, none).
  static constexpr size_t S_NO_INDEX = size_t(-1);

  // Constructors/destructor.

  /// Singular iterator: may only be assigned to or destroyed.
  Chain_iterator();

  /**
   * Constructs iterator at the given position.
   *
   * @param owner
   *        The container.
   * @param idx
   *        Index of the current element; #S_NO_INDEX for past-the-end.
   * @param anchor_idx
   *        Passed to `Walk::last()` when decrementing from past-the-end.
   */
  explicit Chain_iterator(Owner* owner, size_t idx, size_t anchor_idx = S_NO_INDEX);

  /**
   * Converts a mutable iterator to the corresponding const iterator.  Epoch memorized by `src` carries over.
   *
   * @tparam Src_owner
   *         Owner type of `src`.
   * @tparam Src_walk
   *         Walk type of `src`; its `Const_walk` must be `Walk`.
   * @param src
   *        Source object.
   */
  template<typename Src_owner, typename Src_walk,
           typename = std::enable_if_t<std::is_same_v<typename Src_walk::Const_walk, Walk>
                                       && std::is_convertible_v<Src_owner*, Owner*>>>
  Chain_iterator(const Chain_iterator<Src_owner, Src_walk>& src);

  // Methods.

  /**
   * Handle of the element at which `*this` points.  Must not be past-the-end.
   *
   * @return See above.
   */
  Arena_handle handle() const;

  /**
   * Whether `*this` is past-the-end.  Does not check for invalidation.
   *
   * @return See above.
   */
  bool at_end() const;

private:
  // Friends.

  /// boost.iterator's facade calls our private primitives.
  friend class boost::iterator_core_access;

  /// Other instantiations, for the converting constructor and mixed comparisons.
  template<typename, typename>
  friend class Chain_iterator;

  // Methods.

  /**
   * Facade primitive: the current element.
   * @return See above.
   */
  typename Walk::reference dereference() const;

  /// Facade primitive: step forward.
  void increment();

  /// Facade primitive: step backward; from past-the-end steps to `Walk::last()`.
  void decrement();

  /**
   * Facade primitive: same position in the same chain.
   *
   * @tparam Other_owner
   *         See #m_owner.
   * @tparam Other_walk
   *         See `Walk`.
   * @param other
   *        Object.
   * @return See above.
   */
  template<typename Other_owner, typename Other_walk>
  bool equal(const Chain_iterator<Other_owner, Other_walk>& other) const;

  /// Throws if the owner has been structurally mutated since `*this` was created.
  void check_epoch() const;

  // Data.

  /// The container.  Null if singular.
  Owner* m_owner;

  /// Current index, or #S_NO_INDEX.
  size_t m_idx;

  /// See ctor.
  size_t m_anchor_idx;

  /// `m_owner->epoch()` at construction.
  uint64_t m_epoch;
}; // class Chain_iterator

// Template implementations.

template<typename Owner, typename Walk>
Chain_iterator<Owner, Walk>::Chain_iterator() :
  m_owner(nullptr),
  m_idx(S_NO_INDEX),
  m_anchor_idx(S_NO_INDEX),
  m_epoch(0)
{
  // Nothing else.
}

template<typename Owner, typename Walk>
Chain_iterator<Owner, Walk>::Chain_iterator(Owner* owner, size_t idx, size_t anchor_idx) :
  m_owner(owner),
  m_idx(idx),
  m_anchor_idx(anchor_idx),
  m_epoch(m_owner->epoch())
{
  // Nothing else.
}

template<typename Owner, typename Walk>
template<typename Src_owner, typename Src_walk, typename>
Chain_iterator<Owner, Walk>::Chain_iterator(const Chain_iterator<Src_owner, Src_walk>& src) :
  m_owner(src.m_owner),
  m_idx(src.m_idx),
  m_anchor_idx(src.m_anchor_idx),
  m_epoch(src.m_epoch)
{
  // Nothing else.
}

template<typename Owner, typename Walk>
Arena_handle Chain_iterator<Owner, Walk>::handle() const
{
  check_epoch();
  assert(m_idx != S_NO_INDEX);
  return Walk::handle(*m_owner, m_idx);
}

template<typename Owner, typename Walk>
bool Chain_iterator<Owner, Walk>::at_end() const
{
  return m_idx == S_NO_INDEX;
}

template<typename Owner, typename Walk>
typename Walk::reference Chain_iterator<Owner, Walk>::dereference() const
{
  check_epoch();
  assert(m_idx != S_NO_INDEX);
  return Walk::deref(*m_owner, m_idx);
}

template<typename Owner, typename Walk>
void Chain_iterator<Owner, Walk>::increment()
{
  check_epoch();
  assert(m_idx != S_NO_INDEX);
  m_idx = Walk::next(*m_owner, m_idx);
}

template<typename Owner, typename Walk>
void Chain_iterator<Owner, Walk>::decrement()
{
  check_epoch();
  m_idx = (m_idx == S_NO_INDEX) ? Walk::last(*m_owner, m_anchor_idx)
                                : Walk::prev(*m_owner, m_idx);
  assert(m_idx != S_NO_INDEX); // Decrementing begin() is undefined behavior.
}

template<typename Owner, typename Walk>
template<typename Other_owner, typename Other_walk>
bool Chain_iterator<Owner, Walk>::equal(const Chain_iterator<Other_owner, Other_walk>& other) const
{
  return (m_idx == other.m_idx) && (m_owner == other.m_owner);
}

template<typename Owner, typename Walk>
void Chain_iterator<Owner, Walk>::check_epoch() const
{
  assert(m_owner);
  if (m_owner->epoch() != m_epoch)
  {
    throw ::twine::error::Runtime_error(error::Code::S_ITERATOR_INVALIDATED, TWINE_UTIL_WHERE_AM_I_STR());
  }
}

} // namespace twine::container::detail
