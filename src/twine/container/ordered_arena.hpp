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
#include "twine/container/arena_handle.hpp"
#include "twine/container/detail/chain_iterator.hpp"
#include "twine/container/error/error.hpp"
#include "twine/error/error.hpp"
#include "twine/log/log.hpp"
#include <algorithm>
#include <cassert>
#include <iterator>
#include <optional>
#include <vector>

namespace twine::container
{

// Types.

/**
 * A slab of `Payload`s with stable handles and one doubly linked *global order* through the live elements.
 * Allocation reuses freed slots (a free list threaded through them) before growing the backing `std::vector`,
 * so steady-state churn allocates nothing.  Allocation at the tail, or right before/after any live element, and
 * removal of any element are O(1).
 *
 * An element is identified by an Arena_handle: its slot index plus a generation.  The handle keeps working until
 * the element is removed, no matter what else is allocated or removed, with one exception: pack_to() relocates
 * elements, and returns the old-to-new handle mapping.  After removal a handle is detectably stale
 * (error::Code::S_STALE_HANDLE), even if its slot has been reused.
 *
 * Iteration (forward and reverse) visits live payloads in global order.  Any structural mutation (allocation,
 * removal, clear(), pack_to()) bumps epoch(), which invalidates every existing iterator; using one afterwards
 * throws.  Mutating a payload in place through get() or an iterator is not structural.
 *
 * Besides the handle-checked API, an *index-level* API (`*_index()` methods) is public for containers built on top
 * (Ordered_multimap keeps its links in indices).  It validates nothing beyond `assert()`s.
 *
 * ### Thread safety ###
 * Same as for standard containers.
 *
 * @tparam Payload_t
 *         Stored type.  Must be move-constructible.  Copying the arena requires it to be copy-constructible.
 */
template<typename Payload_t>
class Ordered_arena
{
public:
  // Types.

  /// Convenience alias for template arg.
  using Payload = Payload_t;

  /// Short-hand for the handle type.
  using Handle = Arena_handle;

  /// Expresses sizes/lengths/indices.
  using size_type = std::size_t;

  /// Result of remove(): the payload, or nothing on error.
  using Payload_opt = std::optional<Payload>;

  /// Result of pack_to(): indexed by pre-pack slot index; new handle of the element formerly there, or null.
  using Remap = std::vector<Handle>;

private:
  // Types.  These are here in the middle of public block due to inability to forward-declare aliases.

  template<bool IS_CONST>
  struct Walk;

public:
  // Types (continued).

  /// Iterator over mutable payloads in global order.
  using Iterator = detail::Chain_iterator<Ordered_arena, Walk<false>>;

  /// Iterator over immutable payloads in global order.
  using Const_iterator = detail::Chain_iterator<const Ordered_arena, Walk<true>>;

  /// Reverse of #Iterator.
  using Reverse_iterator = std::reverse_iterator<Iterator>;

  /// Reverse of #Const_iterator.
  using Const_reverse_iterator = std::reverse_iterator<Const_iterator>;

  /// For container compliance (hence the irregular capitalization): #Iterator type.
  using iterator = Iterator;

  /// For container compliance (hence the irregular capitalization): #Const_iterator type.
  using const_iterator = Const_iterator;

  /// For container compliance (hence the irregular capitalization): #Payload type.
  using value_type = Payload;

  // Constants.

  /// Index meaning "none," as returned by the index-level API at the ends of the global order.
  static constexpr size_type S_NO_INDEX = size_type(-1);

  // Constructors/destructor.

  /**
   * Constructs empty arena.
   *
   * @param logger
   *        Logger for TRACE output and emitted errors; null to not log.
   */
  explicit Ordered_arena(log::Logger* logger = nullptr);

  /**
   * Copies `src`, including handles: a handle valid in `src` is valid, and refers to the equal payload, in `*this`.
   *
   * @param src
   *        Source object.
   */
  Ordered_arena(const Ordered_arena& src) = default;

  /**
   * Constructs `*this` by taking over the contents of `src`, which becomes empty.
   *
   * @param src
   *        Source object.
   */
  Ordered_arena(Ordered_arena&& src);

  // Methods.

  /**
   * Makes `*this` a copy of `src`.  Invalidates iterators into `*this`.
   *
   * @param src
   *        Source object.
   * @return `*this`.
   */
  Ordered_arena& operator=(const Ordered_arena& src);

  /**
   * Takes over the contents of `src`, which becomes empty.  Invalidates iterators into both.
   *
   * @param src
   *        Source object.
   * @return `*this`.
   */
  Ordered_arena& operator=(Ordered_arena&& src);

  /**
   * Swaps contents (including logger) with `other`.  Invalidates iterators into both.
   *
   * @param other
   *        Other object.
   */
  void swap(Ordered_arena& other);

  /**
   * Stores `payload` in a free (or new) slot and links it at the tail of the global order.
   *
   * @param payload
   *        Payload to move in.
   * @return Handle of the new element.
   */
  Handle allocate_at_tail(Payload payload);

  /**
   * Stores `payload` in a free (or new) slot and links it right after `anchor` in the global order.
   *
   * @param anchor
   *        Handle of a live element.
   * @param payload
   *        Payload to move in.  Dropped on error.
   * @param err_code
   *        See twine::error.  error::Code generated: S_INVALID_INDEX, S_STALE_HANDLE (`anchor` is not live).
   * @return Handle of the new element; null handle on error.
   */
  Handle allocate_after(const Handle& anchor, Payload payload, Error_code* err_code = 0);

  /**
   * Mirror image of allocate_after(): links the new element right before `anchor`.
   *
   * @param anchor
   *        See allocate_after().
   * @param payload
   *        See allocate_after().
   * @param err_code
   *        See allocate_after().
   * @return See allocate_after().
   */
  Handle allocate_before(const Handle& anchor, Payload payload, Error_code* err_code = 0);

  /**
   * Unlinks the element from the global order, frees its slot, and returns the payload.
   *
   * @param handle
   *        Handle of a live element.
   * @param err_code
   *        See twine::error.  error::Code generated: S_INVALID_INDEX, S_STALE_HANDLE.
   * @return The payload; empty on error.
   */
  Payload_opt remove(const Handle& handle, Error_code* err_code = 0);

  /**
   * Returns pointer to the payload of a live element.  The pointer stays valid until the element is removed or
   * the arena reallocates (allocation beyond capacity(), pack_to()).
   *
   * @param handle
   *        Handle of a live element.
   * @param err_code
   *        See twine::error.  error::Code generated: S_INVALID_INDEX, S_STALE_HANDLE.
   * @return See above; null on error.
   */
  Payload* get(const Handle& handle, Error_code* err_code = 0);

  /**
   * `const` counterpart of the other get().
   *
   * @param handle
   *        See other get().
   * @param err_code
   *        See other get().
   * @return See other get().
   */
  const Payload* get(const Handle& handle, Error_code* err_code = 0) const;

  /**
   * Whether `handle` refers to a live element.  Never an error.
   *
   * @param handle
   *        Any handle.
   * @return See above.
   */
  bool contains(const Handle& handle) const;

  /**
   * Ensures `additional` more elements can be allocated without reallocating the backing vector.  Never changes
   * indices or invalidates iterators.
   *
   * @param additional
   *        Number of elements.
   */
  void reserve(size_type additional);

  /**
   * Number of slots (live, free, or not yet used) the backing vector holds without reallocating.
   *
   * @return See above.
   */
  size_type capacity() const;

  /**
   * Number of live elements.
   *
   * @return See above.
   */
  size_type size() const;

  /**
   * `size() == 0`.
   *
   * @return See above.
   */
  bool empty() const;

  /// Removes every element; keeps capacity().  Every handle becomes invalid.
  void clear();

  /**
   * Compaction: moves live elements to slot indices `[0, size())` in global order, empties the free list, and
   * reallocates the backing vector to hold `new_capacity` slots.  Every handle is invalidated; the result maps each
   * old slot index to the new handle of its element.
   *
   * @param new_capacity
   *        Slot capacity afterwards; at least size().
   * @param err_code
   *        See twine::error.  error::Code generated: S_PACK_CAPACITY_TOO_SMALL (nothing is changed then).
   * @return See above; empty on error.
   */
  Remap pack_to(size_type new_capacity, Error_code* err_code = 0);

  /**
   * `pack_to(size())`, which cannot fail.
   *
   * @return See pack_to().
   */
  Remap pack_to_fit();

  /**
   * Structural-mutation counter; see class doc header.
   *
   * @return See above.
   */
  uint64_t epoch() const;

  /**
   * Returns first element in global order, or end() if empty.
   * @return See above.
   */
  Iterator begin();

  /**
   * Returns past-the-end iterator.
   * @return See above.
   */
  Iterator end();

  /**
   * Returns first element in global order, or end() if empty.
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
   * Returns last element in global order, going backwards.
   * @return See above.
   */
  Reverse_iterator rbegin();

  /**
   * Returns past-the-first, going backwards.
   * @return See above.
   */
  Reverse_iterator rend();

  /**
   * Returns last element in global order, going backwards.
   * @return See above.
   */
  Const_reverse_iterator crbegin() const;

  /**
   * Returns past-the-first, going backwards.
   * @return See above.
   */
  Const_reverse_iterator crend() const;

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

  // Index-level API.

  /**
   * Index of the first element in global order, or #S_NO_INDEX.
   * @return See above.
   */
  size_type head_index() const;

  /**
   * Index of the last element in global order, or #S_NO_INDEX.
   * @return See above.
   */
  size_type tail_index() const;

  /**
   * Index of the element after the live element at `idx`, or #S_NO_INDEX.
   * @param idx
   *        Index of a live element.
   * @return See above.
   */
  size_type next_index(size_type idx) const;

  /**
   * Index of the element before the live element at `idx`, or #S_NO_INDEX.
   * @param idx
   *        Index of a live element.
   * @return See above.
   */
  size_type prev_index(size_type idx) const;

  /**
   * Payload of the live element at `idx`.
   * @param idx
   *        Index of a live element.
   * @return See above.
   */
  Payload& at_index(size_type idx);

  /**
   * Payload of the live element at `idx`.
   * @param idx
   *        Index of a live element.
   * @return See above.
   */
  const Payload& at_index(size_type idx) const;

  /**
   * Handle of the live element at `idx`.
   * @param idx
   *        Index of a live element.
   * @return See above.
   */
  Handle handle_at_index(size_type idx) const;

  /**
   * Like remove() for the live element at `idx`.
   * @param idx
   *        Index of a live element.
   * @return The payload.
   */
  Payload remove_at_index(size_type idx);

private:
  // Types.

  /// One element of the backing vector: live (payload present) or free.
  struct Slot
  {
    // Data.

    /// The payload if live; empty if free.
    std::optional<Payload> m_payload;

    /// Previous live slot in global order (live slot only).
    size_type m_prev = S_NO_INDEX;

    /// Next live slot in global order if live; next free slot if free.
    size_type m_next = S_NO_INDEX;

    /// Generation issued at the latest allocation into this slot.
    uint64_t m_generation = 0;
  }; // struct Slot

  /**
   * Walk policy for detail::Chain_iterator: the global order.
   * @tparam IS_CONST
   *         Whether iterating immutable payloads.
   */
  template<bool IS_CONST>
  struct Walk
  {
    // Types.

    /// See detail::Chain_iterator.
    using Owner = std::conditional_t<IS_CONST, const Ordered_arena, Ordered_arena>;
    /// See detail::Chain_iterator.
    using value_type = Payload;
    /// See detail::Chain_iterator.
    using reference = std::conditional_t<IS_CONST, const Payload&, Payload&>;
    /// See detail::Chain_iterator.
    using Const_walk = Walk<true>;

    // Methods.

    /**
     * See detail::Chain_iterator.
     * @param arena
     *        Owner.
     * @param idx
     *        Index.
     * @return See above.
     */
    static reference deref(Owner& arena, size_type idx);
    /**
     * See detail::Chain_iterator.
     * @param arena
     *        Owner.
     * @param idx
     *        Index.
     * @return See above.
     */
    static size_type next(Owner& arena, size_type idx);
    /**
     * See detail::Chain_iterator.
     * @param arena
     *        Owner.
     * @param idx
     *        Index.
     * @return See above.
     */
    static size_type prev(Owner& arena, size_type idx);
    /**
     * See detail::Chain_iterator.
     * @param arena
     *        Owner.
     * @param anchor_idx
     *        Ignored.
     * @return See above.
     */
    static size_type last(Owner& arena, size_type anchor_idx);
    /**
     * See detail::Chain_iterator.
     * @param arena
     *        Owner.
     * @param idx
     *        Index.
     * @return See above.
     */
    static Handle handle(Owner& arena, size_type idx);
  }; // struct Walk

  // Methods.

  /**
   * Checks that `handle` refers to a live element; if not, emits the error into `*err_code`.
   *
   * @param handle
   *        Handle.
   * @param err_code
   *        Non-null.
   * @return `true` if and only if live.
   */
  bool validate(const Handle& handle, Error_code* err_code) const;

  /**
   * Moves `payload` into a free slot (or a new one) with a fresh generation; does not link it.
   *
   * @param payload
   *        Payload.
   * @return Slot index.
   */
  size_type acquire_slot(Payload&& payload);

  /**
   * Links the acquired slot `idx` between `prev` and `next` (either may be #S_NO_INDEX, meaning an end).
   *
   * @param idx
   *        Slot acquired by acquire_slot().
   * @param prev
   *        Its new predecessor.
   * @param next
   *        Its new successor.
   * @return Handle of the element.
   */
  Handle link(size_type idx, size_type prev, size_type next);

  /**
   * pack_to() minus the capacity check.
   *
   * @param new_capacity
   *        See pack_to().
   * @return See pack_to().
   */
  Remap pack_impl(size_type new_capacity);

  // Data.

  /// Logger; may be null.
  log::Logger* m_logger;

  /// The slots.
  std::vector<Slot> m_slots;

  /// First live slot in global order.
  size_type m_head;

  /// Last live slot in global order.
  size_type m_tail;

  /// First free slot; they are chained through Slot::m_next.
  size_type m_free_head;

  /// Number of live slots.
  size_type m_size;

  /// Last generation issued.
  uint64_t m_generation;

  /// See epoch().
  uint64_t m_epoch;
}; // class Ordered_arena

// Template implementations.

template<typename Payload_t>
Ordered_arena<Payload_t>::Ordered_arena(log::Logger* logger) :
  m_logger(logger),
  m_head(S_NO_INDEX),
  m_tail(S_NO_INDEX),
  m_free_head(S_NO_INDEX),
  m_size(0),
  m_generation(0),
  m_epoch(0)
{
  // Nothing else.
}

template<typename Payload_t>
Ordered_arena<Payload_t>::Ordered_arena(Ordered_arena&& src) :
  Ordered_arena(src.m_logger)
{
  swap(src);
}

template<typename Payload_t>
Ordered_arena<Payload_t>& Ordered_arena<Payload_t>::operator=(const Ordered_arena& src)
{
  if (&src != this)
  {
    const auto old_epoch = m_epoch;

    m_logger = src.m_logger;
    m_slots = src.m_slots;
    m_head = src.m_head;
    m_tail = src.m_tail;
    m_free_head = src.m_free_head;
    m_size = src.m_size;
    m_generation = src.m_generation;
    // Our iterators must not mistake the copied epoch for their own.
    m_epoch = std::max(old_epoch, src.m_epoch) + 1;
  }
  return *this;
}

template<typename Payload_t>
Ordered_arena<Payload_t>& Ordered_arena<Payload_t>::operator=(Ordered_arena&& src)
{
  if (&src != this)
  {
    clear();
    swap(src);
  }
  return *this;
}

template<typename Payload_t>
void Ordered_arena<Payload_t>::swap(Ordered_arena& other)
{
  using std::swap;

  if (&other != this)
  {
    swap(m_logger, other.m_logger);
    swap(m_slots, other.m_slots);
    swap(m_head, other.m_head);
    swap(m_tail, other.m_tail);
    swap(m_free_head, other.m_free_head);
    swap(m_size, other.m_size);
    swap(m_generation, other.m_generation);
    // Both sides changed structurally; one fresh epoch for both so that no old iterator matches either.
    m_epoch = other.m_epoch = std::max(m_epoch, other.m_epoch) + 1;
  }
}

template<typename Payload_t>
typename Ordered_arena<Payload_t>::Handle Ordered_arena<Payload_t>::allocate_at_tail(Payload payload)
{
  const auto idx = acquire_slot(std::move(payload));
  return link(idx, m_tail, S_NO_INDEX);
}

template<typename Payload_t>
typename Ordered_arena<Payload_t>::Handle
  Ordered_arena<Payload_t>::allocate_after(const Handle& anchor, Payload payload, Error_code* err_code)
{
  TWINE_ERROR_EXEC_AND_THROW_ON_ERROR(Handle, allocate_after, anchor, std::move(payload), _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  if (!validate(anchor, err_code))
  {
    return Handle();
  }
  // else
  err_code->clear();

  const auto idx = acquire_slot(std::move(payload));
  return link(idx, anchor.m_index, m_slots[anchor.m_index].m_next);
}

template<typename Payload_t>
typename Ordered_arena<Payload_t>::Handle
  Ordered_arena<Payload_t>::allocate_before(const Handle& anchor, Payload payload, Error_code* err_code)
{
  TWINE_ERROR_EXEC_AND_THROW_ON_ERROR(Handle, allocate_before, anchor, std::move(payload), _1);

  if (!validate(anchor, err_code))
  {
    return Handle();
  }
  // else
  err_code->clear();

  const auto idx = acquire_slot(std::move(payload));
  return link(idx, m_slots[anchor.m_index].m_prev, anchor.m_index);
}

template<typename Payload_t>
typename Ordered_arena<Payload_t>::Payload_opt
  Ordered_arena<Payload_t>::remove(const Handle& handle, Error_code* err_code)
{
  TWINE_ERROR_EXEC_AND_THROW_ON_ERROR(Payload_opt, remove, handle, _1);

  if (!validate(handle, err_code))
  {
    return std::nullopt;
  }
  // else
  err_code->clear();

  return remove_at_index(handle.m_index);
}

template<typename Payload_t>
typename Ordered_arena<Payload_t>::Payload*
  Ordered_arena<Payload_t>::get(const Handle& handle, Error_code* err_code)
{
  TWINE_ERROR_EXEC_AND_THROW_ON_ERROR(Payload*, get, handle, _1);

  if (!validate(handle, err_code))
  {
    return nullptr;
  }
  // else
  err_code->clear();

  return &(*(m_slots[handle.m_index].m_payload));
}

template<typename Payload_t>
const typename Ordered_arena<Payload_t>::Payload*
  Ordered_arena<Payload_t>::get(const Handle& handle, Error_code* err_code) const
{
  TWINE_ERROR_EXEC_AND_THROW_ON_ERROR(const Payload*, get, handle, _1);

  if (!validate(handle, err_code))
  {
    return nullptr;
  }
  // else
  err_code->clear();

  return &(*(m_slots[handle.m_index].m_payload));
}

template<typename Payload_t>
bool Ordered_arena<Payload_t>::contains(const Handle& handle) const
{
  return (handle.m_index < m_slots.size())
         && m_slots[handle.m_index].m_payload
         && (m_slots[handle.m_index].m_generation == handle.m_generation);
}

template<typename Payload_t>
bool Ordered_arena<Payload_t>::validate(const Handle& handle, Error_code* err_code) const
{
  TWINE_LOG_SET_CONTEXT(m_logger, Twine_log_component::S_CONTAINER);
  assert(err_code);

  if (handle.m_index >= m_slots.size()) // Includes the null handle.
  {
    TWINE_LOG_WARNING("Arena [" << this << "]: handle " << handle << " is beyond the [" << m_slots.size() << "] "
                      "slots.");
    TWINE_ERROR_EMIT_ERROR(error::Code::S_INVALID_INDEX);
    return false;
  }
  // else
  const auto& slot = m_slots[handle.m_index];
  if ((!slot.m_payload) || (slot.m_generation != handle.m_generation))
  {
    TWINE_LOG_WARNING("Arena [" << this << "]: handle " << handle << " is stale; the slot is "
                      << (slot.m_payload ? "live at generation [" : "free since generation [")
                      << slot.m_generation << "].");
    TWINE_ERROR_EMIT_ERROR(error::Code::S_STALE_HANDLE);
    return false;
  }
  // else
  return true;
} // Ordered_arena::validate()

template<typename Payload_t>
typename Ordered_arena<Payload_t>::size_type Ordered_arena<Payload_t>::acquire_slot(Payload&& payload)
{
  // If constructing the payload throws, the arena must be as it was.
  size_type idx = m_free_head;
  if (idx == S_NO_INDEX)
  {
    idx = m_slots.size();
    m_slots.emplace_back();
    try
    {
      m_slots.back().m_payload.emplace(std::move(payload));
    }
    catch (...)
    {
      m_slots.pop_back();
      throw;
    }
  }
  else
  {
    auto& slot = m_slots[idx];
    slot.m_payload.emplace(std::move(payload));
    m_free_head = slot.m_next;
  }

  m_slots[idx].m_generation = ++m_generation;
  return idx;
}

template<typename Payload_t>
typename Ordered_arena<Payload_t>::Handle Ordered_arena<Payload_t>::link(size_type idx, size_type prev, size_type next)
{
  auto& slot = m_slots[idx];
  slot.m_prev = prev;
  slot.m_next = next;

  if (prev == S_NO_INDEX)
  {
    m_head = idx;
  }
  else
  {
    m_slots[prev].m_next = idx;
  }
  if (next == S_NO_INDEX)
  {
    m_tail = idx;
  }
  else
  {
    m_slots[next].m_prev = idx;
  }

  ++m_size;
  ++m_epoch;
  return Handle{ idx, slot.m_generation };
} // Ordered_arena::link()

template<typename Payload_t>
typename Ordered_arena<Payload_t>::Payload Ordered_arena<Payload_t>::remove_at_index(size_type idx)
{
  assert(idx < m_slots.size());
  auto& slot = m_slots[idx];
  assert(slot.m_payload);

  // First, so that a throwing move leaves the element in place.
  Payload payload(std::move(*slot.m_payload));

  if (slot.m_prev == S_NO_INDEX)
  {
    m_head = slot.m_next;
  }
  else
  {
    m_slots[slot.m_prev].m_next = slot.m_next;
  }
  if (slot.m_next == S_NO_INDEX)
  {
    m_tail = slot.m_prev;
  }
  else
  {
    m_slots[slot.m_next].m_prev = slot.m_prev;
  }

  slot.m_payload.reset();
  slot.m_prev = S_NO_INDEX;
  slot.m_next = m_free_head;
  m_free_head = idx;

  --m_size;
  ++m_epoch;
  return payload;
} // Ordered_arena::remove_at_index()

template<typename Payload_t>
void Ordered_arena<Payload_t>::reserve(size_type additional)
{
  TWINE_LOG_SET_CONTEXT(m_logger, Twine_log_component::S_CONTAINER);

  const size_type n_free = m_slots.size() - m_size;
  if (additional > n_free)
  {
    m_slots.reserve(m_slots.size() + (additional - n_free));
  }

  TWINE_LOG_TRACE("Arena [" << this << "]: reserved room for [" << additional << "] more elements; "
                  "size [" << m_size << "], capacity now [" << m_slots.capacity() << "].");
}

template<typename Payload_t>
typename Ordered_arena<Payload_t>::size_type Ordered_arena<Payload_t>::capacity() const
{
  return m_slots.capacity();
}

template<typename Payload_t>
typename Ordered_arena<Payload_t>::size_type Ordered_arena<Payload_t>::size() const
{
  return m_size;
}

template<typename Payload_t>
bool Ordered_arena<Payload_t>::empty() const
{
  return m_size == 0;
}

template<typename Payload_t>
void Ordered_arena<Payload_t>::clear()
{
  TWINE_LOG_SET_CONTEXT(m_logger, Twine_log_component::S_CONTAINER);
  TWINE_LOG_TRACE("Arena [" << this << "]: clearing [" << m_size << "] elements.");

  m_slots.clear();
  m_head = m_tail = m_free_head = S_NO_INDEX;
  m_size = 0;
  ++m_epoch;
  // m_generation keeps counting: old handles must stay stale.
}

template<typename Payload_t>
typename Ordered_arena<Payload_t>::Remap
  Ordered_arena<Payload_t>::pack_to(size_type new_capacity, Error_code* err_code)
{
  TWINE_ERROR_EXEC_AND_THROW_ON_ERROR(Remap, pack_to, new_capacity, _1);
  TWINE_LOG_SET_CONTEXT(m_logger, Twine_log_component::S_CONTAINER);

  if (new_capacity < m_size)
  {
    TWINE_LOG_WARNING("Arena [" << this << "]: cannot pack [" << m_size << "] elements into "
                      "capacity [" << new_capacity << "].");
    TWINE_ERROR_EMIT_ERROR(error::Code::S_PACK_CAPACITY_TOO_SMALL);
    return Remap();
  }
  // else
  err_code->clear();

  return pack_impl(new_capacity);
}

template<typename Payload_t>
typename Ordered_arena<Payload_t>::Remap Ordered_arena<Payload_t>::pack_to_fit()
{
  return pack_impl(m_size);
}

template<typename Payload_t>
typename Ordered_arena<Payload_t>::Remap Ordered_arena<Payload_t>::pack_impl(size_type new_capacity)
{
  TWINE_LOG_SET_CONTEXT(m_logger, Twine_log_component::S_CONTAINER);
  assert(new_capacity >= m_size);

  std::vector<Slot> packed;
  packed.reserve(new_capacity);
  Remap remap(m_slots.size());

  for (size_type idx = m_head; idx != S_NO_INDEX; idx = m_slots[idx].m_next)
  {
    const size_type new_idx = packed.size();
    auto& old_slot = m_slots[idx];

    packed.emplace_back();
    auto& new_slot = packed.back();
    new_slot.m_payload = std::move(old_slot.m_payload);
    new_slot.m_generation = old_slot.m_generation; // Generations stay unique, so keeping them is safe.
    if (new_idx != 0)
    {
      new_slot.m_prev = new_idx - 1;
      packed[new_idx - 1].m_next = new_idx;
    }

    remap[idx] = Handle{ new_idx, new_slot.m_generation };
  }
  assert(packed.size() == m_size);

  TWINE_LOG_TRACE("Arena [" << this << "]: packed [" << m_size << "] elements from [" << m_slots.size() << "] "
                  "slots; capacity [" << m_slots.capacity() << "] => [" << packed.capacity() << "].");

  m_slots = std::move(packed);
  m_head = (m_size == 0) ? S_NO_INDEX : 0;
  m_tail = (m_size == 0) ? S_NO_INDEX : (m_size - 1);
  m_free_head = S_NO_INDEX;
  ++m_epoch;

  return remap;
} // Ordered_arena::pack_impl()

template<typename Payload_t>
uint64_t Ordered_arena<Payload_t>::epoch() const
{
  return m_epoch;
}

template<typename Payload_t>
typename Ordered_arena<Payload_t>::Iterator Ordered_arena<Payload_t>::begin()
{
  return Iterator(this, m_head);
}

template<typename Payload_t>
typename Ordered_arena<Payload_t>::Iterator Ordered_arena<Payload_t>::end()
{
  return Iterator(this, S_NO_INDEX);
}

template<typename Payload_t>
typename Ordered_arena<Payload_t>::Const_iterator Ordered_arena<Payload_t>::begin() const
{
  return Const_iterator(this, m_head);
}

template<typename Payload_t>
typename Ordered_arena<Payload_t>::Const_iterator Ordered_arena<Payload_t>::end() const
{
  return Const_iterator(this, S_NO_INDEX);
}

template<typename Payload_t>
typename Ordered_arena<Payload_t>::Const_iterator Ordered_arena<Payload_t>::cbegin() const
{
  return begin();
}

template<typename Payload_t>
typename Ordered_arena<Payload_t>::Const_iterator Ordered_arena<Payload_t>::cend() const
{
  return end();
}

template<typename Payload_t>
typename Ordered_arena<Payload_t>::Reverse_iterator Ordered_arena<Payload_t>::rbegin()
{
  return Reverse_iterator(end());
}

template<typename Payload_t>
typename Ordered_arena<Payload_t>::Reverse_iterator Ordered_arena<Payload_t>::rend()
{
  return Reverse_iterator(begin());
}

template<typename Payload_t>
typename Ordered_arena<Payload_t>::Const_reverse_iterator Ordered_arena<Payload_t>::crbegin() const
{
  return Const_reverse_iterator(cend());
}

template<typename Payload_t>
typename Ordered_arena<Payload_t>::Const_reverse_iterator Ordered_arena<Payload_t>::crend() const
{
  return Const_reverse_iterator(cbegin());
}

template<typename Payload_t>
log::Logger* Ordered_arena<Payload_t>::get_logger() const
{
  return m_logger;
}

template<typename Payload_t>
void Ordered_arena<Payload_t>::set_logger(log::Logger* logger)
{
  m_logger = logger;
}

template<typename Payload_t>
typename Ordered_arena<Payload_t>::size_type Ordered_arena<Payload_t>::head_index() const
{
  return m_head;
}

template<typename Payload_t>
typename Ordered_arena<Payload_t>::size_type Ordered_arena<Payload_t>::tail_index() const
{
  return m_tail;
}

template<typename Payload_t>
typename Ordered_arena<Payload_t>::size_type Ordered_arena<Payload_t>::next_index(size_type idx) const
{
  assert(m_slots[idx].m_payload);
  return m_slots[idx].m_next;
}

template<typename Payload_t>
typename Ordered_arena<Payload_t>::size_type Ordered_arena<Payload_t>::prev_index(size_type idx) const
{
  assert(m_slots[idx].m_payload);
  return m_slots[idx].m_prev;
}

template<typename Payload_t>
typename Ordered_arena<Payload_t>::Payload& Ordered_arena<Payload_t>::at_index(size_type idx)
{
  assert(m_slots[idx].m_payload);
  return *(m_slots[idx].m_payload);
}

template<typename Payload_t>
const typename Ordered_arena<Payload_t>::Payload& Ordered_arena<Payload_t>::at_index(size_type idx) const
{
  assert(m_slots[idx].m_payload);
  return *(m_slots[idx].m_payload);
}

template<typename Payload_t>
typename Ordered_arena<Payload_t>::Handle Ordered_arena<Payload_t>::handle_at_index(size_type idx) const
{
  assert(m_slots[idx].m_payload);
  return Handle{ idx, m_slots[idx].m_generation };
}

template<typename Payload_t>
template<bool IS_CONST>
typename Ordered_arena<Payload_t>::template Walk<IS_CONST>::reference
  Ordered_arena<Payload_t>::Walk<IS_CONST>::deref(Owner& arena, size_type idx) // Static.
{
  return arena.at_index(idx);
}

template<typename Payload_t>
template<bool IS_CONST>
typename Ordered_arena<Payload_t>::size_type
  Ordered_arena<Payload_t>::Walk<IS_CONST>::next(Owner& arena, size_type idx) // Static.
{
  return arena.next_index(idx);
}

template<typename Payload_t>
template<bool IS_CONST>
typename Ordered_arena<Payload_t>::size_type
  Ordered_arena<Payload_t>::Walk<IS_CONST>::prev(Owner& arena, size_type idx) // Static.
{
  return arena.prev_index(idx);
}

template<typename Payload_t>
template<bool IS_CONST>
typename Ordered_arena<Payload_t>::size_type
  Ordered_arena<Payload_t>::Walk<IS_CONST>::last(Owner& arena, size_type) // Static.
{
  return arena.tail_index();
}

template<typename Payload_t>
template<bool IS_CONST>
typename Ordered_arena<Payload_t>::Handle
  Ordered_arena<Payload_t>::Walk<IS_CONST>::handle(Owner& arena, size_type idx) // Static.
{
  return arena.handle_at_index(idx);
}

template<typename Payload>
void swap(Ordered_arena<Payload>& val1, Ordered_arena<Payload>& val2)
{
  val1.swap(val2);
}

} // namespace twine::container
