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
#include <utility>
#include <variant>

namespace twine::container
{

// Types.

/**
 * A key of an Ordered_multimap known to be present, as yielded by Ordered_multimap::entry().  Operations act on
 * that key without hashing it again.
 *
 * An Occupied_entry stays usable while its key exists.  Once an operation through it (or through the map directly)
 * removes the key's last value, it must not be used again.
 *
 * @tparam Map_t
 *         The Ordered_multimap type.
 */
template<typename Map_t>
class Ordered_multimap_occupied_entry
{
public:
  // Types.

  /// Convenience alias for template arg.
  using Map = Map_t;

  /// Short-hand for key type.
  using Key = typename Map::Key;

  /// Short-hand for value type.
  using Value = typename Map::Value;

  /// Short-hand for size type.
  using size_type = typename Map::size_type;

  /// See Ordered_multimap.
  using Value_handle = typename Map::Value_handle;

  /// See Ordered_multimap.
  using Value_vector = typename Map::Value_vector;

  /// See Ordered_multimap.
  using Pair = typename Map::Pair;

  /// See Ordered_multimap.
  using Key_values = typename Map::Key_values;

  /// See Ordered_multimap.
  using Key_local_range = typename Map::Key_local_range;

  /// See Ordered_multimap.
  using Const_key_local_range = typename Map::Const_key_local_range;

  // Methods.

  /**
   * The key.
   * @return See above.
   */
  const Key& key() const;

  /**
   * Number of values of the key; positive.
   * @return See above.
   */
  size_type len() const;

  /**
   * The key's first value.
   * @return See above.
   */
  const Value& get() const;

  /**
   * The key's first value, mutable.
   * @return See above.
   */
  Value& get_mut();

  /**
   * Same as get_mut(), but the reference is tied to the map, not to `*this`, so it outlives it.
   * @return See above.
   */
  Value& into_mut();

  /**
   * Ordered_multimap::append() for this key.
   *
   * @param value
   *        Value.
   * @return See Ordered_multimap::append().
   */
  Value_handle append(Value value);

  /**
   * Ordered_multimap::insert() for this key.
   *
   * @param value
   *        Value.
   * @return See Ordered_multimap::insert(); never empty.
   */
  Value_vector insert(Value value);

  /**
   * Synonym of insert().
   *
   * @param value
   *        Value.
   * @return See insert().
   */
  Value_vector insert_all(Value value);

  /**
   * The key's values in key-local order.
   * @return See above.
   */
  Const_key_local_range iter() const;

  /**
   * The key's mutable values in key-local order.
   * @return See above.
   */
  Key_local_range iter_mut();

  /**
   * Ordered_multimap::remove() for this key.  If it was the last value, `*this` is dead.
   * @return The removed value.
   */
  Value remove();

  /**
   * Ordered_multimap::remove_all() for this key.  `*this` is dead afterwards.
   * @return The removed values.
   */
  Value_vector remove_all();

  /**
   * Ordered_multimap::remove_entry() for this key.  If it was the last value, `*this` is dead.
   * @return The key and the removed value.
   */
  Pair remove_entry();

  /**
   * Ordered_multimap::remove_entry_all() for this key.  `*this` is dead afterwards.
   * @return The key and the removed values.
   */
  Key_values remove_entry_all();

private:
  // Friends.

  /// Only the map creates these.
  friend Map;

  /// Vacant_entry::insert_entry() creates these too.
  friend class Ordered_multimap_vacant_entry<Map>;

  // Constructors/destructor.

  /**
   * Constructs entry for the existing key.
   *
   * @param map
   *        The map.
   * @param key_idx
   *        Key arena index of the key.
   */
  explicit Ordered_multimap_occupied_entry(Map* map, size_type key_idx);

  // Methods.

  /**
   * The key's Key_slot.
   * @return See above.
   */
  const auto& slot() const;

  // Data.

  /// The map.
  Map* m_map;

  /// Key arena index of the key.
  size_type m_key_idx;
}; // class Ordered_multimap_occupied_entry

/**
 * A key absent from an Ordered_multimap, as yielded by Ordered_multimap::entry(), holding the key until it is
 * inserted or taken back.
 *
 * @tparam Map_t
 *         The Ordered_multimap type.
 */
template<typename Map_t>
class Ordered_multimap_vacant_entry
{
public:
  // Types.

  /// Convenience alias for template arg.
  using Map = Map_t;

  /// Short-hand for key type.
  using Key = typename Map::Key;

  /// Short-hand for value type.
  using Value = typename Map::Value;

  /// Short-hand for the occupied counterpart.
  using Occupied_entry = Ordered_multimap_occupied_entry<Map>;

  // Methods.

  /**
   * The key.
   * @return See above.
   */
  const Key& key() const;

  /**
   * Gives the key back; `*this` is dead afterwards.
   * @return See above.
   */
  Key into_key();

  /**
   * Creates the key with `value` as its only value, at the end of the global order.  `*this` is dead afterwards.
   *
   * @param value
   *        Value.
   * @return The stored value.
   */
  Value& insert(Value value);

  /**
   * Like insert(), but returns an entry for the now-present key.
   *
   * @param value
   *        Value.
   * @return See above.
   */
  Occupied_entry insert_entry(Value value);

private:
  // Friends.

  /// Only the map creates these.
  friend Map;

  // Constructors/destructor.

  /**
   * Constructs entry for the absent key.
   *
   * @param map
   *        The map.
   * @param key
   *        The key.
   */
  explicit Ordered_multimap_vacant_entry(Map* map, Key&& key);

  // Data.

  /// The map.
  Map* m_map;

  /// The key, until inserted.
  Key m_key;
}; // class Ordered_multimap_vacant_entry

/**
 * Result of Ordered_multimap::entry(): either an Ordered_multimap_occupied_entry or an
 * Ordered_multimap_vacant_entry, plus the usual get-or-insert conveniences, e.g.:
 *
 *   ~~~
 *   ++map.entry("hits").or_insert(0);
 *   map.entry(key).and_modify([](auto& v) { v += 1; }).or_default();
 *   ~~~
 *
 * @tparam Map_t
 *         The Ordered_multimap type.
 */
template<typename Map_t>
class Ordered_multimap_entry
{
public:
  // Types.

  /// Convenience alias for template arg.
  using Map = Map_t;

  /// Short-hand for key type.
  using Key = typename Map::Key;

  /// Short-hand for value type.
  using Value = typename Map::Value;

  /// The occupied state.
  using Occupied_entry = Ordered_multimap_occupied_entry<Map>;

  /// The vacant state.
  using Vacant_entry = Ordered_multimap_vacant_entry<Map>;

  // Methods.

  /**
   * Whether the key is present.
   * @return See above.
   */
  bool is_occupied() const;

  /**
   * The key.
   * @return See above.
   */
  const Key& key() const;

  /**
   * The occupied state, or null if vacant.
   * @return See above.
   */
  Occupied_entry* occupied();

  /**
   * The vacant state, or null if occupied.
   * @return See above.
   */
  Vacant_entry* vacant();

  /**
   * If occupied, invokes `modifier` on the key's first value.
   *
   * @tparam Modifier
   *         Callable as `void (Value&)`.
   * @param modifier
   *        See above.
   * @return `*this`.
   */
  template<typename Modifier>
  Ordered_multimap_entry& and_modify(Modifier&& modifier);

  /**
   * The key's first value if occupied; else inserts `value` and returns it.
   *
   * @param value
   *        Value to insert if vacant.
   * @return See above.
   */
  Value& or_insert(Value value);

  /**
   * Like or_insert(), but the value to insert is made by `factory()`, invoked only if vacant.
   *
   * @tparam Factory
   *         Callable as `Value ()`.
   * @param factory
   *        See above.
   * @return See above.
   */
  template<typename Factory>
  Value& or_insert_with(Factory&& factory);

  /**
   * `or_insert(Value())`, without constructing the `Value` if occupied.
   * @return See or_insert().
   */
  Value& or_default();

  /**
   * If vacant, inserts `value`.  Either way returns the (now) occupied entry.
   *
   * @param value
   *        Value to insert if vacant.
   * @return See above.
   */
  Occupied_entry or_insert_entry(Value value);

private:
  // Friends.

  /// Only the map creates these.
  friend Map;

  // Constructors/destructor.

  /**
   * Constructs occupied entry.
   * @param occupied
   *        The state.
   */
  explicit Ordered_multimap_entry(Occupied_entry&& occupied);

  /**
   * Constructs vacant entry.
   * @param vacant
   *        The state.
   */
  explicit Ordered_multimap_entry(Vacant_entry&& vacant);

  // Data.

  /// The state.
  std::variant<Occupied_entry, Vacant_entry> m_state;
}; // class Ordered_multimap_entry

// Template implementations.

template<typename Map_t>
Ordered_multimap_occupied_entry<Map_t>::Ordered_multimap_occupied_entry(Map* map, size_type key_idx) :
  m_map(map),
  m_key_idx(key_idx)
{
  // Nothing else.
}

template<typename Map_t>
const auto& Ordered_multimap_occupied_entry<Map_t>::slot() const
{
  return m_map->m_keys.at_index(m_key_idx);
}

template<typename Map_t>
const typename Ordered_multimap_occupied_entry<Map_t>::Key& Ordered_multimap_occupied_entry<Map_t>::key() const
{
  return *(slot().m_key);
}

template<typename Map_t>
typename Ordered_multimap_occupied_entry<Map_t>::size_type Ordered_multimap_occupied_entry<Map_t>::len() const
{
  return slot().m_length;
}

template<typename Map_t>
const typename Ordered_multimap_occupied_entry<Map_t>::Value& Ordered_multimap_occupied_entry<Map_t>::get() const
{
  return m_map->m_values.at_index(slot().m_head).m_value;
}

template<typename Map_t>
typename Ordered_multimap_occupied_entry<Map_t>::Value& Ordered_multimap_occupied_entry<Map_t>::get_mut()
{
  return m_map->m_values.at_index(slot().m_head).m_value;
}

template<typename Map_t>
typename Ordered_multimap_occupied_entry<Map_t>::Value& Ordered_multimap_occupied_entry<Map_t>::into_mut()
{
  return get_mut();
}

template<typename Map_t>
typename Ordered_multimap_occupied_entry<Map_t>::Value_handle
  Ordered_multimap_occupied_entry<Map_t>::append(Value value)
{
  return m_map->append_at_key_slot(m_key_idx, std::move(value));
}

template<typename Map_t>
typename Ordered_multimap_occupied_entry<Map_t>::Value_vector
  Ordered_multimap_occupied_entry<Map_t>::insert(Value value)
{
  return m_map->insert_at_key_slot(m_key_idx, std::move(value));
}

template<typename Map_t>
typename Ordered_multimap_occupied_entry<Map_t>::Value_vector
  Ordered_multimap_occupied_entry<Map_t>::insert_all(Value value)
{
  return insert(std::move(value));
}

template<typename Map_t>
typename Ordered_multimap_occupied_entry<Map_t>::Const_key_local_range
  Ordered_multimap_occupied_entry<Map_t>::iter() const
{
  return static_cast<const Map*>(m_map)->key_local_range(m_key_idx);
}

template<typename Map_t>
typename Ordered_multimap_occupied_entry<Map_t>::Key_local_range
  Ordered_multimap_occupied_entry<Map_t>::iter_mut()
{
  return m_map->key_local_range(m_key_idx);
}

template<typename Map_t>
typename Ordered_multimap_occupied_entry<Map_t>::Value Ordered_multimap_occupied_entry<Map_t>::remove()
{
  return m_map->unlink_value(slot().m_head);
}

template<typename Map_t>
typename Ordered_multimap_occupied_entry<Map_t>::Value_vector Ordered_multimap_occupied_entry<Map_t>::remove_all()
{
  return m_map->remove_all_at_key_slot(m_key_idx, nullptr);
}

template<typename Map_t>
typename Ordered_multimap_occupied_entry<Map_t>::Pair Ordered_multimap_occupied_entry<Map_t>::remove_entry()
{
  typename Map::Key_opt last_key;
  auto value = m_map->unlink_value(slot().m_head, &last_key);
  if (last_key)
  {
    return Pair(std::move(*last_key), std::move(value));
  }
  // else
  return Pair(key(), std::move(value));
}

template<typename Map_t>
typename Ordered_multimap_occupied_entry<Map_t>::Key_values
  Ordered_multimap_occupied_entry<Map_t>::remove_entry_all()
{
  typename Map::Key_opt last_key;
  auto values = m_map->remove_all_at_key_slot(m_key_idx, &last_key);
  return Key_values(std::move(*last_key), std::move(values));
}

template<typename Map_t>
Ordered_multimap_vacant_entry<Map_t>::Ordered_multimap_vacant_entry(Map* map, Key&& key) :
  m_map(map),
  m_key(std::move(key))
{
  // Nothing else.
}

template<typename Map_t>
const typename Ordered_multimap_vacant_entry<Map_t>::Key& Ordered_multimap_vacant_entry<Map_t>::key() const
{
  return m_key;
}

template<typename Map_t>
typename Ordered_multimap_vacant_entry<Map_t>::Key Ordered_multimap_vacant_entry<Map_t>::into_key()
{
  return std::move(m_key);
}

template<typename Map_t>
typename Ordered_multimap_vacant_entry<Map_t>::Value& Ordered_multimap_vacant_entry<Map_t>::insert(Value value)
{
  const auto handle = m_map->append_new_key(std::move(m_key), std::move(value));
  return m_map->m_values.at_index(handle.m_index).m_value;
}

template<typename Map_t>
typename Ordered_multimap_vacant_entry<Map_t>::Occupied_entry
  Ordered_multimap_vacant_entry<Map_t>::insert_entry(Value value)
{
  const auto handle = m_map->append_new_key(std::move(m_key), std::move(value));
  return Occupied_entry(m_map, m_map->m_values.at_index(handle.m_index).m_key_index);
}

template<typename Map_t>
Ordered_multimap_entry<Map_t>::Ordered_multimap_entry(Occupied_entry&& occupied) :
  m_state(std::in_place_index<0>, std::move(occupied))
{
  // Nothing else.
}

template<typename Map_t>
Ordered_multimap_entry<Map_t>::Ordered_multimap_entry(Vacant_entry&& vacant) :
  m_state(std::in_place_index<1>, std::move(vacant))
{
  // Nothing else.
}

template<typename Map_t>
bool Ordered_multimap_entry<Map_t>::is_occupied() const
{
  return m_state.index() == 0;
}

template<typename Map_t>
const typename Ordered_multimap_entry<Map_t>::Key& Ordered_multimap_entry<Map_t>::key() const
{
  return std::visit([](const auto& state) -> const Key& { return state.key(); }, m_state);
}

template<typename Map_t>
typename Ordered_multimap_entry<Map_t>::Occupied_entry* Ordered_multimap_entry<Map_t>::occupied()
{
  return std::get_if<Occupied_entry>(&m_state);
}

template<typename Map_t>
typename Ordered_multimap_entry<Map_t>::Vacant_entry* Ordered_multimap_entry<Map_t>::vacant()
{
  return std::get_if<Vacant_entry>(&m_state);
}

template<typename Map_t>
template<typename Modifier>
Ordered_multimap_entry<Map_t>& Ordered_multimap_entry<Map_t>::and_modify(Modifier&& modifier)
{
  if (const auto occupied_state = occupied())
  {
    modifier(occupied_state->get_mut());
  }
  return *this;
}

template<typename Map_t>
typename Ordered_multimap_entry<Map_t>::Value& Ordered_multimap_entry<Map_t>::or_insert(Value value)
{
  if (const auto occupied_state = occupied())
  {
    return occupied_state->into_mut();
  }
  // else
  return vacant()->insert(std::move(value));
}

template<typename Map_t>
template<typename Factory>
typename Ordered_multimap_entry<Map_t>::Value& Ordered_multimap_entry<Map_t>::or_insert_with(Factory&& factory)
{
  if (const auto occupied_state = occupied())
  {
    return occupied_state->into_mut();
  }
  // else
  return vacant()->insert(factory());
}

template<typename Map_t>
typename Ordered_multimap_entry<Map_t>::Value& Ordered_multimap_entry<Map_t>::or_default()
{
  return or_insert_with([]() { return Value(); });
}

template<typename Map_t>
typename Ordered_multimap_entry<Map_t>::Occupied_entry Ordered_multimap_entry<Map_t>::or_insert_entry(Value value)
{
  if (const auto occupied_state = occupied())
  {
    return *occupied_state;
  }
  // else
  return vacant()->insert_entry(std::move(value));
}

} // namespace twine::container
