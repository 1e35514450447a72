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
#include "twine/container/arena_handle.hpp"
#include <boost/functional/hash.hpp>

namespace twine::container
{

// Implementations.

Arena_handle Arena_handle::null() // Static.
{
  return Arena_handle();
}

bool Arena_handle::is_null() const
{
  return m_index == S_NULL_INDEX;
}

bool operator==(const Arena_handle& val1, const Arena_handle& val2)
{
  return (val1.m_index == val2.m_index) && (val1.m_generation == val2.m_generation);
}

bool operator!=(const Arena_handle& val1, const Arena_handle& val2)
{
  return !(val1 == val2);
}

size_t hash_value(const Arena_handle& val)
{
  size_t seed = 0;
  boost::hash_combine(seed, val.m_index);
  boost::hash_combine(seed, val.m_generation);
  return seed;
}

std::ostream& operator<<(std::ostream& os, const Arena_handle& val)
{
  if (val.is_null())
  {
    return os << "[null]";
  }
  // else
  return os << '[' << val.m_index << '@' << val.m_generation << ']';
}

} // namespace twine::container
