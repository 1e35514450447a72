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
#include <cstddef>
#include <cstdint>

namespace twine::container
{

// Types.

/**
 * Identifies one element of an Ordered_arena for that element's lifetime: the slot index plus the generation the
 * slot was given when the element was allocated.  Generations come from a per-arena counter that never repeats, so
 * once the element is removed the handle stays invalid even if its slot is reused; the arena then reports
 * error::Code::S_STALE_HANDLE.
 *
 * Plain data; copy freely.  A default-constructed handle is null (refers to nothing).
 */
struct Arena_handle
{
  // Constants.

  /// #m_index value of a null handle.
  static constexpr size_t S_NULL_INDEX = size_t(-1);

  // Methods.

  /**
   * Returns a null handle; same as default-constructed.
   * @return See above.
   */
  static Arena_handle null();

  /**
   * Whether `*this` is null.
   * @return See above.
   */
  bool is_null() const;

  // Data.

  /// Slot index in the arena's vector; #S_NULL_INDEX if null.
  size_t m_index = S_NULL_INDEX;

  /// Generation of the element, as issued by the arena at allocation.  0 is never issued.
  uint64_t m_generation = 0;
}; // struct Arena_handle

} // namespace twine::container
