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

#include "twine/common.hpp"

/**
 * Namespace containing the twine::container module's extension of boost.system error conventions, so that
 * its APIs can return codes/messages from within its own new set of error codes/messages.  See twine::error
 * for the general conventions.
 */
namespace twine::container::error
{

// Types.

/**
 * All possible errors returned (via twine::Error_code arguments) by twine::container functions/methods.
 * These values are convertible to twine::Error_code (a/k/a `boost::system::error_code`) and thus
 * extend the set of errors that twine::Error_code can represent.
 *
 * Absence of a key is never an error; these are about handles, iterators, and compaction.
 */
enum class Code
{
  /// Handle index is null or beyond the end of the arena's slot vector.
  S_INVALID_INDEX = 1,
  /// Handle refers to a slot that has been freed, or freed and reused, since the handle was issued.
  S_STALE_HANDLE,
  /// Iterator was used after a structural mutation of the container it iterates.
  S_ITERATOR_INVALIDATED,
  /// Requested compaction capacity is smaller than the number of live elements.
  S_PACK_CAPACITY_TOO_SMALL
}; // enum class Code

// Free functions.

/**
 * Given a `Code` `enum` value, creates a lightweight twine::Error_code representing that error.
 * This glues the general twine::Error_code to the container-specific code set, so that a Code implicitly
 * converts to an Error_code.
 *
 * @param err_code
 *        The `enum` value.
 * @return A corresponding twine::Error_code.
 */
Error_code make_error_code(Code err_code);

} // namespace twine::container::error

namespace boost::system
{

// Types.

/**
 * Specialization that authorizes boost.system to implicitly convert twine::container::error::Code to
 * twine::Error_code (via `make_error_code()` found by ADL).
 */
template<>
struct is_error_code_enum<::twine::container::error::Code>
{
  /// Means `Code` `enum` values can be used for twine::Error_code.
  static const bool value = true;
};

} // namespace boost::system
