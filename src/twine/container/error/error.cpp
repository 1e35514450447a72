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
#include "twine/container/error/error.hpp"
#include <cassert>
#include <string>

namespace twine::container::error
{

// Types.

/**
 * The boost.system category for errors returned by the twine::container module.  Think of it as the polymorphic
 * counterpart of error::Code: it gives a Code-carrying twine::Error_code its `name()` and `message()`.
 */
class Category :
  public boost::system::error_category
{
public:
  // Constants.

  /// The one Category.
  static const Category S_CATEGORY;

  // Methods.

  /**
   * Analogous to `std::error_category::name()`: names this category; shows up in `ostream` output of any
   * Category-belonging twine::Error_code.
   *
   * @return See above.
   */
  const char* name() const noexcept override;

  /**
   * Analogous to `std::error_category::message()`: human-readable description of the error.
   *
   * @param val
   *        An error::Code value cast to `int`.
   * @return See above.
   */
  std::string message(int val) const override;

private:
  // Constructors/destructor.

  /// Boring constructor.
  explicit Category();
}; // class Category

// Static initializations.

const Category Category::S_CATEGORY;

// Implementations.

Error_code make_error_code(Code err_code)
{
  return Error_code{static_cast<int>(err_code), Category::S_CATEGORY};
}

Category::Category() = default;

const char* Category::name() const noexcept // Virtual.
{
  return "twine/container";
}

std::string Category::message(int val) const // Virtual.
{
  // KEEP THESE STRINGS IN SYNC WITH COMMENTS IN error.hpp ON THE INDIVIDUAL ENUM MEMBERS!
  switch (static_cast<Code>(val))
  {
  case Code::S_INVALID_INDEX:
    return "Handle index is null or beyond the end of the arena.";
  case Code::S_STALE_HANDLE:
    return "Handle refers to an element that has been removed; its slot may have been reused.";
  case Code::S_ITERATOR_INVALIDATED:
    return "Iterator used after a structural mutation of its container.";
  case Code::S_PACK_CAPACITY_TOO_SMALL:
    return "Requested compaction capacity is smaller than the number of live elements.";
  }
  assert(false);
  return "";
} // Category::message()

} // namespace twine::container::error
