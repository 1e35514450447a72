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
#include <boost/iostreams/stream.hpp>
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/noncopyable.hpp>
#include <ostream>

namespace twine::util
{

/**
 * An `ostream` that appends to an `std::string`: either one the caller owns or one of our own.  Unlike
 * `std::ostringstream` it can write into an existing string without copying it in or out.
 *
 * The stream is buffered; str() flushes it first, so it always returns everything written so far.
 */
class String_ostream :
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Prepares to append to `*target_str`, or to an internal string if `target_str` is null.
   *
   * @param target_str
   *        String to append to; must outlive `*this`.  Null to use our own.
   */
  explicit String_ostream(std::string* target_str = nullptr);

  // Methods.

  /**
   * The stream to write to.
   *
   * @return See above.
   */
  std::ostream& os();

  /**
   * Flushes, then returns the target string.
   *
   * @return See above.
   */
  const std::string& str();

  /// Flushes, then empties the target string.
  void str_clear();

private:
  // Types.

  /// Device appending to an `std::string`.
  using Appender = boost::iostreams::back_insert_device<std::string>;

  // Data.

  /// The target if the user gave none.
  std::string m_own_str;

  /// The target.
  std::string* const m_target;

  /// Stream over an #Appender into `*m_target`.
  boost::iostreams::stream<Appender> m_os;
}; // class String_ostream

} // namespace twine::util
