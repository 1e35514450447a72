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

#include "twine/log/ostream_log_msg_writer.hpp"
#include "twine/log/log.hpp"
#include "twine/util/string_ostream.hpp"
#include "twine/util/util_fwd.hpp"
#include <string>

namespace twine::log
{

// Types.

/**
 * Logger that appends each message, as one line (see Ostream_log_msg_writer), to a string in memory.  Tests use it
 * to check what was logged.  Filtering is per the given Config.
 */
class Buffer_logger :
  public Logger
{
public:
  // Constructors/destructor.

  /**
   * Constructs logger with an empty buffer.
   *
   * @param config
   *        Controls filtering and formatting.  Must outlive `*this`.
   */
  explicit Buffer_logger(Config* config);

  // Methods.

  /**
   * Implements interface method by forwarding to Config::output_whether_should_log().
   *
   * @param sev
   *        Severity.
   * @param component
   *        Component.
   * @return See above.
   */
  bool should_log(Sev sev, const Component& component) const override;

  /**
   * Implements interface method by appending one line to the buffer.
   *
   * @param metadata
   *        See interface.
   * @param msg
   *        See interface.
   */
  void do_log(Msg_metadata* metadata, util::String_view msg) override;

  /**
   * Copy of everything logged so far.  Safe to call while other threads log.
   *
   * @return See above.
   */
  std::string buffer_str_copy();

  // Data.  (Public!)

  /// The Config passed to constructor.
  Config* const m_config;

private:
  // Data.

  /// The lines logged so far.
  std::string m_buffer;

  /// Appends to #m_buffer.
  util::String_ostream m_os;

  /// Writes to #m_os.
  Ostream_log_msg_writer m_os_writer;

  /// Protects #m_buffer.
  util::Mutex_non_recursive m_log_mutex;
}; // class Buffer_logger

} // namespace twine::log
