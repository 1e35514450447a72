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
#include "twine/util/util_fwd.hpp"
#include <iostream>

namespace twine::log
{

// Types.

/**
 * Logger writing each message as one line (see Ostream_log_msg_writer) to one of two `ostream`s: WARNING and more
 * severe to `os_for_err`, the rest to `os`.  Filtering is per the given Config.  Logging is synchronous; a mutex
 * keeps lines from different threads whole.
 *
 * The test driver and `twine_bench` log through one of these.
 */
class Simple_ostream_logger :
  public Logger
{
public:
  // Constructors/destructor.

  /**
   * Constructs logger.  The Config and the streams must outlive `*this`.
   *
   * @param config
   *        Controls filtering and formatting.
   * @param os
   *        Stream for messages more verbose than Sev::S_WARNING.
   * @param os_for_err
   *        Stream for the rest.  May be the same object as `os`.
   */
  explicit Simple_ostream_logger(Config* config,
                                 std::ostream& os = std::cout, std::ostream& os_for_err = std::cerr);

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
   * Implements interface method by writing one line to the stream for `metadata->m_msg_sev`.
   *
   * @param metadata
   *        See interface.
   * @param msg
   *        See interface.
   */
  void do_log(Msg_metadata* metadata, util::String_view msg) override;

  // Data.  (Public!)

  /// The Config passed to constructor.
  Config* const m_config;

private:
  // Data.

  /// Writes to `os`.
  Ostream_log_msg_writer m_os_writer;

  /// Writes to `os_for_err`.
  Ostream_log_msg_writer m_os_for_err_writer;

  /// Serializes do_log().
  util::Mutex_non_recursive m_log_mutex;
}; // class Simple_ostream_logger

} // namespace twine::log
