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

#include "twine/log/log.hpp"
#include <boost/noncopyable.hpp>
#include <array>
#include <ostream>

namespace twine::log
{

// Types.

/**
 * Formats log messages with their metadata, one line each, and writes them to an `ostream`.  A Logger that writes
 * to an `ostream` hands each message to one of these.  The line format:
 *
 *   ~~~
 *   <time stamp> [<sev>]: T<thread nickname or ID>: <component>: <file>:<function>(<line>): <msg>
 *   ~~~
 *
 * `<sev>` is a 4-letter abbreviation (`warn`, `trce`, ...).  `<component>: ` is omitted for an empty Component.
 * The time stamp is seconds.microseconds since the POSIX epoch, or local date-time with nanoseconds and zone, per
 * Config::m_use_human_friendly_time_stamps (read once, at construction).
 *
 * Not thread-safe: the owning Logger serializes log() calls.  Each line reaches the stream in one write.
 */
class Ostream_log_msg_writer :
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Constructs the writer.  Both arguments must outlive `*this`.
   *
   * @param config
   *        Controls time stamp format and component output.
   * @param os
   *        Stream to write to.
   */
  explicit Ostream_log_msg_writer(const Config& config, std::ostream& os);

  // Methods.

  /**
   * Writes one line: metadata plus `msg` plus newline; then flushes.
   *
   * @param metadata
   *        Message metadata.  `metadata.m_msg_sev` must not be Sev::S_NONE.
   * @param msg
   *        Message body.
   */
  void log(const Msg_metadata& metadata, util::String_view msg);

private:
  // Constants.

  /// Severity abbreviations, indexed by `size_t(Sev)`.
  static const std::array<util::String_view, size_t(Sev::S_END_SENTINEL)> S_SEV_STRS;

  // Data.

  /// See ctor.
  const Config& m_config;

  /// Copy of Config::m_use_human_friendly_time_stamps at construction.
  const bool m_human_friendly_time_stamps;

  /// See ctor.
  std::ostream& m_os;

  /// Component text of the current line; reused to avoid reallocating.
  std::string m_component_str;
}; // class Ostream_log_msg_writer

} // namespace twine::log
