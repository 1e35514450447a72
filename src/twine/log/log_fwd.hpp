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
#include "twine/common.hpp"
#include <iosfwd>

/**
 * Twine's logging: a small, synchronous relative of the usual `Logger`/`Config`/`Log_context` trio.
 *
 * Code logs with `TWINE_LOG_INFO("x [" << x << "].")` and friends.  The macros find the Logger and Component through
 * `get_logger()` and `get_log_component()`, which a Log_context base class provides; or a TWINE_LOG_SET_CONTEXT()
 * earlier in the block.  Nothing after the severity is evaluated unless Logger::should_log() says yes.
 *
 * Twine's own classes never need a logger: a null `Logger*` turns all of their logging off.
 */
namespace twine::log
{

// Types.

class Buffer_logger;
class Component;
class Config;
class Logger;
class Log_context;
struct Msg_metadata;
class Ostream_log_msg_writer;
class Simple_ostream_logger;

/**
 * Message severity; and, as a filter, the most verbose severity let through.  Lower is more severe.  Prints as its
 * name without the `S_` (`"WARNING"`) and reads from either that name (any case) or the number.
 */
enum class Sev : size_t
{
  /// Never the severity of a message; as a filter, blocks everything.
  S_NONE = 0,
  /// The program cannot go on.
  S_FATAL,
  /// Something failed, but the program can go on.
  S_ERROR,
  /// Something is off; rare enough to always show by default.
  S_WARNING,
  /// Notable and infrequent.
  S_INFO,
  /// Extra detail, still cheap to leave enabled.
  S_DEBUG,
  /// Per-operation detail, possibly very frequent.
  S_TRACE,
  /// Like S_TRACE, with data dumps.
  S_DATA,
  /// One past the last value.
  S_END_SENTINEL
}; // enum class Sev

// Free functions.

/**
 * Reads a Sev as described in its doc header; an unrecognized token gives Sev::S_NONE.
 *
 * @param is
 *        Stream.
 * @param val
 *        Result.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Sev& val);

/**
 * Prints a Sev's name, like `"TRACE"`.
 *
 * @param os
 *        Stream.
 * @param val
 *        Value.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Sev val);

/**
 * Log_context::swap() as a free function.
 *
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 */
void swap(Log_context& val1, Log_context& val2);

} // namespace twine::log
