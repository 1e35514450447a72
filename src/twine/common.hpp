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

#include <boost/chrono/chrono.hpp>
#include <boost/chrono/io/duration_io.hpp>
#include <boost/system/error_code.hpp>
#include <boost/unordered_map.hpp>
#include <string>

#if (!defined(__cplusplus)) || (__cplusplus < 201703L)
#  error "Twine headers need C++17 or later (std::optional, std::variant, std::string_view)."
#endif

/**
 * Catch-all namespace for the Twine project.
 *
 * The centerpiece is twine::container::Ordered_multimap: a multimap that keeps one insertion order across all keys
 * as well as the order of each key's own values.  Around it:
 *
 *   - twine::log: a `Logger` interface, `Config` (per-component verbosity), `Log_context`, two loggers and the
 *     `TWINE_LOG_*()` macros, which skip building the message unless it will be logged.
 *   - twine::error: Runtime_error and the `Error_code* err_code = 0` convention.
 *   - twine::util: `ostream_op_string()`, String_ostream, Scoped_setter and a few macros.
 *   - twine::container: Arena_handle, Ordered_arena and Ordered_multimap.
 *
 * ### Error handling ###
 * An API that can fail takes a last argument `Error_code* err_code = 0`.  If it is null, failure throws
 * twine::error::Runtime_error; else `*err_code` is set, and cleared on success.  A missing key is never a failure.
 */
namespace twine
{

// Types.

/// Monotonic high-resolution clock for timing, as in `twine_bench`.
using Fine_clock = boost::chrono::high_resolution_clock;

/// A point in time from #Fine_clock.
using Fine_time_pt = Fine_clock::time_point;

/// The difference of two #Fine_time_pt values.
using Fine_duration = Fine_clock::duration;

/// How Twine reports errors: a boost.system error code, categorized per module (see twine::container::error).
using Error_code = boost::system::error_code;

/**
 * Log components of Twine's own logging, usable as log::Component payloads.  A program that logs through Twine
 * registers them with log::Config::init_component_to_union_idx_mapping() and names them with
 * log::Config::init_component_names() and #S_TWINE_LOG_COMPONENT_NAME_MAP.
 *
 * The underlying type must be log::Component::enum_raw_t; `S_END_SENTINEL` must come last.
 */
enum class Twine_log_component : unsigned int
{
  /// Logging from outside the `twine` modules, such as a program's `main()`.
  S_UNCAT = 0,
  /// Logging from twine::log itself.
  S_LOG,
  /// Logging from twine::container.
  S_CONTAINER,
  /// One past the last value.
  S_END_SENTINEL
}; // enum class Twine_log_component

/// The name of each #Twine_log_component, as shown in log lines and accepted by verbosity configuration.
extern const boost::unordered_multimap<Twine_log_component, std::string> S_TWINE_LOG_COMPONENT_NAME_MAP;

} // namespace twine
