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

#include <boost/thread/thread.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/thread/lock_types.hpp>
#include <iosfwd>
#include <string>
#include <string_view>

/**
 * Odds and ends used across Twine: string building via `ostream`, a couple of thread short-hands, source-location
 * macros and a parser for `enum`s that print themselves as words.
 */
namespace twine::util
{

// Types.

class String_ostream;
template<typename Value>
class Scoped_setter;

/// Non-owning view of a character sequence; used for log text, file names and such.
using String_view = std::string_view;

/// Identifies a thread in log output.
using Thread_id = boost::thread::id;

/// The mutex type used by the loggers.
using Mutex_non_recursive = boost::mutex;

/// Lock for a mutex of type `Mutex`; locks in ctor, unlocks in dtor.
template<typename Mutex>
using Lock_guard = boost::unique_lock<Mutex>;

// Free functions.

/**
 * Whether `container` (anything with `find()` and `end()`, keyed by `key_type`) has `key`.
 *
 * @tparam Container
 *         Associative container type.
 * @param container
 *        Container to search.
 * @param key
 *        Key to look for.
 * @return See above.
 */
template<typename Container>
bool key_exists(const Container& container, const typename Container::key_type& key);

/**
 * Appends to `*target_str` what `os << arg1 << arg2 << ...` would print.
 *
 * @tparam T
 *         Any `ostream`-printable types, including manipulators such as `std::hex`.
 * @param target_str
 *        String to append to.
 * @param ostream_args
 *        Things to print, left to right.
 */
template<typename ...T>
void ostream_op_to_string(std::string* target_str, T const &... ostream_args);

/**
 * Same as ostream_op_to_string() but returns a new string.
 *
 * @tparam T
 *         See ostream_op_to_string().
 * @param ostream_args
 *        See ostream_op_to_string().
 * @return The printed text.
 */
template<typename ...T>
std::string ostream_op_string(T const &... ostream_args);

/**
 * Reads an `enum` value from `*is_ptr`, for `enum`s whose `operator<<` prints each value as a word (e.g., `Sev`).
 *
 * The token is the longest run of letters, digits and underscores after any leading whitespace; the character
 * ending it is left in the stream.  A token that is all digits is taken as the numeric value.  Otherwise it is
 * matched, ignoring case, against the printed form of each value in `[0, enum_sentinel)`.  If nothing matches,
 * `enum_default` is the result; the stream is not put into a failed state for that.
 *
 * @tparam Enum
 *         An `enum` or `enum class` whose values run contiguously from 0 to `enum_sentinel`.
 * @param is_ptr
 *        Stream to read.
 * @param enum_default
 *        Result for an empty or unrecognized token.
 * @param enum_sentinel
 *        One past the highest valid value.
 * @return See above.
 */
template<typename Enum>
Enum istream_to_enum(std::istream* is_ptr, Enum enum_default, Enum enum_sentinel);

/**
 * The part of `path` after the last forward slash, or all of it if there is none.
 *
 * @param path
 *        A path, typically `__FILE__`.
 * @return See above.
 */
constexpr String_view get_last_path_segment(String_view path);

/**
 * Returns `"<file name>:<function>(<line>)"`; see TWINE_UTIL_WHERE_AM_I_STR().
 *
 * @param file
 *        Source file path; only its last segment is used.
 * @param function
 *        Function name.
 * @param line
 *        Line number.
 * @return See above.
 */
std::string get_where_am_i_str(String_view file, String_view function, unsigned int line);

} // namespace twine::util

// Macros.

/**
 * Evaluates to an `std::string` naming the source location of the macro invocation, like
 * `"ordered_arena.hpp:remove(123)"`.
 */
#define TWINE_UTIL_WHERE_AM_I_STR() \
  ::twine::util::get_where_am_i_str(__FILE__, __FUNCTION__, __LINE__)

/**
 * Like TWINE_UTIL_WHERE_AM_I_STR() but a string literal, built at compile time.  Since `__FUNCTION__` is not a
 * literal, the caller names the function; and the full `__FILE__` path is kept.
 *
 * @param ARG_function
 *        Function name, as an identifier (not a string).
 */
#define TWINE_UTIL_WHERE_AM_I_LITERAL(ARG_function) \
  __FILE__ ":" TWINE_UTIL_STRINGIFY(ARG_function) "(" TWINE_UTIL_STRINGIFY(__LINE__) ")"

/// Stringifies `ARG_token` after macro-expanding it.
#define TWINE_UTIL_STRINGIFY(ARG_token) TWINE_UTIL_STRINGIFY_LITERALLY(ARG_token)

/// Stringifies `ARG_token` exactly as written.
#define TWINE_UTIL_STRINGIFY_LITERALLY(ARG_token) #ARG_token

/**
 * Wraps a multi-statement macro body so that the macro can be used like a function call, semicolon included, even
 * as the lone statement of an unbraced `if`.  Inside, `break` leaves the body early.
 *
 * @param ARG_func_macro_definition
 *        The statements.  Commas must be protected by parentheses (braces do not protect them).
 */
#define TWINE_UTIL_SEMICOLON_SAFE(ARG_func_macro_definition) \
  do \
  { \
    ARG_func_macro_definition \
  } \
  while (false)
