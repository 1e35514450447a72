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
#include "twine/log/log.hpp"
#include "twine/util/util_fwd.hpp"
#include <boost/system/system_error.hpp>

/**
 * How Twine reports failure: boost.system codes, each module adding its own `enum class Code` and category in
 * `twine::X::error` (see twine::container::error).
 *
 * An API `R f(args..., Error_code* err_code = 0)` that can fail behaves as follows.  With a null `err_code` it
 * throws Runtime_error on failure.  Otherwise it sets `*err_code` (cleared on success) and returns a neutral value
 * on failure.  TWINE_ERROR_EXEC_AND_THROW_ON_ERROR() gives the null-`err_code` behavior in one line.
 */
namespace twine::error
{

// Types.

/// A failed Twine operation's #Error_code plus where it happened; thrown when the caller gave no `err_code`.
class Runtime_error :
  public boost::system::system_error
{
public:
  /**
   * Constructs Runtime_error.
   *
   * @param err_code
   *        What went wrong; not success.
   * @param context
   *        Where it went wrong; TWINE_UTIL_WHERE_AM_I_STR() may help.
   */
  explicit Runtime_error(const Error_code& err_code, util::String_view context = util::String_view());
};

// Free functions.

/**
 * The part of TWINE_ERROR_EXEC_AND_THROW_ON_ERROR() that needs no preprocessor.  If `err_code` is null: runs
 * `*ret = func(&e_c)`, throws `Runtime_error(e_c, context)` if that set `e_c`, and returns `true`.  Otherwise
 * returns `false` at once; the caller then does the work itself.
 *
 * @tparam Func
 *         Callable as `Ret(Error_code*)`.
 * @tparam Ret
 *         Result type.
 * @param func
 *        The operation; usually the calling API again, with a non-null `Error_code*`.
 * @param ret
 *        Receives the result if `func` runs.
 * @param err_code
 *        The caller's `err_code`.
 * @param context
 *        See Runtime_error.
 * @return Whether `func` ran.
 */
template<typename Func, typename Ret>
bool exec_and_throw_on_error(const Func& func, Ret* ret, Error_code* err_code, util::String_view context)
{
  if (err_code)
  {
    return false;
  }
  // else

  Error_code our_err_code;
  *ret = func(&our_err_code);
  if (our_err_code)
  {
    throw Runtime_error(our_err_code, context);
  }
  return true;
}

} // namespace twine::error

// Macros.

/**
 * Sets `*err_code` to `ARG_val`, logging a WARNING about it.  For an API with the trailing `Error_code* err_code`
 * argument, once `err_code` is known to be non-null.  Needs TWINE_LOG_SET_CONTEXT() in scope.
 *
 * @param ARG_val
 *        Convertible to #Error_code; typically some module's `error::Code`.
 */
#define TWINE_ERROR_EMIT_ERROR(ARG_val) \
  TWINE_UTIL_SEMICOLON_SAFE \
  ( \
    const ::twine::Error_code TWINE_ERROR_val(ARG_val); \
    TWINE_LOG_WARNING("Error code emitted: [" << TWINE_ERROR_val << "] [" << TWINE_ERROR_val.message() << "]."); \
    *err_code = TWINE_ERROR_val; \
  )

/**
 * At the top of an API `ARG_ret_type f(..., Error_code* err_code)`: if `err_code` is null, calls
 * `ARG_function_name(...)` with a local #Error_code as `_1`, throws Runtime_error if that failed, else returns its
 * result.  If `err_code` is non-null it does nothing.
 *
 * `ARG_ret_type` must be default-constructible and free of commas.
 *
 * @param ARG_ret_type
 *        Return type of `f()`.
 * @param ARG_function_name
 *        Name of `f()`.
 * @param ...
 *        Arguments of the call, `_1` in place of `err_code`.
 */
#define TWINE_ERROR_EXEC_AND_THROW_ON_ERROR(ARG_ret_type, ARG_function_name, ...) \
  TWINE_UTIL_SEMICOLON_SAFE \
  ( \
    ARG_ret_type TWINE_ERROR_result; \
    if (::twine::error::exec_and_throw_on_error \
          ([&](::twine::Error_code* _1) -> ARG_ret_type { return ARG_function_name(__VA_ARGS__); }, \
           &TWINE_ERROR_result, err_code, TWINE_UTIL_WHERE_AM_I_LITERAL(ARG_function_name))) \
    { \
      return TWINE_ERROR_result; \
    } \
  )
