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
#include "twine/util/string_ostream.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <boost/lexical_cast.hpp>
#include <algorithm>
#include <cctype>
#include <istream>
#include <utility>

namespace twine::util
{

// Types.

/**
 * Sets `*target` to a value for the lifetime of `*this`, then puts back the value it had before.  Movable, so it can
 * be returned from a factory such as log::Config::this_thread_verbosity_override_auto(); a moved-from setter restores
 * nothing.
 *
 * @tparam Value
 *         Type of the variable; copyable or movable.
 */
template<typename Value>
class Scoped_setter
{
public:
  // Constructors/destructor.

  /**
   * Saves `*target`, then sets it to `val_src_moved`.
   *
   * @param target
   *        Variable to set and later restore.  Must outlive `*this`.
   * @param val_src_moved
   *        New value.
   */
  explicit Scoped_setter(Value* target, Value&& val_src_moved);

  /**
   * Takes over the restoring duty of `src_moved`.
   *
   * @param src_moved
   *        Moved-from; will restore nothing.
   */
  Scoped_setter(Scoped_setter&& src_moved);

  /// Restores the saved value, unless moved-from.
  ~Scoped_setter();

  // Methods.

  /// Not copyable: the variable would be restored twice.
  Scoped_setter(const Scoped_setter&) = delete;
  /// Not assignable.
  Scoped_setter& operator=(const Scoped_setter&) = delete;
  /// Not assignable.
  Scoped_setter& operator=(Scoped_setter&&) = delete;

private:
  // Data.

  /// The variable; null if moved-from.
  Value* m_target;

  /// What `*m_target` held when we were constructed.
  Value m_saved;
}; // class Scoped_setter

// Template implementations.

template<typename Value>
Scoped_setter<Value>::Scoped_setter(Value* target, Value&& val_src_moved) :
  m_target(target),
  m_saved(std::exchange(*m_target, std::move(val_src_moved)))
{
}

template<typename Value>
Scoped_setter<Value>::Scoped_setter(Scoped_setter&& src_moved) :
  m_target(std::exchange(src_moved.m_target, nullptr)),
  m_saved(std::move(src_moved.m_saved))
{
}

template<typename Value>
Scoped_setter<Value>::~Scoped_setter()
{
  if (m_target)
  {
    *m_target = std::move(m_saved);
  }
}

template<typename Container>
bool key_exists(const Container& container, const typename Container::key_type& key)
{
  return container.find(key) != container.end();
}

template<typename ...T>
void ostream_op_to_string(std::string* target_str, T const &... ostream_args)
{
  String_ostream os(target_str);
  (os.os() << ... << ostream_args);
  os.os().flush();
}

template<typename ...T>
std::string ostream_op_string(T const &... ostream_args)
{
  std::string str;
  ostream_op_to_string(&str, ostream_args...);
  return str;
}

template<typename Enum>
Enum istream_to_enum(std::istream* is_ptr, Enum enum_default, Enum enum_sentinel)
{
  using num_t = std::underlying_type_t<Enum>;
  auto& is = *is_ptr;

  std::string token;
  is >> std::ws;
  for (auto ch = is.peek(); (ch != std::istream::traits_type::eof()) && (std::isalnum(ch) || (ch == '_'));
       ch = is.peek())
  {
    token += char(is.get());
  }
  if (token.empty())
  {
    return enum_default;
  }
  // else

  if (std::all_of(token.begin(), token.end(), [](char ch) { return std::isdigit(static_cast<unsigned char>(ch)); }))
  {
    num_t num;
    return (boost::conversion::try_lexical_convert(token, num) && (num < num_t(enum_sentinel)))
             ? Enum(num) : enum_default;
  }
  // else

  for (num_t num = 0; num != num_t(enum_sentinel); ++num)
  {
    if (boost::algorithm::iequals(token, ostream_op_string(Enum(num))))
    {
      return Enum(num);
    }
  }
  return enum_default;
} // istream_to_enum()

constexpr String_view get_last_path_segment(String_view path)
{
  const auto slash_pos = path.rfind('/');
  return (slash_pos == String_view::npos) ? path : path.substr(slash_pos + 1);
}

} // namespace twine::util
