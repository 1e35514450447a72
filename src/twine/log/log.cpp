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
#include "twine/log/log.hpp"
#include "twine/util/util.hpp"
#include <array>
#include <cassert>
#include <istream>
#include <ostream>

namespace twine::log
{

// Static initializations.

boost::thread_specific_ptr<std::string> Logger::s_this_thread_nickname_ptr;

// Implementations.

Component::Component() :
  m_payload_type(nullptr),
  m_payload_enum_raw_value(0)
{
}

bool Component::empty() const
{
  return !m_payload_type;
}

std::type_index Component::payload_type_index() const
{
  assert(!empty());
  return std::type_index(*m_payload_type);
}

Component::enum_raw_t Component::payload_enum_raw_value() const
{
  assert(!empty());
  return m_payload_enum_raw_value;
}

Msg_metadata::Msg_metadata(const Component& component, Sev sev,
                           util::String_view src_file, util::String_view src_function, unsigned int src_line) :
  m_msg_component(component),
  m_msg_sev(sev),
  m_msg_src_file(util::get_last_path_segment(src_file)),
  m_msg_src_function(src_function),
  m_msg_src_line(src_line),
  m_called_when(std::chrono::system_clock::now()),
  m_call_thread_nickname(Logger::this_thread_logged_nickname()),
  m_call_thread_id(boost::this_thread::get_id())
{
}

Logger::~Logger() = default;

void Logger::this_thread_set_logged_nickname(util::String_view thread_nickname, Logger* logger_ptr)
{
  if (thread_nickname.empty())
  {
    s_this_thread_nickname_ptr.reset();
  }
  else
  {
    s_this_thread_nickname_ptr.reset(new std::string(thread_nickname));
  }

  TWINE_LOG_SET_CONTEXT(logger_ptr, Twine_log_component::S_LOG);
  TWINE_LOG_INFO("Thread [" << boost::this_thread::get_id() << "] is now nicknamed [" << thread_nickname << "].");
}

const std::string& Logger::this_thread_logged_nickname()
{
  static const std::string s_no_nickname;
  const auto nickname_ptr = s_this_thread_nickname_ptr.get();
  return nickname_ptr ? *nickname_ptr : s_no_nickname;
}

Log_context::Log_context(Logger* logger) :
  m_logger(logger)
{
}

Log_context::Log_context(const Log_context& src) = default;

Log_context::Log_context(Log_context&& src) :
  Log_context()
{
  swap(src);
}

Log_context& Log_context::operator=(const Log_context& src) = default;

Log_context& Log_context::operator=(Log_context&& src)
{
  if (&src != this)
  {
    Log_context().swap(*this);
    swap(src);
  }
  return *this;
}

void Log_context::swap(Log_context& other)
{
  using std::swap;
  swap(m_logger, other.m_logger);
  swap(m_component, other.m_component);
}

Logger* Log_context::get_logger() const
{
  return m_logger;
}

const Component& Log_context::get_log_component() const
{
  return m_component;
}

void swap(Log_context& val1, Log_context& val2)
{
  val1.swap(val2);
}

namespace
{

/// Names of the Sev values, in order.
const std::array<const char*, size_t(Sev::S_END_SENTINEL)> S_SEV_NAMES
  { "NONE", "FATAL", "ERROR", "WARNING", "INFO", "DEBUG", "TRACE", "DATA" };

} // Anonymous namespace

std::ostream& operator<<(std::ostream& os, Sev val)
{
  return (val < Sev::S_END_SENTINEL) ? (os << S_SEV_NAMES[size_t(val)]) : (os << size_t(val));
}

std::istream& operator>>(std::istream& is, Sev& val)
{
  val = util::istream_to_enum(&is, Sev::S_NONE, Sev::S_END_SENTINEL);
  return is;
}

} // namespace twine::log
