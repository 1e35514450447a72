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

#include "twine/log/log_fwd.hpp"
#include "twine/util/string_ostream.hpp"
#include <boost/noncopyable.hpp>
#include <boost/thread/tss.hpp>
#include <chrono>
#include <string>
#include <type_traits>
#include <typeindex>
#include <typeinfo>

// Macros.

/**
 * Logs a FATAL message to `get_logger()` under `get_log_component()`, if Logger::should_log() allows; otherwise
 * `ARG_stream_fragment` is not evaluated.
 *
 * @param ARG_stream_fragment
 *        What would follow `os <<`, such as `"Bad index [" << idx << "]."`.  The newline is added for you.
 */
#define TWINE_LOG_FATAL(ARG_stream_fragment) \
  TWINE_LOG_WITH_CHECKING(::twine::log::Sev::S_FATAL, ARG_stream_fragment)

/**
 * Logs an ERROR message; see TWINE_LOG_FATAL().
 *
 * @param ARG_stream_fragment
 *        See TWINE_LOG_FATAL().
 */
#define TWINE_LOG_ERROR(ARG_stream_fragment) \
  TWINE_LOG_WITH_CHECKING(::twine::log::Sev::S_ERROR, ARG_stream_fragment)

/**
 * Logs a WARNING message; see TWINE_LOG_FATAL().
 *
 * @param ARG_stream_fragment
 *        See TWINE_LOG_FATAL().
 */
#define TWINE_LOG_WARNING(ARG_stream_fragment) \
  TWINE_LOG_WITH_CHECKING(::twine::log::Sev::S_WARNING, ARG_stream_fragment)

/**
 * Logs an INFO message; see TWINE_LOG_FATAL().
 *
 * @param ARG_stream_fragment
 *        See TWINE_LOG_FATAL().
 */
#define TWINE_LOG_INFO(ARG_stream_fragment) \
  TWINE_LOG_WITH_CHECKING(::twine::log::Sev::S_INFO, ARG_stream_fragment)

/**
 * Logs a DEBUG message; see TWINE_LOG_FATAL().
 *
 * @param ARG_stream_fragment
 *        See TWINE_LOG_FATAL().
 */
#define TWINE_LOG_DEBUG(ARG_stream_fragment) \
  TWINE_LOG_WITH_CHECKING(::twine::log::Sev::S_DEBUG, ARG_stream_fragment)

/**
 * Logs a TRACE message; see TWINE_LOG_FATAL().
 *
 * @param ARG_stream_fragment
 *        See TWINE_LOG_FATAL().
 */
#define TWINE_LOG_TRACE(ARG_stream_fragment) \
  TWINE_LOG_WITH_CHECKING(::twine::log::Sev::S_TRACE, ARG_stream_fragment)

/**
 * Logs a DATA message; see TWINE_LOG_FATAL().
 *
 * @param ARG_stream_fragment
 *        See TWINE_LOG_FATAL().
 */
#define TWINE_LOG_DATA(ARG_stream_fragment) \
  TWINE_LOG_WITH_CHECKING(::twine::log::Sev::S_DATA, ARG_stream_fragment)

/**
 * Makes the `TWINE_LOG_*()` invocations in the rest of the enclosing block log to `ARG_logger_ptr` under
 * `Component(ARG_component_payload)`.  Classes that hold a `Logger*` member instead of deriving from Log_context
 * (the twine::container classes do) use this at the top of each logging method.  At most once per block.
 *
 * @param ARG_logger_ptr
 *        `Logger*`; may be null, which turns the logging off.
 * @param ARG_component_payload
 *        An `enum` value suitable for Component.
 */
#define TWINE_LOG_SET_CONTEXT(ARG_logger_ptr, ARG_component_payload) \
  [[maybe_unused]] const auto get_logger \
    = [TWINE_LOG_CTX_logger = static_cast<::twine::log::Logger*>(ARG_logger_ptr)]() \
        -> ::twine::log::Logger* { return TWINE_LOG_CTX_logger; }; \
  [[maybe_unused]] const auto get_log_component \
    = [TWINE_LOG_CTX_component = ::twine::log::Component(ARG_component_payload)]() \
        -> const ::twine::log::Component& { return TWINE_LOG_CTX_component; }

/**
 * Logs with severity `ARG_sev` if `get_logger()` is not null and its Logger::should_log() agrees.  The message text,
 * and so each `<<` operand, is produced only then.
 *
 * @param ARG_sev
 *        A log::Sev.
 * @param ARG_stream_fragment
 *        See TWINE_LOG_FATAL().
 */
#define TWINE_LOG_WITH_CHECKING(ARG_sev, ARG_stream_fragment) \
  TWINE_UTIL_SEMICOLON_SAFE \
  ( \
    ::twine::log::Logger* const TWINE_LOG_logger = get_logger(); \
    if ((!TWINE_LOG_logger) || (!TWINE_LOG_logger->should_log(ARG_sev, get_log_component()))) \
    { \
      break; \
    } \
    /* else */ \
    ::twine::log::Msg_metadata TWINE_LOG_metadata(get_log_component(), ARG_sev, __FILE__, __FUNCTION__, __LINE__); \
    ::twine::util::String_ostream TWINE_LOG_msg_os; \
    TWINE_LOG_msg_os.os() << ARG_stream_fragment; \
    TWINE_LOG_logger->do_log(&TWINE_LOG_metadata, TWINE_LOG_msg_os.str()); \
  )

namespace twine::log
{

// Types.

/**
 * Which part of the program a log message comes from: a value of some `enum`, remembered along with the `enum`'s
 * type so that values of different `enum`s never collide.  Config maps each registered `enum` to its own range of
 * indices for verbosity settings and names.
 *
 * A default-constructed Component is empty: it belongs to no `enum`.
 */
class Component
{
public:
  // Types.

  /// The underlying type every payload `enum` must have.
  using enum_raw_t = unsigned int;

  // Constructors/destructor.

  /// Constructs an empty Component.
  Component();

  /**
   * Constructs a Component holding `payload`.  Implicit, so that an `enum` value can be passed where a Component
   * is expected.
   *
   * @tparam Payload
   *         An `enum` or `enum class` with underlying type #enum_raw_t.
   * @param payload
   *        The value.
   */
  template<typename Payload>
  Component(Payload payload);

  // Methods.

  /**
   * Whether `*this` was default-constructed.
   *
   * @return See above.
   */
  bool empty() const;

  /**
   * The payload `enum`'s type.  Must not be empty().
   *
   * @return See above.
   */
  std::type_index payload_type_index() const;

  /**
   * The payload as its underlying integer.  Must not be empty().
   *
   * @return See above.
   */
  enum_raw_t payload_enum_raw_value() const;

private:
  // Data.

  /// The payload `enum`'s type; null if empty().
  const std::type_info* m_payload_type;

  /// The payload's value; meaningless if empty().
  enum_raw_t m_payload_enum_raw_value;
}; // class Component

/// Everything about one log message except its text.  Filled in by the `TWINE_LOG_*()` macros.
struct Msg_metadata
{
  // Constructors/destructor.

  /**
   * Records the given values, the current time and the calling thread's nickname and ID.
   *
   * @param component
   *        Component.
   * @param sev
   *        Severity.
   * @param src_file
   *        `__FILE__`; only its last segment is kept.  Must have static storage.
   * @param src_function
   *        `__FUNCTION__`.  Must have static storage.
   * @param src_line
   *        `__LINE__`.
   */
  explicit Msg_metadata(const Component& component, Sev sev,
                        util::String_view src_file, util::String_view src_function, unsigned int src_line);

  // Data.

  /// Component.
  Component m_msg_component;
  /// Severity.
  Sev m_msg_sev;
  /// Source file name, without the directories.
  util::String_view m_msg_src_file;
  /// Function name.
  util::String_view m_msg_src_function;
  /// Line number.
  unsigned int m_msg_src_line;
  /// When the message was logged.
  std::chrono::system_clock::time_point m_called_when;
  /// Nickname of the logging thread (Logger::this_thread_set_logged_nickname()); empty if none.
  std::string m_call_thread_nickname;
  /// ID of the logging thread; printed when there is no nickname.
  util::Thread_id m_call_thread_id;
}; // struct Msg_metadata

/**
 * Interface of a log sink: a filter (should_log()) and a writer (do_log()).  Implementations in Twine are
 * Simple_ostream_logger and Buffer_logger; both are synchronous, so do_log() has written the message by the time
 * it returns.
 *
 * Both methods may be called from several threads at once; implementations must cope.
 */
class Logger :
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /// Boring virtual destructor.
  virtual ~Logger();

  // Methods.

  /**
   * Whether a message of severity `sev` from `component` should be logged.  Must be cheap.
   *
   * @param sev
   *        Severity; not Sev::S_NONE.
   * @param component
   *        Component.
   * @return See above.
   */
  virtual bool should_log(Sev sev, const Component& component) const = 0;

  /**
   * Writes one message; should_log() has already returned `true` for it.
   *
   * @param metadata
   *        The message's metadata.  Valid only during the call.
   * @param msg
   *        The message text, without a trailing newline.  Valid only during the call.
   */
  virtual void do_log(Msg_metadata* metadata, util::String_view msg) = 0;

  /**
   * Sets the name identifying the calling thread in later log lines in place of its ID.  An empty name goes back
   * to the ID.
   *
   * @param thread_nickname
   *        Nickname.
   * @param logger_ptr
   *        If not null, an INFO message about the change is logged there.
   */
  static void this_thread_set_logged_nickname(util::String_view thread_nickname = util::String_view(),
                                              Logger* logger_ptr = nullptr);

  /**
   * The calling thread's nickname, or an empty string if none is set.
   *
   * @return See above.
   */
  static const std::string& this_thread_logged_nickname();

private:
  // Data.

  /// The nickname of each thread that has one.
  static boost::thread_specific_ptr<std::string> s_this_thread_nickname_ptr;
}; // class Logger

/**
 * Base class for a class that logs with `TWINE_LOG_*()` from its methods: it supplies the `get_logger()` and
 * `get_log_component()` the macros look for.  Copying copies both.
 */
class Log_context
{
public:
  // Constructors/destructor.

  /**
   * Logs to `logger` with an empty Component.
   *
   * @param logger
   *        May be null.
   */
  explicit Log_context(Logger* logger = nullptr);

  /**
   * Logs to `logger` under `Component(component_payload)`.
   *
   * @tparam Component_payload
   *         See Component.
   * @param logger
   *        May be null.
   * @param component_payload
   *        Component payload.
   */
  template<typename Component_payload>
  explicit Log_context(Logger* logger, Component_payload component_payload);

  /**
   * Copies the logger and component.
   *
   * @param src
   *        Source.
   */
  Log_context(const Log_context& src);

  /**
   * Takes the logger and component; `src` ends up with a null logger and empty component.
   *
   * @param src
   *        Source.
   */
  Log_context(Log_context&& src);

  // Methods.

  /**
   * Copies the logger and component.
   *
   * @param src
   *        Source.
   * @return `*this`.
   */
  Log_context& operator=(const Log_context& src);

  /**
   * Takes the logger and component, as the move constructor does.
   *
   * @param src
   *        Source.
   * @return `*this`.
   */
  Log_context& operator=(Log_context&& src);

  /**
   * Exchanges logger and component with `other`.
   *
   * @param other
   *        The other object.
   */
  void swap(Log_context& other);

  /**
   * The logger; may be null.
   *
   * @return See above.
   */
  Logger* get_logger() const;

  /**
   * The component.
   *
   * @return See above.
   */
  const Component& get_log_component() const;

private:
  // Data.

  /// See get_logger().
  Logger* m_logger;

  /// See get_log_component().
  Component m_component;
}; // class Log_context

// Template implementations.

template<typename Payload>
Component::Component(Payload payload) :
  m_payload_type(&typeid(Payload)),
  m_payload_enum_raw_value(static_cast<enum_raw_t>(payload))
{
  static_assert(std::is_enum_v<Payload>, "A Component payload must be an enum.");
  static_assert(std::is_same_v<std::underlying_type_t<Payload>, enum_raw_t>,
                "A Component payload enum must have underlying type Component::enum_raw_t.");
}

template<typename Component_payload>
Log_context::Log_context(Logger* logger, Component_payload component_payload) :
  m_logger(logger),
  m_component(component_payload)
{
}

} // namespace twine::log
