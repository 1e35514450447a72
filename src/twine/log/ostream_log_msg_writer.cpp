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
#include "twine/log/ostream_log_msg_writer.hpp"
#include "twine/log/config.hpp"
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <fmt/ostream.h>
#include <chrono>
#include <ctime>
#include <iterator>

namespace twine::log
{

// Static initializations.

const std::array<util::String_view, size_t(Sev::S_END_SENTINEL)> Ostream_log_msg_writer::S_SEV_STRS
  ({ "null", "fatl", "eror", "warn", "info", "debg", "trce", "data" });

// Implementations.

Ostream_log_msg_writer::Ostream_log_msg_writer(const Config& config, std::ostream& os) :
  m_config(config),
  m_human_friendly_time_stamps(m_config.m_use_human_friendly_time_stamps),
  m_os(os)
{
  // Nothing else.
}

void Ostream_log_msg_writer::log(const Msg_metadata& metadata, util::String_view msg)
{
  using std::chrono::duration_cast;
  using std::chrono::microseconds;
  using std::chrono::nanoseconds;
  using std::chrono::seconds;
  using std::chrono::system_clock;

  fmt::memory_buffer line;
  auto out = std::back_inserter(line);

  const auto since_epoch = metadata.m_called_when.time_since_epoch();
  if (m_human_friendly_time_stamps)
  {
    // localtime() has 1-second resolution; the sub-second part is added separately.
    const auto local_tm = fmt::localtime(system_clock::to_time_t(metadata.m_called_when));
    const auto nsec = duration_cast<nanoseconds>(since_epoch - duration_cast<seconds>(since_epoch)).count();
    fmt::format_to(out, "{0:%Y-%m-%d %H:%M:%S}.{1:09} {0:%z} ", local_tm, nsec);
  }
  else
  {
    const auto usec = duration_cast<microseconds>(since_epoch).count();
    fmt::format_to(out, "{}.{:06} ", usec / 1000000, usec % 1000000);
  }

  fmt::format_to(out, "[{}]: T", S_SEV_STRS[size_t(metadata.m_msg_sev)]);
  if (metadata.m_call_thread_nickname.empty())
  {
    fmt::format_to(out, "{}: ", fmt::streamed(metadata.m_call_thread_id));
  }
  else
  {
    fmt::format_to(out, "{}: ", metadata.m_call_thread_nickname);
  }

  m_component_str.clear();
  {
    util::String_ostream component_os(&m_component_str);
    m_config.output_component_to_ostream(&component_os.os(), metadata.m_msg_component);
    component_os.str(); // Flush into m_component_str.
  }
  if (!m_component_str.empty())
  {
    fmt::format_to(out, "{}: ", m_component_str);
  }

  fmt::format_to(out, "{}:{}({}): {}\n",
                 metadata.m_msg_src_file, metadata.m_msg_src_function, metadata.m_msg_src_line, msg);

  m_os.write(line.data(), std::streamsize(line.size()));
  m_os.flush();
} // Ostream_log_msg_writer::log()

} // namespace twine::log
