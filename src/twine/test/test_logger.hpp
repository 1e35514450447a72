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

#pragma once

#include "twine/test/test_config.hpp"
#include "twine/log/simple_ostream_logger.hpp"
#include "twine/log/config.hpp"
#include "twine/common.hpp"

namespace twine::test
{

/**
 * Console Logger for tests, filtered at the severity given on the command line, with the Twine components
 * registered and named.
 */
class Test_logger :
  public log::Logger
{
public:
  /**
   * Constructor.
   *
   * @param min_severity
   *        Most verbose severity logged.
   */
  explicit Test_logger(log::Sev min_severity = Test_config::get_singleton().m_sev) :
    m_config(min_severity),
    m_logger(&m_config)
  {
    m_config.init_component_to_union_idx_mapping<Twine_log_component>
      (100, log::Config::standard_component_payload_enum_sparse_length<Twine_log_component>());
    m_config.init_component_names<Twine_log_component>(S_TWINE_LOG_COMPONENT_NAME_MAP, false, "twine-");
  }

  /// Forwards to the console logger.
  bool should_log(log::Sev sev, const log::Component& component) const override
  {
    return m_logger.should_log(sev, component);
  }

  /// Forwards to the console logger.
  void do_log(log::Msg_metadata* metadata, util::String_view msg) override
  {
    m_logger.do_log(metadata, msg);
  }

private:
  /// Logging configuration.
  log::Config m_config;

  /// The console logger.
  log::Simple_ostream_logger m_logger;
}; // class Test_logger

} // namespace twine::test
