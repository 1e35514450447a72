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

#include "twine/log/log.hpp"
#include "twine/log/config.hpp"
#include "twine/log/buffer_logger.hpp"
#include "twine/log/simple_ostream_logger.hpp"
#include "twine/test/test_common_util.hpp"
#include "twine/common.hpp"
#include <gtest/gtest.h>
#include <sstream>

namespace twine::log::test
{

namespace
{
using std::string;
using twine::test::check_output;

/// Not registered with any Config.
enum class Foreign_component : Component::enum_raw_t
{
  S_ALPHA = 3,
  S_END_SENTINEL
};

/// Sets up `config` the way a Twine-using program would.
void init_config(Config* config)
{
  config->init_component_to_union_idx_mapping<Twine_log_component>
    (1000, Config::standard_component_payload_enum_sparse_length<Twine_log_component>());
  config->init_component_names<Twine_log_component>(S_TWINE_LOG_COMPONENT_NAME_MAP, false, "twine-");
  config->m_use_human_friendly_time_stamps = false;
}

/// Logs through its Log_context base.
class Chatty :
  public Log_context
{
public:
  explicit Chatty(Logger* logger) :
    Log_context(logger, Twine_log_component::S_CONTAINER)
  {
  }

  void chat(int n)
  {
    TWINE_LOG_INFO("Chatty says [" << n << "].");
    TWINE_LOG_TRACE("Chatty whispers [" << n << "].");
  }
}; // class Chatty

/// Counts its calls; stands in for an expensive `<<` operand.
int count_call(int* calls)
{
  return ++(*calls);
}

} // Anonymous namespace

TEST(Log, Line_format)
{
  Config config;
  init_config(&config);
  Buffer_logger logger(&config);

  Logger::this_thread_set_logged_nickname("tester");
  {
    TWINE_LOG_SET_CONTEXT(&logger, Twine_log_component::S_CONTAINER);
    TWINE_LOG_INFO("Hello [" << 42 << "].");
    TWINE_LOG_WARNING("Careful.");
    TWINE_LOG_TRACE("Not shown at the default verbosity.");
  }
  Logger::this_thread_set_logged_nickname();

  const auto out = logger.buffer_str_copy();
  EXPECT_TRUE(check_output(out,
                           { R"(^[0-9]+\.[0-9]{6} \[info\]: Ttester: TWINE-CONTAINER: )"
                               R"(log_test\.cpp:TestBody\([0-9]+\): Hello \[42\]\.\n)",
                             R"(\[warn\]: Ttester: TWINE-CONTAINER: .*: Careful\.\n)" }));
  EXPECT_EQ(out.find("Not shown"), string::npos);
}

TEST(Log, Human_friendly_time_stamps)
{
  Config config;
  init_config(&config);
  config.m_use_human_friendly_time_stamps = true;
  Buffer_logger logger(&config);

  TWINE_LOG_SET_CONTEXT(&logger, Twine_log_component::S_LOG);
  TWINE_LOG_INFO("Stamped.");

  EXPECT_TRUE(check_output(logger.buffer_str_copy(),
                           { R"(^[0-9]{4}-[0-9]{2}-[0-9]{2} [0-9]{2}:[0-9]{2}:[0-9]{2}\.[0-9]{9} [+-][0-9]{4} )"
                               R"(\[info\]: T.*: TWINE-LOG: .*: Stamped\.\n$)" }));
}

TEST(Log, Thread_nickname_change_is_logged)
{
  Config config;
  init_config(&config);
  Buffer_logger logger(&config);

  Logger::this_thread_set_logged_nickname("renamed", &logger);
  EXPECT_EQ(Logger::this_thread_logged_nickname(), "renamed");
  Logger::this_thread_set_logged_nickname();
  EXPECT_TRUE(Logger::this_thread_logged_nickname().empty());

  EXPECT_TRUE(check_output(logger.buffer_str_copy(),
                           { R"(\[info\]: Trenamed: TWINE-LOG: .*is now nicknamed \[renamed\]\.)" }));
}

TEST(Log, Macro_is_one_statement)
{
  Config config;
  init_config(&config);
  Buffer_logger logger(&config);
  TWINE_LOG_SET_CONTEXT(&logger, Twine_log_component::S_LOG);

  for (int i = 0; i != 2; ++i)
  {
    if (i == 0)
      TWINE_LOG_INFO("Branch [then], metadata [" << i << ", " << (i + 1) << "].");
    else
      TWINE_LOG_WARNING("Branch [else].");
  }

  const auto out = logger.buffer_str_copy();
  EXPECT_TRUE(check_output(out, { R"(\[info\]: .*Branch \[then\], metadata \[0, 1\]\.\n)",
                                  R"(\[warn\]: .*Branch \[else\]\.\n)" }));
}

TEST(Log, Filtered_fragment_is_not_evaluated)
{
  Config config;
  init_config(&config);
  Buffer_logger logger(&config);
  int calls = 0;

  {
    TWINE_LOG_SET_CONTEXT(&logger, Twine_log_component::S_LOG);
    TWINE_LOG_TRACE("Count [" << count_call(&calls) << "].");
    EXPECT_EQ(calls, 0);
    TWINE_LOG_INFO("Count [" << count_call(&calls) << "].");
    EXPECT_EQ(calls, 1);
  }
  {
    TWINE_LOG_SET_CONTEXT(nullptr, Twine_log_component::S_LOG);
    TWINE_LOG_FATAL("Count [" << count_call(&calls) << "].");
    EXPECT_EQ(calls, 1);
  }

  EXPECT_TRUE(check_output(logger.buffer_str_copy(), { R"(^[^\n]*Count \[1\]\.\n$)" }));
}

TEST(Log, Component_verbosity)
{
  Config config;
  init_config(&config);
  Buffer_logger logger(&config);

  EXPECT_TRUE(config.configure_component_verbosity(Sev::S_TRACE, Twine_log_component::S_CONTAINER));
  EXPECT_TRUE(config.output_whether_should_log(Sev::S_TRACE, Twine_log_component::S_CONTAINER));
  EXPECT_FALSE(config.output_whether_should_log(Sev::S_TRACE, Twine_log_component::S_LOG));
  EXPECT_FALSE(config.output_whether_should_log(Sev::S_DATA, Twine_log_component::S_CONTAINER));

  // Names are matched regardless of case, prefix included.
  EXPECT_TRUE(config.configure_component_verbosity_by_name(Sev::S_ERROR, "twine-log"));
  EXPECT_FALSE(config.output_whether_should_log(Sev::S_WARNING, Twine_log_component::S_LOG));
  EXPECT_TRUE(config.output_whether_should_log(Sev::S_ERROR, Twine_log_component::S_LOG));
  EXPECT_FALSE(config.configure_component_verbosity_by_name(Sev::S_ERROR, "LOG"));

  Chatty chatty(&logger);
  chatty.chat(7);
  EXPECT_TRUE(check_output(logger.buffer_str_copy(), { R"(Chatty says \[7\]\.)", R"(Chatty whispers \[7\]\.)" }));

  config.configure_default_verbosity(Sev::S_WARNING, true);
  EXPECT_FALSE(config.output_whether_should_log(Sev::S_INFO, Twine_log_component::S_CONTAINER));
  EXPECT_TRUE(config.output_whether_should_log(Sev::S_WARNING, Twine_log_component::S_LOG));
  EXPECT_TRUE(config.output_whether_should_log(Sev::S_WARNING, Component()));
}

TEST(Log, Unregistered_component)
{
  Config config;
  init_config(&config);
  Buffer_logger logger(&config);

  EXPECT_FALSE(config.configure_component_verbosity(Sev::S_DATA, Foreign_component::S_ALPHA));
  EXPECT_FALSE(config.output_whether_should_log(Sev::S_DEBUG, Foreign_component::S_ALPHA));

  TWINE_LOG_SET_CONTEXT(&logger, Foreign_component::S_ALPHA);
  TWINE_LOG_INFO("Foreign.");
  EXPECT_TRUE(check_output(logger.buffer_str_copy(), { R"(\]: T[^:]*: 3: .*: Foreign\.)" }));
}

TEST(Log, Thread_verbosity_override)
{
  Config config;
  init_config(&config);
  Buffer_logger logger(&config);
  TWINE_LOG_SET_CONTEXT(&logger, Twine_log_component::S_CONTAINER);

  {
    const auto quiet = Config::this_thread_verbosity_override_auto(Sev::S_NONE);
    TWINE_LOG_FATAL("Silenced.");
    {
      const auto loud = Config::this_thread_verbosity_override_auto(Sev::S_DATA);
      TWINE_LOG_DATA("Loud.");
    }
    TWINE_LOG_ERROR("Silenced again.");
  }
  TWINE_LOG_INFO("Back to normal.");

  const auto out = logger.buffer_str_copy();
  EXPECT_EQ(out.find("Silenced"), string::npos);
  EXPECT_TRUE(check_output(out, { R"(\[data\]: .*Loud\.)", R"(\[info\]: .*Back to normal\.)" }));
}

TEST(Log, Numeric_component_output)
{
  Config config;
  config.init_component_to_union_idx_mapping<Twine_log_component>
    (1000, Config::standard_component_payload_enum_sparse_length<Twine_log_component>());
  config.init_component_names<Twine_log_component>(S_TWINE_LOG_COMPONENT_NAME_MAP, true, "twine-");
  config.m_use_human_friendly_time_stamps = false;
  Buffer_logger logger(&config);

  TWINE_LOG_SET_CONTEXT(&logger, Twine_log_component::S_CONTAINER);
  TWINE_LOG_INFO("By number.");
  EXPECT_TRUE(check_output(logger.buffer_str_copy(), { R"(: 1002: .*By number\.)" }));
  // Names still work for configuration.
  EXPECT_TRUE(config.configure_component_verbosity_by_name(Sev::S_TRACE, "TWINE-CONTAINER"));
}

TEST(Log, Log_context_copy_and_move)
{
  Config config;
  Buffer_logger logger(&config);

  Log_context ctx(&logger, Twine_log_component::S_CONTAINER);
  Log_context copy(ctx);
  EXPECT_EQ(copy.get_logger(), &logger);
  EXPECT_EQ(copy.get_log_component().payload_enum_raw_value(),
            Component::enum_raw_t(Twine_log_component::S_CONTAINER));

  Log_context moved(std::move(copy));
  EXPECT_EQ(moved.get_logger(), &logger);
  EXPECT_EQ(copy.get_logger(), nullptr);
  EXPECT_TRUE(copy.get_log_component().empty());

  Log_context other;
  other = moved;
  EXPECT_EQ(other.get_logger(), &logger);
  EXPECT_EQ(other.get_log_component().payload_type_index(), std::type_index(typeid(Twine_log_component)));
}

TEST(Log, Simple_ostream_logger_routing)
{
  Config config;
  init_config(&config);
  std::ostringstream os;
  std::ostringstream os_for_err;
  Simple_ostream_logger logger(&config, os, os_for_err);

  TWINE_LOG_SET_CONTEXT(&logger, Twine_log_component::S_CONTAINER);
  TWINE_LOG_INFO("To out.");
  TWINE_LOG_WARNING("To err.");
  TWINE_LOG_ERROR("To err too.");

  EXPECT_TRUE(check_output(os.str(), { R"(^[^\n]*\[info\]: .*To out\.\n$)" }));
  EXPECT_TRUE(check_output(os_for_err.str(), { R"(\[warn\]: .*To err\.\n)", R"(\[eror\]: .*To err too\.\n$)" }));
  EXPECT_EQ(os_for_err.str().find("To out"), string::npos);
}

TEST(Log, Sev_stream_io)
{
  EXPECT_EQ(util::ostream_op_string(Sev::S_WARNING), "WARNING");
  EXPECT_EQ(util::ostream_op_string(Sev::S_DATA), "DATA");

  const auto parse = [](const string& str) -> Sev
  {
    std::istringstream is(str);
    Sev sev;
    is >> sev;
    return sev;
  };
  EXPECT_EQ(parse("trace"), Sev::S_TRACE);
  EXPECT_EQ(parse("  Info"), Sev::S_INFO);
  EXPECT_EQ(parse("5"), Sev::S_DEBUG);
  EXPECT_EQ(parse("8"), Sev::S_NONE);
  EXPECT_EQ(parse("chatty"), Sev::S_NONE);
}

} // namespace twine::log::test
