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

#include "twine/container/ordered_multimap.hpp"
#include "twine/log/simple_ostream_logger.hpp"
#include "twine/log/config.hpp"
#include "twine/common.hpp"
#include <boost/noncopyable.hpp>
#include <boost/program_options.hpp>
#include <iostream>

/* This program times a few typical Ordered_multimap workloads.
 *   <executable> [--element-count=N] [--remove-count=N] [--iterations=N] [--minimum-log-severity=SEV]
 * Each scenario is run `--iterations` times, and each run's duration is logged to the console.  The container
 * itself logs to the same console logger, so running with `--minimum-log-severity=TRACE` shows its internals too
 * (and ruins the timings, of course).
 *
 * The scenarios:
 *   - insert-with-capacity: reserve room, then for each of `--element-count` keys call insert() 4 times (so each
 *     insert past the first replaces the key's value in place);
 *   - insert-without-capacity: same, but no reserving;
 *   - iterate: build a map of `--element-count` keys with 5 values each, then time a full walk summing values;
 *   - remove: build a map of `--remove-count` keys, then time removing every 5th key. */

/* As in other Twine console programs, it's easiest to log through a small class containing the functions
 * involved; actual `int main()` just invokes the class's main(). */
class Main : public twine::log::Log_context, private boost::noncopyable
{
public:
  // Boring constructor.
  explicit Main();
  // The program body.  Forward `int main()` here.
  int main(int argc, const char** argv);

private:
  // Types.

  // The map being timed.  Integer keys and values keep the hashing/copying share of the timings small.
  using Map = twine::container::Ordered_multimap<uint64_t, uint64_t>;

  // Methods.

  // Scenario: insert() 4 times per key; optionally reserve first.
  twine::Fine_duration run_insert(size_t n_keys, bool reserve_first);
  // Scenario: sum all values of a 5-values-per-key map.
  twine::Fine_duration run_iterate(size_t n_keys);
  // Scenario: remove_all() every 5th key.
  twine::Fine_duration run_remove(size_t n_keys);
  // Helper: logs one run's result.
  void log_result(const char* scenario, unsigned int iteration, const twine::Fine_duration& duration);

  // Data.

  // Config for m_logger.
  twine::log::Config m_std_log_config;
  // The logger for our console output.
  twine::log::Simple_ostream_logger m_logger;
  // Sink for results computed in the timed sections; logged at the end so that they are not optimized away.
  uint64_t m_checksum;
};

int main(int argc, const char** argv)
{
  Main prog;
  return prog.main(argc, argv);
}

Main::Main() :
  // TWINE_LOG_...() from this class will go to m_logger, which logs to cout, cerr.
  Log_context(&m_logger, twine::Twine_log_component::S_UNCAT),
  m_logger(&m_std_log_config),
  m_checksum(0)
{
  using twine::log::Config;
  using twine::Twine_log_component;

  m_std_log_config.init_component_to_union_idx_mapping<Twine_log_component>
    (1000, Config::standard_component_payload_enum_sparse_length<Twine_log_component>());
  m_std_log_config.init_component_names<Twine_log_component>(twine::S_TWINE_LOG_COMPONENT_NAME_MAP, false,
                                                             "bench-");

  // Name this main thread, to identify it in each log message logged from it.
  twine::log::Logger::this_thread_set_logged_nickname("bench_main", get_logger());
}

int Main::main(int argc, const char** argv)
{
  using twine::log::Sev;
  using twine::error::Runtime_error;
  using std::exception;
  namespace opts = boost::program_options;

  const int BAD_EXIT = 1;

  Sev min_sev = Sev::S_INFO;
  size_t n_elements = 0;
  size_t n_remove_keys = 0;
  unsigned int n_iterations = 0;

  opts::options_description cmd_line_opts("twine_bench options");
  cmd_line_opts.add_options()
    ("help", "Print this help, then exit.")
    ("minimum-log-severity", opts::value<Sev>(&min_sev)->default_value(min_sev),
     "Most verbose severity logged to the console: NONE, FATAL, ERROR, WARNING, INFO, DEBUG, TRACE, DATA.")
    ("element-count", opts::value<size_t>(&n_elements)->default_value(100000),
     "Number of distinct keys in the insert and iterate scenarios.")
    ("remove-count", opts::value<size_t>(&n_remove_keys)->default_value(100000),
     "Number of distinct keys in the remove scenario; every 5th one is removed.")
    ("iterations", opts::value<unsigned int>(&n_iterations)->default_value(5),
     "Number of times to run each scenario.");

  opts::variables_map vm;
  try
  {
    opts::store(opts::parse_command_line(argc, argv, cmd_line_opts), vm);
    opts::notify(vm);
  }
  catch (const opts::error& exc)
  {
    TWINE_LOG_WARNING("Bad command line: [" << exc.what() << "].");
    std::cerr << cmd_line_opts;
    return BAD_EXIT;
  }

  if (vm.count("help") != 0)
  {
    std::cout << cmd_line_opts;
    return 0;
  }
  // else

  m_std_log_config.configure_default_verbosity(min_sev, true);

  TWINE_LOG_INFO("Running [" << n_iterations << "] iterations of each scenario; "
                 "element count [" << n_elements << "]; remove count [" << n_remove_keys << "].");

  // Nothing below should fail; but if the container reports an error, report it and bail.
  try
  {
    for (unsigned int iteration = 0; iteration != n_iterations; ++iteration)
    {
      log_result("insert-with-capacity", iteration, run_insert(n_elements, true));
      log_result("insert-without-capacity", iteration, run_insert(n_elements, false));
      log_result("iterate", iteration, run_iterate(n_elements));
      log_result("remove", iteration, run_remove(n_remove_keys));
    }
  }
  catch (const Runtime_error& exc)
  {
    TWINE_LOG_WARNING("Container error: [" << exc.code() << "] [" << exc.what() << "].");
    return BAD_EXIT;
  }
  catch (const exception& exc)
  {
    TWINE_LOG_WARNING("Unexpected exception: [" << exc.what() << "].");
    return BAD_EXIT;
  }

  TWINE_LOG_INFO("Done; checksum [" << m_checksum << "].");
  return 0;
} // Main::main()

twine::Fine_duration Main::run_insert(size_t n_keys, bool reserve_first)
{
  using twine::Fine_clock;

  Map map(get_logger());
  const auto start = Fine_clock::now();

  if (reserve_first)
  {
    map.reserve_keys(n_keys);
    map.reserve_values(n_keys);
  }
  for (uint64_t key = 0; key != n_keys; ++key)
  {
    for (uint64_t value = 0; value != 4; ++value)
    {
      m_checksum += map.insert(key, value).size();
    }
  }

  const auto duration = Fine_clock::now() - start;
  m_checksum += map.size();
  return duration;
}

twine::Fine_duration Main::run_iterate(size_t n_keys)
{
  using twine::Fine_clock;

  Map map(get_logger());
  map.reserve_keys(n_keys);
  map.reserve_values(n_keys * 5);
  for (uint64_t value = 0; value != 5; ++value)
  {
    for (uint64_t key = 0; key != n_keys; ++key)
    {
      map.append(key, value);
    }
  }

  const auto start = Fine_clock::now();

  uint64_t sum = 0;
  for (const auto& pair : map)
  {
    sum += pair.second;
  }

  const auto duration = Fine_clock::now() - start;
  m_checksum += sum;
  return duration;
}

twine::Fine_duration Main::run_remove(size_t n_keys)
{
  using twine::Fine_clock;

  Map map(get_logger());
  for (uint64_t key = 0; key != n_keys; ++key)
  {
    map.append(key, key);
  }

  const auto start = Fine_clock::now();

  for (uint64_t key = 0; key < n_keys; key += 5)
  {
    m_checksum += map.remove_all(key).size();
  }

  const auto duration = Fine_clock::now() - start;
  m_checksum += map.size();
  return duration;
}

void Main::log_result(const char* scenario, unsigned int iteration, const twine::Fine_duration& duration)
{
  using boost::chrono::microseconds;
  using boost::chrono::duration_cast;

  TWINE_LOG_INFO("Scenario [" << scenario << "] iteration [" << iteration << "]: "
                 "[" << duration_cast<microseconds>(duration) << "].");
}
