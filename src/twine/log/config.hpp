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

#include "twine/log/log.hpp"
#include "twine/util/util.hpp"
#include <boost/unordered_map.hpp>
#include <boost/algorithm/string/case_conv.hpp>
#include <iosfwd>
#include <string>
#include <typeindex>
#include <vector>

namespace twine::log
{

// Types.

/**
 * Logging configuration shared by any number of Logger objects: which messages pass (per-component verbosity,
 * with a default) and how components are named in output.
 *
 * Each `enum` used as a Component payload is registered once with init_component_to_union_idx_mapping(), which places
 * its values at an offset in one flat index space (the *union index*); distinct `enum`s must get non-overlapping
 * ranges.  init_component_names() then names each value, for output and for configure_component_verbosity_by_name().
 * A component of an unregistered `enum` is allowed: it logs at the default verbosity and prints as a number.
 *
 * Typical setup:
 *
 *   ~~~
 *   log::Config cfg(log::Sev::S_INFO);
 *   cfg.init_component_to_union_idx_mapping<Twine_log_component>
 *     (1000, log::Config::standard_component_payload_enum_sparse_length<Twine_log_component>());
 *   cfg.init_component_names<Twine_log_component>(S_TWINE_LOG_COMPONENT_NAME_MAP, false, "twine-");
 *   cfg.configure_component_verbosity(log::Sev::S_TRACE, Twine_log_component::S_CONTAINER);
 *   ~~~
 *
 * ### Thread safety ###
 * The registration and configure methods must not run concurrently with anything else on the same Config.
 * output_whether_should_log() and output_component_to_ostream() may run concurrently with each other.
 */
class Config
{
public:
  // Types.

  /// Index in the flat space all registered components share.
  using component_union_idx_t = Component::enum_raw_t;

  // Constants.

  /// Default verbosity of a new Config.
  static const Sev S_MOST_VERBOSE_SEV_DEFAULT;

  // Constructors/destructor.

  /**
   * Creates a Config with no registered components and the given default verbosity.
   *
   * @param most_verbose_sev_default
   *        Most verbose severity logged for a component without its own setting.
   */
  explicit Config(Sev most_verbose_sev_default = S_MOST_VERBOSE_SEV_DEFAULT);

  /// Copies everything.
  Config(const Config&) = default;

  /// Not movable: loggers hold pointers to Configs.
  Config(Config&&) = delete;

  // Methods.

  /// Not assignable.
  Config& operator=(const Config&) = delete;
  /// Not assignable.
  Config& operator=(Config&&) = delete;

  /**
   * The filter decision behind Logger::should_log(): `sev` is at least as severe as the verbosity in effect for
   * `component`.  In effect is, in order: this thread's override (this_thread_verbosity_override_auto()); the
   * component's own setting; the default.
   *
   * @param sev
   *        Message severity; not Sev::S_NONE.
   * @param component
   *        Message component; may be empty.
   * @return See above.
   */
  bool output_whether_should_log(Sev sev, const Component& component) const;

  /**
   * Prints `component` the way a log line shows it: its registered name; or its union index if names are off or
   * missing; or the raw value for an unregistered `enum`.  An empty component prints nothing.
   *
   * @param os
   *        Stream.
   * @param component
   *        Component.
   */
  void output_component_to_ostream(std::ostream* os, const Component& component) const;

  /**
   * Registers `enum` `Component_payload`: its values map to union indices `enum_to_num_offset + value`.
   *
   * @tparam Component_payload
   *         See Component.
   * @param enum_to_num_offset
   *        First union index of the `enum`.
   * @param enum_sparse_length
   *        One plus the highest numeric value in the `enum`; standard_component_payload_enum_sparse_length()
   *        computes it for `enum`s ending in `S_END_SENTINEL`.
   */
  template<typename Component_payload>
  void init_component_to_union_idx_mapping(component_union_idx_t enum_to_num_offset, size_t enum_sparse_length);

  /**
   * Names the values of a registered `enum`.  Each name is stored as `payload_type_prefix_or_empty + name`,
   * upper-cased; so `"twine-"` and `"CONTAINER"` give `"TWINE-CONTAINER"`.  If a value has several names, the
   * first one seen is used for output and all are accepted by configure_component_verbosity_by_name().
   *
   * @tparam Component_payload
   *         An `enum` already registered with init_component_to_union_idx_mapping().
   * @param component_names
   *        Value to name(s).
   * @param output_components_numerically
   *        If `true`, log lines show union indices instead of names (names still work for configuration).
   * @param payload_type_prefix_or_empty
   *        Prepended to each name.
   */
  template<typename Component_payload>
  void init_component_names(const boost::unordered_multimap<Component_payload, std::string>& component_names,
                            bool output_components_numerically = false,
                            util::String_view payload_type_prefix_or_empty = util::String_view());

  /**
   * Sets the default verbosity; optionally forgets all per-component settings.
   *
   * @param most_verbose_sev_default
   *        New default.
   * @param reset
   *        Whether to clear per-component settings.
   */
  void configure_default_verbosity(Sev most_verbose_sev_default, bool reset);

  /**
   * Sets the verbosity of one component.
   *
   * @tparam Component_payload
   *         See Component.
   * @param most_verbose_sev
   *        New verbosity.
   * @param component_payload
   *        The component.
   * @return `false` if its `enum` is not registered (nothing changes); `true` otherwise.
   */
  template<typename Component_payload>
  bool configure_component_verbosity(Sev most_verbose_sev, Component_payload component_payload);

  /**
   * Sets the verbosity of the component named `component_name` (see init_component_names(); case does not matter).
   *
   * @param most_verbose_sev
   *        New verbosity.
   * @param component_name
   *        Name, prefix included.
   * @return `false` if there is no such name (nothing changes); `true` otherwise.
   */
  bool configure_component_verbosity_by_name(Sev most_verbose_sev, util::String_view component_name);

  /**
   * Until the returned object is destroyed, makes every Config in the calling thread use `most_verbose_sev`,
   * whatever the component.  Sev::S_NONE silences the thread.  Overrides nest.
   *
   * @param most_verbose_sev
   *        Verbosity in effect meanwhile.
   * @return The override; keep it alive.
   */
  static util::Scoped_setter<Sev> this_thread_verbosity_override_auto(Sev most_verbose_sev);

  /**
   * The `enum_sparse_length` of init_component_to_union_idx_mapping() for an `enum` whose last value is
   * `S_END_SENTINEL`.
   *
   * @tparam Component_payload
   *         See above.
   * @return See above.
   */
  template<typename Component_payload>
  static size_t standard_component_payload_enum_sparse_length();

  // Data.

  /**
   * Whether Ostream_log_msg_writer shows local date-time stamps (`2026-10-18 14:03:11.000123456 +0000`) rather
   * than seconds since the epoch (`1792332191.000123`).  Read when a logger is constructed.
   */
  bool m_use_human_friendly_time_stamps;

private:
  // Types.

  /// Marks a union index that has no verbosity of its own.
  static constexpr Sev S_NO_SEV = Sev::S_END_SENTINEL;

  // Methods.

  /**
   * The calling thread's override; #S_NO_SEV if none.
   *
   * @return Reference to the thread-local value.
   */
  static Sev& this_thread_verbosity_override();

  /**
   * Union index of `component`, if its `enum` is registered.
   *
   * @param component
   *        Non-empty component.
   * @param idx
   *        Result, if `true` is returned.
   * @return Whether it is registered.
   */
  bool component_to_union_idx(const Component& component, component_union_idx_t* idx) const;

  /**
   * Upper-cased copy of `name`.
   *
   * @param name
   *        Name.
   * @return See above.
   */
  static std::string normalized_component_name(util::String_view name);

  // Data.

  /// Verbosity for components without their own.
  Sev m_verbosity_default;

  /// Per union index: the verbosity, or #S_NO_SEV.
  std::vector<Sev> m_verbosities_by_union_idx;

  /// First union index of each registered `enum`.
  boost::unordered_map<std::type_index, component_union_idx_t, std::hash<std::type_index>> m_union_idx_offsets;

  /// Output name of each named union index.
  boost::unordered_map<component_union_idx_t, std::string> m_names_by_union_idx;

  /// Union index of each normalized name.
  boost::unordered_map<std::string, component_union_idx_t> m_union_idxs_by_name;

  /// Whether to print union indices even where there are names.
  bool m_output_components_numerically;
}; // class Config

// Template implementations.

template<typename Component_payload>
void Config::init_component_to_union_idx_mapping(component_union_idx_t enum_to_num_offset, size_t enum_sparse_length)
{
  m_union_idx_offsets[std::type_index(typeid(Component_payload))] = enum_to_num_offset;

  const size_t end_idx = enum_to_num_offset + enum_sparse_length;
  if (m_verbosities_by_union_idx.size() < end_idx)
  {
    m_verbosities_by_union_idx.resize(end_idx, S_NO_SEV);
  }
}

template<typename Component_payload>
void Config::init_component_names(const boost::unordered_multimap<Component_payload, std::string>& component_names,
                                  bool output_components_numerically,
                                  util::String_view payload_type_prefix_or_empty)
{
  m_output_components_numerically = output_components_numerically;

  for (const auto& value_and_name : component_names)
  {
    component_union_idx_t idx;
    if (!component_to_union_idx(Component(value_and_name.first), &idx))
    {
      continue; // Not registered; nothing to name.
    }
    // else

    auto name = normalized_component_name(payload_type_prefix_or_empty);
    name += normalized_component_name(value_and_name.second);
    m_names_by_union_idx.emplace(idx, name); // No-op if named already: first name wins.
    m_union_idxs_by_name[std::move(name)] = idx;
  }
}

template<typename Component_payload>
bool Config::configure_component_verbosity(Sev most_verbose_sev, Component_payload component_payload)
{
  component_union_idx_t idx;
  if (!component_to_union_idx(Component(component_payload), &idx))
  {
    return false;
  }
  // else

  if (idx >= m_verbosities_by_union_idx.size())
  {
    m_verbosities_by_union_idx.resize(idx + 1, S_NO_SEV);
  }
  m_verbosities_by_union_idx[idx] = most_verbose_sev;
  return true;
}

template<typename Component_payload>
size_t Config::standard_component_payload_enum_sparse_length()
{
  return size_t(Component_payload::S_END_SENTINEL);
}

} // namespace twine::log
