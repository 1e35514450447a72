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
#include "twine/log/config.hpp"
#include <algorithm>
#include <ostream>

namespace twine::log
{

// Static initializations.

const Sev Config::S_MOST_VERBOSE_SEV_DEFAULT = Sev::S_INFO;

// Implementations.

Config::Config(Sev most_verbose_sev_default) :
  m_use_human_friendly_time_stamps(true),
  m_verbosity_default(most_verbose_sev_default),
  m_output_components_numerically(false)
{
  // Nothing else.
}

bool Config::output_whether_should_log(Sev sev, const Component& component) const
{
  const Sev override_sev = this_thread_verbosity_override();
  if (override_sev != S_NO_SEV)
  {
    return sev <= override_sev;
  }
  // else

  Sev verbosity = m_verbosity_default;
  component_union_idx_t idx;
  if ((!component.empty()) && component_to_union_idx(component, &idx)
      && (idx < m_verbosities_by_union_idx.size()) && (m_verbosities_by_union_idx[idx] != S_NO_SEV))
  {
    verbosity = m_verbosities_by_union_idx[idx];
  }

  return sev <= verbosity;
}

void Config::output_component_to_ostream(std::ostream* os, const Component& component) const
{
  if (component.empty())
  {
    return;
  }
  // else

  component_union_idx_t idx;
  if (!component_to_union_idx(component, &idx))
  {
    *os << component.payload_enum_raw_value();
    return;
  }
  // else

  if (!m_output_components_numerically)
  {
    const auto name_it = m_names_by_union_idx.find(idx);
    if (name_it != m_names_by_union_idx.end())
    {
      *os << name_it->second;
      return;
    }
  }
  // else

  *os << idx;
}

void Config::configure_default_verbosity(Sev most_verbose_sev_default, bool reset)
{
  m_verbosity_default = most_verbose_sev_default;
  if (reset)
  {
    std::fill(m_verbosities_by_union_idx.begin(), m_verbosities_by_union_idx.end(), S_NO_SEV);
  }
}

bool Config::configure_component_verbosity_by_name(Sev most_verbose_sev, util::String_view component_name)
{
  const auto idx_it = m_union_idxs_by_name.find(normalized_component_name(component_name));
  if (idx_it == m_union_idxs_by_name.end())
  {
    return false;
  }
  // else

  const auto idx = idx_it->second;
  if (idx >= m_verbosities_by_union_idx.size())
  {
    m_verbosities_by_union_idx.resize(idx + 1, S_NO_SEV);
  }
  m_verbosities_by_union_idx[idx] = most_verbose_sev;
  return true;
}

util::Scoped_setter<Sev> Config::this_thread_verbosity_override_auto(Sev most_verbose_sev)
{
  return util::Scoped_setter<Sev>(&this_thread_verbosity_override(), std::move(most_verbose_sev));
}

Sev& Config::this_thread_verbosity_override()
{
  thread_local Sev s_override = S_NO_SEV;
  return s_override;
}

bool Config::component_to_union_idx(const Component& component, component_union_idx_t* idx) const
{
  const auto offset_it = m_union_idx_offsets.find(component.payload_type_index());
  if (offset_it == m_union_idx_offsets.end())
  {
    return false;
  }
  // else

  *idx = offset_it->second + component.payload_enum_raw_value();
  return true;
}

std::string Config::normalized_component_name(util::String_view name)
{
  return boost::algorithm::to_upper_copy(std::string(name));
}

} // namespace twine::log
