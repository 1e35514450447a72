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

#include "twine/test/test_common_util.hpp"
#include <regex>

namespace twine::test
{

bool check_output(const std::string& output, const std::vector<std::string>& regex_matches)
{
  for (const auto& pattern : regex_matches)
  {
    if (!std::regex_search(output, std::regex(pattern)))
    {
      return false;
    }
  }
  return true;
}

} // namespace twine::test
