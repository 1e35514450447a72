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

#include <string>
#include <vector>

namespace twine::test
{

/**
 * Whether each of `regex_matches` (ECMAScript) matches somewhere in `output`.
 *
 * @param output
 *        Text to search; typically log output.
 * @param regex_matches
 *        Patterns.
 * @return See above.
 */
bool check_output(const std::string& output, const std::vector<std::string>& regex_matches);

} // namespace twine::test
