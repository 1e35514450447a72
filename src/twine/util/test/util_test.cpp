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

#include "twine/util/util.hpp"
#include "twine/util/string_ostream.hpp"
#include <gtest/gtest.h>
#include <boost/unordered_map.hpp>
#include <iomanip>
#include <sstream>

namespace twine::util::test
{

namespace
{
using std::string;

enum class Color : unsigned int
{
  S_RED = 0,
  S_GREEN,
  S_BLUE_GREEN,
  S_END_SENTINEL
};

std::ostream& operator<<(std::ostream& os, Color color)
{
  static const char* const S_NAMES[] = { "RED", "GREEN", "BLUE_GREEN" };
  return os << S_NAMES[size_t(color)];
}

Color parse_color(const string& str, string* rest = nullptr)
{
  std::istringstream is(str);
  const auto color = istream_to_enum(&is, Color::S_RED, Color::S_END_SENTINEL);
  if (rest)
  {
    std::getline(is, *rest);
  }
  return color;
}

/// Makes a Scoped_setter the way a factory method would.
Scoped_setter<int> make_setter(int* target, int value)
{
  return Scoped_setter<int>(target, std::move(value));
}

} // Anonymous namespace

TEST(Util, Scoped_setter_restores)
{
  int depth = 1;
  string label = "outer";
  {
    Scoped_setter<int> set_depth(&depth, 2);
    Scoped_setter<string> set_label(&label, "inner");
    EXPECT_EQ(depth, 2);
    EXPECT_EQ(label, "inner");
    {
      auto nested = make_setter(&depth, 3);
      EXPECT_EQ(depth, 3);
    }
    EXPECT_EQ(depth, 2);
  }
  EXPECT_EQ(depth, 1);
  EXPECT_EQ(label, "outer");
}

TEST(Util, Scoped_setter_moved_from_is_inert)
{
  int value = 0;
  {
    Scoped_setter<int> first(&value, 7);
    {
      Scoped_setter<int> second(std::move(first));
      EXPECT_EQ(value, 7);
    }
    // The restore happened once, when `second` went away; `first` must not undo it again.
    EXPECT_EQ(value, 0);
    value = 9;
  }
  EXPECT_EQ(value, 9);
}

TEST(Util, Ostream_op_string)
{
  EXPECT_EQ(ostream_op_string("slot[", 4, "] gen[", std::hex, 255, "]"), "slot[4] gen[ff]");
  EXPECT_EQ(ostream_op_string(Color::S_GREEN), "GREEN");

  string target = "keys=";
  ostream_op_to_string(&target, 3, ',', 1.5);
  EXPECT_EQ(target, "keys=3,1.5");
}

TEST(Util, Key_exists)
{
  const boost::unordered_map<string, int> counts{ { "apple", 1 }, { "pear", 0 } };
  EXPECT_TRUE(key_exists(counts, "pear"));
  EXPECT_FALSE(key_exists(counts, "plum"));
}

TEST(Util, Where_am_i)
{
  static_assert(get_last_path_segment("src/twine/util/util.hpp") == "util.hpp");
  EXPECT_EQ(get_last_path_segment("plain.cpp"), "plain.cpp");
  EXPECT_EQ(get_last_path_segment("trailing/"), "");

  EXPECT_EQ(get_where_am_i_str("/x/y/file.cpp", "run", 12), "file.cpp:run(12)");

  const string here = TWINE_UTIL_WHERE_AM_I_STR();
  EXPECT_EQ(here.rfind("util_test.cpp:TestBody(", 0), 0u) << here;

  const string literal = TWINE_UTIL_WHERE_AM_I_LITERAL(pack_to);
  EXPECT_NE(literal.find("util_test.cpp:pack_to("), string::npos) << literal;
}

TEST(Util, String_ostream)
{
  String_ostream own;
  own.os() << "gen=" << std::setw(3) << 7;
  EXPECT_EQ(own.str(), "gen=  7");
  own.str_clear();
  EXPECT_TRUE(own.str().empty());
  own.os() << 'z';
  EXPECT_EQ(own.str(), "z");

  string target = "log: ";
  String_ostream appender(&target);
  appender.os() << "line";
  EXPECT_EQ(&appender.str(), &target);
  EXPECT_EQ(target, "log: line");
}

TEST(Util, Istream_to_enum)
{
  EXPECT_EQ(parse_color("green"), Color::S_GREEN);
  EXPECT_EQ(parse_color("  Blue_Green"), Color::S_BLUE_GREEN);
  EXPECT_EQ(parse_color("2"), Color::S_BLUE_GREEN);
  EXPECT_EQ(parse_color("3"), Color::S_RED);
  EXPECT_EQ(parse_color("purple"), Color::S_RED);
  EXPECT_EQ(parse_color(""), Color::S_RED);

  string rest;
  EXPECT_EQ(parse_color("GREEN,RED", &rest), Color::S_GREEN);
  EXPECT_EQ(rest, ",RED");
}

} // namespace twine::util::test
