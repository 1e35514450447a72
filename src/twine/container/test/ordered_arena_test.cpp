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
#include "twine/container/ordered_arena.hpp"
#include "twine/log/buffer_logger.hpp"
#include "twine/log/config.hpp"
#include "twine/test/test_common_util.hpp"
#include "twine/test/test_logger.hpp"
#include "twine/util/util.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace twine::container::test
{

namespace
{
using std::string;
using std::vector;
using Arena = Ordered_arena<string>;
using Handle = Arena::Handle;

/// Payloads in global order, walked forward; then checks that the reverse walk agrees.
vector<string> contents(const Arena& arena)
{
  vector<string> fwd(arena.begin(), arena.end());
  vector<string> bwd(arena.crbegin(), arena.crend());
  EXPECT_EQ(vector<string>(fwd.rbegin(), fwd.rend()), bwd);
  EXPECT_EQ(fwd.size(), arena.size());
  return fwd;
}

/// Payload whose move constructor throws while #s_fail is set.
struct Brittle
{
  explicit Brittle(string str) : m_str(std::move(str)) {}
  Brittle(const Brittle&) = default;
  Brittle(Brittle&& src) :
    m_str(src.m_str)
  {
    if (s_fail)
    {
      throw std::runtime_error("Brittle move failed.");
    }
  }
  Brittle& operator=(const Brittle&) = default;
  Brittle& operator=(Brittle&&) = default;

  static inline bool s_fail = false;
  string m_str;
}; // struct Brittle

} // Anonymous namespace

// Tags a failed EXPECT with the line it came from; `contents()` runs its own EXPECTs too.
#define CTX util::ostream_op_string("Caller context [", TWINE_UTIL_WHERE_AM_I_STR(), "].")

TEST(Ordered_arena, Allocation_order)
{
  twine::test::Test_logger logger;
  Arena arena(&logger);

  EXPECT_TRUE(arena.empty());
  EXPECT_TRUE(contents(arena).empty());
  EXPECT_EQ(arena.begin(), arena.end());

  const auto b = arena.allocate_at_tail("b");
  const auto d = arena.allocate_at_tail("d");
  const auto a = arena.allocate_before(b, "a");
  const auto c = arena.allocate_after(b, "c");
  const auto e = arena.allocate_after(d, "e");
  EXPECT_EQ(contents(arena), (vector<string>{ "a", "b", "c", "d", "e" })) << CTX;

  // Handles are stable across everything else that happens.
  EXPECT_EQ(*arena.get(a), "a");
  EXPECT_EQ(*arena.get(c), "c");
  EXPECT_EQ(*arena.get(e), "e");
  EXPECT_TRUE(arena.contains(d));

  EXPECT_EQ(arena.remove(c), string("c"));
  EXPECT_EQ(arena.remove(a), string("a"));
  EXPECT_EQ(arena.remove(e), string("e"));
  EXPECT_EQ(contents(arena), (vector<string>{ "b", "d" })) << CTX;
  EXPECT_EQ(*arena.get(b), "b");
  EXPECT_EQ(*arena.get(d), "d");
  EXPECT_EQ(arena.head_index(), b.m_index);
  EXPECT_EQ(arena.tail_index(), d.m_index);

  // In-place modification.
  *arena.get(b) += "!";
  for (auto& payload : arena)
  {
    payload += "?";
  }
  EXPECT_EQ(contents(arena), (vector<string>{ "b!?", "d?" })) << CTX;

  // Iterator knows its handle.
  auto it = arena.begin();
  EXPECT_EQ(it.handle(), b);
  ++it;
  EXPECT_EQ(it.handle(), d);
  ++it;
  EXPECT_TRUE(it.at_end());
  --it;
  EXPECT_EQ(*it, "d?"); // Decrementing end() lands on the tail.
} // TEST(Ordered_arena, Allocation_order)

TEST(Ordered_arena, Slot_reuse_and_stale_handles)
{
  twine::test::Test_logger logger;
  Arena arena(&logger);

  const auto a = arena.allocate_at_tail("a");
  const auto b = arena.allocate_at_tail("b");
  EXPECT_EQ(arena.remove(a), string("a"));

  // Freed slot is reused before the vector grows...
  const auto c = arena.allocate_at_tail("c");
  EXPECT_EQ(c.m_index, a.m_index);
  EXPECT_NE(c.m_generation, a.m_generation);
  EXPECT_EQ(contents(arena), (vector<string>{ "b", "c" })) << CTX;

  // ...but the old handle to it is stale, not an alias of the new element.
  Error_code err_code;
  EXPECT_EQ(arena.get(a, &err_code), nullptr);
  EXPECT_EQ(err_code, error::Code::S_STALE_HANDLE);
  EXPECT_FALSE(arena.contains(a));
  EXPECT_FALSE(arena.remove(a, &err_code));
  EXPECT_EQ(err_code, error::Code::S_STALE_HANDLE);
  EXPECT_EQ(arena.allocate_after(a, "x", &err_code), Handle());
  EXPECT_EQ(err_code, error::Code::S_STALE_HANDLE);
  EXPECT_EQ(contents(arena), (vector<string>{ "b", "c" })) << CTX;

  // Removed and not reused: also stale.
  EXPECT_EQ(arena.remove(b), string("b"));
  EXPECT_EQ(arena.get(b, &err_code), nullptr);
  EXPECT_EQ(err_code, error::Code::S_STALE_HANDLE);

  // Null and out-of-range.
  EXPECT_EQ(arena.get(Handle::null(), &err_code), nullptr);
  EXPECT_EQ(err_code, error::Code::S_INVALID_INDEX);
  EXPECT_EQ(arena.get(Handle{ 1000, 1 }, &err_code), nullptr);
  EXPECT_EQ(err_code, error::Code::S_INVALID_INDEX);

  // Success clears err_code.
  EXPECT_NE(arena.get(c, &err_code), nullptr);
  EXPECT_FALSE(err_code);

  // Null err_code: throw.
  try
  {
    arena.get(a);
    ADD_FAILURE() << "Should have thrown.";
  }
  catch (const twine::error::Runtime_error& exc)
  {
    EXPECT_EQ(exc.code(), error::Code::S_STALE_HANDLE);
  }
  EXPECT_THROW(arena.remove(Handle::null()), twine::error::Runtime_error);
  EXPECT_THROW(arena.allocate_before(b, "x"), twine::error::Runtime_error);
  EXPECT_EQ(arena.size(), 1u);
} // TEST(Ordered_arena, Slot_reuse_and_stale_handles)

TEST(Ordered_arena, Iterator_invalidation)
{
  Arena arena;
  const auto a = arena.allocate_at_tail("a");
  arena.allocate_at_tail("b");

  {
    auto it = arena.begin();
    arena.allocate_at_tail("c");
    EXPECT_THROW(*it, twine::error::Runtime_error);
    EXPECT_THROW(++it, twine::error::Runtime_error);
    try
    {
      ++it;
    }
    catch (const twine::error::Runtime_error& exc)
    {
      EXPECT_EQ(exc.code(), error::Code::S_ITERATOR_INVALIDATED);
    }
  }
  {
    auto it = arena.cbegin();
    arena.remove(a);
    EXPECT_THROW(*it, twine::error::Runtime_error);
  }
  {
    auto it = arena.rbegin();
    arena.clear();
    EXPECT_THROW(*it, twine::error::Runtime_error);
  }

  // Non-structural changes do not invalidate.
  arena.allocate_at_tail("x");
  const auto y = arena.allocate_at_tail("y");
  auto it = arena.begin();
  *arena.get(y) = "Y";
  arena.reserve(100);
  EXPECT_EQ(*it, "x");
  ++it;
  EXPECT_EQ(*it, "Y");

  // Mutable converts to const; the pair compare equal.
  Arena::Const_iterator c_it = it;
  EXPECT_EQ(c_it, it);
  EXPECT_EQ(*c_it, "Y");
} // TEST(Ordered_arena, Iterator_invalidation)

TEST(Ordered_arena, Capacity_and_pack)
{
  twine::test::Test_logger logger;
  Arena arena(&logger);

  arena.reserve(10);
  EXPECT_GE(arena.capacity(), 10u);
  const auto cap = arena.capacity();

  vector<Handle> handles;
  for (size_t i = 0; i != 10; ++i)
  {
    handles.push_back(arena.allocate_at_tail(std::to_string(i)));
  }
  EXPECT_EQ(arena.capacity(), cap); // No reallocation.
  for (size_t i = 0; i != 10; i += 2)
  {
    arena.remove(handles[i]);
  }
  // Move the tail to the front, so global order differs from index order.
  arena.allocate_before(handles[1], *arena.remove(handles[9]));
  EXPECT_EQ(contents(arena), (vector<string>{ "9", "1", "3", "5", "7" })) << CTX;

  // Too small: error, and nothing changes.
  Error_code err_code;
  const auto epoch = arena.epoch();
  EXPECT_TRUE(arena.pack_to(4, &err_code).empty());
  EXPECT_EQ(err_code, error::Code::S_PACK_CAPACITY_TOO_SMALL);
  EXPECT_EQ(arena.epoch(), epoch);
  EXPECT_THROW(arena.pack_to(0), twine::error::Runtime_error);

  const auto remap = arena.pack_to(5, &err_code);
  EXPECT_FALSE(err_code);
  EXPECT_EQ(arena.capacity(), 5u);
  EXPECT_EQ(contents(arena), (vector<string>{ "9", "1", "3", "5", "7" })) << CTX;

  // Indices are now [0, size()) in global order.
  size_t expected_idx = 0;
  for (auto it = arena.begin(); it != arena.end(); ++it)
  {
    EXPECT_EQ(it.handle().m_index, expected_idx++);
  }

  // The remap takes old handles to new ones; removed ones map to null.
  for (size_t i = 1; i != 9; i += 2)
  {
    const auto& new_handle = remap[handles[i].m_index];
    ASSERT_FALSE(new_handle.is_null());
    EXPECT_EQ(*arena.get(new_handle), std::to_string(i));
  }
  EXPECT_TRUE(remap[handles[0].m_index].is_null());
  EXPECT_TRUE(remap[handles[2].m_index].is_null());
  // The re-inserted "9" took the most recently freed slot: its own old one.
  EXPECT_EQ(*arena.get(remap[handles[9].m_index]), "9");

  // Grow via pack.
  arena.pack_to(50);
  EXPECT_EQ(arena.capacity(), 50u);
  EXPECT_EQ(contents(arena), (vector<string>{ "9", "1", "3", "5", "7" })) << CTX;

  // Shrink to fit.
  arena.pack_to_fit();
  EXPECT_EQ(arena.capacity(), 5u);

  // Clear keeps capacity; old handles are dead.
  const auto last = arena.handle_at_index(arena.tail_index());
  arena.clear();
  EXPECT_TRUE(arena.empty());
  EXPECT_EQ(arena.capacity(), 5u);
  EXPECT_FALSE(arena.contains(last));
  arena.clear(); // Idempotent.
  EXPECT_TRUE(arena.empty());

  // Generations do not restart after clear(), so no handle from before can come back to life.
  const auto fresh = arena.allocate_at_tail("fresh");
  EXPECT_EQ(fresh.m_index, 0u);
  EXPECT_GT(fresh.m_generation, last.m_generation);
} // TEST(Ordered_arena, Capacity_and_pack)

TEST(Ordered_arena, Copy_move_swap)
{
  Arena arena1;
  const auto a = arena1.allocate_at_tail("a");
  const auto b = arena1.allocate_at_tail("b");
  arena1.remove(a);
  const auto c = arena1.allocate_at_tail("c");

  // Copy: same handles work.
  const Arena copy(arena1);
  EXPECT_EQ(contents(copy), (vector<string>{ "b", "c" })) << CTX;
  EXPECT_EQ(*copy.get(b), "b");
  EXPECT_EQ(*copy.get(c), "c");
  EXPECT_FALSE(copy.contains(a));

  // Move: source becomes empty.
  Arena arena2(std::move(arena1));
  EXPECT_TRUE(arena1.empty());
  EXPECT_EQ(contents(arena2), (vector<string>{ "b", "c" })) << CTX;

  Arena arena3;
  arena3.allocate_at_tail("z");
  auto it2 = arena2.begin();
  auto it3 = arena3.begin();
  swap(arena2, arena3);
  EXPECT_EQ(contents(arena2), (vector<string>{ "z" })) << CTX;
  EXPECT_EQ(contents(arena3), (vector<string>{ "b", "c" })) << CTX;
  EXPECT_THROW(*it2, twine::error::Runtime_error);
  EXPECT_THROW(*it3, twine::error::Runtime_error);

  arena2 = copy;
  EXPECT_EQ(contents(arena2), (vector<string>{ "b", "c" })) << CTX;
  arena3 = std::move(arena2);
  EXPECT_TRUE(arena2.empty());
  EXPECT_EQ(*arena3.get(c), "c");

  // Move-only payloads are fine.
  Ordered_arena<std::unique_ptr<int>> ptrs;
  const auto p = ptrs.allocate_at_tail(std::make_unique<int>(5));
  ptrs.allocate_before(p, std::make_unique<int>(4));
  EXPECT_EQ(**ptrs.begin(), 4);
  const auto removed = ptrs.remove(p);
  ASSERT_TRUE(removed);
  EXPECT_EQ(**removed, 5);
} // TEST(Ordered_arena, Copy_move_swap)

TEST(Ordered_arena, Throwing_payload_move)
{
  Ordered_arena<Brittle> arena;
  const auto strs = [&]() -> vector<string>
  {
    vector<string> result;
    for (const auto& payload : arena)
    {
      result.push_back(payload.m_str);
    }
    return result;
  };

  const auto a = arena.allocate_at_tail(Brittle("a"));
  const auto gone = arena.allocate_at_tail(Brittle("gone"));
  ASSERT_TRUE(arena.remove(gone));

  {
    util::Scoped_setter<bool> failing(&Brittle::s_fail, true);
    // Reusing the free slot, then growing the vector.
    EXPECT_THROW(arena.allocate_at_tail(Brittle("b")), std::runtime_error);
    EXPECT_THROW(arena.allocate_at_tail(Brittle("c")), std::runtime_error);
    EXPECT_THROW(arena.remove(a), std::runtime_error);
  }

  EXPECT_EQ(arena.size(), 1u);
  EXPECT_EQ(strs(), vector<string>{ "a" });
  EXPECT_TRUE(arena.get(a));

  // Both the free slot and a fresh one still work.
  const auto b = arena.allocate_at_tail(Brittle("b"));
  const auto c = arena.allocate_at_tail(Brittle("c"));
  EXPECT_EQ(b.m_index, gone.m_index);
  EXPECT_NE(c.m_index, gone.m_index);
  EXPECT_EQ(strs(), (vector<string>{ "a", "b", "c" }));
  const auto removed = arena.remove(a);
  ASSERT_TRUE(removed);
  EXPECT_EQ(removed->m_str, "a");
  EXPECT_EQ(strs(), (vector<string>{ "b", "c" }));
} // TEST(Ordered_arena, Throwing_payload_move)

TEST(Ordered_arena, Logging)
{
  log::Config config(log::Sev::S_TRACE);
  config.init_component_to_union_idx_mapping<Twine_log_component>
    (1000, log::Config::standard_component_payload_enum_sparse_length<Twine_log_component>());
  config.init_component_names<Twine_log_component>(S_TWINE_LOG_COMPONENT_NAME_MAP, false, "twine-");
  log::Buffer_logger logger(&config);

  Arena arena(&logger);
  arena.reserve(3);
  const auto a = arena.allocate_at_tail("secret-payload");
  arena.remove(a);
  Error_code err_code;
  arena.get(a, &err_code);
  arena.pack_to_fit();
  arena.clear();

  const auto out = logger.buffer_str_copy();
  EXPECT_TRUE(twine::test::check_output(out,
                                        { R"(\[trce\]: .*TWINE-CONTAINER: .*reserved room for \[3\] more)",
                                          R"(\[warn\]: .*TWINE-CONTAINER: .*handle \[[0-9]+@[0-9]+\] is stale)",
                                          R"(\[warn\]: .*Error code emitted: .*removed)",
                                          R"(\[trce\]: .*packed \[0\] elements)",
                                          R"(\[trce\]: .*clearing \[0\] elements)" }))
    << out;
  EXPECT_EQ(out.find("secret-payload"), string::npos); // Payloads are never logged.
} // TEST(Ordered_arena, Logging)

TEST(Ordered_arena, Error_category)
{
  const Error_code stale(error::Code::S_STALE_HANDLE);
  EXPECT_STREQ(stale.category().name(), "twine/container");
  EXPECT_EQ(stale.message(), "Handle refers to an element that has been removed; its slot may have been reused.");
  EXPECT_EQ(Error_code(error::Code::S_INVALID_INDEX).message(),
            "Handle index is null or beyond the end of the arena.");
  EXPECT_EQ(Error_code(error::Code::S_ITERATOR_INVALIDATED).message(),
            "Iterator used after a structural mutation of its container.");
  EXPECT_EQ(Error_code(error::Code::S_PACK_CAPACITY_TOO_SMALL).message(),
            "Requested compaction capacity is smaller than the number of live elements.");
  EXPECT_TRUE(stale);
  EXPECT_NE(Error_code(error::Code::S_INVALID_INDEX), stale);

  EXPECT_EQ(util::ostream_op_string(Handle{ 3, 7 }), "[3@7]");
  EXPECT_EQ(util::ostream_op_string(Handle::null()), "[null]");
  EXPECT_TRUE(Handle().is_null());
  EXPECT_EQ(hash_value(Handle{ 3, 7 }), hash_value(Handle{ 3, 7 }));
} // TEST(Ordered_arena, Error_category)

} // namespace twine::container::test
