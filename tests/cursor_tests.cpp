// tests/cursor_tests.cpp
//
// Copyright (C) 2025 The jyed authors
//
// This file is part of jyed.
//
// jyed is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// jyed is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with jyed.  If not, see <https://www.gnu.org/licenses/>.


#include <gtest/gtest.h>

#include <vector>

#include "core/cursor.hpp"
#include "test_helpers.hpp"

using namespace jyed::core;
using jyed::test::read_json;

TEST(Cursor, starts_at_the_root)
{
    const cursor c{};
    EXPECT_TRUE(is_root_path(c.get()));
    EXPECT_EQ(c.depth(), 0u);
}

TEST(Cursor, child_and_parent)
{
    const auto t{ read_json(R"({"a":[1,2],"b":3})") };
    cursor c{};

    EXPECT_FALSE(c.to_parent());

    ASSERT_TRUE(c.to_first_child(t));
    ASSERT_TRUE(c.to_first_child(t));
    EXPECT_EQ(c.get(), (path{ 0, 0 }));
    EXPECT_FALSE(c.to_first_child(t));

    ASSERT_TRUE(c.to_parent());
    EXPECT_EQ(c.get(), (path{ 0 }));
}

TEST(Cursor, siblings)
{
    const auto t{ read_json("[1,2,3,4]") };
    cursor c{};
    c.set(path{ 1 });

    EXPECT_TRUE(c.to_next_sibling(t));
    EXPECT_EQ(c.get(), (path{ 2 }));

    EXPECT_TRUE(c.to_last_sibling(t));
    EXPECT_EQ(c.get(), (path{ 3 }));
    EXPECT_FALSE(c.to_next_sibling(t));
    EXPECT_FALSE(c.to_last_sibling(t));

    EXPECT_TRUE(c.to_first_sibling());
    EXPECT_EQ(c.get(), (path{ 0 }));
    EXPECT_FALSE(c.to_prev_sibling());
    EXPECT_FALSE(c.to_first_sibling());
}

TEST(Cursor, root_has_no_siblings)
{
    const auto t{ read_json("[1]") };
    cursor c{};

    EXPECT_FALSE(c.to_next_sibling(t));
    EXPECT_FALSE(c.to_prev_sibling());
    EXPECT_FALSE(c.to_first_sibling());
    EXPECT_FALSE(c.to_last_sibling(t));
    EXPECT_TRUE(is_root_path(c.get()));
}

TEST(Cursor, next_and_prev_walk_in_display_order)
{
    const auto t{ read_json(R"({"a":[1,[2]],"b":3})") };
    const std::vector<path> order{ path{}, path{ 0 }, path{ 0, 0 }, path{ 0, 1 }, path{ 0, 1, 0 }, path{ 1 } };

    cursor c{};
    for (std::size_t i{ 1 }; i < order.size(); ++i)
    {
        ASSERT_TRUE(c.to_next(t));
        EXPECT_EQ(c.get(), order[i]);
    }
    EXPECT_FALSE(c.to_next(t));

    for (std::size_t i{ order.size() - 1 }; i > 0; --i)
    {
        ASSERT_TRUE(c.to_prev(t));
        EXPECT_EQ(c.get(), order[i - 1]);
    }
    EXPECT_FALSE(c.to_prev(t));
}

TEST(Cursor, to_last_reaches_the_deepest_last_node)
{
    const auto t{ read_json(R"({"a":1,"b":[2,{"c":4}]})") };
    cursor c{};

    EXPECT_TRUE(c.to_last(t));
    EXPECT_EQ(c.get(), (path{ 1, 1, 0 }));
    EXPECT_FALSE(c.to_last(t));
}

TEST(Cursor, clamp_moves_to_the_nearest_existing_node)
{
    auto t{ read_json(R"({"a":[1,2]})") };
    cursor c{};
    c.set(path{ 0, 1 });

    ASSERT_EQ(t.remove(path{ 0, 1 }), tree_msg::none);
    c.clamp(t);
    EXPECT_EQ(c.get(), (path{ 0 }));

    c.set(path{ 4, 2 });
    c.clamp(t);
    EXPECT_TRUE(is_root_path(c.get()));
}
