// tests/path_tests.cpp
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

#include <stdexcept>

#include "core/path.hpp"

using namespace jyed::core;

TEST(Path, root_path)
{
    EXPECT_TRUE(is_root_path(path{}));
    EXPECT_FALSE(is_root_path(path{ 0 }));
    EXPECT_EQ(to_string(path{}), "/");
}

TEST(Path, parent_and_child)
{
    const path p{ 0, 3, 1 };

    EXPECT_EQ(last_index_of(p), 1u);
    EXPECT_EQ(make_path_copy_of(parent_path_of(p)), (path{ 0, 3 }));
    EXPECT_EQ(make_child_path_of(p, 4), (path{ 0, 3, 1, 4 }));
    EXPECT_EQ(to_string(p), "/0/3/1");
}

TEST(Path, index_adjustment)
{
    path p{ 2, 5 };

    increment_last_index_of(p);
    EXPECT_EQ(p, (path{ 2, 6 }));

    decrement_last_index_of(p);
    set_last_index_of(p, 0);
    EXPECT_EQ(p, (path{ 2, 0 }));

    EXPECT_THROW(decrement_last_index_of(p), std::invalid_argument);
}

TEST(Path, empty_path_has_no_last_index)
{
    path root{};

    EXPECT_THROW(static_cast<void>(last_index_of(root)), std::invalid_argument);
    EXPECT_THROW(static_cast<void>(parent_path_of(root)), std::invalid_argument);
    EXPECT_THROW(increment_last_index_of(root), std::invalid_argument);
}

TEST(Path, prefix)
{
    EXPECT_TRUE(is_prefix_of(path{}, path{ 1, 2 }));
    EXPECT_TRUE(is_prefix_of(path{ 1 }, path{ 1, 2 }));
    EXPECT_TRUE(is_prefix_of(path{ 1, 2 }, path{ 1, 2 }));
    EXPECT_FALSE(is_prefix_of(path{ 2 }, path{ 1, 2 }));
    EXPECT_FALSE(is_prefix_of(path{ 1, 2, 3 }, path{ 1, 2 }));
}
