// tests/history_tests.cpp
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

#include "core/history.hpp"
#include "test_helpers.hpp"

using namespace jyed::core;
using jyed::test::compact;
using jyed::test::read_json;

namespace
{
    /* a state that is identified by a single number */
    snapshot numbered(const std::int64_t n)
    {
        return snapshot{ .document = tree{ node::make_integer(n) }, .cursor = {} };
    }

    std::int64_t number_of(const snapshot& s)
    {
        return std::get<std::int64_t>(s.document.root().get());
    }

    std::int64_t number_of(const history::optional_snapshot_ref& s)
    {
        if (not s.has_value())
            throw std::invalid_argument("number_of: no snapshot");

        return number_of(s->get());
    }
}

TEST(History, starts_at_the_initial_state)
{
    const history h{ numbered(0) };

    EXPECT_EQ(h.size(), 1u);
    EXPECT_EQ(h.current_seq(), h.root_seq());
    EXPECT_EQ(number_of(h.current()), 0);
    EXPECT_FALSE(h.can_undo());
    EXPECT_FALSE(h.can_redo());
    EXPECT_EQ(h.capacity(), history::default_capacity);
}

TEST(History, undo_at_the_root_is_nothing)
{
    history h{ numbered(0) };

    EXPECT_FALSE(h.undo().has_value());
    EXPECT_FALSE(h.redo().has_value());
    EXPECT_EQ(number_of(h.current()), 0);
}

TEST(History, checkpoint_undo_redo)
{
    history h{ numbered(0) };

    h.checkpoint(numbered(1));
    EXPECT_EQ(number_of(h.current()), 1);
    EXPECT_TRUE(h.can_undo());

    EXPECT_EQ(number_of(h.undo()), 0);
    EXPECT_TRUE(h.can_redo());
    EXPECT_EQ(number_of(h.redo()), 1);
    EXPECT_FALSE(h.can_redo());
}

TEST(History, repeated_undo_terminates_at_the_root)
{
    history h{ numbered(0) };

    for (std::int64_t i{ 1 }; i <= 10; ++i)
        h.checkpoint(numbered(i));

    std::size_t steps{ 0 };
    while (h.undo().has_value())
        ++steps;

    EXPECT_EQ(steps, 10u);
    EXPECT_EQ(h.current_seq(), h.root_seq());
    EXPECT_EQ(number_of(h.current()), 0);
}

TEST(History, redo_replays_checkpoints_in_order)
{
    history h{ numbered(0) };

    for (std::int64_t i{ 1 }; i <= 5; ++i)
        h.checkpoint(numbered(i));

    while (h.undo().has_value())
    {
    }

    for (std::int64_t i{ 1 }; i <= 5; ++i)
        EXPECT_EQ(number_of(h.redo()), i);

    EXPECT_FALSE(h.redo().has_value());
}

TEST(History, redo_follows_the_newest_branch)
{
    /* S0, delete entry 0 -> S1, undo, delete entry 1 -> S2 */
    auto s0{ read_json(R"({"a":1,"b":2})") };

    auto s1{ s0.duplicate() };
    ASSERT_EQ(s1.remove(path{ 0 }), tree_msg::none);

    auto s2{ s0.duplicate() };
    ASSERT_EQ(s2.remove(path{ 1 }), tree_msg::none);

    history h{ snapshot{ .document = std::move(s0), .cursor = {} } };
    h.checkpoint(snapshot{ .document = std::move(s1), .cursor = path{ 0 } });
    const auto first_branch{ h.current_seq() };

    ASSERT_TRUE(h.undo().has_value());
    h.checkpoint(snapshot{ .document = std::move(s2), .cursor = path{ 1 } });
    const auto second_branch{ h.current_seq() };

    EXPECT_EQ(h.parent_of(first_branch), h.root_seq());
    EXPECT_EQ(h.parent_of(second_branch), h.root_seq());
    EXPECT_EQ(h.children_of(h.root_seq()).size(), 2u);

    const auto back{ h.undo() };
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(compact(back->get().document), R"({"a":1,"b":2})");

    const auto forward{ h.redo() };
    ASSERT_TRUE(forward.has_value());
    EXPECT_EQ(h.current_seq(), second_branch);
    EXPECT_EQ(compact(forward->get().document), R"({"a":1})");
    EXPECT_EQ(forward->get().cursor, (path{ 1 }));
}

TEST(History, older_branches_stay_reachable)
{
    history h{ numbered(0) };

    h.checkpoint(numbered(1));
    const auto old_branch{ h.current_seq() };
    static_cast<void>(h.undo());
    h.checkpoint(numbered(2));

    ASSERT_TRUE(h.contains(old_branch));
    EXPECT_EQ(number_of(h.snapshot_of(old_branch)), 1);
    EXPECT_TRUE(h.timestamp_of(old_branch).has_value());
}

TEST(History, recorded_snapshots_stay_as_they_were)
{
    history h{ numbered(0) };

    h.checkpoint(snapshot{ .document = tree{ node::make_integer(1) }, .cursor = path{ 3 } });
    const auto first{ h.current_seq() };
    static_cast<void>(h.undo());
    h.checkpoint(snapshot{ .document = tree{ node::make_integer(2) }, .cursor = path{ 4, 1 } });
    static_cast<void>(h.undo());
    static_cast<void>(h.redo());

    EXPECT_TRUE(is_root_path(h.snapshot_of(h.root_seq())->get().cursor));
    EXPECT_EQ(h.snapshot_of(first)->get().cursor, (path{ 3 }));
    EXPECT_EQ(number_of(h.snapshot_of(first)), 1);
    EXPECT_EQ(h.current().cursor, (path{ 4, 1 }));
    EXPECT_EQ(number_of(h.current()), 2);
}

TEST(History, unknown_sequence_numbers_are_absent)
{
    const history h{ numbered(0) };

    EXPECT_FALSE(h.contains(99));
    EXPECT_FALSE(h.snapshot_of(99).has_value());
    EXPECT_FALSE(h.parent_of(99).has_value());
    EXPECT_TRUE(h.children_of(99).empty());
    EXPECT_FALSE(h.timestamp_of(99).has_value());
}

TEST(History, capacity_prunes_branches_off_the_current_path_first)
{
    history h{ numbered(0), 4 };

    h.checkpoint(numbered(1));
    const auto pruned_top{ h.current_seq() };
    h.checkpoint(numbered(2));
    const auto pruned_child{ h.current_seq() };

    static_cast<void>(h.undo());
    static_cast<void>(h.undo());
    h.checkpoint(numbered(3));
    EXPECT_EQ(h.size(), 4u);

    h.checkpoint(numbered(4));

    EXPECT_EQ(h.size(), 3u);
    EXPECT_FALSE(h.contains(pruned_top));
    EXPECT_FALSE(h.contains(pruned_child));
    EXPECT_EQ(number_of(h.current()), 4);

    /* the current path is intact back to the original root */
    EXPECT_EQ(number_of(h.undo()), 3);
    EXPECT_EQ(number_of(h.undo()), 0);
    EXPECT_FALSE(h.undo().has_value());
}

TEST(History, capacity_reroots_a_long_current_path)
{
    history h{ numbered(0), 3 };

    for (std::int64_t i{ 1 }; i <= 4; ++i)
        h.checkpoint(numbered(i));

    EXPECT_EQ(h.size(), 3u);
    EXPECT_EQ(number_of(h.current()), 4);
    EXPECT_EQ(number_of(h.snapshot_of(h.root_seq())), 2);
    EXPECT_FALSE(h.parent_of(h.root_seq()).has_value());

    EXPECT_EQ(number_of(h.undo()), 3);
    EXPECT_EQ(number_of(h.undo()), 2);
    EXPECT_FALSE(h.undo().has_value());
}

TEST(History, capacity_never_drops_below_one)
{
    history h{ numbered(0), 0 };

    EXPECT_EQ(h.capacity(), 1u);

    h.checkpoint(numbered(1));
    EXPECT_EQ(h.size(), 1u);
    EXPECT_EQ(number_of(h.current()), 1);
    EXPECT_FALSE(h.can_undo());
}

TEST(History, size_never_exceeds_capacity)
{
    history h{ numbered(0), 5 };

    for (std::int64_t i{ 1 }; i <= 40; ++i)
    {
        h.checkpoint(numbered(i));

        if (i % 3 == 0)
        {
            static_cast<void>(h.undo());
            static_cast<void>(h.undo());
        }

        EXPECT_LE(h.size(), 5u);
    }
}
