// tests/tree_tests.cpp
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

#include <string>
#include <vector>

#include "core/tree.hpp"
#include "test_helpers.hpp"

using namespace jyed::core;
using jyed::test::compact;
using jyed::test::read_json;

TEST(Tree, empty_tree_is_an_empty_mapping)
{
    const auto t{ tree::make_empty() };
    EXPECT_TRUE(t.root().is_mapping());
    EXPECT_EQ(t.root().child_count(), 0u);
    EXPECT_EQ(t.node_count(), 1u);
}

TEST(Tree, read_resolves_paths)
{
    const auto t{ read_json(R"({"a":[10,{"b":true}]})") };

    const auto b{ t.read(path{ 0, 1, 0 }) };
    ASSERT_TRUE(b.has_value());
    EXPECT_TRUE(std::get<bool>(b->get().get()));

    ASSERT_TRUE(t.read(path{}).has_value());
    EXPECT_TRUE(t.read(path{})->get().is_mapping());
}

TEST(Tree, read_past_the_end_is_absent)
{
    const auto t{ read_json("[1,2]") };

    EXPECT_FALSE(t.read(path{ 5 }).has_value());
    EXPECT_FALSE(t.read(path{ 2 }).has_value());
}

TEST(Tree, read_below_a_leaf_is_absent)
{
    const auto t{ read_json(R"({"a":1})") };

    EXPECT_FALSE(t.read(path{ 0, 0 }).has_value());
    EXPECT_FALSE(t.read(path{ 0, 0, 0 }).has_value());
}

TEST(Tree, read_accepts_any_path_like_range)
{
    const auto t{ read_json("[[1,[2,3]]]") };
    const path full{ 0, 1, 1, 7 };

    const auto n{ t.read(parent_path_of(full)) };
    ASSERT_TRUE(n.has_value());
    EXPECT_EQ(std::get<std::int64_t>(n->get().get()), 3);
}

TEST(Tree, insert_into_sequence)
{
    auto t{ read_json("[10,30]") };

    ASSERT_EQ(t.insert(path{}, 1, std::nullopt, node::make_integer(20)), tree_msg::none);
    EXPECT_EQ(compact(t), "[10,20,30]");
}

TEST(Tree, insert_preserves_order_at_every_position)
{
    for (std::size_t i{ 0 }; i <= 3; ++i)
    {
        auto t{ read_json("[0,1,2]") };
        ASSERT_EQ(t.insert(path{}, i, std::nullopt, node::make_string("new")), tree_msg::none);

        const auto& s{ std::get<sequence>(t.root().get()) };
        ASSERT_EQ(s.size(), 4u);
        EXPECT_EQ(std::get<string_value>(s[i].get()).text, "new");

        /* the others keep their relative order around the new element */
        std::int64_t expected{ 0 };
        for (std::size_t j{ 0 }; j < s.size(); ++j)
        {
            if (j != i)
                EXPECT_EQ(std::get<std::int64_t>(s[j].get()), expected++);
        }
    }
}

TEST(Tree, insert_into_mapping_preserves_order_at_every_position)
{
    const std::vector<std::string> keys{ "a", "b", "c" };

    for (std::size_t i{ 0 }; i <= keys.size(); ++i)
    {
        auto t{ read_json(R"({"a":0,"b":1,"c":2})") };
        ASSERT_EQ(t.insert(path{}, i, "new", node::make_string("x")), tree_msg::none);

        const auto& m{ std::get<mapping>(t.root().get()) };
        ASSERT_EQ(m.size(), 4u);
        EXPECT_EQ(m[i].key, "new");
        EXPECT_EQ(std::get<string_value>(m[i].child.get()).text, "x");

        /* the others keep their keys, values and relative order around the new entry */
        std::size_t expected{ 0 };
        for (std::size_t j{ 0 }; j < m.size(); ++j)
        {
            if (j == i)
                continue;

            EXPECT_EQ(m[j].key, keys[expected]);
            EXPECT_EQ(std::get<std::int64_t>(m[j].child.get()), static_cast<std::int64_t>(expected));
            ++expected;
        }
    }
}

TEST(Tree, insert_into_mapping_needs_a_key)
{
    auto t{ read_json(R"({"a":1})") };

    EXPECT_EQ(t.insert(path{}, 1, std::nullopt, node::make_null()), tree_msg::key_required);
    EXPECT_EQ(t.insert(path{}, 0, "z", node::make_null()), tree_msg::none);
    EXPECT_EQ(compact(t), R"({"z":null,"a":1})");
}

TEST(Tree, insert_into_sequence_refuses_a_key)
{
    auto t{ read_json("[1]") };
    EXPECT_EQ(t.insert(path{}, 0, "k", node::make_null()), tree_msg::key_not_allowed);
    EXPECT_EQ(compact(t), "[1]");
}

TEST(Tree, insert_failures_are_distinct_and_change_nothing)
{
    auto t{ read_json(R"({"a":[1,2],"s":"x"})") };
    const auto before{ t.duplicate() };

    EXPECT_EQ(t.insert(path{ 0 }, 3, std::nullopt, node::make_null()), tree_msg::out_of_range);
    EXPECT_EQ(t.insert(path{ 1 }, 0, std::nullopt, node::make_null()), tree_msg::not_container);
    EXPECT_EQ(t.insert(path{ 7 }, 0, std::nullopt, node::make_null()), tree_msg::not_found);
    EXPECT_EQ(t.insert(path{ 0 }, 0, std::nullopt, node::make_documents()), tree_msg::invalid_value);

    EXPECT_TRUE(equal_content(t, before));
}

TEST(Tree, remove_shrinks_the_parent_by_one)
{
    auto t{ read_json(R"({"a":1,"b":2})") };

    ASSERT_EQ(t.remove(path{ 1 }), tree_msg::none);
    EXPECT_EQ(compact(t), R"({"a":1})");
}

TEST(Tree, remove_root_fails)
{
    auto t{ read_json("[1,2,3]") };

    EXPECT_EQ(t.remove(path{}), tree_msg::cannot_delete_root);
    EXPECT_EQ(compact(t), "[1,2,3]");
}

TEST(Tree, remove_out_of_range_and_missing)
{
    auto t{ read_json(R"({"a":[1]})") };

    EXPECT_EQ(t.remove(path{ 0, 1 }), tree_msg::out_of_range);
    EXPECT_EQ(t.remove(path{ 3, 0 }), tree_msg::not_found);
    EXPECT_EQ(t.remove(path{ 0, 0, 0 }), tree_msg::not_container);
    EXPECT_EQ(compact(t), R"({"a":[1]})");
}

TEST(Tree, remove_then_read_is_absent)
{
    auto t{ read_json("[[1]]") };

    ASSERT_EQ(t.remove(path{ 0 }), tree_msg::none);
    EXPECT_FALSE(t.read(path{ 0 }).has_value());
    EXPECT_FALSE(t.read(path{ 0, 0 }).has_value());
}

TEST(Tree, insert_then_remove_restores_the_tree)
{
    const std::string text{ R"({"list":[1,{"x":null}],"n":2.5})" };
    auto t{ read_json(text) };
    const auto original{ read_json(text) };

    ASSERT_EQ(t.insert(path{ 0 }, 1, std::nullopt, node::make_boolean(false)), tree_msg::none);
    ASSERT_EQ(t.remove(path{ 0, 1 }), tree_msg::none);
    EXPECT_TRUE(equal_content(t, original));

    ASSERT_EQ(t.insert(path{}, 2, "k", node::make_sequence()), tree_msg::none);
    ASSERT_EQ(t.remove(path{ 2 }), tree_msg::none);
    EXPECT_TRUE(equal_content(t, original));
}

TEST(Tree, replace_scalar)
{
    auto t{ read_json(R"({"a":1,"b":[]})") };

    EXPECT_EQ(t.replace_scalar(path{ 0 }, string_value{ .text = "one" }), tree_msg::none);
    EXPECT_EQ(compact(t), R"({"a":"one","b":[]})");

    EXPECT_EQ(t.replace_scalar(path{ 1 }, std::int64_t{ 3 }), tree_msg::not_scalar);
    EXPECT_EQ(t.replace_scalar(path{ 0 }, mapping{}), tree_msg::not_scalar);
    EXPECT_EQ(t.replace_scalar(path{ 4 }, null_value{}), tree_msg::not_found);
}

TEST(Tree, replace_scalar_keeps_string_style)
{
    tree t{ node::make_sequence({ node::make_string("old", string_style::literal) }) };

    ASSERT_EQ(t.replace_scalar(path{ 0 }, string_value{ .text = "new" }), tree_msg::none);

    const auto& s{ std::get<string_value>(t.read(path{ 0 })->get().get()) };
    EXPECT_EQ(s.text, "new");
    EXPECT_EQ(s.style, string_style::literal);
}

TEST(Tree, rename_key)
{
    auto t{ read_json(R"({"a":{"b":1},"c":[2]})") };

    EXPECT_EQ(t.rename_key(path{ 0, 0 }, "renamed"), tree_msg::none);
    EXPECT_EQ(compact(t), R"({"a":{"renamed":1},"c":[2]})");

    EXPECT_EQ(t.rename_key(path{ 1, 0 }, "x"), tree_msg::not_mapping_entry);
    EXPECT_EQ(t.rename_key(path{}, "x"), tree_msg::not_mapping_entry);
    EXPECT_EQ(t.rename_key(path{ 0, 5 }, "x"), tree_msg::out_of_range);
}

TEST(Tree, key_of)
{
    const auto t{ read_json(R"({"a":[1],"b":2})") };

    EXPECT_EQ(t.key_of(path{ 1 }), "b");
    EXPECT_FALSE(t.key_of(path{ 0, 0 }).has_value());
    EXPECT_FALSE(t.key_of(path{}).has_value());
}

TEST(Tree, edits_mark_the_chain_above_as_modified)
{
    auto t{ read_json(R"({"a":{"b":[1,2]},"c":3})") };

    ASSERT_EQ(t.replace_scalar(path{ 0, 0, 1 }, std::int64_t{ 5 }), tree_msg::none);

    EXPECT_TRUE(t.root().modified());
    EXPECT_TRUE(t.read(path{ 0 })->get().modified());
    EXPECT_TRUE(t.read(path{ 0, 0 })->get().modified());
    EXPECT_TRUE(t.read(path{ 0, 0, 1 })->get().modified());

    EXPECT_FALSE(t.read(path{ 0, 0, 0 })->get().modified());
    EXPECT_FALSE(t.read(path{ 1 })->get().modified());
}

TEST(Tree, reads_do_not_mark_anything)
{
    const auto t{ read_json(R"({"a":[1]})") };

    static_cast<void>(t.read(path{ 0, 0 }));
    EXPECT_FALSE(t.root().modified());
}

TEST(Tree, failed_edits_do_not_mark_anything)
{
    auto t{ read_json(R"({"a":[1]})") };

    ASSERT_EQ(t.insert(path{ 0 }, 9, std::nullopt, node::make_null()), tree_msg::out_of_range);
    EXPECT_FALSE(t.root().modified());
    EXPECT_FALSE(t.read(path{ 0 })->get().modified());
}

TEST(Tree, duplicate_is_independent)
{
    auto t{ read_json("[1,2]") };
    const auto copy{ t.duplicate() };

    ASSERT_EQ(t.remove(path{ 0 }), tree_msg::none);

    EXPECT_EQ(compact(copy), "[1,2]");
    EXPECT_EQ(compact(t), "[2]");
    EXPECT_EQ(copy.source(), t.source());
}

TEST(Tree, nearest_existing_drops_indices_until_something_resolves)
{
    const auto t{ read_json(R"({"a":[1,2]})") };

    EXPECT_EQ(t.nearest_existing(path{ 0, 1 }), (path{ 0, 1 }));
    EXPECT_EQ(t.nearest_existing(path{ 0, 4 }), (path{ 0 }));
    EXPECT_EQ(t.nearest_existing(path{ 3, 4, 5 }), (path{}));
}

TEST(Tree, child_count)
{
    const auto t{ read_json(R"({"a":[1,2,3],"b":"x"})") };

    EXPECT_EQ(t.child_count(path{ 0 }), 3u);
    EXPECT_EQ(t.child_count(path{ 1 }), 0u);
    EXPECT_FALSE(t.child_count(path{ 2 }).has_value());
}

TEST(Tree, messages_have_text)
{
    EXPECT_EQ(msg_text(tree_msg::cannot_delete_root), "cannot delete root");
    EXPECT_NE(msg_text(tree_msg::out_of_range), msg_text(tree_msg::not_container));
}
