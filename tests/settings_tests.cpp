// tests/settings_tests.cpp
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

#include <deque>
#include <string>

#include "core/settings.hpp"

using namespace jyed::core;

TEST(Settings, defaults)
{
    const settings config{};

    EXPECT_EQ(config.history_capacity, 50u);
    EXPECT_EQ(config.indent_size, 2u);
    EXPECT_TRUE(config.preserve_formatting);
    EXPECT_FALSE(config.jsonl.has_value());
    EXPECT_FALSE(config.log_file.has_value());
}

TEST(Settings, options_are_applied_and_files_remain)
{
    std::deque<std::string> args{ "-u", "10", "data.json", "--indent", "4", "--no-preserve", "--jsonl",
                                   "--log", "jyed.log", "--log-level", "debug" };
    settings config{};

    const auto result{ parse_arguments(args, config) };

    EXPECT_EQ(result.msg, arg_msg::none);
    EXPECT_EQ(config.history_capacity, 10u);
    EXPECT_EQ(config.indent_size, 4u);
    EXPECT_FALSE(config.preserve_formatting);
    EXPECT_EQ(config.jsonl, true);
    ASSERT_TRUE(config.log_file.has_value());
    EXPECT_EQ(config.log_file->string(), "jyed.log");
    EXPECT_EQ(config.log_level, jyed::log::level::debug);

    ASSERT_EQ(args.size(), 1u);
    EXPECT_EQ(args.front(), "data.json");
}

TEST(Settings, double_dash_ends_the_options)
{
    std::deque<std::string> args{ "--", "-u", "--help" };
    settings config{};

    EXPECT_EQ(parse_arguments(args, config).msg, arg_msg::none);
    EXPECT_EQ(args, (std::deque<std::string>{ "-u", "--help" }));
    EXPECT_EQ(config.history_capacity, 50u);
}

TEST(Settings, help_and_version)
{
    std::deque<std::string> help{ "file", "-h" };
    std::deque<std::string> version{ "--version" };
    settings config{};

    EXPECT_EQ(parse_arguments(help, config).msg, arg_msg::help);
    EXPECT_EQ(parse_arguments(version, config).msg, arg_msg::version);
    EXPECT_FALSE(usage_text().empty());
}

TEST(Settings, problems_name_the_option)
{
    const auto check{ [](std::deque<std::string> args, const arg_msg expected, const std::string& option) {
        settings config{};
        const auto result{ parse_arguments(args, config) };
        EXPECT_EQ(result.msg, expected);
        EXPECT_EQ(result.option, option);
    } };

    check({ "-u" }, arg_msg::missing_value, "-u");
    check({ "--undo-limit", "many" }, arg_msg::invalid_value, "--undo-limit");
    check({ "-u", "0" }, arg_msg::invalid_value, "-u");
    check({ "-i", "17" }, arg_msg::invalid_value, "-i");
    check({ "--log-level", "loud" }, arg_msg::invalid_value, "--log-level");
    check({ "--log" }, arg_msg::missing_value, "--log");
    check({ "--frobnicate" }, arg_msg::unknown_option, "--frobnicate");
}

TEST(Settings, a_lone_dash_is_a_file_name)
{
    std::deque<std::string> args{ "-" };
    settings config{};

    EXPECT_EQ(parse_arguments(args, config).msg, arg_msg::none);
    EXPECT_EQ(args.size(), 1u);
}

TEST(Settings, json_lines_follow_the_extension_unless_forced)
{
    settings config{};

    EXPECT_TRUE(use_jsonl(config, "events.jsonl"));
    EXPECT_FALSE(use_jsonl(config, "config.json"));

    config.jsonl = true;
    EXPECT_TRUE(use_jsonl(config, "config.json"));

    config.jsonl = false;
    EXPECT_FALSE(use_jsonl(config, "events.jsonl"));
}
