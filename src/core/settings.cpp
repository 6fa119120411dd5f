// core/settings.cpp
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


#include "settings.hpp"

#include <algorithm>
#include <charconv>
#include <iterator>
#include <utility>

namespace jyed::core
{
    namespace detail
    {
        namespace
        {
            constexpr std::size_t max_indent_size{ 16 };

            [[nodiscard]] std::optional<std::size_t> parse_count(const std::string& text)
            {
                std::size_t result{ 0 };
                const auto* end{ text.data() + text.size() };
                const auto [ptr, ec]{ std::from_chars(text.data(), end, result) };

                if (ec != std::errc{} or ptr != end or text.empty())
                    return std::nullopt;

                return result;
            }

            [[nodiscard]] bool is_option(const std::string& arg, std::string_view short_name, std::string_view long_name)
            {
                return (not short_name.empty() and arg == short_name) or arg == long_name;
            }
        }
    }

    arg_result parse_arguments(std::deque<std::string>& args, settings& config)
    {
        std::deque<std::string> files{};

        const auto take_value{ [&]() -> std::optional<std::string> {
            if (args.empty())
                return std::nullopt;

            auto result{ std::move(args.front()) };
            args.pop_front();
            return result;
        } };

        while (not args.empty())
        {
            auto arg{ std::move(args.front()) };
            args.pop_front();

            if (arg == "--")
            {
                std::ranges::move(args, std::back_inserter(files));
                args.clear();
            }
            else if (detail::is_option(arg, "-h", "--help"))
            {
                return { .msg = arg_msg::help, .option = arg };
            }
            else if (detail::is_option(arg, "-v", "--version"))
            {
                return { .msg = arg_msg::version, .option = arg };
            }
            else if (detail::is_option(arg, "-u", "--undo-limit") or detail::is_option(arg, "-i", "--indent"))
            {
                const auto text{ take_value() };

                if (not text.has_value())
                    return { .msg = arg_msg::missing_value, .option = arg };

                const auto count{ detail::parse_count(*text) };

                if (not count.has_value() or *count == 0)
                    return { .msg = arg_msg::invalid_value, .option = arg };

                if (detail::is_option(arg, "-u", "--undo-limit"))
                {
                    config.history_capacity = *count;
                }
                else if (*count <= detail::max_indent_size)
                {
                    config.indent_size = *count;
                }
                else
                {
                    return { .msg = arg_msg::invalid_value, .option = arg };
                }
            }
            else if (detail::is_option(arg, "-l", "--log"))
            {
                const auto text{ take_value() };

                if (not text.has_value())
                    return { .msg = arg_msg::missing_value, .option = arg };

                config.log_file = std::filesystem::path{ *text };
            }
            else if (detail::is_option(arg, "", "--log-level"))
            {
                const auto text{ take_value() };

                if (not text.has_value())
                    return { .msg = arg_msg::missing_value, .option = arg };

                const auto lvl{ log::parse_level(*text) };

                if (not lvl.has_value())
                    return { .msg = arg_msg::invalid_value, .option = arg };

                config.log_level = *lvl;
            }
            else if (detail::is_option(arg, "", "--no-preserve"))
            {
                config.preserve_formatting = false;
            }
            else if (detail::is_option(arg, "", "--jsonl"))
            {
                config.jsonl = true;
            }
            else if (arg.size() > 1 and arg.front() == '-')
            {
                return { .msg = arg_msg::unknown_option, .option = arg };
            }
            else
            {
                files.push_back(std::move(arg));
            }
        }

        args = std::move(files);
        return {};
    }

    std::string_view usage_text() noexcept
    {
        return "Usage: jyed [options] [file]\n"
               "\n"
               "Options:\n"
               "  -u, --undo-limit N    keep at most N undo states (default 50)\n"
               "  -i, --indent N        indent written documents by N spaces (default 2)\n"
               "  -l, --log FILE        write a log to FILE\n"
               "      --log-level LVL   trace, debug, info, warning, error, critical or off\n"
               "      --no-preserve     rewrite unmodified values instead of copying their text\n"
               "      --jsonl           read and write the file as JSON Lines\n"
               "  -h, --help            show this text\n"
               "  -v, --version         show the version\n";
    }

    bool use_jsonl(const settings& config, const std::filesystem::path& file)
    {
        return config.jsonl.value_or(file.extension() == ".jsonl");
    }
}
