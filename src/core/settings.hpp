// core/settings.hpp
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


#pragma once

#include <cstdint>
#include <deque>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "history.hpp"
#include "log.hpp"

namespace jyed::core
{
    struct settings
    {
        std::size_t                             history_capacity{ history::default_capacity };
        std::size_t                             indent_size{ 2 };
        bool                                    preserve_formatting{ true };
        std::optional<bool>                     jsonl{};            /* unset: decided by the file extension */
        std::optional<std::filesystem::path>    log_file{};
        log::level                              log_level{ log::level::info };
    };

    enum class arg_msg : std::int8_t
    {
        none = 0,
        help,
        version,
        missing_value,
        invalid_value,
        unknown_option
    };

    struct arg_result
    {
        arg_msg         msg{ arg_msg::none };
        std::string     option{};           /* the option the message refers to */
    };

    /* Consumes the options in args, applying them to config. Whatever is left in args afterwards
     * are file names. Stops at the first problem. */
    [[nodiscard]] arg_result parse_arguments(std::deque<std::string>& args, settings& config);

    [[nodiscard]] std::string_view usage_text() noexcept;

    /* true if documents in the file should be read as JSON Lines */
    [[nodiscard]] bool use_jsonl(const settings& config, const std::filesystem::path& file);
}
