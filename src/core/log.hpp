// core/log.hpp
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

#include <filesystem>
#include <optional>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace jyed::log
{
    using level = spdlog::level::level_enum;

    /* Installs the "jyed" logger as spdlog's default. With a file the log goes only there (the terminal
     * belongs to curses); without one, all output is discarded. Returns false if the file cannot be opened,
     * in which case output is discarded as well. */
    bool init(const std::optional<std::filesystem::path>& file, level lvl);

    [[nodiscard]] std::optional<level> parse_level(std::string_view name);

    template<typename... Args>
    inline void info(fmt::format_string<Args...> f, Args&&... args)
    {
        spdlog::info(f, std::forward<Args>(args)...);
    }

    template<typename... Args>
    inline void warn(fmt::format_string<Args...> f, Args&&... args)
    {
        spdlog::warn(f, std::forward<Args>(args)...);
    }

    template<typename... Args>
    inline void error(fmt::format_string<Args...> f, Args&&... args)
    {
        spdlog::error(f, std::forward<Args>(args)...);
    }

    template<typename... Args>
    inline void debug(fmt::format_string<Args...> f, Args&&... args)
    {
        spdlog::debug(f, std::forward<Args>(args)...);
    }
}
