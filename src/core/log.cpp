// core/log.cpp
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


#include "log.hpp"

#include <memory>
#include <string>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

namespace jyed::log
{
    bool init(const std::optional<std::filesystem::path>& file, const level lvl)
    {
        std::vector<spdlog::sink_ptr> sinks;
        bool opened{ true };

        if (file.has_value())
        {
            try
            {
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(file->string(), false));
            }
            catch (const spdlog::spdlog_ex&)
            {
                opened = false;
            }
        }

        if (sinks.empty())
            sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());

        auto logger{ std::make_shared<spdlog::logger>("jyed", sinks.begin(), sinks.end()) };
        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%Y-%m-%d %T.%e] [%l] %v");
        spdlog::set_level(lvl);
        spdlog::flush_on(spdlog::level::warn);

        return opened;
    }

    std::optional<level> parse_level(const std::string_view name)
    {
        const auto lvl{ spdlog::level::from_str(std::string{ name }) };

        /* from_str() answers "off" for anything it does not know */
        if (lvl == spdlog::level::off and name != "off")
            return std::nullopt;

        return lvl;
    }
}
