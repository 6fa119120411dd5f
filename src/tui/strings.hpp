// tui/strings.hpp
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
#include <string>
#include <string_view>

#include <spdlog/fmt/fmt.h>

namespace jyed::tui::strings
{
    /* Strings used in window (known at compile time) */

    constexpr std::string_view program_name         { "jyed" };
    constexpr std::string_view version              { "0.1.0" };

    constexpr std::string_view close_prompt         { "Save modified document?" };
    constexpr std::string_view file_prompt          { "File Name to Write: " };
    constexpr std::string_view key_prompt           { "Key: " };
    constexpr std::string_view value_prompt         { "Value: " };
    constexpr std::string_view rename_prompt        { "New key: " };
    constexpr std::string_view modified             { "Modified" };
    constexpr std::string_view empty_file           { "New Document" };
    constexpr std::string_view unbound_key          { "Unbound key" };
    constexpr std::string_view cancelled            { "Cancelled" };
    constexpr std::string_view new_file_msg         { "New file" };
    constexpr std::string_view undone               { "Undone" };
    constexpr std::string_view redone               { "Redone" };
    constexpr std::string_view not_scalar           { "Only scalar values can be edited in place" };
    constexpr std::string_view not_entry            { "Only mapping entries have a key" };
    constexpr std::string_view root_has_no_sibling  { "The root has no siblings" };


    /* Strings with arguments */

    [[nodiscard]] inline std::string read_success(const std::size_t nodes, const std::size_t bytes)
    {
        return fmt::format("Loaded {} nodes from {} bytes", nodes, bytes);
    }

    [[nodiscard]] inline std::string write_success(const std::size_t nodes, const std::size_t bytes)
    {
        return fmt::format("Wrote {} nodes in {} bytes", nodes, bytes);
    }

    [[nodiscard]] inline std::string error_reading(const std::filesystem::path& file, std::string_view reason)
    {
        return fmt::format("Error reading {}: {}", file.string(), reason);
    }

    [[nodiscard]] inline std::string error_writing(const std::filesystem::path& file, std::string_view reason)
    {
        return fmt::format("Error writing {}: {}", file.string(), reason);
    }

    [[nodiscard]] inline std::string parse_error(const std::filesystem::path& file, std::size_t line, std::size_t column,
                                                 std::string_view message)
    {
        return fmt::format("{}:{}:{}: {}", file.string(), line, column, message);
    }

    [[nodiscard]] inline std::string edit_failed(std::string_view reason)
    {
        return fmt::format("Cannot do that: {}", reason);
    }

    [[nodiscard]] inline std::string received(std::string_view signal)
    {
        return fmt::format("Received {}", signal);
    }

    [[nodiscard]] inline std::string autosave(const std::filesystem::path& file)
    {
        return fmt::format("Document was saved to {}", file.string());
    }

    [[nodiscard]] inline std::string version_text()
    {
        return fmt::format("{} version {}", program_name, version);
    }

    [[nodiscard]] inline std::string bad_argument(std::string_view what, std::string_view option)
    {
        return fmt::format("{}: {} '{}'", program_name, what, option);
    }
}
