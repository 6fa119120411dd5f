// core/json.hpp
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

#include <string>
#include <string_view>
#include <variant>

#include "node.hpp"
#include "tree.hpp"

namespace jyed::core::json
{
    struct parse_error
    {
        std::string     message;
        std::size_t     line{ 1 };      /* 1 based */
        std::size_t     column{ 1 };    /* 1 based, in bytes */
    };

    using parse_result = std::variant<tree, parse_error>;
    using literal_result = std::variant<node, parse_error>;

    struct write_options
    {
        std::size_t     indent_size{ 2 };
        bool            preserve_formatting{ true };    /* copy the source text of unmodified nodes */
    };

    /* Reads one JSON document. Nodes record their source span and start out unmodified. */
    [[nodiscard]] parse_result parse(std::string text);

    /* Reads JSON Lines: one document per non-blank line, under a documents root. */
    [[nodiscard]] parse_result parse_lines(std::string text);

    /* Reads a value typed by the user: the resulting nodes carry no span and count as modified. */
    [[nodiscard]] literal_result parse_literal(std::string_view text);

    [[nodiscard]] std::string write(const tree& t, const write_options& options = {});

    /* single line rendering without passthrough */
    [[nodiscard]] std::string write_compact(const node& n);

    [[nodiscard]] std::string quote(std::string_view text);
}
