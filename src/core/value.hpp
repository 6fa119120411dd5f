// core/value.hpp
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
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace jyed::core
{
    class node;
    struct mapping_entry;

    enum class value_type : std::int8_t
    {
        null,
        boolean,
        integer,
        floating,
        string,
        mapping,
        sequence,
        documents,
        alias
    };

    /* how a string is presented in formats that distinguish it (YAML block scalars);
     * kept separate from the text so that editing the text keeps the style */
    enum class string_style : std::int8_t
    {
        plain,
        literal,    /* "|" block */
        folded      /* ">" block */
    };

    using null_value = std::monostate;

    struct string_value
    {
        std::string     text;
        string_style    style{ string_style::plain };

        bool operator==(const string_value&) const = default;
    };

    /* reference to a named anchor; a leaf, never an edge to the anchored node */
    struct alias_value
    {
        std::string     anchor;

        bool operator==(const alias_value&) const = default;
    };

    using mapping = std::vector<mapping_entry>;
    using sequence = std::vector<node>;

    /* root of a multi-document stream; only valid as the root of a tree */
    struct documents
    {
        std::vector<node>   items;
    };

    using value = std::variant<
            null_value,
            bool,
            std::int64_t,
            double,
            string_value,
            mapping,
            sequence,
            documents,
            alias_value
    >;


    /* Classification of values */

    [[nodiscard]] value_type type_of(const value& v) noexcept;
    [[nodiscard]] std::string_view type_name(value_type t) noexcept;
    [[nodiscard]] bool is_container(const value& v) noexcept;
    [[nodiscard]] bool is_mapping(const value& v) noexcept;
    [[nodiscard]] bool is_sequence(const value& v) noexcept;
    [[nodiscard]] bool is_documents(const value& v) noexcept;
    [[nodiscard]] bool is_scalar(const value& v) noexcept;

    /* number of direct children (0 for scalars) */
    [[nodiscard]] std::size_t entry_count(const value& v) noexcept;

    /* compares values recursively, ignoring node bookkeeping (modified flags, spans) */
    [[nodiscard]] bool equal_content(const value& lhs, const value& rhs);

    /* one line human readable rendering of a scalar, or a summary such as "{3}" for containers */
    [[nodiscard]] std::string describe(const value& v);

    /* shortest text that reads back as the same double; always contains '.', 'e' or is "null" */
    [[nodiscard]] std::string format_floating(double d);
}
