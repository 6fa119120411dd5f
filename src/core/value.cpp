// core/value.cpp
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


#include "value.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <ranges>
#include <stdexcept>

#include "node.hpp"

namespace jyed::core
{
    namespace detail
    {
        namespace
        {
            template<typename... Ts>
            struct overload : Ts ... { using Ts::operator()...; };

            constexpr std::size_t max_described_length{ 40 };
        }
    }

    value_type type_of(const value& v) noexcept
    {
        return static_cast<value_type>(v.index());
    }

    std::string_view type_name(const value_type t) noexcept
    {
        switch (t)
        {
            case value_type::null:
                return "null";
            case value_type::boolean:
                return "boolean";
            case value_type::integer:
                return "integer";
            case value_type::floating:
                return "number";
            case value_type::string:
                return "string";
            case value_type::mapping:
                return "object";
            case value_type::sequence:
                return "array";
            case value_type::documents:
                return "documents";
            case value_type::alias:
                return "alias";
        }
        return "unknown";
    }

    bool is_container(const value& v) noexcept
    {
        return is_mapping(v) or is_sequence(v) or is_documents(v);
    }

    bool is_mapping(const value& v) noexcept
    {
        return std::holds_alternative<mapping>(v);
    }

    bool is_sequence(const value& v) noexcept
    {
        return std::holds_alternative<sequence>(v);
    }

    bool is_documents(const value& v) noexcept
    {
        return std::holds_alternative<documents>(v);
    }

    bool is_scalar(const value& v) noexcept
    {
        return not is_container(v);
    }

    std::size_t entry_count(const value& v) noexcept
    {
        return std::visit(detail::overload{
                [](const mapping& m) { return m.size(); },
                [](const sequence& s) { return s.size(); },
                [](const documents& d) { return d.items.size(); },
                [](const auto&) { return 0uz; }
        }, v);
    }

    bool equal_content(const value& lhs, const value& rhs)
    {
        if (lhs.index() != rhs.index())
            return false;

        const auto equal_nodes{ [](const node& a, const node& b) { return equal_content(a, b); } };

        return std::visit(detail::overload{
                [&](const mapping& m)
                {
                    const auto& other{ std::get<mapping>(rhs) };
                    return std::ranges::equal(m, other, [](const mapping_entry& a, const mapping_entry& b) {
                        return a.key == b.key and equal_content(a.child, b.child);
                    });
                },
                [&](const sequence& s)
                {
                    return std::ranges::equal(s, std::get<sequence>(rhs), equal_nodes);
                },
                [&](const documents& d)
                {
                    return std::ranges::equal(d.items, std::get<documents>(rhs).items, equal_nodes);
                },
                [&](const double& d)
                {
                    /* NaN never comes out of a reader, but must still compare equal to itself here */
                    const double other{ std::get<double>(rhs) };
                    return d == other or (std::isnan(d) and std::isnan(other));
                },
                [&]<typename T>(const T& scalar) -> bool
                {
                    return scalar == std::get<T>(rhs);
                }
        }, lhs);
    }

    std::string format_floating(const double d)
    {
        if (not std::isfinite(d))
            return "null";

        std::array<char, 32> buffer{};
        const auto [end, ec]{ std::to_chars(buffer.data(), buffer.data() + buffer.size(), d) };

        if (ec != std::errc{})
            throw std::runtime_error("format_floating: buffer too small");

        std::string result{ buffer.data(), end };

        if (result.find_first_of(".e") == std::string::npos)
            result += ".0";

        return result;
    }

    std::string describe(const value& v)
    {
        return std::visit(detail::overload{
                [](const null_value&) -> std::string { return "null"; },
                [](const bool b) -> std::string { return b ? "true" : "false"; },
                [](const std::int64_t i) { return std::to_string(i); },
                [](const double d) { return format_floating(d); },
                [](const string_value& s)
                {
                    std::string result{ "\"" };
                    const auto first_line{ s.text.substr(0, s.text.find('\n')) };

                    if (first_line.size() > detail::max_described_length)
                        result += first_line.substr(0, detail::max_described_length) + "...";
                    else if (first_line.size() < s.text.size())
                        result += first_line + "...";
                    else
                        result += first_line;

                    return result + "\"";
                },
                [](const mapping& m) { return "{" + std::to_string(m.size()) + "}"; },
                [](const sequence& s) { return "[" + std::to_string(s.size()) + "]"; },
                [](const documents& d) { return "<" + std::to_string(d.items.size()) + " documents>"; },
                [](const alias_value& a) { return "*" + a.anchor; }
        }, v);
    }
}
