// core/path.hpp
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

#include <algorithm>
#include <concepts>
#include <ranges>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace jyed::core
{
    template<typename T, typename U>
    concept same_remove_cvref = std::same_as<typename std::remove_cvref_t<T>, U>;

    /* Any random access range of indices can be used to address a node;
     * an empty range denotes the root */
    template<typename T>
    concept path_like =
            std::ranges::random_access_range<T>
            and requires (T a)
            {
                { *std::ranges::begin(a) } -> same_remove_cvref<std::size_t>;
                { *std::ranges::cbegin(a) } -> same_remove_cvref<std::size_t>;
                { *std::ranges::crbegin(a) } -> same_remove_cvref<std::size_t>;
            };

    /* owning path type: stored in cursors and snapshots, always copied by value */
    using path = std::vector<std::size_t>;

    [[nodiscard]] inline bool is_root_path(const path_like auto& p)
    {
        return std::ranges::size(p) == 0;
    }

    [[nodiscard]] inline std::size_t last_index_of(const path_like auto& p)
    {
        if (std::ranges::size(p) > 0)
            return *(std::ranges::crbegin(p));
        else
            throw std::invalid_argument{ "last_index_of: path has size 0" };
    }

    [[nodiscard]] inline auto parent_path_of(const path_like auto& p)
    {
        if (std::ranges::size(p) > 0)
            return (p | std::views::take(std::ranges::size(p) - 1));
        else
            throw std::invalid_argument{ "parent_path_of: path has size 0" };
    }

    [[nodiscard]] inline path make_path_copy_of(const path_like auto& p)
    {
        path result{ std::ranges::begin(p), std::ranges::end(p) };
        return result;
    }

    [[nodiscard]] inline path make_child_path_of(const path_like auto& p, const std::size_t index)
    {
        auto result{ make_path_copy_of(p) };
        result.push_back(index);
        return result;
    }

    inline void increment_last_index_of(path& p)
    {
        if (std::ranges::size(p) > 0)
            ++p.back();
        else
            throw std::invalid_argument{ "increment_last_index_of: path has size 0" };
    }

    inline void decrement_last_index_of(path& p)
    {
        if (std::ranges::size(p) > 0 and p.back() > 0)
            --p.back();
        else
            throw std::invalid_argument{ "decrement_last_index_of: no previous index" };
    }

    inline void set_last_index_of(path& p, const std::size_t value)
    {
        if (std::ranges::size(p) > 0)
            p.back() = value;
        else
            throw std::invalid_argument{ "set_last_index_of: path has size 0" };
    }

    /* true if a is b or a is an ancestor of b */
    [[nodiscard]] inline bool is_prefix_of(const path_like auto& a, const path_like auto& b)
    {
        if (std::ranges::size(a) > std::ranges::size(b))
            return false;

        return std::ranges::equal(a, b | std::views::take(std::ranges::size(a)));
    }

    /* renders a path as "/0/3/1" ("/" for the root), used in status and log messages */
    [[nodiscard]] inline std::string to_string(const path_like auto& p)
    {
        if (std::ranges::size(p) == 0)
            return "/";

        std::string result{};
        for (const auto index : p)
        {
            result += '/';
            result += std::to_string(index);
        }
        return result;
    }
}
