// core/utf8.hpp
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

namespace jyed::core::utf8
{
    /* Free functions for std::string containing utf-8 characters */

    void append(std::string& str, char32_t cp);
    [[nodiscard]] std::size_t length(std::string_view str) noexcept;

    /* byte offset of the character at index n, or str.size() if there are fewer characters */
    [[nodiscard]] std::size_t offset_of(std::string_view str, std::size_t n) noexcept;

    /* the first n characters of str */
    [[nodiscard]] std::string_view prefix(std::string_view str, std::size_t n) noexcept;

    /* leading bits of multibyte Unicode characters */
    /* source: https://en.wikipedia.org/wiki/UTF-8#Encoding */

    constexpr int test2{ 0b1100'0000 };
    constexpr int test3{ 0b1110'0000 };
    constexpr int test4{ 0b1111'0000 };

    constexpr int mask_cont{ 0b1100'0000 };
    constexpr int test_cont{ 0b1000'0000 };

    [[nodiscard]] constexpr bool is_continuation(const char c) noexcept
    {
        return (c & mask_cont) == test_cont;
    }
}
