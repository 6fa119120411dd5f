// core/utf8.cpp
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


#include "utf8.hpp"

#include <algorithm>

namespace jyed::core::utf8
{
    void append(std::string& str, const char32_t cp)
    {
        if (cp < 0x80)
        {
            str += static_cast<char>(cp);
        }
        else if (cp < 0x800)
        {
            str += static_cast<char>(test2 | (cp >> 6));
            str += static_cast<char>(test_cont | (cp & 0x3f));
        }
        else if (cp < 0x10000)
        {
            str += static_cast<char>(test3 | (cp >> 12));
            str += static_cast<char>(test_cont | ((cp >> 6) & 0x3f));
            str += static_cast<char>(test_cont | (cp & 0x3f));
        }
        else
        {
            str += static_cast<char>(test4 | (cp >> 18));
            str += static_cast<char>(test_cont | ((cp >> 12) & 0x3f));
            str += static_cast<char>(test_cont | ((cp >> 6) & 0x3f));
            str += static_cast<char>(test_cont | (cp & 0x3f));
        }
    }

    std::size_t length(std::string_view str) noexcept
    {
        return static_cast<std::size_t>(std::ranges::count_if(str, [](const char c) { return not is_continuation(c); }));
    }

    std::size_t offset_of(std::string_view str, const std::size_t n) noexcept
    {
        std::size_t count{ 0 };

        for (std::size_t i{ 0 }; i < str.size(); ++i)
        {
            if (not is_continuation(str[i]))
            {
                if (count == n)
                    return i;
                ++count;
            }
        }

        return str.size();
    }

    std::string_view prefix(std::string_view str, const std::size_t n) noexcept
    {
        return str.substr(0, offset_of(str, n));
    }
}
