// tests/test_helpers.hpp
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

#include <stdexcept>
#include <string>
#include <variant>

#include "core/json.hpp"
#include "core/tree.hpp"

namespace jyed::test
{
    /* reads text that the test knows to be valid */
    [[nodiscard]] inline core::tree read_json(std::string text)
    {
        auto result{ core::json::parse(std::move(text)) };

        if (auto* error{ std::get_if<core::json::parse_error>(&result) })
            throw std::invalid_argument("test document does not parse: " + error->message);

        return std::get<core::tree>(std::move(result));
    }

    [[nodiscard]] inline std::string compact(const core::tree& t)
    {
        return core::json::write_compact(t.root());
    }

    [[nodiscard]] inline std::string compact(const core::node& n)
    {
        return core::json::write_compact(n);
    }
}
