// tui/keymap.hpp
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
#include <string_view>
#include <unordered_map>
#include <vector>

#include <curses.h>

namespace jyed::tui
{
    enum class actions : std::int8_t
    {
        unknown,

        cursor_prev,
        cursor_next,
        cursor_parent,
        cursor_child,
        cursor_prev_sibling,
        cursor_next_sibling,
        cursor_first,
        cursor_last,

        node_delete,
        node_insert_after,
        node_insert_before,
        node_insert_child,
        node_edit,
        node_rename,

        undo,
        redo,
        save_file,
        close_file,

        prompt_yes,
        prompt_no,
        prompt_cancel
    };

    namespace key
    {
        using input_t = wint_t;

        constexpr input_t control_modifier{ 0x1f };
        constexpr input_t escape{ 0x1b };

        constexpr input_t ctrl(const wint_t key)
        {
            return key & control_modifier;
        }
    }

    class keymap
    {
    public:
        using map_t = std::unordered_map<key::input_t, actions>;

        struct binding
        {
            std::string_view    key_name;
            std::string_view    description;
        };

        [[nodiscard]] static keymap make_default();
        [[nodiscard]] static map_t make_quit_prompt_keymap();

        /* short key/description pairs for the help bar */
        [[nodiscard]] static std::vector<binding> make_editor_help_bar();
        [[nodiscard]] static std::vector<binding> make_quit_prompt_help_bar();

        [[nodiscard]] const map_t& get() const noexcept;

    private:
        map_t   map_;
    };
}
