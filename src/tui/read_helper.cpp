// tui/read_helper.cpp
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


#include "read_helper.hpp"

namespace jyed::tui
{
    key::input_t char_read_helper::value() const noexcept
    {
        return input_;
    }

    bool char_read_helper::has_input() const noexcept
    {
        return input_info_ != ERR;
    }

    bool char_read_helper::is_resize() const noexcept
    {
        return input_info_ == KEY_CODE_YES and input_ == KEY_RESIZE;
    }

    bool char_read_helper::is_function_key() const noexcept
    {
        return input_info_ == KEY_CODE_YES;
    }

    bool char_read_helper::is_readable() const noexcept
    {
        return input_info_ == OK and input_ >= 0x20 and input_ != 0x7f;
    }

    bool char_read_helper::is_enter() const noexcept
    {
        return (input_info_ == OK and (input_ == '\r' or input_ == '\n'))
               or (input_info_ == KEY_CODE_YES and input_ == KEY_ENTER);
    }

    bool char_read_helper::is_backspace() const noexcept
    {
        return (input_info_ == OK and (input_ == 0x7f or input_ == key::ctrl('h')))
               or (input_info_ == KEY_CODE_YES and input_ == KEY_BACKSPACE);
    }

    void char_read_helper::extract_char()
    {
        input_info_ = get_wch(&input_);
    }

    actions char_read_helper::get_action(const keymap::map_t& keymap) const
    {
        if (not has_input())
            return actions::unknown;

        if (const auto it{ keymap.find(input_) }; it != keymap.end())
            return it->second;
        else
            return actions::unknown;
    }
}
