// tui/read_helper.hpp
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

#include <curses.h>

#include "keymap.hpp"

namespace jyed::tui
{
    /* Class to help with reading keys from ncurses */
    class char_read_helper
    {
    public:
        [[nodiscard]] key::input_t value() const noexcept;
        [[nodiscard]] bool has_input() const noexcept;
        [[nodiscard]] bool is_resize() const noexcept;
        [[nodiscard]] bool is_function_key() const noexcept;
        [[nodiscard]] bool is_readable() const noexcept;    /* printable text, as opposed to a command */
        [[nodiscard]] bool is_enter() const noexcept;
        [[nodiscard]] bool is_backspace() const noexcept;

        /* waits up to the window timeout for a key */
        void extract_char();

        [[nodiscard]] actions get_action(const keymap::map_t& keymap) const;

    private:
        wint_t  input_{ 0 };
        int     input_info_{ ERR };
    };
}
