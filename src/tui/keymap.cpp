// tui/keymap.cpp
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


#include "keymap.hpp"

namespace jyed::tui
{
    keymap keymap::make_default()
    {
        using key::ctrl;

        keymap result{};

        result.map_ = {
                { KEY_UP,       actions::cursor_prev },
                { 'k',          actions::cursor_prev },
                { KEY_DOWN,     actions::cursor_next },
                { 'j',          actions::cursor_next },
                { KEY_LEFT,     actions::cursor_parent },
                { 'h',          actions::cursor_parent },
                { KEY_RIGHT,    actions::cursor_child },
                { 'l',          actions::cursor_child },
                { KEY_PPAGE,    actions::cursor_prev_sibling },
                { 'K',          actions::cursor_prev_sibling },
                { KEY_NPAGE,    actions::cursor_next_sibling },
                { 'J',          actions::cursor_next_sibling },
                { KEY_HOME,     actions::cursor_first },
                { 'g',          actions::cursor_first },
                { KEY_END,      actions::cursor_last },
                { 'G',          actions::cursor_last },

                { 'd',          actions::node_delete },
                { KEY_DC,       actions::node_delete },
                { 'o',          actions::node_insert_after },
                { 'O',          actions::node_insert_before },
                { 'a',          actions::node_insert_child },
                { 'e',          actions::node_edit },
                { 'r',          actions::node_rename },

                { 'u',          actions::undo },
                { ctrl('z'),    actions::undo },
                { ctrl('r'),    actions::redo },
                { ctrl('y'),    actions::redo },
                { ctrl('s'),    actions::save_file },
                { 'q',          actions::close_file },
                { ctrl('x'),    actions::close_file }
        };

        return result;
    }

    keymap::map_t keymap::make_quit_prompt_keymap()
    {
        using key::ctrl;

        return {
                { 'y',          actions::prompt_yes },
                { 'Y',          actions::prompt_yes },
                { 'n',          actions::prompt_no },
                { 'N',          actions::prompt_no },
                { key::escape,  actions::prompt_cancel },
                { ctrl('c'),    actions::prompt_cancel }
        };
    }

    std::vector<keymap::binding> keymap::make_editor_help_bar()
    {
        return {
                { "hjkl", "Move" },
                { "d",    "Delete" },
                { "o",    "Insert" },
                { "a",    "Add child" },
                { "e",    "Edit" },
                { "r",    "Rename" },
                { "u",    "Undo" },
                { "^R",   "Redo" },
                { "^S",   "Save" },
                { "q",    "Quit" }
        };
    }

    std::vector<keymap::binding> keymap::make_quit_prompt_help_bar()
    {
        return {
                { "Y",    "Yes" },
                { "N",    "No" },
                { "^C",   "Cancel" }
        };
    }

    const keymap::map_t& keymap::get() const noexcept
    {
        return map_;
    }
}
