// tui/window.hpp
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

#include <csignal>
#include <deque>
#include <filesystem>
#include <locale>
#include <optional>
#include <string>
#include <vector>

#include "../core/editor.hpp"
#include "../core/settings.hpp"
#include "keymap.hpp"
#include "read_helper.hpp"
#include "window_detail.hpp"

namespace jyed::tui
{
    extern volatile std::sig_atomic_t global_signal_status;

    class window
    {
    public:
        static window create(core::settings config);

        window(const window&) = delete;
        window(window&&) = delete;
        window& operator=(const window&) = delete;
        window& operator=(window&&) = delete;

        ~window();

        int operator()(std::deque<std::string>& filenames);

        inline static std::filesystem::path                             autosave_path{};
        inline static std::optional<core::editor::file_msg>             autosave_msg{};
        inline static std::string                                       exit_message{};    /* why the window closed early */

    private:
        explicit window(core::settings config);

        [[nodiscard]] bool tree_open();
        bool tree_save();
        [[nodiscard]] bool tree_close();
        void tree_autosave();

        void undo();
        void redo();
        void delete_node();
        void insert_node(actions where);
        void edit_node();
        void rename_node();
        void report(core::tree_msg msg);

        [[nodiscard]] std::optional<std::string> prompt(std::string_view label, std::string initial = {});

        void draw_top();
        void draw_status();
        void draw_help();
        void draw_content();

        void rebuild_lines();
        void add_lines(const core::node& n, core::path& at, const std::string& prefix);
        void update_screen();
        void update_viewport_pos();
        void update_window_sizes();


        std::locale                         new_locale_{ "" };
        std::filesystem::path               current_filename_{};
        core::editor                        current_file_;
        detail::coord                       screen_dimensions_{ .y = 0, .x = 0 };

        std::vector<std::string>            lines_{};         /* the outline, one node per line */
        std::size_t                         cursor_line_{ 0 };
        std::size_t                         line_start_y_{ 0 };

        bool                                term_has_color_{ false };

        detail::redraw_set                  screen_redraw_;

        detail::sub_window                  sub_win_top_;
        detail::sub_window                  sub_win_status_;
        detail::sub_window                  sub_win_help_;
        detail::sub_window                  sub_win_content_;

        detail::status_bar_mode             status_mode_{ detail::status_bar_mode::default_mode };
        detail::status_bar_message          status_msg_;
        detail::status_bar_prompt           prompt_info_;
        std::vector<keymap::binding>        help_info_;

        keymap                              keymap_;
        char_read_helper                    crh_;
    };
}
