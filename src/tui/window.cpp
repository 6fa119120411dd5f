// tui/window.cpp
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


#include "window.hpp"

#include <algorithm>
#include <stdexcept>
#include <unistd.h>

#include "../core/json.hpp"
#include "../core/log.hpp"
#include "../core/utf8.hpp"
#include "strings.hpp"

namespace jyed::tui
{
    volatile std::sig_atomic_t global_signal_status;

    namespace
    {
        void signal_handler(int signal)
        {
            global_signal_status = signal;
        }

        constexpr int pad_size{ 2 };
        constexpr std::size_t indent_width{ 2 };

        [[nodiscard]] std::string line_prefix(const core::node& parent, const core::mapping_entry* entry)
        {
            if (entry)
                return entry->key + ": ";
            else if (parent.is_documents())
                return "--- ";
            else
                return "- ";
        }
    }


    /* Constructors and Destructors, and related funcs */

    window::window(core::settings config) :
            current_file_{ std::move(config) },
            status_msg_{ screen_redraw_ }
    {
        std::locale::global(new_locale_);

        initscr();
        raw();          // disable keyboard interrupts (and flow control, so that ^S reaches us)
        nonl();         // disable conversion of enter to new line
        noecho();       // do not echo keyboard input
        curs_set(0);    // cursor only shown in prompts
        timeout(100);

        intrflush(stdscr, false);
        keypad(stdscr, true);
        meta(stdscr, true);

        keymap_ = keymap::make_default();
        help_info_ = keymap::make_editor_help_bar();

        if (has_colors() != FALSE)
        {
            term_has_color_ = true;
            start_color();
            use_default_colors();
            init_pair(detail::warning_pair, COLOR_WHITE, COLOR_RED);
            init_pair(detail::emphasis_pair, COLOR_CYAN, -1);
            bkgd(COLOR_PAIR(0) | ' ');
        }

        update_window_sizes();

        std::signal(SIGHUP, signal_handler);
        std::signal(SIGTERM, signal_handler);
        std::signal(SIGQUIT, signal_handler);
    }

    window::~window()
    {
        sub_win_top_ = detail::sub_window{};
        sub_win_status_ = detail::sub_window{};
        sub_win_help_ = detail::sub_window{};
        sub_win_content_ = detail::sub_window{};
        endwin();
    }

    window window::create(core::settings config)
    {
        static bool window_exists{ false };

        if (not window_exists)
        {
            window_exists = true;
            return window{ std::move(config) };
        }
        else
        {
            throw std::logic_error("Cannot create more than 1 main window");
        }
    }

    int window::operator()(std::deque<std::string>& filenames)
    {
        do
        {
            if (not filenames.empty())
            {
                current_filename_ = filenames.front();
                filenames.pop_front();
            }

            if (not tree_open())
                return 1;

            for (bool exit{ false }; not exit;)
            {
                update_screen();
                crh_.extract_char();

                if (global_signal_status)
                    break;

                status_msg_.tick();

                if (not crh_.has_input())
                    continue;

                if (crh_.is_resize())
                {
                    update_window_sizes();
                    status_msg_.dismiss();
                    continue;
                }

                bool moved{ true };
                const auto action{ crh_.get_action(keymap_.get()) };

                switch (action)
                {
                    case actions::cursor_prev:
                        moved = current_file_.cursor_to_prev();
                        break;
                    case actions::cursor_next:
                        moved = current_file_.cursor_to_next();
                        break;
                    case actions::cursor_parent:
                        moved = current_file_.cursor_to_parent();
                        break;
                    case actions::cursor_child:
                        moved = current_file_.cursor_to_first_child();
                        break;
                    case actions::cursor_prev_sibling:
                        moved = current_file_.cursor_to_prev_sibling();
                        break;
                    case actions::cursor_next_sibling:
                        moved = current_file_.cursor_to_next_sibling();
                        break;
                    case actions::cursor_first:
                        moved = current_file_.cursor_to_first();
                        break;
                    case actions::cursor_last:
                        moved = current_file_.cursor_to_last();
                        break;

                    case actions::node_delete:
                        delete_node();
                        break;
                    case actions::node_insert_after:
                    case actions::node_insert_before:
                    case actions::node_insert_child:
                        insert_node(action);
                        break;
                    case actions::node_edit:
                        edit_node();
                        break;
                    case actions::node_rename:
                        rename_node();
                        break;

                    case actions::undo:
                        undo();
                        break;
                    case actions::redo:
                        redo();
                        break;
                    case actions::save_file:
                        tree_save();
                        break;
                    case actions::close_file:
                        exit = tree_close();
                        break;

                    default:
                        status_msg_.warn(strings::unbound_key);
                        break;
                }

                if (moved)
                    screen_redraw_.mark(detail::region::content, detail::region::top);
            }
        }
        while (not global_signal_status and not filenames.empty());

        if (global_signal_status)
        {
            log::warn("window: received signal {}", static_cast<int>(global_signal_status));

            if (current_file_.modified())
                tree_autosave();

            return 1;
        }

        return 0;
    }


    /* Editor related operations */

    bool window::tree_open()
    {
        using file_msg = core::editor::file_msg;

        if (current_filename_.empty())
        {
            current_file_.make_empty();
        }
        else
        {
            const auto [msg, info]{ current_file_.load_file(current_filename_) };

            switch (msg)
            {
                case file_msg::none:
                    status_msg_.show(strings::read_success(info.node_count, info.byte_count));
                    break;

                case file_msg::does_not_exist:
                    status_msg_.show(strings::new_file_msg);
                    break;

                case file_msg::is_unwritable:
                    status_msg_.warn(core::msg_text(msg));
                    break;

                case file_msg::parse_error:
                    exit_message = strings::parse_error(current_filename_, info.error->line, info.error->column,
                                                        info.error->message);
                    return false;

                case file_msg::is_directory:
                case file_msg::is_device_file:
                case file_msg::is_invalid_file:
                case file_msg::is_unreadable:
                case file_msg::unknown_error:
                    exit_message = strings::error_reading(current_filename_, core::msg_text(msg));
                    return false;
            }
        }

        line_start_y_ = 0;
        screen_redraw_.mark_all();
        return true;
    }

    bool window::tree_save()
    {
        using file_msg = core::editor::file_msg;

        if (current_filename_.empty())
        {
            const auto name{ prompt(strings::file_prompt) };

            if (not name.has_value() or name->empty())
            {
                status_msg_.show(strings::cancelled);
                return false;
            }

            current_filename_ = *name;
        }

        const auto [msg, info]{ current_file_.save_file(current_filename_) };
        screen_redraw_.mark(detail::region::top, detail::region::content);

        if (msg == file_msg::none)
        {
            status_msg_.show(strings::write_success(info.node_count, info.byte_count));
            return true;
        }

        status_msg_.warn(strings::error_writing(current_filename_, core::msg_text(msg)));
        return false;
    }

    bool window::tree_close()
    {
        using detail::status_bar_mode;

        if (not current_file_.modified())
            return true;

        auto saved_help_info{ std::move(help_info_) };

        status_mode_ = status_bar_mode::prompt_close;
        help_info_ = keymap::make_quit_prompt_help_bar();
        screen_redraw_.mark(detail::region::status, detail::region::help);

        const auto local_keymap{ keymap::make_quit_prompt_keymap() };
        std::optional<bool> close{};

        while (not close.has_value() and not global_signal_status)
        {
            update_screen();
            crh_.extract_char();

            if (crh_.is_resize())
                update_window_sizes();

            switch (crh_.get_action(local_keymap))
            {
                case actions::prompt_yes:
                    close = true;
                    break;
                case actions::prompt_no:
                    close = false;
                    break;
                case actions::prompt_cancel:
                    close = std::nullopt;
                    status_mode_ = status_bar_mode::default_mode;
                    help_info_ = std::move(saved_help_info);
                    status_msg_.show(strings::cancelled);
                    screen_redraw_.mark(detail::region::help);
                    return false;
                default:
                    break;
            }
        }

        status_mode_ = status_bar_mode::default_mode;
        help_info_ = std::move(saved_help_info);
        screen_redraw_.mark(detail::region::status, detail::region::help);

        /* "yes" means save first; quitting only goes ahead if that worked */
        if (close.value_or(false))
            return tree_save();

        return close.has_value();
    }

    void window::tree_autosave()
    {
        auto path{ current_filename_.empty() ? std::filesystem::current_path() / (std::string{ strings::program_name } + "."
                                                                                   + std::to_string(getpid()))
                                             : current_filename_ };
        path += ".save";

        for (int i{ 1 }; std::filesystem::exists(std::filesystem::status(path)) and i < 100; ++i)
            path.replace_extension(".save." + std::to_string(i));

        autosave_path = path;
        autosave_msg = current_file_.save_file(path).first;
    }

    void window::undo()
    {
        const auto msg{ current_file_.undo() };

        /* nothing to undo is not an error */
        if (msg == core::history_msg::none)
            status_msg_.show(strings::undone);
        else
            status_msg_.show(core::msg_text(msg));

        screen_redraw_.mark(detail::region::content, detail::region::top);
    }

    void window::redo()
    {
        const auto msg{ current_file_.redo() };

        if (msg == core::history_msg::none)
            status_msg_.show(strings::redone);
        else
            status_msg_.show(core::msg_text(msg));

        screen_redraw_.mark(detail::region::content, detail::region::top);
    }

    void window::delete_node()
    {
        report(current_file_.delete_at_cursor());
    }

    void window::insert_node(const actions where)
    {
        if (where != actions::node_insert_child and core::is_root_path(current_file_.cursor_path()))
        {
            status_msg_.warn(strings::root_has_no_sibling);
            return;
        }

        const bool needs_key{ where == actions::node_insert_child ? current_file_.child_needs_key()
                                                                  : current_file_.sibling_needs_key() };
        std::optional<std::string> key{};

        if (needs_key)
        {
            key = prompt(strings::key_prompt);

            if (not key.has_value())
            {
                status_msg_.show(strings::cancelled);
                return;
            }
        }

        switch (where)
        {
            case actions::node_insert_after:
                report(current_file_.insert_after_cursor(std::move(key), core::node::make_null()));
                break;
            case actions::node_insert_before:
                report(current_file_.insert_before_cursor(std::move(key), core::node::make_null()));
                break;
            case actions::node_insert_child:
                report(current_file_.insert_child(std::move(key), core::node::make_null()));
                break;
            default:
                throw std::invalid_argument("window: insert_node called with a non-insert action");
        }
    }

    void window::edit_node()
    {
        const auto current{ current_file_.cursor_node() };

        if (not current.has_value() or not current->get().is_scalar())
        {
            status_msg_.warn(strings::not_scalar);
            return;
        }

        const auto text{ prompt(strings::value_prompt, core::json::write_compact(current->get())) };

        if (not text.has_value())
        {
            status_msg_.show(strings::cancelled);
            return;
        }

        /* anything that does not read as a JSON value is taken as a string */
        auto literal{ core::json::parse_literal(*text) };

        if (const auto* n{ std::get_if<core::node>(&literal) })
            report(current_file_.replace_at_cursor(n->get()));
        else
            report(current_file_.replace_at_cursor(core::string_value{ .text = *text }));
    }

    void window::rename_node()
    {
        auto key{ current_file_.cursor_key() };

        if (not key.has_value())
        {
            status_msg_.warn(strings::not_entry);
            return;
        }

        const auto text{ prompt(strings::rename_prompt, std::move(*key)) };

        if (not text.has_value())
        {
            status_msg_.show(strings::cancelled);
            return;
        }

        report(current_file_.rename_at_cursor(*text));
    }

    void window::report(const core::tree_msg msg)
    {
        if (msg == core::tree_msg::none)
            screen_redraw_.mark(detail::region::content, detail::region::top);
        else
            status_msg_.warn(strings::edit_failed(core::msg_text(msg)));
    }

    std::optional<std::string> window::prompt(const std::string_view label, std::string initial)
    {
        using detail::status_bar_mode;

        status_mode_ = status_bar_mode::prompt_text;
        prompt_info_ = { .label = label, .text = std::move(initial), .cursor_pos = 0 };
        prompt_info_.cursor_pos = core::utf8::length(prompt_info_.text);
        status_msg_.dismiss();
        curs_set(1);

        std::optional<std::string> result{};

        for (bool exit{ false }; not exit and not global_signal_status;)
        {
            screen_redraw_.mark(detail::region::status);
            update_screen();
            crh_.extract_char();

            if (not crh_.has_input())
                continue;

            auto& text{ prompt_info_.text };
            auto& pos{ prompt_info_.cursor_pos };

            if (crh_.is_resize())
            {
                update_window_sizes();
            }
            else if (crh_.is_enter())
            {
                result = text;
                exit = true;
            }
            else if (crh_.is_backspace())
            {
                if (pos > 0)
                {
                    const auto begin{ core::utf8::offset_of(text, pos - 1) };
                    text.erase(begin, core::utf8::offset_of(text, pos) - begin);
                    --pos;
                }
            }
            else if (crh_.is_function_key())
            {
                switch (crh_.value())
                {
                    case KEY_LEFT:
                        pos -= (pos > 0) ? 1 : 0;
                        break;
                    case KEY_RIGHT:
                        pos += (pos < core::utf8::length(text)) ? 1 : 0;
                        break;
                    case KEY_HOME:
                        pos = 0;
                        break;
                    case KEY_END:
                        pos = core::utf8::length(text);
                        break;
                    case KEY_DC:
                        if (pos < core::utf8::length(text))
                        {
                            const auto begin{ core::utf8::offset_of(text, pos) };
                            text.erase(begin, core::utf8::offset_of(text, pos + 1) - begin);
                        }
                        break;
                    default:
                        break;
                }
            }
            else if (crh_.is_readable())
            {
                std::string ch{};
                core::utf8::append(ch, static_cast<char32_t>(crh_.value()));
                text.insert(core::utf8::offset_of(text, pos), ch);
                ++pos;
            }
            else if (crh_.value() == key::escape or crh_.value() == key::ctrl('c'))
            {
                exit = true;
            }
        }

        curs_set(0);
        status_mode_ = status_bar_mode::default_mode;
        screen_redraw_.mark(detail::region::status);
        return result;
    }


    /* Drawing */

    void window::rebuild_lines()
    {
        lines_.clear();
        cursor_line_ = 0;

        core::path at{};
        add_lines(current_file_.document().root(), at, {});
    }

    /* one line per node in pre-order, indented by depth */
    void window::add_lines(const core::node& n, core::path& at, const std::string& prefix)
    {
        if (at == current_file_.cursor_path())
            cursor_line_ = lines_.size();

        lines_.push_back(std::string(at.size() * indent_width, ' ') + prefix + core::describe(n.get()));

        const auto* m{ std::get_if<core::mapping>(&n.get()) };

        for (std::size_t i{ 0 }; i < n.child_count(); ++i)
        {
            at.push_back(i);
            add_lines(*n.child(i), at, line_prefix(n, m ? &(*m)[i] : nullptr));
            at.pop_back();
        }
    }

    void window::update_viewport_pos()
    {
        const auto height{ static_cast<std::size_t>(std::max(sub_win_content_.height(), 1)) };

        if (cursor_line_ < line_start_y_)
            line_start_y_ = cursor_line_;
        else if (cursor_line_ >= line_start_y_ + height)
            line_start_y_ = cursor_line_ + 1 - height;
    }

    void window::draw_top()
    {
        auto* win{ sub_win_top_.get() };
        werase(win);

        const auto name{ current_filename_.empty() ? std::string{ strings::empty_file } : current_filename_.string() };
        mvwaddnstr(win, 0, pad_size, strings::version_text().c_str(), sub_win_top_.width() - pad_size);

        const int centre{ std::max(0, (sub_win_top_.width() - static_cast<int>(core::utf8::length(name))) / 2) };
        mvwaddnstr(win, 0, centre, name.c_str(), -1);

        if (current_file_.modified())
        {
            const int x{ sub_win_top_.width() - static_cast<int>(strings::modified.size()) - pad_size };
            const detail::color_scope emphasis{ win, detail::color_type::emphasis, term_has_color_ };
            mvwaddnstr(win, 0, std::max(0, x), strings::modified.data(), static_cast<int>(strings::modified.size()));
        }
    }

    void window::draw_content()
    {
        auto* win{ sub_win_content_.get() };
        werase(win);

        const auto width{ static_cast<std::size_t>(std::max(sub_win_content_.width(), 0)) };

        for (int y{ 0 }; y < sub_win_content_.height(); ++y)
        {
            const auto index{ line_start_y_ + static_cast<std::size_t>(y) };

            if (index >= lines_.size())
                break;

            const auto text{ core::utf8::prefix(lines_[index], width) };
            std::optional<detail::color_scope> selected{};

            if (index == cursor_line_)
                selected.emplace(win, detail::color_type::inverse, term_has_color_);

            mvwaddnstr(win, y, 0, text.data(), static_cast<int>(text.size()));
        }
    }

    void window::draw_status()
    {
        using detail::status_bar_mode;

        auto* win{ sub_win_status_.get() };
        werase(win);

        switch (status_mode_)
        {
            case status_bar_mode::prompt_close:
                mvwaddnstr(win, 0, 0, strings::close_prompt.data(), static_cast<int>(strings::close_prompt.size()));
                break;

            case status_bar_mode::prompt_text:
            {
                mvwaddnstr(win, 0, 0, prompt_info_.label.data(), static_cast<int>(prompt_info_.label.size()));
                waddnstr(win, prompt_info_.text.c_str(), -1);
                wmove(win, 0, static_cast<int>(prompt_info_.label.size() + prompt_info_.cursor_pos));
                break;
            }

            case status_bar_mode::default_mode:
                if (not status_msg_.empty())
                {
                    const auto& text{ status_msg_.text() };
                    const int x{ std::max(0, (sub_win_status_.width() - static_cast<int>(core::utf8::length(text))) / 2) };
                    const auto style{ status_msg_.is_warning() ? detail::color_type::warning : detail::color_type::inverse };

                    const detail::color_scope colored{ win, style, term_has_color_ };
                    mvwaddnstr(win, 0, x, text.c_str(), -1);
                }
                break;
        }
    }

    void window::draw_help()
    {
        auto* win{ sub_win_help_.get() };
        werase(win);

        int x{ 0 };

        for (const auto& [key_name, description] : help_info_)
        {
            const int width{ static_cast<int>(key_name.size() + description.size()) + pad_size };

            if (x + width > sub_win_help_.width())
                break;

            {
                const detail::color_scope inverse{ win, detail::color_type::inverse, term_has_color_ };
                mvwaddnstr(win, 0, x, key_name.data(), static_cast<int>(key_name.size()));
            }
            waddch(win, ' ');
            waddnstr(win, description.data(), static_cast<int>(description.size()));
            x += width;
        }
    }

    void window::update_screen()
    {
        if (screen_redraw_.contains(detail::region::content))
        {
            rebuild_lines();
            update_viewport_pos();
            draw_content();
            wnoutrefresh(sub_win_content_.get());
        }

        if (screen_redraw_.contains(detail::region::top))
        {
            draw_top();
            wnoutrefresh(sub_win_top_.get());
        }

        if (screen_redraw_.contains(detail::region::help))
        {
            draw_help();
            wnoutrefresh(sub_win_help_.get());
        }

        /* status last: it holds the terminal cursor while prompting */
        if (screen_redraw_.contains(detail::region::status) or status_mode_ == detail::status_bar_mode::prompt_text)
        {
            draw_status();
            wnoutrefresh(sub_win_status_.get());
        }

        screen_redraw_.reset();
        doupdate();
    }

    void window::update_window_sizes()
    {
        using detail::sub_window;

        getmaxyx(stdscr, screen_dimensions_.y, screen_dimensions_.x);

        constexpr int bars{ 3 };
        const int content_height{ std::max(screen_dimensions_.y - bars, 1) };

        sub_win_top_ = sub_window{ { .y = 1, .x = screen_dimensions_.x }, { .y = 0, .x = 0 } };
        sub_win_content_ = sub_window{ { .y = content_height, .x = screen_dimensions_.x }, { .y = 1, .x = 0 } };
        sub_win_status_ = sub_window{ { .y = 1, .x = screen_dimensions_.x }, { .y = content_height + 1, .x = 0 } };
        sub_win_help_ = sub_window{ { .y = 1, .x = screen_dimensions_.x }, { .y = content_height + 2, .x = 0 } };

        if (not sub_win_top_ or not sub_win_content_ or not sub_win_status_ or not sub_win_help_)
            throw std::runtime_error("window: terminal too small");

        clear();
        wnoutrefresh(stdscr);
        screen_redraw_.mark_all();
    }
}
