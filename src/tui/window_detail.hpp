// tui/window_detail.hpp
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

#include <chrono>
#include <concepts>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <curses.h>

namespace jyed::tui::detail
{
    /* Non-reusable component classes and structs used in window */

    struct coord
    {
        int y;
        int x;
    };

    /* ncurses color pair numbers, set up by window */
    constexpr short warning_pair{ 1 };
    constexpr short emphasis_pair{ 2 };

    enum class color_type : std::int8_t
    {
        inverse,
        warning,
        emphasis
    };

    enum class status_bar_mode : std::int8_t
    {
        default_mode,
        prompt_close,
        prompt_text
    };

    /* Screen areas that are redrawn independently */
    enum class region : std::uint8_t
    {
        top     = 0b0001,
        content = 0b0010,
        status  = 0b0100,
        help    = 0b1000
    };

    /* The regions to draw before the next doupdate() */
    class redraw_set
    {
    public:
        template<typename... Regions>
        requires (std::same_as<Regions, region> and ...)
        void mark(Regions... rs) noexcept;

        void mark_all() noexcept;
        void reset() noexcept;
        [[nodiscard]] bool contains(region r) const noexcept;

    private:
        static constexpr std::uint8_t all_{ 0b1111 };

        std::uint8_t    bits_{ 0 };
    };

    struct window_deleter
    {
        void operator()(WINDOW* win) const noexcept
        {
            delwin(win);
        }
    };

    /* A part of stdscr. Empty if the terminal had no room for it. */
    class sub_window
    {
    public:
        sub_window() = default;
        sub_window(coord size, coord begin);

        [[nodiscard]] WINDOW* get() const;
        [[nodiscard]] int height() const noexcept;
        [[nodiscard]] int width() const noexcept;
        [[nodiscard]] explicit operator bool() const noexcept;

    private:
        std::unique_ptr<WINDOW, window_deleter>     ptr_{};
        coord                                       size_{ .y = 0, .x = 0 };
    };

    /* Switches on the attributes of a color_type for as long as it lives */
    class color_scope
    {
    public:
        color_scope(WINDOW* win, color_type type, bool term_has_color);
        ~color_scope();

        color_scope(const color_scope&) = delete;
        color_scope& operator=(const color_scope&) = delete;

    private:
        [[nodiscard]] static attr_t attributes_of(color_type type, bool term_has_color) noexcept;

        WINDOW*     win_;
        attr_t      attrs_;
    };

    /* The message in the status bar. It goes away a while after it was first drawn. */
    class status_bar_message
    {
        using clock_t = std::chrono::steady_clock;
        static constexpr std::chrono::seconds display_time{ 2 };

    public:
        explicit status_bar_message(redraw_set& redraw);

        [[nodiscard]] const std::string& text() const noexcept;
        [[nodiscard]] bool is_warning() const noexcept;
        [[nodiscard]] bool empty() const noexcept;

        void show(std::string_view msg);
        void warn(std::string_view msg);
        void dismiss();

        /* once per input cycle: the first call after show() starts the timer, a later one may dismiss */
        void tick();

    private:
        void set(std::string_view msg, bool warning);

        std::string                             text_{};
        bool                                    warning_{ false };
        std::optional<clock_t::time_point>      expires_{};
        std::reference_wrapper<redraw_set>      redraw_;
    };

    /* The line being typed into the status bar */
    struct status_bar_prompt
    {
        std::string_view    label;
        std::string         text;                   /* utf-8 */
        std::size_t         cursor_pos{ 0 };        /* in characters */
    };


    /* Inline function implementations for redraw_set */

    template<typename... Regions>
    requires (std::same_as<Regions, region> and ...)
    inline void redraw_set::mark(Regions... rs) noexcept
    {
        bits_ |= (std::to_underlying(rs) | ...);
    }

    inline void redraw_set::mark_all() noexcept
    {
        bits_ = all_;
    }

    inline void redraw_set::reset() noexcept
    {
        bits_ = 0;
    }

    inline bool redraw_set::contains(const region r) const noexcept
    {
        return (bits_ & std::to_underlying(r)) != 0;
    }


    /* Inline function implementations for sub_window */

    inline sub_window::sub_window(const coord size, const coord begin) :
            ptr_{ subwin(stdscr, size.y, size.x, begin.y, begin.x) }, size_{ size }
    {
    }

    inline WINDOW* sub_window::get() const
    {
        if (not ptr_)
            throw std::logic_error("sub_window: no window to draw on");

        return ptr_.get();
    }

    inline int sub_window::height() const noexcept
    {
        return size_.y;
    }

    inline int sub_window::width() const noexcept
    {
        return size_.x;
    }

    inline sub_window::operator bool() const noexcept
    {
        return ptr_ != nullptr;
    }


    /* Inline function implementations for color_scope */

    inline color_scope::color_scope(WINDOW* win, const color_type type, const bool term_has_color) :
            win_{ win }, attrs_{ attributes_of(type, term_has_color) }
    {
        wattr_on(win_, attrs_, nullptr);
    }

    inline color_scope::~color_scope()
    {
        wattr_off(win_, attrs_, nullptr);
    }

    inline attr_t color_scope::attributes_of(const color_type type, const bool term_has_color) noexcept
    {
        switch (type)
        {
            case color_type::inverse:
                return A_REVERSE;
            case color_type::warning:
                return term_has_color ? A_BOLD | static_cast<attr_t>(COLOR_PAIR(warning_pair)) : A_BOLD | A_STANDOUT;
            case color_type::emphasis:
                return term_has_color ? A_BOLD | static_cast<attr_t>(COLOR_PAIR(emphasis_pair)) : A_BOLD;
        }

        return A_NORMAL;
    }


    /* Inline function implementations for status_bar_message */

    inline status_bar_message::status_bar_message(redraw_set& redraw) :
            redraw_{ redraw }
    {
    }

    inline const std::string& status_bar_message::text() const noexcept
    {
        return text_;
    }

    inline bool status_bar_message::is_warning() const noexcept
    {
        return warning_;
    }

    inline bool status_bar_message::empty() const noexcept
    {
        return text_.empty();
    }

    inline void status_bar_message::show(const std::string_view msg)
    {
        set(msg, false);
    }

    inline void status_bar_message::warn(const std::string_view msg)
    {
        set(msg, true);
    }

    inline void status_bar_message::dismiss()
    {
        set({}, false);
    }

    inline void status_bar_message::tick()
    {
        if (text_.empty())
            return;

        if (not expires_.has_value())
            expires_ = clock_t::now() + display_time;
        else if (clock_t::now() >= *expires_)
            dismiss();
    }

    inline void status_bar_message::set(const std::string_view msg, const bool warning)
    {
        text_ = msg;
        warning_ = warning;
        expires_.reset();
        redraw_.get().mark(region::status);
    }
}
