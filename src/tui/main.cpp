// tui/main.cpp
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


#include <deque>
#include <iostream>
#include <string>

#include "../core/log.hpp"
#include "../core/settings.hpp"
#include "strings.hpp"
#include "window.hpp"

int main(const int argc, const char* argv[])
{
    using namespace jyed::tui;
    using jyed::core::arg_msg;

    std::deque<std::string> args{ argv + 1 , argc + argv };
    jyed::core::settings config{};

    switch (const auto [msg, option]{ jyed::core::parse_arguments(args, config) }; msg)
    {
        case arg_msg::none:
            break;
        case arg_msg::help:
            std::cout << jyed::core::usage_text();
            return 0;
        case arg_msg::version:
            std::cout << strings::version_text() << '\n';
            return 0;
        case arg_msg::missing_value:
            std::cerr << strings::bad_argument("missing value for", option) << '\n' << jyed::core::usage_text();
            return 2;
        case arg_msg::invalid_value:
            std::cerr << strings::bad_argument("invalid value for", option) << '\n' << jyed::core::usage_text();
            return 2;
        case arg_msg::unknown_option:
            std::cerr << strings::bad_argument("unknown option", option) << '\n' << jyed::core::usage_text();
            return 2;
    }

    if (not jyed::log::init(config.log_file, config.log_level))
        std::cerr << strings::bad_argument("cannot open log file", config.log_file->string()) << '\n';

    jyed::log::info("{} started", strings::version_text());

    int rv{ 0 };

    {
        window win{ window::create(std::move(config)) };
        rv = win(args);
    }

    if (rv != 0)
    {
        using jyed::core::editor;

        if (global_signal_status == SIGTERM)
            std::cout << strings::received("SIGTERM") << '\n';
        else if (global_signal_status == SIGHUP)
            std::cout << strings::received("SIGHUP") << '\n';
        else if (global_signal_status == SIGQUIT)
            std::cout << strings::received("SIGQUIT") << '\n';

        if (not window::exit_message.empty())
            std::cerr << window::exit_message << '\n';

        if (window::autosave_msg.has_value())
        {
            std::cout << '\n';

            if (*window::autosave_msg == editor::file_msg::none)
                std::cout << strings::autosave(window::autosave_path) << '\n';
            else
                std::cout << strings::error_writing(window::autosave_path, jyed::core::msg_text(*window::autosave_msg))
                          << '\n';
        }

        return 1;
    }

    return 0;
}
