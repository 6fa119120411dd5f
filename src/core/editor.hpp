// core/editor.hpp
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

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <utility>

#include "cursor.hpp"
#include "history.hpp"
#include "json.hpp"
#include "settings.hpp"
#include "tree.hpp"

namespace jyed::core
{
    struct save_load_info
    {
        std::size_t                         node_count{ 0 };
        std::size_t                         byte_count{ 0 };
        std::optional<json::parse_error>    error{};            /* set with file_msg::parse_error */
    };

    enum class history_msg : std::int8_t
    {
        none = 0,
        nothing_to_undo,
        nothing_to_redo
    };

    class editor
    {
    public:
        enum class file_msg : std::int8_t
        {
            none,
            does_not_exist,
            is_directory,
            is_device_file,
            is_invalid_file,
            is_unreadable,
            is_unwritable,
            parse_error,

            unknown_error
        };

        using return_t = std::pair<file_msg, save_load_info>;

        explicit editor(settings config = {});

        void make_empty();
        [[nodiscard]] return_t load_file(const std::filesystem::path& path);
        [[nodiscard]] return_t save_file(const std::filesystem::path& path);

        /* replaces the document with text read as JSON (or JSON Lines); on failure nothing changes */
        [[nodiscard]] std::optional<json::parse_error> load_text(std::string text, bool lines = false);
        [[nodiscard]] std::string text() const;

        [[nodiscard]] bool modified() const;

        [[nodiscard]] const tree& document() const noexcept;
        [[nodiscard]] const history& undo_history() const noexcept;
        [[nodiscard]] const settings& config() const noexcept;

        /* functions to alter the document */

        [[nodiscard]] tree_msg delete_at_cursor();
        [[nodiscard]] tree_msg insert_after_cursor(std::optional<std::string> key, node n);
        [[nodiscard]] tree_msg insert_before_cursor(std::optional<std::string> key, node n);
        [[nodiscard]] tree_msg insert_child(std::optional<std::string> key, node n);
        [[nodiscard]] tree_msg replace_at_cursor(value v);
        [[nodiscard]] tree_msg rename_at_cursor(std::string key);

        /* both move to the nearest state with a different document, restoring the cursor recorded with it */
        [[nodiscard]] history_msg undo();
        [[nodiscard]] history_msg redo();

        /* true if a node inserted beside (or below) the cursor needs a key */
        [[nodiscard]] bool sibling_needs_key() const;
        [[nodiscard]] bool child_needs_key() const;

        /* wrapper functions for cursor */

        bool cursor_to_parent();
        bool cursor_to_first_child();
        bool cursor_to_next_sibling();
        bool cursor_to_prev_sibling();
        bool cursor_to_first_sibling();
        bool cursor_to_last_sibling();
        bool cursor_to_next();
        bool cursor_to_prev();
        bool cursor_to_first();
        bool cursor_to_last();
        bool cursor_go_to(const path& p);

        [[nodiscard]] const path& cursor_path() const noexcept;
        [[nodiscard]] tree::optional_const_ref cursor_node() const;
        [[nodiscard]] std::optional<std::string> cursor_key() const;

        editor(const editor&) = delete;
        editor(editor&&) = delete;
        editor& operator=(const editor&) = delete;
        editor& operator=(editor&&) = delete;
        ~editor() = default;

    private:
        using edit_fn = std::function<tree_msg(tree&)>;

        void init(tree t);
        void mark_saved();
        void restore(const snapshot& state);
        [[nodiscard]] tree_msg apply(std::string_view name, const edit_fn& op, path new_cursor);
        [[nodiscard]] tree_msg insert_beside(std::optional<std::string> key, node n, std::size_t offset);

        settings                        settings_;
        tree                            tree_{};
        cursor                          cursor_{};
        history                         history_;
        bool                            recorded_{ true };      /* the current history node holds the live tree */
        std::optional<history::seq_t>   saved_seq_{};           /* history node matching the file on disk */
    };


    /* Inline public getters */

    inline const tree& editor::document() const noexcept
    {
        return tree_;
    }

    inline const history& editor::undo_history() const noexcept
    {
        return history_;
    }

    inline const settings& editor::config() const noexcept
    {
        return settings_;
    }

    inline const path& editor::cursor_path() const noexcept
    {
        return cursor_.get();
    }

    [[nodiscard]] std::string_view msg_text(editor::file_msg msg) noexcept;
    [[nodiscard]] std::string_view msg_text(history_msg msg) noexcept;
}
