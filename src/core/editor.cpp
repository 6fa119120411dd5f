// core/editor.cpp
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


#include "editor.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>

#include "log.hpp"

namespace jyed::core
{
    namespace
    {
        [[nodiscard]] std::optional<history::seq_t> newest_child_of(const history& h, const history::seq_t seq)
        {
            const auto children{ h.children_of(seq) };

            if (children.empty())
                return std::nullopt;

            return *std::ranges::max_element(children);
        }

        /* Counts the steps along next() to the first state whose document differs from the live one.
         * States that differ only in the cursor position are passed over with the edit beside them. */
        template<typename Next>
        [[nodiscard]] std::optional<std::size_t> steps_to_change(const history& h, const tree& live, Next next)
        {
            std::size_t steps{ 0 };

            for (auto seq{ next(h.current_seq()) }; seq.has_value(); seq = next(*seq))
            {
                ++steps;

                if (not equal_content(h.snapshot_of(*seq)->get().document, live))
                    return steps;
            }

            return std::nullopt;
        }
    }

    editor::editor(settings config) :
            settings_{ std::move(config) },
            history_{ snapshot{ .document = tree::make_empty(), .cursor = {} }, settings_.history_capacity }
    {
        init(tree::make_empty());
    }

    void editor::init(tree t)
    {
        tree_ = std::move(t);
        cursor_.reset();
        history_ = history{ snapshot{ .document = tree_.duplicate(), .cursor = {} }, settings_.history_capacity };
        recorded_ = true;
        saved_seq_ = history_.current_seq();
    }


    /* File related public member functions */

    void editor::make_empty()
    {
        init(tree::make_empty());
    }

    editor::return_t editor::load_file(const std::filesystem::path& path)
    {
        using std::filesystem::perms;

        auto msg{ file_msg::none };
        save_load_info sli{};

        std::optional<tree> loaded{};
        const auto fs{ std::filesystem::status(path) };

        if (not std::filesystem::exists(fs))
        {
            msg = file_msg::does_not_exist; /* (not actually an error) */
        }
        else if (std::filesystem::is_directory(fs))
        {
            msg = file_msg::is_directory;
        }
        else if (std::filesystem::is_character_file(fs) or std::filesystem::is_block_file(fs))
        {
            msg = file_msg::is_device_file;
        }
        else if (std::filesystem::is_fifo(fs) or std::filesystem::is_socket(fs) or std::filesystem::is_other(fs))
        {
            msg = file_msg::is_invalid_file;
        }
        else if (perms::none == (fs.permissions() & perms::owner_read))
        {
            msg = file_msg::is_unreadable;
        }
        else
        {
            if (perms::none == (fs.permissions() & perms::owner_write))
                msg = file_msg::is_unwritable; /* (not actually an error) */

            std::ifstream file{ path, std::ios::binary };

            if (not file)
            {
                msg = file_msg::unknown_error;
            }
            else
            {
                std::string text{ std::istreambuf_iterator<char>{ file }, std::istreambuf_iterator<char>{} };
                sli.byte_count = text.size();

                auto result{ use_jsonl(settings_, path) ? json::parse_lines(std::move(text))
                                                        : json::parse(std::move(text)) };

                if (auto* t{ std::get_if<tree>(&result) })
                {
                    loaded = std::move(*t);
                }
                else
                {
                    msg = file_msg::parse_error;
                    sli.error = std::get<json::parse_error>(std::move(result));
                }
            }
        }

        init(loaded.has_value() ? std::move(*loaded) : tree::make_empty());
        sli.node_count = tree_.node_count();

        if (msg == file_msg::none or msg == file_msg::does_not_exist or msg == file_msg::is_unwritable)
            log::info("editor: loaded {} ({} nodes, {} bytes): {}", path.string(), sli.node_count, sli.byte_count, msg_text(msg));
        else
            log::warn("editor: could not load {}: {}", path.string(), msg_text(msg));

        return { msg, sli };
    }

    editor::return_t editor::save_file(const std::filesystem::path& path)
    {
        using std::filesystem::perms;

        auto msg{ file_msg::none };
        save_load_info sli{};

        const auto fs{ std::filesystem::status(path) };

        bool save{ false };

        if (not std::filesystem::exists(fs))
        {
            save = true;
        }
        else if (std::filesystem::is_directory(fs))
        {
            msg = file_msg::is_directory;
        }
        else if (not std::filesystem::is_regular_file(fs))
        {
            msg = file_msg::is_invalid_file;
        }
        else if (perms::none == (fs.permissions() & perms::owner_write))
        {
            msg = file_msg::is_unwritable;
        }
        else
        {
            save = true;
        }

        if (save)
        {
            std::ofstream file{ path, std::ios::binary | std::ios::trunc };
            auto out{ text() };

            if (not file or not file.write(out.data(), static_cast<std::streamsize>(out.size())))
            {
                msg = file_msg::unknown_error;
            }
            else
            {
                sli.byte_count = out.size();
                sli.node_count = tree_.node_count();

                /* the written text becomes the source later passthrough copies from */
                auto reread{ use_jsonl(settings_, path) ? json::parse_lines(std::move(out)) : json::parse(std::move(out)) };

                if (auto* t{ std::get_if<tree>(&reread) })
                    tree_ = std::move(*t);
                else
                    log::error("editor: could not read back {}", path.string());

                mark_saved();
            }
        }

        if (msg == file_msg::none)
            log::info("editor: saved {} ({} nodes, {} bytes)", path.string(), sli.node_count, sli.byte_count);
        else
            log::warn("editor: could not save {}: {}", path.string(), msg_text(msg));

        return { msg, sli };
    }

    std::optional<json::parse_error> editor::load_text(std::string text, const bool lines)
    {
        auto result{ lines ? json::parse_lines(std::move(text)) : json::parse(std::move(text)) };

        if (auto* t{ std::get_if<tree>(&result) })
        {
            init(std::move(*t));
            return std::nullopt;
        }

        return std::get<json::parse_error>(std::move(result));
    }

    std::string editor::text() const
    {
        return json::write(tree_, { .indent_size = settings_.indent_size,
                                    .preserve_formatting = settings_.preserve_formatting });
    }

    bool editor::modified() const
    {
        if (not saved_seq_.has_value())
            return true;

        if (recorded_ and history_.current_seq() == *saved_seq_)
            return false;

        /* an undo or redo may have led back to the saved content by another route */
        const auto saved{ history_.snapshot_of(*saved_seq_) };
        return not saved.has_value() or not equal_content(saved->get().document, tree_);
    }

    void editor::mark_saved()
    {
        if (not recorded_)
        {
            history_.checkpoint(snapshot{ .document = tree_.duplicate(), .cursor = cursor_.get() });
            recorded_ = true;
        }

        saved_seq_ = history_.current_seq();
    }


    /* Functions to alter the document */

    tree_msg editor::apply(const std::string_view name, const edit_fn& op, path new_cursor)
    {
        /* the pre-edit state needs a node of its own unless the current one holds exactly it */
        const bool record{ not recorded_ or history_.current().cursor != cursor_.get() };
        std::optional<tree> before{};

        if (record)
            before = tree_.duplicate();

        if (const auto msg{ op(tree_) }; msg != tree_msg::none)
        {
            log::debug("editor: {} at {} failed: {}", name, to_string(cursor_.get()), msg_text(msg));
            return msg;
        }

        if (record)
            history_.checkpoint(snapshot{ .document = std::move(*before), .cursor = cursor_.get() });

        recorded_ = false;
        cursor_.set(std::move(new_cursor));
        cursor_.clamp(tree_);
        return tree_msg::none;
    }

    tree_msg editor::delete_at_cursor()
    {
        const auto& at{ cursor_.get() };
        path next{ at };

        /* prefer the following sibling, then the preceding one */
        if (not is_root_path(at))
        {
            const auto count{ tree_.child_count(make_path_copy_of(parent_path_of(at))).value_or(0) };

            if (last_index_of(at) + 1 >= count and last_index_of(at) > 0)
                decrement_last_index_of(next);
        }

        return apply("delete", [&](tree& t) { return t.remove(at); }, std::move(next));
    }

    tree_msg editor::insert_beside(std::optional<std::string> key, node n, const std::size_t offset)
    {
        const auto& at{ cursor_.get() };

        if (is_root_path(at))
            return tree_msg::not_found;

        const auto parent{ make_path_copy_of(parent_path_of(at)) };
        const auto position{ last_index_of(at) + offset };

        return apply("insert", [&](tree& t) {
            return t.insert(parent, position, std::move(key), std::move(n));
        }, make_child_path_of(parent, position));
    }

    tree_msg editor::insert_after_cursor(std::optional<std::string> key, node n)
    {
        return insert_beside(std::move(key), std::move(n), 1);
    }

    tree_msg editor::insert_before_cursor(std::optional<std::string> key, node n)
    {
        return insert_beside(std::move(key), std::move(n), 0);
    }

    tree_msg editor::insert_child(std::optional<std::string> key, node n)
    {
        const auto& at{ cursor_.get() };
        const auto position{ tree_.child_count(at).value_or(0) };

        return apply("insert child", [&](tree& t) {
            return t.insert(at, position, std::move(key), std::move(n));
        }, make_child_path_of(at, position));
    }

    tree_msg editor::replace_at_cursor(value v)
    {
        const auto& at{ cursor_.get() };
        return apply("replace", [&](tree& t) { return t.replace_scalar(at, std::move(v)); }, at);
    }

    tree_msg editor::rename_at_cursor(std::string key)
    {
        const auto& at{ cursor_.get() };
        return apply("rename", [&](tree& t) { return t.rename_key(at, std::move(key)); }, at);
    }

    void editor::restore(const snapshot& state)
    {
        tree_ = state.document.duplicate();
        cursor_.set(state.cursor);
        cursor_.clamp(tree_);
        recorded_ = true;
    }

    history_msg editor::undo()
    {
        /* keep the live state reachable by redo */
        if (not recorded_)
        {
            history_.checkpoint(snapshot{ .document = tree_.duplicate(), .cursor = cursor_.get() });
            recorded_ = true;
        }

        const auto steps{ steps_to_change(history_, tree_, [this](const history::seq_t seq) {
            return history_.parent_of(seq);
        }) };

        if (not steps.has_value())
            return history_msg::nothing_to_undo;

        history::optional_snapshot_ref state{};
        for (std::size_t i{ 0 }; i < *steps; ++i)
            state = history_.undo();

        restore(state->get());
        log::debug("editor: undo to #{}", history_.current_seq());
        return history_msg::none;
    }

    history_msg editor::redo()
    {
        /* edits made since the last undo start a new branch; they are the newest state */
        if (not recorded_)
            return history_msg::nothing_to_redo;

        const auto steps{ steps_to_change(history_, tree_, [this](const history::seq_t seq) {
            return newest_child_of(history_, seq);
        }) };

        if (not steps.has_value())
            return history_msg::nothing_to_redo;

        history::optional_snapshot_ref state{};
        for (std::size_t i{ 0 }; i < *steps; ++i)
            state = history_.redo();

        restore(state->get());
        log::debug("editor: redo to #{}", history_.current_seq());
        return history_msg::none;
    }

    bool editor::sibling_needs_key() const
    {
        const auto& at{ cursor_.get() };

        if (is_root_path(at))
            return false;

        const auto parent{ tree_.read(parent_path_of(at)) };
        return parent.has_value() and parent->get().is_mapping();
    }

    bool editor::child_needs_key() const
    {
        const auto here{ tree_.read(cursor_.get()) };
        return here.has_value() and here->get().is_mapping();
    }


    /* Wrapper functions for cursor */

    bool editor::cursor_to_parent()
    {
        return cursor_.to_parent();
    }

    bool editor::cursor_to_first_child()
    {
        return cursor_.to_first_child(tree_);
    }

    bool editor::cursor_to_next_sibling()
    {
        return cursor_.to_next_sibling(tree_);
    }

    bool editor::cursor_to_prev_sibling()
    {
        return cursor_.to_prev_sibling();
    }

    bool editor::cursor_to_first_sibling()
    {
        return cursor_.to_first_sibling();
    }

    bool editor::cursor_to_last_sibling()
    {
        return cursor_.to_last_sibling(tree_);
    }

    bool editor::cursor_to_next()
    {
        return cursor_.to_next(tree_);
    }

    bool editor::cursor_to_prev()
    {
        return cursor_.to_prev(tree_);
    }

    bool editor::cursor_to_first()
    {
        if (is_root_path(cursor_.get()))
            return false;

        cursor_.reset();
        return true;
    }

    bool editor::cursor_to_last()
    {
        return cursor_.to_last(tree_);
    }

    bool editor::cursor_go_to(const path& p)
    {
        if (not tree_.read(p).has_value())
            return false;

        cursor_.set(p);
        return true;
    }

    tree::optional_const_ref editor::cursor_node() const
    {
        return tree_.read(cursor_.get());
    }

    std::optional<std::string> editor::cursor_key() const
    {
        return tree_.key_of(cursor_.get());
    }


    /* Messages */

    std::string_view msg_text(const editor::file_msg msg) noexcept
    {
        using enum editor::file_msg;

        switch (msg)
        {
            case none:              return "ok";
            case does_not_exist:    return "new file";
            case is_directory:      return "is a directory";
            case is_device_file:    return "is a device file";
            case is_invalid_file:   return "is not a regular file";
            case is_unreadable:     return "permission denied";
            case is_unwritable:     return "file is read-only";
            case parse_error:       return "not valid JSON";
            case unknown_error:     break;
        }

        return "unknown error";
    }

    std::string_view msg_text(const history_msg msg) noexcept
    {
        switch (msg)
        {
            case history_msg::none:             return "ok";
            case history_msg::nothing_to_undo:  return "Nothing to undo";
            case history_msg::nothing_to_redo:  return "Nothing to redo";
        }

        return "unknown";
    }
}
