// core/tree.cpp
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


#include "tree.hpp"

#include <iterator>

namespace jyed::core
{
    std::string_view msg_text(const tree_msg msg) noexcept
    {
        switch (msg)
        {
            case tree_msg::none:
                return "ok";
            case tree_msg::not_found:
                return "no node at path";
            case tree_msg::not_container:
                return "parent is not a container";
            case tree_msg::out_of_range:
                return "position out of range";
            case tree_msg::cannot_delete_root:
                return "cannot delete root";
            case tree_msg::key_required:
                return "object entries need a key";
            case tree_msg::key_not_allowed:
                return "array elements have no key";
            case tree_msg::not_scalar:
                return "not a scalar value";
            case tree_msg::invalid_value:
                return "documents can only be the root";
            case tree_msg::not_mapping_entry:
                return "not an object entry";
        }
        return "unknown error";
    }


    /* Structural edits: each checks everything first, so it either succeeds or leaves the tree alone */

    tree_msg tree::insert(const path& parent, const std::size_t position, std::optional<std::string> key, node n)
    {
        if (n.is_documents())
            return tree_msg::invalid_value;

        const auto target{ read(parent) };

        if (not target.has_value())
            return tree_msg::not_found;

        const node& container{ target->get() };

        if (not container.is_container())
            return tree_msg::not_container;
        else if (container.is_mapping() and not key.has_value())
            return tree_msg::key_required;
        else if (not container.is_mapping() and key.has_value())
            return tree_msg::key_not_allowed;
        else if (position > container.child_count())
            return tree_msg::out_of_range;

        auto offset{ static_cast<std::ptrdiff_t>(position) };
        value& v{ read_write(parent)->get().get_mutable() };

        if (auto* m{ std::get_if<mapping>(&v) }; m != nullptr)
            m->insert(std::next(m->begin(), offset), mapping_entry{ .key = std::move(*key), .child = std::move(n) });
        else if (auto* s{ std::get_if<sequence>(&v) }; s != nullptr)
            s->insert(std::next(s->begin(), offset), std::move(n));
        else
            std::get<documents>(v).items.insert(std::next(std::get<documents>(v).items.begin(), offset), std::move(n));

        return tree_msg::none;
    }

    tree_msg tree::remove(const path& p)
    {
        if (is_root_path(p))
            return tree_msg::cannot_delete_root;

        if (const auto msg{ check_entry(p) }; msg != tree_msg::none)
            return msg;

        const auto offset{ static_cast<std::ptrdiff_t>(last_index_of(p)) };
        value& v{ read_write(parent_path_of(p))->get().get_mutable() };

        if (auto* m{ std::get_if<mapping>(&v) }; m != nullptr)
            m->erase(std::next(m->begin(), offset));
        else if (auto* s{ std::get_if<sequence>(&v) }; s != nullptr)
            s->erase(std::next(s->begin(), offset));
        else
            std::get<documents>(v).items.erase(std::next(std::get<documents>(v).items.begin(), offset));

        return tree_msg::none;
    }

    /* the replacement takes over the presentation style of a string it replaces */
    tree_msg tree::replace_scalar(const path& p, value v)
    {
        if (is_container(v))
            return tree_msg::not_scalar;

        const auto target{ read(p) };

        if (not target.has_value())
            return tree_msg::not_found;
        else if (not target->get().is_scalar())
            return tree_msg::not_scalar;

        const auto* old_string{ std::get_if<string_value>(&target->get().get()) };
        auto* new_string{ std::get_if<string_value>(&v) };

        if (old_string != nullptr and new_string != nullptr)
            new_string->style = old_string->style;

        read_write(p)->get().get_mutable() = std::move(v);
        return tree_msg::none;
    }

    tree_msg tree::rename_key(const path& p, std::string key)
    {
        if (is_root_path(p))
            return tree_msg::not_mapping_entry;

        if (const auto msg{ check_entry(p) }; msg != tree_msg::none)
            return msg;

        if (not read(parent_path_of(p))->get().is_mapping())
            return tree_msg::not_mapping_entry;

        auto& entries{ std::get<mapping>(read_write(parent_path_of(p))->get().get_mutable()) };
        entries[last_index_of(p)].key = std::move(key);
        return tree_msg::none;
    }

    tree tree::duplicate() const
    {
        return tree{ root_, source_ };
    }


    /* Queries */

    std::optional<std::string> tree::key_of(const path& p) const
    {
        if (is_root_path(p))
            return std::nullopt;

        const auto parent{ read(parent_path_of(p)) };

        if (not parent.has_value())
            return std::nullopt;

        const auto* entries{ std::get_if<mapping>(&parent->get().get()) };

        if (entries == nullptr or last_index_of(p) >= entries->size())
            return std::nullopt;

        return (*entries)[last_index_of(p)].key;
    }

    std::optional<std::size_t> tree::child_count(const path& p) const
    {
        return read(p).transform([](const node& n) { return n.child_count(); });
    }

    /* walks up from p until a path that resolves is found; the root always does */
    path tree::nearest_existing(const path& p) const
    {
        path result{ p };

        while (not is_root_path(result) and not read(result).has_value())
            result.pop_back();

        return result;
    }

    tree_msg tree::check_entry(const path& p) const
    {
        const auto parent{ read(parent_path_of(p)) };

        if (not parent.has_value())
            return tree_msg::not_found;
        else if (not parent->get().is_container())
            return tree_msg::not_container;
        else if (last_index_of(p) >= parent->get().child_count())
            return tree_msg::out_of_range;
        else
            return tree_msg::none;
    }
}
