// core/tree.hpp
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

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "node.hpp"
#include "path.hpp"

namespace jyed::core
{
    /* Outcome of a structural edit. Anything other than none means the tree was left unchanged. */
    enum class tree_msg : std::int8_t
    {
        none = 0,
        not_found,              /* path (or the parent of path) does not resolve */
        not_container,          /* parent path resolves to a scalar */
        out_of_range,           /* position past the end of the parent */
        cannot_delete_root,
        key_required,           /* insert into a mapping without a key */
        key_not_allowed,        /* insert into a sequence with a key */
        not_scalar,             /* replace_scalar on a container, or with a container */
        invalid_value,          /* documents value below the root */
        not_mapping_entry       /* rename_key on something that is not a mapping entry */
    };

    [[nodiscard]] std::string_view msg_text(tree_msg msg) noexcept;

    /* A document: one root node, addressed by paths. */
    class tree
    {
    public:
        using optional_ref = std::optional<std::reference_wrapper<node>>;
        using optional_const_ref = std::optional<std::reference_wrapper<const node>>;
        using source_ptr = std::shared_ptr<const std::string>;

        tree();
        explicit tree(node root, source_ptr source = nullptr);

        tree(const tree&) = delete;
        tree(tree&&) noexcept = default;
        tree& operator=(const tree&) = delete;
        tree& operator=(tree&&) noexcept = default;
        ~tree() = default;

        [[nodiscard]] static tree make_empty();

        [[nodiscard]] const node& root() const noexcept;
        [[nodiscard]] const std::string* source() const noexcept;

        [[nodiscard]] optional_const_ref read(const path_like auto& p) const;
        [[nodiscard]] optional_ref read_write(const path_like auto& p);

        [[nodiscard]] tree_msg insert(const path& parent, std::size_t position, std::optional<std::string> key, node n);
        [[nodiscard]] tree_msg remove(const path& p);
        [[nodiscard]] tree_msg replace_scalar(const path& p, value v);
        [[nodiscard]] tree_msg rename_key(const path& p, std::string key);

        [[nodiscard]] tree duplicate() const;

        [[nodiscard]] std::optional<std::string> key_of(const path& p) const;
        [[nodiscard]] std::optional<std::size_t> child_count(const path& p) const;
        [[nodiscard]] path nearest_existing(const path& p) const;
        [[nodiscard]] std::size_t node_count() const noexcept;

    private:
        /* checks that parent resolves to a container with an entry at index, without marking anything */
        [[nodiscard]] tree_msg check_entry(const path& p) const;

        node            root_;
        source_ptr      source_;    /* text the tree was read from (immutable, may be shared between copies) */
    };

    [[nodiscard]] bool equal_content(const tree& lhs, const tree& rhs);


    /* Inline function implementations */

    inline tree::tree() :
            root_{ node::make_mapping() }
    {
    }

    inline tree::tree(node root, source_ptr source) :
            root_{ std::move(root) }, source_{ std::move(source) }
    {
    }

    inline tree tree::make_empty()
    {
        return tree{};
    }

    inline const node& tree::root() const noexcept
    {
        return root_;
    }

    inline const std::string* tree::source() const noexcept
    {
        return source_.get();
    }

    inline std::size_t tree::node_count() const noexcept
    {
        return subtree_size(root_);
    }

    inline tree::optional_const_ref tree::read(const path_like auto& p) const
    {
        const node* current{ &root_ };

        for (const auto& index : p)
        {
            current = current->child(index);

            if (current == nullptr)
                return std::nullopt;
        }
        return { *current };
    }

    /* marks the target and every container enclosing it as modified */
    inline tree::optional_ref tree::read_write(const path_like auto& p)
    {
        if (not read(p).has_value())
            return std::nullopt;

        node* current{ &root_ };
        current->mark_modified();

        for (const auto& index : p)
        {
            current = current->child(index);
            current->mark_modified();
        }
        return { *current };
    }

    inline bool equal_content(const tree& lhs, const tree& rhs)
    {
        return equal_content(lhs.root(), rhs.root());
    }
}
