// core/node.hpp
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
#include <optional>
#include <string>
#include <utility>

#include "value.hpp"

namespace jyed::core
{
    /* byte range [begin, end) of a node's text in the source it was read from */
    struct source_span
    {
        std::size_t     begin{ 0 };
        std::size_t     end{ 0 };

        [[nodiscard]] std::size_t size() const noexcept { return end - begin; }
        bool operator==(const source_span&) const = default;
    };

    /* A value together with its provenance.
     * Nodes are owned by exactly one slot: the root of a tree, a mapping entry or a sequence element. */
    class node
    {
    public:
        node();
        explicit node(value v);
        node(value v, source_span span);

        node(const node&) = default;
        node(node&&) noexcept = default;
        node& operator=(const node&) = default;
        node& operator=(node&&) noexcept = default;
        ~node() = default;

        [[nodiscard]] static node make_null();
        [[nodiscard]] static node make_boolean(bool b);
        [[nodiscard]] static node make_integer(std::int64_t i);
        [[nodiscard]] static node make_floating(double d);
        [[nodiscard]] static node make_string(std::string text, string_style style = string_style::plain);
        [[nodiscard]] static node make_mapping(mapping entries = {});
        [[nodiscard]] static node make_sequence(sequence elements = {});
        [[nodiscard]] static node make_documents(std::vector<node> items = {});
        [[nodiscard]] static node make_alias(std::string anchor);

        [[nodiscard]] const value& get() const noexcept;
        [[nodiscard]] value& get_mutable() noexcept;        /* marks the node as modified */

        [[nodiscard]] bool modified() const noexcept;
        void mark_modified() noexcept;
        void clear_modified() noexcept;                     /* recursive */

        [[nodiscard]] const std::optional<source_span>& span() const noexcept;

        [[nodiscard]] value_type type() const noexcept;
        [[nodiscard]] bool is_container() const noexcept;
        [[nodiscard]] bool is_mapping() const noexcept;
        [[nodiscard]] bool is_sequence() const noexcept;
        [[nodiscard]] bool is_documents() const noexcept;
        [[nodiscard]] bool is_scalar() const noexcept;
        [[nodiscard]] std::size_t child_count() const noexcept;

        /* the nth child of a container, or nullptr if there is none */
        [[nodiscard]] const node* child(std::size_t n) const noexcept;
        [[nodiscard]] node* child(std::size_t n) noexcept;

    private:
        value                           value_;
        std::optional<source_span>      span_;
        bool                            modified_{ true };  /* nodes not created by a reader count as modified */
    };

    struct mapping_entry
    {
        std::string     key;
        node            child;
    };

    [[nodiscard]] bool equal_content(const node& lhs, const node& rhs);

    /* total number of nodes in the subtree rooted at n (including n) */
    [[nodiscard]] std::size_t subtree_size(const node& n) noexcept;


    /* Inline function implementations */

    inline node::node() :
            value_{ null_value{} }
    {
    }

    inline node::node(value v) :
            value_{ std::move(v) }
    {
    }

    inline node::node(value v, const source_span span) :
            value_{ std::move(v) }, span_{ span }, modified_{ false }
    {
    }

    inline const value& node::get() const noexcept
    {
        return value_;
    }

    inline value& node::get_mutable() noexcept
    {
        modified_ = true;
        return value_;
    }

    inline bool node::modified() const noexcept
    {
        return modified_;
    }

    inline void node::mark_modified() noexcept
    {
        modified_ = true;
    }

    inline const std::optional<source_span>& node::span() const noexcept
    {
        return span_;
    }

    inline value_type node::type() const noexcept
    {
        return type_of(value_);
    }

    inline bool node::is_container() const noexcept
    {
        return core::is_container(value_);
    }

    inline bool node::is_mapping() const noexcept
    {
        return core::is_mapping(value_);
    }

    inline bool node::is_sequence() const noexcept
    {
        return core::is_sequence(value_);
    }

    inline bool node::is_documents() const noexcept
    {
        return core::is_documents(value_);
    }

    inline bool node::is_scalar() const noexcept
    {
        return core::is_scalar(value_);
    }

    inline std::size_t node::child_count() const noexcept
    {
        return entry_count(value_);
    }
}
