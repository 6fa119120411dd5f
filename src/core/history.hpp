// core/history.hpp
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
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <vector>

#include "path.hpp"
#include "tree.hpp"

namespace jyed::core
{
    /* The whole document and the cursor at one moment */
    struct snapshot
    {
        tree    document;
        path    cursor;
    };

    /* Branching undo history.
     *
     * Every recorded state is a node; checkpoint() adds a child of the current node and moves there,
     * undo() moves to the parent and redo() to the most recently created child. Branches left behind
     * by undo followed by a new checkpoint are kept, until the node count exceeds the capacity: then
     * the oldest nodes off the path from the root to the current node are pruned first, and if that
     * path alone is too long the history is re-rooted at the oldest ancestor that still fits. */
    class history
    {
    public:
        using seq_t = std::uint64_t;
        using clock_t = std::chrono::system_clock;
        using optional_snapshot_ref = std::optional<std::reference_wrapper<const snapshot>>;

        static constexpr std::size_t default_capacity{ 50 };

        explicit history(snapshot initial, std::size_t capacity = default_capacity);

        history(const history&) = delete;
        history(history&&) noexcept = default;
        history& operator=(const history&) = delete;
        history& operator=(history&&) noexcept = default;
        ~history() = default;

        void checkpoint(snapshot state);
        [[nodiscard]] optional_snapshot_ref undo();
        [[nodiscard]] optional_snapshot_ref redo();

        [[nodiscard]] bool can_undo() const;
        [[nodiscard]] bool can_redo() const;

        [[nodiscard]] const snapshot& current() const;
        [[nodiscard]] seq_t current_seq() const noexcept;
        [[nodiscard]] seq_t root_seq() const noexcept;
        [[nodiscard]] std::size_t size() const noexcept;
        [[nodiscard]] std::size_t capacity() const noexcept;

        [[nodiscard]] bool contains(seq_t seq) const;
        [[nodiscard]] optional_snapshot_ref snapshot_of(seq_t seq) const;
        [[nodiscard]] std::optional<seq_t> parent_of(seq_t seq) const;
        [[nodiscard]] std::vector<seq_t> children_of(seq_t seq) const;
        [[nodiscard]] std::optional<clock_t::time_point> timestamp_of(seq_t seq) const;

    private:
        struct history_node
        {
            snapshot                state;
            std::optional<seq_t>    parent;
            std::vector<seq_t>      children;
            clock_t::time_point     timestamp;      /* informational only, ordering uses the map key */
        };

        [[nodiscard]] std::vector<seq_t> path_to_current() const;
        void enforce_capacity();
        void erase_subtree(seq_t top);
        void reroot(seq_t new_root);

        std::map<seq_t, history_node>   nodes_;     /* keyed by sequence number, so iteration runs oldest first */
        seq_t                           current_{ 0 };
        seq_t                           root_{ 0 };
        seq_t                           next_seq_{ 1 };
        std::size_t                     capacity_;
    };


    /* Inline function definitions */

    inline const snapshot& history::current() const
    {
        return nodes_.at(current_).state;
    }

    inline history::seq_t history::current_seq() const noexcept
    {
        return current_;
    }

    inline history::seq_t history::root_seq() const noexcept
    {
        return root_;
    }

    inline std::size_t history::size() const noexcept
    {
        return nodes_.size();
    }

    inline std::size_t history::capacity() const noexcept
    {
        return capacity_;
    }

    inline bool history::contains(const seq_t seq) const
    {
        return nodes_.contains(seq);
    }

    inline bool history::can_undo() const
    {
        return nodes_.at(current_).parent.has_value();
    }

    inline bool history::can_redo() const
    {
        return not nodes_.at(current_).children.empty();
    }
}
