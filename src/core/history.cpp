// core/history.cpp
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


#include "history.hpp"

#include <algorithm>
#include <ranges>
#include <stack>
#include <stdexcept>
#include <utility>

#include "log.hpp"

namespace jyed::core
{
    history::history(snapshot initial, const std::size_t capacity) :
            capacity_{ std::max(capacity, 1uz) }
    {
        nodes_.emplace(root_, history_node{ .state = std::move(initial),
                                            .parent = std::nullopt,
                                            .children = {},
                                            .timestamp = clock_t::now() });
    }

    void history::checkpoint(snapshot state)
    {
        const seq_t seq{ next_seq_++ };

        nodes_.emplace(seq, history_node{ .state = std::move(state),
                                          .parent = current_,
                                          .children = {},
                                          .timestamp = clock_t::now() });
        nodes_.at(current_).children.push_back(seq);
        current_ = seq;

        enforce_capacity();
    }

    history::optional_snapshot_ref history::undo()
    {
        const auto& parent{ nodes_.at(current_).parent };

        if (not parent.has_value())
            return std::nullopt;

        current_ = *parent;
        return { nodes_.at(current_).state };
    }

    history::optional_snapshot_ref history::redo()
    {
        const auto& children{ nodes_.at(current_).children };

        if (children.empty())
            return std::nullopt;

        /* the newest branch, not necessarily the last one in the list */
        current_ = std::ranges::max(children);
        return { nodes_.at(current_).state };
    }


    /* Inspection */

    history::optional_snapshot_ref history::snapshot_of(const seq_t seq) const
    {
        if (const auto it{ nodes_.find(seq) }; it != nodes_.end())
            return { it->second.state };
        else
            return std::nullopt;
    }

    std::optional<history::seq_t> history::parent_of(const seq_t seq) const
    {
        if (const auto it{ nodes_.find(seq) }; it != nodes_.end())
            return it->second.parent;
        else
            return std::nullopt;
    }

    std::vector<history::seq_t> history::children_of(const seq_t seq) const
    {
        if (const auto it{ nodes_.find(seq) }; it != nodes_.end())
            return it->second.children;
        else
            return {};
    }

    std::optional<history::clock_t::time_point> history::timestamp_of(const seq_t seq) const
    {
        if (const auto it{ nodes_.find(seq) }; it != nodes_.end())
            return it->second.timestamp;
        else
            return std::nullopt;
    }


    /* Capacity management */

    /* sequence numbers from the root to the current node, root first */
    std::vector<history::seq_t> history::path_to_current() const
    {
        std::vector<seq_t> result{ current_ };

        for (auto parent{ nodes_.at(current_).parent }; parent.has_value(); parent = nodes_.at(*parent).parent)
            result.push_back(*parent);

        std::ranges::reverse(result);
        return result;
    }

    void history::enforce_capacity()
    {
        while (nodes_.size() > capacity_)
        {
            const auto kept{ path_to_current() };

            const auto oldest_off_path{ std::ranges::find_if(nodes_, [&](const auto& entry) {
                return std::ranges::find(kept, entry.first) == std::ranges::end(kept);
            }) };

            if (oldest_off_path != nodes_.end())
            {
                const seq_t pruned{ oldest_off_path->first };
                const auto before{ nodes_.size() };
                erase_subtree(pruned);
                log::debug("history: pruned branch at #{} ({} nodes)", pruned, before - nodes_.size());
            }
            else
            {
                /* every stored node lies on the current path */
                const seq_t new_root{ kept[kept.size() - capacity_] };
                log::debug("history: re-rooted from #{} to #{}", root_, new_root);
                reroot(new_root);
            }
        }
    }

    void history::erase_subtree(const seq_t top)
    {
        if (top == root_)
            throw std::runtime_error("history: attempt to erase the root");

        auto& siblings{ nodes_.at(*nodes_.at(top).parent).children };
        std::erase(siblings, top);

        std::stack<seq_t> pending{};
        pending.push(top);

        while (not pending.empty())
        {
            const seq_t seq{ pending.top() };
            pending.pop();

            for (const auto child : nodes_.at(seq).children)
                pending.push(child);

            nodes_.erase(seq);
        }
    }

    /* drops every ancestor of new_root; only called when all of them lie on the current path */
    void history::reroot(const seq_t new_root)
    {
        for (auto ancestor{ nodes_.at(new_root).parent }; ancestor.has_value();)
        {
            const auto next{ nodes_.at(*ancestor).parent };
            nodes_.erase(*ancestor);
            ancestor = next;
        }

        nodes_.at(new_root).parent.reset();
        root_ = new_root;
    }
}
