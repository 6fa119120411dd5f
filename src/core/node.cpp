// core/node.cpp
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


#include "node.hpp"

#include <stack>

namespace jyed::core
{
    /* Factories, one per value alternative */

    node node::make_null()
    {
        return node{ value{ null_value{} } };
    }

    node node::make_boolean(const bool b)
    {
        return node{ value{ b } };
    }

    node node::make_integer(const std::int64_t i)
    {
        return node{ value{ i } };
    }

    node node::make_floating(const double d)
    {
        return node{ value{ d } };
    }

    node node::make_string(std::string text, const string_style style)
    {
        return node{ value{ string_value{ .text = std::move(text), .style = style } } };
    }

    node node::make_mapping(mapping entries)
    {
        return node{ value{ std::move(entries) } };
    }

    node node::make_sequence(sequence elements)
    {
        return node{ value{ std::in_place_type<sequence>, std::move(elements) } };
    }

    node node::make_documents(std::vector<node> items)
    {
        return node{ value{ documents{ .items = std::move(items) } } };
    }

    node node::make_alias(std::string anchor)
    {
        return node{ value{ alias_value{ .anchor = std::move(anchor) } } };
    }


    /* Child access */

    const node* node::child(const std::size_t n) const noexcept
    {
        if (const auto* m{ std::get_if<mapping>(&value_) }; m != nullptr)
            return n < m->size() ? &((*m)[n].child) : nullptr;
        else if (const auto* s{ std::get_if<sequence>(&value_) }; s != nullptr)
            return n < s->size() ? &((*s)[n]) : nullptr;
        else if (const auto* d{ std::get_if<documents>(&value_) }; d != nullptr)
            return n < d->items.size() ? &(d->items[n]) : nullptr;
        else
            return nullptr;
    }

    node* node::child(const std::size_t n) noexcept
    {
        return const_cast<node*>(std::as_const(*this).child(n));
    }

    void node::clear_modified() noexcept
    {
        std::stack<node*> pending{};
        pending.push(this);

        while (not pending.empty())
        {
            node* current{ pending.top() };
            pending.pop();
            current->modified_ = false;

            for (std::size_t i{ 0 }; i < current->child_count(); ++i)
                pending.push(current->child(i));
        }
    }


    /* Free functions */

    bool equal_content(const node& lhs, const node& rhs)
    {
        return equal_content(lhs.get(), rhs.get());
    }

    std::size_t subtree_size(const node& n) noexcept
    {
        std::size_t count{ 1 };

        for (std::size_t i{ 0 }; i < n.child_count(); ++i)
            count += subtree_size(*n.child(i));

        return count;
    }
}
