// core/cursor.hpp
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

#include <utility>

#include "path.hpp"
#include "tree.hpp"

namespace jyed::core
{
    /* The selected node, held as a path. Movement functions return false (and leave the cursor where it
     * was) if there is nowhere to go. */
    class cursor
    {
    public:
        [[nodiscard]] const path& get() const noexcept;
        [[nodiscard]] std::size_t depth() const noexcept;

        void set(path p);
        void reset() noexcept;
        void clamp(const tree& t);

        bool to_parent();
        bool to_first_child(const tree& t);
        bool to_next_sibling(const tree& t);
        bool to_prev_sibling();
        bool to_first_sibling();
        bool to_last_sibling(const tree& t);

        /* pre-order movement over every node of the tree, as it is displayed */
        bool to_next(const tree& t);
        bool to_prev(const tree& t);
        bool to_last(const tree& t);

    private:
        path    path_{};
    };


    /* Inline public getters */

    inline const path& cursor::get() const noexcept
    {
        return path_;
    }

    inline std::size_t cursor::depth() const noexcept
    {
        return path_.size();
    }

    inline void cursor::set(path p)
    {
        path_ = std::move(p);
    }

    inline void cursor::reset() noexcept
    {
        path_.clear();
    }

    inline void cursor::clamp(const tree& t)
    {
        path_ = t.nearest_existing(path_);
    }


    /* Inline public member functions to move the cursor */

    inline bool cursor::to_parent()
    {
        if (is_root_path(path_))
            return false;

        path_.pop_back();
        return true;
    }

    inline bool cursor::to_first_child(const tree& t)
    {
        if (t.child_count(path_).value_or(0) == 0)
            return false;

        path_.push_back(0);
        return true;
    }

    inline bool cursor::to_next_sibling(const tree& t)
    {
        if (is_root_path(path_))
            return false;

        const auto count{ t.child_count(make_path_copy_of(parent_path_of(path_))).value_or(0) };

        if (last_index_of(path_) + 1 >= count)
            return false;

        increment_last_index_of(path_);
        return true;
    }

    inline bool cursor::to_prev_sibling()
    {
        if (is_root_path(path_) or last_index_of(path_) == 0)
            return false;

        decrement_last_index_of(path_);
        return true;
    }

    inline bool cursor::to_first_sibling()
    {
        if (is_root_path(path_) or last_index_of(path_) == 0)
            return false;

        set_last_index_of(path_, 0);
        return true;
    }

    inline bool cursor::to_last_sibling(const tree& t)
    {
        if (is_root_path(path_))
            return false;

        const auto count{ t.child_count(make_path_copy_of(parent_path_of(path_))).value_or(0) };

        if (count == 0 or last_index_of(path_) + 1 == count)
            return false;

        set_last_index_of(path_, count - 1);
        return true;
    }

    inline bool cursor::to_next(const tree& t)
    {
        if (to_first_child(t))
            return true;

        path candidate{ path_ };

        while (not is_root_path(candidate))
        {
            const auto count{ t.child_count(make_path_copy_of(parent_path_of(candidate))).value_or(0) };

            if (last_index_of(candidate) + 1 < count)
            {
                increment_last_index_of(candidate);
                path_ = std::move(candidate);
                return true;
            }

            candidate.pop_back();
        }

        return false;
    }

    inline bool cursor::to_prev(const tree& t)
    {
        if (is_root_path(path_))
            return false;

        if (last_index_of(path_) == 0)
            return to_parent();

        decrement_last_index_of(path_);

        /* the previous line is the last descendant of the previous sibling */
        while (t.child_count(path_).value_or(0) > 0)
            path_.push_back(*t.child_count(path_) - 1);

        return true;
    }

    inline bool cursor::to_last(const tree& t)
    {
        const path before{ path_ };

        path_.clear();
        while (t.child_count(path_).value_or(0) > 0)
            path_.push_back(*t.child_count(path_) - 1);

        return path_ != before;
    }
}
