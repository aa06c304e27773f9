// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#pragma once

#include <inbox/core/assert.h>
#include <inbox/core/config.hpp>

#include <deque>
#include <utility>

INBOX_NAMESPACE_BEGIN

// Copy-on-write history of a value across nested checkpoints. Each entry is
// tagged with the checkpoint version that produced it; the top entry is the
// value visible at the current version.
template <class T>
class VersionStack
{
    std::deque<std::pair<unsigned, T>> stack_{};

public:
    VersionStack(T value, unsigned version = 0)
    {
        stack_.emplace_back(version, std::move(value));
    }

    VersionStack(VersionStack &&) = default;
    VersionStack(VersionStack const &) = delete;
    VersionStack &operator=(VersionStack &&) = default;
    VersionStack &operator=(VersionStack const &) = delete;

    // checkpoint version of the visible entry
    unsigned version() const
    {
        INBOX_ASSERT(stack_.size());

        return stack_.back().first;
    }

    T const &recent() const
    {
        INBOX_ASSERT(stack_.size());

        return stack_.back().second;
    }

    T &current(unsigned const version)
    {
        INBOX_ASSERT(stack_.size());

        if (version > stack_.back().first) {
            T value = stack_.back().second;
            stack_.emplace_back(version, std::move(value));
        }

        return stack_.back().second;
    }

    // Folds the entry for `version` into its parent checkpoint.
    void pop_accept(unsigned const version)
    {
        INBOX_ASSERT(version);

        auto const size = stack_.size();
        INBOX_ASSERT(size);

        if (version == stack_.back().first) {
            if (size > 1 &&
                stack_[size - 2].first + 1 == stack_[size - 1].first) {
                stack_[size - 2].second = std::move(stack_[size - 1].second);
                stack_.pop_back();
            }
            else {
                stack_.back().first = version - 1;
            }
        }
    }

    // Discards the entry for `version`. Returns true when nothing is left,
    // i.e. the value did not exist before the checkpoint.
    bool pop_reject(unsigned const version)
    {
        INBOX_ASSERT(version);

        auto const size = stack_.size();
        INBOX_ASSERT(size);

        if (version == stack_.back().first) {
            stack_.pop_back();
        }

        return stack_.empty();
    }
};

INBOX_NAMESPACE_END
