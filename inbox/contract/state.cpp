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

#include <inbox/contract/state.hpp>
#include <inbox/core/assert.h>

#include <vector>

INBOX_NAMESPACE_BEGIN

bytes32_t
State::get_storage(Address const &address, bytes32_t const &key) const
{
    auto const it = storage_.find(address);
    if (it == storage_.end()) {
        return {};
    }
    auto const it2 = it->second.find(key);
    if (it2 == it->second.end()) {
        return {};
    }
    return it2->second.recent();
}

void State::set_storage(
    Address const &address, bytes32_t const &key, bytes32_t const &value)
{
    unsigned const version = this->version();
    auto &slots = storage_[address];
    auto it = slots.find(key);
    if (it == slots.end()) {
        it = slots.try_emplace(key, bytes32_t{}, version).first;
        if (version) {
            journal_.back().push_back({address, key});
        }
    }
    else if (it->second.version() < version) {
        journal_.back().push_back({address, key});
    }
    it->second.current(version) = value;
}

void State::store_log(Log const &log)
{
    logs_.push_back(log);
}

std::vector<Log> const &State::logs() const
{
    return logs_;
}

size_t State::dirty_slots() const
{
    INBOX_ASSERT(!journal_.empty());

    return journal_.back().size();
}

void State::push()
{
    journal_.emplace_back();
    log_marks_.push_back(logs_.size());
}

void State::pop_accept()
{
    INBOX_ASSERT(!journal_.empty());

    unsigned const version = this->version();
    std::vector<SlotRef> written = std::move(journal_.back());
    journal_.pop_back();
    log_marks_.pop_back();

    for (auto const &slot : written) {
        storage_[slot.address].find(slot.key)->second.pop_accept(version);
    }
    // the parent checkpoint now owns these writes; a slot listed twice pops
    // once since its top entry no longer matches the version
    if (!journal_.empty()) {
        auto &parent = journal_.back();
        parent.insert(parent.end(), written.begin(), written.end());
    }
}

void State::pop_reject()
{
    INBOX_ASSERT(!journal_.empty());

    unsigned const version = this->version();
    for (auto const &slot : journal_.back()) {
        auto &slots = storage_[slot.address];
        auto const it = slots.find(slot.key);
        if (it == slots.end()) {
            continue;
        }
        if (it->second.pop_reject(version)) {
            slots.erase(it);
        }
    }
    journal_.pop_back();

    logs_.resize(log_marks_.back());
    log_marks_.pop_back();
}

INBOX_NAMESPACE_END
