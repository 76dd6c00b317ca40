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

#include <vault/state/state.hpp>

#include <vault/core/assert.h>
#include <vault/core/likely.h>

#include <intx/intx.hpp>

#include <cstddef>
#include <vector>

VAULT_NAMESPACE_BEGIN

template <typename K, typename V>
V &State::current(
    Map<K, VersionStack<V>> &map, std::vector<K> Journal::*const touched,
    K const &key)
{
    auto it = map.find(key);
    if (VAULT_UNLIKELY(it == map.end())) {
        it = map.try_emplace(key, V{}, version_).first;
        if (version_) {
            (journal_.back().*touched).push_back(key);
        }
    }
    else if (it->second.version() < version_) {
        (journal_.back().*touched).push_back(key);
    }
    return it->second.current(version_);
}

template <typename K, typename V>
void State::accept(
    Map<K, VersionStack<V>> &map, std::vector<K> Journal::*const touched)
{
    size_t const depth = journal_.size();
    for (auto const &key : journal_.back().*touched) {
        auto const it = map.find(key);
        VAULT_ASSERT(it != map.end());
        auto const size = it->second.size();
        it->second.pop_accept(version_);
        // relabelled rather than merged: the enclosing version now owns it
        if (depth > 1 && it->second.size() == size) {
            (journal_[depth - 2].*touched).push_back(key);
        }
    }
}

template <typename K, typename V>
void State::reject(
    Map<K, VersionStack<V>> &map, std::vector<K> Journal::*const touched)
{
    for (auto const &key : journal_.back().*touched) {
        auto const it = map.find(key);
        VAULT_ASSERT(it != map.end());
        if (it->second.pop_reject(version_)) {
            map.erase(key);
        }
    }
}

unsigned State::version() const
{
    return version_;
}

void State::push()
{
    journal_.push_back(Journal{.log_size = logs_.size()});
    ++version_;
}

void State::pop_accept()
{
    VAULT_ASSERT(version_);
    VAULT_ASSERT(journal_.size() == version_);

    accept(storage_, &Journal::storage);
    accept(balances_, &Journal::balances);

    journal_.pop_back();
    --version_;
}

void State::pop_reject()
{
    VAULT_ASSERT(version_);
    VAULT_ASSERT(journal_.size() == version_);

    reject(storage_, &Journal::storage);
    reject(balances_, &Journal::balances);

    auto const log_size = static_cast<std::ptrdiff_t>(journal_.back().log_size);
    logs_.erase(logs_.begin() + log_size, logs_.end());

    journal_.pop_back();
    --version_;
}

bytes32_t
State::get_storage(Address const &address, bytes32_t const &key) const
{
    auto const it = storage_.find(StorageKey{address, key});
    if (it == storage_.end()) {
        return {};
    }
    return it->second.recent();
}

void State::set_storage(
    Address const &address, bytes32_t const &key, bytes32_t const &value)
{
    current(storage_, &Journal::storage, StorageKey{address, key}) = value;
}

uint256_t
State::get_balance(Address const &asset, Address const &account) const
{
    auto const it = balances_.find(BalanceKey{asset, account});
    if (it == balances_.end()) {
        return 0;
    }
    return it->second.recent();
}

void State::add_to_balance(
    Address const &asset, Address const &account, uint256_t const &delta)
{
    auto &balance =
        current(balances_, &Journal::balances, BalanceKey{asset, account});
    auto const res = intx::addc(balance, delta);
    VAULT_ASSERT(!res.carry, "balance overflow");
    balance = res.value;
}

void State::subtract_from_balance(
    Address const &asset, Address const &account, uint256_t const &delta)
{
    auto &balance =
        current(balances_, &Journal::balances, BalanceKey{asset, account});
    VAULT_ASSERT(balance >= delta, "balance underflow");
    balance -= delta;
}

std::vector<Log> const &State::logs() const
{
    return logs_;
}

void State::store_log(Log const &log)
{
    logs_.push_back(log);
}

VAULT_NAMESPACE_END
