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

#include <vault/core/address.hpp>
#include <vault/core/bytes.hpp>
#include <vault/core/config.hpp>
#include <vault/core/int.hpp>
#include <vault/state/log.hpp>
#include <vault/state/version_stack.hpp>

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <vector>

VAULT_NAMESPACE_BEGIN

// In-memory ledger the host applies operations against. Every write lands in
// the innermost open version; pop_reject() discards everything written since
// the matching push(), pop_accept() folds it into the enclosing version.
class State
{
public:
    struct StorageKey
    {
        Address address;
        bytes32_t key;

        friend bool operator==(StorageKey const &, StorageKey const &) = default;
    };

    static_assert(std::has_unique_object_representations_v<StorageKey>);

    struct BalanceKey
    {
        Address asset;
        Address account;

        friend bool operator==(BalanceKey const &, BalanceKey const &) = default;
    };

    static_assert(std::has_unique_object_representations_v<BalanceKey>);

    template <typename K>
    struct KeyHash
    {
        using is_avalanching = void;

        uint64_t operator()(K const &k) const noexcept
        {
            return ankerl::unordered_dense::detail::wyhash::hash(&k, sizeof(K));
        }
    };

private:
    template <typename K, typename V>
    using Map = ankerl::unordered_dense::segmented_map<K, V, KeyHash<K>>;

    // Keys whose VersionStack gained an entry for one open version, and the
    // length of the log when that version was pushed. Popping a version walks
    // only its own journal.
    struct Journal
    {
        std::vector<StorageKey> storage;
        std::vector<BalanceKey> balances;
        size_t log_size;
    };

    Map<StorageKey, VersionStack<bytes32_t>> storage_{};

    Map<BalanceKey, VersionStack<uint256_t>> balances_{};

    std::vector<Log> logs_{};

    std::vector<Journal> journal_{};

    unsigned version_{0};

    template <typename K, typename V>
    V &current(Map<K, VersionStack<V>> &, std::vector<K> Journal::*, K const &);

    template <typename K, typename V>
    void accept(Map<K, VersionStack<V>> &, std::vector<K> Journal::*);

    template <typename K, typename V>
    void reject(Map<K, VersionStack<V>> &, std::vector<K> Journal::*);

public:
    State() = default;

    State(State &&) = delete;
    State(State const &) = delete;
    State &operator=(State &&) = delete;
    State &operator=(State const &) = delete;

    unsigned version() const;

    void push();

    void pop_accept();

    void pop_reject();

    ////////////////////////////////////////

    bytes32_t get_storage(Address const &, bytes32_t const &key) const;

    void set_storage(
        Address const &, bytes32_t const &key, bytes32_t const &value);

    ////////////////////////////////////////

    uint256_t get_balance(Address const &asset, Address const &account) const;

    void add_to_balance(
        Address const &asset, Address const &account, uint256_t const &delta);

    void subtract_from_balance(
        Address const &asset, Address const &account, uint256_t const &delta);

    ////////////////////////////////////////

    std::vector<Log> const &logs() const;

    void store_log(Log const &);
};

VAULT_NAMESPACE_END
