/*
 * File: slab/typed_slab.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <utility>

#include "tslab/keys/concepts.hpp"
#include "tslab/slab/raw_slab.hpp"

namespace tslab::slab {

    // Slab whose slots are addressed by a caller supplied key type instead of
    // raw indices. Every key is converted exactly once at the boundary; the raw
    // index API of the underlying storage is not reachable from here.
    //
    // There are no generation counters: a key kept after its value was removed
    // may later address an unrelated value that reused the slot.
    //
    // Stats-enabled slabs count failed lookups on const reads as well; share
    // them between readers only with external synchronization.
    template <keys::SlabKey K, typename V, SlabStats StatsT = null_stats>
    class typed_slab {
    public:

        using key_type = K;
        using value_type = V;
        using stats_type = StatsT;
        using key_traits_type = keys::key_traits<K>;
        using storage_type = raw_slab<V, StatsT>;

        using iterator = typename storage_type::template key_iterator<K>;
        using const_iterator = typename storage_type::template const_key_iterator<K>;
        using range = typename storage_type::template key_range<K>;
        using const_range = typename storage_type::template const_key_range<K>;
        using value_range = typename storage_type::value_range;
        using const_value_range = typename storage_type::const_value_range;
        using drain_type = typename storage_type::drain_type;

        typed_slab() = default;

        static typed_slab with_capacity(std::size_t capacity) {
            typed_slab res;
            res.storage_ = storage_type::with_capacity(capacity);
            return res;
        }

        K insert(V value) {
            return emplace_entry(std::move(value)).first;
        }

        template <typename... Args>
        K emplace(Args&&... args) {
            return emplace_entry(std::forward<Args>(args)...).first;
        }

        // Key and a reference to the stored value; the reference lives until
        // the next insert/remove/drain.
        std::pair<K, V&> insert_entry(V value) {
            return emplace_entry(std::move(value));
        }

        template <typename... Args>
        std::pair<K, V&> emplace_entry(Args&&... args) {
            check_key_space();
            auto [idx, value] = storage_.emplace_entry(std::forward<Args>(args)...);
            return { key_traits_type::from_index(idx), value };
        }

        std::optional<V> remove(const K& key) {
            return storage_.remove(key_traits_type::to_index(key));
        }

        const V* get(const K& key) const {
            return storage_.get(key_traits_type::to_index(key));
        }

        V* get_mut(const K& key) {
            return storage_.get_mut(key_traits_type::to_index(key));
        }

        const V& at(const K& key) const {
            return storage_.at(key_traits_type::to_index(key));
        }

        V& at(const K& key) {
            return storage_.at(key_traits_type::to_index(key));
        }

        const V& operator [] (const K& key) const {
            return storage_[key_traits_type::to_index(key)];
        }

        V& operator [] (const K& key) {
            return storage_[key_traits_type::to_index(key)];
        }

        bool contains(const K& key) const {
            return storage_.contains(key_traits_type::to_index(key));
        }

        std::size_t len() const noexcept {
            return storage_.len();
        }

        bool is_empty() const noexcept {
            return storage_.is_empty();
        }

        std::size_t size() const noexcept {
            return storage_.size();
        }

        bool empty() const noexcept {
            return storage_.empty();
        }

        std::size_t capacity() const noexcept {
            return storage_.capacity();
        }

        void reserve(std::size_t additional) {
            storage_.reserve(additional);
        }

        void clear() noexcept {
            storage_.clear();
        }

        K vacant_key() const {
            check_key_space();
            return key_traits_type::from_index(storage_.vacant_index());
        }

        const_range iter() const {
            return storage_.template iter<K>();
        }

        range iter_mut() {
            return storage_.template iter_mut<K>();
        }

        const_value_range values() const {
            return storage_.values();
        }

        value_range values_mut() {
            return storage_.values_mut();
        }

        drain_type drain() {
            return storage_.drain();
        }

        const_iterator begin() const {
            return iter().begin();
        }

        const_iterator end() const {
            return iter().end();
        }

        iterator begin() {
            return iter_mut().begin();
        }

        iterator end() {
            return iter_mut().end();
        }

        const stats_type& get_stats() const noexcept {
            return storage_.get_stats();
        }

        stats_type& get_stats() noexcept {
            return storage_.get_stats();
        }

    private:

        void check_key_space() const {
            if (storage_.vacant_index() > key_traits_type::max_index) {
                throw std::length_error("typed_slab: key space exhausted");
            }
        }

        storage_type storage_;
    };

} // namespace tslab::slab
