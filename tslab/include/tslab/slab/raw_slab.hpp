/*
 * File: slab/raw_slab.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

#include "tslab/core/debug.hpp"
#include "tslab/slab/slot.hpp"
#include "tslab/slab/stats.hpp"
#include "tslab/slab/iterator.hpp"
#include "tslab/slab/drain.hpp"

namespace tslab::slab {

    // Dense array of slots addressed by raw index.
    // Vacant slots form a singly linked free list starting at free_head_;
    // inserts pop the list before they append. Capacity is never given back.
    //
    // With a counting StatsT, failed lookups are recorded even by const get and
    // at, so concurrent readers of such a slab race on stats_. Only null_stats
    // slabs are safe for shared readers.
    template <typename V, SlabStats StatsT = null_stats>
    class raw_slab {
    public:

        using value_type = V;
        using stats_type = StatsT;
        using slot_type = slot<V>;
        using slot_container = std::vector<slot_type>;

        template <keys::SlabKey K>
        using key_iterator = slot_iterator<slot_type, key_value_projection<K>>;
        template <keys::SlabKey K>
        using const_key_iterator = slot_iterator<const slot_type, key_value_projection<K>>;

        using value_iterator = slot_iterator<slot_type, value_projection>;
        using const_value_iterator = slot_iterator<const slot_type, value_projection>;

        template <keys::SlabKey K>
        using key_range = slot_range<key_iterator<K>>;
        template <keys::SlabKey K>
        using const_key_range = slot_range<const_key_iterator<K>>;

        using value_range = slot_range<value_iterator>;
        using const_value_range = slot_range<const_value_iterator>;

        using drain_type = drain_range<raw_slab>;

        raw_slab() = default;

        static raw_slab with_capacity(std::size_t capacity) {
            raw_slab res;
            res.slots_.reserve(capacity);
            return res;
        }

        std::size_t insert(V value) {
            return emplace_entry(std::move(value)).first;
        }

        template <typename... Args>
        std::size_t emplace(Args&&... args) {
            return emplace_entry(std::forward<Args>(args)...).first;
        }

        std::pair<std::size_t, V&> insert_entry(V value) {
            return emplace_entry(std::move(value));
        }

        template <typename... Args>
        std::pair<std::size_t, V&> emplace_entry(Args&&... args) {
            std::size_t idx = free_head_;
            if (idx != npos) {
                // value is built before the slot is touched and occupy restores
                // the link on a throwing move, so free_head_ stays valid
                V value = V(std::forward<Args>(args)...);
                auto& target = slots_[idx];
                const auto next = target.next_free();
                target.occupy(std::move(value));
                free_head_ = next;
                ++stats_.reused_slots;
            }
            else {
                slots_.emplace_back(std::in_place, std::forward<Args>(args)...);
                idx = slots_.size() - 1;
                ++stats_.appended_slots;
            }
            ++len_;
            ++stats_.inserts;
            return { idx, *slots_[idx].value_ptr() };
        }

        std::optional<V> remove(std::size_t idx) {
            if (!contains(idx)) {
                ++stats_.failed_lookups;
                return std::nullopt;
            }
            ++stats_.removes;
            return { release(idx) };
        }

        V take(std::size_t idx) {
            if (!contains(idx)) {
                ++stats_.failed_lookups;
                throw std::out_of_range("raw_slab::take: slot is vacant");
            }
            ++stats_.removes;
            return release(idx);
        }

        const V* get(std::size_t idx) const noexcept {
            if (idx < slots_.size()) {
                if (auto value = slots_[idx].value_ptr()) {
                    return value;
                }
            }
            ++stats_.failed_lookups;
            return nullptr;
        }

        V* get_mut(std::size_t idx) noexcept {
            if (idx < slots_.size()) {
                if (auto value = slots_[idx].value_ptr()) {
                    return value;
                }
            }
            ++stats_.failed_lookups;
            return nullptr;
        }

        const V& at(std::size_t idx) const {
            if (auto value = get(idx)) {
                return *value;
            }
            throw std::out_of_range("raw_slab::at: slot is vacant");
        }

        V& at(std::size_t idx) {
            if (auto value = get_mut(idx)) {
                return *value;
            }
            throw std::out_of_range("raw_slab::at: slot is vacant");
        }

        const V& operator [] (std::size_t idx) const {
            TSLAB_ASSERT(contains(idx), "invalid slab index");
            return *slots_[idx].value_ptr();
        }

        V& operator [] (std::size_t idx) {
            TSLAB_ASSERT(contains(idx), "invalid slab index");
            return *slots_[idx].value_ptr();
        }

        bool contains(std::size_t idx) const noexcept {
            return idx < slots_.size() && slots_[idx].is_occupied();
        }

        std::size_t len() const noexcept {
            return len_;
        }

        bool is_empty() const noexcept {
            return len_ == 0;
        }

        std::size_t size() const noexcept {
            return len();
        }

        bool empty() const noexcept {
            return is_empty();
        }

        std::size_t capacity() const noexcept {
            return slots_.capacity();
        }

        // Room for at least `additional` more values without reallocation.
        // Vacant slots already count as room.
        void reserve(std::size_t additional) {
            if (capacity() - len_ >= additional) {
                return;
            }
            const auto need = additional - (slots_.size() - len_);
            slots_.reserve(slots_.size() + need);
        }

        void clear() noexcept {
            slots_.clear();
            len_ = 0;
            free_head_ = npos;
        }

        // index the next insert is going to use
        std::size_t vacant_index() const noexcept {
            return free_head_ != npos ? free_head_ : slots_.size();
        }

        template <keys::SlabKey K = std::size_t>
        const_key_range<K> iter() const {
            return make_slot_range<const slot_type, key_value_projection<K>>(std::span<const slot_type>{ slots_ });
        }

        template <keys::SlabKey K = std::size_t>
        key_range<K> iter_mut() {
            return make_slot_range<slot_type, key_value_projection<K>>(std::span<slot_type>{ slots_ });
        }

        const_value_range values() const {
            return make_slot_range<const slot_type, value_projection>(std::span<const slot_type>{ slots_ });
        }

        value_range values_mut() {
            return make_slot_range<slot_type, value_projection>(std::span<slot_type>{ slots_ });
        }

        drain_type drain() {
            if (is_empty()) {
                // only holes left; start over as a fresh slab
                clear();
            }
            return drain_type{ *this };
        }

        const stats_type& get_stats() const noexcept {
            return stats_;
        }

        stats_type& get_stats() noexcept {
            return stats_;
        }

    TSLAB_PRIVATE_TESTABLE:

        friend drain_type;

        V release(std::size_t idx) {
            V value = slots_[idx].release(free_head_);
            free_head_ = idx;
            --len_;
            return value;
        }

        slot_container slots_;
        std::size_t len_ = 0;
        std::size_t free_head_ = npos;
        mutable stats_type stats_{};
    };

} // namespace tslab::slab
