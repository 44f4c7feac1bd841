/*
 * File: slab/iterator.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <cstddef>
#include <functional>
#include <iterator>
#include <ranges>
#include <span>
#include <type_traits>
#include <utility>

#include "tslab/core/assert.hpp"
#include "tslab/keys/concepts.hpp"
#include "tslab/slab/slot.hpp"

namespace tslab::slab {

    // (index, value) -> (key, value)
    template <keys::SlabKey K>
    struct key_value_projection {
        template <typename V>
        std::pair<K, V&> operator()(std::size_t idx, V& value) const {
            return { keys::key_traits<K>::from_index(idx), value };
        }
    };

    // (index, value) -> value
    struct value_projection {
        template <typename V>
        V& operator()(std::size_t, V& value) const noexcept {
            return value;
        }
    };

    // Walks the occupied slots of a slot array in both directions.
    // Holds a view of the array; any insert or remove invalidates it.
    template <typename SlotT, typename ProjT>
    class slot_iterator {

        constexpr static bool is_const = std::is_const_v<SlotT>;

        using slot_value_type = std::conditional_t<
            is_const,
            const typename std::remove_const_t<SlotT>::value_type,
            typename std::remove_const_t<SlotT>::value_type
        >;

    public:
        using reference = std::invoke_result_t<const ProjT&, std::size_t, slot_value_type&>;
        using value_type = std::remove_cvref_t<reference>;
        using difference_type = std::ptrdiff_t;
        using iterator_concept = std::bidirectional_iterator_tag;
        using iterator_category = std::conditional_t<
            std::is_reference_v<reference>,
            std::bidirectional_iterator_tag,
            std::input_iterator_tag
        >;

        slot_iterator() = default;

        slot_iterator(std::span<SlotT> slots, std::size_t pos)
            : slots_(slots)
            , pos_(pos)
        {}

        static slot_iterator first(std::span<SlotT> slots) {
            slot_iterator res{ slots, 0 };
            res.skip_vacant_forward();
            return res;
        }

        static slot_iterator last(std::span<SlotT> slots) {
            return { slots, slots.size() };
        }

        reference operator*() const {
            TSLAB_ASSERT(pos_ < slots_.size() && slots_[pos_].is_occupied(), "dereferencing a vacant position");
            return ProjT{}(pos_, *slots_[pos_].value_ptr());
        }

        slot_iterator& operator++() {
            ++pos_;
            skip_vacant_forward();
            return *this;
        }

        slot_iterator operator++(int) {
            auto tmp = *this;
            ++(*this);
            return tmp;
        }

        slot_iterator& operator--() {
            do {
                TSLAB_ASSERT(pos_ > 0, "decrementing past the first occupied slot");
                --pos_;
            } while (!slots_[pos_].is_occupied());
            return *this;
        }

        slot_iterator operator--(int) {
            auto tmp = *this;
            --(*this);
            return tmp;
        }

        std::size_t index() const noexcept {
            return pos_;
        }

        friend bool operator == (const slot_iterator& a, const slot_iterator& b) noexcept {
            return a.pos_ == b.pos_;
        }

    private:

        void skip_vacant_forward() noexcept {
            while (pos_ < slots_.size() && !slots_[pos_].is_occupied()) {
                ++pos_;
            }
        }

        std::span<SlotT> slots_{};
        std::size_t pos_ = 0;
    };

    template <typename IterT>
    class slot_range : public std::ranges::view_interface<slot_range<IterT>> {
    public:
        using iterator = IterT;
        using reverse_iterator = std::reverse_iterator<IterT>;

        slot_range() = default;

        slot_range(iterator b, iterator e)
            : begin_(std::move(b))
            , end_(std::move(e))
        {}

        iterator begin() const {
            return begin_;
        }

        iterator end() const {
            return end_;
        }

        reverse_iterator rbegin() const {
            return reverse_iterator{ end_ };
        }

        reverse_iterator rend() const {
            return reverse_iterator{ begin_ };
        }

    private:
        iterator begin_{};
        iterator end_{};
    };

    template <typename SlotT, typename ProjT>
    slot_range<slot_iterator<SlotT, ProjT>> make_slot_range(std::span<SlotT> slots) {
        using iterator = slot_iterator<SlotT, ProjT>;
        return { iterator::first(slots), iterator::last(slots) };
    }

} // namespace tslab::slab
