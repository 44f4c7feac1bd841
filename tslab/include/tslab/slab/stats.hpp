/*
 * File: slab/stats.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <concepts>
#include <cstdint>

namespace tslab::slab {

    struct stats {
        std::uint64_t inserts = 0, removes = 0;
        std::uint64_t reused_slots = 0, appended_slots = 0;
        std::uint64_t drained = 0, failed_lookups = 0;
        void reset() { *this = {}; }
    };

    template <typename T = std::uint64_t>
    struct null_field {
        // ++x / --x
        constexpr null_field& operator++() noexcept { return *this; }
        constexpr null_field& operator--() noexcept { return *this; }

        // x++ / x--
        constexpr T operator++(int) noexcept { return T{}; }
        constexpr T operator--(int) noexcept { return T{}; }

        constexpr null_field& operator+=(T) noexcept { return *this; }
        constexpr null_field& operator-=(T) noexcept { return *this; }

        constexpr null_field& operator=(T) noexcept { return *this; }

        // always reads as zero
        constexpr operator T() const noexcept { return T{}; }
    };

    struct null_stats {
        null_field<> inserts, removes;
        null_field<> reused_slots, appended_slots;
        null_field<> drained, failed_lookups;
        void reset() {}
    };

    template <typename T>
    concept SlabStats = std::default_initializable<T> && requires(T s) {
        ++s.inserts;
        ++s.removes;
        ++s.reused_slots;
        ++s.appended_slots;
        ++s.drained;
        ++s.failed_lookups;
        { s.reset() } -> std::same_as<void>;
    };

    static_assert(SlabStats<stats>);
    static_assert(SlabStats<null_stats>);

} // namespace tslab::slab
