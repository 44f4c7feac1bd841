/*
 * File: keys/concepts.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <type_traits>

namespace tslab::keys {

    namespace detail {
        template <typename K>
        consteval std::size_t default_max_index() {
            if constexpr (std::integral<K>) {
                using unsigned_type = std::make_unsigned_t<K>;
                constexpr auto kmax = static_cast<unsigned_type>(std::numeric_limits<K>::max());
                if constexpr (sizeof(unsigned_type) < sizeof(std::size_t)) {
                    return static_cast<std::size_t>(kmax);
                }
                else {
                    return std::numeric_limits<std::size_t>::max() < kmax
                        ? std::numeric_limits<std::size_t>::max()
                        : static_cast<std::size_t>(kmax);
                }
            }
            else {
                return std::numeric_limits<std::size_t>::max();
            }
        }
    }

    // Conversion between a caller key type and a raw slot index.
    // Specialize it for key types that don't convert on their own.
    template <typename K>
    struct key_traits {};

    template <typename K>
        requires (!std::same_as<K, bool>) && (!std::floating_point<K>)
              && std::constructible_from<K, std::size_t>
              && requires(const K& k) { static_cast<std::size_t>(k); }
    struct key_traits<K> {

        // largest raw index the key can carry without loss
        constexpr static const std::size_t max_index = detail::default_max_index<K>();

        static constexpr K from_index(std::size_t idx) {
            return K(idx);
        }

        static constexpr std::size_t to_index(const K& key) {
            return static_cast<std::size_t>(key);
        }
    };

    template <typename K>
    concept SlabKey = std::copyable<K> && requires(const K& key, std::size_t idx) {
        { key_traits<K>::from_index(idx) } -> std::same_as<K>;
        { key_traits<K>::to_index(key) } -> std::convertible_to<std::size_t>;
        { key_traits<K>::max_index } -> std::convertible_to<std::size_t>;
    };

    static_assert(SlabKey<std::size_t>);
    static_assert(SlabKey<std::uint16_t>);
    static_assert(!SlabKey<bool>);

} // namespace tslab::keys
