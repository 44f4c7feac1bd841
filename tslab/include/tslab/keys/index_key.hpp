/*
 * File: keys/index_key.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <compare>
#include <concepts>
#include <cstdint>
#include <functional>
#include <limits>

#include "tslab/core/assert.hpp"
#include "tslab/keys/concepts.hpp"

namespace tslab::keys {

    // Strongly typed slot index. Two keys with different tags never convert into
    // each other, so an edge key can't be used to look up a node.
    //   struct node_tag;
    //   using node_key = index_key<node_tag>;
    template <typename Tag, std::unsigned_integral StorageT = std::uint32_t>
    class index_key {
    public:
        using tag_type = Tag;
        using storage_type = StorageT;

        constexpr static const storage_type invalid_value = std::numeric_limits<storage_type>::max();

        constexpr index_key() = default;
        constexpr explicit index_key(storage_type value) noexcept
            : value_(value)
        {}

        constexpr storage_type get() const noexcept {
            return value_;
        }

        constexpr bool is_valid() const noexcept {
            return value_ != invalid_value;
        }

        constexpr auto operator <=> (const index_key&) const noexcept = default;

    private:
        storage_type value_ = invalid_value;
    };

    template <typename Tag, std::unsigned_integral StorageT>
    struct key_traits<index_key<Tag, StorageT>> {
        using key_type = index_key<Tag, StorageT>;

        // the all-ones value is reserved for default constructed keys
        constexpr static const std::size_t max_index =
            static_cast<std::size_t>(key_type::invalid_value - 1);

        static constexpr key_type from_index(std::size_t idx) {
            TSLAB_ASSERT(idx <= max_index, "index does not fit the key storage");
            return key_type{ static_cast<StorageT>(idx) };
        }

        static constexpr std::size_t to_index(const key_type& key) {
            return static_cast<std::size_t>(key.get());
        }
    };

    namespace detail {
        struct probe_tag {};
    }

    static_assert(SlabKey<index_key<detail::probe_tag>>);
    static_assert(SlabKey<index_key<detail::probe_tag, std::uint8_t>>);

} // namespace tslab::keys

namespace std {
    template <typename Tag, std::unsigned_integral StorageT>
    struct hash<tslab::keys::index_key<Tag, StorageT>> {
        std::size_t operator()(const tslab::keys::index_key<Tag, StorageT>& key) const noexcept {
            return std::hash<StorageT>{}(key.get());
        }
    };
}
