/*
 * File: slab/slot.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <cstddef>
#include <limits>
#include <utility>
#include <variant>

#include "tslab/core/assert.hpp"

namespace tslab::slab {

    constexpr static const std::size_t npos = std::numeric_limits<std::size_t>::max();

    // a hole; next_free links the free list, npos terminates it
    struct vacant {
        std::size_t next_free = npos;
    };

    template <typename V>
    struct occupied {
        template <typename... Args>
        explicit occupied(std::in_place_t, Args&&... args)
            : value(std::forward<Args>(args)...)
        {}
        V value;
    };

    template <typename V>
    class slot {
    public:

        using value_type = V;
        using occupied_type = occupied<V>;

        slot() = default;

        explicit slot(vacant v)
            : data_(v)
        {}

        template <typename... Args>
        explicit slot(std::in_place_t, Args&&... args)
            : data_(std::in_place_type<occupied_type>, std::in_place, std::forward<Args>(args)...)
        {}

        bool is_occupied() const noexcept {
            return std::holds_alternative<occupied_type>(data_);
        }

        bool is_vacant() const noexcept {
            return std::holds_alternative<vacant>(data_);
        }

        V* value_ptr() noexcept {
            if (auto occ = std::get_if<occupied_type>(&data_)) {
                return &occ->value;
            }
            return nullptr;
        }

        const V* value_ptr() const noexcept {
            if (auto occ = std::get_if<occupied_type>(&data_)) {
                return &occ->value;
            }
            return nullptr;
        }

        std::size_t next_free() const noexcept {
            TSLAB_ASSERT(is_vacant(), "occupied slot is not a free list link");
            return std::get_if<vacant>(&data_)->next_free;
        }

        // emplace destroys the vacant alternative before it moves `value` in;
        // if that move throws, the link is put back and the slot stays vacant
        V& occupy(V&& value) {
            const auto next = next_free();
            try {
                return data_.template emplace<occupied_type>(std::in_place, std::move(value)).value;
            }
            catch (...) {
                data_.template emplace<vacant>(vacant{ next });
                throw;
            }
        }

        V release(std::size_t next_free) {
            TSLAB_ASSERT(is_occupied(), "releasing a vacant slot");
            V value = std::move(std::get_if<occupied_type>(&data_)->value);
            data_.template emplace<vacant>(vacant{ next_free });
            return value;
        }

    private:
        std::variant<vacant, occupied_type> data_;
    };

} // namespace tslab::slab
