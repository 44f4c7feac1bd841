/*
 * File: slab/drain.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <cstddef>
#include <iterator>
#include <optional>
#include <utility>

namespace tslab::slab {

    // Moves values out of a slab front to back (or back to front), releasing each
    // slot as its value is produced. Dropping the range early leaves the values
    // that were not produced in place.
    template <typename SlabT>
    class drain_range {
    public:

        using slab_type = SlabT;
        using value_type = typename slab_type::value_type;

        class iterator {
        public:
            using value_type = typename drain_range::value_type;
            using reference = value_type&&;
            using difference_type = std::ptrdiff_t;
            using iterator_concept = std::input_iterator_tag;

            iterator() = default;
            explicit iterator(drain_range* range) : range_(range) {}

            reference operator*() const {
                return std::move(*range_->current_);
            }

            iterator& operator++() {
                range_->current_ = range_->next();
                return *this;
            }

            void operator++(int) {
                ++(*this);
            }

            friend bool operator == (const iterator& it, std::default_sentinel_t) noexcept {
                return it.exhausted();
            }

        private:
            bool exhausted() const noexcept {
                return range_ == nullptr || !range_->current_.has_value();
            }

            drain_range* range_ = nullptr;
        };

        explicit drain_range(slab_type& slab)
            : slab_(&slab)
            , back_(slab.slots_.size())
        {}

        drain_range(const drain_range&) = delete;
        drain_range& operator = (const drain_range&) = delete;

        drain_range(drain_range&& other) noexcept
            : slab_(std::exchange(other.slab_, nullptr))
            , front_(std::exchange(other.front_, 0))
            , back_(std::exchange(other.back_, 0))
            , current_(std::move(other.current_))
        {
            other.current_.reset();
        }

        drain_range& operator = (drain_range&&) = delete;

        std::optional<value_type> next() {
            while (front_ < back_) {
                const auto idx = front_++;
                if (slab_->contains(idx)) {
                    return { produce(idx) };
                }
            }
            return std::nullopt;
        }

        std::optional<value_type> next_back() {
            while (front_ < back_) {
                const auto idx = --back_;
                if (slab_->contains(idx)) {
                    return { produce(idx) };
                }
            }
            return std::nullopt;
        }

        iterator begin() {
            current_ = next();
            return iterator{ this };
        }

        std::default_sentinel_t end() const noexcept {
            return {};
        }

    private:

        value_type produce(std::size_t idx) {
            value_type value = slab_->release(idx);
            ++slab_->stats_.drained;
            if (slab_->is_empty()) {
                // nothing left to hand out; start over from index 0
                slab_->clear();
                front_ = back_ = 0;
            }
            return value;
        }

        slab_type* slab_ = nullptr;
        std::size_t front_ = 0;
        std::size_t back_ = 0;
        std::optional<value_type> current_;
    };

} // namespace tslab::slab
