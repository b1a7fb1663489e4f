#pragma once

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <memory>
#include <utility>

#include "common.hpp"


namespace imprint {

    // Basic output_sink implementation that uses the free store (new/delete) for storage.
    // Reallocations are done as necessary to extend the buffer while encoding.
    // Storage obtained from new std::byte[] is aligned for any object with fundamental alignment, which satisfies
    // image_alignment.
    class basic_buffer {
    public:
        // capacity is the number of bytes to preallocate (similar to std::vector's capacity).
        // If preload is true, force the memory to be loaded into the process now. Otherwise, it may not be loaded until
        // the buffer is written to.
        explicit basic_buffer(std::size_t const capacity = 4096, bool const preload = true) :
            _data{new std::byte[std::max<std::size_t>(capacity, 1)]},
            _capacity{std::max<std::size_t>(capacity, 1)},
            _used{0}
        {
            if (preload) {
                // Initialising the memory forces the OS to load it in now, rather than later during encoding.
                std::fill_n(_data.get(), _capacity, std::byte{0});
            }
        }

        basic_buffer(basic_buffer&& other) noexcept :
            _data{std::move(other._data)},
            _capacity{std::exchange(other._capacity, 0)},
            _used{std::exchange(other._used, 0)}
        {}

        basic_buffer& operator=(basic_buffer other) noexcept {
            swap(*this, other);
            return *this;
        }

        // Extends the buffer by count bytes, while maintaining the previous content.
        // If the new size is greater than the current capacity, the buffer is reallocated and any view of the buffer
        // previously acquired from span() will be invalidated. The new extended section of memory is not initialised.
        // Returns the new value of span().
        mutable_bytes_span extend(std::size_t const count) {
            auto const new_used = _used + count;
            if (_capacity < new_used) {
                auto const new_capacity = std::max(new_used, _capacity + _capacity / 2);
                std::unique_ptr<std::byte[]> new_data{new std::byte[new_capacity]};
                assert(_data || _used == 0);
                std::copy_n(_data.get(), _used, new_data.get());
                // Take ownership of new data last - strong exception guarantee.
                _data = std::move(new_data);
                _capacity = new_capacity;
            }
            _used = new_used;
            return span();
        }

        // Discards the content, keeping the allocated memory.
        void clear() noexcept {
            _used = 0;
        }

        [[nodiscard]]
        const_bytes_span span() const noexcept {
            return {_data.get(), _used};
        }

        [[nodiscard]]
        mutable_bytes_span span() noexcept {
            return {_data.get(), _used};
        }

        [[nodiscard]]
        std::size_t capacity() const noexcept {
            return _capacity;
        }

        friend void swap(basic_buffer& first, basic_buffer& second) noexcept {
            using std::swap;
            swap(first._data, second._data);
            swap(first._capacity, second._capacity);
            swap(first._used, second._used);
        }

    private:
        std::unique_ptr<std::byte[]> _data;
        std::size_t _capacity;      // Number of bytes allocated.
        std::size_t _used;          // Number of bytes used at the start of the allocated memory.
    };

}
