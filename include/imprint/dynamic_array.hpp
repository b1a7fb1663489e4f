#pragma once

#include <algorithm>
#include <cassert>
#include <concepts>
#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

#include "common.hpp"
#include "utility.hpp"


namespace imprint {

    /*
        dynamic_array:
            Header is the data pointer, element count, and capacity.
            Tail is the elements' headers as one aligned block, followed by each element's tail in element order.
            Capacity is reduced to the element count when neutralised, so a decoded array has no spare capacity.
    */


    // Growable homogeneous array which owns its elements.
    // A decoded dynamic_array lives inside the image buffer and must not be modified or destroyed.
    template<typename T>
    class dynamic_array {
    public:
        using value_type = T;
        using size_type = std::size_t;
        using difference_type = std::ptrdiff_t;
        using reference = T&;
        using const_reference = T const&;
        using pointer = T*;
        using const_pointer = T const*;
        using iterator = T*;
        using const_iterator = T const*;

        constexpr dynamic_array() noexcept :
            _data{nullptr},
            _size{0},
            _capacity{0}
        {}

        dynamic_array(std::initializer_list<T> const elements) :
            dynamic_array(elements.begin(), elements.end())
        {}

        explicit dynamic_array(size_type const count, T const& value = T{}) :
            dynamic_array()
        {
            reserve(count);
            std::uninitialized_fill_n(_data, count, value);
            _size = count;
        }

        template<std::input_iterator I, std::sentinel_for<I> S>
            requires std::constructible_from<T, std::iter_reference_t<I>>
        dynamic_array(I first, S const last) :
            dynamic_array()
        {
            if constexpr (std::sized_sentinel_for<S, I>) {
                reserve(static_cast<size_type>(last - first));
            }
            for (; first != last; ++first) {
                emplace_back(*first);
            }
        }

        dynamic_array(dynamic_array const& other) :
            dynamic_array(other.begin(), other.end())
        {}

        dynamic_array(dynamic_array&& other) noexcept :
            _data{std::exchange(other._data, nullptr)},
            _size{std::exchange(other._size, 0)},
            _capacity{std::exchange(other._capacity, 0)}
        {}

        ~dynamic_array() {
            _release();
        }

        dynamic_array& operator=(dynamic_array other) noexcept {
            swap(*this, other);
            return *this;
        }

        [[nodiscard]]
        size_type size() const noexcept {
            return _size;
        }

        // Number of elements which fit in the allocated storage.
        [[nodiscard]]
        size_type capacity() const noexcept {
            return _capacity;
        }

        [[nodiscard]]
        bool empty() const noexcept {
            return _size == 0;
        }

        [[nodiscard]]
        T* data() noexcept {
            return _data;
        }

        [[nodiscard]]
        T const* data() const noexcept {
            return _data;
        }

        [[nodiscard]]
        iterator begin() noexcept {
            return _data;
        }

        [[nodiscard]]
        const_iterator begin() const noexcept {
            return _data;
        }

        [[nodiscard]]
        iterator end() noexcept {
            return _data + _size;
        }

        [[nodiscard]]
        const_iterator end() const noexcept {
            return _data + _size;
        }

        // Gets the element at the specified index. index must be < size().
        [[nodiscard]]
        T& operator[](size_type const index) noexcept {
            assert(index < _size);
            return _data[index];
        }

        [[nodiscard]]
        T const& operator[](size_type const index) const noexcept {
            assert(index < _size);
            return _data[index];
        }

        // Gets the element at the specified index. Throws std::out_of_range if index is out of bounds.
        [[nodiscard]]
        T const& at(size_type const index) const {
            if (index < _size) {
                return _data[index];
            }
            else {
                throw std::out_of_range{"index " + std::to_string(index)
                    + " is out of bounds for dynamic_array with size " + std::to_string(_size)};
            }
        }

        [[nodiscard]]
        T& at(size_type const index) {
            return const_cast<T&>(std::as_const(*this).at(index));
        }

        [[nodiscard]]
        T const& front() const noexcept {
            assert(_size > 0);
            return _data[0];
        }

        [[nodiscard]]
        T const& back() const noexcept {
            assert(_size > 0);
            return _data[_size - 1];
        }

        // Ensures the capacity is at least new_capacity. Invalidates iterators if reallocation occurs.
        void reserve(size_type const new_capacity) {
            if (new_capacity > _capacity) {
                _reallocate(new_capacity);
            }
        }

        template<typename... Args> requires std::constructible_from<T, Args...>
        T& emplace_back(Args&&... args) {
            if (_size == _capacity) {
                // Construct first, args may refer to an element.
                T element(std::forward<Args>(args)...);
                _reallocate(_grown_capacity());
                std::construct_at(_data + _size, std::move(element));
            }
            else {
                std::construct_at(_data + _size, std::forward<Args>(args)...);
            }
            return _data[_size++];
        }

        void push_back(T const& element) {
            emplace_back(element);
        }

        void push_back(T&& element) {
            emplace_back(std::move(element));
        }

        void pop_back() noexcept {
            assert(_size > 0);
            std::destroy_at(_data + --_size);
        }

        // Destroys all the elements, keeping the allocated storage.
        void clear() noexcept {
            std::destroy_n(_data, _size);
            _size = 0;
        }

        void resize(size_type const count) requires std::default_initializable<T> {
            if (count < _size) {
                std::destroy_n(_data + count, _size - count);
                _size = count;
            }
            else {
                reserve(count);
                while (_size < count) {
                    emplace_back();
                }
            }
        }

        [[nodiscard]]
        friend bool operator==(dynamic_array const& lhs, dynamic_array const& rhs) requires std::equality_comparable<T> {
            return std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end());
        }

        friend void swap(dynamic_array& first, dynamic_array& second) noexcept {
            using std::swap;
            swap(first._data, second._data);
            swap(first._size, second._size);
            swap(first._capacity, second._capacity);
        }

    private:
        friend struct image_traits<dynamic_array<T>>;

        T* _data;
        size_type _size;            // Number of constructed elements at the start of _data.
        size_type _capacity;        // Number of elements allocated.

        [[nodiscard]]
        size_type _grown_capacity() const noexcept {
            return std::max<size_type>(_capacity + _capacity / 2, _capacity + 1);
        }

        void _reallocate(size_type const new_capacity) {
            assert(new_capacity >= _size);
            std::allocator<T> allocator;
            T* const new_data = allocator.allocate(new_capacity);
            try {
                if constexpr (std::is_nothrow_move_constructible_v<T> || !std::copy_constructible<T>) {
                    std::uninitialized_move_n(_data, _size, new_data);
                }
                else {
                    std::uninitialized_copy_n(_data, _size, new_data);
                }
            }
            catch (...) {
                allocator.deallocate(new_data, new_capacity);
                throw;
            }
            auto const size = _size;
            _release();
            _data = new_data;
            _size = size;
            _capacity = new_capacity;
        }

        void _release() noexcept {
            if (_data) {
                std::destroy_n(_data, _size);
                std::allocator<T>{}.deallocate(_data, _capacity);
            }
            _data = nullptr;
            _size = 0;
            _capacity = 0;
        }
    };


    template<imageable T>
    struct image_traits<dynamic_array<T>> {
        static void serialise_tail(dynamic_array<T> const& value, output_sink auto& sink) {
            detail::serialise_elements(value.data(), value.size(), sink);
        }

        static void neutralise(dynamic_array<T>& value) noexcept {
            value._data = detail::neutral_pointer<T>();
            value._capacity = value._size;
        }

        [[nodiscard]]
        static std::optional<mutable_bytes_span> reconstruct(dynamic_array<T>& value, mutable_bytes_span const bytes) {
            auto const result = detail::reconstruct_elements<T>(value._size, bytes);
            if (!result) {
                return std::nullopt;
            }
            value._data = result->first.data();
            return result->second;
        }

        [[nodiscard]]
        static std::optional<const_bytes_span> validate(dynamic_array<T> const& value, const_bytes_span const bytes) {
            return detail::validate_elements(value.data(), value.size(), bytes);
        }
    };

}
