#pragma once

#include <algorithm>
#include <cassert>
#include <compare>
#include <cstddef>
#include <cstring>
#include <memory>
#include <optional>
#include <ostream>
#include <string_view>
#include <utility>

#include "common.hpp"
#include "utility.hpp"


namespace imprint {

    /*
        string:
            Header is the data pointer, length, and capacity.
            Tail is the characters, with no terminator and no padding.
    */


    // Growable text buffer which owns its characters.
    // No null terminator is kept, use view() to interoperate with other string types.
    // A decoded string lives inside the image buffer and must not be modified or destroyed.
    class string {
    public:
        using value_type = char;
        using size_type = std::size_t;
        using iterator = char*;
        using const_iterator = char const*;

        constexpr string() noexcept :
            _data{nullptr},
            _size{0},
            _capacity{0}
        {}

        explicit string(std::string_view const text) :
            string()
        {
            append(text);
        }

        explicit string(char const* const text) :
            string(std::string_view{text})
        {}

        string(string const& other) :
            string(other.view())
        {}

        string(string&& other) noexcept :
            _data{std::exchange(other._data, nullptr)},
            _size{std::exchange(other._size, 0)},
            _capacity{std::exchange(other._capacity, 0)}
        {}

        ~string() {
            _release();
        }

        string& operator=(string other) noexcept {
            swap(*this, other);
            return *this;
        }

        [[nodiscard]]
        size_type size() const noexcept {
            return _size;
        }

        [[nodiscard]]
        size_type capacity() const noexcept {
            return _capacity;
        }

        [[nodiscard]]
        bool empty() const noexcept {
            return _size == 0;
        }

        [[nodiscard]]
        char const* data() const noexcept {
            return _data;
        }

        [[nodiscard]]
        const_iterator begin() const noexcept {
            return _data;
        }

        [[nodiscard]]
        const_iterator end() const noexcept {
            return _data + _size;
        }

        [[nodiscard]]
        char operator[](size_type const index) const noexcept {
            assert(index < _size);
            return _data[index];
        }

        [[nodiscard]]
        std::string_view view() const noexcept {
            return {_data, _size};
        }

        operator std::string_view() const noexcept {
            return view();
        }

        void reserve(size_type const new_capacity) {
            if (new_capacity > _capacity) {
                _reallocate(new_capacity, {});
            }
        }

        // text may view this string's own characters.
        string& append(std::string_view const text) {
            if (_size + text.size() > _capacity) {
                _reallocate(std::max(_size + text.size(), _capacity + _capacity / 2), text);
            }
            else {
                std::copy_n(text.data(), text.size(), _data + _size);
            }
            _size += text.size();
            return *this;
        }

        string& operator+=(std::string_view const text) {
            return append(text);
        }

        void push_back(char const c) {
            append(std::string_view{&c, 1});
        }

        // Removes the characters, keeping the allocated storage.
        void clear() noexcept {
            _size = 0;
        }

        [[nodiscard]]
        friend bool operator==(string const& lhs, string const& rhs) noexcept {
            return lhs.view() == rhs.view();
        }

        [[nodiscard]]
        friend bool operator==(string const& lhs, std::string_view const rhs) noexcept {
            return lhs.view() == rhs;
        }

        [[nodiscard]]
        friend std::strong_ordering operator<=>(string const& lhs, string const& rhs) noexcept {
            return lhs.view() <=> rhs.view();
        }

        friend std::ostream& operator<<(std::ostream& stream, string const& value) {
            return stream << value.view();
        }

        friend void swap(string& first, string& second) noexcept {
            using std::swap;
            swap(first._data, second._data);
            swap(first._size, second._size);
            swap(first._capacity, second._capacity);
        }

    private:
        friend struct image_traits<string>;

        char* _data;
        size_type _size;
        size_type _capacity;

        // Moves the characters, followed by appended, into new storage. The old storage is freed last, as appended
        // may refer into it.
        void _reallocate(size_type const new_capacity, std::string_view const appended) {
            assert(new_capacity >= _size + appended.size());
            char* const new_data = std::allocator<char>{}.allocate(new_capacity);
            std::copy_n(_data, _size, new_data);
            std::copy_n(appended.data(), appended.size(), new_data + _size);
            auto const size = _size;
            _release();
            _data = new_data;
            _size = size;
            _capacity = new_capacity;
        }

        void _release() noexcept {
            if (_data) {
                std::allocator<char>{}.deallocate(_data, _capacity);
            }
            _data = nullptr;
            _size = 0;
            _capacity = 0;
        }
    };


    template<>
    struct image_traits<string> {
        static void serialise_tail(string const& value, output_sink auto& sink) {
            static_cast<void>(detail::append_objects(sink, value.data(), value.size()));
        }

        static void neutralise(string& value) noexcept {
            value._data = detail::neutral_pointer<char>();
            value._capacity = value._size;
        }

        [[nodiscard]]
        static std::optional<mutable_bytes_span> reconstruct(string& value, mutable_bytes_span const bytes) {
            auto const claimed = detail::claim_objects<char>(bytes, value._size);
            if (!claimed) {
                return std::nullopt;
            }
            value._data = bytes_to_typed<char>(claimed->first, value._size).data();
            return claimed->second;
        }

        [[nodiscard]]
        static std::optional<const_bytes_span> validate(string const& value, const_bytes_span const bytes) {
            auto const claimed = detail::claim_objects<char>(bytes, value._size);
            if (!claimed || typed_to_bytes(value._data, value._size).data() != claimed->first.data()) {
                return std::nullopt;
            }
            return claimed->second;
        }
    };

}
