#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string_view>
#include <type_traits>

#include "common.hpp"
#include "utility.hpp"


namespace imprint {

    /*
        slice (std::span):
            Header is the data pointer and element count.
            Tail is the referenced elements' headers as one aligned block, followed by each element's tail in element
            order. The decoded span refers to the copy inside the image, never to the original elements.
    */


    template<typename T> requires imageable<std::remove_const_t<T>>
    struct image_traits<std::span<T>> {
        using element_type = std::remove_const_t<T>;

        static void serialise_tail(std::span<T> const& value, output_sink auto& sink) {
            detail::serialise_elements<element_type>(value.data(), value.size(), sink);
        }

        static void neutralise(std::span<T>& value) noexcept {
            value = std::span<T>{detail::neutral_pointer<T>(), value.size()};
        }

        [[nodiscard]]
        static std::optional<mutable_bytes_span> reconstruct(std::span<T>& value, mutable_bytes_span const bytes) {
            auto const result = detail::reconstruct_elements<element_type>(value.size(), bytes);
            if (!result) {
                return std::nullopt;
            }
            value = result->first;
            return result->second;
        }

        [[nodiscard]]
        static std::optional<const_bytes_span> validate(std::span<T> const& value, const_bytes_span const bytes) {
            return detail::validate_elements<element_type>(value.data(), value.size(), bytes);
        }
    };


    /*
        std::string_view:
            Borrowed text. Header is the data pointer and length. Tail is the characters.
    */


    template<>
    struct image_traits<std::string_view> {
        static void serialise_tail(std::string_view const& value, output_sink auto& sink) {
            static_cast<void>(detail::append_objects(sink, value.data(), value.size()));
        }

        static void neutralise(std::string_view& value) noexcept {
            value = std::string_view{detail::neutral_pointer<char const>(), value.size()};
        }

        [[nodiscard]]
        static std::optional<mutable_bytes_span> reconstruct(std::string_view& value, mutable_bytes_span const bytes) {
            auto const claimed = detail::claim_objects<char>(bytes, value.size());
            if (!claimed) {
                return std::nullopt;
            }
            value = std::string_view{bytes_to_typed<char>(claimed->first, value.size()).data(), value.size()};
            return claimed->second;
        }

        [[nodiscard]]
        static std::optional<const_bytes_span> validate(std::string_view const& value, const_bytes_span const bytes) {
            auto const claimed = detail::claim_objects<char>(bytes, value.size());
            if (!claimed || typed_to_bytes(value.data(), value.size()).data() != claimed->first.data()) {
                return std::nullopt;
            }
            return claimed->second;
        }
    };

}
