#pragma once

#include <array>
#include <cstddef>
#include <optional>

#include "common.hpp"


namespace imprint {

    /*
        static_array:
            The elements live in the header, so the tail is each element's tail, in index order.
    */


    template<imageable T, std::size_t Size>
    struct image_traits<std::array<T, Size>> {
        static void serialise_tail(std::array<T, Size> const& value, output_sink auto& sink) {
            for (auto const& element : value) {
                imprint::serialise_tail(element, sink);
            }
        }

        static void neutralise(std::array<T, Size>& value) noexcept {
            for (auto& element : value) {
                imprint::neutralise(element);
            }
        }

        [[nodiscard]]
        static std::optional<mutable_bytes_span> reconstruct(std::array<T, Size>& value, mutable_bytes_span bytes) {
            for (auto& element : value) {
                auto const rest = imprint::reconstruct(element, bytes);
                if (!rest) {
                    return std::nullopt;
                }
                bytes = *rest;
            }
            return bytes;
        }

        [[nodiscard]]
        static std::optional<const_bytes_span> validate(std::array<T, Size> const& value, const_bytes_span bytes) {
            for (auto const& element : value) {
                auto const rest = imprint::validate(element, bytes);
                if (!rest) {
                    return std::nullopt;
                }
                bytes = *rest;
            }
            return bytes;
        }
    };

}
