#pragma once

#include <optional>

#include "common.hpp"


namespace imprint {

    /*
        optional:
            If a value is contained, the value's tail. Otherwise nothing.
            Whether a value is contained is part of the header, so the reader knows before consuming anything.
    */


    template<imageable T>
    struct image_traits<std::optional<T>> {
        static void serialise_tail(std::optional<T> const& value, output_sink auto& sink) {
            if (value.has_value()) {
                imprint::serialise_tail(*value, sink);
            }
        }

        static void neutralise(std::optional<T>& value) noexcept {
            if (value.has_value()) {
                imprint::neutralise(*value);
            }
        }

        [[nodiscard]]
        static std::optional<mutable_bytes_span> reconstruct(std::optional<T>& value, mutable_bytes_span const bytes) {
            if (value.has_value()) {
                return imprint::reconstruct(*value, bytes);
            }
            else {
                return bytes;
            }
        }

        [[nodiscard]]
        static std::optional<const_bytes_span> validate(std::optional<T> const& value, const_bytes_span const bytes) {
            if (value.has_value()) {
                return imprint::validate(*value, bytes);
            }
            else {
                return bytes;
            }
        }
    };

}
