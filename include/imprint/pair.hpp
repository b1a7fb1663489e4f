#pragma once

#include <optional>
#include <utility>

#include "common.hpp"


namespace imprint {

    /*
        pair:
            The first element's tail, then the second element's tail.
    */


    template<imageable T1, imageable T2>
    struct image_traits<std::pair<T1, T2>> {
        static void serialise_tail(std::pair<T1, T2> const& value, output_sink auto& sink) {
            serialise_tail_each(sink, value.first, value.second);
        }

        static void neutralise(std::pair<T1, T2>& value) noexcept {
            neutralise_each(value.first, value.second);
        }

        [[nodiscard]]
        static std::optional<mutable_bytes_span> reconstruct(std::pair<T1, T2>& value, mutable_bytes_span const bytes) {
            return reconstruct_each(bytes, value.first, value.second);
        }

        [[nodiscard]]
        static std::optional<const_bytes_span> validate(std::pair<T1, T2> const& value, const_bytes_span const bytes) {
            return validate_each(bytes, value.first, value.second);
        }
    };

}
