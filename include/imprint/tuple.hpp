#pragma once

#include <optional>
#include <tuple>

#include "common.hpp"


namespace imprint {

    /*
        tuple:
            Each element's tail, in index order. The empty tuple is the unit type and has no tail.
    */


    template<imageable... Ts>
    struct image_traits<std::tuple<Ts...>> {
        static void serialise_tail(std::tuple<Ts...> const& value, output_sink auto& sink) {
            std::apply([&sink](Ts const&... elements) {
                serialise_tail_each(sink, elements...);
            }, value);
        }

        static void neutralise(std::tuple<Ts...>& value) noexcept {
            std::apply([](Ts&... elements) noexcept {
                neutralise_each(elements...);
            }, value);
        }

        [[nodiscard]]
        static std::optional<mutable_bytes_span> reconstruct(std::tuple<Ts...>& value, mutable_bytes_span const bytes) {
            return std::apply([bytes](Ts&... elements) {
                return reconstruct_each(bytes, elements...);
            }, value);
        }

        [[nodiscard]]
        static std::optional<const_bytes_span> validate(std::tuple<Ts...> const& value, const_bytes_span const bytes) {
            return std::apply([bytes](Ts const&... elements) {
                return validate_each(bytes, elements...);
            }, value);
        }
    };

}
