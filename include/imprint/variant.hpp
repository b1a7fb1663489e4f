#pragma once

#include <optional>
#include <variant>

#include "common.hpp"


namespace imprint {

    /*
        variant:
            The tail of the active alternative. The alternative index is part of the header.
            A variant that is valueless by exception has no tail.
    */


    template<imageable... Ts>
    struct image_traits<std::variant<Ts...>> {
        static void serialise_tail(std::variant<Ts...> const& value, output_sink auto& sink) {
            if (!value.valueless_by_exception()) {
                std::visit([&sink] <typename T> (T const& alternative) {
                    imprint::serialise_tail(alternative, sink);
                }, value);
            }
        }

        static void neutralise(std::variant<Ts...>& value) noexcept {
            if (!value.valueless_by_exception()) {
                std::visit([] <typename T> (T& alternative) noexcept {
                    imprint::neutralise(alternative);
                }, value);
            }
        }

        [[nodiscard]]
        static std::optional<mutable_bytes_span> reconstruct(std::variant<Ts...>& value, mutable_bytes_span const bytes) {
            if (value.valueless_by_exception()) {
                return bytes;
            }
            return std::visit([bytes] <typename T> (T& alternative) {
                return imprint::reconstruct(alternative, bytes);
            }, value);
        }

        [[nodiscard]]
        static std::optional<const_bytes_span> validate(std::variant<Ts...> const& value, const_bytes_span const bytes) {
            if (value.valueless_by_exception()) {
                return bytes;
            }
            return std::visit([bytes] <typename T> (T const& alternative) {
                return imprint::validate(alternative, bytes);
            }, value);
        }
    };

}
