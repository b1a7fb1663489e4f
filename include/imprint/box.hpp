#pragma once

#include <memory>
#include <optional>

#include "common.hpp"
#include "utility.hpp"


namespace imprint {

    /*
        box (std::unique_ptr):
            Header is the pointer.
            If the pointer is non-null, tail is the pointee's header, aligned, followed by the pointee's tail.
            A null pointer stays null and has no tail.
    */


    template<imageable T>
    struct image_traits<std::unique_ptr<T>> {
        static void serialise_tail(std::unique_ptr<T> const& value, output_sink auto& sink) {
            if (value) {
                detail::serialise_elements(value.get(), 1, sink);
            }
        }

        // Never deletes anything: the header copy does not own the pointee.
        static void neutralise(std::unique_ptr<T>& value) noexcept {
            if (value) {
                static_cast<void>(value.release());
                value.reset(detail::neutral_pointer<T>());
            }
        }

        [[nodiscard]]
        static std::optional<mutable_bytes_span> reconstruct(std::unique_ptr<T>& value, mutable_bytes_span const bytes) {
            if (!value) {
                return bytes;
            }
            auto const result = detail::reconstruct_elements<T>(1, bytes);
            if (!result) {
                return std::nullopt;
            }
            static_cast<void>(value.release());
            value.reset(result->first.data());
            return result->second;
        }

        [[nodiscard]]
        static std::optional<const_bytes_span> validate(std::unique_ptr<T> const& value, const_bytes_span const bytes) {
            if (!value) {
                return bytes;
            }
            return detail::validate_elements(value.get(), 1, bytes);
        }
    };

}
