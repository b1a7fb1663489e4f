#pragma once

#include <memory>
#include <optional>
#include <string>
#include <typeinfo>

#include "common.hpp"
#include "utility.hpp"


namespace imprint {

    /*
        Image layout for a type T:
            [padding to alignof(T)]
            [header: object representation of T, neutralised]
            [tail: image_traits<T>::serialise_tail() output]

        The reader must know T statically, and must have the same representation of T as the writer (pointer width,
        alignment, byte order). Images may be preceded and followed by other data in the same buffer.
    */


    // A value decoded in place, and the bytes following its image.
    template<imageable T>
    struct decoded {
        T const& value;
        mutable_bytes_span remaining;
    };

    // A value validated in place, and the bytes following its image.
    template<imageable T>
    struct validated {
        T const& value;
        const_bytes_span remaining;
    };


    // Appends the image of value to the end of sink.
    // value is not modified; neutralisation is done on the copy in sink.
    template<imageable T>
    void encode(T const& value, output_sink auto& sink) {
        auto const header = detail::append_objects(sink, std::addressof(value), 1);
        imprint::neutralise(header.front());
        imprint::serialise_tail(value, sink);
    }


    // Decodes the image at the start of bytes, in place.
    // The bytes are modified so the returned value refers into them. They must not be moved or modified while the
    // value is in use, and the value must not be destroyed.
    // Returns std::nullopt if bytes is shorter than the image.
    // bytes must begin with an image of T produced by encode(), at the same offset from an image_alignment boundary as
    // it was encoded at. Anything else is undefined behaviour.
    template<imageable T>
    [[nodiscard]]
    std::optional<decoded<T>> decode(mutable_bytes_span const bytes) {
        auto const claimed = detail::claim_objects<T>(bytes, 1);
        if (!claimed) {
            return std::nullopt;
        }
        T& value = bytes_to_typed<T>(claimed->first, 1).front();
        auto const remaining = imprint::reconstruct(value, claimed->second);
        if (!remaining) {
            return std::nullopt;
        }
        return decoded<T>{value, *remaining};
    }


    // Obtains the value of an image which has already been decoded in place and not moved since, without modifying
    // anything.
    // Returns std::nullopt if bytes is shorter than the image, or if the image does not refer to its current location.
    template<imageable T>
    [[nodiscard]]
    std::optional<validated<T>> validate_buffer(const_bytes_span const bytes) {
        auto const claimed = detail::claim_objects<T>(bytes, 1);
        if (!claimed) {
            return std::nullopt;
        }
        T const& value = bytes_to_typed<T>(claimed->first, 1).front();
        auto const remaining = imprint::validate(value, claimed->second);
        if (!remaining) {
            return std::nullopt;
        }
        return validated<T>{value, *remaining};
    }


    // As decode(), but throws truncated_buffer_error on failure.
    template<imageable T>
    [[nodiscard]]
    decoded<T> decode_checked(mutable_bytes_span const bytes) {
        auto const result = decode<T>(bytes);
        if (!result) {
            throw truncated_buffer_error{"Buffer of size " + std::to_string(bytes.size())
                + " is too small to decode type " + typeid(T).name()};
        }
        return *result;
    }


    // As validate_buffer(), but throws validation_error on failure.
    template<imageable T>
    [[nodiscard]]
    validated<T> validate_buffer_checked(const_bytes_span const bytes) {
        auto const result = validate_buffer<T>(bytes);
        if (!result) {
            throw validation_error{"Buffer of size " + std::to_string(bytes.size())
                + " does not hold a decoded image of type " + typeid(T).name()};
        }
        return *result;
    }

}
