#pragma once

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <utility>

#include "common.hpp"


namespace imprint {

    /*
        Raw reinterpretation:
            These two functions are the only place where typed memory is treated as bytes and vice versa.
            Everything else in the library goes through them.

            typed_to_bytes() exposes the object representation of objects, including any padding bits.
            bytes_to_typed() does not create objects; the bytes must already hold the representation of count objects
            of T (e.g. copied there by typed_to_bytes()), and must be suitably aligned for T.
    */


    // Views the object representation of count consecutive objects of T starting at data.
    template<typename T>
    [[nodiscard]]
    const_bytes_span typed_to_bytes(T const* const data, std::size_t const count) noexcept {
        return {reinterpret_cast<std::byte const*>(data), count * sizeof(T)};
    }

    // Views the bytes at the start of bytes as count consecutive objects of T.
    // bytes must be at least count * sizeof(T) bytes long.
    template<typename T>
    [[nodiscard]]
    std::span<T> bytes_to_typed(mutable_bytes_span const bytes, std::size_t const count) noexcept {
        assert(bytes.size() >= count * sizeof(T));
        assert(reinterpret_cast<std::uintptr_t>(bytes.data()) % alignof(T) == 0);
        return {reinterpret_cast<T*>(bytes.data()), count};
    }

    // Const version of bytes_to_typed(), for validation.
    template<typename T>
    [[nodiscard]]
    std::span<T const> bytes_to_typed(const_bytes_span const bytes, std::size_t const count) noexcept {
        assert(bytes.size() >= count * sizeof(T));
        assert(reinterpret_cast<std::uintptr_t>(bytes.data()) % alignof(T) == 0);
        return {reinterpret_cast<T const*>(bytes.data()), count};
    }


    namespace detail {

        // Number of bytes to skip from position to reach a multiple of alignment.
        [[nodiscard]]
        constexpr std::size_t padding_for(std::uintptr_t const position, std::size_t const alignment) noexcept {
            assert(alignment > 0);
            return (alignment - position % alignment) % alignment;
        }

        template<typename T>
        [[nodiscard]]
        std::size_t padding_for(std::byte const* const address) noexcept {
            return padding_for(reinterpret_cast<std::uintptr_t>(address), alignof(T));
        }


        // Appends zero bytes to sink until its size is a multiple of alignof(T).
        // Returns the new size, which is where the next object of T will be written.
        template<typename T>
        std::size_t align_sink_for(output_sink auto& sink) {
            auto const size = sink.span().size();
            auto const padding = padding_for(size, alignof(T));
            if (padding > 0) {
                auto const span = sink.extend(padding);
                std::fill_n(span.begin() + size, padding, std::byte{0});
            }
            return size + padding;
        }


        // Appends the object representations of count objects of T to sink, preceded by alignment padding.
        // Returns the appended objects as they reside in the sink. The returned span is invalidated by the next
        // extension of the sink.
        template<typename T>
        std::span<T> append_objects(output_sink auto& sink, T const* const objects, std::size_t const count) {
            auto const position = align_sink_for<T>(sink);
            auto const bytes = typed_to_bytes(objects, count);
            auto const span = sink.extend(bytes.size());
            if (!bytes.empty()) {
                std::memcpy(span.data() + position, bytes.data(), bytes.size());
            }
            return bytes_to_typed<T>(span.subspan(position), count);
        }


        // Splits the storage of count objects of T, plus leading alignment padding, off the front of bytes.
        // Returns the storage and the remainder, or std::nullopt if bytes is too short.
        template<typename T, typename Byte>
        [[nodiscard]]
        std::optional<std::pair<std::span<Byte>, std::span<Byte>>> claim_objects(std::span<Byte> const bytes,
                std::size_t const count) noexcept {
            auto const padding = padding_for<T>(bytes.data());
            if (padding > bytes.size() || (bytes.size() - padding) / sizeof(T) < count) {
                return std::nullopt;
            }
            auto const size = count * sizeof(T);
            return std::pair{bytes.subspan(padding, size), bytes.subspan(padding + size)};
        }


        /*
            Owned element storage:
                Shared by every type which owns or references a contiguous run of elements.
                The elements' representations are written as one aligned block, the copies in the block are
                neutralised, then each original element's tail follows in element order.
        */


        template<imageable T>
        void serialise_elements(T const* const elements, std::size_t const count, output_sink auto& sink) {
            for (auto& copy : append_objects(sink, elements, count)) {
                imprint::neutralise(copy);
            }
            // Copies are done with, the sink may now be extended.
            for (std::size_t i = 0; i < count; ++i) {
                imprint::serialise_tail(elements[i], sink);
            }
        }


        // Claims storage for count elements from the front of bytes and reconstructs each element in turn.
        // Returns the elements and the unclaimed remainder.
        template<imageable T>
        [[nodiscard]]
        std::optional<std::pair<std::span<T>, mutable_bytes_span>> reconstruct_elements(std::size_t const count,
                mutable_bytes_span const bytes) {
            auto const claimed = claim_objects<T>(bytes, count);
            if (!claimed) {
                return std::nullopt;
            }
            auto rest = claimed->second;
            auto const elements = bytes_to_typed<T>(claimed->first, count);
            for (auto& element : elements) {
                auto const next = imprint::reconstruct(element, rest);
                if (!next) {
                    return std::nullopt;
                }
                rest = *next;
            }
            return std::pair{elements, rest};
        }


        // Checks that elements is exactly where reconstruct_elements() would have put it, and that each element
        // validates in turn.
        template<imageable T>
        [[nodiscard]]
        std::optional<const_bytes_span> validate_elements(T const* const elements, std::size_t const count,
                const_bytes_span const bytes) {
            auto const claimed = claim_objects<T>(bytes, count);
            if (!claimed) {
                return std::nullopt;
            }
            if (typed_to_bytes(elements, count).data() != claimed->first.data()) {
                return std::nullopt;
            }
            auto rest = claimed->second;
            for (std::size_t i = 0; i < count; ++i) {
                auto const next = imprint::validate(elements[i], rest);
                if (!next) {
                    return std::nullopt;
                }
                rest = *next;
            }
            return rest;
        }

    }

}
