#pragma once

#include <climits>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <optional>
#include <span>
#include <string>
#include <type_traits>
#include <utility>


namespace imprint {

    static_assert(CHAR_BIT == 8, "Imprint only supports platforms with 8-bit bytes");


    using const_bytes_span = std::span<std::byte const>;
    using mutable_bytes_span = std::span<std::byte>;


    // Alignment that the start of every output sink and every buffer handed to decode must have.
    // Imageable types may not be aligned more strictly than this.
    inline constexpr std::size_t image_alignment = alignof(std::max_align_t);


    // Address written into pointer fields when they are neutralised.
    // Invalid but non-zero, so a neutralised pointer is distinguishable from a null one.
    inline constexpr std::uintptr_t neutral_address = 0x1;


    namespace detail {

        template<typename T>
        [[nodiscard]]
        T* neutral_pointer() noexcept {
            return reinterpret_cast<T*>(neutral_address);
        }

    }


    // A growable, append-only container of bytes which images are written into.
    // It requires:
    //   - extend(count) member function which extends the current buffer by count bytes, keeping the previous content.
    //       Returns the new value of span().
    //   - span() member function which returns an std::span of the whole content. This span may be invalidated by
    //       calls to extend().
    // The storage must begin at an address aligned to image_alignment, as positions within an image are aligned
    // relative to its start.
    // Output sinks are not views, and are always passed by reference.
    template<typename T>
    concept output_sink = requires(T& t, std::size_t const count) {
        { t.extend(count) } -> std::same_as<mutable_bytes_span>;
        { t.span() } noexcept -> std::same_as<mutable_bytes_span>;
    };


    // Describes how a type's indirectly owned memory is written after its header and how it is recovered.
    // A type is imageable only if this is specialised for it. A specialisation provides:
    //   - static void serialise_tail(T const& value, output_sink auto& sink)
    //       Appends to sink everything required to later reconstruct the memory value refers to. Must not modify
    //       value.
    //   - static void neutralise(T& value) noexcept
    //       Edits the fields of value (never the memory they point to) to remove raw addresses. Only ever invoked on
    //       a copy residing in the output sink.
    //   - static std::optional<mutable_bytes_span> reconstruct(T& value, mutable_bytes_span bytes)
    //       Claims the leading bytes of bytes that back value's owned memory, points value's fields at them, and
    //       returns the unclaimed remainder. Returns std::nullopt if bytes is too short.
    //   - static std::optional<const_bytes_span> validate(T const& value, const_bytes_span bytes)
    //       Checks that value's fields already point at the leading bytes of bytes, exactly as reconstruct would
    //       have left them. Returns the remainder, or std::nullopt on truncation or address mismatch.
    // The order in which serialise_tail writes must be the order in which reconstruct and validate consume.
    template<typename T>
    struct image_traits;


    // image_traits base for types that own no indirect memory.
    template<typename T>
    struct trivial_image_traits {
        static constexpr void serialise_tail(T const&, output_sink auto&) noexcept {}

        static constexpr void neutralise(T&) noexcept {}

        [[nodiscard]]
        static constexpr std::optional<mutable_bytes_span> reconstruct(T&, mutable_bytes_span const bytes) noexcept {
            return bytes;
        }

        [[nodiscard]]
        static constexpr std::optional<const_bytes_span> validate(T const&, const_bytes_span const bytes) noexcept {
            return bytes;
        }
    };


    namespace detail {

        // Archetype implementation of output_sink.
        // Only exists for concept checking, don't use anywhere else!
        struct output_sink_archetype {
            output_sink_archetype() = delete;
            output_sink_archetype(output_sink_archetype&&) = delete;
            output_sink_archetype(output_sink_archetype const&) = delete;
            ~output_sink_archetype() = delete;

            output_sink_archetype& operator=(output_sink_archetype&&) = delete;
            output_sink_archetype& operator=(output_sink_archetype const&) = delete;

            mutable_bytes_span extend(std::size_t);
            mutable_bytes_span span() noexcept;
        };

    }


    template<typename T>
    concept imageable = std::is_object_v<T> && !std::is_const_v<T> && !std::is_volatile_v<T>
        && (alignof(T) <= image_alignment)
        && requires(T& value, T const& const_value, detail::output_sink_archetype& sink,
                mutable_bytes_span const mutable_bytes, const_bytes_span const const_bytes) {
            image_traits<T>::serialise_tail(const_value, sink);
            image_traits<T>::neutralise(value);
            { image_traits<T>::reconstruct(value, mutable_bytes) } -> std::same_as<std::optional<mutable_bytes_span>>;
            { image_traits<T>::validate(const_value, const_bytes) } -> std::same_as<std::optional<const_bytes_span>>;
        };


    // Entry points for the four operations. Implementations of image_traits should call these for subobjects, rather
    // than image_traits directly.

    template<imageable T>
    constexpr void serialise_tail(T const& value, output_sink auto& sink) {
        image_traits<T>::serialise_tail(value, sink);
    }

    template<imageable T>
    constexpr void neutralise(T& value) noexcept {
        image_traits<T>::neutralise(value);
    }

    template<imageable T>
    [[nodiscard]]
    constexpr std::optional<mutable_bytes_span> reconstruct(T& value, mutable_bytes_span const bytes) {
        return image_traits<T>::reconstruct(value, bytes);
    }

    template<imageable T>
    [[nodiscard]]
    constexpr std::optional<const_bytes_span> validate(T const& value, const_bytes_span const bytes) {
        return image_traits<T>::validate(value, bytes);
    }


    // Helpers for implementing image_traits of types composed of several imageable subobjects.
    // Each applies the operation to the subobjects in argument order, which should be their declared order.

    template<imageable... Ts>
    constexpr void serialise_tail_each(output_sink auto& sink, Ts const&... values) {
        (imprint::serialise_tail(values, sink), ...);
    }

    template<imageable... Ts>
    constexpr void neutralise_each(Ts&... values) noexcept {
        (imprint::neutralise(values), ...);
    }

    // Threads bytes through each subobject's reconstruct. Stops at the first failure.
    template<imageable... Ts>
    [[nodiscard]]
    constexpr std::optional<mutable_bytes_span> reconstruct_each(mutable_bytes_span const bytes, Ts&... values) {
        std::optional<mutable_bytes_span> rest{bytes};
        static_cast<void>(((rest = imprint::reconstruct(values, *rest)).has_value() && ...));
        return rest;
    }

    // Threads bytes through each subobject's validate. Stops at the first failure.
    template<imageable... Ts>
    [[nodiscard]]
    constexpr std::optional<const_bytes_span> validate_each(const_bytes_span const bytes, Ts const&... values) {
        std::optional<const_bytes_span> rest{bytes};
        static_cast<void>(((rest = imprint::validate(values, *rest)).has_value() && ...));
        return rest;
    }


    // Base for exceptions relating to images.
    class image_error : public std::exception {
    public:
        virtual ~image_error() = 0;
    };

    inline image_error::~image_error() = default;


    // Thrown when a buffer ends before the image it should contain.
    class truncated_buffer_error : public image_error {
    public:
        truncated_buffer_error(std::string message) noexcept :
            _message{std::move(message)}
        {}

        [[nodiscard]]
        char const* what() const noexcept override {
            return _message.c_str();
        }

    private:
        std::string _message;
    };


    // Thrown when a buffer does not hold a previously decoded image at its current address.
    // This can occur if the buffer was moved, modified, truncated, or never decoded.
    class validation_error : public image_error {
    public:
        validation_error(std::string message) noexcept :
            _message{std::move(message)}
        {}

        [[nodiscard]]
        char const* what() const noexcept override {
            return _message.c_str();
        }

    private:
        std::string _message;
    };

}
