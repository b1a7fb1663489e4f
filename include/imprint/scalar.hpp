#pragma once

#include <concepts>
#include <cstddef>
#include <type_traits>
#include <variant>

#include "common.hpp"


namespace imprint {

    /*
        Scalars:
            Integers, floating point numbers, bool, character types, enumerations (which includes std::byte), and
            std::monostate. Their header is their entire representation; they own no other memory.
    */


    template<typename T>
    concept scalar = std::is_arithmetic_v<T> || std::is_enum_v<T> || std::same_as<T, std::monostate>;


    template<scalar S> requires (!std::is_const_v<S> && !std::is_volatile_v<S>)
    struct image_traits<S> : trivial_image_traits<S> {};

}
