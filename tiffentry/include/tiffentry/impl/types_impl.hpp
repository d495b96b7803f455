// Do not include this file directly. Include "tiffentry/types.hpp" instead.

#pragma once

#include <bit>
#include <cstdint>
#include <type_traits>

#ifndef TIFFENTRY_TYPES_HEADER
#include "../types.hpp" // for linters
#endif

namespace tiffentry {

// byteswap template

template <typename T>
constexpr T byteswap(T value) noexcept requires std::is_integral_v<T> {
    using U = std::make_unsigned_t<T>;
    U bits = static_cast<U>(value);
    if constexpr (sizeof(T) == 1) {
        return value;
    } else if constexpr (sizeof(T) == 2) {
        return static_cast<T>(static_cast<U>((bits >> 8) | (bits << 8)));
    } else if constexpr (sizeof(T) == 4) {
        return static_cast<T>(
            ((bits & 0xFF000000u) >> 24) |
            ((bits & 0x00FF0000u) >> 8)  |
            ((bits & 0x0000FF00u) << 8)  |
            ((bits & 0x000000FFu) << 24)
        );
    } else if constexpr (sizeof(T) == 8) {
        return static_cast<T>(
            ((bits & 0xFF00000000000000ULL) >> 56) |
            ((bits & 0x00FF000000000000ULL) >> 40) |
            ((bits & 0x0000FF0000000000ULL) >> 24) |
            ((bits & 0x000000FF00000000ULL) >> 8)  |
            ((bits & 0x00000000FF000000ULL) << 8)  |
            ((bits & 0x0000000000FF0000ULL) << 24) |
            ((bits & 0x000000000000FF00ULL) << 40) |
            ((bits & 0x00000000000000FFULL) << 56)
        );
    } else {
        static_assert(sizeof(T) <= 8, "byteswap supports integers up to 64 bits");
        return value;
    }
}

// convert_endianness template

template <typename T, std::endian SourceEndian, std::endian TargetEndian>
constexpr void convert_endianness([[maybe_unused]] T& value) noexcept requires std::is_integral_v<T> {
    if constexpr (SourceEndian != TargetEndian) {
        value = byteswap(value);
    }
}

} // namespace tiffentry
