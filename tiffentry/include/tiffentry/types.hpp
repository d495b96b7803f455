#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace tiffentry {

/// @brief Byte-swap an integral value
/// @tparam T Integral type to swap
/// @param value The value to byte-swap
/// @return The byte-swapped value
/// @note For 1-byte types, returns the value unchanged
template <typename T>
[[nodiscard]] constexpr T byteswap(T value) noexcept requires std::is_integral_v<T>;

/// @brief Convert an integral value from source endianness to target endianness
/// @tparam T Integral type of the value to convert
/// @tparam SourceEndian Source endianness
/// @tparam TargetEndian Target endianness
/// @param value The value to convert (modified in place)
template <typename T, std::endian SourceEndian, std::endian TargetEndian>
constexpr void convert_endianness([[maybe_unused]] T& value) noexcept requires std::is_integral_v<T>;

/// @brief TIFF format type discriminator
enum class TiffFormatType : uint16_t {
    Classic, ///< Classic TIFF (32-bit counts and offsets, 12-byte entries)
    BigTIFF  ///< BigTIFF (64-bit counts and offsets, 20-byte entries)
};

/// @brief Size in bytes of one IFD entry record for a format
template <TiffFormatType TiffFormat>
inline constexpr std::size_t entry_size = (TiffFormat == TiffFormatType::Classic) ? 12 : 20;

/// Byte order marks found in the first two bytes of a TIFF file
inline constexpr char little_endian_mark[2] = {'I', 'I'};
inline constexpr char big_endian_mark[2] = {'M', 'M'};

} // namespace tiffentry

#define TIFFENTRY_TYPES_HEADER
#include "impl/types_impl.hpp"
