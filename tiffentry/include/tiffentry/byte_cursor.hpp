#pragma once

/**
 * @file byte_cursor.hpp
 * @brief Sequential, endian-aware reading on top of a RawReader
 *
 * RawReader implementations only provide positioned reads. Entry decoders need a
 * reader that walks forward field by field and converts integers from the byte
 * order of the file. ByteCursor provides exactly that and satisfies EntryReader.
 *
 * ## Example Usage
 *
 * @code{.cpp}
 * using namespace tiffentry;
 *
 * StreamFileReader file("image.tif");
 * auto order = detect_byte_order(file);
 * if (!order || order.value() != std::endian::big) {
 *     return;
 * }
 *
 * ByteCursor<StreamFileReader, std::endian::big> cursor(file, ifd_offset + 2);
 * auto entry = decode_entry(cursor);
 * @endcode
 *
 * @note A cursor is a small value (reader pointer + position). It is not thread-safe,
 *       but any number of cursors may share one thread-safe RawReader.
 */

#include <bit>
#include <cstddef>
#include <cstdint>
#include <span>
#include <type_traits>
#include "reader_base.hpp"
#include "types.hpp"
#include "types/result.hpp"

namespace tiffentry {

/**
 * @brief Forward-only cursor decoding fixed-width fields from a RawReader
 *
 * @tparam Reader The underlying positioned reader (must satisfy `RawReader`)
 * @tparam SourceEndian Byte order of integer fields in the source
 *
 * A field is either consumed whole or not at all: when a read fails the position
 * stays at the start of that field.
 */
template <RawReader Reader, std::endian SourceEndian = std::endian::native>
class ByteCursor {
private:
    const Reader* reader_;
    std::size_t position_;

    [[nodiscard]] Result<void> read_exact(void* dest, std::size_t size) noexcept;

public:
    static constexpr std::endian byte_order = SourceEndian;

    /// @brief Create a cursor at a given absolute offset of the reader
    /// @param reader Reader to decode from (must outlive the cursor)
    /// @param position Starting offset in bytes
    explicit ByteCursor(const Reader& reader, std::size_t position = 0) noexcept;

    /// @brief Read one unsigned integer in SourceEndian and convert it to native order
    /// @tparam T Unsigned integral type; sizeof(T) bytes are consumed
    /// @retval Error::Code::OutOfBounds The cursor is at or beyond the end of the data
    /// @retval Error::Code::UnexpectedEndOfFile Fewer than sizeof(T) bytes remain
    /// @retval Error::Code::ReadError The underlying reader failed
    template <typename T>
        requires (std::is_integral_v<T> && std::is_unsigned_v<T>)
    [[nodiscard]] Result<T> read_uint() noexcept;

    /// @brief Copy out.size() raw bytes, without any byte order conversion
    /// @param out Destination, filled completely on success
    [[nodiscard]] Result<void> read_bytes(std::span<uint8_t> out) noexcept;

    /// @brief Current absolute offset
    [[nodiscard]] std::size_t position() const noexcept;

    /// @brief Move to an absolute offset (the end of the data is a valid position)
    /// @retval Error::Code::OutOfBounds Offset is beyond the end of the data
    [[nodiscard]] Result<void> seek(std::size_t position) noexcept;

    /// @brief Number of bytes between the position and the end of the data
    [[nodiscard]] Result<std::size_t> remaining() const noexcept;

    [[nodiscard]] const Reader& reader() const noexcept;
};

/**
 * @brief Read the byte order mark at the start of a TIFF or BigTIFF file
 *
 * @return std::endian::little for "II", std::endian::big for "MM"
 * @retval Error::Code::InvalidHeader The first two bytes are not a byte order mark
 * @retval Error::Code::UnexpectedEndOfFile The data is shorter than two bytes
 */
template <RawReader Reader>
[[nodiscard]] Result<std::endian> detect_byte_order(const Reader& reader) noexcept;

} // namespace tiffentry

#define TIFFENTRY_BYTE_CURSOR_HEADER
#include "impl/byte_cursor_impl.hpp"
