#pragma once

/**
 * @file entry.hpp
 * @brief Decoding of the fixed-size IFD entry records of TIFF and BigTIFF
 *
 * Each IFD entry has the following layout (integers in the file's byte order):
 *
 * | Classic TIFF (12 bytes) | BigTIFF (20 bytes) | Field       |
 * |-------------------------|--------------------|-------------|
 * | 0-1                     | 0-1                | TagID       |
 * | 2-3                     | 2-3                | TypeID      |
 * | 4-7                     | 4-11               | Count       |
 * | 8-11                    | 12-19              | ValueOffset |
 *
 * The ValueOffset field is either the value itself, when count * size(type) fits
 * in the field, or the file offset of the value. Which case applies depends on the
 * type and count, so it is kept here as the raw bytes read from the file.
 *
 * Entry and EntryBig are immutable values. They are only created by the decode
 * functions below, which return the reader's error unchanged when a field cannot
 * be read.
 *
 * @code{.cpp}
 * using namespace tiffentry;
 *
 * BufferViewReader reader(std::span<const std::byte>(bytes));
 * ByteCursor<BufferViewReader, std::endian::big> cursor(reader);
 *
 * auto entry = decode_entry(cursor);
 * if (!entry) {
 *     // Directory is truncated or corrupt at this entry
 *     return;
 * }
 * uint16_t tag = entry.value().tag_id();
 * @endcode
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <vector>
#include "reader_base.hpp"
#include "types.hpp"
#include "types/result.hpp"

namespace tiffentry {

class Entry;
class EntryBig;

template <EntryReader Reader>
[[nodiscard]] Result<Entry> decode_entry(Reader& reader) noexcept;

template <EntryReader Reader>
[[nodiscard]] Result<EntryBig> decode_entry_big(Reader& reader) noexcept;

/// @brief One 12-byte entry of a Classic TIFF IFD
class Entry {
public:
    using count_type = uint32_t;
    using value_offset_type = std::array<uint8_t, 4>;

    static constexpr std::size_t encoded_size = 12;

    /// @brief Tag identifier (bytes 0-1)
    [[nodiscard]] constexpr uint16_t tag_id() const noexcept { return tag_id_; }

    /// @brief Data type identifier (bytes 2-3), not validated
    [[nodiscard]] constexpr uint16_t type_id() const noexcept { return type_id_; }

    /// @brief Number of values of the data type (bytes 4-7)
    [[nodiscard]] constexpr count_type count() const noexcept { return count_; }

    /// @brief Inline value or offset, as stored (bytes 8-11)
    [[nodiscard]] constexpr const value_offset_type& value_offset() const noexcept { return value_offset_; }

    friend constexpr bool operator==(const Entry&, const Entry&) noexcept = default;

private:
    uint16_t tag_id_;
    uint16_t type_id_;
    count_type count_;
    value_offset_type value_offset_;

    constexpr Entry(uint16_t tag_id, uint16_t type_id, count_type count, const value_offset_type& value_offset) noexcept
        : tag_id_(tag_id), type_id_(type_id), count_(count), value_offset_(value_offset) {}

    template <EntryReader Reader>
    friend Result<Entry> decode_entry(Reader& reader) noexcept;
};

/// @brief One 20-byte entry of a BigTIFF IFD
class EntryBig {
public:
    using count_type = uint64_t;
    using value_offset_type = std::array<uint8_t, 8>;

    static constexpr std::size_t encoded_size = 20;

    /// @brief Tag identifier (bytes 0-1)
    [[nodiscard]] constexpr uint16_t tag_id() const noexcept { return tag_id_; }

    /// @brief Data type identifier (bytes 2-3), not validated
    [[nodiscard]] constexpr uint16_t type_id() const noexcept { return type_id_; }

    /// @brief Number of values of the data type (bytes 4-11)
    [[nodiscard]] constexpr count_type count() const noexcept { return count_; }

    /// @brief Inline value or offset, as stored (bytes 12-19)
    [[nodiscard]] constexpr const value_offset_type& value_offset() const noexcept { return value_offset_; }

    friend constexpr bool operator==(const EntryBig&, const EntryBig&) noexcept = default;

private:
    uint16_t tag_id_;
    uint16_t type_id_;
    count_type count_;
    value_offset_type value_offset_;

    constexpr EntryBig(uint16_t tag_id, uint16_t type_id, count_type count, const value_offset_type& value_offset) noexcept
        : tag_id_(tag_id), type_id_(type_id), count_(count), value_offset_(value_offset) {}

    template <EntryReader Reader>
    friend Result<EntryBig> decode_entry_big(Reader& reader) noexcept;
};

static_assert(Entry::encoded_size == entry_size<TiffFormatType::Classic>);
static_assert(EntryBig::encoded_size == entry_size<TiffFormatType::BigTIFF>);

/// Entry type of a TIFF format variant
template <TiffFormatType TiffFormat>
using EntryType = std::conditional_t<TiffFormat == TiffFormatType::Classic, Entry, EntryBig>;

/**
 * @brief Decode one Classic TIFF entry (12 bytes)
 *
 * Reads tag (16 bits), type (16 bits), count (32 bits) and the 4 raw value/offset
 * bytes, in that order.
 *
 * @param reader Sequential reader positioned at the start of the entry
 * @return The decoded entry, or the first error reported by the reader, unchanged
 *
 * @note On success the reader has advanced by 12 bytes. On failure it has advanced
 *       by the size of the fields read before the failing one; the caller owns recovery.
 */
template <EntryReader Reader>
[[nodiscard]] Result<Entry> decode_entry(Reader& reader) noexcept;

/**
 * @brief Decode one BigTIFF entry (20 bytes)
 *
 * Same as decode_entry() with a 64-bit count and 8 raw value/offset bytes.
 */
template <EntryReader Reader>
[[nodiscard]] Result<EntryBig> decode_entry_big(Reader& reader) noexcept;

/// @brief Decode one entry of the given format
template <TiffFormatType TiffFormat, EntryReader Reader>
[[nodiscard]] Result<EntryType<TiffFormat>> decode_entry_for(Reader& reader) noexcept;

/**
 * @brief Decode a run of consecutive entries, such as the entry array of one IFD
 *
 * Decoding stops at the first entry that cannot be read; its error is returned
 * unchanged and the entries decoded before it are discarded.
 *
 * @param reader Sequential reader positioned at the first entry
 * @param num_entries Number of entries to decode
 */
template <TiffFormatType TiffFormat, EntryReader Reader>
[[nodiscard]] Result<std::vector<EntryType<TiffFormat>>> decode_entries(Reader& reader, std::size_t num_entries) noexcept;

} // namespace tiffentry

#define TIFFENTRY_ENTRY_HEADER
#include "impl/entry_impl.hpp"
