#pragma once

// This file contains the implementation of entry decoding.
// Do not include this file directly - it is included by entry.hpp

#include <algorithm>
#include <cstdint>
#include <new>
#include <span>
#include <string>
#include <utility>
#include <vector>
#include "../reader_base.hpp"
#include "../types/result.hpp"

#ifndef TIFFENTRY_ENTRY_HEADER
#include "../entry.hpp" // for linters
#endif

namespace tiffentry {

template <EntryReader Reader>
inline Result<Entry> decode_entry(Reader& reader) noexcept {
    auto tag_id = reader.template read_uint<uint16_t>();
    if (tag_id.is_error()) {
        return tag_id.error();
    }
    auto type_id = reader.template read_uint<uint16_t>();
    if (type_id.is_error()) {
        return type_id.error();
    }
    auto count = reader.template read_uint<Entry::count_type>();
    if (count.is_error()) {
        return count.error();
    }
    Entry::value_offset_type value_offset{};
    auto offset_result = reader.read_bytes(std::span<uint8_t>(value_offset));
    if (offset_result.is_error()) {
        return offset_result.error();
    }
    return Entry(tag_id.value(), type_id.value(), count.value(), value_offset);
}

template <EntryReader Reader>
inline Result<EntryBig> decode_entry_big(Reader& reader) noexcept {
    auto tag_id = reader.template read_uint<uint16_t>();
    if (tag_id.is_error()) {
        return tag_id.error();
    }
    auto type_id = reader.template read_uint<uint16_t>();
    if (type_id.is_error()) {
        return type_id.error();
    }
    auto count = reader.template read_uint<EntryBig::count_type>();
    if (count.is_error()) {
        return count.error();
    }
    EntryBig::value_offset_type value_offset{};
    auto offset_result = reader.read_bytes(std::span<uint8_t>(value_offset));
    if (offset_result.is_error()) {
        return offset_result.error();
    }
    return EntryBig(tag_id.value(), type_id.value(), count.value(), value_offset);
}

template <TiffFormatType TiffFormat, EntryReader Reader>
inline Result<EntryType<TiffFormat>> decode_entry_for(Reader& reader) noexcept {
    if constexpr (TiffFormat == TiffFormatType::Classic) {
        return decode_entry(reader);
    } else {
        return decode_entry_big(reader);
    }
}

template <TiffFormatType TiffFormat, EntryReader Reader>
inline Result<std::vector<EntryType<TiffFormat>>> decode_entries(Reader& reader, std::size_t num_entries) noexcept {
    // num_entries may come from the file; storage grows with the entries read
    constexpr std::size_t max_reserved_entries = 4096;

    std::vector<EntryType<TiffFormat>> entries;
    try {
        entries.reserve(std::min(num_entries, max_reserved_entries));

        for (std::size_t i = 0; i < num_entries; ++i) {
            auto entry = decode_entry_for<TiffFormat>(reader);
            if (entry.is_error()) {
                return entry.error();
            }
            entries.push_back(std::move(entry).value());
        }
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::OutOfBounds,
                   "Cannot allocate " + std::to_string(entries.size() + 1) + " directory entries");
    }
    return Ok(std::move(entries));
}

} // namespace tiffentry
