#pragma once

// This file contains the implementation of ByteCursor.
// Do not include this file directly - it is included by byte_cursor.hpp

#include <cstring>
#include <span>
#include <string>
#include "../reader_base.hpp"
#include "../types.hpp"
#include "../types/result.hpp"

#ifndef TIFFENTRY_BYTE_CURSOR_HEADER
#include "../byte_cursor.hpp" // for linters
#endif

namespace tiffentry {

template <RawReader Reader, std::endian SourceEndian>
ByteCursor<Reader, SourceEndian>::ByteCursor(const Reader& reader, std::size_t position) noexcept
    : reader_(&reader), position_(position) {}

template <RawReader Reader, std::endian SourceEndian>
inline Result<void> ByteCursor<Reader, SourceEndian>::read_exact(void* dest, std::size_t size) noexcept {
    auto view_result = reader_->read(position_, size);
    if (view_result.is_error()) {
        return view_result.error();
    }

    const auto& view = view_result.value();
    if (view.size() < size) {
        return Err(Error::Code::UnexpectedEndOfFile,
                   "Incomplete read at offset " + std::to_string(position_) + ": expected " +
                   std::to_string(size) + " bytes, got " + std::to_string(view.size()));
    }

    std::memcpy(dest, view.data().data(), size);
    position_ += size;
    return Ok();
}

template <RawReader Reader, std::endian SourceEndian>
template <typename T>
    requires (std::is_integral_v<T> && std::is_unsigned_v<T>)
inline Result<T> ByteCursor<Reader, SourceEndian>::read_uint() noexcept {
    T value;
    auto result = read_exact(&value, sizeof(T));
    if (result.is_error()) {
        return result.error();
    }
    convert_endianness<T, SourceEndian, std::endian::native>(value);
    return Ok(value);
}

template <RawReader Reader, std::endian SourceEndian>
inline Result<void> ByteCursor<Reader, SourceEndian>::read_bytes(std::span<uint8_t> out) noexcept {
    if (out.empty()) {
        return Ok();
    }
    return read_exact(out.data(), out.size());
}

template <RawReader Reader, std::endian SourceEndian>
inline std::size_t ByteCursor<Reader, SourceEndian>::position() const noexcept {
    return position_;
}

template <RawReader Reader, std::endian SourceEndian>
inline Result<void> ByteCursor<Reader, SourceEndian>::seek(std::size_t position) noexcept {
    auto size_result = reader_->size();
    if (size_result.is_error()) {
        return Err(size_result.error().code, "Failed to query size for seek: " + size_result.error().message);
    }
    if (position > size_result.value()) {
        return Err(Error::Code::OutOfBounds,
                   "Seek to " + std::to_string(position) + " beyond size " + std::to_string(size_result.value()));
    }
    position_ = position;
    return Ok();
}

template <RawReader Reader, std::endian SourceEndian>
inline Result<std::size_t> ByteCursor<Reader, SourceEndian>::remaining() const noexcept {
    auto size_result = reader_->size();
    if (size_result.is_error()) {
        return Err(size_result.error().code, "Failed to query size: " + size_result.error().message);
    }
    const std::size_t total = size_result.value();
    return Ok(total > position_ ? total - position_ : std::size_t{0});
}

template <RawReader Reader, std::endian SourceEndian>
inline const Reader& ByteCursor<Reader, SourceEndian>::reader() const noexcept {
    return *reader_;
}

template <RawReader Reader>
inline Result<std::endian> detect_byte_order(const Reader& reader) noexcept {
    auto view_result = reader.read(0, 2);
    if (view_result.is_error()) {
        return Err(view_result.error().code, "Failed to read byte order mark: " + view_result.error().message);
    }

    const auto& view = view_result.value();
    if (view.size() < 2) {
        return Err(Error::Code::UnexpectedEndOfFile, "File too small for a byte order mark");
    }

    char mark[2];
    std::memcpy(mark, view.data().data(), 2);
    if (mark[0] == little_endian_mark[0] && mark[1] == little_endian_mark[1]) {
        return Ok(std::endian::little);
    }
    if (mark[0] == big_endian_mark[0] && mark[1] == big_endian_mark[1]) {
        return Ok(std::endian::big);
    }
    return Err(Error::Code::InvalidHeader, "Unknown byte order mark");
}

} // namespace tiffentry
