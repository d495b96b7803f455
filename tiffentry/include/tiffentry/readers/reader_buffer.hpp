#pragma once

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <span>
#include <vector>
#include "../reader_base.hpp"

namespace tiffentry {
namespace buffer_impl {

/// Read-only view for borrowed buffer data (zero-copy)
class BorrowedBufferReadView {
private:
    std::span<const std::byte> data_;

public:
    BorrowedBufferReadView() noexcept = default;

    explicit BorrowedBufferReadView(std::span<const std::byte> data) noexcept
        : data_(data) {}

    [[nodiscard]] std::span<const std::byte> data() const noexcept { return data_; }
    [[nodiscard]] std::size_t size() const noexcept { return data_.size(); }
    [[nodiscard]] bool empty() const noexcept { return data_.empty(); }

    BorrowedBufferReadView(BorrowedBufferReadView&&) noexcept = default;
    BorrowedBufferReadView& operator=(BorrowedBufferReadView&&) noexcept = default;
    BorrowedBufferReadView(const BorrowedBufferReadView&) = delete;
    BorrowedBufferReadView& operator=(const BorrowedBufferReadView&) = delete;
};

static_assert(DataReadOnlyView<BorrowedBufferReadView>, "BorrowedBufferReadView must satisfy DataReadOnlyView concept");

/// Clamp a positioned read against a buffer, shared by the buffer readers
[[nodiscard]] inline Result<std::span<const std::byte>> slice(
    std::span<const std::byte> buffer, std::size_t offset, std::size_t size) noexcept {
    if (offset >= buffer.size()) [[unlikely]] {
        return Err(Error::Code::OutOfBounds, "Read offset " + std::to_string(offset) +
                   " beyond buffer size " + std::to_string(buffer.size()));
    }
    std::size_t bytes_to_read = std::min(size, buffer.size() - offset);
    return Ok(buffer.subspan(offset, bytes_to_read));
}

} // namespace buffer_impl

/// In-memory buffer view reader (borrowed, zero-copy, thread-safe for immutable buffers)
/// The caller keeps the bytes alive for the lifetime of the reader and its views.
class BufferViewReader {
private:
    std::span<const std::byte> buffer_;

public:
    using ReadViewType = buffer_impl::BorrowedBufferReadView;

    static constexpr bool read_must_allocate = false;

    BufferViewReader() noexcept = default;

    explicit BufferViewReader(std::span<const std::byte> buffer) noexcept
        : buffer_(buffer) {}

    // Template constructor for any span type
    template <typename T>
    explicit BufferViewReader(std::span<const T> data) noexcept
        : buffer_(std::as_bytes(data)) {}

    [[nodiscard]] Result<ReadViewType> read(std::size_t offset, std::size_t size) const noexcept {
        auto slice_result = buffer_impl::slice(buffer_, offset, size);
        if (slice_result.is_error()) [[unlikely]] {
            return slice_result.error();
        }
        return Ok(buffer_impl::BorrowedBufferReadView(slice_result.value()));
    }

    [[nodiscard]] Result<void> read_into(void* dest_buffer, std::size_t offset, std::size_t size) const noexcept {
        auto slice_result = buffer_impl::slice(buffer_, offset, size);
        if (slice_result.is_error()) [[unlikely]] {
            return slice_result.error();
        }
        const auto& bytes = slice_result.value();
        if (bytes.size() < size) {
            return Err(Error::Code::UnexpectedEndOfFile,
                       "Incomplete read at offset " + std::to_string(offset));
        }
        std::memcpy(dest_buffer, bytes.data(), bytes.size());
        return Ok();
    }

    [[nodiscard]] Result<std::size_t> size() const noexcept {
        return Ok(buffer_.size());
    }

    [[nodiscard]] bool is_valid() const noexcept {
        // An empty buffer is still valid - it just has zero size
        return true;
    }
};

static_assert(RawReader<BufferViewReader>, "BufferViewReader must satisfy RawReader concept");

/// In-memory owned buffer reader (backed by vector, thread-safe for immutable buffers)
class BufferReader {
private:
    std::vector<std::byte> buffer_;

public:
    using ReadViewType = buffer_impl::BorrowedBufferReadView;

    static constexpr bool read_must_allocate = false;

    BufferReader() noexcept = default;

    // Constructor from existing data (copy)
    explicit BufferReader(std::span<const std::byte> data)
        : buffer_(data.begin(), data.end()) {}

    // Constructor taking ownership of a vector
    explicit BufferReader(std::vector<std::byte>&& data) noexcept
        : buffer_(std::move(data)) {}

    // Template constructor from any span type (copy)
    template <typename T>
    explicit BufferReader(std::span<const T> data)
        : buffer_(std::as_bytes(data).begin(), std::as_bytes(data).end()) {}

    [[nodiscard]] Result<ReadViewType> read(std::size_t offset, std::size_t size) const noexcept {
        auto slice_result = buffer_impl::slice(std::span<const std::byte>(buffer_), offset, size);
        if (slice_result.is_error()) [[unlikely]] {
            return slice_result.error();
        }
        return Ok(buffer_impl::BorrowedBufferReadView(slice_result.value()));
    }

    [[nodiscard]] Result<void> read_into(void* dest_buffer, std::size_t offset, std::size_t size) const noexcept {
        return BufferViewReader(std::span<const std::byte>(buffer_)).read_into(dest_buffer, offset, size);
    }

    [[nodiscard]] Result<std::size_t> size() const noexcept {
        return Ok(buffer_.size());
    }

    [[nodiscard]] bool is_valid() const noexcept {
        return true;  // Owned buffers are always valid (even if empty)
    }
};

static_assert(RawReader<BufferReader>, "BufferReader must satisfy RawReader concept");

} // namespace tiffentry
