#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>
#include "types/result.hpp"

namespace tiffentry {

/// Concept for a read-only view into data with RAII lifetime management
/// Only one thread at a time should access the view
template <typename T>
concept DataReadOnlyView = requires(T view) {
    // Access to the underlying data
    { view.data() } -> std::same_as<std::span<const std::byte>>;

    // Size of the data
    { view.size() } -> std::same_as<std::size_t>;

    // Check if view is empty
    { view.empty() } -> std::same_as<bool>;

    // Must be movable for Result<T> and transferring ownership
    requires std::move_constructible<T>;
    requires std::is_nothrow_move_constructible_v<T>;
};

/// Concept for a raw reader that provides thread-safe positioned reads
template <typename T>
concept RawReader = requires(const T reader, void* buffer, std::size_t offset, std::size_t size) {
    // Read operation returning a view (implementation may use zero-copy or allocate)
    // Calls to read() must be threadsafe. Several threads may use the results
    // of read() simultaneously.
    // A read that crosses the end of the data returns a shorter view; a read
    // starting at or after the end fails with OutOfBounds.
    { reader.read(offset, size) } -> std::same_as<Result<typename T::ReadViewType>>;
    requires DataReadOnlyView<typename T::ReadViewType>;

    // Alternative read_into() method that reads directly into provided buffer
    { reader.read_into(buffer, offset, size) } -> std::same_as<Result<void>>;

    // Get total size of the readable content
    { reader.size() } -> std::same_as<Result<std::size_t>>;

    // Check if reader is valid/open
    { reader.is_valid() } -> std::same_as<bool>;

    // Hint whether read() must allocate new buffer or can return zero-copy views
    // If true, read_into() should be preferred for performance
    { T::read_must_allocate } -> std::convertible_to<bool>;
};

/// Concept for a sequential reader that entry decoders consume
///
/// The byte order of integer fields is a property of the reader.
/// Each successful call advances the reader by exactly the field width.
/// A failed call reports the failure and does not consume the field.
template <typename T>
concept EntryReader = requires(T reader, std::span<uint8_t> out) {
    { reader.template read_uint<uint16_t>() } -> std::same_as<Result<uint16_t>>;
    { reader.template read_uint<uint32_t>() } -> std::same_as<Result<uint32_t>>;
    { reader.template read_uint<uint64_t>() } -> std::same_as<Result<uint64_t>>;
    { reader.read_bytes(out) } -> std::same_as<Result<void>>;
};

} // namespace tiffentry
