#pragma once

/// Main header for the TIFF/BigTIFF directory entry decoder
///
/// Decodes the fixed-size records of an Image File Directory: 12 bytes per entry
/// in Classic TIFF, 20 bytes in BigTIFF. Entries are kept uninterpreted (tag, type,
/// count and the raw value/offset bytes).
///
/// Key features:
/// - No exceptions: uses Result<T> for error handling
/// - Byte order chosen at compile time on the cursor
/// - Thread-safe RawReader implementations for memory buffers and files
/// - JSON and single-line renderings of entries
///
/// Example usage:
/// ```cpp
/// #include <tiffentry/tiffentry.hpp>
///
/// using namespace tiffentry;
///
/// StreamFileReader file("image.tif");
/// ByteCursor<StreamFileReader, std::endian::little> cursor(file, first_ifd_offset + 2);
///
/// auto entries = decode_entries<TiffFormatType::Classic>(cursor, num_entries);
/// if (entries) {
///     for (const auto& entry : entries.value()) {
///         std::cout << entry << "\n";
///     }
/// }
/// ```

#include "types/result.hpp"
#include "types.hpp"
#include "reader_base.hpp"
#include "readers/reader_buffer.hpp"
#include "readers/reader_stream.hpp"
#include "byte_cursor.hpp"
#include "entry.hpp"
#include "entry_format.hpp"
