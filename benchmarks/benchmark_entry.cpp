#include <benchmark/benchmark.h>
#include <bit>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <tiffio.h>

#include "../tiffentry/include/tiffentry/byte_cursor.hpp"
#include "../tiffentry/include/tiffentry/entry.hpp"
#include "../tiffentry/include/tiffentry/readers/reader_buffer.hpp"
#include "../tiffentry/include/tiffentry/readers/reader_stream.hpp"
#include "../tiffentry/include/tiffentry/types.hpp"
#include "../tiffentry/include/tiffentry/types/result.hpp"

namespace fs = std::filesystem;
using namespace tiffentry;

// ============================================================================
// Helpers
// ============================================================================

template <std::endian Endian, typename T>
void append_uint(std::vector<std::byte>& out, T value) {
    convert_endianness<T, std::endian::native, Endian>(value);
    const auto* bytes = reinterpret_cast<const std::byte*>(&value);
    out.insert(out.end(), bytes, bytes + sizeof(T));
}

/// Entry array of an IFD with increasing tags, as found after the entry count
template <TiffFormatType TiffFormat, std::endian Endian>
std::vector<std::byte> make_entry_array(std::size_t num_entries) {
    std::vector<std::byte> out;
    out.reserve(num_entries * entry_size<TiffFormat>);
    for (std::size_t i = 0; i < num_entries; ++i) {
        append_uint<Endian>(out, static_cast<uint16_t>(256 + i));
        append_uint<Endian>(out, static_cast<uint16_t>(i % 12 + 1));
        if constexpr (TiffFormat == TiffFormatType::Classic) {
            append_uint<Endian>(out, static_cast<uint32_t>(i + 1));
            append_uint<Endian>(out, static_cast<uint32_t>(1024 + 8 * i));
        } else {
            append_uint<Endian>(out, static_cast<uint64_t>(i + 1));
            append_uint<Endian>(out, static_cast<uint64_t>(1024 + 8 * i));
        }
    }
    return out;
}

/// Temporary TIFF written with libtiff, removed on destruction
class LibTiffFile {
public:
    LibTiffFile(TiffFormatType format, std::endian endian, uint32_t width) {
        path_ = fs::temp_directory_path() /
                fmt::format("tiffentry_bench_{}_{}_{}.tif",
                            format == TiffFormatType::BigTIFF ? "big" : "classic",
                            endian == std::endian::big ? "be" : "le", width);

        std::string mode = "w";
        if (format == TiffFormatType::BigTIFF) {
            mode += "8";
        }
        mode += endian == std::endian::big ? "b" : "l";

        TIFF* tif = TIFFOpen(path_.string().c_str(), mode.c_str());
        if (!tif) {
            fmt::print(stderr, "Failed to open TIFF file for writing: {}\n", path_.string());
            return;
        }

        TIFFSetField(tif, TIFFTAG_IMAGEWIDTH, width);
        TIFFSetField(tif, TIFFTAG_IMAGELENGTH, width);
        TIFFSetField(tif, TIFFTAG_SAMPLESPERPIXEL, 1);
        TIFFSetField(tif, TIFFTAG_BITSPERSAMPLE, 8);
        TIFFSetField(tif, TIFFTAG_SAMPLEFORMAT, SAMPLEFORMAT_UINT);
        TIFFSetField(tif, TIFFTAG_COMPRESSION, COMPRESSION_NONE);
        TIFFSetField(tif, TIFFTAG_PLANARCONFIG, PLANARCONFIG_CONTIG);
        TIFFSetField(tif, TIFFTAG_PHOTOMETRIC, PHOTOMETRIC_MINISBLACK);
        TIFFSetField(tif, TIFFTAG_ROWSPERSTRIP, 1);
        TIFFSetField(tif, TIFFTAG_SOFTWARE, "tiffentry benchmark");

        std::vector<uint8_t> row(width);
        for (uint32_t y = 0; y < width; ++y) {
            for (uint32_t x = 0; x < width; ++x) {
                row[x] = static_cast<uint8_t>((x + y) & 0xFF);
            }
            if (TIFFWriteScanline(tif, row.data(), y, 0) < 0) {
                fmt::print(stderr, "Failed to write row {} of {}\n", y, path_.string());
                TIFFClose(tif);
                return;
            }
        }

        TIFFClose(tif);
        valid_ = true;
    }

    ~LibTiffFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    LibTiffFile(const LibTiffFile&) = delete;
    LibTiffFile& operator=(const LibTiffFile&) = delete;

    [[nodiscard]] bool is_valid() const noexcept { return valid_; }
    [[nodiscard]] const fs::path& path() const noexcept { return path_; }

private:
    fs::path path_;
    bool valid_{false};
};

/// Decode the entries of the first IFD, starting from the file header
template <TiffFormatType TiffFormat, std::endian Endian, RawReader Reader>
Result<std::vector<EntryType<TiffFormat>>> read_first_directory(const Reader& reader) noexcept {
    ByteCursor<Reader, Endian> cursor(reader, 2);

    auto version = cursor.template read_uint<uint16_t>();
    if (version.is_error()) {
        return version.error();
    }

    std::size_t num_entries = 0;
    if constexpr (TiffFormat == TiffFormatType::Classic) {
        if (version.value() != 42) {
            return Err(Error::Code::InvalidHeader, "Not a Classic TIFF: version " + std::to_string(version.value()));
        }
        auto ifd_offset = cursor.template read_uint<uint32_t>();
        if (ifd_offset.is_error()) {
            return ifd_offset.error();
        }
        auto seek_result = cursor.seek(ifd_offset.value());
        if (seek_result.is_error()) {
            return seek_result.error();
        }
        auto count = cursor.template read_uint<uint16_t>();
        if (count.is_error()) {
            return count.error();
        }
        num_entries = count.value();
    } else {
        if (version.value() != 43) {
            return Err(Error::Code::InvalidHeader, "Not a BigTIFF: version " + std::to_string(version.value()));
        }
        // Offset byte size (8) and reserved word
        auto skip_result = cursor.seek(8);
        if (skip_result.is_error()) {
            return skip_result.error();
        }
        auto ifd_offset = cursor.template read_uint<uint64_t>();
        if (ifd_offset.is_error()) {
            return ifd_offset.error();
        }
        auto seek_result = cursor.seek(static_cast<std::size_t>(ifd_offset.value()));
        if (seek_result.is_error()) {
            return seek_result.error();
        }
        auto count = cursor.template read_uint<uint64_t>();
        if (count.is_error()) {
            return count.error();
        }
        num_entries = static_cast<std::size_t>(count.value());
    }

    return decode_entries<TiffFormat>(cursor, num_entries);
}

// ============================================================================
// In-memory decoding
// ============================================================================

template <TiffFormatType TiffFormat, std::endian Endian>
static void BM_DecodeEntries(benchmark::State& state) {
    const auto num_entries = static_cast<std::size_t>(state.range(0));
    const auto bytes = make_entry_array<TiffFormat, Endian>(num_entries);
    BufferViewReader reader{std::span<const std::byte>(bytes)};

    for (auto _ : state) {
        ByteCursor<BufferViewReader, Endian> cursor(reader);
        auto entries = decode_entries<TiffFormat>(cursor, num_entries);
        if (entries.is_error()) {
            state.SkipWithError(("Failed to decode entries: " + entries.error().message).c_str());
            return;
        }
        benchmark::DoNotOptimize(entries);
    }

    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(num_entries));
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(bytes.size()));
}

BENCHMARK(BM_DecodeEntries<TiffFormatType::Classic, std::endian::little>)
    ->Arg(16)->Arg(256)->Arg(4096)
    ->Name("TiffEntry/Decode/Classic/LittleEndian");
BENCHMARK(BM_DecodeEntries<TiffFormatType::Classic, std::endian::big>)
    ->Arg(16)->Arg(256)->Arg(4096)
    ->Name("TiffEntry/Decode/Classic/BigEndian");
BENCHMARK(BM_DecodeEntries<TiffFormatType::BigTIFF, std::endian::little>)
    ->Arg(16)->Arg(256)->Arg(4096)
    ->Name("TiffEntry/Decode/BigTIFF/LittleEndian");
BENCHMARK(BM_DecodeEntries<TiffFormatType::BigTIFF, std::endian::big>)
    ->Arg(16)->Arg(256)->Arg(4096)
    ->Name("TiffEntry/Decode/BigTIFF/BigEndian");

// ============================================================================
// First directory of a file, compared with libtiff
// ============================================================================

template <TiffFormatType TiffFormat, std::endian Endian>
static void BM_TiffEntry_ReadDirectory(benchmark::State& state) {
    LibTiffFile file(TiffFormat, Endian, static_cast<uint32_t>(state.range(0)));
    if (!file.is_valid()) {
        state.SkipWithError("Failed to create TIFF file");
        return;
    }

    StreamFileReader reader;
    auto open_result = reader.open(file.path().string());
    if (open_result.is_error()) {
        fmt::print(stderr, "{}\n", open_result.error().message);
        state.SkipWithError("Failed to open TIFF file");
        return;
    }

    for (auto _ : state) {
        auto order = detect_byte_order(reader);
        if (order.is_error() || order.value() != Endian) {
            state.SkipWithError("Unexpected byte order mark");
            return;
        }
        auto entries = read_first_directory<TiffFormat, Endian>(reader);
        if (entries.is_error()) {
            state.SkipWithError(("Failed to read IFD " + entries.error().message).c_str());
            return;
        }
        benchmark::DoNotOptimize(entries);
    }

    state.SetItemsProcessed(state.iterations());
}

template <TiffFormatType TiffFormat, std::endian Endian>
static void BM_LibTIFF_ReadDirectory(benchmark::State& state) {
    LibTiffFile file(TiffFormat, Endian, static_cast<uint32_t>(state.range(0)));
    if (!file.is_valid()) {
        state.SkipWithError("Failed to create TIFF file");
        return;
    }

    TIFF* tif = TIFFOpen(file.path().string().c_str(), "r");
    if (!tif) {
        state.SkipWithError("Failed to open TIFF file");
        return;
    }

    for (auto _ : state) {
        // Re-reads the first directory from the file
        if (!TIFFSetDirectory(tif, 0)) {
            state.SkipWithError("TIFFSetDirectory failed");
            break;
        }
        uint32_t w = 0;
        TIFFGetField(tif, TIFFTAG_IMAGEWIDTH, &w);
        benchmark::DoNotOptimize(w);
    }

    TIFFClose(tif);
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_TiffEntry_ReadDirectory<TiffFormatType::Classic, std::endian::little>)
    ->Arg(256)->Arg(4096)
    ->Name("TiffEntry/ReadDirectory/Classic/LittleEndian");
BENCHMARK(BM_TiffEntry_ReadDirectory<TiffFormatType::BigTIFF, std::endian::big>)
    ->Arg(256)->Arg(4096)
    ->Name("TiffEntry/ReadDirectory/BigTIFF/BigEndian");
BENCHMARK(BM_LibTIFF_ReadDirectory<TiffFormatType::Classic, std::endian::little>)
    ->Arg(256)->Arg(4096)
    ->Name("LibTIFF/ReadDirectory/Classic/LittleEndian");
BENCHMARK(BM_LibTIFF_ReadDirectory<TiffFormatType::BigTIFF, std::endian::big>)
    ->Arg(256)->Arg(4096)
    ->Name("LibTIFF/ReadDirectory/BigTIFF/BigEndian");

BENCHMARK_MAIN();
