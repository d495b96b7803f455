#include <gtest/gtest.h>
#include <array>
#include <bit>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

#include "../tiffentry/include/tiffentry/byte_cursor.hpp"
#include "../tiffentry/include/tiffentry/entry.hpp"
#include "../tiffentry/include/tiffentry/readers/reader_buffer.hpp"
#include "../tiffentry/include/tiffentry/readers/reader_stream.hpp"

using namespace tiffentry;
namespace fs = std::filesystem;

// ============================================================================
// Test Helper Functions
// ============================================================================

std::vector<std::byte> make_bytes(std::initializer_list<int> values) {
    std::vector<std::byte> bytes;
    bytes.reserve(values.size());
    for (int v : values) {
        bytes.push_back(static_cast<std::byte>(v));
    }
    return bytes;
}

/// Append an integer to a buffer in the requested byte order
template <std::endian StorageEndian, typename T>
void append_uint(std::vector<std::byte>& buffer, T value) {
    convert_endianness<T, std::endian::native, StorageEndian>(value);
    std::byte raw[sizeof(T)];
    std::memcpy(raw, &value, sizeof(T));
    buffer.insert(buffer.end(), raw, raw + sizeof(T));
}

/// Append one encoded entry (Classic or BigTIFF layout depending on CountT / N)
template <std::endian StorageEndian, typename CountT, std::size_t N>
void append_entry(std::vector<std::byte>& buffer, uint16_t tag, uint16_t type, CountT count,
                  const std::array<uint8_t, N>& value_offset) {
    append_uint<StorageEndian>(buffer, tag);
    append_uint<StorageEndian>(buffer, type);
    append_uint<StorageEndian>(buffer, count);
    for (uint8_t b : value_offset) {
        buffer.push_back(static_cast<std::byte>(b));
    }
}

// ============================================================================
// Classic TIFF entries
// ============================================================================

TEST(ClassicEntry, BigEndianScenario) {
    auto bytes = make_bytes({0x00, 0x01, 0x00, 0x03, 0x00, 0x00, 0x00, 0x02, 0x00, 0x00, 0x00, 0x10});
    BufferViewReader reader{std::span<const std::byte>(bytes)};
    ByteCursor<BufferViewReader, std::endian::big> cursor(reader);

    auto result = decode_entry(cursor);
    ASSERT_TRUE(result.is_ok()) << result.error().message;

    const Entry& entry = result.value();
    EXPECT_EQ(entry.tag_id(), 1);
    EXPECT_EQ(entry.type_id(), 3);
    EXPECT_EQ(entry.count(), 2u);
    EXPECT_EQ(entry.value_offset(), (std::array<uint8_t, 4>{0, 0, 0, 16}));
}

TEST(ClassicEntry, LittleEndianKeepsValueOffsetBytesAsStored) {
    auto bytes = make_bytes({0x01, 0x00, 0x03, 0x00, 0x02, 0x00, 0x00, 0x00, 0x10, 0x00, 0x00, 0x00});
    BufferViewReader reader{std::span<const std::byte>(bytes)};
    ByteCursor<BufferViewReader, std::endian::little> cursor(reader);

    auto result = decode_entry(cursor);
    ASSERT_TRUE(result.is_ok()) << result.error().message;

    EXPECT_EQ(result.value().tag_id(), 1);
    EXPECT_EQ(result.value().type_id(), 3);
    EXPECT_EQ(result.value().count(), 2u);
    // The raw field is not byte-swapped: it still reads 10 00 00 00
    EXPECT_EQ(result.value().value_offset(), (std::array<uint8_t, 4>{16, 0, 0, 0}));
}

TEST(ClassicEntry, FullRangeFieldValues) {
    std::vector<std::byte> bytes;
    append_entry<std::endian::little>(bytes, uint16_t{0xFFFF}, uint16_t{0xFFFE}, uint32_t{0xFFFFFFFF},
                                      std::array<uint8_t, 4>{0xDE, 0xAD, 0xBE, 0xEF});
    BufferViewReader reader{std::span<const std::byte>(bytes)};
    ByteCursor<BufferViewReader, std::endian::little> cursor(reader);

    auto result = decode_entry(cursor);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().tag_id(), 0xFFFF);
    EXPECT_EQ(result.value().type_id(), 0xFFFE);
    EXPECT_EQ(result.value().count(), 0xFFFFFFFFu);
    EXPECT_EQ(result.value().value_offset(), (std::array<uint8_t, 4>{0xDE, 0xAD, 0xBE, 0xEF}));
}

TEST(ClassicEntry, UnknownTagAndTypeAreAccepted) {
    std::vector<std::byte> bytes;
    append_entry<std::endian::big>(bytes, uint16_t{65000}, uint16_t{999}, uint32_t{0},
                                   std::array<uint8_t, 4>{0, 0, 0, 0});
    BufferViewReader reader{std::span<const std::byte>(bytes)};
    ByteCursor<BufferViewReader, std::endian::big> cursor(reader);

    auto result = decode_entry(cursor);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().tag_id(), 65000);
    EXPECT_EQ(result.value().type_id(), 999);
    EXPECT_EQ(result.value().count(), 0u);
}

TEST(ClassicEntry, ConsumesExactlyTwelveBytes) {
    auto bytes = make_bytes({0x00, 0x01, 0x00, 0x03, 0x00, 0x00, 0x00, 0x02, 0x00, 0x00, 0x00, 0x10,
                             0xAA, 0xBB, 0xCC});
    BufferViewReader reader{std::span<const std::byte>(bytes)};
    ByteCursor<BufferViewReader, std::endian::big> cursor(reader);

    ASSERT_TRUE(decode_entry(cursor).is_ok());
    EXPECT_EQ(cursor.position(), 12u);

    auto trailing = cursor.read_uint<uint8_t>();
    ASSERT_TRUE(trailing.is_ok());
    EXPECT_EQ(trailing.value(), 0xAA);
}

TEST(ClassicEntry, DecodesAtNonZeroOffset) {
    std::vector<std::byte> bytes(10, std::byte{0x55});
    append_entry<std::endian::little>(bytes, uint16_t{256}, uint16_t{4}, uint32_t{1},
                                      std::array<uint8_t, 4>{0x00, 0x04, 0x00, 0x00});
    BufferViewReader reader{std::span<const std::byte>(bytes)};
    ByteCursor<BufferViewReader, std::endian::little> cursor(reader, 10);

    auto result = decode_entry(cursor);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().tag_id(), 256);
    EXPECT_EQ(result.value().type_id(), 4);
    EXPECT_EQ(cursor.position(), 22u);
}

TEST(ClassicEntry, ChangingOneByteChangesOnlyItsField) {
    std::vector<std::byte> base;
    append_entry<std::endian::big>(base, uint16_t{0x0102}, uint16_t{0x0304}, uint32_t{0x05060708},
                                   std::array<uint8_t, 4>{0x09, 0x0A, 0x0B, 0x0C});
    BufferViewReader base_reader{std::span<const std::byte>(base)};
    ByteCursor<BufferViewReader, std::endian::big> base_cursor(base_reader);
    auto base_result = decode_entry(base_cursor);
    ASSERT_TRUE(base_result.is_ok());
    const Entry original = base_result.value();

    for (std::size_t i = 0; i < Entry::encoded_size; ++i) {
        auto modified = base;
        modified[i] ^= std::byte{0xFF};
        BufferViewReader reader{std::span<const std::byte>(modified)};
        ByteCursor<BufferViewReader, std::endian::big> cursor(reader);
        auto result = decode_entry(cursor);
        ASSERT_TRUE(result.is_ok());
        const Entry& entry = result.value();

        EXPECT_EQ(entry.tag_id() != original.tag_id(), i < 2) << "byte " << i;
        EXPECT_EQ(entry.type_id() != original.type_id(), i >= 2 && i < 4) << "byte " << i;
        EXPECT_EQ(entry.count() != original.count(), i >= 4 && i < 8) << "byte " << i;
        EXPECT_EQ(entry.value_offset() != original.value_offset(), i >= 8) << "byte " << i;
    }
}

TEST(ClassicEntry, DecodingIsDeterministic) {
    std::vector<std::byte> bytes;
    append_entry<std::endian::little>(bytes, uint16_t{273}, uint16_t{4}, uint32_t{8},
                                      std::array<uint8_t, 4>{0x20, 0x01, 0x00, 0x00});
    BufferReader reader{std::span<const std::byte>(bytes)};

    ByteCursor<BufferReader, std::endian::little> first(reader);
    ByteCursor<BufferReader, std::endian::little> second(reader);
    auto a = decode_entry(first);
    auto b = decode_entry(second);
    ASSERT_TRUE(a.is_ok());
    ASSERT_TRUE(b.is_ok());
    EXPECT_EQ(a.value(), b.value());
}

// ============================================================================
// BigTIFF entries
// ============================================================================

TEST(BigEntry, BigEndianScenario) {
    auto bytes = make_bytes({0x00, 0x01, 0x00, 0x03,
                             0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x02,
                             0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x10});
    BufferViewReader reader{std::span<const std::byte>(bytes)};
    ByteCursor<BufferViewReader, std::endian::big> cursor(reader);

    auto result = decode_entry_big(cursor);
    ASSERT_TRUE(result.is_ok()) << result.error().message;

    const EntryBig& entry = result.value();
    EXPECT_EQ(entry.tag_id(), 1);
    EXPECT_EQ(entry.type_id(), 3);
    EXPECT_EQ(entry.count(), 2u);
    EXPECT_EQ(entry.value_offset(), (std::array<uint8_t, 8>{0, 0, 0, 0, 0, 0, 0, 16}));
}

TEST(BigEntry, SixtyFourBitCount) {
    std::vector<std::byte> bytes;
    append_entry<std::endian::little>(bytes, uint16_t{324}, uint16_t{16}, uint64_t{0x0000012345678901ULL},
                                      std::array<uint8_t, 8>{1, 2, 3, 4, 5, 6, 7, 8});
    BufferViewReader reader{std::span<const std::byte>(bytes)};
    ByteCursor<BufferViewReader, std::endian::little> cursor(reader);

    auto result = decode_entry_big(cursor);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().tag_id(), 324);
    EXPECT_EQ(result.value().type_id(), 16);
    EXPECT_EQ(result.value().count(), 0x0000012345678901ULL);
    EXPECT_EQ(result.value().value_offset(), (std::array<uint8_t, 8>{1, 2, 3, 4, 5, 6, 7, 8}));
}

TEST(BigEntry, ConsumesExactlyTwentyBytes) {
    std::vector<std::byte> bytes;
    append_entry<std::endian::big>(bytes, uint16_t{256}, uint16_t{3}, uint64_t{1},
                                   std::array<uint8_t, 8>{0, 64, 0, 0, 0, 0, 0, 0});
    bytes.push_back(std::byte{0x7F});
    BufferViewReader reader{std::span<const std::byte>(bytes)};
    ByteCursor<BufferViewReader, std::endian::big> cursor(reader);

    ASSERT_TRUE(decode_entry_big(cursor).is_ok());
    EXPECT_EQ(cursor.position(), 20u);
}

TEST(BigEntry, ChangingOneByteChangesOnlyItsField) {
    std::vector<std::byte> base;
    append_entry<std::endian::little>(base, uint16_t{0x0102}, uint16_t{0x0304}, uint64_t{0x05060708090A0B0CULL},
                                      std::array<uint8_t, 8>{0x0D, 0x0E, 0x0F, 0x10, 0x11, 0x12, 0x13, 0x14});
    BufferViewReader base_reader{std::span<const std::byte>(base)};
    ByteCursor<BufferViewReader, std::endian::little> base_cursor(base_reader);
    auto base_result = decode_entry_big(base_cursor);
    ASSERT_TRUE(base_result.is_ok());
    const EntryBig original = base_result.value();

    for (std::size_t i = 0; i < EntryBig::encoded_size; ++i) {
        auto modified = base;
        modified[i] ^= std::byte{0x01};
        BufferViewReader reader{std::span<const std::byte>(modified)};
        ByteCursor<BufferViewReader, std::endian::little> cursor(reader);
        auto result = decode_entry_big(cursor);
        ASSERT_TRUE(result.is_ok());
        const EntryBig& entry = result.value();

        EXPECT_EQ(entry.tag_id() != original.tag_id(), i < 2) << "byte " << i;
        EXPECT_EQ(entry.type_id() != original.type_id(), i >= 2 && i < 4) << "byte " << i;
        EXPECT_EQ(entry.count() != original.count(), i >= 4 && i < 12) << "byte " << i;
        EXPECT_EQ(entry.value_offset() != original.value_offset(), i >= 12) << "byte " << i;
    }
}

// ============================================================================
// Format dispatch and entry runs
// ============================================================================

static_assert(std::is_same_v<EntryType<TiffFormatType::Classic>, Entry>);
static_assert(std::is_same_v<EntryType<TiffFormatType::BigTIFF>, EntryBig>);
static_assert(!std::is_convertible_v<Entry, EntryBig>);
static_assert(!std::is_convertible_v<EntryBig, Entry>);
static_assert(!std::is_default_constructible_v<Entry>);
static_assert(EntryReader<ByteCursor<BufferViewReader, std::endian::little>>);
static_assert(EntryReader<ByteCursor<StreamFileReader, std::endian::big>>);

TEST(EntryDispatch, DecodeEntryForSelectsLayout) {
    std::vector<std::byte> classic_bytes;
    append_entry<std::endian::little>(classic_bytes, uint16_t{257}, uint16_t{3}, uint32_t{1},
                                      std::array<uint8_t, 4>{0x80, 0x00, 0x00, 0x00});
    BufferViewReader classic_reader{std::span<const std::byte>(classic_bytes)};
    ByteCursor<BufferViewReader, std::endian::little> classic_cursor(classic_reader);

    auto classic = decode_entry_for<TiffFormatType::Classic>(classic_cursor);
    ASSERT_TRUE(classic.is_ok());
    EXPECT_EQ(classic.value().tag_id(), 257);
    EXPECT_EQ(classic_cursor.position(), entry_size<TiffFormatType::Classic>);

    std::vector<std::byte> big_bytes;
    append_entry<std::endian::little>(big_bytes, uint16_t{257}, uint16_t{3}, uint64_t{1},
                                      std::array<uint8_t, 8>{0x80, 0, 0, 0, 0, 0, 0, 0});
    BufferViewReader big_reader{std::span<const std::byte>(big_bytes)};
    ByteCursor<BufferViewReader, std::endian::little> big_cursor(big_reader);

    auto big = decode_entry_for<TiffFormatType::BigTIFF>(big_cursor);
    ASSERT_TRUE(big.is_ok());
    EXPECT_EQ(big.value().tag_id(), 257);
    EXPECT_EQ(big_cursor.position(), entry_size<TiffFormatType::BigTIFF>);
}

TEST(EntryRuns, DecodesConsecutiveClassicEntries) {
    std::vector<std::byte> bytes;
    append_entry<std::endian::big>(bytes, uint16_t{256}, uint16_t{3}, uint32_t{1}, std::array<uint8_t, 4>{0, 64, 0, 0});
    append_entry<std::endian::big>(bytes, uint16_t{257}, uint16_t{3}, uint32_t{1}, std::array<uint8_t, 4>{0, 32, 0, 0});
    append_entry<std::endian::big>(bytes, uint16_t{258}, uint16_t{3}, uint32_t{3}, std::array<uint8_t, 4>{0, 0, 1, 0});
    append_uint<std::endian::big>(bytes, uint32_t{0});  // next IFD offset

    BufferViewReader reader{std::span<const std::byte>(bytes)};
    ByteCursor<BufferViewReader, std::endian::big> cursor(reader);

    auto result = decode_entries<TiffFormatType::Classic>(cursor, 3);
    ASSERT_TRUE(result.is_ok()) << result.error().message;
    const auto& entries = result.value();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].tag_id(), 256);
    EXPECT_EQ(entries[1].tag_id(), 257);
    EXPECT_EQ(entries[2].tag_id(), 258);
    EXPECT_EQ(entries[2].count(), 3u);
    EXPECT_EQ(entries[2].value_offset(), (std::array<uint8_t, 4>{0, 0, 1, 0}));
    EXPECT_EQ(cursor.position(), 36u);
}

TEST(EntryRuns, DecodesConsecutiveBigEntries) {
    std::vector<std::byte> bytes;
    for (uint16_t tag = 300; tag < 305; ++tag) {
        append_entry<std::endian::little>(bytes, tag, uint16_t{16}, uint64_t{tag} * 1000,
                                          std::array<uint8_t, 8>{static_cast<uint8_t>(tag & 0xFF), 0, 0, 0, 0, 0, 0, 1});
    }
    BufferViewReader reader{std::span<const std::byte>(bytes)};
    ByteCursor<BufferViewReader, std::endian::little> cursor(reader);

    auto result = decode_entries<TiffFormatType::BigTIFF>(cursor, 5);
    ASSERT_TRUE(result.is_ok()) << result.error().message;
    ASSERT_EQ(result.value().size(), 5u);
    for (std::size_t i = 0; i < 5; ++i) {
        EXPECT_EQ(result.value()[i].tag_id(), static_cast<uint16_t>(300 + i));
        EXPECT_EQ(result.value()[i].count(), static_cast<uint64_t>((300 + i) * 1000));
    }
    EXPECT_EQ(cursor.position(), 100u);
}

TEST(EntryRuns, ZeroEntries) {
    std::vector<std::byte> bytes;
    BufferViewReader reader{std::span<const std::byte>(bytes)};
    ByteCursor<BufferViewReader, std::endian::little> cursor(reader);

    auto result = decode_entries<TiffFormatType::Classic>(cursor, 0);
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().empty());
    EXPECT_EQ(cursor.position(), 0u);
}

// ============================================================================
// Files and concurrency
// ============================================================================

TEST(EntryFromFile, DecodesFirstDirectoryOfClassicFile) {
    // Minimal big-endian header, an IFD with two entries, no next IFD
    std::vector<std::byte> content = make_bytes({'M', 'M', 0x00, 0x2A, 0x00, 0x00, 0x00, 0x08});
    append_uint<std::endian::big>(content, uint16_t{2});
    append_entry<std::endian::big>(content, uint16_t{256}, uint16_t{4}, uint32_t{1}, std::array<uint8_t, 4>{0, 0, 2, 0});
    append_entry<std::endian::big>(content, uint16_t{257}, uint16_t{4}, uint32_t{1}, std::array<uint8_t, 4>{0, 0, 1, 0});
    append_uint<std::endian::big>(content, uint32_t{0});

    fs::path path = fs::temp_directory_path() / "tiffentry_classic_directory.bin";
    {
        std::ofstream file(path, std::ios::binary);
        file.write(reinterpret_cast<const char*>(content.data()), static_cast<std::streamsize>(content.size()));
    }

    StreamFileReader file(path.string());
    ASSERT_TRUE(file.is_valid());

    auto order = detect_byte_order(file);
    ASSERT_TRUE(order.is_ok());
    ASSERT_EQ(order.value(), std::endian::big);

    ByteCursor<StreamFileReader, std::endian::big> cursor(file, 8);
    auto num_entries = cursor.read_uint<uint16_t>();
    ASSERT_TRUE(num_entries.is_ok());
    ASSERT_EQ(num_entries.value(), 2);

    auto entries = decode_entries<TiffFormatType::Classic>(cursor, num_entries.value());
    ASSERT_TRUE(entries.is_ok()) << entries.error().message;
    EXPECT_EQ(entries.value()[0].tag_id(), 256);
    EXPECT_EQ(entries.value()[0].value_offset(), (std::array<uint8_t, 4>{0, 0, 2, 0}));
    EXPECT_EQ(entries.value()[1].tag_id(), 257);
    EXPECT_EQ(cursor.position(), 8u + 2u + 24u);

    file.close();
    fs::remove(path);
}

TEST(EntryConcurrency, IndependentCursorsOnSharedReader) {
    constexpr std::size_t num_entries = 64;
    std::vector<std::byte> bytes;
    for (std::size_t i = 0; i < num_entries; ++i) {
        append_entry<std::endian::little>(bytes, static_cast<uint16_t>(i), uint16_t{4}, static_cast<uint64_t>(i * 7),
                                          std::array<uint8_t, 8>{static_cast<uint8_t>(i), 0, 0, 0, 0, 0, 0, 0});
    }
    const BufferReader reader{std::span<const std::byte>(bytes)};

    constexpr int num_threads = 8;
    std::vector<int> successes(num_threads, 0);
    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&reader, &successes, t]() {
            ByteCursor<BufferReader, std::endian::little> cursor(reader);
            auto result = decode_entries<TiffFormatType::BigTIFF>(cursor, num_entries);
            if (!result.is_ok()) {
                return;
            }
            for (std::size_t i = 0; i < num_entries; ++i) {
                const auto& entry = result.value()[i];
                if (entry.tag_id() != static_cast<uint16_t>(i) || entry.count() != i * 7 ||
                    entry.value_offset()[0] != static_cast<uint8_t>(i)) {
                    return;
                }
            }
            successes[t] = 1;
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    for (int t = 0; t < num_threads; ++t) {
        EXPECT_EQ(successes[t], 1) << "thread " << t;
    }
}
