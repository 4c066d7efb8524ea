#include <common.hpp>

TEST(ChunkReader, LengthIsRemainingFromCursor) {
    TempFile file(pattern(100));
    auto slice = open_slice(file).slice(10, 40);
    EXPECT_EQ(slice.length(), 30u);
    std::vector<std::uint8_t> buffer(12);
    ASSERT_TRUE(slice.read(buffer).is_value());
    EXPECT_EQ(slice.length(), 18u);
    ASSERT_TRUE(slice.seek(fsl::seek_end(100)).is_value());
    EXPECT_EQ(slice.length(), 0u);
}

TEST(ChunkReader, GetViewRunsToWindowEnd) {
    TempFile file(pattern(100));
    const auto slice = open_slice(file).slice(10, 40);
    auto view = slice.get_view(5);
    EXPECT_EQ(view.start, 15u);
    EXPECT_EQ(view.end, 40u);
    EXPECT_EQ(view.cursor, 15u);
    EXPECT_EQ(read_all(view), pattern(15, 40));
}

TEST(ChunkReader, GetReadIsClampedToWindow) {
    TempFile file(pattern(100));
    const auto slice = open_slice(file).slice(10, 40);
    auto view = slice.get_read(20, 50);
    EXPECT_EQ(view.start, 30u);
    EXPECT_EQ(view.end, 40u);
    EXPECT_EQ(read_all(view), pattern(30, 40));
}

TEST(ChunkReader, GetBytesMaterializesExactRange) {
    TempFile file(pattern(4096));
    const auto slice = open_slice(file).slice(1000, 3000);
    auto bytes = slice.get_bytes(24, 1500);
    ASSERT_TRUE(bytes.is_value());
    EXPECT_EQ(bytes.value(), pattern(1024, 2524));
    EXPECT_EQ(slice.cursor, 1000u);
}

TEST(ChunkReader, GetBytesFailsWhenWindowIsTooShort) {
    TempFile file(pattern(100));
    const auto slice = open_slice(file).slice(10, 40);
    auto bytes = slice.get_bytes(25, 10);
    ASSERT_TRUE(bytes.is_error());
    EXPECT_TRUE(bytes.error() == fsl::errc::unexpected_eof);

    auto empty = slice.get_bytes(30, 0);
    ASSERT_TRUE(empty.is_value());
    EXPECT_TRUE(empty.value().empty());
}

TEST(ChunkReader, ReadExactFillsOrFails) {
    TempFile file(pattern(100));
    auto slice = open_slice(file).slice(50, 70);
    std::vector<std::uint8_t> buffer(15);
    auto bytes = slice.read_exact(buffer);
    ASSERT_TRUE(bytes.is_value());
    EXPECT_EQ(bytes.value(), 15u);
    EXPECT_EQ(buffer, pattern(50, 65));

    auto short_read = slice.read_exact(buffer);
    ASSERT_TRUE(short_read.is_error());
    EXPECT_TRUE(short_read.error() == fsl::errc::unexpected_eof);
    EXPECT_EQ(slice.cursor, 70u);
}

TEST(ChunkReader, ReadToEndDrainsRemainder) {
    TempFile file(pattern(100));
    auto slice = open_slice(file).slice(5, 95);
    ASSERT_TRUE(slice.seek(fsl::seek_start(30)).is_value());
    auto rest = slice.read_to_end();
    ASSERT_TRUE(rest.is_value());
    EXPECT_EQ(rest.value(), pattern(35, 95));

    auto nothing = slice.read_to_end();
    ASSERT_TRUE(nothing.is_value());
    EXPECT_TRUE(nothing.value().empty());
}

TEST(ChunkReader, ReadToEndStopsWhenFileShrank) {
    TempFile file(pattern(100));
    auto slice = open_slice(file);
    file.write(pattern(40));
    auto rest = slice.read_to_end();
    ASSERT_TRUE(rest.is_value());
    EXPECT_EQ(rest.value(), pattern(40));
}
