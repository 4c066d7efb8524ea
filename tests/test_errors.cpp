#include <common.hpp>

#include <cstring>
#include <string>

TEST(Errors, CategoryAndMessages) {
    const std::error_code code = fsl::errc::out_of_bounds;
    EXPECT_STREQ(code.category().name(), "fileslice");
    EXPECT_TRUE(code.category() == fsl::error_category());
    EXPECT_EQ(code.value(), static_cast<int>(fsl::errc::out_of_bounds));
    EXPECT_EQ(code.message(), "Out of bounds");
    EXPECT_EQ(std::error_code(fsl::errc::unexpected_eof).message(), "Unexpected end of window");
    EXPECT_EQ(std::error_code(fsl::errc::invalid_archive).message(), "Invalid archive header");
    EXPECT_EQ(std::error_code(fsl::errc::truncated_archive).message(), "Archive header truncated");
    EXPECT_FALSE(code == fsl::errc::unexpected_eof);
}

TEST(Errors, Stringify) {
    EXPECT_STREQ(fsl::stringify(fsl::errc::out_of_bounds), "out_of_bounds");
    EXPECT_STREQ(fsl::stringify(fsl::errc::truncated_archive), "truncated_archive");
    EXPECT_STREQ(fsl::stringify(fsl::tar_type_directory), "directory");
    EXPECT_STREQ(fsl::stringify(fsl::tar_type_other), "other");
}

TEST(Expected, HoldsValueOrError) {
    fsl::Expected<std::string> value = std::string("payload");
    ASSERT_TRUE(value.is_value());
    EXPECT_TRUE(static_cast<bool>(value));
    EXPECT_EQ(value.value(), "payload");

    fsl::Expected<std::string> error = fsl::make_error_code(fsl::errc::out_of_bounds);
    ASSERT_TRUE(error.is_error());
    EXPECT_TRUE(!error);
    EXPECT_TRUE(error.error() == fsl::errc::out_of_bounds);
}

TEST(Expected, CopyMoveAndAssign) {
    fsl::Expected<std::string> original = std::string("abc");
    auto copy = original;
    EXPECT_EQ(copy.value(), "abc");
    EXPECT_EQ(original.value(), "abc");

    auto moved = std::move(copy);
    EXPECT_EQ(moved.value(), "abc");

    fsl::Expected<std::string> other = fsl::make_error_code(fsl::errc::invalid_archive);
    other = original;
    ASSERT_TRUE(other.is_value());
    EXPECT_EQ(other.value(), "abc");

    other = fsl::Expected<std::string>(fsl::make_error_code(fsl::errc::unexpected_eof));
    ASSERT_TRUE(other.is_error());
    EXPECT_TRUE(other.error() == fsl::errc::unexpected_eof);

    EXPECT_EQ(original.unwrap(), "abc");
}

TEST(Expected, CarriesAMoveOnlyValueOrASlice) {
    TempFile file(pattern(16));
    auto opened = fsl::open_file(file.string().c_str());
    ASSERT_TRUE(opened.is_value());

    fsl::Expected<fsl::File, fsl::FileSlice> owned = opened.unwrap();
    ASSERT_TRUE(owned.is_value());
    EXPECT_TRUE(owned.value().is_open());

    auto slice = fsl::make_file_slice(owned.unwrap());
    ASSERT_TRUE(slice.is_value());
    fsl::Expected<fsl::File, fsl::FileSlice> returned = slice.value();
    ASSERT_TRUE(returned.is_error());
    EXPECT_EQ(returned.error().end, 16u);
    EXPECT_EQ(slice.value().file.use_count(), 2);
}

TEST(File, MoveTransfersOwnership) {
    TempFile file(pattern(16));
    auto opened = fsl::open_file(file.string().c_str());
    ASSERT_TRUE(opened.is_value());
    auto first = opened.unwrap();
    auto second = std::move(first);
    EXPECT_FALSE(first.is_open());
    EXPECT_TRUE(second.is_open());

    auto length = second.length();
    ASSERT_TRUE(length.is_value());
    EXPECT_EQ(length.value(), 16u);
}
