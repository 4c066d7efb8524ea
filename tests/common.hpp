#ifndef FILESLICE_TESTS_COMMON_HPP
#define FILESLICE_TESTS_COMMON_HPP

#include <fileslice/archive/slice_tarball.hpp>
#include <fileslice/archive/tar.hpp>

#include <fileslice/core/file_slice.hpp>
#include <fileslice/core/constants.hpp>
#include <fileslice/core/expected.hpp>
#include <fileslice/core/error.hpp>
#include <fileslice/core/range.hpp>
#include <fileslice/core/file.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <functional>
#include <algorithm>
#include <fstream>
#include <cstring>
#include <cstdint>
#include <cstdio>
#include <atomic>
#include <string>
#include <vector>

// Byte i of every test file; distinct enough that an off-by-one shows up.
static inline std::uint8_t pattern_byte(std::uint64_t index) noexcept {
    return static_cast<std::uint8_t>((index * 7 + 3) & 0xff);
}

static inline std::vector<std::uint8_t> pattern(std::size_t size) {
    std::vector<std::uint8_t> bytes(size);
    for (std::size_t i = 0; i < size; ++i) {
        bytes[i] = pattern_byte(i);
    }
    return bytes;
}

static inline std::vector<std::uint8_t> pattern(std::uint64_t from, std::uint64_t to) {
    std::vector<std::uint8_t> bytes;
    for (auto i = from; i < to; ++i) {
        bytes.push_back(pattern_byte(i));
    }
    return bytes;
}

// A file in the temporary directory, removed when the object goes away.
struct TempFile {
    std::filesystem::path path;

    explicit TempFile(const std::vector<std::uint8_t>& contents) {
        static std::atomic<std::uint32_t> counter = 0;
        const auto name = "fileslice-test-" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                          "-" + std::to_string(counter++) + "-" + std::to_string(std::hash<std::string>()(
                              ::testing::UnitTest::GetInstance()->current_test_info()->name()));
        path = std::filesystem::temp_directory_path() / name;
        write(contents);
    }

    ~TempFile() {
        std::error_code error;
        std::filesystem::remove(path, error);
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator =(const TempFile&) = delete;

    void write(const std::vector<std::uint8_t>& contents) const {
        std::ofstream stream(path, std::ios::binary | std::ios::trunc);
        stream.write(reinterpret_cast<const char*>(contents.data()), static_cast<std::streamsize>(contents.size()));
    }

    void append(const std::vector<std::uint8_t>& contents) const {
        std::ofstream stream(path, std::ios::binary | std::ios::app);
        stream.write(reinterpret_cast<const char*>(contents.data()), static_cast<std::streamsize>(contents.size()));
    }

    std::string string() const {
        return path.string();
    }
};

static inline fsl::FileSlice open_slice(const TempFile& file) {
    auto slice = fsl::make_file_slice(file.string().c_str());
    EXPECT_TRUE(slice.is_value());
    return slice.unwrap();
}

static inline std::vector<std::uint8_t> read_all(fsl::FileSlice& slice, std::size_t chunk = 7) {
    std::vector<std::uint8_t> contents;
    std::vector<std::uint8_t> buffer(chunk);
    while (true) {
        auto bytes = slice.read(buffer);
        EXPECT_TRUE(bytes.is_value());
        if (!bytes || bytes.value() == 0) {
            break;
        }
        contents.insert(contents.end(), buffer.begin(), buffer.begin() + bytes.value());
    }
    return contents;
}

// Writes ustar archives the way GNU tar lays them out.
struct TarBuilder {
    std::vector<std::uint8_t> bytes;

    void add(const std::string& name, const std::vector<std::uint8_t>& contents, char type = '0', const std::string& prefix = {}) {
        std::uint8_t header[fsl::tar_block_size] = {};
        std::memcpy(header, name.data(), (std::min<std::size_t>)(name.size(), 100));
        std::snprintf(reinterpret_cast<char*>(header + 100), 8, "%07o", 0644u);
        std::snprintf(reinterpret_cast<char*>(header + 108), 8, "%07o", 1000u);
        std::snprintf(reinterpret_cast<char*>(header + 116), 8, "%07o", 1000u);
        std::snprintf(reinterpret_cast<char*>(header + 124), 12, "%011llo", static_cast<unsigned long long>(contents.size()));
        std::snprintf(reinterpret_cast<char*>(header + 136), 12, "%011llo", 1700000000ull);
        header[156] = static_cast<std::uint8_t>(type);
        std::memcpy(header + 257, "ustar\0" "00", 8);
        std::memcpy(header + 345, prefix.data(), (std::min<std::size_t>)(prefix.size(), 155));
        std::memset(header + fsl::tar_checksum_offset, ' ', fsl::tar_checksum_size);
        unsigned sum = 0;
        for (const auto each : header) {
            sum += each;
        }
        std::snprintf(reinterpret_cast<char*>(header + fsl::tar_checksum_offset), 7, "%06o", sum);
        bytes.insert(bytes.end(), header, header + fsl::tar_block_size);
        bytes.insert(bytes.end(), contents.begin(), contents.end());
        pad();
    }

    void add_long_name(const std::string& name, const std::vector<std::uint8_t>& contents) {
        std::vector<std::uint8_t> long_name(name.begin(), name.end());
        long_name.push_back(0);
        add("././@LongLink", long_name, 'L');
        add(name.substr(0, 99), contents);
    }

    void add_pax_path(const std::string& path, const std::vector<std::uint8_t>& contents) {
        auto record = " path=" + path + "\n";
        auto length = record.size() + 1;
        while (std::to_string(length).size() + record.size() != length) {
            ++length;
        }
        const auto text = std::to_string(length) + record;
        add("PaxHeaders/entry", std::vector<std::uint8_t>(text.begin(), text.end()), 'x');
        add("short-name", contents);
    }

    void finish() {
        bytes.resize(bytes.size() + 2 * fsl::tar_block_size, 0);
    }

    void pad() {
        const auto remainder = bytes.size() % fsl::tar_block_size;
        if (remainder != 0) {
            bytes.resize(bytes.size() + fsl::tar_block_size - remainder, 0);
        }
    }
};

#endif //FILESLICE_TESTS_COMMON_HPP
