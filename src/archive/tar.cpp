#include <fileslice/archive/tar.hpp>

#include <fileslice/core/constants.hpp>
#include <fileslice/core/error.hpp>

#include <fileslice/detail/platform.hpp>
#include <fileslice/detail/logger.hpp>

#include <string_view>
#include <algorithm>
#include <optional>
#include <utility>
#include <array>

namespace fsl {
    using Block = std::array<std::uint8_t, tar_block_size>;

    // Names that override the next real header, collected from GNU 'L'/'K'
    // entries and pax 'x' records.
    struct PendingNames {
        std::optional<std::string> path;
        std::optional<std::string> link_name;
        std::optional<std::uint64_t> size;
    };

    fsl_nodiscard static inline std::uint64_t round_up_to_block(std::uint64_t size) noexcept {
        return (size + (tar_block_size - 1)) / tar_block_size * tar_block_size;
    }

    // Reads as much of [offset, offset + size) as the file has; stops early only at end of file.
    fsl_nodiscard static inline Expected<std::size_t> read_fully(const File& file, std::uint8_t* buffer, std::size_t size, std::uint64_t offset) noexcept {
        std::size_t total = 0;
        while (total < size) {
            auto bytes = dtl::read_at(file.handle, buffer + total, size - total, offset + total);
            fsl_unlikely_if(!bytes) {
                return bytes;
            }
            fsl_unlikely_if(bytes.value() == 0) {
                break;
            }
            total += bytes.value();
        }
        return total;
    }

    fsl_nodiscard static inline std::string_view field(const Block& block, std::size_t offset, std::size_t size) noexcept {
        const auto first = reinterpret_cast<const char*>(block.data()) + offset;
        const auto last = std::find(first, first + size, '\0');
        return { first, static_cast<std::size_t>(last - first) };
    }

    // Octal, space or NUL padded; GNU base-256 when the high bit of the first byte is set.
    fsl_nodiscard static inline std::optional<std::uint64_t> numeric_field(const Block& block, std::size_t offset, std::size_t size) noexcept {
        const auto first = block.data() + offset;
        fsl_unlikely_if(first[0] & 0x80) {
            std::uint64_t value = first[0] & 0x7f;
            for (std::size_t i = 1; i < size; ++i) {
                fsl_unlikely_if(value >> 56) {
                    return std::nullopt;
                }
                value = (value << 8) | first[i];
            }
            return value;
        }
        std::size_t i = 0;
        while (i < size && (first[i] == ' ' || first[i] == '\0')) {
            ++i;
        }
        std::uint64_t value = 0;
        for (; i < size; ++i) {
            const auto digit = first[i];
            if (digit == ' ' || digit == '\0') {
                break;
            }
            fsl_unlikely_if(digit < '0' || digit > '7' || (value >> 61)) {
                return std::nullopt;
            }
            value = (value << 3) | static_cast<std::uint64_t>(digit - '0');
        }
        return value;
    }

    fsl_nodiscard static inline bool is_zero_block(const Block& block) noexcept {
        return std::all_of(block.begin(), block.end(), [](std::uint8_t each) {
            return each == 0;
        });
    }

    fsl_nodiscard static inline bool checksum_matches(const Block& block) noexcept {
        const auto expected = numeric_field(block, tar_checksum_offset, tar_checksum_size);
        fsl_unlikely_if(!expected) {
            return false;
        }
        std::uint64_t sum = 0;
        for (std::size_t i = 0; i < block.size(); ++i) {
            const auto in_checksum = i >= tar_checksum_offset && i < tar_checksum_offset + tar_checksum_size;
            sum += in_checksum ? ' ' : block[i];
        }
        return sum == *expected;
    }

    fsl_nodiscard static inline TarType classify(char flag) noexcept {
        switch (flag) {
            case '\0':
            case '0':
            case '7': return tar_type_regular;
            case '1': return tar_type_hard_link;
            case '2': return tar_type_symlink;
            case '3': return tar_type_char_device;
            case '4': return tar_type_block_device;
            case '5': return tar_type_directory;
            case '6': return tar_type_fifo;
        }
        return tar_type_other;
    }

    // Records are "<length> <key>=<value>\n", length counting the whole record.
    fsl_nodiscard static inline bool parse_pax_records(std::string_view records, PendingNames& pending) noexcept {
        while (!records.empty()) {
            const auto space = records.find(' ');
            fsl_unlikely_if(space == std::string_view::npos || space == 0) {
                return false;
            }
            std::size_t length = 0;
            for (const auto digit : records.substr(0, space)) {
                fsl_unlikely_if(digit < '0' || digit > '9' || length > records.size()) {
                    return false;
                }
                length = length * 10 + static_cast<std::size_t>(digit - '0');
            }
            fsl_unlikely_if(length <= space + 1 || length > records.size() || records[length - 1] != '\n') {
                return false;
            }
            const auto record = records.substr(space + 1, length - space - 2);
            const auto equals = record.find('=');
            fsl_unlikely_if(equals == std::string_view::npos) {
                return false;
            }
            const auto key = record.substr(0, equals);
            const auto value = record.substr(equals + 1);
            if (key == "path") {
                pending.path = std::string(value);
            } else if (key == "linkpath") {
                pending.link_name = std::string(value);
            } else if (key == "size") {
                std::uint64_t size = 0;
                for (const auto digit : value) {
                    fsl_unlikely_if(digit < '0' || digit > '9') {
                        return false;
                    }
                    size = size * 10 + static_cast<std::uint64_t>(digit - '0');
                }
                pending.size = size;
            }
            records.remove_prefix(length);
        }
        return true;
    }

    fsl_nodiscard fsl_module Expected<std::vector<TarEntry>> TarArchive::entries_with_seek() const noexcept {
        fsl_profile_scoped();
        auto length = file.length();
        fsl_unlikely_if(!length) {
            dtl::logger().error("failed to query archive length: {}", length.error().message());
            return length.error();
        }
        const auto archive_size = length.value();
        std::vector<TarEntry> entries;
        PendingNames pending;
        std::uint64_t offset = 0;
        Block block;
        while (true) {
            auto bytes = read_fully(file, block.data(), block.size(), offset);
            fsl_unlikely_if(!bytes) {
                dtl::logger().error("failed to read tar header at offset {}: {}", offset, bytes.error().message());
                return bytes.error();
            }
            fsl_unlikely_if(bytes.value() == 0) {
                break;
            }
            fsl_unlikely_if(bytes.value() < block.size()) {
                dtl::logger().error("tar header at offset {} is cut short after {} bytes", offset, bytes.value());
                return make_error_code(errc::truncated_archive);
            }
            fsl_unlikely_if(is_zero_block(block)) {
                offset += tar_block_size;
                if (info.ignore_zeros) {
                    continue;
                }
                break;
            }
            fsl_unlikely_if(info.verify_checksums && !checksum_matches(block)) {
                dtl::logger().error("tar header at offset {} has a bad checksum", offset);
                return make_error_code(errc::invalid_archive);
            }
            const auto size = numeric_field(block, 124, 12);
            const auto mtime = numeric_field(block, 136, 12);
            const auto mode = numeric_field(block, 100, 8);
            fsl_unlikely_if(!size || !mtime || !mode) {
                dtl::logger().error("tar header at offset {} has a malformed numeric field", offset);
                return make_error_code(errc::invalid_archive);
            }
            const auto flag = static_cast<char>(block[156]);
            const auto payload = offset + tar_block_size;
            const auto payload_size = pending.size && classify(flag) == tar_type_regular ? *pending.size : *size;
            fsl_unlikely_if(payload_size > archive_size || payload > archive_size - payload_size) {
                dtl::logger().error("tar entry at offset {} claims {} bytes past the end of the archive", offset, payload_size);
                return make_error_code(errc::truncated_archive);
            }

            switch (flag) {
                case 'L':
                case 'K':
                case 'x': {
                    fsl_unlikely_if(payload_size > tar_max_metadata_size) {
                        dtl::logger().error("tar metadata entry at offset {} is too large: {} bytes", offset, payload_size);
                        return make_error_code(errc::invalid_archive);
                    }
                    std::string contents(static_cast<std::size_t>(payload_size), '\0');
                    auto read = read_fully(file, reinterpret_cast<std::uint8_t*>(contents.data()), contents.size(), payload);
                    fsl_unlikely_if(!read) {
                        return read.error();
                    }
                    if (flag == 'x') {
                        fsl_unlikely_if(!parse_pax_records(contents, pending)) {
                            dtl::logger().error("malformed pax records at offset {}", offset);
                            return make_error_code(errc::invalid_archive);
                        }
                    } else {
                        const auto terminator = contents.find('\0');
                        if (terminator != std::string::npos) {
                            contents.resize(terminator);
                        }
                        (flag == 'L' ? pending.path : pending.link_name) = std::move(contents);
                    }
                } break;

                case 'g':
                    break;

                default: {
                    TarEntry entry;
                    auto& header = entry.header;
                    if (pending.path) {
                        header.path = std::move(*pending.path);
                    } else {
                        const auto name = field(block, 0, 100);
                        const auto is_ustar = field(block, 257, 6) == "ustar";
                        const auto prefix = is_ustar ? field(block, 345, 155) : std::string_view();
                        header.path = prefix.empty() ? std::string(name) : std::string(prefix) + '/' + std::string(name);
                    }
                    header.link_name = pending.link_name ? std::move(*pending.link_name) : std::string(field(block, 157, 100));
                    header.size = payload_size;
                    header.mtime = *mtime;
                    header.mode = static_cast<std::uint32_t>(*mode);
                    header.type = classify(flag);
                    header.type_flag = flag;
                    entry.raw_file_position = payload;
                    dtl::logger().debug("tar entry \"{}\" ({}), {} bytes at offset {}", header.path, stringify(header.type), header.size, payload);
                    entries.emplace_back(std::move(entry));
                    pending = {};
                } break;
            }
            offset = payload + round_up_to_block(payload_size);
        }
        return entries;
    }

    fsl_nodiscard fsl_module File TarArchive::into_inner() noexcept {
        fsl_profile_scoped();
        return std::move(file);
    }

    fsl_nodiscard fsl_module TarArchive make_tar_archive(File&& file, TarArchive::CreateInfo&& info) noexcept {
        return { std::move(file), std::move(info) };
    }

    fsl_nodiscard fsl_module Expected<TarArchive> make_tar_archive(const char* path, TarArchive::CreateInfo&& info) noexcept {
        fsl_profile_scoped();
        auto file = open_file(path);
        fsl_unlikely_if(!file) {
            return file.error();
        }
        return make_tar_archive(file.unwrap(), std::move(info));
    }

    fsl_nodiscard fsl_module const char* stringify(TarType type) noexcept {
        switch (type) {
            case tar_type_regular:      return "regular";
            case tar_type_hard_link:    return "hard link";
            case tar_type_symlink:      return "symlink";
            case tar_type_char_device:  return "character device";
            case tar_type_block_device: return "block device";
            case tar_type_directory:    return "directory";
            case tar_type_fifo:         return "fifo";
            case tar_type_other:        break;
        }
        return "other";
    }
} // namespace fsl
