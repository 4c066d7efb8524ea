#include <fileslice/core/file_slice.hpp>
#include <fileslice/core/error.hpp>

#include <fileslice/detail/logger.hpp>

#include <algorithm>
#include <optional>
#include <atomic>
#include <limits>
#include <utility>

namespace fsl {
    constexpr auto max_offset = (std::numeric_limits<std::uint64_t>::max)();

    fsl_nodiscard static inline std::uint64_t saturating_add(std::uint64_t base, std::uint64_t delta) noexcept {
        fsl_unlikely_if(delta > max_offset - base) {
            return max_offset;
        }
        return base + delta;
    }

    // base + delta, or nothing when the result leaves the unsigned 64-bit range.
    fsl_nodiscard static inline std::optional<std::uint64_t> checked_offset(std::uint64_t base, std::int64_t delta) noexcept {
        if (delta >= 0) {
            const auto magnitude = static_cast<std::uint64_t>(delta);
            fsl_unlikely_if(magnitude > max_offset - base) {
                return std::nullopt;
            }
            return base + magnitude;
        }
        // -(delta + 1) cannot overflow, even for the minimum int64.
        const auto magnitude = static_cast<std::uint64_t>(-(delta + 1)) + 1;
        fsl_unlikely_if(magnitude > base) {
            return std::nullopt;
        }
        return base - magnitude;
    }

    fsl_nodiscard fsl_module FileSlice FileSlice::slice(Range range) const noexcept {
        fsl_profile_scoped();
        fsl_assert(start <= end, "FileSlice window is inverted");
        auto new_start = range.start ? saturating_add(start, *range.start) : start;
        // Clamped to end as well, so a start past the window gives an empty view at end.
        new_start = (std::min)(new_start, end);
        auto new_end = range.end ? saturating_add(start, *range.end) : end;
        new_end = (std::max)((std::min)(new_end, end), new_start);
        return { file, new_start, new_start, new_end };
    }

    fsl_nodiscard fsl_module FileSlice FileSlice::slice(std::uint64_t from, std::uint64_t to) const noexcept {
        return slice(range(from, to));
    }

    fsl_nodiscard fsl_module Expected<std::size_t> FileSlice::read(std::span<std::uint8_t> buffer) noexcept {
        fsl_profile_scoped();
        fsl_assert(start <= cursor, "FileSlice cursor is before its window");
        fsl_unlikely_if(cursor >= end || buffer.empty()) {
            return std::size_t(0);
        }
        const auto remaining = end - cursor;
        const auto count = static_cast<std::size_t>((std::min<std::uint64_t>)(buffer.size(), remaining));
        auto bytes = dtl::read_at(file->handle, buffer.data(), count, cursor);
        fsl_unlikely_if(!bytes) {
            dtl::logger().error("positional read of {} bytes at offset {} failed: {}", count, cursor, bytes.error().message());
            return bytes;
        }
        cursor += bytes.value();
        return bytes;
    }

    fsl_nodiscard fsl_module Expected<std::size_t> FileSlice::read_exact(std::span<std::uint8_t> buffer) noexcept {
        fsl_profile_scoped();
        std::size_t total = 0;
        while (total < buffer.size()) {
            auto bytes = read(buffer.subspan(total));
            fsl_unlikely_if(!bytes) {
                return bytes;
            }
            fsl_unlikely_if(bytes.value() == 0) {
                return make_error_code(errc::unexpected_eof);
            }
            total += bytes.value();
        }
        return total;
    }

    fsl_nodiscard fsl_module Expected<std::vector<std::uint8_t>> FileSlice::read_to_end() noexcept {
        fsl_profile_scoped();
        std::vector<std::uint8_t> contents(static_cast<std::size_t>(length()));
        std::size_t total = 0;
        while (total < contents.size()) {
            auto bytes = read(std::span(contents).subspan(total));
            fsl_unlikely_if(!bytes) {
                return bytes.error();
            }
            // The file shrank underneath us; keep what was there.
            fsl_unlikely_if(bytes.value() == 0) {
                break;
            }
            total += bytes.value();
        }
        contents.resize(total);
        return contents;
    }

    fsl_nodiscard fsl_module Expected<std::uint64_t> FileSlice::seek(SeekFrom position) noexcept {
        fsl_profile_scoped();
        std::optional<std::uint64_t> target;
        switch (position.origin) {
            case SeekFrom::origin_start: {
                fsl_likely_if(position.position <= max_offset - start) {
                    target = start + position.position;
                }
            } break;

            case SeekFrom::origin_current: {
                target = checked_offset(cursor, position.offset);
            } break;

            case SeekFrom::origin_end: {
                target = checked_offset(end, position.offset);
            } break;
        }
        fsl_unlikely_if(!target || *target < start) {
            return make_error_code(errc::out_of_bounds);
        }
        cursor = *target;
        return stream_position();
    }

    fsl_nodiscard fsl_module std::uint64_t FileSlice::stream_position() const noexcept {
        return cursor - start;
    }

    fsl_nodiscard fsl_module Expected<std::uint64_t> FileSlice::expand() noexcept {
        fsl_profile_scoped();
        auto length = file->length();
        fsl_unlikely_if(!length) {
            dtl::logger().error("failed to query file length while expanding: {}", length.error().message());
            return length;
        }
        dtl::logger().debug("expanding FileSlice [{}, {}) to [0, {})", start, end, length.value());
        start = 0;
        end = length.value();
        return length;
    }

    fsl_nodiscard fsl_module std::uint64_t FileSlice::length() const noexcept {
        fsl_unlikely_if(cursor >= end) {
            return 0;
        }
        return end - cursor;
    }

    fsl_nodiscard fsl_module FileSlice FileSlice::get_view(std::uint64_t from) const noexcept {
        fsl_profile_scoped();
        return slice(range_from(from));
    }

    fsl_nodiscard fsl_module FileSlice FileSlice::get_read(std::uint64_t from, std::uint64_t count) const noexcept {
        fsl_profile_scoped();
        return slice(range(from, saturating_add(from, count)));
    }

    fsl_nodiscard fsl_module Expected<std::vector<std::uint8_t>> FileSlice::get_bytes(std::uint64_t from, std::uint64_t count) const noexcept {
        fsl_profile_scoped();
        auto view = get_read(from, count);
        fsl_unlikely_if(view.end - view.start < count) {
            return make_error_code(errc::unexpected_eof);
        }
        std::vector<std::uint8_t> bytes(static_cast<std::size_t>(count));
        auto status = view.read_exact(bytes);
        fsl_unlikely_if(!status) {
            return status.error();
        }
        return bytes;
    }

    fsl_nodiscard fsl_module Expected<FileSlice> make_file_slice(File&& file) noexcept {
        fsl_profile_scoped();
        auto length = file.length();
        fsl_unlikely_if(!length) {
            dtl::logger().error("failed to query file length: {}", length.error().message());
            return length.error();
        }
        dtl::logger().debug("adopted file handle, length: {} bytes", length.value());
        return FileSlice{
            .file = std::make_shared<File>(std::move(file)),
            .cursor = 0,
            .start = 0,
            .end = length.value()
        };
    }

    fsl_nodiscard fsl_module Expected<FileSlice> make_file_slice(native_handle_t handle) noexcept {
        return make_file_slice(File(handle));
    }

    fsl_nodiscard fsl_module Expected<FileSlice> make_file_slice(const char* path) noexcept {
        fsl_profile_scoped();
        auto file = open_file(path);
        fsl_unlikely_if(!file) {
            return file.error();
        }
        return make_file_slice(file.unwrap());
    }

    fsl_nodiscard fsl_module Expected<File, FileSlice> try_reclaim(FileSlice&& slice) noexcept {
        fsl_profile_scoped();
        fsl_unlikely_if(slice.file.use_count() != 1) {
            dtl::logger().debug("cannot reclaim file handle, {} FileSlices still share it", slice.file.use_count());
            return std::move(slice);
        }
        // Sole owner: pair with the release in the other holders' destructors.
        // make_file_slice allocates the File itself non-const.
        std::atomic_thread_fence(std::memory_order_acquire);
        auto handle = std::const_pointer_cast<File>(slice.file)->release();
        slice.file.reset();
        return File(handle);
    }
} // namespace fsl
