#pragma once

#include <fileslice/core/expected.hpp>
#include <fileslice/core/range.hpp>
#include <fileslice/core/file.hpp>

#include <fileslice/detail/platform.hpp>
#include <fileslice/detail/forward.hpp>
#include <fileslice/detail/macros.hpp>

#include <cstdint>
#include <cstddef>
#include <memory>
#include <vector>
#include <span>

namespace fsl {
    // A window [start, end) onto a shared file, behaving like an independent
    // read-only file. Reads are positional, so copies of a FileSlice never
    // disturb each other's cursor; copying only bumps a reference count.
    struct FileSlice {
        std::shared_ptr<const File> file;
        // May go past end, never before start.
        std::uint64_t cursor;
        std::uint64_t start;
        std::uint64_t end;

        // Bounds are relative to this window and clamped to it.
        fsl_nodiscard fsl_module FileSlice slice(Range) const noexcept;
        fsl_nodiscard fsl_module FileSlice slice(std::uint64_t, std::uint64_t) const noexcept;

        fsl_nodiscard fsl_module Expected<std::size_t>               read(std::span<std::uint8_t>) noexcept;
        fsl_nodiscard fsl_module Expected<std::size_t>               read_exact(std::span<std::uint8_t>) noexcept;
        fsl_nodiscard fsl_module Expected<std::vector<std::uint8_t>> read_to_end() noexcept;

        // Returns the new position relative to start. Seeking past end is
        // allowed; seeking before start fails with errc::out_of_bounds.
        fsl_nodiscard fsl_module Expected<std::uint64_t> seek(SeekFrom) noexcept;
        fsl_nodiscard fsl_module std::uint64_t           stream_position() const noexcept;

        // Resets the window to the whole file as it is right now, discarding
        // any previous narrowing. Returns the new length.
        fsl_nodiscard fsl_module Expected<std::uint64_t> expand() noexcept;

        // Chunked reader interface.
        fsl_nodiscard fsl_module std::uint64_t                         length() const noexcept;
        fsl_nodiscard fsl_module FileSlice                             get_view(std::uint64_t) const noexcept;
        fsl_nodiscard fsl_module FileSlice                             get_read(std::uint64_t, std::uint64_t) const noexcept;
        fsl_nodiscard fsl_module Expected<std::vector<std::uint8_t>>   get_bytes(std::uint64_t, std::uint64_t) const noexcept;
    };

    fsl_nodiscard fsl_module Expected<FileSlice> make_file_slice(File&&) noexcept;
    fsl_nodiscard fsl_module Expected<FileSlice> make_file_slice(native_handle_t) noexcept;
    fsl_nodiscard fsl_module Expected<FileSlice> make_file_slice(const char*) noexcept;

    // Gives the File back if this slice is its only holder, otherwise
    // returns the slice untouched as the error arm.
    fsl_nodiscard fsl_module Expected<File, FileSlice> try_reclaim(FileSlice&&) noexcept;
} // namespace fsl
