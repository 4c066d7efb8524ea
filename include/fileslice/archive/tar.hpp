#pragma once

#include <fileslice/core/expected.hpp>
#include <fileslice/core/file.hpp>

#include <fileslice/detail/forward.hpp>
#include <fileslice/detail/macros.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace fsl {
    enum TarType {
        tar_type_regular,
        tar_type_hard_link,
        tar_type_symlink,
        tar_type_char_device,
        tar_type_block_device,
        tar_type_directory,
        tar_type_fifo,
        tar_type_other
    };

    struct TarHeader {
        std::string path;
        std::string link_name;
        std::uint64_t size;
        std::uint64_t mtime;
        std::uint32_t mode;
        TarType type;
        char type_flag;
    };

    struct TarEntry {
        TarHeader header;
        // Absolute offset of the entry's payload within the archive file.
        std::uint64_t raw_file_position;
    };

    // Minimal ustar / GNU / pax reader. It only walks headers: payloads are
    // skipped by offset arithmetic, never read, except for the GNU long name
    // and pax records that rename the following entry.
    struct TarArchive {
        struct CreateInfo {
            bool verify_checksums = true;
            // Keep walking past zero blocks, for concatenated archives.
            bool ignore_zeros = false;
        };
        File file;
        CreateInfo info;

        fsl_nodiscard fsl_module Expected<std::vector<TarEntry>> entries_with_seek() const noexcept;
        fsl_nodiscard fsl_module File                            into_inner() noexcept;
    };

    fsl_nodiscard fsl_module TarArchive           make_tar_archive(File&&, TarArchive::CreateInfo&& = {}) noexcept;
    fsl_nodiscard fsl_module Expected<TarArchive> make_tar_archive(const char*, TarArchive::CreateInfo&& = {}) noexcept;
    fsl_nodiscard fsl_module const char*          stringify(TarType) noexcept;
} // namespace fsl
