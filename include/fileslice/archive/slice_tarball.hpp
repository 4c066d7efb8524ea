#pragma once

#include <fileslice/archive/tar.hpp>

#include <fileslice/core/file_slice.hpp>
#include <fileslice/core/expected.hpp>

#include <fileslice/detail/forward.hpp>
#include <fileslice/detail/macros.hpp>

#include <string_view>
#include <iterator>
#include <optional>
#include <cstddef>
#include <vector>

namespace fsl {
    struct TarballEntry {
        TarHeader header;
        FileSlice slice;
    };

    // Every entry of a tarball as its own FileSlice, all sharing one handle.
    // Offsets are recorded once up front; slices are cut as they are visited.
    struct TarballSlices {
        struct Iterator {
            using iterator_category = std::input_iterator_tag;
            using value_type = TarballEntry;
            using difference_type = std::ptrdiff_t;
            using pointer = void;
            using reference = TarballEntry;

            const TarballSlices* owner;
            std::size_t index;

            fsl_nodiscard fsl_module TarballEntry operator *() const noexcept;
                          fsl_module Iterator&    operator ++() noexcept;
                          fsl_module Iterator     operator ++(int) noexcept;
            fsl_nodiscard fsl_module bool         operator ==(const Iterator&) const noexcept;
        };
        FileSlice root;
        std::vector<TarEntry> entries;

        fsl_nodiscard fsl_module Iterator     begin() const noexcept;
        fsl_nodiscard fsl_module Iterator     end() const noexcept;
        fsl_nodiscard fsl_module std::size_t  size() const noexcept;
        fsl_nodiscard fsl_module TarballEntry operator [](std::size_t) const noexcept;
    };

    // Walks the archive once, then hands its file over to a single root slice.
    fsl_nodiscard fsl_module Expected<TarballSlices>  slice_tarball(TarArchive&&) noexcept;
    fsl_nodiscard fsl_module std::optional<FileSlice> find_entry(const TarballSlices&, std::string_view) noexcept;
} // namespace fsl
