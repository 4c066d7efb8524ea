#include <fileslice/archive/slice_tarball.hpp>

#include <fileslice/detail/logger.hpp>

#include <utility>

namespace fsl {
    fsl_nodiscard fsl_module TarballEntry TarballSlices::Iterator::operator *() const noexcept {
        return (*owner)[index];
    }

    fsl_module TarballSlices::Iterator& TarballSlices::Iterator::operator ++() noexcept {
        ++index;
        return *this;
    }

    fsl_module TarballSlices::Iterator TarballSlices::Iterator::operator ++(int) noexcept {
        auto previous = *this;
        ++index;
        return previous;
    }

    fsl_nodiscard fsl_module bool TarballSlices::Iterator::operator ==(const Iterator& other) const noexcept {
        return owner == other.owner && index == other.index;
    }

    fsl_nodiscard fsl_module TarballSlices::Iterator TarballSlices::begin() const noexcept {
        return { this, 0 };
    }

    fsl_nodiscard fsl_module TarballSlices::Iterator TarballSlices::end() const noexcept {
        return { this, entries.size() };
    }

    fsl_nodiscard fsl_module std::size_t TarballSlices::size() const noexcept {
        return entries.size();
    }

    fsl_nodiscard fsl_module TarballEntry TarballSlices::operator [](std::size_t index) const noexcept {
        fsl_profile_scoped();
        const auto& entry = entries[index];
        const auto start = entry.raw_file_position;
        return { entry.header, root.slice(start, start + entry.header.size) };
    }

    fsl_nodiscard fsl_module Expected<TarballSlices> slice_tarball(TarArchive&& archive) noexcept {
        fsl_profile_scoped();
        auto entries = archive.entries_with_seek();
        fsl_unlikely_if(!entries) {
            return entries.error();
        }
        auto root = make_file_slice(archive.into_inner());
        fsl_unlikely_if(!root) {
            return root.error();
        }
        dtl::logger().info("sliced tarball into {} entries, {} bytes total", entries.value().size(), root.value().end);
        return TarballSlices{
            .root = root.unwrap(),
            .entries = entries.unwrap()
        };
    }

    fsl_nodiscard fsl_module std::optional<FileSlice> find_entry(const TarballSlices& slices, std::string_view path) noexcept {
        fsl_profile_scoped();
        for (auto [header, slice] : slices) {
            if (header.path == path) {
                return slice;
            }
        }
        return std::nullopt;
    }
} // namespace fsl
