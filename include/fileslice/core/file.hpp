#pragma once

#include <fileslice/core/expected.hpp>

#include <fileslice/detail/platform.hpp>
#include <fileslice/detail/forward.hpp>
#include <fileslice/detail/macros.hpp>

#include <cstdint>

namespace fsl {
    // Sole owner of an open native handle; closes it on destruction.
    // FileSlices share one File through std::shared_ptr<const File>.
    struct File {
        native_handle_t handle;

        explicit File(native_handle_t) noexcept;
        ~File() noexcept;
        File(const File&) noexcept = delete;
        File& operator =(const File&) noexcept = delete;
        File(File&&) noexcept;
        File& operator =(File&&) noexcept;

        fsl_nodiscard fsl_module bool                    is_open() const noexcept;
        fsl_nodiscard fsl_module Expected<std::uint64_t> length() const noexcept;
        fsl_nodiscard fsl_module native_handle_t         release() noexcept;
    };

    fsl_nodiscard fsl_module Expected<File> open_file(const char*) noexcept;
} // namespace fsl
