#include <fileslice/core/file.hpp>

#include <fileslice/detail/logger.hpp>

#include <utility>

namespace fsl {
    File::File(native_handle_t handle) noexcept
        : handle(handle) {
        fsl_profile_scoped();
    }

    File::~File() noexcept {
        fsl_profile_scoped();
        dtl::close_handle(handle);
    }

    File::File(File&& other) noexcept
        : handle(std::exchange(other.handle, dtl::invalid_handle())) {
        fsl_profile_scoped();
    }

    File& File::operator =(File&& other) noexcept {
        fsl_profile_scoped();
        if (this != &other) {
            dtl::close_handle(handle);
            handle = std::exchange(other.handle, dtl::invalid_handle());
        }
        return *this;
    }

    fsl_nodiscard fsl_module bool File::is_open() const noexcept {
        return handle != dtl::invalid_handle();
    }

    fsl_nodiscard fsl_module Expected<std::uint64_t> File::length() const noexcept {
        fsl_profile_scoped();
        return dtl::file_length(handle);
    }

    fsl_nodiscard fsl_module native_handle_t File::release() noexcept {
        fsl_profile_scoped();
        return std::exchange(handle, dtl::invalid_handle());
    }

    fsl_nodiscard fsl_module Expected<File> open_file(const char* path) noexcept {
        fsl_profile_scoped();
        auto handle = dtl::open_read_only(path);
        fsl_unlikely_if(!handle) {
            dtl::logger().error("failed to open \"{}\": {}", path, handle.error().message());
            return handle.error();
        }
        return File(handle.value());
    }
} // namespace fsl
