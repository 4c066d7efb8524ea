#include <fileslice/detail/platform.hpp>

#include <fileslice/core/error.hpp>

#include <fileslice/detail/logger.hpp>

#if defined(_WIN32)
    #include <Windows.h>
#else
    #include <sys/types.h>
    #include <sys/stat.h>
    #include <unistd.h>
    #include <fcntl.h>
#endif

#include <algorithm>
#include <limits>

namespace fsl::dtl {
    fsl_nodiscard fsl_module native_handle_t invalid_handle() noexcept {
#if defined(_WIN32)
        return INVALID_HANDLE_VALUE;
#else
        return -1;
#endif
    }

    fsl_nodiscard fsl_module Expected<native_handle_t> open_read_only(const char* path) noexcept {
        fsl_profile_scoped();
#if defined(_WIN32)
        const auto handle = CreateFileA(path, GENERIC_READ, FILE_SHARE_READ, nullptr, OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
        fsl_unlikely_if(handle == INVALID_HANDLE_VALUE) {
            return last_os_error();
        }
        return native_handle_t(handle);
#else
        const auto handle = open(path, O_RDONLY | O_CLOEXEC);
        fsl_unlikely_if(handle == -1) {
            return last_os_error();
        }
        return native_handle_t(handle);
#endif
    }

    fsl_nodiscard fsl_module Expected<std::uint64_t> file_length(native_handle_t handle) noexcept {
        fsl_profile_scoped();
#if defined(_WIN32)
        LARGE_INTEGER size;
        fsl_unlikely_if(!GetFileSizeEx(handle, &size)) {
            return last_os_error();
        }
        return static_cast<std::uint64_t>(size.QuadPart);
#else
        struct stat file_info;
        fsl_unlikely_if(fstat(handle, &file_info) == -1) {
            return last_os_error();
        }
        return static_cast<std::uint64_t>(file_info.st_size);
#endif
    }

    fsl_nodiscard fsl_module Expected<std::size_t> read_at(native_handle_t handle, void* buffer, std::size_t size, std::uint64_t offset) noexcept {
        fsl_profile_scoped();
#if defined(_WIN32)
        // ReadFile takes a DWORD count; a short read is allowed by contract.
        const auto count = static_cast<DWORD>(std::min<std::size_t>(size, (std::numeric_limits<DWORD>::max)()));
        OVERLAPPED overlapped = {};
        overlapped.Offset = static_cast<DWORD>(offset & 0xffffffffu);
        overlapped.OffsetHigh = static_cast<DWORD>(offset >> 32);
        DWORD bytes = 0;
        fsl_unlikely_if(!ReadFile(handle, buffer, count, &bytes, &overlapped)) {
            fsl_likely_if(GetLastError() == ERROR_HANDLE_EOF) {
                return std::size_t(0);
            }
            return last_os_error();
        }
        return static_cast<std::size_t>(bytes);
#else
        // pread rejects offsets that do not fit in off_t; there is nothing to read there.
        fsl_unlikely_if(offset > static_cast<std::uint64_t>((std::numeric_limits<off_t>::max)())) {
            return std::size_t(0);
        }
        const auto count = std::min<std::size_t>(size, (std::numeric_limits<ssize_t>::max)());
        const auto bytes = pread(handle, buffer, count, static_cast<off_t>(offset));
        fsl_unlikely_if(bytes == -1) {
            return last_os_error();
        }
        return static_cast<std::size_t>(bytes);
#endif
    }

    fsl_module void close_handle(native_handle_t handle) noexcept {
        fsl_profile_scoped();
        fsl_unlikely_if(handle == invalid_handle()) {
            return;
        }
#if defined(_WIN32)
        fsl_unlikely_if(!CloseHandle(handle)) {
            const auto error = last_os_error();
            logger().warn("failed to close handle {}: {}", (const void*)handle, error.message());
        }
#else
        fsl_unlikely_if(close(handle) == -1) {
            const auto error = last_os_error();
            logger().warn("failed to close descriptor {}: {}", handle, error.message());
        }
#endif
    }
} // namespace fsl::dtl
