#include <fileslice/core/error.hpp>

#if defined(_WIN32)
    #include <Windows.h>
#else
    #include <cerrno>
#endif

#include <string>

namespace fsl {
    struct ErrorCategory : std::error_category {
        fsl_nodiscard const char* name() const noexcept override {
            return "fileslice";
        }

        fsl_nodiscard std::string message(int value) const override {
            switch (static_cast<errc>(value)) {
                case errc::out_of_bounds:     return "Out of bounds";
                case errc::unexpected_eof:    return "Unexpected end of window";
                case errc::invalid_archive:   return "Invalid archive header";
                case errc::truncated_archive: return "Archive header truncated";
            }
            return "Unknown fileslice error";
        }
    };

    fsl_nodiscard fsl_module const std::error_category& error_category() noexcept {
        static const ErrorCategory category;
        return category;
    }

    fsl_nodiscard fsl_module std::error_code make_error_code(errc code) noexcept {
        return { static_cast<int>(code), error_category() };
    }

    fsl_nodiscard fsl_module std::error_code last_os_error() noexcept {
#if defined(_WIN32)
        return { static_cast<int>(GetLastError()), std::system_category() };
#else
        return { errno, std::system_category() };
#endif
    }
} // namespace fsl
