#pragma once

#include <fileslice/detail/macros.hpp>

#include <system_error>
#include <type_traits>

namespace fsl {
    enum class errc {
        out_of_bounds = 1,
        unexpected_eof,
        invalid_archive,
        truncated_archive
    };

    fsl_nodiscard constexpr const char* stringify(errc code) noexcept {
        switch (code) {
            case errc::out_of_bounds:     return "out_of_bounds";
            case errc::unexpected_eof:    return "unexpected_eof";
            case errc::invalid_archive:   return "invalid_archive";
            case errc::truncated_archive: return "truncated_archive";
        }
        return "unknown";
    }

    // Category of every library-originated error, named "fileslice".
    // OS failures are reported in std::system_category() untouched.
    fsl_nodiscard fsl_module const std::error_category& error_category() noexcept;
    fsl_nodiscard fsl_module std::error_code            make_error_code(errc) noexcept;
    fsl_nodiscard fsl_module std::error_code            last_os_error() noexcept;
} // namespace fsl

namespace std {
    template <>
    struct is_error_code_enum<fsl::errc> : true_type {};
} // namespace std
