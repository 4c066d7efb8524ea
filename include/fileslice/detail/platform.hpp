#pragma once

#include <fileslice/core/expected.hpp>

#include <fileslice/detail/macros.hpp>

#include <cstddef>
#include <cstdint>

namespace fsl {
#if defined(_WIN32)
    using native_handle_t = void*;
#else
    using native_handle_t = int;
#endif
} // namespace fsl

namespace fsl::dtl {
    // Positional I/O primitives, one implementation per platform. None of them
    // consult or move a file-wide cursor, so any number of FileSlices may read
    // through the same handle concurrently.
    fsl_nodiscard fsl_module native_handle_t                   invalid_handle() noexcept;
    fsl_nodiscard fsl_module Expected<native_handle_t>         open_read_only(const char*) noexcept;
    fsl_nodiscard fsl_module Expected<std::uint64_t>           file_length(native_handle_t) noexcept;
    fsl_nodiscard fsl_module Expected<std::size_t>             read_at(native_handle_t, void*, std::size_t, std::uint64_t) noexcept;
                  fsl_module void                              close_handle(native_handle_t) noexcept;
} // namespace fsl::dtl
