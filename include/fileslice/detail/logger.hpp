#pragma once

#include <fileslice/detail/macros.hpp>

#include <spdlog/logger.h>

namespace fsl::dtl {
    // The library's named logger ("fileslice"), created on first use.
    fsl_nodiscard fsl_module spdlog::logger& logger() noexcept;
    // Applies SPDLOG_LEVEL from the environment, e.g. SPDLOG_LEVEL=fileslice=debug.
                  fsl_module void            load_log_levels() noexcept;
} // namespace fsl::dtl
