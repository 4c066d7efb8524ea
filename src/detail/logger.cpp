#include <fileslice/detail/logger.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include <exception>
#include <memory>

namespace fsl::dtl {
    fsl_nodiscard fsl_module spdlog::logger& logger() noexcept {
        static const auto instance = [] {
            auto existing = spdlog::get("fileslice");
            fsl_unlikely_if(existing) {
                return existing;
            }
            return spdlog::stderr_color_mt("fileslice");
        }();
        return *instance;
    }

    fsl_module void load_log_levels() noexcept {
        spdlog::cfg::load_env_levels();
    }

    fsl_noreturn fsl_module void panic(const char* message, const char* where) noexcept {
        logger().critical("fsl::panic() was called in {} with: {}", where, message);
        logger().flush();
        std::terminate();
    }
} // namespace fsl::dtl
