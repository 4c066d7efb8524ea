#pragma once

#include <fileslice/detail/macros.hpp>

#include <optional>
#include <cstdint>

namespace fsl {
    // Half-open byte range relative to a FileSlice's window; an empty bound
    // means "from the window's start" or "to the window's end".
    struct Range {
        std::optional<std::uint64_t> start;
        std::optional<std::uint64_t> end;
    };

    fsl_nodiscard constexpr Range range(std::uint64_t start, std::uint64_t end) noexcept {
        return { start, end };
    }

    fsl_nodiscard constexpr Range range_from(std::uint64_t start) noexcept {
        return { start, std::nullopt };
    }

    fsl_nodiscard constexpr Range range_to(std::uint64_t end) noexcept {
        return { std::nullopt, end };
    }

    fsl_nodiscard constexpr Range range_full() noexcept {
        return { std::nullopt, std::nullopt };
    }

    struct SeekFrom {
        enum Origin {
            origin_start,
            origin_current,
            origin_end
        } origin;
        // origin_start uses position, the other two use offset.
        std::uint64_t position;
        std::int64_t offset;
    };

    fsl_nodiscard constexpr SeekFrom seek_start(std::uint64_t position) noexcept {
        return { SeekFrom::origin_start, position, 0 };
    }

    fsl_nodiscard constexpr SeekFrom seek_current(std::int64_t offset) noexcept {
        return { SeekFrom::origin_current, 0, offset };
    }

    fsl_nodiscard constexpr SeekFrom seek_end(std::int64_t offset) noexcept {
        return { SeekFrom::origin_end, 0, offset };
    }
} // namespace fsl
