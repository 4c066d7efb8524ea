#pragma once

#include <cstdint>

namespace fsl {
    constexpr auto tar_block_size        = 512u;
    constexpr auto tar_checksum_offset   = 148u;
    constexpr auto tar_checksum_size     = 8u;
    constexpr auto tar_max_metadata_size = std::uint64_t(1) << 20; // GNU long names and pax records
} // namespace fsl
