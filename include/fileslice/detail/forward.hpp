#pragma once

#include <fileslice/detail/macros.hpp>

#include <system_error>

namespace fsl {
    struct File;
    struct FileSlice;
    struct Range;
    struct SeekFrom;
    struct TarHeader;
    struct TarArchive;
    struct TarballSlices;
    template <typename T, typename E = std::error_code>
    struct Expected;
} // namespace fsl
