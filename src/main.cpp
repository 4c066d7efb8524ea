#include <fileslice/archive/slice_tarball.hpp>
#include <fileslice/archive/tar.hpp>

#include <fileslice/core/file_slice.hpp>

#include <fileslice/detail/logger.hpp>

#include <cstdint>
#include <cstdio>
#include <array>

int main(int argc, char** argv) {
    fsl::dtl::load_log_levels();
    auto& logger = fsl::dtl::logger();
    if (argc != 3) {
        logger.error("usage: fileslice-tarcat <tarball> <entry>");
        return 1;
    }
    auto archive = fsl::make_tar_archive(argv[1]);
    if (!archive) {
        return 1;
    }
    auto slices = fsl::slice_tarball(archive.unwrap());
    if (!slices) {
        logger.error("cannot read \"{}\" as a tarball: {}", argv[1], slices.error().message());
        return 1;
    }
    auto slice = fsl::find_entry(slices.value(), argv[2]);
    if (!slice) {
        logger.error("no entry \"{}\" in \"{}\"", argv[2], argv[1]);
        return 1;
    }
    std::array<std::uint8_t, 64 * 1024> buffer;
    while (true) {
        auto bytes = slice->read(buffer);
        if (!bytes) {
            logger.error("reading \"{}\" failed: {}", argv[2], bytes.error().message());
            return 1;
        }
        if (bytes.value() == 0) {
            break;
        }
        if (std::fwrite(buffer.data(), 1, bytes.value(), stdout) != bytes.value()) {
            logger.error("failed writing to stdout");
            return 1;
        }
    }
    return std::fflush(stdout) == 0 ? 0 : 1;
}
