#pragma once

#include <prebuilt/core/types.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace prebuilt::extraction {

/**
 * Per-entry problems (unsafe paths, failed permission restores, ...) are reported as
 * warnings; only an unreadable or corrupt archive fails the extraction.
 */
struct ExtractReport {
    std::size_t entries{0};
    std::vector<std::string> warnings;
};

class IArchiveExtractor {
public:
    virtual ~IArchiveExtractor() = default;

    /**
     * Unpack archivePath under destDir. The caller guarantees archivePath has been
     * digest-verified.
     */
    virtual Result<ExtractReport> extract(const std::filesystem::path& archivePath,
                                          const std::filesystem::path& destDir) = 0;
};

/**
 * libarchive-backed extractor for tar archives (gzip-compressed or plain).
 */
std::unique_ptr<IArchiveExtractor> makeTarGzExtractor();

} // namespace prebuilt::extraction
