/**
 * @file archive_extractor.cpp
 * @brief tar / tar.gz extraction through libarchive
 */

#include <prebuilt/extraction/archive_extractor.hpp>

#include <archive.h>
#include <archive_entry.h>
#include <spdlog/spdlog.h>

#include <system_error>

namespace prebuilt::extraction {

namespace fs = std::filesystem;

namespace {

struct ArchiveReadDeleter {
    void operator()(struct archive* a) const noexcept { archive_read_free(a); }
};
struct ArchiveWriteDeleter {
    void operator()(struct archive* a) const noexcept { archive_write_free(a); }
};
using ArchiveReadPtr = std::unique_ptr<struct archive, ArchiveReadDeleter>;
using ArchiveWritePtr = std::unique_ptr<struct archive, ArchiveWriteDeleter>;

std::string archiveError(struct archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? std::string(msg) : std::string("unknown libarchive error");
}

// Entry names must stay below the destination directory
bool isSafeRelative(const fs::path& p) {
    if (p.empty() || p.is_absolute() || p.has_root_name() || p.has_root_directory())
        return false;
    for (const auto& part : p) {
        if (part == "..")
            return false;
    }
    return true;
}

class TarGzExtractor final : public IArchiveExtractor {
public:
    Result<ExtractReport> extract(const fs::path& archivePath, const fs::path& destDir) override {
        ExtractReport report;
        auto warn = [&report](std::string msg) {
            spdlog::warn("{}", msg);
            report.warnings.push_back(std::move(msg));
        };

        ArchiveReadPtr in{archive_read_new()};
        ArchiveWritePtr out{archive_write_disk_new()};
        if (!in || !out) {
            return Error{ErrorCode::ExtractError, "libarchive allocation failed"};
        }

        archive_read_support_format_tar(in.get());
        archive_read_support_filter_gzip(in.get());
        archive_read_support_filter_none(in.get());

        archive_write_disk_set_options(out.get(), ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM |
                                                      ARCHIVE_EXTRACT_SECURE_NODOTDOT |
                                                      ARCHIVE_EXTRACT_SECURE_SYMLINKS);
        archive_write_disk_set_standard_lookup(out.get());

        if (archive_read_open_filename(in.get(), archivePath.string().c_str(), 10240) !=
            ARCHIVE_OK) {
            return Error{ErrorCode::ExtractError, "Failed to open archive " +
                                                      archivePath.string() + ": " +
                                                      archiveError(in.get())};
        }

        // SECURE_SYMLINKS also applies to the destination prefix
        std::error_code ec;
        fs::path root = fs::absolute(destDir, ec).lexically_normal();
        if (!ec)
            fs::create_directories(root, ec);
        if (!ec)
            root = fs::canonical(root, ec);
        if (ec) {
            return Error{ErrorCode::ExtractError,
                         "Failed to create destination directory: " + ec.message()};
        }

        for (;;) {
            struct archive_entry* entry = nullptr;
            int r = archive_read_next_header(in.get(), &entry);
            if (r == ARCHIVE_EOF)
                break;
            if (r < ARCHIVE_WARN) {
                return Error{ErrorCode::ExtractError,
                             "Corrupt archive " + archivePath.string() + ": " +
                                 archiveError(in.get())};
            }
            if (r == ARCHIVE_WARN) {
                warn(archiveError(in.get()));
            }

            const fs::path name = archive_entry_pathname(entry) ? archive_entry_pathname(entry)
                                                                 : "";
            if (!isSafeRelative(name)) {
                warn("Skipping unsafe archive entry: " + name.string());
                archive_read_data_skip(in.get());
                continue;
            }
            archive_entry_set_pathname(entry, (root / name).string().c_str());

            if (const char* link = archive_entry_hardlink(entry)) {
                const fs::path target = link;
                if (!isSafeRelative(target)) {
                    warn("Skipping hardlink with unsafe target: " + name.string());
                    archive_read_data_skip(in.get());
                    continue;
                }
                archive_entry_set_hardlink(entry, (root / target).string().c_str());
            }

            r = archive_write_header(out.get(), entry);
            if (r < ARCHIVE_OK) {
                warn("Failed to extract " + name.string() + ": " + archiveError(out.get()));
            }
            if (r >= ARCHIVE_WARN && archive_entry_size(entry) > 0) {
                const void* buff = nullptr;
                size_t size = 0;
                la_int64_t offset = 0;
                for (;;) {
                    r = archive_read_data_block(in.get(), &buff, &size, &offset);
                    if (r == ARCHIVE_EOF)
                        break;
                    if (r < ARCHIVE_WARN) {
                        return Error{ErrorCode::ExtractError,
                                     "Failed to read " + name.string() + ": " +
                                         archiveError(in.get())};
                    }
                    if (archive_write_data_block(out.get(), buff, size, offset) < ARCHIVE_OK) {
                        warn("Failed to write " + name.string() + ": " +
                             archiveError(out.get()));
                        break;
                    }
                }
            }
            if (archive_write_finish_entry(out.get()) < ARCHIVE_OK) {
                warn("Failed to finish " + name.string() + ": " + archiveError(out.get()));
            }
            ++report.entries;
        }

        if (archive_write_close(out.get()) < ARCHIVE_OK) {
            warn("Failed to finalize extraction: " + archiveError(out.get()));
        }
        spdlog::debug("extracted {} entries from {} into {}", report.entries,
                      archivePath.string(), root.string());
        return report;
    }
};

} // namespace

std::unique_ptr<IArchiveExtractor> makeTarGzExtractor() {
    return std::make_unique<TarGzExtractor>();
}

} // namespace prebuilt::extraction
