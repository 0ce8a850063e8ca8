/*
 * prebuilt/src/fetch/disk_writer.cpp
 *
 * DiskWriter implementation:
 * - Staging file is created or truncated on open, restrictive permissions (0600) on POSIX
 * - Chunks are appended through a single open stream
 * - close() flushes and fsyncs before the digest decision is acted upon
 * - publish() is one rename onto the final path, followed by a directory fsync
 */

#include <prebuilt/fetch/fetcher.hpp>

#include <spdlog/spdlog.h>

#include <fstream>
#include <system_error>

#if defined(_WIN32)
#define NOMINMAX
#include <Windows.h>
#else
#include <fcntl.h>
#include <unistd.h>
#endif

namespace prebuilt::fetch {

namespace fs = std::filesystem;

namespace {

// ---------- Helpers (platform-specific sync) ----------

Result<void> fsync_file(const fs::path& p) {
#if defined(_WIN32)
    HANDLE h = CreateFileW(p.wstring().c_str(), GENERIC_READ | GENERIC_WRITE,
                           FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE, nullptr,
                           OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (h == INVALID_HANDLE_VALUE) {
        return Error{ErrorCode::FilesystemError, "CreateFile failed for fsync: " + p.string()};
    }
    if (!FlushFileBuffers(h)) {
        CloseHandle(h);
        return Error{ErrorCode::FilesystemError, "FlushFileBuffers failed for: " + p.string()};
    }
    CloseHandle(h);
    return {};
#else
    int fd = ::open(p.c_str(), O_RDONLY);
    if (fd < 0) {
        return Error{ErrorCode::FilesystemError, "open() failed for fsync: " + p.string()};
    }
    if (::fsync(fd) != 0) {
        ::close(fd);
        return Error{ErrorCode::FilesystemError, "fsync() failed for: " + p.string()};
    }
    ::close(fd);
    return {};
#endif
}

void fsync_dir_best_effort(const fs::path& dir) {
#if !defined(_WIN32)
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        spdlog::debug("open(O_DIRECTORY) failed for {}", dir.string());
        return;
    }
    if (::fsync(fd) != 0) {
        spdlog::debug("fsync(dir) failed for {}", dir.string());
    }
    ::close(fd);
#else
    (void)dir;
#endif
}

void ensure_file_private(const fs::path& p) {
#if !defined(_WIN32)
    std::error_code ec;
    fs::permissions(p, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace,
                    ec);
    if (ec) {
        spdlog::debug("Failed to set private file perms on {}: {}", p.string(), ec.message());
    }
#else
    (void)p;
#endif
}

void set_file_shared_readable(const fs::path& p) {
#if !defined(_WIN32)
    std::error_code ec;
    fs::permissions(p,
                    fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read |
                        fs::perms::others_read,
                    fs::perm_options::replace, ec);
    if (ec) {
        spdlog::debug("Failed to set permissions on {}: {}", p.string(), ec.message());
    }
#else
    (void)p;
#endif
}

fs::path parent_or_current(const fs::path& p) {
    auto parent = p.parent_path();
    return parent.empty() ? fs::path(".") : parent;
}

} // namespace

// ---------- DiskWriter implementation ----------

class DiskWriter final : public IDiskWriter {
public:
    ~DiskWriter() override {
        if (out_.is_open())
            out_.close();
    }

    Result<void> openStaging(const fs::path& stagingPath) override {
        if (out_.is_open())
            out_.close();
        written_ = 0;
        path_ = stagingPath;

        std::error_code ec;
        auto dir = stagingPath.parent_path();
        if (!dir.empty()) {
            fs::create_directories(dir, ec);
            if (ec) {
                return Error{ErrorCode::FilesystemError, "Failed to create staging dir " +
                                                             dir.string() + ": " + ec.message()};
            }
        }

        out_.open(stagingPath, std::ios::binary | std::ios::out | std::ios::trunc);
        if (!out_.is_open()) {
            return Error{ErrorCode::FilesystemError,
                         "Failed to create staging file: " + stagingPath.string()};
        }
        ensure_file_private(stagingPath);
        return {};
    }

    Result<void> append(ByteSpan data) override {
        if (!out_.is_open()) {
            return Error{ErrorCode::FilesystemError, "staging file is not open"};
        }
        if (data.empty())
            return {};
        out_.write(reinterpret_cast<const char*>(data.data()),
                   static_cast<std::streamsize>(data.size()));
        if (!out_.good()) {
            return Error{ErrorCode::FilesystemError, "write failed on: " + path_.string()};
        }
        written_ += static_cast<std::uint64_t>(data.size());
        return {};
    }

    Result<std::uint64_t> close() override {
        if (!out_.is_open()) {
            return Error{ErrorCode::FilesystemError, "staging file is not open"};
        }
        out_.flush();
        const bool ok = out_.good();
        out_.close();
        if (!ok) {
            return Error{ErrorCode::FilesystemError, "flush failed on: " + path_.string()};
        }
        auto r = fsync_file(path_);
        if (!r)
            return r.error();
        return written_;
    }

    Result<void> publish(const fs::path& stagingPath, const fs::path& finalPath) override {
        std::error_code ec;
        auto dir = finalPath.parent_path();
        if (!dir.empty()) {
            fs::create_directories(dir, ec);
            if (ec) {
                return Error{ErrorCode::FilesystemError,
                             "Failed to create directory " + dir.string() + ": " + ec.message()};
            }
        }

        fs::rename(stagingPath, finalPath, ec);
        if (ec) {
            return Error{ErrorCode::FilesystemError, "rename() failed (" + ec.message() +
                                                         ") from " + stagingPath.string() +
                                                         " to " + finalPath.string()};
        }

        set_file_shared_readable(finalPath);
        fsync_dir_best_effort(parent_or_current(finalPath));
        return {};
    }

    void cleanup(const fs::path& stagingPath) noexcept override {
        if (out_.is_open() && path_ == stagingPath)
            out_.close();
        std::error_code ec;
        fs::remove(stagingPath, ec);
        if (ec) {
            spdlog::debug("cleanup: failed to remove staging file {}: {}", stagingPath.string(),
                          ec.message());
        }
    }

private:
    std::ofstream out_;
    fs::path path_;
    std::uint64_t written_{0};
};

std::unique_ptr<IDiskWriter> makeDiskWriter() {
    return std::make_unique<DiskWriter>();
}

} // namespace prebuilt::fetch
