#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <thread>

namespace prebuilt::test_support {

// Owns a unique temporary directory and removes it on destruction.
class TempDirScope {
public:
    explicit TempDirScope(std::filesystem::path root) : root_(std::move(root)) {}
    TempDirScope(const TempDirScope&) = delete;
    TempDirScope& operator=(const TempDirScope&) = delete;

    ~TempDirScope() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& path() const { return root_; }

    static std::filesystem::path unique_path(const std::string& base_name) {
        auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id());
        auto n = counter_.fetch_add(1, std::memory_order_relaxed);
        auto root = std::filesystem::temp_directory_path() /
                    (base_name + "-" + std::to_string(now) + "-" + std::to_string(tid) + "-" +
                     std::to_string(n));
        std::error_code ec;
        std::filesystem::create_directories(root, ec);
        return root;
    }

private:
    std::filesystem::path root_;
    static inline std::atomic<std::uint64_t> counter_{0};
};

} // namespace prebuilt::test_support
