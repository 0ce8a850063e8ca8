#include <spdlog/spdlog.h>
#include <prebuilt/cli/fetch_command.h>

int main(int argc, char* argv[]) {
    try {
        // run() lowers or raises the level for -q / -v
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        return prebuilt::cli::run(argc, argv, prebuilt::config::processEnvironment());
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
