#include <watchman/cli/watchman_cli.h>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <exception>
#include <iostream>

int main(int argc, char* argv[]) {
    // stdout carries the response; diagnostics go to stderr and only above warn
    auto logger = spdlog::stderr_color_mt("watchman");
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::warn);
    spdlog::set_pattern("[%H:%M:%S] [%l] %v");

    try {
        watchman::cli::WatchmanCLI cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "watchman: " << e.what() << std::endl;
        return 1;
    }
}
