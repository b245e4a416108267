// main.cpp
#include "LineFilter.hpp"
#include "Logger.hpp"
#include "requirements.hpp"
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>

int main(int argc, char** argv) {
    // a closed downstream pipe must surface as EPIPE, not kill the process
    std::signal(SIGPIPE, SIG_IGN);
    std::ios::sync_with_stdio(false);

    const char* config_env = std::getenv("LINEFILTER_CONFIG");
    std::string config_path = config_env ? config_env : "";

    auto boot = Requirements::run(argc, argv, config_path);
    if (!boot.ok) {
        std::cerr << boot.error;
        if (boot.error.empty() || boot.error.back() != '\n') std::cerr << "\n";
        Logger::close();
        return boot.exit_code;
    }

    FilterStats stats;
    FilterStatus status = run_line_filter(std::cin, std::cout, *boot.matcher, boot.config, stats);

    Logger::log("[LineFilter] lines_read=" + std::to_string(stats.lines_read) +
                " lines_matched=" + std::to_string(stats.lines_matched) +
                " status=" + filter_status_name(status));
    Logger::close();
    return filter_exit_code(status);
}
