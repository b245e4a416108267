// requirements.hpp
#pragma once
#include "ConfigManager.hpp"
#include "PatternMatcherHS.hpp"
#include <memory>
#include <string>
#include <vector>

struct StartupResult {
    bool ok = false;
    int exit_code = 0;              // non-zero status when !ok
    std::string error;
    std::vector<std::string> logs;
    ConfigManager config;
    std::unique_ptr<PatternMatcherHS> matcher;
};

class Requirements {
public:
    // Empty config_path means built-in defaults.
    static StartupResult run(int argc, const char* const* argv,
                             const std::string& config_path);

    static std::string usage(const std::string& prog);

private:
    static bool checkArgs(int argc, const char* const* argv, StartupResult& out);
    static bool loadConfig(const std::string& config_path, StartupResult& out);
    static bool openLog(StartupResult& out);
    static bool checkPlatform(StartupResult& out);
    static bool compilePattern(const std::string& pattern, StartupResult& out);
};
