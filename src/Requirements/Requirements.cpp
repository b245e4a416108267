// requirements.cpp
#include "requirements.hpp"
#include "Logger.hpp"
#include <cerrno>
#include <cstring>

static const int kStartupFailure = 2;

// Desc: mark startup as failed with a message and exit status
// In: StartupResult& out, const std::string& msg
// Out: bool (always false)
static bool fail(StartupResult& out, const std::string& msg) {
    out.ok = false;
    out.exit_code = kStartupFailure;
    out.error = msg;
    out.logs.push_back(msg);
    return false;
}

std::string Requirements::usage(const std::string& prog) {
    return "Usage:\n"
           "  cat file.txt | " + prog + " \"<regex>\"\n"
           "Example:\n"
           "  cat emails.txt | " + prog + " \"^[a-zA-Z0-9._%+-]+@[a-zA-Z0-9.-]+\\.[a-zA-Z]{2,}$\"\n";
}

// Desc: require exactly one positional argument (the pattern)
// In: int argc, const char* const* argv, StartupResult& out
// Out: bool (true if a pattern was supplied)
bool Requirements::checkArgs(int argc, const char* const* argv, StartupResult& out) {
    const std::string prog = (argc > 0 && argv && argv[0]) ? argv[0] : "linefilter";
    if (argc != 2) {
        return fail(out, usage(prog));
    }
    out.logs.push_back("[args] pattern: " + std::string(argv[1]));
    return true;
}

// Desc: load JSON config into StartupResult::config (defaults when no path)
// In: const std::string& config_path, StartupResult& out
// Out: bool (true on success)
bool Requirements::loadConfig(const std::string& config_path, StartupResult& out) {
    if (config_path.empty()) {
        out.logs.push_back("[config] no config file, using defaults");
        return true;
    }
    if (!out.config.loadFromFile(config_path)) {
        return fail(out, "[config] failed to load " + config_path);
    }
    out.logs.push_back("[config] loaded: " + config_path);
    out.logs.push_back(std::string("[config] flush_each_line: ") + (out.config.flushEachLine() ? "true" : "false"));
    out.logs.push_back(std::string("[config] utf8: ") + (out.config.utf8() ? "true" : "false"));
    if (out.config.max_line_bytes() > 0)
        out.logs.push_back("[config] max_line_bytes: " + std::to_string(out.config.max_line_bytes()));
    return true;
}

// Desc: open the run log if configured
// In: StartupResult& out
// Out: bool (false if the configured log file cannot be opened)
bool Requirements::openLog(StartupResult& out) {
    const std::string& path = out.config.getLogPath();
    if (path.empty()) return true;
    if (!Logger::open(path)) {
        return fail(out, "[config] cannot open log_path " + path + " (" + std::string(::strerror(errno)) + ")");
    }
    out.logs.push_back("[log] writing to " + path);
    return true;
}

bool Requirements::checkPlatform(StartupResult& out) {
    if (!PatternMatcherHS::platformSupported()) {
        return fail(out, "[Requirements] this CPU is not supported by Hyperscan");
    }
    return true;
}

// Desc: compile the pattern once; the matcher is kept for the whole run
// In: const std::string& pattern, StartupResult& out
// Out: bool (true on success)
bool Requirements::compilePattern(const std::string& pattern, StartupResult& out) {
    auto matcher = std::make_unique<PatternMatcherHS>();
    if (!matcher->compile(pattern, out.config.utf8())) {
        return fail(out, "linefilter: invalid pattern: " + matcher->lastError());
    }
    out.matcher = std::move(matcher);
    out.logs.push_back("[pattern] compiled");
    return true;
}


// Desc: orchestrate startup: args, config, log, engine, pattern
// In: int argc, const char* const* argv, const std::string& config_path
// Out: StartupResult
StartupResult Requirements::run(int argc, const char* const* argv,
                                const std::string& config_path) {
    StartupResult res;

    if (!checkArgs(argc, argv, res)) return res;
    if (!loadConfig(config_path, res)) return res;
    if (!openLog(res)) return res;

    // from here on the startup trail also lands in the run log
    if (!checkPlatform(res) || !compilePattern(argv[1], res)) {
        for (auto& l : res.logs) Logger::log(l);
        return res;
    }

    res.ok = true;
    for (auto& l : res.logs) Logger::log(l);
    return res;
}
