// include/ConfigManager.hpp
#pragma once
#include <string>
#include <cstdint>

class ConfigManager {
public:
    explicit ConfigManager() = default;
    bool loadFromFile(const std::string& config_path);

    const std::string& getLogPath() const { return log_path_; }
    bool flushEachLine() const { return flush_each_line_; }
    bool utf8() const { return utf8_; }

    // 0 = no cap beyond the engine's scan length limit
    std::uint64_t max_line_bytes() const { return max_line_bytes_; }

    static std::uint64_t parse_size_kb_mb(const std::string& s);

private:
    std::string log_path_;
    bool flush_each_line_ = true;
    bool utf8_ = false;
    std::uint64_t max_line_bytes_ = 0;
};
