// === src/LineFilter/LineFilter.cpp ===
#include "LineFilter.hpp"
#include "ConfigManager.hpp"
#include "PatternMatcherHS.hpp"

#include <cerrno>
#include <cstring>
#include <iostream>

// Desc: strict UTF-8 check (no overlongs, surrogates or code points above U+10FFFF)
// In: const std::string& s
// Out: bool
static bool valid_utf8(const std::string& s) {
    const unsigned char* p = reinterpret_cast<const unsigned char*>(s.data());
    const size_t n = s.size();
    size_t i = 0;
    while (i < n) {
        unsigned char c = p[i];
        if (c < 0x80) { ++i; continue; }

        size_t len;
        unsigned char lo = 0x80, hi = 0xBF;
        if (c >= 0xC2 && c <= 0xDF)      { len = 2; }
        else if (c == 0xE0)              { len = 3; lo = 0xA0; }
        else if (c == 0xED)              { len = 3; hi = 0x9F; }
        else if (c >= 0xE1 && c <= 0xEF) { len = 3; }
        else if (c == 0xF0)              { len = 4; lo = 0x90; }
        else if (c == 0xF4)              { len = 4; hi = 0x8F; }
        else if (c >= 0xF1 && c <= 0xF3) { len = 4; }
        else return false;

        if (n - i < len) return false;
        if (p[i + 1] < lo || p[i + 1] > hi) return false;
        for (size_t k = 2; k < len; ++k) {
            if (p[i + k] < 0x80 || p[i + k] > 0xBF) return false;
        }
        i += len;
    }
    return true;
}

// Desc: stream lines from 'in', emit the matching ones to 'out'
// In: std::istream& in, std::ostream& out, const PatternMatcherHS& matcher,
//     const ConfigManager& config, FilterStats& stats
// Out: FilterStatus
FilterStatus run_line_filter(std::istream& in,
                             std::ostream& out,
                             const PatternMatcherHS& matcher,
                             const ConfigManager& config,
                             FilterStats& stats) {
    const bool flush = config.flushEachLine();
    const std::uint64_t max_line = config.max_line_bytes();
    const bool utf8 = config.utf8();

    std::string line;
    while (std::getline(in, line)) {
        ++stats.lines_read;

        if (max_line > 0 && line.size() > max_line) {
            std::cerr << "[LineFilter] line " << stats.lines_read << " exceeds max_line_bytes ("
                      << line.size() << " > " << max_line << ")\n";
            return FilterStatus::ScanError;
        }

        // a UTF-8 database must never see malformed input
        if (utf8 && !valid_utf8(line)) {
            std::cerr << "[LineFilter] invalid UTF-8 on line " << stats.lines_read << "\n";
            return FilterStatus::InputError;
        }

        bool matched = false;
        if (!matcher.scanLine(line, matched)) {
            std::cerr << "[LineFilter] scan failed on line " << stats.lines_read << "\n";
            return FilterStatus::ScanError;
        }
        if (!matched) continue;

        errno = 0;
        out << line << '\n';
        if (flush) out.flush();
        if (!out) {
            if (errno == EPIPE) return FilterStatus::OutputClosed;
            std::cerr << "[LineFilter] error writing standard output: "
                      << (errno ? std::strerror(errno) : "stream failure") << "\n";
            return FilterStatus::OutputError;
        }
        ++stats.lines_matched;
    }

    if (in.bad()) {
        std::cerr << "[LineFilter] error reading standard input\n";
        return FilterStatus::InputError;
    }

    // buffered tail when flushing per line is off
    errno = 0;
    out.flush();
    if (!out) {
        if (errno == EPIPE) return FilterStatus::OutputClosed;
        std::cerr << "[LineFilter] error writing standard output: "
                  << (errno ? std::strerror(errno) : "stream failure") << "\n";
        return FilterStatus::OutputError;
    }
    return FilterStatus::Completed;
}

const char* filter_status_name(FilterStatus s) {
    switch (s) {
        case FilterStatus::Completed:    return "completed";
        case FilterStatus::InputError:   return "input_error";
        case FilterStatus::OutputClosed: return "output_closed";
        case FilterStatus::OutputError:  return "output_error";
        case FilterStatus::ScanError:    return "scan_error";
    }
    return "unknown";
}

int filter_exit_code(FilterStatus s) {
    switch (s) {
        case FilterStatus::Completed:
        case FilterStatus::OutputClosed:
            return 0;
        default:
            return 1;
    }
}
