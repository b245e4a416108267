#pragma once
#include <cstdint>
#include <istream>
#include <ostream>
#include <string>

class ConfigManager;
class PatternMatcherHS;

enum class FilterStatus {
    Completed,      // input exhausted
    InputError,     // input stream went bad
    OutputClosed,   // downstream closed the pipe (EPIPE)
    OutputError,    // any other write failure
    ScanError       // engine failure or line over the configured cap
};

struct FilterStats {
    std::uint64_t lines_read = 0;
    std::uint64_t lines_matched = 0;
};

// Copy every line of 'in' that the matcher accepts to 'out', in order.
FilterStatus run_line_filter(std::istream& in,
                             std::ostream& out,
                             const PatternMatcherHS& matcher,
                             const ConfigManager& config,
                             FilterStats& stats);

const char* filter_status_name(FilterStatus s);

// 0 for Completed/OutputClosed, 1 otherwise.
int filter_exit_code(FilterStatus s);
