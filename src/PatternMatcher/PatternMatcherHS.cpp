#include "PatternMatcherHS.hpp"
#include <iostream>
#include <limits>

PatternMatcherHS::PatternMatcherHS() = default;

PatternMatcherHS::~PatternMatcherHS() {
    freeAll_();
}

void PatternMatcherHS::freeAll_() noexcept {
    if (scratch_) { hs_free_scratch(scratch_); scratch_ = nullptr; }
    if (db_)      { hs_free_database(db_);     db_      = nullptr; }
    ready_ = false;
}

bool PatternMatcherHS::platformSupported() {
    return hs_valid_platform() == HS_SUCCESS;
}

// Desc: compile a single pattern into a block-mode database and allocate scratch
// In: const std::string& pattern, bool utf8
// Out: bool (true on success, lastError() set otherwise)
bool PatternMatcherHS::compile(const std::string& pattern, bool utf8) {
    freeAll_();
    pattern_ = pattern;
    last_error_.clear();

    // existence-only per line; accept patterns that can match an empty line
    unsigned flags = HS_FLAG_SINGLEMATCH | HS_FLAG_ALLOWEMPTY;
    if (utf8) flags |= HS_FLAG_UTF8;

    hs_compile_error_t* ce = nullptr;
    hs_error_t rc = hs_compile(
        pattern.c_str(),
        flags,
        HS_MODE_BLOCK,
        nullptr,
        &db_,
        &ce
    );

    if (rc != HS_SUCCESS) {
        if (ce && ce->message) {
            last_error_ = ce->message;
        } else {
            last_error_ = "unknown compile error";
        }
        if (ce) hs_free_compile_error(ce);
        freeAll_();
        return false;
    }
    if (ce) hs_free_compile_error(ce);

    rc = hs_alloc_scratch(db_, &scratch_);
    if (rc != HS_SUCCESS) {
        last_error_ = "hs_alloc_scratch failed (rc=" + std::to_string(rc) + ")";
        freeAll_();
        return false;
    }

    ready_ = true;
    return true;
}

// Desc: block-scan one line, stopping at the first match
// In: const std::string& text, bool& matched
// Out: bool (false on engine error or oversized line)
bool PatternMatcherHS::scanLine(const std::string& text, bool& matched) const {
    matched = false;
    if (!ready_) return false;
    if (text.size() > std::numeric_limits<unsigned int>::max()) return false;

    auto on_match = [](unsigned int, unsigned long long, unsigned long long, unsigned int, void* ctx) -> int {
        *static_cast<bool*>(ctx) = true;
        return 1; // stop scanning
    };

    hs_error_t rc = hs_scan(
        db_,
        text.data(),
        static_cast<unsigned int>(text.size()),
        0,
        scratch_,
        on_match,
        &matched
    );

    return rc == HS_SUCCESS || rc == HS_SCAN_TERMINATED;
}

bool PatternMatcherHS::matches(const std::string& text) const {
    bool matched = false;
    if (!scanLine(text, matched)) {
        std::cerr << "[PatternMatcherHS] hs_scan failed\n";
        return false;
    }
    return matched;
}
