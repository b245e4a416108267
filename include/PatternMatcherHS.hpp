#pragma once
#include <string>
#include <hs/hs.h>

// Single-pattern line matcher built on Hyperscan (block mode).
class PatternMatcherHS {
public:
    PatternMatcherHS();
    ~PatternMatcherHS();

    PatternMatcherHS(const PatternMatcherHS&) = delete;
    PatternMatcherHS& operator=(const PatternMatcherHS&) = delete;

    // Compile (or recompile) 'pattern'. Returns false if Hyperscan rejects it;
    // the engine's message is then available from lastError().
    bool compile(const std::string& pattern, bool utf8 = false);

    // Scan one line. Returns false on engine failure; 'matched' is only
    // meaningful when the call succeeds.
    bool scanLine(const std::string& text, bool& matched) const;

    // Fast boolean check: does the pattern match anywhere in 'text'?
    bool matches(const std::string& text) const;

    static bool platformSupported();

    bool isReady() const { return ready_; }
    const std::string& pattern()   const { return pattern_; }
    const std::string& lastError() const { return last_error_; }

private:
    hs_database_t* db_{nullptr};
    hs_scratch_t*  scratch_{nullptr};
    bool           ready_{false};
    std::string    pattern_;
    std::string    last_error_;

    void freeAll_() noexcept;
};
