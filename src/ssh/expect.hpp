#pragma once

#include <string>
#include <vector>
#include <regex>
#include <chrono>
#include <atomic>

struct Pattern {
    std::regex regex;
    std::string raw;

    Pattern(const std::string& pattern);
};

struct MatchResult {
    bool matched;
    size_t pattern_index;
    std::string matched_text;
    std::string before_text;
    bool closed;  // the descriptor hit EOF or error before a match
};

// Accumulates output read from a descriptor (a pty master) and matches it
// against a set of patterns.
class ExpectMatcher {
public:
    explicit ExpectMatcher(int fd);

    // Wait until one of patterns matches the accumulated output, the
    // timeout passes, cancel becomes true, or the descriptor closes.
    MatchResult expect(const std::vector<Pattern>& patterns,
                       std::chrono::milliseconds timeout,
                       const std::atomic<bool>* cancel = nullptr);

    // Read and discard whatever is pending, waiting at most wait_ms.
    // False once the descriptor is closed.
    bool drain(int wait_ms);

    void clear_buffer() { buffer_.clear(); }
    const std::string& get_buffer() const { return buffer_; }

private:
    int fd_;
    std::string buffer_;

    // Append available data to buffer_. False on EOF/error.
    bool read_available(int wait_ms);
    bool check_patterns(const std::vector<Pattern>& patterns, MatchResult& result);
};
