#include "expect.hpp"
#include <core/constants.hpp>
#include <algorithm>
#include <cerrno>
#include <poll.h>
#include <unistd.h>

static std::string escape_regex(const std::string& s) {
    static const std::string special = "\\^$.|?*+()[]{}";
    std::string out;
    for (char c : s) {
        if (special.find(c) != std::string::npos) out += '\\';
        out += c;
    }
    return out;
}

Pattern::Pattern(const std::string& pattern) : raw(pattern) {
    try {
        regex = std::regex(pattern, std::regex::extended);
    } catch (const std::regex_error&) {
        // Not a valid expression: match it literally.
        regex = std::regex(escape_regex(pattern), std::regex::extended);
    }
}

ExpectMatcher::ExpectMatcher(int fd) : fd_(fd) {}

MatchResult ExpectMatcher::expect(const std::vector<Pattern>& patterns,
                                  std::chrono::milliseconds timeout,
                                  const std::atomic<bool>* cancel) {
    MatchResult result{false, 0, "", "", false};
    if (fd_ < 0) {
        result.closed = true;
        return result;
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        // Check if we have a match in current buffer
        if (check_patterns(patterns, result)) {
            return result;
        }

        if (cancel && cancel->load()) break;

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) break;

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        int slice = static_cast<int>(std::min<long long>(remaining.count(), EXPECT_POLL_MS));

        if (!read_available(std::max(slice, 1))) {
            result.closed = true;
            break;
        }
    }

    result.matched = false;
    result.before_text = buffer_;
    return result;
}

bool ExpectMatcher::drain(int wait_ms) {
    bool open = read_available(wait_ms);
    buffer_.clear();
    return open;
}

bool ExpectMatcher::read_available(int wait_ms) {
    struct pollfd pfd = {fd_, POLLIN, 0};
    int pr = poll(&pfd, 1, wait_ms);
    if (pr < 0) return errno == EINTR;
    if (pr == 0) return true;
    if (pfd.revents & POLLNVAL) return false;

    char buf[SSH_READ_BUF_SIZE];
    ssize_t n = read(fd_, buf, sizeof(buf));
    if (n > 0) {
        buffer_.append(buf, static_cast<size_t>(n));
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) return true;
    // EOF, or EIO once the slave side is gone
    return false;
}

bool ExpectMatcher::check_patterns(const std::vector<Pattern>& patterns,
                                   MatchResult& result) {
    for (size_t i = 0; i < patterns.size(); ++i) {
        std::smatch match;
        if (std::regex_search(buffer_, match, patterns[i].regex)) {
            result.matched = true;
            result.pattern_index = i;
            result.matched_text = match[0];
            result.before_text = buffer_.substr(0, match.position());
            return true;
        }
    }
    return false;
}
