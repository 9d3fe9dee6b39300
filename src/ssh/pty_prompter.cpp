#include "pty_prompter.hpp"
#include "expect.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/socket_util.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <chrono>
#include <vector>
#include <unistd.h>
#include <fcntl.h>

PtyPrompter::PtyPrompter(int pty_master, CtrlExpectConfig config, std::string destination)
    : fd_(pty_master >= 0 ? fcntl(pty_master, F_DUPFD_CLOEXEC, 0) : -1),
      config_(std::move(config)),
      destination_(std::move(destination)) {
}

PtyPrompter::~PtyPrompter() {
    cancel();
    if (fd_ >= 0) close(fd_);
}

void PtyPrompter::start() {
    if (fd_ < 0 || thread_.joinable()) return;
    thread_ = std::thread(&PtyPrompter::run, this);
}

void PtyPrompter::cancel() {
    cancelled_.store(true);
    if (thread_.joinable()) thread_.join();
}

bool PtyPrompter::write_response(const std::string& text) {
    std::string line = text;
    if (line.empty() || (line.back() != '\r' && line.back() != '\n')) line += '\r';
    return platform::write_all(fd_, line.data(), line.size());
}

void PtyPrompter::run() {
    using clock = std::chrono::steady_clock;
    bool bounded = config_.timeout_secs > 0;
    auto deadline = clock::now() + std::chrono::seconds(bounded ? config_.timeout_secs : 0);

    auto remaining = [&]() {
        if (!bounded) return std::chrono::milliseconds(EXPECT_POLL_MS);
        return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
    };
    auto expired = [&]() { return bounded && clock::now() >= deadline; };

    ExpectMatcher matcher(fd_);
    int count = std::min<int>(config_.count, static_cast<int>(config_.prompts.size()));
    if (count < config_.count) {
        debug(fmt::format("{} expect count {} exceeds the {} configured prompt(s)",
                          destination_, config_.count, config_.prompts.size()));
    }

    for (int i = 0; i < count; ++i) {
        const auto& rule = config_.prompts[i];
        std::vector<Pattern> patterns{Pattern(rule.pattern)};

        while (true) {
            if (cancelled_.load()) return;
            if (expired()) {
                debug(fmt::format("{} expect timeout waiting for [{}]", destination_, rule.pattern));
                return;
            }
            auto result = matcher.expect(patterns, remaining(), &cancelled_);
            if (result.closed) return;
            if (!result.matched) continue;

            debug(fmt::format("{} expect [{}] matched, sending response {}",
                              destination_, rule.pattern, i + 1));
            if (!write_response(rule.send)) {
                debug(fmt::format("{} write prompt response failed", destination_));
                return;
            }
            answered_.fetch_add(1);
            matcher.clear_buffer();
            break;
        }
    }

    // Keep the terminal drained until startup finishes.
    while (!cancelled_.load() && !expired()) {
        if (!matcher.drain(EXPECT_POLL_MS)) return;
    }
}
