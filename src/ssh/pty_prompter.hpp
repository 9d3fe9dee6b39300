#pragma once

#include <atomic>
#include <string>
#include <thread>
#include <core/types.hpp>

// Answers the interactive prompts of a child attached to a pty.
//
// Works through config.prompts in order: waits for each pattern on the pty
// master, writes the configured response, then keeps draining output so
// the child never blocks on its terminal. Stops at the deadline (when
// config.timeout_secs > 0), on cancel(), or when the pty closes. Stopping
// never touches the child process itself.
//
// Reads and writes through its own duplicate of the master descriptor; the
// caller keeps ownership of the original.
class PtyPrompter {
public:
    PtyPrompter(int pty_master, CtrlExpectConfig config, std::string destination);
    ~PtyPrompter();

    PtyPrompter(const PtyPrompter&) = delete;
    PtyPrompter& operator=(const PtyPrompter&) = delete;

    void start();

    // Stop and join. Idempotent.
    void cancel();

    // Number of prompts answered so far.
    int answered() const { return answered_.load(); }

private:
    int fd_;
    CtrlExpectConfig config_;
    std::string destination_;
    std::atomic<bool> cancelled_{false};
    std::atomic<int> answered_{0};
    std::thread thread_;

    void run();
    bool write_response(const std::string& text);
};
