#pragma once

#include <functional>
#include <thread>
#include <signal.h>

namespace platform {

// Scoped SIGINT listener.
//
// While alive, SIGINT no longer terminates the process; the first one
// invokes on_interrupt on a helper thread. The destructor restores the
// previous disposition and joins the helper. Only one listener may be alive
// at a time.
class InterruptListener {
public:
    using Callback = std::function<void()>;

    explicit InterruptListener(Callback on_interrupt);
    ~InterruptListener();

    InterruptListener(const InterruptListener&) = delete;
    InterruptListener& operator=(const InterruptListener&) = delete;

    // False if the handler could not be installed.
    bool active() const { return installed_; }

private:
    int sig_pipe_[2] = {-1, -1};
    int stop_pipe_[2] = {-1, -1};
    struct sigaction old_sa_;
    bool installed_ = false;
    std::thread thread_;

    void wait_loop(Callback on_interrupt);
};

} // namespace platform
