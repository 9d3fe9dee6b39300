#include "shutdown_registry.hpp"
#include "log.hpp"
#include <fmt/format.h>

ShutdownRegistry::ShutdownRegistry(std::string name) : name_(std::move(name)) {}

ShutdownRegistry::~ShutdownRegistry() {
    drain();
}

void ShutdownRegistry::add(Action action) {
    if (!action) return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!drained_) {
            actions_.push_back(std::move(action));
            return;
        }
    }
    ctlssh_log(fmt::format("{}: action added after drain, running now", name_));
    action();
}

void ShutdownRegistry::drain() {
    std::vector<Action> actions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (drained_) return;
        drained_ = true;
        actions.swap(actions_);
    }
    if (!actions.empty()) {
        ctlssh_log(fmt::format("{}: running {} cleanup action(s)", name_, actions.size()));
    }
    for (auto it = actions.rbegin(); it != actions.rend(); ++it) {
        (*it)();
    }
}

bool ShutdownRegistry::drained() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return drained_;
}

size_t ShutdownRegistry::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return actions_.size();
}
