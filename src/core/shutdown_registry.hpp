#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <vector>

// Deferred teardown actions bound to the whole client run.
//
// Components append during setup; the owner drains once at a single
// shutdown point. Actions run last-registered-first. An action added after
// the drain runs immediately, so nothing registered late is leaked.
class ShutdownRegistry {
public:
    using Action = std::function<void()>;

    explicit ShutdownRegistry(std::string name);
    ~ShutdownRegistry();

    ShutdownRegistry(const ShutdownRegistry&) = delete;
    ShutdownRegistry& operator=(const ShutdownRegistry&) = delete;

    void add(Action action);

    // Run every pending action. Later calls are no-ops.
    void drain();

    bool drained() const;
    size_t pending() const;
    const std::string& name() const { return name_; }

private:
    std::string name_;
    mutable std::mutex mutex_;
    std::vector<Action> actions_;
    bool drained_ = false;
};
