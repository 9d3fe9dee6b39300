#pragma once

#include <functional>
#include <memory>
#include <string>
#include <core/types.hpp>
#include "control_client.hpp"

class HostConfig;
class ShutdownRegistry;

// Starts a control master for (host, socket). Replaceable for tests.
using MasterLauncher = std::function<Result<void>(const HostConfig& host,
                                                  const std::string& socket,
                                                  ShutdownRegistry& on_exit)>;

// Decides whether to reuse, start or skip a control master, and yields a
// ready mux client when a control socket answers. Never fails the
// connection attempt: every problem becomes a warning and nullptr.
//
//   ControlPath ""/none     → nullptr, nothing spawned or dialed
//   ControlMaster yes/ask   → nullptr if the socket already exists,
//                             otherwise behaves like auto
//   ControlMaster auto/...  → start a master (failure is only a warning)
//   anything else           → attach to an existing master, if any
class ControlConnector {
public:
    explicit ControlConnector(ShutdownRegistry& on_exit, MasterLauncher launcher = nullptr);

    std::unique_ptr<ControlClient> connect(const HostConfig& host);

    // ControlPath after token and home expansion; "" when disabled.
    static Result<std::string> control_path(const HostConfig& host);

private:
    ShutdownRegistry& on_exit_;
    MasterLauncher launcher_;
};
