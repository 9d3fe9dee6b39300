#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <functional>
#include <cstdint>

// Broad category of a failure, for callers that react differently per kind.
enum class ErrorKind {
    None,
    Config,            // bad configuration (e.g. ssh resolves to ourselves)
    Resource,          // pty / pipe / socket allocation failed
    ProcessStart,      // fork/exec failed
    Protocol,          // unexpected bytes from a peer
    PrematureExit,     // child died before signaling readiness
    UserInterrupt,     // SIGINT during startup
    Dial,              // socket missing or unreachable
    DuplicateHandler,  // channel handler already registered
    RelayIO,           // per-channel copy failure
    Auth,              // authentication rejected
    Other,
};

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None};
    }

    static Result<T> Err(const std::string& err, ErrorKind kind = ErrorKind::Other) {
        return {false, T{}, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(const std::string& err, ErrorKind kind = ErrorKind::Other) {
        return {false, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Case-insensitive option name → values, in the order they were given.
using OptionMap = std::map<std::string, std::vector<std::string>>;

// Parsed command line of one client invocation.
struct SshArgs {
    std::string destination;             // host part after user@ / :port split
    std::string original_dest;           // destination exactly as typed
    std::string login_name;              // -l or user@
    int port = 0;                        // -p or :port, 0 = unset
    std::string config_file;             // -F, passed through to ssh
    std::string proxy_jump;              // -J
    std::vector<std::string> identities;        // -i
    std::vector<std::string> dynamic_forwards;  // -D
    std::vector<std::string> local_forwards;    // -L
    std::vector<std::string> remote_forwards;   // -R
    OptionMap options;                   // -o Key=Value, keys lower-cased
    bool debug = false;                  // -v
    bool forward_agent = false;          // -A
    bool no_forward_agent = false;       // -a
    bool force_tty = false;              // -t
    bool disable_tty = false;            // -T
    std::string command;                 // remote command, empty = shell
};

// One prompt/response pair for interactive credential entry.
struct ExpectRule {
    std::string pattern;
    std::string send;
};

// How the control master's interactive login should be answered.
struct CtrlExpectConfig {
    std::vector<ExpectRule> prompts;
    int count = 0;           // expected prompt count; 0 = no pty
    int timeout_secs = 0;    // 0 = unbounded (cancelled when startup ends)
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
