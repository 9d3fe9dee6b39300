#pragma once

// ── External programs ───────────────────────────────────────
constexpr const char* OPENSSH_PATH = "/usr/bin/ssh";

// Remote command of the control master child. The "ok" is the readiness
// token; 10 seconds is enough for the socket to become attachable.
constexpr const char* CONTROL_READY_COMMAND = "echo ok; sleep 10";
constexpr const char* CONTROL_READY_TOKEN   = "ok";

// ── Timeouts ────────────────────────────────────────────────
constexpr int CONTROL_CONNECT_TIMEOUT_SECS = 5;     // -oConnectTimeout for the master
constexpr int CONTROL_DIAL_TIMEOUT_MS      = 1000;  // dial of the control socket
constexpr int AGENT_DIAL_TIMEOUT_MS        = 1000;
constexpr int QUIT_GRACE_MS                = 500;   // SIGINT → SIGKILL escalation
constexpr int DIRECT_CONNECT_TIMEOUT_SECS  = 30;
constexpr int IO_POLL_INTERVAL_MS          = 10;    // EAGAIN back-off for libssh2 I/O
constexpr int EXPECT_POLL_MS               = 100;   // pty read slice while prompting

// ── Buffer sizes ────────────────────────────────────────────
constexpr int STDERR_BUF_SIZE   = 100;
constexpr int STDOUT_BUF_SIZE   = 1000;
constexpr int RELAY_BUF_SIZE    = 16384;
constexpr int SSH_READ_BUF_SIZE = 4096;

// ── Agent forwarding ────────────────────────────────────────
constexpr const char* AGENT_CHANNEL_TYPE = "auth-agent@openssh.com";
constexpr const char* AGENT_ENV_VAR      = "SSH_AUTH_SOCK";
// Used only when it exists on disk.
constexpr const char* DEFAULT_AGENT_ADDR = "~/.ssh/agent.sock";

// ── Option names that never reach the ssh child ─────────────
constexpr const char* OPT_REMOTE_COMMAND     = "remotecommand";
constexpr const char* OPT_CTRL_EXPECT_COUNT  = "ctrlexpectcount";
constexpr const char* OPT_CTRL_EXPECT_TIMEOUT = "ctrlexpecttimeout";

// Tokens OpenSSH accepts in ControlPath.
constexpr const char* CONTROL_PATH_TOKENS = "%CdhikLlnpru";

// ── Exit codes ──────────────────────────────────────────────
constexpr int EXIT_CONNECT_FAILED = 255;

constexpr const char* CTLSSH_VERSION = "0.1.0";
