#pragma once

// Packet framing of the OpenSSH connection-multiplexing protocol
// (PROTOCOL.mux): every packet is a u32 length followed by the payload,
// integers are big-endian u32, strings are u32 length + bytes.

#include <cstdint>
#include <string>
#include <core/types.hpp>

constexpr uint32_t MUX_PROTOCOL_VERSION = 4;
constexpr uint32_t MUX_MAX_PACKET       = 256 * 1024;
constexpr uint32_t MUX_ESCAPE_NONE      = 0xffffffff;

// ── Message types ───────────────────────────────────────────
constexpr uint32_t MUX_MSG_HELLO          = 0x00000001;
constexpr uint32_t MUX_C_NEW_SESSION      = 0x10000002;
constexpr uint32_t MUX_C_ALIVE_CHECK      = 0x10000004;
constexpr uint32_t MUX_S_PERMISSION_DENIED = 0x80000002;
constexpr uint32_t MUX_S_FAILURE          = 0x80000003;
constexpr uint32_t MUX_S_EXIT_MESSAGE     = 0x80000004;
constexpr uint32_t MUX_S_ALIVE            = 0x80000005;
constexpr uint32_t MUX_S_SESSION_OPENED   = 0x80000006;
constexpr uint32_t MUX_S_TTY_ALLOC_FAIL   = 0x80000008;

class MuxWriter {
public:
    explicit MuxWriter(uint32_t type) { put_u32(type); }

    MuxWriter& put_u32(uint32_t v);
    MuxWriter& put_string(const std::string& s);

    // Payload with its length prefix.
    std::string packet() const;
    const std::string& payload() const { return payload_; }

private:
    std::string payload_;
};

class MuxReader {
public:
    explicit MuxReader(std::string payload) : payload_(std::move(payload)) {}

    // False once the payload is exhausted; the out value is untouched.
    bool get_u32(uint32_t& v);
    bool get_string(std::string& s);

    size_t remaining() const { return payload_.size() - pos_; }

private:
    std::string payload_;
    size_t pos_ = 0;
};

// Blocking packet I/O on a stream socket.
bool mux_write_packet(int fd, const MuxWriter& msg);
Result<std::string> mux_read_packet(int fd);
