#include "mux_message.hpp"
#include <platform/socket_util.hpp>
#include <fmt/format.h>

MuxWriter& MuxWriter::put_u32(uint32_t v) {
    payload_.push_back(static_cast<char>((v >> 24) & 0xff));
    payload_.push_back(static_cast<char>((v >> 16) & 0xff));
    payload_.push_back(static_cast<char>((v >> 8) & 0xff));
    payload_.push_back(static_cast<char>(v & 0xff));
    return *this;
}

MuxWriter& MuxWriter::put_string(const std::string& s) {
    put_u32(static_cast<uint32_t>(s.size()));
    payload_ += s;
    return *this;
}

std::string MuxWriter::packet() const {
    MuxWriter len(static_cast<uint32_t>(payload_.size()));
    return len.payload_ + payload_;
}

bool MuxReader::get_u32(uint32_t& v) {
    if (remaining() < 4) return false;
    auto b = reinterpret_cast<const unsigned char*>(payload_.data() + pos_);
    v = (uint32_t(b[0]) << 24) | (uint32_t(b[1]) << 16) | (uint32_t(b[2]) << 8) | uint32_t(b[3]);
    pos_ += 4;
    return true;
}

bool MuxReader::get_string(std::string& s) {
    size_t start = pos_;
    uint32_t len;
    if (!get_u32(len)) return false;
    if (remaining() < len) {
        pos_ = start;
        return false;
    }
    s = payload_.substr(pos_, len);
    pos_ += len;
    return true;
}

bool mux_write_packet(int fd, const MuxWriter& msg) {
    auto data = msg.packet();
    return platform::write_all(fd, data.data(), data.size());
}

Result<std::string> mux_read_packet(int fd) {
    unsigned char hdr[4];
    if (!platform::read_exact(fd, hdr, sizeof(hdr))) {
        return Result<std::string>::Err("control socket closed", ErrorKind::Protocol);
    }
    uint32_t len = (uint32_t(hdr[0]) << 24) | (uint32_t(hdr[1]) << 16) |
                   (uint32_t(hdr[2]) << 8) | uint32_t(hdr[3]);
    if (len > MUX_MAX_PACKET) {
        return Result<std::string>::Err(
            fmt::format("control packet too large: {} bytes", len), ErrorKind::Protocol);
    }
    std::string payload(len, '\0');
    if (len > 0 && !platform::read_exact(fd, payload.data(), len)) {
        return Result<std::string>::Err("control socket closed mid-packet", ErrorKind::Protocol);
    }
    return Result<std::string>::Ok(std::move(payload));
}
