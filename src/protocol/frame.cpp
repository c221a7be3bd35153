#include "protocol/frame.hpp"

#include <cerrno>

#include <unistd.h>

namespace {

// read_exact
//   정확히 size 바이트를 읽는다. 반환값: 읽은 바이트 수 (EOF 시 size 미만), -1 = 오류
[[nodiscard]] ssize_t read_exact(int fd, char* buf, std::size_t size) {
    std::size_t done = 0;
    while (done < size) {
        const ssize_t n = ::read(fd, buf + done, size - done);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return -1;
        }
        if (n == 0) {
            break;
        }
        done += static_cast<std::size_t>(n);
    }
    return static_cast<ssize_t>(done);
}

[[nodiscard]] bool write_all(int fd, const char* buf, std::size_t size) {
    std::size_t done = 0;
    while (done < size) {
        const ssize_t n = ::write(fd, buf + done, size - done);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        done += static_cast<std::size_t>(n);
    }
    return true;
}

} // namespace

std::array<std::uint8_t, 4> encode_le4(std::uint32_t val) noexcept {
    return {
        static_cast<std::uint8_t>(val),
        static_cast<std::uint8_t>(val >> 8),
        static_cast<std::uint8_t>(val >> 16),
        static_cast<std::uint8_t>(val >> 24),
    };
}

std::uint32_t decode_le4(const std::array<std::uint8_t, 4>& buf) noexcept {
    return static_cast<std::uint32_t>(buf[0])
         | (static_cast<std::uint32_t>(buf[1]) << 8)
         | (static_cast<std::uint32_t>(buf[2]) << 16)
         | (static_cast<std::uint32_t>(buf[3]) << 24);
}

std::string encode_frame(std::string_view body) {
    const auto hdr = encode_le4(static_cast<std::uint32_t>(body.size()));
    std::string out;
    out.reserve(hdr.size() + body.size());
    out.append(reinterpret_cast<const char*>(hdr.data()), hdr.size());
    out.append(body);
    return out;
}

std::string_view to_string(FrameError error) noexcept {
    switch (error) {
        case FrameError::kEof:       return "eof";
        case FrameError::kTruncated: return "truncated frame";
        case FrameError::kTooLarge:  return "invalid frame length";
        case FrameError::kIo:        return "i/o error";
    }
    return "i/o error";
}

std::expected<std::string, FrameError> read_frame(int fd, std::uint32_t max_size) {
    std::array<std::uint8_t, 4> hdr{};
    const ssize_t hdr_n = read_exact(fd, reinterpret_cast<char*>(hdr.data()), hdr.size());
    if (hdr_n < 0) {
        return std::unexpected(FrameError::kIo);
    }
    if (hdr_n == 0) {
        return std::unexpected(FrameError::kEof);
    }
    if (static_cast<std::size_t>(hdr_n) != hdr.size()) {
        return std::unexpected(FrameError::kTruncated);
    }

    const std::uint32_t len = decode_le4(hdr);
    if (len == 0 || len > max_size) {
        return std::unexpected(FrameError::kTooLarge);
    }

    std::string body(len, '\0');
    const ssize_t body_n = read_exact(fd, body.data(), body.size());
    if (body_n < 0) {
        return std::unexpected(FrameError::kIo);
    }
    if (static_cast<std::size_t>(body_n) != body.size()) {
        return std::unexpected(FrameError::kTruncated);
    }
    return body;
}

std::expected<void, FrameError> write_frame(int fd, std::string_view body) {
    if (body.empty() || body.size() > kMaxRunnerFrameSize) {
        return std::unexpected(FrameError::kTooLarge);
    }
    const std::string frame = encode_frame(body);
    if (!write_all(fd, frame.data(), frame.size())) {
        return std::unexpected(FrameError::kIo);
    }
    return {};
}
