#pragma once

// ---------------------------------------------------------------------------
// frame.hpp
//
// 길이 프리픽스 프레임 코덱.
//
//   Wire 포맷:
//     [4바이트 LE body length][body...]
//
// 제어 소켓(UDS, JSON 바디)과 호스트 ↔ 러너 파이프(YAML 바디)가 같은 프레이밍을
// 사용한다. 러너 쪽은 블로킹 fd I/O (read_frame/write_frame), 호스트 쪽은
// Boost.Asio 비동기 I/O 로 같은 헤더를 해석한다.
//
// [보안 고려사항]
// - body length 0 또는 max_size 초과는 프레임 오류로 처리한다 (메모리 고갈 방지).
// ---------------------------------------------------------------------------

#include <array>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

// 호스트 ↔ 러너 프레임 최대 크기 (캡처 출력 상한과 진단 정보를 감안한 값)
inline constexpr std::uint32_t kMaxRunnerFrameSize = 16u * 1024u * 1024u;

// 제어 소켓 요청 최대 크기 (4MiB)
inline constexpr std::uint32_t kMaxRequestSize = 4u * 1024u * 1024u;

// encode_le4: uint32_t → 4바이트 LE 배열
[[nodiscard]] std::array<std::uint8_t, 4> encode_le4(std::uint32_t val) noexcept;

// decode_le4: 4바이트 LE 배열 → uint32_t
[[nodiscard]] std::uint32_t decode_le4(const std::array<std::uint8_t, 4>& buf) noexcept;

// encode_frame
//   헤더 + 바디를 이어붙인 바이트 문자열.
[[nodiscard]] std::string encode_frame(std::string_view body);

// ---------------------------------------------------------------------------
// FrameError
//   kEof: 프레임 경계에서 정상 종료 (상대가 fd 를 닫음)
// ---------------------------------------------------------------------------
enum class FrameError : std::uint8_t {
    kEof       = 0,
    kTruncated = 1,  // 헤더/바디 중간에 종료
    kTooLarge  = 2,  // 0 또는 max_size 초과
    kIo        = 3,  // read/write 시스템 호출 실패
};

[[nodiscard]] std::string_view to_string(FrameError error) noexcept;

// read_frame
//   블로킹 fd 에서 프레임 하나를 읽는다. EINTR 은 재시도한다.
[[nodiscard]] std::expected<std::string, FrameError> read_frame(int fd, std::uint32_t max_size);

// write_frame
//   블로킹 fd 에 프레임 하나를 쓴다. 부분 쓰기/EINTR 은 재시도한다.
[[nodiscard]] std::expected<void, FrameError> write_frame(int fd, std::string_view body);
