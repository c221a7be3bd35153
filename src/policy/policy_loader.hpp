#pragma once

// ---------------------------------------------------------------------------
// policy_loader.hpp
//
// YAML 정책 파일을 로드하여 Policy 로 파싱하고, 러너 요청 프레임에 싣기 위해
// 같은 스키마로 다시 직렬화하는 로더.
//
// [설계 원칙]
// - load() 실패 시 std::unexpected(error_message) 반환. 호출자는
//   실패 시 서비스를 시작하지 않아야 한다 (fail-close).
// - 파일과 러너 요청은 같은 스키마를 사용한다 (from_node / emit 대칭).
//
// [순환 의존성]
// policy_loader.hpp → rule.hpp (단방향만)
// ❌ rule.hpp → policy_loader.hpp 금지
//
// [보안 고려사항]
// - YAML 파일 경로는 환경변수/CLI 에서만 지정하고 학습자 입력을 사용하지 않는다.
// - 파싱 실패 원인은 로깅하되, YAML 파일 전체를 로그에 출력하지 말 것.
// ---------------------------------------------------------------------------

#include <expected>
#include <filesystem>
#include <string>

#include <yaml-cpp/yaml.h>

#include "rule.hpp"  // Policy

// ---------------------------------------------------------------------------
// PolicyLoader
//   상태 없는 정적 함수 모음.
// ---------------------------------------------------------------------------
class PolicyLoader {
public:
    // load
    //   지정된 경로의 YAML 파일을 읽어 Policy 로 파싱한다.
    //
    //   [fail-close 요구사항]
    //   파일 없음, 파싱 오류, 스키마 불일치 모두 실패로 처리한다.
    //   부분적으로 파싱된 정책을 반환하지 않는다.
    [[nodiscard]] static std::expected<Policy, std::string>
    load(const std::filesystem::path& config_path);

    // from_node
    //   이미 파싱된 YAML 루트 맵에서 Policy 를 구성한다.
    //   누락된 섹션/필드는 구조체 기본값을 적용한다.
    [[nodiscard]] static std::expected<Policy, std::string>
    from_node(const YAML::Node& root);

    // emit
    //   Policy 를 from_node 가 읽을 수 있는 YAML 맵으로 기록한다.
    static void emit(YAML::Emitter& out, const Policy& policy);
};
