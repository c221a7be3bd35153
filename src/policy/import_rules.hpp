#pragma once

// ---------------------------------------------------------------------------
// import_rules.hpp
//
// import 허용 판정 (정적 검증기와 러너의 런타임 import 게이트가 공유).
//
// [설계 원칙]
// - 두 계층이 같은 함수를 사용하므로 "검증기가 거부한 것은 런타임에서도
//   거부된다"가 구조적으로 보장된다.
// - 모듈 이름은 정확히 일치해야 한다 (접두사 매칭 없음).
// - 상대 import (level > 0) 는 항상 거부한다.
// ---------------------------------------------------------------------------

#include "rule.hpp"

#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// ImportDecision
//   offending: 거부 시 위반 모듈 이름 (상대 import 는 "." 접두사 포함)
//   reason   : 사람이 읽을 수 있는 거부 사유
// ---------------------------------------------------------------------------
struct ImportDecision {
    bool        allowed{false};  // 기본값 거부 (fail-close)
    std::string offending{};
    std::string reason{};
};

// check_import
//   symbols 가 비어 있으면 `import module`, 아니면 `from module import symbols...`.
//   "*" 심볼은 모듈 규칙이 "all" 일 때만 허용된다.
[[nodiscard]] ImportDecision check_import(const ValidatorPolicy&        policy,
                                          std::string_view              module,
                                          const std::vector<std::string>& symbols,
                                          int                           level);
