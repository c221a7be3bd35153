#pragma once

// ---------------------------------------------------------------------------
// python_parser.hpp
//
// 파이썬 소스 → 불변 구문 트리(AST arena) 변환기.
//
// [설계 원칙]
// - 임베디드 인터프리터의 컴파일러를 AST 전용 모드(PyCF_ONLY_AST)로만 사용한다.
//   어떤 코드도 실행하지 않는다.
// - 결과는 파이썬 객체를 참조하지 않는 평면 노드 배열(ParsedProgram)이다.
//   GIL 밖에서 자유롭게 복사/공유/순회할 수 있다.
// - 노드 순서는 전위 순회(pre-order). 인덱스 0 이 루트(Module/Expression).
//
// [fail-close]
// - 파싱 실패는 항상 std::unexpected(GradeFailure{kSyntaxInvalid}).
// - NUL 바이트를 포함한 소스는 파싱 이전에 거부한다.
//
// [알려진 한계]
// - 표현식 문맥 노드(Load/Store/Del, 필드명 ctx)는 정보가 없으므로 생략한다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <cstddef>
#include <expected>
#include <map>
#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// AstEdge
//   부모 → 자식 간선. field 는 파이썬 AST 필드명 (예: "body", "names").
// ---------------------------------------------------------------------------
struct AstEdge {
    std::string field{};
    std::size_t index{0};
};

// ---------------------------------------------------------------------------
// AstNode
//   kind     : AST 클래스 이름 (예: "FunctionDef", "Import", "BoolOp")
//   scalars  : 문자열/상수 필드 (str 은 원문, 그 외 상수는 repr).
//              Constant 노드는 "value_type" 에 상수 타입 이름을 추가로 가진다.
//   names    : 문자열 리스트 필드 (예: Global.names)
//   children : AST 자식 간선 (필드 선언 순서, 리스트 내부 순서 유지)
// ---------------------------------------------------------------------------
struct AstNode {
    std::string                                     kind{};
    int                                             line{0};
    int                                             column{0};
    std::map<std::string, std::string>              scalars{};
    std::map<std::string, std::vector<std::string>> names{};
    std::vector<AstEdge>                            children{};

    [[nodiscard]] const std::string* scalar(std::string_view key) const;
};

// ---------------------------------------------------------------------------
// ParsedProgram
//   파싱 결과 (불변 값 객체).
// ---------------------------------------------------------------------------
class ParsedProgram {
public:
    ParsedProgram(std::string source, std::vector<AstNode> nodes);

    [[nodiscard]] const std::vector<AstNode>& nodes() const noexcept { return nodes_; }
    [[nodiscard]] const AstNode& root() const { return nodes_.front(); }
    [[nodiscard]] const AstNode& at(std::size_t index) const { return nodes_.at(index); }
    [[nodiscard]] const std::string& source() const noexcept { return source_; }

    // children
    //   node 의 field 간선 자식들을 순서대로 반환한다.
    [[nodiscard]] std::vector<const AstNode*>
    children(const AstNode& node, std::string_view field) const;

private:
    std::string          source_;
    std::vector<AstNode> nodes_;
};

// ---------------------------------------------------------------------------
// PythonParser
//   PythonRuntime::initialize 가 먼저 성공해야 한다.
//   내부에서 GilGuard 를 사용하므로 어느 스레드에서든 호출 가능하다.
// ---------------------------------------------------------------------------
class PythonParser {
public:
    PythonParser()  = default;
    ~PythonParser() = default;

    PythonParser(const PythonParser&)            = default;
    PythonParser& operator=(const PythonParser&) = default;
    PythonParser(PythonParser&&)                 = default;
    PythonParser& operator=(PythonParser&&)      = default;

    // parse
    //   모듈 단위 소스를 파싱한다 (exec 모드).
    [[nodiscard]] std::expected<ParsedProgram, GradeFailure>
    parse(std::string_view source) const;

    // parse_expression
    //   단일 표현식을 파싱한다 (eval 모드). 루트는 "Expression".
    [[nodiscard]] std::expected<ParsedProgram, GradeFailure>
    parse_expression(std::string_view source) const;

private:
    [[nodiscard]] std::expected<ParsedProgram, GradeFailure>
    compile(std::string_view source, int start_token) const;
};
