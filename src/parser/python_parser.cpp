// ---------------------------------------------------------------------------
// python_parser.cpp
//
// PyCF_ONLY_AST 컴파일 결과(ast.AST 객체 트리)를 AstNode arena 로 변환한다.
//
// [변환 규칙]
// - 노드 종류: type(node).__name__
// - 위치: lineno / col_offset (없으면 0). column 은 1-based 로 저장.
// - 필드: type(node)._fields 순서대로 방문
//     ast.AST 인스턴스      → 자식 간선
//     list[ast.AST]         → 자식 간선 (리스트 순서 유지)
//     list[str]             → names
//     str                   → scalars (원문)
//     None                  → 생략
//     그 외 상수(int, bytes) → scalars (repr)
// ---------------------------------------------------------------------------

#include "parser/python_runtime.hpp"
#include "parser/python_parser.hpp"

#include <utility>

#include <spdlog/spdlog.h>

namespace {

// 변환 중 오류 (인터프리터 내부 오류). SyntaxInvalid 와 구분한다.
struct ConvertError {
    std::string message{};
};

class AstConverter {
public:
    explicit AstConverter(PyObject* ast_base) : ast_base_(ast_base) {}

    [[nodiscard]] std::expected<std::size_t, ConvertError> convert(PyObject* node) {
        const std::size_t index = nodes_.size();
        nodes_.emplace_back();

        {
            PyRef type_name{PyObject_GetAttrString(
                reinterpret_cast<PyObject*>(Py_TYPE(node)), "__name__")};
            if (!type_name) {
                return std::unexpected(ConvertError{"cannot read AST node type name"});
            }
            nodes_[index].kind = py_str(type_name.get());
        }
        nodes_[index].line   = read_int_attr(node, "lineno");
        nodes_[index].column = read_int_attr(node, "col_offset") + 1;

        PyRef fields{PyObject_GetAttrString(reinterpret_cast<PyObject*>(Py_TYPE(node)), "_fields")};
        if (!fields || !PyTuple_Check(fields.get())) {
            PyErr_Clear();
            return index;  // 필드 없는 노드 (예: Pass)
        }

        const Py_ssize_t field_count = PyTuple_Size(fields.get());
        for (Py_ssize_t f = 0; f < field_count; ++f) {
            PyObject*         field_obj = PyTuple_GetItem(fields.get(), f);  // borrowed
            const std::string field     = py_str(field_obj);
            if (field == "ctx") {
                continue;
            }

            PyRef value{PyObject_GetAttr(node, field_obj)};
            if (!value) {
                PyErr_Clear();
                continue;
            }
            if (auto r = visit_field(index, field, value.get()); !r) {
                return std::unexpected(r.error());
            }
        }
        return index;
    }

    [[nodiscard]] std::vector<AstNode> take() && { return std::move(nodes_); }

private:
    [[nodiscard]] std::expected<void, ConvertError>
    visit_field(std::size_t index, const std::string& field, PyObject* value) {
        if (value == Py_None) {
            return {};
        }
        if (is_ast(value)) {
            auto child = convert(value);
            if (!child) {
                return std::unexpected(child.error());
            }
            nodes_[index].children.push_back(AstEdge{field, *child});
            return {};
        }
        if (PyList_Check(value)) {
            const Py_ssize_t n = PyList_Size(value);
            for (Py_ssize_t i = 0; i < n; ++i) {
                PyObject* item = PyList_GetItem(value, i);  // borrowed
                if (is_ast(item)) {
                    auto child = convert(item);
                    if (!child) {
                        return std::unexpected(child.error());
                    }
                    nodes_[index].children.push_back(AstEdge{field, *child});
                } else if (PyUnicode_Check(item)) {
                    nodes_[index].names[field].push_back(py_str(item));
                }
            }
            return {};
        }
        if (PyUnicode_Check(value)) {
            nodes_[index].scalars[field] = py_str(value);
        } else {
            nodes_[index].scalars[field] = py_repr(value);
        }
        if (field == "value") {
            nodes_[index].scalars["value_type"] = py_type_name(value);
        }
        return {};
    }

    [[nodiscard]] bool is_ast(PyObject* obj) const {
        const int r = PyObject_IsInstance(obj, ast_base_);
        if (r < 0) {
            PyErr_Clear();
            return false;
        }
        return r == 1;
    }

    [[nodiscard]] static int read_int_attr(PyObject* node, const char* name) {
        PyRef attr{PyObject_GetAttrString(node, name)};
        if (!attr) {
            PyErr_Clear();
            return 0;
        }
        const long v = PyLong_AsLong(attr.get());
        if (v == -1 && PyErr_Occurred() != nullptr) {
            PyErr_Clear();
            return 0;
        }
        return static_cast<int>(v);
    }

    PyObject*            ast_base_;  // borrowed (ast.AST)
    std::vector<AstNode> nodes_;
};

[[nodiscard]] GradeFailure make_syntax_failure(std::string message, int line = 0, int column = 0) {
    GradeFailure failure{};
    failure.kind    = FailureKind::kSyntaxInvalid;
    failure.stage   = GradeState::kValidating;
    failure.detail  = message;
    failure.message = std::move(message);
    failure.line    = line;
    failure.column  = column;
    return failure;
}

// ---------------------------------------------------------------------------
// syntax_failure_from_error
//   현재 설정된 SyntaxError(및 하위 IndentationError/TabError)를 소비하여
//   메시지와 1-based 위치를 뽑는다.
// ---------------------------------------------------------------------------
[[nodiscard]] GradeFailure syntax_failure_from_error() {
    PyObject* raw_type  = nullptr;
    PyObject* raw_value = nullptr;
    PyObject* raw_tb    = nullptr;
    PyErr_Fetch(&raw_type, &raw_value, &raw_tb);
    PyErr_NormalizeException(&raw_type, &raw_value, &raw_tb);
    PyRef type{raw_type};
    PyRef value{raw_value};
    PyRef tb{raw_tb};

    std::string message = "invalid syntax";
    int         line    = 0;
    int         column  = 0;
    if (value) {
        PyRef msg{PyObject_GetAttrString(value.get(), "msg")};
        if (msg && msg.get() != Py_None) {
            message = py_str(msg.get());
        } else {
            PyErr_Clear();
            message = py_str(value.get());
        }
        PyRef lineno{PyObject_GetAttrString(value.get(), "lineno")};
        if (lineno && PyLong_Check(lineno.get())) {
            line = static_cast<int>(PyLong_AsLong(lineno.get()));
        }
        PyRef offset{PyObject_GetAttrString(value.get(), "offset")};
        if (offset && PyLong_Check(offset.get())) {
            column = static_cast<int>(PyLong_AsLong(offset.get()));
        }
        PyErr_Clear();
    }
    auto failure = make_syntax_failure(message, line, column);
    failure.exception_type = "SyntaxError";
    if (type) {
        PyRef type_name{PyObject_GetAttrString(type.get(), "__name__")};
        if (type_name) {
            failure.exception_type = py_str(type_name.get());
        }
    }
    PyErr_Clear();
    return failure;
}

} // namespace

const std::string* AstNode::scalar(std::string_view key) const {
    const auto it = scalars.find(std::string{key});
    return it == scalars.end() ? nullptr : &it->second;
}

ParsedProgram::ParsedProgram(std::string source, std::vector<AstNode> nodes)
    : source_(std::move(source))
    , nodes_(std::move(nodes))
{}

std::vector<const AstNode*>
ParsedProgram::children(const AstNode& node, std::string_view field) const {
    std::vector<const AstNode*> result;
    for (const auto& edge : node.children) {
        if (edge.field == field) {
            result.push_back(&nodes_.at(edge.index));
        }
    }
    return result;
}

std::expected<ParsedProgram, GradeFailure>
PythonParser::parse(std::string_view source) const {
    return compile(source, Py_file_input);
}

std::expected<ParsedProgram, GradeFailure>
PythonParser::parse_expression(std::string_view source) const {
    return compile(source, Py_eval_input);
}

// ---------------------------------------------------------------------------
// compile
//   1. NUL 바이트 사전 거부 (C API 는 NUL 에서 문자열을 자른다)
//   2. GIL 획득 → Py_CompileStringExFlags(PyCF_ONLY_AST)
//   3. AST 객체 트리 → AstNode arena 변환
// ---------------------------------------------------------------------------
std::expected<ParsedProgram, GradeFailure>
PythonParser::compile(std::string_view source, int start_token) const {
    if (source.find('\0') != std::string_view::npos) {
        return std::unexpected(make_syntax_failure("source code string cannot contain null bytes"));
    }

    std::string text{source};
    GilGuard    gil;

    PyCompilerFlags flags{};
    flags.cf_flags           = PyCF_ONLY_AST;
    flags.cf_feature_version = PY_MINOR_VERSION;

    PyRef tree{Py_CompileStringExFlags(text.c_str(), "<source>", start_token, &flags, -1)};
    if (!tree) {
        if (PyErr_ExceptionMatches(PyExc_SyntaxError) != 0) {
            return std::unexpected(syntax_failure_from_error());
        }
        // RecursionError / MemoryError / ValueError: 파싱할 수 없는 소스로 취급
        const auto err = fetch_python_error(false);
        auto failure = make_syntax_failure(fmt::format("{}: {}", err.type, err.message));
        failure.exception_type = err.type;
        return std::unexpected(failure);
    }

    PyRef ast_module{PyImport_ImportModule("ast")};
    PyRef ast_base = ast_module ? PyRef{PyObject_GetAttrString(ast_module.get(), "AST")} : PyRef{};
    if (!ast_base) {
        const auto err = fetch_python_error(false);
        spdlog::error("[python_parser] cannot load ast.AST: {}: {}", err.type, err.message);
        GradeFailure failure{};
        failure.kind    = FailureKind::kInternalError;
        failure.stage   = GradeState::kValidating;
        failure.message = "python ast module unavailable";
        return std::unexpected(failure);
    }

    AstConverter converter{ast_base.get()};
    if (auto root = converter.convert(tree.get()); !root) {
        spdlog::error("[python_parser] AST conversion failed: {}", root.error().message);
        GradeFailure failure{};
        failure.kind    = FailureKind::kInternalError;
        failure.stage   = GradeState::kValidating;
        failure.message = root.error().message;
        return std::unexpected(failure);
    }
    return ParsedProgram{std::move(text), std::move(converter).take()};
}
