// ---------------------------------------------------------------------------
// test_python_parser.cpp
//
// PythonParser / PythonRuntime 단위 테스트.
//
// [테스트 범위]
// - 노드 arena: 루트 Module, 전위 순서, 필드 간선 순서, 위치(1-based)
// - 스칼라/이름 목록 필드 (FunctionDef.name, Global.names, Constant.value)
// - parse_expression: 루트 Expression
// - 문법 오류: kSyntaxInvalid + line/column
// - 여러 스레드에서 동시 파싱 (GilGuard)
// - py_str / py_repr / py_type_name 헬퍼
// ---------------------------------------------------------------------------

#include "parser/python_runtime.hpp"
#include "parser/python_parser.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

namespace {

class PythonParserTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        const auto init = PythonRuntime::initialize(InterpreterMode::kHost);
        ASSERT_TRUE(init.has_value()) << init.error();
    }

    PythonParser parser_{};
};

const AstNode* find_first(const ParsedProgram& program, const std::string& kind) {
    for (const auto& node : program.nodes()) {
        if (node.kind == kind) {
            return &node;
        }
    }
    return nullptr;
}

} // namespace

TEST_F(PythonParserTest, Module_RootAndPreorder) {
    const auto program = parser_.parse("def f(a):\n    return a\nx = f(1)\n");
    ASSERT_TRUE(program.has_value()) << program.error().message;

    EXPECT_EQ(program->root().kind, "Module");
    const auto body = program->children(program->root(), "body");
    ASSERT_EQ(body.size(), 2u);
    EXPECT_EQ(body[0]->kind, "FunctionDef");
    EXPECT_EQ(body[1]->kind, "Assign");
    EXPECT_EQ(body[0]->line, 1);
    EXPECT_EQ(body[1]->line, 3);
    EXPECT_EQ(body[1]->column, 1);

    // 전위 순서: 함수 정의가 함수 본문의 Return 보다 앞선다
    std::size_t def_index = 0;
    std::size_t ret_index = 0;
    for (std::size_t i = 0; i < program->nodes().size(); ++i) {
        if (program->nodes()[i].kind == "FunctionDef") { def_index = i; }
        if (program->nodes()[i].kind == "Return")      { ret_index = i; }
    }
    EXPECT_LT(def_index, ret_index);
}

TEST_F(PythonParserTest, ScalarAndNameFields) {
    const auto program = parser_.parse("def helper():\n    global total, count\n    return 42\n");
    ASSERT_TRUE(program.has_value()) << program.error().message;

    const AstNode* def = find_first(*program, "FunctionDef");
    ASSERT_NE(def, nullptr);
    ASSERT_NE(def->scalar("name"), nullptr);
    EXPECT_EQ(*def->scalar("name"), "helper");

    const AstNode* global = find_first(*program, "Global");
    ASSERT_NE(global, nullptr);
    ASSERT_EQ(global->names.count("names"), 1u);
    EXPECT_EQ(global->names.at("names"), (std::vector<std::string>{"total", "count"}));

    const AstNode* constant = find_first(*program, "Constant");
    ASSERT_NE(constant, nullptr);
    ASSERT_NE(constant->scalar("value"), nullptr);
    EXPECT_EQ(*constant->scalar("value"), "42");
    ASSERT_NE(constant->scalar("value_type"), nullptr);
    EXPECT_EQ(*constant->scalar("value_type"), "int");
}

TEST_F(PythonParserTest, MissingScalar_ReturnsNull) {
    const auto program = parser_.parse("pass\n");
    ASSERT_TRUE(program.has_value());
    EXPECT_EQ(program->root().scalar("does_not_exist"), nullptr);
}

TEST_F(PythonParserTest, Expression_Root) {
    const auto program = parser_.parse_expression("[1, 2, 'x']");
    ASSERT_TRUE(program.has_value()) << program.error().message;
    EXPECT_EQ(program->root().kind, "Expression");
    EXPECT_NE(find_first(*program, "List"), nullptr);
}

TEST_F(PythonParserTest, Expression_RejectsStatement) {
    const auto program = parser_.parse_expression("x = 1");
    ASSERT_FALSE(program.has_value());
    EXPECT_EQ(program.error().kind, FailureKind::kSyntaxInvalid);
}

TEST_F(PythonParserTest, SyntaxError_LineAndColumn) {
    const auto program = parser_.parse("a = 1\nb = (2 +\n");
    ASSERT_FALSE(program.has_value());
    EXPECT_EQ(program.error().kind, FailureKind::kSyntaxInvalid);
    EXPECT_GE(program.error().line, 2);
    EXPECT_GE(program.error().column, 1);
    EXPECT_FALSE(program.error().detail.empty());
}

TEST_F(PythonParserTest, IndentationError_IsSyntaxInvalid) {
    const auto program = parser_.parse("def f():\nreturn 1\n");
    ASSERT_FALSE(program.has_value());
    EXPECT_EQ(program.error().kind, FailureKind::kSyntaxInvalid);
    EXPECT_EQ(program.error().line, 2);
}

TEST_F(PythonParserTest, ConcurrentParsing_IsSafe) {
    constexpr int kThreads = 4;
    constexpr int kIterations = 25;
    std::atomic<int> ok{0};

    std::vector<std::thread> threads;
    threads.reserve(kThreads);
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&ok]() {
            const PythonParser parser;
            for (int i = 0; i < kIterations; ++i) {
                const auto program = parser.parse("def f(x):\n    return [v * 2 for v in x]\n");
                if (program.has_value() && program->root().kind == "Module") {
                    ok.fetch_add(1);
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    EXPECT_EQ(ok.load(), kThreads * kIterations);
}

TEST_F(PythonParserTest, StringHelpers) {
    const GilGuard gil;
    PyRef list{Py_BuildValue("[is]", 1, "a")};
    ASSERT_TRUE(list);
    EXPECT_EQ(py_repr(list.get()), "[1, 'a']");
    EXPECT_EQ(py_type_name(list.get()), "list");

    PyRef text{new_py_string("héllo")};
    ASSERT_TRUE(text);
    EXPECT_EQ(py_str(text.get()), "héllo");
}
