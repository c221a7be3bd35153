#include "runner/execution_engine.hpp"

#include <string_view>

#include <spdlog/spdlog.h>

namespace {

constexpr std::string_view kTruncatedMarker = "\n[output truncated]";

[[nodiscard]] std::string buffer_text(PyObject* buffer) {
    if (buffer == nullptr) {
        return {};
    }
    PyRef value{PyObject_CallMethod(buffer, "getvalue", nullptr)};
    if (!value) {
        PyErr_Clear();
        return {};
    }
    return py_str(value.get());
}

[[nodiscard]] GradeFailure execution_failure(FailureKind kind, const CapturedOutput& output) {
    const PyErrorInfo err = fetch_python_error(kind == FailureKind::kExecutionError);
    GradeFailure f{};
    f.kind           = kind;
    f.exception_type = err.type;
    f.message        = err.message;
    f.trace          = err.trace;
    f.detail         = err.type.empty() ? std::string{"unknown error"}
                                        : err.type + ": " + err.message;
    f.stdout_text    = output.stdout_text;
    f.stderr_text    = output.stderr_text;
    return f;
}

[[nodiscard]] GradeFailure capture_failure() {
    GradeFailure f{};
    f.kind   = FailureKind::kInternalError;
    f.detail = "execution: cannot redirect sys.stdout/sys.stderr";
    return f;
}

} // namespace

// ---------------------------------------------------------------------------
// OutputCapture
// ---------------------------------------------------------------------------
OutputCapture::OutputCapture() {
    PyRef io{PyImport_ImportModule("io")};
    if (!io) {
        PyErr_Clear();
        return;
    }
    buffer_stdout_ = PyRef{PyObject_CallMethod(io.get(), "StringIO", nullptr)};
    buffer_stderr_ = PyRef{PyObject_CallMethod(io.get(), "StringIO", nullptr)};
    if (!buffer_stdout_ || !buffer_stderr_) {
        PyErr_Clear();
        return;
    }

    saved_stdout_ = PyRef::borrow(PySys_GetObject("stdout"));
    saved_stderr_ = PyRef::borrow(PySys_GetObject("stderr"));
    if (PySys_SetObject("stdout", buffer_stdout_.get()) != 0
        || PySys_SetObject("stderr", buffer_stderr_.get()) != 0) {
        PyErr_Clear();
        (void)PySys_SetObject("stdout", saved_stdout_.get());
        (void)PySys_SetObject("stderr", saved_stderr_.get());
        PyErr_Clear();
        return;
    }
    active_ = true;
}

OutputCapture::~OutputCapture() {
    if (!active_) {
        return;
    }
    // 진행 중인 예외가 있어도 복원은 수행하고 예외 상태는 보존한다.
    PyObject* type  = nullptr;
    PyObject* value = nullptr;
    PyObject* tb    = nullptr;
    PyErr_Fetch(&type, &value, &tb);
    if (PySys_SetObject("stdout", saved_stdout_.get()) != 0
        || PySys_SetObject("stderr", saved_stderr_.get()) != 0) {
        PyErr_Clear();
        spdlog::error("[execution] failed to restore sys.stdout/sys.stderr");
    }
    PyErr_Restore(type, value, tb);
}

CapturedOutput OutputCapture::collect(std::size_t limit) const {
    CapturedOutput out{};
    if (!active_) {
        return out;
    }
    // 예외 상태를 건드리지 않도록 보존
    PyObject* type  = nullptr;
    PyObject* value = nullptr;
    PyObject* tb    = nullptr;
    PyErr_Fetch(&type, &value, &tb);
    out.stdout_text = truncate_output(buffer_text(buffer_stdout_.get()), limit);
    out.stderr_text = truncate_output(buffer_text(buffer_stderr_.get()), limit);
    PyErr_Restore(type, value, tb);
    return out;
}

std::string truncate_output(std::string text, std::size_t limit) {
    if (text.size() <= limit) {
        return text;
    }
    std::size_t cut = limit;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0u) == 0x80u) {
        --cut;
    }
    text.resize(cut);
    text.append(kTruncatedMarker);
    return text;
}

// ---------------------------------------------------------------------------
// ExecutionEngine
// ---------------------------------------------------------------------------
std::expected<CapturedOutput, GradeFailure>
ExecutionEngine::run(const std::string& source, const Namespace& ns, const char* filename) const {
    if (source.find('\0') != std::string::npos) {
        GradeFailure f{};
        f.kind    = FailureKind::kSyntaxInvalid;
        f.detail  = "source code string cannot contain null bytes";
        f.message = f.detail;
        return std::unexpected(std::move(f));
    }

    OutputCapture capture;
    if (!capture.active()) {
        return std::unexpected(capture_failure());
    }

    PyRef code{Py_CompileStringExFlags(source.c_str(), filename, Py_file_input, nullptr, -1)};
    if (!code) {
        return std::unexpected(execution_failure(FailureKind::kSyntaxInvalid,
                                                 capture.collect(output_limit_)));
    }

    PyRef result{PyEval_EvalCode(code.get(), ns.dict(), ns.dict())};
    if (!result) {
        return std::unexpected(execution_failure(FailureKind::kExecutionError,
                                                 capture.collect(output_limit_)));
    }

    spdlog::debug("[execution] {} executed", filename);
    return capture.collect(output_limit_);
}

std::expected<Invocation, GradeFailure>
ExecutionEngine::invoke(PyObject* callable, PyObject* args) const {
    OutputCapture capture;
    if (!capture.active()) {
        return std::unexpected(capture_failure());
    }

    PyRef value{PyObject_CallObject(callable, args)};
    if (!value) {
        return std::unexpected(execution_failure(FailureKind::kExecutionError,
                                                 capture.collect(output_limit_)));
    }
    return Invocation{std::move(value), capture.collect(output_limit_)};
}
