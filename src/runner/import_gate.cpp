#include "runner/import_gate.hpp"

#include <array>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace {

constexpr const char* kCapsuleName = "gradegate.import_gate";

// 제출물 문맥에서 거부하는 감사 이벤트
constexpr std::array<std::string_view, 3> kGuardedEvents{
    "open", "import", "builtins.input",
};
constexpr std::array<std::string_view, 10> kGuardedPrefixes{
    "os.", "shutil.", "subprocess.", "socket.", "ctypes.",
    "fcntl.", "mmap.", "pty.", "resource.", "signal.",
};

// 감사 훅의 판정자. GIL 로 보호된다.
ImportGate* g_armed_gate = nullptr;

[[nodiscard]] bool is_guarded(std::string_view event) noexcept {
    for (const auto name : kGuardedEvents) {
        if (event == name) {
            return true;
        }
    }
    for (const auto prefix : kGuardedPrefixes) {
        if (event.starts_with(prefix)) {
            return true;
        }
    }
    return false;
}

int audit_trampoline(const char* event, PyObject* args, void* /*user_data*/) {
    return g_armed_gate != nullptr ? g_armed_gate->audit(event, args) : 0;
}

PyObject* gate_trampoline(PyObject* self, PyObject* args, PyObject* kwargs) {
    auto* gate = static_cast<ImportGate*>(PyCapsule_GetPointer(self, kCapsuleName));
    if (gate == nullptr) {
        return nullptr;
    }
    return gate->handle(args, kwargs);
}

PyMethodDef g_gate_def{
    "__import__",
    reinterpret_cast<PyCFunction>(reinterpret_cast<void (*)()>(&gate_trampoline)),
    METH_VARARGS | METH_KEYWORDS,
    "Import a module permitted by the sandbox policy.",
};

} // namespace

int submission_frame_depth() {
    int   depth = 0;
    PyRef frame = PyRef::borrow(reinterpret_cast<PyObject*>(PyEval_GetFrame()));
    while (frame) {
        auto* current = reinterpret_cast<PyFrameObject*>(frame.get());
        const PyRef code{reinterpret_cast<PyObject*>(PyFrame_GetCode(current))};
        PyObject* filename = reinterpret_cast<PyCodeObject*>(code.get())->co_filename;
        if (filename != nullptr
            && PyUnicode_CompareWithASCIIString(filename, kSubmissionFilename) == 0) {
            ++depth;
        }
        frame = PyRef{reinterpret_cast<PyObject*>(PyFrame_GetBack(current))};
    }
    return depth;
}

ImportGate::ImportGate(const ValidatorPolicy& policy) noexcept
    : policy_(policy) {}

ImportGate::~ImportGate() {
    disarm();
}

bool ImportGate::install_audit_hook() {
    static const bool installed = [] {
        if (PySys_AddAuditHook(&audit_trampoline, nullptr) != 0) {
            spdlog::error("[import_gate] PySys_AddAuditHook failed");
            return false;
        }
        spdlog::debug("[import_gate] audit hook installed");
        return true;
    }();
    return installed;
}

void ImportGate::arm() noexcept {
    g_armed_gate = this;
}

void ImportGate::disarm() noexcept {
    if (g_armed_gate == this) {
        g_armed_gate = nullptr;
    }
}

PyRef ImportGate::make_function() {
    PyRef capsule{PyCapsule_New(this, kCapsuleName, nullptr)};
    if (!capsule) {
        return {};
    }
    return PyRef{PyCFunction_NewEx(&g_gate_def, capsule.get(), nullptr)};
}

void ImportGate::record(std::string offending, std::string exception_type, std::string message) {
    violations_.push_back(RuntimeViolation{
        std::move(offending), std::move(exception_type), std::move(message)});
}

PyObject* ImportGate::handle(PyObject* args, PyObject* kwargs) {
    static char* kwlist[] = {
        const_cast<char*>("name"),
        const_cast<char*>("globals"),
        const_cast<char*>("locals"),
        const_cast<char*>("fromlist"),
        const_cast<char*>("level"),
        nullptr,
    };

    PyObject* name     = nullptr;
    PyObject* globals  = nullptr;
    PyObject* locals   = nullptr;
    PyObject* fromlist = nullptr;
    int       level    = 0;
    if (!PyArg_ParseTupleAndKeywords(args, kwargs, "U|OOOi:__import__", kwlist,
                                     &name, &globals, &locals, &fromlist, &level)) {
        return nullptr;
    }

    const char* module = PyUnicode_AsUTF8(name);
    if (module == nullptr) {
        return nullptr;
    }

    std::vector<std::string> symbols;
    if (fromlist != nullptr && fromlist != Py_None) {
        PyRef seq{PySequence_Fast(fromlist, "__import__() fromlist must be a sequence")};
        if (!seq) {
            return nullptr;
        }
        const Py_ssize_t n = PySequence_Fast_GET_SIZE(seq.get());
        for (Py_ssize_t i = 0; i < n; ++i) {
            PyObject* item = PySequence_Fast_GET_ITEM(seq.get(), i);
            const char* symbol = PyUnicode_Check(item) ? PyUnicode_AsUTF8(item) : nullptr;
            if (symbol == nullptr) {
                if (!PyErr_Occurred()) {
                    PyErr_SetString(PyExc_TypeError, "__import__() fromlist items must be str");
                }
                return nullptr;
            }
            symbols.emplace_back(symbol);
        }
    }

    const ImportDecision decision = check_import(policy_, module, symbols, level);
    if (!decision.allowed) {
        spdlog::warn("[import_gate] runtime import blocked: module='{}' reason='{}'",
                     decision.offending, decision.reason);
        PyErr_Format(PyExc_ImportError, "Import of '%s' is not allowed",
                     decision.offending.c_str());
        record(decision.offending, "ImportError",
               fmt::format("Import of '{}' is not allowed", decision.offending));
        return nullptr;
    }

    // 허용된 모듈의 초기화 코드는 파일을 읽는다. 현재 깊이에서만 허용한다.
    const int saved = trusted_depth_;
    trusted_depth_  = submission_frame_depth();
    PyObject* imported = PyImport_ImportModuleLevelObject(name, globals, locals, fromlist, level);
    trusted_depth_ = saved;
    return imported;
}

int ImportGate::audit(const char* event, PyObject* args) {
    const std::string_view name{event};
    if (!is_guarded(name)) {
        return 0;
    }
    const int depth = submission_frame_depth();
    if (depth == 0 || depth == trusted_depth_) {
        return 0;
    }

    if (name == "import") {
        // args = (module, filename, sys.path, sys.meta_path, sys.path_hooks)
        std::string module{"<unknown>"};
        PyObject* first = PyTuple_Check(args) && PyTuple_GET_SIZE(args) > 0
            ? PyTuple_GET_ITEM(args, 0) : nullptr;
        if (first != nullptr && PyUnicode_Check(first)) {
            if (const char* text = PyUnicode_AsUTF8(first); text != nullptr) {
                module = text;
            } else {
                PyErr_Clear();
            }
        }
        const ImportDecision decision = check_import(policy_, module, {}, 0);
        if (decision.allowed) {
            return 0;
        }
        spdlog::warn("[import_gate] import bypassing the gate blocked: module='{}'",
                     decision.offending);
        PyErr_Format(PyExc_ImportError, "Import of '%s' is not allowed",
                     decision.offending.c_str());
        record(decision.offending, "ImportError",
               fmt::format("Import of '{}' is not allowed", decision.offending));
        return -1;
    }

    spdlog::warn("[import_gate] audit event '{}' denied in submission code", name);
    PyErr_Format(PyExc_PermissionError, "'%s' is not permitted in submission code", event);
    record(std::string{name}, "PermissionError",
           fmt::format("'{}' is not permitted in submission code", name));
    return -1;
}
