#include "runner/python_namespace.hpp"

#include <spdlog/spdlog.h>

namespace {

[[nodiscard]] GradeFailure namespace_failure(std::string detail) {
    GradeFailure f{};
    f.kind   = FailureKind::kInternalError;
    f.detail = std::move(detail);
    const PyErrorInfo err = fetch_python_error(false);
    if (!err.type.empty()) {
        f.exception_type = err.type;
        f.message        = err.message;
    }
    return f;
}

// copy_builtin
//   real(builtins 모듈 dict) 에서 name 을 찾아 target 에 복사한다.
[[nodiscard]] bool copy_builtin(PyObject* real, PyObject* target, const std::string& name) {
    PyObject* value = PyDict_GetItemString(real, name.c_str());  // borrowed
    if (value == nullptr) {
        return false;
    }
    return PyDict_SetItemString(target, name.c_str(), value) == 0;
}

[[nodiscard]] bool set_text(PyObject* dict, const char* key, const std::string& text) {
    PyRef value = new_py_string(text);
    return value && PyDict_SetItemString(dict, key, value.get()) == 0;
}

} // namespace

std::expected<PyRef, GradeFailure> NamespaceFactory::make_builtins(ExecutionRole role) {
    PyRef module{PyImport_ImportModule("builtins")};
    if (!module) {
        return std::unexpected(namespace_failure("namespace: cannot load builtins module"));
    }
    PyObject* real = PyModule_GetDict(module.get());  // borrowed

    PyRef curated{PyDict_New()};
    if (!curated) {
        return std::unexpected(namespace_failure("namespace: dict allocation failed"));
    }

    for (const auto& name : policy_.submission_builtins) {
        if (name == "__import__") {
            continue;  // 역할별로 아래에서 결정
        }
        if (!copy_builtin(real, curated.get(), name)) {
            return std::unexpected(namespace_failure(
                "namespace: builtin '" + name + "' is not available in this interpreter"));
        }
    }

    if (role == ExecutionRole::kSubmission) {
        PyRef gate = gate_.make_function();
        if (!gate || PyDict_SetItemString(curated.get(), "__import__", gate.get()) != 0) {
            return std::unexpected(namespace_failure("namespace: cannot install import gate"));
        }
        return curated;
    }

    for (const auto& name : policy_.grader_extra_builtins) {
        if (!copy_builtin(real, curated.get(), name)) {
            return std::unexpected(namespace_failure(
                "namespace: builtin '" + name + "' is not available in this interpreter"));
        }
    }
    return curated;
}

std::expected<Namespace, GradeFailure>
NamespaceFactory::build(ExecutionRole role, const std::string& source) {
    auto builtins = make_builtins(role);
    if (!builtins) {
        return std::unexpected(builtins.error());
    }

    PyRef globals{PyDict_New()};
    if (!globals) {
        return std::unexpected(namespace_failure("namespace: dict allocation failed"));
    }
    if (PyDict_SetItemString(globals.get(), "__builtins__", builtins->get()) != 0
        || !set_text(globals.get(), "__name__", "__main__")) {
        return std::unexpected(namespace_failure("namespace: cannot seed globals"));
    }

    if (role == ExecutionRole::kSubmission) {
        if (!set_text(globals.get(), "__source__", source)) {
            return std::unexpected(namespace_failure("namespace: cannot seed __source__"));
        }
    } else {
        if (!set_text(globals.get(), "__file__", "<grader>")) {
            return std::unexpected(namespace_failure("namespace: cannot seed __file__"));
        }
        for (const auto& name : policy_.grader_modules) {
            PyRef mod{PyImport_ImportModule(name.c_str())};
            if (!mod || PyDict_SetItemString(globals.get(), name.c_str(), mod.get()) != 0) {
                return std::unexpected(namespace_failure(
                    "namespace: cannot bind grader module '" + name + "'"));
            }
        }
    }

    spdlog::debug("[namespace] {} namespace built", to_string(role));
    return Namespace{role, std::move(globals)};
}
