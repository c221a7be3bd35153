#include "parser/python_runtime.hpp"

#include <mutex>
#include <sstream>

#include <spdlog/spdlog.h>

namespace {

[[nodiscard]] std::string utf8_of(PyObject* text) {
    if (text == nullptr) {
        PyErr_Clear();
        return "<unprintable>";
    }
    Py_ssize_t size = 0;
    const char* data = PyUnicode_AsUTF8AndSize(text, &size);
    if (data == nullptr) {
        PyErr_Clear();
        return "<unprintable>";
    }
    return std::string{data, static_cast<std::size_t>(size)};
}

[[nodiscard]] std::expected<void, std::string> do_initialize(InterpreterMode mode) {
    PyConfig config;
    PyConfig_InitIsolatedConfig(&config);
    config.install_signal_handlers = mode == InterpreterMode::kRunner ? 1 : 0;
    config.write_bytecode          = 0;
    config.parse_argv              = 0;
    // 호스트는 ast 만 필요하다. 러너는 numpy 를 위해 site-packages 가 필요하다.
    config.site_import             = mode == InterpreterMode::kRunner ? 1 : 0;

    const PyStatus status = Py_InitializeFromConfig(&config);
    PyConfig_Clear(&config);
    if (PyStatus_Exception(status)) {
        return std::unexpected(fmt::format(
            "python_runtime: interpreter initialization failed: {}",
            status.err_msg != nullptr ? status.err_msg : "unknown error"));
    }

    if (mode == InterpreterMode::kHost) {
        // 메인 스레드가 GIL 을 놓는다. 이후 모든 접근은 GilGuard 경유.
        (void)PyEval_SaveThread();
    }
    spdlog::debug("python_runtime: interpreter {} initialized ({} mode)",
                  Py_GetVersion(), mode == InterpreterMode::kHost ? "host" : "runner");
    return {};
}

} // namespace

std::expected<void, std::string> PythonRuntime::initialize(InterpreterMode mode) {
    static std::once_flag                         once;
    static std::expected<void, std::string>       result;
    std::call_once(once, [mode] { result = do_initialize(mode); });
    return result;
}

PyErrorInfo fetch_python_error(bool with_traceback) {
    PyErrorInfo info{};
    if (PyErr_Occurred() == nullptr) {
        return info;
    }

    PyObject* raw_type  = nullptr;
    PyObject* raw_value = nullptr;
    PyObject* raw_tb    = nullptr;
    PyErr_Fetch(&raw_type, &raw_value, &raw_tb);
    PyErr_NormalizeException(&raw_type, &raw_value, &raw_tb);
    PyRef type{raw_type};
    PyRef value{raw_value};
    PyRef tb{raw_tb};

    if (type) {
        PyRef name{PyObject_GetAttrString(type.get(), "__name__")};
        info.type = name ? utf8_of(name.get()) : std::string{"Exception"};
        if (!name) {
            PyErr_Clear();
        }
    }
    if (value) {
        info.message = py_str(value.get());
    }

    if (with_traceback && type) {
        PyRef tb_module{PyImport_ImportModule("traceback")};
        PyRef lines = tb_module
            ? PyRef{PyObject_CallMethod(tb_module.get(), "format_exception", "OOO",
                                        type.get(),
                                        value ? value.get() : Py_None,
                                        tb ? tb.get() : Py_None)}
            : PyRef{};
        if (lines && PyList_Check(lines.get())) {
            const Py_ssize_t n = PyList_Size(lines.get());
            for (Py_ssize_t i = 0; i < n; ++i) {
                std::istringstream chunk{utf8_of(PyList_GetItem(lines.get(), i))};
                std::string line;
                while (std::getline(chunk, line)) {
                    info.trace.push_back(line);
                }
            }
        } else {
            PyErr_Clear();
        }
    }
    return info;
}

std::string py_str(PyObject* obj) {
    if (obj == nullptr) {
        return "None";
    }
    PyRef text{PyObject_Str(obj)};
    return utf8_of(text.get());
}

std::string py_repr(PyObject* obj) {
    if (obj == nullptr) {
        return "None";
    }
    PyRef text{PyObject_Repr(obj)};
    return utf8_of(text.get());
}

std::string py_type_name(PyObject* obj) {
    if (obj == nullptr) {
        return "NoneType";
    }
    PyRef name{PyObject_GetAttrString(reinterpret_cast<PyObject*>(Py_TYPE(obj)), "__name__")};
    return utf8_of(name.get());
}

PyRef new_py_string(const std::string& text) {
    return PyRef{PyUnicode_DecodeUTF8(text.data(), static_cast<Py_ssize_t>(text.size()),
                                      "surrogateescape")};
}
