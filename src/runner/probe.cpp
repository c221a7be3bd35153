#include "runner/probe.hpp"

#include <csignal>

#include <sys/time.h>

#include <spdlog/spdlog.h>

namespace {

constexpr Py_ssize_t kVariablePreviewLimit = 100;
constexpr Py_ssize_t kVariablePreviewKeep  = 97;

extern "C" void on_probe_alarm(int /*signo*/) {
    // async-signal-safe: 인터프리터에 SIGINT 도착을 알리기만 한다.
    (void)PyErr_SetInterruptEx(SIGINT);
}

// ---------------------------------------------------------------------------
// ProbeAlarm
//   시도 하나의 예산. 생성 시 ITIMER_REAL 을 걸고, 소멸 시 해제한 뒤
//   이미 요청된 인터럽트가 남아 있으면 소비한다 (다음 시도로 새지 않도록).
// ---------------------------------------------------------------------------
class ProbeAlarm {
public:
    explicit ProbeAlarm(std::uint32_t timeout_ms) noexcept {
        struct sigaction action{};
        action.sa_handler = &on_probe_alarm;
        sigemptyset(&action.sa_mask);
        action.sa_flags = 0;
        installed_      = ::sigaction(SIGALRM, &action, &previous_) == 0;

        itimerval timer{};
        timer.it_value.tv_sec  = static_cast<time_t>(timeout_ms / 1000);
        timer.it_value.tv_usec = static_cast<suseconds_t>((timeout_ms % 1000) * 1000);
        if (installed_ && ::setitimer(ITIMER_REAL, &timer, nullptr) != 0) {
            spdlog::warn("[probe] setitimer failed, probe runs without a per-call budget");
        }
    }

    ~ProbeAlarm() {
        itimerval off{};
        (void)::setitimer(ITIMER_REAL, &off, nullptr);
        if (installed_) {
            (void)::sigaction(SIGALRM, &previous_, nullptr);
        }
        PyObject* type  = nullptr;
        PyObject* value = nullptr;
        PyObject* tb    = nullptr;
        PyErr_Fetch(&type, &value, &tb);
        if (PyErr_CheckSignals() != 0) {
            PyErr_Clear();
        }
        PyErr_Restore(type, value, tb);
    }

    ProbeAlarm(const ProbeAlarm&)            = delete;
    ProbeAlarm& operator=(const ProbeAlarm&) = delete;

private:
    struct sigaction previous_{};
    bool             installed_{false};
};

// make_battery
//   입력 배터리. 생성 실패 시 해당 항목은 빈 PyRef (건너뜀).
[[nodiscard]] std::vector<PyRef> make_battery() {
    std::vector<PyRef> battery;
    battery.emplace_back(Py_BuildValue("()"));
    battery.emplace_back(Py_BuildValue("([])"));
    battery.emplace_back(Py_BuildValue("([iiiii])", 1, 2, 3, 4, 5));
    battery.emplace_back(Py_BuildValue("(s)", "test"));
    battery.emplace_back(Py_BuildValue("(i)", 5));
    battery.emplace_back(Py_BuildValue("(i)", 0));
    PyErr_Clear();
    return battery;
}

[[nodiscard]] bool is_sequence_result(PyObject* value) noexcept {
    return PyList_Check(value) || PyTuple_Check(value);
}

} // namespace

ClassInfo describe_class(const std::string& name, PyObject* cls) {
    ClassInfo info{};
    info.name = name;

    PyRef names{PyObject_Dir(cls)};
    if (!names || !PyList_Check(names.get())) {
        PyErr_Clear();
        return info;
    }
    const Py_ssize_t n = PyList_Size(names.get());
    for (Py_ssize_t i = 0; i < n; ++i) {
        PyObject* attr_name = PyList_GetItem(names.get(), i);  // borrowed
        const char* raw = PyUnicode_Check(attr_name) ? PyUnicode_AsUTF8(attr_name) : nullptr;
        if (raw == nullptr) {
            PyErr_Clear();
            continue;
        }
        if (raw[0] == '_') {
            continue;
        }
        PyRef attr{PyObject_GetAttr(cls, attr_name)};
        if (!attr) {
            PyErr_Clear();
            continue;
        }
        if (PyCallable_Check(attr.get())) {
            info.methods.emplace_back(raw);
        }
    }
    return info;
}

VariableInfo describe_variable(const std::string& name, PyObject* value) {
    VariableInfo info{};
    info.name = name;
    info.type = py_type_name(value);

    PyRef text{PyObject_Str(value)};
    if (!text) {
        PyErr_Clear();
        info.value = "<unable to serialize>";
        return info;
    }
    if (PyUnicode_GetLength(text.get()) >= kVariablePreviewLimit) {
        PyRef head{PyUnicode_Substring(text.get(), 0, kVariablePreviewKeep)};
        info.value = head ? py_str(head.get()) + "..." : std::string{"<unable to serialize>"};
        PyErr_Clear();
        return info;
    }
    info.value = py_str(text.get());
    return info;
}

ProbeResult ProbeRunner::probe_callable(const std::string& name, PyObject* fn) const {
    ProbeResult result{};
    result.name = name;

    for (const auto& args : make_battery()) {
        if (!args) {
            continue;
        }
        ++result.attempts;

        auto call = [&] {
            ProbeAlarm alarm{call_timeout_ms_};
            return engine_.invoke(fn, args.get());
        }();

        if (!call) {
            const auto& f = call.error();
            result.last_error = f.exception_type == "KeyboardInterrupt"
                ? fmt::format("probe call exceeded {} ms", call_timeout_ms_)
                : f.detail;
            continue;
        }

        PyObject* value     = call->value.get();
        result.succeeded    = true;
        result.arguments    = py_repr(args.get());
        result.return_value = py_repr(value);
        result.return_type  = py_type_name(value);

        if (!is_sequence_result(value) || PyObject_Length(value) > 0) {
            break;
        }
    }

    if (result.succeeded) {
        result.last_error.clear();
    }
    return result;
}

Diagnostics ProbeRunner::collect(const Namespace& ns) const {
    Diagnostics diag{};

    // 프로브가 globals 를 바꿀 수 있으므로 스냅샷을 순회한다.
    PyRef items{PyDict_Items(ns.dict())};
    if (!items) {
        PyErr_Clear();
        return diag;
    }

    const Py_ssize_t n = PyList_Size(items.get());
    for (Py_ssize_t i = 0; i < n; ++i) {
        PyObject* pair  = PyList_GetItem(items.get(), i);  // borrowed
        PyObject* key   = PyTuple_GetItem(pair, 0);
        PyObject* value = PyTuple_GetItem(pair, 1);
        const char* raw = PyUnicode_Check(key) ? PyUnicode_AsUTF8(key) : nullptr;
        if (raw == nullptr) {
            PyErr_Clear();
            continue;
        }
        const std::string name{raw};
        if (name.starts_with("__") || PyModule_Check(value)) {
            continue;
        }

        if (PyType_Check(value)) {
            diag.classes.push_back(describe_class(name, value));
        } else if (PyCallable_Check(value)) {
            diag.probes.push_back(probe_callable(name, value));
            spdlog::debug("[probe] {} attempts={} succeeded={}", name,
                          diag.probes.back().attempts, diag.probes.back().succeeded);
        } else {
            diag.variables.push_back(describe_variable(name, value));
        }
    }
    PyErr_Clear();
    return diag;
}
