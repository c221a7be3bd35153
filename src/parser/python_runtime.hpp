#pragma once

// ---------------------------------------------------------------------------
// python_runtime.hpp
//
// 임베디드 CPython 3 인터프리터 수명 관리와 C API RAII 래퍼.
//
// [두 가지 사용 모드]
// - kHost  : gradegate 데몬/테스트. AST 파싱 전용. 초기화 직후 GIL 을 놓고
//            각 스레드는 GilGuard 로 GIL 을 잡는다. 시그널 핸들러 미설치.
// - kRunner: gradegate-runner. 단일 스레드가 GIL 을 계속 보유한다.
//            SIGINT 핸들러를 설치하여 프로브 시간 초과 시 인터프리터
//            인터럽트(KeyboardInterrupt)를 사용할 수 있게 한다.
//
// [순서 주의]
// Python.h 는 표준 헤더보다 먼저 포함되어야 한다. 이 헤더를 포함하는
// .cpp 는 이 헤더를 첫 번째 include 로 둔다.
//
// [알려진 한계]
// - Py_FinalizeEx 는 호출하지 않는다. 인터프리터는 프로세스 수명과 같다.
//   (numpy 등 확장 모듈은 재초기화를 지원하지 않는다.)
// ---------------------------------------------------------------------------

#define PY_SSIZE_T_CLEAN
#include <Python.h>

#include <cstdint>
#include <expected>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// PyRef
//   strong reference 하나를 소유하는 RAII 핸들.
//   소멸/reset 시점에 GIL 을 보유하고 있어야 한다.
// ---------------------------------------------------------------------------
class PyRef {
public:
    PyRef() noexcept = default;
    explicit PyRef(PyObject* owned) noexcept : ptr_(owned) {}

    // borrow
    //   borrowed reference 를 받아 refcount 를 올린 뒤 소유한다.
    [[nodiscard]] static PyRef borrow(PyObject* borrowed) noexcept {
        Py_XINCREF(borrowed);
        return PyRef{borrowed};
    }

    ~PyRef() { Py_XDECREF(ptr_); }

    PyRef(const PyRef&)            = delete;
    PyRef& operator=(const PyRef&) = delete;

    PyRef(PyRef&& other) noexcept : ptr_(other.ptr_) { other.ptr_ = nullptr; }
    PyRef& operator=(PyRef&& other) noexcept {
        if (this != &other) {
            Py_XDECREF(ptr_);
            ptr_       = other.ptr_;
            other.ptr_ = nullptr;
        }
        return *this;
    }

    [[nodiscard]] PyObject* get() const noexcept { return ptr_; }

    // release
    //   소유권을 호출자에게 넘긴다 (PyDict_SetItem 이 아닌 steal API 용).
    [[nodiscard]] PyObject* release() noexcept {
        PyObject* p = ptr_;
        ptr_        = nullptr;
        return p;
    }

    explicit operator bool() const noexcept { return ptr_ != nullptr; }

private:
    PyObject* ptr_{nullptr};
};

// ---------------------------------------------------------------------------
// GilGuard
//   PyGILState_Ensure / Release 스코프 가드.
//   이미 GIL 을 보유한 스레드에서 중첩 사용해도 안전하다.
// ---------------------------------------------------------------------------
class GilGuard {
public:
    GilGuard() noexcept : state_(PyGILState_Ensure()) {}
    ~GilGuard() { PyGILState_Release(state_); }

    GilGuard(const GilGuard&)            = delete;
    GilGuard& operator=(const GilGuard&) = delete;
    GilGuard(GilGuard&&)                 = delete;
    GilGuard& operator=(GilGuard&&)      = delete;

private:
    PyGILState_STATE state_;
};

enum class InterpreterMode : std::uint8_t {
    kHost   = 0,
    kRunner = 1,
};

// ---------------------------------------------------------------------------
// PythonRuntime
//   프로세스당 한 번만 초기화한다. 두 번째 호출부터는 첫 결과를 반환한다
//   (모드가 달라도 첫 모드가 유지된다).
// ---------------------------------------------------------------------------
class PythonRuntime {
public:
    [[nodiscard]] static std::expected<void, std::string> initialize(InterpreterMode mode);
};

// ---------------------------------------------------------------------------
// PyErrorInfo
//   현재 설정된 파이썬 예외를 꺼내(clear) 문자열로 변환한 값.
// ---------------------------------------------------------------------------
struct PyErrorInfo {
    std::string              type{};
    std::string              message{};
    std::vector<std::string> trace{};
};

// fetch_python_error
//   예외 상태를 소비한다. 예외가 없으면 type 이 빈 문자열이다.
//   with_traceback = true 이면 traceback.format_exception 결과를 줄 단위로 담는다.
[[nodiscard]] PyErrorInfo fetch_python_error(bool with_traceback);

// str()/repr()/type(x).__name__ 의 UTF-8 변환. 변환 중 예외는 삼키고 대체 문자열 반환.
[[nodiscard]] std::string py_str(PyObject* obj);
[[nodiscard]] std::string py_repr(PyObject* obj);
[[nodiscard]] std::string py_type_name(PyObject* obj);

// new_py_string
//   UTF-8 std::string → str 객체. 실패 시 빈 PyRef (예외 설정됨).
[[nodiscard]] PyRef new_py_string(const std::string& text);
