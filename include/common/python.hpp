#pragma once

#define PY_SSIZE_T_CLEAN
#include <Python.h>
#include <memory>

/**
 * @brief 在当前线程获取 GIL，析构时释放
 * 任何线程调用 Python C API 之前都必须持有 GIL
 */
class GIL_guard {
public:
    GIL_guard();
    ~GIL_guard();

    GIL_guard(const GIL_guard &) = delete;
    GIL_guard &operator=(const GIL_guard &) = delete;

private:
    PyGILState_STATE state;
};

/**
 * @brief 主线程初始化解释器后释放 GIL，让其他线程可以执行 Python 代码
 * 析构时重新获取 GIL，以便调用 Py_FinalizeEx
 */
class PyThread_guard {
public:
    PyThread_guard();
    ~PyThread_guard();

    PyThread_guard(const PyThread_guard &) = delete;
    PyThread_guard &operator=(const PyThread_guard &) = delete;

private:
    PyThreadState *state;
};

/**
 * @brief 持有一个 Python 对象的强引用，析构时 Py_XDECREF
 * 析构时调用方必须持有 GIL
 */
class py_ref {
public:
    py_ref();
    /**
     * @param obj 新引用（new reference），所有权转移给 py_ref
     */
    explicit py_ref(PyObject *obj);
    py_ref(py_ref &&other);
    ~py_ref();

    py_ref(const py_ref &) = delete;
    py_ref &operator=(const py_ref &) = delete;
    py_ref &operator=(py_ref &&other);

    /**
     * @brief 从借用引用（borrowed reference）构造，会增加引用计数
     */
    static py_ref borrow(PyObject *obj);

    PyObject *get() const;
    PyObject *release();
    explicit operator bool() const;

private:
    PyObject *obj;
};

/**
 * @brief 初始化嵌入式 Python 解释器，并在主线程释放 GIL
 * 整个进程只能有一个实例，析构时结束解释器
 */
class python_runtime {
public:
    explicit python_runtime(const char *program_name);
    ~python_runtime();

private:
    std::unique_ptr<PyThread_guard> thread_guard;
};
