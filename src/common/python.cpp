#include "common/python.hpp"
#include <glog/logging.h>
#include <utility>

GIL_guard::GIL_guard() {
    state = PyGILState_Ensure();
}

GIL_guard::~GIL_guard() {
    PyGILState_Release(state);
}

PyThread_guard::PyThread_guard() {
    state = PyEval_SaveThread();
}

PyThread_guard::~PyThread_guard() {
    PyEval_RestoreThread(state);
}

py_ref::py_ref() : obj(nullptr) {}

py_ref::py_ref(PyObject *obj) : obj(obj) {}

py_ref::py_ref(py_ref &&other) : obj(other.obj) {
    other.obj = nullptr;
}

py_ref::~py_ref() {
    Py_XDECREF(obj);
}

py_ref &py_ref::operator=(py_ref &&other) {
    std::swap(obj, other.obj);
    return *this;
}

py_ref py_ref::borrow(PyObject *obj) {
    Py_XINCREF(obj);
    return py_ref(obj);
}

PyObject *py_ref::get() const {
    return obj;
}

PyObject *py_ref::release() {
    PyObject *result = obj;
    obj = nullptr;
    return result;
}

py_ref::operator bool() const {
    return obj != nullptr;
}

python_runtime::python_runtime(const char *program_name) {
    PyConfig config;
    PyConfig_InitIsolatedConfig(&config);
    PyStatus status = PyConfig_SetBytesString(&config, &config.program_name, program_name);
    if (!PyStatus_Exception(status))
        status = Py_InitializeFromConfig(&config);
    PyConfig_Clear(&config);
    if (PyStatus_Exception(status))
        LOG(FATAL) << "Unable to initialize embedded Python interpreter: "
                   << (status.err_msg ? status.err_msg : "unknown error");

    // 主线程不执行 Python 代码，释放 GIL 给执行用户代码的线程
    thread_guard = std::make_unique<PyThread_guard>();
    LOG(INFO) << "Embedded Python " << Py_GetVersion() << " initialized";
}

python_runtime::~python_runtime() {
    thread_guard.reset();
    if (Py_FinalizeEx() < 0)
        LOG(ERROR) << "Errors occurred while finalizing embedded Python interpreter";
}
