#include "backend/in_process.hpp"
#include <glog/logging.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <map>
#include <memory>
#include <set>
#include <vector>
#include "common/exceptions.hpp"
#include "common/python.hpp"
#include "common/utils.hpp"

namespace sandbox {
using namespace std;

// clang-format off
static const char *const ALLOWED_BUILTINS[] = {
    "abs", "all", "any", "ascii", "bin", "bool", "bytearray", "bytes", "callable", "chr",
    "classmethod", "complex", "dict", "divmod", "enumerate", "filter", "float", "format",
    "frozenset", "hasattr", "hash", "hex", "id", "int", "isinstance", "issubclass", "iter",
    "len", "list", "map", "max", "min", "next", "object", "oct", "ord", "pow", "property",
    "range", "repr", "reversed", "round", "set", "slice", "sorted", "staticmethod", "str",
    "sum", "super", "tuple", "type", "zip", "__build_class__",
    "None", "True", "False", "Ellipsis", "NotImplemented",
    "ArithmeticError", "AssertionError", "AttributeError", "BaseException", "Exception",
    "IndexError", "KeyError", "LookupError", "NameError", "NotImplementedError",
    "OverflowError", "RecursionError", "RuntimeError", "StopIteration", "TimeoutError",
    "TypeError", "ValueError", "ZeroDivisionError"
};

static const set<string> ALLOWED_MODULES = {
    "math", "json", "collections", "itertools", "functools", "heapq", "bisect", "string", "re"
};
// clang-format on

static const char *const PRELOADED_MODULES[] = {"math", "json"};

/**
 * @brief 模块代理中额外隐藏的公开属性
 * string.Formatter().get_field 可以用字符串访问任意属性
 */
static const map<string, set<string>> HIDDEN_ATTRIBUTES = {
    {"string", {"Formatter"}}
};

/**
 * @brief print() 最多写出的字节数，超出部分直接丢弃
 */
static const size_t CAPTURE_RETAIN_LIMIT = 1 << 20;

static const char *const CAPTURE_CAPSULE = "sandbox.io_capture";

/**
 * @brief print() 和 input() 共享的状态
 * 由 capsule 持有，用户代码保存了 print 的引用时也不会悬空
 */
struct io_capture {
    size_t written = 0;
    vector<string> input_lines;
    size_t next_line = 0;
};

/**
 * @brief 将数据完整写入文件描述符
 */
static bool write_fully(int fd, const char *data, size_t size) {
    while (size > 0) {
        ssize_t n = write(fd, data, size);
        if (n == -1) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        size -= n;
    }
    return true;
}

static void release_capture(PyObject *capsule) {
    delete static_cast<io_capture *>(PyCapsule_GetPointer(capsule, CAPTURE_CAPSULE));
}

static io_capture *get_capture(PyObject *self) {
    return static_cast<io_capture *>(PyCapsule_GetPointer(self, CAPTURE_CAPSULE));
}

static bool append_str(string &out, PyObject *obj) {
    py_ref str(PyObject_Str(obj));
    if (!str) return false;
    Py_ssize_t size;
    const char *data = PyUnicode_AsUTF8AndSize(str.get(), &size);
    if (!data) return false;
    out.append(data, size);
    return true;
}

static bool keyword_string(PyObject *kwargs, const char *name, string &value) {
    if (!kwargs) return true;
    PyObject *obj = PyDict_GetItemString(kwargs, name);
    if (!obj || obj == Py_None) return true;
    if (!PyUnicode_Check(obj)) {
        PyErr_Format(PyExc_TypeError, "%s must be None or a string, not %.200s", name, Py_TYPE(obj)->tp_name);
        return false;
    }
    Py_ssize_t size;
    const char *data = PyUnicode_AsUTF8AndSize(obj, &size);
    if (!data) return false;
    value.assign(data, size);
    return true;
}

static PyObject *sandbox_print(PyObject *self, PyObject *args, PyObject *kwargs) {
    io_capture *capture = get_capture(self);
    if (!capture) return nullptr;

    string sep = " ", end = "\n";
    if (!keyword_string(kwargs, "sep", sep) || !keyword_string(kwargs, "end", end))
        return nullptr;

    string text;
    for (Py_ssize_t i = 0; i < PyTuple_GET_SIZE(args); ++i) {
        if (i) text += sep;
        if (!append_str(text, PyTuple_GET_ITEM(args, i))) return nullptr;
    }
    text += end;
    // 直接写入子进程的标准输出，超时被结束时已经输出的内容不会丢失
    if (capture->written < CAPTURE_RETAIN_LIMIT) {
        size_t size = min(text.size(), CAPTURE_RETAIN_LIMIT - capture->written);
        if (!write_fully(STDOUT_FILENO, text.data(), size))
            return PyErr_SetFromErrno(PyExc_OSError);
        capture->written += size;
    }
    Py_RETURN_NONE;
}

static PyObject *sandbox_input(PyObject *self, PyObject *args) {
    io_capture *capture = get_capture(self);
    if (!capture) return nullptr;

    PyObject *prompt = nullptr;
    if (!PyArg_UnpackTuple(args, "input", 0, 1, &prompt)) return nullptr;

    if (capture->next_line >= capture->input_lines.size()) return PyUnicode_FromString("");
    const string &line = capture->input_lines[capture->next_line++];
    return PyUnicode_DecodeUTF8(line.data(), line.size(), "replace");
}

/**
 * @brief 为模块创建一个新的代理模块，只包含公开的、不是模块的属性
 * 用户代码通过代理既不能访问模块内部导入的其它模块（比如 json.codecs、collections._sys），
 * 也不能修改真正的模块。代理没有 __name__，from 语句不会退回到 sys.modules 中查找子模块。
 * @return 失败时返回空引用，并设置 Python 异常
 */
static py_ref make_module_proxy(PyObject *module) {
    const char *name = PyModule_GetName(module);
    if (!name) return py_ref();
    auto hidden = HIDDEN_ATTRIBUTES.find(name);

    py_ref proxy(PyModule_New(name));
    if (!proxy) return py_ref();
    PyObject *proxy_dict = PyModule_GetDict(proxy.get());
    if (PyDict_DelItemString(proxy_dict, "__name__") != 0) return py_ref();

    PyObject *key, *value;
    Py_ssize_t pos = 0;
    while (PyDict_Next(PyModule_GetDict(module), &pos, &key, &value)) {
        if (!PyUnicode_Check(key) || PyModule_Check(value)) continue;
        const char *attr = PyUnicode_AsUTF8(key);
        if (!attr) return py_ref();
        if (attr[0] == '_') continue;
        if (hidden != HIDDEN_ATTRIBUTES.end() && hidden->second.count(attr)) continue;
        if (PyDict_SetItem(proxy_dict, key, value) != 0) return py_ref();
    }
    return proxy;
}

/**
 * @brief 只允许导入白名单中的模块，返回模块的代理，self 为原始的 builtins.__import__
 */
static PyObject *sandbox_import(PyObject *self, PyObject *args, PyObject *kwargs) {
    static const char *keywords[] = {"name", "globals", "locals", "fromlist", "level", nullptr};
    PyObject *name, *globals = nullptr, *locals = nullptr, *fromlist = nullptr;
    int level = 0;
    if (!PyArg_ParseTupleAndKeywords(args, kwargs, "U|OOOi:__import__", const_cast<char **>(keywords),
                                     &name, &globals, &locals, &fromlist, &level))
        return nullptr;

    const char *module = PyUnicode_AsUTF8(name);
    if (!module) return nullptr;
    string top_level(module);
    top_level = top_level.substr(0, top_level.find('.'));
    if (level != 0 || !ALLOWED_MODULES.count(top_level)) {
        PyErr_Format(PyExc_ImportError, "Import of module '%s' is not allowed", module);
        return nullptr;
    }
    py_ref imported(PyObject_Call(self, args, kwargs));
    if (!imported) return nullptr;
    return make_module_proxy(imported.get()).release();
}

static PyMethodDef print_def = {"print", reinterpret_cast<PyCFunction>(reinterpret_cast<void (*)(void)>(sandbox_print)), METH_VARARGS | METH_KEYWORDS, nullptr};
static PyMethodDef input_def = {"input", sandbox_input, METH_VARARGS, nullptr};
static PyMethodDef import_def = {"__import__", reinterpret_cast<PyCFunction>(reinterpret_cast<void (*)(void)>(sandbox_import)), METH_VARARGS | METH_KEYWORDS, nullptr};

/**
 * @brief 取出当前的 Python 异常，格式化为 "<类型>: <信息>"
 * 调用方必须持有 GIL
 */
static string describe_exception() {
    PyObject *type, *value, *traceback;
    PyErr_Fetch(&type, &value, &traceback);
    PyErr_NormalizeException(&type, &value, &traceback);
    py_ref type_ref(type), value_ref(value), traceback_ref(traceback);

    string name = type ? reinterpret_cast<PyTypeObject *>(type)->tp_name : "Exception";
    string message;
    if (value && !append_str(message, value)) {
        message.clear();
        PyErr_Clear();
    }
    return message.empty() ? name : name + ": " + message;
}

static bool set_item(PyObject *dict, const char *key, PyObject *value) {
    return value && PyDict_SetItemString(dict, key, value) == 0;
}

/**
 * @brief 构造用户代码的全局变量字典
 * @param capsule print() 和 input() 的状态
 * @return 失败时返回空引用，并设置 Python 异常
 */
static py_ref build_globals(PyObject *capsule) {
    py_ref builtins_module(PyImport_ImportModule("builtins"));
    if (!builtins_module) return py_ref();
    PyObject *builtins_dict = PyModule_GetDict(builtins_module.get());

    py_ref restricted(PyDict_New());
    if (!restricted) return py_ref();
    for (const char *name : ALLOWED_BUILTINS) {
        PyObject *value = PyDict_GetItemString(builtins_dict, name);
        if (value && !set_item(restricted.get(), name, value)) return py_ref();
    }

    PyObject *real_import = PyDict_GetItemString(builtins_dict, "__import__");
    if (!real_import) {
        PyErr_SetString(PyExc_RuntimeError, "builtins.__import__ is missing");
        return py_ref();
    }
    py_ref import_fn(PyCFunction_NewEx(&import_def, real_import, nullptr));
    py_ref print_fn(PyCFunction_NewEx(&print_def, capsule, nullptr));
    py_ref input_fn(PyCFunction_NewEx(&input_def, capsule, nullptr));
    if (!set_item(restricted.get(), "__import__", import_fn.get()) ||
        !set_item(restricted.get(), "print", print_fn.get()) ||
        !set_item(restricted.get(), "input", input_fn.get()))
        return py_ref();

    py_ref globals(PyDict_New());
    py_ref module_name(PyUnicode_FromString("__main__"));
    if (!globals ||
        !set_item(globals.get(), "__builtins__", restricted.get()) ||
        !set_item(globals.get(), "__name__", module_name.get()))
        return py_ref();

    for (const char *name : PRELOADED_MODULES) {
        py_ref module(PyImport_ImportModule(name));
        if (!module) return py_ref();
        py_ref proxy = make_module_proxy(module.get());
        if (!set_item(globals.get(), name, proxy.get())) return py_ref();
    }
    return globals;
}

embedded_python_backend::embedded_python_backend(chrono::milliseconds timeout)
    : timeout(timeout) {}

string embedded_python_backend::language() const {
    return "python";
}

string embedded_python_backend::label() const {
    return "Python";
}

bool embedded_python_backend::accepts(const execution_request &request) const {
    return request.grading;
}

void embedded_python_backend::prepare(execution_context &) const {
    // 在当前进程内执行，不需要 workspace
}

/**
 * @brief 在子进程中执行用户代码
 * 输出已经由 print() 写入标准输出，异常写入标准错误输出
 * @return 子进程的返回值，0 表示正常结束
 */
static int evaluate_in_child(const execution_request &request) {
    auto *capture = new io_capture;
    capture->input_lines = split_lines(request.stdin_text);

    py_ref capsule(PyCapsule_New(capture, CAPTURE_CAPSULE, release_capture));
    if (!capsule) {
        delete capture;
        throw internal_error("Unable to create Python capsule: " + describe_exception());
    }
    py_ref globals = build_globals(capsule.get());
    if (!globals) throw internal_error("Unable to prepare Python globals: " + describe_exception());

    py_ref code(Py_CompileString(request.source.c_str(), "<sandbox>", Py_file_input));
    py_ref result;
    if (code) result = py_ref(PyEval_EvalCode(code.get(), globals.get(), globals.get()));
    if (result) return 0;

    string error = describe_exception();
    if (!write_fully(STDERR_FILENO, error.data(), error.size())) return 2;
    return 1;
}

void embedded_python_backend::run(execution_context &ctx) const {
    // fork 时必须持有 GIL，子进程继承这个线程的解释器状态
    GIL_guard gil;
    unique_ptr<PyThread_guard> released;

    fork_hooks hooks;
    hooks.prepare = [] { PyOS_BeforeFork(); };
    hooks.parent = [&released] {
        PyOS_AfterFork_Parent();
        // 等待子进程期间，其它线程可以使用解释器
        released = make_unique<PyThread_guard>();
    };
    hooks.child = [] { PyOS_AfterFork_Child(); };

    process_options options;
    options.timeout = timeout;
    process_outcome outcome = run_forked("embedded python", [&ctx] { return evaluate_in_child(ctx.request); }, options, hooks);
    released.reset();

    apply_outcome(ctx.result, outcome);
    string &output = ctx.result.stdout_text;
    if (!output.empty() && output.back() == '\n') output.pop_back();
}

}  // namespace sandbox
