#include "grader/sandbox/python_interpreter.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <csignal>
#include "grader/common/defer.hpp"
#include "grader/common/exceptions.hpp"

namespace grader::sandbox {
using namespace std;
using namespace nlohmann;
namespace bp = boost::python;

static const char *CANDIDATE_FILENAME = "<candidate>";

/**
 * @brief interrupt 是否请求了中断
 * Python 层的 SIGALRM 处理函数只有在该标志被设置时才会抛出 Timeout，
 * 这样迟到的信号不会影响下一个数据点
 */
static volatile sig_atomic_t interrupt_requested = 0;

static PyObject *timeout_type = nullptr;

static PyObject *on_deadline(PyObject *, PyObject *) {
    if (!interrupt_requested) Py_RETURN_NONE;
    interrupt_requested = 0;
    PyErr_SetString(timeout_type, "test case exceeded its deadline");
    return nullptr;
}

static PyMethodDef on_deadline_def = {"on_deadline", on_deadline, METH_VARARGS, nullptr};

static bp::object make_object(PyObject *ptr) {
    if (!ptr) return bp::object();
    return bp::object(bp::handle<>(ptr));
}

/**
 * @brief 取出当前的 Python 错误，转换为 candidate_error
 * 调用后 Python 的错误状态被清除
 */
static candidate_error fetch_error() {
    PyObject *type, *value, *traceback;
    PyErr_Fetch(&type, &value, &traceback);
    if (!type) throw internal_error("no Python error is set");
    PyErr_NormalizeException(&type, &value, &traceback);
    if (traceback && value) PyException_SetTraceback(value, traceback);

    bp::object otype = make_object(type), ovalue = make_object(value), otraceback = make_object(traceback);
    string kind = ((PyTypeObject *)otype.ptr())->tp_name;
    // tp_name 可能包含模块名，比如 grader.Timeout
    if (auto dot = kind.rfind('.'); dot != string::npos) kind = kind.substr(dot + 1);

    try {
        string message = bp::extract<string>(bp::str(ovalue));
        bp::object lines = bp::import("traceback").attr("format_exception")(otype, ovalue, otraceback);
        string formatted = bp::extract<string>(bp::str("").join(lines));
        return candidate_error(kind, message, formatted);
    } catch (bp::error_already_set &) {
        PyErr_Clear();
        LOG(WARNING) << "Unable to format " << kind << " raised by candidate";
        return candidate_error(kind, "<unprintable " + kind + ">", "<unprintable " + kind + ">");
    }
}

stream_capture::stream_capture(const string &input) : sys(bp::import("sys")) {
    bp::object io = bp::import("io");
    bp::object new_stdin = io.attr("StringIO")(bp::str(input.data(), input.size()));
    buffer = io.attr("StringIO")();
    saved_stdout = sys.attr("stdout");
    saved_stdin = sys.attr("stdin");
    sys.attr("stdout") = buffer;
    sys.attr("stdin") = new_stdin;
}

stream_capture::~stream_capture() {
    PyObject *type, *value, *traceback;
    PyErr_Fetch(&type, &value, &traceback);
    if (PyObject_SetAttrString(sys.ptr(), "stdout", saved_stdout.ptr()) < 0) {
        PyErr_Clear();
        LOG(ERROR) << "Unable to restore sys.stdout";
    }
    if (PyObject_SetAttrString(sys.ptr(), "stdin", saved_stdin.ptr()) < 0) {
        PyErr_Clear();
        LOG(ERROR) << "Unable to restore sys.stdin";
    }
    PyErr_Restore(type, value, traceback);
}

string stream_capture::output() const {
    return bp::extract<string>(buffer.attr("getvalue")());
}

/**
 * @brief 加载到 candidate 模块中的 Python 程序
 * 源代码只编译一次，脚本模式下每个数据点重新执行编译好的代码对象
 */
struct python_program : public program {
    python_program(bp::object module, bp::object code)
        : module(move(module)), code(move(code)), loads(bp::import("json").attr("loads")) {}

    invocation_result call(const string &entry_point, const json &input, const json &expected) override {
        defer { interrupt_requested = 0; };
        try {
            // 每次调用都重新查找入口函数，入口函数不存在时每个数据点都得到 AttributeError
            bp::object fn = module.attr(entry_point.c_str());
            bp::tuple args = input.is_array() ? bp::tuple(to_python(input)) : bp::make_tuple(to_python(input));
            bp::object got(bp::handle<>(PyObject_Call(fn.ptr(), args.ptr(), nullptr)));

            bp::object want = to_python(expected);
            int eq = PyObject_RichCompareBool(got.ptr(), want.ptr(), Py_EQ);
            if (eq < 0) bp::throw_error_already_set();
            string actual = bp::extract<string>(bp::str(got));
            return {eq == 1, actual};
        } catch (bp::error_already_set &) {
            throw fetch_error();
        }
    }

    invocation_result run_script(const json &input, const json &expected) override {
        defer { interrupt_requested = 0; };
        try {
            string output;
            {
                stream_capture capture(to_stdin(input));
                exec();
                output = capture.output();
            }
            string got = bp::extract<string>(bp::str(output.data(), output.size()).attr("strip")());
            string want = bp::extract<string>(bp::str(to_python(expected)).attr("strip")());
            return {got == want, output};
        } catch (bp::error_already_set &) {
            throw fetch_error();
        }
    }

    /**
     * @brief 在模块的命名空间中执行整个程序
     * @throw bp::error_already_set 程序抛出异常
     */
    void exec() {
        bp::object globals = module.attr("__dict__");
        bp::handle<>(PyEval_EvalCode(code.ptr(), globals.ptr(), globals.ptr()));
    }

    /**
     * @brief 数据点的输入作为标准输入时的文本
     * 字符串原样输入，null 表示没有输入，其他值使用 Python 的 str 转换
     */
    string to_stdin(const json &input) const {
        if (input.is_null()) return "";
        if (input.is_string()) return input.get<string>();
        return bp::extract<string>(bp::str(to_python(input)));
    }

private:
    bp::object to_python(const json &value) const {
        return loads(value.dump());
    }

    bp::object module;
    bp::object code;
    bp::object loads;
};

python_interpreter::python_interpreter() {
    if (!Py_IsInitialized()) Py_InitializeEx(0);

    if (!timeout_type) {
        timeout_type = PyErr_NewException("grader.Timeout", PyExc_BaseException, nullptr);
        if (!timeout_type) {
            PyErr_Clear();
            throw internal_error("Unable to create the Timeout exception type");
        }
    }

    try {
        bp::object handler(bp::handle<>(PyCFunction_New(&on_deadline_def, nullptr)));
        bp::import("signal").attr("signal")(SIGALRM, handler);
    } catch (bp::error_already_set &) {
        candidate_error e = fetch_error();
        throw internal_error(fmt::format("Unable to install the SIGALRM handler: {}: {}", e.kind, e.what()));
    }
}

string python_interpreter::language() const {
    return "python";
}

bool python_interpreter::check_syntax(const string &source) {
    if (source.find('\0') != string::npos) return false;

    PyCompilerFlags flags{PyCF_ONLY_AST, PY_MINOR_VERSION};
    bp::handle<> tree(bp::allow_null(Py_CompileStringExFlags(source.c_str(), CANDIDATE_FILENAME, Py_file_input, &flags, -1)));
    if (!tree) {
        PyErr_Clear();
        return false;
    }
    return true;
}

unique_ptr<program> python_interpreter::load(const string &source, const json &input) {
    defer { interrupt_requested = 0; };
    if (source.find('\0') != string::npos)
        throw candidate_error("SyntaxError", "source code string cannot contain null bytes", "");

    try {
        bp::object module(bp::handle<>(PyModule_New("candidate")));
        module.attr("__dict__")["__builtins__"] = bp::import("builtins");

        bp::object code(bp::handle<>(Py_CompileStringExFlags(source.c_str(), CANDIDATE_FILENAME, Py_file_input, nullptr, -1)));

        auto prog = make_unique<python_program>(module, code);
        {
            // 加载时的输出被丢弃
            stream_capture capture(prog->to_stdin(input));
            prog->exec();
        }
        return prog;
    } catch (bp::error_already_set &) {
        throw fetch_error();
    }
}

void python_interpreter::interrupt() noexcept {
    interrupt_requested = 1;
    PyErr_SetInterruptEx(SIGALRM);
}

void python_interpreter::reset() noexcept {
    // Python 层的处理函数可能仍在等待执行，清除标志后它不会再抛出 Timeout
    interrupt_requested = 0;
}

}  // namespace grader::sandbox
