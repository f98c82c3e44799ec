#include "common/python.hpp"
#include "sandbox/python_sandbox.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/python.hpp>
#include <boost/python/raw_function.hpp>
#include <boost/python/stl_iterator.hpp>
#include <fmt/core.h>
#include <glog/logging.h>
#include <condition_variable>
#include <cstring>
#include <memory>
#include <mutex>
#include <regex>
#include <thread>
#include <vector>
#include "common/bounded_buffer.hpp"
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace runbox {
using namespace std;
namespace bp = boost::python;

static const chrono::milliseconds WAIT_SLICE(20);

// 纯计算、没有副作用的内建函数
static const char *SAFE_BUILTINS[] = {
    "abs", "all", "any", "ascii", "bin", "bool", "bytearray", "bytes", "callable", "chr",
    "classmethod", "complex", "dict", "divmod", "enumerate", "filter", "float", "format",
    "frozenset", "hash", "hex", "id", "int", "isinstance", "issubclass", "iter", "len", "list",
    "map", "max", "min", "next", "object", "oct", "ord", "pow", "property", "range", "repr",
    "reversed", "round", "set", "slice", "sorted", "staticmethod", "str", "sum", "super",
    "tuple", "type", "zip", "__build_class__", "NotImplemented", "Ellipsis",
    "BaseException", "Exception", "ArithmeticError", "AssertionError", "AttributeError",
    "EOFError", "FloatingPointError", "ImportError", "IndexError", "KeyError", "LookupError",
    "MemoryError", "ModuleNotFoundError", "NameError", "NotImplementedError", "OverflowError",
    "PermissionError", "RecursionError", "RuntimeError", "StopIteration", "SyntaxError",
    "SystemExit", "TimeoutError", "TypeError", "UnicodeError", "ValueError", "ZeroDivisionError",
    "Warning", "DeprecationWarning", "UserWarning"};

// 在沙箱中存在但调用即被拒绝的内建函数
static const char *DENIED_BUILTINS[] = {
    "open", "exec", "eval", "compile", "breakpoint", "globals", "locals", "vars", "dir",
    "memoryview", "help", "exit", "quit", "copyright", "credits", "license"};

// 允许的模块中以字符串参数访问属性的函数，属性名同样要经过检查
static const set<string> ATTRIBUTE_CALLERS = {"operator.attrgetter", "operator.methodcaller"};

// 允许的模块中不提供的成员，Formatter.get_field 可以按字符串访问任意属性
static const set<string> HIDDEN_MEMBERS = {"string.Formatter"};

// 沙箱线程上被拒绝的审计事件，以 '.' 结尾的是事件名前缀
static const char *DENIED_EVENTS[] = {
    "open", "import", "os.", "subprocess.", "socket.", "shutil.", "ctypes.", "gc.", "marshal.",
    "glob.", "tempfile.", "urllib.", "http.", "ftplib.", "smtplib.", "poplib.", "imaplib.",
    "nntplib.", "telnetlib.", "webbrowser.", "pty.", "fcntl.", "resource.", "syslog.", "mmap.",
    "sqlite3.", "winreg.", "msvcrt.", "cpython.", "code.__new__", "builtins.breakpoint",
    "pickle.find_class", "setopencodehook", "sys.settrace", "sys.setprofile", "sys.addaudithook",
    "sys._current_frames", "sys._current_exceptions", "sys.monitoring."};

// 允许的模块在运行中延迟导入的模块（比如 datetime.strptime）和格式化异常用到的模块。
// 沙箱线程上真正加载模块会触发 import 审计事件，因此在安装钩子之前导入
static const char *PRELOADED_MODULES[] = {"ast", "traceback", "linecache", "tokenize", "_strptime"};

// 不以下划线开头，但可以通过栈帧拿到其他模块 globals 的属性
static const set<string> FRAME_ATTRIBUTES = {
    "f_globals", "f_locals", "f_builtins", "f_back", "f_code",
    "gi_frame", "gi_code", "cr_frame", "cr_code", "ag_frame", "ag_code",
    "tb_frame", "tb_next"};

// 格式化字符串中的属性访问，比如 "{0.__class__}".format(x)
static const regex FORMAT_ATTRIBUTE(R"(\{[^{}]*\.(_|f_|gi_|cr_|ag_|tb_))");

static PyObject *capability_denied_type = nullptr;

// 所有实例共享的类：允许的模块中的类及其基类、元类。只在持有 GIL 时访问
static set<PyObject *> shared_types;

static bool is_forbidden_attribute(const string &name) {
    return (!name.empty() && name[0] == '_') || FRAME_ATTRIBUTES.count(name);
}

static bool is_denied_event(const char *event) {
    for (const char *denied : DENIED_EVENTS) {
        size_t length = strlen(denied);
        if (denied[length - 1] == '.' ? strncmp(event, denied, length) == 0 : strcmp(event, denied) == 0)
            return true;
    }
    return false;
}

/**
 * @brief 登记一个共享的类，连同它的基类和元类
 * 静态类型本身不可修改，不需要登记
 */
static void share_type(PyObject *object) {
    if (!PyType_Check(object)) return;
    auto *type = reinterpret_cast<PyTypeObject *>(object);
    if (!(type->tp_flags & Py_TPFLAGS_HEAPTYPE)) return;
    if (!shared_types.insert(object).second) return;
    Py_INCREF(object);

    if (type->tp_mro && PyTuple_Check(type->tp_mro))
        for (Py_ssize_t i = 0; i < PyTuple_GET_SIZE(type->tp_mro); ++i)
            share_type(PyTuple_GET_ITEM(type->tp_mro, i));
    share_type(reinterpret_cast<PyObject *>(Py_TYPE(object)));
}

[[noreturn]] static void raise_python(PyObject *type, const string &message) {
    PyErr_SetString(type, message.c_str());
    bp::throw_error_already_set();
    throw internal_error("unreachable");
}

static bp::object own(PyObject *p) {
    return bp::object(bp::handle<>(p));
}

static bp::object call_with(const bp::object &f, const bp::tuple &args, const bp::dict &kwargs) {
    return own(PyObject_Call(f.ptr(), args.ptr(), kwargs.ptr()));
}

static bp::object wrap(PyObject *p) {
    return p ? bp::object(bp::handle<>(p)) : bp::object();
}

/**
 * @brief 判断 value 是否是绑定在 owner 上的方法
 */
static bool bound_to(const bp::object &value, const bp::object &owner) {
    if (owner.ptr() == Py_None) return false;
    PyObject *self = PyObject_GetAttrString(value.ptr(), "__self__");
    if (!self) {
        PyErr_Clear();
        return false;
    }
    bool result = self == owner.ptr();
    Py_DECREF(self);
    return result;
}

/**
 * @brief 模块中的可变容器复制一份，沙箱中的修改不会影响其他实例
 */
static bp::object private_copy(const bp::object &value) {
    PyObject *p = value.ptr();
    if (PyDict_CheckExact(p)) return own(PyDict_Copy(p));
    if (PyList_CheckExact(p)) return own(PySequence_List(p));
    if (PySet_CheckExact(p)) return own(PySet_New(p));
    if (PyByteArray_CheckExact(p)) return own(PyByteArray_FromObject(p));
    return value;
}

struct python_error {
    bp::object type, value, traceback;
};

/**
 * @brief 取出当前线程的 Python 异常
 */
static python_error fetch_python_error() {
    PyObject *type, *value, *traceback;
    PyErr_Fetch(&type, &value, &traceback);
    PyErr_NormalizeException(&type, &value, &traceback);
    if (value && traceback) PyException_SetTraceback(value, traceback);
    return {wrap(type), wrap(value), wrap(traceback)};
}

static string format_python_error(const python_error &error, bool only_exception) {
    try {
        bp::object traceback = bp::import("traceback");
        bp::object lines = only_exception
                               ? traceback.attr("format_exception_only")(error.type, error.value)
                               : traceback.attr("format_exception")(error.type, error.value, error.traceback);
        return bp::extract<string>(bp::str("").join(lines));
    } catch (bp::error_already_set &) {
        // 用户异常的 __str__ 本身也可能抛出异常
        PyErr_Clear();
        return "<unprintable exception>\n";
    }
}

static optional<int> error_line(const python_error &error) {
    PyObject *lineno = PyObject_GetAttrString(error.value.ptr(), "lineno");
    if (!lineno) {
        PyErr_Clear();
        return nullopt;
    }
    optional<int> line;
    if (PyLong_Check(lineno)) line = static_cast<int>(PyLong_AsLong(lineno));
    Py_DECREF(lineno);
    return line;
}

/**
 * @brief 一次执行对应的沙箱实例
 * 由调用方和执行线程共同持有。输出缓冲区和状态由 mut 保护；
 * Python 对象（定时器回调）以及 trusted、quiet 只在执行线程持有 GIL 时访问。
 */
struct sandbox_instance {
    struct pending_timer {
        int id;
        chrono::steady_clock::time_point due;
        bp::object callback;
    };

    const sandbox_options options;

    mutex mut;
    condition_variable cond;
    bool finished = false;
    atomic<bool> aborted{false};

    bounded_buffer stdout_buffer;
    bounded_buffer stderr_buffer;
    size_t input_pos = 0;

    bool denied = false;
    string denial;

    sandbox_result::outcome kind = sandbox_result::outcome::COMPLETED;
    optional<int> exit_code;
    optional<int> line;
    string message;

    vector<pending_timer> timers;
    int next_timer_id = 1;

    /**
     * @brief 大于 0 时正在导入允许的模块，审计钩子放行
     */
    int trusted = 0;

    /**
     * @brief 正在格式化用户异常，审计钩子的拒绝不记录在实例上
     */
    bool quiet = false;

    explicit sandbox_instance(const sandbox_options &options)
        : options(options), stdout_buffer(options.max_output_bytes), stderr_buffer(options.max_output_bytes) {}

    void write_stdout(const string &text) {
        scoped_lock guard(mut);
        stdout_buffer.append(text);
    }

    void write_stderr(const string &text) {
        scoped_lock guard(mut);
        stderr_buffer.append(text);
    }

    void record_denial(const string &what, optional<int> at = nullopt) {
        {
            scoped_lock guard(mut);
            if (!denied) {
                denied = true;
                denial = what;
                line = at;
            }
        }
        LOG(WARNING) << "sandbox capability denied: " << what;
    }

    /**
     * @brief 记录一次被拒绝的操作并向用户代码抛出 CapabilityDenied
     */
    [[noreturn]] void deny(const string &what) {
        record_denial(what);
        raise_python(capability_denied_type, what);
    }

    /**
     * @brief 在审计钩子中拒绝一次操作，只设置 Python 异常
     */
    int refuse(const string &what) {
        if (!quiet) record_denial(what);
        PyErr_SetString(capability_denied_type, what.c_str());
        return -1;
    }

    void abort() {
        aborted = true;
        cond.notify_all();
    }

    void finish(sandbox_result::outcome result_kind, optional<int> code, const string &msg, optional<int> at = nullopt) {
        scoped_lock guard(mut);
        kind = result_kind;
        exit_code = code;
        message = msg;
        if (at) line = at;
    }

    void complete() {
        {
            scoped_lock guard(mut);
            finished = true;
        }
        cond.notify_all();
    }

    void evaluate();

private:
    bp::dict make_builtins(bp::dict &module_cache);
    bp::object module_proxy(const bp::object &module, bp::dict &module_cache);
    bp::object denied_function(const string &name);
    bp::object attribute_caller(const string &name, const bp::object &real);
    bool check_source(const bp::object &tree);
    bp::object compile_source();
    void report_compile_error();
    void execute(const bp::object &code, bp::dict &globals);
    void run_timers();
    void handle_error();
    void report_error(const python_error &error);
};

// 当前线程上正在执行的沙箱实例，其他线程上为空
static thread_local sandbox_instance *current_instance = nullptr;

/**
 * @brief 在每一行和每一次函数调用时检查实例是否已被放弃
 * 被放弃后每个事件都会抛出 TimeoutError，因此用户代码即使捕获了异常也无法继续执行
 */
static int sandbox_trace(PyObject *, PyFrameObject *, int, PyObject *) {
    sandbox_instance *instance = current_instance;
    if (instance && instance->aborted.load()) {
        PyErr_SetString(PyExc_TimeoutError, "sandbox execution interrupted");
        return -1;
    }
    return 0;
}

/**
 * @brief 进程级的审计钩子，只对沙箱线程生效
 * 用户代码即使拿到了模块代理以外的对象，文件、进程、网络访问和导入仍然会被拒绝。
 * 修改共享的类会影响之后的实例，同样被拒绝；沙箱中新建的类不受限制。
 */
static int sandbox_audit(const char *event, PyObject *args, void *) {
    sandbox_instance *instance = current_instance;
    if (!instance || instance->trusted > 0) return 0;

    if (strcmp(event, "object.__setattr__") == 0 || strcmp(event, "object.__delattr__") == 0) {
        if (!PyTuple_Check(args) || PyTuple_GET_SIZE(args) < 1) return 0;
        PyObject *target = PyTuple_GET_ITEM(args, 0);
        if (!shared_types.count(target)) return 0;
        return instance->refuse(fmt::format("modification of shared type '{}' is not allowed in the sandbox",
                                            reinterpret_cast<PyTypeObject *>(target)->tp_name));
    }

    if (!is_denied_event(event)) return 0;
    return instance->refuse(fmt::format("operation '{}' is not allowed in the sandbox", event));
}

bp::object sandbox_instance::denied_function(const string &name) {
    return bp::raw_function([this, name](bp::tuple, bp::dict) -> bp::object {
        deny(fmt::format("'{}' is not available in the sandbox", name));
    });
}

bp::object sandbox_instance::attribute_caller(const string &name, const bp::object &real) {
    // attrgetter 的每个参数都是属性路径，methodcaller 只有第一个参数是方法名
    bool all_arguments = name == "operator.attrgetter";
    return bp::raw_function(
        [this, name, real, all_arguments](bp::tuple args, bp::dict kwargs) -> bp::object {
            long count = all_arguments ? bp::len(args) : 1;
            for (long i = 0; i < count; ++i) {
                bp::object argument = args[i];
                if (!PyUnicode_Check(argument.ptr())) continue;
                string path = bp::extract<string>(argument);
                vector<string> parts;
                boost::split(parts, path, boost::is_any_of("."));
                for (auto &part : parts)
                    if (is_forbidden_attribute(part))
                        deny(fmt::format("{}() of attribute '{}' is not allowed", name, path));
            }
            return call_with(real, args, kwargs);
        },
        1);
}

bp::object sandbox_instance::module_proxy(const bp::object &module, bp::dict &module_cache) {
    string name = bp::extract<string>(module.attr("__name__"));
    if (module_cache.has_key(name)) return module_cache[name];

    bp::object proxy = wrap(PyModule_New(name.c_str()));
    module_cache[name] = proxy;

    // random 的模块级函数是共享 Random 实例的方法，改为绑定到本实例独有的 Random；
    // decimal 的模块级 Context 复制一份
    bp::object shared_random, own_random, context_type;
    if (name == "random") {
        shared_random = module.attr("_inst");
        own_random = module.attr("Random")();
    } else if (name == "decimal") {
        context_type = module.attr("Context");
    }

    bp::dict members(module.attr("__dict__"));
    bp::list items = members.items();
    for (long i = 0; i < bp::len(items); ++i) {
        bp::object key = items[i][0], value = items[i][1];
        string attribute = bp::extract<string>(key);
        if (is_forbidden_attribute(attribute)) continue;
        string qualified = name + "." + attribute;

        if (PyModule_Check(value.ptr())) {
            // 只保留自己的子模块，比如 collections.abc，而不是 fractions.sys
            bp::object sub_name = value.attr("__name__");
            if (!PyUnicode_Check(sub_name.ptr())) continue;
            string sub = bp::extract<string>(sub_name);
            if (sub.rfind(name + ".", 0) != 0) continue;
            proxy.attr(attribute.c_str()) = module_proxy(value, module_cache);
            continue;
        }

        share_type(value.ptr());
        share_type(reinterpret_cast<PyObject *>(Py_TYPE(value.ptr())));

        if (HIDDEN_MEMBERS.count(qualified)) {
            proxy.attr(attribute.c_str()) = denied_function(qualified);
        } else if (ATTRIBUTE_CALLERS.count(qualified)) {
            proxy.attr(attribute.c_str()) = attribute_caller(qualified, value);
        } else if (bound_to(value, shared_random)) {
            proxy.attr(attribute.c_str()) = bp::getattr(own_random, value.attr("__name__"));
        } else if (context_type.ptr() != Py_None && PyObject_IsInstance(value.ptr(), context_type.ptr()) == 1) {
            proxy.attr(attribute.c_str()) = value.attr("copy")();
        } else {
            proxy.attr(attribute.c_str()) = private_copy(value);
        }
    }
    return proxy;
}

bp::dict sandbox_instance::make_builtins(bp::dict &module_cache) {
    bp::object builtins = bp::import("builtins");
    bp::dict restricted;
    for (const char *name : SAFE_BUILTINS) {
        if (PyObject_HasAttrString(builtins.ptr(), name))
            restricted[name] = builtins.attr(name);
    }

    for (const char *name : DENIED_BUILTINS)
        restricted[name] = denied_function(name);

    restricted["print"] = bp::raw_function([this](bp::tuple args, bp::dict kwargs) -> bp::object {
        string sep = " ", end = "\n";
        if (kwargs.has_key("sep") && kwargs["sep"].ptr() != Py_None)
            sep = bp::extract<string>(kwargs["sep"])();
        if (kwargs.has_key("end") && kwargs["end"].ptr() != Py_None)
            end = bp::extract<string>(kwargs["end"])();

        string text;
        for (long i = 0; i < bp::len(args); ++i) {
            if (i > 0) text += sep;
            text += bp::extract<string>(bp::str(args[i]))();
        }
        text += end;
        write_stdout(text);
        return bp::object();
    });

    restricted["input"] = bp::raw_function([this](bp::tuple args, bp::dict) -> bp::object {
        if (bp::len(args) > 0)
            write_stdout(bp::extract<string>(bp::str(args[0])));

        string line;
        bool eof = false;
        {
            scoped_lock guard(mut);
            const string &input = options.input;
            if (input_pos >= input.size()) {
                eof = true;
            } else {
                size_t newline = input.find('\n', input_pos);
                size_t stop = newline == string::npos ? input.size() : newline;
                line = input.substr(input_pos, stop - input_pos);
                input_pos = newline == string::npos ? input.size() : newline + 1;
                if (!line.empty() && line.back() == '\r') line.pop_back();
            }
        }
        if (!eof) return bp::str(line);
        raise_python(PyExc_EOFError, "EOF when reading a line");
    });

    // 属性访问函数：拒绝以下划线开头的属性名，其余转发给真正的实现
    for (const char *name : {"getattr", "setattr", "delattr", "hasattr"}) {
        string function_name = name;
        bp::object real = builtins.attr(name);
        restricted[name] = bp::raw_function(
            [this, function_name, real](bp::tuple args, bp::dict kwargs) -> bp::object {
                bp::object attribute = args[1];
                if (PyUnicode_Check(attribute.ptr())) {
                    string attr = bp::extract<string>(attribute);
                    if (is_forbidden_attribute(attr))
                        deny(fmt::format("{}() of attribute '{}' is not allowed", function_name, attr));
                }
                return call_with(real, args, kwargs);
            },
            2);
    }

    restricted["__import__"] = bp::raw_function(
        [this, module_cache](bp::tuple args, bp::dict kwargs) mutable -> bp::object {
            bp::object name = args[0];
            if (!PyUnicode_Check(name.ptr()))
                raise_python(PyExc_TypeError, "__import__() argument 1 must be str");
            string module = bp::extract<string>(name);

            bp::object fromlist = bp::len(args) > 3 ? bp::object(args[3]) : kwargs.get("fromlist", bp::tuple());
            bp::object level_arg = bp::len(args) > 4 ? bp::object(args[4]) : kwargs.get("level", 0);
            int level = bp::extract<int>(level_arg);

            string root = module.substr(0, module.find('.'));
            if (level != 0)
                deny("relative imports are not allowed in the sandbox");
            if (!python_sandbox::allowed_modules().count(root))
                deny(fmt::format("import of module '{}' is not allowed in the sandbox", module));
            if (module.find("._") != string::npos)
                deny(fmt::format("import of private module '{}' is not allowed in the sandbox", module));

            ++trusted;
            defer { --trusted; };
            bp::object real = wrap(PyImport_ImportModuleLevelObject(name.ptr(), nullptr, nullptr, fromlist.ptr(), 0));
            if (real.ptr() == Py_None) bp::throw_error_already_set();
            return module_proxy(real, module_cache);
        },
        1);

    restricted["set_timeout"] = bp::raw_function(
        [this](bp::tuple args, bp::dict kwargs) -> bp::object {
            bp::object callback = args[0];
            if (!PyCallable_Check(callback.ptr()))
                raise_python(PyExc_TypeError, "set_timeout() argument 1 must be callable");

            long long delay = 0;
            if (bp::len(args) > 1)
                delay = bp::extract<long long>(args[1])();
            else if (kwargs.has_key("delay_ms"))
                delay = bp::extract<long long>(kwargs["delay_ms"])();
            if (delay < 0) delay = 0;

            if (timers.size() >= python_sandbox::MAX_PENDING_TIMERS)
                raise_python(PyExc_RuntimeError, fmt::format("too many pending timers (at most {})", python_sandbox::MAX_PENDING_TIMERS));

            int id = next_timer_id++;
            timers.push_back({id, chrono::steady_clock::now() + chrono::milliseconds(delay), callback});
            return bp::object(id);
        },
        1);

    restricted["clear_timeout"] = bp::raw_function(
        [this](bp::tuple args, bp::dict) -> bp::object {
            bp::extract<int> id(args[0]);
            if (!id.check()) return bp::object();
            for (auto it = timers.begin(); it != timers.end(); ++it) {
                if (it->id == id()) {
                    timers.erase(it);
                    break;
                }
            }
            return bp::object();
        },
        1);

    return restricted;
}

/**
 * @brief 静态检查：拒绝下划线属性访问和格式化字符串中的属性访问
 * @return 若代码可以执行返回 true，否则已经记录了拒绝原因
 */
bool sandbox_instance::check_source(const bp::object &tree) {
    bp::object ast = bp::import("ast");
    bp::object attribute_type = ast.attr("Attribute");
    bp::object constant_type = ast.attr("Constant");

    bp::stl_input_iterator<bp::object> it(ast.attr("walk")(tree)), end;
    for (; it != end; ++it) {
        bp::object node = *it;
        if (PyObject_IsInstance(node.ptr(), attribute_type.ptr()) == 1) {
            string attr = bp::extract<string>(node.attr("attr"));
            if (is_forbidden_attribute(attr)) {
                int lineno = bp::extract<int>(node.attr("lineno"));
                record_denial(fmt::format("access to attribute '{}' is not allowed in the sandbox (line {})", attr, lineno), lineno);
                return false;
            }
        } else if (PyObject_IsInstance(node.ptr(), constant_type.ptr()) == 1) {
            bp::object value = node.attr("value");
            if (PyUnicode_Check(value.ptr())) {
                string text = bp::extract<string>(value);
                if (regex_search(text, FORMAT_ATTRIBUTE)) {
                    int lineno = bp::extract<int>(node.attr("lineno"));
                    record_denial(fmt::format("attribute access in format string is not allowed in the sandbox (line {})", lineno), lineno);
                    return false;
                }
            }
        }
    }
    return true;
}

void sandbox_instance::report_compile_error() {
    python_error error = fetch_python_error();
    quiet = true;
    defer { quiet = false; };
    string formatted = format_python_error(error, true);
    write_stderr(formatted);
    while (!formatted.empty() && formatted.back() == '\n') formatted.pop_back();
    finish(sandbox_result::outcome::COMPILE_ERROR, nullopt, formatted, error_line(error));
}

/**
 * @brief 解析、静态检查并编译源代码
 * ast.parse 和 compile 抛出的错误（包括 return 出现在函数之外这类只有编译时才能发现的错误）
 * 都是编译错误
 * @return 编译得到的代码对象，失败时为 None，结果已经记录在实例上
 */
bp::object sandbox_instance::compile_source() {
    bp::object tree;
    try {
        tree = bp::import("ast").attr("parse")(options.source, options.filename, "exec");
    } catch (bp::error_already_set &) {
        report_compile_error();
        return bp::object();
    }

    if (!check_source(tree)) return bp::object();

    try {
        return bp::import("builtins").attr("compile")(tree, options.filename, "exec");
    } catch (bp::error_already_set &) {
        report_compile_error();
        return bp::object();
    }
}

void sandbox_instance::report_error(const python_error &error) {
    if (PyErr_GivenExceptionMatches(error.type.ptr(), PyExc_SystemExit)) {
        bp::object code = error.value.ptr() != Py_None ? bp::object(error.value.attr("code")) : bp::object();
        if (code.ptr() == Py_None) {
            finish(sandbox_result::outcome::COMPLETED, 0, "");
        } else if (PyLong_Check(code.ptr())) {
            int status = bp::extract<int>(code);
            if (status == 0)
                finish(sandbox_result::outcome::COMPLETED, 0, "");
            else
                finish(sandbox_result::outcome::RUNTIME_ERROR, status, fmt::format("exit code {}", status));
        } else {
            write_stderr(bp::extract<string>(bp::str(code))() + "\n");
            finish(sandbox_result::outcome::RUNTIME_ERROR, 1, "exit code 1");
        }
        return;
    }

    string traceback = format_python_error(error, false);
    write_stderr(traceback);
    string last_line = traceback;
    while (!last_line.empty() && last_line.back() == '\n') last_line.pop_back();
    last_line = last_line.substr(last_line.rfind('\n') + 1);
    finish(sandbox_result::outcome::RUNTIME_ERROR, 1, last_line);
}

void sandbox_instance::handle_error() {
    python_error error = fetch_python_error();

    if (aborted) {
        finish(sandbox_result::outcome::TIMED_OUT, nullopt, "interrupted");
        return;
    }

    // 格式化时会调用用户定义的 __str__ 和 SystemExit.code
    quiet = true;
    defer { quiet = false; };
    try {
        report_error(error);
    } catch (bp::error_already_set &) {
        PyErr_Clear();
        write_stderr("<unprintable exception>\n");
        finish(sandbox_result::outcome::RUNTIME_ERROR, 1, "<unprintable exception>");
    }
}

void sandbox_instance::execute(const bp::object &code, bp::dict &globals) {
    PyObject *ret = PyEval_EvalCode(code.ptr(), globals.ptr(), globals.ptr());
    if (!ret) {
        handle_error();
        return;
    }
    Py_DECREF(ret);
    run_timers();
}

/**
 * @brief 主程序结束后按到期时间执行定时器，同一到期时间按注册顺序执行
 */
void sandbox_instance::run_timers() {
    while (!timers.empty() && !aborted) {
        auto next = timers.begin();
        for (auto it = timers.begin(); it != timers.end(); ++it)
            if (it->due < next->due) next = it;

        auto due = next->due;
        {
            // 等待时释放 GIL
            PyThread_guard release;
            unique_lock lock(mut);
            cond.wait_until(lock, due, [this] { return aborted.load(); });
        }
        if (aborted) return;

        // 等待期间不会有其他代码修改队列，next 仍然有效
        bp::object callback = next->callback;
        timers.erase(next);

        PyObject *ret = PyObject_CallObject(callback.ptr(), nullptr);
        if (!ret) {
            handle_error();
            return;
        }
        Py_DECREF(ret);
    }
}

void sandbox_instance::evaluate() {
    GIL_guard gil;
    bp::dict module_cache;
    bp::dict globals;

    // 设置跟踪函数本身会触发 sys.settrace 审计事件，必须在登记当前实例之前
    PyEval_SetTrace(sandbox_trace, nullptr);
    current_instance = this;
    defer {
        // 用户对象的 __del__ 可能在清理时执行，此时仍然处于沙箱中
        timers.clear();
        PyDict_Clear(globals.ptr());
        PyDict_Clear(module_cache.ptr());
        current_instance = nullptr;
        PyEval_SetTrace(nullptr, nullptr);
    };

    try {
        globals["__builtins__"] = make_builtins(module_cache);
        globals["__name__"] = "__main__";

        bp::object code = compile_source();
        if (code.ptr() != Py_None && !options.check_only)
            execute(code, globals);
    } catch (bp::error_already_set &) {
        handle_error();
    } catch (std::exception &e) {
        LOG(ERROR) << "sandbox evaluation failed: " << e.what();
        finish(sandbox_result::outcome::INTERNAL_ERROR, nullopt, e.what());
    }
}

static void preload_module(const string &module) {
    PyObject *m = PyImport_ImportModule(module.c_str());
    if (!m) {
        PyErr_Clear();
        LOG(WARNING) << "Unable to preload module " << module << " for the sandbox";
        return;
    }
    Py_DECREF(m);
}

python_sandbox::python_sandbox() {
    if (!python_interpreter::initialized())
        throw internal_error("embedded Python interpreter is not initialized");

    static once_flag flag;
    call_once(flag, [] {
        GIL_guard gil;
        capability_denied_type = PyErr_NewException("sandbox.CapabilityDenied", PyExc_PermissionError, nullptr);
        if (!capability_denied_type) {
            PyErr_Clear();
            throw internal_error("unable to create CapabilityDenied exception type");
        }

        for (auto &module : allowed_modules())
            preload_module(module);
        for (const char *module : PRELOADED_MODULES)
            preload_module(module);

        if (PySys_AddAuditHook(sandbox_audit, nullptr) != 0) {
            PyErr_Clear();
            throw internal_error("unable to install the sandbox audit hook");
        }
    });
}

const set<string> &python_sandbox::allowed_modules() {
    static const set<string> modules = {
        "math", "cmath", "random", "re", "json", "string", "itertools", "functools",
        "collections", "heapq", "bisect", "statistics", "fractions", "decimal", "datetime",
        "operator", "copy", "textwrap", "enum", "dataclasses"};
    return modules;
}

sandbox_result python_sandbox::run(const sandbox_options &options, const atomic<bool> *cancelled) const {
    auto instance = make_shared<sandbox_instance>(options);
    elapsed_time timer;
    sandbox_result result;

    // 执行线程持有实例的共享所有权，超时后调用方直接返回，不等待线程结束
    thread([instance] {
        try {
            instance->evaluate();
        } catch (...) {
            LOG(ERROR) << "sandbox evaluation failed: " << boost::current_exception_diagnostic_information();
            instance->finish(sandbox_result::outcome::INTERNAL_ERROR, nullopt, "sandbox evaluation failed");
        }
        instance->complete();
    }).detach();

    auto deadline = chrono::steady_clock::now() + options.timeout;
    unique_lock lock(instance->mut);
    while (!instance->finished) {
        auto now = chrono::steady_clock::now();
        if (cancelled && cancelled->load()) {
            result.kind = sandbox_result::outcome::CANCELLED;
            result.message = "cancelled";
            break;
        }
        if (now >= deadline) {
            result.kind = sandbox_result::outcome::TIMED_OUT;
            result.message = fmt::format("time limit exceeded after {} ms", timer.milliseconds());
            break;
        }
        instance->cond.wait_until(lock, min(deadline, now + WAIT_SLICE));
    }

    if (!instance->finished) {
        LOG(WARNING) << "sandbox execution abandoned: " << result.message;
        instance->abort();
    } else if (instance->denied) {
        result.kind = sandbox_result::outcome::CAPABILITY_DENIED;
        result.message = instance->denial;
        result.exit_code = instance->exit_code;
        result.line = instance->line;
    } else {
        result.kind = instance->kind;
        result.message = instance->message;
        result.exit_code = instance->kind == sandbox_result::outcome::COMPLETED ? optional<int>(0) : instance->exit_code;
        result.line = instance->line;
    }

    result.stdout_truncated = instance->stdout_buffer.truncated();
    result.stderr_truncated = instance->stderr_buffer.truncated();
    result.stdout_data = instance->stdout_buffer.str();
    result.stderr_data = instance->stderr_buffer.str();
    if (result.kind == sandbox_result::outcome::CAPABILITY_DENIED && result.stderr_data.empty())
        result.stderr_data = "CapabilityDenied: " + result.message + "\n";
    result.duration_ms = timer.milliseconds();
    return result;
}

}  // namespace runbox
