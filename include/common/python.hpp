#pragma once

#include <Python.h>

namespace runbox {

/**
 * @brief 在当前线程获取 GIL，析构时释放
 * 任何线程在调用 Python C API 或 boost::python 之前都必须持有 GIL
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
 * @brief 在当前线程释放 GIL，析构时重新获取
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
 * @brief 内嵌 Python 解释器的初始化
 * 整个进程只初始化一次，且不会调用 Py_Finalize：被放弃的沙箱线程可能仍然持有
 * 解释器对象，在进程退出前结束解释器是不安全的。
 * 初始化完成后主线程会释放 GIL，以便沙箱线程通过 GIL_guard 获取。
 */
class python_interpreter {
public:
    /**
     * @brief 初始化解释器（重复调用无副作用）
     * 必须在任何沙箱执行之前调用，且调用线程之后不能持有 GIL
     */
    static void initialize();

    static bool initialized();
};

}  // namespace runbox
