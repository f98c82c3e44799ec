#include "common/python.hpp"
#include <glog/logging.h>
#include <mutex>

namespace runbox {

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

static std::once_flag python_init_flag;

void python_interpreter::initialize() {
    std::call_once(python_init_flag, [] {
        if (Py_IsInitialized()) return;
        // 不安装 Python 的信号处理器，SIGINT 由宿主程序处理
        Py_InitializeEx(0);
        LOG(INFO) << "Embedded Python " << Py_GetVersion() << " initialized";
        // 释放主线程的 GIL，该线程状态在进程生命周期内不再恢复
        PyEval_SaveThread();
    });
}

bool python_interpreter::initialized() {
    return Py_IsInitialized();
}

}  // namespace runbox
