#include "workspace/workspace.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <random>
#include <system_error>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace runbox {
using namespace std;
namespace fs = std::filesystem;

workspace_manager::workspace_manager(fs::path root)
    : root_dir(move(root)) {
    fs::create_directories(root_dir);
    fs::permissions(root_dir, fs::perms::owner_all, fs::perm_options::replace);
}

static string random_suffix() {
    thread_local mt19937_64 engine(random_device{}());
    return fmt::format("{:012x}", engine() & 0xffffffffffffULL);
}

workspace workspace_manager::allocate(const string &execution_id) {
    if (!is_safe_identifier(execution_id))
        throw validation_error("execution id is malformed: " + execution_id);

    // 目录名带有随机后缀，即使调用方重复使用执行 id，也不会拿到同一个目录
    for (int attempt = 0; attempt < 8; ++attempt) {
        fs::path path = root_dir / (execution_id + "-" + random_suffix());
        error_code ec;
        if (fs::create_directory(path, ec)) {
            fs::permissions(path, fs::perms::owner_all, fs::perm_options::replace, ec);
            if (ec)
                LOG(WARNING) << "Unable to restrict permissions of workspace " << path << ": " << ec.message();
            return workspace{path, execution_id, chrono::system_clock::now()};
        }
        if (ec)
            throw internal_error(fmt::format("unable to create workspace {}: {}", path.string(), ec.message()));
    }
    throw internal_error("unable to allocate a unique workspace for " + execution_id);
}

fs::path workspace_manager::write(const workspace &ws, const string &filename, const string &content) {
    fs::path path = ws.path / assert_safe_path(filename);
    write_file_content(path, content);
    return path;
}

bool workspace_manager::destroy(const workspace &ws) noexcept {
    error_code ec;
    auto removed = fs::remove_all(ws.path, ec);
    if (ec) {
        LOG(ERROR) << "Unable to remove workspace " << ws.path << " of execution " << ws.execution_id << ": " << ec.message();
        return false;
    }
    if (removed == 0 || removed == static_cast<uintmax_t>(-1)) return false;
    LOG(INFO) << "Removed workspace " << ws.path << " of execution " << ws.execution_id;
    return true;
}

const fs::path &workspace_manager::root() const {
    return root_dir;
}

}  // namespace runbox
