#include <filesystem>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "gtest/gtest.h"
#include "test/environment.hpp"
#include "workspace/workspace.hpp"

using namespace std;
using namespace runbox;
namespace fs = std::filesystem;

class WorkspaceManagerTest : public ::testing::Test {
protected:
    fs::path root;

    void SetUp() override {
        root = make_test_directory("workspace");
    }

    void TearDown() override {
        error_code ec;
        fs::remove_all(root, ec);
    }
};

TEST_F(WorkspaceManagerTest, AllocateCreatesPrivateEmptyDirectory) {
    workspace_manager manager(root);
    auto ws = manager.allocate("exec-1");
    EXPECT_EQ(ws.execution_id, "exec-1");
    EXPECT_EQ(ws.path.parent_path(), root);
    EXPECT_EQ(ws.path.filename().string().rfind("exec-1-", 0), 0);
    ASSERT_TRUE(fs::is_directory(ws.path));
    EXPECT_TRUE(fs::is_empty(ws.path));
    EXPECT_EQ(fs::status(ws.path).permissions(), fs::perms::owner_all);
}

TEST_F(WorkspaceManagerTest, SameIdGetsDistinctWorkspaces) {
    workspace_manager manager(root);
    auto a = manager.allocate("dup");
    auto b = manager.allocate("dup");
    EXPECT_NE(a.path, b.path);
    EXPECT_EQ(count_entries(root), 2);
}

TEST_F(WorkspaceManagerTest, WriteSourceFile) {
    workspace_manager manager(root);
    auto ws = manager.allocate("writer");
    auto path = manager.write(ws, "main.py", "print('hi')\n");
    EXPECT_EQ(path, ws.path / "main.py");
    EXPECT_EQ(read_file_content(path), "print('hi')\n");
}

TEST_F(WorkspaceManagerTest, RejectUnsafeFilenames) {
    workspace_manager manager(root);
    auto ws = manager.allocate("unsafe");
    for (const char *name : {"", ".", "..", "../escape.py", "dir/main.py", "/etc/passwd", "-o"})
        EXPECT_THROW(manager.write(ws, name, "x"), validation_error) << name;
    EXPECT_THROW(manager.write(ws, string("a\0b", 3), "x"), validation_error);
    EXPECT_TRUE(fs::is_empty(ws.path));
    EXPECT_FALSE(fs::exists(root / "escape.py"));
}

TEST_F(WorkspaceManagerTest, RejectMalformedExecutionId) {
    workspace_manager manager(root);
    EXPECT_THROW(manager.allocate(""), validation_error);
    EXPECT_THROW(manager.allocate("../x"), validation_error);
    EXPECT_THROW(manager.allocate("a b"), validation_error);
    EXPECT_THROW(manager.allocate(string(65, 'a')), validation_error);
    EXPECT_NO_THROW(manager.allocate(string(64, 'a')));
}

TEST_F(WorkspaceManagerTest, DestroyIsIdempotent) {
    workspace_manager manager(root);
    auto ws = manager.allocate("destroy");
    manager.write(ws, "main.c", "int main() {}");
    fs::create_directory(ws.path / "nested");
    manager.write(ws, "program", "binary");

    EXPECT_TRUE(manager.destroy(ws));
    EXPECT_FALSE(fs::exists(ws.path));
    EXPECT_FALSE(manager.destroy(ws));
    EXPECT_EQ(count_entries(root), 0);
}
