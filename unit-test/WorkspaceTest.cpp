#include <unistd.h>
#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "engine/workspace.hpp"
#include "language/registry.hpp"

using namespace std;
using namespace std::filesystem;
using namespace runner;

class WorkspaceTest : public ::testing::Test {
protected:
    path root;

    void SetUp() override {
        root = temp_directory_path() / ("code-runner-workspace-test-" + to_string(getpid()));
        remove_all(root);
    }

    void TearDown() override {
        remove_all(root);
    }

    const language_spec &language(const string &name) {
        return language_registry::builtin().resolve(name);
    }
};

TEST_F(WorkspaceTest, SourceFileIsNamedMain) {
    workspace ws = workspace::acquire(root, language("python"), "print(1)\n");
    EXPECT_EQ(ws.source_name(), "main.py");
    EXPECT_EQ(ws.dir().parent_path(), root);
    EXPECT_TRUE(is_regular_file(ws.source_file()));
    EXPECT_EQ(read_file_content(ws.source_file()), "print(1)\n");
    EXPECT_TRUE(ws.main_class().empty());
}

TEST_F(WorkspaceTest, ReleaseIsIdempotent) {
    workspace ws = workspace::acquire(root, language("cpp"), "int main() {}\n");
    path dir = ws.dir();
    ASSERT_TRUE(is_directory(dir));

    ws.release();
    EXPECT_TRUE(ws.released());
    EXPECT_FALSE(exists(dir));

    EXPECT_NO_THROW(ws.release());
    EXPECT_FALSE(exists(dir));
}

TEST_F(WorkspaceTest, DestructorRemovesDirectory) {
    path dir;
    {
        workspace ws = workspace::acquire(root, language("python"), "print(1)\n");
        dir = ws.dir();
        ASSERT_TRUE(is_directory(dir));
    }
    EXPECT_FALSE(exists(dir));
}

TEST_F(WorkspaceTest, MoveTransfersOwnership) {
    workspace ws = workspace::acquire(root, language("python"), "print(1)\n");
    path dir = ws.dir();

    workspace moved(move(ws));
    EXPECT_TRUE(ws.released());
    EXPECT_FALSE(moved.released());
    ws.release();
    EXPECT_TRUE(is_directory(dir));

    moved.release();
    EXPECT_FALSE(exists(dir));
}

TEST_F(WorkspaceTest, DirectoriesAreUnique) {
    workspace a = workspace::acquire(root, language("python"), "print(1)\n");
    workspace b = workspace::acquire(root, language("python"), "print(2)\n");
    EXPECT_NE(a.dir(), b.dir());
}

TEST_F(WorkspaceTest, JavaSourceIsNamedAfterPublicType) {
    workspace ws = workspace::acquire(root, language("java"),
                                      "import java.util.*;\n"
                                      "class Helper {}\n"
                                      "public final class Solution {\n"
                                      "    public static void main(String[] args) {}\n"
                                      "}\n");
    EXPECT_EQ(ws.source_name(), "Solution.java");
    EXPECT_EQ(ws.main_class(), "Solution");
    EXPECT_TRUE(is_regular_file(ws.dir() / "Solution.java"));
}

TEST_F(WorkspaceTest, MissingPublicTypeFailsBeforeAnythingIsCreated) {
    EXPECT_THROW(workspace::acquire(root, language("java"), "class Main { public static void main(String[] a) {} }\n"),
                 no_public_type_found);
    EXPECT_FALSE(exists(root));
}

TEST_F(WorkspaceTest, FindPublicType) {
    EXPECT_EQ(find_public_type("public class Main {}", "java"), "Main");
    EXPECT_EQ(find_public_type("public abstract class Shape {}", "java"), "Shape");
    EXPECT_EQ(find_public_type("interface A {}\npublic interface B {}", "java"), "B");
    EXPECT_EQ(find_public_type("public record Point(int x, int y) {}", "java"), "Point");
    EXPECT_THROW(find_public_type("class Main {}", "java"), no_public_type_found);
}

TEST_F(WorkspaceTest, FindPublicTypeInLongSource) {
    EXPECT_EQ(find_public_type("public" + string(100000, ' ') + "class\n\n  Main {}", "java"), "Main");
    EXPECT_THROW(find_public_type("public final " + string(100000, 'A'), "java"), no_public_type_found);
}
