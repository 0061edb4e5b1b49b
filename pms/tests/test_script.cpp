#include <gtest/gtest.h>
#include "../main/src/script.hpp"
#include "../main/src/config.hpp"
#include "../main/src/localization.hpp"
#include "../main/src/utils.hpp"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class ScriptTest : public ::testing::Test {
protected:
    fs::path test_root;
    fs::path script_dir;

    void SetUp() override {
        set_quiet_mode(true);
        init_localization();
        test_root = fs::absolute("tmp_script_test");
        script_dir = test_root / "scripts";
        if (fs::exists(test_root)) fs::remove_all(test_root);
        fs::create_directories(script_dir);
        set_root_path(test_root.string());
    }

    void TearDown() override {
        set_quiet_mode(false);
        set_root_path("/");
        if (fs::exists(test_root)) fs::remove_all(test_root);
    }

    void write_script(const std::string& name, const std::string& body) {
        std::ofstream f(script_dir / name);
        f << body;
    }
};

TEST_F(ScriptTest, MissingScriptSucceeds) {
    EXPECT_TRUE(find_lifecycle_script(script_dir / "postinst").empty());
    EXPECT_TRUE(run_lifecycle_script(script_dir / "postinst"));
}

TEST_F(ScriptTest, ShellScriptPrefersShOverPy) {
    write_script("install.sh", "exit 0\n");
    write_script("install.py", "raise SystemExit(1)\n");
    EXPECT_EQ(find_lifecycle_script(script_dir / "install"), script_dir / "install.sh");
    EXPECT_TRUE(run_lifecycle_script(script_dir / "install"));
}

TEST_F(ScriptTest, NonZeroExitFails) {
    write_script("remove.sh", "exit 4\n");
    EXPECT_FALSE(run_lifecycle_script(script_dir / "remove"));
}

TEST_F(ScriptTest, RunsInScriptDirectoryWithRootExported) {
    write_script("postinst.sh", "pwd > \"$PMS_ROOT/cwd.txt\"\n");
    ASSERT_TRUE(run_lifecycle_script(script_dir / "postinst"));

    std::string cwd = read_file(test_root / "cwd.txt");
    while (!cwd.empty() && cwd.back() == '\n') cwd.pop_back();
    EXPECT_TRUE(fs::equivalent(cwd, script_dir));
}
