#include <gtest/gtest.h>
#include "../main/src/package_manager.hpp"
#include "../main/src/config.hpp"
#include "../main/src/exception.hpp"
#include "../main/src/localization.hpp"
#include "../main/src/utils.hpp"

#include <algorithm>
#include <filesystem>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

// Records every lifecycle step as "<step>:<name>" and can be told to fail one.
class FakeLifecycle : public ArchiveLifecycle {
public:
    std::vector<std::string> calls;
    std::set<std::string> failing_configure;

    fs::path fetch(const PackageMetadata& metadata) override {
        calls.push_back("fetch:" + metadata.name);
        return fs::path("/fake") / (metadata.name + ".tar.gz");
    }

    fs::path unpack(const PackageMetadata& metadata, const fs::path&) override {
        calls.push_back("unpack:" + metadata.name);
        return fs::path("/fake") / metadata.name;
    }

    void configure(const PackageMetadata& metadata, const fs::path&) override {
        calls.push_back("configure:" + metadata.name);
        if (failing_configure.contains(metadata.name)) {
            throw PmsException("configure failed for " + metadata.name);
        }
    }

    void deconfigure(const PackageMetadata& metadata) override {
        calls.push_back("deconfigure:" + metadata.name);
    }

    std::optional<PackageMetadata> installed_metadata(const std::string&) const override {
        return std::nullopt;
    }

    PackageMetadata inspect_archive(const fs::path& archive) override {
        throw PmsException("unexpected archive " + archive.string());
    }

    void cleanup(const PackageMetadata& metadata) override {
        calls.push_back("cleanup:" + metadata.name);
    }

    std::vector<std::string> steps(const std::string& step) const {
        std::vector<std::string> names;
        const std::string prefix = step + ":";
        for (const auto& call : calls) {
            if (call.starts_with(prefix)) names.push_back(call.substr(prefix.size()));
        }
        return names;
    }
};

class FakeRegistry : public PlatformRegistry {
public:
    std::map<std::string, PackageMetadata> entries;

    void publish(const PackageMetadata& metadata) override { entries[metadata.name] = metadata; }
    void unpublish(const std::string& name) override { entries.erase(name); }
    bool is_privileged() const override { return true; }

    std::vector<PackageMetadata> published() const override {
        std::vector<PackageMetadata> all;
        for (const auto& [name, m] : entries) all.push_back(m);
        return all;
    }
};

} // anonymous namespace

class PackageManagerTest : public ::testing::Test {
protected:
    fs::path test_root;
    RepositoryIndex index;
    std::unique_ptr<StatusLedger> ledger;
    FakeLifecycle lifecycle;
    FakeRegistry registry;

    void SetUp() override {
        set_non_interactive_mode(NonInteractiveMode::YES);
        set_quiet_mode(true);
        init_localization();

        test_root = fs::absolute("tmp_package_manager_test");
        if (fs::exists(test_root)) fs::remove_all(test_root);
        fs::create_directories(test_root);

        set_root_path(test_root.string());
        init_filesystem();
        ledger = std::make_unique<StatusLedger>(STATUS_FILE);
    }

    void TearDown() override {
        set_quiet_mode(false);
        set_non_interactive_mode(NonInteractiveMode::YES);
        set_root_path("/");
        if (fs::exists(test_root)) fs::remove_all(test_root);
    }

    void add(const std::string& name, const std::string& version, std::vector<std::string> dependencies = {}) {
        PackageMetadata m;
        m.name = name;
        m.version = version;
        m.maintainer = "pms team";
        m.description = name + " package";
        m.specification = "1.0.0";
        m.dependencies = std::move(dependencies);
        index.add(std::move(m));
    }

    void mark_installed(const std::string& name, const std::string& version) {
        ledger->record_transition(name, version, DesiredState::marked_for_install, CurrentState::installed, "2026-01-01T00:00:00");
    }

    PackageManager manager(bool assume_yes = true) {
        return PackageManager(index, *ledger, lifecycle, registry, {.assume_yes = assume_yes});
    }

    StatusRecord record_of(const std::string& name, const std::string& version) const {
        return ledger->status_of(name).at(version);
    }
};

TEST_F(PackageManagerTest, PlanInstallExcludesRootAndSatisfiedDependencies) {
    add("app", "1.0.0", {"lib", "util (>= 2.0)"});
    add("lib", "1.0.0");
    add("util", "2.5.0");
    mark_installed("lib", "1.0.0");

    const ResolutionPlan plan = manager().plan_install("app");
    EXPECT_FALSE(plan.contains("app"));
    EXPECT_EQ(plan.version_of("util").value_or(""), "2.5.0");
    EXPECT_EQ(plan.version_of("lib").value_or(""), "1.0.0");
    EXPECT_TRUE(lifecycle.calls.empty());
}

TEST_F(PackageManagerTest, InstallAppliesDependenciesFirst) {
    add("app", "1.0.0", {"mid"});
    add("mid", "1.0.0", {"base"});
    add("base", "1.0.0");

    manager().install_package("app");

    EXPECT_EQ(lifecycle.steps("configure"), (std::vector<std::string>{"base", "mid", "app"}));
    for (const std::string name : {"base", "mid", "app"}) {
        const StatusRecord record = record_of(name, "1.0.0");
        EXPECT_EQ(record.desired, DesiredState::marked_for_install) << name;
        EXPECT_EQ(record.current, CurrentState::installed) << name;
        EXPECT_TRUE(record.install_date.has_value()) << name;
        EXPECT_TRUE(registry.entries.contains(name)) << name;
    }
    EXPECT_EQ(lifecycle.steps("cleanup").size(), 3u);
}

TEST_F(PackageManagerTest, InstallingTheInstalledVersionIsANoOp) {
    add("app", "1.0.0");
    mark_installed("app", "1.0");

    manager().install_package("app", std::string("1.0.0"));
    EXPECT_TRUE(lifecycle.calls.empty());
    EXPECT_TRUE(registry.entries.empty());
}

TEST_F(PackageManagerTest, InstallingAnotherVersionReplacesTheInstalledOne) {
    add("app", "1.0.0");
    add("app", "2.0.0");
    mark_installed("app", "1.0.0");

    manager().install_package("app");

    EXPECT_EQ(lifecycle.steps("deconfigure"), std::vector<std::string>{"app"});
    EXPECT_EQ(ledger->installed_version("app"), "2.0.0");
    EXPECT_EQ(ledger->status_of("app").size(), 1u);
}

TEST_F(PackageManagerTest, DecliningDependenciesCancelsBeforeAnyChange) {
    add("app", "1.0.0", {"lib"});
    add("lib", "1.0.0");
    set_non_interactive_mode(NonInteractiveMode::NO);

    EXPECT_THROW(manager(false).install_package("app"), OperationCancelled);
    EXPECT_TRUE(lifecycle.calls.empty());
    EXPECT_FALSE(fs::exists(STATUS_FILE));
}

TEST_F(PackageManagerTest, AssumeYesSkipsThePrompt) {
    add("app", "1.0.0", {"lib"});
    add("lib", "1.0.0");
    set_non_interactive_mode(NonInteractiveMode::NO);

    EXPECT_NO_THROW(manager(true).install_package("app"));
    EXPECT_TRUE(ledger->is_installed("lib", "1.0.0"));
    EXPECT_TRUE(ledger->is_installed("app", "1.0.0"));
}

TEST_F(PackageManagerTest, FailedConfigureLeavesHalfInstalledTrail) {
    add("app", "1.0.0", {"lib"});
    add("lib", "1.0.0");
    lifecycle.failing_configure.insert("app");

    EXPECT_THROW(manager().install_package("app"), PmsException);

    EXPECT_TRUE(ledger->is_installed("lib", "1.0.0"));
    const StatusRecord record = record_of("app", "1.0.0");
    EXPECT_EQ(record.desired, DesiredState::marked_for_install);
    EXPECT_EQ(record.current, CurrentState::partially_installed);
    EXPECT_FALSE(registry.entries.contains("app"));
    EXPECT_TRUE(lifecycle.steps("cleanup") == std::vector<std::string>{"lib"});
}

TEST_F(PackageManagerTest, FailedDependencyStopsTheTransaction) {
    add("app", "1.0.0", {"a", "b"});
    add("a", "1.0.0");
    add("b", "1.0.0");
    lifecycle.failing_configure.insert("a");

    EXPECT_THROW(manager().install_package("app"), PmsException);
    EXPECT_TRUE(lifecycle.steps("fetch") == std::vector<std::string>{"a"});
    EXPECT_TRUE(ledger->status_of("b").empty());
    EXPECT_TRUE(ledger->status_of("app").empty());
}

TEST_F(PackageManagerTest, UnknownPackageFailsBeforeAnyLedgerWrite) {
    add("app", "1.0.0", {"ghost"});

    EXPECT_THROW(manager().install_package("nowhere"), UnknownPackage);
    EXPECT_THROW(manager().install_package("app"), UnknownPackage);
    EXPECT_FALSE(fs::exists(STATUS_FILE));
    EXPECT_TRUE(lifecycle.calls.empty());
}

TEST_F(PackageManagerTest, CircularDependencyFailsBeforeAnyLedgerWrite) {
    add("a", "1.0.0", {"b"});
    add("b", "1.0.0", {"a"});

    EXPECT_THROW(manager().install_package("a"), CircularDependency);
    EXPECT_FALSE(fs::exists(STATUS_FILE));
}

TEST_F(PackageManagerTest, RemoveNotInstalledThrows) {
    add("app", "1.0.0");
    EXPECT_THROW(manager().remove_package("app"), NotInstalled);
    EXPECT_TRUE(lifecycle.calls.empty());
}

TEST_F(PackageManagerTest, RemoveRecordsEveryStepAndStampsDate) {
    add("app", "1.0.0");
    mark_installed("app", "1.0.0");
    registry.entries["app"] = index.metadata_for("app");

    manager().remove_package("app", true);

    const StatusRecord record = record_of("app", "1.0.0");
    EXPECT_EQ(record.desired, DesiredState::unknown);
    EXPECT_EQ(record.current, CurrentState::not_installed);
    EXPECT_TRUE(record.remove_date.has_value());
    EXPECT_FALSE(record.install_date.has_value());
    EXPECT_TRUE(registry.entries.empty());
    EXPECT_EQ(lifecycle.steps("deconfigure"), std::vector<std::string>{"app"});
    EXPECT_FALSE(manager().is_installed("app"));
}

TEST_F(PackageManagerTest, RemoveTakesDependenciesAtTheirInstalledVersion) {
    add("app", "1.0.0", {"lib", "util"});
    add("lib", "1.0.0");
    add("util", "2.0.0");
    add("bystander", "1.0.0");
    mark_installed("app", "1.0.0");
    mark_installed("lib", "1.0.0");
    mark_installed("util", "1.5.0");
    mark_installed("bystander", "1.0.0");

    manager().remove_package("app");

    EXPECT_FALSE(ledger->is_installed("app"));
    EXPECT_FALSE(ledger->is_installed("lib"));
    EXPECT_FALSE(ledger->is_installed("util"));
    EXPECT_EQ(record_of("util", "1.5.0").current, CurrentState::not_installed);
    EXPECT_TRUE(ledger->is_installed("bystander", "1.0.0"));
}

TEST_F(PackageManagerTest, NewerPublishedDependencyDoesNotShieldInstalledOne) {
    add("app", "1.0.0", {"lib"});
    add("lib", "1.0.0");
    add("lib", "2.0.0");
    mark_installed("app", "1.0.0");
    mark_installed("lib", "1.0.0");

    manager().remove_package("app");

    EXPECT_FALSE(ledger->is_installed("lib"));
    EXPECT_EQ(lifecycle.steps("deconfigure"), (std::vector<std::string>{"lib", "app"}));
}

TEST_F(PackageManagerTest, RemoveSkipsDependenciesThatAreNotInstalled) {
    add("app", "1.0.0", {"lib"});
    add("lib", "1.0.0");
    mark_installed("app", "1.0.0");

    manager().remove_package("app");

    EXPECT_EQ(lifecycle.steps("deconfigure"), std::vector<std::string>{"app"});
    EXPECT_TRUE(ledger->status_of("lib").empty());
}

TEST_F(PackageManagerTest, RemoveWithoutIndexEntryStillRemovesThePackage) {
    mark_installed("orphan", "0.3");

    manager().remove_package("orphan");
    EXPECT_FALSE(ledger->is_installed("orphan"));
    EXPECT_EQ(lifecycle.steps("deconfigure"), std::vector<std::string>{"orphan"});
}

TEST_F(PackageManagerTest, DecliningRemovalKeepsEverything) {
    add("app", "1.0.0", {"lib"});
    add("lib", "1.0.0");
    mark_installed("app", "1.0.0");
    mark_installed("lib", "1.0.0");
    set_non_interactive_mode(NonInteractiveMode::NO);

    EXPECT_THROW(manager(false).remove_package("app"), OperationCancelled);
    EXPECT_TRUE(ledger->is_installed("app", "1.0.0"));
    EXPECT_TRUE(ledger->is_installed("lib", "1.0.0"));
}

TEST_F(PackageManagerTest, UpgradeMovesEveryPackageToItsLatest) {
    add("a", "1.0.0");
    add("a", "2.0.0");
    add("b", "2.0.0");
    add("b", "3.0.0");
    mark_installed("a", "1.0.0");
    mark_installed("b", "2.0.0");

    const auto result = manager().upgrade();
    EXPECT_EQ(result, (std::map<std::string, std::string>{{"a", "2.0.0"}, {"b", "3.0.0"}}));
    EXPECT_EQ(ledger->all_installed(), result);
}

TEST_F(PackageManagerTest, UpgradeLeavesCurrentAndUnknownPackagesAlone) {
    add("a", "2.0.0");
    mark_installed("a", "2.0.0");
    mark_installed("local-only", "0.1");

    const auto result = manager().upgrade();
    EXPECT_EQ(result, (std::map<std::string, std::string>{{"a", "2.0.0"}, {"local-only", "0.1"}}));
    EXPECT_TRUE(lifecycle.calls.empty());
}

TEST_F(PackageManagerTest, UnresolvableUpgradeKeepsTheInstalledVersion) {
    add("a", "1.0.0");
    add("a", "2.0.0", {"ghost (>= 9.0)"});
    mark_installed("a", "1.0.0");

    EXPECT_THROW(manager().upgrade(), UnknownPackage);

    EXPECT_TRUE(ledger->is_installed("a", "1.0.0"));
    EXPECT_TRUE(lifecycle.calls.empty());
    EXPECT_EQ(ledger->status_of("a").size(), 1u);
}

TEST_F(PackageManagerTest, UpgradeOfExplicitMapSkipsRemovalOfUnrecordedVersions) {
    add("a", "1.0.0");
    add("a", "2.0.0");

    const auto result = manager().upgrade(std::map<std::string, std::string>{{"a", "1.0.0"}});
    EXPECT_EQ(result.at("a"), "2.0.0");
    EXPECT_TRUE(lifecycle.steps("deconfigure").empty());
    EXPECT_TRUE(ledger->is_installed("a", "2.0.0"));
}

TEST_F(PackageManagerTest, StatusReportsWhetherPackageWasSeen) {
    add("app", "1.0.0");
    EXPECT_FALSE(manager().status("app"));

    mark_installed("app", "1.0.0");
    EXPECT_TRUE(manager().status("app"));
}

TEST_F(PackageManagerTest, ListAndSearch) {
    add("editor", "1.0.0");
    add("libtext", "2.0.0");
    registry.entries["editor"] = index.metadata_for("editor");

    const auto listed = manager().list(true);
    ASSERT_EQ(listed.size(), 1u);
    EXPECT_EQ(listed[0].name, "editor");

    const auto found = manager().search("^lib", true);
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].name, "libtext");
}

TEST_F(PackageManagerTest, CleanEmptiesTempAndDropsCache) {
    write_file_atomic(TEMP_DIR / "leftover.tar.gz", "x");
    write_file_atomic(REPO_CACHE_FILE, "{}");

    manager().clean();
    EXPECT_TRUE(fs::exists(TEMP_DIR));
    EXPECT_TRUE(fs::is_empty(TEMP_DIR));
    EXPECT_FALSE(fs::exists(REPO_CACHE_FILE));
}
