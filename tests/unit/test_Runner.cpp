#include <gtest/gtest.h>
#include "runtime/Runner.hpp"
#include "scan/Locator.hpp"
#include "test_helpers.hpp"

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using namespace ci;
using ci::test::FakeProvider;
using ci::test::TempDir;
using ci::test::writeFile;
using ci::test::readFile;

class RunnerTest : public ::testing::Test {
protected:
    TempDir search{"ci-run-src"};
    TempDir backup{"ci-run-dst"};
    FakeProvider provider;
    config::Config cfg;
    fs::path repo;

    void SetUp() override {
        repo = search / "work/app";
        writeFile(repo / "main.cpp", "tracked");
        writeFile(repo / "debug.log", "log");
        writeFile(repo / "temp.tmp", "tmp");
        writeFile(repo / "vendor/lib.a", "lib");
        writeFile(repo / "vendor/lib2.a", "lib2");
        provider.add(repo).ignoredFiles = {"debug.log", "temp.tmp", "vendor/lib.a", "vendor/lib2.a"};

        cfg = test::makeConfig(search.path(), backup.path());
        cfg.scan.excludes = {"*.log"};
    }
};

TEST_F(RunnerTest, MirrorsIgnoredFilesAndSkipsExcluded) {
    runtime::Runner runner(cfg, provider);
    const auto summary = runner.run();

    EXPECT_EQ(summary.repositories, 1u);
    EXPECT_EQ(summary.failed_repositories, 0u);
    EXPECT_EQ(summary.discovered, 2u);
    EXPECT_EQ(summary.copy.copied, 2u);
    EXPECT_EQ(summary.copy.errors, 0u);
    EXPECT_FALSE(summary.interrupted);

    EXPECT_EQ(readFile(backup / "work/app/temp.tmp"), "tmp");
    EXPECT_EQ(readFile(backup / "work/app/vendor/lib2.a"), "lib2");
    EXPECT_FALSE(fs::exists(backup / "work/app/debug.log"));
    EXPECT_FALSE(fs::exists(backup / "work/app/main.cpp"));
}

TEST_F(RunnerTest, SecondRunCopiesNothing) {
    {
        runtime::Runner first(cfg, provider);
        ASSERT_EQ(first.run().copy.copied, 2u);
    }

    cfg.timestamp = "20240101-130000";
    runtime::Runner second(cfg, provider);
    const auto summary = second.run();
    EXPECT_EQ(summary.copy.copied, 0u);
    EXPECT_EQ(summary.copy.skipped, 2u);
    EXPECT_EQ(summary.orphans_versioned, 0u);
    EXPECT_FALSE(fs::exists(cfg.historyRoot()));
}

TEST_F(RunnerTest, VanishedSourcesAreVersionedOut) {
    {
        runtime::Runner first(cfg, provider);
        (void)first.run();
    }

    fs::remove(repo / "temp.tmp");
    provider.add(repo).ignoredFiles = {"debug.log", "vendor/lib.a", "vendor/lib2.a"};
    cfg.timestamp = "20240101-130000";

    runtime::Runner second(cfg, provider);
    const auto summary = second.run();
    EXPECT_EQ(summary.orphans_versioned, 1u);
    EXPECT_FALSE(summary.cleanup_skipped);
    EXPECT_FALSE(fs::exists(backup / "work/app/temp.tmp"));
    EXPECT_EQ(readFile(cfg.historyRoot() / "work/app/temp.tmp"), "tmp");
    EXPECT_TRUE(fs::exists(backup / "work/app/vendor/lib.a"));
}

TEST_F(RunnerTest, FailedRepositorySkipsCleanup) {
    writeFile(backup / "work/app/orphan.o", "o");
    const auto broken = search / "work/broken";
    fs::create_directories(broken);
    provider.add(broken).failListing = true;

    runtime::Runner runner(cfg, provider);
    const auto summary = runner.run();

    EXPECT_EQ(summary.repositories, 2u);
    EXPECT_EQ(summary.failed_repositories, 1u);
    EXPECT_TRUE(summary.cleanup_skipped);
    EXPECT_EQ(summary.copy.copied, 2u);
    EXPECT_TRUE(fs::exists(backup / "work/app/orphan.o"));
}

TEST_F(RunnerTest, CleanupCanBeDisabled) {
    writeFile(backup / "work/app/orphan.o", "o");
    cfg.backup.cleanup_orphans = false;

    runtime::Runner runner(cfg, provider);
    const auto summary = runner.run();
    EXPECT_FALSE(summary.cleanup_skipped);
    EXPECT_EQ(summary.orphans_versioned, 0u);
    EXPECT_TRUE(fs::exists(backup / "work/app/orphan.o"));
}

TEST_F(RunnerTest, DryRunPlansAndWritesNothing) {
    writeFile(backup / "work/app/orphan.o", "o");
    cfg.copy.dry_run = true;

    runtime::Runner runner(cfg, provider);
    const auto summary = runner.run();

    EXPECT_TRUE(summary.dry_run);
    EXPECT_EQ(summary.copy.copied, 0u);
    EXPECT_EQ(summary.copy.total, 2u);

    auto planned = summary.planned;
    std::ranges::sort(planned);
    const std::vector<fs::path> expected{"work/app/temp.tmp", "work/app/vendor"};
    EXPECT_EQ(planned, expected);

    EXPECT_FALSE(fs::exists(backup / "work/app/temp.tmp"));
    EXPECT_TRUE(fs::exists(backup / "work/app/orphan.o"));
    EXPECT_FALSE(fs::exists(cfg.historyBase()));

    const auto j = runner.report(summary);
    EXPECT_EQ(j.at("planned").size(), 2u);
}

TEST_F(RunnerTest, BackupInsideSearchRootIsNotRescanned) {
    auto inner = test::makeConfig(search.path(), search / "backups");
    inner.scan.excludes = {"*.log"};
    writeFile(search / "backups/work/app/stale.o", "x");
    provider.add(search / "backups/work/app");

    runtime::Runner runner(inner, provider);
    const auto summary = runner.run();
    EXPECT_EQ(summary.repositories, 1u);
    EXPECT_EQ(summary.copy.copied, 2u);
}

TEST_F(RunnerTest, WritesJsonReport) {
    cfg.report_path = backup / "reports/run.json";

    runtime::Runner runner(cfg, provider);
    (void)runner.run();

    const auto j = nlohmann::json::parse(readFile(*cfg.report_path));
    EXPECT_EQ(j.at("repositories"), 1);
    EXPECT_EQ(j.at("discovered"), 2);
    EXPECT_EQ(j.at("copied"), 2);
    EXPECT_EQ(j.at("errors"), 0);
    EXPECT_EQ(j.at("timestamp"), cfg.timestamp);
    EXPECT_EQ(j.at("search_root"), search.path().string());
    EXPECT_EQ(j.at("config").at("keep"), 3);
    EXPECT_FALSE(j.contains("planned"));
}

TEST_F(RunnerTest, InterruptBeforeStartSkipsEverything) {
    writeFile(backup / "work/app/orphan.o", "o");

    runtime::Runner runner(cfg, provider);
    runner.interruptFlag()->store(true);
    const auto summary = runner.run();

    EXPECT_TRUE(summary.interrupted);
    EXPECT_TRUE(summary.cleanup_skipped);
    EXPECT_EQ(summary.copy.copied, 0u);
    EXPECT_TRUE(fs::exists(backup / "work/app/orphan.o"));
}

TEST_F(RunnerTest, StaticInterruptFlagIsUsedWithoutOwnership) {
    static std::atomic<bool> raised{false};
    raised = true;

    runtime::Runner runner(cfg, provider, std::shared_ptr<std::atomic<bool>>(std::shared_ptr<void>(), &raised));
    EXPECT_EQ(runner.interruptFlag().get(), &raised);

    const auto summary = runner.run();
    EXPECT_TRUE(summary.interrupted);
    EXPECT_EQ(summary.copy.copied, 0u);
    raised = false;
}

TEST_F(RunnerTest, UnreadableSearchRootIsATraversalError) {
    const auto root = search / "vanishing";
    fs::create_directories(root);
    auto local = test::makeConfig(root, backup.path());
    fs::remove(root);

    runtime::Runner runner(local, provider);
    EXPECT_THROW((void)runner.run(), scan::TraversalError);
}
