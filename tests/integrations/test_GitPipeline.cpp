#include <gtest/gtest.h>
#include "runtime/Runner.hpp"
#include "test_helpers.hpp"
#include "util/process.hpp"
#include "vcs/Git.hpp"

namespace fs = std::filesystem;
using namespace ci;
using ci::test::TempDir;
using ci::test::writeFile;
using ci::test::readFile;

class GitPipelineTest : public ::testing::Test {
protected:
    TempDir search{"ci-it-src"};
    TempDir backup{"ci-it-dst"};
    vcs::Git git;
    fs::path repo;

    void SetUp() override {
        if (!util::onPath("git")) GTEST_SKIP() << "git is not installed";

        repo = search / "projects/app";
        fs::create_directories(repo);
        runGit(repo, {"init", "-q"});

        writeFile(repo / ".gitignore", "*.log\n*.tmp\nvendor/\n");
        writeFile(repo / "main.cpp", "int main() {}\n");
        writeFile(repo / "debug.log", "log");
        writeFile(repo / "temp.tmp", "tmp");
        writeFile(repo / "vendor/lib.a", "lib");
        writeFile(repo / "vendor/lib2.a", "lib2");
    }

    static void runGit(const fs::path& dir, std::vector<std::string> args) {
        std::vector<std::string> argv{"git", "-C", dir.string(),
                                      "-c", "user.email=ci@example.invalid", "-c", "user.name=copy-ignore tests",
                                      "-c", "init.defaultBranch=main", "-c", "commit.gpgsign=false"};
        argv.insert(argv.end(), args.begin(), args.end());
        const auto res = util::execCapture(argv);
        ASSERT_TRUE(res.ok()) << "git " << args.front() << " failed: " << res.stderr_text;
    }

    config::Config makeConfig(const std::string& stamp) const {
        auto cfg = test::makeConfig(search.path(), backup.path());
        cfg.scan.excludes = {"*.log"};
        cfg.timestamp = stamp;
        return cfg;
    }
};

TEST_F(GitPipelineTest, BacksUpIgnoredFilesOnly) {
    const auto cfg = makeConfig("20240101-120000");
    runtime::Runner runner(cfg, git);
    const auto summary = runner.run();

    EXPECT_EQ(summary.repositories, 1u);
    EXPECT_EQ(summary.failed_repositories, 0u);
    EXPECT_EQ(summary.copy.errors, 0u);

    EXPECT_EQ(readFile(backup / "projects/app/temp.tmp"), "tmp");
    EXPECT_EQ(readFile(backup / "projects/app/vendor/lib.a"), "lib");
    EXPECT_EQ(readFile(backup / "projects/app/vendor/lib2.a"), "lib2");
    EXPECT_FALSE(fs::exists(backup / "projects/app/debug.log"));
    EXPECT_FALSE(fs::exists(backup / "projects/app/main.cpp"));
    EXPECT_FALSE(fs::exists(backup / "projects/app/.gitignore"));
    EXPECT_FALSE(fs::exists(backup / "projects/app/.git"));
}

TEST_F(GitPipelineTest, SecondRunIsIncremental) {
    {
        const auto cfg = makeConfig("20240101-120000");
        runtime::Runner first(cfg, git);
        ASSERT_GT(first.run().copy.copied, 0u);
    }

    const auto cfg = makeConfig("20240101-130000");
    runtime::Runner second(cfg, git);
    const auto summary = second.run();
    EXPECT_EQ(summary.copy.copied, 0u);
    EXPECT_EQ(summary.copy.errors, 0u);
    EXPECT_EQ(summary.orphans_versioned, 0u);
}

TEST_F(GitPipelineTest, ChangedSourceKeepsOldVersion) {
    {
        const auto cfg = makeConfig("20240101-120000");
        runtime::Runner first(cfg, git);
        (void)first.run();
    }

    writeFile(repo / "temp.tmp", "tmp v2");
    fs::last_write_time(repo / "temp.tmp", fs::file_time_type::clock::now() + std::chrono::hours(1));

    const auto cfg = makeConfig("20240101-130000");
    runtime::Runner second(cfg, git);
    const auto summary = second.run();

    EXPECT_EQ(summary.copy.copied, 1u);
    EXPECT_EQ(readFile(backup / "projects/app/temp.tmp"), "tmp v2");
    EXPECT_EQ(readFile(cfg.historyRoot() / "projects/app/temp.tmp"), "tmp");
}

TEST_F(GitPipelineTest, LinkedWorktreeIsScanned) {
    runGit(repo, {"add", ".gitignore", "main.cpp"});
    runGit(repo, {"commit", "-q", "-m", "initial"});
    runGit(repo, {"worktree", "add", "-q", (search / "projects/app-feature").string()});
    writeFile(search / "projects/app-feature/feature.tmp", "feature");

    EXPECT_TRUE(git.isRepositoryRoot(search / "projects/app-feature"));

    const auto cfg = makeConfig("20240101-120000");
    runtime::Runner runner(cfg, git);
    const auto summary = runner.run();

    EXPECT_EQ(summary.repositories, 2u);
    EXPECT_EQ(readFile(backup / "projects/app-feature/feature.tmp"), "feature");
    EXPECT_EQ(readFile(backup / "projects/app/temp.tmp"), "tmp");
}
