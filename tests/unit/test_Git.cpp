#include <gtest/gtest.h>
#include "test_helpers.hpp"
#include "vcs/Git.hpp"

namespace fs = std::filesystem;
using namespace ci::vcs;
using ci::test::TempDir;
using ci::test::writeFile;

class GitTest : public ::testing::Test {
protected:
    TempDir root{"ci-git"};
    Git git;
};

TEST_F(GitTest, ControlDirectoryMarksRepository) {
    fs::create_directories(root / "repo/.git");
    EXPECT_TRUE(git.isRepositoryRoot(root / "repo"));
    EXPECT_FALSE(git.isRepositoryRoot(root.path()));
}

TEST_F(GitTest, LinkedWorktreeFileMarksRepository) {
    fs::create_directories(root / "main/.git/worktrees/feature");
    writeFile(root / "feature/.git", "gitdir: ../main/.git/worktrees/feature\n");
    writeFile(root / "absolute/.git", "gitdir: " + (root / "main/.git/worktrees/feature").string() + "\n");

    EXPECT_TRUE(git.isRepositoryRoot(root / "feature"));
    EXPECT_TRUE(git.isRepositoryRoot(root / "absolute"));
    EXPECT_EQ(Git::readGitdirFile(root / "feature"), (root / "main/.git/worktrees/feature").lexically_normal());
}

TEST_F(GitTest, BrokenMarkerFilesAreNotRepositories) {
    writeFile(root / "dangling/.git", "gitdir: /nonexistent/path/.git/worktrees/x\n");
    writeFile(root / "garbage/.git", "hello\n");
    writeFile(root / "empty/.git", "");

    EXPECT_FALSE(git.isRepositoryRoot(root / "dangling"));
    EXPECT_FALSE(git.isRepositoryRoot(root / "garbage"));
    EXPECT_FALSE(git.isRepositoryRoot(root / "empty"));
    EXPECT_FALSE(Git::readGitdirFile(root / "garbage").has_value());
}

TEST_F(GitTest, NulListIsSplitAndCleaned) {
    const std::string out = std::string("a.log") + '\0' + "dir/./b.tmp" + '\0' + '\0' + "." + '\0'
                            + "../escape" + '\0' + "vendor/" + '\0' + "x/../y.o";
    const std::vector<fs::path> expected{"a.log", "dir/b.tmp", "vendor", "y.o"};
    EXPECT_EQ(Git::parseNulList(out), expected);
    EXPECT_TRUE(Git::parseNulList("").empty());
}

TEST_F(GitTest, MissingExecutableIsAVcsError) {
    const Git broken("copy-ignore-no-such-git-binary");
    fs::create_directories(root / "repo/.git");
    EXPECT_THROW((void)broken.listIgnored(root / "repo"), VcsError);
    EXPECT_THROW((void)broken.isIgnored(root / "repo", root / "repo/x"), VcsError);
}
