#include <gtest/gtest.h>
#include "cli/CommandLine.hpp"
#include "test_helpers.hpp"

namespace fs = std::filesystem;
using namespace ci::cli;
using ci::config::ConfigError;
using ci::test::TempDir;
using ci::test::writeFile;

TEST(CliTokenizeTest, ClassifiesArguments) {
    const auto toks = tokenize({"--exclude=*.log", "-j8", "-nv", "--dry-run", "src", "-", "--", "-weird"});
    const std::vector<Token> expected{
        {TokenType::Flag, "exclude"}, {TokenType::Value, "*.log"},
        {TokenType::Flag, "j"}, {TokenType::Value, "8"},
        {TokenType::Flag, "n"}, {TokenType::Flag, "v"},
        {TokenType::Flag, "dry-run"},
        {TokenType::Word, "src"}, {TokenType::Word, "-"}, {TokenType::Word, "--"}, {TokenType::Word, "-weird"},
    };
    EXPECT_EQ(toks, expected);
}

TEST(CliTokenizeTest, GluedShortValueDropsLeadingEquals) {
    const auto toks = tokenize({"-e=/tmp/x"});
    ASSERT_EQ(toks.size(), 2u);
    EXPECT_EQ(toks[1], (Token{TokenType::Value, "/tmp/x"}));
}

TEST(CliTokenizeTest, NegativeNumbersAreWords) {
    const std::vector<Token> expected{{TokenType::Word, "-5"}, {TokenType::Word, "-1.5"}};
    EXPECT_EQ(tokenize({"-5", "-1.5"}), expected);
}

TEST(CliParseTest, RepeatableAndLastWins) {
    const auto call = parseTokens(tokenize({"-e", "a", "--exclude", "b", "-j", "2", "--concurrency=5", "x", "y"}),
                                  optionSpec());
    EXPECT_EQ(call.values("exclude"), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(call.value("concurrency"), "5");
    EXPECT_EQ(call.positionals, (std::vector<std::string>{"x", "y"}));
    EXPECT_FALSE(call.has("dry-run"));
}

TEST(CliParseTest, RejectsMalformedOptions) {
    const auto& spec = optionSpec();
    EXPECT_THROW(parseTokens(tokenize({"--bogus"}), spec), UsageError);
    EXPECT_THROW(parseTokens(tokenize({"-z"}), spec), UsageError);
    EXPECT_THROW(parseTokens(tokenize({"--concurrency"}), spec), UsageError);
    EXPECT_THROW(parseTokens(tokenize({"--exclude", "--dry-run"}), spec), UsageError);
    EXPECT_THROW(parseTokens(tokenize({"--dry-run=yes"}), spec), UsageError);
    EXPECT_THROW(parseTokens(tokenize({"--report", "--", "x"}), spec), UsageError);
}

TEST(CliParseTest, DoubleDashEndsOptions) {
    const auto call = parseTokens(tokenize({"-n", "--", "--src", "-b"}), optionSpec());
    EXPECT_TRUE(call.has("dry-run"));
    EXPECT_EQ(call.positionals, (std::vector<std::string>{"--src", "-b"}));
}

TEST(CliCommandLineTest, MapsOptionsOntoConfig) {
    const auto inv = parseCommandLine({
        "--exclude", "*.log", "-e", "/abs/skip", "--dry-run", "-v", "--no-cleanup",
        "-j", "3", "--scan-workers", "2", "--backup-keep", "7",
        "--history-subdir", "old", "--log-dir", "/tmp/logs", "--report", "/tmp/r.json",
        "/src", "/backup"});

    EXPECT_FALSE(inv.help);
    const auto& cfg = inv.config;
    EXPECT_EQ(cfg.scan.search_root, fs::path("/src"));
    EXPECT_EQ(cfg.copy.backup_root, fs::path("/backup"));
    EXPECT_EQ(cfg.scan.excludes, (std::vector<std::string>{"*.log", "/abs/skip"}));
    EXPECT_TRUE(cfg.copy.dry_run);
    EXPECT_TRUE(cfg.verbose);
    EXPECT_FALSE(cfg.backup.cleanup_orphans);
    EXPECT_EQ(cfg.copy.concurrency, 3u);
    EXPECT_EQ(cfg.scan.workers, 2u);
    EXPECT_EQ(cfg.backup.keep, 7u);
    EXPECT_EQ(cfg.backup.history_subdir, "old");
    EXPECT_EQ(cfg.logging.log_dir, fs::path("/tmp/logs"));
    EXPECT_EQ(cfg.report_path, fs::path("/tmp/r.json"));
    EXPECT_FALSE(cfg.backup.history_dir);
}

TEST(CliCommandLineTest, HelpShortCircuits) {
    EXPECT_TRUE(parseCommandLine({"-h"}).help);
    EXPECT_TRUE(parseCommandLine({"--help", "only-one-positional"}).help);
    EXPECT_NE(usage("copy-ignore").find("--backup-keep"), std::string::npos);
}

TEST(CliCommandLineTest, RequiresBothRoots) {
    EXPECT_THROW(parseCommandLine({}), UsageError);
    EXPECT_THROW(parseCommandLine({"/src"}), UsageError);
    EXPECT_THROW(parseCommandLine({"/a", "/b", "/c"}), UsageError);
}

TEST(CliCommandLineTest, CountsMustBeNonNegativeIntegers) {
    EXPECT_THROW(parseCommandLine({"-j", "many", "/s", "/b"}), UsageError);
    EXPECT_THROW(parseCommandLine({"--backup-keep", "3x", "/s", "/b"}), UsageError);
    EXPECT_THROW(parseCommandLine({"--scan-workers=", "/s", "/b"}), UsageError);
    EXPECT_EQ(parseCommandLine({"--scan-workers", "0", "/s", "/b"}).config.scan.workers, 0u);
}

TEST(CliCommandLineTest, EmptyHistoryDirIsIgnored) {
    const auto inv = parseCommandLine({"--history-dir=", "/s", "/b"});
    EXPECT_FALSE(inv.config.backup.history_dir);

    const auto set = parseCommandLine({"--history-dir", "/h", "/s", "/b"});
    EXPECT_EQ(set.config.backup.history_dir, fs::path("/h"));
}

TEST(CliCommandLineTest, ConfigFileSuppliesDefaultsCommandLineOverrides) {
    TempDir dir{"ci-cli"};
    const auto file = dir / "cfg.yaml";
    writeFile(file, "scan:\n  search_root: /from/file\n  excludes: [\"*.tmp\"]\n"
                    "copy:\n  backup_root: /file/backup\n  concurrency: 9\n"
                    "backup:\n  keep: 4\n");

    const auto fromFile = parseCommandLine({"--config", file.string()});
    EXPECT_EQ(fromFile.config.scan.search_root, fs::path("/from/file"));
    EXPECT_EQ(fromFile.config.copy.concurrency, 9u);

    const auto overridden = parseCommandLine({"--config", file.string(), "-e", "*.log", "-j", "2", "/cli/src", "/cli/dst"});
    const auto& cfg = overridden.config;
    EXPECT_EQ(cfg.scan.search_root, fs::path("/cli/src"));
    EXPECT_EQ(cfg.copy.backup_root, fs::path("/cli/dst"));
    EXPECT_EQ(cfg.scan.excludes, (std::vector<std::string>{"*.tmp", "*.log"}));
    EXPECT_EQ(cfg.copy.concurrency, 2u);
    EXPECT_EQ(cfg.backup.keep, 4u);

    EXPECT_THROW(parseCommandLine({"--config", (dir / "missing.yaml").string()}), ConfigError);
}
