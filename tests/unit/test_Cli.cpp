#include "cli/Router.hpp"
#include "cli/Parser.hpp"
#include "cli/Token.hpp"
#include "cli/commands.hpp"
#include "error/Error.hpp"

#include <gtest/gtest.h>

using namespace fm;
using namespace fm::cli;

TEST(TokenizerTest, SplitsFlagsValuesAndWords) {
    const auto toks = tokenize({"sync", "--cache=/tmp/c.json", "-cX", "--enable_deep_scan", "-1.5", "--", "--literal"});
    EXPECT_EQ(to_string(toks),
              "Word(sync) Flag(cache) Word(/tmp/c.json) Flag(c) Word(X) Flag(enable-deep-scan) Word(-1.5) "
              "Word(--) Word(--literal)");
}

TEST(ParserTest, BooleanFlagsNeverSwallowPositionals) {
    const auto call = parseTokens(tokenize({"sync", "--dry-run", "src", "dst"}), {"dry-run"});
    EXPECT_EQ(call.name, "sync");
    EXPECT_TRUE(call.has("dry-run"));
    EXPECT_FALSE(call.value("dry-run"));
    EXPECT_EQ(call.positionals, (std::vector<std::string>{"src", "dst"}));
}

TEST(ParserTest, LastOccurrenceWins) {
    const auto call = parseTokens(tokenize({"duplicates", "-p", "a", "--path", "b"}), {});
    EXPECT_EQ(call.value("p"), "a");
    EXPECT_EQ(call.value("path"), "b");
}

class RouterTest : public ::testing::Test {
protected:
    Router router;
    void SetUp() override { registerAllCommands(router); }
};

TEST_F(RouterTest, CanonicalizesAliasesAndUnderscores) {
    const auto call = router.parse({"sync", "SRC", "DST", "-c", "/tmp/x.json", "--enable_deep_scan", "--dry_run"});
    EXPECT_EQ(call.name, "sync");
    EXPECT_EQ(call.positionals, (std::vector<std::string>{"SRC", "DST"}));
    EXPECT_EQ(call.value("cache"), "/tmp/x.json");
    EXPECT_TRUE(call.has("enable-deep-scan"));
    EXPECT_TRUE(call.has("dry-run"));
}

TEST_F(RouterTest, DuplicatesOptions) {
    const auto call = router.parse({"duplicates", "--input-json=r.json", "-d", "--dry-run", "-o", "out.json"});
    EXPECT_EQ(call.value("input-json"), "r.json");
    EXPECT_EQ(call.value("output-json"), "out.json");
    EXPECT_TRUE(call.has("delete"));
    EXPECT_TRUE(call.has("dry-run"));
    EXPECT_TRUE(call.positionals.empty());
}

TEST_F(RouterTest, GlobalConfigOptionIsAcceptedAnywhere) {
    const auto call = router.parse({"--config", "/etc/fm.yaml", "duplicates", "-p", "."});
    EXPECT_EQ(call.name, "duplicates");
    EXPECT_EQ(call.value("config"), "/etc/fm.yaml");
    EXPECT_EQ(call.value("path"), ".");
}

TEST_F(RouterTest, UsageErrorsAreConfigErrors) {
    EXPECT_THROW(router.parse({"frobnicate"}), error::ConfigError);
    EXPECT_THROW(router.parse({"sync", "only-one"}), error::ConfigError);
    EXPECT_THROW(router.parse({"sync", "a", "b", "c"}), error::ConfigError);
    EXPECT_THROW(router.parse({"sync", "a", "b", "--bogus"}), error::ConfigError);
    EXPECT_THROW(router.parse({"duplicates", "--path"}), error::ConfigError);
}

TEST_F(RouterTest, HelpNeedsNoArguments) {
    EXPECT_TRUE(Router::isHelp(router.parse({})));
    EXPECT_TRUE(Router::isHelp(router.parse({"help"})));
    EXPECT_TRUE(Router::isHelp(router.parse({"sync", "--help"})));
    EXPECT_TRUE(Router::isHelp(router.parse({"duplicates", "-h"})));

    const auto top = router.execute(router.parse({"help"}));
    EXPECT_EQ(top.exit_code, EXIT_OK);
    EXPECT_NE(top.stdout_text.find("duplicates"), std::string::npos);
    EXPECT_NE(top.stdout_text.find("sync"), std::string::npos);

    const auto sync = router.execute(router.parse({"help", "sync"}));
    EXPECT_NE(sync.stdout_text.find("--enable-deep-scan"), std::string::npos);
    EXPECT_NE(sync.stdout_text.find("SOURCE"), std::string::npos);
}
