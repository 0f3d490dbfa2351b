#include <gtest/gtest.h>

#include "shell/Token.hpp"
#include "shell/Parser.hpp"
#include "shell/Router.hpp"
#include "shell/IO.hpp"
#include "shell/Table.hpp"
#include "shell/argsHelpers.hpp"
#include "commands/all.hpp"
#include "util/errors.hpp"

#include <sstream>

using namespace uc::shell;

TEST(TokenTest, SplitsFlagsAndWords) {
    const auto toks = tokenize({"create", "upd", "--md5", "-dt", "--config=/etc/uc.yaml", "dist.zip"});
    EXPECT_EQ(to_string(toks),
              "Word(create) Word(upd) Flag(md5) Flag(d) Flag(t) Flag(config) Word(/etc/uc.yaml) Word(dist.zip)");
}

TEST(TokenTest, GluedShortValueAndNegativeNumber) {
    const auto toks = tokenize({"cmd", "-c./conf.yaml", "-5"});
    EXPECT_EQ(to_string(toks), "Word(cmd) Flag(c) Word(./conf.yaml) Word(-5)");
}

TEST(TokenTest, LeadingHelpFlagIsACommandName) {
    const auto toks = tokenize({"--help"});
    ASSERT_EQ(toks.size(), 1u);
    EXPECT_EQ(toks[0].type, TokenType::Word);
}

TEST(TokenTest, EverythingAfterSentinelIsAWord) {
    const auto toks = tokenize({"create", "--", "-odd-dir", "--x"});
    EXPECT_EQ(to_string(toks), "Word(create) Word(--) Word(-odd-dir) Word(--x)");
}

TEST(ParserTest, SwitchesNeverSwallowPositionals) {
    const auto call = Router::parse({"create", "-d", "upd", "-m", "dist.zip"});
    EXPECT_EQ(call.name, "create");
    EXPECT_EQ(call.positionals, (std::vector<std::string>{"upd", "dist.zip"}));
    EXPECT_TRUE(hasFlag(call, "d"));
    EXPECT_TRUE(hasFlag(call, std::vector<std::string>{"m", "md5"}));
}

TEST(ParserTest, ValueFlagsTakeTheNextWord) {
    const auto call = Router::parse({"create", "--config", "uc.yaml", "upd", "dist.zip"});
    EXPECT_EQ(optVal(call, "config").value_or(""), "uc.yaml");
    EXPECT_EQ(call.positionals.size(), 2u);
    EXPECT_FALSE(hasFlag(call, "config"));
    EXPECT_TRUE(hasKey(call, "config"));
}

TEST(ParserTest, LastFlagWins) {
    const auto call = parseTokens(tokenize({"x", "--k", "a", "--k", "b"}));
    ASSERT_EQ(call.options.size(), 1u);
    EXPECT_EQ(optVal(call, "k").value_or(""), "b");
}

class RouterTest : public ::testing::Test {
protected:
    Router router;
    void SetUp() override { uc::commands::registerAllCommands(router); }
};

TEST_F(RouterTest, HelpAliasesResolve) {
    for (const auto* alias : {"help", "-h", "--help", "?"}) {
        const auto res = router.execute(Router::parse({alias}));
        EXPECT_EQ(res.exit_code, 0) << alias;
        EXPECT_NE(res.stdout_text.find("create"), std::string::npos) << alias;
    }
}

TEST_F(RouterTest, HelpForOneCommand) {
    const auto res = router.execute(Router::parse({"help", "create"}));
    EXPECT_EQ(res.exit_code, 0);
    EXPECT_NE(res.stdout_text.find("update-creator create <update_dir> <distribution>"), std::string::npos);
    EXPECT_NE(res.stdout_text.find("--md5 | -m"), std::string::npos);
}

TEST_F(RouterTest, VersionCommand) {
    const auto res = router.execute(Router::parse({"version"}));
    EXPECT_EQ(res.exit_code, 0);
    EXPECT_EQ(res.stdout_text.rfind("update-creator v", 0), 0u);
}

TEST_F(RouterTest, UnknownCommandIsUsageError) {
    const auto res = router.execute(Router::parse({"frobnicate"}));
    EXPECT_EQ(res.exit_code, 2);
    EXPECT_NE(res.stderr_text.find("frobnicate"), std::string::npos);
}

TEST_F(RouterTest, MissingCommandIsUsageError) {
    EXPECT_EQ(router.execute(Router::parse({})).exit_code, 2);
}

TEST_F(RouterTest, CreateChecksArgumentCount) {
    const auto res = router.execute(Router::parse({"create", "only-one"}));
    EXPECT_EQ(res.exit_code, 2);
    EXPECT_NE(res.stdout_text.find("Usage:"), std::string::npos);
}

TEST_F(RouterTest, UsageIsPlainUnlessColorIsOn) {
    const auto plain = router.execute(Router::parse({"help", "create"}));
    EXPECT_EQ(plain.stdout_text.find('\033'), std::string::npos);

    router.setColor(true);
    const auto colored = router.execute(Router::parse({"help", "create"}));
    EXPECT_NE(colored.stdout_text.find("\033[1;32mcreate"), std::string::npos);
    EXPECT_NE(colored.stdout_text.find("\033[1;36mUsage:"), std::string::npos);
}

TEST(ParserTest, FlagsMayPrecedeTheCommand) {
    const auto call = Router::parse({"--config", "uc.yaml", "-d", "create", "upd", "dist.zip"});
    EXPECT_EQ(call.name, "create");
    EXPECT_EQ(optVal(call, "config").value_or(""), "uc.yaml");
    EXPECT_TRUE(hasFlag(call, "d"));
    EXPECT_EQ(call.positionals, (std::vector<std::string>{"upd", "dist.zip"}));
}

TEST(TokenTest, LeadingFlagOtherThanHelpIsAFlag) {
    EXPECT_EQ(to_string(tokenize({"--config", "x.yaml", "create"})), "Flag(config) Word(x.yaml) Word(create)");
    EXPECT_EQ(to_string(tokenize({"-v"})), "Word(-v)");
}

TEST(PreferenceTest, TrimsFoldsAndDefaults) {
    EXPECT_EQ(parsePreference("  Y ", Preference::No), Preference::Yes);
    EXPECT_EQ(parsePreference("YES", Preference::No), Preference::Yes);
    EXPECT_EQ(parsePreference("n", Preference::Yes), Preference::No);
    EXPECT_EQ(parsePreference("R", Preference::No), Preference::Reenter);
    EXPECT_EQ(parsePreference("", Preference::Reenter), Preference::Reenter);
    EXPECT_EQ(parsePreference("   ", Preference::No), Preference::No);
    EXPECT_EQ(parsePreference("sure", Preference::No), Preference::Unknown);
}

TEST(TerminalIOTest, PromptReadsOneLine) {
    std::istringstream in("first\r\nsecond\n");
    std::ostringstream out;
    TerminalIO io(in, out);

    EXPECT_EQ(io.prompt("? "), "first");
    EXPECT_EQ(io.prompt("? "), "second");
    EXPECT_EQ(out.str(), "? ? ");
}

TEST(TerminalIOTest, ClosedInputThrows) {
    std::istringstream in("");
    std::ostringstream out;
    TerminalIO io(in, out);
    EXPECT_THROW(io.prompt("? "), uc::InputError);
}

TEST(TableTest, RendersHeaderRuleAndRows) {
    Table t({{"Index", Align::Right}, {"Matching Location"}});
    t.add_row({"1", "CARBON_HOME/bin/a.sh"});
    t.add_row({"10", "CARBON_HOME/lib/b.jar"});

    const auto out = t.render();
    EXPECT_EQ(out,
              "  Index  Matching Location    \n"
              "  -----  ---------------------\n"
              "      1  CARBON_HOME/bin/a.sh \n"
              "     10  CARBON_HOME/lib/b.jar\n");
}

TEST(TableTest, LongPathsAreEllipsizedInTheMiddle) {
    Table t({{"Index"}, {"Loc", Align::Left, 1, 12, true}});
    t.add_row({"1", "CARBON_HOME/very/long/path.xml"});

    const auto out = t.render();
    EXPECT_NE(out.find("CARB...h.xml"), std::string::npos);
}
