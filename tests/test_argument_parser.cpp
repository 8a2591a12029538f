#include "core/ArgumentParser.h"
#include "core/Config.h"
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <sstream>
#include <string>
#include <vector>

using ::testing::ElementsAre;
using ::testing::HasSubstr;

namespace hostdiag {

class ArgumentParserTest : public ::testing::Test {
protected:
    bool parse(std::vector<const char*> args) {
        args.insert(args.begin(), "hostdiag");
        return parser.parse(static_cast<int>(args.size()), const_cast<char**>(args.data()), cfg);
    }

    ArgumentParser parser;
    Config cfg;
};

TEST_F(ArgumentParserTest, ParseRunSubcommand) {
    EXPECT_TRUE(parse({"run", "--only-domains=net,os", "--concurrency=4"}));
    EXPECT_EQ(cfg.subcommand, "run");
    EXPECT_EQ(cfg.options.global("onlydomains"), "net,os");
    EXPECT_EQ(cfg.options.global("concurrency"), "4");
}

TEST_F(ArgumentParserTest, TypedFlags) {
    EXPECT_TRUE(parse({"run", "--output", "report.json", "--workdir=/tmp/hd", "--module-dir", "/opt/hd",
                       "--config-file=/etc/hd.ini", "--debug"}));
    EXPECT_EQ(cfg.output_file, "report.json");
    EXPECT_EQ(cfg.workdir, "/tmp/hd");
    EXPECT_EQ(cfg.module_root, "/opt/hd");
    EXPECT_EQ(cfg.config_file, "/etc/hd.ini");
    EXPECT_TRUE(cfg.debug);
    EXPECT_FALSE(cfg.options.has_global("output"));
}

TEST_F(ArgumentParserTest, MissingValueForTypedFlag) {
    EXPECT_FALSE(parse({"run", "--output"}));
    EXPECT_EQ(parser.error(), "Missing value for --output");
}

TEST_F(ArgumentParserTest, BareFlagsBecomeTrue) {
    EXPECT_TRUE(parse({"run", "--not-an-instance", "--perf_impact"}));
    EXPECT_EQ(cfg.options.global("notaninstance"), "True");
    EXPECT_EQ(cfg.options.global("perfimpact"), "True");
}

TEST_F(ArgumentParserTest, NoExcludesModule) {
    EXPECT_TRUE(parse({"run", "--no=arpcache", "--no", "mtu"}));
    EXPECT_EQ(cfg.options.global("arpcache"), "False");
    EXPECT_EQ(cfg.options.global("mtu"), "False");
}

TEST_F(ArgumentParserTest, BarePositionalArgument) {
    EXPECT_TRUE(parse({"run", "mtu"}));
    EXPECT_TRUE(cfg.options.has_global("mtu"));
    EXPECT_EQ(cfg.options.global("mtu", "unset"), "");
}

TEST_F(ArgumentParserTest, HelpTargets) {
    EXPECT_TRUE(parse({"help", "arpcache", "run"}));
    EXPECT_EQ(cfg.subcommand, "help");
    EXPECT_THAT(cfg.help_targets, ElementsAre("arpcache", "run"));
}

TEST_F(ArgumentParserTest, InvalidSubcommand) {
    EXPECT_FALSE(parse({"launch"}));
    EXPECT_EQ(parser.error(), "Invalid Subcommand 'launch'.  Valid subcommands are: run, list, help, version.");
}

TEST_F(ArgumentParserTest, InvalidOption) {
    EXPECT_FALSE(parse({"run", "-x"}));
    EXPECT_THAT(parser.error(), HasSubstr("Invalid Command line option '-x'"));
    Config other;
    ArgumentParser p2;
    const char* argv[] = {"hostdiag", "run", "--"};
    EXPECT_FALSE(p2.parse(3, const_cast<char**>(argv), other));
}

TEST_F(ArgumentParserTest, HelpAndVersionExitEarly) {
    EXPECT_FALSE(parse({"--help"}));
    EXPECT_TRUE(parser.error().empty());
    ArgumentParser p2;
    Config c2;
    const char* argv[] = {"hostdiag", "--version"};
    EXPECT_FALSE(p2.parse(2, const_cast<char**>(argv), c2));
    EXPECT_TRUE(p2.error().empty());
}

TEST_F(ArgumentParserTest, NoArguments) {
    EXPECT_TRUE(parse({}));
    EXPECT_TRUE(cfg.subcommand.empty());
}

TEST_F(ArgumentParserTest, UsageListsFlags) {
    std::ostringstream os;
    ArgumentParser::print_usage(os);
    EXPECT_THAT(os.str(), HasSubstr("usage: hostdiag"));
    EXPECT_THAT(os.str(), HasSubstr("--only-modules"));
    EXPECT_THAT(os.str(), HasSubstr("--module-timeout"));
    EXPECT_THAT(ArgumentParser::subcommands(), ElementsAre("run", "list", "help", "version"));
}

} // namespace hostdiag

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
