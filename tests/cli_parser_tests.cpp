#include "cli/cli_parser.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace e2e;

namespace {

CliParser parse(std::vector<std::string> args) {
    std::vector<char*> argv;
    static std::string prog = "e2e_extract";
    argv.push_back(prog.data());
    for (auto& a : args) argv.push_back(a.data());
    CliParser cli;
    cli.parse(static_cast<int>(argv.size()), argv.data());
    return cli;
}

} // namespace

TEST(CliParserTests, KeyValuePairsAndFlags) {
    const CliParser cli = parse({"--in", "scan.e2e", "--mode=faf", "--out", "dir", "--quiet"});
    EXPECT_EQ(cli.get("in"), "scan.e2e");
    EXPECT_EQ(cli.get("mode"), "faf");
    EXPECT_EQ(cli.get("out"), "dir");
    EXPECT_TRUE(cli.has("quiet"));
    EXPECT_EQ(cli.get("quiet"), "true");
    EXPECT_EQ(cli.get("format", "pgm"), "pgm");
}

TEST(CliParserTests, PositionalArguments) {
    const CliParser cli = parse({"scan.e2e", "--out", "dir", "extra"});
    ASSERT_EQ(cli.positional().size(), 2u);
    EXPECT_EQ(cli.positional()[0], "scan.e2e");
    EXPECT_EQ(cli.positional()[1], "extra");
    EXPECT_FALSE(cli.has("in"));
}
