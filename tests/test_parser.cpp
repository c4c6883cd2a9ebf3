#include <gtest/gtest.h>
#include "../src/provider.hpp"
#include "test_support.hpp"

#include <string>
#include <vector>

using Names = std::vector<std::string>;

class ParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_test_localization();
    }
};

TEST_F(ParserTest, DependsKeepsOnlyDependsAndPreDepends) {
    const std::string output =
        "bash\n"
        "  PreDepends: libc6\n"
        "  PreDepends: libtinfo6\n"
        "  Depends: base-files\n"
        "  Depends: debianutils\n"
        " |Recommends: bash-completion\n"
        "  Suggests: bash-doc\n"
        "  Conflicts: <bash-completion>\n"
        "  Replaces: bash-doc\n";

    EXPECT_EQ(parse_depends_output(output), (Names{"libc6", "libtinfo6", "base-files", "debianutils"}));
}

TEST_F(ParserTest, DependsSkipsAlternativeLines) {
    const std::string output =
        "mawk-user\n"
        " |Depends: gawk\n"
        "  Depends: mawk\n";
    EXPECT_EQ(parse_depends_output(output), (Names{"mawk"}));
}

TEST_F(ParserTest, VirtualPackageMarkersAreStripped) {
    const std::string output =
        "foo\n"
        "  Depends: <virtual-pkg>\n"
        "  PreDepends: <awk>\n";
    EXPECT_EQ(parse_depends_output(output), (Names{"virtual-pkg", "awk"}));
}

TEST_F(ParserTest, DependsTakesFirstTokenOnly) {
    const std::string output = "foo\n  Depends: libc6 (>= 2.36)\n  Depends:\tzlib1g  extra\n";
    EXPECT_EQ(parse_depends_output(output), (Names{"libc6", "zlib1g"}));
}

TEST_F(ParserTest, DependsSkipsMarkerWithoutName) {
    const std::string output = "foo\n  Depends:\n  Depends:   \n  Depends: <>\n  Depends: bar\n";
    EXPECT_EQ(parse_depends_output(output), (Names{"bar"}));
}

TEST_F(ParserTest, DependsKeepsDuplicatesInOrder) {
    const std::string output = "foo\n  Depends: b\n  Depends: a\n  Depends: b\n";
    EXPECT_EQ(parse_depends_output(output), (Names{"b", "a", "b"}));
}

TEST_F(ParserTest, DependsHandlesCarriageReturnsAndMissingNewline) {
    const std::string output = "foo\r\n  Depends: a\r\n  Depends: b";
    EXPECT_EQ(parse_depends_output(output), (Names{"a", "b"}));
}

TEST_F(ParserTest, DependsOnEmptyOutput) {
    EXPECT_TRUE(parse_depends_output("").empty());
    EXPECT_TRUE(parse_depends_output("foo\n").empty());
}

TEST_F(ParserTest, RdependsSkipsHeaderAndAlternatives) {
    const std::string output =
        "libc6\n"
        "Reverse Depends:\n"
        "  bash\n"
        " |mawk\n"
        "  coreutils\n"
        "\n"
        "  bash\n";
    EXPECT_EQ(parse_rdepends_output(output), (Names{"bash", "coreutils", "bash"}));
}

TEST_F(ParserTest, RdependsKeepsLinesVerbatim) {
    const std::string output = "x\nReverse Depends:\n  lib32-thing:i386\n  <weird>\n";
    EXPECT_EQ(parse_rdepends_output(output), (Names{"lib32-thing:i386", "<weird>"}));
}

TEST_F(ParserTest, RdependsWithOnlyHeader) {
    EXPECT_TRUE(parse_rdepends_output("x\nReverse Depends:\n").empty());
    EXPECT_TRUE(parse_rdepends_output("x\n").empty());
    EXPECT_TRUE(parse_rdepends_output("").empty());
}

TEST(NormalizeTest, TrimsAndStripsMarkers) {
    EXPECT_EQ(normalize_package_name("  <virtual-pkg>  "), "virtual-pkg");
    EXPECT_EQ(normalize_package_name("libc6"), "libc6");
    EXPECT_EQ(normalize_package_name("\tLibFoo\n"), "LibFoo");
    EXPECT_EQ(normalize_package_name("<<pkg>>"), "pkg");
    EXPECT_EQ(normalize_package_name("   "), "");
}
