#include <gtest/gtest.h>
#include "setup_core/Version.hpp"

using namespace setupcore;

static PackedVersion mustParse(const std::string& s)
{
    PackedVersion v;
    Error err;
    EXPECT_TRUE(parseVersion(s, v, &err)) << s << ": " << err.message;
    return v;
}

static ErrorKind parseErrorOf(const std::string& s)
{
    PackedVersion v;
    Error err;
    EXPECT_FALSE(parseVersion(s, v, &err)) << s;
    return err.kind;
}

TEST(VersionTest, PacksComponentsHighToLow) {
    EXPECT_EQ(mustParse("1.2.10").value, 0x0001'0002'000A'0000ull);
    EXPECT_EQ(mustParse("65535.0.0.1").value, 0xFFFF'0000'0000'0001ull);
}

TEST(VersionTest, MissingComponentsAreZero) {
    EXPECT_EQ(compareVersions(mustParse("1.2"), mustParse("1.2.0.0")), 0);
    EXPECT_EQ(compareVersions(mustParse("3"), mustParse("3.0")), 0);
}

TEST(VersionTest, ComparesNumericallyNotLexically) {
    EXPECT_EQ(compareVersions(mustParse("1.10"), mustParse("1.9")), 1);
    EXPECT_EQ(compareVersions(mustParse("0.16.2"), mustParse("0.17.0")), -1);
    EXPECT_EQ(compareVersions(mustParse("2.0"), mustParse("1.65535.65535.65535")), 1);
}

TEST(VersionTest, RejectsMalformedStrings) {
    EXPECT_EQ(parseErrorOf(""), ErrorKind::VersionParseError);
    EXPECT_EQ(parseErrorOf("1..2"), ErrorKind::VersionParseError);
    EXPECT_EQ(parseErrorOf("1.2."), ErrorKind::VersionParseError);
    EXPECT_EQ(parseErrorOf(".1"), ErrorKind::VersionParseError);
    EXPECT_EQ(parseErrorOf("1.2b"), ErrorKind::VersionParseError);
    EXPECT_EQ(parseErrorOf("-1.0"), ErrorKind::VersionParseError);
    EXPECT_EQ(parseErrorOf("v1.0"), ErrorKind::VersionParseError);
}

TEST(VersionTest, RejectsOverflowInsteadOfTruncating) {
    EXPECT_EQ(parseErrorOf("65536.0"), ErrorKind::VersionParseError);
    EXPECT_EQ(parseErrorOf("1.99999999999"), ErrorKind::VersionParseError);
    EXPECT_EQ(parseErrorOf("1.2.3.4.5"), ErrorKind::VersionParseError);
}

TEST(VersionTest, ToStringShowsAllComponents) {
    EXPECT_EQ(toString(mustParse("0.17.2")), "0.17.2.0");
}
