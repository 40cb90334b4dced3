#include <gtest/gtest.h>

#include "warden/utils/string_utils.hpp"
#include "warden/utils/hash_utils.hpp"
#include "warden/utils/time_utils.hpp"

using namespace warden::utils;

TEST(StringUtilsTest, SplitTrimsAndDropsEmpty) {
    auto parts = StringUtils::Split(" email, sms ,,push ", ',');
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], "email");
    EXPECT_EQ(parts[1], "sms");
    EXPECT_EQ(parts[2], "push");
}

TEST(StringUtilsTest, SecurityKeywords) {
    EXPECT_TRUE(StringUtils::ContainsSecurityKeyword("DATA_EXPORT"));
    EXPECT_TRUE(StringUtils::ContainsSecurityKeyword("session_refresh"));
    EXPECT_FALSE(StringUtils::ContainsSecurityKeyword("UPDATE_INVOICE"));
}

TEST(StringUtilsTest, TitleFromIdentifier) {
    EXPECT_EQ(StringUtils::ToTitle("coordinated_attack"), "COORDINATED ATTACK");
    EXPECT_EQ(StringUtils::ToTitle("brute_force_advanced"), "BRUTE FORCE ADVANCED");
    EXPECT_EQ(StringUtils::ToTitle(""), "");
}

TEST(HashUtilsTest, Sha256KnownVector) {
    EXPECT_EQ(HashUtils::ComputeSHA256("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(HashUtilsTest, FingerprintIsPrefix) {
    EXPECT_EQ(HashUtils::Fingerprint("abc"), "ba7816bf8f01cfea");
}

TEST(TimeUtilsTest, FormatsAndParsesIsoTimestamps) {
    auto when = TimeUtils::FromEpochMillis(1740823200123LL);
    EXPECT_EQ(TimeUtils::FormatTimestamp(when), "2025-03-01T10:00:00.123Z");

    auto parsed = TimeUtils::ParseTimestamp("2025-03-01T10:00:00.123Z");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(TimeUtils::ToEpochMillis(*parsed), 1740823200123LL);

    EXPECT_FALSE(TimeUtils::ParseTimestamp("yesterday").has_value());
}
