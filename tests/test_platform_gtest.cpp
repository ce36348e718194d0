// ==============================================================================
// test_platform_gtest.cpp - Тесты платформенного модуля (GoogleTest)
// ==============================================================================
//
// Пути UTF-8, окружение, UUID и время ISO-8601.
//
// ==============================================================================

#include "budgetaudit/platform.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <gtest/gtest.h>
#include <regex>
#include <set>
#include <string>

namespace budgetaudit::platform::test {

// ==============================================================================
// Пути
// ==============================================================================

TEST(PlatformTest, PathConversion_Roundtrip) {
    std::string original = "rules/budget_v3_3.yml";

    std::filesystem::path p = path_from_utf8(original);

    EXPECT_EQ(path_to_utf8(p), original);
}

TEST(PlatformTest, PathToUtf8_EmptyPath) {
    EXPECT_TRUE(path_to_utf8(std::filesystem::path()).empty());
}

TEST(PlatformTest, PathFromUtf8_EmptyString) {
    EXPECT_TRUE(path_from_utf8("").empty());
}

TEST(PlatformTest, PathConversion_RoundtripWithChinese) {
    std::string original = "文档/部门决算_2024.json";

    std::string roundtrip = path_to_utf8(path_from_utf8(original));

    EXPECT_EQ(roundtrip, original);
    EXPECT_NE(roundtrip.find("部门决算"), std::string::npos);
}

TEST(PlatformTest, PathConversion_RoundtripWithSpaces) {
    std::string original = "my documents/final account.json";

    EXPECT_EQ(path_to_utf8(path_from_utf8(original)), original);
}

// ==============================================================================
// TTY
// ==============================================================================

TEST(PlatformTest, IsTty_ReturnsWithoutThrowing) {
    EXPECT_NO_THROW({
        (void)is_tty_stdout();
        (void)is_tty_stderr();
    });
}

// ==============================================================================
// Окружение
// ==============================================================================

TEST(PlatformTest, GetEnv_MissingVariable_ReturnsNullopt) {
    EXPECT_FALSE(get_env("BUDGETAUDIT_TEST_SURELY_NOT_SET_42").has_value());
}

TEST(PlatformTest, GetEnv_SetVariable_ReturnsValue) {
    ::setenv("BUDGETAUDIT_TEST_ENV", "glm-4.5-flash", 1);

    auto value = get_env("BUDGETAUDIT_TEST_ENV");

    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "glm-4.5-flash");
    ::unsetenv("BUDGETAUDIT_TEST_ENV");
}

TEST(PlatformTest, GetEnv_EmptyValue_TreatedAsMissing) {
    ::setenv("BUDGETAUDIT_TEST_EMPTY", "", 1);

    EXPECT_FALSE(get_env("BUDGETAUDIT_TEST_EMPTY").has_value());
    ::unsetenv("BUDGETAUDIT_TEST_EMPTY");
}

// ==============================================================================
// UUID
// ==============================================================================

TEST(PlatformTest, GenerateUuid_CanonicalForm) {
    static const std::regex uuid_re(
        "^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");

    std::string id = generate_uuid();

    EXPECT_TRUE(std::regex_match(id, uuid_re)) << id;
}

TEST(PlatformTest, GenerateUuid_Unique) {
    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i) {
        ids.insert(generate_uuid());
    }

    EXPECT_EQ(ids.size(), 100u);
}

// ==============================================================================
// Время
// ==============================================================================

TEST(PlatformTest, FormatIso8601_Epoch) {
    std::chrono::system_clock::time_point epoch{};

    EXPECT_EQ(format_iso8601(epoch), "1970-01-01T00:00:00.000Z");
}

TEST(PlatformTest, FormatIso8601_KeepsMilliseconds) {
    std::chrono::system_clock::time_point tp{std::chrono::milliseconds(1714557600123LL)};

    EXPECT_EQ(format_iso8601(tp), "2024-05-01T10:00:00.123Z");
}

TEST(PlatformTest, NowIso8601_HasUtcSuffix) {
    std::string now = now_iso8601();

    ASSERT_EQ(now.size(), 24u);
    EXPECT_EQ(now.back(), 'Z');
    EXPECT_EQ(now[10], 'T');
}

}  // namespace budgetaudit::platform::test
