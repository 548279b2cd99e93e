#include <gtest/gtest.h>
#include "core/version.h"
#include "update/version_checker.h"
#include <chrono>
#include <thread>

using namespace occm;

namespace {

std::optional<VersionCheckResult> wait_for_result(VersionChecker& checker) {
    for (int i = 0; i < 500; ++i) {
        if (auto result = checker.poll()) return result;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return std::nullopt;
}

}

TEST(VersionCheckerTest, CompareVersions) {
    EXPECT_TRUE(VersionChecker::compare_versions("1.2.3", "1.2.4"));
    EXPECT_TRUE(VersionChecker::compare_versions("1.9.0", "1.10.0"));
    EXPECT_FALSE(VersionChecker::compare_versions("2.0.0", "1.9.9"));
    EXPECT_FALSE(VersionChecker::compare_versions("1.2.3", "1.2.3"));
    EXPECT_FALSE(VersionChecker::compare_versions("1.2.3", "latest"));
}

TEST(VersionCheckerTest, ParseReleaseStripsPrefix) {
    auto info = VersionChecker::parse_release({{"tag_name", "v1.4.0"},
                                               {"html_url", "https://example.com/releases/v1.4.0"}});

    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->version, "1.4.0");
    EXPECT_EQ(info->url, "https://example.com/releases/v1.4.0");

    auto no_url = VersionChecker::parse_release({{"tag_name", "release-2.0.1"}});
    ASSERT_TRUE(no_url.has_value());
    EXPECT_EQ(no_url->version, "2.0.1");
    EXPECT_EQ(no_url->url, kReleasesPageUrl);

    EXPECT_FALSE(VersionChecker::parse_release({{"name", "nightly"}}).has_value());
    EXPECT_FALSE(VersionChecker::parse_release({{"tag_name", "nightly"}}).has_value());
}

TEST(VersionCheckerTest, AsyncCheckFindsUpdate) {
    std::string requested_url;
    VersionChecker checker("0.1.0", [&requested_url](const std::string& url, std::string&) {
        requested_url = url;
        return std::string(R"({"tag_name": "v0.2.0", "html_url": "https://example.com/r"})");
    });

    checker.check_async();
    auto result = wait_for_result(checker);

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->success);
    EXPECT_TRUE(result->update_available);
    EXPECT_EQ(result->release.version, "0.2.0");
    EXPECT_EQ(requested_url, kReleasesApiUrl);
    EXPECT_FALSE(checker.checking());
    EXPECT_FALSE(checker.poll().has_value());
}

TEST(VersionCheckerTest, AppVersionIsNotBehindPublishedRelease) {
    VersionChecker checker(kAppVersion, [](const std::string&, std::string&) {
        return std::string(R"({"tag_name": "v1.0.1", "html_url": "https://example.com/r"})");
    });

    checker.check_async();
    auto result = wait_for_result(checker);

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->success);
    EXPECT_FALSE(result->update_available);
    EXPECT_FALSE(VersionChecker::compare_versions(kAppVersion, "1.0.1"));
}

TEST(VersionCheckerTest, AsyncCheckReportsFetchError) {
    VersionChecker checker("0.1.0", [](const std::string&, std::string& error) {
        error = "Network error: timeout";
        return std::string();
    });

    checker.check_async();
    auto result = wait_for_result(checker);

    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->success);
    EXPECT_EQ(result->error, "Network error: timeout");
}

TEST(VersionCheckerTest, InvalidBodyIsAnError) {
    VersionChecker checker("0.1.0", [](const std::string&, std::string&) {
        return std::string("<html>rate limited</html>");
    });

    checker.check_async();
    auto result = wait_for_result(checker);

    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->success);
    EXPECT_EQ(result->error, "Invalid response from GitHub");
}
