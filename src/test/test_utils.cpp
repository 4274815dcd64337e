#include <catch2/catch_test_macros.hpp>
#include <sig-vault/logger.hpp>
#include <sig-vault/string_utils.hpp>
#include <sig-vault/time_utils.hpp>
#include <sig-vault/vault_status.hpp>

using namespace SigVault;

TEST_CASE("StringUtils case handling", "[utils][string]")
{
    REQUIRE(StringUtils::toLower("IMG_0001.JPG") == "img_0001.jpg");
    // UTF-8 bytes pass through untouched
    REQUIRE(StringUtils::toLower("\xC3\x84PFEL.PNG") == "\xC3\x84pfel.png");

    REQUIRE(StringUtils::compareCaseInsensitive("a.jpg", "A.JPG") == 0);
    REQUIRE(StringUtils::compareCaseInsensitive("A", "a.jpg") < 0);
    REQUIRE(StringUtils::compareCaseInsensitive("b.jpg", "a.jpg") > 0);
    REQUIRE(StringUtils::trim("  \tname\r\n") == "name");
    REQUIRE(StringUtils::trim("   ").empty());
}

TEST_CASE("StringUtils sizes", "[utils][string]")
{
    SECTION("formatSize")
    {
        REQUIRE(StringUtils::formatSize(512) == "512 B");
        REQUIRE(StringUtils::formatSize(2048) == "2.0 KB");
        REQUIRE(StringUtils::formatSize(5 * 1024 * 1024) == "5.0 MB");
        REQUIRE(StringUtils::formatSize(1288490189ULL) == "1.2 GB");
    }

    SECTION("parseByteCount")
    {
        REQUIRE(StringUtils::parseByteCount("4096") == 4096u);
        REQUIRE(StringUtils::parseByteCount("512K") == 512u * 1024);
        REQUIRE(StringUtils::parseByteCount("10MB") == 10u * 1024 * 1024);
        REQUIRE(StringUtils::parseByteCount("2g") == 2ULL * 1024 * 1024 * 1024);
        REQUIRE_FALSE(StringUtils::parseByteCount("").has_value());
        REQUIRE_FALSE(StringUtils::parseByteCount("-5").has_value());
        REQUIRE_FALSE(StringUtils::parseByteCount("12 parsecs").has_value());
    }
}

TEST_CASE("StringUtils URL helpers", "[utils][string]")
{
    REQUIRE(StringUtils::urlEncodePath("Photos/Summer 2024/a+b.jpg") == "Photos/Summer%202024/a%2Bb.jpg");
    REQUIRE(StringUtils::urlDecode("Photos/Summer%202024/a%2Bb.jpg") == "Photos/Summer 2024/a+b.jpg");
    REQUIRE(StringUtils::urlDecode("100%") == "100%");
    REQUIRE(StringUtils::urlDecode("%zz") == "%zz");
    REQUIRE(StringUtils::urlDecode("%C3%A4") == "\xC3\xA4");
}

TEST_CASE("StringUtils hashHex is stable", "[utils][string]")
{
    REQUIRE(StringUtils::hashHex("") == "cbf29ce484222325");
    REQUIRE(StringUtils::hashHex("smb://nas/media|\\a.jpg").size() == 16);
    REQUIRE(StringUtils::hashHex("a") != StringUtils::hashHex("b"));
}

TEST_CASE("TimeUtils", "[utils][time]")
{
    auto tp = TimeUtils::fromEpochMillis(1717496100123LL);
    REQUIRE(TimeUtils::toEpochMillis(tp) == 1717496100123LL);

    REQUIRE(TimeUtils::formatTimestamp(tp).size() == 16);
    REQUIRE(TimeUtils::formatTimestamp(tp, "%Y").size() == 4);

    REQUIRE(TimeUtils::formatDuration(std::chrono::seconds(42)) == "42 seconds");
    REQUIRE(TimeUtils::formatDuration(std::chrono::minutes(5)) == "5 minutes");
    REQUIRE(TimeUtils::formatDuration(std::chrono::hours(3)) == "3 hours");
    REQUIRE(TimeUtils::formatDuration(std::chrono::hours(72)) == "3 days");
}

TEST_CASE("VaultStatus descriptions", "[utils][status]")
{
    REQUIRE(isSuccess(VaultStatus::success()));
    REQUIRE(describeStatus(VaultStatus::success()) == "SUCCESS");
    REQUIRE(describeStatus({ StatusCode::NOT_FOUND, "a.jpg" }) == "NOT_FOUND: a.jpg");
    REQUIRE(std::string(statusCodeToString(StatusCode::QUOTA_EXCEEDED)) == "QUOTA_EXCEEDED");
    REQUIRE(std::string(statusCodeToString(StatusCode::SUPERSEDED)) == "SUPERSEDED");
}

TEST_CASE("Logger configuration", "[utils][logger]")
{
    REQUIRE(Logger::parseLevel("DEBUG") == LogLevel::DEBUG);
    REQUIRE(Logger::parseLevel("warning") == LogLevel::WARN);
    REQUIRE(Logger::parseLevel("error") == LogLevel::ERR);
    REQUIRE_FALSE(Logger::parseLevel("loud").has_value());

    REQUIRE(std::string(Logger::categoryTag(LogCategory::CLOUD)) == "DAV");
    REQUIRE(std::string(Logger::levelName(LogLevel::ERR)) == "ERROR");

    SECTION("Nothing is logged before initialization")
    {
        Logger::shutdown();
        REQUIRE_FALSE(Logger::shouldLog(LogLevel::FATAL, LogCategory::GENERAL));
    }

    SECTION("Level and category filtering")
    {
        Logger::initialize(LogLevel::INFO, LogOutput::DISABLED);
        REQUIRE_FALSE(Logger::shouldLog(LogLevel::ERR, LogCategory::GENERAL));

        Logger::initialize(LogLevel::INFO, LogOutput::CONSOLE);
        Logger::setCategoriesFromString("smb, Cache");
        REQUIRE(Logger::shouldLog(LogLevel::INFO, LogCategory::SMB));
        REQUIRE(Logger::shouldLog(LogLevel::WARN, LogCategory::CACHE));
        REQUIRE_FALSE(Logger::shouldLog(LogLevel::DEBUG, LogCategory::SMB));
        REQUIRE_FALSE(Logger::shouldLog(LogLevel::ERR, LogCategory::CLOUD));

        Logger::setCategoriesFromString("all");
        REQUIRE(Logger::shouldLog(LogLevel::INFO, LogCategory::EVENTS));
        Logger::shutdown();
    }
}
