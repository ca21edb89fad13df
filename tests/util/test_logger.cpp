#include <catch2/catch.hpp>

#include <geoserve/util/logger.h>

#include "common/test_utils.h"

using namespace geoserve;
using namespace geoserve::test;

TEST_CASE("Log levels parse case-insensitively", "[util][logger]")
{
    REQUIRE(ParseLogLevel("debug") == LogLevel::debug);
    REQUIRE(ParseLogLevel("INFO") == LogLevel::info);
    REQUIRE(ParseLogLevel("Warning") == LogLevel::warn);
    REQUIRE(ParseLogLevel("warn") == LogLevel::warn);
    REQUIRE(ParseLogLevel("error") == LogLevel::error);
    REQUIRE_FALSE(ParseLogLevel("trace").has_value());
    REQUIRE_FALSE(ParseLogLevel("").has_value());
}

TEST_CASE("Lines below the level are dropped", "[util][logger]")
{
    TempDir dir;
    const std::string path = dir.file("geoserve.log");

    Logger log;
    log.SetFile(path);
    log.SetLevel(LogLevel::warn);
    REQUIRE(log.level() == LogLevel::warn);

    log.Debug("update.tick", "quiet");
    log.Info("update.tick", "quiet");
    log.Warn("validate.reject", "candidate too small");
    log.Error("bootstrap.fatal", "no database");

    const auto bytes = ReadFile(path);
    const std::string text(bytes.begin(), bytes.end());
    REQUIRE(text.find("quiet") == std::string::npos);
    REQUIRE(text.find("[WARN] [validate.reject] candidate too small\n") != std::string::npos);
    REQUIRE(text.find("[ERROR] [bootstrap.fatal] no database\n") != std::string::npos);
    REQUIRE(text.find("[WARN]") < text.find("[ERROR]"));
}
