#include <catch2/catch.hpp>

#include <geoserve/update/gzip.h>

#include "common/mmdb_writer.h"
#include "common/test_utils.h"

#include <filesystem>

using namespace geoserve;
using namespace geoserve::test;

TEST_CASE("Gzip payloads are recognised by their magic bytes", "[update][gzip]")
{
    TempDir dir;
    WriteGzipFile(dir.file("a.gz"), {'h', 'e', 'l', 'l', 'o'});
    WriteFile(dir.file("b.mmdb"), BuildCityFixture());
    WriteFile(dir.file("c"), {0x1f});

    REQUIRE(update::LooksGzip(dir.file("a.gz")));
    REQUIRE_FALSE(update::LooksGzip(dir.file("b.mmdb")));
    REQUIRE_FALSE(update::LooksGzip(dir.file("c")));
    REQUIRE_FALSE(update::LooksGzip(dir.file("missing")));
}

TEST_CASE("InflateGzipFile restores the original database bytes", "[update][gzip]")
{
    TempDir dir;
    const auto db = BuildCityFixture();
    WriteGzipFile(dir.file("db.mmdb.gz"), db);

    auto st = update::InflateGzipFile(dir.file("db.mmdb.gz"), dir.file("db.mmdb"));
    REQUIRE(st.ok());
    REQUIRE(ReadFile(dir.file("db.mmdb")) == db);
}

TEST_CASE("A truncated gzip stream is rejected", "[update][gzip]")
{
    TempDir dir;
    std::vector<std::uint8_t> big(256 * 1024);
    for (std::size_t i = 0; i < big.size(); ++i)
        big[i] = static_cast<std::uint8_t>((i * 2654435761u) >> 13);
    WriteGzipFile(dir.file("full.gz"), big);

    auto gz = ReadFile(dir.file("full.gz"));
    gz.resize(gz.size() / 2);
    WriteFile(dir.file("half.gz"), gz);

    auto st = update::InflateGzipFile(dir.file("half.gz"), dir.file("out"));
    REQUIRE_FALSE(st.ok());
    REQUIRE_FALSE(std::filesystem::exists(dir.file("out")));
}

TEST_CASE("An empty gzip payload is rejected", "[update][gzip]")
{
    TempDir dir;
    WriteGzipFile(dir.file("empty.gz"), {});
    auto st = update::InflateGzipFile(dir.file("empty.gz"), dir.file("out"));
    REQUIRE(st.code == GeoErrc::Corruption);
    REQUIRE_FALSE(std::filesystem::exists(dir.file("out")));
}

TEST_CASE("Inflating a missing file reports an error", "[update][gzip]")
{
    TempDir dir;
    auto st = update::InflateGzipFile(dir.file("nope.gz"), dir.file("out"));
    REQUIRE_FALSE(st.ok());
}
