#include <catch2/catch.hpp>

#include <geoserve/storage/file_util.h>

#include "common/test_utils.h"

#include <filesystem>

using namespace geoserve;
using namespace geoserve::test;
namespace fs = std::filesystem;

TEST_CASE("Directories are created on demand", "[storage][file_util]")
{
    TempDir dir;
    const std::string nested = dir.file("x/y/z");
    REQUIRE(storage::EnsureDirExists(nested).ok());
    REQUIRE(fs::is_directory(nested));
    REQUIRE(storage::EnsureDirExists(nested).ok());
}

TEST_CASE("FileSize reports bytes or an error", "[storage][file_util]")
{
    TempDir dir;
    WriteFile(dir.file("f"), std::vector<std::uint8_t>(1234, 7));
    auto size = storage::FileSize(dir.file("f"));
    REQUIRE(size.ok());
    REQUIRE(size.value() == 1234u);
    REQUIRE_FALSE(storage::FileSize(dir.file("missing")).ok());
}

TEST_CASE("AtomicRename replaces the destination", "[storage][file_util]")
{
    TempDir dir;
    WriteFile(dir.file("a.tmp"), {1, 2, 3});
    WriteFile(dir.file("a"), {9});
    REQUIRE(storage::AtomicRename(dir.file("a.tmp"), dir.file("a")).ok());
    REQUIRE(ReadFile(dir.file("a")) == std::vector<std::uint8_t>{1, 2, 3});
    REQUIRE_FALSE(fs::exists(dir.file("a.tmp")));
    REQUIRE_FALSE(storage::AtomicRename(dir.file("a.tmp"), dir.file("a")).ok());
}

TEST_CASE("AtomicSymlink repoints an existing link", "[storage][file_util]")
{
    TempDir dir;
    const std::string link = dir.file("latest.mmdb");
    REQUIRE(storage::AtomicSymlink("geoip-1.mmdb", link).ok());
    REQUIRE(fs::read_symlink(link).string() == "geoip-1.mmdb");
    REQUIRE(storage::AtomicSymlink("geoip-2.mmdb", link).ok());
    REQUIRE(fs::read_symlink(link).string() == "geoip-2.mmdb");
    REQUIRE(ListDir(dir.str()) == std::vector<std::string>{"latest.mmdb"});
}

TEST_CASE("RemoveIfExists tolerates missing files", "[storage][file_util]")
{
    TempDir dir;
    WriteFile(dir.file("f"), {1});
    REQUIRE(storage::RemoveIfExists(dir.file("f")));
    REQUIRE_FALSE(fs::exists(dir.file("f")));
    REQUIRE(storage::RemoveIfExists(dir.file("f")));
}
