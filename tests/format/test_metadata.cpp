#include <catch2/catch.hpp>

#include <geoserve/format/metadata.h>

#include "common/mmdb_writer.h"

#include <vector>

namespace
{
    using namespace geoserve;
    using namespace geoserve::format;
    using namespace geoserve::test;

    // One-node tree whose records both mean "no match".
    std::vector<std::uint8_t> EmptyTree(std::uint16_t record_size)
    {
        const std::size_t half = record_size / 8;
        std::vector<std::uint8_t> tree(half * 2, 0);
        tree[half - 1] = 1;
        tree[2 * half - 1] = 1;
        return tree;
    }
}

TEST_CASE("Metadata of a generated database is read back", "[format][metadata]")
{
    MmdbOptions opt;
    opt.build_epoch = 1712345678;
    MmdbBuilder b(opt);
    b.Insert("8.8.8.0", 24, DataValue::Map({}));
    const auto file = b.Build();

    auto md = ReadMetadata(file);
    REQUIRE(md.ok());
    const Metadata &m = md.value();
    REQUIRE(m.record_size == 24);
    REQUIRE(m.ip_version == 6);
    REQUIRE(m.build_epoch == 1712345678u);
    REQUIRE(m.node_count == b.node_count());
    REQUIRE(m.binary_format_major_version == 2);
    REQUIRE(m.database_type == "GeoServe-Test-City");
    REQUIRE(m.languages == std::vector<std::string>{"en"});
    REQUIRE(m.description.at("en") == "geoserve test fixture");
    REQUIRE(m.node_byte_size == 6);
    REQUIRE(m.tree_size == m.node_count * 6u);
    REQUIRE(m.data_section_offset == m.tree_size + kDataSectionSeparator);
    REQUIRE(m.marker_offset == m.data_section_offset + m.data_section_size);
}

TEST_CASE("Missing or damaged metadata is rejected", "[format][metadata]")
{
    const auto file = BuildCityFixture();

    SECTION("no marker")
    {
        std::vector<std::uint8_t> junk(4096, 0x5a);
        auto md = ReadMetadata(junk);
        REQUIRE_FALSE(md.ok());
        REQUIRE(md.status().code == GeoErrc::Corruption);
    }

    SECTION("truncated metadata map")
    {
        std::vector<std::uint8_t> cut(file.begin(), file.end() - 20);
        REQUIRE_FALSE(ReadMetadata(cut).ok());
    }

    SECTION("marker beyond the search window")
    {
        std::vector<std::uint8_t> padded(file);
        padded.insert(padded.end(), kMetadataMaxSize + 1, 0);
        REQUIRE(FindMetadataMarker(padded) == padded.size());
        REQUIRE_FALSE(ReadMetadata(padded).ok());
    }

    SECTION("dirty separator")
    {
        auto md = ReadMetadata(file);
        REQUIRE(md.ok());
        std::vector<std::uint8_t> dirty(file);
        dirty[md.value().tree_size + 3] = 0x01;
        REQUIRE(ReadMetadata(dirty).status().code == GeoErrc::Corruption);
    }
}

TEST_CASE("Metadata fields are range checked", "[format][metadata]")
{
    SECTION("unsupported record size")
    {
        auto file = AssembleMmdb(EmptyTree(24), {}, MetadataMap(1, 20, 4, 1));
        REQUIRE_FALSE(ReadMetadata(file).ok());
    }

    SECTION("unsupported ip version")
    {
        auto file = AssembleMmdb(EmptyTree(24), {}, MetadataMap(1, 24, 5, 1));
        REQUIRE_FALSE(ReadMetadata(file).ok());
    }

    SECTION("tree larger than the file")
    {
        auto file = AssembleMmdb(EmptyTree(24), {}, MetadataMap(5000, 24, 4, 1));
        REQUIRE_FALSE(ReadMetadata(file).ok());
    }

    SECTION("required key missing")
    {
        DataMap meta;
        meta.emplace("record_size", DataValue::Uint16(24));
        meta.emplace("ip_version", DataValue::Uint16(4));
        meta.emplace("node_count", DataValue::Uint32(1));
        auto file = AssembleMmdb(EmptyTree(24), {}, DataValue::Map(std::move(meta)));
        auto md = ReadMetadata(file);
        REQUIRE_FALSE(md.ok());
        REQUIRE(md.status().msg.find("build_epoch") != std::string::npos);
    }

    SECTION("metadata that is not a map")
    {
        auto file = AssembleMmdb(EmptyTree(24), {}, DataValue::String("nope"));
        REQUIRE_FALSE(ReadMetadata(file).ok());
    }

    SECTION("minimal valid layout")
    {
        auto file = AssembleMmdb(EmptyTree(32), {}, MetadataMap(1, 32, 4, 7));
        auto md = ReadMetadata(file);
        REQUIRE(md.ok());
        REQUIRE(md.value().data_section_size == 0);
        REQUIRE(md.value().build_epoch == 7u);
    }
}
