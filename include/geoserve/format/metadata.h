#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <geoserve/core/status.h>

namespace geoserve::format
{
    // "\xAB\xCD\xEFMaxMind.com": separates the data section from the metadata map.
    inline constexpr std::string_view kMetadataMarker{"\xAB\xCD\xEF"
                                                      "MaxMind.com",
                                                      14};
    // The marker is searched for only in this many trailing bytes.
    inline constexpr std::size_t kMetadataMaxSize = 128 * 1024;
    // Zero bytes between the search tree and the data section.
    inline constexpr std::size_t kDataSectionSeparator = 16;

    struct Metadata
    {
        // Required fields.
        std::uint16_t record_size{0};
        std::uint32_t node_count{0};
        std::uint16_t ip_version{0};
        std::uint64_t build_epoch{0};

        // Informational fields.
        std::uint16_t binary_format_major_version{0};
        std::uint16_t binary_format_minor_version{0};
        std::string database_type;
        std::vector<std::string> languages;
        std::map<std::string, std::string> description;

        // Layout derived from the required fields and the marker position.
        std::size_t node_byte_size{0};
        std::size_t tree_size{0};
        std::size_t data_section_offset{0};
        std::size_t data_section_size{0};
        std::size_t marker_offset{0};
        std::size_t metadata_offset{0};
    };

    // Returns the offset of the last metadata marker, or file.size() when absent.
    std::size_t FindMetadataMarker(std::span<const std::uint8_t> file);

    // Parses the trailing metadata block and checks it against the file layout:
    // supported record size and ip version, a tree that fits before the
    // marker, and an all-zero data section separator.
    Result<Metadata> ReadMetadata(std::span<const std::uint8_t> file);
} // namespace geoserve::format
