#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include <geoserve/core/status.h>
#include <geoserve/format/metadata.h>
#include <geoserve/net/ip_address.h>

namespace geoserve::format
{
    struct TreeMatch
    {
        bool found{false};
        // Offset into the data section; valid when found.
        std::size_t data_offset{0};
        // Number of address bits consumed before the walk ended.
        std::uint8_t prefix_len{0};
    };

    // Walks the IP-indexed binary trie at the start of a database file.
    // The file and metadata must outlive the walker.
    class SearchTree
    {
    public:
        SearchTree(std::span<const std::uint8_t> file, const Metadata &meta);

        Result<TreeMatch> Find(const net::IpAddress &ip) const;

        // Child record of `node` for the given bit (0 = left, 1 = right).
        std::uint32_t ReadRecord(std::uint32_t node, int bit) const;

    private:
        Result<TreeMatch> Resolve(std::uint32_t record, std::size_t depth) const;

        std::span<const std::uint8_t> file_;
        const Metadata *meta_;
        // Node reached after 96 zero bits: root of IPv4 space in a dual-stack tree.
        std::uint32_t ipv4_start_{0};
        std::size_t ipv4_start_depth_{0};
    };
} // namespace geoserve::format
