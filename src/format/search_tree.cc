#include <geoserve/format/search_tree.h>

#include <string>

namespace geoserve::format
{
    namespace
    {
        inline std::uint32_t Be24(const std::uint8_t *p)
        {
            return (static_cast<std::uint32_t>(p[0]) << 16) | (static_cast<std::uint32_t>(p[1]) << 8) | p[2];
        }

        inline std::uint32_t Be32(const std::uint8_t *p)
        {
            return (static_cast<std::uint32_t>(p[0]) << 24) | (static_cast<std::uint32_t>(p[1]) << 16) |
                   (static_cast<std::uint32_t>(p[2]) << 8) | p[3];
        }
    } // namespace

    SearchTree::SearchTree(std::span<const std::uint8_t> file, const Metadata &meta)
        : file_(file), meta_(&meta)
    {
        if (meta.ip_version == 6)
        {
            std::uint32_t node = 0;
            std::size_t depth = 0;
            for (; depth < 96 && node < meta.node_count; ++depth)
                node = ReadRecord(node, 0);
            ipv4_start_ = node;
            ipv4_start_depth_ = depth;
        }
    }

    std::uint32_t SearchTree::ReadRecord(std::uint32_t node, int bit) const
    {
        const std::uint8_t *p = file_.data() + static_cast<std::size_t>(node) * meta_->node_byte_size;
        switch (meta_->record_size)
        {
        case 24:
            return Be24(p + (bit ? 3 : 0));
        case 28:
            if (bit)
                return (static_cast<std::uint32_t>(p[3] & 0x0f) << 24) | Be24(p + 4);
            return (static_cast<std::uint32_t>(p[3] & 0xf0) << 20) | Be24(p);
        default:
            return Be32(p + (bit ? 4 : 0));
        }
    }

    Result<TreeMatch> SearchTree::Find(const net::IpAddress &ip) const
    {
        const std::uint32_t node_count = meta_->node_count;

        std::uint32_t node = 0;
        std::size_t base_depth = 0;
        if (ip.is_v4())
        {
            if (meta_->ip_version == 6)
            {
                node = ipv4_start_;
                base_depth = ipv4_start_depth_;
            }
        }
        else if (meta_->ip_version == 4)
        {
            return TreeMatch{};
        }

        const std::size_t bits = ip.bit_count();
        std::size_t i = 0;
        for (; i < bits && node < node_count; ++i)
            node = ReadRecord(node, ip.bit(i));

        if (node < node_count)
            return TreeMatch{};
        return Resolve(node, base_depth + i);
    }

    Result<TreeMatch> SearchTree::Resolve(std::uint32_t record, std::size_t depth) const
    {
        const std::uint32_t node_count = meta_->node_count;
        if (record == node_count)
            return TreeMatch{false, 0, static_cast<std::uint8_t>(depth)};

        const std::uint64_t past = static_cast<std::uint64_t>(record) - node_count;
        if (past < kDataSectionSeparator)
            return Status::Corrupt("tree record " + std::to_string(record) + " points into the separator");

        const std::uint64_t offset = past - kDataSectionSeparator;
        if (offset >= meta_->data_section_size)
            return Status::Corrupt("tree record " + std::to_string(record) + " points past the data section");

        TreeMatch m;
        m.found = true;
        m.data_offset = static_cast<std::size_t>(offset);
        m.prefix_len = static_cast<std::uint8_t>(depth);
        return m;
    }
} // namespace geoserve::format
