#include <geoserve/format/metadata.h>

#include <algorithm>
#include <cstring>
#include <limits>

#include <geoserve/format/decoder.h>

namespace geoserve::format
{
    namespace
    {
        template <typename T>
        Status RequireUnsigned(const DataValue &meta, std::string_view key, T &out)
        {
            const DataValue *v = meta.Find(key);
            if (!v)
                return Status::Corrupt("metadata is missing '" + std::string(key) + "'");
            auto u = v->AsUnsigned();
            if (!u)
                return Status::Corrupt("metadata field '" + std::string(key) + "' is not an unsigned integer");
            if (*u > std::numeric_limits<T>::max())
                return Status::Corrupt("metadata field '" + std::string(key) + "' is out of range");
            out = static_cast<T>(*u);
            return Status::Ok();
        }

        template <typename T>
        void OptionalUnsigned(const DataValue &meta, std::string_view key, T &out)
        {
            const DataValue *v = meta.Find(key);
            if (!v)
                return;
            auto u = v->AsUnsigned();
            if (u && *u <= std::numeric_limits<T>::max())
                out = static_cast<T>(*u);
        }
    } // namespace

    std::size_t FindMetadataMarker(std::span<const std::uint8_t> file)
    {
        const std::size_t n = kMetadataMarker.size();
        if (file.size() < n)
            return file.size();

        const std::size_t floor = file.size() > kMetadataMaxSize ? file.size() - kMetadataMaxSize : 0;
        std::size_t pos = file.size() - n;
        while (true)
        {
            if (std::memcmp(file.data() + pos, kMetadataMarker.data(), n) == 0)
                return pos;
            if (pos == floor)
                break;
            --pos;
        }
        return file.size();
    }

    Result<Metadata> ReadMetadata(std::span<const std::uint8_t> file)
    {
        const std::size_t marker = FindMetadataMarker(file);
        if (marker == file.size())
            return Status::Corrupt("metadata marker not found");

        Metadata md;
        md.marker_offset = marker;
        md.metadata_offset = marker + kMetadataMarker.size();

        Decoder decoder(file.subspan(md.metadata_offset));
        auto decoded = decoder.Decode(0);
        if (!decoded.ok())
            return Status::Corrupt("metadata: " + decoded.status().msg);

        const DataValue &meta = decoded.value();
        if (!meta.AsMap())
            return Status::Corrupt("metadata is not a map");

        Status st = RequireUnsigned(meta, "record_size", md.record_size);
        if (st.ok())
            st = RequireUnsigned(meta, "node_count", md.node_count);
        if (st.ok())
            st = RequireUnsigned(meta, "ip_version", md.ip_version);
        if (st.ok())
            st = RequireUnsigned(meta, "build_epoch", md.build_epoch);
        if (!st.ok())
            return st;

        OptionalUnsigned(meta, "binary_format_major_version", md.binary_format_major_version);
        OptionalUnsigned(meta, "binary_format_minor_version", md.binary_format_minor_version);
        if (const auto *s = meta.Find("database_type"); s && s->AsString())
            md.database_type = *s->AsString();
        if (const auto *langs = meta.Find("languages"); langs && langs->AsArray())
        {
            for (const auto &l : *langs->AsArray())
                if (l.AsString())
                    md.languages.push_back(*l.AsString());
        }
        if (const auto *desc = meta.Find("description"); desc && desc->AsMap())
        {
            for (const auto &[lang, text] : *desc->AsMap())
                if (text.AsString())
                    md.description.emplace(lang, *text.AsString());
        }

        if (md.record_size != 24 && md.record_size != 28 && md.record_size != 32)
            return Status::Corrupt("unsupported record_size " + std::to_string(md.record_size));
        if (md.ip_version != 4 && md.ip_version != 6)
            return Status::Corrupt("unsupported ip_version " + std::to_string(md.ip_version));
        if (md.node_count == 0)
            return Status::Corrupt("node_count is zero");
        if (md.binary_format_major_version != 0 && md.binary_format_major_version != 2)
            return Status::Corrupt("unsupported binary format major version " +
                                   std::to_string(md.binary_format_major_version));

        md.node_byte_size = static_cast<std::size_t>(md.record_size) * 2 / 8;
        md.tree_size = md.node_byte_size * md.node_count;
        md.data_section_offset = md.tree_size + kDataSectionSeparator;
        if (md.data_section_offset > md.marker_offset)
            return Status::Corrupt("search tree of " + std::to_string(md.tree_size) +
                                   " bytes does not fit before metadata at " + std::to_string(md.marker_offset));
        md.data_section_size = md.marker_offset - md.data_section_offset;

        const auto sep = file.subspan(md.tree_size, kDataSectionSeparator);
        if (!std::all_of(sep.begin(), sep.end(), [](std::uint8_t b)
                         { return b == 0; }))
            return Status::Corrupt("data section separator is not zeroed");

        return md;
    }
} // namespace geoserve::format
