#include "common/mmdb_writer.h"

#include <geoserve/format/metadata.h>
#include <geoserve/net/ip_address.h>

#include <bit>
#include <stdexcept>

namespace geoserve::test
{
    using format::DataType;
    using format::DataValue;

    void DataWriter::WriteBigEndian(std::uint64_t v, std::size_t n)
    {
        for (std::size_t i = n; i > 0; --i)
            out_.push_back(static_cast<std::uint8_t>(v >> (8 * (i - 1))));
    }

    void DataWriter::WriteControl(DataType type, std::size_t size)
    {
        const auto t = static_cast<unsigned>(type);
        std::uint8_t ctrl = t <= 7 ? static_cast<std::uint8_t>(t << 5) : 0;

        std::size_t extra = 0;
        std::size_t extra_value = 0;
        if (size < 29)
            ctrl |= static_cast<std::uint8_t>(size);
        else if (size < 285)
        {
            ctrl |= 29;
            extra = 1;
            extra_value = size - 29;
        }
        else if (size < 65821)
        {
            ctrl |= 30;
            extra = 2;
            extra_value = size - 285;
        }
        else
        {
            ctrl |= 31;
            extra = 3;
            extra_value = size - 65821;
        }

        out_.push_back(ctrl);
        if (t > 7)
            out_.push_back(static_cast<std::uint8_t>(t - 7));
        WriteBigEndian(extra_value, extra);
    }

    std::size_t DataWriter::WritePointer(std::size_t target)
    {
        const std::size_t at = out_.size();
        if (target < 2048)
        {
            out_.push_back(static_cast<std::uint8_t>(0x20 | ((target >> 8) & 0x7)));
            WriteBigEndian(target & 0xff, 1);
        }
        else if (target < 526336)
        {
            const std::size_t v = target - 2048;
            out_.push_back(static_cast<std::uint8_t>(0x28 | ((v >> 16) & 0x7)));
            WriteBigEndian(v & 0xffff, 2);
        }
        else if (target < 526336 + (std::size_t(1) << 27))
        {
            const std::size_t v = target - 526336;
            out_.push_back(static_cast<std::uint8_t>(0x30 | ((v >> 24) & 0x7)));
            WriteBigEndian(v & 0xffffff, 3);
        }
        else
        {
            out_.push_back(0x38);
            WriteBigEndian(target, 4);
        }
        return at;
    }

    void DataWriter::WriteUnsigned(DataType type, format::uint128 v)
    {
        std::uint8_t buf[16];
        std::size_t n = 0;
        for (format::uint128 x = v; x != 0; x >>= 8)
            buf[n++] = static_cast<std::uint8_t>(x & 0xff);
        WriteControl(type, n);
        for (std::size_t i = n; i > 0; --i)
            out_.push_back(buf[i - 1]);
    }

    std::size_t DataWriter::Write(const DataValue &v)
    {
        const std::size_t at = out_.size();

        switch (v.type())
        {
        case DataType::kString:
        {
            const std::string &s = *v.AsString();
            if (dedupe_strings_)
            {
                auto it = strings_.find(s);
                if (it != strings_.end())
                    return WritePointer(it->second);
                strings_.emplace(s, at);
            }
            WriteControl(DataType::kString, s.size());
            out_.insert(out_.end(), s.begin(), s.end());
            break;
        }
        case DataType::kDouble:
            WriteControl(DataType::kDouble, 8);
            WriteBigEndian(std::bit_cast<std::uint64_t>(std::get<double>(v.v)), 8);
            break;
        case DataType::kFloat:
            WriteControl(DataType::kFloat, 4);
            WriteBigEndian(std::bit_cast<std::uint32_t>(std::get<float>(v.v)), 4);
            break;
        case DataType::kBytes:
        {
            const auto &b = std::get<format::Bytes>(v.v);
            WriteControl(DataType::kBytes, b.size());
            out_.insert(out_.end(), b.begin(), b.end());
            break;
        }
        case DataType::kUint16:
            WriteUnsigned(DataType::kUint16, std::get<std::uint16_t>(v.v));
            break;
        case DataType::kUint32:
            WriteUnsigned(DataType::kUint32, std::get<std::uint32_t>(v.v));
            break;
        case DataType::kUint64:
            WriteUnsigned(DataType::kUint64, std::get<std::uint64_t>(v.v));
            break;
        case DataType::kUint128:
            WriteUnsigned(DataType::kUint128, std::get<format::uint128>(v.v));
            break;
        case DataType::kInt32:
        {
            const std::int32_t i = std::get<std::int32_t>(v.v);
            if (i < 0)
            {
                WriteControl(DataType::kInt32, 4);
                WriteBigEndian(static_cast<std::uint32_t>(i), 4);
            }
            else
            {
                WriteUnsigned(DataType::kInt32, static_cast<std::uint32_t>(i));
            }
            break;
        }
        case DataType::kBool:
            WriteControl(DataType::kBool, std::get<bool>(v.v) ? 1 : 0);
            break;
        case DataType::kMap:
        {
            const auto &m = *v.AsMap();
            WriteControl(DataType::kMap, m.size());
            for (const auto &[key, value] : m)
            {
                Write(DataValue::String(key));
                Write(value);
            }
            break;
        }
        case DataType::kArray:
        {
            const auto &a = *v.AsArray();
            WriteControl(DataType::kArray, a.size());
            for (const auto &e : a)
                Write(e);
            break;
        }
        default:
            throw std::logic_error("DataWriter: value has no wire encoding");
        }
        return at;
    }

    std::vector<std::uint8_t> EncodeValue(const DataValue &v)
    {
        DataWriter w;
        w.Write(v);
        return w.bytes();
    }

    void MmdbBuilder::Insert(std::string_view address, unsigned prefix_len, DataValue record)
    {
        auto ip = net::IpAddress::Parse(address);
        if (!ip.ok())
            throw std::invalid_argument("MmdbBuilder: bad address " + std::string(address));
        const net::IpAddress &a = ip.value();

        std::vector<int> bits;
        if (a.is_v4() && opt_.ip_version == 6)
            bits.assign(96, 0);
        else if (!a.is_v4() && opt_.ip_version == 4)
            throw std::invalid_argument("MmdbBuilder: IPv6 network in an IPv4 database");
        if (prefix_len == 0 || prefix_len > a.bit_count())
            throw std::invalid_argument("MmdbBuilder: bad prefix length");
        for (unsigned i = 0; i < prefix_len; ++i)
            bits.push_back(a.bit(i));

        records_.push_back(std::move(record));
        const std::int64_t leaf = -static_cast<std::int64_t>(records_.size() - 1) - 2;

        std::size_t node = 0;
        for (std::size_t d = 0; d < bits.size(); ++d)
        {
            const int b = bits[d];
            if (d + 1 == bits.size())
            {
                nodes_[node].child[b] = leaf;
                break;
            }
            std::int64_t next = nodes_[node].child[b];
            if (next < 0)
            {
                // Split an empty or covering record into a fresh node.
                nodes_.push_back({next, next});
                next = static_cast<std::int64_t>(nodes_.size() - 1);
                nodes_[node].child[b] = next;
            }
            node = static_cast<std::size_t>(next);
        }
    }

    std::vector<std::uint8_t> MmdbBuilder::Build() const
    {
        const std::uint32_t node_count = static_cast<std::uint32_t>(nodes_.size());

        DataWriter data(opt_.dedupe_strings);
        std::vector<std::size_t> record_offsets;
        for (const auto &r : records_)
            record_offsets.push_back(data.Write(r));

        auto encode = [&](std::int64_t child) -> std::uint64_t
        {
            if (child == kEmpty)
                return node_count;
            if (child >= 0)
                return static_cast<std::uint64_t>(child);
            return node_count + format::kDataSectionSeparator + record_offsets[static_cast<std::size_t>(-(child + 2))];
        };

        std::vector<std::uint8_t> out;
        for (const auto &n : nodes_)
        {
            const std::uint64_t l = encode(n.child[0]);
            const std::uint64_t r = encode(n.child[1]);
            switch (opt_.record_size)
            {
            case 24:
                for (int s : {16, 8, 0})
                    out.push_back(static_cast<std::uint8_t>(l >> s));
                for (int s : {16, 8, 0})
                    out.push_back(static_cast<std::uint8_t>(r >> s));
                break;
            case 28:
                for (int s : {16, 8, 0})
                    out.push_back(static_cast<std::uint8_t>(l >> s));
                out.push_back(static_cast<std::uint8_t>((((l >> 24) & 0x0f) << 4) | ((r >> 24) & 0x0f)));
                for (int s : {16, 8, 0})
                    out.push_back(static_cast<std::uint8_t>(r >> s));
                break;
            case 32:
                for (int s : {24, 16, 8, 0})
                    out.push_back(static_cast<std::uint8_t>(l >> s));
                for (int s : {24, 16, 8, 0})
                    out.push_back(static_cast<std::uint8_t>(r >> s));
                break;
            default:
                throw std::invalid_argument("MmdbBuilder: bad record size");
            }
        }

        std::vector<std::uint8_t> section = data.bytes();
        section.insert(section.end(), opt_.padding, 0);
        return AssembleMmdb(out, section, MetadataMap(node_count, opt_.record_size, opt_.ip_version,
                                                      opt_.build_epoch, opt_.database_type));
    }

    std::vector<std::uint8_t> AssembleMmdb(const std::vector<std::uint8_t> &tree,
                                           const std::vector<std::uint8_t> &data,
                                           const DataValue &metadata)
    {
        std::vector<std::uint8_t> out(tree);
        out.insert(out.end(), format::kDataSectionSeparator, 0);
        out.insert(out.end(), data.begin(), data.end());
        out.insert(out.end(), format::kMetadataMarker.begin(), format::kMetadataMarker.end());
        const auto meta_bytes = EncodeValue(metadata);
        out.insert(out.end(), meta_bytes.begin(), meta_bytes.end());
        return out;
    }

    DataValue MetadataMap(std::uint32_t node_count,
                          std::uint16_t record_size,
                          std::uint16_t ip_version,
                          std::uint64_t build_epoch,
                          std::string database_type)
    {
        format::DataMap desc;
        desc.emplace("en", DataValue::String("geoserve test fixture"));
        format::DataMap meta;
        meta.emplace("binary_format_major_version", DataValue::Uint16(2));
        meta.emplace("binary_format_minor_version", DataValue::Uint16(0));
        meta.emplace("build_epoch", DataValue::Uint64(build_epoch));
        meta.emplace("database_type", DataValue::String(std::move(database_type)));
        meta.emplace("description", DataValue::Map(std::move(desc)));
        meta.emplace("ip_version", DataValue::Uint16(ip_version));
        meta.emplace("languages", DataValue::Array({DataValue::String("en")}));
        meta.emplace("node_count", DataValue::Uint32(node_count));
        meta.emplace("record_size", DataValue::Uint16(record_size));
        return DataValue::Map(std::move(meta));
    }

    DataValue CityRecord(const CityFields &f)
    {
        auto names = [](const std::string &en)
        {
            format::DataMap n;
            n.emplace("en", DataValue::String(en));
            return DataValue::Map(std::move(n));
        };

        format::DataMap rec;
        if (f.city)
        {
            format::DataMap city;
            city.emplace("names", names(*f.city));
            rec.emplace("city", DataValue::Map(std::move(city)));
        }
        if (f.subdivision)
        {
            format::DataMap sub;
            sub.emplace("names", names(*f.subdivision));
            rec.emplace("subdivisions", DataValue::Array({DataValue::Map(std::move(sub))}));
        }

        format::DataMap country;
        country.emplace("iso_code", DataValue::String(f.country_code));
        country.emplace("names", names(f.country));
        rec.emplace("country", DataValue::Map(std::move(country)));

        format::DataMap continent;
        continent.emplace("code", DataValue::String(f.continent_code));
        continent.emplace("names", names(f.continent));
        rec.emplace("continent", DataValue::Map(std::move(continent)));

        format::DataMap location;
        location.emplace("accuracy_radius", DataValue::Uint16(f.accuracy_radius));
        location.emplace("latitude", DataValue::Double(f.latitude));
        location.emplace("longitude", DataValue::Double(f.longitude));
        location.emplace("time_zone", DataValue::String(f.time_zone));
        rec.emplace("location", DataValue::Map(std::move(location)));

        return DataValue::Map(std::move(rec));
    }

    std::vector<std::uint8_t> BuildCityFixture(MmdbOptions opt)
    {
        const bool v6 = opt.ip_version == 6;
        MmdbBuilder b(std::move(opt));

        b.Insert("1.1.1.0", 24, CityRecord({"South Brisbane", "Queensland", "Australia", "AU", "Oceania", "OC",
                                            -27.4766, 153.0166, "Australia/Brisbane", 1000}));
        b.Insert("8.8.8.0", 24, CityRecord({"Mountain View", "California", "United States", "US", "North America", "NA",
                                            37.386, -122.0838, "America/Los_Angeles", 1000}));
        b.Insert("81.2.69.0", 24, CityRecord({"London", "England", "United Kingdom", "GB", "Europe", "EU",
                                              51.5142, -0.0931, "Europe/London", 10}));
        if (v6)
            b.Insert("2001:4860::", 32, CityRecord({std::nullopt, std::nullopt, "United States", "US", "North America", "NA",
                                                    37.751, -97.822, "America/Chicago", 1000}));
        return b.Build();
    }
}
