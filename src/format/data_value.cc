#include <geoserve/format/data_value.h>

namespace geoserve::format
{
    DataType DataValue::type() const
    {
        switch (v.index())
        {
        case 1:
            return DataType::kString;
        case 2:
            return DataType::kDouble;
        case 3:
            return DataType::kBytes;
        case 4:
            return DataType::kUint16;
        case 5:
            return DataType::kUint32;
        case 6:
            return DataType::kMap;
        case 7:
            return DataType::kInt32;
        case 8:
            return DataType::kUint64;
        case 9:
            return DataType::kUint128;
        case 10:
            return DataType::kArray;
        case 11:
            return DataType::kBool;
        case 12:
            return DataType::kFloat;
        default:
            return DataType::kExtended;
        }
    }

    const DataValue *DataValue::Find(std::string_view key) const
    {
        const auto *m = std::get_if<DataMap>(&v);
        if (!m)
            return nullptr;
        auto it = m->find(key);
        return it == m->end() ? nullptr : &it->second;
    }

    const DataValue *DataValue::At(std::size_t index) const
    {
        const auto *a = std::get_if<DataArray>(&v);
        if (!a || index >= a->size())
            return nullptr;
        return &(*a)[index];
    }

    const std::string *DataValue::AsString() const
    {
        return std::get_if<std::string>(&v);
    }

    const DataMap *DataValue::AsMap() const
    {
        return std::get_if<DataMap>(&v);
    }

    const DataArray *DataValue::AsArray() const
    {
        return std::get_if<DataArray>(&v);
    }

    std::optional<std::uint64_t> DataValue::AsUnsigned() const
    {
        if (const auto *p = std::get_if<std::uint16_t>(&v))
            return *p;
        if (const auto *p = std::get_if<std::uint32_t>(&v))
            return *p;
        if (const auto *p = std::get_if<std::uint64_t>(&v))
            return *p;
        if (const auto *p = std::get_if<uint128>(&v))
        {
            if (*p >> 64)
                return std::nullopt;
            return static_cast<std::uint64_t>(*p);
        }
        if (const auto *p = std::get_if<std::int32_t>(&v))
        {
            if (*p < 0)
                return std::nullopt;
            return static_cast<std::uint64_t>(*p);
        }
        return std::nullopt;
    }

    std::optional<double> DataValue::AsDouble() const
    {
        if (const auto *p = std::get_if<double>(&v))
            return *p;
        if (const auto *p = std::get_if<float>(&v))
            return static_cast<double>(*p);
        return std::nullopt;
    }

    std::optional<bool> DataValue::AsBool() const
    {
        if (const auto *p = std::get_if<bool>(&v))
            return *p;
        return std::nullopt;
    }

    bool operator==(const DataValue &a, const DataValue &b)
    {
        return a.v == b.v;
    }

    const char *DataTypeName(DataType t) noexcept
    {
        switch (t)
        {
        case DataType::kExtended:
            return "extended";
        case DataType::kPointer:
            return "pointer";
        case DataType::kString:
            return "utf8_string";
        case DataType::kDouble:
            return "double";
        case DataType::kBytes:
            return "bytes";
        case DataType::kUint16:
            return "uint16";
        case DataType::kUint32:
            return "uint32";
        case DataType::kMap:
            return "map";
        case DataType::kInt32:
            return "int32";
        case DataType::kUint64:
            return "uint64";
        case DataType::kUint128:
            return "uint128";
        case DataType::kArray:
            return "array";
        case DataType::kContainer:
            return "container";
        case DataType::kEndMarker:
            return "end_marker";
        case DataType::kBool:
            return "boolean";
        case DataType::kFloat:
            return "float";
        }
        return "unknown";
    }
} // namespace geoserve::format
