#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace geoserve::format
{
    using uint128 = unsigned __int128;

    // Wire type tags of the MaxMind DB data section.
    enum class DataType : std::uint8_t
    {
        kExtended = 0,
        kPointer = 1,
        kString = 2,
        kDouble = 3,
        kBytes = 4,
        kUint16 = 5,
        kUint32 = 6,
        kMap = 7,
        kInt32 = 8,
        kUint64 = 9,
        kUint128 = 10,
        kArray = 11,
        kContainer = 12,
        kEndMarker = 13,
        kBool = 14,
        kFloat = 15
    };

    struct DataValue;

    using DataMap = std::map<std::string, DataValue, std::less<>>;
    using DataArray = std::vector<DataValue>;
    using Bytes = std::vector<std::uint8_t>;

    // One decoded value. Pointers never appear here: the decoder resolves them.
    struct DataValue
    {
        using Storage = std::variant<std::monostate,
                                     std::string,
                                     double,
                                     Bytes,
                                     std::uint16_t,
                                     std::uint32_t,
                                     DataMap,
                                     std::int32_t,
                                     std::uint64_t,
                                     uint128,
                                     DataArray,
                                     bool,
                                     float>;

        Storage v;

        DataValue() = default;
        explicit DataValue(Storage s) : v(std::move(s)) {}

        static DataValue String(std::string s) { return DataValue(Storage(std::move(s))); }
        static DataValue Double(double d) { return DataValue(Storage(d)); }
        static DataValue Float(float f) { return DataValue(Storage(f)); }
        static DataValue Blob(Bytes b) { return DataValue(Storage(std::move(b))); }
        static DataValue Uint16(std::uint16_t u) { return DataValue(Storage(u)); }
        static DataValue Uint32(std::uint32_t u) { return DataValue(Storage(u)); }
        static DataValue Uint64(std::uint64_t u) { return DataValue(Storage(u)); }
        static DataValue Uint128(uint128 u) { return DataValue(Storage(u)); }
        static DataValue Int32(std::int32_t i) { return DataValue(Storage(i)); }
        static DataValue Bool(bool b) { return DataValue(Storage(b)); }
        static DataValue Map(DataMap m) { return DataValue(Storage(std::move(m))); }
        static DataValue Array(DataArray a) { return DataValue(Storage(std::move(a))); }

        bool empty() const { return std::holds_alternative<std::monostate>(v); }
        DataType type() const;

        // Map member lookup; nullptr when this is not a map or the key is absent.
        const DataValue *Find(std::string_view key) const;
        // Array element; nullptr when this is not an array or out of range.
        const DataValue *At(std::size_t index) const;

        const std::string *AsString() const;
        const DataMap *AsMap() const;
        const DataArray *AsArray() const;
        // Any unsigned width, or a non-negative int32.
        std::optional<std::uint64_t> AsUnsigned() const;
        // double or float.
        std::optional<double> AsDouble() const;
        std::optional<bool> AsBool() const;
    };

    bool operator==(const DataValue &a, const DataValue &b);
    inline bool operator!=(const DataValue &a, const DataValue &b) { return !(a == b); }

    const char *DataTypeName(DataType t) noexcept;
} // namespace geoserve::format
