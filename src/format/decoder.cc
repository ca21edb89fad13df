#include <geoserve/format/decoder.h>

#include <bit>
#include <cstring>
#include <string>

namespace geoserve::format
{
    namespace
    {
        Status Truncated(std::size_t offset, std::size_t want, std::size_t have)
        {
            return Status::Corrupt("value at offset " + std::to_string(offset) + " needs " +
                                   std::to_string(want) + " bytes, section has " + std::to_string(have));
        }

        Status BadWidth(DataType t, std::size_t size)
        {
            return Status::Corrupt(std::string("invalid payload size ") + std::to_string(size) +
                                   " for " + DataTypeName(t));
        }

        // Well-formed UTF-8: no overlong forms, surrogates or code points
        // above U+10FFFF.
        bool ValidUtf8(const std::uint8_t *p, std::size_t n)
        {
            std::size_t i = 0;
            while (i < n)
            {
                const std::uint8_t c = p[i];
                if (c < 0x80)
                {
                    ++i;
                    continue;
                }

                std::size_t len = 0;
                std::uint8_t lo = 0x80;
                std::uint8_t hi = 0xBF;
                if (c >= 0xC2 && c <= 0xDF)
                    len = 2;
                else if (c >= 0xE0 && c <= 0xEF)
                {
                    len = 3;
                    if (c == 0xE0)
                        lo = 0xA0;
                    else if (c == 0xED)
                        hi = 0x9F;
                }
                else if (c >= 0xF0 && c <= 0xF4)
                {
                    len = 4;
                    if (c == 0xF0)
                        lo = 0x90;
                    else if (c == 0xF4)
                        hi = 0x8F;
                }
                else
                    return false;

                if (n - i < len)
                    return false;
                if (p[i + 1] < lo || p[i + 1] > hi)
                    return false;
                for (std::size_t k = 2; k < len; ++k)
                {
                    if (p[i + k] < 0x80 || p[i + k] > 0xBF)
                        return false;
                }
                i += len;
            }
            return true;
        }
    } // namespace

    Result<DataValue> Decoder::Decode(std::size_t offset) const
    {
        DataValue out;
        std::size_t next = 0;
        Status st = DecodeAt(offset, &out, &next);
        if (!st.ok())
            return st;
        return out;
    }

    Status Decoder::DecodeAt(std::size_t offset, DataValue *out, std::size_t *next) const
    {
        Budget budget;
        std::size_t cursor = offset;
        DataValue value;
        Status st = DecodeValue(cursor, 0, 0, budget, value);
        if (!st.ok())
            return st;
        if (out)
            *out = std::move(value);
        if (next)
            *next = cursor;
        return Status::Ok();
    }

    Status Decoder::Need(std::size_t offset, std::size_t n) const
    {
        if (offset > section_.size() || section_.size() - offset < n)
            return Truncated(offset, n, section_.size());
        return Status::Ok();
    }

    Status Decoder::ReadPointer(std::size_t &offset, std::uint8_t ctrl, std::size_t &target) const
    {
        const std::size_t ss = (ctrl >> 3) & 0x3u;
        const std::uint32_t vvv = ctrl & 0x7u;
        const std::size_t n = ss + 1;

        Status st = Need(offset, n);
        if (!st.ok())
            return st;

        switch (ss)
        {
        case 0:
            target = (static_cast<std::size_t>(vvv) << 8) | ReadBigEndian<std::size_t>(offset, 1);
            break;
        case 1:
            target = ((static_cast<std::size_t>(vvv) << 16) | ReadBigEndian<std::size_t>(offset, 2)) + 2048;
            break;
        case 2:
            target = ((static_cast<std::size_t>(vvv) << 24) | ReadBigEndian<std::size_t>(offset, 3)) + 526336;
            break;
        default:
            target = ReadBigEndian<std::size_t>(offset, 4);
            break;
        }
        offset += n;
        return Status::Ok();
    }

    Status Decoder::ReadSize(std::size_t &offset, std::uint8_t ctrl, std::size_t &size) const
    {
        size = ctrl & 0x1fu;
        if (size < 29)
            return Status::Ok();

        const std::size_t extra = size - 28;
        Status st = Need(offset, extra);
        if (!st.ok())
            return st;

        const std::size_t raw = ReadBigEndian<std::size_t>(offset, extra);
        offset += extra;
        if (extra == 1)
            size = 29 + raw;
        else if (extra == 2)
            size = 285 + raw;
        else
            size = 65821 + raw;
        return Status::Ok();
    }

    Status Decoder::DecodeValue(std::size_t &offset, int depth, int chain, Budget &budget, DataValue &out) const
    {
        if (depth > kMaxDepth)
            return Status::Corrupt("maximum data structure depth exceeded");

        Status st = Need(offset, 1);
        if (!st.ok())
            return st;

        const std::size_t start = offset;
        const std::uint8_t ctrl = section_[offset++];
        auto type = static_cast<DataType>(ctrl >> 5);

        if (type == DataType::kPointer)
        {
            if (chain >= kMaxPointerChain)
                return Status::Corrupt("pointer chain too long at offset " + std::to_string(start));
            if (++budget.pointer_follows > kMaxPointerFollows)
                return Status::Corrupt("too many pointers followed");

            std::size_t target = 0;
            st = ReadPointer(offset, ctrl, target);
            if (!st.ok())
                return st;
            if (target >= section_.size())
                return Status::Corrupt("pointer at offset " + std::to_string(start) + " targets " +
                                       std::to_string(target) + " past section end");
            return DecodeValue(target, depth + 1, chain + 1, budget, out);
        }

        if (type == DataType::kExtended)
        {
            st = Need(offset, 1);
            if (!st.ok())
                return st;
            const unsigned ext = 7u + section_[offset++];
            if (ext < 8 || ext > 15)
                return Status::Corrupt("unknown extended type " + std::to_string(ext) +
                                       " at offset " + std::to_string(start));
            type = static_cast<DataType>(ext);
        }

        std::size_t size = 0;
        st = ReadSize(offset, ctrl, size);
        if (!st.ok())
            return st;

        switch (type)
        {
        case DataType::kMap:
            return DecodeMap(offset, size, depth, budget, out);
        case DataType::kArray:
            return DecodeArray(offset, size, depth, budget, out);
        case DataType::kBool:
            if (size > 1)
                return BadWidth(type, size);
            out = DataValue::Bool(size == 1);
            return Status::Ok();
        default:
            break;
        }

        st = Need(offset, size);
        if (!st.ok())
            return st;

        switch (type)
        {
        case DataType::kString:
            if (!ValidUtf8(section_.data() + offset, size))
                return Status::Corrupt("string at offset " + std::to_string(offset) + " is not valid UTF-8");
            out = DataValue::String(std::string(reinterpret_cast<const char *>(section_.data() + offset), size));
            break;
        case DataType::kBytes:
            out = DataValue::Blob(Bytes(section_.begin() + offset, section_.begin() + offset + size));
            break;
        case DataType::kDouble:
            if (size != 8)
                return BadWidth(type, size);
            out = DataValue::Double(std::bit_cast<double>(ReadBigEndian<std::uint64_t>(offset, 8)));
            break;
        case DataType::kFloat:
            if (size != 4)
                return BadWidth(type, size);
            out = DataValue::Float(std::bit_cast<float>(ReadBigEndian<std::uint32_t>(offset, 4)));
            break;
        case DataType::kUint16:
            if (size > 2)
                return BadWidth(type, size);
            out = DataValue::Uint16(ReadBigEndian<std::uint16_t>(offset, size));
            break;
        case DataType::kUint32:
            if (size > 4)
                return BadWidth(type, size);
            out = DataValue::Uint32(ReadBigEndian<std::uint32_t>(offset, size));
            break;
        case DataType::kInt32:
            if (size > 4)
                return BadWidth(type, size);
            out = DataValue::Int32(static_cast<std::int32_t>(ReadBigEndian<std::uint32_t>(offset, size)));
            break;
        case DataType::kUint64:
            if (size > 8)
                return BadWidth(type, size);
            out = DataValue::Uint64(ReadBigEndian<std::uint64_t>(offset, size));
            break;
        case DataType::kUint128:
            if (size > 16)
                return BadWidth(type, size);
            out = DataValue::Uint128(ReadBigEndian<uint128>(offset, size));
            break;
        default:
            return Status::Corrupt(std::string("unexpected type ") + DataTypeName(type) +
                                   " at offset " + std::to_string(start));
        }
        offset += size;
        return Status::Ok();
    }

    Status Decoder::DecodeMap(std::size_t &offset, std::size_t count, int depth, Budget &budget, DataValue &out) const
    {
        // Every entry takes at least two control bytes.
        if (count > (section_.size() - offset) / 2)
            return Status::Corrupt("map of " + std::to_string(count) + " entries overruns section");

        DataMap m;
        for (std::size_t i = 0; i < count; ++i)
        {
            DataValue key;
            Status st = DecodeValue(offset, depth + 1, 0, budget, key);
            if (!st.ok())
                return st;
            auto *name = std::get_if<std::string>(&key.v);
            if (!name)
                return Status::Corrupt(std::string("map key of type ") + DataTypeName(key.type()));

            DataValue value;
            st = DecodeValue(offset, depth + 1, 0, budget, value);
            if (!st.ok())
                return st;
            m.insert_or_assign(std::move(*name), std::move(value));
        }
        out = DataValue::Map(std::move(m));
        return Status::Ok();
    }

    Status Decoder::DecodeArray(std::size_t &offset, std::size_t count, int depth, Budget &budget, DataValue &out) const
    {
        if (count > section_.size() - offset)
            return Status::Corrupt("array of " + std::to_string(count) + " elements overruns section");

        DataArray a;
        a.reserve(count);
        for (std::size_t i = 0; i < count; ++i)
        {
            DataValue element;
            Status st = DecodeValue(offset, depth + 1, 0, budget, element);
            if (!st.ok())
                return st;
            a.push_back(std::move(element));
        }
        out = DataValue::Array(std::move(a));
        return Status::Ok();
    }
} // namespace geoserve::format
