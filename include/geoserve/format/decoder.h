#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include <geoserve/core/status.h>
#include <geoserve/format/data_value.h>

namespace geoserve::format
{
    // Decodes self-describing values from one section of a database file
    // (the data section or the metadata section). All offsets, including the
    // targets of format-level pointers, are relative to the section start.
    class Decoder
    {
    public:
        // A pointer may lead to another pointer at most this many times in a row.
        static constexpr int kMaxPointerChain = 4;
        // Maximum nesting of maps/arrays (pointer hops count as a level).
        static constexpr int kMaxDepth = 64;
        // Upper bound on pointers followed while decoding one top-level value.
        static constexpr std::size_t kMaxPointerFollows = 1u << 16;

        explicit Decoder(std::span<const std::uint8_t> section) noexcept : section_(section) {}

        // Decodes the value starting at `offset`.
        Result<DataValue> Decode(std::size_t offset) const;

        // Decodes the value at `offset` and reports where the next value starts.
        // A pointer at `offset` is followed, but `*next` is the byte after it.
        Status DecodeAt(std::size_t offset, DataValue *out, std::size_t *next) const;

        std::size_t size() const noexcept { return section_.size(); }

    private:
        struct Budget
        {
            std::size_t pointer_follows{0};
        };

        Status DecodeValue(std::size_t &offset, int depth, int chain, Budget &budget, DataValue &out) const;
        Status ReadPointer(std::size_t &offset, std::uint8_t ctrl, std::size_t &target) const;
        Status ReadSize(std::size_t &offset, std::uint8_t ctrl, std::size_t &size) const;
        Status DecodeMap(std::size_t &offset, std::size_t count, int depth, Budget &budget, DataValue &out) const;
        Status DecodeArray(std::size_t &offset, std::size_t count, int depth, Budget &budget, DataValue &out) const;
        Status Need(std::size_t offset, std::size_t n) const;

        template <typename T>
        T ReadBigEndian(std::size_t offset, std::size_t n) const
        {
            T value = 0;
            for (std::size_t i = 0; i < n; ++i)
                value = static_cast<T>((value << 8) | static_cast<T>(section_[offset + i]));
            return value;
        }

        std::span<const std::uint8_t> section_;
    };
} // namespace geoserve::format
