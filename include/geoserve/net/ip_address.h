#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include <geoserve/core/status.h>

namespace geoserve::net
{
    class IpAddress
    {
    public:
        enum class Family : std::uint8_t
        {
            kV4,
            kV6
        };

        IpAddress() = default;

        // Accepts dotted-quad IPv4 and RFC 4291 IPv6 text. IPv4-mapped IPv6
        // literals (::ffff:a.b.c.d) come back as IPv4.
        static Result<IpAddress> Parse(std::string_view text);

        static IpAddress V4(const std::array<std::uint8_t, 4> &octets);
        static IpAddress V6(const std::array<std::uint8_t, 16> &octets);

        Family family() const noexcept { return family_; }
        bool is_v4() const noexcept { return family_ == Family::kV4; }

        // Network-order bytes; an IPv4 address uses the first four.
        const std::array<std::uint8_t, 16> &bytes() const noexcept { return bytes_; }
        std::size_t bit_count() const noexcept { return is_v4() ? 32 : 128; }
        int bit(std::size_t i) const noexcept { return (bytes_[i >> 3] >> (7 - (i & 7))) & 1; }

        std::string ToString() const;

        friend bool operator==(const IpAddress &a, const IpAddress &b)
        {
            return a.family_ == b.family_ && a.bytes_ == b.bytes_;
        }

    private:
        Family family_{Family::kV4};
        std::array<std::uint8_t, 16> bytes_{};
    };
} // namespace geoserve::net
