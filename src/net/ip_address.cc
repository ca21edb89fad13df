#include <geoserve/net/ip_address.h>

#include <arpa/inet.h>
#include <netinet/in.h>

#include <algorithm>
#include <cstring>

namespace geoserve::net
{
    namespace
    {
        bool IsV4Mapped(const std::uint8_t *b)
        {
            for (int i = 0; i < 10; ++i)
                if (b[i] != 0)
                    return false;
            return b[10] == 0xff && b[11] == 0xff;
        }
    } // namespace

    Result<IpAddress> IpAddress::Parse(std::string_view text)
    {
        if (text.empty())
            return Status::Invalid("empty address");
        if (text.size() >= INET6_ADDRSTRLEN || text.find('\0') != std::string_view::npos)
            return Status::Invalid("not an IP address: " + std::string(text.substr(0, 64)));

        char buf[INET6_ADDRSTRLEN];
        std::memcpy(buf, text.data(), text.size());
        buf[text.size()] = '\0';

        std::uint8_t raw[16] = {};
        if (::inet_pton(AF_INET, buf, raw) == 1)
        {
            IpAddress ip;
            ip.family_ = Family::kV4;
            std::copy(raw, raw + 4, ip.bytes_.begin());
            return ip;
        }
        if (::inet_pton(AF_INET6, buf, raw) == 1)
        {
            IpAddress ip;
            if (IsV4Mapped(raw))
            {
                ip.family_ = Family::kV4;
                std::copy(raw + 12, raw + 16, ip.bytes_.begin());
            }
            else
            {
                ip.family_ = Family::kV6;
                std::copy(raw, raw + 16, ip.bytes_.begin());
            }
            return ip;
        }
        return Status::Invalid("not an IP address: " + std::string(text));
    }

    IpAddress IpAddress::V4(const std::array<std::uint8_t, 4> &octets)
    {
        IpAddress ip;
        ip.family_ = Family::kV4;
        std::copy(octets.begin(), octets.end(), ip.bytes_.begin());
        return ip;
    }

    IpAddress IpAddress::V6(const std::array<std::uint8_t, 16> &octets)
    {
        IpAddress ip;
        ip.family_ = Family::kV6;
        ip.bytes_ = octets;
        return ip;
    }

    std::string IpAddress::ToString() const
    {
        char buf[INET6_ADDRSTRLEN] = {};
        const int af = is_v4() ? AF_INET : AF_INET6;
        if (!::inet_ntop(af, bytes_.data(), buf, sizeof(buf)))
            return {};
        return buf;
    }
} // namespace geoserve::net
