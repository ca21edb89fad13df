#include <geoserve/core/status.h>

namespace geoserve
{
    const char *ErrcName(GeoErrc code) noexcept
    {
        switch (code)
        {
        case GeoErrc::Ok:
            return "OK";
        case GeoErrc::InvalidArgument:
            return "InvalidArgument";
        case GeoErrc::NotFound:
            return "NotFound";
        case GeoErrc::AlreadyExists:
            return "AlreadyExists";
        case GeoErrc::Corruption:
            return "Corruption";
        case GeoErrc::IoError:
            return "IoError";
        case GeoErrc::Timeout:
            return "Timeout";
        case GeoErrc::Cancelled:
            return "Cancelled";
        case GeoErrc::Unavailable:
            return "Unavailable";
        case GeoErrc::Busy:
            return "Busy";
        case GeoErrc::Internal:
            return "Internal";
        }
        return "Unknown";
    }

    std::string Status::ToString() const
    {
        if (ok())
            return "OK";
        std::string s = ErrcName(code);
        if (!msg.empty())
        {
            s += ": ";
            s += msg;
        }
        return s;
    }
} // namespace geoserve
