#include <geoserve/service/lookup_service.h>

#include <geoserve/net/ip_address.h>

namespace geoserve::service
{
    const char *LookupStatusName(LookupStatus s) noexcept
    {
        switch (s)
        {
        case LookupStatus::kFound:
            return "found";
        case LookupStatus::kNotFound:
            return "not_found";
        case LookupStatus::kInvalid:
            return "invalid";
        case LookupStatus::kUnavailable:
            return "unavailable";
        case LookupStatus::kInternal:
            return "internal";
        }
        return "unknown";
    }

    LookupResponse LookupService::Lookup(std::string_view ip_text) const
    {
        LookupResponse resp;

        auto ip = net::IpAddress::Parse(ip_text);
        if (!ip.ok())
        {
            resp.status = LookupStatus::kInvalid;
            resp.error = "invalid IP address";
            return resp;
        }

        db::GenerationHandle gen = slot_->Get();
        if (!gen)
        {
            resp.status = LookupStatus::kUnavailable;
            resp.error = "database not loaded";
            return resp;
        }

        auto found = gen->Lookup(ip.value(), std::string(ip_text), language_);
        if (!found.ok())
        {
            if (log_)
                log_->Error("lookup.decode", std::string(ip_text) + " in " + gen->path() + ": " + found.status().ToString());
            resp.status = LookupStatus::kInternal;
            resp.error = "internal error";
            return resp;
        }

        if (!found.value())
        {
            resp.status = LookupStatus::kNotFound;
            resp.error = "IP address not found in database";
            return resp;
        }

        resp.status = LookupStatus::kFound;
        resp.result = std::move(*found.value());
        return resp;
    }
} // namespace geoserve::service
