#pragma once
#include <string>
#include <string_view>
#include <vector>

#include <geoserve/server/http.h>
#include <geoserve/service/lookup_service.h>
#include <geoserve/util/logger.h>

namespace geoserve::server
{
    // Host allow-list and optional API key applied to lookup routes.
    struct AccessPolicy
    {
        // Lower-case; a leading '*' matches by suffix ("*.example.com").
        std::vector<std::string> allowed_hosts;
        // Empty disables the key check.
        std::string api_key;

        // `host_header` is the raw Host value; the port is ignored.
        bool HostAllowed(std::string_view host_header) const;
        bool KeyAccepted(const HttpRequest &req) const;
    };

    class Router
    {
    public:
        Router(const service::LookupService *lookup, AccessPolicy policy, Logger *log = nullptr)
            : lookup_(lookup), policy_(std::move(policy)), log_(log) {}

        HttpResponse Handle(const HttpRequest &req) const;

    private:
        HttpResponse HandleLookup(std::string_view ip_text) const;

        const service::LookupService *lookup_;
        AccessPolicy policy_;
        Logger *log_;
    };
} // namespace geoserve::server
