#include <geoserve/server/router.h>

#include <geoserve/server/json_writer.h>

#include <algorithm>
#include <cctype>

namespace geoserve::server
{
    namespace
    {
        std::string HostWithoutPort(std::string_view host)
        {
            std::string_view h = host;
            if (!h.empty() && h.front() == '[')
            {
                auto close = h.find(']');
                h = (close == std::string_view::npos) ? h.substr(1) : h.substr(1, close - 1);
            }
            else
            {
                h = h.substr(0, h.find(':'));
            }
            std::string out(h);
            std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return out;
        }

        HttpResponse Json(int status, std::string body)
        {
            HttpResponse resp;
            resp.status = status;
            resp.body = std::move(body);
            return resp;
        }
    } // namespace

    bool AccessPolicy::HostAllowed(std::string_view host_header) const
    {
        const std::string host = HostWithoutPort(host_header);
        if (host.empty())
            return false;

        for (const auto &allowed : allowed_hosts)
        {
            if (!allowed.empty() && allowed.front() == '*')
            {
                std::string_view suffix = std::string_view(allowed).substr(1);
                if (host.size() >= suffix.size() && host.compare(host.size() - suffix.size(), suffix.size(), suffix) == 0)
                    return true;
            }
            else if (host == allowed)
            {
                return true;
            }
        }
        return false;
    }

    bool AccessPolicy::KeyAccepted(const HttpRequest &req) const
    {
        if (api_key.empty())
            return true;

        if (const std::string *auth = req.Header("Authorization"))
        {
            constexpr std::string_view kBearer = "Bearer ";
            if (auth->size() > kBearer.size() && std::string_view(*auth).substr(0, kBearer.size()) == kBearer)
                return auth->substr(kBearer.size()) == api_key;
        }
        if (const std::string *key = req.Header("X-API-Key"))
            return *key == api_key;
        if (auto key = req.QueryParam("api_key"))
            return *key == api_key;
        return false;
    }

    HttpResponse Router::Handle(const HttpRequest &req) const
    {
        if (req.method != "GET")
            return Json(405, ErrorJson("method not allowed"));

        if (req.path == "/health")
            return Json(200, "{\"status\":\"healthy\"}");

        std::string_view ip_text = std::string_view(req.path).substr(1);
        if (ip_text.empty() || ip_text.find('/') != std::string_view::npos)
            return Json(404, ErrorJson("not found"));

        const std::string *host = req.Header("Host");
        if (host == nullptr || !policy_.HostAllowed(*host))
        {
            if (log_)
                log_->Debug("http.forbidden", "host " + (host ? *host : std::string("<none>")) + " not allowed");
            return Json(403, ErrorJson("forbidden"));
        }
        if (!policy_.KeyAccepted(req))
            return Json(401, ErrorJson("unauthorized"));

        return HandleLookup(ip_text);
    }

    HttpResponse Router::HandleLookup(std::string_view ip_text) const
    {
        service::LookupResponse r = lookup_->Lookup(ip_text);
        switch (r.status)
        {
        case service::LookupStatus::kFound:
            return Json(200, LookupResultToJson(*r.result));
        case service::LookupStatus::kNotFound:
            return Json(404, ErrorJson(r.error));
        case service::LookupStatus::kInvalid:
            return Json(400, ErrorJson(r.error));
        case service::LookupStatus::kUnavailable:
            return Json(503, ErrorJson(r.error));
        case service::LookupStatus::kInternal:
            break;
        }
        return Json(500, ErrorJson(r.error.empty() ? "internal error" : r.error));
    }
} // namespace geoserve::server
