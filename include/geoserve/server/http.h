#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <geoserve/core/status.h>

namespace geoserve::server
{
    // Upper bound on the request line plus headers.
    inline constexpr std::size_t kMaxRequestHead = 16 * 1024;

    struct HttpRequest
    {
        std::string method;
        std::string target;
        // Percent-decoded path and the raw query string (without '?').
        std::string path;
        std::string query;
        std::string version;
        std::vector<std::pair<std::string, std::string>> headers;

        // Case-insensitive header lookup; first match wins.
        const std::string *Header(std::string_view name) const;
        std::optional<std::string> QueryParam(std::string_view name) const;
    };

    struct HttpResponse
    {
        int status{200};
        std::string content_type{"application/json"};
        std::string body;
    };

    // Parses the request line and headers. `head` ends at (and may include)
    // the blank line; request bodies are not read.
    Result<HttpRequest> ParseHttpRequest(std::string_view head);

    std::string SerializeResponse(const HttpResponse &resp);
    const char *ReasonPhrase(int status) noexcept;
    std::optional<std::string> PercentDecode(std::string_view in);
} // namespace geoserve::server
