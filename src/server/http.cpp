#include <geoserve/server/http.h>

#include <cctype>
#include <strings.h>

namespace geoserve::server
{
    namespace
    {
        int HexValue(char c)
        {
            if (c >= '0' && c <= '9')
                return c - '0';
            if (c >= 'a' && c <= 'f')
                return c - 'a' + 10;
            if (c >= 'A' && c <= 'F')
                return c - 'A' + 10;
            return -1;
        }

        std::string_view TrimView(std::string_view s)
        {
            while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
                s.remove_prefix(1);
            while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r'))
                s.remove_suffix(1);
            return s;
        }

        bool IsToken(std::string_view s)
        {
            if (s.empty())
                return false;
            for (char c : s)
            {
                auto u = static_cast<unsigned char>(c);
                if (u <= 32 || u >= 127)
                    return false;
            }
            return true;
        }
    } // namespace

    std::optional<std::string> PercentDecode(std::string_view in)
    {
        std::string out;
        out.reserve(in.size());
        for (std::size_t i = 0; i < in.size(); ++i)
        {
            if (in[i] != '%')
            {
                out.push_back(in[i]);
                continue;
            }
            if (i + 2 >= in.size())
                return std::nullopt;
            int hi = HexValue(in[i + 1]);
            int lo = HexValue(in[i + 2]);
            if (hi < 0 || lo < 0)
                return std::nullopt;
            out.push_back(static_cast<char>((hi << 4) | lo));
            i += 2;
        }
        return out;
    }

    const std::string *HttpRequest::Header(std::string_view name) const
    {
        for (const auto &[k, v] : headers)
        {
            if (k.size() == name.size() && ::strncasecmp(k.data(), name.data(), name.size()) == 0)
                return &v;
        }
        return nullptr;
    }

    std::optional<std::string> HttpRequest::QueryParam(std::string_view name) const
    {
        std::string_view q(query);
        while (!q.empty())
        {
            auto amp = q.find('&');
            std::string_view pair = q.substr(0, amp);
            q = (amp == std::string_view::npos) ? std::string_view() : q.substr(amp + 1);

            auto eq = pair.find('=');
            if (eq == std::string_view::npos)
                continue;
            if (pair.substr(0, eq) == name)
                return PercentDecode(pair.substr(eq + 1));
        }
        return std::nullopt;
    }

    Result<HttpRequest> ParseHttpRequest(std::string_view head)
    {
        if (head.size() > kMaxRequestHead)
            return Status::Invalid("request head too large");

        HttpRequest req;
        auto eol = head.find("\r\n");
        if (eol == std::string_view::npos)
            return Status::Invalid("incomplete request line");
        std::string_view line = head.substr(0, eol);
        std::string_view rest = head.substr(eol + 2);

        auto sp1 = line.find(' ');
        auto sp2 = (sp1 == std::string_view::npos) ? sp1 : line.find(' ', sp1 + 1);
        if (sp1 == std::string_view::npos || sp2 == std::string_view::npos)
            return Status::Invalid("malformed request line");

        std::string_view method = line.substr(0, sp1);
        std::string_view target = line.substr(sp1 + 1, sp2 - sp1 - 1);
        std::string_view version = line.substr(sp2 + 1);
        if (!IsToken(method) || !IsToken(target) || version.substr(0, 5) != "HTTP/")
            return Status::Invalid("malformed request line");
        if (target.front() != '/')
            return Status::Invalid("unsupported request target");

        req.method = std::string(method);
        req.target = std::string(target);
        req.version = std::string(version);

        auto qmark = target.find('?');
        auto path = PercentDecode(target.substr(0, qmark));
        if (!path)
            return Status::Invalid("bad percent-encoding in path");
        req.path = std::move(*path);
        if (qmark != std::string_view::npos)
            req.query = std::string(target.substr(qmark + 1));

        while (!rest.empty())
        {
            eol = rest.find("\r\n");
            std::string_view h = rest.substr(0, eol);
            rest = (eol == std::string_view::npos) ? std::string_view() : rest.substr(eol + 2);
            if (h.empty())
                break;

            auto colon = h.find(':');
            if (colon == std::string_view::npos || colon == 0)
                return Status::Invalid("malformed header line");
            std::string_view name = h.substr(0, colon);
            if (!IsToken(name))
                return Status::Invalid("malformed header name");
            req.headers.emplace_back(std::string(name), std::string(TrimView(h.substr(colon + 1))));
        }
        return req;
    }

    const char *ReasonPhrase(int status) noexcept
    {
        switch (status)
        {
        case 200:
            return "OK";
        case 400:
            return "Bad Request";
        case 401:
            return "Unauthorized";
        case 403:
            return "Forbidden";
        case 404:
            return "Not Found";
        case 405:
            return "Method Not Allowed";
        case 431:
            return "Request Header Fields Too Large";
        case 500:
            return "Internal Server Error";
        case 503:
            return "Service Unavailable";
        default:
            return "Unknown";
        }
    }

    std::string SerializeResponse(const HttpResponse &resp)
    {
        std::string out;
        out.reserve(128 + resp.body.size());
        out += "HTTP/1.1 ";
        out += std::to_string(resp.status);
        out += ' ';
        out += ReasonPhrase(resp.status);
        out += "\r\nContent-Type: ";
        out += resp.content_type;
        out += "\r\nContent-Length: ";
        out += std::to_string(resp.body.size());
        if (resp.status == 405)
            out += "\r\nAllow: GET";
        out += "\r\nConnection: close\r\n\r\n";
        out += resp.body;
        return out;
    }
} // namespace geoserve::server
