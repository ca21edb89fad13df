#include <geoserve/server/json_writer.h>

#include <charconv>
#include <cmath>
#include <cstdio>

namespace geoserve::server
{
    void AppendJsonString(std::string &out, std::string_view s)
    {
        out.push_back('"');
        for (char c : s)
        {
            switch (c)
            {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\b':
                out += "\\b";
                break;
            case '\f':
                out += "\\f";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20)
                {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                }
                else
                {
                    out.push_back(c);
                }
            }
        }
        out.push_back('"');
    }

    void AppendJsonNumber(std::string &out, double v)
    {
        if (!std::isfinite(v))
        {
            out += "null";
            return;
        }
        char buf[32];
        auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
        if (ec != std::errc())
        {
            out += "null";
            return;
        }
        out.append(buf, ptr);
    }

    namespace
    {
        class ObjectWriter
        {
        public:
            explicit ObjectWriter(std::string &out) : out_(out) { out_.push_back('{'); }

            void Key(std::string_view k)
            {
                if (!first_)
                    out_.push_back(',');
                first_ = false;
                AppendJsonString(out_, k);
                out_.push_back(':');
            }

            void Field(std::string_view k, const std::optional<std::string> &v)
            {
                if (!v)
                    return;
                Key(k);
                AppendJsonString(out_, *v);
            }

            void Field(std::string_view k, const std::optional<double> &v)
            {
                if (!v)
                    return;
                Key(k);
                AppendJsonNumber(out_, *v);
            }

            void Field(std::string_view k, const std::optional<std::uint16_t> &v)
            {
                if (!v)
                    return;
                Key(k);
                out_ += std::to_string(*v);
            }

            void Close() { out_.push_back('}'); }

        private:
            std::string &out_;
            bool first_{true};
        };
    } // namespace

    std::string LookupResultToJson(const db::LookupResult &r)
    {
        std::string out;
        out.reserve(256);
        ObjectWriter w(out);
        w.Key("ip");
        AppendJsonString(out, r.ip);
        w.Field("city", r.city);
        w.Field("subdivision", r.subdivision);
        w.Field("country", r.country);
        w.Field("country_code", r.country_code);
        w.Field("continent", r.continent);
        w.Field("continent_code", r.continent_code);
        w.Field("latitude", r.latitude);
        w.Field("longitude", r.longitude);
        w.Field("timezone", r.timezone);
        w.Field("accuracy_radius", r.accuracy_radius);
        w.Close();
        return out;
    }

    std::string ErrorJson(std::string_view message)
    {
        std::string out = "{\"error\":";
        AppendJsonString(out, message);
        out.push_back('}');
        return out;
    }
} // namespace geoserve::server
