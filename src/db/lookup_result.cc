#include <geoserve/db/lookup_result.h>

#include <initializer_list>
#include <limits>

namespace geoserve::db
{
    namespace
    {
        using format::DataValue;

        const DataValue *Walk(const DataValue &root, std::initializer_list<std::string_view> path)
        {
            const DataValue *cur = &root;
            for (auto key : path)
            {
                cur = cur->Find(key);
                if (!cur)
                    return nullptr;
            }
            return cur;
        }

        std::optional<std::string> StringAt(const DataValue *v)
        {
            if (!v || !v->AsString())
                return std::nullopt;
            return *v->AsString();
        }

        std::optional<std::string> LocalName(const DataValue *entity, std::string_view language)
        {
            if (!entity)
                return std::nullopt;
            const DataValue *names = entity->Find("names");
            if (!names)
                return std::nullopt;
            return StringAt(names->Find(language));
        }
    } // namespace

    LookupResult ProjectCityRecord(const format::DataValue &record, std::string ip, std::string_view language)
    {
        LookupResult r;
        r.ip = std::move(ip);

        r.city = LocalName(record.Find("city"), language);

        if (const DataValue *subs = record.Find("subdivisions"))
            r.subdivision = LocalName(subs->At(0), language);

        const DataValue *country = record.Find("country");
        r.country = LocalName(country, language);
        if (country)
            r.country_code = StringAt(country->Find("iso_code"));

        const DataValue *continent = record.Find("continent");
        r.continent = LocalName(continent, language);
        if (continent)
            r.continent_code = StringAt(continent->Find("code"));

        if (const DataValue *lat = Walk(record, {"location", "latitude"}))
            r.latitude = lat->AsDouble();
        if (const DataValue *lon = Walk(record, {"location", "longitude"}))
            r.longitude = lon->AsDouble();
        r.timezone = StringAt(Walk(record, {"location", "time_zone"}));
        if (const DataValue *acc = Walk(record, {"location", "accuracy_radius"}))
        {
            auto u = acc->AsUnsigned();
            if (u && *u <= std::numeric_limits<std::uint16_t>::max())
                r.accuracy_radius = static_cast<std::uint16_t>(*u);
        }
        return r;
    }
} // namespace geoserve::db
