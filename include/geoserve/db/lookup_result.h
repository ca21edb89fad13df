#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <geoserve/format/data_value.h>

namespace geoserve::db
{
    // Location fields projected from one city record. Only `ip` is always
    // set; a field the record does not carry stays empty.
    struct LookupResult
    {
        std::string ip;
        std::optional<std::string> city;
        std::optional<std::string> subdivision;
        std::optional<std::string> country;
        std::optional<std::string> country_code;
        std::optional<std::string> continent;
        std::optional<std::string> continent_code;
        std::optional<double> latitude;
        std::optional<double> longitude;
        std::optional<std::string> timezone;
        std::optional<std::uint16_t> accuracy_radius;

        bool operator==(const LookupResult &) const = default;
    };

    // Maps a GeoIP2/DB-IP city record onto a LookupResult, taking localized
    // names in `language`.
    LookupResult ProjectCityRecord(const format::DataValue &record, std::string ip, std::string_view language);
} // namespace geoserve::db
