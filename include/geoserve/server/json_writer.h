#pragma once
#include <string>
#include <string_view>

#include <geoserve/db/lookup_result.h>

namespace geoserve::server
{
    void AppendJsonString(std::string &out, std::string_view s);
    void AppendJsonNumber(std::string &out, double v);

    // Absent optional fields are left out of the object.
    std::string LookupResultToJson(const db::LookupResult &r);
    std::string ErrorJson(std::string_view message);
} // namespace geoserve::server
