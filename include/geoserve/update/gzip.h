#pragma once

#include <string>

#include <geoserve/core/status.h>

namespace geoserve::update
{
    // True when the file starts with the gzip magic 1f 8b.
    bool LooksGzip(const std::string &path);

    // Inflates `src` into `dst`. `dst` is removed on failure.
    Status InflateGzipFile(const std::string &src, const std::string &dst);
} // namespace geoserve::update
