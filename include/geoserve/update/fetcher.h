#pragma once

#include <atomic>
#include <string>

#include <geoserve/core/status.h>

namespace geoserve::update
{
    // Retrieves a remote artifact into a local file. On failure no partial
    // file is left at `dest_path`.
    class Fetcher
    {
    public:
        virtual ~Fetcher() = default;
        virtual Status Fetch(const std::string &url, const std::string &dest_path,
                             const std::atomic<bool> &cancel) = 0;
    };

    struct CurlFetcherOptions
    {
        long timeout_ms = 300000;
        long connect_timeout_ms = 15000;
        std::string user_agent = "geoserve/1.0";
    };

    class CurlFetcher final : public Fetcher
    {
    public:
        explicit CurlFetcher(CurlFetcherOptions opt = {}) : opt_(std::move(opt)) {}

        Status Fetch(const std::string &url, const std::string &dest_path,
                     const std::atomic<bool> &cancel) override;

    private:
        CurlFetcherOptions opt_;
    };
} // namespace geoserve::update
