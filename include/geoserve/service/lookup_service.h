#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <geoserve/db/active_slot.h>
#include <geoserve/db/lookup_result.h>
#include <geoserve/util/logger.h>

namespace geoserve::service
{
    enum class LookupStatus : std::uint8_t
    {
        kFound,
        kNotFound,
        kInvalid,
        kUnavailable,
        kInternal
    };

    const char *LookupStatusName(LookupStatus s) noexcept;

    struct LookupResponse
    {
        LookupStatus status{LookupStatus::kInternal};
        std::optional<db::LookupResult> result;
        std::string error;
    };

    class LookupService
    {
    public:
        LookupService(const db::ActiveSlot *slot, std::string language, Logger *log = nullptr)
            : slot_(slot), language_(std::move(language)), log_(log) {}

        // Safe to call from any number of threads, including while the slot
        // is being swapped.
        LookupResponse Lookup(std::string_view ip_text) const;

        const std::string &language() const noexcept { return language_; }

    private:
        const db::ActiveSlot *slot_;
        std::string language_;
        Logger *log_;
    };
} // namespace geoserve::service
