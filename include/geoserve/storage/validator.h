#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <geoserve/core/status.h>
#include <geoserve/format/metadata.h>
#include <geoserve/util/logger.h>

namespace geoserve::storage
{
    struct ValidatorOptions
    {
        // Absolute floor for a candidate file.
        std::uint64_t min_file_size = 1024 * 1024;
        // Candidate must be at least this fraction of the active generation.
        double min_size_ratio = 0.5;
        // Addresses walked and decoded as a structural smoke test.
        std::vector<std::string> probe_addresses{"1.1.1.1", "8.8.8.8", "2001:4860:4860::8888"};
    };

    // Gatekeeper between a downloaded file and activation. Checks run in
    // order and stop at the first failure: size floor, size relative to the
    // active generation, metadata block, probe lookups.
    class Validator
    {
    public:
        explicit Validator(ValidatorOptions opt, Logger *log = nullptr) : opt_(std::move(opt)), log_(log) {}

        // Non-destructive check of `path`.
        Result<format::Metadata> Inspect(const std::string &path, std::optional<std::uint64_t> active_size) const;

        // Inspect(), and remove the candidate file when it is rejected.
        Result<format::Metadata> Validate(const std::string &path, std::optional<std::uint64_t> active_size) const;

        const ValidatorOptions &options() const noexcept { return opt_; }

    private:
        Status CheckSize(std::uint64_t size, std::optional<std::uint64_t> active_size) const;

        ValidatorOptions opt_;
        Logger *log_{nullptr};
    };
} // namespace geoserve::storage
