#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <geoserve/core/status.h>
#include <geoserve/db/generation.h>
#include <geoserve/util/logger.h>

namespace geoserve::storage
{
    struct RetentionEntry
    {
        std::uint64_t timestamp{0};
        std::string path;
        std::uint64_t size_bytes{0};
        bool is_active{false};
        // Set while this generation is loaded in memory.
        std::weak_ptr<const db::Generation> handle;
    };

    // Bookkeeping of the generations kept in the data directory:
    //   geoip-<build_epoch>.mmdb   one file per generation
    //   latest.mmdb                symlink to the active file
    // Entries are ordered newest first. The store is owned by the update
    // scheduler and is not thread-safe.
    class RetentionStore
    {
    public:
        static constexpr std::string_view kFilePrefix = "geoip-";
        static constexpr std::string_view kFileSuffix = ".mmdb";
        static constexpr std::string_view kLatestLink = "latest.mmdb";
        static constexpr std::string_view kTempSuffix = ".tmp";

        RetentionStore(std::string data_dir, std::size_t limit, Logger *log = nullptr);

        // Rebuilds the entry list from the directory contents and clears
        // leftover temporary files from an interrupted run.
        Status Load();

        // Adds a validated generation that is not active yet.
        Status Record(RetentionEntry entry);

        // Makes `timestamp` the active generation and repoints latest.mmdb.
        // The entry is marked active even when the link update fails.
        Status Promote(std::uint64_t timestamp, const db::GenerationHandle &handle);

        // Forgets `timestamp` and removes its file (deferred while in use).
        Status Evict(std::uint64_t timestamp);

        // Drops the oldest entries beyond the limit, never the active one
        // and never `keep_path`. Returns the paths that were evicted.
        std::vector<std::string> Prune(std::string_view keep_path = {});

        const std::vector<RetentionEntry> &entries() const noexcept { return entries_; }
        const RetentionEntry *Active() const;
        const RetentionEntry *Find(std::uint64_t timestamp) const;
        bool Contains(std::uint64_t timestamp) const { return Find(timestamp) != nullptr; }

        std::string PathFor(std::uint64_t timestamp) const;
        std::string TempPath(std::string_view tag) const;
        std::string LatestLinkPath() const;
        const std::string &data_dir() const noexcept { return data_dir_; }
        std::size_t limit() const noexcept { return limit_; }

        static std::optional<std::uint64_t> ParseGenerationName(std::string_view name);

    private:
        void Sort();
        bool RemoveFile(const RetentionEntry &entry);

        std::string data_dir_;
        std::size_t limit_;
        Logger *log_{nullptr};
        std::vector<RetentionEntry> entries_;
    };
} // namespace geoserve::storage
