#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <geoserve/core/status.h>
#include <geoserve/db/lookup_result.h>
#include <geoserve/format/data_value.h>
#include <geoserve/format/metadata.h>
#include <geoserve/format/search_tree.h>
#include <geoserve/net/ip_address.h>

namespace geoserve::util
{
    class PosixFile;
}

namespace geoserve::db
{
    class Generation;

    // Shared, read-only reference to one opened database generation.
    using GenerationHandle = std::shared_ptr<const Generation>;

    // One opened database file: the bytes (a read-only mapping, or an owned
    // buffer) plus the metadata and search tree derived from them. Immutable
    // once opened; lookups may run on it from any number of threads.
    class Generation
    {
    public:
        static Result<GenerationHandle> Open(const std::string &path);
        static Result<GenerationHandle> FromBuffer(std::vector<std::uint8_t> bytes, std::string label = "<memory>");

        ~Generation();

        Generation(const Generation &) = delete;
        Generation &operator=(const Generation &) = delete;

        Result<format::TreeMatch> Find(const net::IpAddress &ip) const;
        Result<format::DataValue> DecodeRecord(std::size_t data_offset) const;

        // Resolves `ip` to its city record. An empty optional means the
        // address is not covered; an error means the record is malformed.
        Result<std::optional<LookupResult>> Lookup(const net::IpAddress &ip,
                                                   std::string ip_text,
                                                   std::string_view language) const;

        const format::Metadata &metadata() const noexcept { return meta_; }
        const std::string &path() const noexcept { return path_; }
        std::uint64_t build_epoch() const noexcept { return meta_.build_epoch; }
        std::size_t size_bytes() const noexcept { return bytes_.size(); }
        std::span<const std::uint8_t> bytes() const noexcept { return bytes_; }

        // Called when the generation leaves retention while readers still
        // hold it: the backing file is unlinked once the last handle drops.
        void RetireFileOnRelease() const noexcept;
        bool retired() const noexcept { return retire_on_release_.load(std::memory_order_acquire); }

    private:
        Generation() = default;
        Status Init();

        std::string path_;
        std::unique_ptr<util::PosixFile> file_;
        std::vector<std::uint8_t> owned_;
        std::span<const std::uint8_t> bytes_;
        format::Metadata meta_;
        std::optional<format::SearchTree> tree_;
        mutable std::atomic<bool> retire_on_release_{false};
    };
} // namespace geoserve::db
