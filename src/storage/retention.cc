#include <geoserve/storage/retention.h>

#include <geoserve/storage/file_util.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace geoserve::storage
{
    RetentionStore::RetentionStore(std::string data_dir, std::size_t limit, Logger *log)
        : data_dir_(std::move(data_dir)), limit_(limit == 0 ? 1 : limit), log_(log)
    {
    }

    std::optional<std::uint64_t> RetentionStore::ParseGenerationName(std::string_view name)
    {
        if (name.size() <= kFilePrefix.size() + kFileSuffix.size())
            return std::nullopt;
        if (name.substr(0, kFilePrefix.size()) != kFilePrefix)
            return std::nullopt;
        if (name.substr(name.size() - kFileSuffix.size()) != kFileSuffix)
            return std::nullopt;

        std::string_view digits = name.substr(kFilePrefix.size(), name.size() - kFilePrefix.size() - kFileSuffix.size());
        if (!std::all_of(digits.begin(), digits.end(), [](char c)
                         { return std::isdigit(static_cast<unsigned char>(c)) != 0; }))
            return std::nullopt;

        std::uint64_t ts = 0;
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), ts);
        if (ec != std::errc() || ptr != digits.data() + digits.size())
            return std::nullopt;
        return ts;
    }

    std::string RetentionStore::PathFor(std::uint64_t timestamp) const
    {
        return data_dir_ + "/" + std::string(kFilePrefix) + std::to_string(timestamp) + std::string(kFileSuffix);
    }

    std::string RetentionStore::TempPath(std::string_view tag) const
    {
        return data_dir_ + "/" + std::string(tag) + std::string(kTempSuffix);
    }

    std::string RetentionStore::LatestLinkPath() const
    {
        return data_dir_ + "/" + std::string(kLatestLink);
    }

    void RetentionStore::Sort()
    {
        std::sort(entries_.begin(), entries_.end(), [](const RetentionEntry &a, const RetentionEntry &b)
                  { return a.timestamp > b.timestamp; });
    }

    Status RetentionStore::Load()
    {
        Status st = EnsureDirExists(data_dir_);
        if (!st.ok())
            return st;

        entries_.clear();

        std::optional<std::uint64_t> active_ts;
        std::error_code ec;
        const fs::path link(LatestLinkPath());
        if (fs::is_symlink(fs::symlink_status(link, ec)))
        {
            fs::path target = fs::read_symlink(link, ec);
            if (!ec)
                active_ts = ParseGenerationName(target.filename().string());
        }

        fs::directory_iterator it(data_dir_, ec);
        if (ec)
            return Status::Io("list " + data_dir_ + ": " + ec.message());

        for (const auto &dirent : it)
        {
            const std::string name = dirent.path().filename().string();

            if (name.size() > kTempSuffix.size() && name.ends_with(kTempSuffix))
            {
                if (log_)
                    log_->Info("retention.load", "removing leftover temporary file " + name);
                RemoveIfExists(dirent.path().string());
                continue;
            }

            auto ts = ParseGenerationName(name);
            if (!ts)
                continue;
            std::error_code fec;
            if (!dirent.is_regular_file(fec))
                continue;

            RetentionEntry e;
            e.timestamp = *ts;
            e.path = dirent.path().string();
            e.size_bytes = static_cast<std::uint64_t>(dirent.file_size(fec));
            e.is_active = active_ts && *active_ts == *ts;
            entries_.push_back(std::move(e));
        }
        Sort();

        if (log_)
            log_->Info("retention.load", "found " + std::to_string(entries_.size()) + " generation(s) in " + data_dir_);
        return Status::Ok();
    }

    Status RetentionStore::Record(RetentionEntry entry)
    {
        if (Contains(entry.timestamp))
            return Status::Exists("generation " + std::to_string(entry.timestamp) + " is already retained");
        entry.is_active = false;
        entries_.push_back(std::move(entry));
        Sort();
        return Status::Ok();
    }

    Status RetentionStore::Promote(std::uint64_t timestamp, const db::GenerationHandle &handle)
    {
        auto it = std::find_if(entries_.begin(), entries_.end(), [&](const RetentionEntry &e)
                               { return e.timestamp == timestamp; });
        if (it == entries_.end())
            return Status::NotFound("generation " + std::to_string(timestamp) + " is not retained");

        for (auto &e : entries_)
        {
            if (e.is_active && e.timestamp != timestamp)
                e.is_active = false;
        }
        it->is_active = true;
        it->handle = handle;

        const std::string target = fs::path(it->path).filename().string();
        return AtomicSymlink(target, LatestLinkPath());
    }

    Status RetentionStore::Evict(std::uint64_t timestamp)
    {
        auto it = std::find_if(entries_.begin(), entries_.end(), [&](const RetentionEntry &e)
                               { return e.timestamp == timestamp; });
        if (it == entries_.end())
            return Status::NotFound("generation " + std::to_string(timestamp) + " is not retained");

        RetentionEntry entry = std::move(*it);
        entries_.erase(it);
        if (!RemoveFile(entry))
            return Status::Io("could not remove " + entry.path);
        return Status::Ok();
    }

    const RetentionEntry *RetentionStore::Active() const
    {
        for (const auto &e : entries_)
            if (e.is_active)
                return &e;
        return nullptr;
    }

    const RetentionEntry *RetentionStore::Find(std::uint64_t timestamp) const
    {
        for (const auto &e : entries_)
            if (e.timestamp == timestamp)
                return &e;
        return nullptr;
    }

    bool RetentionStore::RemoveFile(const RetentionEntry &entry)
    {
        if (auto gen = entry.handle.lock())
        {
            gen->RetireFileOnRelease();
            if (log_)
                log_->Info("retention.prune", "deferring removal of in-use generation " + entry.path);
            return true;
        }
        if (!RemoveIfExists(entry.path))
        {
            if (log_)
                log_->Warn("retention.prune", "failed to remove " + entry.path);
            return false;
        }
        if (log_)
            log_->Info("retention.prune", "removed generation " + entry.path);
        return true;
    }

    std::vector<std::string> RetentionStore::Prune(std::string_view keep_path)
    {
        std::vector<std::string> removed;
        const RetentionEntry *active = Active();
        const std::string active_path = active ? active->path : std::string();

        while (entries_.size() > limit_)
        {
            // Oldest first, skipping the active entry.
            auto victim = entries_.end();
            for (auto it = entries_.rbegin(); it != entries_.rend(); ++it)
            {
                if (!it->is_active && it->path != active_path && it->path != keep_path)
                {
                    victim = std::next(it).base();
                    break;
                }
            }
            if (victim == entries_.end())
                break;

            RetentionEntry entry = std::move(*victim);
            entries_.erase(victim);
            if (RemoveFile(entry))
                removed.push_back(entry.path);
        }
        return removed;
    }
} // namespace geoserve::storage
