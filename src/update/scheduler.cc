#include <geoserve/update/scheduler.h>

#include <geoserve/db/generation.h>
#include <geoserve/storage/file_util.h>
#include <geoserve/update/gzip.h>

#include <algorithm>
#include <cstdio>
#include <ctime>
#include <optional>
#include <vector>

namespace geoserve::update
{
    namespace
    {
        void ReplaceAll(std::string &s, std::string_view from, std::string_view to)
        {
            std::size_t pos = 0;
            while ((pos = s.find(from, pos)) != std::string::npos)
            {
                s.replace(pos, from.size(), to);
                pos += to.size();
            }
        }
    } // namespace

    const char *UpdateStateName(UpdateState s) noexcept
    {
        switch (s)
        {
        case UpdateState::kIdle:
            return "idle";
        case UpdateState::kDownloading:
            return "downloading";
        case UpdateState::kValidating:
            return "validating";
        case UpdateState::kActivating:
            return "activating";
        case UpdateState::kPruning:
            return "pruning";
        }
        return "unknown";
    }

    UpdateScheduler::UpdateScheduler(SchedulerOptions opt,
                                     std::string data_dir,
                                     db::ActiveSlot *slot,
                                     std::unique_ptr<Fetcher> fetcher,
                                     Logger *log)
        : opt_(std::move(opt)),
          slot_(slot),
          fetcher_(std::move(fetcher)),
          log_(log),
          validator_(opt_.validator, log),
          retention_(std::move(data_dir), opt_.retain_count, log)
    {
    }

    UpdateScheduler::~UpdateScheduler()
    {
        Stop();
    }

    std::string UpdateScheduler::ResolveSourceUrl(std::string_view tmpl, std::chrono::system_clock::time_point now)
    {
        const std::time_t t = std::chrono::system_clock::to_time_t(now);
        std::tm tm{};
        gmtime_r(&t, &tm);

        char year[8];
        char month[4];
        std::snprintf(year, sizeof(year), "%04d", tm.tm_year + 1900);
        std::snprintf(month, sizeof(month), "%02d", tm.tm_mon + 1);

        std::string url(tmpl);
        ReplaceAll(url, "{year}", year);
        ReplaceAll(url, "{month}", month);
        return url;
    }

    Status UpdateScheduler::Activate(std::uint64_t epoch, const std::string &path, std::size_t size_bytes, bool record)
    {
        auto gen = db::Generation::Open(path);
        if (!gen.ok())
            return gen.status();
        db::GenerationHandle handle = gen.move_value();

        if (record)
        {
            storage::RetentionEntry entry;
            entry.timestamp = epoch;
            entry.path = path;
            entry.size_bytes = size_bytes;
            entry.handle = handle;
            Status st = retention_.Record(std::move(entry));
            if (!st.ok())
                return st;
        }

        db::GenerationHandle previous = slot_->Swap(handle);

        Status st = retention_.Promote(epoch, handle);
        if (!st.ok() && log_)
            log_->Warn("update.activate", "serving " + path + " but could not update latest link: " + st.ToString());

        if (log_)
        {
            std::string msg = "activated build_epoch=" + std::to_string(epoch) + " from " + path;
            if (previous)
                msg += " (replaced build_epoch=" + std::to_string(previous->build_epoch()) + ")";
            log_->Info("update.activate", msg);
        }
        return Status::Ok();
    }

    Status UpdateScheduler::ActivateRetained()
    {
        // The generation latest.mmdb names goes first, then newest first.
        std::vector<storage::RetentionEntry> candidates = retention_.entries();
        std::stable_partition(candidates.begin(), candidates.end(), [](const storage::RetentionEntry &e)
                              { return e.is_active; });

        for (const auto &e : candidates)
        {
            auto md = validator_.Inspect(e.path, std::nullopt);
            if (!md.ok())
            {
                if (log_)
                    log_->Warn("bootstrap.retained", "evicting " + e.path + ": " + md.status().ToString());
                EvictRetained(e.timestamp);
                continue;
            }
            if (md.value().build_epoch != e.timestamp && log_)
                log_->Warn("bootstrap.retained", e.path + " reports build_epoch=" + std::to_string(md.value().build_epoch));

            Status st = Activate(e.timestamp, e.path, e.size_bytes, false);
            if (st.ok())
                return st;
            if (log_)
                log_->Warn("bootstrap.retained", "evicting " + e.path + ", could not activate: " + st.ToString());
            EvictRetained(e.timestamp);
        }
        return Status::NotFound("no usable retained generation in " + retention_.data_dir());
    }

    void UpdateScheduler::EvictRetained(std::uint64_t epoch)
    {
        Status st = retention_.Evict(epoch);
        if (!st.ok() && log_)
            log_->Warn("retention.evict", st.ToString());
    }

    void UpdateScheduler::PruneRetained()
    {
        SetState(UpdateState::kPruning);
        db::GenerationHandle serving = slot_->Get();
        retention_.Prune(serving ? std::string_view(serving->path()) : std::string_view());
    }

    Status UpdateScheduler::Bootstrap()
    {
        Status st = retention_.Load();
        if (!st.ok())
            return st;

        st = ActivateRetained();
        if (st.ok())
        {
            PruneRetained();
            SetState(UpdateState::kIdle);
            return st;
        }
        if (log_)
            log_->Info("bootstrap.download", "no retained generation, downloading initial database");

        const std::uint32_t attempts = std::max<std::uint32_t>(1, opt_.bootstrap_attempts);
        std::chrono::milliseconds backoff = opt_.bootstrap_backoff;
        Status last = Status::Unavailable("bootstrap did not run");

        for (std::uint32_t attempt = 1; attempt <= attempts; ++attempt)
        {
            auto r = RunOnce();
            if (r.ok() && !slot_->empty())
                return Status::Ok();
            last = r.ok() ? Status::Unavailable("update finished without an active generation") : r.status();

            if (log_)
                log_->Warn("bootstrap.download", "attempt " + std::to_string(attempt) + "/" +
                                                     std::to_string(attempts) + " failed: " + last.ToString());

            if (attempt == attempts)
                break;
            if (!SleepFor(backoff))
                return Status::Cancelled("bootstrap cancelled");
            backoff = std::min(backoff * 2, opt_.bootstrap_backoff_max);
        }

        return Status::Unavailable("bootstrap failed after " + std::to_string(attempts) +
                                   " attempt(s): " + last.ToString());
    }

    Result<UpdateOutcome> UpdateScheduler::RunOnce()
    {
        if (in_flight_.exchange(true, std::memory_order_acq_rel))
            return Status::Busy("update already in progress");

        auto r = RunPipeline();

        SetState(UpdateState::kIdle);
        in_flight_.store(false, std::memory_order_release);

        if (!r.ok() && log_)
            log_->Error("update.run", r.status().ToString());
        return r;
    }

    Result<UpdateOutcome> UpdateScheduler::RunPipeline()
    {
        const std::string url = ResolveSourceUrl(opt_.source_url, std::chrono::system_clock::now());
        db::GenerationHandle active = slot_->Get();

        if (active && url == last_activated_url_)
        {
            if (log_)
                log_->Info("update.skip", "active generation already came from " + url);
            return UpdateOutcome::kUpToDate;
        }

        SetState(UpdateState::kDownloading);
        const std::string seq = std::to_string(++download_seq_);
        const std::string download_path = retention_.TempPath("download-" + seq);
        if (log_)
            log_->Info("update.download", "fetching " + url);

        Status st = fetcher_->Fetch(url, download_path, cancel_);
        if (!st.ok())
        {
            storage::RemoveIfExists(download_path);
            return st;
        }

        std::string candidate = download_path;
        if (LooksGzip(download_path))
        {
            const std::string inflated = retention_.TempPath("inflate-" + seq);
            st = InflateGzipFile(download_path, inflated);
            storage::RemoveIfExists(download_path);
            if (!st.ok())
                return st;
            candidate = inflated;
        }

        SetState(UpdateState::kValidating);
        std::optional<std::uint64_t> active_size;
        if (active)
            active_size = active->size_bytes();

        auto md = validator_.Validate(candidate, active_size);
        if (!md.ok())
            return md.status();
        const std::uint64_t epoch = md.value().build_epoch;

        if (active && epoch <= active->build_epoch())
        {
            storage::RemoveIfExists(candidate);
            if (active && epoch == active->build_epoch())
                last_activated_url_ = url;
            if (log_)
                log_->Info("update.skip", "build_epoch=" + std::to_string(epoch) + " is not newer than the active one");
            return UpdateOutcome::kUpToDate;
        }

        // A retained file of this epoch that is not serving gets replaced,
        // unless readers still hold it and its unlink is pending.
        if (const storage::RetentionEntry *stale = retention_.Find(epoch))
        {
            if (!stale->handle.expired())
            {
                storage::RemoveIfExists(candidate);
                return UpdateOutcome::kUpToDate;
            }
            if (log_)
                log_->Warn("update.replace", "replacing retained " + retention_.PathFor(epoch));
            Status evicted = retention_.Evict(epoch);
            if (!evicted.ok())
            {
                storage::RemoveIfExists(candidate);
                return evicted;
            }
        }

        SetState(UpdateState::kActivating);
        const std::string final_path = retention_.PathFor(epoch);
        auto size = storage::FileSize(candidate);
        if (!size.ok())
        {
            storage::RemoveIfExists(candidate);
            return size.status();
        }
        st = storage::AtomicRename(candidate, final_path);
        if (!st.ok())
        {
            storage::RemoveIfExists(candidate);
            return st;
        }

        st = Activate(epoch, final_path, size.value(), true);
        if (!st.ok())
        {
            storage::RemoveIfExists(final_path);
            return st;
        }
        last_activated_url_ = url;

        PruneRetained();
        return UpdateOutcome::kActivated;
    }

    bool UpdateScheduler::SleepFor(std::chrono::milliseconds d)
    {
        std::unique_lock<std::mutex> lk(mu_);
        return !cv_.wait_for(lk, d, [this]
                             { return stop_requested_; });
    }

    void UpdateScheduler::Start()
    {
        if (running_.exchange(true, std::memory_order_acq_rel))
            return;

        {
            std::lock_guard<std::mutex> lk(mu_);
            stop_requested_ = false;
        }
        cancel_.store(false, std::memory_order_release);

        th_ = std::thread([this]
                          { Loop(); });
        if (log_)
            log_->Info("update.start", "checking for updates every " +
                                           std::to_string(opt_.update_interval.count()) + "s");
    }

    void UpdateScheduler::Stop()
    {
        {
            std::lock_guard<std::mutex> lk(mu_);
            stop_requested_ = true;
        }
        cancel_.store(true, std::memory_order_release);
        cv_.notify_all();

        if (!running_.exchange(false, std::memory_order_acq_rel))
            return;
        if (th_.joinable())
            th_.join();
    }

    void UpdateScheduler::Loop()
    {
        while (SleepFor(std::chrono::duration_cast<std::chrono::milliseconds>(opt_.update_interval)))
        {
            auto r = RunOnce();
            if (r.ok() && log_)
                log_->Info("update.tick", r.value() == UpdateOutcome::kActivated ? "new generation activated"
                                                                                 : "up to date");
        }
    }
} // namespace geoserve::update
