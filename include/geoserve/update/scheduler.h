#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

#include <geoserve/core/status.h>
#include <geoserve/db/active_slot.h>
#include <geoserve/storage/retention.h>
#include <geoserve/storage/validator.h>
#include <geoserve/update/fetcher.h>
#include <geoserve/util/logger.h>

namespace geoserve::update
{
    inline constexpr std::string_view kDefaultSourceUrl =
        "https://download.db-ip.com/free/dbip-city-lite-{year}-{month}.mmdb.gz";

    struct SchedulerOptions
    {
        // {year} and {month} are substituted with the current UTC date.
        std::string source_url{kDefaultSourceUrl};
        std::chrono::seconds update_interval{86400};

        std::uint32_t bootstrap_attempts = 5;
        std::chrono::milliseconds bootstrap_backoff{2000};
        std::chrono::milliseconds bootstrap_backoff_max{60000};

        std::size_t retain_count = 3;
        storage::ValidatorOptions validator{};
    };

    enum class UpdateState : std::uint8_t
    {
        kIdle,
        kDownloading,
        kValidating,
        kActivating,
        kPruning
    };

    enum class UpdateOutcome : std::uint8_t
    {
        kActivated,
        kUpToDate
    };

    const char *UpdateStateName(UpdateState s) noexcept;

    // Owns the download -> validate -> activate -> prune pipeline and the
    // timer thread that runs it. At most one pipeline run is in flight.
    class UpdateScheduler
    {
    public:
        UpdateScheduler(SchedulerOptions opt,
                        std::string data_dir,
                        db::ActiveSlot *slot,
                        std::unique_ptr<Fetcher> fetcher,
                        Logger *log = nullptr);
        ~UpdateScheduler();

        UpdateScheduler(const UpdateScheduler &) = delete;
        UpdateScheduler &operator=(const UpdateScheduler &) = delete;

        // Activates the best retained generation, or downloads one with
        // bounded retries. A non-ok status means there is nothing to serve.
        Status Bootstrap();

        // One pipeline run. Returns Busy if another run is in flight.
        Result<UpdateOutcome> RunOnce();

        void Start();
        // Cancels an in-flight download and joins the timer thread.
        void Stop();

        UpdateState state() const noexcept { return state_.load(std::memory_order_acquire); }
        bool running() const noexcept { return running_.load(std::memory_order_acquire); }

        // Not synchronised with the timer thread.
        const storage::RetentionStore &retention() const noexcept { return retention_; }

        static std::string ResolveSourceUrl(std::string_view tmpl, std::chrono::system_clock::time_point now);

    private:
        Result<UpdateOutcome> RunPipeline();
        Status ActivateRetained();
        Status Activate(std::uint64_t epoch, const std::string &path, std::size_t size_bytes, bool record);
        void EvictRetained(std::uint64_t epoch);
        void PruneRetained();
        void Loop();
        bool SleepFor(std::chrono::milliseconds d);
        void SetState(UpdateState s) noexcept { state_.store(s, std::memory_order_release); }

        SchedulerOptions opt_;
        db::ActiveSlot *slot_;
        std::unique_ptr<Fetcher> fetcher_;
        Logger *log_;
        storage::Validator validator_;
        storage::RetentionStore retention_;

        std::atomic<bool> in_flight_{false};
        std::atomic<bool> cancel_{false};
        std::atomic<bool> running_{false};
        std::atomic<UpdateState> state_{UpdateState::kIdle};

        std::mutex mu_;
        std::condition_variable cv_;
        bool stop_requested_{false};
        std::thread th_;

        // Written only by the run holding in_flight_.
        std::string last_activated_url_;
        std::uint64_t download_seq_{0};
    };
} // namespace geoserve::update
