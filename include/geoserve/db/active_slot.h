#pragma once

#include <atomic>
#include <memory>

#include <geoserve/db/generation.h>

namespace geoserve::db
{
    // The generation lookups should use right now. Readers take a fresh
    // handle per request; the updater publishes a replacement with one
    // atomic exchange. An old generation stays alive until its last reader
    // drops the handle returned by Get().
    class ActiveSlot
    {
    public:
        ActiveSlot() = default;
        explicit ActiveSlot(GenerationHandle initial) : current_(std::move(initial)) {}

        ActiveSlot(const ActiveSlot &) = delete;
        ActiveSlot &operator=(const ActiveSlot &) = delete;

        GenerationHandle Get() const noexcept
        {
            return current_.load(std::memory_order_acquire);
        }

        // Publishes `next` and hands back the generation it replaced.
        GenerationHandle Swap(GenerationHandle next) noexcept
        {
            return current_.exchange(std::move(next), std::memory_order_acq_rel);
        }

        bool empty() const noexcept { return Get() == nullptr; }

    private:
        std::atomic<GenerationHandle> current_{nullptr};
    };
} // namespace geoserve::db
