#pragma once

#include <array>
#include <mutex>
#include <string>

#include <absl/hash/hash.h>
#include "common/stage.h"

namespace Wipflow {

// Striped mutual exclusion for release cycles, keyed by (factory, stage).
// Different pairs may share a stripe. Only AllGuard holds more than one
// stripe, and it takes them in index order.
template<size_t NumStripes = 64>
class StripedStageLock {
public:
    StripedStageLock() = default;

    static std::string Key(const std::string& factory_id, Stage stage) {
        return factory_id + "/" + StageCode(stage);
    }

    size_t GetStripeIndex(const std::string& key) const {
        return absl::Hash<std::string>{}(key) % NumStripes;
    }

    // RAII guard held for the critical sections of one release cycle
    class Guard {
    public:
        Guard(StripedStageLock& striped, const std::string& factory_id, Stage stage)
            : lock_(striped.locks_[striped.GetStripeIndex(Key(factory_id, stage))].mutex) {}

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

    private:
        std::lock_guard<std::mutex> lock_;
    };

    // Holds every stripe, for administrative resets
    class AllGuard {
    public:
        explicit AllGuard(StripedStageLock& striped) : striped_(striped) {
            for (auto& stripe : striped_.locks_) stripe.mutex.lock();
        }

        ~AllGuard() {
            for (auto it = striped_.locks_.rbegin(); it != striped_.locks_.rend(); ++it) it->mutex.unlock();
        }

        AllGuard(const AllGuard&) = delete;
        AllGuard& operator=(const AllGuard&) = delete;

    private:
        StripedStageLock& striped_;
    };

private:
    struct alignas(64) CacheAlignedMutex {
        std::mutex mutex;
    };
    std::array<CacheAlignedMutex, NumStripes> locks_;
};

using StageLock = StripedStageLock<>;

} // namespace Wipflow
