/*
 * operation_counters.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Per-category invocation and latency counters

**************************************************/

#ifndef BEACON_STATS_OPERATION_COUNTERS_HPP
#define BEACON_STATS_OPERATION_COUNTERS_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace beacon::stats {

using json = nlohmann::json;
using Duration = std::chrono::nanoseconds;

/**
 * @brief Read-only view of one category's counters
 */
struct CounterSnapshot {
    std::uint64_t invocations{0};
    Duration total_elapsed{0};
    Duration min_elapsed{0};
    Duration max_elapsed{0};

    /**
     * @brief Mean latency, zero when nothing was recorded
     */
    [[nodiscard]] Duration mean() const noexcept {
        return invocations > 0
                   ? Duration(total_elapsed.count() /
                              static_cast<Duration::rep>(invocations))
                   : Duration::zero();
    }

    /**
     * @brief JSON with millisecond values
     */
    [[nodiscard]] json toJson() const;
};

/**
 * @brief Named counters for a class of operations (endpoints, queries)
 *
 * Each category is updated and read as a unit. Categories are created on
 * first use and never removed, so a snapshot taken after reset() still lists
 * every category observed so far, with zeroed values.
 *
 * @thread_safety All public operations are thread-safe
 */
class OperationCounters {
public:
    OperationCounters() = default;
    OperationCounters(const OperationCounters&) = delete;
    OperationCounters& operator=(const OperationCounters&) = delete;

    /**
     * @brief Count one invocation of @p category taking @p elapsed
     */
    void record(std::string_view category, Duration elapsed);

    /**
     * @brief Current values of every category
     *
     * Each category is individually consistent; the map as a whole is not a
     * transactional snapshot.
     */
    [[nodiscard]] std::map<std::string, CounterSnapshot> snapshot() const;

    /**
     * @brief Current values of one category, zero if never recorded
     */
    [[nodiscard]] CounterSnapshot snapshot(std::string_view category) const;

    /**
     * @brief Zero every category, keeping the names
     */
    void reset();

    /**
     * @brief Return current values and zero them, category by category
     */
    std::map<std::string, CounterSnapshot> snapshotAndReset();

    /**
     * @brief Sum over all categories
     */
    [[nodiscard]] CounterSnapshot aggregate() const;

    /**
     * @brief Names of every category observed so far, sorted
     */
    [[nodiscard]] std::vector<std::string> categories() const;

    /**
     * @brief Serialise a snapshot map keyed by category
     */
    [[nodiscard]] static json toJson(
        const std::map<std::string, CounterSnapshot>& snapshot);

private:
    struct Counter {
        mutable std::mutex mutex;
        CounterSnapshot values;
    };

    Counter& counterFor(std::string_view category);

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<Counter>> counters_;
};

/**
 * @brief Records the lifetime of a scope into an OperationCounters category
 */
class ScopedOperationTimer {
public:
    ScopedOperationTimer(OperationCounters* counters, std::string category)
        : counters_(counters),
          category_(std::move(category)),
          start_(std::chrono::steady_clock::now()) {}

    ~ScopedOperationTimer() {
        if (counters_ != nullptr) {
            counters_->record(category_, elapsed());
        }
    }

    ScopedOperationTimer(const ScopedOperationTimer&) = delete;
    ScopedOperationTimer& operator=(const ScopedOperationTimer&) = delete;

    [[nodiscard]] Duration elapsed() const {
        return std::chrono::duration_cast<Duration>(
            std::chrono::steady_clock::now() - start_);
    }

private:
    OperationCounters* counters_;
    std::string category_;
    std::chrono::steady_clock::time_point start_;
};

/**
 * @brief The two counter groups reported by the service
 */
struct ServiceMetrics {
    OperationCounters endpoints;  ///< Keyed by HTTP route
    OperationCounters queries;    ///< Keyed by cache query name
};

}  // namespace beacon::stats

#endif  // BEACON_STATS_OPERATION_COUNTERS_HPP
