/*
 * operation_counters.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "operation_counters.hpp"

#include <algorithm>

namespace beacon::stats {

namespace {

double toMillis(Duration d) {
    return std::chrono::duration<double, std::milli>(d).count();
}

}  // namespace

json CounterSnapshot::toJson() const {
    return {{"count", invocations},
            {"total_ms", toMillis(total_elapsed)},
            {"mean_ms", toMillis(mean())},
            {"min_ms", toMillis(min_elapsed)},
            {"max_ms", toMillis(max_elapsed)}};
}

OperationCounters::Counter& OperationCounters::counterFor(
    std::string_view category) {
    {
        std::shared_lock lock(mutex_);
        if (auto it = counters_.find(std::string(category));
            it != counters_.end()) {
            return *it->second;
        }
    }

    std::unique_lock lock(mutex_);
    auto [it, inserted] =
        counters_.try_emplace(std::string(category), nullptr);
    if (inserted) {
        it->second = std::make_unique<Counter>();
    }
    return *it->second;
}

void OperationCounters::record(std::string_view category, Duration elapsed) {
    auto& counter = counterFor(category);
    std::lock_guard lock(counter.mutex);
    auto& v = counter.values;
    if (v.invocations == 0) {
        v.min_elapsed = elapsed;
        v.max_elapsed = elapsed;
    } else {
        v.min_elapsed = std::min(v.min_elapsed, elapsed);
        v.max_elapsed = std::max(v.max_elapsed, elapsed);
    }
    ++v.invocations;
    v.total_elapsed += elapsed;
}

std::map<std::string, CounterSnapshot> OperationCounters::snapshot() const {
    std::map<std::string, CounterSnapshot> result;
    std::shared_lock lock(mutex_);
    for (const auto& [name, counter] : counters_) {
        std::lock_guard counterLock(counter->mutex);
        result.emplace(name, counter->values);
    }
    return result;
}

CounterSnapshot OperationCounters::snapshot(std::string_view category) const {
    std::shared_lock lock(mutex_);
    auto it = counters_.find(std::string(category));
    if (it == counters_.end()) {
        return {};
    }
    std::lock_guard counterLock(it->second->mutex);
    return it->second->values;
}

void OperationCounters::reset() {
    std::shared_lock lock(mutex_);
    for (auto& [name, counter] : counters_) {
        std::lock_guard counterLock(counter->mutex);
        counter->values = CounterSnapshot{};
    }
}

std::map<std::string, CounterSnapshot> OperationCounters::snapshotAndReset() {
    std::map<std::string, CounterSnapshot> previous;
    std::shared_lock lock(mutex_);
    for (auto& [name, counter] : counters_) {
        std::lock_guard counterLock(counter->mutex);
        previous.emplace(name, counter->values);
        counter->values = CounterSnapshot{};
    }
    return previous;
}

CounterSnapshot OperationCounters::aggregate() const {
    CounterSnapshot total;
    for (const auto& [name, values] : snapshot()) {
        if (values.invocations == 0) {
            continue;
        }
        if (total.invocations == 0) {
            total.min_elapsed = values.min_elapsed;
            total.max_elapsed = values.max_elapsed;
        } else {
            total.min_elapsed = std::min(total.min_elapsed, values.min_elapsed);
            total.max_elapsed = std::max(total.max_elapsed, values.max_elapsed);
        }
        total.invocations += values.invocations;
        total.total_elapsed += values.total_elapsed;
    }
    return total;
}

std::vector<std::string> OperationCounters::categories() const {
    std::vector<std::string> names;
    {
        std::shared_lock lock(mutex_);
        names.reserve(counters_.size());
        for (const auto& [name, counter] : counters_) {
            names.push_back(name);
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

json OperationCounters::toJson(
    const std::map<std::string, CounterSnapshot>& snapshot) {
    json j = json::object();
    for (const auto& [name, values] : snapshot) {
        j[name] = values.toJson();
    }
    return j;
}

}  // namespace beacon::stats
