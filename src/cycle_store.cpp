#include "quotatrack/cycle_store.hpp"
#include "quotatrack/exceptions.hpp"

#include <algorithm>

namespace quotatrack {

Cycle& InMemoryCycleStore::find_locked(CycleId id) {
    auto idx = index_.find(id);
    if (idx == index_.end()) {
        throw CycleNotFoundException(id);
    }
    auto& list = cycles_[idx->second];
    auto it = std::find_if(list.begin(), list.end(),
        [id](const Cycle& c) { return c.id == id; });
    if (it == list.end()) {
        throw CycleNotFoundException(id);
    }
    return *it;
}

std::optional<Cycle> InMemoryCycleStore::get_active_cycle(const QuotaKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cycles_.find(key);
    if (it == cycles_.end()) return std::nullopt;

    // The active cycle, if any, is always the most recently created one
    for (auto c = it->second.rbegin(); c != it->second.rend(); ++c) {
        if (c->is_active()) return *c;
    }
    return std::nullopt;
}

Cycle InMemoryCycleStore::create_cycle(const QuotaKey& key,
                                       Timestamp start,
                                       double initial_peak,
                                       std::optional<Timestamp> resets_at) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& list = cycles_[key];
    for (const auto& c : list) {
        if (c.is_active()) {
            throw StoreException("Active cycle " + std::to_string(c.id) +
                                 " already open for " + key.to_string());
        }
    }

    Cycle cycle;
    cycle.id = next_id_++;
    cycle.key = key;
    cycle.start = start;
    cycle.peak = initial_peak;
    cycle.start_consumed = initial_peak;
    cycle.last_sample_at = start;
    cycle.last_consumed = initial_peak;
    cycle.resets_at = resets_at;

    list.push_back(cycle);
    index_.emplace(cycle.id, key);
    return cycle;
}

void InMemoryCycleStore::update_cycle(CycleId id, const CycleUpdate& update) {
    std::lock_guard<std::mutex> lock(mutex_);
    Cycle& c = find_locked(id);
    if (!c.is_active()) {
        throw StoreException("Cannot update closed cycle " + std::to_string(id));
    }
    c.peak = update.peak;
    c.total_delta = update.total_delta;
    c.last_sample_at = update.last_sample_at;
    c.last_consumed = update.last_consumed;
    c.limit = update.limit;
    c.resets_at = update.resets_at;
}

void InMemoryCycleStore::close_cycle(CycleId id, Timestamp end,
                                     double final_peak, double final_total_delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    Cycle& c = find_locked(id);
    if (!c.is_active()) {
        throw StoreException("Cycle " + std::to_string(id) + " is already closed");
    }
    c.end = end;
    c.peak = final_peak;
    c.total_delta = final_total_delta;
}

std::vector<Cycle> InMemoryCycleStore::list_cycles_since(const QuotaKey& key, Timestamp since) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Cycle> result;
    auto it = cycles_.find(key);
    if (it == cycles_.end()) return result;

    for (auto c = it->second.rbegin(); c != it->second.rend(); ++c) {
        if (c->start >= since) {
            result.push_back(*c);
        }
    }
    return result;
}

std::vector<Cycle> InMemoryCycleStore::list_cycle_history(const QuotaKey& key, std::size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Cycle> result;
    auto it = cycles_.find(key);
    if (it == cycles_.end()) return result;

    for (auto c = it->second.rbegin(); c != it->second.rend(); ++c) {
        if (c->is_active()) continue;
        result.push_back(*c);
        if (limit > 0 && result.size() >= limit) break;
    }
    return result;
}

std::vector<Cycle> InMemoryCycleStore::all_cycles(const QuotaKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cycles_.find(key);
    if (it == cycles_.end()) return {};
    return it->second;
}

std::size_t InMemoryCycleStore::cycle_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.size();
}

} // namespace quotatrack
