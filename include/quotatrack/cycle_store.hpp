#pragma once

#include "quotatrack/types.hpp"

#include <cstddef>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace quotatrack {

// Abstract ordered store of cycle records.
// Implementations report failures by throwing StoreException.
class CycleStore {
public:
    virtual ~CycleStore() = default;

    virtual std::optional<Cycle> get_active_cycle(const QuotaKey& key) = 0;

    virtual Cycle create_cycle(const QuotaKey& key,
                               Timestamp start,
                               double initial_peak,
                               std::optional<Timestamp> resets_at = std::nullopt) = 0;

    virtual void update_cycle(CycleId id, const CycleUpdate& update) = 0;

    virtual void close_cycle(CycleId id, Timestamp end,
                             double final_peak, double final_total_delta) = 0;

    // Cycles (active included) starting at or after `since`, newest first
    virtual std::vector<Cycle> list_cycles_since(const QuotaKey& key, Timestamp since) = 0;

    // Completed cycles, newest first. limit == 0 returns all of them.
    virtual std::vector<Cycle> list_cycle_history(const QuotaKey& key, std::size_t limit) = 0;
};

// Reference store kept in process memory
class InMemoryCycleStore : public CycleStore {
public:
    InMemoryCycleStore() = default;

    InMemoryCycleStore(const InMemoryCycleStore&) = delete;
    InMemoryCycleStore& operator=(const InMemoryCycleStore&) = delete;

    std::optional<Cycle> get_active_cycle(const QuotaKey& key) override;
    Cycle create_cycle(const QuotaKey& key,
                       Timestamp start,
                       double initial_peak,
                       std::optional<Timestamp> resets_at = std::nullopt) override;
    void update_cycle(CycleId id, const CycleUpdate& update) override;
    void close_cycle(CycleId id, Timestamp end,
                     double final_peak, double final_total_delta) override;
    std::vector<Cycle> list_cycles_since(const QuotaKey& key, Timestamp since) override;
    std::vector<Cycle> list_cycle_history(const QuotaKey& key, std::size_t limit) override;

    // Every cycle for `key`, oldest first
    std::vector<Cycle> all_cycles(const QuotaKey& key) const;
    std::size_t cycle_count() const;

private:
    mutable std::mutex mutex_;
    CycleId next_id_{1};
    // Per key, in creation order (which is also start order)
    std::unordered_map<QuotaKey, std::vector<Cycle>> cycles_;
    std::unordered_map<CycleId, QuotaKey> index_;

    Cycle& find_locked(CycleId id);
};

} // namespace quotatrack
