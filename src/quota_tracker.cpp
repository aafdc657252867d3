#include "quotatrack/quota_tracker.hpp"
#include "quotatrack/exceptions.hpp"
#include "quotatrack/normalizer.hpp"

#include <algorithm>
#include <cmath>
#include <exception>

namespace quotatrack {

namespace {

void validate_descriptor(const QuotaDescriptor& d) {
    if (d.key.provider.empty() || d.key.quota.empty()) {
        throw InvalidConfigException("Quota key needs both provider and quota");
    }
    if (d.value_field.empty()) {
        throw InvalidConfigException("Quota " + d.key.to_string() + " has no value field");
    }
    if (d.drop_ratio && (!std::isfinite(*d.drop_ratio) ||
                         *d.drop_ratio <= 0.0 || *d.drop_ratio > 1.0)) {
        throw InvalidConfigException("Quota " + d.key.to_string() +
                                     ": drop_ratio must be in (0, 1]");
    }
    if (d.min_signal && (!std::isfinite(*d.min_signal) || *d.min_signal < 0.0)) {
        throw InvalidConfigException("Quota " + d.key.to_string() +
                                     ": min_signal must be non-negative");
    }
}

} // anonymous namespace

QuotaTracker::QuotaTracker(std::shared_ptr<CycleStore> store, TrackerConfig config)
    : config_((validate(config), std::move(config)))
    , store_(std::move(store))
    , detector_(store_, config_.detector)
    , rate_engine_(config_.rate)
{
    if (!store_) {
        throw InvalidConfigException("QuotaTracker requires a cycle store");
    }
}

const TrackerConfig& QuotaTracker::config() const noexcept {
    return config_;
}

// ==================== Registration ====================

void QuotaTracker::register_quota(QuotaDescriptor descriptor) {
    validate_descriptor(descriptor);

    std::unique_lock lock(registry_mutex_);
    QuotaKey key = descriptor.key;
    if (quotas_.count(key) > 0) {
        throw QuotaAlreadyRegisteredException(key);
    }
    std::string kind = to_string(descriptor.kind);
    quotas_.emplace(key, std::make_unique<QuotaState>(std::move(descriptor),
                                                      config_.rate.window_span));
    lock.unlock();

    emit_event(EventType::QuotaRegistered, "Quota registered as " + kind, key);
}

bool QuotaTracker::is_registered(const QuotaKey& key) const {
    std::shared_lock lock(registry_mutex_);
    return quotas_.count(key) > 0;
}

std::optional<QuotaDescriptor> QuotaTracker::get_descriptor(const QuotaKey& key) const {
    std::shared_lock lock(registry_mutex_);
    auto it = quotas_.find(key);
    if (it == quotas_.end()) return std::nullopt;
    return it->second->descriptor;
}

std::vector<QuotaKey> QuotaTracker::quota_keys() const {
    std::shared_lock lock(registry_mutex_);
    std::vector<QuotaKey> keys;
    keys.reserve(quotas_.size());
    for (auto& [key, _] : quotas_) {
        keys.push_back(key);
    }
    std::sort(keys.begin(), keys.end(), [](const QuotaKey& a, const QuotaKey& b) {
        return a.to_string() < b.to_string();
    });
    return keys;
}

std::size_t QuotaTracker::quota_count() const {
    std::shared_lock lock(registry_mutex_);
    return quotas_.size();
}

// ==================== Ingestion ====================

IngestResult QuotaTracker::ingest(const QuotaSample& sample) {
    std::shared_lock registry_lock(registry_mutex_);
    QuotaState& state = state_for(sample.key);

    IngestResult result;
    std::string discard_reason;
    std::exception_ptr store_error;
    std::string store_message;
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        try {
            result = detector_.ingest(state.descriptor, sample);
        } catch (const MalformedSampleException& e) {
            result = IngestResult{};
            result.outcome = IngestOutcome::Discarded;
            discard_reason = e.reason();
        } catch (const StoreException& e) {
            store_error = std::current_exception();
            store_message = e.what();
        }

        switch (result.outcome) {
            case IngestOutcome::Created:
            case IngestOutcome::Reset:
                state.window.clear();
                state.window.add(sample.timestamp, result.normalized->consumed);
                break;
            case IngestOutcome::Continued:
                state.window.add(sample.timestamp, result.normalized->consumed);
                break;
            case IngestOutcome::OutOfOrder:
            case IngestOutcome::Discarded:
                break;
        }
    }
    registry_lock.unlock();

    if (store_error) {
        emit_event(EventType::StoreFailure, "ingest aborted: " + store_message,
                   sample.key, std::nullopt, std::nullopt, std::nullopt,
                   std::nullopt, sample.timestamp);
        std::rethrow_exception(store_error);
    }

    if (result.outcome == IngestOutcome::Discarded) {
        emit_event(EventType::SampleDiscarded, discard_reason, sample.key,
                   std::nullopt, std::nullopt, std::nullopt, std::nullopt,
                   sample.timestamp);
    } else {
        emit_ingest_events(sample, result);
    }
    return result;
}

std::vector<IngestResult> QuotaTracker::ingest_all(const std::vector<QuotaSample>& samples) {
    std::vector<IngestResult> results;
    results.reserve(samples.size());
    for (const auto& sample : samples) {
        results.push_back(ingest(sample));
    }
    return results;
}

void QuotaTracker::emit_ingest_events(const QuotaSample& sample, const IngestResult& result) {
    const auto& active = result.active_cycle;
    const double consumed = result.normalized ? result.normalized->consumed : 0.0;

    switch (result.outcome) {
        case IngestOutcome::Created:
            emit_event(EventType::CycleCreated, "New cycle opened",
                       sample.key, active->id, consumed, active->peak,
                       std::nullopt, sample.timestamp);
            break;

        case IngestOutcome::Continued:
            emit_event(EventType::CycleUpdated, "",
                       sample.key, active->id, consumed, active->peak,
                       std::nullopt, sample.timestamp);
            break;

        case IngestOutcome::Reset: {
            const auto& closed = result.closed_cycle;
            emit_event(EventType::CycleClosed,
                       "Cycle closed with total delta " + std::to_string(closed->total_delta),
                       sample.key, closed->id, std::nullopt, closed->peak,
                       result.reset_reason, sample.timestamp);
            emit_event(EventType::ResetDetected,
                       "Quota reset detected (" + std::string(to_string(result.reset_reason)) + ")",
                       sample.key, active->id, consumed, closed->peak,
                       result.reset_reason, sample.timestamp);
            emit_event(EventType::CycleCreated, "New cycle opened after reset",
                       sample.key, active->id, consumed, active->peak,
                       std::nullopt, sample.timestamp);
            break;
        }

        case IngestOutcome::OutOfOrder:
            emit_event(EventType::SampleOutOfOrder,
                       "Sample not newer than the last one applied; ignored",
                       sample.key, active ? std::optional<CycleId>(active->id) : std::nullopt,
                       consumed, std::nullopt, std::nullopt, sample.timestamp);
            break;

        case IngestOutcome::Discarded:
            break;
    }
}

// ==================== Queries ====================

template <typename Fn>
auto QuotaTracker::guard_store(const QuotaKey& key, const char* operation, Fn&& fn) const
    -> decltype(fn())
{
    try {
        return fn();
    } catch (const StoreException& e) {
        emit_event(EventType::StoreFailure,
                   std::string(operation) + " failed: " + e.what(), key);
        throw;
    }
}

QuotaTracker::QuotaState& QuotaTracker::state_for(const QuotaKey& key) const {
    auto it = quotas_.find(key);
    if (it == quotas_.end()) {
        throw QuotaNotFoundException(key);
    }
    return *it->second;
}

std::optional<Cycle> QuotaTracker::load_active(const QuotaKey& key) const {
    return guard_store(key, "get_active_cycle", [&] {
        return store_->get_active_cycle(key);
    });
}

std::vector<WindowPoint> QuotaTracker::window_points(const QuotaKey& key, Timestamp now) const {
    std::shared_lock registry_lock(registry_mutex_);
    QuotaState& state = state_for(key);
    std::lock_guard<std::mutex> lock(state.mutex);
    return state.window.recent_points(now);
}

std::vector<Cycle> QuotaTracker::rate_history(const QuotaKey& key,
                                              const std::optional<Cycle>& active) const {
    auto cycles = guard_store(key, "list_cycle_history", [&] {
        return store_->list_cycle_history(key, config_.analytics.history_limit);
    });
    if (active) {
        cycles.insert(cycles.begin(), *active);
    }
    return cycles;
}

RateEstimate QuotaTracker::rate_for(const QuotaKey& key,
                                    const std::optional<Cycle>& active,
                                    Timestamp now) const {
    auto points = window_points(key, now);
    auto windowed = rate_engine_.window_rate(points);
    if (windowed.has_rate()) {
        return windowed;
    }
    return rate_engine_.cycle_average_rate(rate_history(key, active), now);
}

Projection QuotaTracker::projection_for(const std::optional<Cycle>& active,
                                        const RateEstimate& rate,
                                        Timestamp now) const {
    if (!active) {
        return RateEngine::project(0.0, std::nullopt, rate, std::nullopt, now);
    }
    return RateEngine::project(active->last_consumed, active->limit, rate,
                               active->resets_at, now);
}

std::optional<Cycle> QuotaTracker::active_cycle(const QuotaKey& key) const {
    {
        std::shared_lock lock(registry_mutex_);
        state_for(key);
    }
    return load_active(key);
}

RateEstimate QuotaTracker::rate(const QuotaKey& key, Timestamp now) const {
    auto active = active_cycle(key);
    return rate_for(key, active, now);
}

Projection QuotaTracker::projection(const QuotaKey& key, Timestamp now) const {
    auto active = active_cycle(key);
    auto r = rate_for(key, active, now);
    return projection_for(active, r, now);
}

std::vector<BillingPeriod> QuotaTracker::billing_periods(const QuotaKey& key, Timestamp now) const {
    return billing_summary(key, now).periods();
}

BillingSummary QuotaTracker::billing_summary(const QuotaKey& key, Timestamp now) const {
    {
        std::shared_lock lock(registry_mutex_);
        state_for(key);
    }
    auto cycles = guard_store(key, "list_cycles_since", [&] {
        return store_->list_cycles_since(key, now - config_.analytics.lookback);
    });
    return BillingSummary::from_cycles(cycles, config_.analytics.period_min_signal);
}

UsageSummary QuotaTracker::usage_summary(const QuotaKey& key, Timestamp now) const {
    auto active = active_cycle(key);
    auto history = guard_store(key, "list_cycle_history", [&] {
        return store_->list_cycle_history(key, config_.analytics.history_limit);
    });

    UsageSummary s;
    s.key = key;
    s.completed_cycles = history.size();

    if (!history.empty()) {
        double total_delta = 0.0;
        for (const auto& c : history) {
            total_delta += c.total_delta;
            s.peak_cycle = std::max(s.peak_cycle, c.peak);
        }
        s.average_per_cycle = total_delta / static_cast<double>(history.size());
        s.total_tracked = total_delta;
        // History is newest first
        s.tracking_since = history.back().start;
    }

    if (active) {
        s.total_tracked += active->total_delta;
        s.peak_cycle = std::max(s.peak_cycle, active->peak);
        if (!s.tracking_since) {
            s.tracking_since = active->start;
        }
        s.current = active->last_consumed;
        s.limit = active->limit;
        s.usage_percent = usage_percent(s.current, s.limit);
        s.resets_at = active->resets_at;
        if (s.resets_at && *s.resets_at > now) {
            s.hours_until_reset = to_hours(*s.resets_at - now);
        }
    }
    s.active_cycle = std::move(active);
    return s;
}

QuotaInsights QuotaTracker::insights(const QuotaKey& key, Timestamp now) const {
    auto active = active_cycle(key);

    QuotaInsights out;
    out.key = key;

    out.rate = rate_for(key, active, now);
    out.projection = projection_for(active, out.rate, now);
    out.forecast = classify_forecast(out.rate, out.projection);

    std::optional<double> limit = active ? active->limit : std::nullopt;
    if (active) {
        if (auto pct = usage_percent(active->last_consumed, limit)) {
            out.usage = classify_usage(*pct);
        }
    }

    out.billing = billing_summary(key, now);
    if (out.billing.count() > 1) {
        out.variance = classify_variance(out.billing.max(), out.billing.average());
    }
    out.trend = trend_from_periods(out.billing);
    out.cycle_utilization = classify_cycle_utilization(out.billing.average(), limit);
    out.weekly_pace = classify_weekly_pace(
        out.billing.sum_since(now - config_.analytics.weekly_span),
        out.billing.sum(), limit, out.billing.count());
    return out;
}

TrackerSnapshot QuotaTracker::get_snapshot() const {
    TrackerSnapshot snapshot;
    snapshot.timestamp = Clock::now();

    std::vector<std::pair<QuotaKey, CounterKind>> keys;
    {
        std::shared_lock lock(registry_mutex_);
        for (auto& [key, state] : quotas_) {
            keys.emplace_back(key, state->descriptor.kind);
        }
    }
    std::sort(keys.begin(), keys.end(), [](const auto& a, const auto& b) {
        return a.first.to_string() < b.first.to_string();
    });

    for (auto& [key, kind] : keys) {
        QuotaSnapshot q;
        q.key = key;
        q.kind = kind;
        auto active = load_active(key);
        if (active) {
            q.has_active_cycle = true;
            q.cycle_start = active->start;
            q.current = active->last_consumed;
            q.peak = active->peak;
            q.limit = active->limit;
            q.usage_percent = usage_percent(active->last_consumed, active->limit);
            q.resets_at = active->resets_at;
        }
        snapshot.quotas.push_back(std::move(q));
    }
    return snapshot;
}

// ==================== Configuration ====================

void QuotaTracker::set_monitor(std::shared_ptr<Monitor> monitor) {
    monitor_ = std::move(monitor);
}

void QuotaTracker::publish_snapshot() {
    if (!monitor_) return;
    auto snapshot = get_snapshot();
    monitor_->on_snapshot(snapshot);
}

void QuotaTracker::emit_event(EventType type, const std::string& message,
                              std::optional<QuotaKey> quota_key,
                              std::optional<CycleId> cycle_id,
                              std::optional<double> consumed,
                              std::optional<double> peak,
                              std::optional<ResetReason> reset_reason,
                              std::optional<Timestamp> sample_time) const {
    if (!monitor_) return;

    MonitorEvent event;
    event.type = type;
    event.timestamp = Clock::now();
    event.message = message;
    event.quota_key = std::move(quota_key);
    event.cycle_id = cycle_id;
    event.consumed = consumed;
    event.peak = peak;
    event.reset_reason = reset_reason;
    event.sample_time = sample_time;

    monitor_->on_event(event);
}

} // namespace quotatrack
