#include "quotatrack/cycle_detector.hpp"
#include "quotatrack/normalizer.hpp"

#include <algorithm>

namespace quotatrack {

CycleDetector::CycleDetector(std::shared_ptr<CycleStore> store, DetectorConfig config)
    : store_(std::move(store))
    , config_(std::move(config))
{}

const DetectorConfig& CycleDetector::config() const noexcept {
    return config_;
}

bool CycleDetector::is_drop_reset(double peak, double consumed,
                                  double drop_ratio, double min_signal) noexcept {
    return peak > min_signal && consumed < peak * drop_ratio;
}

IngestResult CycleDetector::ingest(const QuotaDescriptor& descriptor, const QuotaSample& sample) {
    auto normalized = SampleNormalizer::normalize(sample, descriptor);
    return apply(descriptor, sample, normalized);
}

IngestResult CycleDetector::apply(const QuotaDescriptor& descriptor,
                                  const QuotaSample& sample,
                                  const NormalizedConsumption& normalized) {
    IngestResult result;
    result.normalized = normalized;

    auto active = store_->get_active_cycle(sample.key);
    if (!active) {
        result.active_cycle = open_cycle(sample, normalized);
        result.outcome = IngestOutcome::Created;
        return result;
    }

    // Delivery is assumed monotonic per key; anything else is dropped
    if (sample.timestamp <= active->last_sample_at) {
        result.active_cycle = std::move(active);
        result.outcome = IngestOutcome::OutOfOrder;
        return result;
    }

    ResetReason reason = detect_reset(descriptor, *active, sample, normalized.consumed);
    if (reason != ResetReason::None) {
        // The previous sample is the last one known to belong to the old period
        Cycle closed = *active;
        closed.end = active->last_sample_at;
        closed.total_delta = std::max(0.0, closed.peak - closed.start_consumed);
        store_->close_cycle(closed.id, *closed.end, closed.peak, closed.total_delta);

        result.closed_cycle = std::move(closed);
        result.active_cycle = open_cycle(sample, normalized);
        result.outcome = IngestOutcome::Reset;
        result.reset_reason = reason;
        return result;
    }

    // Continuation
    CycleUpdate update;
    update.peak = std::max(active->peak, normalized.consumed);
    update.total_delta = std::max(0.0, update.peak - active->start_consumed);
    update.last_sample_at = sample.timestamp;
    update.last_consumed = normalized.consumed;
    update.limit = normalized.limit ? normalized.limit : active->limit;
    update.resets_at = sample.resets_at ? sample.resets_at : active->resets_at;
    store_->update_cycle(active->id, update);

    Cycle updated = *active;
    updated.peak = update.peak;
    updated.total_delta = update.total_delta;
    updated.last_sample_at = update.last_sample_at;
    updated.last_consumed = update.last_consumed;
    updated.limit = update.limit;
    updated.resets_at = update.resets_at;

    result.active_cycle = std::move(updated);
    result.outcome = IngestOutcome::Continued;
    return result;
}

ResetReason CycleDetector::detect_reset(const QuotaDescriptor& descriptor,
                                        const Cycle& active,
                                        const QuotaSample& sample,
                                        double consumed) const {
    if (config_.honor_reported_reset && active.resets_at &&
        sample.timestamp > *active.resets_at + config_.reset_grace) {
        return ResetReason::ReportedResetPassed;
    }

    double drop_ratio = descriptor.drop_ratio.value_or(config_.drop_ratio);
    double min_signal = descriptor.min_signal.value_or(config_.min_signal);
    if (is_drop_reset(active.peak, consumed, drop_ratio, min_signal)) {
        return ResetReason::DropBelowRatio;
    }
    return ResetReason::None;
}

Cycle CycleDetector::open_cycle(const QuotaSample& sample, const NormalizedConsumption& normalized) {
    Cycle cycle = store_->create_cycle(sample.key, sample.timestamp,
                                       normalized.consumed, sample.resets_at);
    if (normalized.limit) {
        CycleUpdate update;
        update.peak = cycle.peak;
        update.total_delta = cycle.total_delta;
        update.last_sample_at = cycle.last_sample_at;
        update.last_consumed = cycle.last_consumed;
        update.limit = normalized.limit;
        update.resets_at = cycle.resets_at;
        store_->update_cycle(cycle.id, update);
        cycle.limit = normalized.limit;
    }
    return cycle;
}

} // namespace quotatrack
