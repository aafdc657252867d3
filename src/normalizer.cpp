#include "quotatrack/normalizer.hpp"
#include "quotatrack/exceptions.hpp"

#include <algorithm>
#include <cmath>

namespace quotatrack {

namespace {

double require_value(const QuotaSample& sample, const QuotaDescriptor& descriptor) {
    auto it = sample.fields.find(descriptor.value_field);
    if (it == sample.fields.end()) {
        throw MalformedSampleException(sample.key,
            "missing field '" + descriptor.value_field + "'");
    }
    if (!std::isfinite(it->second)) {
        throw MalformedSampleException(sample.key,
            "field '" + descriptor.value_field + "' is not a finite number");
    }
    return it->second;
}

std::optional<double> usable_limit(double v) {
    if (!std::isfinite(v) || v <= 0.0) return std::nullopt;
    return v;
}

} // anonymous namespace

// ========== IncreasingUsageStrategy ==========

NormalizedConsumption IncreasingUsageStrategy::normalize(
    const QuotaSample& sample, const QuotaDescriptor& descriptor) const
{
    double raw = require_value(sample, descriptor);
    if (raw < 0.0) {
        throw MalformedSampleException(sample.key, "negative usage counter");
    }
    return NormalizedConsumption{raw, SampleNormalizer::resolve_limit(sample, descriptor)};
}

// ========== RemainingBudgetStrategy ==========

NormalizedConsumption RemainingBudgetStrategy::normalize(
    const QuotaSample& sample, const QuotaDescriptor& descriptor) const
{
    double remaining = require_value(sample, descriptor);
    if (remaining < 0.0) {
        throw MalformedSampleException(sample.key, "negative remaining budget");
    }
    auto limit = SampleNormalizer::resolve_limit(sample, descriptor);
    if (!limit) {
        throw MalformedSampleException(sample.key,
            "remaining budget without a known limit");
    }
    // Remaining above the limit (plan upgrade mid-cycle) reads as nothing used
    double consumed = std::clamp(*limit - remaining, 0.0, *limit);
    return NormalizedConsumption{consumed, limit};
}

// ========== UtilizationPercentStrategy ==========

NormalizedConsumption UtilizationPercentStrategy::normalize(
    const QuotaSample& sample, const QuotaDescriptor& descriptor) const
{
    double percent = require_value(sample, descriptor);
    if (percent < 0.0) {
        throw MalformedSampleException(sample.key, "negative utilization");
    }
    return NormalizedConsumption{percent, 100.0};
}

// ========== SampleNormalizer ==========

const NormalizationStrategy& SampleNormalizer::strategy_for(CounterKind kind) {
    static const IncreasingUsageStrategy increasing;
    static const RemainingBudgetStrategy remaining;
    static const UtilizationPercentStrategy percent;

    switch (kind) {
        case CounterKind::IncreasingUsage:    return increasing;
        case CounterKind::RemainingBudget:    return remaining;
        case CounterKind::UtilizationPercent: return percent;
    }
    return increasing;
}

NormalizedConsumption SampleNormalizer::normalize(const QuotaSample& sample,
                                                  const QuotaDescriptor& descriptor) {
    return strategy_for(descriptor.kind).normalize(sample, descriptor);
}

std::optional<double> SampleNormalizer::resolve_limit(const QuotaSample& sample,
                                                      const QuotaDescriptor& descriptor) {
    // An unusable value at one level counts as absent
    if (sample.limit.has_value()) {
        if (auto limit = usable_limit(*sample.limit)) return limit;
    }
    if (!descriptor.limit_field.empty()) {
        auto it = sample.fields.find(descriptor.limit_field);
        if (it != sample.fields.end()) {
            if (auto limit = usable_limit(it->second)) return limit;
        }
    }
    if (descriptor.fixed_limit.has_value()) {
        return usable_limit(*descriptor.fixed_limit);
    }
    return std::nullopt;
}

std::optional<double> usage_percent(double consumed, std::optional<double> limit) {
    if (!limit || !(*limit > 0.0) || !std::isfinite(*limit) || !std::isfinite(consumed)) {
        return std::nullopt;
    }
    return (consumed / *limit) * 100.0;
}

} // namespace quotatrack
