#pragma once

#include "quotatrack/types.hpp"
#include "quotatrack/quota_descriptor.hpp"

#include <optional>
#include <string>

namespace quotatrack {

// Abstract normalization strategy: one per counter kind
class NormalizationStrategy {
public:
    virtual ~NormalizationStrategy() = default;

    // Throws MalformedSampleException when the sample cannot be interpreted.
    virtual NormalizedConsumption normalize(const QuotaSample& sample,
                                            const QuotaDescriptor& descriptor) const = 0;

    virtual CounterKind kind() const noexcept = 0;
    virtual std::string name() const = 0;
};

// consumed = raw
class IncreasingUsageStrategy : public NormalizationStrategy {
public:
    NormalizedConsumption normalize(const QuotaSample& sample,
                                    const QuotaDescriptor& descriptor) const override;
    CounterKind kind() const noexcept override { return CounterKind::IncreasingUsage; }
    std::string name() const override { return "IncreasingUsage"; }
};

// consumed = limit - remaining; a known limit is required
class RemainingBudgetStrategy : public NormalizationStrategy {
public:
    NormalizedConsumption normalize(const QuotaSample& sample,
                                    const QuotaDescriptor& descriptor) const override;
    CounterKind kind() const noexcept override { return CounterKind::RemainingBudget; }
    std::string name() const override { return "RemainingBudget"; }
};

// consumed = percent, limit fixed at 100
class UtilizationPercentStrategy : public NormalizationStrategy {
public:
    NormalizedConsumption normalize(const QuotaSample& sample,
                                    const QuotaDescriptor& descriptor) const override;
    CounterKind kind() const noexcept override { return CounterKind::UtilizationPercent; }
    std::string name() const override { return "UtilizationPercent"; }
};

class SampleNormalizer {
public:
    static const NormalizationStrategy& strategy_for(CounterKind kind);

    static NormalizedConsumption normalize(const QuotaSample& sample,
                                           const QuotaDescriptor& descriptor);

    // Limit from the sample, then its limit field, then the descriptor.
    // A missing, non-finite, zero or negative value at one level falls
    // through to the next; nullopt when no level is usable.
    static std::optional<double> resolve_limit(const QuotaSample& sample,
                                               const QuotaDescriptor& descriptor);
};

// consumed / limit * 100, or nullopt when the limit is unknown
std::optional<double> usage_percent(double consumed, std::optional<double> limit);

} // namespace quotatrack
