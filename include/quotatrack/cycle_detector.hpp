#pragma once

#include "quotatrack/types.hpp"
#include "quotatrack/config.hpp"
#include "quotatrack/cycle_store.hpp"
#include "quotatrack/quota_descriptor.hpp"

#include <memory>

namespace quotatrack {

// Decides reset vs. continuation for each sample and writes the
// resulting cycle state through the store.
//
// Not synchronized: callers serialize ingest per quota key.
class CycleDetector {
public:
    CycleDetector(std::shared_ptr<CycleStore> store, DetectorConfig config = DetectorConfig{});

    // Normalizes and applies one sample.
    // Throws MalformedSampleException (nothing written) or StoreException.
    IngestResult ingest(const QuotaDescriptor& descriptor, const QuotaSample& sample);

    // Applies an already-normalized sample.
    IngestResult apply(const QuotaDescriptor& descriptor,
                       const QuotaSample& sample,
                       const NormalizedConsumption& normalized);

    // peak > min_signal && consumed < peak * drop_ratio
    static bool is_drop_reset(double peak, double consumed,
                              double drop_ratio, double min_signal) noexcept;

    const DetectorConfig& config() const noexcept;

private:
    std::shared_ptr<CycleStore> store_;
    DetectorConfig config_;

    ResetReason detect_reset(const QuotaDescriptor& descriptor,
                             const Cycle& active,
                             const QuotaSample& sample,
                             double consumed) const;
    Cycle open_cycle(const QuotaSample& sample, const NormalizedConsumption& normalized);
};

} // namespace quotatrack
