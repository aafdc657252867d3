#pragma once

// QuotaTrack: Quota Cycle Tracking Engine
//
// Turns periodic snapshots of provider quota counters into usage cycles,
// billing periods, burn rates and exhaustion forecasts.

// Core
#include "quotatrack/types.hpp"
#include "quotatrack/exceptions.hpp"
#include "quotatrack/config.hpp"
#include "quotatrack/quota_descriptor.hpp"
#include "quotatrack/normalizer.hpp"
#include "quotatrack/cycle_store.hpp"
#include "quotatrack/cycle_detector.hpp"
#include "quotatrack/quota_tracker.hpp"
#include "quotatrack/monitor.hpp"

// Analytics
#include "quotatrack/tracker_window.hpp"
#include "quotatrack/billing_period.hpp"
#include "quotatrack/rate_engine.hpp"
#include "quotatrack/insight.hpp"

// Provider counter families
#include "quotatrack/providers/request_counter.hpp"
#include "quotatrack/providers/remaining_budget.hpp"
#include "quotatrack/providers/utilization_window.hpp"
