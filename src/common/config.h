#pragma once

#include <cstddef>
#include <cstdint>

/// Scheduling policy defaults forwarded to optimizers
/// Minimum number of orders an optimizer should group into one batch
const int32_t kDefaultBatchQMin = 3;
/// Maximum number of orders an optimizer should group into one batch
const int32_t kDefaultBatchQMax = 7;
/// Planning horizon in sim minutes
const int64_t kDefaultHorizonMinutes = 240;
/// Interval between optimizer runs in sim minutes
const int64_t kDefaultSchedIntervalMinutes = 30;
/// Expected order arrivals per interval
const int32_t kDefaultPoissonLambda = 4;

/// Optimizer call configs
/// The timeout for a single optimizer invocation.
const int64_t kDefaultOptimizerTimeoutMs = 30000;
/// Upper bound of bytes read back from an optimizer process.
const size_t kMaxOptimizerOutputBytes = 1UL << 20;

/// Scheduling log configs
/// Capacity of the asynchronous scheduling log queue.
const size_t kDefaultSchedulingLogQueueCapacity = 1024;
/// Number of PAP batches summarised in each optimizer run record.
const int kMaxBatchInsights = 5;
