// Copyright 2025 LogAgg Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file batch_collector.hpp
/// @brief Turns raw frames into accepted records
///
/// Each frame is decoded, then passed through the acceptance filter.
/// Frames that fail to decode and records the filter rejects are dropped
/// silently and never count towards any limit.
///
/// Example:
/// @code
///   BatchCollector collector(source, accept_all());
///   while (auto batch = collector.collect(100)) {
///       sink.write_batch(*batch);
///   }
/// @endcode

#include "logagg/acceptance_filter.hpp"
#include "logagg/frame_source.hpp"
#include "logagg/record.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>

namespace logagg {

/// Statistics for the batch collector
struct CollectorStats {
    uint64_t frames_received = 0;
    uint64_t decode_failures = 0;
    uint64_t filtered_out = 0;
    uint64_t records_accepted = 0;
};

class BatchCollector {
public:
    /// @param source Frame source to pull from (must outlive the collector)
    /// @param filter Acceptance filter, evaluated once per decoded record
    /// @param verbose Log every accepted record
    BatchCollector(FrameSource& source, AcceptanceFilter filter, bool verbose = false);

    /// Pull the next accepted record (unbounded streaming use)
    /// @return Record, or nullopt once the source is stopped
    std::optional<Record> next();

    /// Collect exactly `limit` accepted records
    /// @return Full batch, or nullopt if the source stopped first
    std::optional<Batch> collect(size_t limit);

    CollectorStats stats() const { return stats_; }

private:
    FrameSource& source_;
    AcceptanceFilter filter_;
    bool verbose_;
    CollectorStats stats_;
};

}  // namespace logagg
