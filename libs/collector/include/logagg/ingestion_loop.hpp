// Copyright 2025 LogAgg Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file ingestion_loop.hpp
/// @brief Drives collect/write cycles until the record budget is spent
///
/// State machine: Bound -> (Collecting -> Writing)* -> Stopped
///
/// With batch size 0 records are streamed one by one to the immediate
/// policy and the total budget is checked per record. With batch size N
/// the budget is only checked between batches, so a run may accept up to
/// N-1 records more than requested (batch 10, total 15 -> 20 records).

#include "logagg/batch_collector.hpp"
#include "logagg/record_sink.hpp"

#include <cstdint>
#include <optional>

namespace logagg {

/// Run-scoped limits
struct RunLimits {
    /// Accepted records before stopping; nullopt runs until stopped
    std::optional<uint64_t> total;
};

/// Ingestion loop states
enum class LoopState {
    Bound,
    Collecting,
    Writing,
    Stopped
};

/// Convert LoopState to string
const char* to_string(LoopState state);

/// Counters owned by the loop. Rejected frames never advance them.
struct IngestionCounters {
    uint64_t total_accepted = 0;   ///< Whole run
    uint64_t batch_accepted = 0;   ///< Current cycle, reset each cycle
};

/// Result of a run
struct IngestionStats {
    IngestionCounters counters;
    uint64_t batches_written = 0;
    uint64_t records_written = 0;
    bool source_stopped = false;   ///< Ended by a stop request, not the budget
};

class IngestionLoop {
public:
    /// @param collector Record producer (must outlive the loop)
    /// @param sink Record consumer (must outlive the loop)
    /// @param batch_size 0 for immediate streaming, N for batches of N
    IngestionLoop(BatchCollector& collector, RecordSink& sink, uint64_t batch_size);

    /// Run until the budget is spent or the frame source is stopped.
    /// Store and transport errors propagate to the caller.
    IngestionStats run(const RunLimits& limits = {});

    LoopState state() const { return state_; }
    SinkPolicy policy() const { return policy_for_batch_size(batch_size_); }
    const IngestionCounters& counters() const { return counters_; }

private:
    void run_streaming(const RunLimits& limits, IngestionStats& stats);
    void run_batched(const RunLimits& limits, IngestionStats& stats);

    static bool budget_left(const RunLimits& limits, uint64_t accepted);

    BatchCollector& collector_;
    RecordSink& sink_;
    uint64_t batch_size_;
    LoopState state_ = LoopState::Bound;
    IngestionCounters counters_;
};

}  // namespace logagg
