// Copyright 2025 LogAgg Contributors
// SPDX-License-Identifier: Apache-2.0

#include "logagg/ingestion_loop.hpp"

#include <glog/logging.h>

namespace logagg {

const char* to_string(LoopState state) {
    switch (state) {
        case LoopState::Bound: return "bound";
        case LoopState::Collecting: return "collecting";
        case LoopState::Writing: return "writing";
        case LoopState::Stopped: return "stopped";
    }
    return "unknown";
}

IngestionLoop::IngestionLoop(BatchCollector& collector, RecordSink& sink, uint64_t batch_size)
    : collector_(collector)
    , sink_(sink)
    , batch_size_(batch_size) {
}

bool IngestionLoop::budget_left(const RunLimits& limits, uint64_t accepted) {
    return !limits.total || accepted < *limits.total;
}

IngestionStats IngestionLoop::run(const RunLimits& limits) {
    IngestionStats stats;

    LOG(INFO) << "Ingestion loop started"
              << " (policy=" << to_string(policy())
              << ", batch=" << batch_size_
              << ", total=" << (limits.total ? std::to_string(*limits.total) : "unbounded")
              << ")";

    if (batch_size_ == 0) {
        run_streaming(limits, stats);
    } else {
        run_batched(limits, stats);
    }

    state_ = LoopState::Stopped;

    auto sink_stats = sink_.stats();
    stats.counters = counters_;
    stats.batches_written = sink_stats.batches_written;
    stats.records_written = sink_stats.records_written;

    LOG(INFO) << "Ingestion loop stopped"
              << " (accepted=" << counters_.total_accepted
              << ", written=" << stats.records_written
              << ", batches=" << stats.batches_written
              << (stats.source_stopped ? ", source stopped" : ", budget reached")
              << ")";
    return stats;
}

void IngestionLoop::run_streaming(const RunLimits& limits, IngestionStats& stats) {
    counters_.batch_accepted = 0;

    while (budget_left(limits, counters_.total_accepted)) {
        state_ = LoopState::Collecting;
        auto record = collector_.next();
        if (!record) {
            stats.source_stopped = true;
            return;
        }
        counters_.batch_accepted++;
        counters_.total_accepted++;

        state_ = LoopState::Writing;
        sink_.write(*record);
    }
}

void IngestionLoop::run_batched(const RunLimits& limits, IngestionStats& stats) {
    while (budget_left(limits, counters_.total_accepted)) {
        state_ = LoopState::Collecting;
        counters_.batch_accepted = 0;

        auto batch = collector_.collect(static_cast<size_t>(batch_size_));
        if (!batch) {
            stats.source_stopped = true;
            return;
        }
        counters_.batch_accepted = batch->size();

        state_ = LoopState::Writing;
        sink_.write_batch(*batch);
        counters_.total_accepted += batch_size_;
    }
}

}  // namespace logagg
