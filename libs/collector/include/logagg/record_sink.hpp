// Copyright 2025 LogAgg Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file record_sink.hpp
/// @brief Applies accepted records to the store under a durability policy
///
/// Immediate policy (batch size 0):
///   write() runs every insert statement for one record and commits it
///   before returning. An interruption loses at most the record in flight.
///
/// Batched policy (batch size > 0):
///   write_batch() runs each insert statement over the whole batch inside
///   one transaction. Faster, but an interruption loses the whole batch.
///
/// Both policies write merge_defaults(defaults, record) for every statement.

#include "logagg/record.hpp"
#include "logagg/record_store.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace logagg {

/// Durability policy, selected by the configured batch size
enum class SinkPolicy {
    Immediate,
    Batched
};

/// Convert SinkPolicy to string
const char* to_string(SinkPolicy policy);

/// Policy for a batch size: 0 is Immediate, anything else Batched
SinkPolicy policy_for_batch_size(uint64_t batch_size);

/// Statistics for the record sink
struct SinkStats {
    uint64_t records_written = 0;
    uint64_t batches_written = 0;
};

class RecordSink {
public:
    /// Prepares every insert statement up front
    /// @param store Store to write to (must outlive the sink)
    /// @param inserts Parameterized insert statements, applied in order
    /// @param defaults Field values used when a record lacks them
    /// @throws StoreError if a statement cannot be prepared
    RecordSink(RecordStore& store, std::vector<std::string> inserts, Record defaults);

    /// Immediate policy: write and commit one record
    void write(const Record& record);

    /// Batched policy: write a whole batch, one transaction per statement
    void write_batch(const Batch& batch);

    SinkStats stats() const { return stats_; }

private:
    RecordStore& store_;
    std::vector<std::string> inserts_;
    Record defaults_;
    SinkStats stats_;
};

}  // namespace logagg
