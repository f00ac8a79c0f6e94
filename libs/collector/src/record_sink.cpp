// Copyright 2025 LogAgg Contributors
// SPDX-License-Identifier: Apache-2.0

#include "logagg/record_sink.hpp"

#include <glog/logging.h>

namespace logagg {

const char* to_string(SinkPolicy policy) {
    switch (policy) {
        case SinkPolicy::Immediate: return "immediate";
        case SinkPolicy::Batched: return "batched";
    }
    return "unknown";
}

SinkPolicy policy_for_batch_size(uint64_t batch_size) {
    return batch_size == 0 ? SinkPolicy::Immediate : SinkPolicy::Batched;
}

RecordSink::RecordSink(RecordStore& store, std::vector<std::string> inserts, Record defaults)
    : store_(store)
    , inserts_(std::move(inserts))
    , defaults_(defaults.is_null() ? Record::object() : std::move(defaults)) {
    for (const auto& sql : inserts_) {
        store_.prepare(sql);
    }
}

void RecordSink::write(const Record& record) {
    for (const auto& sql : inserts_) {
        store_.execute(sql, merge_defaults(defaults_, record));
    }
    stats_.records_written++;
}

void RecordSink::write_batch(const Batch& batch) {
    if (batch.empty()) {
        return;
    }

    for (const auto& sql : inserts_) {
        std::vector<Record> rows;
        rows.reserve(batch.size());
        for (const auto& record : batch) {
            rows.push_back(merge_defaults(defaults_, record));
        }
        store_.execute_many(sql, rows);
    }

    stats_.records_written += batch.size();
    stats_.batches_written++;
    VLOG(1) << "Wrote batch of " << batch.size() << " records to " << store_.name();
}

}  // namespace logagg
