// Copyright 2025 LogAgg Contributors
// SPDX-License-Identifier: Apache-2.0

#include "logagg/batch_collector.hpp"

#include <glog/logging.h>

#include <algorithm>

namespace logagg {

namespace {

constexpr size_t kMaxReserve = 4096;

}  // namespace

BatchCollector::BatchCollector(FrameSource& source, AcceptanceFilter filter, bool verbose)
    : source_(source)
    , filter_(filter ? std::move(filter) : accept_all())
    , verbose_(verbose) {
}

std::optional<Record> BatchCollector::next() {
    while (auto frame = source_.receive()) {
        stats_.frames_received++;

        auto decoded = decode_record(*frame);
        if (!decoded.ok()) {
            stats_.decode_failures++;
            continue;
        }

        if (!filter_(decoded.record)) {
            stats_.filtered_out++;
            continue;
        }

        stats_.records_accepted++;
        if (verbose_) {
            LOG(INFO) << "Processing: " << decoded.record.dump();
        }
        return std::move(decoded.record);
    }
    return std::nullopt;
}

std::optional<Batch> BatchCollector::collect(size_t limit) {
    Batch batch;
    batch.reserve(std::min(limit, kMaxReserve));

    while (batch.size() < limit) {
        auto record = next();
        if (!record) {
            if (!batch.empty()) {
                LOG(WARNING) << "Frame source stopped, dropping incomplete batch of "
                             << batch.size() << "/" << limit << " records";
            }
            return std::nullopt;
        }
        batch.push_back(std::move(*record));
    }
    return batch;
}

}  // namespace logagg
