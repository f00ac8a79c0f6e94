// Copyright 2025 LogAgg Contributors
// SPDX-License-Identifier: Apache-2.0

/// @file main.cpp
/// @brief LogAgg Send - feeds JSON lines from stdin to a collector
///
/// Every input line is parsed as a JSON object and sent as one datagram.
/// Lines that are not JSON objects are skipped with a warning.
///
/// Usage:
///   echo '{"msg": "hello"}' | logagg_send --bind=ip://127.0.0.1:5140
///   logagg_send --bind=unix:///run/logagg.sock --interval_ms=10 < events.jsonl

#include "logagg/bind_address.hpp"
#include "logagg/datagram_sender.hpp"
#include "logagg/errors.hpp"
#include "logagg/record.hpp"

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <chrono>
#include <iostream>
#include <string>
#include <thread>

DEFINE_string(bind, "ip://127.0.0.1:5140", "Collector endpoint: ip://host:port or unix://path");
DEFINE_int32(interval_ms, 0, "Delay between datagrams in milliseconds");

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    gflags::SetUsageMessage("LogAgg Send - sends JSON lines from stdin as datagrams");
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    FLAGS_logtostderr = true;

    logagg::TransportBinding target;
    try {
        target = logagg::parse_bind(FLAGS_bind);
    } catch (const logagg::ConfigError& e) {
        LOG(ERROR) << "Invalid --bind: " << e.what();
        return 1;
    }

    logagg::DatagramSender sender(target);
    if (!sender.initialize()) {
        return 1;
    }

    std::string line;
    uint64_t line_no = 0;
    uint64_t skipped = 0;
    while (std::getline(std::cin, line)) {
        line_no++;
        if (line.empty()) {
            continue;
        }

        auto decoded = logagg::decode_record(
            reinterpret_cast<const uint8_t*>(line.data()), line.size());
        if (!decoded.ok()) {
            LOG(WARNING) << "Skipping line " << line_no << ": "
                         << logagg::to_string(decoded.status);
            skipped++;
            continue;
        }

        if (!sender.send(decoded.record)) {
            return 1;
        }

        if (FLAGS_interval_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(FLAGS_interval_ms));
        }
    }

    auto stats = sender.stats();
    LOG(INFO) << "Sent " << stats.frames_sent << " records (" << stats.bytes_sent
              << " bytes), skipped " << skipped;
    return 0;
}
