// Copyright 2025 LogAgg Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file datagram_sender.hpp
/// @brief Client side of a datagram binding
///
/// Sends frames to the endpoint a collector listens on. Used by the
/// logagg_send tool to feed a running collector.

#include "logagg/bind_address.hpp"
#include "logagg/record.hpp"

#include <cstdint>

namespace logagg {

/// Sender statistics
struct SenderStats {
    uint64_t frames_sent = 0;
    uint64_t bytes_sent = 0;
    uint64_t send_errors = 0;
};

class DatagramSender {
public:
    explicit DatagramSender(const TransportBinding& target);
    ~DatagramSender();

    DatagramSender(const DatagramSender&) = delete;
    DatagramSender& operator=(const DatagramSender&) = delete;

    /// Create the socket
    /// @return false if the socket cannot be created
    bool initialize();

    void shutdown();

    /// Send one frame as one datagram
    /// @return false on failure (logged)
    bool send(const Frame& frame);

    /// Encode and send one record
    bool send(const Record& record) { return send(encode_record(record)); }

    SenderStats stats() const { return stats_; }

private:
    TransportBinding target_;
    int fd_ = -1;
    SenderStats stats_;
};

}  // namespace logagg
