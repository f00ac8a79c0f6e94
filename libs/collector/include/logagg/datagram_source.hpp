// Copyright 2025 LogAgg Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file datagram_source.hpp
/// @brief Frame source backed by a bound datagram socket
///
/// Binds one UDP (IPv4/IPv6) or local (AF_UNIX, SOCK_DGRAM) socket and
/// hands out each received datagram as one frame. Datagrams larger than
/// the receive buffer are truncated by the kernel.

#include "logagg/bind_address.hpp"
#include "logagg/frame_source.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <vector>

namespace logagg {

/// Datagram socket settings
struct DatagramSourceConfig {
    TransportBinding binding;

    /// Receive buffer size, i.e. maximum frame size in bytes
    size_t frame_size = 4096;

    /// How often a blocked receive() re-checks for a stop request
    std::chrono::milliseconds stop_poll_interval{200};
};

class DatagramSource : public FrameSource {
public:
    explicit DatagramSource(const DatagramSourceConfig& config);
    ~DatagramSource() override;

    DatagramSource(const DatagramSource&) = delete;
    DatagramSource& operator=(const DatagramSource&) = delete;

    /// Create and bind the socket
    /// @throws TransportError if the socket cannot be created or bound
    void open();

    /// Close the socket. A local socket file created by open() is removed.
    void close();

    bool is_open() const { return fd_ >= 0; }

    /// Port actually bound (resolves port 0), 0 for local sockets
    uint16_t local_port() const;

    std::optional<Frame> receive() override;
    void request_stop() override;
    FrameSourceStats stats() const override { return stats_; }
    std::string name() const override;

private:
    void open_ip();
    void open_local();

    DatagramSourceConfig config_;
    int fd_ = -1;
    bool owns_path_ = false;
    std::atomic<bool> stop_requested_{false};
    std::vector<uint8_t> buffer_;
    FrameSourceStats stats_;
};

}  // namespace logagg
