// Copyright 2025 LogAgg Contributors
// SPDX-License-Identifier: Apache-2.0

#include "logagg/datagram_source.hpp"
#include "logagg/errors.hpp"

#include <glog/logging.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace logagg {

namespace {

std::string errno_message(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

}  // namespace

DatagramSource::DatagramSource(const DatagramSourceConfig& config)
    : config_(config)
    , buffer_(config.frame_size) {
}

DatagramSource::~DatagramSource() {
    close();
}

void DatagramSource::open() {
    if (fd_ >= 0) {
        return;
    }

    if (config_.binding.family == BindFamily::Local) {
        open_local();
    } else {
        open_ip();
    }

    LOG(INFO) << "[DATAGRAM] Listening on " << name()
              << " (frame_size=" << config_.frame_size << ")";
}

void DatagramSource::open_ip() {
    const auto& binding = config_.binding;
    const bool v6 = binding.family == BindFamily::Ipv6;

    fd_ = ::socket(v6 ? AF_INET6 : AF_INET, SOCK_DGRAM, 0);
    if (fd_ < 0) {
        throw TransportError(errno_message("Failed to create UDP socket"));
    }

    int rc = -1;
    if (v6) {
        sockaddr_in6 addr{};
        addr.sin6_family = AF_INET6;
        addr.sin6_port = htons(binding.port);
        if (inet_pton(AF_INET6, binding.host.c_str(), &addr.sin6_addr) != 1) {
            close();
            throw TransportError("Invalid IPv6 address: " + binding.host);
        }
        rc = ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    } else {
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(binding.port);
        if (inet_pton(AF_INET, binding.host.c_str(), &addr.sin_addr) != 1) {
            close();
            throw TransportError("Invalid IPv4 address: " + binding.host);
        }
        rc = ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    }

    if (rc < 0) {
        std::string msg = errno_message("Failed to bind " + binding.to_string());
        close();
        throw TransportError(msg);
    }
}

void DatagramSource::open_local() {
    const auto& path = config_.binding.path;

    sockaddr_un addr{};
    if (path.size() >= sizeof(addr.sun_path)) {
        throw TransportError("Socket path too long: " + path);
    }

    fd_ = ::socket(AF_UNIX, SOCK_DGRAM, 0);
    if (fd_ < 0) {
        throw TransportError(errno_message("Failed to create local socket"));
    }

    addr.sun_family = AF_UNIX;
    std::memcpy(addr.sun_path, path.c_str(), path.size());

    if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::string msg = errno_message("Failed to bind " + config_.binding.to_string());
        close();
        throw TransportError(msg);
    }
    owns_path_ = true;
}

void DatagramSource::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    if (owns_path_) {
        ::unlink(config_.binding.path.c_str());
        owns_path_ = false;
    }
}

uint16_t DatagramSource::local_port() const {
    if (fd_ < 0 || config_.binding.family == BindFamily::Local) {
        return 0;
    }

    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        LOG(WARNING) << "[DATAGRAM] getsockname failed: " << std::strerror(errno);
        return 0;
    }
    if (addr.ss_family == AF_INET6) {
        return ntohs(reinterpret_cast<sockaddr_in6*>(&addr)->sin6_port);
    }
    return ntohs(reinterpret_cast<sockaddr_in*>(&addr)->sin_port);
}

std::optional<Frame> DatagramSource::receive() {
    if (fd_ < 0) {
        throw TransportError("Datagram source is not open");
    }

    const int timeout_ms = static_cast<int>(config_.stop_poll_interval.count());

    while (!stop_requested_.load(std::memory_order_acquire)) {
        pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = POLLIN;

        int ready = ::poll(&pfd, 1, timeout_ms);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            stats_.receive_errors++;
            throw TransportError(errno_message("poll failed"));
        }
        if (ready == 0) {
            continue;
        }

        ssize_t received = ::recv(fd_, buffer_.data(), buffer_.size(), 0);
        if (received < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            stats_.receive_errors++;
            throw TransportError(errno_message("recv failed"));
        }

        stats_.frames_received++;
        stats_.bytes_received += static_cast<uint64_t>(received);
        return Frame(buffer_.begin(), buffer_.begin() + received);
    }

    return std::nullopt;
}

void DatagramSource::request_stop() {
    stop_requested_.store(true, std::memory_order_release);
}

std::string DatagramSource::name() const {
    return "datagram(" + config_.binding.to_string() + ")";
}

}  // namespace logagg
