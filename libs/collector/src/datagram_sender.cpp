// Copyright 2025 LogAgg Contributors
// SPDX-License-Identifier: Apache-2.0

#include "logagg/datagram_sender.hpp"

#include <glog/logging.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace logagg {

DatagramSender::DatagramSender(const TransportBinding& target)
    : target_(target) {
}

DatagramSender::~DatagramSender() {
    shutdown();
}

bool DatagramSender::initialize() {
    if (fd_ >= 0) {
        return true;
    }

    int domain = AF_INET;
    if (target_.family == BindFamily::Ipv6) {
        domain = AF_INET6;
    } else if (target_.family == BindFamily::Local) {
        domain = AF_UNIX;
    }

    fd_ = ::socket(domain, SOCK_DGRAM, 0);
    if (fd_ < 0) {
        LOG(ERROR) << "[SEND] Failed to create socket: " << std::strerror(errno);
        return false;
    }

    LOG(INFO) << "[SEND] Initialized: target=" << target_.to_string();
    return true;
}

void DatagramSender::shutdown() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

bool DatagramSender::send(const Frame& frame) {
    if (fd_ < 0) {
        LOG(ERROR) << "[SEND] Socket not initialized";
        return false;
    }

    sockaddr_storage dest{};
    socklen_t dest_len = 0;

    switch (target_.family) {
        case BindFamily::Ipv4: {
            auto* addr = reinterpret_cast<sockaddr_in*>(&dest);
            addr->sin_family = AF_INET;
            addr->sin_port = htons(target_.port);
            if (inet_pton(AF_INET, target_.host.c_str(), &addr->sin_addr) != 1) {
                LOG(ERROR) << "[SEND] Invalid target address: " << target_.host;
                return false;
            }
            dest_len = sizeof(sockaddr_in);
            break;
        }
        case BindFamily::Ipv6: {
            auto* addr = reinterpret_cast<sockaddr_in6*>(&dest);
            addr->sin6_family = AF_INET6;
            addr->sin6_port = htons(target_.port);
            if (inet_pton(AF_INET6, target_.host.c_str(), &addr->sin6_addr) != 1) {
                LOG(ERROR) << "[SEND] Invalid target address: " << target_.host;
                return false;
            }
            dest_len = sizeof(sockaddr_in6);
            break;
        }
        case BindFamily::Local: {
            auto* addr = reinterpret_cast<sockaddr_un*>(&dest);
            if (target_.path.size() >= sizeof(addr->sun_path)) {
                LOG(ERROR) << "[SEND] Socket path too long: " << target_.path;
                return false;
            }
            addr->sun_family = AF_UNIX;
            std::memcpy(addr->sun_path, target_.path.c_str(), target_.path.size());
            dest_len = sizeof(sockaddr_un);
            break;
        }
    }

    ssize_t sent = ::sendto(fd_, frame.data(), frame.size(), 0,
                            reinterpret_cast<sockaddr*>(&dest), dest_len);
    if (sent < 0) {
        stats_.send_errors++;
        LOG(ERROR) << "[SEND] Failed to send: " << std::strerror(errno);
        return false;
    }

    stats_.frames_sent++;
    stats_.bytes_sent += static_cast<uint64_t>(sent);
    return true;
}

}  // namespace logagg
