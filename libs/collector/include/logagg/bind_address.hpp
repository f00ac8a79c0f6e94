// Copyright 2025 LogAgg Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file bind_address.hpp
/// @brief Parsing of the `bind` setting into a datagram endpoint
///
/// Supported forms:
///   ip://127.0.0.1:9999   IPv4 socket address
///   ip://[::1]:9999       IPv6 socket address
///   ip://localhost:9999   IPv4 loopback
///   ip://:9999            IPv4 loopback
///   127.0.0.1:9999        scheme defaults to ip://
///   unix:///tmp/logs.sock local datagram socket

#include <cstdint>
#include <string>

namespace logagg {

/// Address family of a transport binding
enum class BindFamily {
    Ipv4,
    Ipv6,
    Local
};

/// Convert BindFamily to string
const char* to_string(BindFamily family);

/// The single endpoint a pipeline listens on
struct TransportBinding {
    BindFamily family = BindFamily::Ipv4;
    std::string host;    ///< IP literal (Ipv4/Ipv6 only)
    uint16_t port = 0;   ///< Ipv4/Ipv6 only
    std::string path;    ///< Local only

    /// Human readable form for logging, e.g. "ip://127.0.0.1:9999"
    std::string to_string() const;
};

bool operator==(const TransportBinding& lhs, const TransportBinding& rhs);

/// Parse a bind string
/// @throws ConfigError (MalformedBindAddress or UnsupportedScheme)
TransportBinding parse_bind(const std::string& input);

}  // namespace logagg
