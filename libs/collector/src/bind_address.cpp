// Copyright 2025 LogAgg Contributors
// SPDX-License-Identifier: Apache-2.0

#include "logagg/bind_address.hpp"
#include "logagg/errors.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <algorithm>
#include <cctype>

namespace logagg {

namespace {

constexpr const char* kSchemeSeparator = "://";
constexpr const char* kLoopbackV4 = "127.0.0.1";

[[noreturn]] void malformed(const std::string& reason, const std::string& input) {
    throw ConfigError(ConfigErrorKind::MalformedBindAddress,
                      reason + ": '" + input + "'");
}

uint16_t parse_port(const std::string& text, const std::string& input) {
    if (text.empty()) {
        malformed("No port for ip socket", input);
    }
    if (!std::all_of(text.begin(), text.end(),
                     [](unsigned char c) { return std::isdigit(c); })) {
        malformed("Invalid port", input);
    }
    if (text.size() > 5 || std::stoul(text) > 65535) {
        malformed("Port out of range", input);
    }
    return static_cast<uint16_t>(std::stoul(text));
}

TransportBinding parse_ip(const std::string& rest, const std::string& input) {
    // Anything after the authority (e.g. a trailing "/") is ignored
    std::string authority = rest.substr(0, rest.find('/'));

    std::string host;
    std::string port_text;
    bool has_port = false;

    if (!authority.empty() && authority.front() == '[') {
        size_t close = authority.find(']');
        if (close == std::string::npos) {
            malformed("Unterminated IPv6 literal", input);
        }
        host = authority.substr(1, close - 1);
        std::string tail = authority.substr(close + 1);
        if (!tail.empty()) {
            if (tail.front() != ':') {
                malformed("Unexpected text after IPv6 literal", input);
            }
            has_port = true;
            port_text = tail.substr(1);
        }
    } else {
        size_t colon = authority.find(':');
        if (colon != std::string::npos && authority.find(':', colon + 1) != std::string::npos) {
            malformed("IPv6 addresses must be enclosed in brackets", input);
        }
        host = authority.substr(0, colon);
        if (colon != std::string::npos) {
            has_port = true;
            port_text = authority.substr(colon + 1);
        }
    }

    if (!has_port) {
        malformed("No port for ip socket", input);
    }

    TransportBinding binding;
    binding.port = parse_port(port_text, input);

    std::string lower = host;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower.empty() || lower == "localhost") {
        binding.family = BindFamily::Ipv4;
        binding.host = kLoopbackV4;
        return binding;
    }

    in_addr v4{};
    in6_addr v6{};
    if (inet_pton(AF_INET, host.c_str(), &v4) == 1) {
        binding.family = BindFamily::Ipv4;
    } else if (inet_pton(AF_INET6, host.c_str(), &v6) == 1) {
        binding.family = BindFamily::Ipv6;
    } else {
        malformed("Host is not an IP address", input);
    }
    binding.host = host;
    return binding;
}

}  // namespace

const char* to_string(BindFamily family) {
    switch (family) {
        case BindFamily::Ipv4: return "ipv4";
        case BindFamily::Ipv6: return "ipv6";
        case BindFamily::Local: return "local";
    }
    return "unknown";
}

std::string TransportBinding::to_string() const {
    switch (family) {
        case BindFamily::Ipv4:
            return "ip://" + host + ":" + std::to_string(port);
        case BindFamily::Ipv6:
            return "ip://[" + host + "]:" + std::to_string(port);
        case BindFamily::Local:
            return "unix://" + path;
    }
    return "unknown";
}

bool operator==(const TransportBinding& lhs, const TransportBinding& rhs) {
    return lhs.family == rhs.family && lhs.host == rhs.host &&
           lhs.port == rhs.port && lhs.path == rhs.path;
}

TransportBinding parse_bind(const std::string& input) {
    std::string scheme = "ip";
    std::string rest = input;

    size_t sep = input.find(kSchemeSeparator);
    if (sep != std::string::npos) {
        scheme = input.substr(0, sep);
        std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        rest = input.substr(sep + std::char_traits<char>::length(kSchemeSeparator));
    }

    if (scheme == "ip") {
        return parse_ip(rest, input);
    }

    if (scheme == "unix") {
        if (rest.empty()) {
            malformed("No socket path", input);
        }
        TransportBinding binding;
        binding.family = BindFamily::Local;
        binding.path = rest;
        return binding;
    }

    throw ConfigError(ConfigErrorKind::UnsupportedScheme,
                      "Unsupported scheme '" + scheme + "' in '" + input + "'");
}

}  // namespace logagg
