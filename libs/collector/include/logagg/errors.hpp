// Copyright 2025 LogAgg Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file errors.hpp
/// @brief Fatal error types raised by the collector
///
/// Configuration errors are raised before any datagram is read.
/// Store and transport errors abort a running pipeline. None of them
/// are retried; the collector tool logs them and exits.

#include <stdexcept>
#include <string>

namespace logagg {

/// Reason a configuration was rejected
enum class ConfigErrorKind {
    UnreadableFile,
    MissingDatabase,
    InvalidCreateStatements,
    InvalidInsertStatements,
    InvalidDefaults,
    InvalidBatchSize,
    InvalidFrameSize,
    InvalidFilter,
    ConflictingOptions,
    NoTransportBinding,
    MalformedBindAddress,
    UnsupportedScheme,
    ExporterNotImplemented
};

/// Convert ConfigErrorKind to string
const char* to_string(ConfigErrorKind kind);

/// Configuration-fatal error
class ConfigError : public std::runtime_error {
public:
    ConfigError(ConfigErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ConfigErrorKind kind() const { return kind_; }

private:
    ConfigErrorKind kind_;
};

/// Store write or schema failure
class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Socket creation, bind or receive failure
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace logagg
