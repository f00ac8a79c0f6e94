// Copyright 2025 LogAgg Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file pipeline_config.hpp
/// @brief Validated collector configuration
///
/// Settings come from a YAML (or JSON) file and command line overrides.
/// A value given on the command line wins over the file. The result is
/// checked once at startup; any problem raises a ConfigError before the
/// collector binds its socket.
///
/// Example file:
/// @code
///   database: events.db
///   create:
///     - CREATE TABLE IF NOT EXISTS logs (ts TEXT, region TEXT, msg TEXT)
///   insert:
///     - INSERT INTO logs VALUES (:ts, :region, :msg)
///   defaults:
///     region: us
///   batch: 100
///   bind: ip://0.0.0.0:5140
///   filter:
///     exclude:
///       msg: heartbeat
/// @endcode

#include "logagg/acceptance_filter.hpp"
#include "logagg/bind_address.hpp"
#include "logagg/record.hpp"

#include <yaml-cpp/yaml.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace logagg {

/// Resolved, validated configuration. Read-only after startup.
struct PipelineConfig {
    std::string database;
    std::vector<std::string> create;
    std::vector<std::string> insert;   ///< Never empty
    Record defaults = Record::object();
    uint64_t batch = 0;                ///< 0 = immediate streaming mode
    std::optional<std::string> exporter;
    TransportBinding bind;
    FilterConfig filter;
    size_t frame_size = 4096;
};

/// Command line values; unset fields fall back to the file
struct ConfigOverrides {
    std::optional<std::string> database;
    std::optional<std::vector<std::string>> create;
    std::optional<std::vector<std::string>> insert;
    std::optional<int64_t> batch;
    std::optional<std::string> exporter;
    std::optional<std::string> bind;
};

/// Load a configuration file
/// @throws ConfigError (UnreadableFile)
YAML::Node load_config_file(const std::string& path);

/// Merge overrides over the file contents and validate the result
/// @param file Parsed file (may be a null node when no file is used)
/// @throws ConfigError describing the first violated requirement
PipelineConfig resolve_config(const YAML::Node& file, const ConfigOverrides& overrides);

/// Convert a YAML value to a JSON value. Quoted scalars stay strings.
/// Plain scalars follow the YAML 1.2 core schema: true/false become
/// booleans, decimal integers and floats become numbers, the rest stay
/// strings.
/// @throws YAML::RepresentationException if a mapping key is not a scalar
Record yaml_to_record(const YAML::Node& node);

/// Dump the configuration as a JSON object (for logging)
Record to_record(const PipelineConfig& config);

}  // namespace logagg
