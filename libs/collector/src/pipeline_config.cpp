// Copyright 2025 LogAgg Contributors
// SPDX-License-Identifier: Apache-2.0

#include "logagg/pipeline_config.hpp"
#include "logagg/errors.hpp"

#include <cerrno>
#include <cstdlib>
#include <map>

namespace logagg {

namespace {

constexpr int64_t kMaxFrameSize = 65536;

YAML::Node field(const YAML::Node& file, const char* key) {
    if (!file.IsMap()) {
        return YAML::Node();
    }
    return file[key];
}

bool present(const YAML::Node& node) {
    return node.IsDefined() && !node.IsNull();
}

std::optional<std::string> scalar_string(const YAML::Node& node, ConfigErrorKind kind,
                                         const char* key) {
    if (!present(node)) {
        return std::nullopt;
    }
    if (!node.IsScalar()) {
        throw ConfigError(kind, std::string("'") + key + "' must be a string");
    }
    return node.Scalar();
}

std::vector<std::string> statement_list(const YAML::Node& node, ConfigErrorKind kind,
                                        const char* what) {
    if (!present(node)) {
        throw ConfigError(kind, std::string("No ") + what + " statement list configured");
    }
    if (!node.IsSequence()) {
        throw ConfigError(kind, std::string("The ") + what + " statements must be a list");
    }

    std::vector<std::string> statements;
    for (const auto& item : node) {
        if (!item.IsScalar()) {
            throw ConfigError(kind, std::string("Every ") + what + " statement must be a string");
        }
        statements.push_back(item.Scalar());
    }
    return statements;
}

int64_t integer(const YAML::Node& node, ConfigErrorKind kind, const char* key) {
    if (!node.IsScalar()) {
        throw ConfigError(kind, std::string("'") + key + "' must be an integer");
    }
    int64_t value = 0;
    if (!YAML::convert<int64_t>::decode(node, value)) {
        throw ConfigError(kind, std::string("Invalid ") + key + ": '" + node.Scalar() + "'");
    }
    return value;
}

/// [-+]?[0-9]+
bool is_decimal_integer(const std::string& text) {
    size_t pos = (!text.empty() && (text[0] == '-' || text[0] == '+')) ? 1 : 0;
    if (pos == text.size()) {
        return false;
    }
    for (; pos < text.size(); ++pos) {
        if (text[pos] < '0' || text[pos] > '9') {
            return false;
        }
    }
    return true;
}

/// [-+]?(\.[0-9]+|[0-9]+(\.[0-9]*)?)([eE][-+]?[0-9]+)?
bool is_decimal_float(const std::string& text) {
    auto digits = [&text](size_t& pos) {
        size_t start = pos;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            ++pos;
        }
        return pos - start;
    };

    size_t pos = (!text.empty() && (text[0] == '-' || text[0] == '+')) ? 1 : 0;
    size_t mantissa = digits(pos);
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        mantissa += digits(pos);
    }
    if (mantissa == 0) {
        return false;
    }
    if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
        ++pos;
        if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
            ++pos;
        }
        if (digits(pos) == 0) {
            return false;
        }
    }
    return pos == text.size();
}

/// Plain scalar typed by the YAML 1.2 core schema. Anything that is not
/// exactly a boolean or a decimal number stays a string, e.g. `no` or `0x1F`.
Record plain_scalar(const std::string& text) {
    if (text == "true" || text == "True" || text == "TRUE") {
        return true;
    }
    if (text == "false" || text == "False" || text == "FALSE") {
        return false;
    }
    if (is_decimal_integer(text)) {
        errno = 0;
        long long value = std::strtoll(text.c_str(), nullptr, 10);
        if (errno != ERANGE) {
            return static_cast<int64_t>(value);
        }
    }
    if (is_decimal_float(text)) {
        errno = 0;
        double value = std::strtod(text.c_str(), nullptr);
        if (errno != ERANGE) {
            return value;
        }
    }
    return text;
}

/// yaml_to_record for a config section, with YAML errors reported as `kind`
Record config_value(const YAML::Node& node, ConfigErrorKind kind, const std::string& what) {
    try {
        return yaml_to_record(node);
    } catch (const YAML::Exception& e) {
        throw ConfigError(kind, "Invalid " + what + ": " + e.what());
    }
}

std::string filter_key(const YAML::Node& key, const std::string& where) {
    if (!key.IsScalar()) {
        throw ConfigError(ConfigErrorKind::InvalidFilter, where + " keys must be strings");
    }
    return key.Scalar();
}

std::map<std::string, Record> field_rules(const YAML::Node& node, const char* section) {
    std::map<std::string, Record> rules;
    if (!present(node)) {
        return rules;
    }
    if (!node.IsMap()) {
        throw ConfigError(ConfigErrorKind::InvalidFilter,
                          std::string("filter.") + section + " must be a mapping");
    }
    std::string where = std::string("filter.") + section;
    for (const auto& entry : node) {
        auto key = filter_key(entry.first, where);
        rules[key] = config_value(entry.second, ConfigErrorKind::InvalidFilter, where + "." + key);
    }
    return rules;
}

FilterConfig parse_filter(const YAML::Node& node) {
    FilterConfig filter;
    if (!present(node)) {
        return filter;
    }
    if (!node.IsMap()) {
        throw ConfigError(ConfigErrorKind::InvalidFilter, "'filter' must be a mapping");
    }
    for (const auto& entry : node) {
        auto key = filter_key(entry.first, "filter");
        if (key != "require" && key != "exclude") {
            throw ConfigError(ConfigErrorKind::InvalidFilter,
                              "Unknown filter section '" + key + "'");
        }
    }
    filter.require = field_rules(node["require"], "require");
    filter.exclude = field_rules(node["exclude"], "exclude");
    return filter;
}

}  // namespace

YAML::Node load_config_file(const std::string& path) {
    try {
        return YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw ConfigError(ConfigErrorKind::UnreadableFile,
                          "Failed to load config file " + path + ": " + e.what());
    }
}

Record yaml_to_record(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Undefined:
        case YAML::NodeType::Null:
            return nullptr;

        case YAML::NodeType::Sequence: {
            Record array = Record::array();
            for (const auto& item : node) {
                array.push_back(yaml_to_record(item));
            }
            return array;
        }

        case YAML::NodeType::Map: {
            Record object = Record::object();
            for (const auto& entry : node) {
                if (!entry.first.IsScalar()) {
                    throw YAML::RepresentationException(entry.first.Mark(),
                                                        "mapping keys must be scalars");
                }
                object[entry.first.Scalar()] = yaml_to_record(entry.second);
            }
            return object;
        }

        case YAML::NodeType::Scalar: {
            // Quoted scalars carry the non-specific "!" tag
            if (node.Tag() == "!") {
                return node.Scalar();
            }
            return plain_scalar(node.Scalar());
        }
    }
    return nullptr;
}

PipelineConfig resolve_config(const YAML::Node& file, const ConfigOverrides& overrides) {
    if (present(file) && !file.IsMap()) {
        throw ConfigError(ConfigErrorKind::UnreadableFile,
                          "Configuration file must contain a mapping");
    }

    PipelineConfig config;

    // database
    auto database = overrides.database
        ? overrides.database
        : scalar_string(field(file, "database"), ConfigErrorKind::MissingDatabase, "database");
    if (!database || database->empty()) {
        throw ConfigError(ConfigErrorKind::MissingDatabase, "No database file configured");
    }
    config.database = *database;

    // create / insert
    config.create = overrides.create
        ? *overrides.create
        : statement_list(field(file, "create"), ConfigErrorKind::InvalidCreateStatements, "create");
    config.insert = overrides.insert
        ? *overrides.insert
        : statement_list(field(file, "insert"), ConfigErrorKind::InvalidInsertStatements, "insert");
    if (config.insert.empty()) {
        throw ConfigError(ConfigErrorKind::InvalidInsertStatements,
                          "At least one insert statement is required");
    }

    // defaults
    auto defaults = field(file, "defaults");
    if (present(defaults)) {
        if (!defaults.IsMap()) {
            throw ConfigError(ConfigErrorKind::InvalidDefaults, "'defaults' must be a mapping");
        }
        config.defaults = config_value(defaults, ConfigErrorKind::InvalidDefaults, "defaults");
    }

    // batch
    int64_t batch = 0;
    if (overrides.batch) {
        batch = *overrides.batch;
    } else if (present(field(file, "batch"))) {
        batch = integer(field(file, "batch"), ConfigErrorKind::InvalidBatchSize, "batch");
    }
    if (batch < 0) {
        throw ConfigError(ConfigErrorKind::InvalidBatchSize,
                          "Invalid batch size " + std::to_string(batch));
    }
    config.batch = static_cast<uint64_t>(batch);

    // frame_size
    auto frame_size = field(file, "frame_size");
    if (present(frame_size)) {
        int64_t size = integer(frame_size, ConfigErrorKind::InvalidFrameSize, "frame_size");
        if (size <= 0 || size > kMaxFrameSize) {
            throw ConfigError(ConfigErrorKind::InvalidFrameSize,
                              "Invalid frame size " + std::to_string(size));
        }
        config.frame_size = static_cast<size_t>(size);
    }

    config.filter = parse_filter(field(file, "filter"));

    // bind / exporter
    if (overrides.bind && overrides.exporter) {
        throw ConfigError(ConfigErrorKind::ConflictingOptions,
                          "--bind and --exporter are mutually exclusive");
    }
    config.exporter = overrides.exporter
        ? overrides.exporter
        : scalar_string(field(file, "exporter"), ConfigErrorKind::NoTransportBinding, "exporter");
    auto bind = overrides.bind
        ? overrides.bind
        : scalar_string(field(file, "bind"), ConfigErrorKind::MalformedBindAddress, "bind");

    if (!bind) {
        if (!config.exporter) {
            throw ConfigError(ConfigErrorKind::NoTransportBinding,
                              "Neither bind nor exporter configured");
        }
        throw ConfigError(ConfigErrorKind::ExporterNotImplemented,
                          "Exporter auto-discovery is not implemented; "
                          "attach to the log exporter manually with 'bind'");
    }
    config.bind = parse_bind(*bind);

    return config;
}

Record to_record(const PipelineConfig& config) {
    Record out = Record::object();
    out["database"] = config.database;
    out["create"] = config.create;
    out["insert"] = config.insert;
    out["defaults"] = config.defaults;
    out["batch"] = config.batch;
    out["exporter"] = config.exporter ? Record(*config.exporter) : Record();
    out["bind"] = config.bind.to_string();
    out["frame_size"] = config.frame_size;

    Record filter = Record::object();
    filter["require"] = Record::object();
    filter["exclude"] = Record::object();
    for (const auto& [key, value] : config.filter.require) {
        filter["require"][key] = value;
    }
    for (const auto& [key, value] : config.filter.exclude) {
        filter["exclude"][key] = value;
    }
    out["filter"] = filter;
    return out;
}

}  // namespace logagg
