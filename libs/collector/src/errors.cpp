// Copyright 2025 LogAgg Contributors
// SPDX-License-Identifier: Apache-2.0

#include "logagg/errors.hpp"

namespace logagg {

const char* to_string(ConfigErrorKind kind) {
    switch (kind) {
        case ConfigErrorKind::UnreadableFile: return "unreadable_file";
        case ConfigErrorKind::MissingDatabase: return "missing_database";
        case ConfigErrorKind::InvalidCreateStatements: return "invalid_create_statements";
        case ConfigErrorKind::InvalidInsertStatements: return "invalid_insert_statements";
        case ConfigErrorKind::InvalidDefaults: return "invalid_defaults";
        case ConfigErrorKind::InvalidBatchSize: return "invalid_batch_size";
        case ConfigErrorKind::InvalidFrameSize: return "invalid_frame_size";
        case ConfigErrorKind::InvalidFilter: return "invalid_filter";
        case ConfigErrorKind::ConflictingOptions: return "conflicting_options";
        case ConfigErrorKind::NoTransportBinding: return "no_transport_binding";
        case ConfigErrorKind::MalformedBindAddress: return "malformed_bind_address";
        case ConfigErrorKind::UnsupportedScheme: return "unsupported_scheme";
        case ConfigErrorKind::ExporterNotImplemented: return "exporter_not_implemented";
    }
    return "unknown";
}

}  // namespace logagg
