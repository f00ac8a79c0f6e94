// Copyright 2025 LogAgg Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file record.hpp
/// @brief Schema-less event records and their datagram wire format
///
/// A Record is one decoded JSON object. Frames on the wire are plain
/// UTF-8 JSON text, one object per datagram.
///
/// Example:
/// @code
///   auto result = decode_record(frame);
///   if (result.ok()) {
///       Record row = merge_defaults(defaults, result.record);
///   }
/// @endcode

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace logagg {

/// One decoded event: always a JSON object
using Record = nlohmann::json;

/// Ordered sequence of accepted records written together
using Batch = std::vector<Record>;

/// Raw datagram payload before decoding
using Frame = std::vector<uint8_t>;

/// Deepest object/array nesting accepted in a frame; the top-level object is depth 0
constexpr int kMaxRecordDepth = 512;

/// Outcome of decoding a frame
enum class DecodeStatus {
    Ok,
    InvalidJson,   ///< Not parseable as JSON
    NotAnObject,   ///< Valid JSON, but not a mapping
    TooDeep        ///< Nested deeper than kMaxRecordDepth
};

/// Convert DecodeStatus to string
const char* to_string(DecodeStatus status);

/// Tagged decode result; `record` is only meaningful when ok()
struct DecodeResult {
    DecodeStatus status = DecodeStatus::InvalidJson;
    Record record;

    bool ok() const { return status == DecodeStatus::Ok; }
};

/// Decode a raw frame. Never throws.
DecodeResult decode_record(const uint8_t* data, size_t size);

/// Decode a raw frame. Never throws.
DecodeResult decode_record(const Frame& frame);

/// Serialize a record to its wire frame (compact JSON)
Frame encode_record(const Record& record);

/// Build the effective record written to the store.
/// Keys of `record` win over keys of `defaults`.
Record merge_defaults(const Record& defaults, const Record& record);

}  // namespace logagg
