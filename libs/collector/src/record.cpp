// Copyright 2025 LogAgg Contributors
// SPDX-License-Identifier: Apache-2.0

#include "logagg/record.hpp"

namespace logagg {

const char* to_string(DecodeStatus status) {
    switch (status) {
        case DecodeStatus::Ok: return "ok";
        case DecodeStatus::InvalidJson: return "invalid_json";
        case DecodeStatus::NotAnObject: return "not_an_object";
        case DecodeStatus::TooDeep: return "too_deep";
    }
    return "unknown";
}

DecodeResult decode_record(const uint8_t* data, size_t size) {
    DecodeResult result;

    // Containers past the limit are dropped as soon as they open, so the
    // parsed value never holds more than kMaxRecordDepth levels
    bool too_deep = false;
    auto limit_depth = [&too_deep](int depth, nlohmann::json::parse_event_t event, nlohmann::json&) {
        if ((event == nlohmann::json::parse_event_t::object_start ||
             event == nlohmann::json::parse_event_t::array_start) &&
            depth > kMaxRecordDepth) {
            too_deep = true;
            return false;
        }
        return true;
    };

    // allow_exceptions=false: parse errors come back as a discarded value
    auto value = nlohmann::json::parse(data, data + size, limit_depth, false);
    if (too_deep && !value.is_discarded()) {
        result.status = DecodeStatus::TooDeep;
        return result;
    }
    if (value.is_discarded()) {
        result.status = DecodeStatus::InvalidJson;
        return result;
    }
    if (!value.is_object()) {
        result.status = DecodeStatus::NotAnObject;
        return result;
    }

    result.status = DecodeStatus::Ok;
    result.record = std::move(value);
    return result;
}

DecodeResult decode_record(const Frame& frame) {
    return decode_record(frame.data(), frame.size());
}

Frame encode_record(const Record& record) {
    std::string text = record.dump();
    return Frame(text.begin(), text.end());
}

Record merge_defaults(const Record& defaults, const Record& record) {
    Record merged = defaults.is_object() ? defaults : Record::object();
    for (const auto& [key, value] : record.items()) {
        merged[key] = value;
    }
    return merged;
}

}  // namespace logagg
