// Copyright 2025 LogAgg Contributors
// SPDX-License-Identifier: Apache-2.0

#include "logagg/acceptance_filter.hpp"

namespace logagg {

AcceptanceFilter accept_all() {
    return [](const Record&) { return true; };
}

AcceptanceFilter make_field_filter(const FilterConfig& config) {
    if (config.empty()) {
        return accept_all();
    }

    return [config](const Record& record) {
        for (const auto& [field, expected] : config.require) {
            auto it = record.find(field);
            if (it == record.end() || *it != expected) {
                return false;
            }
        }
        for (const auto& [field, rejected] : config.exclude) {
            auto it = record.find(field);
            if (it != record.end() && *it == rejected) {
                return false;
            }
        }
        return true;
    };
}

}  // namespace logagg
