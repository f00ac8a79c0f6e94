// Copyright 2025 LogAgg Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file acceptance_filter.hpp
/// @brief Predicates deciding which decoded records are kept
///
/// Records rejected here count towards neither the per-batch nor the
/// total record limit, exactly like frames that fail to decode.

#include "logagg/record.hpp"

#include <functional>
#include <map>
#include <string>

namespace logagg {

/// Returns true to keep the record
using AcceptanceFilter = std::function<bool(const Record&)>;

/// Filter that keeps every record
AcceptanceFilter accept_all();

/// Field equality rules loaded from the `filter` config section
struct FilterConfig {
    /// Record must carry each field with an equal value
    std::map<std::string, Record> require;

    /// Record is dropped if it carries any field with an equal value
    std::map<std::string, Record> exclude;

    bool empty() const { return require.empty() && exclude.empty(); }
};

/// Build a predicate from field rules. Empty rules accept everything.
AcceptanceFilter make_field_filter(const FilterConfig& config);

}  // namespace logagg
