// Copyright 2025 LogAgg Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file record_store.hpp
/// @brief Abstract interface for the relational store records end up in
///
/// Statements are parameterized by name; the parameter values come from
/// the (defaults-merged) record. Implementations throw StoreError on any
/// failure.

#include "logagg/record.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace logagg {

/// Statistics for record stores
struct StoreStats {
    uint64_t statements_executed = 0;
    uint64_t rows_bound = 0;
    uint64_t transactions_committed = 0;
    uint64_t transactions_rolled_back = 0;
};

class RecordStore {
public:
    virtual ~RecordStore() = default;

    /// Validate and cache a statement ahead of its first use
    virtual void prepare(const std::string& sql) = 0;

    /// Execute one statement for one record and commit it
    virtual void execute(const std::string& sql, const Record& params) = 0;

    /// Execute one statement for every record as a single transaction.
    /// Either every row is applied or none is.
    virtual void execute_many(const std::string& sql, const std::vector<Record>& params) = 0;

    /// Execute a parameterless statement (schema bootstrap)
    virtual void execute_script(const std::string& sql) = 0;

    /// Get statistics
    virtual StoreStats stats() const = 0;

    /// Get store name for logging
    virtual std::string name() const = 0;
};

}  // namespace logagg
