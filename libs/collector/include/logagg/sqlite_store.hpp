// Copyright 2025 LogAgg Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file sqlite_store.hpp
/// @brief RecordStore on top of a SQLite database file
///
/// The connection runs in autocommit mode; execute_many() wraps each call
/// in BEGIN IMMEDIATE / COMMIT. Named parameters (:name, @name, $name) are
/// bound from record fields:
///   null -> NULL, bool -> INTEGER 0/1, integer -> INTEGER,
///   float -> REAL, string -> TEXT, array/object -> TEXT (JSON)

#include "logagg/record_store.hpp"

#include <sqlite3.h>

#include <string>
#include <unordered_map>

namespace logagg {

class SqliteStore : public RecordStore {
public:
    /// Open (or create) the database
    /// @param path Database file, or ":memory:"
    /// @throws StoreError if the database cannot be opened
    explicit SqliteStore(const std::string& path);
    ~SqliteStore() override;

    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    sqlite3* handle() const { return db_; }

    void prepare(const std::string& sql) override;
    void execute(const std::string& sql, const Record& params) override;
    void execute_many(const std::string& sql, const std::vector<Record>& params) override;
    void execute_script(const std::string& sql) override;
    StoreStats stats() const override { return stats_; }
    std::string name() const override { return "sqlite(" + path_ + ")"; }

private:
    sqlite3_stmt* statement(const std::string& sql);
    void bind_record(sqlite3_stmt* stmt, const Record& params);
    void step(sqlite3_stmt* stmt);
    void exec(const char* sql);

    std::string path_;
    sqlite3* db_ = nullptr;
    std::unordered_map<std::string, sqlite3_stmt*> statements_;
    StoreStats stats_;
};

}  // namespace logagg
