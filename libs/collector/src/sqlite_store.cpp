// Copyright 2025 LogAgg Contributors
// SPDX-License-Identifier: Apache-2.0

#include "logagg/sqlite_store.hpp"
#include "logagg/errors.hpp"

#include <glog/logging.h>

#include <cstdint>
#include <limits>

namespace logagg {

namespace {

constexpr int kBusyTimeoutMs = 5000;

std::string error_message(sqlite3* db, const std::string& what) {
    return what + ": " + (db ? sqlite3_errmsg(db) : "unknown sqlite error");
}

/// BEGIN IMMEDIATE on construction, ROLLBACK on destruction unless committed
class ScopedTransaction {
public:
    ScopedTransaction(sqlite3* db, StoreStats& stats) : db_(db), stats_(stats) {
        char* err = nullptr;
        if (sqlite3_exec(db_, "BEGIN IMMEDIATE;", nullptr, nullptr, &err) != SQLITE_OK) {
            std::string msg = std::string("BEGIN failed: ") + (err ? err : "unknown");
            sqlite3_free(err);
            throw StoreError(msg);
        }
    }

    ~ScopedTransaction() {
        if (committed_) {
            return;
        }
        char* err = nullptr;
        if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
            LOG(WARNING) << "[SQLITE] ROLLBACK failed: " << (err ? err : "unknown");
        }
        sqlite3_free(err);
        stats_.transactions_rolled_back++;
    }

    ScopedTransaction(const ScopedTransaction&) = delete;
    ScopedTransaction& operator=(const ScopedTransaction&) = delete;

    void commit() {
        char* err = nullptr;
        if (sqlite3_exec(db_, "COMMIT;", nullptr, nullptr, &err) != SQLITE_OK) {
            std::string msg = std::string("COMMIT failed: ") + (err ? err : "unknown");
            sqlite3_free(err);
            throw StoreError(msg);
        }
        committed_ = true;
        stats_.transactions_committed++;
    }

private:
    sqlite3* db_;
    StoreStats& stats_;
    bool committed_ = false;
};

}  // namespace

SqliteStore::SqliteStore(const std::string& path) : path_(path) {
    int rc = sqlite3_open_v2(path_.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = error_message(db_, "Failed to open database " + path_);
        sqlite3_close(db_);
        db_ = nullptr;
        throw StoreError(msg);
    }

    sqlite3_busy_timeout(db_, kBusyTimeoutMs);
    LOG(INFO) << "[SQLITE] Opened " << path_;
}

SqliteStore::~SqliteStore() {
    for (auto& [sql, stmt] : statements_) {
        sqlite3_finalize(stmt);
    }
    statements_.clear();

    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteStore::prepare(const std::string& sql) {
    statement(sql);
}

sqlite3_stmt* SqliteStore::statement(const std::string& sql) {
    auto it = statements_.find(sql);
    if (it != statements_.end()) {
        return it->second;
    }

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK || stmt == nullptr) {
        sqlite3_finalize(stmt);
        throw StoreError(error_message(db_, "Failed to prepare '" + sql + "'"));
    }

    statements_.emplace(sql, stmt);
    return stmt;
}

void SqliteStore::bind_record(sqlite3_stmt* stmt, const Record& params) {
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);

    const int count = sqlite3_bind_parameter_count(stmt);
    for (int i = 1; i <= count; ++i) {
        const char* raw_name = sqlite3_bind_parameter_name(stmt, i);
        if (raw_name == nullptr) {
            throw StoreError("Positional parameters are not supported in '" +
                             std::string(sqlite3_sql(stmt)) + "'");
        }

        // Strip the ':', '@' or '$' prefix
        std::string key(raw_name + 1);
        auto field = params.find(key);
        if (field == params.end()) {
            throw StoreError("No value supplied for binding parameter " +
                             std::string(raw_name));
        }

        int rc = SQLITE_OK;
        const auto& value = *field;
        switch (value.type()) {
            case nlohmann::json::value_t::null:
                rc = sqlite3_bind_null(stmt, i);
                break;
            case nlohmann::json::value_t::boolean:
                rc = sqlite3_bind_int(stmt, i, value.get<bool>() ? 1 : 0);
                break;
            case nlohmann::json::value_t::number_integer:
                rc = sqlite3_bind_int64(stmt, i, value.get<int64_t>());
                break;
            case nlohmann::json::value_t::number_unsigned: {
                auto u = value.get<uint64_t>();
                if (u <= static_cast<uint64_t>(std::numeric_limits<sqlite3_int64>::max())) {
                    rc = sqlite3_bind_int64(stmt, i, static_cast<sqlite3_int64>(u));
                } else {
                    rc = sqlite3_bind_double(stmt, i, static_cast<double>(u));
                }
                break;
            }
            case nlohmann::json::value_t::number_float:
                rc = sqlite3_bind_double(stmt, i, value.get<double>());
                break;
            case nlohmann::json::value_t::string: {
                const auto& text = value.get_ref<const std::string&>();
                rc = sqlite3_bind_text(stmt, i, text.c_str(),
                                       static_cast<int>(text.size()), SQLITE_TRANSIENT);
                break;
            }
            default: {
                // Arrays and objects are stored as their JSON text
                std::string text = value.dump();
                rc = sqlite3_bind_text(stmt, i, text.c_str(),
                                       static_cast<int>(text.size()), SQLITE_TRANSIENT);
                break;
            }
        }

        if (rc != SQLITE_OK) {
            throw StoreError(error_message(db_, "Failed to bind " + std::string(raw_name)));
        }
    }
    stats_.rows_bound++;
}

void SqliteStore::step(sqlite3_stmt* stmt) {
    int rc = sqlite3_step(stmt);
    while (rc == SQLITE_ROW) {
        rc = sqlite3_step(stmt);
    }

    if (rc != SQLITE_DONE) {
        std::string msg = error_message(db_, "Failed to execute '" +
                                             std::string(sqlite3_sql(stmt)) + "'");
        sqlite3_reset(stmt);
        throw StoreError(msg);
    }

    sqlite3_reset(stmt);
    stats_.statements_executed++;
}

void SqliteStore::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = std::string("Failed to execute '") + sql + "': " +
                          (err ? err : "unknown");
        sqlite3_free(err);
        throw StoreError(msg);
    }
    stats_.statements_executed++;
}

void SqliteStore::execute(const std::string& sql, const Record& params) {
    sqlite3_stmt* stmt = statement(sql);
    bind_record(stmt, params);
    step(stmt);
}

void SqliteStore::execute_many(const std::string& sql, const std::vector<Record>& params) {
    if (params.empty()) {
        return;
    }

    sqlite3_stmt* stmt = statement(sql);
    ScopedTransaction tx(db_, stats_);
    for (const auto& row : params) {
        bind_record(stmt, row);
        step(stmt);
    }
    tx.commit();
}

void SqliteStore::execute_script(const std::string& sql) {
    exec(sql.c_str());
}

}  // namespace logagg
