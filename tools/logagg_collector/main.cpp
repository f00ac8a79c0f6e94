// Copyright 2025 LogAgg Contributors
// SPDX-License-Identifier: Apache-2.0

/// @file main.cpp
/// @brief LogAgg Collector - stores JSON datagrams in a SQLite database
///
/// Listens on one datagram endpoint, decodes every datagram as a JSON
/// object, filters it and inserts it into SQLite, either one record at a
/// time (batch 0) or in transactional batches.
///
/// Architecture:
///   DatagramSource -> BatchCollector -> IngestionLoop -> RecordSink -> SqliteStore
///
/// Usage:
///   logagg_collector collector.yaml
///   logagg_collector --config=collector.yaml --batch=100 --total=10000
///   logagg_collector --database_file=events.db --bind=unix:///run/logagg.sock \
///       --create_statement="CREATE TABLE IF NOT EXISTS logs (msg TEXT)" \
///       --insert_statement="INSERT INTO logs VALUES (:msg)"

#include "logagg/batch_collector.hpp"
#include "logagg/datagram_source.hpp"
#include "logagg/errors.hpp"
#include "logagg/ingestion_loop.hpp"
#include "logagg/pipeline_config.hpp"
#include "logagg/record_sink.hpp"
#include "logagg/sqlite_store.hpp"

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <atomic>
#include <csignal>
#include <filesystem>
#include <system_error>

// Command line flags
DEFINE_string(config, "", "YAML or JSON configuration file (may also be given as first argument)");
DEFINE_string(database_file, "", "SQLite database file (overrides 'database')");
DEFINE_string(create_statement, "", "Schema statement (overrides the 'create' list)");
DEFINE_string(insert_statement, "", "Insert statement (overrides the 'insert' list)");
DEFINE_int64(batch, -1, "Records per transaction, 0 = write immediately (overrides 'batch')");
DEFINE_int64(total, -1, "Stop after this many accepted records (-1 = unbounded)");
DEFINE_bool(wipe_existing, false, "Delete the database file before starting");
DEFINE_bool(verbose, false, "Log every accepted record");
DEFINE_string(exporter, "", "Log exporter to attach to (auto-discovery, not implemented)");
DEFINE_string(bind, "", "Endpoint to listen on: ip://host:port or unix://path (overrides 'bind')");

namespace {

std::atomic<logagg::FrameSource*> g_source{nullptr};

void signal_handler(int sig) {
    // A second signal terminates immediately
    std::signal(sig, SIG_DFL);
    if (auto* source = g_source.load()) {
        source->request_stop();
    }
}

logagg::ConfigOverrides overrides_from_flags() {
    logagg::ConfigOverrides overrides;
    if (!FLAGS_database_file.empty()) overrides.database = FLAGS_database_file;
    if (!FLAGS_create_statement.empty()) overrides.create = std::vector<std::string>{FLAGS_create_statement};
    if (!FLAGS_insert_statement.empty()) overrides.insert = std::vector<std::string>{FLAGS_insert_statement};
    if (FLAGS_batch >= 0) overrides.batch = FLAGS_batch;
    if (!FLAGS_exporter.empty()) overrides.exporter = FLAGS_exporter;
    if (!FLAGS_bind.empty()) overrides.bind = FLAGS_bind;
    return overrides;
}

void wipe_database(const std::string& path) {
    std::error_code ec;
    if (std::filesystem::remove(path, ec)) {
        LOG(INFO) << "Removed existing database " << path;
    } else if (ec) {
        LOG(WARNING) << "Could not remove " << path << ": " << ec.message();
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    // Initialize logging and flags
    google::InitGoogleLogging(argv[0]);
    gflags::SetUsageMessage("LogAgg Collector - stores JSON datagrams in a SQLite database\n\n"
                            "Usage: logagg_collector [config.yaml] [flags]");
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    FLAGS_logtostderr = true;

    if (FLAGS_config.empty() && argc > 1) {
        FLAGS_config = argv[1];
    }

    LOG(INFO) << "LogAgg Collector starting...";

    // Resolve configuration
    logagg::PipelineConfig config;
    try {
        YAML::Node file;
        if (!FLAGS_config.empty()) {
            file = logagg::load_config_file(FLAGS_config);
            LOG(INFO) << "Loaded configuration from " << FLAGS_config;
        }
        config = logagg::resolve_config(file, overrides_from_flags());
    } catch (const logagg::ConfigError& e) {
        LOG(ERROR) << "Invalid configuration (" << logagg::to_string(e.kind()) << "): " << e.what();
        return 1;
    }

    LOG(INFO) << "Configuration: " << logagg::to_record(config).dump(2);

    logagg::RunLimits limits;
    if (FLAGS_total >= 0) {
        limits.total = static_cast<uint64_t>(FLAGS_total);
    }

    if (FLAGS_wipe_existing) {
        wipe_database(config.database);
    }

    try {
        logagg::SqliteStore store(config.database);
        for (const auto& statement : config.create) {
            store.execute_script(statement);
        }
        LOG(INFO) << "Schema ready (" << config.create.size() << " statements)";

        logagg::RecordSink sink(store, config.insert, config.defaults);

        logagg::DatagramSourceConfig source_config;
        source_config.binding = config.bind;
        source_config.frame_size = config.frame_size;
        logagg::DatagramSource source(source_config);
        source.open();

        g_source = &source;
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        logagg::BatchCollector collector(source, logagg::make_field_filter(config.filter),
                                         FLAGS_verbose);
        logagg::IngestionLoop loop(collector, sink, config.batch);

        auto stats = loop.run(limits);

        g_source = nullptr;

        auto collector_stats = collector.stats();
        LOG(INFO) << "Final stats:"
                  << " frames=" << collector_stats.frames_received
                  << " decode_failures=" << collector_stats.decode_failures
                  << " filtered=" << collector_stats.filtered_out
                  << " accepted=" << collector_stats.records_accepted
                  << " written=" << stats.records_written
                  << " batches=" << stats.batches_written;
    } catch (const logagg::StoreError& e) {
        g_source = nullptr;
        LOG(ERROR) << "Store failure: " << e.what();
        return 1;
    } catch (const logagg::TransportError& e) {
        g_source = nullptr;
        LOG(ERROR) << "Transport failure: " << e.what();
        return 1;
    }

    LOG(INFO) << "LogAgg Collector stopped.";
    return 0;
}
