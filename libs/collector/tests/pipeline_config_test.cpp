// Copyright 2025 LogAgg Contributors
// SPDX-License-Identifier: Apache-2.0

#include "logagg/errors.hpp"
#include "logagg/pipeline_config.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>

namespace logagg::test {

namespace {

const char* const kMinimal = R"(
database: events.db
create:
  - CREATE TABLE IF NOT EXISTS logs (msg TEXT)
insert:
  - INSERT INTO logs VALUES (:msg)
bind: ip://127.0.0.1:5140
)";

ConfigErrorKind error_kind(const std::string& yaml, const ConfigOverrides& overrides = {}) {
    try {
        resolve_config(YAML::Load(yaml), overrides);
    } catch (const ConfigError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "resolve_config accepted:\n" << yaml;
    return ConfigErrorKind::UnreadableFile;
}

}  // namespace

// =============================================================================
// Resolution
// =============================================================================

TEST(PipelineConfigTest, MinimalFile) {
    auto config = resolve_config(YAML::Load(kMinimal), {});

    EXPECT_EQ(config.database, "events.db");
    ASSERT_EQ(config.create.size(), 1u);
    ASSERT_EQ(config.insert.size(), 1u);
    EXPECT_EQ(config.insert[0], "INSERT INTO logs VALUES (:msg)");
    EXPECT_EQ(config.batch, 0u);
    EXPECT_TRUE(config.defaults.is_object());
    EXPECT_TRUE(config.defaults.empty());
    EXPECT_FALSE(config.exporter.has_value());
    EXPECT_EQ(config.bind.host, "127.0.0.1");
    EXPECT_EQ(config.bind.port, 5140);
    EXPECT_EQ(config.frame_size, 4096u);
    EXPECT_TRUE(config.filter.empty());
}

TEST(PipelineConfigTest, FullFile) {
    auto config = resolve_config(YAML::Load(std::string(kMinimal) + R"(
defaults:
  region: us
  level: 3
  code: "007"
  sampled: true
batch: 100
frame_size: 8192
filter:
  require:
    service: api
  exclude:
    msg: heartbeat
)"), {});

    EXPECT_EQ(config.batch, 100u);
    EXPECT_EQ(config.frame_size, 8192u);
    EXPECT_EQ(config.defaults["region"], "us");
    EXPECT_EQ(config.defaults["level"], 3);
    EXPECT_EQ(config.defaults["code"], "007");
    EXPECT_EQ(config.defaults["sampled"], true);
    EXPECT_EQ(config.filter.require.at("service"), "api");
    EXPECT_EQ(config.filter.exclude.at("msg"), "heartbeat");
}

TEST(PipelineConfigTest, JsonFileAccepted) {
    auto config = resolve_config(YAML::Load(R"({
        "database": "events.db",
        "create": [],
        "insert": ["INSERT INTO logs VALUES (:msg)"],
        "batch": 5,
        "bind": "unix:///tmp/logagg.sock"
    })"), {});

    EXPECT_TRUE(config.create.empty());
    EXPECT_EQ(config.batch, 5u);
    EXPECT_EQ(config.bind.family, BindFamily::Local);
}

TEST(PipelineConfigTest, OverridesWinOverFile) {
    ConfigOverrides overrides;
    overrides.database = "override.db";
    overrides.create = std::vector<std::string>{"CREATE TABLE t (a)"};
    overrides.insert = std::vector<std::string>{"INSERT INTO t VALUES (:a)"};
    overrides.batch = 7;
    overrides.bind = "unix:///tmp/override.sock";

    auto config = resolve_config(YAML::Load(kMinimal), overrides);

    EXPECT_EQ(config.database, "override.db");
    EXPECT_EQ(config.create[0], "CREATE TABLE t (a)");
    EXPECT_EQ(config.insert[0], "INSERT INTO t VALUES (:a)");
    EXPECT_EQ(config.batch, 7u);
    EXPECT_EQ(config.bind.path, "/tmp/override.sock");
}

TEST(PipelineConfigTest, OverridesWithoutFile) {
    ConfigOverrides overrides;
    overrides.database = "cli.db";
    overrides.create = std::vector<std::string>{};
    overrides.insert = std::vector<std::string>{"INSERT INTO t VALUES (:a)"};
    overrides.bind = "ip://:9000";

    auto config = resolve_config(YAML::Node(), overrides);

    EXPECT_EQ(config.database, "cli.db");
    EXPECT_EQ(config.bind.port, 9000);
}

TEST(PipelineConfigTest, BindOverrideSkipsMalformedFileBind) {
    ConfigOverrides overrides;
    overrides.bind = "ip://127.0.0.1:6000";

    auto config = resolve_config(
        YAML::Load(R"(
database: events.db
create: []
insert: ["INSERT INTO t VALUES (:a)"]
bind: "tcp://nowhere"
)"), overrides);

    EXPECT_EQ(config.bind.port, 6000);
}

TEST(PipelineConfigTest, ToRecordContainsSettings) {
    auto config = resolve_config(YAML::Load(kMinimal), {});

    auto dumped = to_record(config);

    EXPECT_EQ(dumped["database"], "events.db");
    EXPECT_EQ(dumped["bind"], "ip://127.0.0.1:5140");
    EXPECT_EQ(dumped["batch"], 0);
    EXPECT_TRUE(dumped["exporter"].is_null());
}

// =============================================================================
// Validation errors
// =============================================================================

TEST(PipelineConfigTest, TopLevelMustBeMapping) {
    EXPECT_EQ(error_kind("- a\n- b\n"), ConfigErrorKind::UnreadableFile);
}

TEST(PipelineConfigTest, MissingDatabase) {
    EXPECT_EQ(error_kind("create: []\ninsert: [x]\nbind: ip://:1\n"),
              ConfigErrorKind::MissingDatabase);
}

TEST(PipelineConfigTest, DatabaseCheckedFirst) {
    // Every other setting is wrong as well
    EXPECT_EQ(error_kind("batch: -1\nbind: tcp://x\n"), ConfigErrorKind::MissingDatabase);
}

TEST(PipelineConfigTest, CreateMustBeList) {
    EXPECT_EQ(error_kind("database: a.db\ncreate: CREATE TABLE t (a)\ninsert: [x]\nbind: ip://:1\n"),
              ConfigErrorKind::InvalidCreateStatements);
    EXPECT_EQ(error_kind("database: a.db\ninsert: [x]\nbind: ip://:1\n"),
              ConfigErrorKind::InvalidCreateStatements);
}

TEST(PipelineConfigTest, InsertMustBeNonEmptyList) {
    EXPECT_EQ(error_kind("database: a.db\ncreate: []\ninsert: []\nbind: ip://:1\n"),
              ConfigErrorKind::InvalidInsertStatements);
    EXPECT_EQ(error_kind("database: a.db\ncreate: []\ninsert: {a: b}\nbind: ip://:1\n"),
              ConfigErrorKind::InvalidInsertStatements);
    EXPECT_EQ(error_kind("database: a.db\ncreate: []\ninsert: [[nested]]\nbind: ip://:1\n"),
              ConfigErrorKind::InvalidInsertStatements);
}

TEST(PipelineConfigTest, DefaultsMustBeMapping) {
    EXPECT_EQ(error_kind(std::string(kMinimal) + "defaults: [a, b]\n"),
              ConfigErrorKind::InvalidDefaults);
}

TEST(PipelineConfigTest, BatchMustBeNonNegativeInteger) {
    EXPECT_EQ(error_kind(std::string(kMinimal) + "batch: -1\n"), ConfigErrorKind::InvalidBatchSize);
    EXPECT_EQ(error_kind(std::string(kMinimal) + "batch: ten\n"), ConfigErrorKind::InvalidBatchSize);
    EXPECT_EQ(error_kind(std::string(kMinimal) + "batch: 2.5\n"), ConfigErrorKind::InvalidBatchSize);

    ConfigOverrides overrides;
    overrides.batch = -3;
    EXPECT_EQ(error_kind(kMinimal, overrides), ConfigErrorKind::InvalidBatchSize);
}

TEST(PipelineConfigTest, FrameSizeRange) {
    EXPECT_EQ(error_kind(std::string(kMinimal) + "frame_size: 0\n"),
              ConfigErrorKind::InvalidFrameSize);
    EXPECT_EQ(error_kind(std::string(kMinimal) + "frame_size: 70000\n"),
              ConfigErrorKind::InvalidFrameSize);
}

TEST(PipelineConfigTest, DefaultsKeysMustBeScalars) {
    EXPECT_EQ(error_kind(std::string(kMinimal) + "defaults: {[a]: 1}\n"),
              ConfigErrorKind::InvalidDefaults);
    EXPECT_EQ(error_kind(std::string(kMinimal) + "defaults:\n  meta: {[k]: 1}\n"),
              ConfigErrorKind::InvalidDefaults);
}

TEST(PipelineConfigTest, FilterKeysMustBeScalars) {
    EXPECT_EQ(error_kind(std::string(kMinimal) + "filter: {[require]: {}}\n"),
              ConfigErrorKind::InvalidFilter);
    EXPECT_EQ(error_kind(std::string(kMinimal) + "filter:\n  require: {[a]: 1}\n"),
              ConfigErrorKind::InvalidFilter);
    EXPECT_EQ(error_kind(std::string(kMinimal) + "filter:\n  exclude: {level: {[x]: 1}}\n"),
              ConfigErrorKind::InvalidFilter);
}

TEST(PipelineConfigTest, FilterSections) {
    EXPECT_EQ(error_kind(std::string(kMinimal) + "filter: [a]\n"), ConfigErrorKind::InvalidFilter);
    EXPECT_EQ(error_kind(std::string(kMinimal) + "filter:\n  match: {a: 1}\n"),
              ConfigErrorKind::InvalidFilter);
    EXPECT_EQ(error_kind(std::string(kMinimal) + "filter:\n  require: [a]\n"),
              ConfigErrorKind::InvalidFilter);
}

TEST(PipelineConfigTest, BindAndExporterConflict) {
    ConfigOverrides overrides;
    overrides.bind = "ip://:1";
    overrides.exporter = "journald";

    EXPECT_EQ(error_kind(kMinimal, overrides), ConfigErrorKind::ConflictingOptions);
}

TEST(PipelineConfigTest, NeitherBindNorExporter) {
    EXPECT_EQ(error_kind("database: a.db\ncreate: []\ninsert: [x]\n"),
              ConfigErrorKind::NoTransportBinding);
}

TEST(PipelineConfigTest, ExporterOnlyNotImplemented) {
    EXPECT_EQ(error_kind("database: a.db\ncreate: []\ninsert: [x]\nexporter: journald\n"),
              ConfigErrorKind::ExporterNotImplemented);
}

TEST(PipelineConfigTest, MalformedBind) {
    EXPECT_EQ(error_kind("database: a.db\ncreate: []\ninsert: [x]\nbind: ip://127.0.0.1\n"),
              ConfigErrorKind::MalformedBindAddress);
    EXPECT_EQ(error_kind("database: a.db\ncreate: []\ninsert: [x]\nbind: udp://:1\n"),
              ConfigErrorKind::UnsupportedScheme);
}

TEST(PipelineConfigTest, ErrorKindToString) {
    EXPECT_STREQ(to_string(ConfigErrorKind::InvalidDefaults), "invalid_defaults");
    EXPECT_STREQ(to_string(ConfigErrorKind::ExporterNotImplemented), "exporter_not_implemented");
}

// =============================================================================
// Files and value conversion
// =============================================================================

TEST(PipelineConfigTest, LoadMissingFileFails) {
    try {
        load_config_file("/nonexistent/collector.yaml");
        FAIL() << "Expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_EQ(e.kind(), ConfigErrorKind::UnreadableFile);
    }
}

TEST(PipelineConfigTest, LoadFileFromDisk) {
    std::string path = ::testing::TempDir() + "logagg_config_test.yaml";
    {
        std::ofstream out(path);
        out << kMinimal;
    }

    auto config = resolve_config(load_config_file(path), {});

    EXPECT_EQ(config.database, "events.db");
    std::remove(path.c_str());
}

TEST(YamlToRecordTest, ScalarTypes) {
    auto node = YAML::Load(R"(
int: 42
negative: -7
float: 1.5
yes: true
text: hello
quoted_number: "42"
empty:
)");

    auto record = yaml_to_record(node);

    EXPECT_TRUE(record["int"].is_number_integer());
    EXPECT_EQ(record["int"], 42);
    EXPECT_EQ(record["negative"], -7);
    EXPECT_DOUBLE_EQ(record["float"].get<double>(), 1.5);
    EXPECT_EQ(record["yes"], true);
    EXPECT_EQ(record["text"], "hello");
    EXPECT_TRUE(record["quoted_number"].is_string());
    EXPECT_TRUE(record["empty"].is_null());
}

TEST(YamlToRecordTest, OnlyCoreSchemaScalarsAreTyped) {
    auto record = yaml_to_record(YAML::Load(R"(
country: no
flag: on
switch: off
answer: yes
hex: 0x1F
octal: 0o17
version: 1.2.3
shout: TRUE
exp: 1e3
big: 99999999999999999999
)"));

    EXPECT_EQ(record["country"], "no");
    EXPECT_EQ(record["flag"], "on");
    EXPECT_EQ(record["switch"], "off");
    EXPECT_EQ(record["answer"], "yes");
    EXPECT_EQ(record["hex"], "0x1F");
    EXPECT_EQ(record["octal"], "0o17");
    EXPECT_EQ(record["version"], "1.2.3");
    EXPECT_EQ(record["shout"], true);
    EXPECT_TRUE(record["exp"].is_number_float());
    EXPECT_DOUBLE_EQ(record["exp"].get<double>(), 1000.0);
    EXPECT_TRUE(record["big"].is_number_float());
}

TEST(YamlToRecordTest, NonScalarKeyThrows) {
    EXPECT_THROW(yaml_to_record(YAML::Load("{[a]: 1}")), YAML::Exception);
}

TEST(PipelineConfigTest, PlainWordsInFilterMatchStrings) {
    auto config = resolve_config(YAML::Load(std::string(kMinimal) + R"(
defaults:
  country: no
filter:
  exclude:
    level: off
)"), {});

    EXPECT_EQ(config.defaults["country"], "no");
    ASSERT_EQ(config.filter.exclude.count("level"), 1u);
    EXPECT_EQ(config.filter.exclude.at("level"), "off");

    auto accept = make_field_filter(config.filter);
    EXPECT_FALSE(accept(Record{{"level", "off"}, {"msg", "x"}}));
    EXPECT_TRUE(accept(Record{{"level", "info"}, {"msg", "x"}}));
}

TEST(YamlToRecordTest, NestedValues) {
    auto record = yaml_to_record(YAML::Load("tags: [a, 1]\nmeta: {k: v}\n"));

    ASSERT_TRUE(record["tags"].is_array());
    EXPECT_EQ(record["tags"][0], "a");
    EXPECT_EQ(record["tags"][1], 1);
    EXPECT_EQ(record["meta"]["k"], "v");
}

}  // namespace logagg::test
