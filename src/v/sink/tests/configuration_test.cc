/*
 * Copyright 2024 Redpanda Data, Inc.
 *
 * Use of this software is governed by the Business Source License
 * included in the file licenses/BSL.md
 *
 * As of the Change Date specified in that file, in accordance with
 * the Business Source License, use of this software will be governed
 * by the Apache License, Version 2.0
 */
#include "model/errc.h"
#include "sink/configuration.h"

#include <gtest/gtest.h>

using namespace std::chrono_literals;

namespace {

sink::configuration::property_map minimal() {
    return {{"bucket", "archive"}, {"local.buffer.dir", "/var/lib/chunkvault"}};
}

void expect_invalid(const sink::configuration::property_map& props) {
    auto cfg = sink::configuration::from_properties(props);
    ASSERT_TRUE(cfg.has_error());
    EXPECT_EQ(cfg.error(), model::errc::invalid_configuration);
}

} // namespace

TEST(Configuration, Defaults) {
    auto cfg = sink::configuration::from_properties(minimal());
    ASSERT_TRUE(cfg.has_value());
    const auto& c = cfg.value();
    EXPECT_EQ(c.name, "chunkvault");
    EXPECT_EQ(c.bucket, object_store::bucket_name("archive"));
    EXPECT_EQ(c.prefix, "");
    EXPECT_EQ(c.buffer_dir, std::filesystem::path("/var/lib/chunkvault"));
    EXPECT_EQ(c.compressed_block_size, 64_MiB);
    EXPECT_EQ(c.remote_timeout, 30s);
    EXPECT_EQ(c.format.type, chunk::format_type::binary);
    EXPECT_FALSE(c.format.include_keys);

    auto w = c.writer_options();
    EXPECT_EQ(w.buffer_dir, c.buffer_dir);
    EXPECT_EQ(w.segment_threshold, 64_MiB);
}

TEST(Configuration, AllOptions) {
    auto cfg = sink::configuration::from_properties({
      {"name", "nightly"},
      {"s3.bucket", "legacy-bucket"},
      {"s3.prefix", "/archive/v1/"},
      {"local.buffer.dir", "/tmp/buf"},
      {"compressed_block_size", "1048576"},
      {"remote.timeout.ms", "2500"},
      {"format", "text"},
      {"format.include.keys", "true"},
      {"format.key.delimiter", "|"},
      {"format.value.delimiter", "\r\n"},
      {"some.host.option", "ignored"},
    });
    ASSERT_TRUE(cfg.has_value());
    const auto& c = cfg.value();
    EXPECT_EQ(c.name, "nightly");
    EXPECT_EQ(c.bucket, object_store::bucket_name("legacy-bucket"));
    EXPECT_EQ(c.prefix, "archive/v1");
    EXPECT_EQ(c.compressed_block_size, 1_MiB);
    EXPECT_EQ(c.remote_timeout, 2500ms);
    EXPECT_EQ(c.format.type, chunk::format_type::text);
    EXPECT_TRUE(c.format.include_keys);
    EXPECT_EQ(c.format.key_delimiter, "|");
    EXPECT_EQ(c.format.value_delimiter, "\r\n");

    auto r = c.reader_config();
    EXPECT_EQ(r.prefix, "archive/v1");
    EXPECT_EQ(r.bucket, c.bucket);
}

TEST(Configuration, PrimaryNameWinsOverAlias) {
    auto props = minimal();
    props["s3.bucket"] = "other";
    auto cfg = sink::configuration::from_properties(props);
    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg.value().bucket, object_store::bucket_name("archive"));
}

TEST(Configuration, RejectsInvalidOptions) {
    expect_invalid({{"local.buffer.dir", "/tmp"}});
    expect_invalid({{"bucket", ""}, {"local.buffer.dir", "/tmp"}});
    expect_invalid({{"bucket", "b"}});

    for (const auto& [k, v] : std::vector<std::pair<ss::sstring, ss::sstring>>{
           {"compressed_block_size", "0"},
           {"compressed_block_size", "-1"},
           {"compressed_block_size", "64MiB"},
           {"remote.timeout.ms", "soon"},
           {"format", "avro"},
           {"format.include.keys", "yes"},
           {"format.key.delimiter", ""},
           {"format.value.delimiter", ""},
         }) {
        auto props = minimal();
        props[k] = v;
        SCOPED_TRACE(k + "=" + v);
        expect_invalid(props);
    }

    auto same_delimiters = minimal();
    same_delimiters["format"] = "text";
    same_delimiters["format.include.keys"] = "true";
    same_delimiters["format.key.delimiter"] = ",";
    same_delimiters["format.value.delimiter"] = ",";
    expect_invalid(same_delimiters);

    // without keys the key delimiter is never written
    same_delimiters["format.include.keys"] = "false";
    EXPECT_TRUE(
      sink::configuration::from_properties(same_delimiters).has_value());
}

TEST(Configuration, ReadYaml) {
    auto cfg = sink::configuration::read_yaml(R"(
chunkvault:
  bucket: archive
  prefix: backups
  local:
    buffer:
      dir: /data/buffer
  remote.timeout.ms: 1000
  format:
    include.keys: "false"
other_service:
  bucket: unrelated
)");
    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg.value().bucket, object_store::bucket_name("archive"));
    EXPECT_EQ(cfg.value().prefix, "backups");
    EXPECT_EQ(cfg.value().buffer_dir, std::filesystem::path("/data/buffer"));
    EXPECT_EQ(cfg.value().remote_timeout, 1s);
}

TEST(Configuration, ReadYamlErrors) {
    for (std::string_view doc : {
           "other: {bucket: b}",
           "chunkvault: [1, 2]",
           "chunkvault: {bucket: [a, b], local.buffer.dir: /d}",
           "chunkvault: {bucket: b",
         }) {
        SCOPED_TRACE(doc);
        auto cfg = sink::configuration::read_yaml(doc);
        ASSERT_TRUE(cfg.has_error());
        EXPECT_EQ(cfg.error(), model::errc::invalid_configuration);
    }
}
