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
#include "sink/configuration.h"

#include "base/vlog.h"
#include "chunk/path_utils.h"
#include "model/errc.h"
#include "sink/logger.h"

#include <fmt/ostream.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <array>
#include <charconv>
#include <optional>
#include <ostream>

namespace sink {

namespace {

struct option {
    std::string_view name;
    std::string_view alias;
};

constexpr std::array options{
  option{"name", ""},
  option{"bucket", "s3.bucket"},
  option{"prefix", "s3.prefix"},
  option{"local.buffer.dir", ""},
  option{"compressed_block_size", ""},
  option{"remote.timeout.ms", ""},
  option{"format", ""},
  option{"format.include.keys", ""},
  option{"format.key.delimiter", ""},
  option{"format.value.delimiter", ""},
};

constexpr std::string_view yaml_root = "chunkvault";

bool is_known(std::string_view key) {
    return std::any_of(options.begin(), options.end(), [key](const option& o) {
        return o.name == key || (!o.alias.empty() && o.alias == key);
    });
}

std::optional<ss::sstring> lookup(
  const configuration::property_map& props,
  std::string_view name,
  std::string_view alias = {}) {
    if (auto it = props.find(ss::sstring(name)); it != props.end()) {
        return it->second;
    }
    if (!alias.empty()) {
        if (auto it = props.find(ss::sstring(alias)); it != props.end()) {
            return it->second;
        }
    }
    return std::nullopt;
}

std::optional<uint64_t> parse_positive(std::string_view s) {
    uint64_t v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size() || v == 0) {
        return std::nullopt;
    }
    return v;
}

std::optional<bool> parse_bool(std::string_view s) {
    if (s == "true") {
        return true;
    }
    if (s == "false") {
        return false;
    }
    return std::nullopt;
}

void flatten(
  const YAML::Node& node,
  const std::string& path,
  configuration::property_map& out) {
    if (node.IsMap()) {
        for (const auto& kv : node) {
            auto key = kv.first.as<std::string>();
            flatten(kv.second, path.empty() ? key : path + "." + key, out);
        }
        return;
    }
    if (!node.IsScalar()) {
        throw YAML::Exception(
          node.Mark(), fmt::format("option '{}' must be a scalar", path));
    }
    out.insert_or_assign(ss::sstring(path), ss::sstring(node.as<std::string>()));
}

} // namespace

result<configuration>
configuration::from_properties(const property_map& props) {
    for (const auto& [k, v] : props) {
        if (!is_known(k)) {
            vlog(sink_log.debug, "Ignoring unknown option '{}'", k);
        }
    }

    auto invalid = [](std::string_view option, std::string_view reason) {
        vlog(sink_log.error, "Invalid option '{}': {}", option, reason);
        return model::errc::invalid_configuration;
    };

    configuration cfg;
    if (auto v = lookup(props, "name"); v.has_value() && !v->empty()) {
        cfg.name = *v;
    }

    auto bucket = lookup(props, "bucket", "s3.bucket");
    if (!bucket.has_value() || bucket->empty()) {
        return invalid("bucket", "a non-empty bucket name is required");
    }
    cfg.bucket = object_store::bucket_name(*bucket);

    if (auto v = lookup(props, "prefix", "s3.prefix"); v.has_value()) {
        cfg.prefix = chunk::normalize_prefix(*v);
    }

    auto dir = lookup(props, "local.buffer.dir");
    if (!dir.has_value() || dir->empty()) {
        return invalid("local.buffer.dir", "a buffer directory is required");
    }
    cfg.buffer_dir = std::filesystem::path(std::string_view(*dir));

    if (auto v = lookup(props, "compressed_block_size"); v.has_value()) {
        auto size = parse_positive(*v);
        if (!size.has_value()) {
            return invalid("compressed_block_size", "expected a positive integer");
        }
        cfg.compressed_block_size = *size;
    }

    if (auto v = lookup(props, "remote.timeout.ms"); v.has_value()) {
        auto ms = parse_positive(*v);
        if (!ms.has_value()) {
            return invalid("remote.timeout.ms", "expected a positive integer");
        }
        cfg.remote_timeout = std::chrono::milliseconds(*ms);
    }

    if (auto v = lookup(props, "format"); v.has_value()) {
        if (*v == "binary") {
            cfg.format.type = chunk::format_type::binary;
        } else if (*v == "text") {
            cfg.format.type = chunk::format_type::text;
        } else {
            return invalid("format", "expected 'binary' or 'text'");
        }
    }

    if (auto v = lookup(props, "format.include.keys"); v.has_value()) {
        auto b = parse_bool(*v);
        if (!b.has_value()) {
            return invalid("format.include.keys", "expected 'true' or 'false'");
        }
        cfg.format.include_keys = *b;
    }

    if (auto v = lookup(props, "format.key.delimiter"); v.has_value()) {
        if (v->empty()) {
            return invalid("format.key.delimiter", "delimiter can't be empty");
        }
        cfg.format.key_delimiter = *v;
    }
    if (auto v = lookup(props, "format.value.delimiter"); v.has_value()) {
        if (v->empty()) {
            return invalid("format.value.delimiter", "delimiter can't be empty");
        }
        cfg.format.value_delimiter = *v;
    }
    if (
      cfg.format.type == chunk::format_type::text && cfg.format.include_keys
      && cfg.format.key_delimiter == cfg.format.value_delimiter) {
        return invalid(
          "format.key.delimiter", "must differ from the value delimiter");
    }

    vlog(sink_log.info, "Configuration: {}", cfg);
    return cfg;
}

result<configuration> configuration::read_yaml(std::string_view document) {
    property_map props;
    try {
        auto root = YAML::Load(std::string(document));
        auto node = root[std::string(yaml_root)];
        if (!node || !node.IsMap()) {
            vlog(
              sink_log.error,
              "Configuration document has no '{}' section",
              yaml_root);
            return model::errc::invalid_configuration;
        }
        flatten(node, "", props);
    } catch (const YAML::Exception& e) {
        vlog(sink_log.error, "Can't parse configuration: {}", e.what());
        return model::errc::invalid_configuration;
    }
    return from_properties(props);
}

std::ostream& operator<<(std::ostream& o, const configuration& cfg) {
    fmt::print(
      o,
      "{{name: {}, bucket: {}, prefix: '{}', buffer_dir: {}, "
      "compressed_block_size: {}, remote_timeout: {}ms, format: {}, "
      "include_keys: {}}}",
      cfg.name,
      cfg.bucket,
      cfg.prefix,
      cfg.buffer_dir.native(),
      cfg.compressed_block_size,
      cfg.remote_timeout.count(),
      cfg.format.type,
      cfg.format.include_keys);
    return o;
}

} // namespace sink
