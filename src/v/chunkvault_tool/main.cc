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

#include "base/seastarx.h"
#include "chunk/chunk_codec.h"
#include "chunk/chunk_reader.h"
#include "chunk/path_utils.h"
#include "chunk/record_format.h"
#include "model/fundamental.h"
#include "object_store/local_client.h"
#include "sink/configuration.h"
#include "sink/remote_store.h"

#include <seastar/core/app-template.hh>
#include <seastar/core/coroutine.hh>
#include <seastar/core/lowres_clock.hh>
#include <seastar/util/log.hh>

#include <boost/program_options.hpp>
#include <fmt/format.h>

#include <chrono>
#include <filesystem>
#include <iostream>

namespace {

struct tool_options {
    std::filesystem::path root;
    object_store::bucket_name bucket;
    ss::sstring prefix;
    model::partition_key key;
    chunk::format_options format;
    std::chrono::milliseconds timeout{30000};
    model::offset offset{0};
    size_t count{10};

    ss::lowres_clock::duration remote_timeout() const {
        return std::chrono::duration_cast<ss::lowres_clock::duration>(timeout);
    }
};

using command_fn = ss::future<int> (*)(
  object_store::client&, sink::remote_store&, const tool_options&);

ss::future<int> resume_offset(
  object_store::client&, sink::remote_store& remote, const tool_options& opts) {
    auto r = co_await remote.resolve_resume_offset(opts.key);
    if (r.has_error()) {
        std::cerr << "resume offset: " << r.error().message() << "\n";
        co_return 1;
    }
    std::cout << r.value() << "\n";
    co_return 0;
}

ss::future<int>
list(object_store::client&, sink::remote_store& remote, const tool_options& opts) {
    auto chunks = co_await remote.list_chunks(opts.key);
    if (chunks.has_error()) {
        std::cerr << "list: " << chunks.error().message() << "\n";
        co_return 1;
    }
    for (const auto& c : chunks.value()) {
        if (!c.is_complete()) {
            fmt::print(
              "{:>20}  partial (data: {}, index: {})\n",
              c.start,
              c.data_size.has_value(),
              c.index_size.has_value());
            continue;
        }
        auto idx = co_await remote.download_index(opts.key, c.start);
        if (idx.has_error()) {
            fmt::print("{:>20}  {}\n", c.start, idx.error().message());
            continue;
        }
        fmt::print(
          "{:>20}  next: {}, segments: {}, bytes: {} ({} uncompressed)\n",
          c.start,
          idx.value().next_offset(),
          idx.value().segments().size(),
          idx.value().total_bytes(),
          idx.value().total_uncompressed_bytes());
    }
    co_return 0;
}

ss::future<int> dump(
  object_store::client& client,
  sink::remote_store& remote,
  const tool_options& opts) {
    auto chunks = co_await remote.list_chunks(opts.key);
    if (chunks.has_error()) {
        std::cerr << "dump: " << chunks.error().message() << "\n";
        co_return 1;
    }
    // last complete chunk starting at or below the requested offset
    std::optional<model::offset> chunk_start;
    for (const auto& c : chunks.value()) {
        if (c.is_complete() && c.start <= opts.offset) {
            chunk_start = c.start;
        }
    }
    if (!chunk_start.has_value()) {
        std::cerr << "dump: no chunk contains offset " << opts.offset << "\n";
        co_return 1;
    }

    auto format = chunk::make_record_format(opts.format);
    chunk::chunk_codec codec(*format);
    chunk::chunk_reader reader(
      client,
      {.bucket = remote.bucket(),
       .prefix = remote.prefix(),
       .timeout = opts.remote_timeout()},
      codec);
    auto records = co_await reader.read(
      opts.key, *chunk_start, opts.offset, opts.count);
    if (records.has_error()) {
        std::cerr << "dump: " << records.error().message() << "\n";
        co_return 1;
    }
    auto o = opts.offset;
    for (const auto& r : records.value()) {
        fmt::print(
          "{}\t{}\t{}\n",
          o,
          r.key.has_value() ? std::string_view(*r.key) : "<null>",
          r.value.has_value() ? std::string_view(*r.value) : "<null>");
        ++o;
    }
    co_return 0;
}

ss::future<int> prune(
  object_store::client&, sink::remote_store& remote, const tool_options& opts) {
    auto removed = co_await remote.remove_partial_chunks(opts.key);
    if (removed.has_error()) {
        std::cerr << "prune: " << removed.error().message() << "\n";
        co_return 1;
    }
    fmt::print("deleted {} objects\n", removed.value());
    co_return 0;
}

ss::future<int> run_command(command_fn cmd, tool_options opts) {
    object_store::local_client client(opts.root);
    sink::remote_store remote(
      client, opts.bucket, opts.prefix, opts.remote_timeout());
    auto ret = co_await cmd(client, remote, opts);
    co_await client.stop();
    co_return ret;
}

int run(char** argv, command_fn cmd, tool_options opts) {
    seastar::app_template app;
    try {
        return app.run(1, argv, [cmd, opts = std::move(opts)]() {
            return run_command(cmd, opts);
        });
    } catch (...) {
        std::cerr << std::current_exception() << "\n";
        return 1;
    }
}

} // namespace

/**
 * Inspection of chunks archived into a directory backed object store.
 *
 *   chunkvault_tool --root /mnt/store --bucket b --stream orders \
 *     --partition 3 resume-offset|list|dump|prune
 *
 * prune deletes partial chunks and must not run while a task archives the
 * partition.
 */
int main(int ac, char* av[]) {
    namespace po = boost::program_options;
    po::options_description desc("Allowed options");

    // clang-format off
    desc.add_options()
      ("help", "Allowed options")
      ("root", po::value<std::string>(), "Directory of the local object store")
      ("bucket", po::value<std::string>(), "Bucket name")
      ("prefix", po::value<std::string>()->default_value(""), "Object key prefix")
      ("stream", po::value<std::string>(), "Stream name")
      ("partition", po::value<int32_t>()->default_value(0), "Partition")
      ("format", po::value<std::string>()->default_value("binary"), "Record format of the chunks: binary or text")
      ("include-keys", po::bool_switch()->default_value(false), "Text chunks hold record keys")
      ("key-delimiter", po::value<std::string>()->default_value("\t", "\\t"), "Key delimiter of text chunks")
      ("value-delimiter", po::value<std::string>()->default_value("\n", "\\n"), "Value delimiter of text chunks")
      ("timeout-ms", po::value<int64_t>()->default_value(30000), "Object store request timeout")
      ("offset", po::value<int64_t>()->default_value(0), "First offset to dump")
      ("count", po::value<size_t>()->default_value(10), "Number of records to dump")
      ("command", po::value<std::string>(), "resume-offset, list, dump or prune");
    // clang-format on
    po::positional_options_description pos;
    pos.add("command", 1);

    po::variables_map vm;
    try {
        po::store(
          po::command_line_parser(ac, av).options(desc).positional(pos).run(),
          vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << e.what() << "\n" << desc << "\n";
        return 1;
    }

    if (vm.count("help") || !vm.count("command")) {
        std::cout << desc << "\n";
        return 0;
    }
    for (const auto* required : {"root", "bucket", "stream"}) {
        if (!vm.count(required)) {
            std::cerr << "--" << required << " is required\n";
            return 1;
        }
    }

    tool_options opts{
      .root = vm["root"].as<std::string>(),
      .bucket = object_store::bucket_name(vm["bucket"].as<std::string>()),
      .prefix = chunk::normalize_prefix(vm["prefix"].as<std::string>()),
      .key = model::partition_key(
        model::stream_name(vm["stream"].as<std::string>()),
        model::partition_id(vm["partition"].as<int32_t>())),
      .offset = model::offset(vm["offset"].as<int64_t>()),
      .count = vm["count"].as<size_t>(),
    };
    auto format = vm["format"].as<std::string>();
    if (format == "text") {
        opts.format.type = chunk::format_type::text;
    } else if (format != "binary") {
        std::cerr << "unknown format " << format << "\n";
        return 1;
    }
    opts.format.include_keys = vm["include-keys"].as<bool>();
    opts.format.key_delimiter = vm["key-delimiter"].as<std::string>();
    opts.format.value_delimiter = vm["value-delimiter"].as<std::string>();
    if (
      opts.format.key_delimiter.empty() || opts.format.value_delimiter.empty()) {
        std::cerr << "delimiters can't be empty\n";
        return 1;
    }
    if (
      opts.format.include_keys
      && opts.format.key_delimiter == opts.format.value_delimiter) {
        std::cerr << "key and value delimiters must differ\n";
        return 1;
    }
    auto timeout_ms = vm["timeout-ms"].as<int64_t>();
    if (timeout_ms <= 0) {
        std::cerr << "--timeout-ms must be positive\n";
        return 1;
    }
    opts.timeout = std::chrono::milliseconds(timeout_ms);

    auto command = vm["command"].as<std::string>();
    if (command == "resume-offset") {
        return run(av, resume_offset, std::move(opts));
    } else if (command == "list") {
        return run(av, list, std::move(opts));
    } else if (command == "dump") {
        return run(av, dump, std::move(opts));
    } else if (command == "prune") {
        return run(av, prune, std::move(opts));
    }
    std::cerr << "unknown command " << command << "\n" << desc << "\n";
    return 1;
}
