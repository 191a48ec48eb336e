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
#pragma once

#include "base/seastarx.h"
#include "object_store/client.h"

#include <seastar/core/coroutine.hh>
#include <seastar/core/sleep.hh>
#include <seastar/core/sstring.hh>

#include <chrono>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

/// In-memory object store with failure injection.
class memory_object_store final : public object_store::client {
public:
    enum class op { get, head, put, list, remove };

    using object_map = std::map<ss::sstring, ss::sstring>;

    ss::future<> stop() override { return ss::now(); }

    /// The next 'count' requests of kind 'o' fail with 'e'.
    void fail_next(op o, object_store::error_outcome e, size_t count = 1) {
        for (size_t i = 0; i < count; ++i) {
            _failures[o].push_back(e);
        }
    }

    /// The next request of kind 'o' takes at least 'd' to complete.
    void delay_next(op o, std::chrono::milliseconds d) {
        _delays[o].push_back(d);
    }

    /// Requests started and not yet completed.
    size_t in_flight() const { return _in_flight; }

    /// Upper bound on the number of keys returned by one list request.
    void set_page_size(size_t n) { _page_size = n; }

    void put_raw(
      const object_store::bucket_name& b,
      const ss::sstring& key,
      ss::sstring data) {
        _buckets[b()][key] = std::move(data);
    }
    void remove_raw(const object_store::bucket_name& b, const ss::sstring& key) {
        _buckets[b()].erase(key);
    }
    std::optional<ss::sstring>
    get_raw(const object_store::bucket_name& b, const ss::sstring& key) const {
        auto bucket = _buckets.find(b());
        if (bucket == _buckets.end()) {
            return std::nullopt;
        }
        auto it = bucket->second.find(key);
        if (it == bucket->second.end()) {
            return std::nullopt;
        }
        return it->second;
    }
    const object_map& objects(const object_store::bucket_name& b) {
        return _buckets[b()];
    }

    /// Keys of every successful upload, in upload order.
    const std::vector<ss::sstring>& put_log() const { return _put_log; }
    size_t list_requests() const { return _list_requests; }

    ss::future<result<ss::temporary_buffer<char>, object_store::error_outcome>>
    get_object(
      const object_store::bucket_name& name,
      const object_store::object_key& key,
      ss::lowres_clock::duration,
      bool = false,
      std::optional<object_store::byte_range> range = std::nullopt) override {
        request_guard g(_in_flight);
        co_await delayed(op::get);
        if (auto e = injected(op::get); e.has_value()) {
            co_return *e;
        }
        auto data = get_raw(name, key());
        if (!data.has_value()) {
            co_return object_store::error_outcome::key_not_found;
        }
        std::string_view view(*data);
        if (range.has_value()) {
            if (range->first > range->second || range->first >= view.size()) {
                co_return object_store::error_outcome::fail;
            }
            view = view.substr(
              range->first, range->second - range->first + 1);
        }
        co_return ss::temporary_buffer<char>(view.data(), view.size());
    }

    ss::future<result<head_object_result, object_store::error_outcome>>
    head_object(
      const object_store::bucket_name& name,
      const object_store::object_key& key,
      ss::lowres_clock::duration) override {
        request_guard g(_in_flight);
        co_await delayed(op::head);
        if (auto e = injected(op::head); e.has_value()) {
            co_return *e;
        }
        auto data = get_raw(name, key());
        if (!data.has_value()) {
            co_return object_store::error_outcome::key_not_found;
        }
        co_return head_object_result{.object_size = data->size()};
    }

    ss::future<result<no_response, object_store::error_outcome>> put_object(
      const object_store::bucket_name& name,
      const object_store::object_key& key,
      size_t payload_size,
      ss::input_stream<char> body,
      ss::lowres_clock::duration) override {
        request_guard g(_in_flight);
        std::string data;
        while (true) {
            auto buf = co_await body.read();
            if (buf.empty()) {
                break;
            }
            data.append(buf.get(), buf.size());
        }
        co_await body.close();
        co_await delayed(op::put);
        if (auto e = injected(op::put); e.has_value()) {
            co_return *e;
        }
        if (data.size() != payload_size) {
            co_return object_store::error_outcome::fail;
        }
        put_raw(name, key(), ss::sstring(data));
        _put_log.push_back(key());
        co_return no_response{};
    }

    ss::future<result<list_bucket_result, object_store::error_outcome>>
    list_objects(
      const object_store::bucket_name& name,
      std::optional<object_store::object_key> prefix,
      std::optional<size_t> max_keys,
      std::optional<ss::sstring> continuation_token,
      ss::lowres_clock::duration) override {
        request_guard g(_in_flight);
        ++_list_requests;
        co_await delayed(op::list);
        if (auto e = injected(op::list); e.has_value()) {
            co_return *e;
        }
        list_bucket_result res;
        std::string_view p;
        if (prefix.has_value()) {
            res.prefix = (*prefix)();
            p = res.prefix;
        }
        auto limit = max_keys.value_or(_page_size);
        for (const auto& [k, v] : objects(name)) {
            if (!std::string_view(k).starts_with(p)) {
                continue;
            }
            if (
              continuation_token.has_value()
              && std::string_view(k) <= std::string_view(*continuation_token)) {
                continue;
            }
            if (res.contents.size() == limit) {
                res.is_truncated = true;
                res.next_continuation_token = res.contents.back().key;
                break;
            }
            res.contents.push_back(
              list_bucket_item{.key = k, .size_bytes = v.size()});
        }
        co_return std::move(res);
    }

    ss::future<result<no_response, object_store::error_outcome>>
    delete_object(
      const object_store::bucket_name& name,
      const object_store::object_key& key,
      ss::lowres_clock::duration) override {
        request_guard g(_in_flight);
        co_await delayed(op::remove);
        if (auto e = injected(op::remove); e.has_value()) {
            co_return *e;
        }
        remove_raw(name, key());
        co_return no_response{};
    }

private:
    struct request_guard {
        explicit request_guard(size_t& n)
          : _n(n) {
            ++_n;
        }
        request_guard(const request_guard&) = delete;
        request_guard& operator=(const request_guard&) = delete;
        ~request_guard() { --_n; }

        size_t& _n;
    };

    ss::future<> delayed(op o) {
        auto& q = _delays[o];
        if (q.empty()) {
            co_return;
        }
        auto d = q.front();
        q.pop_front();
        co_await ss::sleep(d);
    }

    std::optional<object_store::error_outcome> injected(op o) {
        auto& q = _failures[o];
        if (q.empty()) {
            return std::nullopt;
        }
        auto e = q.front();
        q.pop_front();
        return e;
    }

    std::map<ss::sstring, object_map> _buckets;
    std::map<op, std::deque<object_store::error_outcome>> _failures;
    std::map<op, std::deque<std::chrono::milliseconds>> _delays;
    std::vector<ss::sstring> _put_log;
    size_t _page_size{1000};
    size_t _list_requests{0};
    size_t _in_flight{0};
};
