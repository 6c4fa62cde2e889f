/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <unordered_map>
#include <seastar/core/metrics_registration.hh>
#include <seastar/core/scheduling.hh>
#include <seastar/core/shared_ptr.hh>
#include <seastar/http/client.hh>
#include <seastar/util/noncopyable_function.hh>

#include "utils/s3/object_store.hh"

namespace s3 {

using s3_clock = std::chrono::steady_clock;

struct endpoint_config {
    std::string host;
    unsigned port = 443;
    bool use_https = true;
    std::string region = "us-east-1";
    std::string access_key_id;
    std::string secret_access_key;
    std::string session_token;
    // Per scheduling group. When not set it is derived from the group shares.
    std::optional<unsigned> max_connections;

    bool operator==(const endpoint_config&) const = default;
};

using endpoint_config_ptr = seastar::lw_shared_ptr<endpoint_config>;

future<> ignore_reply(const http::reply& rep, input_stream<char>&& in_);

// Maps an error that survived the retry policy to storage_io_error.
// Caller aborts and invalid arguments are rethrown as they are.
[[noreturn]] void map_s3_client_exception(std::exception_ptr ex);

class copy_s3_object;
class multipart_upload;

// S3 object store over the seastar http client. Requests are signed with
// AWS SigV4 using the static credentials of the endpoint config. Non-success
// replies are raised as aws::aws_exception (with the parsed <Error> code when
// the body carries one), unexpected success codes as unexpected_status_error.
class client : public object_store, public enable_shared_from_this<client> {
    friend class copy_s3_object;
    friend class multipart_upload;

    std::string _host;
    endpoint_config_ptr _cfg;

    struct io_stats {
        uint64_t ops = 0;
        uint64_t bytes = 0;
        std::chrono::duration<double> duration = std::chrono::duration<double>(0);

        void update(uint64_t len, std::chrono::duration<double> lat) {
            ops++;
            bytes += len;
            duration += lat;
        }
    };
    struct group_client {
        http::experimental::client http;
        io_stats read_stats;
        io_stats write_stats;
        seastar::metrics::metric_groups metrics;
        group_client(std::unique_ptr<http::experimental::connection_factory> f, unsigned max_conn);
        void register_metrics(std::string class_name, std::string host);
    };
    std::unordered_map<seastar::scheduling_group, group_client> _https;

    struct private_tag {};

    std::string host_header() const;
    void authorize(http::request& req);
    group_client& find_or_create_client();

    using reply_handler_ext = noncopyable_function<future<>(group_client&, const http::reply&, input_stream<char>&& body)>;
    future<> make_request(http::request req, http::experimental::client::reply_handler handle, std::optional<http::reply::status_type> expected = std::nullopt, abort_source* = nullptr);
    future<> make_request(http::request req, reply_handler_ext handle, std::optional<http::reply::status_type> expected = std::nullopt, abort_source* = nullptr);

    future<> get_object_header(sstring object_name, http::experimental::client::reply_handler handler, abort_source* as);
public:
    client(endpoint_config_ptr cfg, private_tag);
    static shared_ptr<client> make(endpoint_config_ptr cfg);

    const endpoint_config& config() const noexcept { return *_cfg; }

    future<sstring> create_multipart_upload(sstring object_name, abort_source* as = nullptr) override;
    future<sstring> upload_part(sstring object_name, sstring upload_id, unsigned part_number, temporary_buffer<char> data, abort_source* as = nullptr) override;
    future<> complete_multipart_upload(sstring object_name, sstring upload_id, std::vector<completed_part> parts, abort_source* as = nullptr) override;
    future<> abort_multipart_upload(sstring object_name, sstring upload_id, abort_source* as = nullptr) override;
    future<presigned_request> presign_upload_part(sstring object_name, sstring upload_id, unsigned part_number) override;

    future<uint64_t> get_object_size(sstring object_name, abort_source* as = nullptr) override;
    future<temporary_buffer<char>> get_object_contiguous(sstring object_name, std::optional<range> range = {}, abort_source* as = nullptr) override;
    future<> put_object(sstring object_name, temporary_buffer<char> buf, abort_source* as = nullptr);
    future<> delete_object(sstring object_name, abort_source* as = nullptr) override;
    future<> copy_object(sstring source_object, sstring target_object, abort_source* as = nullptr) override;

    future<> close() override;
};

} // namespace s3
