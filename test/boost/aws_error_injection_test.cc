/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <atomic>
#include <seastar/core/units.hh>
#include <seastar/http/httpd.hh>
#include <seastar/testing/thread_test_case.hh>
#include <seastar/util/closeable.hh>
#include <seastar/util/short_streams.hh>

#include "client/chunk_uploader.hh"
#include "client/http_part_transport.hh"
#include "test/lib/log.hh"
#include "test/lib/pipeline_utils.hh"
#include "test/lib/test_endpoint.hh"
#include "utils/exceptions.hh"
#include "utils/s3/aws_error.hh"
#include "utils/s3/client.hh"
#include "utils/s3/multipart_storage_client.hh"

using namespace seastar;
using namespace std::chrono_literals;

struct server {
    enum class failure_policy : uint8_t {
        SUCCESS = 0,
        RETRYABLE_FAILURE = 1,
        NONRETRYABLE_FAILURE = 2,
        NEVERENDING_RETRYABLE_FAILURE = 3,
    };
    class dummy_aws_request_handler : public httpd::handler_base {
    public:
        explicit dummy_aws_request_handler(server& test_server) : _test_server(test_server) {}
        future<std::unique_ptr<http::reply>> handle(const sstring& path, std::unique_ptr<http::request> req, std::unique_ptr<http::reply> rep) override {
            auto method = req->_method;
            auto url_params = req->query_parameters;
            testlog.debug("{}\t{}", req->_method, req->_url);
            ++_test_server.requests;
            sstring response_body;
            if (method == "DELETE") {
                rep->set_status(http::reply::status_type::no_content);
                if (url_params.contains("uploadId") && _test_server.test_failure_policy == failure_policy::NONRETRYABLE_FAILURE) {
                    rep->set_status(http::reply::status_type::not_found);
                }
            } else if (method == "PUT") {
                rep->set_status(http::reply::status_type::ok);
                if (url_params.contains("partNumber") && url_params.contains("uploadId")) {
                    if (req->get_header("Content-Type") == "application/octet-stream") {
                        ++_test_server.authorized_parts;
                    }
                    rep->add_header("ETag", "\"SomeTag_" + url_params.at("partNumber") + "\"");
                } else {
                    rep->add_header("ETag", "\"SomeTag\"");
                }
            } else if (method == "POST") {
                response_body = build_response(*req);
            } else {
                rep->set_status(http::reply::status_type::bad_request);
            }
            rep->write_body("txt", response_body);
            return make_ready_future<std::unique_ptr<http::reply>>(std::move(rep));
        }

    private:
        sstring build_response(const http::request& req) {
            if (req.query_parameters.contains("uploads")) {
                return R"(<InitiateMultipartUploadResult>
                                <Bucket>bucket</Bucket>
                                <Key>key</Key>
                                <UploadId>UploadId</UploadId>
                            </InitiateMultipartUploadResult>)";
            }
            if (req.query_parameters.contains("uploadId")) {
                ++_test_server.completions;
                switch (_test_server.test_failure_policy) {
                case failure_policy::SUCCESS:
                    return R"(<CompleteMultipartUploadResult xmlns="http://s3.amazonaws.com/doc/2006-03-01/">
                                     <Location>http://Example-Bucket.s3.Region.amazonaws.com/Example-Object</Location>
                                     <Bucket>Example-Bucket</Bucket>
                                     <Key>Example-Object</Key>
                                     <ETag>"3858f62230ac3c915f300c664312c11f-9"</ETag>
                                </CompleteMultipartUploadResult>)";
                case failure_policy::RETRYABLE_FAILURE:
                case failure_policy::NEVERENDING_RETRYABLE_FAILURE:
                    if (_test_server.test_failure_policy == failure_policy::RETRYABLE_FAILURE) {
                        // should succeed on retry
                        _test_server.test_failure_policy = failure_policy::SUCCESS;
                    }
                    return R"(<?xml version="1.0" encoding="UTF-8"?>

                                 <Error>
                                  <Code>InternalError</Code>
                                  <Message>We encountered an internal error. Please try again.</Message>
                                  <RequestId>656c76696e6727732072657175657374</RequestId>
                                  <HostId>Uuag1LuByRx9e6j5Onimru9pO4ZVKnJ2Qz7/C1NPcfTWAtRPfTaOFg==</HostId>
                                 </Error>)";
                case failure_policy::NONRETRYABLE_FAILURE:
                    return R"(<?xml version="1.0" encoding="UTF-8"?>

                                 <Error>
                                  <Code>InvalidAction</Code>
                                  <Message>Something went terribly wrong</Message>
                                  <RequestId>656c76696e6727732072657175657374</RequestId>
                                  <HostId>Uuag1LuByRx9e6j5Onimru9pO4ZVKnJ2Qz7/C1NPcfTWAtRPfTaOFg==</HostId>
                                 </Error>)";
                }
            }
            throw std::invalid_argument(fmt::format("unexpected POST {}", req._url));
        }

        server& _test_server;
    };

    explicit server(failure_policy _test_failure_policy) : test_failure_policy(_test_failure_policy) {
        handler = std::make_unique<dummy_aws_request_handler>(*this);
    }

    future<> start(const std::string& address, uint16_t port) {
        std::exception_ptr ex;
        try {
            net::inet_address addr(address);
            testlog.info("Starting server on {}:{}", address, port);
            co_await http_server.start("test");
            co_await http_server.server().invoke_on_all([this] (httpd::http_server& server) {
                server._routes.add_default_handler(handler.get());
                return make_ready_future<>();
            });
            co_await http_server.listen(socket_address{addr, port});
            co_return;
        } catch (...) {
            ex = std::current_exception();
        }
        co_await http_server.stop();
        throw std::runtime_error(fmt::format("Failed to start server. Reason: {}", ex));
    }

    future<> stop() {
        co_await http_server.stop();
    }

    std::atomic<failure_policy> test_failure_policy;
    unsigned requests = 0;
    unsigned completions = 0;
    unsigned authorized_parts = 0;

private:
    std::unique_ptr<httpd::handler_base> handler;
    httpd::http_server_control http_server;
};

static tests::test_endpoint network_unshare;

static s3::endpoint_config_ptr make_minio_config(const std::string& address, uint16_t port) {
    s3::endpoint_config cfg = {
        .host = address,
        .port = port,
        .use_https = false,
        .region = "us-east-1",
        .access_key_id = "foo",
        .secret_access_key = "bar",
        .session_token = "baz",
    };
    return make_lw_shared<s3::endpoint_config>(std::move(cfg));
}

// Creates, fills and completes a three part upload through the retrying
// storage client.
static void do_test_multipart_upload(const std::string& address, uint16_t port) {
    auto cln = s3::client::make(make_minio_config(address, port));
    auto close_client = deferred_close(*cln);
    s3::multipart_storage_client storage(cln, s3::storage_client_config{.bucket = "test", .call_timeout = 10s}, tests::fast_retry());

    auto id = storage.create_multipart("object").get();
    BOOST_REQUIRE_EQUAL(id, "UploadId");
    std::vector<s3::completed_part> parts;
    for (unsigned n = 1; n <= 3; ++n) {
        auto etag = storage.upload_part("object", id, n, temporary_buffer<char>(n == 3 ? 1000 : 5_MiB)).get();
        BOOST_REQUIRE_EQUAL(etag, format("\"SomeTag_{}\"", n));
        parts.push_back(s3::completed_part{n, etag});
    }
    std::exception_ptr ex;
    try {
        storage.complete_multipart("object", id, std::move(parts)).get();
    } catch (...) {
        ex = std::current_exception();
    }
    if (ex) {
        storage.abort_multipart("object", id).get();
        std::rethrow_exception(ex);
    }
}

SEASTAR_THREAD_TEST_CASE(test_multipart_upload_success) {
    auto port = network_unshare.get_port();
    auto address = network_unshare.get_address();
    server server(server::failure_policy::SUCCESS);
    server.start(address, port).get();
    auto close_server = deferred_stop(server);
    BOOST_REQUIRE_NO_THROW(do_test_multipart_upload(address, port));
    BOOST_REQUIRE_EQUAL(server.completions, 1);
}

SEASTAR_THREAD_TEST_CASE(test_multipart_upload_retryable_success) {
    auto port = network_unshare.get_port();
    auto address = network_unshare.get_address();
    server server(server::failure_policy::RETRYABLE_FAILURE);
    server.start(address, port).get();
    auto close_server = deferred_stop(server);
    BOOST_REQUIRE_NO_THROW(do_test_multipart_upload(address, port));
    BOOST_REQUIRE_EQUAL(server.completions, 2);
}

SEASTAR_THREAD_TEST_CASE(test_multipart_upload_failure_1) {
    auto port = network_unshare.get_port();
    auto address = network_unshare.get_address();
    server server(server::failure_policy::NEVERENDING_RETRYABLE_FAILURE);
    server.start(address, port).get();
    auto close_server = deferred_stop(server);
    BOOST_REQUIRE_EXCEPTION(do_test_multipart_upload(address, port), storage_io_error,
                            [] (const storage_io_error& e) { return e.code().value() == EIO; });
    // every attempt of the policy was made
    BOOST_REQUIRE_EQUAL(server.completions, 5);
}

SEASTAR_THREAD_TEST_CASE(test_multipart_upload_failure_2) {
    auto port = network_unshare.get_port();
    auto address = network_unshare.get_address();
    server server(server::failure_policy::NONRETRYABLE_FAILURE);
    server.start(address, port).get();
    auto close_server = deferred_stop(server);
    // the abort gets a 404 which is only logged
    BOOST_REQUIRE_EXCEPTION(do_test_multipart_upload(address, port), storage_io_error,
                            [] (const storage_io_error& e) { return e.code().value() == EIO; });
    BOOST_REQUIRE_EQUAL(server.completions, 1);
}

SEASTAR_THREAD_TEST_CASE(test_authorized_parts_upload_without_credentials) {
    auto port = network_unshare.get_port();
    auto address = network_unshare.get_address();
    server server(server::failure_policy::SUCCESS);
    server.start(address, port).get();
    auto close_server = deferred_stop(server);

    auto cln = s3::client::make(make_minio_config(address, port));
    auto close_client = deferred_close(*cln);
    s3::multipart_storage_client storage(cln, s3::storage_client_config{.bucket = "test"}, tests::fast_retry());

    constexpr uint64_t chunk_size = 64_KiB;
    auto payload = tests::make_payload(5 * chunk_size + 100, 1);
    auto id = storage.create_multipart("chunked").get();
    ingest::file_descriptor fd{.name = "chunked", .total_chunks = 6, .multipart_id = id};
    for (unsigned n = 1; n <= fd.total_chunks; ++n) {
        auto req = storage.authorize_part_upload("chunked", id, n).get();
        BOOST_REQUIRE(std::string_view(req.url).starts_with(fmt::format("http://{}:{}/test/chunked?", address, port)));
        BOOST_REQUIRE(req.headers.contains("Authorization"));
        fd.parts.push_back(ingest::part_descriptor{n, std::move(req.url), std::move(req.headers)});
    }

    client::http_part_transport transport;
    auto close_transport = deferred_close(transport);
    client::chunk_uploader uploader(transport, client::uploader_config{.workers = 3, .retry = tests::fast_retry()});
    std::vector<s3::completed_part> parts(fd.total_chunks);
    auto stats = uploader.upload(fd, chunk_size, payload.size(), [&payload] (uint64_t off, size_t len) {
        return make_ready_future<temporary_buffer<char>>(temporary_buffer<char>(payload.data() + off, len));
    }, [&parts] (unsigned chunk, unsigned part, sstring etag) {
        parts[chunk] = s3::completed_part{part, std::move(etag)};
        return make_ready_future<>();
    }).get();

    BOOST_REQUIRE_EQUAL(stats.chunks, 6);
    BOOST_REQUIRE_EQUAL(server.authorized_parts, 6);
    BOOST_REQUIRE_EQUAL(parts[5].etag, "\"SomeTag_6\"");
    storage.complete_multipart("chunked", id, std::move(parts)).get();
}
