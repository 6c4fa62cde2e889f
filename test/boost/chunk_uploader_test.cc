/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <map>
#include <set>
#include <seastar/core/coroutine.hh>
#include <seastar/core/sleep.hh>
#include <seastar/core/timed_out_error.hh>
#include <seastar/coroutine/exception.hh>
#include <seastar/testing/thread_test_case.hh>

#include "archive/archive_builder.hh"
#include "client/chunk_uploader.hh"
#include "ingest/upload_session_manager.hh"
#include "kv/memory_metadata_store.hh"
#include "test/lib/memory_object_store.hh"
#include "test/lib/pipeline_utils.hh"
#include "test/lib/zip_reader.hh"
#include "utils/s3/aws_error.hh"

using namespace seastar;
using namespace std::chrono_literals;

namespace {

constexpr uint64_t chunk_size = 1024;

class fake_transport final : public client::part_transport {
public:
    std::map<unsigned, std::string> parts;
    // part number -> failures left
    std::map<unsigned, unsigned> transient_failures;
    std::set<unsigned> broken_parts;
    unsigned calls = 0;
    unsigned inflight = 0;
    unsigned max_inflight = 0;

    future<sstring> put_part(const ingest::part_descriptor& part, temporary_buffer<char> data, abort_source* as) override {
        ++calls;
        max_inflight = std::max(max_inflight, ++inflight);
        co_await sleep(1ms);
        --inflight;
        if (broken_parts.contains(part.part_number)) {
            co_await coroutine::return_exception(aws::aws_exception(aws::aws_error_map.at("AccessDenied")));
        }
        if (auto it = transient_failures.find(part.part_number); it != transient_failures.end() && it->second > 0) {
            --it->second;
            co_await coroutine::return_exception(aws::aws_exception(
                    aws::aws_error::from_http_code(http::reply::status_type::service_unavailable)));
        }
        parts[part.part_number] = std::string(data.get(), data.size());
        co_return format("\"etag-{}\"", part.part_number);
    }

    future<> close() override {
        return make_ready_future<>();
    }
};

ingest::file_descriptor make_descriptor(sstring name, unsigned chunks) {
    ingest::file_descriptor fd{.name = std::move(name), .total_chunks = chunks, .multipart_id = "upload-1"};
    for (unsigned i = 1; i <= chunks; ++i) {
        fd.parts.push_back(ingest::part_descriptor{i, format("http://example.com/{}?partNumber={}", fd.name, i), {}});
    }
    return fd;
}

client::chunk_reader string_reader(const std::string& data) {
    return [&data] (uint64_t offset, size_t len) {
        return make_ready_future<temporary_buffer<char>>(temporary_buffer<char>(data.data() + offset, len));
    };
}

struct confirmations {
    std::map<unsigned, sstring> etags;

    client::chunk_confirmer confirmer() {
        return [this] (unsigned chunk, unsigned part, sstring etag) {
            BOOST_REQUIRE_EQUAL(part, chunk + 1);
            etags[chunk] = std::move(etag);
            return make_ready_future<>();
        };
    }
};

}

SEASTAR_THREAD_TEST_CASE(test_every_chunk_is_uploaded_and_confirmed) {
    fake_transport transport;
    tests::counting_observer observer;
    client::chunk_uploader uploader(transport, client::uploader_config{.workers = 3, .retry = tests::fast_retry()}, observer);
    auto payload = tests::make_payload(11 * chunk_size + 512, 1);
    auto fd = make_descriptor("a.bin", 12);
    confirmations confirmed;

    auto stats = uploader.upload(fd, chunk_size, payload.size(), string_reader(payload), confirmed.confirmer()).get();
    BOOST_REQUIRE_EQUAL(stats.chunks, 12);
    BOOST_REQUIRE_EQUAL(stats.bytes, payload.size());
    BOOST_REQUIRE_EQUAL(transport.calls, 12);
    BOOST_REQUIRE_EQUAL(transport.max_inflight, 3);
    BOOST_REQUIRE_EQUAL(confirmed.etags.size(), 12);
    BOOST_REQUIRE_EQUAL(confirmed.etags[4], "\"etag-5\"");

    std::string joined;
    for (const auto& [n, data] : transport.parts) {
        joined += data;
    }
    BOOST_REQUIRE(joined == payload);
    BOOST_REQUIRE_EQUAL(transport.parts[12].size(), 512);
    BOOST_REQUIRE_EQUAL(observer.retries, 0);
}

SEASTAR_THREAD_TEST_CASE(test_fewer_chunks_than_workers) {
    fake_transport transport;
    client::chunk_uploader uploader(transport, client::uploader_config{.workers = 8, .retry = tests::fast_retry()});
    std::string payload;
    auto fd = make_descriptor("empty", 1);
    confirmations confirmed;

    auto stats = uploader.upload(fd, chunk_size, 0, string_reader(payload), confirmed.confirmer()).get();
    BOOST_REQUIRE_EQUAL(stats.chunks, 1);
    BOOST_REQUIRE_EQUAL(stats.bytes, 0);
    BOOST_REQUIRE_EQUAL(transport.max_inflight, 1);
    BOOST_REQUIRE(transport.parts[1].empty());
}

SEASTAR_THREAD_TEST_CASE(test_transient_failures_are_retried) {
    fake_transport transport;
    tests::counting_observer observer;
    client::chunk_uploader uploader(transport, client::uploader_config{.workers = 2, .retry = tests::fast_retry()}, observer);
    auto payload = tests::make_payload(4 * chunk_size, 2);
    auto fd = make_descriptor("a.bin", 4);
    transport.transient_failures[3] = 2;

    unsigned confirm_calls = 0;
    std::set<unsigned> confirmed;
    auto stats = uploader.upload(fd, chunk_size, payload.size(), string_reader(payload), [&] (unsigned chunk, unsigned, sstring) {
        // the first confirmation times out
        if (confirm_calls++ == 0) {
            return make_exception_future<>(timed_out_error());
        }
        confirmed.insert(chunk);
        return make_ready_future<>();
    }).get();

    BOOST_REQUIRE_EQUAL(stats.chunks, 4);
    BOOST_REQUIRE_EQUAL(confirmed.size(), 4);
    BOOST_REQUIRE_EQUAL(confirm_calls, 5);
    BOOST_REQUIRE_EQUAL(transport.calls, 6);
    BOOST_REQUIRE_EQUAL(observer.retries, 3);
}

SEASTAR_THREAD_TEST_CASE(test_permanent_failure_stops_the_pool) {
    fake_transport transport;
    client::chunk_uploader uploader(transport, client::uploader_config{.workers = 2, .retry = tests::fast_retry()});
    auto payload = tests::make_payload(50 * chunk_size, 3);
    auto fd = make_descriptor("a.bin", 50);
    transport.broken_parts.insert(2);
    confirmations confirmed;

    BOOST_REQUIRE_THROW(uploader.upload(fd, chunk_size, payload.size(), string_reader(payload), confirmed.confirmer()).get(), aws::aws_exception);
    BOOST_REQUIRE(!confirmed.etags.contains(1));
    // no chunk is claimed after the failure
    BOOST_REQUIRE_LT(transport.calls, 50);
}

SEASTAR_THREAD_TEST_CASE(test_descriptor_must_match_the_file) {
    fake_transport transport;
    client::chunk_uploader uploader(transport);
    std::string payload(3 * chunk_size, 'x');
    confirmations confirmed;

    BOOST_REQUIRE_THROW(uploader.upload(make_descriptor("a", 2), chunk_size, payload.size(), string_reader(payload), confirmed.confirmer()).get(),
            std::invalid_argument);
    auto fd = make_descriptor("a", 3);
    fd.parts.pop_back();
    BOOST_REQUIRE_THROW(uploader.upload(fd, chunk_size, payload.size(), string_reader(payload), confirmed.confirmer()).get(), std::invalid_argument);
    BOOST_REQUIRE_EQUAL(transport.calls, 0);
    BOOST_REQUIRE_THROW(client::chunk_uploader(transport, client::uploader_config{.workers = 0}), std::invalid_argument);
}

SEASTAR_THREAD_TEST_CASE(test_caller_abort) {
    fake_transport transport;
    client::chunk_uploader uploader(transport, client::uploader_config{.workers = 2, .retry = tests::fast_retry()});
    auto payload = tests::make_payload(10 * chunk_size, 4);
    confirmations confirmed;

    abort_source as;
    as.request_abort();
    BOOST_REQUIRE_THROW(uploader.upload(make_descriptor("a", 10), chunk_size, payload.size(), string_reader(payload), confirmed.confirmer(), &as).get(),
            abort_requested_exception);
    BOOST_REQUIRE_EQUAL(transport.calls, 0);
}

namespace {

// PUTs straight into the in-memory store, the way S3 handles a part request.
class memory_transport final : public client::part_transport {
    tests::memory_object_store& _store;
public:
    explicit memory_transport(tests::memory_object_store& store) : _store(store) {}

    future<sstring> put_part(const ingest::part_descriptor& part, temporary_buffer<char> data, abort_source*) override {
        std::string_view url(part.url);
        constexpr std::string_view origin = "http://memory";
        auto query = url.find('?');
        auto upload_id = url.substr(url.find("uploadId=") + 9);
        co_return _store.put_part(sstring(url.substr(origin.size(), query - origin.size())), sstring(upload_id),
                part.part_number, std::string(data.get(), data.size()));
    }

    future<> close() override {
        return make_ready_future<>();
    }
};

}

SEASTAR_THREAD_TEST_CASE(test_upload_through_the_session_manager) {
    auto store = make_shared<tests::memory_object_store>();
    s3::multipart_storage_client storage(store, s3::storage_client_config{.bucket = "bucket"}, tests::fast_retry());
    kv::memory_metadata_store metadata;
    archive::archive_builder builder(storage);
    ingest::pin_credential_verifier verifier;
    ingest::upload_session_manager manager(storage, metadata, builder, verifier, ingest::ingest_config{.background_archiving = false});
    memory_transport transport(*store);
    client::chunk_uploader uploader(transport, client::uploader_config{.workers = 3, .retry = tests::fast_retry()});

    auto a = tests::make_payload(11_MiB, 5);
    auto b = tests::make_payload(1000, 6);
    auto desc = manager.init({{"a.bin", a.size()}, {"b.txt", b.size()}}, "0042").get();
    for (size_t i = 0; i < desc.files.size(); ++i) {
        const auto& data = i == 0 ? a : b;
        const auto& fd = desc.files[i];
        uploader.upload(fd, desc.chunk_size, data.size(), string_reader(data), [&] (unsigned chunk, unsigned part, sstring etag) {
            return manager.confirm_chunk(desc.session_id, fd.name, chunk, part, std::move(etag)).discard_result();
        }).get();
    }
    BOOST_REQUIRE_EQUAL(manager.status(desc.session_id).get().progress, 1);

    auto resp = manager.seal(desc.session_id).get();
    BOOST_REQUIRE(resp.status == ingest::session_state::done);
    auto archive = store->get(storage.object_name(ingest::archive_object_key(*resp.archive_id)));
    BOOST_REQUIRE(archive);
    auto entries = tests::read_zip(*archive);
    BOOST_REQUIRE_EQUAL(entries.size(), 2);
    BOOST_REQUIRE(entries[0].data == a);
    BOOST_REQUIRE(entries[1].data == b);
}
