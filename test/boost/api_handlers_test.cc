/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <seastar/core/coroutine.hh>
#include <seastar/http/client.hh>
#include <seastar/testing/thread_test_case.hh>
#include <seastar/util/defer.hh>
#include <seastar/util/short_streams.hh>

#include "api/upload_handlers.hh"
#include "archive/archive_builder.hh"
#include "ingest/credentials.hh"
#include "ingest/upload_session_manager.hh"
#include "kv/memory_metadata_store.hh"
#include "test/lib/log.hh"
#include "test/lib/memory_object_store.hh"
#include "test/lib/pipeline_utils.hh"
#include "test/lib/test_endpoint.hh"
#include "utils/http.hh"
#include "utils/rjson.hh"

using namespace seastar;
using failure = tests::memory_object_store::failure;

static tests::test_endpoint network_unshare;

namespace {

struct api_reply {
    int status;
    rjson::value body;
};

struct api_fixture {
    shared_ptr<tests::memory_object_store> store = make_shared<tests::memory_object_store>();
    s3::multipart_storage_client storage{store, s3::storage_client_config{.bucket = "bucket"}, tests::fast_retry()};
    kv::memory_metadata_store metadata;
    archive::archive_builder builder{storage};
    ingest::pin_credential_verifier verifier;
    ingest::upload_session_manager manager{storage, metadata, builder, verifier, ingest::ingest_config{.background_archiving = false}};
    api::server server{manager};
    std::string address = network_unshare.get_address();
    uint16_t port = network_unshare.get_port();
    http::experimental::client http{std::make_unique<utils::http::dns_connection_factory>(address, port, false, testlog)};

    api_fixture() {
        server.init(api::api_config{.address = sstring(address), .port = port}).get();
    }

    future<> stop() {
        co_await http.close();
        co_await server.stop();
        co_await manager.stop();
    }

    api_reply call(sstring method, sstring path, std::optional<sstring> body = std::nullopt) {
        auto req = http::request::make(method, sstring(address), path);
        if (body) {
            req.write_body("json", std::move(*body));
        }
        api_reply ret{0, rjson::null_value()};
        http.make_request(std::move(req), [&ret] (const http::reply& rep, input_stream<char>&& in_) -> future<> {
            auto in = std::move(in_);
            ret.status = int(rep._status);
            auto content = co_await util::read_entire_stream_contiguous(in);
            if (!content.empty()) {
                ret.body = rjson::parse(std::string_view(content));
            }
        }, std::nullopt).get();
        testlog.debug("{} {} -> {} {}", method, path, ret.status, rjson::print(ret.body));
        return ret;
    }

    api_reply post(sstring path, std::string_view json) {
        return call("POST", std::move(path), sstring(json));
    }

    // PUTs the chunk the way a browser would with the part request.
    sstring put_chunk(const sstring& session_id, const sstring& file, const sstring& upload_id, unsigned chunk, std::string data) {
        return store->put_part(storage.object_name(ingest::temp_object_key(session_id, file)), upload_id, chunk + 1, std::move(data));
    }
};

sstring confirm_body(const sstring& session_id, std::string_view file, unsigned chunk, const sstring& etag) {
    auto doc = rjson::empty_object();
    rjson::add(doc, "sessionId", std::string_view(session_id));
    rjson::add(doc, "fileName", file);
    rjson::add(doc, "chunkIndex", rjson::value(chunk));
    rjson::add(doc, "partNumber", rjson::value(chunk + 1));
    rjson::add(doc, "etag", std::string_view(etag));
    return sstring(rjson::print(doc));
}

}

SEASTAR_THREAD_TEST_CASE(test_upload_flow_over_http) {
    api_fixture f;
    auto stop = defer([&f] () noexcept { f.stop().get(); });

    auto init = f.post("/api/upload/init", R"({"files":[{"name":"a.txt","size":100},{"name":"b.txt","size":5}],"password":"1234"})");
    BOOST_REQUIRE_EQUAL(init.status, 200);
    auto session_id = rjson::get_string(init.body, "sessionId");
    BOOST_REQUIRE_EQUAL(rjson::get_uint64(init.body, "chunkSize"), 5_MiB);
    const auto& files = rjson::get(init.body, "files");
    BOOST_REQUIRE_EQUAL(files.Size(), 2);
    const auto& part = files[0]["parts"][0];
    BOOST_REQUIRE_EQUAL(rjson::get_uint64(part, "partNumber"), 1);
    BOOST_REQUIRE(!rjson::get_string(part, "uploadUrl").empty());
    BOOST_REQUIRE(rjson::get(part, "headers").IsObject());

    auto a = tests::make_payload(100, 1);
    auto b = tests::make_payload(5, 2);
    auto etag_a = f.put_chunk(session_id, "a.txt", rjson::get_string(files[0], "uploadId"), 0, a);
    auto etag_b = f.put_chunk(session_id, "b.txt", rjson::get_string(files[1], "uploadId"), 0, b);

    auto confirm = f.post("/api/upload/chunk-confirm", confirm_body(session_id, "a.txt", 0, etag_a));
    BOOST_REQUIRE_EQUAL(confirm.status, 200);
    BOOST_REQUIRE_EQUAL(rjson::get_uint64(confirm.body, "uploadedCount"), 1);
    BOOST_REQUIRE_EQUAL(rjson::get_uint64(confirm.body, "totalChunks"), 2);
    BOOST_REQUIRE(rjson::get_bool(confirm.body, "isNew"));

    // the incomplete session cannot be sealed
    auto complete_body = fmt::format(R"({{"sessionId":"{}"}})", session_id);
    auto incomplete = f.post("/api/upload/complete", complete_body);
    BOOST_REQUIRE_EQUAL(incomplete.status, 409);
    const auto& missing = rjson::get(incomplete.body, "missing");
    BOOST_REQUIRE_EQUAL(missing["b.txt"].Size(), 1);
    BOOST_REQUIRE_EQUAL(missing["b.txt"][0].GetUint(), 0);

    f.post("/api/upload/chunk-confirm", confirm_body(session_id, "b.txt", 0, etag_b));
    auto status = f.call("GET", format("/api/upload/status?sessionId={}", session_id));
    BOOST_REQUIRE_EQUAL(status.status, 200);
    BOOST_REQUIRE_EQUAL(rjson::get_string(status.body, "state"), "ingesting");
    BOOST_REQUIRE_EQUAL(rjson::get(status.body, "progress").GetDouble(), 1.0);

    auto done = f.post("/api/upload/complete", complete_body);
    BOOST_REQUIRE_EQUAL(done.status, 200);
    BOOST_REQUIRE_EQUAL(rjson::get_string(done.body, "status"), "done");
    auto archive_id = rjson::get_string(done.body, "archiveId");

    status = f.call("GET", format("/api/upload/status?sessionId={}", session_id));
    BOOST_REQUIRE_EQUAL(rjson::get_string(status.body, "state"), "done");
    BOOST_REQUIRE_EQUAL(rjson::get_string(status.body, "archiveId"), archive_id);
    BOOST_REQUIRE(f.store->contains(f.storage.object_name(ingest::archive_object_key(archive_id))));

    // a replayed complete reports the same archive
    done = f.post("/api/upload/complete", complete_body);
    BOOST_REQUIRE_EQUAL(rjson::get_string(done.body, "archiveId"), archive_id);
}

SEASTAR_THREAD_TEST_CASE(test_error_replies) {
    api_fixture f;
    auto stop = defer([&f] () noexcept { f.stop().get(); });

    auto r = f.post("/api/upload/init", R"({"files":[{"name":"a.txt","size":1}],"password":"abcd"})");
    BOOST_REQUIRE_EQUAL(r.status, 400);
    BOOST_REQUIRE(!rjson::get_string(r.body, "error").empty());

    BOOST_REQUIRE_EQUAL(f.post("/api/upload/init", "not json").status, 400);
    BOOST_REQUIRE_EQUAL(f.post("/api/upload/init", "[1, 2]").status, 400);
    BOOST_REQUIRE_EQUAL(f.post("/api/upload/init", R"({"password":"1234"})").status, 400);
    BOOST_REQUIRE_EQUAL(f.call("POST", "/api/upload/complete").status, 400);
    BOOST_REQUIRE_EQUAL(f.call("GET", "/api/upload/status").status, 400);
    BOOST_REQUIRE_EQUAL(f.call("GET", "/api/upload/status?sessionId=nope").status, 404);
    BOOST_REQUIRE_EQUAL(f.post("/api/upload/complete", R"({"sessionId":"nope"})").status, 404);

    f.store->inject("create_multipart_upload", failure::non_retryable);
    r = f.post("/api/upload/init", R"({"files":[{"name":"a.txt","size":1}],"password":"1234"})");
    BOOST_REQUIRE_EQUAL(r.status, 502);

    auto init = f.post("/api/upload/init", R"({"files":[{"name":"a.txt","size":1}],"password":"1234"})");
    BOOST_REQUIRE_EQUAL(init.status, 200);
    auto session_id = rjson::get_string(init.body, "sessionId");
    auto upload_id = rjson::get_string(rjson::get(init.body, "files")[0], "uploadId");
    auto etag = f.put_chunk(session_id, "a.txt", upload_id, 0, "x");
    BOOST_REQUIRE_EQUAL(f.post("/api/upload/chunk-confirm", confirm_body(session_id, "a.txt", 0, etag)).status, 200);
    BOOST_REQUIRE_EQUAL(f.post("/api/upload/chunk-confirm", confirm_body(session_id, "a.txt", 0, "\"other\"")).status, 409);
    BOOST_REQUIRE_EQUAL(f.post("/api/upload/chunk-confirm", confirm_body(session_id, "a.txt", 7, etag)).status, 400);
}
