/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <seastar/core/abort_source.hh>
#include <seastar/core/sleep.hh>
#include <seastar/testing/thread_test_case.hh>

#include "archive/archive_builder.hh"
#include "archive/zip_writer.hh"
#include "test/lib/log.hh"
#include "test/lib/memory_object_store.hh"
#include "test/lib/pipeline_utils.hh"
#include "test/lib/zip_reader.hh"

using namespace seastar;
using namespace std::chrono_literals;
using failure = tests::memory_object_store::failure;

namespace {

const auto mtime = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));

struct builder_fixture {
    shared_ptr<tests::memory_object_store> store = make_shared<tests::memory_object_store>();
    tests::counting_observer observer;
    s3::multipart_storage_client storage{store, s3::storage_client_config{.bucket = "bucket"}, tests::fast_retry(), observer};

    std::vector<archive::source_object> add_sources(const std::vector<std::pair<std::string, std::string>>& files) {
        std::vector<archive::source_object> ret;
        for (const auto& [name, data] : files) {
            auto key = seastar::format("temp/s1/{}", name);
            store->put(storage.object_name(key), data);
            ret.push_back(archive::source_object{name, key});
        }
        return ret;
    }

    std::string object(const sstring& key) const {
        auto data = store->get(storage.object_name(key));
        BOOST_REQUIRE(data);
        return std::move(*data);
    }
};

// The whole archive written into one buffer.
std::string pack_in_memory(const std::vector<std::pair<std::string, std::string>>& files) {
    std::string out;
    archive::zip_writer w([&out] (temporary_buffer<char> buf) {
        out.append(buf.get(), buf.size());
        return make_ready_future<>();
    }, mtime);
    for (const auto& [name, data] : files) {
        w.begin_entry(name, data.size()).get();
        w.write(temporary_buffer<char>(data.data(), data.size())).get();
        w.end_entry().get();
    }
    w.finish().get();
    return out;
}

bool message_contains(const std::exception& e, std::string_view what) {
    return std::string_view(e.what()).find(what) != std::string_view::npos;
}

}

SEASTAR_THREAD_TEST_CASE(test_parts_have_fixed_size) {
    builder_fixture f;
    std::vector<std::pair<std::string, std::string>> files = {
        {"first.bin", tests::make_payload(40_MiB, 1)},
        {"second.bin", tests::make_payload(1_MiB, 2)},
        {"third.bin", tests::make_payload(90_MiB, 3)},
    };
    auto sources = f.add_sources(files);
    archive::archive_builder builder(f.storage);

    std::vector<unsigned> progress;
    auto res = builder.build("archives/a1/files.zip", sources, mtime, [&progress] (unsigned done) {
        progress.push_back(done);
        return make_ready_future<>();
    }).get();

    BOOST_REQUIRE_EQUAL(res.file_count, 3);
    BOOST_REQUIRE(progress == (std::vector<unsigned>{1, 2, 3}));
    BOOST_REQUIRE_EQUAL(res.parts.size(), 3);
    BOOST_REQUIRE_EQUAL(res.part_sizes.size(), 3);
    BOOST_REQUIRE_EQUAL(res.part_sizes[0], 50_MiB);
    BOOST_REQUIRE_EQUAL(res.part_sizes[1], 50_MiB);
    BOOST_REQUIRE_EQUAL(res.part_sizes[2], res.size - 100_MiB);
    BOOST_REQUIRE(f.store->completed_part_sizes(f.storage.object_name(res.key)) == res.part_sizes);
    for (unsigned i = 0; i < res.parts.size(); ++i) {
        BOOST_REQUIRE_EQUAL(res.parts[i].part_number, i + 1);
    }

    auto data = f.object(res.key);
    BOOST_REQUIRE_EQUAL(data.size(), res.size);
    auto entries = tests::read_zip(data);
    BOOST_REQUIRE_EQUAL(entries.size(), 3);
    for (size_t i = 0; i < files.size(); ++i) {
        BOOST_REQUIRE_EQUAL(entries[i].name, files[i].first);
        BOOST_REQUIRE(entries[i].data == files[i].second);
    }
    for (const auto& src : sources) {
        BOOST_REQUIRE(!f.store->contains(f.storage.object_name(src.key)));
    }
    BOOST_REQUIRE_EQUAL(f.store->pending_uploads(), 0);
    BOOST_REQUIRE_EQUAL(f.observer.parts_uploaded, 3);
    BOOST_REQUIRE_EQUAL(f.observer.part_bytes, res.size);
}

SEASTAR_THREAD_TEST_CASE(test_streamed_archive_matches_in_memory_one) {
    builder_fixture f;
    std::vector<std::pair<std::string, std::string>> files = {
        {"a.txt", tests::make_payload(2_MiB + 17, 4)},
        {"empty", ""},
        {"dir/b.bin", tests::make_payload(7_MiB, 5)},
        {"c.bin", tests::make_payload(5_MiB, 6)},
    };
    auto sources = f.add_sources(files);
    archive::archive_builder builder(f.storage, archive::builder_config{
        .part_size = 5_MiB,
        .read_window = 1_MiB - 3,
        .max_inflight_parts = 2,
        .channel_capacity = 3,
        .delete_sources = false,
    });

    auto res = builder.build("out.zip", sources, mtime).get();
    auto expected = pack_in_memory(files);
    BOOST_REQUIRE_EQUAL(res.size, expected.size());
    BOOST_REQUIRE(f.object("out.zip") == expected);
    BOOST_REQUIRE_EQUAL(res.parts.size(), (expected.size() + 5_MiB - 1) / 5_MiB);
    // kept on request
    for (const auto& src : sources) {
        BOOST_REQUIRE(f.store->contains(f.storage.object_name(src.key)));
    }
}

SEASTAR_THREAD_TEST_CASE(test_part_uploads_in_flight_are_bounded) {
    builder_fixture f;
    std::vector<std::pair<std::string, std::string>> files = {
        {"big.bin", tests::make_payload(32_MiB, 8)},
    };
    auto sources = f.add_sources(files);
    // the packer waits for a free upload slot instead of buffering more parts
    archive::archive_builder builder(f.storage, archive::builder_config{
        .part_size = 5_MiB,
        .read_window = 2_MiB,
        .max_inflight_parts = 2,
        .channel_capacity = 1,
    });

    auto res = builder.build("out.zip", sources, mtime).get();
    BOOST_REQUIRE_EQUAL(res.parts.size(), 7);
    BOOST_REQUIRE_GE(f.store->max_parts_inflight(), 1);
    BOOST_REQUIRE_LE(f.store->max_parts_inflight(), 2);
    BOOST_REQUIRE(f.object("out.zip") == pack_in_memory(files));
}

SEASTAR_THREAD_TEST_CASE(test_source_read_whole_when_size_is_unknown) {
    builder_fixture f;
    std::vector<std::pair<std::string, std::string>> files = {
        {"a.txt", tests::make_payload(3_MiB, 7)},
    };
    auto sources = f.add_sources(files);
    archive::archive_builder builder(f.storage, archive::builder_config{.read_window = 1_MiB});

    f.store->inject("get_object_size", failure::non_retryable);
    auto res = builder.build("out.zip", sources, mtime).get();
    BOOST_REQUIRE_EQUAL(res.file_count, 1);
    BOOST_REQUIRE_EQUAL(f.store->calls("get_object_contiguous"), 1);
    BOOST_REQUIRE(f.object("out.zip") == pack_in_memory(files));
}

SEASTAR_THREAD_TEST_CASE(test_transient_part_failures_are_retried) {
    builder_fixture f;
    auto sources = f.add_sources({{"a.txt", tests::make_payload(12_MiB, 8)}});
    archive::archive_builder builder(f.storage, archive::builder_config{.part_size = 5_MiB});

    f.store->inject("upload_part", failure::retryable, 2);
    auto res = builder.build("out.zip", sources, mtime).get();
    BOOST_REQUIRE_EQUAL(res.parts.size(), 3);
    BOOST_REQUIRE_EQUAL(f.observer.retries, 2);
    BOOST_REQUIRE_EQUAL(tests::read_zip(f.object("out.zip")).size(), 1);
}

SEASTAR_THREAD_TEST_CASE(test_failure_aborts_the_upload) {
    builder_fixture f;
    auto sources = f.add_sources({{"a.txt", tests::make_payload(6_MiB, 9)}});
    sources.push_back(archive::source_object{"missing.txt", "temp/s1/missing.txt"});
    archive::archive_builder builder(f.storage, archive::builder_config{.part_size = 5_MiB});

    BOOST_REQUIRE_THROW(builder.build("out.zip", sources, mtime).get(), archive::builder_failure_error);
    BOOST_REQUIRE(!f.store->contains(f.storage.object_name("out.zip")));
    BOOST_REQUIRE_EQUAL(f.store->pending_uploads(), 0);
    BOOST_REQUIRE_EQUAL(f.store->aborted_uploads(), 1);
    BOOST_REQUIRE_EQUAL(f.store->calls("complete_multipart_upload"), 0);
    // nothing is deleted on failure
    BOOST_REQUIRE(f.store->contains(f.storage.object_name(sources[0].key)));
}

SEASTAR_THREAD_TEST_CASE(test_failed_part_upload_aborts_the_upload) {
    builder_fixture f;
    auto sources = f.add_sources({{"a.txt", tests::make_payload(16_MiB, 10)}});
    archive::archive_builder builder(f.storage, archive::builder_config{.part_size = 5_MiB, .max_inflight_parts = 1});

    f.store->inject("upload_part", failure::non_retryable);
    BOOST_REQUIRE_THROW(builder.build("out.zip", sources, mtime).get(), archive::builder_failure_error);
    BOOST_REQUIRE_EQUAL(f.store->pending_uploads(), 0);
    BOOST_REQUIRE_EQUAL(f.store->aborted_uploads(), 1);
    BOOST_REQUIRE(!f.store->contains(f.storage.object_name("out.zip")));
}

SEASTAR_THREAD_TEST_CASE(test_pending_parts_have_a_ceiling) {
    builder_fixture f;
    auto sources = f.add_sources({{"a.txt", tests::make_payload(1_MiB, 11)}});
    archive::archive_builder builder(f.storage, archive::builder_config{.part_size = 5_MiB, .finalize_timeout = 50ms});

    f.store->inject("upload_part", failure::stall);
    BOOST_REQUIRE_EXCEPTION(builder.build("out.zip", sources, mtime).get(), archive::builder_failure_error,
            [] (const archive::builder_failure_error& e) {
        return message_contains(e, "did not finish within");
    });
    BOOST_REQUIRE_EQUAL(f.store->pending_uploads(), 0);
    BOOST_REQUIRE_EQUAL(f.store->aborted_uploads(), 1);
}

SEASTAR_THREAD_TEST_CASE(test_create_failure) {
    builder_fixture f;
    auto sources = f.add_sources({{"a.txt", "x"}});
    archive::archive_builder builder(f.storage);

    f.store->inject("create_multipart_upload", failure::non_retryable);
    BOOST_REQUIRE_EXCEPTION(builder.build("out.zip", sources, mtime).get(), archive::builder_failure_error,
            [] (const archive::builder_failure_error& e) {
        return message_contains(e, "cannot start");
    });
    BOOST_REQUIRE_EQUAL(f.store->calls("get_object_size"), 0);
}

SEASTAR_THREAD_TEST_CASE(test_caller_abort) {
    builder_fixture f;
    auto sources = f.add_sources({{"a.txt", "x"}});
    archive::archive_builder builder(f.storage);

    abort_source as;
    as.request_abort();
    BOOST_REQUIRE_THROW(builder.build("out.zip", sources, mtime, {}, &as).get(), abort_requested_exception);
    BOOST_REQUIRE_EQUAL(f.store->calls("create_multipart_upload"), 0);

    // aborted mid-way
    abort_source as2;
    f.store->inject("upload_part", failure::stall);
    auto fut = builder.build("out.zip", sources, mtime, {}, &as2);
    sleep(10ms).get();
    as2.request_abort();
    BOOST_REQUIRE_THROW(fut.get(), archive::builder_failure_error);
    BOOST_REQUIRE_EQUAL(f.store->pending_uploads(), 0);
}

SEASTAR_THREAD_TEST_CASE(test_invalid_requests) {
    builder_fixture f;
    BOOST_REQUIRE_THROW(archive::archive_builder(f.storage, archive::builder_config{.part_size = 1_MiB}), std::invalid_argument);
    BOOST_REQUIRE_THROW(archive::archive_builder(f.storage, archive::builder_config{.read_window = 0}), std::invalid_argument);
    archive::archive_builder builder(f.storage);
    BOOST_REQUIRE_THROW(builder.build("out.zip", {}, mtime).get(), std::invalid_argument);
}
