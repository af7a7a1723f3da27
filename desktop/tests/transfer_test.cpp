#include "local_broker.h"
#include "logger.h"
#include "transfer_manager.h"
#include "transfer_messages.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

using namespace litecdn;

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

namespace {

constexpr int kWaitMs = 15000;

std::vector<uint8_t> pattern_bytes(size_t n, uint8_t seed = 1) {
    std::vector<uint8_t> v(n);
    for (size_t i = 0; i < n; ++i) v[i] = static_cast<uint8_t>((i * 7 + seed * 13 + (i >> 8)) & 0xFF);
    return v;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

TransferOptions fast_options(uint32_t chunk_size = 1000) {
    TransferOptions o;
    o.chunk_size = chunk_size;
    o.retransmit_interval_ms = 50;
    o.max_retransmit_rounds = 4;
    o.download_timeout_ms = 10000;
    o.ack_timeout_ms = 2000;
    return o;
}

// One broker with storage, an uploading node and a downloading node.
struct TestBed {
    std::shared_ptr<LocalBroker> broker;
    std::unique_ptr<LocalTransport> source_link;
    std::unique_ptr<LocalTransport> sink_link;
    std::unique_ptr<TransferManager> source;
    std::unique_ptr<TransferManager> sink;

    explicit TestBed(bool storage = true) {
        LocalBroker::Options options;
        options.storage = storage;
        broker = LocalBroker::create(options);
        source_link = broker->connect();
        sink_link = broker->connect();
        source = std::make_unique<TransferManager>(*source_link);
        sink = std::make_unique<TransferManager>(*sink_link);
    }

    ~TestBed() {
        sink.reset();
        source.reset();
        broker->wait_idle(2000);
    }
};

// Pending download result.
struct Pending {
    std::shared_ptr<std::promise<TransferResult>> promise = std::make_shared<std::promise<TransferResult>>();
    std::future<TransferResult> future = promise->get_future();

    TransferCallback callback() {
        auto p = promise;
        return [p](const TransferResult& r) { p->set_value(r); };
    }

    bool wait(TransferResult& out) {
        if (future.wait_for(std::chrono::milliseconds(kWaitMs)) != std::future_status::ready) {
            return false;
        }
        out = future.get();
        return true;
    }
};

} // namespace

// ============================================================================
// ROUND TRIPS
// ============================================================================

static bool test_round_trip_live() {
    TestBed bed;
    const auto data = pattern_bytes(10 * 1000 + 123);

    Pending dl;
    TEST_ASSERT(bed.sink->start_download("media/clip.bin", fast_options(), dl.callback()), "start_download");

    TransferOptions up = fast_options();
    up.file_name = "clip.bin";
    const TransferResult ur = bed.source->upload("media/clip.bin", data, up);
    TEST_ASSERT(ur.success, "upload failed: " + ur.error.to_string());
    TEST_ASSERT(ur.manifest.chunk_count == 11, "chunk count");
    TEST_ASSERT(ur.chunks_transferred == 11, "chunks published");

    TransferResult dr;
    TEST_ASSERT(dl.wait(dr), "download did not resolve");
    TEST_ASSERT(dr.success, "download failed: " + dr.error.to_string());
    TEST_ASSERT(dr.data == data, "downloaded bytes differ");
    TEST_ASSERT(dr.manifest.file_name == "clip.bin", "file name carried in manifest");
    TEST_ASSERT(dr.manifest == ur.manifest, "manifests differ");

    const auto stats = bed.sink->get_statistics();
    TEST_ASSERT(stats.at("downloads_completed") == 1, "downloads_completed");
    TEST_ASSERT(stats.at("bytes_downloaded") == static_cast<double>(data.size()), "bytes_downloaded");
    TEST_ASSERT(bed.sink->active_downloads() == 0, "session released");
    return true;
}

static bool test_late_download_from_store() {
    TestBed bed;
    const auto data = pattern_bytes(4321, 3);

    const TransferResult ur = bed.source->upload("late.bin", data, fast_options(500));
    TEST_ASSERT(ur.success, "upload failed: " + ur.error.to_string());
    bed.broker->wait_idle(2000);

    const TransferResult dr = bed.sink->download("late.bin", fast_options(500));
    TEST_ASSERT(dr.success, "late download failed: " + dr.error.to_string());
    TEST_ASSERT(dr.data == data, "bytes");
    TEST_ASSERT(dr.retransmit_rounds >= 1, "chunks came from retransmission");
    return true;
}

static bool test_without_query_support() {
    TestBed bed;
    bed.sink_link->set_supports_query(false);
    const auto data = pattern_bytes(2500, 4);

    TEST_ASSERT(bed.source->upload("noquery.bin", data, fast_options()).success, "upload");
    bed.broker->wait_idle(2000);

    const TransferResult dr = bed.sink->download("noquery.bin", fast_options());
    TEST_ASSERT(dr.success, "download failed: " + dr.error.to_string());
    TEST_ASSERT(dr.data == data, "bytes");

    std::vector<ObjectManifest> listed;
    std::string error;
    TEST_ASSERT(!bed.sink->list_objects(500, listed, &error), "listing without query support");
    return true;
}

static bool test_empty_object() {
    TestBed bed;

    Pending dl;
    TEST_ASSERT(bed.sink->start_download("empty.bin", fast_options(), dl.callback()), "start_download");
    const TransferResult ur = bed.source->upload("empty.bin", {}, fast_options());
    TEST_ASSERT(ur.success, "upload failed: " + ur.error.to_string());
    TEST_ASSERT(ur.manifest.chunk_count == 0, "zero chunks");

    TransferResult dr;
    TEST_ASSERT(dl.wait(dr), "download did not resolve");
    TEST_ASSERT(dr.success, "download failed: " + dr.error.to_string());
    TEST_ASSERT(dr.data.empty(), "empty bytes");
    return true;
}

static bool test_parallel_publish() {
    TestBed bed;
    const auto data = pattern_bytes(64 * 1024, 5);

    Pending dl;
    TEST_ASSERT(bed.sink->start_download("par.bin", fast_options(1024), dl.callback()), "start_download");
    TransferOptions up = fast_options(1024);
    up.parallel_publish = true;
    const TransferResult ur = bed.source->upload("par.bin", data, up);
    TEST_ASSERT(ur.success, "upload failed: " + ur.error.to_string());
    TEST_ASSERT(ur.chunks_transferred == 64, "all chunks published");

    TransferResult dr;
    TEST_ASSERT(dl.wait(dr) && dr.success, "download failed: " + dr.error.to_string());
    TEST_ASSERT(dr.data == data, "bytes");
    return true;
}

// ============================================================================
// ORDERING / DUPLICATION
// ============================================================================

static bool test_hello_delivered_out_of_order() {
    TestBed bed;
    const std::vector<uint8_t> data = {'0', '1', '2', '3', '4', '5', '6', '7', '8', '9'};

    std::mutex order_mutex;
    std::vector<uint32_t> order;
    // third endpoint that only records arrival order
    auto observer = bed.broker->connect();
    const TopicScheme& topics = bed.sink->topics();
    TEST_ASSERT(observer->subscribe(topics.chunk_pattern("hello.bin"),
                                    [&](const std::string& topic, const std::string&) {
                                        ParsedTopic p;
                                        if (topics.parse(topic, p)) {
                                            std::lock_guard<std::mutex> lock(order_mutex);
                                            // first arrival only; retransmitted copies may follow
                                            if (std::find(order.begin(), order.end(), p.chunk_index) == order.end()) {
                                                order.push_back(p.chunk_index);
                                            }
                                        }
                                    },
                                    nullptr) != 0,
                "observer subscription");

    bed.broker->set_fault_hook([](const std::string& topic, std::string&) {
        FaultDecision d;
        if (ends_with(topic, "/@chunk/0")) d.delay_ms = 150;
        if (ends_with(topic, "/@chunk/1")) d.delay_ms = 300;
        return d;
    });

    TransferOptions o = fast_options(4);
    o.retransmit_interval_ms = 1000;
    Pending dl;
    TEST_ASSERT(bed.sink->start_download("hello.bin", o, dl.callback()), "start_download");
    const TransferResult ur = bed.source->upload("hello.bin", data, o);
    TEST_ASSERT(ur.success, "upload failed: " + ur.error.to_string());
    TEST_ASSERT(ur.manifest.chunk_count == 3, "three chunks");
    TEST_ASSERT(ur.manifest.expected_chunk_length(2) == 2, "short last chunk");

    TransferResult dr;
    TEST_ASSERT(dl.wait(dr) && dr.success, "download failed: " + dr.error.to_string());
    TEST_ASSERT(dr.data == data, "bytes");

    bed.broker->wait_idle(2000);
    std::lock_guard<std::mutex> lock(order_mutex);
    TEST_ASSERT(order.size() == 3, "observer saw every chunk");
    TEST_ASSERT(order[0] == 2 && order[1] == 0 && order[2] == 1, "arrival order was [2,0,1]");
    observer.reset();
    return true;
}

static bool test_shuffled_with_duplicates() {
    TestBed bed;
    const auto data = pattern_bytes(20 * 512 + 7, 6);
    TEST_ASSERT(bed.source->upload("dup.bin", data, fast_options(512)).success, "upload");
    bed.broker->wait_idle(2000);

    auto rng = std::make_shared<std::mt19937>(42);
    auto rng_mutex = std::make_shared<std::mutex>();
    bed.broker->set_fault_hook([rng, rng_mutex](const std::string& topic, std::string&) {
        FaultDecision d;
        if (topic.find("/@chunk/") != std::string::npos) {
            std::lock_guard<std::mutex> lock(*rng_mutex);
            d.extra_copies = 2;
            d.delay_ms = static_cast<int>((*rng)() % 40);
        }
        return d;
    });

    const TransferResult dr = bed.sink->download("dup.bin", fast_options(512));
    TEST_ASSERT(dr.success, "download failed: " + dr.error.to_string());
    TEST_ASSERT(dr.data == data, "bytes");
    TEST_ASSERT(bed.sink->get_statistics().at("duplicate_chunks") > 0, "duplicates were seen and ignored");
    return true;
}

// ============================================================================
// LOSS / TAMPERING
// ============================================================================

static bool test_single_loss_recovered() {
    TestBed bed;
    const auto data = pattern_bytes(8000, 7);

    auto dropped = std::make_shared<std::atomic<bool>>(false);
    bed.broker->set_fault_hook([dropped](const std::string& topic, std::string&) {
        FaultDecision d;
        if (ends_with(topic, "/@chunk/5") && !dropped->exchange(true)) d.drop = true;
        return d;
    });

    Pending dl;
    TEST_ASSERT(bed.sink->start_download("loss.bin", fast_options(), dl.callback()), "start_download");
    TEST_ASSERT(bed.source->upload("loss.bin", data, fast_options()).success, "upload");

    TransferResult dr;
    TEST_ASSERT(dl.wait(dr) && dr.success, "download failed: " + dr.error.to_string());
    TEST_ASSERT(dr.data == data, "bytes");
    TEST_ASSERT(dropped->load(), "chunk 5 was dropped once");
    TEST_ASSERT(dr.retransmit_rounds >= 1, "retransmission requested");
    return true;
}

static bool test_requests_name_only_missing_chunks() {
    TestBed bed;
    const auto data = pattern_bytes(8 * 1000, 11);
    TEST_ASSERT(bed.source->upload("sel.bin", data, fast_options()).success, "upload");
    bed.broker->wait_idle(2000);

    std::mutex requests_mutex;
    std::vector<std::vector<uint32_t>> requests;
    auto observer = bed.broker->connect();
    TEST_ASSERT(observer->subscribe(bed.sink->topics().retransmit_topic("sel.bin"),
                                    [&](const std::string&, const std::string& payload) {
                                        RetransmitRequest req;
                                        if (!transfer_messages::decode_retransmit(payload, req, nullptr)) return;
                                        if (req.indices.empty()) return;   // manifest-only
                                        std::lock_guard<std::mutex> lock(requests_mutex);
                                        requests.push_back(req.indices);
                                    },
                                    nullptr) != 0,
                "observer subscription");

    auto dropped = std::make_shared<std::atomic<bool>>(false);
    bed.broker->set_fault_hook([dropped](const std::string& topic, std::string&) {
        FaultDecision d;
        if (ends_with(topic, "/@chunk/5") && !dropped->exchange(true)) d.drop = true;
        return d;
    });

    TransferOptions o = fast_options();
    o.retransmit_interval_ms = 200;
    const TransferResult dr = bed.sink->download("sel.bin", o);
    TEST_ASSERT(dr.success, "download failed: " + dr.error.to_string());
    TEST_ASSERT(dr.data == data, "bytes");

    bed.broker->wait_idle(2000);
    std::lock_guard<std::mutex> lock(requests_mutex);
    TEST_ASSERT(requests.size() >= 2, "initial request and at least one retransmission");
    for (uint32_t index : requests[0]) {
        TEST_ASSERT(index < 8, "first request within the object");
    }
    // after the first round only chunk 5 is missing
    for (size_t i = 1; i < requests.size(); ++i) {
        TEST_ASSERT(requests[i] == std::vector<uint32_t>({5}), "retransmission names exactly {5}");
    }
    observer.reset();
    return true;
}

static bool test_late_manifest_keeps_chunk_budget() {
    TestBed bed;
    bed.sink_link->set_supports_query(false);
    const auto data = pattern_bytes(10 * 100, 12);
    TEST_ASSERT(bed.source->upload("late-manifest.bin", data, fast_options(100)).success, "upload");
    bed.broker->wait_idle(2000);

    // every request round but the last loses the manifest
    auto manifests = std::make_shared<std::atomic<int>>(0);
    bed.broker->set_fault_hook([manifests](const std::string& topic, std::string&) {
        FaultDecision d;
        if (ends_with(topic, "/@manifest") && ++(*manifests) <= 4) d.drop = true;
        return d;
    });

    TransferOptions o = fast_options(100);
    o.max_retransmit_rounds = 4;
    const TransferResult dr = bed.sink->download("late-manifest.bin", o);
    TEST_ASSERT(manifests->load() >= 5, "manifest delivered on the last allowed round");
    TEST_ASSERT(dr.success, "download failed: " + dr.error.to_string());
    TEST_ASSERT(dr.data == data, "bytes");
    TEST_ASSERT(dr.manifest.chunk_count == 10, "ten chunks");
    return true;
}

static bool test_manifest_too_large_for_transport() {
    TestBed bed;
    const auto data = pattern_bytes(10000, 13);
    TEST_ASSERT(bed.source->upload("wide.bin", data, fast_options(4096)).success, "upload");
    bed.broker->wait_idle(2000);

    // this node can never receive a 4096-byte chunk frame
    bed.sink_link->set_max_message_size(2048);
    const TransferResult dr = bed.sink->download("wide.bin", fast_options());
    TEST_ASSERT(!dr.success, "download succeeded");
    TEST_ASSERT(dr.error.kind == TransferErrorKind::FORMAT_ERROR, "FormatError, got " + dr.error.to_string());
    TEST_ASSERT(dr.error.missing_indices.empty(), "no reassembly was started");
    TEST_ASSERT(bed.sink->active_downloads() == 0, "session released");
    return true;
}

static bool test_chunk_never_arrives() {
    TestBed bed;
    const auto data = pattern_bytes(5 * 100, 8);

    bed.broker->set_fault_hook([](const std::string& topic, std::string&) {
        FaultDecision d;
        d.drop = ends_with(topic, "/@chunk/3");
        return d;
    });

    TransferOptions o = fast_options(100);
    o.max_retransmit_rounds = 3;
    Pending dl;
    TEST_ASSERT(bed.sink->start_download("five.bin", o, dl.callback()), "start_download");
    const TransferResult ur = bed.source->upload("five.bin", data, o);
    TEST_ASSERT(ur.success && ur.manifest.chunk_count == 5, "upload of five chunks");

    TransferResult dr;
    TEST_ASSERT(dl.wait(dr), "download did not resolve");
    TEST_ASSERT(!dr.success, "download succeeded without chunk 3");
    TEST_ASSERT(dr.error.kind == TransferErrorKind::TIMEOUT_ERROR, "TimeoutError, got " + dr.error.to_string());
    TEST_ASSERT(dr.error.missing_indices == std::vector<uint32_t>({3}), "missing set is {3}");
    TEST_ASSERT(dr.data.empty(), "no partial data handed out");
    return true;
}

static bool test_tampered_once_recovered() {
    TestBed bed;
    const auto data = pattern_bytes(6000, 9);
    TEST_ASSERT(bed.source->upload("tamper1.bin", data, fast_options()).success, "upload");
    bed.broker->wait_idle(2000);

    auto tampered = std::make_shared<std::atomic<bool>>(false);
    bed.broker->set_fault_hook([tampered](const std::string& topic, std::string& payload) {
        if (ends_with(topic, "/@chunk/2") && !tampered->exchange(true)) {
            payload[payload.size() - 1] ^= 0x5A;   // last payload byte
        }
        return FaultDecision{};
    });

    const TransferResult dr = bed.sink->download("tamper1.bin", fast_options());
    TEST_ASSERT(dr.success, "download failed: " + dr.error.to_string());
    TEST_ASSERT(dr.data == data, "bytes");
    TEST_ASSERT(bed.sink->get_statistics().at("digest_mismatches") >= 1, "mismatch recorded");
    return true;
}

static bool test_tampered_always() {
    TestBed bed;
    const auto data = pattern_bytes(6000, 10);
    TEST_ASSERT(bed.source->upload("tamper2.bin", data, fast_options()).success, "upload");
    bed.broker->wait_idle(2000);

    bed.broker->set_fault_hook([](const std::string& topic, std::string& payload) {
        if (ends_with(topic, "/@chunk/4")) {
            payload[payload.size() - 1] ^= 0x01;
        }
        return FaultDecision{};
    });

    TransferOptions o = fast_options();
    o.max_retransmit_rounds = 3;
    const TransferResult dr = bed.sink->download("tamper2.bin", o);
    TEST_ASSERT(!dr.success, "tampered object accepted");
    TEST_ASSERT(dr.error.kind == TransferErrorKind::TIMEOUT_ERROR, "TimeoutError, got " + dr.error.to_string());
    TEST_ASSERT(dr.error.missing_indices == std::vector<uint32_t>({4}), "missing set is {4}");
    return true;
}

static bool test_manifest_never_arrives() {
    TestBed bed;
    TransferOptions o = fast_options();
    o.max_retransmit_rounds = 2;
    const TransferResult dr = bed.sink->download("nobody/has/this", o);
    TEST_ASSERT(!dr.success, "download of unknown object succeeded");
    TEST_ASSERT(dr.error.kind == TransferErrorKind::TIMEOUT_ERROR, "TimeoutError, got " + dr.error.to_string());
    return true;
}

static bool test_overall_deadline() {
    TestBed bed;
    TransferOptions o = fast_options();
    o.max_retransmit_rounds = 1000;
    o.download_timeout_ms = 300;

    const auto started = std::chrono::steady_clock::now();
    const TransferResult dr = bed.sink->download("slow.bin", o);
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
    TEST_ASSERT(dr.error.kind == TransferErrorKind::TIMEOUT_ERROR, "TimeoutError, got " + dr.error.to_string());
    TEST_ASSERT(elapsed < 5000, "deadline honoured");
    return true;
}

// ============================================================================
// CONTROL
// ============================================================================

static bool test_busy_and_cancel() {
    TestBed bed;
    TransferOptions o = fast_options();
    o.max_retransmit_rounds = 1000;
    o.download_timeout_ms = 0;

    Pending first;
    TEST_ASSERT(bed.sink->start_download("wait.bin", o, first.callback()), "first download");
    TEST_ASSERT(bed.sink->is_active("wait.bin"), "active");

    Pending second;
    TEST_ASSERT(!bed.sink->start_download("wait.bin", o, second.callback()), "second download accepted");
    TransferResult busy;
    TEST_ASSERT(second.wait(busy), "busy result not reported");
    TEST_ASSERT(busy.error.kind == TransferErrorKind::BUSY, "BUSY, got " + busy.error.to_string());

    TEST_ASSERT(bed.sink->cancel_download("wait.bin"), "cancel");
    TransferResult cancelled;
    TEST_ASSERT(first.wait(cancelled), "cancelled download did not resolve");
    TEST_ASSERT(cancelled.error.kind == TransferErrorKind::CANCELLED, "CANCELLED, got " + cancelled.error.to_string());
    TEST_ASSERT(!bed.sink->is_active("wait.bin"), "slot freed");
    TEST_ASSERT(!bed.sink->cancel_download("wait.bin"), "cancel of nothing");

    Pending again;
    TEST_ASSERT(bed.sink->start_download("wait.bin", o, again.callback()), "slot reusable after cancel");
    bed.sink->cancel_all();
    TransferResult r;
    TEST_ASSERT(again.wait(r) && r.error.kind == TransferErrorKind::CANCELLED, "cancel_all");
    return true;
}

static bool test_await_ack() {
    TestBed bed;
    const auto data = pattern_bytes(3000, 11);

    Pending dl;
    TEST_ASSERT(bed.sink->start_download("acked.bin", fast_options(), dl.callback()), "start_download");
    TransferOptions up = fast_options();
    up.await_ack = true;
    const TransferResult ur = bed.source->upload("acked.bin", data, up);
    TEST_ASSERT(ur.success, "acknowledged upload failed: " + ur.error.to_string());

    TransferResult dr;
    TEST_ASSERT(dl.wait(dr) && dr.success, "download failed");

    // nobody downloads this one
    up.ack_timeout_ms = 200;
    const TransferResult lonely = bed.source->upload("unacked.bin", data, up);
    TEST_ASSERT(lonely.error.kind == TransferErrorKind::TIMEOUT_ERROR, "TimeoutError, got " + lonely.error.to_string());
    return true;
}

static bool test_uploader_serves_retransmits() {
    // no storage node: only the uploader can answer
    TestBed bed(false);
    const auto data = pattern_bytes(7000, 12);

    auto dropped = std::make_shared<std::atomic<bool>>(false);
    bed.broker->set_fault_hook([dropped](const std::string& topic, std::string&) {
        FaultDecision d;
        if (ends_with(topic, "/@chunk/1") && !dropped->exchange(true)) d.drop = true;
        return d;
    });

    Pending dl;
    TEST_ASSERT(bed.sink->start_download("direct.bin", fast_options(), dl.callback()), "start_download");
    TransferOptions up = fast_options();
    up.await_ack = true;
    const TransferResult ur = bed.source->upload("direct.bin", data, up);
    TEST_ASSERT(ur.success, "upload failed: " + ur.error.to_string());
    TEST_ASSERT(ur.retransmit_rounds >= 1, "uploader served a retransmission");

    TransferResult dr;
    TEST_ASSERT(dl.wait(dr) && dr.success, "download failed: " + dr.error.to_string());
    TEST_ASSERT(dr.data == data, "bytes");
    return true;
}

static bool test_upload_failures() {
    TestBed bed;

    bed.broker->set_publish_fail_filter([](const std::string& topic) { return ends_with(topic, "/@chunk/1"); });
    const TransferResult failed = bed.source->upload("fail.bin", pattern_bytes(3000), fast_options());
    TEST_ASSERT(failed.error.kind == TransferErrorKind::TRANSPORT_ERROR,
                "TransportError, got " + failed.error.to_string());
    bed.broker->clear_faults();

    bed.source_link->set_max_message_size(1024);
    const TransferResult oversize = bed.source->upload("big.bin", pattern_bytes(10000), fast_options(4096));
    TEST_ASSERT(oversize.error.kind == TransferErrorKind::FORMAT_ERROR,
                "FormatError, got " + oversize.error.to_string());
    bed.source_link->set_max_message_size(16 * 1024 * 1024);

    TransferOptions zero = fast_options(0);
    TEST_ASSERT(!bed.source->upload("zero.bin", pattern_bytes(10), zero).success, "zero chunk size accepted");

    TransferOptions alg = fast_options();
    alg.digest_algorithm = "md5";
    TEST_ASSERT(bed.source->upload("alg.bin", pattern_bytes(10), alg).error.kind ==
                TransferErrorKind::INVALID_ARGUMENT, "unknown algorithm");

    TEST_ASSERT(bed.source->upload("bad//id", pattern_bytes(10), fast_options()).error.kind ==
                TransferErrorKind::INVALID_ARGUMENT, "invalid object id");
    TEST_ASSERT(bed.sink->download("@manifest", fast_options()).error.kind ==
                TransferErrorKind::INVALID_ARGUMENT, "invalid download id");
    return true;
}

// ============================================================================
// ISOLATION / LISTING
// ============================================================================

static bool test_objects_are_isolated() {
    TestBed bed;
    const auto a = pattern_bytes(4000, 13);
    const auto b = pattern_bytes(4000, 14);

    bed.broker->set_fault_hook([](const std::string& topic, std::string&) {
        FaultDecision d;
        d.drop = topic.find("/files/iso/a/@chunk/0") != std::string::npos;
        return d;
    });

    TransferOptions o = fast_options();
    o.max_retransmit_rounds = 3;
    Pending dla;
    Pending dlb;
    TEST_ASSERT(bed.sink->start_download("iso/a", o, dla.callback()), "download a");
    TEST_ASSERT(bed.sink->start_download("iso/b", o, dlb.callback()), "download b");
    TEST_ASSERT(bed.sink->active_downloads() == 2, "two active downloads");

    TEST_ASSERT(bed.source->upload("iso/a", a, o).success, "upload a");
    TEST_ASSERT(bed.source->upload("iso/b", b, o).success, "upload b");

    TransferResult rb;
    TEST_ASSERT(dlb.wait(rb) && rb.success, "b failed: " + rb.error.to_string());
    TEST_ASSERT(rb.data == b, "b bytes");

    TransferResult ra;
    TEST_ASSERT(dla.wait(ra), "a did not resolve");
    TEST_ASSERT(ra.error.kind == TransferErrorKind::TIMEOUT_ERROR, "a times out, got " + ra.error.to_string());
    TEST_ASSERT(ra.error.missing_indices == std::vector<uint32_t>({0}), "a misses chunk 0");
    return true;
}

static bool test_list_objects() {
    TestBed bed;
    TEST_ASSERT(bed.source->upload("list/one.bin", pattern_bytes(100), fast_options()).success, "upload one");
    TEST_ASSERT(bed.source->upload("list/two.bin", pattern_bytes(2500), fast_options()).success, "upload two");
    bed.broker->wait_idle(2000);

    std::vector<ObjectManifest> listed;
    std::string error;
    TEST_ASSERT(bed.sink->list_objects(2000, listed, &error), "list_objects: " + error);
    TEST_ASSERT(listed.size() == 2, "two objects listed");
    TEST_ASSERT(listed[0].object_id == "list/one.bin" && listed[1].object_id == "list/two.bin", "sorted by id");
    TEST_ASSERT(listed[1].total_size == 2500 && listed[1].chunk_count == 3, "listed manifest fields");
    return true;
}

int main() {
    set_log_level(LogLevel::ERROR);
    std::cout << "--- Transfer tests ---" << std::endl;

    if (test_round_trip_live()) std::cout << "PASS: live round trip" << std::endl;
    if (test_late_download_from_store()) std::cout << "PASS: late download from store" << std::endl;
    if (test_without_query_support()) std::cout << "PASS: transport without query" << std::endl;
    if (test_empty_object()) std::cout << "PASS: empty object" << std::endl;
    if (test_parallel_publish()) std::cout << "PASS: parallel publish" << std::endl;
    if (test_hello_delivered_out_of_order()) std::cout << "PASS: hello.bin out of order" << std::endl;
    if (test_shuffled_with_duplicates()) std::cout << "PASS: shuffled with duplicates" << std::endl;
    if (test_single_loss_recovered()) std::cout << "PASS: single loss recovered" << std::endl;
    if (test_requests_name_only_missing_chunks()) std::cout << "PASS: requests name only missing chunks" << std::endl;
    if (test_late_manifest_keeps_chunk_budget()) std::cout << "PASS: late manifest keeps chunk budget" << std::endl;
    if (test_manifest_too_large_for_transport()) std::cout << "PASS: manifest too large for transport" << std::endl;
    if (test_chunk_never_arrives()) std::cout << "PASS: chunk never arrives" << std::endl;
    if (test_tampered_once_recovered()) std::cout << "PASS: tampered once" << std::endl;
    if (test_tampered_always()) std::cout << "PASS: tampered always" << std::endl;
    if (test_manifest_never_arrives()) std::cout << "PASS: manifest never arrives" << std::endl;
    if (test_overall_deadline()) std::cout << "PASS: overall deadline" << std::endl;
    if (test_busy_and_cancel()) std::cout << "PASS: busy and cancel" << std::endl;
    if (test_await_ack()) std::cout << "PASS: await ack" << std::endl;
    if (test_uploader_serves_retransmits()) std::cout << "PASS: uploader serves retransmits" << std::endl;
    if (test_upload_failures()) std::cout << "PASS: upload failures" << std::endl;
    if (test_objects_are_isolated()) std::cout << "PASS: objects isolated" << std::endl;
    if (test_list_objects()) std::cout << "PASS: list objects" << std::endl;

    if (tests_failed != 0) {
        std::cerr << "FAILED: " << tests_failed << " test(s)" << std::endl;
        return 1;
    }
    std::cout << "ALL PASS" << std::endl;
    return 0;
}
