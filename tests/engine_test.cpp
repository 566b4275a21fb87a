#include <gtest/gtest.h>

#include <numeric>
#include <xxhash.h>
#include <core/http_transfer/http_transfer.hpp>
#include <core/planner/segment_planner.hpp>
#include <extensions/resumer.hpp>
#include "fake_http.hpp"
#include "test_utils.hpp"

using namespace segdl;
using segdl::testing::FakeHttpSession;
using segdl::testing::TempDir;
using segdl::testing::factory_for;
using segdl::testing::fast_options;
using segdl::testing::make_body;
using segdl::testing::read_file;
using segdl::testing::write_file;

namespace {

constexpr const char* k_url = "http://example.com/archive.bin";

struct EngineFixture {
    TempDir dir;
    std::shared_ptr<FakeHttpSession> server;
    core::EngineOptions options = fast_options();

    explicit EngineFixture(std::size_t size = 100'003) : server(std::make_shared<FakeHttpSession>(make_body(size))) {}

    auto request(std::uint32_t workers = 4) const -> core::TransferRequest {
        return core::TransferRequest::make(k_url, dir.path(), workers);
    }

    auto transfer(std::uint32_t workers = 4, infra::CancellationToken cancel = {}) -> std::unique_ptr<core::HttpTransfer> {
        return std::make_unique<core::HttpTransfer>(request(workers), options, factory_for(server), cancel);
    }

    // Останавливает передачу, когда сервер отдал threshold байт
    void pause_after(std::uint64_t threshold, infra::CancellationToken cancel) {
        server->on_served = [threshold, cancel](std::uint64_t served) mutable {
            if (served >= threshold) cancel.request();
        };
    }
};

auto part_sizes_sum(const core::ResumeRecord& record) -> std::uint64_t {
    return std::accumulate(record.parts.begin(), record.parts.end(), std::uint64_t{0},
                           [](std::uint64_t acc, const auto& part) { return acc + part.second; });
}

} // namespace

TEST(EngineTest, SegmentedRoundTrip)
{
    EngineFixture f;
    auto transfer = f.transfer(4);

    const auto result = transfer->start();
    ASSERT_TRUE(result.success) << (result.error ? result.error->message : "");
    EXPECT_EQ(transfer->state(), core::TransferState::Completed);
    EXPECT_EQ(read_file(f.request().destination()), f.server->body());
    EXPECT_EQ(result.stats.bytes_downloaded, f.server->body().size());
    EXPECT_EQ(result.stats.transfer_attempts, 1);

    EXPECT_FALSE(std::filesystem::exists(f.request().resume_file()));
    EXPECT_FALSE(std::filesystem::exists(f.request().parts_dir()));
    EXPECT_EQ(f.server->requests().size(), 4u);
    EXPECT_EQ(transfer->plan()->original_workers, 4u);
}

TEST(EngineTest, ProgressEventsReachSubscribers)
{
    EngineFixture f;
    auto transfer = f.transfer(4);
    std::vector<infra::ProgressEvent> events;
    transfer->subscribe([&](const infra::ProgressEvent& e) { events.push_back(e); });

    ASSERT_TRUE(transfer->start().success);
    ASSERT_FALSE(events.empty());
    for (std::size_t i = 1; i < events.size(); ++i) {
        EXPECT_GE(events[i].bytes_downloaded, events[i - 1].bytes_downloaded);
    }
    ASSERT_TRUE(events.back().percent.has_value());
    EXPECT_DOUBLE_EQ(*events.back().percent, 100.0);
    EXPECT_EQ(*events.back().bytes_total, f.server->body().size());
}

TEST(EngineTest, NoRangeSupportFallsBackToSingleStream)
{
    EngineFixture f;
    f.server->ranges = false;

    // Запись от прошлого сегментированного запуска должна быть отброшена
    const auto req = f.request();
    core::ResumeRecord stale{k_url, req.filename, f.server->body().size(), {{0, 10}, {1, 10}, {2, 0}, {3, 0}}, 0.0, 4};
    ASSERT_TRUE(extensions::ResumeStore(req).save(stale).has_value());
    write_file(core::part_file(req.parts_dir(), 1), std::string(10, 'x'));

    auto transfer = f.transfer(4);
    const auto result = transfer->start();
    ASSERT_TRUE(result.success);

    const auto requests = f.server->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_FALSE(requests[0].range.has_value());
    EXPECT_EQ(transfer->plan()->original_workers, 1u);
    EXPECT_EQ(read_file(req.destination()), f.server->body());
    EXPECT_FALSE(std::filesystem::exists(req.resume_file()));
}

TEST(EngineTest, UnknownSizeDownloadsWithoutResumeState)
{
    EngineFixture f;
    f.server->send_length = false;

    auto transfer = f.transfer(4);
    std::optional<infra::ProgressEvent> last;
    transfer->subscribe([&](const infra::ProgressEvent& e) { last = e; });

    const auto result = transfer->start();
    ASSERT_TRUE(result.success);
    EXPECT_FALSE(transfer->plan()->resumable());
    EXPECT_EQ(read_file(f.request().destination()), f.server->body());
    EXPECT_FALSE(std::filesystem::exists(f.request().resume_file()));
    ASSERT_TRUE(last.has_value());
    EXPECT_FALSE(last->percent.has_value());
}

TEST(EngineTest, EmptyResource)
{
    EngineFixture f(0);
    auto transfer = f.transfer(4);
    std::optional<infra::ProgressEvent> last;
    transfer->subscribe([&](const infra::ProgressEvent& e) { last = e; });

    const auto result = transfer->start();
    ASSERT_TRUE(result.success);
    EXPECT_TRUE(std::filesystem::exists(f.request().destination()));
    EXPECT_EQ(std::filesystem::file_size(f.request().destination()), 0u);
    EXPECT_TRUE(f.server->requests().empty());
    ASSERT_TRUE(last.has_value());
    ASSERT_TRUE(last->percent.has_value());
    EXPECT_DOUBLE_EQ(*last->percent, 100.0);
}

TEST(EngineTest, TinyResourceUsesFewerSegments)
{
    EngineFixture f(3);
    auto transfer = f.transfer(8);

    ASSERT_TRUE(transfer->start().success);
    EXPECT_EQ(transfer->plan()->original_workers, 3u);
    EXPECT_EQ(read_file(f.request().destination()), f.server->body());
}

TEST(EngineTest, ProbeFailureIsFatal)
{
    EngineFixture f;
    f.server->head_status = 404;

    auto transfer = f.transfer(4);
    const auto result = transfer->start();
    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->code, infra::ErrorCode::ProbeFailed);
    EXPECT_EQ(transfer->state(), core::TransferState::Failed);
    EXPECT_TRUE(f.server->requests().empty());
}

TEST(EngineTest, TransferRetryRecoversFailedSegment)
{
    EngineFixture f;
    f.options.segment_retry.max_attempts = 1;
    f.server->drops = 1;
    f.server->drop_after = 5'000;

    auto transfer = f.transfer(4);
    const auto result = transfer->start();
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.stats.transfer_attempts, 2);
    EXPECT_EQ(f.server->requests().size(), 5u);
    EXPECT_EQ(read_file(f.request().destination()), f.server->body());
}

TEST(EngineTest, RetryExhaustionKeepsResumeState)
{
    EngineFixture f;
    f.server->get_fails = true;

    auto transfer = f.transfer(4);
    const auto result = transfer->start();
    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->code, infra::ErrorCode::RetryExhausted);
    EXPECT_EQ(transfer->state(), core::TransferState::Failed);

    // 3 прохода по 4 сегмента по 3 попытки
    EXPECT_EQ(result.stats.transfer_attempts, 3);
    EXPECT_EQ(f.server->requests().size(), 36u);
    EXPECT_TRUE(std::filesystem::exists(f.request().resume_file()));
    EXPECT_FALSE(std::filesystem::exists(f.request().destination()));
}

TEST(EngineTest, PauseThenResumeWithoutRedownload)
{
    EngineFixture f(400'000);
    infra::CancellationToken cancel;
    f.pause_after(150'000, cancel);

    auto transfer = f.transfer(4, cancel);
    const auto paused = transfer->start();
    EXPECT_FALSE(paused.success);
    EXPECT_TRUE(paused.paused);
    ASSERT_TRUE(paused.error.has_value());
    EXPECT_EQ(paused.error->code, infra::ErrorCode::Interrupted);
    EXPECT_EQ(transfer->state(), core::TransferState::Paused);

    // Чекпоинт после паузы совпадает с файлами сегментов
    const auto record = extensions::read_resume_record(f.request().resume_file());
    ASSERT_TRUE(record.has_value());
    for (const auto& [index, bytes] : record->parts) {
        const auto path = core::part_file(f.request().parts_dir(), index);
        const auto on_disk = std::filesystem::exists(path) ? std::filesystem::file_size(path) : 0;
        EXPECT_EQ(on_disk, bytes) << "part " << index;
    }
    const auto saved = part_sizes_sum(*record);
    EXPECT_GT(saved, 0u);
    EXPECT_LT(saved, f.server->body().size());

    f.server->on_served = nullptr;
    const auto served_before = f.server->served();
    const auto resumed = transfer->resume();
    ASSERT_TRUE(resumed.success);
    EXPECT_EQ(read_file(f.request().destination()), f.server->body());
    EXPECT_EQ(f.server->served() - served_before, f.server->body().size() - saved);
}

TEST(EngineTest, ResumeKeepsOriginalPartition)
{
    EngineFixture f(400'000);
    infra::CancellationToken cancel;
    f.pause_after(100'000, cancel);
    ASSERT_TRUE(f.transfer(4, cancel)->start().paused);
    f.server->on_served = nullptr;

    auto second = f.transfer(2);
    const auto result = second->start();
    ASSERT_TRUE(result.success);
    EXPECT_EQ(second->plan()->original_workers, 4u);

    const auto expected = core::plan_segments(400'000, 4);
    const auto segments = second->segments();
    ASSERT_EQ(segments.size(), 4u);
    for (std::size_t i = 0; i < segments.size(); ++i) {
        EXPECT_EQ(segments[i].span, expected[i].span);
    }
    EXPECT_EQ(read_file(f.request().destination()), f.server->body());
}

TEST(EngineTest, MissingPartFileIsRedownloaded)
{
    EngineFixture f(400'000);
    infra::CancellationToken cancel;
    f.pause_after(200'000, cancel);
    ASSERT_TRUE(f.transfer(4, cancel)->start().paused);
    f.server->on_served = nullptr;

    std::filesystem::remove(core::part_file(f.request().parts_dir(), 1));

    auto second = f.transfer(4);
    ASSERT_TRUE(second->start().success);
    EXPECT_EQ(read_file(f.request().destination()), f.server->body());
}

TEST(EngineTest, ChangedRemoteSizeDiscardsRecord)
{
    EngineFixture f;
    const auto req = f.request();
    core::ResumeRecord stale{k_url, req.filename, 999, {{0, 100}, {1, 0}}, 0.0, 2};
    ASSERT_TRUE(extensions::ResumeStore(req).save(stale).has_value());
    write_file(core::part_file(req.parts_dir(), 0), std::string(100, 'z'));

    auto transfer = f.transfer(4);
    ASSERT_TRUE(transfer->start().success);
    EXPECT_EQ(transfer->plan()->original_workers, 4u);
    EXPECT_EQ(read_file(req.destination()), f.server->body());
}

TEST(EngineTest, ExpectedDigestIsVerified)
{
    EngineFixture f;
    const auto& body = f.server->body();
    f.options.expected_xxh64 = XXH64(body.data(), body.size(), 0);
    ASSERT_TRUE(f.transfer(4)->start().success);
}

TEST(EngineTest, DigestMismatchFails)
{
    EngineFixture f;
    const auto& body = f.server->body();
    f.options.expected_xxh64 = XXH64(body.data(), body.size(), 0) ^ 1u;

    const auto result = f.transfer(4)->start();
    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->code, infra::ErrorCode::ChecksumMismatch);
}

TEST(EngineTest, UnwritableResumeFileDoesNotStopTransfer)
{
    EngineFixture f{20'000};
    const auto req = f.request(4);

    // Непустой каталог на месте resume-файла: rename() в него не пройдёт
    std::filesystem::create_directories(req.resume_file() / "occupied");

    auto transfer = f.transfer(4);
    const auto result = transfer->start();
    ASSERT_TRUE(result.success) << (result.error ? result.error->message : "");
    EXPECT_EQ(transfer->state(), core::TransferState::Completed);
    EXPECT_EQ(read_file(req.destination()), f.server->body());

    auto temp = req.resume_file();
    temp += ".tmp";
    EXPECT_FALSE(std::filesystem::exists(temp));
    EXPECT_TRUE(std::filesystem::is_directory(req.resume_file()));
    EXPECT_FALSE(std::filesystem::exists(req.parts_dir()));
}
