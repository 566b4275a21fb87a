#include <gtest/gtest.h>

#include <core/merger/merger.hpp>
#include <core/planner/segment_planner.hpp>
#include <extensions/resumer.hpp>
#include "fake_http.hpp"
#include "test_utils.hpp"

using namespace segdl;
using segdl::testing::TempDir;
using segdl::testing::read_file;
using segdl::testing::write_file;

namespace {

struct MergeFixture {
    TempDir dir;
    core::TransferRequest request = core::TransferRequest::make("http://example.com/data.bin", dir.path(), 4);
    std::string body = segdl::testing::make_body(10'001);
    std::vector<core::Segment> segments = core::plan_segments(body.size(), 4);

    void write_parts() {
        for (auto& s : segments) {
            write_file(core::part_file(request.parts_dir(), s.index),
                       std::string_view(body).substr(s.span->first, s.span->size()));
            s.downloaded = s.span->size();
        }
    }
};

} // namespace

TEST(MergerTest, ConcatenatesInOrderAndClearsState)
{
    MergeFixture f;
    f.write_parts();
    extensions::ResumeStore store(f.request);
    core::ResumeRecord record{f.request.url, f.request.filename, f.body.size(), {}, 0.0, 4};
    ASSERT_TRUE(store.save(record).has_value());

    auto res = core::merge_segments(f.segments, f.request.parts_dir(), f.request.destination(), store);
    ASSERT_TRUE(res.has_value()) << res.error().message;

    EXPECT_EQ(read_file(f.request.destination()), f.body);
    EXPECT_FALSE(store.exists());
    EXPECT_FALSE(std::filesystem::exists(f.request.parts_dir()));
}

TEST(MergerTest, TruncatedPartIsCorruption)
{
    MergeFixture f;
    f.write_parts();
    const auto path = core::part_file(f.request.parts_dir(), 2);
    std::filesystem::resize_file(path, *f.segments[2].expected_size - 1);

    extensions::ResumeStore store(f.request);
    auto res = core::merge_segments(f.segments, f.request.parts_dir(), f.request.destination(), store);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, infra::ErrorCode::Corruption);

    // Ничего не склеено, сегменты на месте
    EXPECT_FALSE(std::filesystem::exists(f.request.destination()));
    EXPECT_TRUE(std::filesystem::exists(core::part_file(f.request.parts_dir(), 0)));
}

TEST(MergerTest, FailedStagingWriteKeepsSegmentsAndResumeState)
{
    MergeFixture f;
    f.write_parts();
    extensions::ResumeStore store(f.request);
    core::ResumeRecord record{f.request.url, f.request.filename, f.body.size(), {}, 0.0, 4};
    ASSERT_TRUE(store.save(record).has_value());

    // Каталог на месте файла склейки: open() вернёт EISDIR
    auto staging = f.request.destination();
    staging += ".merging";
    std::filesystem::create_directories(staging / "occupied");

    auto res = core::merge_segments(f.segments, f.request.parts_dir(), f.request.destination(), store);
    ASSERT_FALSE(res.has_value());

    EXPECT_FALSE(std::filesystem::exists(f.request.destination()));
    EXPECT_TRUE(store.exists());
    for (const auto& s : f.segments) {
        EXPECT_EQ(std::filesystem::file_size(core::part_file(f.request.parts_dir(), s.index)), s.span->size());
    }
}

TEST(MergerTest, OversizedPartIsCorruption)
{
    MergeFixture f;
    f.write_parts();
    std::ofstream(core::part_file(f.request.parts_dir(), 0), std::ios::app) << "x";

    auto res = core::validate_segments(f.segments, f.request.parts_dir());
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, infra::ErrorCode::Corruption);
}

TEST(MergerTest, MissingPartIsCorruption)
{
    MergeFixture f;
    f.write_parts();
    std::filesystem::remove(core::part_file(f.request.parts_dir(), 3));

    auto res = core::validate_segments(f.segments, f.request.parts_dir());
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, infra::ErrorCode::Corruption);
}

TEST(MergerTest, UnknownSizeSinglePartIsAccepted)
{
    TempDir dir;
    const auto request = core::TransferRequest::make("http://example.com/stream", dir.path(), 1);
    auto segments = core::plan_single_stream(std::nullopt);
    write_file(core::part_file(request.parts_dir(), 0), "streamed body");

    extensions::ResumeStore store(request);
    ASSERT_TRUE(core::merge_segments(segments, request.parts_dir(), request.destination(), store).has_value());
    EXPECT_EQ(read_file(request.destination()), "streamed body");
}

TEST(MergerTest, EmptyResourceProducesEmptyFile)
{
    TempDir dir;
    const auto request = core::TransferRequest::make("http://example.com/empty.txt", dir.path(), 4);
    const auto segments = core::plan_segments(0, 4);

    extensions::ResumeStore store(request);
    ASSERT_TRUE(core::merge_segments(segments, request.parts_dir(), request.destination(), store).has_value());
    EXPECT_TRUE(std::filesystem::exists(request.destination()));
    EXPECT_EQ(std::filesystem::file_size(request.destination()), 0u);
}
