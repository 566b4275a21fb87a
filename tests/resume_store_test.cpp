#include <gtest/gtest.h>

#include <extensions/resumer.hpp>
#include <yaml-cpp/yaml.h>
#include "test_utils.hpp"

using namespace segdl;
using segdl::testing::TempDir;
using segdl::testing::read_file;
using segdl::testing::write_file;

namespace {

auto sample_record() -> core::ResumeRecord {
    core::ResumeRecord record;
    record.url = "http://example.com/file.bin";
    record.filename = "file.bin";
    record.file_size = 10'485'760;
    record.parts = {{0, 2'621'440}, {1, 1000}, {2, 0}, {3, 5}};
    record.timestamp = 1'700'000'000.25;
    record.original_workers = 4;
    return record;
}

} // namespace

TEST(ResumeStoreTest, SaveThenLoad)
{
    TempDir dir;
    const auto request = core::TransferRequest::make("http://example.com/file.bin", dir.path(), 4);
    extensions::ResumeStore store(request);

    ASSERT_TRUE(store.save(sample_record()).has_value());
    EXPECT_TRUE(store.exists());
    EXPECT_FALSE(std::filesystem::exists(request.resume_file().string() + ".tmp"));

    const auto loaded = store.load(request);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->url, request.url);
    EXPECT_EQ(loaded->file_size, 10'485'760u);
    EXPECT_EQ(loaded->original_workers, 4u);
    EXPECT_EQ(loaded->parts.at(0), 2'621'440u);
    EXPECT_EQ(loaded->parts.at(3), 5u);
    EXPECT_DOUBLE_EQ(loaded->timestamp, 1'700'000'000.25);
}

TEST(ResumeStoreTest, FileIsFlowMapping)
{
    // Запись читается любым JSON-парсером: один flow-map с кавычками
    const auto text = extensions::serialize_resume_record(sample_record());
    EXPECT_EQ(text.front(), '{');
    EXPECT_EQ(text.back(), '}');
    EXPECT_NE(text.find("\"url\": \"http://example.com/file.bin\""), std::string::npos);
    EXPECT_NE(text.find("\"original_worker_count\": 4"), std::string::npos);

    const auto node = YAML::Load(text);
    EXPECT_EQ(node["parts"]["1"].as<std::uint64_t>(), 1000u);
}

TEST(ResumeStoreTest, UrlMismatchClearsState)
{
    TempDir dir;
    const auto request = core::TransferRequest::make("http://example.com/file.bin", dir.path(), 4);
    extensions::ResumeStore store(request);
    ASSERT_TRUE(store.save(sample_record()).has_value());
    write_file(core::part_file(request.parts_dir(), 0), "abc");

    const auto other = core::TransferRequest::make("http://mirror.example.com/file.bin", dir.path(), 4);
    EXPECT_FALSE(store.load(other).has_value());
    EXPECT_FALSE(store.exists());
    EXPECT_FALSE(std::filesystem::exists(request.parts_dir()));
}

TEST(ResumeStoreTest, FilenameMismatchClearsState)
{
    TempDir dir;
    const auto request = core::TransferRequest::make("http://example.com/file.bin", dir.path(), 4);
    extensions::ResumeStore store(request);
    auto record = sample_record();
    record.filename = "renamed.bin";
    ASSERT_TRUE(store.save(record).has_value());
    write_file(core::part_file(request.parts_dir(), 0), "abc");

    EXPECT_FALSE(store.load(request).has_value());
    EXPECT_FALSE(store.exists());
    EXPECT_FALSE(std::filesystem::exists(request.parts_dir()));
}

TEST(ResumeStoreTest, PartIndexOutOfRangeIsRejected)
{
    TempDir dir;
    const auto request = core::TransferRequest::make("http://example.com/file.bin", dir.path(), 4);
    extensions::ResumeStore store(request);
    auto record = sample_record();
    record.parts[9] = 1;
    ASSERT_TRUE(store.save(record).has_value());

    EXPECT_FALSE(store.load(request).has_value());
    EXPECT_FALSE(store.exists());
}

TEST(ResumeStoreTest, CorruptFileIsDiscarded)
{
    TempDir dir;
    const auto request = core::TransferRequest::make("http://example.com/file.bin", dir.path(), 4);
    write_file(request.resume_file(), "{\"url\": \"http://example.com/file.bin\", \"filen");

    extensions::ResumeStore store(request);
    EXPECT_FALSE(store.load(request).has_value());
    EXPECT_FALSE(std::filesystem::exists(request.resume_file()));
}

TEST(ResumeStoreTest, MissingKeyIsAnError)
{
    auto parsed = extensions::parse_resume_record("{\"url\": \"x\", \"filename\": \"y\"}");
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().code, infra::ErrorCode::Persistence);
}

TEST(ResumeStoreTest, ClearIsIdempotent)
{
    TempDir dir;
    const auto request = core::TransferRequest::make("http://example.com/file.bin", dir.path(), 4);
    extensions::ResumeStore store(request);
    ASSERT_TRUE(store.save(sample_record()).has_value());
    write_file(core::part_file(request.parts_dir(), 0), "abc");
    write_file(core::part_file(request.parts_dir(), 1), "def");

    store.clear();
    EXPECT_FALSE(store.exists());
    EXPECT_FALSE(std::filesystem::exists(request.parts_dir()));

    store.clear();
    EXPECT_FALSE(store.exists());
}

TEST(ResumeStoreTest, ListResumable)
{
    TempDir dir;
    const auto a = core::TransferRequest::make("http://example.com/a.bin", dir.path(), 2);
    const auto b = core::TransferRequest::make("http://example.com/b.bin", dir.path(), 2);

    auto record = sample_record();
    record.url = a.url;
    record.filename = a.filename;
    ASSERT_TRUE(extensions::ResumeStore(a).save(record).has_value());
    record.url = b.url;
    record.filename = b.filename;
    ASSERT_TRUE(extensions::ResumeStore(b).save(record).has_value());
    write_file(dir.path() / "junk.resume", "not: [valid");

    const auto listed = extensions::list_resumable(dir.path());
    ASSERT_EQ(listed.size(), 2u);
    EXPECT_EQ(listed[0].second.filename, "a.bin");
    EXPECT_EQ(listed[1].second.filename, "b.bin");
}

TEST(ResumeStoreTest, ListedRecordRebuildsItsRequestPaths)
{
    TempDir dir;
    const auto original = core::TransferRequest::make("http://example.com/video.mp4?x=1", dir.path(), 4, "clip.mp4");
    auto record = sample_record();
    record.url = original.url;
    record.filename = original.filename;
    ASSERT_TRUE(extensions::ResumeStore(original).save(record).has_value());
    write_file(core::part_file(original.parts_dir(), 1), "abc");

    const auto listed = extensions::list_resumable(dir.path());
    ASSERT_EQ(listed.size(), 1u);
    const auto& [path, found] = listed.front();

    const auto rebuilt = core::TransferRequest::make(found.url, dir.path(), 1, found.filename);
    EXPECT_EQ(rebuilt.resume_file(), path);
    EXPECT_EQ(rebuilt.parts_dir(), original.parts_dir());

    extensions::ResumeStore store(rebuilt);
    store.clear();
    EXPECT_FALSE(std::filesystem::exists(path));
    EXPECT_FALSE(std::filesystem::exists(original.parts_dir()));
}
