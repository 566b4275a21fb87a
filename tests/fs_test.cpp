#include <gtest/gtest.h>

#include <fcntl.h>
#include <unistd.h>
#include <adapters/fs.hpp>
#include "fake_http.hpp"
#include "test_utils.hpp"

using namespace segdl;
using segdl::testing::TempDir;
using segdl::testing::read_file;
using segdl::testing::write_file;

TEST(FsTest, StrategyThresholds)
{
    EXPECT_EQ(adapters::fs::select_strategy(1024), adapters::fs::AppendStrategy::Buffered);
    EXPECT_EQ(adapters::fs::select_strategy(10 * 1024 * 1024), adapters::fs::AppendStrategy::MMap);
    EXPECT_EQ(adapters::fs::select_strategy(200ull * 1024 * 1024), adapters::fs::AppendStrategy::Uring);
}

TEST(FsTest, ConcatPreservesOrder)
{
    TempDir dir;
    write_file(dir.path() / "a", "hello ");
    write_file(dir.path() / "b", "");
    write_file(dir.path() / "c", "world");

    const auto dst = dir.path() / "out";
    ASSERT_TRUE(adapters::fs::concat_files({dir.path() / "a", dir.path() / "b", dir.path() / "c"}, dst).has_value());
    EXPECT_EQ(read_file(dst), "hello world");
}

TEST(FsTest, ConcatFailureRemovesDestination)
{
    TempDir dir;
    write_file(dir.path() / "a", "hello");
    const auto dst = dir.path() / "out";

    auto res = adapters::fs::concat_files({dir.path() / "a", dir.path() / "missing"}, dst);
    EXPECT_FALSE(res.has_value());
    EXPECT_FALSE(std::filesystem::exists(dst));
}

TEST(FsTest, AppendStrategiesProduceSameBytes)
{
    TempDir dir;
    const auto body = segdl::testing::make_body(3 * 1024 * 1024 + 17);
    write_file(dir.path() / "src", body);

    for (auto strategy : {adapters::fs::AppendStrategy::Buffered,
                          adapters::fs::AppendStrategy::MMap,
                          adapters::fs::AppendStrategy::Uring}) {
        const auto dst = dir.path() / "dst";
        const int fd = ::open(dst.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
        ASSERT_NE(fd, -1);
        auto res = adapters::fs::append_file(dir.path() / "src", fd, strategy);
        ::close(fd);
        ASSERT_TRUE(res.has_value()) << res.error().message;
        EXPECT_EQ(read_file(dst), body);
    }
}

TEST(FsTest, AtomicWriteReplacesContent)
{
    TempDir dir;
    const auto target = dir.path() / "state.resume";
    ASSERT_TRUE(adapters::fs::atomic_write(target, "first").has_value());
    ASSERT_TRUE(adapters::fs::atomic_write(target, "second").has_value());
    EXPECT_EQ(read_file(target), "second");
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "state.resume.tmp"));
}

TEST(FsTest, AtomicWriteIntoMissingDirectoryFails)
{
    TempDir dir;
    auto res = adapters::fs::atomic_write(dir.path() / "nope" / "state.resume", "x");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, infra::ErrorCode::Persistence);
}

TEST(FsTest, FileSizeAndDirectories)
{
    TempDir dir;
    EXPECT_EQ(adapters::fs::file_size(dir.path() / "missing"), -1);
    write_file(dir.path() / "f", "12345");
    EXPECT_EQ(adapters::fs::file_size(dir.path() / "f"), 5);

    ASSERT_TRUE(adapters::fs::ensure_directory(dir.path() / "x" / "y").has_value());
    EXPECT_TRUE(adapters::fs::is_writable_directory(dir.path() / "x" / "y"));
    EXPECT_FALSE(adapters::fs::is_writable_directory(dir.path() / "missing"));

    EXPECT_TRUE(adapters::fs::remove_quietly(dir.path() / "f"));
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "f"));
    EXPECT_TRUE(adapters::fs::remove_quietly(dir.path() / "f"));
}
