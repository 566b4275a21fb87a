#include <gtest/gtest.h>

#include <git_info.hpp>

TEST(BuildInfoTest, GitMetadataAvailable)
{
    EXPECT_FALSE(segdl::build_info::git_commit.empty());
    EXPECT_FALSE(segdl::build_info::git_commit_short.empty());
    EXPECT_FALSE(segdl::build_info::build_timestamp.empty());
}

TEST(BuildInfoTest, GetGitInfoMatchesConstants)
{
    constexpr auto info = segdl::build_info::get_git_info();
    EXPECT_EQ(info.commit, segdl::build_info::git_commit);
    EXPECT_EQ(info.commit_short, segdl::build_info::git_commit_short);
    EXPECT_EQ(info.dirty, segdl::build_info::git_dirty);
}
