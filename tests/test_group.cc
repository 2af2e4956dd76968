/**
 * @file test_group.cc
 * @brief Unit tests for dupe_grouper_t
 */

#include <gtest/gtest.h>

#include <vector>

#include "group.hh"

namespace fs = std::filesystem;
using fsclean::dupe_grouper_t;
using fsclean::fingerprint_t;

namespace {

fingerprint_t fp(const unsigned char tag, const uint64_t size) {
  return fingerprint_t{{tag, 0x42, 0x17}, size};
}

}  // namespace

TEST(GroupTest, EmptyGrouperHasNoGroups) {
  dupe_grouper_t grouper;
  EXPECT_TRUE(grouper.groups().empty());
  EXPECT_EQ(grouper.size(), 0U);
}

TEST(GroupTest, UniqueFingerprintsAreNotGroups) {
  dupe_grouper_t grouper;
  grouper.add("a", fp(1, 10));
  grouper.add("b", fp(2, 10));
  grouper.add("c", fp(1, 11));
  EXPECT_EQ(grouper.size(), 3U);
  EXPECT_TRUE(grouper.groups().empty());
}

TEST(GroupTest, ZeroSizeRecordsAreIgnored) {
  dupe_grouper_t grouper;
  EXPECT_FALSE(grouper.add("e1", fp(0, 0)));
  EXPECT_FALSE(grouper.add("e2", fp(0, 0)));
  EXPECT_FALSE(grouper.add("e3", fp(0, 0)));
  EXPECT_EQ(grouper.size(), 0U);
  EXPECT_TRUE(grouper.groups().empty());
}

TEST(GroupTest, GroupsKeepInsertionOrder) {
  dupe_grouper_t grouper;
  grouper.add("z/late", fp(9, 5));
  grouper.add("x", fp(1, 5));
  grouper.add("sub/y", fp(1, 5));
  grouper.add("unique", fp(3, 5));
  grouper.add("a", fp(9, 5));
  grouper.add("w", fp(1, 5));

  const auto groups = grouper.groups();
  ASSERT_EQ(groups.size(), 2U);
  // ordered by first insertion
  EXPECT_EQ(groups[0].fp, fp(9, 5));
  EXPECT_EQ(groups[0].paths, (std::vector<fs::path>{"z/late", "a"}));
  EXPECT_EQ(groups[1].fp, fp(1, 5));
  EXPECT_EQ(groups[1].paths, (std::vector<fs::path>{"x", "sub/y", "w"}));
}
