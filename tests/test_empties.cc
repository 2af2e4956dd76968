/**
 * @file test_empties.cc
 * @brief Tests of the empty file and directory pass
 */

#include <gtest/gtest.h>

#include <sstream>

#include "empties.hh"
#include "tmp_tree.hh"

namespace fs = std::filesystem;
using fsclean::change_ledger_t;
using fsclean::logger_t;
using fsclean::remove_empty;
using fsclean::test::tmp_tree_t;

class EmptiesTest : public ::testing::Test {
 protected:
  tmp_tree_t tree;
  std::ostringstream out;
  logger_t log{out};
  change_ledger_t ledger;

  void populate() {
    tree.write("empty.txt", "");
    tree.write("full.txt", "data");
    tree.mkdir("hollow");
    tree.write("sub/nested_empty", "");
    tree.write("sub/keep", "k");
    tree.mkdir("sub/inner_hollow");
  }
};

TEST_F(EmptiesTest, NonRecursiveCleansRootLevelOnly) {
  populate();
  remove_empty(tree.root(), false, false, ledger, log);

  EXPECT_FALSE(tree.exists("empty.txt"));
  EXPECT_FALSE(tree.exists("hollow"));
  EXPECT_TRUE(tree.exists("full.txt"));
  EXPECT_TRUE(tree.exists("sub/nested_empty"));
  EXPECT_TRUE(tree.exists("sub/inner_hollow"));

  ASSERT_EQ(ledger.size(), 2U);
  EXPECT_EQ(ledger.changes()[0].path, tree / "empty.txt");
  EXPECT_EQ(ledger.changes()[1].path, tree / "hollow");
  for (const auto &change : ledger.changes()) {
    EXPECT_EQ(change.operation, "empties");
    EXPECT_TRUE(change.executed);
  }
}

TEST_F(EmptiesTest, RecursiveCleansNestedLevels) {
  populate();
  remove_empty(tree.root(), true, false, ledger, log);

  EXPECT_FALSE(tree.exists("sub/nested_empty"));
  EXPECT_FALSE(tree.exists("sub/inner_hollow"));
  EXPECT_TRUE(tree.exists("sub/keep"));
  EXPECT_EQ(ledger.size(), 4U);
  EXPECT_EQ(ledger.executed_count(), 4U);
  // removed directories are not reported as traversal errors
  EXPECT_EQ(out.str().find("[warn]"), std::string::npos);
}

TEST_F(EmptiesTest, DryRunRecordsWithoutRemoving) {
  populate();
  const auto before = tree.snapshot();
  remove_empty(tree.root(), true, true, ledger, log);

  EXPECT_EQ(tree.snapshot(), before);
  EXPECT_EQ(ledger.size(), 4U);
  EXPECT_EQ(ledger.executed_count(), 0U);
}

TEST_F(EmptiesTest, NothingToDoOnCleanTree) {
  tree.write("a", "1");
  tree.write("sub/b", "2");
  remove_empty(tree.root(), true, false, ledger, log);
  EXPECT_EQ(ledger.size(), 0U);
}
