/**
 * @file test_dedupe.cc
 * @brief Tests of the duplicate pipeline on real trees
 *
 * scan_dupes(): grouping, recursion, zero-byte exclusion, head pre-filter.
 * remove_duplicates(): the report scenario, idempotence, conservation of
 * freed bytes and dry-run non-mutation.
 */

#include <gtest/gtest.h>

#include <chrono>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "config.hh"
#include "dedupe.hh"
#include "tmp_tree.hh"

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using fsclean::change_ledger_t;
using fsclean::dedupe_opts_t;
using fsclean::logger_t;
using fsclean::remove_duplicates;
using fsclean::scan_dupes;
using fsclean::test::tmp_tree_t;

class DedupeTest : public ::testing::Test {
 protected:
  tmp_tree_t tree;
  std::ostringstream out;
  logger_t log{out, fsclean::level_t::debug};
  change_ledger_t ledger;
  dedupe_opts_t opts;

  std::vector<std::vector<fs::path>> scan() {
    std::vector<std::vector<fs::path>> result;
    for (auto &group : scan_dupes(tree.root(), opts, log)) {
      std::vector<fs::path> rel;
      for (const auto &path : group.paths) {
        rel.push_back(fs::relative(path, tree.root()));
      }
      result.push_back(std::move(rel));
    }
    return result;
  }

  // mixed tree with groups in several directories
  void populate() {
    tree.write("a.txt", "alpha");
    tree.write("a copy.txt", "alpha");
    tree.write("b.txt", "bravo");
    tree.write("sub/a-again.txt", "alpha");
    tree.write("sub/c.dat", "charlie");
    tree.write("sub/deeper/charlie.dat", "charlie");
    tree.write("sub/deeper/c2.dat", "charlie");
    tree.write("empty1", "");
    tree.write("sub/empty2", "");
  }
};

TEST_F(DedupeTest, FindsIdenticalFilesInRoot) {
  tree.write("one.txt", "same");
  tree.write("two.txt", "same");
  tree.write("three.txt", "diff");
  const std::vector<std::vector<fs::path>> expected{{"one.txt", "two.txt"}};
  EXPECT_EQ(scan(), expected);
}

TEST_F(DedupeTest, NonRecursiveIgnoresSubdirectories) {
  tree.write("one.txt", "same");
  tree.write("sub/two.txt", "same");
  EXPECT_TRUE(scan().empty());
}

TEST_F(DedupeTest, RecursiveFindsCrossDirectoryDuplicates) {
  populate();
  opts.recursive = true;
  const std::vector<std::vector<fs::path>> expected{
      {"a copy.txt", "a.txt", "sub/a-again.txt"},
      {"sub/c.dat", "sub/deeper/c2.dat", "sub/deeper/charlie.dat"}};
  EXPECT_EQ(scan(), expected);
}

TEST_F(DedupeTest, ZeroByteFilesAreNeverDuplicates) {
  for (int i = 0; i < 5; ++i) {
    tree.write("empty" + std::to_string(i), "");
  }
  opts.recursive = true;
  EXPECT_TRUE(scan().empty());
  EXPECT_EQ(remove_duplicates(tree.root(), opts, ledger, log), 0U);
  EXPECT_EQ(ledger.size(), 0U);
}

TEST_F(DedupeTest, SameSizeDifferentContentIsNotGrouped) {
  tree.write("x", "abcd");
  tree.write("y", "abce");
  EXPECT_TRUE(scan().empty());
}

TEST_F(DedupeTest, LargeFilesDifferingOnlyAfterHeadBlock) {
  std::string content(fsclean::head_blk_sz * 3, 'q');
  tree.write("big1", content);
  tree.write("big2", content);
  content.back() = 'z';
  tree.write("big3", content);
  const std::vector<std::vector<fs::path>> expected{{"big1", "big2"}};
  EXPECT_EQ(scan(), expected);
}

TEST_F(DedupeTest, ResultDoesNotDependOnThreadCount) {
  populate();
  opts.recursive = true;
  opts.max_thread = 1;
  const auto single = scan();
  opts.max_thread = 8;
  EXPECT_EQ(scan(), single);
}

TEST_F(DedupeTest, ThrowsWhenRootIsNotADirectory) {
  EXPECT_THROW(scan_dupes(tree / "missing", opts, log), std::invalid_argument);
}

TEST_F(DedupeTest, ReportScenario) {
  const std::string content(100, 'r');
  tree.write("report.txt", content);
  tree.write("report_final.txt", content);
  tree.write("report (copy).txt", content);
  tree.touch("report.txt", -24h);

  EXPECT_EQ(remove_duplicates(tree.root(), opts, ledger, log), 200U);
  EXPECT_TRUE(tree.exists("report.txt"));
  EXPECT_FALSE(tree.exists("report_final.txt"));
  EXPECT_FALSE(tree.exists("report (copy).txt"));

  ASSERT_EQ(ledger.size(), 2U);
  for (const auto &change : ledger.changes()) {
    EXPECT_TRUE(change.executed);
    EXPECT_EQ(change.operation, "duplicates");
    EXPECT_EQ(change.original, tree / "report.txt");
    EXPECT_NE(change.path, tree / "report.txt");
  }
  EXPECT_NE(out.str().find("2 duplicates found"), std::string::npos);
}

TEST_F(DedupeTest, SecondRunRemovesNothing) {
  populate();
  opts.recursive = true;
  EXPECT_GT(remove_duplicates(tree.root(), opts, ledger, log), 0U);
  const auto first = ledger.size();
  EXPECT_EQ(first, 4U);

  EXPECT_EQ(remove_duplicates(tree.root(), opts, ledger, log), 0U);
  EXPECT_EQ(ledger.size(), first);
  EXPECT_TRUE(scan().empty());
}

TEST_F(DedupeTest, FreedBytesEqualRemovedFileSizes) {
  populate();
  tree.write("sub/deeper/big.bin", std::string(10000, 'b'));
  tree.write("big-copy.bin", std::string(10000, 'b'));
  opts.recursive = true;

  std::map<fs::path, uintmax_t> sizes;
  for (const auto &entry : fs::recursive_directory_iterator(tree.root())) {
    if (entry.is_regular_file()) {
      sizes[entry.path()] = entry.file_size();
    }
  }

  const auto freed = remove_duplicates(tree.root(), opts, ledger, log);
  uint64_t expected = 0;
  for (const auto &change : ledger.changes()) {
    ASSERT_TRUE(change.executed);
    expected += sizes.at(change.path);
  }
  EXPECT_EQ(freed, expected);
  EXPECT_EQ(freed, 10000U + 2 * 5U + 2 * 7U);
}

TEST_F(DedupeTest, DryRunLeavesTreeUntouched) {
  populate();
  opts.recursive = true;
  const auto before = tree.snapshot();

  opts.dry_run = true;
  EXPECT_EQ(remove_duplicates(tree.root(), opts, ledger, log), 0U);
  EXPECT_EQ(tree.snapshot(), before);
  EXPECT_EQ(ledger.executed_count(), 0U);

  change_ledger_t applied;
  opts.dry_run = false;
  remove_duplicates(tree.root(), opts, applied, log);

  ASSERT_EQ(ledger.size(), applied.size());
  for (std::size_t i = 0; i < ledger.size(); ++i) {
    EXPECT_EQ(ledger.changes()[i].path, applied.changes()[i].path);
    EXPECT_EQ(ledger.changes()[i].original, applied.changes()[i].original);
    EXPECT_TRUE(applied.changes()[i].executed);
  }
}
