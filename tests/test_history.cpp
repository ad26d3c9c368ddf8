#include <gtest/gtest.h>
#include "history/RunHistory.hpp"
#include "TestSupport.hpp"

#include "llvm/Support/FileSystem.h"

using namespace aicw;
using aicw::test::TempRepo;

namespace {

class RunHistoryTest : public ::testing::Test {
protected:
  TempRepo dir;
  std::string dbPath;
  std::string repoPath;
  AnalyzeOptions opts;

  void SetUp() override {
    dbPath = dir.root() + "/state/history.db";
    repoPath = dir.root() + "/repo";
    dir.write("repo/.keep", "");
  }

  static AnalysisResult run(unsigned functions, unsigned ai, unsigned pairs,
                            unsigned zero, unsigned aiZero, double cost) {
    AnalysisResult r;
    r.summary.functionsScanned = functions;
    r.summary.probableAiFunctions = ai;
    r.summary.highConfidenceDuplicationPairs = pairs;
    r.summary.runtimeZeroInvocations = zero;
    r.summary.probableAiZeroInvocations = aiZero;
    r.summary.estimatedAnnualizedAvoidableRuntimeCost = cost;
    Finding f;
    f.type = "x";
    f.title = "a";
    r.findings.push_back(f);
    return r;
  }
};

} // namespace

TEST_F(RunHistoryTest, RecordRunAndTrendDelta) {
  HistoryContext first, second;
  std::string error;
  ASSERT_TRUE(recordRun(dbPath, repoPath, "2026-10-11 09:30:00Z",
                        run(10, 3, 2, 1, 1, 12.5), opts, first, &error)) << error;
  EXPECT_TRUE(llvm::sys::fs::exists(dbPath));
  EXPECT_GT(first.runId, 0);
  EXPECT_FALSE(first.previousRunId.has_value());
  EXPECT_FALSE(first.trend.has_value());

  ASSERT_TRUE(recordRun(dbPath, repoPath, "2026-10-18 09:30:00Z",
                        run(12, 2, 1, 0, 0, 7.0), opts, second, &error)) << error;
  EXPECT_GT(second.runId, first.runId);
  EXPECT_EQ(second.scannedAt, "2026-10-18 09:30:00Z");
  EXPECT_EQ(second.previousRunId, std::optional<int64_t>(first.runId));
  EXPECT_EQ(second.previousScannedAt, std::optional<std::string>("2026-10-11 09:30:00Z"));
  ASSERT_TRUE(second.trend.has_value());
  EXPECT_EQ(second.trend->functionsScanned, 2);
  EXPECT_EQ(second.trend->probableAiFunctions, -1);
  EXPECT_EQ(second.trend->highConfidenceDuplicationPairs, -1);
  EXPECT_EQ(second.trend->runtimeZeroInvocations, -1);
  EXPECT_EQ(second.trend->probableAiZeroInvocations, -1);
  EXPECT_DOUBLE_EQ(second.trend->estimatedAnnualizedAvoidableRuntimeCost, -5.5);
}

TEST_F(RunHistoryTest, RunsAreComparedPerRepository) {
  dir.write("other/.keep", "");
  HistoryContext a, b, c;
  std::string error;
  ASSERT_TRUE(recordRun(dbPath, repoPath, "t1", run(1, 0, 0, 0, 0, 0), opts, a, &error)) << error;
  ASSERT_TRUE(recordRun(dbPath, dir.root() + "/other", "t2", run(5, 0, 0, 0, 0, 0), opts, b, &error))
    << error;
  EXPECT_FALSE(b.trend.has_value());

  // same repository through a non-canonical spelling
  ASSERT_TRUE(recordRun(dbPath, repoPath + "/./", "t3", run(4, 0, 0, 0, 0, 0), opts, c, &error))
    << error;
  EXPECT_EQ(c.previousRunId, std::optional<int64_t>(a.runId));
  ASSERT_TRUE(c.trend.has_value());
  EXPECT_EQ(c.trend->functionsScanned, 3);
}

TEST_F(RunHistoryTest, RepoKeyIsResolvedAndLowercased) {
  std::string key = historyRepoKey(repoPath);
  EXPECT_EQ(key, llvm::StringRef(key).lower());
  EXPECT_EQ(historyRepoKey(repoPath + "/../repo"), key);
}

TEST_F(RunHistoryTest, UnopenableDatabaseIsAnError) {
  HistoryContext ctx;
  std::string error;
  // a directory where the database file should be
  dir.write("taken/history.db/.keep", "");
  EXPECT_FALSE(recordRun(dir.root() + "/taken/history.db", repoPath, "t",
                         run(1, 0, 0, 0, 0, 0), opts, ctx, &error));
  EXPECT_NE(error.find("History database"), std::string::npos);
}
