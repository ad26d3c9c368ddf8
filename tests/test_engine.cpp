#include <gtest/gtest.h>
#include "engine/Engine.hpp"
#include "TestSupport.hpp"

#include <algorithm>

using namespace aicw;
using aicw::test::TempRepo;
using aicw::test::findByName;

namespace {

class EngineTest : public ::testing::Test {
protected:
  TempRepo repo;
  AnalyzeOptions opts;

  void SetUp() override {
    opts.repoPath = repo.root();
    opts.gitProvenance = false;
  }

  AnalysisResult analyze() {
    AnalysisResult result;
    std::string error;
    EXPECT_TRUE(analyzeRepository(opts, result, &error)) << error;
    return result;
  }
};

const Finding* findingOfType(const AnalysisResult& r, llvm::StringRef type) {
  for (const auto& f : r.findings)
    if (f.type == type) return &f;
  return nullptr;
}

} // namespace

TEST_F(EngineTest, RejectsInvalidOptions) {
  std::string error;
  AnalyzeOptions bad = opts;
  bad.aiThreshold = 1.5;
  EXPECT_FALSE(validateOptions(bad, &error));
  EXPECT_NE(error.find("--ai-threshold"), std::string::npos);

  bad = opts;
  bad.dupThreshold = -0.1;
  EXPECT_FALSE(validateOptions(bad, &error));

  bad = opts;
  bad.dupMediumThreshold = 0.95;
  EXPECT_TRUE(validateOptions(bad, &error)) << error;
  bad.reportMediumDuplicates = true;
  EXPECT_FALSE(validateOptions(bad, &error));
  EXPECT_NE(error.find("--dup-medium-threshold"), std::string::npos);

  bad = opts;
  bad.minDupBodyStatements = -1;
  EXPECT_FALSE(validateOptions(bad, &error));

  bad = opts;
  bad.timeWindowDays = 0;
  EXPECT_FALSE(validateOptions(bad, &error));

  bad = opts;
  bad.costPerInvocation = -1;
  EXPECT_FALSE(validateOptions(bad, &error));

  bad = opts;
  bad.repoPath = repo.root() + "/missing";
  EXPECT_FALSE(validateOptions(bad, &error));
  EXPECT_NE(error.find("missing"), std::string::npos);

  AnalysisResult result;
  EXPECT_FALSE(analyzeRepository(bad, result, &error));
}

TEST_F(EngineTest, BadRuntimeFileFailsTheRun) {
  repo.write("a.js", test::SampleLogicJs);
  opts.runtimePath = repo.write("runtime.json", "{not json");
  AnalysisResult result;
  std::string error;
  EXPECT_FALSE(analyzeRepository(opts, result, &error));
  EXPECT_NE(error.find("runtime"), std::string::npos);
}

TEST_F(EngineTest, ScriptFixtureEndToEnd) {
  repo.write("sample_logic.js", test::SampleLogicJs);
  opts.runtimePath = repo.write("runtime.json", test::SampleRuntimeJson);
  opts.costPerInvocation = 0.0005;

  AnalysisResult r = analyze();
  const Summary& s = r.summary;
  EXPECT_EQ(s.functionsScanned, 3u);
  EXPECT_EQ(s.probableAiFunctions, 2u);
  EXPECT_EQ(s.highConfidenceAiFunctions, 0u);
  EXPECT_EQ(s.highConfidenceDuplicationPairs, 1u);
  EXPECT_EQ(s.runtimeZeroInvocations, 1u);
  EXPECT_EQ(s.runtimeUnknown, 0u);
  EXPECT_EQ(s.probableAiZeroInvocations, 0u);
  EXPECT_EQ(s.gitEvidenceAvailable, 0u);
  EXPECT_DOUBLE_EQ(s.estimatedAnnualizedAvoidableRuntimeCost, 1.62);
  EXPECT_TRUE(r.gitEvidence.empty());

  ASSERT_EQ(r.findings.size(), 1u);
  const Finding& f = r.findings[0];
  EXPECT_EQ(f.type, "consolidation_candidate_review");
  EXPECT_EQ(f.severity, Severity::Medium);
  ASSERT_EQ(f.entityIds.size(), 2u);
  EXPECT_EQ(f.entityIds[0], findByName(r.entities, "validateOrderPayload")->id);
  std::vector<std::string> evidence{"semantic_overlap=0.974", "invocations_a=1200",
                                    "invocations_b=800"};
  EXPECT_EQ(f.evidence, evidence);
  EXPECT_EQ(f.estimatedAnnualCost, std::optional<double>(1.62));
}

TEST_F(EngineTest, NativeFixtureEndToEnd) {
  repo.write("service.cpp", test::OrderServiceCpp);
  opts.runtimePath = repo.write("runtime.json", test::OrderRuntimeJson);

  AnalysisResult r = analyze();
  EXPECT_EQ(r.summary.functionsScanned, 4u);
  EXPECT_EQ(r.summary.probableAiFunctions, 2u);
  EXPECT_EQ(r.summary.highConfidenceDuplicationPairs, 1u);
  EXPECT_EQ(r.summary.runtimeZeroInvocations, 1u);
  EXPECT_EQ(r.summary.runtimeUnknown, 1u);
  // cost estimates are off without a cost per invocation
  EXPECT_DOUBLE_EQ(r.summary.estimatedAnnualizedAvoidableRuntimeCost, 0.0);

  const Finding* consolidation = findingOfType(r, "consolidation_candidate_review");
  ASSERT_NE(consolidation, nullptr);
  EXPECT_FALSE(consolidation->estimatedAnnualCost.has_value());

  for (const auto& sig : r.aiSignals) {
    EXPECT_DOUBLE_EQ(sig.probability, 0.75);
    EXPECT_EQ(sig.signals.front(), "uniform guard clauses");
  }
}

TEST_F(EngineTest, ZeroInvocationProbableAiIsReported) {
  repo.write("sample_logic.js", test::SampleLogicJs);
  opts.runtimePath = repo.write("runtime.json",
    R"({"validateOrderPayload": 40, "validateOrderRequest": 0, "helper": 3})");

  AnalysisResult r = analyze();
  EXPECT_EQ(r.summary.runtimeZeroInvocations, 1u);
  EXPECT_EQ(r.summary.probableAiZeroInvocations, 1u);

  const Finding* unused = findingOfType(r, "runtime_unused_review");
  ASSERT_NE(unused, nullptr);
  EXPECT_EQ(unused->severity, Severity::Low);
  EXPECT_EQ(unused->entityIds.front(), findByName(r.entities, "validateOrderRequest")->id);
  std::vector<std::string> evidence{"ai_probability=0.75", "runtime_invocations=0",
                                    "confidence=medium"};
  EXPECT_EQ(unused->evidence, evidence);
  // the pair is not active on both sides
  EXPECT_EQ(findingOfType(r, "consolidation_candidate_review"), nullptr);
  EXPECT_EQ(findingOfType(r, "delete_candidate_review"), nullptr);
}

TEST_F(EngineTest, DeleteCandidateNeedsHighConfidenceDuplicate) {
  AnalysisResult r;
  Entity a, b;
  a.id = "aaaaaaaaaaaa";
  b.id = "bbbbbbbbbbbb";
  r.entities = {a, b};
  r.aiSignals = {{a.id, 0.85, Confidence::High, {"uniform guard clauses"}}};
  r.duplicationPairs = {{a.id, b.id, 0.95, Confidence::High}};
  r.runtimeEvidence[a.id] = {a.id, int64_t(0), std::nullopt, "runtime-file"};
  r.runtimeEvidence[b.id] = {b.id, int64_t(12), std::nullopt, "runtime-file"};

  correlateFindings(r, opts);
  ASSERT_EQ(r.findings.size(), 2u);
  EXPECT_EQ(r.findings[0].type, "runtime_unused_review");
  EXPECT_EQ(r.findings[1].type, "delete_candidate_review");
  std::vector<std::string> evidence{"ai_probability=0.85", "runtime_invocations=0",
                                    "high_semantic_overlap=true"};
  EXPECT_EQ(r.findings[1].evidence, evidence);
  EXPECT_EQ(r.summary.highConfidenceAiFunctions, 1u);
  EXPECT_EQ(r.summary.probableAiZeroInvocations, 1u);
}

TEST_F(EngineTest, TestDirectoriesNeedOptIn) {
  repo.write("src/app.js", "function main() {\n  return 0;\n}\n");
  repo.write("tests/app.test.js", "function checkMain() {\n  return 1;\n}\n");

  EXPECT_EQ(analyze().summary.functionsScanned, 1u);
  opts.includeTests = true;
  EXPECT_EQ(analyze().summary.functionsScanned, 2u);
}

TEST_F(EngineTest, RepeatedRunsAgree) {
  repo.write("b/sample_logic.js", test::SampleLogicJs);
  repo.write("a/service.cpp", test::OrderServiceCpp);

  AnalysisResult first = analyze();
  AnalysisResult second = analyze();
  ASSERT_EQ(first.entities.size(), second.entities.size());
  for (size_t i = 0; i < first.entities.size(); ++i)
    EXPECT_EQ(first.entities[i].id, second.entities[i].id);
  ASSERT_EQ(first.duplicationPairs.size(), second.duplicationPairs.size());
  for (size_t i = 0; i < first.duplicationPairs.size(); ++i) {
    EXPECT_EQ(first.duplicationPairs[i].entityA, second.duplicationPairs[i].entityA);
    EXPECT_DOUBLE_EQ(first.duplicationPairs[i].overlap, second.duplicationPairs[i].overlap);
  }
  EXPECT_TRUE(std::is_sorted(first.entities.begin(), first.entities.end(),
                             [](const Entity& x, const Entity& y) { return x.filePath < y.filePath; }));
}

TEST_F(EngineTest, EmptyRepository) {
  AnalysisResult r = analyze();
  EXPECT_EQ(r.summary.functionsScanned, 0u);
  EXPECT_TRUE(r.findings.empty());
  EXPECT_TRUE(r.runtimeEvidence.empty());
}

TEST(FormatNumberTest, ShortestForm) {
  EXPECT_EQ(formatNumber(0.75), "0.75");
  EXPECT_EQ(formatNumber(0.974), "0.974");
  EXPECT_EQ(formatNumber(1.0), "1");
}
