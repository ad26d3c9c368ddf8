#pragma once
#include "model/Entity.hpp"
#include "model/Evidence.hpp"
#include "model/Finding.hpp"
#include <string>
#include <vector>

namespace aicw {

struct AnalyzeOptions {
  std::string repoPath = ".";
  std::string runtimePath;             // optional runtime evidence JSON
  int    timeWindowDays = 90;          // window the runtime counts cover
  double costPerInvocation = 0.0;      // 0 disables cost estimates
  double aiThreshold = 0.65;
  double dupThreshold = 0.9;
  double dupMediumThreshold = 0.75;
  bool   reportMediumDuplicates = false;
  int    minDupBodyStatements = 3;
  bool   includeTests = false;
  bool   gitProvenance = true;
  bool   verbose = false;
  std::vector<std::string> extraArgs;  // extra compiler args for C/C++ parsing
};

struct Summary {
  unsigned functionsScanned = 0;
  unsigned probableAiFunctions = 0;
  unsigned highConfidenceAiFunctions = 0;
  unsigned highConfidenceDuplicationPairs = 0;
  unsigned runtimeZeroInvocations = 0;
  unsigned runtimeUnknown = 0;
  unsigned probableAiZeroInvocations = 0;
  unsigned gitEvidenceAvailable = 0;
  double   estimatedAnnualizedAvoidableRuntimeCost = 0.0;
};

struct AnalysisResult {
  std::vector<Entity>           entities;
  std::vector<ProvenanceSignal> aiSignals;
  GitEvidenceMap                gitEvidence;
  std::vector<DuplicationPair>  duplicationPairs;
  RuntimeEvidenceMap            runtimeEvidence;
  std::vector<Finding>          findings;
  Summary                       summary;
};

// Rejects out-of-range thresholds and a missing repository root.
bool validateOptions(const AnalyzeOptions& opts, std::string* error);

// Scan, score, pair, and correlate. Fails only on caller-input errors;
// files and tools that misbehave simply contribute nothing.
bool analyzeRepository(const AnalyzeOptions& opts, AnalysisResult& out, std::string* error);

// Derives findings and the summary from the other fields of `result`.
void correlateFindings(AnalysisResult& result, const AnalyzeOptions& opts);

// "0.75", "12", "0.983"
std::string formatNumber(double value);

} // namespace aicw
