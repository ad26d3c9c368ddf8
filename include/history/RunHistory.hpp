#pragma once
#include "engine/Engine.hpp"
#include "llvm/ADT/StringRef.h"
#include <cstdint>
#include <optional>
#include <string>

namespace aicw {

// Change of each summary counter since the previous run of the same repository.
struct TrendDelta {
  int64_t functionsScanned = 0;
  int64_t probableAiFunctions = 0;
  int64_t highConfidenceDuplicationPairs = 0;
  int64_t runtimeZeroInvocations = 0;
  int64_t probableAiZeroInvocations = 0;
  double  estimatedAnnualizedAvoidableRuntimeCost = 0.0;  // rounded to cents
};

struct HistoryContext {
  int64_t     runId = 0;
  std::string scannedAt;
  std::optional<int64_t>     previousRunId;
  std::optional<std::string> previousScannedAt;
  std::optional<TrendDelta>  trend;            // set when a previous run exists
};

// Resolved, lowercased repository path. Runs sharing a key are compared.
std::string historyRepoKey(llvm::StringRef repoPath);

// Appends one run (summary counters, the thresholds it ran with, and the
// number of findings per type) to the SQLite database at `dbPath`, creating
// the file and schema on first use, then diffs it against the previous run
// of the same repository. Nothing is written when this returns false.
bool recordRun(const std::string& dbPath, llvm::StringRef repoPath,
               llvm::StringRef scannedAt, const AnalysisResult& result,
               const AnalyzeOptions& opts, HistoryContext& out, std::string* error);

} // namespace aicw
