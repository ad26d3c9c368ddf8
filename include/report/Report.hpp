#pragma once
#include "engine/Engine.hpp"
#include "history/RunHistory.hpp"
#include "llvm/ADT/StringRef.h"
#include <optional>
#include <string>

namespace aicw {

struct ReportContext {
  std::string repoPath;        // shown as given; callers pass the resolved root
  int         timeWindowDays = 90;
  std::string currency = "USD";
  std::string generatedAt;     // empty means "now"
  std::optional<HistoryContext> history;  // set when the run was recorded
};

// "2026-10-18 09:30:00Z"
std::string currentUtcTimestamp();

// "USD 1,234.50"
std::string formatCurrency(double value, llvm::StringRef currency);

std::string buildMarkdownReport(const AnalysisResult& result, const ReportContext& ctx);
std::string buildJsonReport(const AnalysisResult& result, const ReportContext& ctx);

} // namespace aicw
