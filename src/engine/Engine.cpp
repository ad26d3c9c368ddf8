#include "engine/Engine.hpp"
#include "analysis/Duplication.hpp"
#include "analysis/Provenance.hpp"
#include "git/GitEvidence.hpp"
#include "runtime/RuntimeEvidence.hpp"
#include "scanner/Scanner.hpp"

#include "llvm/ADT/Twine.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Format.h"
#include "llvm/Support/WithColor.h"
#include "llvm/Support/raw_ostream.h"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <map>
#include <set>

namespace fs = std::filesystem;
namespace aicw {

static bool inUnitRange(double v) { return v >= 0.0 && v <= 1.0; }

std::string formatNumber(double value) {
  std::string out;
  llvm::raw_string_ostream os(out);
  os << llvm::format("%g", value);
  return os.str();
}

bool validateOptions(const AnalyzeOptions& opts, std::string* error) {
  auto fail = [&](const llvm::Twine& msg) {
    if (error) *error = msg.str();
    return false;
  };
  if (!inUnitRange(opts.aiThreshold))
    return fail("--ai-threshold must be within [0, 1], got " + formatNumber(opts.aiThreshold));
  if (!inUnitRange(opts.dupThreshold))
    return fail("--dup-threshold must be within [0, 1], got " + formatNumber(opts.dupThreshold));
  if (opts.reportMediumDuplicates) {
    if (!inUnitRange(opts.dupMediumThreshold))
      return fail("--dup-medium-threshold must be within [0, 1], got " +
                  formatNumber(opts.dupMediumThreshold));
    if (opts.dupMediumThreshold > opts.dupThreshold)
      return fail("--dup-medium-threshold must not exceed --dup-threshold");
  }
  if (opts.minDupBodyStatements < 0)
    return fail("--min-dup-body-statements must be >= 0");
  if (opts.timeWindowDays < 1)
    return fail("--time-window-days must be >= 1");
  if (opts.costPerInvocation < 0.0 || !std::isfinite(opts.costPerInvocation))
    return fail("--cost-per-invocation must be a non-negative number");
  if (!llvm::sys::fs::is_directory(opts.repoPath))
    return fail("Repository path does not exist or is not a directory: " + opts.repoPath);
  return true;
}

bool analyzeRepository(const AnalyzeOptions& opts, AnalysisResult& out, std::string* error) {
  if (!validateOptions(opts, error)) return false;

  RuntimeIndex runtimeIndex;
  if (!loadRuntimeIndex(opts.runtimePath, runtimeIndex, error)) return false;

  std::error_code ec;
  fs::path root = fs::weakly_canonical(fs::absolute(opts.repoPath, ec), ec);
  const std::string rootStr = ec ? opts.repoPath : root.string();

  ScanOptions scan;
  scan.includeTests = opts.includeTests;
  scan.verbose = opts.verbose;
  scan.extraArgs = opts.extraArgs;

  out = AnalysisResult{};
  out.entities = scanRepository(rootStr, scan);
  if (opts.verbose)
    llvm::WithColor::note() << "scanned " << out.entities.size() << " function(s)\n";

  if (opts.gitProvenance) {
    out.gitEvidence = collectGitEvidence(rootStr, out.entities);
    if (opts.verbose && out.gitEvidence.empty())
      llvm::WithColor::note() << "no git evidence for " << rootStr << "\n";
  }
  out.aiSignals = detectProvenanceSignals(out.entities, opts.aiThreshold,
                                          opts.gitProvenance ? &out.gitEvidence : nullptr);

  DuplicationOptions dup;
  dup.highThreshold = opts.dupThreshold;
  dup.mediumThreshold = opts.dupMediumThreshold;
  dup.includeMedium = opts.reportMediumDuplicates;
  dup.minBodyStatements = (unsigned)opts.minDupBodyStatements;
  out.duplicationPairs = detectDuplicationPairs(out.entities, dup);

  out.runtimeEvidence = mapRuntimeEvidence(out.entities, runtimeIndex);
  correlateFindings(out, opts);
  return true;
}

void correlateFindings(AnalysisResult& result, const AnalyzeOptions& opts) {
  std::map<std::string, const ProvenanceSignal*> signalById;
  for (const auto& s : result.aiSignals) signalById[s.entityId] = &s;

  std::set<std::string> duplicateMembers;
  for (const auto& p : result.duplicationPairs) {
    duplicateMembers.insert(p.entityA);
    duplicateMembers.insert(p.entityB);
  }

  auto runtimeOf = [&](const std::string& id) -> std::optional<int64_t> {
    auto it = result.runtimeEvidence.find(id);
    if (it == result.runtimeEvidence.end()) return std::nullopt;
    return it->second.invocationCount;
  };

  Summary summary;
  std::vector<Finding> findings;

  for (const auto& e : result.entities) {
    auto invocations = runtimeOf(e.id);
    auto sig = signalById.find(e.id);
    const ProvenanceSignal* signal = sig == signalById.end() ? nullptr : sig->second;

    if (invocations && *invocations == 0) {
      ++summary.runtimeZeroInvocations;
      if (signal) {
        ++summary.probableAiZeroInvocations;
        Finding f;
        f.type = "runtime_unused_review";
        f.severity = Severity::Low;
        f.title = "Probable AI-generated function with zero runtime usage";
        f.entityIds = {e.id};
        f.evidence = {"ai_probability=" + formatNumber(signal->probability),
                      "runtime_invocations=0",
                      std::string("confidence=") + confidenceName(signal->confidence)};
        findings.push_back(std::move(f));
      }
    }
    if (!invocations) ++summary.runtimeUnknown;

    if (signal && signal->confidence == Confidence::High && invocations && *invocations == 0 &&
        duplicateMembers.count(e.id)) {
      Finding f;
      f.type = "delete_candidate_review";
      f.severity = Severity::Low;
      f.title = "High-confidence delete candidate (human review required)";
      f.entityIds = {e.id};
      f.evidence = {"ai_probability=" + formatNumber(signal->probability),
                    "runtime_invocations=0",
                    "high_semantic_overlap=true"};
      findings.push_back(std::move(f));
    }
  }

  double annualized = 0.0;
  for (const auto& p : result.duplicationPairs) {
    auto a = runtimeOf(p.entityA), b = runtimeOf(p.entityB);
    if (!a || !b || *a <= 0 || *b <= 0) continue;

    Finding f;
    f.type = "consolidation_candidate_review";
    f.severity = Severity::Medium;
    f.title = "High-overlap active duplicate logic (human review required)";
    f.entityIds = {p.entityA, p.entityB};
    f.evidence = {"semantic_overlap=" + formatNumber(p.overlap),
                  "invocations_a=" + std::to_string(*a),
                  "invocations_b=" + std::to_string(*b)};
    if (opts.costPerInvocation > 0) {
      double factor = 365.0 / std::max(opts.timeWindowDays, 1);
      double cost = std::round((double)std::min(*a, *b) * opts.costPerInvocation * factor * 100.0) / 100.0;
      f.estimatedAnnualCost = cost;
      annualized += cost;
    }
    findings.push_back(std::move(f));
  }

  summary.functionsScanned = (unsigned)result.entities.size();
  summary.probableAiFunctions = (unsigned)result.aiSignals.size();
  summary.highConfidenceAiFunctions = (unsigned)std::count_if(
    result.aiSignals.begin(), result.aiSignals.end(),
    [](const ProvenanceSignal& s) { return s.confidence == Confidence::High; });
  summary.highConfidenceDuplicationPairs = (unsigned)std::count_if(
    result.duplicationPairs.begin(), result.duplicationPairs.end(),
    [](const DuplicationPair& p) { return p.confidence == Confidence::High; });
  summary.gitEvidenceAvailable = (unsigned)std::count_if(
    result.gitEvidence.begin(), result.gitEvidence.end(),
    [](const auto& kv) { return kv.second.available; });
  summary.estimatedAnnualizedAvoidableRuntimeCost = std::round(annualized * 100.0) / 100.0;

  result.findings = std::move(findings);
  result.summary = summary;
}

} // namespace aicw
