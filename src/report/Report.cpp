#include "report/Report.hpp"

#include "llvm/Support/Format.h"
#include "llvm/Support/JSON.h"
#include "llvm/Support/raw_ostream.h"

#include <algorithm>
#include <cmath>
#include <ctime>
#include <map>

namespace aicw {

namespace {

using EntityIndex = std::map<std::string, const Entity*>;

EntityIndex indexEntities(const AnalysisResult& result) {
  EntityIndex idx;
  for (const auto& e : result.entities) idx[e.id] = &e;
  return idx;
}

std::string entityReference(const EntityIndex& idx, const std::string& id) {
  auto it = idx.find(id);
  if (it == idx.end()) return id;
  return it->second->filePath + ":" + std::to_string(it->second->line);
}

std::string timestampOf(const ReportContext& ctx) {
  return ctx.generatedAt.empty() ? currentUtcTimestamp() : ctx.generatedAt;
}

llvm::json::Value optionalValue(const std::optional<unsigned>& v) {
  return v ? llvm::json::Value(*v) : llvm::json::Value(nullptr);
}
llvm::json::Value optionalValue(const std::optional<int64_t>& v) {
  return v ? llvm::json::Value(*v) : llvm::json::Value(nullptr);
}
llvm::json::Value optionalValue(const std::optional<double>& v) {
  return v ? llvm::json::Value(*v) : llvm::json::Value(nullptr);
}
llvm::json::Value optionalValue(const std::optional<std::string>& v) {
  return v ? llvm::json::Value(*v) : llvm::json::Value(nullptr);
}

// "+2", "0", "-1"
std::string signedCount(int64_t v) {
  return v > 0 ? "+" + std::to_string(v) : std::to_string(v);
}

} // namespace

std::string currentUtcTimestamp() {
  std::time_t now = std::time(nullptr);
  std::tm utc{};
  gmtime_r(&now, &utc);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%SZ", &utc);
  return buf;
}

std::string formatCurrency(double value, llvm::StringRef currency) {
  long long cents = std::llround(std::fabs(value) * 100.0);
  std::string whole = std::to_string(cents / 100);
  std::string grouped;
  for (size_t i = 0; i < whole.size(); ++i) {
    if (i && (whole.size() - i) % 3 == 0) grouped += ',';
    grouped += whole[i];
  }
  std::string out;
  llvm::raw_string_ostream os(out);
  os << currency << " " << (value < 0 && cents ? "-" : "") << grouped << "."
     << llvm::format("%02lld", cents % 100);
  return os.str();
}

std::string buildMarkdownReport(const AnalysisResult& result, const ReportContext& ctx) {
  const Summary& s = result.summary;
  EntityIndex idx = indexEntities(result);

  std::string costText = s.estimatedAnnualizedAvoidableRuntimeCost > 0
    ? formatCurrency(s.estimatedAnnualizedAvoidableRuntimeCost, ctx.currency)
    : "Not calculated (set --cost-per-invocation to enable)";

  std::string out;
  llvm::raw_string_ostream os(out);
  os << "# Software Intelligence Waste Diagnostic\n\n";

  os << "## Scope\n"
     << "- Repository: `" << ctx.repoPath << "`\n"
     << "- Generated at: `" << timestampOf(ctx) << "`\n"
     << "- Runtime window: `" << ctx.timeWindowDays << "` days\n\n";

  os << "## Executive Truth Summary\n"
     << "- Functions scanned: **" << s.functionsScanned << "**\n"
     << "- Probable AI-generated functions: **" << s.probableAiFunctions << "**\n"
     << "- High-confidence duplicate pairs: **" << s.highConfidenceDuplicationPairs << "**\n"
     << "- Probable AI functions with zero runtime invocations: **"
     << s.probableAiZeroInvocations << "**\n"
     << "- Git provenance coverage: **" << s.gitEvidenceAvailable << "**\n"
     << "- Estimated annualized avoidable runtime cost: **" << costText << "**\n\n";

  if (ctx.history && ctx.history->trend && ctx.history->previousScannedAt) {
    const TrendDelta& t = *ctx.history->trend;
    os << "## Trend vs Previous Run\n"
       << "- Previous run: `" << *ctx.history->previousScannedAt << "`\n"
       << "- Functions scanned delta: **" << signedCount(t.functionsScanned) << "**\n"
       << "- Probable AI functions delta: **" << signedCount(t.probableAiFunctions) << "**\n"
       << "- High-confidence duplicate pairs delta: **"
       << signedCount(t.highConfidenceDuplicationPairs) << "**\n"
       << "- Runtime zero-invocation delta: **" << signedCount(t.runtimeZeroInvocations) << "**\n"
       << "- Estimated annualized avoidable runtime cost delta: **"
       << formatCurrency(t.estimatedAnnualizedAvoidableRuntimeCost, ctx.currency) << "**\n\n";
  }

  os << "## Waste Taxonomy Mapping\n"
     << "| Category | Instances | Economic signal |\n"
     << "| --- | ---: | --- |\n"
     << "| Structural duplication | " << s.highConfidenceDuplicationPairs
     << " | Consolidation may reduce repeated execution and maintenance. |\n"
     << "| Runtime unused paths | " << s.runtimeZeroInvocations
     << " | Unused paths carry maintenance burden without runtime value. |\n"
     << "| Probable AI + runtime unused | " << s.probableAiZeroInvocations
     << " | Candidate area for delete/consolidate review. |\n"
     << "| Runtime ambiguity | " << s.runtimeUnknown
     << " | No decision without mapped runtime evidence. |\n\n";

  os << "## Evidence Snapshots\n";
  if (result.findings.empty()) {
    os << "- No high-confidence findings met report thresholds.\n";
  } else {
    size_t n = std::min<size_t>(result.findings.size(), 20);
    for (size_t i = 0; i < n; ++i) {
      const Finding& f = result.findings[i];
      os << (i + 1) << ". **" << f.title << "**\n"
         << "   - Type: `" << f.type << "`\n"
         << "   - Severity: `" << severityName(f.severity) << "`\n";
      if (!f.entityIds.empty()) {
        os << "   - Entities: ";
        for (size_t k = 0; k < f.entityIds.size(); ++k)
          os << (k ? ", " : "") << "`" << entityReference(idx, f.entityIds[k]) << "`";
        os << "\n";
      }
      if (!f.evidence.empty()) {
        os << "   - Evidence: ";
        for (size_t k = 0; k < f.evidence.size(); ++k)
          os << (k ? "; " : "") << f.evidence[k];
        os << "\n";
      }
      if (f.estimatedAnnualCost)
        os << "   - Estimated annual cost: "
           << formatCurrency(*f.estimatedAnnualCost, ctx.currency) << "\n";
    }
  }
  os << "\n";

  os << "## Method Constraints\n"
     << "- Diagnostic only: no code mutation, no auto-refactor.\n"
     << "- AI provenance is heuristic probability, not authorship proof.\n"
     << "- Runtime mapping is best-effort; ambiguous mappings stay unresolved.\n";
  return os.str();
}

std::string buildJsonReport(const AnalysisResult& result, const ReportContext& ctx) {
  const Summary& s = result.summary;
  std::string out;
  llvm::raw_string_ostream os(out);
  llvm::json::OStream J(os, 2);

  J.object([&] {
    J.attributeObject("meta", [&] {
      J.attribute("repo_path", ctx.repoPath);
      J.attribute("generated_at", timestampOf(ctx));
      J.attribute("time_window_days", ctx.timeWindowDays);
      J.attribute("currency", ctx.currency);
    });

    J.attributeObject("summary", [&] {
      J.attribute("functions_scanned", s.functionsScanned);
      J.attribute("probable_ai_functions", s.probableAiFunctions);
      J.attribute("high_confidence_ai_functions", s.highConfidenceAiFunctions);
      J.attribute("high_confidence_duplication_pairs", s.highConfidenceDuplicationPairs);
      J.attribute("runtime_zero_invocations", s.runtimeZeroInvocations);
      J.attribute("runtime_unknown", s.runtimeUnknown);
      J.attribute("probable_ai_zero_invocations", s.probableAiZeroInvocations);
      J.attribute("git_evidence_available", s.gitEvidenceAvailable);
      J.attribute("estimated_annualized_avoidable_runtime_cost",
                  s.estimatedAnnualizedAvoidableRuntimeCost);
    });

    if (ctx.history) {
      const HistoryContext& h = *ctx.history;
      J.attributeObject("history", [&] {
        J.attribute("run_id", h.runId);
        J.attribute("scanned_at", h.scannedAt);
        J.attribute("previous_run_id", optionalValue(h.previousRunId));
        J.attribute("previous_scanned_at", optionalValue(h.previousScannedAt));
      });
    } else {
      J.attribute("history", nullptr);
    }
    if (ctx.history && ctx.history->trend) {
      const TrendDelta& t = *ctx.history->trend;
      J.attributeObject("trend", [&] {
        J.attribute("functions_scanned_delta", t.functionsScanned);
        J.attribute("probable_ai_functions_delta", t.probableAiFunctions);
        J.attribute("high_confidence_duplication_pairs_delta", t.highConfidenceDuplicationPairs);
        J.attribute("runtime_zero_invocations_delta", t.runtimeZeroInvocations);
        J.attribute("probable_ai_zero_invocations_delta", t.probableAiZeroInvocations);
        J.attribute("estimated_annualized_avoidable_runtime_cost_delta",
                    t.estimatedAnnualizedAvoidableRuntimeCost);
      });
    } else {
      J.attribute("trend", nullptr);
    }

    J.attributeArray("entities", [&] {
      for (const auto& e : result.entities)
        J.object([&] {
          J.attribute("entity_id", e.id);
          J.attribute("file_path", e.filePath);
          J.attribute("name", e.name);
          J.attribute("qualified_name", e.qualifiedName);
          J.attribute("lineno", e.line);
          J.attribute("end_lineno", e.endLine);
          J.attribute("language", languageName(e.language));
        });
    });

    J.attributeArray("ai_signals", [&] {
      for (const auto& sig : result.aiSignals)
        J.object([&] {
          J.attribute("entity_id", sig.entityId);
          J.attribute("probability", sig.probability);
          J.attribute("confidence", confidenceName(sig.confidence));
          J.attributeArray("signals", [&] {
            for (const auto& label : sig.signals) J.value(label);
          });
        });
    });

    J.attributeArray("duplication_pairs", [&] {
      for (const auto& p : result.duplicationPairs)
        J.object([&] {
          J.attribute("entity_a", p.entityA);
          J.attribute("entity_b", p.entityB);
          J.attribute("semantic_overlap", p.overlap);
          J.attribute("confidence", confidenceName(p.confidence));
        });
    });

    J.attributeArray("git_evidence", [&] {
      for (const auto& kv : result.gitEvidence) {
        const GitEvidence& g = kv.second;
        J.object([&] {
          J.attribute("entity_id", g.entityId);
          J.attribute("available", g.available);
          J.attribute("blame_commit_count", optionalValue(g.blameCommitCount));
          J.attribute("blame_author_count", optionalValue(g.blameAuthorCount));
          J.attribute("line_commit_concentration", optionalValue(g.lineCommitConcentration));
          J.attribute("last_commit_age_days", optionalValue(g.lastCommitAgeDays));
          J.attribute("file_commit_count", optionalValue(g.fileCommitCount));
          J.attribute("file_author_count", optionalValue(g.fileAuthorCount));
        });
      }
    });

    J.attributeArray("runtime_evidence", [&] {
      for (const auto& kv : result.runtimeEvidence) {
        const RuntimeEvidence& r = kv.second;
        J.object([&] {
          J.attribute("entity_id", r.entityId);
          J.attribute("invocation_count", optionalValue(r.invocationCount));
          J.attribute("last_invoked_at", optionalValue(r.lastInvokedAt));
          J.attribute("source", r.source);
        });
      }
    });

    J.attributeArray("findings", [&] {
      for (const auto& f : result.findings)
        J.object([&] {
          J.attribute("finding_type", f.type);
          J.attribute("severity", severityName(f.severity));
          J.attribute("title", f.title);
          J.attributeArray("entity_ids", [&] {
            for (const auto& id : f.entityIds) J.value(id);
          });
          J.attributeArray("evidence", [&] {
            for (const auto& ev : f.evidence) J.value(ev);
          });
          J.attribute("estimated_annual_cost", optionalValue(f.estimatedAnnualCost));
        });
    });
  });
  os << "\n";
  return os.str();
}

} // namespace aicw
