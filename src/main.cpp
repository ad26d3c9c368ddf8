#include "engine/Engine.hpp"
#include "history/RunHistory.hpp"
#include "report/Report.hpp"
#include "support/FileIO.hpp"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/CommandLine.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/WithColor.h"
#include "llvm/Support/raw_ostream.h"

using namespace aicw;

static llvm::cl::OptionCategory ToolCat("aicw options");

static llvm::cl::opt<std::string> RepoPath(
  "repo", llvm::cl::desc("Repository root to scan"),
  llvm::cl::init("."), llvm::cl::cat(ToolCat));

static llvm::cl::opt<std::string> RuntimePath(
  "runtime", llvm::cl::desc("Runtime invocation evidence (JSON)"),
  llvm::cl::init(""), llvm::cl::cat(ToolCat));

static llvm::cl::opt<int> TimeWindowDays(
  "time-window-days", llvm::cl::desc("Days covered by the runtime evidence"),
  llvm::cl::init(90), llvm::cl::cat(ToolCat));

static llvm::cl::opt<double> CostPerInvocation(
  "cost-per-invocation", llvm::cl::desc("Cost of one invocation; 0 disables cost estimates"),
  llvm::cl::init(0.0), llvm::cl::cat(ToolCat));

static llvm::cl::opt<double> AiThreshold(
  "ai-threshold", llvm::cl::desc("Minimum provenance score to report"),
  llvm::cl::init(0.65), llvm::cl::cat(ToolCat));

static llvm::cl::opt<double> DupThreshold(
  "dup-threshold", llvm::cl::desc("Similarity for a high-confidence duplicate pair"),
  llvm::cl::init(0.9), llvm::cl::cat(ToolCat));

static llvm::cl::opt<double> DupMediumThreshold(
  "dup-medium-threshold", llvm::cl::desc("Similarity for a medium-confidence pair"),
  llvm::cl::init(0.75), llvm::cl::cat(ToolCat));

static llvm::cl::opt<bool> ReportMediumDups(
  "report-medium-dups", llvm::cl::desc("Also report medium-confidence duplicate pairs"),
  llvm::cl::init(false), llvm::cl::cat(ToolCat));

static llvm::cl::opt<int> MinDupBodyStatements(
  "min-dup-body-statements", llvm::cl::desc("Smallest body considered for duplication"),
  llvm::cl::init(3), llvm::cl::cat(ToolCat));

static llvm::cl::opt<bool> IncludeTests(
  "include-tests", llvm::cl::desc("Scan test directories too"),
  llvm::cl::init(false), llvm::cl::cat(ToolCat));

static llvm::cl::opt<bool> NoGitProvenance(
  "no-git-provenance", llvm::cl::desc("Skip git history evidence"),
  llvm::cl::init(false), llvm::cl::cat(ToolCat));

static llvm::cl::opt<std::string> Currency(
  "currency", llvm::cl::desc("Currency label for cost figures"),
  llvm::cl::init("USD"), llvm::cl::cat(ToolCat));

static llvm::cl::opt<std::string> OutputPath(
  "output", llvm::cl::desc("Markdown report path"),
  llvm::cl::init("reports/diagnostic.md"), llvm::cl::cat(ToolCat));

static llvm::cl::opt<std::string> JsonOutputPath(
  "json-output", llvm::cl::desc("Optional JSON report path"),
  llvm::cl::init(""), llvm::cl::cat(ToolCat));

static llvm::cl::opt<std::string> HistoryDb(
  "history-db", llvm::cl::desc("SQLite database recording each run for trend comparison"),
  llvm::cl::init(""), llvm::cl::cat(ToolCat));

static llvm::cl::list<std::string> ExtraArgs(
  "extra-arg", llvm::cl::desc("Additional compiler argument for C/C++ parsing"),
  llvm::cl::ZeroOrMore, llvm::cl::cat(ToolCat));

static llvm::cl::opt<bool> Verbose(
  "verbose", llvm::cl::desc("Print progress notes to stderr"),
  llvm::cl::init(false), llvm::cl::cat(ToolCat));

int main(int argc, const char** argv) {
  llvm::cl::HideUnrelatedOptions(ToolCat);
  llvm::cl::ParseCommandLineOptions(argc, argv, "AI code waste diagnostic (read-only)\n");

  AnalyzeOptions opts;
  opts.repoPath = RepoPath;
  opts.runtimePath = RuntimePath;
  opts.timeWindowDays = TimeWindowDays;
  opts.costPerInvocation = CostPerInvocation;
  opts.aiThreshold = AiThreshold;
  opts.dupThreshold = DupThreshold;
  opts.dupMediumThreshold = DupMediumThreshold;
  opts.reportMediumDuplicates = ReportMediumDups;
  opts.minDupBodyStatements = MinDupBodyStatements;
  opts.includeTests = IncludeTests;
  opts.gitProvenance = !NoGitProvenance;
  opts.verbose = Verbose;
  opts.extraArgs.assign(ExtraArgs.begin(), ExtraArgs.end());

  AnalysisResult result;
  std::string error;
  if (!analyzeRepository(opts, result, &error)) {
    llvm::WithColor::error() << error << "\n";
    return 1;
  }

  llvm::SmallString<256> root(opts.repoPath);
  if (llvm::sys::fs::real_path(opts.repoPath, root))
    root = opts.repoPath;

  ReportContext ctx;
  ctx.repoPath = std::string(root.str());
  ctx.timeWindowDays = opts.timeWindowDays;
  ctx.currency = Currency;
  ctx.generatedAt = currentUtcTimestamp();

  if (!HistoryDb.empty()) {
    HistoryContext history;
    if (!recordRun(HistoryDb, ctx.repoPath, ctx.generatedAt, result, opts, history, &error)) {
      llvm::WithColor::error() << error << "\n";
      return 1;
    }
    ctx.history = std::move(history);
  }

  if (!writeFile(OutputPath, buildMarkdownReport(result, ctx), &error)) {
    llvm::WithColor::error() << error << "\n";
    return 1;
  }
  if (!JsonOutputPath.empty() &&
      !writeFile(JsonOutputPath, buildJsonReport(result, ctx), &error)) {
    llvm::WithColor::error() << error << "\n";
    return 1;
  }

  const Summary& s = result.summary;
  llvm::outs() << "Report written: " << OutputPath << "\n";
  if (!JsonOutputPath.empty())
    llvm::outs() << "JSON report written: " << JsonOutputPath << "\n";
  llvm::outs() << "Functions scanned: " << s.functionsScanned << "\n"
               << "Probable AI functions: " << s.probableAiFunctions << "\n"
               << "High-confidence duplicate pairs: " << s.highConfidenceDuplicationPairs << "\n"
               << "Probable AI + zero invocations: " << s.probableAiZeroInvocations << "\n"
               << "Git provenance coverage: " << s.gitEvidenceAvailable << "\n";
  if (ctx.history) {
    llvm::outs() << "Run recorded: #" << ctx.history->runId << "\n";
    if (ctx.history->previousRunId)
      llvm::outs() << "Compared with run #" << *ctx.history->previousRunId << "\n";
  }
  return 0;
}
