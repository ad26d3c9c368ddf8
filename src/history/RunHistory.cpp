#include "history/RunHistory.hpp"

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Path.h"

#include <sqlite3.h>

#include <cmath>
#include <map>
#include <memory>

namespace aicw {

namespace {

const char* const Schema = R"sql(
CREATE TABLE IF NOT EXISTS runs (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  repo_key TEXT NOT NULL,
  repo_path TEXT NOT NULL,
  scanned_at TEXT NOT NULL,
  functions_scanned INTEGER NOT NULL,
  probable_ai_functions INTEGER NOT NULL,
  high_confidence_duplication_pairs INTEGER NOT NULL,
  runtime_zero_invocations INTEGER NOT NULL,
  probable_ai_zero_invocations INTEGER NOT NULL,
  estimated_annualized_avoidable_runtime_cost REAL NOT NULL,
  ai_threshold REAL NOT NULL,
  dup_threshold REAL NOT NULL,
  min_dup_body_statements INTEGER NOT NULL,
  include_tests INTEGER NOT NULL,
  git_provenance_enabled INTEGER NOT NULL
);
CREATE TABLE IF NOT EXISTS finding_counts (
  run_id INTEGER NOT NULL,
  finding_type TEXT NOT NULL,
  finding_count INTEGER NOT NULL,
  PRIMARY KEY (run_id, finding_type),
  FOREIGN KEY (run_id) REFERENCES runs(id) ON DELETE CASCADE
);
CREATE INDEX IF NOT EXISTS idx_runs_repo_key_id ON runs(repo_key, id);
)sql";

const char* const InsertRun = R"sql(
INSERT INTO runs (
  repo_key, repo_path, scanned_at,
  functions_scanned, probable_ai_functions, high_confidence_duplication_pairs,
  runtime_zero_invocations, probable_ai_zero_invocations,
  estimated_annualized_avoidable_runtime_cost,
  ai_threshold, dup_threshold, min_dup_body_statements,
  include_tests, git_provenance_enabled
) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
)sql";

const char* const InsertFindingCount =
  "INSERT INTO finding_counts (run_id, finding_type, finding_count) VALUES (?, ?, ?)";

const char* const SelectPrevious = R"sql(
SELECT id, scanned_at,
       functions_scanned, probable_ai_functions, high_confidence_duplication_pairs,
       runtime_zero_invocations, probable_ai_zero_invocations,
       estimated_annualized_avoidable_runtime_cost
FROM runs
WHERE repo_key = ? AND id < ?
ORDER BY id DESC
LIMIT 1
)sql";

struct DbCloser {
  void operator()(sqlite3* db) const { sqlite3_close_v2(db); }
};
using DbHandle = std::unique_ptr<sqlite3, DbCloser>;

// Prepared statement with positional binding. A failed prepare or bind makes
// step() report SQLITE_ERROR.
class Statement {
  sqlite3_stmt* S = nullptr;
  int Next = 1;
  bool Ok;

public:
  Statement(sqlite3* db, const char* sql)
    : Ok(sqlite3_prepare_v2(db, sql, -1, &S, nullptr) == SQLITE_OK) {}
  ~Statement() { sqlite3_finalize(S); }
  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  Statement& bind(int64_t v) {
    Ok = Ok && sqlite3_bind_int64(S, Next++, v) == SQLITE_OK;
    return *this;
  }
  Statement& bind(double v) {
    Ok = Ok && sqlite3_bind_double(S, Next++, v) == SQLITE_OK;
    return *this;
  }
  Statement& bind(llvm::StringRef v) {
    Ok = Ok && sqlite3_bind_text(S, Next++, v.data(), (int)v.size(), SQLITE_TRANSIENT) == SQLITE_OK;
    return *this;
  }

  int step() { return Ok ? sqlite3_step(S) : SQLITE_ERROR; }

  int64_t intColumn(int i) const { return sqlite3_column_int64(S, i); }
  double doubleColumn(int i) const { return sqlite3_column_double(S, i); }
  std::string textColumn(int i) const {
    const unsigned char* text = sqlite3_column_text(S, i);
    return text ? std::string((const char*)text, (size_t)sqlite3_column_bytes(S, i)) : std::string();
  }
};

llvm::SmallString<256> resolvePath(llvm::StringRef path) {
  llvm::SmallString<256> resolved;
  if (!llvm::sys::fs::real_path(path, resolved)) return resolved;
  resolved = path;
  if (llvm::sys::fs::make_absolute(resolved)) resolved = path;
  llvm::sys::path::remove_dots(resolved, /*remove_dot_dot=*/true);
  return resolved;
}

bool fail(sqlite3* db, llvm::StringRef dbPath, llvm::StringRef what, std::string* error) {
  if (error)
    *error = ("History database " + dbPath + ": " + what + ": " +
              (db ? sqlite3_errmsg(db) : "out of memory")).str();
  return false;
}

} // namespace

std::string historyRepoKey(llvm::StringRef repoPath) {
  return resolvePath(repoPath).str().lower();
}

bool recordRun(const std::string& dbPath, llvm::StringRef repoPath,
               llvm::StringRef scannedAt, const AnalysisResult& result,
               const AnalyzeOptions& opts, HistoryContext& out, std::string* error)
{
  llvm::StringRef parent = llvm::sys::path::parent_path(dbPath);
  if (!parent.empty()) {
    if (std::error_code ec = llvm::sys::fs::create_directories(parent)) {
      if (error) *error = "Failed to create " + parent.str() + ": " + ec.message();
      return false;
    }
  }

  sqlite3* raw = nullptr;
  int rc = sqlite3_open_v2(dbPath.c_str(), &raw, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
  DbHandle db(raw);
  if (rc != SQLITE_OK) return fail(db.get(), dbPath, "open", error);
  sqlite3_busy_timeout(db.get(), 5000);

  if (sqlite3_exec(db.get(), "PRAGMA foreign_keys = ON", nullptr, nullptr, nullptr) != SQLITE_OK ||
      sqlite3_exec(db.get(), Schema, nullptr, nullptr, nullptr) != SQLITE_OK)
    return fail(db.get(), dbPath, "schema", error);

  // Closing the handle without COMMIT rolls the run back.
  if (sqlite3_exec(db.get(), "BEGIN IMMEDIATE", nullptr, nullptr, nullptr) != SQLITE_OK)
    return fail(db.get(), dbPath, "begin", error);

  const Summary& s = result.summary;
  const std::string key = historyRepoKey(repoPath);
  {
    Statement insert(db.get(), InsertRun);
    insert.bind(llvm::StringRef(key))
          .bind(resolvePath(repoPath).str())
          .bind(scannedAt)
          .bind((int64_t)s.functionsScanned)
          .bind((int64_t)s.probableAiFunctions)
          .bind((int64_t)s.highConfidenceDuplicationPairs)
          .bind((int64_t)s.runtimeZeroInvocations)
          .bind((int64_t)s.probableAiZeroInvocations)
          .bind(s.estimatedAnnualizedAvoidableRuntimeCost)
          .bind(opts.aiThreshold)
          .bind(opts.dupThreshold)
          .bind((int64_t)opts.minDupBodyStatements)
          .bind((int64_t)opts.includeTests)
          .bind((int64_t)opts.gitProvenance);
    if (insert.step() != SQLITE_DONE) return fail(db.get(), dbPath, "insert run", error);
  }
  const int64_t runId = sqlite3_last_insert_rowid(db.get());

  std::map<std::string, int64_t> counts;
  for (const auto& f : result.findings) ++counts[f.type];
  for (const auto& kv : counts) {
    Statement insert(db.get(), InsertFindingCount);
    insert.bind(runId).bind(llvm::StringRef(kv.first)).bind(kv.second);
    if (insert.step() != SQLITE_DONE) return fail(db.get(), dbPath, "insert finding counts", error);
  }

  HistoryContext ctx;
  ctx.runId = runId;
  ctx.scannedAt = scannedAt.str();
  {
    Statement previous(db.get(), SelectPrevious);
    previous.bind(llvm::StringRef(key)).bind(runId);
    rc = previous.step();
    if (rc == SQLITE_ROW) {
      ctx.previousRunId = previous.intColumn(0);
      ctx.previousScannedAt = previous.textColumn(1);
      TrendDelta t;
      t.functionsScanned = (int64_t)s.functionsScanned - previous.intColumn(2);
      t.probableAiFunctions = (int64_t)s.probableAiFunctions - previous.intColumn(3);
      t.highConfidenceDuplicationPairs =
        (int64_t)s.highConfidenceDuplicationPairs - previous.intColumn(4);
      t.runtimeZeroInvocations = (int64_t)s.runtimeZeroInvocations - previous.intColumn(5);
      t.probableAiZeroInvocations = (int64_t)s.probableAiZeroInvocations - previous.intColumn(6);
      double cost = s.estimatedAnnualizedAvoidableRuntimeCost - previous.doubleColumn(7);
      t.estimatedAnnualizedAvoidableRuntimeCost = std::round(cost * 100.0) / 100.0;
      ctx.trend = t;
    } else if (rc != SQLITE_DONE) {
      return fail(db.get(), dbPath, "previous run", error);
    }
  }

  if (sqlite3_exec(db.get(), "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK)
    return fail(db.get(), dbPath, "commit", error);
  out = std::move(ctx);
  return true;
}

} // namespace aicw
