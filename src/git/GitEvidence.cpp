#include "git/GitEvidence.hpp"

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/FileUtilities.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Program.h"
#include "llvm/Support/Regex.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <map>
#include <set>

namespace aicw {

namespace {

constexpr int64_t SecondsPerDay = 86400;

class GitClient final : public VcsClient {
  std::string Root;
  std::optional<std::string> GitPath;

  // stdout of `git -C <root> args...`, or nullopt on any failure
  std::optional<std::string> run(llvm::ArrayRef<llvm::StringRef> args) {
    if (!GitPath) return std::nullopt;

    llvm::SmallString<128> outPath;
    if (llvm::sys::fs::createTemporaryFile("aicw-git", "out", outPath)) return std::nullopt;
    llvm::FileRemover remover(outPath);

    llvm::SmallVector<llvm::StringRef, 12> argv{"git", "-C", Root};
    argv.append(args.begin(), args.end());

    std::string errMsg;
    bool failed = false;
    int rc = llvm::sys::ExecuteAndWait(
      *GitPath, argv, /*Env=*/{},
      {llvm::StringRef(""), llvm::StringRef(outPath), llvm::StringRef("")},
      /*SecondsToWait=*/0, /*MemoryLimit=*/0, &errMsg, &failed);
    if (failed || rc != 0) return std::nullopt;

    auto buffer = llvm::MemoryBuffer::getFile(outPath);
    if (!buffer) return std::nullopt;
    return (*buffer)->getBuffer().str();
  }

public:
  explicit GitClient(const std::string& root) : Root(root) {
    if (auto found = llvm::sys::findProgramByName("git")) GitPath = *found;
  }

  bool isWorkTree() override {
    auto out = run({"rev-parse", "--is-inside-work-tree"});
    return out && llvm::StringRef(*out).trim().lower() == "true";
  }

  std::optional<std::string> fileLog(llvm::StringRef relativePath) override {
    return run({"log", "--follow", "--format=%H|%an", "--", relativePath});
  }

  std::optional<std::string> blame(llvm::StringRef relativePath,
                                   unsigned first, unsigned last) override {
    std::string range = (llvm::Twine(first) + "," + llvm::Twine(last)).str();
    return run({"blame", "--line-porcelain", "-L", range, "--", relativePath});
  }
};

} // namespace

std::unique_ptr<VcsClient> makeGitClient(const std::string& repoRoot) {
  return std::make_unique<GitClient>(repoRoot);
}

FileHistory parseFileLog(llvm::StringRef output) {
  std::set<std::string> commits, authors;
  llvm::SmallVector<llvm::StringRef, 64> lines;
  output.split(lines, '\n', -1, /*KeepEmpty=*/false);
  for (auto line : lines) {
    auto bar = line.find('|');
    if (bar == llvm::StringRef::npos) continue;
    auto hash = line.take_front(bar);
    auto author = line.drop_front(bar + 1);
    if (!hash.empty()) commits.insert(hash.str());
    if (!author.empty()) authors.insert(author.str());
  }
  return {(unsigned)commits.size(), (unsigned)authors.size()};
}

std::vector<BlameLine> parseBlamePorcelain(llvm::StringRef output) {
  static llvm::Regex HeaderRe(
    "^[0-9a-f]{40}[[:space:]]+[0-9]+[[:space:]]+[0-9]+([[:space:]]+[0-9]+)?$");

  std::vector<BlameLine> out;
  std::optional<std::string> commit, author;
  std::optional<int64_t> authorTime;

  llvm::SmallVector<llvm::StringRef, 256> lines;
  output.split(lines, '\n');
  for (auto line : lines) {
    if (HeaderRe.match(line)) {
      commit = line.take_until([](char c) { return c == ' '; }).str();
      author.reset();
      authorTime.reset();
      continue;
    }
    if (line.consume_front("author ")) {
      author = line.trim().str();
      continue;
    }
    if (line.consume_front("author-time ")) {
      int64_t t;
      if (line.trim().getAsInteger(10, t)) authorTime.reset();
      else authorTime = t;
      continue;
    }
    if (!line.empty() && line.front() == '\t' && commit)
      out.push_back({*commit, author, authorTime});
  }
  return out;
}

std::optional<BlameMetrics> summarizeBlame(llvm::ArrayRef<BlameLine> lines, int64_t nowEpoch) {
  if (lines.empty()) return std::nullopt;

  std::map<std::string, unsigned> perCommit;
  std::set<std::string> authors;
  std::optional<int64_t> newest;
  for (const auto& l : lines) {
    ++perCommit[l.commit];
    if (l.author) authors.insert(*l.author);
    if (l.authorTime) newest = std::max(newest.value_or(*l.authorTime), *l.authorTime);
  }

  unsigned dominant = 0;
  for (const auto& kv : perCommit) dominant = std::max(dominant, kv.second);

  BlameMetrics m;
  m.commitCount = (unsigned)perCommit.size();
  m.authorCount = (unsigned)authors.size();
  m.concentration = std::round((double)dominant / (double)lines.size() * 1000.0) / 1000.0;
  if (newest && *newest != 0)
    m.ageDays = std::max<int64_t>((nowEpoch - *newest) / SecondsPerDay, 0);
  return m;
}

GitEvidenceMap collectGitEvidence(VcsClient& vcs, const std::vector<Entity>& entities,
                                  int64_t nowEpoch)
{
  GitEvidenceMap evidence;
  if (!vcs.isWorkTree()) return evidence;

  std::map<std::string, std::vector<const Entity*>> byFile;
  for (const auto& e : entities) byFile[e.filePath].push_back(&e);

  for (const auto& [file, fileEntities] : byFile) {
    FileHistory history;
    if (auto log = vcs.fileLog(file)) history = parseFileLog(*log);

    for (const Entity* e : fileEntities) {
      GitEvidence ev;
      ev.entityId = e->id;
      ev.fileCommitCount = history.commitCount;
      ev.fileAuthorCount = history.authorCount;

      std::optional<BlameMetrics> metrics;
      if (auto out = vcs.blame(file, e->line, e->endLine))
        metrics = summarizeBlame(parseBlamePorcelain(*out), nowEpoch);
      if (metrics) {
        ev.available = true;
        ev.blameCommitCount = metrics->commitCount;
        ev.blameAuthorCount = metrics->authorCount;
        ev.lineCommitConcentration = metrics->concentration;
        ev.lastCommitAgeDays = metrics->ageDays;
      }
      evidence[e->id] = std::move(ev);
    }
  }
  return evidence;
}

GitEvidenceMap collectGitEvidence(const std::string& repoRoot,
                                  const std::vector<Entity>& entities) {
  auto client = makeGitClient(repoRoot);
  auto now = std::chrono::duration_cast<std::chrono::seconds>(
    std::chrono::system_clock::now().time_since_epoch()).count();
  return collectGitEvidence(*client, entities, (int64_t)now);
}

} // namespace aicw
