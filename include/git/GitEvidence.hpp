#pragma once
#include "model/Entity.hpp"
#include "model/Evidence.hpp"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace aicw {

// Raw version-control queries. Every method returns nullopt (or false) when
// the tool is missing, exits non-zero, or its output cannot be read.
class VcsClient {
public:
  virtual ~VcsClient() = default;
  virtual bool isWorkTree() = 0;
  // `git log --follow --format=%H|%an -- <file>`
  virtual std::optional<std::string> fileLog(llvm::StringRef relativePath) = 0;
  // `git blame --line-porcelain -L first,last -- <file>`
  virtual std::optional<std::string> blame(llvm::StringRef relativePath,
                                           unsigned first, unsigned last) = 0;
};

// Runs the git binary found on PATH, synchronously, with `-C repoRoot`.
std::unique_ptr<VcsClient> makeGitClient(const std::string& repoRoot);

struct FileHistory {
  unsigned commitCount = 0;
  unsigned authorCount = 0;
};

// Distinct hashes and authors; --follow can repeat a commit across renames.
FileHistory parseFileLog(llvm::StringRef output);

struct BlameLine {
  std::string commit;
  std::optional<std::string> author;
  std::optional<int64_t> authorTime;
};

std::vector<BlameLine> parseBlamePorcelain(llvm::StringRef output);

struct BlameMetrics {
  unsigned commitCount = 0;
  unsigned authorCount = 0;
  double   concentration = 0.0;   // lines of the dominant commit / all lines
  int64_t  ageDays = 0;           // since the newest author-time, >= 0
};

std::optional<BlameMetrics> summarizeBlame(llvm::ArrayRef<BlameLine> lines, int64_t nowEpoch);

// Evidence for every entity, keyed by entity id; empty when `vcs` is not
// a work tree.
GitEvidenceMap collectGitEvidence(VcsClient& vcs, const std::vector<Entity>& entities,
                                  int64_t nowEpoch);

GitEvidenceMap collectGitEvidence(const std::string& repoRoot,
                                  const std::vector<Entity>& entities);

} // namespace aicw
