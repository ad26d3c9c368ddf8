#pragma once
#include "model/Entity.hpp"
#include "llvm/ADT/StringRef.h"
#include <memory>
#include <string>
#include <vector>

namespace aicw {

struct ScanOptions {
  bool includeTests = false;           // descend into directories named "tests"
  bool verbose = false;                // note skipped files on stderr
  std::vector<std::string> extraArgs;  // extra compiler args for the Clang path
};

// One extractor per language family. A file that cannot be read or parsed
// contributes nothing; extractFile reports that by returning false.
class EntityExtractor {
public:
  virtual ~EntityExtractor() = default;

  virtual bool handles(llvm::StringRef relativePath) const = 0;

  // Appends the file's entities to `out`, sorted by start line.
  virtual bool extractFile(const std::string& absolutePath,
                           const std::string& relativePath,
                           llvm::StringRef content,
                           std::vector<Entity>& out) = 0;
};

// C and C++ through the Clang frontend. Compile flags come from a
// compile_commands.json at or above `repoRoot` when one exists.
std::unique_ptr<EntityExtractor> makeClangExtractor(const std::string& repoRoot,
                                                    const ScanOptions& opts);

// JavaScript and TypeScript by pattern matching plus brace matching.
std::unique_ptr<EntityExtractor> makeScriptExtractor();

} // namespace aicw
