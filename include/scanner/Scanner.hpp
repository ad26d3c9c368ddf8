#pragma once
#include "model/Entity.hpp"
#include "scanner/Extractor.hpp"
#include "llvm/ADT/StringRef.h"
#include <string>
#include <vector>

namespace aicw {

// Directory names never descended into.
bool isIgnoredDirectory(llvm::StringRef name, bool includeTests);

// Repo-relative paths ('/' separated, sorted) of files some extractor handles.
std::vector<std::string>
collectSourceFiles(const std::string& repoRoot, const ScanOptions& opts,
                   const std::vector<std::unique_ptr<EntityExtractor>>& extractors);

// Every entity in the repository, ordered by (file path, start line).
std::vector<Entity> scanRepository(const std::string& repoRoot, const ScanOptions& opts);

} // namespace aicw
