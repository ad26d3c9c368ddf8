#pragma once
#include "model/Entity.hpp"
#include "model/Evidence.hpp"
#include "llvm/ADT/StringRef.h"
#include <optional>
#include <string>
#include <vector>

namespace aicw {

struct DuplicationOptions {
  double   highThreshold = 0.9;
  double   mediumThreshold = 0.75;
  bool     includeMedium = false;   // mediumThreshold is ignored otherwise
  unsigned minBodyStatements = 3;
};

// Top-level statements of the entity's first function body; nullopt when no
// body can be located.
std::optional<unsigned> bodyStatementCount(const Entity& entity);

// Syntax-invariant form of the entity's first function, or nullopt when it
// has no body or fewer than minBodyStatements statements.
std::optional<std::string> canonicalSignature(const Entity& entity, unsigned minBodyStatements);

// 2*LCS / (|a|+|b|), via indel edit distance. Symmetric; 1.0 for two empty strings.
double similarityRatio(llvm::StringRef a, llvm::StringRef b);

// All pairs at or above the enabled thresholds, highest overlap first.
std::vector<DuplicationPair> detectDuplicationPairs(const std::vector<Entity>& entities,
                                                    const DuplicationOptions& opts);

} // namespace aicw
