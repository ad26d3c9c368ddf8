#include "analysis/Duplication.hpp"
#include "scanner/ScriptLexer.hpp"

#include "llvm/Support/raw_ostream.h"

#include <algorithm>
#include <cmath>

namespace aicw {

namespace {

// Placeholder text for names and literals; all other node text is kept.
llvm::StringRef canonicalText(const SyntaxNode& n) {
  switch (n.kind) {
  case SyntaxKind::Param:         return "arg";
  case SyntaxKind::DeclRef:
  case SyntaxKind::VarDecl:       return "var";
  case SyntaxKind::Member:        return "attr";
  case SyntaxKind::StringLiteral: return "STR";
  case SyntaxKind::NumberLiteral: return "0";
  default:                        return n.text;
  }
}

void dumpCanonical(const SyntaxNode& n, llvm::raw_ostream& os) {
  os << kindName(n.kind) << '(' << canonicalText(n);
  for (const auto& child : n.children) {
    os << ',';
    dumpCanonical(child, os);
  }
  os << ')';
}

} // namespace

std::optional<unsigned> bodyStatementCount(const Entity& entity) {
  if (isLexical(entity.language)) {
    auto fn = firstFunctionText(declarationText(entity));
    if (!fn) return std::nullopt;
    return countBodyStatements(*fn);
  }
  if (!entity.syntax) return std::nullopt;
  const SyntaxNode* fn = firstFunction(*entity.syntax);
  if (!fn || !fn->body()) return std::nullopt;
  return (unsigned)fn->body()->children.size();
}

std::optional<std::string> canonicalSignature(const Entity& entity, unsigned minBodyStatements) {
  auto statements = bodyStatementCount(entity);
  if (!statements || *statements < minBodyStatements) return std::nullopt;

  if (isLexical(entity.language)) {
    auto fn = firstFunctionText(declarationText(entity));
    if (!fn) return std::nullopt;
    return canonicalizeScript(*fn);
  }

  std::string out;
  llvm::raw_string_ostream os(out);
  dumpCanonical(*firstFunction(*entity.syntax), os);
  return os.str();
}

double similarityRatio(llvm::StringRef a, llvm::StringRef b) {
  size_t total = a.size() + b.size();
  if (total == 0) return 1.0;
  unsigned indels = a.edit_distance(b, /*AllowReplacements=*/false);
  return 1.0 - (double)indels / (double)total;
}

std::vector<DuplicationPair> detectDuplicationPairs(const std::vector<Entity>& entities,
                                                    const DuplicationOptions& opts)
{
  struct Candidate {
    const Entity* entity;
    std::string signature;
  };
  std::vector<Candidate> candidates;
  for (const auto& e : entities) {
    if (auto sig = canonicalSignature(e, opts.minBodyStatements))
      candidates.push_back({&e, std::move(*sig)});
  }

  std::vector<DuplicationPair> pairs;
  for (size_t i = 0; i < candidates.size(); ++i) {
    for (size_t j = i + 1; j < candidates.size(); ++j) {
      double ratio = similarityRatio(candidates[i].signature, candidates[j].signature);

      std::optional<Confidence> tier;
      if (ratio >= opts.highThreshold) tier = Confidence::High;
      else if (opts.includeMedium && ratio >= opts.mediumThreshold) tier = Confidence::Medium;
      if (!tier) continue;

      DuplicationPair p;
      p.entityA = candidates[i].entity->id;
      p.entityB = candidates[j].entity->id;
      p.overlap = std::round(ratio * 1000.0) / 1000.0;
      p.confidence = *tier;
      pairs.push_back(std::move(p));
    }
  }

  std::stable_sort(pairs.begin(), pairs.end(), [](const DuplicationPair& x, const DuplicationPair& y) {
    return x.overlap > y.overlap;
  });
  return pairs;
}

} // namespace aicw
