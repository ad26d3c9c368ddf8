#include "analysis/Provenance.hpp"
#include "scanner/ScriptLexer.hpp"

#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/Support/Regex.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <set>

namespace aicw {

namespace {

constexpr llvm::StringLiteral GenericNames[] = {
  "data", "input", "output", "result", "value", "item",
  "obj", "response", "request", "temp", "payload",
};

constexpr unsigned GuardWindow = 6;

static bool mentionsError(llvm::StringRef lowered) {
  return lowered.contains("error") || lowered.contains("invalid") || lowered.contains("fail");
}

static FunctionFeatures nativeFeatures(const SyntaxNode& fn) {
  FunctionFeatures f;
  const auto& stmts = fn.body()->children;
  f.statementCount = (unsigned)stmts.size();

  for (size_t i = 0; i < stmts.size() && i < GuardWindow; ++i) {
    const SyntaxNode& s = stmts[i];
    if (s.kind != SyntaxKind::If || s.children.size() < 2) break;
    const SyntaxNode* only = &s.children[1];
    if (only->kind == SyntaxKind::Block) {
      if (only->children.size() != 1) break;
      only = &only->children.front();
    }
    if (only->kind == SyntaxKind::Return || only->kind == SyntaxKind::Throw) ++f.guardClauses;
  }

  walk(fn, [&](const SyntaxNode& n) {
    switch (n.kind) {
    case SyntaxKind::If:
      ++f.conditionals;
      break;
    case SyntaxKind::VarDecl:
      f.assignedNames.push_back(llvm::StringRef(n.text).lower());
      break;
    case SyntaxKind::Assign:
      if (!n.children.empty() && n.children.front().kind == SyntaxKind::DeclRef)
        f.assignedNames.push_back(llvm::StringRef(n.children.front().text).lower());
      break;
    case SyntaxKind::StringLiteral: {
      std::string lowered = llvm::StringRef(n.text).lower();
      if (mentionsError(lowered)) f.errorMessages.push_back(std::move(lowered));
      break;
    }
    case SyntaxKind::Loop:
    case SyntaxKind::Try:
      f.hasLoopOrHandler = true;
      break;
    default:
      break;
    }
  });

  if (!stmts.empty()) {
    const SyntaxNode& last = stmts.back();
    if (last.kind == SyntaxKind::Return && last.children.size() == 1 &&
        last.children.front().kind == SyntaxKind::DeclRef)
      f.genericReturn = isGenericName(llvm::StringRef(last.children.front().text).lower());
  }
  return f;
}

static unsigned countMatches(llvm::Regex& re, llvm::StringRef code) {
  unsigned n = 0;
  forEachMatch(re, code, [&](llvm::ArrayRef<llvm::StringRef>, size_t) { ++n; });
  return n;
}

// Text approximations of the tree features. Patterns run on masked code so
// strings and comments cannot fake a keyword.
static FunctionFeatures scriptFeatures(llvm::StringRef fnText) {
  static llvm::Regex GuardRe(
    "if[[:space:]]*[(][^{};]*[)][[:space:]]*[{][^{}]*(return|throw)[^{}]*[}]");
  static llvm::Regex DeclRe("(const|let|var)[[:space:]]+([A-Za-z_$][A-Za-z0-9_$]*)");
  static llvm::Regex IfRe("if[[:space:]]*[(]");
  static llvm::Regex LoopRe("(for|while)[[:space:]]*[(]");
  static llvm::Regex ReturnKeywordRe("return([^A-Za-z0-9_$]|$)");
  static llvm::Regex ReturnNameRe("^return[[:space:]]+([A-Za-z_$][A-Za-z0-9_$]*)[[:space:]]*;");

  std::string masked = maskScript(fnText);
  llvm::StringRef code(masked);

  FunctionFeatures f;
  f.statementCount = countBodyStatements(fnText);
  f.guardClauses = countMatches(GuardRe, code);
  f.conditionals = countMatches(IfRe, code);
  f.hasLoopOrHandler = countMatches(LoopRe, code) > 0;

  forEachMatch(DeclRe, code, [&](llvm::ArrayRef<llvm::StringRef> groups, size_t) {
    f.assignedNames.push_back(groups[2].lower());
  });

  for (const auto& literal : collectStringLiterals(fnText)) {
    std::string lowered = llvm::StringRef(literal).lower();
    if (mentionsError(lowered)) f.errorMessages.push_back(std::move(lowered));
  }

  std::optional<size_t> lastReturn;
  forEachMatch(ReturnKeywordRe, code, [&](llvm::ArrayRef<llvm::StringRef>, size_t at) {
    lastReturn = at;
  });
  llvm::SmallVector<llvm::StringRef, 2> groups;
  if (lastReturn && ReturnNameRe.match(code.drop_front(*lastReturn), &groups))
    f.genericReturn = isGenericName(groups[1].lower());
  return f;
}

const StructuralRule StructuralRules[] = {
  {"uniform guard clauses", 0.25,
   [](const FunctionFeatures& f) { return f.guardClauses >= 3; }},
  {"generic variable naming", 0.20,
   [](const FunctionFeatures& f) { return f.genericNameRatio() >= 0.6; }},
  {"high defensive branch density", 0.20,
   [](const FunctionFeatures& f) { return f.defensiveDensity() >= 0.4 && f.statementCount >= 4; }},
  {"repetitive error messaging", 0.15,
   [](const FunctionFeatures& f) { return f.repetitiveErrors(); }},
  {"generic return pipeline", 0.15,
   [](const FunctionFeatures& f) { return f.genericReturn; }},
  {"long boilerplate flow", 0.10,
   [](const FunctionFeatures& f) { return f.statementCount >= 12 && !f.hasLoopOrHandler; }},
};

// Blame fields are always set on available evidence; the fallbacks only keep
// a rule from firing on a missing value.
const EvidenceRule EvidenceRules[] = {
  {"single-source commit concentration", 0.10, [](const GitEvidence& e) {
     return e.lineCommitConcentration.value_or(0.0) >= 0.85 && e.blameCommitCount.value_or(99) <= 2;
   }},
  {"recent introduction window", 0.05, [](const GitEvidence& e) {
     return e.lastCommitAgeDays.value_or(INT64_MAX) <= 45 && e.blameCommitCount.value_or(99) <= 3;
   }},
  {"low-author diversity file", 0.05, [](const GitEvidence& e) {
     return e.fileAuthorCount.value_or(99) <= 1 && e.fileCommitCount.value_or(99) <= 3;
   }},
  {"sustained multi-commit evolution", -0.10, [](const GitEvidence& e) {
     return e.blameCommitCount.value_or(0) >= 6;
   }},
  {"multi-author maintenance", -0.10, [](const GitEvidence& e) {
     return e.blameAuthorCount.value_or(0) >= 3;
   }},
  {"long-lived stable code", -0.05, [](const GitEvidence& e) {
     return e.lastCommitAgeDays.value_or(0) >= 365;
   }},
};

class HeuristicModel final : public ProvenanceModel {
public:
  std::optional<ProvenanceSignal>
  score(const Entity& entity, const GitEvidence* evidence, double threshold) override {
    auto features = extractFeatures(entity);
    if (!features) return std::nullopt;

    double total = 0.0;
    std::vector<std::string> labels;
    for (const auto& rule : structuralRules()) {
      if (!rule.applies(*features)) continue;
      total += rule.weight;
      labels.emplace_back(rule.label);
    }
    if (evidence && evidence->available) {
      for (const auto& rule : evidenceRules()) {
        if (!rule.applies(*evidence)) continue;
        total += rule.delta;
        labels.emplace_back(rule.label);
      }
    }

    // a probability estimate, never certainty
    double probability = std::min(std::round(std::max(total, 0.0) * 100.0) / 100.0, 0.99);
    if (probability < threshold) return std::nullopt;

    ProvenanceSignal s;
    s.entityId = entity.id;
    s.probability = probability;
    s.confidence = probability >= 0.8 ? Confidence::High : Confidence::Medium;
    s.signals = std::move(labels);
    return s;
  }
};

} // namespace

bool isGenericName(llvm::StringRef lowercaseName) {
  return llvm::is_contained(GenericNames, lowercaseName);
}

double FunctionFeatures::genericNameRatio() const {
  if (assignedNames.empty()) return 0.0;
  auto generic = llvm::count_if(assignedNames, [](const std::string& n) { return isGenericName(n); });
  return (double)generic / (double)assignedNames.size();
}

double FunctionFeatures::defensiveDensity() const {
  return (double)conditionals / (double)std::max(statementCount, 1u);
}

bool FunctionFeatures::repetitiveErrors() const {
  if (errorMessages.size() < 2) return false;
  std::set<std::string> distinct(errorMessages.begin(), errorMessages.end());
  return distinct.size() <= errorMessages.size() / 2 + 1;
}

std::optional<FunctionFeatures> extractFeatures(const Entity& entity) {
  if (isLexical(entity.language)) {
    auto fn = firstFunctionText(declarationText(entity));
    if (!fn) return std::nullopt;
    return scriptFeatures(*fn);
  }
  if (!entity.syntax) return std::nullopt;
  const SyntaxNode* fn = firstFunction(*entity.syntax);
  if (!fn || !fn->body()) return std::nullopt;
  return nativeFeatures(*fn);
}

llvm::ArrayRef<StructuralRule> structuralRules() { return StructuralRules; }

llvm::ArrayRef<EvidenceRule> evidenceRules() { return EvidenceRules; }

std::unique_ptr<ProvenanceModel> makeHeuristicModel() {
  return std::make_unique<HeuristicModel>();
}

std::vector<ProvenanceSignal> detectProvenanceSignals(const std::vector<Entity>& entities,
                                                      double threshold,
                                                      const GitEvidenceMap* evidence)
{
  auto model = makeHeuristicModel();
  std::vector<ProvenanceSignal> out;
  for (const auto& e : entities) {
    const GitEvidence* ev = nullptr;
    if (evidence) {
      auto it = evidence->find(e.id);
      if (it != evidence->end()) ev = &it->second;
    }
    if (auto signal = model->score(e, ev, threshold)) out.push_back(std::move(*signal));
  }
  return out;
}

} // namespace aicw
