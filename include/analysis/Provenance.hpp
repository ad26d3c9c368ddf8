#pragma once
#include "model/Entity.hpp"
#include "model/Evidence.hpp"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace aicw {

// Structural measurements of one function, from either the syntax tree or
// the raw text of a lexically scanned entity.
struct FunctionFeatures {
  unsigned statementCount = 0;     // top-level body statements
  unsigned guardClauses = 0;       // leading if -> return/throw guards
  unsigned conditionals = 0;       // every if, nested ones included
  std::vector<std::string> assignedNames;   // lowercase
  std::vector<std::string> errorMessages;   // lowercase literals naming an error
  bool genericReturn = false;      // ends with `return <generic name>`
  bool hasLoopOrHandler = false;

  double genericNameRatio() const;
  double defensiveDensity() const;
  bool repetitiveErrors() const;
};

bool isGenericName(llvm::StringRef lowercaseName);

std::optional<FunctionFeatures> extractFeatures(const Entity& entity);

struct StructuralRule {
  const char* label;
  double weight;
  bool (*applies)(const FunctionFeatures&);
};

struct EvidenceRule {
  const char* label;
  double delta;
  bool (*applies)(const GitEvidence&);
};

// Evaluated in table order; labels appear in the signal in the same order.
llvm::ArrayRef<StructuralRule> structuralRules();
llvm::ArrayRef<EvidenceRule> evidenceRules();

// Scores one entity. Returns nullopt when the entity has no analyzable
// function or scores below the threshold.
class ProvenanceModel {
public:
  virtual ~ProvenanceModel() = default;
  virtual std::optional<ProvenanceSignal>
  score(const Entity& entity, const GitEvidence* evidence, double threshold) = 0;
};

// The additive rule-table model; always available.
std::unique_ptr<ProvenanceModel> makeHeuristicModel();

// One signal per entity at or above `threshold`, in entity order. Git
// adjustments apply only to entities present in `evidence`.
std::vector<ProvenanceSignal> detectProvenanceSignals(const std::vector<Entity>& entities,
                                                      double threshold,
                                                      const GitEvidenceMap* evidence = nullptr);

} // namespace aicw
