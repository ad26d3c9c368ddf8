#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace aicw {

enum class Confidence { Medium, High };

const char* confidenceName(Confidence c);

struct ProvenanceSignal {
  std::string entityId;
  double      probability = 0.0;   // [0, 0.99], two decimals
  Confidence  confidence = Confidence::Medium;
  std::vector<std::string> signals;  // labels, in rule order
};

struct DuplicationPair {
  std::string entityA;   // earlier in scan order
  std::string entityB;
  double      overlap = 0.0;       // [0, 1], three decimals
  Confidence  confidence = Confidence::High;
};

// Blame fields are only set when `available`; file counts are set whenever
// the file history could be queried.
struct GitEvidence {
  std::string entityId;
  bool available = false;
  std::optional<unsigned> blameCommitCount;
  std::optional<unsigned> blameAuthorCount;
  std::optional<double>   lineCommitConcentration;
  std::optional<int64_t>  lastCommitAgeDays;
  std::optional<unsigned> fileCommitCount;
  std::optional<unsigned> fileAuthorCount;
};

using GitEvidenceMap = std::map<std::string, GitEvidence>;

struct RuntimeEvidence {
  std::string entityId;
  std::optional<int64_t>     invocationCount;
  std::optional<std::string> lastInvokedAt;
  std::string source;   // runtime-file | runtime-unmapped | runtime-unavailable
};

using RuntimeEvidenceMap = std::map<std::string, RuntimeEvidence>;

} // namespace aicw
