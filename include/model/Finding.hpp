#pragma once
#include <optional>
#include <string>
#include <vector>

namespace aicw {

enum class Severity { Low, Medium };

const char* severityName(Severity s);

struct Finding {
  std::string type;           // eg. "runtime_unused_review", "consolidation_candidate_review"
  Severity    severity = Severity::Low;
  std::string title;
  std::vector<std::string> entityIds;
  std::vector<std::string> evidence;            // "key=value" strings
  std::optional<double>    estimatedAnnualCost; // only with a cost per invocation
};

} // namespace aicw
