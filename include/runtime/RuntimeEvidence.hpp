#pragma once
#include "model/Entity.hpp"
#include "model/Evidence.hpp"
#include "llvm/ADT/StringRef.h"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace aicw {

struct RuntimeRecord {
  int64_t invocations = 0;
  std::optional<std::string> lastInvokedAt;
};

// Function name (qualified or simple) -> observed invocations.
using RuntimeIndex = std::map<std::string, RuntimeRecord>;

// Accepts {"functions": {name: rec}}, {name: rec}, or [{"name": .., "invocations": ..}].
// A record is a number or an object with "invocations" or "count".
// Entries that do not fit are ignored; malformed JSON is an error.
bool parseRuntimeIndex(llvm::StringRef json, RuntimeIndex& out, std::string* error);

// An empty path yields an empty index.
bool loadRuntimeIndex(const std::string& path, RuntimeIndex& out, std::string* error);

// One record per entity, looked up by qualified name and then simple name.
RuntimeEvidenceMap mapRuntimeEvidence(const std::vector<Entity>& entities,
                                      const RuntimeIndex& index);

} // namespace aicw
