#include "runtime/RuntimeEvidence.hpp"
#include "support/FileIO.hpp"

#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"
#include "llvm/Support/raw_ostream.h"

#include <cmath>

namespace json = llvm::json;
namespace aicw {

namespace {

static std::optional<int64_t> asCount(const json::Value& v) {
  if (auto i = v.getAsInteger()) return *i;
  if (auto d = v.getAsNumber()) {
    // counts that do not fit int64_t are unusable
    double t = std::trunc(*d);
    if (!std::isfinite(t) || t < -9223372036854775808.0 || t >= 9223372036854775808.0)
      return std::nullopt;
    return (int64_t)t;
  }
  if (auto s = v.getAsString()) {
    int64_t parsed;
    if (!s->trim().getAsInteger(10, parsed)) return parsed;
  }
  return std::nullopt;
}

static std::optional<RuntimeRecord> coerce(const json::Value& v) {
  if (v.kind() == json::Value::Number) {
    auto count = asCount(v);
    if (!count) return std::nullopt;
    RuntimeRecord r;
    r.invocations = *count;
    return r;
  }
  const json::Object* obj = v.getAsObject();
  if (!obj) return std::nullopt;

  const json::Value* raw = obj->get("invocations");
  if (!raw) raw = obj->get("count");
  if (!raw) return std::nullopt;
  auto count = asCount(*raw);
  if (!count) return std::nullopt;

  RuntimeRecord r;
  r.invocations = *count;
  if (const json::Value* last = obj->get("last_invoked_at")) {
    if (auto s = last->getAsString()) {
      r.lastInvokedAt = s->str();
    } else if (last->kind() != json::Value::Null) {
      std::string text;
      llvm::raw_string_ostream os(text);
      os << *last;
      r.lastInvokedAt = os.str();
    }
  }
  return r;
}

static void indexObject(const json::Object& obj, RuntimeIndex& out) {
  for (const auto& kv : obj)
    if (auto rec = coerce(kv.second)) out[kv.first.str()] = std::move(*rec);
}

static std::optional<std::string> rowName(const json::Object& row) {
  for (llvm::StringRef key : {"name", "qualified_name", "function"}) {
    if (auto s = row.getString(key))
      if (!s->empty()) return s->str();
  }
  return std::nullopt;
}

} // namespace

bool parseRuntimeIndex(llvm::StringRef text, RuntimeIndex& out, std::string* error) {
  auto parsed = json::parse(text);
  if (!parsed) {
    if (error) *error = "Invalid runtime JSON: " + llvm::toString(parsed.takeError());
    return false;
  }

  if (const json::Object* obj = parsed->getAsObject()) {
    const json::Value* functions = obj->get("functions");
    if (functions && functions->getAsObject()) indexObject(*functions->getAsObject(), out);
    else indexObject(*obj, out);
  } else if (const json::Array* rows = parsed->getAsArray()) {
    for (const auto& row : *rows) {
      const json::Object* fields = row.getAsObject();
      if (!fields) continue;
      auto name = rowName(*fields);
      if (!name) continue;
      if (auto rec = coerce(row)) out[*name] = std::move(*rec);
    }
  }
  return true;
}

bool loadRuntimeIndex(const std::string& path, RuntimeIndex& out, std::string* error) {
  if (path.empty()) return true;
  std::string content;
  if (!readFile(path, content)) {
    if (error) *error = "Failed to read runtime file " + path;
    return false;
  }
  return parseRuntimeIndex(content, out, error);
}

RuntimeEvidenceMap mapRuntimeEvidence(const std::vector<Entity>& entities,
                                      const RuntimeIndex& index) {
  RuntimeEvidenceMap mapped;
  for (const auto& e : entities) {
    RuntimeEvidence ev;
    ev.entityId = e.id;
    auto it = index.find(e.qualifiedName);
    if (it == index.end()) it = index.find(e.name);
    if (it != index.end()) {
      ev.invocationCount = it->second.invocations;
      ev.lastInvokedAt = it->second.lastInvokedAt;
      ev.source = "runtime-file";
    } else {
      ev.source = index.empty() ? "runtime-unavailable" : "runtime-unmapped";
    }
    mapped[e.id] = std::move(ev);
  }
  return mapped;
}

} // namespace aicw
