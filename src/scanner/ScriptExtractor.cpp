#include "scanner/Extractor.hpp"
#include "scanner/ScriptLexer.hpp"

#include "llvm/ADT/STLExtras.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/Regex.h"

#include <algorithm>
#include <set>

namespace aicw {

namespace {

// Function-defining idioms, tried in this order. For a given start offset the
// first pattern that yields a resolvable body wins. A type annotation stays on
// one line and never crosses a brace or paren.
struct PatternSpec {
  const char* source;
  unsigned nameGroup;
  bool arrow;   // body must follow "=>" directly
};

constexpr PatternSpec Patterns[] = {
  // [async] function [*] name [<T>] (
  {"(async[[:space:]]+)?function[[:space:]]*[*]?[[:space:]]*([A-Za-z_$][A-Za-z0-9_$]*)"
   "[[:space:]]*(<[^>]*>)?[[:space:]]*[(]", 2, false},
  // [const|let|var] name = [async] function
  {"((const|let|var)[[:space:]]+)?([A-Za-z_$][A-Za-z0-9_$]*)[[:space:]]*(:[^=;{}()\n]*)?="
   "[[:space:]]*(async[[:space:]]+)?function[^A-Za-z0-9_$]", 3, false},
  // [const|let|var] name = [async] (params) =>
  {"((const|let|var)[[:space:]]+)?([A-Za-z_$][A-Za-z0-9_$]*)[[:space:]]*(:[^=;{}()\n]*)?="
   "[[:space:]]*(async[[:space:]]*)?[(][^()]*[)][^=;{}()]*=>", 3, true},
  // [const|let|var] name = [async] param =>
  {"((const|let|var)[[:space:]]+)?([A-Za-z_$][A-Za-z0-9_$]*)[[:space:]]*="
   "[[:space:]]*(async[[:space:]]+)?[A-Za-z_$][A-Za-z0-9_$]*[[:space:]]*=>", 3, true},
};

constexpr llvm::StringLiteral ScriptExtensions[] = {
  ".js", ".jsx", ".mjs", ".cjs", ".ts", ".tsx",
};

class LineTable {
  std::vector<size_t> Starts{0};
public:
  explicit LineTable(llvm::StringRef text) {
    for (size_t i = 0; i < text.size(); ++i)
      if (text[i] == '\n') Starts.push_back(i + 1);
  }
  size_t startOf(unsigned line) const { return Starts[line - 1]; }
  unsigned lineOf(size_t offset) const {
    return (unsigned)(std::upper_bound(Starts.begin(), Starts.end(), offset) - Starts.begin());
  }
};

class ScriptExtractorImpl final : public EntityExtractor {
  std::vector<llvm::Regex> Compiled;

public:
  ScriptExtractorImpl() {
    for (const auto& p : Patterns) Compiled.emplace_back(p.source);
  }

  bool handles(llvm::StringRef relativePath) const override {
    return llvm::is_contained(ScriptExtensions, llvm::sys::path::extension(relativePath));
  }

  bool extractFile(const std::string& /*absolutePath*/,
                   const std::string& relativePath,
                   llvm::StringRef content,
                   std::vector<Entity>& out) override
  {
    // Patterns run on masked text so keywords inside strings and comments
    // never match; braces are resolved on the unmasked text.
    std::string masked = maskScript(content);
    llvm::StringRef code(masked);
    LineTable lines(content);
    const std::string module = moduleNameFromPath(relativePath);
    auto ext = llvm::sys::path::extension(relativePath);
    const SourceLanguage lang = (ext == ".ts" || ext == ".tsx") ? SourceLanguage::TypeScript
                                                                : SourceLanguage::JavaScript;

    std::set<size_t> claimedStarts, claimedBodies;
    std::vector<Entity> found;

    for (size_t i = 0; i < Compiled.size(); ++i) {
      const PatternSpec& spec = Patterns[i];
      forEachMatch(Compiled[i], code, [&](llvm::ArrayRef<llvm::StringRef> groups, size_t start) {
        if (claimedStarts.count(start)) return;

        std::optional<size_t> open;
        if (spec.arrow) {
          size_t next = code.find_first_not_of(" \t\r\n", start + groups[0].size());
          if (next != llvm::StringRef::npos && code[next] == '{') open = next;
        } else {
          open = findBodyOpen(code, start);
        }
        if (!open) return;
        auto close = findMatchingBrace(content, *open);
        if (!close) return;
        // "const f = async function g() {" matches twice; one body, one entity
        if (!claimedBodies.insert(*open).second) return;
        claimedStarts.insert(start);

        Entity e;
        e.filePath = relativePath;
        e.name = groups[spec.nameGroup].str();
        e.qualifiedName = module.empty() ? e.name : module + "." + e.name;
        e.line = lines.lineOf(start);
        e.endLine = lines.lineOf(*close);
        e.id = makeEntityId(e.filePath, e.qualifiedName, e.line);
        e.source = sliceLines(content, e.line, e.endLine);
        e.declOffset = (unsigned)(start - lines.startOf(e.line));
        e.language = lang;
        found.push_back(std::move(e));
      });
    }

    std::stable_sort(found.begin(), found.end(),
                     [](const Entity& a, const Entity& b) { return a.line < b.line; });
    out.insert(out.end(), std::make_move_iterator(found.begin()),
               std::make_move_iterator(found.end()));
    return true;
  }
};

} // namespace

std::unique_ptr<EntityExtractor> makeScriptExtractor() {
  return std::make_unique<ScriptExtractorImpl>();
}

} // namespace aicw
