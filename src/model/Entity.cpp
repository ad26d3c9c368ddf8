#include "model/Entity.hpp"
#include "model/Evidence.hpp"
#include "model/Finding.hpp"

#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/SHA1.h"

#include <algorithm>

namespace aicw {

const char* languageName(SourceLanguage lang) {
  switch (lang) {
  case SourceLanguage::Cpp:        return "cpp";
  case SourceLanguage::JavaScript: return "javascript";
  case SourceLanguage::TypeScript: return "typescript";
  }
  return "unknown";
}

const char* confidenceName(Confidence c) {
  return c == Confidence::High ? "high" : "medium";
}

const char* severityName(Severity s) {
  return s == Severity::Medium ? "medium" : "low";
}

std::string makeEntityId(llvm::StringRef filePath, llvm::StringRef qualifiedName,
                         unsigned line) {
  std::string raw = (filePath + ":" + qualifiedName + ":" + llvm::Twine(line)).str();
  auto digest = llvm::SHA1::hash(llvm::arrayRefFromStringRef(raw));
  return llvm::toHex(digest, /*LowerCase=*/true).substr(0, 12);
}

std::string moduleNameFromPath(llvm::StringRef relativePath) {
  std::string normalized = relativePath.str();
  for (auto& c : normalized) if (c == '\\') c = '/';

  llvm::SmallVector<llvm::StringRef, 8> parts;
  llvm::StringRef(normalized).split(parts, '/', -1, /*KeepEmpty=*/false);
  if (parts.empty()) return "";

  // strip the extension of the file segment only
  auto dot = parts.back().rfind('.');
  if (dot != llvm::StringRef::npos && dot > 0) parts.back() = parts.back().take_front(dot);
  if (parts.back() == "index") parts.pop_back();
  return llvm::join(parts, ".");
}

std::string sliceLines(llvm::StringRef text, unsigned line, unsigned endLine) {
  llvm::SmallVector<llvm::StringRef, 64> lines;
  text.split(lines, '\n');
  // a trailing newline does not start another line
  if (!lines.empty() && lines.back().empty() && text.endswith("\n")) lines.pop_back();

  unsigned first = line > 0 ? line - 1 : 0;
  unsigned last = std::min<unsigned>(endLine, lines.size());
  std::string out;
  for (unsigned i = first; i < last; ++i) {
    if (i != first) out += '\n';
    out += lines[i].str();
  }
  return out;
}

} // namespace aicw
