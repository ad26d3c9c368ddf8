#pragma once
#include "model/SyntaxTree.hpp"
#include "llvm/ADT/StringRef.h"
#include <memory>
#include <string>

namespace aicw {

enum class SourceLanguage { Cpp, JavaScript, TypeScript };

// Lexically scanned languages have no syntax tree attached.
inline bool isLexical(SourceLanguage lang) { return lang != SourceLanguage::Cpp; }

const char* languageName(SourceLanguage lang);

// One function or method definition found by the scanner.
struct Entity {
  std::string id;             // stable hash of file, qualified name and line
  std::string filePath;       // repo-relative, '/' separated
  std::string name;
  std::string qualifiedName;  // module.Type.name
  unsigned    line = 0;       // 1-based
  unsigned    endLine = 0;    // inclusive
  std::string source;         // exact text of [line, endLine]
  unsigned    declOffset = 0; // where the declaration starts within `source`
  SourceLanguage language = SourceLanguage::Cpp;
  std::shared_ptr<const SyntaxNode> syntax;  // null for lexical entities
};

// `source` from the declaration onward, without whatever precedes it on its
// first line.
inline llvm::StringRef declarationText(const Entity& e) {
  return llvm::StringRef(e.source).drop_front(e.declOffset);
}

// First 12 hex digits of SHA-1("<file>:<qualified>:<line>").
std::string makeEntityId(llvm::StringRef filePath, llvm::StringRef qualifiedName,
                         unsigned line);

// "pkg/util/index.js" -> "pkg.util", "src/Order.cpp" -> "src.Order"
std::string moduleNameFromPath(llvm::StringRef relativePath);

// Lines [line, endLine] of text, 1-based and inclusive, joined with '\n'.
std::string sliceLines(llvm::StringRef text, unsigned line, unsigned endLine);

} // namespace aicw
