#pragma once
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Regex.h"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace aicw {

// Text helpers for JavaScript/TypeScript sources. None of this is a parser:
// it only knows enough about string literals, template literals and comments
// to keep braces and keywords inside them from being mistaken for code.

// Index of the '}' matching the '{' at `open`, skipping quoted strings,
// template literals (including nested ${...}) and comments.
std::optional<size_t> findMatchingBrace(llvm::StringRef text, size_t open);

// Same length as `text`: comments blanked, string/template contents blanked
// (quotes kept). Newlines are preserved so offsets map to the same lines.
std::string maskScript(llvm::StringRef text);

// Contents of every quoted or template literal, in source order.
std::vector<std::string> collectStringLiterals(llvm::StringRef text);

// First '{' at parenthesis depth 0 at or after `from` in masked text.
// A ';' at depth 0 ends the search.
std::optional<size_t> findBodyOpen(llvm::StringRef masked, size_t from);

// Prefix of `text` ending at the brace that closes its first function body.
std::optional<llvm::StringRef> firstFunctionText(llvm::StringRef text);

// Statement estimate for the first function body in `text`: ';' plus control
// keywords (if, for, while, do, switch, try) at brace depth 1.
unsigned countBodyStatements(llvm::StringRef text);

// Comment-free token stream with literals and identifiers replaced by
// placeholders, single-space separated.
std::string canonicalizeScript(llvm::StringRef text);

bool isScriptKeyword(llvm::StringRef word);
bool isIdentifierChar(char c);

// Calls fn(matches, offset) for every match of `re` in `text` whose start is
// not preceded by an identifier character or '.'.
void forEachMatch(llvm::Regex& re, llvm::StringRef text,
                  llvm::function_ref<void(llvm::ArrayRef<llvm::StringRef>, size_t)> fn);

} // namespace aicw
