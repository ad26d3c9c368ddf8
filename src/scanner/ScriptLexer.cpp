#include "scanner/ScriptLexer.hpp"

#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringExtras.h"

#include <algorithm>
#include <cctype>

namespace aicw {

namespace {

const size_t npos = llvm::StringRef::npos;

enum class Region { Code, Comment, String, Template };

constexpr llvm::StringLiteral ScriptKeywords[] = {
  "abstract", "as", "async", "await", "break", "case", "catch", "class",
  "const", "continue", "debugger", "declare", "default", "delete", "do",
  "else", "enum", "export", "extends", "false", "finally", "for", "from",
  "function", "get", "if", "implements", "import", "in", "instanceof",
  "interface", "let", "new", "null", "of", "private", "protected", "public",
  "readonly", "return", "set", "static", "super", "switch", "this", "throw",
  "true", "try", "type", "typeof", "undefined", "var", "void", "while",
  "with", "yield",
};

constexpr llvm::StringLiteral ControlKeywords[] = {
  "if", "for", "while", "do", "switch", "try",
};

static bool startsComment(llvm::StringRef text, size_t pos) {
  return text[pos] == '/' && pos + 1 < text.size() &&
         (text[pos + 1] == '/' || text[pos + 1] == '*');
}

// Position after the comment starting at pos. Line comments stop at the newline.
static size_t skipComment(llvm::StringRef text, size_t pos) {
  if (text[pos + 1] == '/') {
    size_t nl = text.find('\n', pos);
    return nl == npos ? text.size() : nl;
  }
  size_t end = text.find("*/", pos + 2);
  return end == npos ? text.size() : end + 2;
}

// Position after a '...' or "..." literal. Unterminated literals end at the
// newline since script strings cannot span lines.
static size_t skipQuoted(llvm::StringRef text, size_t pos) {
  char quote = text[pos++];
  while (pos < text.size()) {
    char c = text[pos];
    if (c == '\\') { pos += 2; continue; }
    if (c == quote) return pos + 1;
    if (c == '\n') return pos;
    ++pos;
  }
  return text.size();
}

// Position after a `...` literal, or npos if it never closes.
static size_t skipTemplate(llvm::StringRef text, size_t pos) {
  ++pos;
  while (pos < text.size()) {
    char c = text[pos];
    if (c == '\\') { pos += 2; continue; }
    if (c == '`') return pos + 1;
    if (c == '$' && pos + 1 < text.size() && text[pos + 1] == '{') {
      auto close = findMatchingBrace(text, pos + 1);
      if (!close) return npos;
      pos = *close + 1;
      continue;
    }
    ++pos;
  }
  return npos;
}

// Splits text into code, comment and literal regions, in order.
template <typename Fn>
static void scanRegions(llvm::StringRef text, Fn&& fn) {
  size_t pos = 0, codeStart = 0;
  while (pos < text.size()) {
    char c = text[pos];
    Region kind;
    size_t end;
    if (startsComment(text, pos)) {
      kind = Region::Comment;
      end = skipComment(text, pos);
    } else if (c == '\'' || c == '"') {
      kind = Region::String;
      end = skipQuoted(text, pos);
    } else if (c == '`') {
      kind = Region::Template;
      end = skipTemplate(text, pos);
      if (end == npos) end = text.size();
    } else {
      ++pos;
      continue;
    }
    if (pos > codeStart) fn(Region::Code, codeStart, pos);
    fn(kind, pos, end);
    pos = codeStart = end;
  }
  if (text.size() > codeStart) fn(Region::Code, codeStart, text.size());
}

static bool isControlKeyword(llvm::StringRef word) {
  return llvm::is_contained(ControlKeywords, word);
}

} // namespace

bool isIdentifierChar(char c) {
  return std::isalnum((unsigned char)c) || c == '_' || c == '$';
}

bool isScriptKeyword(llvm::StringRef word) {
  return llvm::is_contained(ScriptKeywords, word);
}

std::optional<size_t> findMatchingBrace(llvm::StringRef text, size_t open) {
  if (open >= text.size() || text[open] != '{') return std::nullopt;
  unsigned depth = 0;
  size_t pos = open;
  while (pos < text.size()) {
    char c = text[pos];
    if (startsComment(text, pos)) { pos = skipComment(text, pos); continue; }
    if (c == '\'' || c == '"') { pos = skipQuoted(text, pos); continue; }
    if (c == '`') {
      size_t end = skipTemplate(text, pos);
      if (end == npos) return std::nullopt;
      pos = end;
      continue;
    }
    if (c == '{') {
      ++depth;
    } else if (c == '}') {
      if (--depth == 0) return pos;
    }
    ++pos;
  }
  return std::nullopt;
}

std::string maskScript(llvm::StringRef text) {
  std::string out = text.str();
  auto blank = [&](size_t begin, size_t end) {
    for (size_t i = begin; i < end; ++i)
      if (out[i] != '\n') out[i] = ' ';
  };
  scanRegions(text, [&](Region kind, size_t begin, size_t end) {
    switch (kind) {
    case Region::Code:
      break;
    case Region::Comment:
      blank(begin, end);
      break;
    case Region::String:
    case Region::Template: {
      // keep the delimiters so the literal still reads as one
      size_t last = end - 1;
      bool closed = end - begin >= 2 && text[last] == text[begin];
      blank(begin + 1, closed ? last : end);
      break;
    }
    }
  });
  return out;
}

std::vector<std::string> collectStringLiterals(llvm::StringRef text) {
  std::vector<std::string> out;
  scanRegions(text, [&](Region kind, size_t begin, size_t end) {
    if (kind != Region::String && kind != Region::Template) return;
    size_t last = end - 1;
    bool closed = end - begin >= 2 && text[last] == text[begin];
    out.push_back(text.slice(begin + 1, closed ? last : end).str());
  });
  return out;
}

std::optional<size_t> findBodyOpen(llvm::StringRef masked, size_t from) {
  unsigned parens = 0;
  for (size_t pos = from; pos < masked.size(); ++pos) {
    char c = masked[pos];
    if (c == '(') {
      ++parens;
    } else if (c == ')') {
      if (parens > 0) --parens;
    } else if (parens == 0) {
      if (c == ';') return std::nullopt;
      if (c == '{') return pos;
    }
  }
  return std::nullopt;
}

std::optional<llvm::StringRef> firstFunctionText(llvm::StringRef text) {
  std::string masked = maskScript(text);
  auto open = findBodyOpen(masked, 0);
  if (!open) return std::nullopt;
  auto close = findMatchingBrace(text, *open);
  if (!close) return std::nullopt;
  return text.take_front(*close + 1);
}

unsigned countBodyStatements(llvm::StringRef text) {
  std::string masked = maskScript(text);
  llvm::StringRef code(masked);
  auto open = findBodyOpen(code, 0);
  if (!open) return 0;
  auto close = findMatchingBrace(code, *open);
  if (!close) return 0;

  unsigned count = 0, braces = 0, parens = 0;
  for (size_t pos = *open; pos <= *close;) {
    char c = code[pos];
    if (isIdentifierChar(c) && !std::isdigit((unsigned char)c)) {
      size_t end = pos;
      while (end < code.size() && isIdentifierChar(code[end])) ++end;
      bool wordStart = pos == 0 || code[pos - 1] != '.';
      if (braces == 1 && wordStart && isControlKeyword(code.slice(pos, end))) ++count;
      pos = end;
      continue;
    }
    switch (c) {
    case '{': ++braces; break;
    case '}': --braces; break;
    case '(': ++parens; break;
    case ')': if (parens > 0) --parens; break;
    case ';': if (braces == 1 && parens == 0) ++count; break;
    default: break;
    }
    ++pos;
  }
  return count;
}

std::string canonicalizeScript(llvm::StringRef text) {
  llvm::SmallVector<std::string, 256> tokens;
  scanRegions(text, [&](Region kind, size_t begin, size_t end) {
    if (kind == Region::Comment) return;
    if (kind != Region::Code) {
      tokens.push_back("STR");
      return;
    }
    size_t pos = begin;
    while (pos < end) {
      char c = text[pos];
      if (std::isspace((unsigned char)c)) { ++pos; continue; }
      bool number = std::isdigit((unsigned char)c) ||
                    (c == '.' && pos + 1 < end && std::isdigit((unsigned char)text[pos + 1]));
      if (number) {
        while (pos < end && (isIdentifierChar(text[pos]) || text[pos] == '.')) ++pos;
        tokens.push_back("0");
        continue;
      }
      if (isIdentifierChar(c)) {
        size_t wordEnd = pos;
        while (wordEnd < end && isIdentifierChar(text[wordEnd])) ++wordEnd;
        llvm::StringRef word = text.slice(pos, wordEnd);
        tokens.push_back(isScriptKeyword(word) ? word.str() : std::string("id"));
        pos = wordEnd;
        continue;
      }
      tokens.push_back(std::string(1, c));
      ++pos;
    }
  });
  return llvm::join(tokens, " ");
}

void forEachMatch(llvm::Regex& re, llvm::StringRef text,
                  llvm::function_ref<void(llvm::ArrayRef<llvm::StringRef>, size_t)> fn) {
  llvm::SmallVector<llvm::StringRef, 8> groups;
  size_t offset = 0;
  while (offset < text.size()) {
    groups.clear();
    if (!re.match(text.drop_front(offset), &groups)) return;
    size_t start = groups[0].data() - text.data();
    if (start > 0 && (isIdentifierChar(text[start - 1]) || text[start - 1] == '.')) {
      offset = start + 1;
      continue;
    }
    fn(groups, start);
    offset = start + std::max<size_t>(groups[0].size(), 1);
  }
}

} // namespace aicw
