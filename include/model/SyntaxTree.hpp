#pragma once
#include <string>
#include <vector>

namespace aicw {

// Fixed set of node kinds kept from the Clang AST. Statements and expressions
// without a dedicated kind become Other, carrying the Clang class name as text.
enum class SyntaxKind {
  Function,       // text: simple name; children: Param..., Block
  Param,          // text: parameter name
  Block,
  If,             // children: condition, then, [else]
  Return,         // children: [value]
  Throw,          // children: [operand]
  Loop,           // text: for | range-for | while | do
  Try,
  Catch,
  Declaration,    // children: VarDecl...
  VarDecl,        // text: variable name; children: [initializer]
  Assign,         // text: operator spelling; children: target, value
  Operator,       // text: operator spelling
  Call,
  DeclRef,        // text: referenced name
  Member,         // text: member name; children: [base]
  StringLiteral,  // text: literal contents
  NumberLiteral,  // text: literal spelling
  OtherLiteral,   // text: literal spelling (char, bool, nullptr)
  Other           // text: Clang statement class name
};

struct SyntaxNode {
  SyntaxKind kind = SyntaxKind::Other;
  std::string text;
  std::vector<SyntaxNode> children;

  // Function nodes keep their body as the last child.
  const SyntaxNode* body() const;
};

const char* kindName(SyntaxKind kind);

// Returns the node itself when it is a function, otherwise its first
// function child, or nullptr.
const SyntaxNode* firstFunction(const SyntaxNode& root);

// Pre-order visit of node and all descendants.
template <typename Fn>
void walk(const SyntaxNode& node, Fn&& fn) {
  fn(node);
  for (const auto& child : node.children) walk(child, fn);
}

} // namespace aicw
