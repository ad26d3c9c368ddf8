#include "model/SyntaxTree.hpp"

namespace aicw {

const SyntaxNode* SyntaxNode::body() const {
  if (children.empty() || children.back().kind != SyntaxKind::Block) return nullptr;
  return &children.back();
}

const char* kindName(SyntaxKind kind) {
  switch (kind) {
  case SyntaxKind::Function:      return "Function";
  case SyntaxKind::Param:         return "Param";
  case SyntaxKind::Block:         return "Block";
  case SyntaxKind::If:            return "If";
  case SyntaxKind::Return:        return "Return";
  case SyntaxKind::Throw:         return "Throw";
  case SyntaxKind::Loop:          return "Loop";
  case SyntaxKind::Try:           return "Try";
  case SyntaxKind::Catch:         return "Catch";
  case SyntaxKind::Declaration:   return "Declaration";
  case SyntaxKind::VarDecl:       return "VarDecl";
  case SyntaxKind::Assign:        return "Assign";
  case SyntaxKind::Operator:      return "Operator";
  case SyntaxKind::Call:          return "Call";
  case SyntaxKind::DeclRef:       return "DeclRef";
  case SyntaxKind::Member:        return "Member";
  case SyntaxKind::StringLiteral: return "StringLiteral";
  case SyntaxKind::NumberLiteral: return "NumberLiteral";
  case SyntaxKind::OtherLiteral:  return "OtherLiteral";
  case SyntaxKind::Other:         return "Other";
  }
  return "Other";
}

const SyntaxNode* firstFunction(const SyntaxNode& root) {
  if (root.kind == SyntaxKind::Function) return &root;
  for (const auto& child : root.children)
    if (child.kind == SyntaxKind::Function) return &child;
  return nullptr;
}

} // namespace aicw
