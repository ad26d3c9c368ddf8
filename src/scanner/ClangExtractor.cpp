#include "scanner/Extractor.hpp"

#include "clang/AST/ASTContext.h"
#include "clang/AST/Decl.h"
#include "clang/AST/DeclCXX.h"
#include "clang/AST/Expr.h"
#include "clang/AST/ExprCXX.h"
#include "clang/AST/Stmt.h"
#include "clang/AST/StmtCXX.h"
#include "clang/ASTMatchers/ASTMatchFinder.h"
#include "clang/ASTMatchers/ASTMatchers.h"
#include "clang/Basic/Diagnostic.h"
#include "clang/Basic/OperatorKinds.h"
#include "clang/Basic/SourceManager.h"
#include "clang/Lex/Lexer.h"
#include "clang/Tooling/ArgumentsAdjusters.h"
#include "clang/Tooling/CompilationDatabase.h"
#include "clang/Tooling/Tooling.h"
#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/WithColor.h"

#include <algorithm>
#include <cstdlib>

using namespace clang;
using namespace clang::tooling;
using namespace clang::ast_matchers;

namespace aicw {

namespace {

constexpr llvm::StringLiteral CppExtensions[] = {
  ".c", ".cc", ".cpp", ".cxx", ".c++", ".h", ".hh", ".hpp", ".hxx",
};

// Counts diagnostics without printing them; any error drops the file.
class SilentDiagnostics : public DiagnosticConsumer {
public:
  void HandleDiagnostic(DiagnosticsEngine::Level Level, const Diagnostic& Info) override {
    DiagnosticConsumer::HandleDiagnostic(Level, Info);
  }
};

// Lowers a Clang function definition into the fixed SyntaxNode kind set.
// Implicit casts, temporaries and elided constructors are looked through so
// the tree mirrors what is spelled in the source.
class SyntaxBuilder {
  const ASTContext& Ctx;

  static SyntaxNode leaf(SyntaxKind kind, std::string text = "") {
    SyntaxNode n;
    n.kind = kind;
    n.text = std::move(text);
    return n;
  }

  SyntaxNode node(SyntaxKind kind, std::string text,
                  std::initializer_list<const Stmt*> children) {
    SyntaxNode n = leaf(kind, std::move(text));
    for (const Stmt* child : children)
      if (child) n.children.push_back(stmt(child));
    return n;
  }

  std::string spelling(const Stmt* S) const {
    return Lexer::getSourceText(CharSourceRange::getTokenRange(S->getSourceRange()),
                                Ctx.getSourceManager(), Ctx.getLangOpts()).str();
  }

  SyntaxNode var(const VarDecl* VD) {
    SyntaxNode n = leaf(SyntaxKind::VarDecl, VD->getNameAsString());
    if (VD->hasInit()) n.children.push_back(stmt(VD->getInit()));
    return n;
  }

public:
  explicit SyntaxBuilder(const ASTContext& C) : Ctx(C) {}

  SyntaxNode function(const FunctionDecl* FD) {
    SyntaxNode fn = leaf(SyntaxKind::Function, FD->getNameAsString());
    for (const ParmVarDecl* P : FD->parameters())
      fn.children.push_back(leaf(SyntaxKind::Param, P->getNameAsString()));
    SyntaxNode body = stmt(FD->getBody());
    if (body.kind != SyntaxKind::Block) {
      // function-try-block
      SyntaxNode wrapper = leaf(SyntaxKind::Block);
      wrapper.children.push_back(std::move(body));
      body = std::move(wrapper);
    }
    fn.children.push_back(std::move(body));
    return fn;
  }

  SyntaxNode stmt(const Stmt* S) {
    if (!S) return leaf(SyntaxKind::Other, "<null>");
    if (const auto* E = dyn_cast<Expr>(S)) S = E->IgnoreUnlessSpelledInSource();

    if (const auto* CS = dyn_cast<CompoundStmt>(S)) {
      SyntaxNode n = leaf(SyntaxKind::Block);
      for (const Stmt* child : CS->body()) n.children.push_back(stmt(child));
      return n;
    }
    if (const auto* If = dyn_cast<IfStmt>(S))
      return node(SyntaxKind::If, "", {If->getCond(), If->getThen(), If->getElse()});
    if (const auto* R = dyn_cast<ReturnStmt>(S))
      return node(SyntaxKind::Return, "", {R->getRetValue()});
    if (const auto* T = dyn_cast<CXXThrowExpr>(S))
      return node(SyntaxKind::Throw, "", {T->getSubExpr()});
    if (const auto* F = dyn_cast<ForStmt>(S))
      return node(SyntaxKind::Loop, "for", {F->getInit(), F->getCond(), F->getInc(), F->getBody()});
    if (const auto* RF = dyn_cast<CXXForRangeStmt>(S)) {
      SyntaxNode n = leaf(SyntaxKind::Loop, "range-for");
      if (const VarDecl* LV = RF->getLoopVariable()) n.children.push_back(var(LV));
      n.children.push_back(stmt(RF->getRangeInit()));
      n.children.push_back(stmt(RF->getBody()));
      return n;
    }
    if (const auto* W = dyn_cast<WhileStmt>(S))
      return node(SyntaxKind::Loop, "while", {W->getCond(), W->getBody()});
    if (const auto* D = dyn_cast<DoStmt>(S))
      return node(SyntaxKind::Loop, "do", {D->getBody(), D->getCond()});
    if (const auto* Try = dyn_cast<CXXTryStmt>(S)) {
      SyntaxNode n = node(SyntaxKind::Try, "", {Try->getTryBlock()});
      for (unsigned i = 0; i < Try->getNumHandlers(); ++i) {
        const CXXCatchStmt* Handler = Try->getHandler(i);
        SyntaxNode c = leaf(SyntaxKind::Catch);
        if (const VarDecl* EV = Handler->getExceptionDecl()) c.children.push_back(var(EV));
        c.children.push_back(stmt(Handler->getHandlerBlock()));
        n.children.push_back(std::move(c));
      }
      return n;
    }
    if (const auto* DS = dyn_cast<DeclStmt>(S)) {
      SyntaxNode n = leaf(SyntaxKind::Declaration);
      for (const Decl* D : DS->decls()) {
        if (const auto* VD = dyn_cast<VarDecl>(D)) n.children.push_back(var(VD));
        else n.children.push_back(leaf(SyntaxKind::Other, D->getDeclKindName()));
      }
      return n;
    }
    if (const auto* BO = dyn_cast<BinaryOperator>(S))
      return node(BO->isAssignmentOp() ? SyntaxKind::Assign : SyntaxKind::Operator,
                  BO->getOpcodeStr().str(), {BO->getLHS(), BO->getRHS()});
    if (const auto* OC = dyn_cast<CXXOperatorCallExpr>(S)) {
      SyntaxNode n = leaf(OC->isAssignmentOp() ? SyntaxKind::Assign : SyntaxKind::Operator,
                          getOperatorSpelling(OC->getOperator()));
      for (const Expr* Arg : OC->arguments()) n.children.push_back(stmt(Arg));
      return n;
    }
    if (const auto* UO = dyn_cast<UnaryOperator>(S))
      return node(SyntaxKind::Operator, UnaryOperator::getOpcodeStr(UO->getOpcode()).str(),
                  {UO->getSubExpr()});
    if (const auto* Call = dyn_cast<CallExpr>(S)) {
      SyntaxNode n = node(SyntaxKind::Call, "", {Call->getCallee()});
      for (const Expr* Arg : Call->arguments()) n.children.push_back(stmt(Arg));
      return n;
    }
    if (const auto* DR = dyn_cast<DeclRefExpr>(S))
      return leaf(SyntaxKind::DeclRef, DR->getNameInfo().getAsString());
    if (const auto* ME = dyn_cast<MemberExpr>(S)) {
      SyntaxNode n = leaf(SyntaxKind::Member, ME->getMemberNameInfo().getAsString());
      if (!ME->isImplicitAccess()) n.children.push_back(stmt(ME->getBase()));
      return n;
    }
    if (const auto* SL = dyn_cast<clang::StringLiteral>(S))
      return leaf(SyntaxKind::StringLiteral,
                  SL->getCharByteWidth() == 1 ? SL->getString().str() : spelling(SL));
    if (isa<IntegerLiteral, FloatingLiteral, ImaginaryLiteral, FixedPointLiteral>(S))
      return leaf(SyntaxKind::NumberLiteral, spelling(S));
    if (isa<CharacterLiteral, CXXBoolLiteralExpr, CXXNullPtrLiteralExpr>(S))
      return leaf(SyntaxKind::OtherLiteral, spelling(S));

    SyntaxNode n = leaf(SyntaxKind::Other, S->getStmtClassName());
    for (const Stmt* child : S->children())
      if (child) n.children.push_back(stmt(child));
    return n;
  }
};

static std::vector<std::string> enclosingTypes(const FunctionDecl* FD) {
  std::vector<std::string> names;
  for (const DeclContext* DC = FD->getDeclContext(); DC && !DC->isTranslationUnit();
       DC = DC->getParent()) {
    if (const auto* RD = dyn_cast<RecordDecl>(DC))
      if (!RD->getName().empty()) names.push_back(RD->getNameAsString());
  }
  std::reverse(names.begin(), names.end());
  return names;
}

class FunctionCollector : public MatchFinder::MatchCallback {
  const std::string& RelPath;
  const std::string& Module;
  llvm::StringRef Content;
  std::vector<Entity>& Out;

public:
  FunctionCollector(const std::string& rel, const std::string& module,
                    llvm::StringRef content, std::vector<Entity>& out)
    : RelPath(rel), Module(module), Content(content), Out(out) {}

  void run(const MatchFinder::MatchResult& Result) override {
    const auto* FD = Result.Nodes.getNodeAs<FunctionDecl>("func");
    if (!FD || !FD->doesThisDeclarationHaveABody() || !FD->getBody()) return;
    if (const auto* MD = dyn_cast<CXXMethodDecl>(FD))
      if (MD->getParent()->isLambda()) return;

    const auto& SM = *Result.SourceManager;
    Entity e;
    e.filePath = RelPath;
    e.name = FD->getNameAsString();
    e.line = SM.getExpansionLineNumber(FD->getBeginLoc());
    e.endLine = std::max(e.line, SM.getExpansionLineNumber(FD->getEndLoc()));

    std::vector<std::string> parts;
    if (!Module.empty()) parts.push_back(Module);
    for (auto& type : enclosingTypes(FD)) parts.push_back(std::move(type));
    parts.push_back(e.name);
    e.qualifiedName = llvm::join(parts, ".");

    e.id = makeEntityId(e.filePath, e.qualifiedName, e.line);
    e.source = sliceLines(Content, e.line, e.endLine);
    e.language = SourceLanguage::Cpp;
    SyntaxBuilder builder(*Result.Context);
    e.syntax = std::make_shared<const SyntaxNode>(builder.function(FD));
    Out.push_back(std::move(e));
  }
};

static std::string resourceDir() {
  if (const char* rd = std::getenv("CLANG_RESOURCE_DIR")) return rd;
  return AICW_CLANG_RESOURCE_DIR;
}

class ClangExtractorImpl final : public EntityExtractor {
  std::string Root;
  ScanOptions Opts;
  std::unique_ptr<CompilationDatabase> Compilations;

  // Without a compilation database, project headers resolve from the root
  // and from <root>/include.
  std::vector<std::string> fallbackArgs(llvm::StringRef rel) const {
    std::vector<std::string> args;
    if (llvm::sys::path::extension(rel) == ".c") args = {"-xc", "-std=c11"};
    else args = {"-xc++", "-std=c++17"};
    llvm::SmallString<256> include(Root);
    llvm::sys::path::append(include, "include");
    args.push_back("-I" + Root);
    args.push_back("-I" + include.str().str());
    return args;
  }

public:
  ClangExtractorImpl(const std::string& root, const ScanOptions& opts)
    : Root(root), Opts(opts)
  {
    std::string err;
    if (auto found = CompilationDatabase::autoDetectFromDirectory(root, err))
      Compilations = inferMissingCompileCommands(std::move(found));
    else if (opts.verbose)
      llvm::WithColor::note() << "no compilation database under " << root
                              << "; using default flags\n";
  }

  bool handles(llvm::StringRef relativePath) const override {
    return llvm::is_contained(CppExtensions, llvm::sys::path::extension(relativePath));
  }

  bool extractFile(const std::string& absolutePath,
                   const std::string& relativePath,
                   llvm::StringRef content,
                   std::vector<Entity>& out) override
  {
    std::unique_ptr<CompilationDatabase> fixed;
    const CompilationDatabase* db = Compilations.get();
    if (!db) {
      fixed = std::make_unique<FixedCompilationDatabase>(Root, fallbackArgs(relativePath));
      db = fixed.get();
    }

    std::vector<std::string> sources{absolutePath};
    ClangTool Tool(*db, sources);
    Tool.mapVirtualFile(absolutePath, content);
    Tool.setPrintErrorMessage(false);
    SilentDiagnostics diags;
    Tool.setDiagnosticConsumer(&diags);

    if (!Opts.extraArgs.empty())
      Tool.appendArgumentsAdjuster(
        getInsertArgumentAdjuster(Opts.extraArgs, ArgumentInsertPosition::END));
    Tool.appendArgumentsAdjuster(
      getInsertArgumentAdjuster({"-resource-dir", resourceDir()}, ArgumentInsertPosition::BEGIN));
    if (const char* sdk = std::getenv("SDKROOT"))
      Tool.appendArgumentsAdjuster(
        getInsertArgumentAdjuster({"-isysroot", sdk}, ArgumentInsertPosition::BEGIN));

    std::vector<Entity> found;
    const std::string module = moduleNameFromPath(relativePath);
    FunctionCollector collector(relativePath, module, content, found);

    MatchFinder Finder;
    auto FunctionMatcher =
      functionDecl(isDefinition(), isExpansionInMainFile(),
                   unless(isImplicit()), unless(isInstantiated()))
        .bind("func");
    Finder.addMatcher(FunctionMatcher, &collector);

    int res = Tool.run(newFrontendActionFactory(&Finder).get());
    if (res != 0 || diags.getNumErrors() > 0) {
      if (Opts.verbose)
        llvm::WithColor::note() << "skipping " << relativePath << ": "
                                << diags.getNumErrors() << " parse error(s)\n";
      return false;
    }

    std::stable_sort(found.begin(), found.end(),
                     [](const Entity& a, const Entity& b) { return a.line < b.line; });
    out.insert(out.end(), std::make_move_iterator(found.begin()),
               std::make_move_iterator(found.end()));
    return true;
  }
};

} // namespace

std::unique_ptr<EntityExtractor> makeClangExtractor(const std::string& repoRoot,
                                                    const ScanOptions& opts) {
  return std::make_unique<ClangExtractorImpl>(repoRoot, opts);
}

} // namespace aicw
