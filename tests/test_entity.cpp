#include <gtest/gtest.h>
#include "model/Entity.hpp"
#include "model/Evidence.hpp"
#include "model/Finding.hpp"

using namespace aicw;

TEST(EntityTest, IdIsTwelveHexDigitsOfSha1) {
  EXPECT_EQ(makeEntityId("src/a.js", "src.a.f", 1), "fad65364d357");
  EXPECT_EQ(makeEntityId("sample_logic.js", "sample_logic.validateOrderPayload", 1),
            "c79cf43d3c75");
}

TEST(EntityTest, IdDependsOnEveryComponent) {
  std::string base = makeEntityId("a.cpp", "a.f", 3);
  EXPECT_EQ(base, makeEntityId("a.cpp", "a.f", 3));
  EXPECT_NE(base, makeEntityId("b.cpp", "a.f", 3));
  EXPECT_NE(base, makeEntityId("a.cpp", "a.g", 3));
  EXPECT_NE(base, makeEntityId("a.cpp", "a.f", 4));
}

TEST(EntityTest, ModuleNameFromPath) {
  EXPECT_EQ(moduleNameFromPath("src/Order.cpp"), "src.Order");
  EXPECT_EQ(moduleNameFromPath("pkg/util/index.js"), "pkg.util");
  EXPECT_EQ(moduleNameFromPath("main.ts"), "main");
  EXPECT_EQ(moduleNameFromPath("lib\\win\\path.hpp"), "lib.win.path");
  EXPECT_EQ(moduleNameFromPath("index.js"), "");
}

TEST(EntityTest, SliceLinesIsInclusiveAndOneBased) {
  const char* text = "one\ntwo\nthree\nfour\n";
  EXPECT_EQ(sliceLines(text, 2, 3), "two\nthree");
  EXPECT_EQ(sliceLines(text, 4, 4), "four");
  EXPECT_EQ(sliceLines(text, 3, 99), "three\nfour");
  EXPECT_EQ(sliceLines(text, 5, 6), "");
}

TEST(EntityTest, Names) {
  EXPECT_STREQ(languageName(SourceLanguage::Cpp), "cpp");
  EXPECT_STREQ(languageName(SourceLanguage::TypeScript), "typescript");
  EXPECT_FALSE(isLexical(SourceLanguage::Cpp));
  EXPECT_TRUE(isLexical(SourceLanguage::JavaScript));
  EXPECT_STREQ(confidenceName(Confidence::High), "high");
  EXPECT_STREQ(severityName(Severity::Medium), "medium");
}

TEST(SyntaxTreeTest, FirstFunctionAndBody) {
  SyntaxNode fn;
  fn.kind = SyntaxKind::Function;
  fn.text = "f";
  fn.children.push_back({SyntaxKind::Param, "x", {}});
  EXPECT_EQ(fn.body(), nullptr);
  fn.children.push_back({SyntaxKind::Block, "", {{SyntaxKind::Return, "", {}}}});
  ASSERT_NE(fn.body(), nullptr);
  EXPECT_EQ(fn.body()->children.size(), 1u);
  EXPECT_EQ(firstFunction(fn), &fn);

  SyntaxNode wrapper{SyntaxKind::Other, "TranslationUnit", {fn}};
  EXPECT_EQ(firstFunction(wrapper), &wrapper.children[0]);
  SyntaxNode empty{SyntaxKind::Block, "", {}};
  EXPECT_EQ(firstFunction(empty), nullptr);

  unsigned visited = 0;
  walk(wrapper, [&](const SyntaxNode&) { ++visited; });
  EXPECT_EQ(visited, 5u);
}
