#include <gtest/gtest.h>
#include "scanner/ScriptLexer.hpp"
#include "TestSupport.hpp"

#include <vector>

using namespace aicw;

TEST(ScriptLexerTest, MatchingBraceSkipsStringsAndComments) {
  llvm::StringRef text = "{ a = '}'; b = \"{\"; // }\n /* } */ c(); }";
  auto close = findMatchingBrace(text, 0);
  ASSERT_TRUE(close.has_value());
  EXPECT_EQ(*close, text.size() - 1);
}

TEST(ScriptLexerTest, MatchingBraceSkipsTemplateSubstitutions) {
  llvm::StringRef text = "{ const s = `x ${ {a: 1}.a } }`; return s; } tail";
  auto close = findMatchingBrace(text, 0);
  ASSERT_TRUE(close.has_value());
  EXPECT_EQ(text.substr(*close), "} tail");
}

TEST(ScriptLexerTest, MatchingBraceFailsWhenUnbalanced) {
  EXPECT_FALSE(findMatchingBrace("{ if (x) { return 1; }", 0).has_value());
  EXPECT_FALSE(findMatchingBrace("x { }", 0).has_value());
  EXPECT_FALSE(findMatchingBrace("{ `never closed }", 0).has_value());
}

TEST(ScriptLexerTest, MaskKeepsOffsetsAndQuotes) {
  llvm::StringRef text = "a('function x() {}'); // function y() {\nb();";
  std::string masked = maskScript(text);
  ASSERT_EQ(masked.size(), text.size());
  EXPECT_EQ(masked.find("function"), std::string::npos);
  EXPECT_EQ(masked.find('\n'), text.find('\n'));
  EXPECT_EQ(llvm::StringRef(masked).take_front(3), "a('");
  EXPECT_EQ(llvm::StringRef(masked).drop_front(text.find('\n')), "\nb();");
}

TEST(ScriptLexerTest, StringLiteralsInOrder) {
  auto literals = collectStringLiterals("f('a', \"b\\\"c\", `t${x}`) // 'not'");
  std::vector<std::string> expected{"a", "b\\\"c", "t${x}"};
  EXPECT_EQ(literals, expected);
}

TEST(ScriptLexerTest, BodyOpenStopsAtStatementEnd) {
  EXPECT_EQ(findBodyOpen("f(a, {b}) {", 0), std::optional<size_t>(10));
  EXPECT_FALSE(findBodyOpen("x = f(a); {", 0).has_value());
}

TEST(ScriptLexerTest, FirstFunctionText) {
  auto fn = firstFunctionText("const f = (a) => { return a; }; trailing();");
  ASSERT_TRUE(fn.has_value());
  EXPECT_EQ(*fn, "const f = (a) => { return a; }");
  EXPECT_FALSE(firstFunctionText("no body here;").has_value());
}

TEST(ScriptLexerTest, StatementCountOnFixture) {
  llvm::StringRef text(test::SampleLogicJs);
  // three guards, two declarations, two assignments, one return
  EXPECT_EQ(countBodyStatements(text), 8u);

  size_t helper = text.find("function helper");
  ASSERT_NE(helper, llvm::StringRef::npos);
  EXPECT_EQ(countBodyStatements(text.drop_front(helper)), 2u);
}

TEST(ScriptLexerTest, StatementCountIgnoresForHeaders) {
  EXPECT_EQ(countBodyStatements("function f() { for (let i = 0; i < 3; i++) { g(); } h(); }"), 2u);
  EXPECT_EQ(countBodyStatements("function f() { obj.if = 1; }"), 1u);
}

TEST(ScriptLexerTest, CanonicalFormErasesNamesAndLiterals) {
  EXPECT_EQ(canonicalizeScript("const total = 'x' + 42.5; // note"),
            "const id = STR + 0 ;");
  EXPECT_EQ(canonicalizeScript("return left(a)"), canonicalizeScript("return right(b)"));
}

TEST(ScriptLexerTest, Keywords) {
  EXPECT_TRUE(isScriptKeyword("function"));
  EXPECT_TRUE(isScriptKeyword("await"));
  EXPECT_FALSE(isScriptKeyword("payload"));
  EXPECT_TRUE(isIdentifierChar('$'));
  EXPECT_FALSE(isIdentifierChar('.'));
}

TEST(ScriptLexerTest, MatchesInsideIdentifiersAreRejected) {
  llvm::Regex re("function");
  std::vector<size_t> offsets;
  forEachMatch(re, "myfunction(); obj.function(); function", [&](llvm::ArrayRef<llvm::StringRef>, size_t at) {
    offsets.push_back(at);
  });
  ASSERT_EQ(offsets.size(), 1u);
  EXPECT_EQ(offsets[0], 30u);
}
