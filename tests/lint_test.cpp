#include "read_zero_byte_vec.hpp"

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "parse_state.hpp"
#include "session.hpp"

using namespace smir;

class ReadZeroByteVecTest : public ::testing::Test {
protected:
    Session session{};

    // Lints `body` wrapped in a function and returns the lint's diagnostics.
    std::vector<Diagnostic> lint(const std::string& body) {
        session.diags.clear();
        FileId file = session.add_source("lint.rs", "fn read_buf() {\n" + body + "\n}\n");
        ParseState* parsed = session.parse(file);
        EXPECT_NE(parsed, nullptr);
        EXPECT_FALSE(session.has_errors()) << "parse failed for:\n" << body;
        if (!parsed || !parsed->root) return {};

        check_read_zero_byte_vec(session, *parsed->root);
        std::vector<Diagnostic> out{};
        for (const Diagnostic& d : session.diags) {
            if (d.code == DiagCode::ReadZeroByteVec) out.push_back(d);
        }
        return out;
    }

    std::string snippet(const Span& span) const { return session.sources.snippet(span, "<none>"); }
};

TEST_F(ReadZeroByteVecTest, ConstantCapacitySuggestsResize) {
    std::vector<Diagnostic> diags = lint(
        "let mut v = Vec::with_capacity(100);\n"
        "f.read(&mut v);");
    ASSERT_EQ(diags.size(), 1u);
    const Diagnostic& d = diags[0];
    EXPECT_EQ(d.severity, Severity::Error);
    EXPECT_EQ(d.message, "reading zero byte data to `Vec`");
    EXPECT_EQ(snippet(d.span), "f.read(&mut v);");
    EXPECT_EQ(d.span.begin.line, 3u);

    ASSERT_TRUE(d.suggestion.has_value());
    EXPECT_EQ(d.suggestion->message, "try");
    EXPECT_EQ(d.suggestion->replacement, "v.resize(100, 0); f.read(&mut v);");
    EXPECT_EQ(d.suggestion->applicability, Applicability::MaybeIncorrect);
}

TEST_F(ReadZeroByteVecTest, InterveningStatementSuppresses) {
    EXPECT_TRUE(lint("let mut v = Vec::with_capacity(100);\n"
                     "v.push(1);\n"
                     "f.read(&mut v);")
                    .empty());
}

TEST_F(ReadZeroByteVecTest, ExpressionCapacityIsCopiedVerbatim) {
    std::vector<Diagnostic> diags = lint(
        "let mut v = Vec::with_capacity(n * 2);\n"
        "f.read_exact(&mut v);");
    ASSERT_EQ(diags.size(), 1u);
    ASSERT_TRUE(diags[0].suggestion.has_value());
    EXPECT_EQ(diags[0].suggestion->replacement, "v.resize(n * 2, 0); f.read_exact(&mut v);");
}

TEST_F(ReadZeroByteVecTest, ConstantExpressionIsFolded) {
    std::vector<Diagnostic> diags = lint(
        "let mut v = Vec::with_capacity(2 * 8);\n"
        "f.read(&mut v);");
    ASSERT_EQ(diags.size(), 1u);
    ASSERT_TRUE(diags[0].suggestion.has_value());
    EXPECT_EQ(diags[0].suggestion->replacement, "v.resize(16, 0); f.read(&mut v);");
}

TEST_F(ReadZeroByteVecTest, OverflowingCapacityIsNotFolded) {
    std::vector<Diagnostic> diags = lint(
        "let mut v = Vec::with_capacity(18446744073709551615 + 1);\n"
        "f.read(&mut v);");
    ASSERT_EQ(diags.size(), 1u);
    ASSERT_TRUE(diags[0].suggestion.has_value());
    EXPECT_EQ(diags[0].suggestion->replacement, "v.resize(18446744073709551615 + 1, 0); f.read(&mut v);");
}

TEST_F(ReadZeroByteVecTest, EmptyVecHasNoSuggestion) {
    std::vector<Diagnostic> diags = lint(
        "let mut v = Vec::new();\n"
        "f.read_exact(&mut v);");
    ASSERT_EQ(diags.size(), 1u);
    EXPECT_FALSE(diags[0].suggestion.has_value());

    diags = lint(
        "let mut w = Vec::default();\n"
        "f.read(&mut w);");
    EXPECT_EQ(diags.size(), 1u);
}

TEST_F(ReadZeroByteVecTest, DefaultNeedsVecAnnotation) {
    EXPECT_EQ(lint("let mut v: Vec<u8> = Default::default();\n"
                   "f.read(&mut v);")
                  .size(),
              1u);
    EXPECT_TRUE(lint("let mut v = Default::default();\n"
                     "f.read(&mut v);")
                    .empty());
}

TEST_F(ReadZeroByteVecTest, MacroStatementIsSkipped) {
    EXPECT_TRUE(lint("let mut v = Vec::with_capacity(8);\n"
                     "read_all!(f.read(&mut v));")
                    .empty());
}

TEST_F(ReadZeroByteVecTest, ReadInTailExpression) {
    std::vector<Diagnostic> diags = lint(
        "let mut v = Vec::with_capacity(4);\n"
        "f.read_exact(&mut v)?");
    ASSERT_EQ(diags.size(), 1u);
    EXPECT_EQ(snippet(diags[0].span), "f.read_exact(&mut v)?");
    ASSERT_TRUE(diags[0].suggestion.has_value());
    EXPECT_EQ(diags[0].suggestion->replacement, "v.resize(4, 0); f.read_exact(&mut v)?");
}

TEST_F(ReadZeroByteVecTest, LastStatementWithoutTail) {
    EXPECT_TRUE(lint("f.read(&mut v);\n"
                     "let mut v = Vec::with_capacity(4);")
                    .empty());
}

TEST_F(ReadZeroByteVecTest, NestedBlocksAreChecked) {
    std::vector<Diagnostic> diags = lint(
        "if ready {\n"
        "    let mut v = Vec::with_capacity(8);\n"
        "    f.read(&mut v);\n"
        "} else {\n"
        "    let mut w = Vec::new();\n"
        "    f.read(&mut w);\n"
        "}\n"
        "{\n"
        "    let mut x = Vec::new();\n"
        "    f.read(&mut x);\n"
        "}");
    ASSERT_EQ(diags.size(), 3u);
    EXPECT_EQ(diags[0].span.begin.line, 4u);
    EXPECT_EQ(diags[1].span.begin.line, 7u);
    EXPECT_EQ(diags[2].span.begin.line, 11u);
}

TEST_F(ReadZeroByteVecTest, ReadInsideLetInitializer) {
    std::vector<Diagnostic> diags = lint(
        "let mut v = Vec::with_capacity(8);\n"
        "let n = f.read(&mut v);");
    ASSERT_EQ(diags.size(), 1u);
    EXPECT_EQ(snippet(diags[0].span), "let n = f.read(&mut v);");
}

TEST_F(ReadZeroByteVecTest, ReadIntoOtherBufferIsIgnored) {
    EXPECT_TRUE(lint("let mut v = Vec::with_capacity(8);\n"
                     "f.read(&mut w);")
                    .empty());
    EXPECT_TRUE(lint("let mut v = Vec::with_capacity(8);\n"
                     "f.read(&v);")
                    .empty());
}

TEST_F(ReadZeroByteVecTest, WildcardBindingIsIgnored) {
    EXPECT_TRUE(lint("let _ = Vec::with_capacity(8);\n"
                     "f.read(&mut v);")
                    .empty());
}

TEST_F(ReadZeroByteVecTest, AllowSilencesTheLint) {
    session.options.read_zero_byte_vec = LintLevel::Allow;
    EXPECT_TRUE(lint("let mut v = Vec::new();\n"
                     "f.read(&mut v);")
                    .empty());
}

TEST_F(ReadZeroByteVecTest, WarnReportsAWarning) {
    session.options.read_zero_byte_vec = LintLevel::Warn;
    std::vector<Diagnostic> diags = lint(
        "let mut v = Vec::new();\n"
        "f.read(&mut v);");
    ASSERT_EQ(diags.size(), 1u);
    EXPECT_EQ(diags[0].severity, Severity::Warning);
    EXPECT_FALSE(session.has_errors());
}

TEST_F(ReadZeroByteVecTest, DiagnosticFormatting) {
    std::vector<Diagnostic> diags = lint(
        "let mut v = Vec::with_capacity(100);\n"
        "f.read(&mut v);");
    ASSERT_EQ(diags.size(), 1u);
    std::string text = format_diagnostic(session.sources, diags[0]);
    EXPECT_NE(text.find("lint.rs:3:1"), std::string::npos);
    EXPECT_NE(text.find("reading zero byte data to `Vec`"), std::string::npos);
    EXPECT_NE(text.find("v.resize(100, 0); f.read(&mut v);"), std::string::npos);
}

TEST(ConstInt, FoldsIntegerArithmetic) {
    Span span{};
    ExprInt six{span, 6};
    ExprInt four{span, 4};
    ExprInt zero{span, 0};
    ExprBinary sum{span, BinaryOp::Add, &six, &four};
    ExprBinary rem{span, BinaryOp::Mod, &sum, &four};
    ExprBinary under{span, BinaryOp::Sub, &four, &six};
    ExprBinary div0{span, BinaryOp::Div, &six, &zero};
    ExprBinary cmp{span, BinaryOp::Lt, &six, &four};

    EXPECT_EQ(const_int(&sum), std::optional<std::uint64_t>(10));
    EXPECT_EQ(const_int(&rem), std::optional<std::uint64_t>(2));
    EXPECT_FALSE(const_int(&under).has_value());
    EXPECT_FALSE(const_int(&div0).has_value());
    EXPECT_FALSE(const_int(&cmp).has_value());
    EXPECT_FALSE(const_int(nullptr).has_value());
}
