#include <gtest/gtest.h>

#include <sstream>

#include "repl.hpp"
#include "test_support.hpp"

class ReplTest : public ::testing::Test {
   protected:
    CapturedOutput out;
    ScriptedInput in;
    std::ostringstream diag;
    ReplSession session{out, in, diag};
};

// Test basic expression evaluation
TEST_F(ReplTest, EvaluateSimpleExpression) {
    EXPECT_EQ(session.feed_line("2 + 3"), ReplSession::Status::Evaluated);
    EXPECT_EQ(out.text(), "5\n");
}

TEST_F(ReplTest, StatementsAreNotEchoed) {
    EXPECT_EQ(session.feed_line("let x"), ReplSession::Status::Evaluated);
    EXPECT_EQ(session.feed_line("print null"), ReplSession::Status::Evaluated);
    EXPECT_EQ(out.text(), "null\n");
}

TEST_F(ReplTest, NullExpressionIsNotEchoed) {
    EXPECT_EQ(session.feed_line("null"), ReplSession::Status::Evaluated);
    EXPECT_EQ(out.text(), "");
}

// Test variable persistence across lines
TEST_F(ReplTest, BindingsPersistBetweenLines) {
    session.feed_line("let x");
    session.feed_line("set x to 10");
    session.feed_line("x * 2");
    session.feed_line("\"s\" .. x");
    EXPECT_EQ(out.text(), "20\ns10\n");
}

TEST_F(ReplTest, TransientBindingDoesNotLeak) {
    session.feed_line("with t as 1 print t");
    EXPECT_EQ(session.feed_line("t"), ReplSession::Status::Failed);
    EXPECT_NE(diag.str().find("NameError"), std::string::npos);
}

TEST_F(ReplTest, BlankLinesAreIgnored) {
    EXPECT_EQ(session.feed_line("   "), ReplSession::Status::Evaluated);
    EXPECT_FALSE(session.has_pending_input());
    EXPECT_EQ(out.text(), "");
}

// Test multi-line input
TEST_F(ReplTest, OpenBlockWaitsForEnd) {
    EXPECT_EQ(session.feed_line("do"), ReplSession::Status::NeedMore);
    EXPECT_TRUE(session.has_pending_input());
    EXPECT_EQ(session.feed_line("  print 1"), ReplSession::Status::NeedMore);
    EXPECT_EQ(out.text(), "");
    EXPECT_EQ(session.feed_line("end"), ReplSession::Status::Evaluated);
    EXPECT_FALSE(session.has_pending_input());
    EXPECT_EQ(out.text(), "1\n");
}

TEST_F(ReplTest, LoopWaitsForItsEnd) {
    EXPECT_EQ(session.feed_line("loop do"), ReplSession::Status::NeedMore);
    EXPECT_EQ(session.feed_line("  print \"once\" and break"), ReplSession::Status::NeedMore);
    EXPECT_EQ(session.feed_line("end"), ReplSession::Status::Evaluated);
    EXPECT_EQ(out.text(), "once\n");
}

TEST_F(ReplTest, UnfinishedIfWaits) {
    EXPECT_EQ(session.feed_line("if 1 < 2 then"), ReplSession::Status::NeedMore);
    EXPECT_EQ(session.feed_line("print \"yes\""), ReplSession::Status::Evaluated);
    EXPECT_EQ(out.text(), "yes\n");
}

TEST_F(ReplTest, TripleQuotedStringSpansLines) {
    EXPECT_EQ(session.feed_line("print \"\"\"a"), ReplSession::Status::NeedMore);
    EXPECT_EQ(session.feed_line("b\"\"\""), ReplSession::Status::Evaluated);
    EXPECT_EQ(out.text(), "a\nb\n");
}

TEST_F(ReplTest, DiscardPendingInput) {
    session.feed_line("do");
    session.discard_pending_input();
    EXPECT_FALSE(session.has_pending_input());
    EXPECT_EQ(session.feed_line("1"), ReplSession::Status::Evaluated);
    EXPECT_EQ(out.text(), "1\n");
}

// Test error recovery
TEST_F(ReplTest, ErrorsAreReportedAndSessionContinues) {
    EXPECT_EQ(session.feed_line("print 1 / 0"), ReplSession::Status::Failed);
    EXPECT_NE(diag.str().find("Error: ArithmeticError"), std::string::npos) << diag.str();
    EXPECT_FALSE(session.has_pending_input());

    EXPECT_EQ(session.feed_line("set y 2"), ReplSession::Status::Failed);
    EXPECT_NE(diag.str().find("ParseError"), std::string::npos);

    EXPECT_EQ(session.feed_line("7"), ReplSession::Status::Evaluated);
    EXPECT_EQ(out.text(), "7\n");
}

TEST_F(ReplTest, OutputBeforeErrorIsKept) {
    EXPECT_EQ(session.feed_line("print \"a\" and print nope"), ReplSession::Status::Failed);
    EXPECT_EQ(out.text(), "a\n");
}

TEST_F(ReplTest, ModulesStayImported) {
    session.feed_line("using Math from Clarice/Std");
    session.feed_line("Math.Max(2, 9)");
    EXPECT_EQ(out.text(), "9\n");
}

TEST_F(ReplTest, LineSourcesAreReleased) {
    session.feed_line("with a as 1");
    session.feed_line("do");
    session.feed_line("print 2");
    EXPECT_EQ(session.evaluator().source_count(), 0u);
    session.feed_line("end");
    session.feed_line("print nope");
    session.feed_line("set y 2");
    session.feed_line("3");
    EXPECT_EQ(session.evaluator().source_count(), 0u);
    EXPECT_EQ(out.text(), "2\n3\n");
}
