#include <gtest/gtest.h>

#include "format/format.hpp"
#include "lexer.hpp"
#include "parser.hpp"

static std::unique_ptr<ProgramNode> parse_text(const std::string& source) {
    Lexer lexer(source, "<test>");
    auto tokens = lexer.tokenize();
    Parser parser(tokens);
    return parser.parse();
}

static std::string formatted(const std::string& source) {
    auto program = parse_text(source);
    return format_program(program.get());
}

// printing, re-parsing and printing again must be a fixed point
static void expect_stable(const std::string& source) {
    std::string once = formatted(source);
    std::string twice = formatted(once);
    EXPECT_EQ(once, twice) << "source:\n" << source;
}

TEST(FormatTest, CanonicalSpacing) {
    EXPECT_EQ(formatted("with   x as 6\n   if x=6 then print \"Winner!\"  else print \"Try again!\""),
        "with x as 6 if x = 6 then print \"Winner!\" else print \"Try again!\"\n");
}

TEST(FormatTest, LetSetPrint) {
    EXPECT_EQ(formatted("let x as int set x to 3 print x"), "let x as int\nset x to 3\nprint x\n");
}

TEST(FormatTest, LoopAlwaysClosedWithEnd) {
    EXPECT_EQ(formatted("loop do print 1 break"), "loop do\n  print 1\n  break\nend\n");
}

TEST(FormatTest, NestedBlocksIndent) {
    EXPECT_EQ(formatted("loop do do print 1 end break end"),
        "loop do\n  do\n    print 1\n  end\n  break\nend\n");
}

TEST(FormatTest, ParenthesesOnlyWhereNeeded) {
    EXPECT_EQ(formatted("print (1 + 2) * 3"), "print (1 + 2) * 3\n");
    EXPECT_EQ(formatted("print ((1 - 2) - 3)"), "print 1 - 2 - 3\n");
    EXPECT_EQ(formatted("print 1 - (2 - 3)"), "print 1 - (2 - 3)\n");
    EXPECT_EQ(formatted("print (a = b) = c"), "print (a = b) = c\n");
    EXPECT_EQ(formatted("print -(1 + 2)"), "print -(1 + 2)\n");
    EXPECT_EQ(formatted("print (-x).y"), "print (-x).y\n");
}

TEST(FormatTest, StringsAreEscaped) {
    EXPECT_EQ(formatted("print \"\"\"a\n\"b\" $5\"\"\""), "print \"a\\n\\\"b\\\" \\$5\"\n");
}

TEST(FormatTest, TemplatesKeepInterpolation) {
    EXPECT_EQ(formatted("print \"sum: ${1 + 2}!\""), "print \"sum: ${1 + 2}!\"\n");
}

TEST(FormatTest, IdentifierValueBeforeBlockIsParenthesized) {
    std::string out = formatted("with x as (g) do print x end");
    EXPECT_EQ(out, "with x as (g) do\n  print x\nend\n");
    auto reparsed = parse_text(out);
    EXPECT_NE(dynamic_cast<WithStatementNode*>(reparsed->body[0].get()), nullptr);
}

TEST(FormatTest, IdentifierValueBeforeSequenceStartingWithBlock) {
    std::string out = formatted("with x as (y) do print x end and print 2");
    EXPECT_EQ(out, "with x as (y) do\n  print x\nend and print 2\n");
    auto reparsed = parse_text(out);
    ASSERT_EQ(reparsed->body.size(), 1u);
    auto* ws = dynamic_cast<WithStatementNode*>(reparsed->body[0].get());
    ASSERT_NE(ws, nullptr);
    EXPECT_NE(dynamic_cast<SequenceStatementNode*>(ws->body.get()), nullptr);
}

TEST(FormatTest, AliasFormAndUsing) {
    EXPECT_EQ(formatted("using Markdown from Clarice/Extra with Markdown.ConvertHTML as c do c(\"# x\", \"x.html\")"),
        "using Markdown from Clarice/Extra\nwith Markdown.ConvertHTML as c do c(\"# x\", \"x.html\")\n");
    EXPECT_EQ(formatted("using h from \"lib/h.clrs\""), "using h from \"lib/h.clrs\"\n");
}

TEST(FormatTest, ElseAfterLoopStaysWithOuterIf) {
    std::string out = formatted("if c then loop do break else print 1");
    EXPECT_EQ(out, "if c then loop do\n  break\nend else print 1\n");
    auto reparsed = parse_text(out);
    auto* ifn = dynamic_cast<IfStatementNode*>(reparsed->body[0].get());
    ASSERT_NE(ifn, nullptr);
    EXPECT_NE(ifn->else_branch, nullptr);
}

TEST(FormatTest, HandBuiltDanglingElseIsWrapped) {
    // if a then (if b then print 1) else print 2
    auto inner = std::make_unique<IfStatementNode>();
    auto b = std::make_unique<IdentifierNode>();
    b->name = "b";
    inner->condition = std::move(b);
    auto p1 = std::make_unique<PrintStatementNode>();
    auto one = std::make_unique<IntegerLiteralNode>();
    one->value = 1;
    p1->expression = std::move(one);
    inner->then_branch = std::move(p1);

    auto outer = std::make_unique<IfStatementNode>();
    auto a = std::make_unique<IdentifierNode>();
    a->name = "a";
    outer->condition = std::move(a);
    outer->then_branch = std::move(inner);
    auto p2 = std::make_unique<PrintStatementNode>();
    auto two = std::make_unique<IntegerLiteralNode>();
    two->value = 2;
    p2->expression = std::move(two);
    outer->else_branch = std::move(p2);

    std::string out = format_statement(outer.get());
    EXPECT_EQ(out, "if a then do\n  if b then print 1\nend else print 2");

    auto reparsed = parse_text(out);
    auto* top = dynamic_cast<IfStatementNode*>(reparsed->body[0].get());
    ASSERT_NE(top, nullptr);
    EXPECT_NE(top->else_branch, nullptr);
}

TEST(FormatTest, RoundTripIsAFixedPoint) {
    const char* programs[] = {
        "with x as 6 if x = 6 then print \"Winner!\" else print \"Try again!\"",
        "let x as int\nset x to 3\nprint x",
        "let i set i to 0 loop do set i to i + 1 if i >= 3 then break end print i",
        "iter c in \"abc\" do print c and print c .. c",
        "using Text from Clarice/Std print Text.Upper(\"a\" .. \"b\")",
        "print [1, 2.5, \"x\", [true, null]]",
        "print 1 - -2 * (3 + 4) % 5 / 6",
        "prompt \"Press enter: \" then print \"ok\"",
        "do let t set t to \"\"\"multi\nline\"\"\" print \"${t}-${1}\" end",
        "if a then if b then print 1 else print 2 else print 3",
        "print 1\n1 * 3 + 2",
        "let y set y to 5 with x as (y) do print x end and print 2",
    };
    for (const char* src : programs) {
        expect_stable(src);
    }
}

TEST(FormatTest, ReparsedExpressionStatementsStaySeparate) {
    auto program = parse_text("print a\n1 * 3 + 2");
    ASSERT_EQ(program->body.size(), 2u);
    auto reparsed = parse_text(format_program(program.get()));
    EXPECT_EQ(reparsed->body.size(), 2u);
}
