#include "lexer/lexer.hpp"
#include "parser/parser.hpp"

#include <gtest/gtest.h>
#include <sstream>

using namespace talkpp;
using namespace talkpp::parser;

namespace {

auto outline(const std::string& code) -> std::string {
    auto tokens = lexer::tokenize(code);
    EXPECT_TRUE(is_ok(tokens));
    if (is_err(tokens)) {
        return {};
    }
    auto program = parse(std::move(unwrap(tokens)));
    EXPECT_TRUE(is_ok(program));
    if (is_err(program)) {
        return {};
    }
    return program_to_string(unwrap(program));
}

} // anonymous namespace

TEST(AstPrinterTest, Conditional) {
    EXPECT_EQ(outline("if new user registers then validate email using SendGrid"),
              "Program (1 statement)\n"
              "  Conditional\n"
              "    Event subject=\"new user\" action=\"registers\"\n"
              "    Then\n"
              "      Action validate\n"
              "        Target Ident \"email\"\n"
              "        Service SendGrid\n");
}

TEST(AstPrinterTest, ElseBlockAndContext) {
    EXPECT_EQ(outline("when file uploads to \"inbox\" then process file else send alert"),
              "Program (1 statement)\n"
              "  Conditional\n"
              "    Event subject=\"file\" action=\"uploads\" context=\"inbox\"\n"
              "    Then\n"
              "      Action process\n"
              "        Target Ident \"file\"\n"
              "    Else\n"
              "      Action send\n"
              "        Target Ident \"alert\"\n");
}

TEST(AstPrinterTest, LogicalCondition) {
    EXPECT_EQ(outline("if a b and c d then trigger"),
              "Program (1 statement)\n"
              "  Conditional\n"
              "    Logical and\n"
              "      Event subject=\"a\" action=\"b\"\n"
              "      Event subject=\"c\" action=\"d\"\n"
              "    Then\n"
              "      Action trigger\n");
}

TEST(AstPrinterTest, ActionsAndAssignments) {
    EXPECT_EQ(outline("archive \"old rows\"\nlimit: 10\nlabel: \"vip\""),
              "Program (3 statements)\n"
              "  Action archive (custom)\n"
              "    Target String \"old rows\"\n"
              "  Assignment limit = Int 10\n"
              "  Assignment label = String \"vip\"\n");
}

TEST(AstPrinterTest, EmptyProgram) {
    EXPECT_EQ(outline(""), "Program (0 statements)\n");
}

TEST(AstPrinterTest, HandBuiltNodes) {
    Program program;
    SourceSpan span{};

    ConditionalStatement cond{
        .condition = make_comparison_condition(make_ident_expr("count", span),
                                               ComparisonOp::GreaterEqual,
                                               make_int_expr(5, span), span),
        .then_actions = {},
        .else_actions = std::nullopt,
        .span = span};
    program.statements.push_back(make_conditional_stmt(std::move(cond)));
    program.statements.push_back(make_assignment_stmt("flag", make_bool_expr(true, span), span));
    program.statements.push_back(make_comment_stmt("generated", span));

    std::ostringstream out;
    print_program(out, program);
    EXPECT_EQ(out.str(), "Program (3 statements)\n"
                         "  Conditional\n"
                         "    Comparison Ident \"count\" >= Int 5\n"
                         "    Then\n"
                         "  Assignment flag = Bool true\n"
                         "  Comment \"generated\"\n");
}

TEST(AstPrinterTest, OperatorNames) {
    EXPECT_EQ(comparison_op_symbol(ComparisonOp::Equal), "==");
    EXPECT_EQ(comparison_op_symbol(ComparisonOp::NotEqual), "!=");
    EXPECT_EQ(comparison_op_symbol(ComparisonOp::LessThan), "<");
    EXPECT_EQ(logical_op_name(LogicalOp::And), "and");
    EXPECT_EQ(logical_op_name(LogicalOp::Or), "or");
}
