//===----------------------------------------------------------------------===//
//
// Part of the LionCode project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/lioncode/test_analyzer.cpp
// Purpose: Name resolution, type inference and the semantic error catalog.
// Key invariants: Analysis stops at the first error, which carries L2000.
//
//===----------------------------------------------------------------------===//

#include "tests/lioncode/LionTestUtils.hpp"

using namespace lion::frontends::lioncode;
using namespace lion::tests;

namespace
{

//===----------------------------------------------------------------------===//
// Accepted programs
//===----------------------------------------------------------------------===//

TEST(LionAnalyzer, FirstAssignmentDeclares)
{
    auto program = analyzeOk("x = 1 + 2\nx = 7");
    ASSERT_EQ(program->statements.size(), 2u);

    const auto *first = stmtAs<AssignmentStmt>(*program, 0, StmtKind::Assignment);
    ASSERT_NE(first, nullptr);
    EXPECT_TRUE(first->isDeclaration);
    EXPECT_EQ(first->target->type, Type::Number);
    EXPECT_EQ(first->value->type, Type::Number);

    const auto *second = stmtAs<AssignmentStmt>(*program, 1, StmtKind::Assignment);
    ASSERT_NE(second, nullptr);
    EXPECT_FALSE(second->isDeclaration);
}

TEST(LionAnalyzer, DeclaringAssignmentKeepsValueAndType)
{
    auto program = analyzeOk("s = -hi-\nb = true");

    const auto *text = stmtAs<AssignmentStmt>(*program, 0, StmtKind::Assignment);
    ASSERT_NE(text, nullptr);
    ASSERT_NE(text->target, nullptr);
    ASSERT_NE(text->value, nullptr);
    EXPECT_TRUE(isIdentifier(text->target.get(), "s"));
    EXPECT_EQ(text->target->type, Type::String);
    EXPECT_TRUE(isPlainString(text->value.get(), "hi"));

    const auto *flag = stmtAs<AssignmentStmt>(*program, 1, StmtKind::Assignment);
    ASSERT_NE(flag, nullptr);
    ASSERT_NE(flag->value, nullptr);
    EXPECT_EQ(flag->target->type, Type::Boolean);
    EXPECT_TRUE(isBoolean(flag->value.get(), true));
}

TEST(LionAnalyzer, InfersExpressionTypes)
{
    auto program = analyzeOk("s = -a- + 1\nb = 1 < 2 and true\nn = -(3 * 4)\nt = -1- is equal to 1");
    const Type expected[] = {Type::String, Type::Boolean, Type::Number, Type::Boolean};
    for (size_t i = 0; i < 4; ++i)
    {
        const auto *assign = stmtAs<AssignmentStmt>(*program, i, StmtKind::Assignment);
        ASSERT_NE(assign, nullptr);
        EXPECT_EQ(assign->value->type, expected[i]) << "statement " << i;
    }
}

TEST(LionAnalyzer, FunctionReturnTypeFromFirstServe)
{
    auto program = analyzeOk("ignite twice(a) | serve a * 2 |\n"
                             "ignite greet(n) | serve -Hi - + n |\n"
                             "ignite quiet() | roar 1 |");
    const auto *twice = stmtAs<FunctionDeclStmt>(*program, 0, StmtKind::FunctionDecl);
    const auto *greet = stmtAs<FunctionDeclStmt>(*program, 1, StmtKind::FunctionDecl);
    const auto *quiet = stmtAs<FunctionDeclStmt>(*program, 2, StmtKind::FunctionDecl);
    ASSERT_TRUE(twice && greet && quiet);
    EXPECT_EQ(twice->returnType, Type::Number);
    EXPECT_EQ(greet->returnType, Type::String);
    EXPECT_EQ(quiet->returnType, Type::Unknown);
    ASSERT_EQ(twice->params.size(), 1u);
    EXPECT_EQ(twice->params[0], "a");
}

TEST(LionAnalyzer, CallsTakeTheFunctionReturnType)
{
    auto program = analyzeOk("ignite greet(n) | serve -Hi- |\nroar greet(1)\nroar sqrt(16)");
    const Expr *user = printedValue(*program, 1);
    const Expr *builtin = printedValue(*program, 2);
    ASSERT_TRUE(user && builtin);
    ASSERT_EQ(user->kind, ExprKind::Call);
    EXPECT_EQ(user->type, Type::String);
    EXPECT_FALSE(static_cast<const CallExpr *>(user)->isBuiltin);
    ASSERT_EQ(builtin->kind, ExprKind::Call);
    EXPECT_TRUE(static_cast<const CallExpr *>(builtin)->isBuiltin);
    EXPECT_EQ(builtin->type, Type::Number);
}

TEST(LionAnalyzer, RecursionResolves)
{
    auto program = analyzeOk("ignite fact(n) |\n"
                             "  if (n <= 1) | serve 1 | otherwise | serve n * fact(n - 1) |\n"
                             "|\n"
                             "roar fact(5)");
    EXPECT_EQ(program->statements.size(), 2u);
}

TEST(LionAnalyzer, BuiltinsMayBeShadowed)
{
    auto program = analyzeOk("sqrt = 4\nroar sqrt");
    const auto *assign = stmtAs<AssignmentStmt>(*program, 0, StmtKind::Assignment);
    ASSERT_NE(assign, nullptr);
    EXPECT_TRUE(assign->isDeclaration);
    EXPECT_TRUE(isIdentifier(printedValue(*program, 1), "sqrt"));
}

TEST(LionAnalyzer, BlocksOpenScopes)
{
    // Each branch declares its own `y`; the outer reference is then unbound.
    EXPECT_EQ(analyzeError("if (true) | y = 1 |\nroar y"), "Variable 'y' not declared");
}

TEST(LionAnalyzer, IfChainLinksAlternates)
{
    auto program = analyzeOk("x = 1\nif (x > 1) | roar 1 | else (x > 0) | roar 2 | otherwise | roar 3 |");
    const auto *outer = stmtAs<IfStmt>(*program, 1, StmtKind::If);
    ASSERT_NE(outer, nullptr);
    ASSERT_NE(outer->alternate, nullptr);
    ASSERT_EQ(outer->alternate->kind, StmtKind::If);
    const auto &inner = static_cast<const IfStmt &>(*outer->alternate);
    ASSERT_NE(inner.alternate, nullptr);
    EXPECT_EQ(inner.alternate->kind, StmtKind::Block);
}

TEST(LionAnalyzer, LoopBindsNumberVariable)
{
    auto program = analyzeOk("Prowl i in range(3) | roar i + 1 |");
    const auto *loop = stmtAs<WhileStmt>(*program, 0, StmtKind::While);
    ASSERT_NE(loop, nullptr);
    EXPECT_EQ(loop->variable->name, "i");
    EXPECT_EQ(loop->variable->type, Type::Number);
    EXPECT_TRUE(isNumber(loop->range->bound.get(), 3));
    ASSERT_EQ(loop->body->statements.size(), 1u);
}

TEST(LionAnalyzer, BreakInsideNestedBlockOfLoop)
{
    auto program = analyzeOk("Prowl i in range(3) | if (i == 1) | break | |");
    EXPECT_EQ(program->statements.size(), 1u);
}

TEST(LionAnalyzer, KeepsCommentsAndExpressionStatements)
{
    auto program = analyzeOk("~ note ~\nignite hi() | roar 1 |\nhi()");
    const auto *comment = stmtAs<CommentStmt>(*program, 0, StmtKind::Comment);
    ASSERT_NE(comment, nullptr);
    EXPECT_EQ(comment->text, "note");
    const auto *call = stmtAs<ExpressionStmt>(*program, 2, StmtKind::Expression);
    ASSERT_NE(call, nullptr);
    EXPECT_EQ(call->expr->kind, ExprKind::Call);
}

TEST(LionAnalyzer, InterpolatedStringKeepsSegments)
{
    auto program = analyzeOk("n = 1\nroar -v=$n-");
    const Expr *value = printedValue(*program, 1);
    ASSERT_NE(value, nullptr);
    ASSERT_EQ(value->kind, ExprKind::StringLiteral);
    const auto *str = static_cast<const StringLiteralExpr *>(value);
    ASSERT_TRUE(str->isInterpolated());
    ASSERT_EQ(str->segments.size(), 2u);
    EXPECT_EQ(str->segments[0].text, "v=");
    EXPECT_TRUE(isIdentifier(str->segments[1].expr.get(), "n"));
}

TEST(LionAnalyzer, FunctionReferenceIsMarked)
{
    auto program = analyzeOk("ignite f() | serve 1 |\nroar f == f");
    const Expr *value = printedValue(*program, 1);
    ASSERT_NE(value, nullptr);
    ASSERT_EQ(value->kind, ExprKind::Comparison);
    const auto *cmp = static_cast<const ComparisonExpr *>(value);
    ASSERT_EQ(cmp->left->kind, ExprKind::Identifier);
    EXPECT_TRUE(static_cast<const IdentifierExpr &>(*cmp->left).isFunction);
}

//===----------------------------------------------------------------------===//
// Rejected programs
//===----------------------------------------------------------------------===//

TEST(LionAnalyzer, ErrorCarriesCodeAndLocation)
{
    auto program = analyzeSource("x = 1\nroar y");
    ASSERT_FALSE(program);
    EXPECT_EQ(program.error().code, "L2000");
    EXPECT_EQ(program.error().message, "Variable 'y' not declared");
    EXPECT_EQ(program.error().loc.line, 2u);
    EXPECT_EQ(program.error().loc.column, 6u);
}

TEST(LionAnalyzer, RejectsReassignmentWithOtherType)
{
    EXPECT_EQ(analyzeError("x = 1\nx = -a-"), "Operands must have the same type");
}

TEST(LionAnalyzer, RejectsIllTypedArithmetic)
{
    EXPECT_EQ(analyzeError("roar -a- - 1"), "Cannot apply - to string and number");
    EXPECT_EQ(analyzeError("roar true + 1"), "Cannot apply + to boolean and number");
    EXPECT_EQ(analyzeError("roar 2 * false"), "Cannot apply * to number and boolean");
    EXPECT_EQ(analyzeError("roar -a- % 2"), "Modulus requires number operands");
}

TEST(LionAnalyzer, RejectsLiteralZeroDivisor)
{
    EXPECT_EQ(analyzeError("roar 1 / 0"), "Cannot divide by zero");
}

TEST(LionAnalyzer, RejectsNonBooleanLogic)
{
    EXPECT_EQ(analyzeError("roar 1 and true"), "Cannot apply and to number and boolean");
    EXPECT_EQ(analyzeError("roar true or -s-"), "Cannot apply or to boolean and string");
}

TEST(LionAnalyzer, RejectsUnorderedComparison)
{
    EXPECT_EQ(analyzeError("roar 1 < -a-"), "Expected number or string");
    EXPECT_EQ(analyzeError("roar true is greater than false"), "Expected number or string");
}

TEST(LionAnalyzer, RejectsIllTypedUnary)
{
    EXPECT_EQ(analyzeError("roar -true"), "Cannot apply - to boolean");
    EXPECT_EQ(analyzeError("roar !5"), "Cannot apply ! to number");
}

TEST(LionAnalyzer, RejectsMisplacedServeAndBreak)
{
    EXPECT_EQ(analyzeError("serve 1"), "Return statement outside function");
    EXPECT_EQ(analyzeError("break"), "Break can only appear in a loop");
    EXPECT_EQ(analyzeError("Prowl i in range(3) | ignite f() | break | |"), "Break can only appear in a loop");
}

TEST(LionAnalyzer, RejectsBadAssignmentTargets)
{
    EXPECT_EQ(analyzeError("5 + 3 = 8"), "Cannot assign to expression");
    EXPECT_EQ(analyzeError("ignite f() | serve 1 |\nf = 2"), "Assignment to immutable variable");
    EXPECT_EQ(analyzeError("Prowl i in range(3) | i = 2 |"), "Cannot reassign loop variable");
}

TEST(LionAnalyzer, RejectsBadLoops)
{
    EXPECT_EQ(analyzeError("Prowl 123 in range(5) | roar 1 |"), "Invalid loop variable");
    EXPECT_EQ(analyzeError("Prowl i in range(-a-) | roar i |"), "Range bound must be a number");
    EXPECT_EQ(analyzeError("Prowl i in range(-5) | roar i |"), "Range requires non-negative value");
}

TEST(LionAnalyzer, RejectsDuplicateDeclarations)
{
    EXPECT_EQ(analyzeError("x = 1\nignite x() | serve 1 |"), "Variable already declared: x");
    EXPECT_EQ(analyzeError("ignite f(a, a) | serve a |"), "Variable already declared: a");
}

TEST(LionAnalyzer, RejectsBadCalls)
{
    EXPECT_EQ(analyzeError("roar g(1)"), "Variable 'g' not declared");
    EXPECT_EQ(analyzeError("x = 1\nroar x(2)"), "Not a function");
    EXPECT_EQ(analyzeError("ignite add(a, b) | serve a + b |\nroar add(1)"),
              "Expected 2 argument(s) but 1 passed");
    EXPECT_EQ(analyzeError("roar sqrt(1, 2)"), "Expected 1 argument(s) but 2 passed");
}

TEST(LionAnalyzer, RejectsNonNumberArguments)
{
    EXPECT_EQ(analyzeError("ignite f(a) | serve a * 2 |\nroar f(-hi-)"),
              "Expected number argument but found string");
    EXPECT_EQ(analyzeError("roar sqrt(true)"), "Expected number argument but found boolean");
    EXPECT_EQ(analyzeError("ignite fact(n) | if (n < 2) | serve 1 | otherwise | serve n * fact(-x-) | |"),
              "Recursive call with invalid type");

    // Function references have no primitive type and are accepted.
    auto program = analyzeOk("ignite g() | roar 1 |\nignite f(a) | serve 1 |\nroar f(g)");
    EXPECT_EQ(program->statements.size(), 3u);
}

TEST(LionAnalyzer, RejectsMismatchedBranches)
{
    EXPECT_EQ(analyzeError("if (true) | y = 1 | otherwise | y = -s- |"), "Mismatched types in if-else branches");
    EXPECT_EQ(analyzeError("ignite f(a) | if (a > 1) | serve 1 | otherwise | serve -no- | |"),
              "Mismatched types in if-else branches");
}

TEST(LionAnalyzer, RejectsComparingFunctionWithValue)
{
    EXPECT_EQ(analyzeError("ignite f() | serve 1 |\nroar f == 1"), "Cannot compare function and number");
}

TEST(LionAnalyzer, ReportsOnlyTheFirstError)
{
    EXPECT_EQ(analyzeError("roar a\nroar b"), "Variable 'a' not declared");
}

} // namespace
