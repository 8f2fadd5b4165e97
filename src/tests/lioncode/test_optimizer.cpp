//===----------------------------------------------------------------------===//
//
// Part of the LionCode project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/lioncode/test_optimizer.cpp
// Purpose: Constant folding, algebraic simplification, strength reduction and
//          dead code elimination on analyzed LionCode programs.
// Key invariants: The input tree is never modified and untouched programs
//                 come back as the same pointer.
//
//===----------------------------------------------------------------------===//

#include "tests/lioncode/LionTestUtils.hpp"

#include "transform/Optimizer.hpp"

using namespace lion::frontends::lioncode;
using namespace lion::tests;
using lion::transform::optimize;

namespace
{

ProgramPtr optimized(const std::string &source)
{
    return optimize(analyzeOk(source));
}

const BinaryExpr *asBinary(const Expr *e, BinaryOp op)
{
    if (!e || e->kind != ExprKind::Binary)
        return nullptr;
    const auto *b = static_cast<const BinaryExpr *>(e);
    return b->op == op ? b : nullptr;
}

//===----------------------------------------------------------------------===//
// Constant folding
//===----------------------------------------------------------------------===//

TEST(LionOptimizer, FoldsArithmetic)
{
    auto program = optimized("x = 5 + 8\nroar 2 * 3 - 1\nroar 7 % 4\nroar 1 / 4\nroar -5");
    const auto *assign = stmtAs<AssignmentStmt>(*program, 0, StmtKind::Assignment);
    ASSERT_NE(assign, nullptr);
    EXPECT_TRUE(isNumber(assign->value.get(), 13));
    EXPECT_TRUE(isNumber(printedValue(*program, 1), 5));
    EXPECT_TRUE(isNumber(printedValue(*program, 2), 3));
    EXPECT_TRUE(isNumber(printedValue(*program, 3), 0.25));
    EXPECT_TRUE(isNumber(printedValue(*program, 4), -5));
}

TEST(LionOptimizer, LeavesModulusByZero)
{
    auto program = optimized("roar 5 % 0");
    EXPECT_NE(asBinary(printedValue(*program, 0), BinaryOp::Mod), nullptr);
}

TEST(LionOptimizer, FoldsStringConcatenation)
{
    auto program = optimized("roar -a- + 1\nroar 1 + -a-\nroar -x- + true");
    EXPECT_TRUE(isPlainString(printedValue(*program, 0), "a1"));
    EXPECT_TRUE(isPlainString(printedValue(*program, 1), "1a"));
    EXPECT_TRUE(isPlainString(printedValue(*program, 2), "xtrue"));
}

TEST(LionOptimizer, FoldsComparisons)
{
    auto program = optimized("roar 1 < 2\nroar -a- == -a-\nroar 1 == -1-\nroar true != false\nroar 3 is greater than 4");
    EXPECT_TRUE(isBoolean(printedValue(*program, 0), true));
    EXPECT_TRUE(isBoolean(printedValue(*program, 1), true));
    EXPECT_TRUE(isBoolean(printedValue(*program, 2), false));
    EXPECT_TRUE(isBoolean(printedValue(*program, 3), true));
    EXPECT_TRUE(isBoolean(printedValue(*program, 4), false));
}

TEST(LionOptimizer, ComparesIdenticalOperands)
{
    auto program = optimized("y = 1\nroar y == y\nroar y < y\nroar y >= y\nroar y is less than 3");
    EXPECT_TRUE(isBoolean(printedValue(*program, 1), true));
    EXPECT_TRUE(isBoolean(printedValue(*program, 2), false));
    EXPECT_TRUE(isBoolean(printedValue(*program, 3), true));
    const Expr *kept = printedValue(*program, 4);
    ASSERT_NE(kept, nullptr);
    EXPECT_EQ(kept->kind, ExprKind::Comparison);
}

TEST(LionOptimizer, FoldsBuiltinCalls)
{
    auto program = optimized("roar sqrt(16)\nroar abs(0 - 3)\nroar floor(2.7)\nroar ceil(2.1)\nroar sqrt(0 - 1)");
    EXPECT_TRUE(isNumber(printedValue(*program, 0), 4));
    EXPECT_TRUE(isNumber(printedValue(*program, 1), 3));
    EXPECT_TRUE(isNumber(printedValue(*program, 2), 2));
    EXPECT_TRUE(isNumber(printedValue(*program, 3), 3));

    const Expr *negative = printedValue(*program, 4);
    ASSERT_NE(negative, nullptr);
    ASSERT_EQ(negative->kind, ExprKind::Call);
    EXPECT_TRUE(isNumber(static_cast<const CallExpr *>(negative)->args[0].get(), -1));
}

TEST(LionOptimizer, FoldsInterpolatedLiterals)
{
    auto program = optimized("roar -v=$(1 + 2)-\nn = 4\nroar -$n and $(2 * 3)-");
    EXPECT_TRUE(isPlainString(printedValue(*program, 0), "v=3"));

    const Expr *partial = printedValue(*program, 2);
    ASSERT_NE(partial, nullptr);
    ASSERT_EQ(partial->kind, ExprKind::StringLiteral);
    const auto *str = static_cast<const StringLiteralExpr *>(partial);
    ASSERT_EQ(str->segments.size(), 2u);
    EXPECT_TRUE(isIdentifier(str->segments[0].expr.get(), "n"));
    EXPECT_EQ(str->segments[1].text, " and 6");
}

//===----------------------------------------------------------------------===//
// Algebraic simplification
//===----------------------------------------------------------------------===//

TEST(LionOptimizer, AppliesIdentities)
{
    auto program = optimized("y = 3\nroar y + 0\nroar 0 + y\nroar y * 1\nroar 1 * y\nroar y * 0");
    EXPECT_TRUE(isIdentifier(printedValue(*program, 1), "y"));
    EXPECT_TRUE(isIdentifier(printedValue(*program, 2), "y"));
    EXPECT_TRUE(isIdentifier(printedValue(*program, 3), "y"));
    EXPECT_TRUE(isIdentifier(printedValue(*program, 4), "y"));
    EXPECT_TRUE(isNumber(printedValue(*program, 5), 0));
}

TEST(LionOptimizer, StringPlusZeroIsNotAnIdentity)
{
    auto program = optimized("s = -a-\nroar s + 0");
    EXPECT_NE(asBinary(printedValue(*program, 1), BinaryOp::Add), nullptr);
}

TEST(LionOptimizer, CombinesConstantTerms)
{
    auto program = optimized("y = 3\nroar (y + 2) + 3");
    const BinaryExpr *add = asBinary(printedValue(*program, 1), BinaryOp::Add);
    ASSERT_NE(add, nullptr);
    EXPECT_TRUE(isIdentifier(add->left.get(), "y"));
    EXPECT_TRUE(isNumber(add->right.get(), 5));
}

TEST(LionOptimizer, ShortCircuitsBooleans)
{
    auto program = optimized("b = true\nroar b and true\nroar b or true\nroar false and b\nroar false or b\nroar !!b");
    EXPECT_TRUE(isIdentifier(printedValue(*program, 1), "b"));
    EXPECT_TRUE(isBoolean(printedValue(*program, 2), true));
    EXPECT_TRUE(isBoolean(printedValue(*program, 3), false));
    EXPECT_TRUE(isIdentifier(printedValue(*program, 4), "b"));
    EXPECT_TRUE(isIdentifier(printedValue(*program, 5), "b"));
}

TEST(LionOptimizer, ReducesPowerOfTwoToShifts)
{
    auto program = optimized("y = 3\nroar y * 8\nroar 8 * y\nroar y / 4\nroar y * 6");

    const BinaryExpr *shl = asBinary(printedValue(*program, 1), BinaryOp::Shl);
    ASSERT_NE(shl, nullptr);
    EXPECT_TRUE(isIdentifier(shl->left.get(), "y"));
    EXPECT_TRUE(isNumber(shl->right.get(), 3));

    const BinaryExpr *swapped = asBinary(printedValue(*program, 2), BinaryOp::Shl);
    ASSERT_NE(swapped, nullptr);
    EXPECT_TRUE(isIdentifier(swapped->left.get(), "y"));

    const BinaryExpr *shr = asBinary(printedValue(*program, 3), BinaryOp::Shr);
    ASSERT_NE(shr, nullptr);
    EXPECT_TRUE(isNumber(shr->right.get(), 2));

    EXPECT_NE(asBinary(printedValue(*program, 4), BinaryOp::Mul), nullptr);
}

TEST(LionOptimizer, ShiftCountStaysWithinInt32)
{
    auto program = optimized("y = 3\nroar y * 1073741824\nroar y * 4294967296\nroar y / 2147483648");

    const BinaryExpr *widest = asBinary(printedValue(*program, 1), BinaryOp::Shl);
    ASSERT_NE(widest, nullptr);
    EXPECT_TRUE(isNumber(widest->right.get(), 30));

    const BinaryExpr *wide = asBinary(printedValue(*program, 2), BinaryOp::Mul);
    ASSERT_NE(wide, nullptr);
    EXPECT_TRUE(isNumber(wide->right.get(), 4294967296.0));

    EXPECT_NE(asBinary(printedValue(*program, 3), BinaryOp::Div), nullptr);
}

//===----------------------------------------------------------------------===//
// Statements
//===----------------------------------------------------------------------===//

TEST(LionOptimizer, RemovesSelfAssignment)
{
    auto program = optimized("x = 1\nx = x\nroar x");
    ASSERT_EQ(program->statements.size(), 2u);
    EXPECT_EQ(program->statements[1]->kind, StmtKind::Print);
}

TEST(LionOptimizer, RemovesEmptyLoops)
{
    EXPECT_TRUE(optimized("Prowl i in range(0) | roar i |")->statements.empty());
    EXPECT_TRUE(optimized("Prowl i in range(3) | if (false) | roar i | |")->statements.empty());
}

TEST(LionOptimizer, KeepsLoopsWithWork)
{
    auto program = optimized("Prowl i in range(1 + 2) | roar i * 1 |");
    const auto *loop = stmtAs<WhileStmt>(*program, 0, StmtKind::While);
    ASSERT_NE(loop, nullptr);
    EXPECT_TRUE(isNumber(loop->range->bound.get(), 3));
    ASSERT_EQ(loop->body->statements.size(), 1u);
    const auto &print = static_cast<const PrintStmt &>(*loop->body->statements[0]);
    EXPECT_TRUE(isIdentifier(print.value.get(), "i"));
}

TEST(LionOptimizer, SplicesLiteralConditions)
{
    auto taken = optimized("if (1 < 2) | roar 1 | otherwise | roar 2 |");
    ASSERT_EQ(taken->statements.size(), 1u);
    EXPECT_TRUE(isNumber(printedValue(*taken, 0), 1));

    auto otherwise = optimized("if (false) | roar 1 | otherwise | roar 2\nroar 3 |");
    ASSERT_EQ(otherwise->statements.size(), 2u);
    EXPECT_TRUE(isNumber(printedValue(*otherwise, 1), 3));

    EXPECT_TRUE(optimized("if (false) | roar 1 |")->statements.empty());
}

TEST(LionOptimizer, ResolvesElseIfChains)
{
    auto program = optimized("if (false) | roar 1 | else (true) | roar 2 | otherwise | roar 3 |");
    ASSERT_EQ(program->statements.size(), 1u);
    EXPECT_TRUE(isNumber(printedValue(*program, 0), 2));
}

TEST(LionOptimizer, DropsEmptyConditional)
{
    auto program = optimized("y = 1\nif (y > 0) | |");
    EXPECT_EQ(program->statements.size(), 1u);
}

TEST(LionOptimizer, SwapsNegatedCondition)
{
    auto program = optimized("y = 1\nif (y != 2) | roar 1 | otherwise | roar 2 |");
    const auto *stmt = stmtAs<IfStmt>(*program, 1, StmtKind::If);
    ASSERT_NE(stmt, nullptr);
    ASSERT_EQ(stmt->condition->kind, ExprKind::Comparison);
    EXPECT_EQ(static_cast<const ComparisonExpr &>(*stmt->condition).op, CompareOp::Eq);
    ASSERT_EQ(stmt->consequent->statements.size(), 1u);
    const auto &first = static_cast<const PrintStmt &>(*stmt->consequent->statements[0]);
    EXPECT_TRUE(isNumber(first.value.get(), 2));
}

TEST(LionOptimizer, OptimizesFunctionBodies)
{
    auto program = optimized("ignite f(a) | serve a * 1 |");
    const auto *fn = stmtAs<FunctionDeclStmt>(*program, 0, StmtKind::FunctionDecl);
    ASSERT_NE(fn, nullptr);
    ASSERT_EQ(fn->body->statements.size(), 1u);
    const auto &ret = static_cast<const ReturnStmt &>(*fn->body->statements[0]);
    EXPECT_TRUE(isIdentifier(ret.value.get(), "a"));
    EXPECT_EQ(fn->returnType, Type::Number);
}

//===----------------------------------------------------------------------===//
// Sharing
//===----------------------------------------------------------------------===//

TEST(LionOptimizer, UnchangedProgramIsReturnedAsIs)
{
    ProgramPtr input = analyzeOk("y = 1\nroar y\n~ done ~");
    EXPECT_EQ(optimize(input), input);
}

TEST(LionOptimizer, DoesNotModifyItsInput)
{
    ProgramPtr input = analyzeOk("x = 5 + 8");
    ProgramPtr output = optimize(input);
    EXPECT_NE(output, input);

    const auto *original = stmtAs<AssignmentStmt>(*input, 0, StmtKind::Assignment);
    ASSERT_NE(original, nullptr);
    EXPECT_EQ(original->value->kind, ExprKind::Binary);

    // A second pass has nothing left to do.
    EXPECT_EQ(optimize(output), output);
}

TEST(LionOptimizer, SharesUntouchedStatements)
{
    ProgramPtr input = analyzeOk("y = 1\nroar 2 + 3");
    ProgramPtr output = optimize(input);
    ASSERT_EQ(output->statements.size(), 2u);
    EXPECT_EQ(output->statements[0], input->statements[0]);
    EXPECT_NE(output->statements[1], input->statements[1]);
}

} // namespace
