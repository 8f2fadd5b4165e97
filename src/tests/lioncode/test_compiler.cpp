//===----------------------------------------------------------------------===//
//
// Part of the LionCode project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/lioncode/test_compiler.cpp
// Purpose: End-to-end behavior of the compile() driver and the AST dump.
// Key invariants: A failing phase contributes exactly one diagnostic tagged
//                 with the code of that phase.
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "frontends/lioncode/AstPrinter.hpp"
#include "frontends/lioncode/Compiler.hpp"
#include "support/source_manager.hpp"
#include "tests/lioncode/LionTestUtils.hpp"

#include <iostream>
#include <sstream>
#include <string>

using namespace lion::frontends::lioncode;
using lion::support::SourceManager;

namespace
{

std::string printed(const CompilerResult &result, const SourceManager &sm)
{
    std::ostringstream os;
    result.diagnostics.printAll(os, &sm);
    return os.str();
}

/// @brief Redirects std::cerr into a buffer for the lifetime of the guard.
class CerrCapture
{
  public:
    CerrCapture() : old_(std::cerr.rdbuf(buffer_.rdbuf())) {}

    ~CerrCapture()
    {
        std::cerr.rdbuf(old_);
    }

    std::string str() const
    {
        return buffer_.str();
    }

  private:
    std::ostringstream buffer_;
    std::streambuf *old_;
};

TEST(LionCompiler, CompilesAndOptimizes)
{
    SourceManager sm;
    CompilerInput input{.source = "x = 5 + 8\nroar x", .path = "main.lion"};
    CompilerOptions opts{};

    auto result = compile(input, opts, sm);

    ASSERT_TRUE(result.succeeded()) << printed(result, sm);
    EXPECT_EQ(result.output, "let x = 13;\nconsole.log(x);");
    EXPECT_EQ(result.fileId, 1u);
    ASSERT_NE(result.program, nullptr);
    EXPECT_EQ(result.program->statements.size(), 2u);
}

TEST(LionCompiler, OptimizerCanBeDisabled)
{
    SourceManager sm;
    CompilerInput input{.source = "x = 5 + 8\nroar x", .path = "main.lion"};
    CompilerOptions opts{};
    opts.optimize = false;

    auto result = compile(input, opts, sm);

    ASSERT_TRUE(result.succeeded());
    EXPECT_EQ(result.output, "let x = (5 + 8);\nconsole.log(x);");
}

TEST(LionCompiler, NegativeOperandSubtraction)
{
    SourceManager sm;
    CompilerInput input{.source = "x = -5 - 3\nroar x", .path = "main.lion"};
    CompilerOptions opts{};

    auto result = compile(input, opts, sm);
    ASSERT_TRUE(result.succeeded()) << printed(result, sm);
    EXPECT_EQ(result.output, "let x = -8;\nconsole.log(x);");

    opts.optimize = false;
    SourceManager plain;
    auto unoptimized = compile(input, opts, plain);
    ASSERT_TRUE(unoptimized.succeeded()) << printed(unoptimized, plain);
    EXPECT_EQ(unoptimized.output, "let x = ((-5) - 3);\nconsole.log(x);");
}

TEST(LionCompiler, RemovedCodeDisappearsFromOutput)
{
    SourceManager sm;
    CompilerInput input{.source = "y = 3\nProwl i in range(0) | roar i |\nif (y != 3) | roar y * 8 | otherwise | roar y / 4 |",
                        .path = "main.lion"};
    CompilerOptions opts{};

    auto result = compile(input, opts, sm);

    ASSERT_TRUE(result.succeeded()) << printed(result, sm);
    EXPECT_EQ(result.output,
              "let y = 3;\n"
              "if ((y === 3)) {\n"
              "  console.log((y >> 2));\n"
              "} else {\n"
              "  console.log((y << 3));\n"
              "}");
}

TEST(LionCompiler, SyntaxErrorsUseL1000)
{
    SourceManager sm;
    CompilerInput input{.source = "roar (", .path = "main.lion"};
    CompilerOptions opts{};

    auto result = compile(input, opts, sm);

    EXPECT_FALSE(result.succeeded());
    EXPECT_EQ(result.diagnostics.errorCount(), 1u);
    EXPECT_EQ(result.program, nullptr);
    EXPECT_EQ(printed(result, sm), "main.lion:1:7: error[L1000]: expected an expression but found end of input\n");
}

TEST(LionCompiler, SemanticErrorsUseL2000)
{
    SourceManager sm;
    CompilerInput input{.source = "roar x", .path = "main.lion"};
    CompilerOptions opts{};

    auto result = compile(input, opts, sm);

    EXPECT_FALSE(result.succeeded());
    EXPECT_EQ(printed(result, sm), "main.lion:1:6: error[L2000]: Variable 'x' not declared\n");
}

TEST(LionCompiler, UnknownTargetUsesL3000)
{
    SourceManager sm;
    CompilerInput input{.source = "roar 1", .path = "main.lion"};
    CompilerOptions opts{};
    opts.target = "wasm";

    auto result = compile(input, opts, sm);

    EXPECT_FALSE(result.succeeded());
    EXPECT_TRUE(result.output.empty());
    EXPECT_EQ(printed(result, sm), "error[L3000]: Unknown output type: wasm\n");
}

TEST(LionCompiler, ReusesSuppliedFileId)
{
    SourceManager sm;
    uint32_t id = sm.addFile("lib/prelude.lion");
    CompilerInput input{.source = "roar y", .path = "ignored.lion", .fileId = id};
    CompilerOptions opts{};

    auto result = compile(input, opts, sm);

    EXPECT_EQ(result.fileId, id);
    EXPECT_EQ(sm.fileCount(), 1u);
    EXPECT_EQ(printed(result, sm), "lib/prelude.lion:1:6: error[L2000]: Variable 'y' not declared\n");
}

TEST(LionCompiler, DumpsAstWhenRequested)
{
    SourceManager sm;
    CompilerInput input{.source = "x = 1 + 2", .path = "main.lion"};
    CompilerOptions opts{};
    opts.dumpAst = true;

    std::string dump;
    {
        CerrCapture capture;
        auto result = compile(input, opts, sm);
        EXPECT_TRUE(result.succeeded());
        dump = capture.str();
    }

    EXPECT_NE(dump.find("=== AST after semantic analysis ==="), std::string::npos);
    EXPECT_NE(dump.find("=== AST after optimization ==="), std::string::npos);
    EXPECT_NE(dump.find("NumberLiteral 3 : number"), std::string::npos);
}

TEST(LionAstPrinter, DumpsTypedTree)
{
    auto program = lion::tests::analyzeOk("x = 1 + 2");
    AstPrinter printer;
    EXPECT_EQ(printer.dump(*program),
              "Program\n"
              "  AssignmentStatement let (1:1)\n"
              "    Identifier \"x\" : number (1:1)\n"
              "    BinaryExpression (+) : number (1:7)\n"
              "      NumberLiteral 1 : number (1:5)\n"
              "      NumberLiteral 2 : number (1:9)\n");
}

TEST(LionAstPrinter, DumpsStatementsAndLabels)
{
    auto program = lion::tests::analyzeOk("ignite f(a, b) | if (a > b) | serve -big- | otherwise | serve -small- | |");
    AstPrinter printer;
    const std::string dump = printer.dump(*program);

    EXPECT_NE(dump.find("  FunctionDeclaration \"f\" : string (1:1)\n    Params: a b\n    Body:\n"),
              std::string::npos);
    EXPECT_NE(dump.find("IfStatement (1:18)"), std::string::npos);
    EXPECT_NE(dump.find("ComparisonExpression (>) : boolean"), std::string::npos);
    EXPECT_NE(dump.find("Then:"), std::string::npos);
    EXPECT_NE(dump.find("Else:"), std::string::npos);
    EXPECT_NE(dump.find("StringLiteral \"small\" : string"), std::string::npos);
}

TEST(LionAstPrinter, DumpsSingleExpression)
{
    auto program = lion::tests::analyzeOk("n = 2\nroar -n=$n-");
    const Expr *value = lion::tests::printedValue(*program, 1);
    ASSERT_NE(value, nullptr);
    AstPrinter printer;
    EXPECT_EQ(printer.dump(*value),
              "StringLiteral interpolated : string (2:6)\n"
              "  Text \"n=\"\n"
              "  Identifier \"n\" : number (2:10)\n");
}

} // namespace
