//===----------------------------------------------------------------------===//
//
// Part of the LionCode project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Compiler.cpp
/// @brief Implements the LionCode compiler driver.
///
//===----------------------------------------------------------------------===//

#include "frontends/lioncode/Compiler.hpp"

#include "codegen/Generator.hpp"
#include "frontends/lioncode/Analyzer.hpp"
#include "frontends/lioncode/AstPrinter.hpp"
#include "frontends/lioncode/Parser.hpp"
#include "transform/Optimizer.hpp"

#include <iostream>

namespace lion::frontends::lioncode
{

namespace
{
void dumpProgram(const char *phase, const Program &program)
{
    AstPrinter printer;
    std::cerr << "=== AST after " << phase << " ===\n" << printer.dump(program) << "=== End AST ===\n";
}
} // namespace

bool CompilerResult::succeeded() const
{
    return diagnostics.errorCount() == 0;
}

CompilerResult compile(const CompilerInput &input,
                       const CompilerOptions &options,
                       lion::support::SourceManager &sm)
{
    CompilerResult result{};

    if (input.fileId.has_value())
        result.fileId = *input.fileId;
    else
        result.fileId = sm.addFile(std::string(input.path));

    // Phase 1: Parsing
    auto tree = parse(std::string(input.source), result.fileId);
    if (!tree)
    {
        result.diagnostics.report(tree.error());
        return result;
    }

    // Phase 2: Semantic Analysis
    auto program = analyze(tree.value());
    if (!program)
    {
        result.diagnostics.report(program.error());
        return result;
    }
    result.program = program.value();

    if (options.dumpAst)
        dumpProgram("semantic analysis", *result.program);

    // Phase 3: Optimization
    if (options.optimize)
    {
        result.program = lion::transform::optimize(result.program);
        if (options.dumpAst)
            dumpProgram("optimization", *result.program);
    }

    // Phase 4: Generation
    auto output = lion::codegen::generate(*result.program, options.target);
    if (!output)
    {
        result.diagnostics.report(output.error());
        return result;
    }
    result.output = std::move(output.value());

    return result;
}

} // namespace lion::frontends::lioncode
