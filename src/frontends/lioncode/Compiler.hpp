//===----------------------------------------------------------------------===//
//
// Part of the LionCode project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Compiler.hpp
/// @brief LionCode compiler driver - orchestrates the complete pipeline.
///
/// @details Coordinates all phases of compilation:
///
/// ## Compilation Pipeline
///
/// 1. **Parsing** - Tokenize and build the parse tree (Lexer, Parser)
/// 2. **Semantic Analysis** - Name resolution and typing (Analyzer)
/// 3. **Optimization** - AST rewrites, skipped with `optimize = false`
/// 4. **Generation** - Render the target source text (Generator)
///
/// ## Usage
///
/// ```cpp
/// SourceManager sm;
/// CompilerInput input{.source = sourceCode, .path = "main.lion"};
/// CompilerOptions options{};
/// CompilerResult result = compile(input, options, sm);
///
/// if (result.succeeded()) {
///     // Use result.output
/// } else {
///     result.diagnostics.printAll(std::cerr, &sm);
/// }
/// ```
///
/// ## Error Handling
///
/// The first failing phase contributes exactly one diagnostic to
/// `CompilerResult::diagnostics` and the later phases do not run.
///
/// @invariant Result program and output are valid only if succeeded().
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/lioncode/AST.hpp"
#include "frontends/lioncode/Options.hpp"
#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace lion::frontends::lioncode
{

/// @brief Input parameters describing the source to compile.
struct CompilerInput
{
    /// @brief LionCode source code to compile.
    std::string_view source;

    /// @brief Path used for diagnostics; defaults to "<input>" when empty.
    std::string_view path{"<input>"};

    /// @brief Existing file id within the supplied source manager, if any.
    std::optional<uint32_t> fileId{};
};

/// @brief Aggregated result of compiling LionCode source.
struct CompilerResult
{
    /// @brief Diagnostics accumulated during compilation.
    lion::support::DiagnosticEngine diagnostics{};

    /// @brief File identifier used for the compiled source.
    uint32_t fileId{0};

    /// @brief Analyzed (and, when enabled, optimized) program.
    ProgramPtr program{};

    /// @brief Generated target source text.
    std::string output{};

    /// @brief Helper indicating whether compilation succeeded without errors.
    [[nodiscard]] bool succeeded() const;
};

/// @brief Compile LionCode source text into target source text.
/// @param input Source information describing the buffer to compile.
/// @param options Options controlling optimization, target and dumps.
/// @param sm Source manager used for diagnostics.
/// @return Program, output and diagnostics emitted during compilation.
CompilerResult compile(const CompilerInput &input,
                       const CompilerOptions &options,
                       lion::support::SourceManager &sm);

} // namespace lion::frontends::lioncode
