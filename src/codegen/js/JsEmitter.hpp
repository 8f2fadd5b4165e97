//===----------------------------------------------------------------------===//
//
// Part of the LionCode project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/js/JsEmitter.hpp
// Purpose: Render a typed LionCode program as JavaScript source text.
// Key invariants: One output line per simple statement; nested blocks are
//                 indented by two spaces per level; every binary and
//                 comparison expression is fully parenthesized.
// Ownership/Lifetime: The emitter borrows the program for one emit() call
//                     and owns the produced lines until then.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "codegen/js/NameTable.hpp"
#include "frontends/lioncode/AST.hpp"

#include <string>
#include <vector>

namespace lion::codegen::js
{

namespace lc = lion::frontends::lioncode;

/// \brief Emits JavaScript for a LionCode program.
class JsEmitter
{
  public:
    /// \brief Render @p program; lines are joined with '\n' and the result
    ///        carries no trailing newline.
    [[nodiscard]] std::string emit(const lc::Program &program);

    /// \brief Render a single expression using the current name bindings.
    [[nodiscard]] std::string emitExpr(const lc::Expr &expr);

    /// \brief Quote @p text as a double-quoted JavaScript string literal.
    [[nodiscard]] static std::string quote(const std::string &text);

  private:
    void emitStatements(const lc::StmtList &statements);
    void emitScopedBlock(const lc::BlockStmt &block);
    void emitStmt(const lc::Stmt &stmt);
    void emitAssignment(const lc::AssignmentStmt &stmt);
    void emitFunction(const lc::FunctionDeclStmt &stmt);
    void emitIf(const lc::IfStmt &stmt);
    void emitWhile(const lc::WhileStmt &stmt);

    [[nodiscard]] std::string emitBinary(const lc::BinaryExpr &expr);
    [[nodiscard]] std::string emitComparison(const lc::ComparisonExpr &expr);
    [[nodiscard]] std::string emitUnary(const lc::UnaryExpr &expr);
    [[nodiscard]] std::string emitCall(const lc::CallExpr &expr);
    [[nodiscard]] std::string emitString(const lc::StringLiteralExpr &expr);
    [[nodiscard]] std::string emitIdentifier(const lc::IdentifierExpr &expr) const;

    /// \brief Append @p text at the current indentation.
    void line(const std::string &text);

    std::vector<std::string> lines_{};
    unsigned indent_{0};
    NameTable names_{};
};

} // namespace lion::codegen::js
