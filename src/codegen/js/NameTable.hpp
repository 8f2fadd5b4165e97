//===----------------------------------------------------------------------===//
//
// Part of the LionCode project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/js/NameTable.hpp
// Purpose: Lexical scope tracking and collision-free naming for the
//          JavaScript emitter.
//
// Every LionCode declaration (variable introduction, function, parameter,
// loop variable) receives an emitted JavaScript name:
// - Uniqueness: no two declarations share an emitted name, even across
//   scopes, so statements spliced out of a block by the optimizer never
//   redeclare a `let`
// - Determinism: the first declaration of `x` keeps `x`, later ones get the
//   first free name among `x_2`, `x_3`, ...
// - Safety: JavaScript reserved words and the globals `console` and `Math`
//   are never handed out
//
// References resolve innermost scope first, like the source language.
//
//===----------------------------------------------------------------------===//
#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace lion::codegen::js
{

/// @brief Scoped map from LionCode names to emitted JavaScript names.
/// @invariant Emitted names are pairwise distinct and never reserved.
class NameTable
{
  public:
    /// @brief RAII guard pushing a scope for one block, function or loop.
    class ScopedScope
    {
      public:
        explicit ScopedScope(NameTable &table) : table_(table)
        {
            table_.pushScope();
        }

        ~ScopedScope()
        {
            table_.popScope();
        }

        ScopedScope(const ScopedScope &) = delete;
        ScopedScope &operator=(const ScopedScope &) = delete;
        ScopedScope(ScopedScope &&) = delete;
        ScopedScope &operator=(ScopedScope &&) = delete;

      private:
        NameTable &table_;
    };

    /// @brief Construct a table with one global scope and the reserved words.
    NameTable()
    {
        reset();
    }

    /// @brief Forget every declaration and start over with one global scope.
    void reset()
    {
        stack_.clear();
        stack_.emplace_back();
        used_.clear();
        for (const char *word : kReserved)
            used_.insert(word);
    }

    void pushScope()
    {
        stack_.emplace_back();
    }

    void popScope()
    {
        if (stack_.size() > 1)
            stack_.pop_back();
    }

    /// @brief Declare @p name in the current scope.
    /// @return The emitted name: @p name itself when free, else the first
    ///         free `name_N` with N >= 2.
    std::string declare(const std::string &name)
    {
        std::string emitted = name;
        for (unsigned suffix = 2; used_.contains(emitted); ++suffix)
            emitted = name + "_" + std::to_string(suffix);
        used_.insert(emitted);
        stack_.back()[name] = emitted;
        return emitted;
    }

    /// @brief Resolve a source name, searching from innermost to outermost scope.
    [[nodiscard]] std::optional<std::string> resolve(const std::string &name) const
    {
        for (auto it = stack_.rbegin(); it != stack_.rend(); ++it)
        {
            auto found = it->find(name);
            if (found != it->end())
                return found->second;
        }
        return std::nullopt;
    }

    [[nodiscard]] bool isReserved(const std::string &name) const
    {
        for (const char *word : kReserved)
        {
            if (name == word)
                return true;
        }
        return false;
    }

    [[nodiscard]] std::size_t depth() const
    {
        return stack_.size();
    }

  private:
    static constexpr const char *kReserved[] = {
        "arguments", "await",     "break",     "case",      "catch",    "class",
        "console",   "const",     "continue",  "debugger",  "default",  "delete",
        "do",        "else",      "enum",      "eval",      "export",   "extends",
        "false",     "finally",   "for",       "function",  "if",       "implements",
        "import",    "in",        "Infinity",  "instanceof", "interface", "let",
        "Math",      "NaN",       "new",       "null",      "package",  "private",
        "protected", "public",    "return",    "static",    "super",    "switch",
        "this",      "throw",     "true",      "try",       "typeof",   "undefined",
        "var",       "void",      "while",     "with",      "yield",
    };

    std::vector<std::unordered_map<std::string, std::string>> stack_;
    std::unordered_set<std::string> used_;
};

} // namespace lion::codegen::js
