#pragma once

#include "../frontend/ast.hpp"
#include "symbol_table.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace badlang::mir
{
    struct LoweringDiagnostic
    {
        std::string code;
        std::string functionName;
        std::string detail;
    };

    /**
     * Walk a flattened program once and record every global, function, parameter and local in `globals`.
     * Global initializers are folded to constants where possible. Returns false, with diagnostics appended,
     * when the tree breaks an invariant the checking passes guarantee (duplicate names, erroneous types or
     * nested functions).
     */
    bool buildLayout(const frontend::Program& program, FlatSymbolTable& globals,
                     std::vector<LoweringDiagnostic>& diagnostics);

    /**
     * Fold a global initializer using literals and the initial values of globals already in `globals`.
     * Calls, division by zero and overflowing division are not foldable.
     */
    [[nodiscard]] std::optional<std::int32_t> foldConstant(const frontend::Expression& expression,
                                                           const FlatSymbolTable& globals);
} // namespace badlang::mir
