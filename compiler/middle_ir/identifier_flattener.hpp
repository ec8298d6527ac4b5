#pragma once

#include "../frontend/ast.hpp"

#include <string_view>

namespace badlang::mir
{
    /**
     * Returns a copy of `program` in which every parameter, variable and function carries a program-wide
     * unique name of the form `<name>_<n>`, with every reference rewritten to the binding it resolved to.
     * The entry function keeps its name. The program must already have passed name and type checking.
     */
    [[nodiscard]] frontend::Program flattenIdentifiers(const frontend::Program& program,
                                                       std::string_view entryName = "main");
} // namespace badlang::mir
