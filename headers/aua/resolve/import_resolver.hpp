//
// Created by gregorian-rayne on 10/15/26.
//

#ifndef AUA_RESOLVE_IMPORT_RESOLVER_HPP
#define AUA_RESOLVE_IMPORT_RESOLVER_HPP

#include "aua/python/syntax_tree.hpp"
#include "aua/resolve/alias_table.hpp"

#include <string>

namespace aua::resolve {

    /**
     * Records the bindings introduced by an import statement.
     *
     * - `import a.b.c`          binds a -> a
     * - `import a.b.c as z`     binds z -> a.b.c
     * - `from X import Y as Z`  binds Z -> X.Y
     * - `from . import y`       binds y opaquely (client-local code)
     * - `from X import *`       marks X as a wildcard source for the scope
     *
     * Nodes other than import_statement / import_from_statement are ignored.
     */
    void apply_import(const python::SyntaxTree& tree, TSNode statement, AliasTable& table);

    /**
     * "a.b.c" for a dotted_name node, whatever whitespace the source has
     * between the parts.
     */
    [[nodiscard]] std::string dotted_name(const python::SyntaxTree& tree, TSNode node);

}  // namespace aua::resolve

#endif //AUA_RESOLVE_IMPORT_RESOLVER_HPP
