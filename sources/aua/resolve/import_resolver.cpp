//
// Created by gregorian-rayne on 10/15/26.
//

#include "aua/resolve/import_resolver.hpp"

namespace aua::resolve {

    using python::is_type;
    using python::named_children;

    std::string dotted_name(const python::SyntaxTree& tree, const TSNode node) {
        if (!is_type(node, "dotted_name")) {
            return std::string(tree.text(node));
        }
        std::string name;
        for (const TSNode part : named_children(node)) {
            if (!name.empty()) {
                name += '.';
            }
            name += tree.text(part);
        }
        return name;
    }

    namespace {

        struct ImportedName {
            std::string name;
            std::string local;  ///< Empty when no alias was given
        };

        ImportedName imported_name(const python::SyntaxTree& tree, const TSNode node) {
            if (is_type(node, "aliased_import")) {
                return {dotted_name(tree, python::field(node, "name")),
                        std::string(tree.text(python::field(node, "alias")))};
            }
            return {dotted_name(tree, node), {}};
        }

        void apply_plain_import(const python::SyntaxTree& tree, const TSNode statement, AliasTable& table) {
            for (const TSNode child : named_children(statement)) {
                const auto [name, local] = imported_name(tree, child);
                if (!local.empty()) {
                    table.bind_import(local, name);
                    continue;
                }
                const std::string root = name.substr(0, name.find('.'));
                table.bind_import(root, root);
            }
        }

        void apply_from_import(const python::SyntaxTree& tree, const TSNode statement, AliasTable& table) {
            const TSNode source = python::field(statement, "module_name");

            std::string module;
            bool relative = false;
            if (is_type(source, "relative_import")) {
                relative = true;
                for (const TSNode part : named_children(source)) {
                    if (is_type(part, "dotted_name")) {
                        module = dotted_name(tree, part);
                    }
                }
            } else {
                module = dotted_name(tree, source);
            }

            for (const TSNode child : named_children(statement)) {
                if (ts_node_eq(child, source)) {
                    continue;
                }
                if (is_type(child, "wildcard_import")) {
                    if (!relative) {
                        table.add_wildcard(module);
                    }
                    continue;
                }

                const auto [name, alias] = imported_name(tree, child);
                const std::string& local = alias.empty() ? name : alias;
                if (relative) {
                    table.bind_opaque(local);
                } else {
                    table.bind_import(local, module + "." + name);
                }
            }
        }

    }  // namespace

    void apply_import(const python::SyntaxTree& tree, const TSNode statement, AliasTable& table) {
        if (is_type(statement, "import_statement")) {
            apply_plain_import(tree, statement, table);
        } else if (is_type(statement, "import_from_statement")) {
            apply_from_import(tree, statement, table);
        }
    }

}  // namespace aua::resolve
