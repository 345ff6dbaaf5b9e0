//
// Created by gregorian-rayne on 10/13/26.
//

#ifndef AUA_PYTHON_SYNTAX_TREE_HPP
#define AUA_PYTHON_SYNTAX_TREE_HPP

/**
 * @file syntax_tree.hpp
 * @brief Python syntax trees from tree-sitter-python.
 *
 * Usage:
 * @code
 *     auto tree = python::SyntaxTree::parse(text, {.max_nesting_depth = 200});
 *     if (tree.is_err()) {
 *         // [ParseError] invalid syntax (context: 12:8)
 *     }
 *     for (const TSNode statement : python::named_children(tree.value().root())) { ... }
 * @endcode
 *
 * tree-sitter recovers from syntax errors by inserting ERROR and MISSING
 * nodes. A tree holding either is rejected as a whole: the file fails with a
 * ParseError whose context is "line:column" of the first bad node.
 */

#include "aua/result.hpp"

extern "C" {
#include <tree_sitter/api.h>
}

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace aua::python {

    /**
     * Per-file resource limits. Exceeding one is reported as a ParseError.
     */
    struct ParseLimits {
        std::size_t max_nesting_depth = 200;
        std::optional<std::chrono::steady_clock::time_point> deadline;
    };

    /**
     * One-based line and column (in bytes) of a node.
     */
    struct Position {
        std::size_t line = 0;
        std::size_t column = 0;
    };

    class SyntaxTree {
    public:
        /**
         * Skips a UTF-8 BOM, validates the encoding, parses, and checks the
         * tree for errors and the nesting limit.
         */
        [[nodiscard]] static Result<SyntaxTree, Error> parse(std::string_view source,
                                                             const ParseLimits& limits = {});

        [[nodiscard]] TSNode root() const;

        /**
         * Source text covered by `node`.
         */
        [[nodiscard]] std::string_view text(TSNode node) const;

        [[nodiscard]] const std::string& source() const noexcept { return source_; }

    private:
        SyntaxTree(std::string source, TSTree* tree);

        std::string source_;
        std::unique_ptr<TSTree, decltype(&ts_tree_delete)> tree_;
    };

    [[nodiscard]] std::string_view node_type(TSNode node);

    [[nodiscard]] bool is_type(TSNode node, std::string_view type);

    /**
     * Child stored under `field`, or a null node.
     */
    [[nodiscard]] TSNode field(TSNode node, std::string_view name);

    /**
     * Every child stored under `field`, for fields that repeat
     * (`elif` alternatives, `match a, b` subjects).
     */
    [[nodiscard]] std::vector<TSNode> field_children(TSNode node, std::string_view name);

    /**
     * Named children without comments and line continuations.
     */
    [[nodiscard]] std::vector<TSNode> named_children(TSNode node);

    [[nodiscard]] Position position_of(TSNode node);

    /**
     * Byte offset of the first malformed UTF-8 sequence, or npos.
     */
    [[nodiscard]] std::size_t find_invalid_utf8(std::string_view text) noexcept;

}  // namespace aua::python

#endif //AUA_PYTHON_SYNTAX_TREE_HPP
