//
// Created by gregorian-rayne on 10/15/26.
//

#include "aua/usage/value_signature.hpp"
#include "aua/python/literal.hpp"

#include <array>
#include <optional>
#include <utility>

namespace aua::usage {

    namespace {

        using python::is_type;
        using python::node_type;
        using python::SyntaxTree;

        constexpr std::array<std::pair<std::string_view, std::string_view>, 9> SHAPES = {{
            {"list", "list"},
            {"tuple", "tuple"},
            {"dictionary", "dict"},
            {"set", "set"},
            {"lambda", "lambda"},
            {"list_comprehension", "listcomp"},
            {"set_comprehension", "setcomp"},
            {"dictionary_comprehension", "dictcomp"},
            {"generator_expression", "genexp"},
        }};

        constexpr std::array<std::string_view, 6> OPERATORS = {
            "unary_operator", "not_operator", "binary_operator",
            "boolean_operator", "comparison_operator", "conditional_expression"
        };

        TSNode unwrap(TSNode node) {
            while (is_type(node, "parenthesized_expression")) {
                const auto inner = python::named_children(node);
                if (inner.size() != 1) {
                    break;
                }
                node = inner.front();
            }
            return node;
        }

        bool is_format_string(const SyntaxTree& tree, const TSNode string) {
            for (const char c : tree.text(string)) {
                if (c == '\'' || c == '"') {
                    return false;
                }
                if (c == 'f' || c == 'F') {
                    return true;
                }
            }
            return false;
        }

        bool is_number(const TSNode node) {
            return is_type(node, "integer") || is_type(node, "float");
        }

        bool is_operator(const TSNode node) {
            const auto type = node_type(node);
            for (const auto op : OPERATORS) {
                if (type == op) {
                    return true;
                }
            }
            return false;
        }

        bool is_constant(const SyntaxTree& tree, const TSNode node) {
            const auto type = node_type(node);
            if (type == "string") {
                return !is_format_string(tree, node);
            }
            if (type == "concatenated_string") {
                for (const TSNode part : python::named_children(node)) {
                    if (is_format_string(tree, part)) {
                        return false;
                    }
                }
                return true;
            }
            return is_number(node) || type == "true" || type == "false" || type == "none" || type == "ellipsis";
        }

        /**
         * True when every leaf under an operator node is a constant.
         * Operator chains can be arbitrarily long, so the walk keeps its own
         * stack.
         */
        bool is_constant_tree(const SyntaxTree& tree, const TSNode root) {
            std::vector<TSNode> pending{root};
            while (!pending.empty()) {
                const TSNode node = unwrap(pending.back());
                pending.pop_back();
                if (is_constant(tree, node)) {
                    continue;
                }
                if (!is_operator(node)) {
                    return false;
                }
                for (const TSNode child : python::named_children(node)) {
                    pending.push_back(child);
                }
            }
            return true;
        }

        std::optional<std::string> string_value(const SyntaxTree& tree, const TSNode node,
                                                std::u32string& value, bool& is_bytes) {
            auto decoded = python::decode_string_token(tree.text(node));
            if (decoded.is_err()) {
                return decoded.error().message();
            }
            is_bytes = decoded.value().is_bytes;
            value += decoded.value().value;
            return std::nullopt;
        }

        ValueSignature constant_signature(const SyntaxTree& tree, const TSNode node) {
            const auto type = node_type(node);
            if (type == "true") return ValueSignature::literal("True");
            if (type == "false") return ValueSignature::literal("False");
            if (type == "none") return ValueSignature::literal("None");
            if (type == "ellipsis") return ValueSignature::literal("Ellipsis");

            if (is_number(node)) {
                auto number = python::decode_number_token(tree.text(node));
                return number.is_ok() ? ValueSignature::literal(number.value().repr) : ValueSignature::unknown();
            }

            std::u32string value;
            bool is_bytes = false;
            if (type == "string") {
                if (string_value(tree, node, value, is_bytes)) {
                    return ValueSignature::unknown();
                }
            } else {
                bool first = true;
                for (const TSNode part : python::named_children(node)) {
                    bool part_bytes = false;
                    if (string_value(tree, part, value, part_bytes)) {
                        return ValueSignature::unknown();
                    }
                    if (first) {
                        is_bytes = part_bytes;
                        first = false;
                    }
                }
            }
            return ValueSignature::literal(python::string_repr(value, is_bytes));
        }

    }  // namespace

    ValueSignature signature_of(const SyntaxTree& tree, const TSNode expr) {
        const TSNode node = unwrap(expr);
        const auto type = node_type(node);

        if (is_constant(tree, node)) {
            return constant_signature(tree, node);
        }
        if (type == "string" || type == "concatenated_string") {
            return ValueSignature::shape("fstring");
        }
        for (const auto& [node_kind, shape] : SHAPES) {
            if (type == node_kind) {
                return ValueSignature::shape(std::string(shape));
            }
        }

        if (type == "unary_operator") {
            const TSNode operand = unwrap(python::field(node, "argument"));
            const auto op = tree.text(python::field(node, "operator"));
            if (is_number(operand) && (op == "-" || op == "+")) {
                auto number = python::decode_number_token(tree.text(operand));
                if (number.is_err()) {
                    return ValueSignature::unknown();
                }
                const std::string& repr = number.value().repr;
                if (op == "+" || (number.value().kind == python::NumberKind::Int && repr == "0")) {
                    return ValueSignature::literal(repr);
                }
                return ValueSignature::literal("-" + repr);
            }
        }

        if (is_operator(node) && is_constant_tree(tree, node)) {
            return ValueSignature::shape("expression");
        }
        return ValueSignature::unknown();
    }

    ValueSignature bucket_signature(const bool keyword_bucket, const std::size_t count) {
        return ValueSignature::shape(std::string(keyword_bucket ? "dict[" : "tuple[") +
                                     std::to_string(count) + "]");
    }

}  // namespace aua::usage
