//
// Created by gregorian-rayne on 10/13/26.
//

#include "aua/python/syntax_tree.hpp"

#include <cstdint>
#include <limits>

extern "C" const TSLanguage* tree_sitter_python(void);

namespace aua::python {

    namespace {

        constexpr std::size_t kDeadlineCheckInterval = 4096;
        constexpr std::string_view kBom = "\xEF\xBB\xBF";

        Error failure_at(const std::string& message, const Position position) {
            return Error::parse_error(message, std::to_string(position.line) + ":" + std::to_string(position.column));
        }

        Position position_at_offset(const std::string_view text, const std::size_t offset) {
            Position position{1, 1};
            std::size_t line_start = 0;
            for (std::size_t i = 0; i < offset && i < text.size(); ++i) {
                if (text[i] == '\n') {
                    ++position.line;
                    line_start = i + 1;
                }
            }
            position.column = offset - line_start + 1;
            return position;
        }

        bool deadline_passed(const ParseLimits& limits) {
            return limits.deadline.has_value() && std::chrono::steady_clock::now() > *limits.deadline;
        }

        /**
         * `a + b + c` nests one binary_operator per operand; such chains do
         * not count as nesting.
         */
        bool is_operator_chain(const TSNode node, const TSSymbol parent) {
            if (ts_node_symbol(node) != parent) {
                return false;
            }
            const auto type = node_type(node);
            return type == "binary_operator" || type == "boolean_operator";
        }

        std::optional<Error> check_argument_order(const TSNode arguments) {
            bool keyword_seen = false;
            bool mapping_unpacked = false;
            for (const TSNode argument : named_children(arguments)) {
                const auto type = node_type(argument);
                if (type == "keyword_argument") {
                    keyword_seen = true;
                } else if (type == "dictionary_splat") {
                    mapping_unpacked = true;
                } else if (type == "list_splat") {
                    if (mapping_unpacked) {
                        return failure_at("iterable argument unpacking follows keyword argument unpacking",
                                          position_of(argument));
                    }
                } else if (mapping_unpacked) {
                    return failure_at("positional argument follows keyword argument unpacking", position_of(argument));
                } else if (keyword_seen) {
                    return failure_at("positional argument follows keyword argument", position_of(argument));
                }
            }
            return std::nullopt;
        }

        class CursorGuard {
        public:
            explicit CursorGuard(const TSNode root) : cursor_(ts_tree_cursor_new(root)) {}
            ~CursorGuard() { ts_tree_cursor_delete(&cursor_); }
            CursorGuard(const CursorGuard&) = delete;
            CursorGuard& operator=(const CursorGuard&) = delete;

            TSTreeCursor* get() noexcept { return &cursor_; }

        private:
            TSTreeCursor cursor_;
        };

        /**
         * Pre-order walk over every node: the first ERROR or MISSING node,
         * misplaced arguments, the nesting limit and the deadline.
         */
        std::optional<Error> check_tree(const TSNode root, const ParseLimits& limits) {
            struct Frame {
                TSSymbol symbol;
                bool counted;
            };

            CursorGuard guard(root);
            TSTreeCursor* cursor = guard.get();
            std::vector<Frame> frames;
            std::size_t depth = 0;
            std::size_t visited = 0;

            while (true) {
                const TSNode node = ts_tree_cursor_current_node(cursor);

                if (++visited % kDeadlineCheckInterval == 0 && deadline_passed(limits)) {
                    return failure_at("processing deadline exceeded", position_of(node));
                }
                if (ts_node_is_missing(node)) {
                    const std::string type(node_type(node));
                    return failure_at(ts_node_is_named(node) ? "missing " + type : "missing '" + type + "'",
                                      position_of(node));
                }
                if (is_type(node, "ERROR")) {
                    return failure_at("invalid syntax", position_of(node));
                }
                if (is_type(node, "argument_list")) {
                    if (auto problem = check_argument_order(node)) {
                        return problem;
                    }
                }

                const bool counted = ts_node_is_named(node) &&
                                     (frames.empty() || !is_operator_chain(node, frames.back().symbol));
                if (counted && ++depth > limits.max_nesting_depth) {
                    return failure_at("too many nested parentheses or blocks", position_of(node));
                }

                if (ts_tree_cursor_goto_first_child(cursor)) {
                    frames.push_back({ts_node_symbol(node), counted});
                    continue;
                }
                if (counted) {
                    --depth;
                }

                while (!ts_tree_cursor_goto_next_sibling(cursor)) {
                    if (frames.empty() || !ts_tree_cursor_goto_parent(cursor)) {
                        return std::nullopt;
                    }
                    if (frames.back().counted) {
                        --depth;
                    }
                    frames.pop_back();
                }
            }
        }

    }  // namespace

    SyntaxTree::SyntaxTree(std::string source, TSTree* tree)
        : source_(std::move(source))
        , tree_(tree, ts_tree_delete) {}

    Result<SyntaxTree, Error> SyntaxTree::parse(std::string_view source, const ParseLimits& limits) {
        if (source.starts_with(kBom)) {
            source.remove_prefix(kBom.size());
        }
        if (const auto bad = find_invalid_utf8(source); bad != std::string_view::npos) {
            return Result<SyntaxTree, Error>::failure(
                failure_at("invalid UTF-8 in source", position_at_offset(source, bad)));
        }
        if (source.size() > std::numeric_limits<std::uint32_t>::max()) {
            return Result<SyntaxTree, Error>::failure(Error::parse_error("source too large to parse"));
        }

        const std::unique_ptr<TSParser, decltype(&ts_parser_delete)> parser(ts_parser_new(), ts_parser_delete);
        if (!parser || !ts_parser_set_language(parser.get(), tree_sitter_python())) {
            return Result<SyntaxTree, Error>::failure(
                Error::internal_error("tree-sitter-python grammar is not compatible with the tree-sitter runtime"));
        }

        std::string text(source);
        TSTree* raw = ts_parser_parse_string(parser.get(), nullptr, text.data(), static_cast<std::uint32_t>(text.size()));
        if (raw == nullptr) {
            return Result<SyntaxTree, Error>::failure(Error::parse_error("parser produced no tree"));
        }
        SyntaxTree tree(std::move(text), raw);

        if (deadline_passed(limits)) {
            return Result<SyntaxTree, Error>::failure(failure_at("processing deadline exceeded", Position{1, 1}));
        }
        if (auto problem = check_tree(tree.root(), limits)) {
            return Result<SyntaxTree, Error>::failure(std::move(*problem));
        }
        return Result<SyntaxTree, Error>::success(std::move(tree));
    }

    TSNode SyntaxTree::root() const {
        return ts_tree_root_node(tree_.get());
    }

    std::string_view SyntaxTree::text(const TSNode node) const {
        if (ts_node_is_null(node)) {
            return {};
        }
        const std::uint32_t start = ts_node_start_byte(node);
        const std::uint32_t end = ts_node_end_byte(node);
        if (start >= source_.size() || end < start) {
            return {};
        }
        return std::string_view(source_).substr(start, end - start);
    }

    std::string_view node_type(const TSNode node) {
        if (ts_node_is_null(node)) {
            return {};
        }
        const char* type = ts_node_type(node);
        return type == nullptr ? std::string_view{} : std::string_view(type);
    }

    bool is_type(const TSNode node, const std::string_view type) {
        return node_type(node) == type;
    }

    TSNode field(const TSNode node, const std::string_view name) {
        return ts_node_child_by_field_name(node, name.data(), static_cast<std::uint32_t>(name.size()));
    }

    std::vector<TSNode> field_children(const TSNode node, const std::string_view name) {
        std::vector<TSNode> children;
        if (ts_node_is_null(node)) {
            return children;
        }
        const std::uint32_t count = ts_node_child_count(node);
        for (std::uint32_t i = 0; i < count; ++i) {
            const char* child_field = ts_node_field_name_for_child(node, i);
            if (child_field != nullptr && name == child_field) {
                children.push_back(ts_node_child(node, i));
            }
        }
        return children;
    }

    std::vector<TSNode> named_children(const TSNode node) {
        std::vector<TSNode> children;
        if (ts_node_is_null(node)) {
            return children;
        }
        const std::uint32_t count = ts_node_named_child_count(node);
        children.reserve(count);
        for (std::uint32_t i = 0; i < count; ++i) {
            const TSNode child = ts_node_named_child(node, i);
            if (!ts_node_is_extra(child)) {
                children.push_back(child);
            }
        }
        return children;
    }

    Position position_of(const TSNode node) {
        const TSPoint point = ts_node_start_point(node);
        return {static_cast<std::size_t>(point.row) + 1, static_cast<std::size_t>(point.column) + 1};
    }

    std::size_t find_invalid_utf8(const std::string_view text) noexcept {
        std::size_t i = 0;
        while (i < text.size()) {
            const auto c = static_cast<unsigned char>(text[i]);
            if (c < 0x80) {
                ++i;
                continue;
            }

            std::size_t length;
            char32_t cp;
            if ((c & 0xE0) == 0xC0) {
                length = 2;
                cp = c & 0x1F;
            } else if ((c & 0xF0) == 0xE0) {
                length = 3;
                cp = c & 0x0F;
            } else if ((c & 0xF8) == 0xF0) {
                length = 4;
                cp = c & 0x07;
            } else {
                return i;
            }
            if (i + length > text.size()) {
                return i;
            }
            for (std::size_t k = 1; k < length; ++k) {
                const auto cc = static_cast<unsigned char>(text[i + k]);
                if ((cc & 0xC0) != 0x80) {
                    return i;
                }
                cp = (cp << 6) | (cc & 0x3F);
            }
            const bool overlong = (length == 2 && cp < 0x80) ||
                                  (length == 3 && cp < 0x800) ||
                                  (length == 4 && cp < 0x10000);
            if (overlong || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
                return i;
            }
            i += length;
        }
        return std::string_view::npos;
    }

}  // namespace aua::python
