//
// Created by gregorian-rayne on 10/15/26.
//

#include "aua/resolve/call_resolver.hpp"
#include "aua/resolve/import_resolver.hpp"
#include "aua/usage/value_signature.hpp"

#include <algorithm>
#include <set>

namespace aua::resolve {

    using python::field;
    using python::field_children;
    using python::is_type;
    using python::named_children;
    using python::node_type;

    namespace {

        constexpr std::size_t kDeadlineCheckInterval = 256;

        bool is_comprehension(const std::string_view type) {
            return type == "list_comprehension" || type == "set_comprehension" ||
                   type == "dictionary_comprehension" || type == "generator_expression";
        }

        bool is_null(const TSNode node) {
            return ts_node_is_null(node);
        }

        /**
         * Suite of a clause. `finally` and `except` carry theirs without a
         * field name.
         */
        TSNode block_of(const TSNode clause) {
            const TSNode body = field(clause, "body");
            if (!is_null(body)) {
                return body;
            }
            TSNode block{};
            for (const TSNode child : named_children(clause)) {
                if (is_type(child, "block")) {
                    block = child;
                }
            }
            return block;
        }

        /**
         * Identifier a parameter binds: `x`, `x: int`, `x=1`, `*args`, `**kw`.
         */
        TSNode parameter_name(TSNode parameter) {
            while (!is_null(parameter) && !is_type(parameter, "identifier")) {
                const TSNode name = field(parameter, "name");
                if (!is_null(name)) {
                    parameter = name;
                    continue;
                }
                const auto children = named_children(parameter);
                if (children.empty()) {
                    return TSNode{};
                }
                parameter = children.front();
            }
            return parameter;
        }

        TSNode first_identifier(TSNode node) {
            while (!is_null(node) && !is_type(node, "identifier")) {
                const auto children = named_children(node);
                if (children.empty()) {
                    return TSNode{};
                }
                node = children.front();
            }
            return node;
        }

    }  // namespace

    CallResolver::CallResolver(const api::ApiDescription& api, std::string file)
        : api_(api)
        , file_(std::move(file)) {}

    Result<std::vector<CallSite>, Error> CallResolver::resolve(const python::SyntaxTree& tree, Deadline deadline) {
        tree_ = &tree;
        deadline_ = deadline;
        ticks_ = 0;
        aliases_ = AliasTable{};
        sites_.clear();

        try {
            visit_block(tree.root());
        } catch (const DeadlineExceeded& expired) {
            tree_ = nullptr;
            sites_.clear();
            return Result<std::vector<CallSite>, Error>::failure(Error::parse_error(
                "processing deadline exceeded",
                std::to_string(expired.position.line) + ":" + std::to_string(expired.position.column)));
        }

        tree_ = nullptr;
        return Result<std::vector<CallSite>, Error>::success(std::move(sites_));
    }

    void CallResolver::tick(const TSNode node) {
        if (!deadline_ || ticks_++ % kDeadlineCheckInterval != 0) {
            return;
        }
        if (std::chrono::steady_clock::now() > *deadline_) {
            throw DeadlineExceeded{python::position_of(node)};
        }
    }

    void CallResolver::visit_block(const TSNode block) {
        for (const TSNode stmt : named_children(block)) {
            visit_statement(stmt);
        }
    }

    void CallResolver::visit_statement(const TSNode stmt) {
        tick(stmt);
        const auto type = node_type(stmt);

        if (type == "expression_statement") {
            for (const TSNode child : named_children(stmt)) {
                if (is_type(child, "assignment") || is_type(child, "augmented_assignment")) {
                    visit_assignment(child);
                } else {
                    visit_expr(child);
                }
            }
        } else if (type == "import_statement" || type == "import_from_statement") {
            apply_import(*tree_, stmt, aliases_);
        } else if (type == "function_definition") {
            visit_function(stmt, TSNode{});
        } else if (type == "class_definition") {
            visit_class(stmt, TSNode{});
        } else if (type == "decorated_definition") {
            const TSNode definition = field(stmt, "definition");
            if (is_type(definition, "class_definition")) {
                visit_class(definition, stmt);
            } else {
                visit_function(definition, stmt);
            }
        } else if (type == "if_statement") {
            visit_if(stmt);
        } else if (type == "for_statement" || type == "while_statement") {
            visit_loop(stmt);
        } else if (type == "try_statement") {
            visit_try(stmt);
        } else if (type == "with_statement") {
            visit_with(stmt);
        } else if (type == "match_statement") {
            visit_match(stmt);
        } else if (type == "delete_statement") {
            for (const TSNode target : named_children(stmt)) {
                bind_target(target);
            }
        } else if (type == "global_statement") {
            for (const TSNode name : named_children(stmt)) {
                aliases_.declare_global(std::string(tree_->text(name)));
            }
        } else if (type == "nonlocal_statement") {
            for (const TSNode name : named_children(stmt)) {
                aliases_.declare_nonlocal(std::string(tree_->text(name)));
            }
        } else if (type == "type_alias_statement") {
            const TSNode name = first_identifier(field(stmt, "left"));
            if (!is_null(name)) {
                aliases_.rebind(std::string(tree_->text(name)));
            }
            visit_expr(field(stmt, "right"));
        } else if (type == "future_import_statement" || type == "pass_statement" ||
                   type == "break_statement" || type == "continue_statement") {
            return;
        } else {
            // return, raise, assert, print, exec
            for (const TSNode child : named_children(stmt)) {
                visit_expr(child);
            }
        }
    }

    void CallResolver::visit_assignment(const TSNode assignment) {
        if (is_type(assignment, "augmented_assignment")) {
            const TSNode target = field(assignment, "left");
            visit_expr(target);
            visit_expr(field(assignment, "right"));
            bind_target(target);
            return;
        }

        // a = b = value nests one assignment per target.
        std::vector<TSNode> targets;
        TSNode node = assignment;
        while (is_type(node, "assignment")) {
            targets.push_back(field(node, "left"));
            visit_expr(field(node, "type"));
            node = field(node, "right");
        }

        if (is_null(node)) {
            // Annotation only: `x: int` binds nothing.
            if (!is_type(targets.front(), "identifier")) {
                visit_expr(targets.front());
            }
            return;
        }
        if (is_type(node, "augmented_assignment")) {
            visit_assignment(node);
        } else {
            visit_expr(node);
        }
        for (const TSNode target : targets) {
            bind_target(target);
        }
    }

    void CallResolver::visit_function(const TSNode function, const TSNode decorated) {
        for (const TSNode decorator : named_children(decorated)) {
            if (is_type(decorator, "decorator")) {
                visit_expr(decorator);
            }
        }
        const TSNode parameters = field(function, "parameters");
        visit_parameter_defaults(parameters);
        visit_expr(field(function, "return_type"));

        aliases_.rebind(std::string(tree_->text(field(function, "name"))));

        aliases_.push_scope(ScopeKind::Function);
        bind_parameters(parameters);
        visit_block(field(function, "body"));
        aliases_.pop_scope();
    }

    void CallResolver::visit_class(const TSNode klass, const TSNode decorated) {
        for (const TSNode decorator : named_children(decorated)) {
            if (is_type(decorator, "decorator")) {
                visit_expr(decorator);
            }
        }
        visit_expr(field(klass, "superclasses"));

        aliases_.push_scope(ScopeKind::Class);
        visit_block(field(klass, "body"));
        aliases_.pop_scope();

        aliases_.rebind(std::string(tree_->text(field(klass, "name"))));
    }

    void CallResolver::visit_if(const TSNode stmt) {
        visit_expr(field(stmt, "condition"));

        const auto mark = aliases_.open_branch();
        visit_block(field(stmt, "consequence"));
        auto outcome = aliases_.rewind(mark);

        bool has_else = false;
        for (const TSNode clause : field_children(stmt, "alternative")) {
            if (is_type(clause, "elif_clause")) {
                visit_expr(field(clause, "condition"));
                visit_block(field(clause, "consequence"));
            } else {
                visit_block(block_of(clause));
                has_else = true;
            }
            outcome = aliases_.join(outcome, aliases_.rewind(mark));
        }
        if (!has_else) {
            outcome = aliases_.join(outcome, {});
        }
        aliases_.close_branch(outcome);
    }

    void CallResolver::visit_loop(const TSNode stmt) {
        const bool is_for = is_type(stmt, "for_statement");
        visit_expr(field(stmt, is_for ? "right" : "condition"));

        // The body may run zero times.
        const auto mark = aliases_.open_branch();
        if (is_for) {
            bind_target(field(stmt, "left"));
        }
        visit_block(field(stmt, "body"));
        const auto body = aliases_.rewind(mark);
        aliases_.close_branch(aliases_.join(body, {}));

        const TSNode orelse = field(stmt, "alternative");
        if (!is_null(orelse)) {
            visit_block(block_of(orelse));
        }
    }

    void CallResolver::visit_try(const TSNode stmt) {
        std::vector<TSNode> handlers;
        TSNode orelse{};
        TSNode finalbody{};
        for (const TSNode clause : named_children(stmt)) {
            const auto type = node_type(clause);
            if (type == "except_clause" || type == "except_group_clause") {
                handlers.push_back(clause);
            } else if (type == "else_clause") {
                orelse = clause;
            } else if (type == "finally_clause") {
                finalbody = clause;
            }
        }

        const auto mark = aliases_.open_branch();
        visit_block(field(stmt, "body"));
        const auto body = aliases_.rewind(mark);

        // A handler may start anywhere inside the body.
        const auto handler_entry = aliases_.join(body, {});

        aliases_.apply(body);
        if (!is_null(orelse)) {
            visit_block(block_of(orelse));
        }
        auto outcome = aliases_.rewind(mark);

        for (const TSNode handler : handlers) {
            aliases_.apply(handler_entry);

            // except E as name: expressions precede the block
            std::vector<TSNode> expressions;
            for (const TSNode child : named_children(handler)) {
                if (!is_type(child, "block")) {
                    expressions.push_back(child);
                }
            }
            if (!expressions.empty() && is_type(expressions.front(), "as_pattern")) {
                const TSNode pattern = expressions.front();
                const auto inner = named_children(pattern);
                expressions = {inner.empty() ? TSNode{} : inner.front(), field(pattern, "alias")};
            }
            if (!expressions.empty()) {
                visit_expr(expressions.front());
            }
            if (expressions.size() > 1) {
                const TSNode name = first_identifier(expressions[1]);
                if (!is_null(name)) {
                    aliases_.rebind(std::string(tree_->text(name)));
                }
            }

            visit_block(block_of(handler));
            outcome = aliases_.join(outcome, aliases_.rewind(mark));
        }

        aliases_.close_branch(outcome);
        if (!is_null(finalbody)) {
            visit_block(block_of(finalbody));
        }
    }

    void CallResolver::visit_with(const TSNode stmt) {
        for (const TSNode child : named_children(stmt)) {
            if (!is_type(child, "with_clause")) {
                continue;
            }
            for (const TSNode item : named_children(child)) {
                const TSNode value = field(item, "value");
                if (!is_type(value, "as_pattern")) {
                    visit_expr(value);
                    if (const TSNode alias = field(item, "alias"); !is_null(alias)) {
                        bind_target(alias);
                    }
                    continue;
                }
                const auto inner = named_children(value);
                if (!inner.empty()) {
                    visit_expr(inner.front());
                }
                TSNode target = field(value, "alias");
                if (is_type(target, "as_pattern_target")) {
                    const auto bound = named_children(target);
                    target = bound.empty() ? TSNode{} : bound.front();
                }
                if (!is_null(target)) {
                    bind_target(target);
                }
            }
        }
        visit_block(field(stmt, "body"));
    }

    void CallResolver::visit_match(const TSNode stmt) {
        for (const TSNode subject : field_children(stmt, "subject")) {
            visit_expr(subject);
        }

        // No case may match.
        const auto mark = aliases_.open_branch();
        AliasTable::Branch outcome;

        for (const TSNode match_case : named_children(field(stmt, "body"))) {
            if (!is_type(match_case, "case_clause")) {
                continue;
            }
            tick(match_case);
            for (const TSNode pattern : named_children(match_case)) {
                if (is_type(pattern, "case_pattern")) {
                    bind_captures(pattern);
                }
            }
            visit_expr(field(match_case, "guard"));
            visit_block(field(match_case, "consequence"));
            outcome = aliases_.join(outcome, aliases_.rewind(mark));
        }

        aliases_.close_branch(outcome);
    }

    void CallResolver::bind_captures(const TSNode pattern) {
        std::vector<TSNode> pending{pattern};
        while (!pending.empty()) {
            const TSNode node = pending.back();
            pending.pop_back();

            const auto type = node_type(node);
            auto children = named_children(node);

            if (type == "dotted_name") {
                // `x` captures, `Color.RED` compares.
                if (children.size() == 1 && tree_->text(node) != "_") {
                    aliases_.rebind(std::string(tree_->text(node)));
                }
                continue;
            }
            if (type == "identifier") {
                if (tree_->text(node) != "_") {
                    aliases_.rebind(std::string(tree_->text(node)));
                }
                continue;
            }
            if ((type == "class_pattern" || type == "keyword_pattern") && !children.empty()) {
                // Class name and keyword are not captures.
                children.erase(children.begin());
            }
            for (auto it = children.rbegin(); it != children.rend(); ++it) {
                pending.push_back(*it);
            }
        }
    }

    void CallResolver::visit_expr(const TSNode expr) {
        if (is_null(expr)) {
            return;
        }

        // Operator chains are as long as the source line, so only the
        // scoped constructs recurse.
        std::vector<TSNode> pending{expr};
        while (!pending.empty()) {
            const TSNode node = pending.back();
            pending.pop_back();

            const auto type = node_type(node);
            if (type == "call") {
                visit_call(node);
                continue;
            }
            if (type == "lambda") {
                visit_lambda(node);
                continue;
            }
            if (is_comprehension(type)) {
                visit_comprehension(node);
                continue;
            }
            if (type == "named_expression") {
                visit_expr(field(node, "value"));
                aliases_.rebind(std::string(tree_->text(field(node, "name"))), true);
                continue;
            }

            const auto children = named_children(node);
            for (auto it = children.rbegin(); it != children.rend(); ++it) {
                pending.push_back(*it);
            }
        }
    }

    void CallResolver::visit_call(const TSNode call) {
        tick(call);
        const TSNode callee = field(call, "function");
        const python::Position position = python::position_of(call);

        CallSite site;
        site.location = {file_, position.line, position.column};
        site.target = resolve_callee(callee);
        site.arguments = arguments_of(call);
        sites_.push_back(std::move(site));

        visit_expr(callee);
        visit_expr(field(call, "arguments"));
    }

    std::vector<CallArgument> CallResolver::arguments_of(const TSNode call) const {
        std::vector<CallArgument> arguments;
        const TSNode list = field(call, "arguments");

        // f(x for x in xs)
        if (is_type(list, "generator_expression")) {
            arguments.push_back({ArgumentKind::Positional, {}, usage::signature_of(*tree_, list)});
            return arguments;
        }

        for (const TSNode argument : named_children(list)) {
            const auto type = node_type(argument);
            if (type == "keyword_argument") {
                arguments.push_back({ArgumentKind::Keyword,
                                     std::string(tree_->text(field(argument, "name"))),
                                     usage::signature_of(*tree_, field(argument, "value"))});
            } else if (type == "list_splat" || type == "dictionary_splat") {
                const auto inner = named_children(argument);
                arguments.push_back({type == "list_splat" ? ArgumentKind::StarUnpack : ArgumentKind::DoubleStarUnpack,
                                     {},
                                     inner.empty() ? ValueSignature::unknown() : usage::signature_of(*tree_, inner.front())});
            } else {
                arguments.push_back({ArgumentKind::Positional, {}, usage::signature_of(*tree_, argument)});
            }
        }
        return arguments;
    }

    void CallResolver::visit_lambda(const TSNode lambda) {
        const TSNode parameters = field(lambda, "parameters");
        visit_parameter_defaults(parameters);
        aliases_.push_scope(ScopeKind::Function);
        bind_parameters(parameters);
        visit_expr(field(lambda, "body"));
        aliases_.pop_scope();
    }

    void CallResolver::visit_comprehension(const TSNode comprehension) {
        const TSNode body = field(comprehension, "body");
        std::vector<TSNode> clauses;
        for (const TSNode child : named_children(comprehension)) {
            if (!ts_node_eq(child, body)) {
                clauses.push_back(child);
            }
        }

        // The first iterable is evaluated in the enclosing scope.
        bool first = true;
        for (const TSNode clause : clauses) {
            if (is_type(clause, "for_in_clause")) {
                for (const TSNode iterable : field_children(clause, "right")) {
                    visit_expr(iterable);
                }
                break;
            }
        }

        aliases_.push_scope(ScopeKind::Comprehension);
        for (const TSNode clause : clauses) {
            if (is_type(clause, "for_in_clause")) {
                if (!first) {
                    for (const TSNode iterable : field_children(clause, "right")) {
                        visit_expr(iterable);
                    }
                }
                first = false;
                bind_target(field(clause, "left"));
            } else {
                visit_expr(clause);
            }
        }
        visit_expr(body);
        aliases_.pop_scope();
    }

    void CallResolver::visit_parameter_defaults(const TSNode parameters) {
        for (const TSNode parameter : named_children(parameters)) {
            visit_expr(field(parameter, "type"));
            visit_expr(field(parameter, "value"));
        }
    }

    void CallResolver::bind_parameters(const TSNode parameters) {
        for (const TSNode parameter : named_children(parameters)) {
            const TSNode name = parameter_name(parameter);
            if (!is_null(name)) {
                aliases_.rebind(std::string(tree_->text(name)));
            }
        }
    }

    void CallResolver::bind_target(const TSNode target) {
        const auto type = node_type(target);
        if (type == "identifier") {
            aliases_.rebind(std::string(tree_->text(target)));
        } else if (type == "pattern_list" || type == "tuple_pattern" || type == "list_pattern" ||
                   type == "expression_list" || type == "tuple" || type == "list" ||
                   type == "parenthesized_expression" || type == "list_splat_pattern" || type == "list_splat") {
            for (const TSNode child : named_children(target)) {
                bind_target(child);
            }
        } else {
            visit_expr(target);
        }
    }

    CallTarget CallResolver::resolve_callee(const TSNode callee) const {
        std::vector<std::string_view> attributes;
        TSNode node = callee;
        while (is_type(node, "attribute")) {
            attributes.push_back(tree_->text(field(node, "attribute")));
            node = field(node, "object");
        }
        if (!is_type(node, "identifier")) {
            return UnresolvedTarget{UnresolvedReason::DynamicCallee, {}};
        }
        std::reverse(attributes.begin(), attributes.end());

        const std::string name(tree_->text(node));
        std::string suffix;
        for (const auto attribute : attributes) {
            suffix += '.';
            suffix += attribute;
        }

        const auto binding = aliases_.lookup(name);
        if (!binding) {
            bool api_wildcard = false;
            std::set<const ApiElement*> candidates;
            for (const auto& module : aliases_.visible_wildcards()) {
                if (!api_.is_package_root(module)) {
                    continue;
                }
                api_wildcard = true;
                for (const ApiElement* element : api_.find_by_bare_name(name, module)) {
                    candidates.insert(element);
                }
            }
            if (!api_wildcard || candidates.empty()) {
                return UnresolvedTarget{UnresolvedReason::NotImported, name + suffix};
            }
            if (candidates.size() > 1) {
                return UnresolvedTarget{UnresolvedReason::Ambiguous, name + suffix};
            }
            return resolve_identifier((*candidates.begin())->qualified_name + suffix);
        }

        switch (binding->state) {
            case BindingState::Origin:
                return resolve_identifier(binding->origin + suffix);
            case BindingState::Opaque:
                return UnresolvedTarget{UnresolvedReason::NotInApi, name + suffix};
            case BindingState::Rebound:
                return UnresolvedTarget{UnresolvedReason::Rebound, name + suffix};
            case BindingState::Ambiguous:
                return UnresolvedTarget{UnresolvedReason::Ambiguous, name + suffix};
        }
        return UnresolvedTarget{UnresolvedReason::NotImported, name + suffix};
    }

    CallTarget CallResolver::resolve_identifier(const std::string& composed) const {
        const std::string canonical = api_.canonicalize(composed);
        const ApiElement* element = api_.find(canonical);
        if (element == nullptr) {
            element = api_.find(composed);
        }
        if (element == nullptr) {
            return UnresolvedTarget{UnresolvedReason::NotInApi, canonical};
        }

        switch (element->kind) {
            case ElementKind::Function:
                return ResolvedTarget{element->qualified_name, 0, false};

            case ElementKind::Method:
                return ResolvedTarget{element->qualified_name,
                                      element->method_kind == MethodKind::Class ? std::size_t{1} : std::size_t{0},
                                      false};

            case ElementKind::Class: {
                const ApiElement* constructor = api_.constructor_of(element->qualified_name);
                if (constructor == nullptr) {
                    return UnresolvedTarget{UnresolvedReason::NotInApi, element->qualified_name + ".__init__"};
                }
                return ResolvedTarget{constructor->qualified_name,
                                      std::min<std::size_t>(1, constructor->parameters.size()),
                                      true};
            }

            case ElementKind::Module:
            case ElementKind::Parameter:
                break;
        }
        return UnresolvedTarget{UnresolvedReason::NotCallable, element->qualified_name};
    }

    Result<std::vector<CallSite>, Error> find_call_sites(const api::ApiDescription& api,
                                                         const python::SyntaxTree& tree,
                                                         std::string file,
                                                         const CallResolver::Deadline deadline) {
        CallResolver resolver(api, std::move(file));
        return resolver.resolve(tree, deadline);
    }

}  // namespace aua::resolve
