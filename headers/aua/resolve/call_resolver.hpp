//
// Created by gregorian-rayne on 10/15/26.
//

#ifndef AUA_RESOLVE_CALL_RESOLVER_HPP
#define AUA_RESOLVE_CALL_RESOLVER_HPP

/**
 * @file call_resolver.hpp
 * @brief Finds every call in a parsed file and names its target.
 *
 * The resolver walks the tree in program order while maintaining the file's
 * AliasTable, so each call is resolved against the bindings visible at that
 * point:
 *
 * @code
 *     import sklearn.linear_model as lm
 *     lm.Ridge(alpha=0.5)        // -> sklearn.linear_model.Ridge.__init__
 *     lm = None
 *     lm.Ridge()                 // -> unresolved (rebound)
 * @endcode
 *
 * One CallSite is produced per call expression; nested and chained calls
 * each produce their own. Argument values are classified on the way.
 */

#include "aua/api/api_description.hpp"
#include "aua/python/syntax_tree.hpp"
#include "aua/resolve/alias_table.hpp"
#include "aua/result.hpp"
#include "aua/types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace aua::resolve {

    class CallResolver {
    public:
        using Deadline = std::optional<std::chrono::steady_clock::time_point>;

        CallResolver(const api::ApiDescription& api, std::string file);

        /**
         * Walks a whole module. The resolver can be reused; each call starts
         * from an empty alias table.
         *
         * @return ParseError "processing deadline exceeded" (context
         *         "line:column" of the statement being visited) once
         *         `deadline` has passed.
         */
        [[nodiscard]] Result<std::vector<CallSite>, Error> resolve(const python::SyntaxTree& tree,
                                                                   Deadline deadline = std::nullopt);

    private:
        struct DeadlineExceeded {
            python::Position position;
        };

        void tick(TSNode node);

        void visit_block(TSNode block);
        void visit_statement(TSNode stmt);
        void visit_assignment(TSNode assignment);
        void visit_function(TSNode function, TSNode decorated);
        void visit_class(TSNode klass, TSNode decorated);
        void visit_if(TSNode stmt);
        void visit_loop(TSNode stmt);
        void visit_try(TSNode stmt);
        void visit_with(TSNode stmt);
        void visit_match(TSNode stmt);

        void visit_expr(TSNode expr);
        void visit_call(TSNode call);
        void visit_lambda(TSNode lambda);
        void visit_comprehension(TSNode comprehension);
        void visit_parameter_defaults(TSNode parameters);
        void bind_parameters(TSNode parameters);
        void bind_target(TSNode target);
        void bind_captures(TSNode pattern);

        [[nodiscard]] CallTarget resolve_callee(TSNode callee) const;
        [[nodiscard]] CallTarget resolve_identifier(const std::string& composed) const;
        [[nodiscard]] std::vector<CallArgument> arguments_of(TSNode call) const;

        const api::ApiDescription& api_;
        std::string file_;
        const python::SyntaxTree* tree_ = nullptr;
        Deadline deadline_;
        std::size_t ticks_ = 0;
        AliasTable aliases_;
        std::vector<CallSite> sites_;
    };

    /**
     * Convenience wrapper: resolves every call of `tree`.
     */
    [[nodiscard]] Result<std::vector<CallSite>, Error> find_call_sites(const api::ApiDescription& api,
                                                                       const python::SyntaxTree& tree,
                                                                       std::string file,
                                                                       CallResolver::Deadline deadline = std::nullopt);

}  // namespace aua::resolve

#endif //AUA_RESOLVE_CALL_RESOLVER_HPP
