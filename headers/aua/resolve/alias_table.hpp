//
// Created by gregorian-rayne on 10/15/26.
//

#ifndef AUA_RESOLVE_ALIAS_TABLE_HPP
#define AUA_RESOLVE_ALIAS_TABLE_HPP

/**
 * @file alias_table.hpp
 * @brief Per-file mapping from local names to the identifiers they import.
 *
 * The table is a stack of lexical scopes that mirrors Python's rules:
 * - module, class, function and comprehension scopes
 * - class scopes are not visible from functions nested in them
 * - `global` and `nonlocal` redirect bindings to the owning scope
 * - the last write in program order wins
 *
 * Control flow is handled through a change journal. While a branch is open
 * every write is logged with the value it replaced; rewinding to the mark
 * undoes the writes and hands back what the branch bound. Only the names a
 * branch touches are copied:
 *
 * @code
 *     const auto mark = table.open_branch();
 *     visit(body);
 *     auto taken = table.rewind(mark);
 *     visit(orelse);
 *     auto other = table.rewind(mark);
 *     table.close_branch(table.join(taken, other));
 * @endcode
 */

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace aua::resolve {

    enum class BindingState {
        Origin,     ///< Bound by an import to `origin`
        Opaque,     ///< Bound by a relative import (client-local code)
        Rebound,    ///< Bound by a non-import expression
        Ambiguous   ///< Different bindings on different control-flow paths
    };

    const char* to_string(BindingState state) noexcept;

    struct AliasBinding {
        BindingState state = BindingState::Rebound;
        std::string origin;

        static AliasBinding import_of(std::string origin) {
            return {BindingState::Origin, std::move(origin)};
        }

        bool operator==(const AliasBinding&) const = default;
    };

    enum class ScopeKind {
        Module,
        Class,
        Function,
        Comprehension
    };

    class AliasTable {
    public:
        struct Scope {
            ScopeKind kind = ScopeKind::Module;
            std::map<std::string, AliasBinding> bindings;
            std::set<std::string> wildcard_modules;
            std::set<std::string> globals;
            std::set<std::string> nonlocals;
        };

        using Key = std::pair<std::size_t, std::string>;  ///< Scope index, name

        /**
         * What one control-flow path bound, relative to the state at its mark.
         */
        struct Branch {
            std::map<Key, AliasBinding> bindings;
            std::set<Key> wildcards;
            std::set<Key> globals;
            std::set<Key> nonlocals;
        };

        AliasTable();

        void push_scope(ScopeKind kind);
        void pop_scope();

        [[nodiscard]] ScopeKind current_kind() const noexcept { return scopes_.back().kind; }
        [[nodiscard]] std::size_t depth() const noexcept { return scopes_.size(); }

        /**
         * Binds `name` in the scope that owns it. Walrus targets inside
         * comprehensions pass `skip_comprehensions` so the binding lands in
         * the enclosing function or module.
         */
        void bind(const std::string& name, AliasBinding binding, bool skip_comprehensions = false);

        void bind_import(const std::string& name, std::string origin) {
            bind(name, AliasBinding::import_of(std::move(origin)));
        }

        void bind_opaque(const std::string& name) {
            bind(name, {BindingState::Opaque, {}});
        }

        void rebind(const std::string& name, bool skip_comprehensions = false) {
            bind(name, {BindingState::Rebound, {}}, skip_comprehensions);
        }

        void add_wildcard(std::string module);
        void declare_global(const std::string& name);
        void declare_nonlocal(const std::string& name);

        /**
         * Binding visible for `name` from the current scope, if any.
         */
        [[nodiscard]] std::optional<AliasBinding> lookup(std::string_view name) const;

        /**
         * Wildcard-imported modules visible from the current scope, sorted.
         */
        [[nodiscard]] std::vector<std::string> visible_wildcards() const;

        /**
         * Starts logging writes. Branches nest; each open_branch() is paired
         * with one close_branch().
         */
        [[nodiscard]] std::size_t open_branch();

        /**
         * Undoes every write since `mark` and returns them as a Branch.
         * Writes to scopes pushed after the mark are discarded.
         */
        [[nodiscard]] Branch rewind(std::size_t mark);

        /**
         * Re-applies a branch without closing it, e.g. the entry state of an
         * except handler.
         */
        void apply(const Branch& branch);

        /**
         * Applies the merged outcome and stops logging for this branch.
         */
        void close_branch(const Branch& outcome);

        /**
         * Merges two paths taken from the current (rewound) state.
         *
         * Per name: equal bindings are kept; a name bound on one path only
         * keeps that binding; different bindings become Ambiguous.
         */
        [[nodiscard]] Branch join(const Branch& a, const Branch& b) const;

    private:
        struct Change {
            enum class Kind { Binding, Wildcard, Global, Nonlocal };

            Kind kind;
            std::size_t scope;
            std::string name;
            std::optional<AliasBinding> previous;
        };

        [[nodiscard]] std::size_t owner_of(const std::string& name, bool skip_comprehensions) const;
        [[nodiscard]] std::optional<AliasBinding> binding_at(const Key& key) const;
        void set_binding(std::size_t scope, const std::string& name, AliasBinding binding);
        void insert_marker(Change::Kind kind, std::size_t scope, const std::string& name);

        std::vector<Scope> scopes_;
        std::vector<Change> journal_;
        std::size_t open_branches_ = 0;
    };

}  // namespace aua::resolve

#endif //AUA_RESOLVE_ALIAS_TABLE_HPP
