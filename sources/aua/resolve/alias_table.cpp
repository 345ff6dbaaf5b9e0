//
// Created by gregorian-rayne on 10/15/26.
//

#include "aua/resolve/alias_table.hpp"

namespace aua::resolve {

    const char* to_string(const BindingState state) noexcept {
        switch (state) {
            case BindingState::Origin:    return "origin";
            case BindingState::Opaque:    return "opaque";
            case BindingState::Rebound:   return "rebound";
            case BindingState::Ambiguous: return "ambiguous";
        }
        return "unknown";
    }

    AliasTable::AliasTable() {
        scopes_.push_back(Scope{});
    }

    void AliasTable::push_scope(const ScopeKind kind) {
        Scope scope;
        scope.kind = kind;
        scopes_.push_back(std::move(scope));
    }

    void AliasTable::pop_scope() {
        if (scopes_.size() > 1) {
            scopes_.pop_back();
        }
    }

    std::size_t AliasTable::owner_of(const std::string& name, const bool skip_comprehensions) const {
        std::size_t index = scopes_.size() - 1;
        if (skip_comprehensions) {
            while (index > 0 && scopes_[index].kind == ScopeKind::Comprehension) {
                --index;
            }
        }

        const Scope& scope = scopes_[index];
        if (scope.globals.contains(name)) {
            return 0;
        }
        if (scope.nonlocals.contains(name)) {
            for (std::size_t i = index; i-- > 0;) {
                if (scopes_[i].kind == ScopeKind::Function && scopes_[i].bindings.contains(name)) {
                    return i;
                }
            }
            for (std::size_t i = index; i-- > 0;) {
                if (scopes_[i].kind == ScopeKind::Function) {
                    return i;
                }
            }
        }
        return index;
    }

    void AliasTable::set_binding(const std::size_t scope, const std::string& name, AliasBinding binding) {
        auto& bindings = scopes_[scope].bindings;
        if (open_branches_ > 0) {
            const auto it = bindings.find(name);
            std::optional<AliasBinding> previous;
            if (it != bindings.end()) {
                previous = it->second;
            }
            journal_.push_back({Change::Kind::Binding, scope, name, std::move(previous)});
        }
        bindings[name] = std::move(binding);
    }

    void AliasTable::insert_marker(const Change::Kind kind, const std::size_t scope, const std::string& name) {
        Scope& target = scopes_[scope];
        std::set<std::string>* markers = &target.wildcard_modules;
        if (kind == Change::Kind::Global) {
            markers = &target.globals;
        } else if (kind == Change::Kind::Nonlocal) {
            markers = &target.nonlocals;
        }
        if (markers->insert(name).second && open_branches_ > 0) {
            journal_.push_back({kind, scope, name, std::nullopt});
        }
    }

    void AliasTable::bind(const std::string& name, AliasBinding binding, const bool skip_comprehensions) {
        set_binding(owner_of(name, skip_comprehensions), name, std::move(binding));
    }

    void AliasTable::add_wildcard(std::string module) {
        insert_marker(Change::Kind::Wildcard, scopes_.size() - 1, module);
    }

    void AliasTable::declare_global(const std::string& name) {
        if (scopes_.size() > 1) {
            insert_marker(Change::Kind::Global, scopes_.size() - 1, name);
        }
    }

    void AliasTable::declare_nonlocal(const std::string& name) {
        insert_marker(Change::Kind::Nonlocal, scopes_.size() - 1, name);
    }

    std::optional<AliasBinding> AliasTable::lookup(const std::string_view name) const {
        const std::string key(name);
        const std::size_t top = scopes_.size() - 1;

        for (std::size_t i = top + 1; i-- > 0;) {
            const Scope& scope = scopes_[i];
            if (i != top && scope.kind == ScopeKind::Class) {
                continue;
            }
            if (scope.globals.contains(key)) {
                const auto it = scopes_.front().bindings.find(key);
                if (it != scopes_.front().bindings.end()) {
                    return it->second;
                }
                return std::nullopt;
            }
            if (scope.nonlocals.contains(key)) {
                continue;
            }
            const auto it = scope.bindings.find(key);
            if (it != scope.bindings.end()) {
                return it->second;
            }
        }
        return std::nullopt;
    }

    std::vector<std::string> AliasTable::visible_wildcards() const {
        std::set<std::string> modules;
        const std::size_t top = scopes_.size() - 1;
        for (std::size_t i = 0; i <= top; ++i) {
            if (i != top && scopes_[i].kind == ScopeKind::Class) {
                continue;
            }
            modules.insert(scopes_[i].wildcard_modules.begin(), scopes_[i].wildcard_modules.end());
        }
        return {modules.begin(), modules.end()};
    }

    std::optional<AliasBinding> AliasTable::binding_at(const Key& key) const {
        if (key.first >= scopes_.size()) {
            return std::nullopt;
        }
        const auto& bindings = scopes_[key.first].bindings;
        const auto it = bindings.find(key.second);
        if (it == bindings.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::size_t AliasTable::open_branch() {
        ++open_branches_;
        return journal_.size();
    }

    AliasTable::Branch AliasTable::rewind(const std::size_t mark) {
        Branch branch;
        while (journal_.size() > mark) {
            Change change = std::move(journal_.back());
            journal_.pop_back();
            // Scopes pushed inside the branch are gone already.
            if (change.scope >= scopes_.size()) {
                continue;
            }

            Scope& scope = scopes_[change.scope];
            Key key{change.scope, change.name};
            switch (change.kind) {
                case Change::Kind::Binding:
                    // Walking backwards, the first entry seen holds the final value.
                    if (!branch.bindings.contains(key)) {
                        branch.bindings.emplace(key, scope.bindings[change.name]);
                    }
                    if (change.previous) {
                        scope.bindings[change.name] = std::move(*change.previous);
                    } else {
                        scope.bindings.erase(change.name);
                    }
                    break;
                case Change::Kind::Wildcard:
                    scope.wildcard_modules.erase(change.name);
                    branch.wildcards.insert(std::move(key));
                    break;
                case Change::Kind::Global:
                    scope.globals.erase(change.name);
                    branch.globals.insert(std::move(key));
                    break;
                case Change::Kind::Nonlocal:
                    scope.nonlocals.erase(change.name);
                    branch.nonlocals.insert(std::move(key));
                    break;
            }
        }
        return branch;
    }

    void AliasTable::apply(const Branch& branch) {
        for (const auto& [key, binding] : branch.bindings) {
            if (key.first < scopes_.size()) {
                set_binding(key.first, key.second, binding);
            }
        }
        const auto mark_all = [this](const std::set<Key>& keys, const Change::Kind kind) {
            for (const auto& [scope, name] : keys) {
                if (scope < scopes_.size()) {
                    insert_marker(kind, scope, name);
                }
            }
        };
        mark_all(branch.wildcards, Change::Kind::Wildcard);
        mark_all(branch.globals, Change::Kind::Global);
        mark_all(branch.nonlocals, Change::Kind::Nonlocal);
    }

    void AliasTable::close_branch(const Branch& outcome) {
        if (open_branches_ > 0) {
            --open_branches_;
        }
        if (open_branches_ == 0) {
            journal_.clear();
        }
        apply(outcome);
    }

    AliasTable::Branch AliasTable::join(const Branch& a, const Branch& b) const {
        Branch merged;

        const auto value_of = [this](const Branch& branch, const Key& key) -> std::optional<AliasBinding> {
            const auto it = branch.bindings.find(key);
            if (it != branch.bindings.end()) {
                return it->second;
            }
            return binding_at(key);
        };

        std::set<Key> keys;
        for (const auto& [key, binding] : a.bindings) {
            keys.insert(key);
        }
        for (const auto& [key, binding] : b.bindings) {
            keys.insert(key);
        }

        for (const Key& key : keys) {
            auto left = value_of(a, key);
            auto right = value_of(b, key);
            if (left && right) {
                merged.bindings.emplace(key, *left == *right ? *left : AliasBinding{BindingState::Ambiguous, {}});
            } else if (left) {
                merged.bindings.emplace(key, std::move(*left));
            } else if (right) {
                merged.bindings.emplace(key, std::move(*right));
            }
        }

        merged.wildcards = a.wildcards;
        merged.wildcards.insert(b.wildcards.begin(), b.wildcards.end());
        merged.globals = a.globals;
        merged.globals.insert(b.globals.begin(), b.globals.end());
        merged.nonlocals = a.nonlocals;
        merged.nonlocals.insert(b.nonlocals.begin(), b.nonlocals.end());
        return merged;
    }

}  // namespace aua::resolve
