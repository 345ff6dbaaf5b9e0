//
// Created by gregorian-rayne on 10/16/26.
//

#include "aua/binding/argument_binder.hpp"
#include "aua/usage/value_signature.hpp"

#include <algorithm>
#include <optional>

namespace aua::binding {

    const ValueSignature* BindingResult::find(const std::string_view parameter) const {
        const auto it = std::ranges::find_if(bindings, [parameter](const ParameterBinding& b) {
            return b.parameter == parameter;
        });
        return it == bindings.end() ? nullptr : &it->value;
    }

    std::string binding_name(const FormalParameter& formal) {
        switch (formal.kind) {
            case ParameterKind::VarPositional: return "*" + formal.name;
            case ParameterKind::VarKeyword:    return "**" + formal.name;
            default:                           return formal.name;
        }
    }

    BindingResult bind_arguments(const std::vector<CallArgument>& arguments,
                                 const std::span<const FormalParameter> formals) {
        BindingResult result;
        std::vector<std::optional<ValueSignature>> bound(formals.size());

        std::optional<std::size_t> var_positional;
        std::optional<std::size_t> var_keyword;
        for (std::size_t i = 0; i < formals.size(); ++i) {
            if (formals[i].kind == ParameterKind::VarPositional) {
                var_positional = i;
            } else if (formals[i].kind == ParameterKind::VarKeyword) {
                var_keyword = i;
            }
        }

        bool star_unpack = false;
        bool double_star_unpack = false;
        std::size_t absorbed_positional = 0;
        std::size_t absorbed_keyword = 0;

        // Keywords bind first so positionals can skip what they claimed.
        for (const auto& argument : arguments) {
            if (argument.kind == ArgumentKind::DoubleStarUnpack) {
                double_star_unpack = true;
                continue;
            }
            if (argument.kind != ArgumentKind::Keyword) {
                continue;
            }

            const auto it = std::find_if(formals.begin(), formals.end(), [&](const FormalParameter& formal) {
                return formal.name == argument.name && formal.accepts_keyword();
            });
            if (it != formals.end()) {
                auto& slot = bound[static_cast<std::size_t>(it - formals.begin())];
                if (slot) {
                    result.malformed = true;
                } else {
                    slot = argument.value;
                }
            } else if (var_keyword) {
                ++absorbed_keyword;
            } else {
                result.malformed = true;
            }
        }

        std::size_t next = 0;
        for (const auto& argument : arguments) {
            if (argument.kind == ArgumentKind::StarUnpack) {
                star_unpack = true;
                continue;
            }
            if (argument.kind != ArgumentKind::Positional || star_unpack) {
                continue;
            }

            while (next < formals.size() && formals[next].accepts_positional() && bound[next]) {
                ++next;
            }
            if (next < formals.size() && formals[next].accepts_positional()) {
                bound[next] = argument.value;
                ++next;
            } else if (var_positional) {
                ++absorbed_positional;
            } else {
                result.malformed = true;
            }
        }

        for (std::size_t i = 0; i < formals.size(); ++i) {
            const FormalParameter& formal = formals[i];
            const std::string name = binding_name(formal);

            if (bound[i]) {
                result.bindings.push_back({name, std::move(*bound[i])});
                continue;
            }

            switch (formal.kind) {
                case ParameterKind::VarPositional:
                    if (star_unpack) {
                        result.bindings.push_back({name, ValueSignature::unknown()});
                    } else if (absorbed_positional > 0) {
                        result.bindings.push_back({name, usage::bucket_signature(false, absorbed_positional)});
                    }
                    break;

                case ParameterKind::VarKeyword:
                    if (double_star_unpack) {
                        result.bindings.push_back({name, ValueSignature::unknown()});
                    } else if (absorbed_keyword > 0) {
                        result.bindings.push_back({name, usage::bucket_signature(true, absorbed_keyword)});
                    }
                    break;

                default:
                    if ((star_unpack && formal.accepts_positional()) ||
                        (double_star_unpack && formal.accepts_keyword())) {
                        result.bindings.push_back({name, ValueSignature::unknown()});
                    } else if (formal.has_default) {
                        result.bindings.push_back({name, ValueSignature::uses_default()});
                    } else {
                        result.bindings.push_back({name, ValueSignature::unknown()});
                    }
                    break;
            }
        }

        return result;
    }

    BindingResult bind_call(const CallSite& site, const ApiElement& target) {
        const auto* resolved = site.resolved();
        const std::size_t implicit = resolved == nullptr
            ? 0
            : std::min(resolved->implicit_parameters, target.parameters.size());
        const std::span<const FormalParameter> formals(target.parameters);
        return bind_arguments(site.arguments, formals.subspan(implicit));
    }

}  // namespace aua::binding
