//
// Created by gregorian-rayne on 10/16/26.
//

#ifndef AUA_BINDING_ARGUMENT_BINDER_HPP
#define AUA_BINDING_ARGUMENT_BINDER_HPP

/**
 * @file argument_binder.hpp
 * @brief Maps the arguments of a resolved call onto formal parameters.
 *
 * Example, for `def fn(a, x=None, y=5)`:
 * @code
 *     p.fn(1, x=2)   // a -> 1, x -> 2, y -> <default>
 * @endcode
 *
 * Variadic parameters are reported under synthetic names:
 * @code
 *     // def log(msg, *args, **kwargs)
 *     log("a", 1, 2, k=3)   // msg -> 'a', *args -> <tuple[2]>, **kwargs -> <dict[1]>
 * @endcode
 *
 * Binding never fails. Arguments that cannot be placed (surplus without a
 * catch-all, unknown or duplicate keywords) are dropped and the result is
 * flagged malformed.
 */

#include "aua/types.hpp"

#include <span>
#include <string>
#include <vector>

namespace aua::binding {

    struct ParameterBinding {
        std::string parameter;  ///< Formal name, or "*name" / "**name" for buckets
        ValueSignature value;
    };

    struct BindingResult {
        std::vector<ParameterBinding> bindings;  ///< In formal-parameter order
        bool malformed = false;

        [[nodiscard]] const ValueSignature* find(std::string_view parameter) const;
    };

    /**
     * Binds `arguments` to `formals` (implicit leading formals already
     * removed).
     */
    [[nodiscard]] BindingResult bind_arguments(const std::vector<CallArgument>& arguments,
                                               std::span<const FormalParameter> formals);

    /**
     * Binds a resolved call to its target, dropping the target's implicit
     * leading parameters (self/cls).
     */
    [[nodiscard]] BindingResult bind_call(const CallSite& site, const ApiElement& target);

    /**
     * Histogram key of a formal: its name, or the bucket name of a variadic.
     */
    [[nodiscard]] std::string binding_name(const FormalParameter& formal);

}  // namespace aua::binding

#endif //AUA_BINDING_ARGUMENT_BINDER_HPP
