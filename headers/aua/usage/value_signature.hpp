//
// Created by gregorian-rayne on 10/15/26.
//

#ifndef AUA_USAGE_VALUE_SIGNATURE_HPP
#define AUA_USAGE_VALUE_SIGNATURE_HPP

#include "aua/python/syntax_tree.hpp"
#include "aua/types.hpp"

namespace aua::usage {

    /**
     * Classifies an argument expression.
     *
     * - constants and sign-prefixed numbers: Literal with their repr
     * - displays and comprehensions: LiteralKind with their shape
     *   (list, tuple, dict, set, fstring, lambda, listcomp, setcomp,
     *   dictcomp, genexp)
     * - operator trees whose leaves are all constants: LiteralKind "expression"
     * - anything else: Unknown
     *
     * Parentheses around an expression are ignored.
     */
    [[nodiscard]] ValueSignature signature_of(const python::SyntaxTree& tree, TSNode expr);

    /**
     * Shape recorded for a variadic bucket that absorbed `count` arguments:
     * "tuple[n]" or "dict[n]".
     */
    [[nodiscard]] ValueSignature bucket_signature(bool keyword_bucket, std::size_t count);

}  // namespace aua::usage

#endif //AUA_USAGE_VALUE_SIGNATURE_HPP
