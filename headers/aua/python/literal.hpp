//
// Created by gregorian-rayne on 10/14/26.
//

#ifndef AUA_PYTHON_LITERAL_HPP
#define AUA_PYTHON_LITERAL_HPP

/**
 * @file literal.hpp
 * @brief Decoding of Python literals into their canonical repr text.
 *
 * Argument values are recorded the way Python's repr() prints them, so the
 * same value written differently in source (0x10 and 16, "a" and 'a')
 * lands in the same histogram bucket.
 */

#include "aua/result.hpp"

#include <string>
#include <string_view>

namespace aua::python {

    /**
     * One decoded string token.
     */
    struct StringLiteral {
        bool is_bytes = false;
        bool is_format = false;
        std::u32string value;  ///< Empty for f-strings
    };

    /**
     * Decodes a string token (prefix, quotes and body) into its value.
     *
     * @return The literal, or a ParseError for malformed escapes.
     */
    Result<StringLiteral, Error> decode_string_token(std::string_view token_text);

    /**
     * repr() of a str (is_bytes = false) or bytes value.
     *
     * @code
     *     string_repr(U"abc", false)    // 'abc'
     *     string_repr(U"it's", false)   // "it's"
     *     string_repr(U"\n", true)      // b'\n'
     * @endcode
     */
    std::string string_repr(const std::u32string& value, bool is_bytes);

    enum class NumberKind {
        Int,
        Float,
        Complex
    };

    struct NumberLiteral {
        NumberKind kind = NumberKind::Int;
        std::string repr;
    };

    /**
     * Classifies a numeric token and renders its repr (decimal for every
     * integer base, shortest round-trip for floats).
     */
    Result<NumberLiteral, Error> decode_number_token(std::string_view token_text);

    /**
     * repr() of a float: "1.0", "0.0001", "1e+16", "1.5e-05", "inf".
     */
    std::string float_repr(double value);

}  // namespace aua::python

#endif //AUA_PYTHON_LITERAL_HPP
