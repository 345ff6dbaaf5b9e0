//
// Created by gregorian-rayne on 10/14/26.
//

#include "aua/python/literal.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <vector>

namespace aua::python {

    namespace {

        std::u32string decode_utf8(std::string_view text) {
            std::u32string result;
            result.reserve(text.size());
            std::size_t i = 0;
            while (i < text.size()) {
                const auto c = static_cast<unsigned char>(text[i]);
                char32_t cp;
                std::size_t length;
                if (c < 0x80) {
                    cp = c;
                    length = 1;
                } else if ((c & 0xE0) == 0xC0) {
                    cp = c & 0x1F;
                    length = 2;
                } else if ((c & 0xF0) == 0xE0) {
                    cp = c & 0x0F;
                    length = 3;
                } else {
                    cp = c & 0x07;
                    length = 4;
                }
                for (std::size_t k = 1; k < length && i + k < text.size(); ++k) {
                    cp = (cp << 6) | (static_cast<unsigned char>(text[i + k]) & 0x3F);
                }
                result.push_back(cp);
                i += length;
            }
            return result;
        }

        void append_utf8(std::string& out, const char32_t cp) {
            if (cp < 0x80) {
                out.push_back(static_cast<char>(cp));
            } else if (cp < 0x800) {
                out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else if (cp < 0x10000) {
                out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else {
                out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            }
        }

        void append_escape(std::string& out, const char prefix, const char32_t cp, const int width) {
            char buf[16];
            std::snprintf(buf, sizeof(buf), "\\%c%0*x", prefix, width, static_cast<unsigned>(cp));
            out += buf;
        }

        int hex_value(const char32_t c) noexcept {
            if (c >= U'0' && c <= U'9') return static_cast<int>(c - U'0');
            if (c >= U'a' && c <= U'f') return static_cast<int>(c - U'a' + 10);
            if (c >= U'A' && c <= U'F') return static_cast<int>(c - U'A' + 10);
            return -1;
        }

        /**
         * Converts a digit string in base 2, 8, 10 or 16 to decimal text of
         * arbitrary length.
         */
        std::string to_decimal(std::string_view digits, const unsigned base) {
            constexpr std::uint32_t kLimb = 1000000000U;
            std::vector<std::uint32_t> limbs{0};
            for (const char c : digits) {
                std::uint64_t carry = static_cast<std::uint64_t>(hex_value(static_cast<char32_t>(c)));
                for (auto& limb : limbs) {
                    const std::uint64_t value = static_cast<std::uint64_t>(limb) * base + carry;
                    limb = static_cast<std::uint32_t>(value % kLimb);
                    carry = value / kLimb;
                }
                while (carry > 0) {
                    limbs.push_back(static_cast<std::uint32_t>(carry % kLimb));
                    carry /= kLimb;
                }
            }

            std::string result = std::to_string(limbs.back());
            char buf[16];
            for (auto it = limbs.rbegin() + 1; it != limbs.rend(); ++it) {
                std::snprintf(buf, sizeof(buf), "%09u", *it);
                result += buf;
            }
            return result;
        }

        Error literal_error(const std::string& message) {
            return Error::parse_error(message);
        }

    }  // namespace

    Result<StringLiteral, Error> decode_string_token(const std::string_view token_text) {
        StringLiteral literal;
        bool is_raw = false;

        std::size_t i = 0;
        while (i < token_text.size() && token_text[i] != '\'' && token_text[i] != '"') {
            switch (std::tolower(static_cast<unsigned char>(token_text[i]))) {
                case 'b': literal.is_bytes = true; break;
                case 'f': literal.is_format = true; break;
                case 'r': is_raw = true; break;
                default: break;
            }
            ++i;
        }
        if (i >= token_text.size()) {
            return Result<StringLiteral, Error>::failure(literal_error("malformed string literal"));
        }

        const char quote = token_text[i];
        const bool triple = token_text.size() >= i + 6 &&
                            token_text[i + 1] == quote && token_text[i + 2] == quote;
        const std::size_t quote_length = triple ? 3 : 1;
        if (token_text.size() < i + 2 * quote_length) {
            return Result<StringLiteral, Error>::failure(literal_error("malformed string literal"));
        }

        if (literal.is_format) {
            return Result<StringLiteral, Error>::success(std::move(literal));
        }

        const auto body = decode_utf8(token_text.substr(i + quote_length,
                                                        token_text.size() - i - 2 * quote_length));
        std::u32string& out = literal.value;
        out.reserve(body.size());

        for (std::size_t k = 0; k < body.size(); ++k) {
            const char32_t c = body[k];

            if (c == U'\r') {
                out.push_back(U'\n');
                if (k + 1 < body.size() && body[k + 1] == U'\n') {
                    ++k;
                }
                continue;
            }
            if (c != U'\\' || k + 1 >= body.size()) {
                out.push_back(c);
                continue;
            }
            if (is_raw) {
                out.push_back(c);
                out.push_back(body[++k]);
                continue;
            }

            const char32_t e = body[++k];
            switch (e) {
                case U'\n': break;
                case U'\r':
                    if (k + 1 < body.size() && body[k + 1] == U'\n') {
                        ++k;
                    }
                    break;
                case U'\\': out.push_back(U'\\'); break;
                case U'\'': out.push_back(U'\''); break;
                case U'"':  out.push_back(U'"'); break;
                case U'a':  out.push_back(7); break;
                case U'b':  out.push_back(8); break;
                case U'f':  out.push_back(12); break;
                case U'n':  out.push_back(10); break;
                case U'r':  out.push_back(13); break;
                case U't':  out.push_back(9); break;
                case U'v':  out.push_back(11); break;
                case U'0': case U'1': case U'2': case U'3':
                case U'4': case U'5': case U'6': case U'7': {
                    char32_t value = e - U'0';
                    for (int n = 0; n < 2 && k + 1 < body.size() && body[k + 1] >= U'0' && body[k + 1] <= U'7'; ++n) {
                        value = value * 8 + (body[++k] - U'0');
                    }
                    out.push_back(literal.is_bytes ? (value & 0xFF) : value);
                    break;
                }
                case U'x':
                case U'u':
                case U'U': {
                    if (literal.is_bytes && e != U'x') {
                        out.push_back(U'\\');
                        out.push_back(e);
                        break;
                    }
                    const int width = e == U'x' ? 2 : (e == U'u' ? 4 : 8);
                    char32_t value = 0;
                    for (int n = 0; n < width; ++n) {
                        const int digit = k + 1 < body.size() ? hex_value(body[k + 1]) : -1;
                        if (digit < 0) {
                            return Result<StringLiteral, Error>::failure(
                                literal_error(std::string("truncated \\") + static_cast<char>(e) + " escape")
                            );
                        }
                        value = value * 16 + static_cast<char32_t>(digit);
                        ++k;
                    }
                    if (value > 0x10FFFF) {
                        return Result<StringLiteral, Error>::failure(
                            literal_error("illegal Unicode character in escape")
                        );
                    }
                    out.push_back(value);
                    break;
                }
                default:
                    // Unknown escapes (including \N{...}) keep the backslash.
                    out.push_back(U'\\');
                    out.push_back(e);
                    break;
            }
        }

        return Result<StringLiteral, Error>::success(std::move(literal));
    }

    std::string string_repr(const std::u32string& value, const bool is_bytes) {
        const bool has_single = value.find(U'\'') != std::u32string::npos;
        const bool has_double = value.find(U'"') != std::u32string::npos;
        const char quote = has_single && !has_double ? '"' : '\'';

        std::string out;
        out.reserve(value.size() + 3);
        if (is_bytes) {
            out.push_back('b');
        }
        out.push_back(quote);

        for (const char32_t c : value) {
            if (c == U'\\') {
                out += "\\\\";
            } else if (c == static_cast<char32_t>(quote)) {
                out.push_back('\\');
                out.push_back(quote);
            } else if (c == U'\t') {
                out += "\\t";
            } else if (c == U'\n') {
                out += "\\n";
            } else if (c == U'\r') {
                out += "\\r";
            } else if (c < 0x20 || c == 0x7F) {
                append_escape(out, 'x', c, 2);
            } else if (is_bytes && c >= 0x80) {
                append_escape(out, 'x', c & 0xFF, 2);
            } else if ((c >= 0x80 && c <= 0xA0) || c == 0xAD) {
                append_escape(out, 'x', c, 2);
            } else if ((c >= 0xD800 && c <= 0xDFFF) || c == 0x2028 || c == 0x2029) {
                append_escape(out, 'u', c, 4);
            } else {
                append_utf8(out, c);
            }
        }

        out.push_back(quote);
        return out;
    }

    std::string float_repr(const double value) {
        if (std::isnan(value)) {
            return "nan";
        }
        if (std::isinf(value)) {
            return value > 0 ? "inf" : "-inf";
        }

        char buf[64];
        const auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::scientific);
        if (ec != std::errc{}) {
            return std::to_string(value);
        }
        const std::string_view text(buf, static_cast<std::size_t>(end - buf));

        const bool negative = text.front() == '-';
        const auto e_pos = text.find('e');
        std::string digits;
        for (const char c : text.substr(negative ? 1 : 0, e_pos - (negative ? 1 : 0))) {
            if (c != '.') {
                digits.push_back(c);
            }
        }
        const int exponent = std::atoi(std::string(text.substr(e_pos + 1)).c_str());

        std::string out = negative ? "-" : "";
        if (exponent >= -4 && exponent < 16) {
            if (exponent >= 0) {
                const auto int_digits = static_cast<std::size_t>(exponent) + 1;
                if (digits.size() <= int_digits) {
                    out += digits;
                    out.append(int_digits - digits.size(), '0');
                    out += ".0";
                } else {
                    out += digits.substr(0, int_digits);
                    out += '.';
                    out += digits.substr(int_digits);
                }
            } else {
                out += "0.";
                out.append(static_cast<std::size_t>(-exponent - 1), '0');
                out += digits;
            }
            return out;
        }

        out += digits.substr(0, 1);
        if (digits.size() > 1) {
            out += '.';
            out += digits.substr(1);
        }
        char exp_buf[16];
        std::snprintf(exp_buf, sizeof(exp_buf), "e%c%02d", exponent < 0 ? '-' : '+', std::abs(exponent));
        out += exp_buf;
        return out;
    }

    Result<NumberLiteral, Error> decode_number_token(const std::string_view token_text) {
        std::string clean;
        clean.reserve(token_text.size());
        for (const char c : token_text) {
            if (c != '_') {
                clean.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
            }
        }
        if (clean.empty()) {
            return Result<NumberLiteral, Error>::failure(literal_error("invalid number literal"));
        }

        NumberLiteral literal;

        if (clean.size() > 1 && clean[0] == '0' && (clean[1] == 'x' || clean[1] == 'o' || clean[1] == 'b')) {
            const unsigned base = clean[1] == 'x' ? 16U : (clean[1] == 'o' ? 8U : 2U);
            const std::string_view digits = std::string_view(clean).substr(2);
            if (digits.empty()) {
                return Result<NumberLiteral, Error>::failure(literal_error("invalid number literal"));
            }
            for (const char c : digits) {
                const int digit = hex_value(static_cast<char32_t>(c));
                if (digit < 0 || static_cast<unsigned>(digit) >= base) {
                    return Result<NumberLiteral, Error>::failure(
                        literal_error("invalid digit '" + std::string(1, c) + "' in number literal")
                    );
                }
            }
            literal.kind = NumberKind::Int;
            literal.repr = to_decimal(digits, base);
            return Result<NumberLiteral, Error>::success(std::move(literal));
        }

        if (clean.back() == 'j') {
            clean.pop_back();
            literal.kind = NumberKind::Complex;
            std::string repr = float_repr(std::strtod(clean.c_str(), nullptr));
            if (repr.size() > 2 && repr.compare(repr.size() - 2, 2, ".0") == 0) {
                repr.resize(repr.size() - 2);
            }
            literal.repr = repr + "j";
            return Result<NumberLiteral, Error>::success(std::move(literal));
        }

        if (clean.find_first_of(".e") != std::string::npos) {
            literal.kind = NumberKind::Float;
            literal.repr = float_repr(std::strtod(clean.c_str(), nullptr));
            return Result<NumberLiteral, Error>::success(std::move(literal));
        }

        for (const char c : clean) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return Result<NumberLiteral, Error>::failure(literal_error("invalid number literal"));
            }
        }
        const auto first = clean.find_first_not_of('0');
        literal.kind = NumberKind::Int;
        literal.repr = first == std::string::npos ? "0" : clean.substr(first);
        return Result<NumberLiteral, Error>::success(std::move(literal));
    }

}  // namespace aua::python
