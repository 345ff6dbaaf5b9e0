//
// Created by gregorian-rayne on 10/12/26.
//

#ifndef AUA_TYPES_HPP
#define AUA_TYPES_HPP

/**
 * @file types.hpp
 * @brief Core data structures of the usage analyzer.
 *
 * - Basic types: Duration, Timestamp, SourceLocation
 * - API description: ApiElement, FormalParameter and their kinds
 * - Call data: ValueSignature, CallTarget, CallArgument, CallSite
 * - File data: SourceFile, FileOutcome
 *
 * CallSite and everything it contains owns its data, so call sites survive
 * the syntax tree they were extracted from.
 */

#include <chrono>
#include <compare>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace aua {

    namespace fs = std::filesystem;

    // ============================================================================
    // Basic Types
    // ============================================================================

    using Duration = std::chrono::nanoseconds;
    using Timestamp = std::chrono::system_clock::time_point;

    /**
     * Position of a construct in a corpus file. Lines and columns are 1-based;
     * zero means unknown.
     */
    struct SourceLocation {
        std::string file;
        std::size_t line = 0;
        std::size_t column = 0;

        [[nodiscard]] bool has_location() const noexcept {
            return !file.empty() && line > 0;
        }
    };

    // ============================================================================
    // API Description Types
    // ============================================================================

    enum class ElementKind {
        Module,
        Class,
        Function,
        Method,
        Parameter
    };

    /**
     * How a formal parameter accepts arguments.
     */
    enum class ParameterKind {
        PositionalOnly,
        PositionalOrKeyword,
        VarPositional,
        KeywordOnly,
        VarKeyword
    };

    /**
     * How a method is bound when reached through its class.
     */
    enum class MethodKind {
        Instance,
        Class,
        Static
    };

    const char* to_string(ElementKind kind) noexcept;
    const char* to_string(ParameterKind kind) noexcept;
    const char* to_string(MethodKind kind) noexcept;

    std::optional<ElementKind> element_kind_from_string(std::string_view str);
    std::optional<ParameterKind> parameter_kind_from_string(std::string_view str);
    std::optional<MethodKind> method_kind_from_string(std::string_view str);

    struct FormalParameter {
        std::string name;
        ParameterKind kind = ParameterKind::PositionalOrKeyword;
        bool has_default = false;
        std::optional<std::string> default_value;

        [[nodiscard]] bool accepts_positional() const noexcept {
            return kind == ParameterKind::PositionalOnly ||
                   kind == ParameterKind::PositionalOrKeyword;
        }

        [[nodiscard]] bool accepts_keyword() const noexcept {
            return kind == ParameterKind::PositionalOrKeyword ||
                   kind == ParameterKind::KeywordOnly;
        }

        [[nodiscard]] bool is_variadic() const noexcept {
            return kind == ParameterKind::VarPositional ||
                   kind == ParameterKind::VarKeyword;
        }
    };

    /**
     * One element of the analyzed library's public interface.
     */
    struct ApiElement {
        std::string qualified_name;
        ElementKind kind = ElementKind::Function;
        MethodKind method_kind = MethodKind::Instance;
        std::vector<FormalParameter> parameters;

        [[nodiscard]] bool is_callable() const noexcept {
            return kind == ElementKind::Function || kind == ElementKind::Method;
        }

        /**
         * Last component of the dotted name.
         */
        [[nodiscard]] std::string_view bare_name() const noexcept;

        /**
         * Dotted name without its last component ("" for top-level names).
         */
        [[nodiscard]] std::string_view parent_name() const noexcept;
    };

    // ============================================================================
    // Call Data
    // ============================================================================

    enum class SignatureKind {
        Literal,      ///< Hashable simple literal, text is its canonical repr
        LiteralKind,  ///< Container or complex expression, text is its shape
        UsesDefault,  ///< Argument omitted, the parameter has a default
        Unknown       ///< Non-literal expression or indeterminate binding
    };

    /**
     * Coarse classification of one argument value.
     *
     * The key() form is what appears in exported documents: literals keep their
     * repr (1, 'abc', None), shapes are wrapped in angle brackets (<list>,
     * <tuple[2]>), and the two markers are <default> and <unknown>. A string
     * literal is always quoted, so keys never collide.
     */
    struct ValueSignature {
        SignatureKind kind = SignatureKind::Unknown;
        std::string text;

        static ValueSignature literal(std::string repr) {
            return {SignatureKind::Literal, std::move(repr)};
        }

        static ValueSignature shape(std::string shape_name) {
            return {SignatureKind::LiteralKind, std::move(shape_name)};
        }

        static ValueSignature uses_default() {
            return {SignatureKind::UsesDefault, {}};
        }

        static ValueSignature unknown() {
            return {SignatureKind::Unknown, {}};
        }

        [[nodiscard]] std::string key() const;
        static ValueSignature from_key(std::string_view key);

        auto operator<=>(const ValueSignature&) const = default;
    };

    struct ResolvedTarget {
        std::string qualified_name;
        std::size_t implicit_parameters = 0;  ///< Leading formals supplied by the runtime (self/cls)
        bool via_constructor = false;         ///< Reached by calling a class
    };

    enum class UnresolvedReason {
        NotImported,    ///< Root name has no alias binding
        Rebound,        ///< Root name was rebound to a non-import expression
        Ambiguous,      ///< Several plausible origins (branches, wildcard imports)
        DynamicCallee,  ///< Callee is not a name/attribute chain
        NotInApi,       ///< Composed identifier is not a known element
        NotCallable     ///< Known element that cannot be called (module, parameter)
    };

    const char* to_string(UnresolvedReason reason) noexcept;

    struct UnresolvedTarget {
        UnresolvedReason reason = UnresolvedReason::NotImported;
        std::string composed_name;  ///< Best-effort identifier, may be empty
    };

    using CallTarget = std::variant<ResolvedTarget, UnresolvedTarget>;

    enum class ArgumentKind {
        Positional,
        Keyword,
        StarUnpack,       ///< f(*xs)
        DoubleStarUnpack  ///< f(**kw)
    };

    struct CallArgument {
        ArgumentKind kind = ArgumentKind::Positional;
        std::string name;  ///< Keyword name, empty otherwise
        ValueSignature value;
    };

    struct CallSite {
        SourceLocation location;
        CallTarget target = UnresolvedTarget{};
        std::vector<CallArgument> arguments;

        [[nodiscard]] bool is_resolved() const noexcept {
            return std::holds_alternative<ResolvedTarget>(target);
        }

        [[nodiscard]] const ResolvedTarget* resolved() const noexcept {
            return std::get_if<ResolvedTarget>(&target);
        }

        [[nodiscard]] const UnresolvedTarget* unresolved() const noexcept {
            return std::get_if<UnresolvedTarget>(&target);
        }
    };

    // ============================================================================
    // File Data
    // ============================================================================

    /**
     * A corpus file as produced by the walker. `relative_path` is the stable
     * identity used in checkpoints and reports.
     */
    struct SourceFile {
        std::string relative_path;
        fs::path absolute_path;
        std::string text;
    };

    /**
     * How processing of one file ended, as stored in its checkpoint.
     */
    enum class FileOutcome {
        Analyzed,
        SyntaxError,
        Irrelevant
    };

    const char* to_string(FileOutcome outcome) noexcept;
    std::optional<FileOutcome> file_outcome_from_string(std::string_view str);

}  // namespace aua

#endif //AUA_TYPES_HPP
