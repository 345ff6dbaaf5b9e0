//
// Created by gregorian-rayne on 10/12/26.
//

#include "aua/types.hpp"
#include "aua/utils/string_utils.hpp"

namespace aua {

    const char* to_string(const ElementKind kind) noexcept {
        switch (kind) {
            case ElementKind::Module:    return "module";
            case ElementKind::Class:     return "class";
            case ElementKind::Function:  return "function";
            case ElementKind::Method:    return "method";
            case ElementKind::Parameter: return "parameter";
        }
        return "unknown";
    }

    const char* to_string(const ParameterKind kind) noexcept {
        switch (kind) {
            case ParameterKind::PositionalOnly:      return "positional_only";
            case ParameterKind::PositionalOrKeyword: return "positional_or_keyword";
            case ParameterKind::VarPositional:       return "var_positional";
            case ParameterKind::KeywordOnly:         return "keyword_only";
            case ParameterKind::VarKeyword:          return "var_keyword";
        }
        return "unknown";
    }

    const char* to_string(const MethodKind kind) noexcept {
        switch (kind) {
            case MethodKind::Instance: return "instance";
            case MethodKind::Class:    return "class";
            case MethodKind::Static:   return "static";
        }
        return "unknown";
    }

    const char* to_string(const UnresolvedReason reason) noexcept {
        switch (reason) {
            case UnresolvedReason::NotImported:   return "not-imported";
            case UnresolvedReason::Rebound:       return "rebound";
            case UnresolvedReason::Ambiguous:     return "ambiguous";
            case UnresolvedReason::DynamicCallee: return "dynamic-callee";
            case UnresolvedReason::NotInApi:      return "not-in-api";
            case UnresolvedReason::NotCallable:   return "not-callable";
        }
        return "unknown";
    }

    const char* to_string(const FileOutcome outcome) noexcept {
        switch (outcome) {
            case FileOutcome::Analyzed:    return "parsed";
            case FileOutcome::SyntaxError: return "syntax-error";
            case FileOutcome::Irrelevant:  return "irrelevant";
        }
        return "unknown";
    }

    std::optional<ElementKind> element_kind_from_string(const std::string_view str) {
        if (str == "module") return ElementKind::Module;
        if (str == "class") return ElementKind::Class;
        if (str == "function") return ElementKind::Function;
        if (str == "method") return ElementKind::Method;
        if (str == "parameter") return ElementKind::Parameter;
        return std::nullopt;
    }

    std::optional<ParameterKind> parameter_kind_from_string(const std::string_view str) {
        if (str == "positional_only") return ParameterKind::PositionalOnly;
        if (str == "positional_or_keyword") return ParameterKind::PositionalOrKeyword;
        if (str == "var_positional") return ParameterKind::VarPositional;
        if (str == "keyword_only") return ParameterKind::KeywordOnly;
        if (str == "var_keyword") return ParameterKind::VarKeyword;
        return std::nullopt;
    }

    std::optional<MethodKind> method_kind_from_string(const std::string_view str) {
        if (str == "instance") return MethodKind::Instance;
        if (str == "class" || str == "classmethod") return MethodKind::Class;
        if (str == "static" || str == "staticmethod") return MethodKind::Static;
        return std::nullopt;
    }

    std::optional<FileOutcome> file_outcome_from_string(const std::string_view str) {
        if (str == "parsed") return FileOutcome::Analyzed;
        if (str == "syntax-error") return FileOutcome::SyntaxError;
        if (str == "irrelevant") return FileOutcome::Irrelevant;
        return std::nullopt;
    }

    std::string_view ApiElement::bare_name() const noexcept {
        return string_utils::last_component(qualified_name);
    }

    std::string_view ApiElement::parent_name() const noexcept {
        const std::string_view name = qualified_name;
        const auto dot = name.rfind('.');
        return dot == std::string_view::npos ? std::string_view{} : name.substr(0, dot);
    }

    std::string ValueSignature::key() const {
        switch (kind) {
            case SignatureKind::Literal:     return text;
            case SignatureKind::LiteralKind: return "<" + text + ">";
            case SignatureKind::UsesDefault: return "<default>";
            case SignatureKind::Unknown:     return "<unknown>";
        }
        return "<unknown>";
    }

    ValueSignature ValueSignature::from_key(const std::string_view key) {
        if (key == "<default>") {
            return uses_default();
        }
        if (key == "<unknown>") {
            return unknown();
        }
        if (key.size() >= 2 && key.front() == '<' && key.back() == '>') {
            return shape(std::string(key.substr(1, key.size() - 2)));
        }
        return literal(std::string(key));
    }

}  // namespace aua
