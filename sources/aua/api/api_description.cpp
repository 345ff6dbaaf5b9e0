//
// Created by gregorian-rayne on 10/13/26.
//

#include "aua/api/api_description.hpp"
#include "aua/utils/json_utils.hpp"
#include "aua/utils/string_utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <unordered_set>

namespace aua::api {

    using json = nlohmann::json;

    namespace {

        Result<FormalParameter, Error> parse_parameter(const json& j, const std::string& owner) {
            auto name = json_utils::require_string(j, "name", "Parameter without a name", owner);
            if (name.is_err()) {
                return Result<FormalParameter, Error>::failure(name.error());
            }

            FormalParameter param;
            param.name = std::move(name).value();

            if (const auto it = j.find("default_value"); it != j.end() && !it->is_null()) {
                param.default_value = it->is_string() ? it->get<std::string>() : it->dump();
                param.has_default = true;
            }
            if (json_utils::get_or(j, "has_default", false)) {
                param.has_default = true;
            }

            if (const auto kind = json_utils::get_or<std::string>(j, "kind", ""); !kind.empty()) {
                const auto parsed = parameter_kind_from_string(kind);
                if (!parsed) {
                    return Result<FormalParameter, Error>::failure(
                        Error::parse_error("Unknown parameter kind '" + kind + "'", owner + "." + param.name)
                    );
                }
                param.kind = *parsed;
            }

            return Result<FormalParameter, Error>::success(std::move(param));
        }

    }  // namespace

    Result<ApiDescription, Error> ApiDescription::from_json(const json& document) {
        if (!document.is_object()) {
            return Result<ApiDescription, Error>::failure(
                Error::parse_error("API description must be a JSON object")
            );
        }
        auto package = json_utils::require_string(document, "package", "API description has no 'package'");
        if (package.is_err()) {
            return Result<ApiDescription, Error>::failure(package.error());
        }
        if (!document.contains("functions") || !document["functions"].is_array()) {
            return Result<ApiDescription, Error>::failure(
                Error::parse_error("API description has no 'functions' array")
            );
        }

        ApiDescription api;
        api.set_metadata(
            json_utils::get_or<std::string>(document, "distribution", ""),
            std::move(package).value(),
            json_utils::get_or<std::string>(document, "version", "")
        );

        auto push = [&api](ApiElement element) {
            if (const auto it = api.by_name_.find(element.qualified_name); it != api.by_name_.end()) {
                api.elements_[it->second] = std::move(element);
                return;
            }
            api.by_name_.emplace(element.qualified_name, api.elements_.size());
            api.elements_.push_back(std::move(element));
        };

        for (const auto& module : json_utils::get_or(document, "modules", json::array())) {
            if (module.is_string()) {
                push(ApiElement{.qualified_name = module.get<std::string>(), .kind = ElementKind::Module});
            }
        }

        std::unordered_set<std::string> class_names;
        for (const auto& cls : json_utils::get_or(document, "classes", json::array())) {
            if (!cls.is_string()) {
                return Result<ApiDescription, Error>::failure(
                    Error::parse_error("Class names must be strings")
                );
            }
            class_names.insert(cls.get<std::string>());
            push(ApiElement{.qualified_name = cls.get<std::string>(), .kind = ElementKind::Class});
        }

        for (const auto& fn : document["functions"]) {
            auto qname = json_utils::require_string(fn, "qname", "Function entry without a 'qname'");
            if (qname.is_err()) {
                return Result<ApiDescription, Error>::failure(qname.error());
            }

            ApiElement element;
            element.qualified_name = std::move(qname).value();

            const auto kind = json_utils::get_or<std::string>(fn, "kind", "");
            if (kind.empty()) {
                // Undeclared kind: members of a listed class are methods.
                element.kind = class_names.contains(std::string(element.parent_name()))
                    ? ElementKind::Method
                    : ElementKind::Function;
            } else if (const auto parsed = element_kind_from_string(kind); parsed && (
                           *parsed == ElementKind::Function || *parsed == ElementKind::Method)) {
                element.kind = *parsed;
            } else {
                return Result<ApiDescription, Error>::failure(
                    Error::parse_error("Unsupported function kind '" + kind + "'", element.qualified_name)
                );
            }

            if (const auto method_kind = json_utils::get_or<std::string>(fn, "method_kind", "");
                !method_kind.empty()) {
                const auto parsed = method_kind_from_string(method_kind);
                if (!parsed) {
                    return Result<ApiDescription, Error>::failure(
                        Error::parse_error("Unknown method kind '" + method_kind + "'", element.qualified_name)
                    );
                }
                element.method_kind = *parsed;
            }

            for (const auto& param : json_utils::get_or(fn, "parameters", json::array())) {
                auto parsed = parse_parameter(param, element.qualified_name);
                if (parsed.is_err()) {
                    return Result<ApiDescription, Error>::failure(parsed.error());
                }
                element.parameters.push_back(std::move(parsed).value());
            }

            push(std::move(element));
        }

        const auto aliases = json_utils::get_or(document, "aliases", json::object());
        for (const auto& [alias, target] : aliases.items()) {
            if (!target.is_string()) {
                return Result<ApiDescription, Error>::failure(
                    Error::parse_error("Alias target must be a string", alias)
                );
            }
            api.aliases_[alias] = target.get<std::string>();
        }

        api.rebuild_bare_index();
        return Result<ApiDescription, Error>::success(std::move(api));
    }

    Result<ApiDescription, Error> ApiDescription::load(const std::filesystem::path& path) {
        auto document = json_utils::read_file(path);
        if (document.is_err()) {
            return Result<ApiDescription, Error>::failure(document.error());
        }
        return from_json(document.value()).map_error([&](Error e) {
            return e.with_context(path.string());
        });
    }

    const ApiElement* ApiDescription::find(const std::string_view qualified_name) const {
        const auto it = by_name_.find(std::string(qualified_name));
        return it == by_name_.end() ? nullptr : &elements_[it->second];
    }

    std::vector<const ApiElement*> ApiDescription::find_by_bare_name(const std::string_view bare_name,
                                                                     const std::string_view within) const {
        std::vector<const ApiElement*> matches;
        const auto it = by_bare_name_.find(std::string(bare_name));
        if (it == by_bare_name_.end()) {
            return matches;
        }
        for (const std::size_t index : it->second) {
            const ApiElement& element = elements_[index];
            if (element.qualified_name.size() > within.size() &&
                string_utils::is_dotted_prefix(within, element.qualified_name)) {
                matches.push_back(&element);
            }
        }
        return matches;
    }

    const ApiElement* ApiDescription::constructor_of(const std::string_view class_name) const {
        for (const char* name : {"__new__", "__init__"}) {
            if (const auto* ctor = find(string_utils::join_dotted(class_name, name));
                ctor != nullptr && ctor->is_callable()) {
                return ctor;
            }
        }
        return nullptr;
    }

    std::string ApiDescription::canonicalize(const std::string_view name) const {
        std::string current(name);
        if (aliases_.empty()) {
            return current;
        }

        std::unordered_set<std::string> applied;
        while (true) {
            // Longest alias that is a dotted prefix of the current name.
            const std::pair<const std::string, std::string>* best = nullptr;
            for (const auto& entry : aliases_) {
                if (string_utils::is_dotted_prefix(entry.first, current) &&
                    (best == nullptr || entry.first.size() > best->first.size())) {
                    best = &entry;
                }
            }
            if (best == nullptr || !applied.insert(best->first).second) {
                return current;
            }
            current = best->second + current.substr(best->first.size());
        }
    }

    bool ApiDescription::is_package_root(const std::string_view name) const {
        const auto root = name.substr(0, name.find('.'));
        if (root.empty()) {
            return false;
        }
        if (root == package_) {
            return true;
        }
        return std::ranges::any_of(elements_, [&](const ApiElement& element) {
            return element.kind == ElementKind::Module && element.qualified_name == root;
        });
    }

    std::vector<std::string> ApiDescription::classes() const {
        std::vector<std::string> result;
        for (const auto& element : elements_) {
            if (element.kind == ElementKind::Class) {
                result.push_back(element.qualified_name);
            }
        }
        return result;
    }

    std::vector<const ApiElement*> ApiDescription::callables() const {
        std::vector<const ApiElement*> result;
        for (const auto& element : elements_) {
            if (element.is_callable()) {
                result.push_back(&element);
            }
        }
        return result;
    }

    std::vector<const ApiElement*> ApiDescription::members_of(const std::string_view class_name) const {
        std::vector<const ApiElement*> result;
        for (const auto& element : elements_) {
            if (element.is_callable() && element.parent_name() == class_name) {
                result.push_back(&element);
            }
        }
        return result;
    }

    void ApiDescription::add_element(ApiElement element) {
        if (const auto it = by_name_.find(element.qualified_name); it != by_name_.end()) {
            elements_[it->second] = std::move(element);
        } else {
            by_name_.emplace(element.qualified_name, elements_.size());
            elements_.push_back(std::move(element));
        }
        rebuild_bare_index();
    }

    void ApiDescription::add_alias(std::string alias, std::string target) {
        aliases_[std::move(alias)] = std::move(target);
    }

    void ApiDescription::set_metadata(std::string distribution, std::string package, std::string version) {
        distribution_ = std::move(distribution);
        package_ = std::move(package);
        version_ = std::move(version);
    }

    void ApiDescription::rebuild_bare_index() {
        // Only names reachable by a wildcard import: class members are not.
        by_bare_name_.clear();
        for (std::size_t i = 0; i < elements_.size(); ++i) {
            const auto& element = elements_[i];
            if (element.kind == ElementKind::Parameter) {
                continue;
            }
            if (const auto* parent = find(element.parent_name());
                parent != nullptr && parent->kind == ElementKind::Class) {
                continue;
            }
            by_bare_name_[std::string(element.bare_name())].push_back(i);
        }
    }

}  // namespace aua::api
