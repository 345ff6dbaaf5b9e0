//
// Created by gregorian-rayne on 10/13/26.
//

#ifndef AUA_API_DESCRIPTION_HPP
#define AUA_API_DESCRIPTION_HPP

/**
 * @file api_description.hpp
 * @brief Public interface of the analyzed library.
 *
 * The description is loaded once from its JSON document and is read-only
 * for the rest of the run, so it is shared by every worker without locking.
 *
 * Document layout:
 * @code
 * {
 *   "distribution": "scikit-learn", "package": "sklearn", "version": "1.5.0",
 *   "modules":   ["sklearn", "sklearn.cluster"],
 *   "classes":   ["sklearn.cluster.KMeans"],
 *   "functions": [
 *     {"qname": "sklearn.cluster.KMeans.__init__", "kind": "method",
 *      "parameters": [{"name": "self"}, {"name": "n_clusters", "default_value": "8"}]}
 *   ],
 *   "aliases":   {"sklearn.KMeans": "sklearn.cluster.KMeans"}
 * }
 * @endcode
 */

#include "aua/types.hpp"
#include "aua/result.hpp"

#include <nlohmann/json_fwd.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace aua::api {

    /**
     * Indexed, immutable view of the library's public interface.
     */
    class ApiDescription {
    public:
        ApiDescription() = default;

        /**
         * Builds a description from a parsed JSON document.
         *
         * @return The description, or a ParseError when required fields are
         *         missing or malformed.
         */
        static Result<ApiDescription, Error> from_json(const nlohmann::json& document);

        /**
         * Reads and parses an API description file.
         */
        static Result<ApiDescription, Error> load(const std::filesystem::path& path);

        [[nodiscard]] const std::string& distribution() const noexcept { return distribution_; }
        [[nodiscard]] const std::string& package() const noexcept { return package_; }
        [[nodiscard]] const std::string& version() const noexcept { return version_; }

        /**
         * Finds an element by exact qualified name.
         */
        [[nodiscard]] const ApiElement* find(std::string_view qualified_name) const;

        /**
         * Elements whose last dotted component is `bare_name` and that live
         * under the module `within`, as a `from within import *` would
         * expose them. Class members are not indexed.
         */
        [[nodiscard]] std::vector<const ApiElement*> find_by_bare_name(std::string_view bare_name,
                                                                        std::string_view within) const;

        /**
         * Constructor of a class: its `__new__` element if described, else
         * its `__init__`. nullptr when the class lists neither.
         */
        [[nodiscard]] const ApiElement* constructor_of(std::string_view class_name) const;

        /**
         * Rewrites a composed identifier through the longest matching alias
         * prefix, repeatedly, until no alias applies.
         *
         * @code
         *     // aliases: {"pkg.fn": "pkg._impl.fn"}
         *     canonicalize("pkg.fn")      // "pkg._impl.fn"
         *     canonicalize("pkg.fn.sub")  // "pkg._impl.fn.sub"
         * @endcode
         *
         * Alias cycles stop after every alias has been applied once.
         */
        [[nodiscard]] std::string canonicalize(std::string_view name) const;

        /**
         * True when the first dotted component of `name` is the package or
         * any declared module root.
         */
        [[nodiscard]] bool is_package_root(std::string_view name) const;

        /**
         * All elements in document order.
         */
        [[nodiscard]] const std::vector<ApiElement>& elements() const noexcept { return elements_; }

        /**
         * Qualified names of every class, in document order.
         */
        [[nodiscard]] std::vector<std::string> classes() const;

        /**
         * Callable elements (functions and methods), in document order.
         */
        [[nodiscard]] std::vector<const ApiElement*> callables() const;

        /**
         * Callables defined directly inside a class, including its constructor.
         */
        [[nodiscard]] std::vector<const ApiElement*> members_of(std::string_view class_name) const;

        [[nodiscard]] const std::unordered_map<std::string, std::string>& aliases() const noexcept {
            return aliases_;
        }

        [[nodiscard]] std::size_t size() const noexcept { return elements_.size(); }

        /**
         * Adds an element, replacing an existing one with the same name.
         */
        void add_element(ApiElement element);

        /**
         * Declares a re-export alias.
         */
        void add_alias(std::string alias, std::string target);

        void set_metadata(std::string distribution, std::string package, std::string version);

    private:
        void rebuild_bare_index();

        std::string distribution_;
        std::string package_;
        std::string version_;

        std::vector<ApiElement> elements_;
        std::unordered_map<std::string, std::size_t> by_name_;
        std::unordered_map<std::string, std::vector<std::size_t>> by_bare_name_;
        std::unordered_map<std::string, std::string> aliases_;
    };

}  // namespace aua::api

#endif //AUA_API_DESCRIPTION_HPP
