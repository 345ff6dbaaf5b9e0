//
// Created by gregorian-rayne on 10/12/26.
//

#ifndef AUA_RESULT_HPP
#define AUA_RESULT_HPP

/**
 * @file result.hpp
 * @brief Success-or-error return type.
 *
 * Every fallible operation in the library returns a Result so that per-file
 * failures can be recorded while the run continues, and configuration
 * failures can be propagated to the command line.
 *
 * @code
 *     auto api = ApiDescription::load(path);
 *     if (api.is_err()) {
 *         spdlog::error("{}", api.error().to_string());
 *     }
 *     auto tree = file_utils::read_file(path).and_then([](const std::string& text) {
 *         return python::SyntaxTree::parse(text);
 *     });
 * @endcode
 */

#include "aua/error.hpp"

#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace aua {

    /**
     * Holds a T on success or an E on failure. Never empty.
     *
     * Asking for the alternative that is not held throws std::logic_error.
     */
    template<typename T, typename E = Error>
    class Result {
        static constexpr std::size_t kValue = 0;
        static constexpr std::size_t kError = 1;

    public:
        using value_type = T;
        using error_type = E;

        static Result success(T value) {
            return Result(std::in_place_index<kValue>, std::move(value));
        }

        static Result failure(E error) {
            return Result(std::in_place_index<kError>, std::move(error));
        }

        [[nodiscard]] bool is_ok() const noexcept { return data_.index() == kValue; }
        [[nodiscard]] bool is_err() const noexcept { return data_.index() == kError; }
        explicit operator bool() const noexcept { return is_ok(); }

        T& value() & { return std::get<kValue>(checked(kValue)); }
        const T& value() const& { return std::get<kValue>(checked(kValue)); }
        T&& value() && { return std::get<kValue>(std::move(checked(kValue))); }

        E& error() & { return std::get<kError>(checked(kError)); }
        const E& error() const& { return std::get<kError>(checked(kError)); }

        T value_or(T fallback) const& {
            return is_ok() ? std::get<kValue>(data_) : std::move(fallback);
        }

        T value_or(T fallback) && {
            return is_ok() ? std::get<kValue>(std::move(data_)) : std::move(fallback);
        }

        /**
         * Applies `f` to the value; an error passes through.
         */
        template<typename F>
        auto map(F&& f) const& -> Result<std::invoke_result_t<F, const T&>, E> {
            using Mapped = Result<std::invoke_result_t<F, const T&>, E>;
            return is_ok() ? Mapped::success(std::forward<F>(f)(std::get<kValue>(data_)))
                           : Mapped::failure(std::get<kError>(data_));
        }

        template<typename F>
        auto map(F&& f) && -> Result<std::invoke_result_t<F, T&&>, E> {
            using Mapped = Result<std::invoke_result_t<F, T&&>, E>;
            return is_ok() ? Mapped::success(std::forward<F>(f)(std::get<kValue>(std::move(data_))))
                           : Mapped::failure(std::get<kError>(std::move(data_)));
        }

        /**
         * Runs the next fallible step on the value. `f` returns a Result with
         * the same error type.
         */
        template<typename F>
        auto and_then(F&& f) const& -> std::invoke_result_t<F, const T&> {
            using Next = std::invoke_result_t<F, const T&>;
            if (is_err()) {
                return Next::failure(std::get<kError>(data_));
            }
            return std::forward<F>(f)(std::get<kValue>(data_));
        }

        template<typename F>
        auto and_then(F&& f) && -> std::invoke_result_t<F, T&&> {
            using Next = std::invoke_result_t<F, T&&>;
            if (is_err()) {
                return Next::failure(std::get<kError>(std::move(data_)));
            }
            return std::forward<F>(f)(std::get<kValue>(std::move(data_)));
        }

        /**
         * Rewrites a held error, usually to attach a path as context.
         */
        template<typename F>
        Result map_error(F&& f) && {
            if (is_ok()) {
                return std::move(*this);
            }
            return failure(std::forward<F>(f)(std::get<kError>(std::move(data_))));
        }

    private:
        template<std::size_t I, typename U>
        Result(std::in_place_index_t<I> which, U&& payload) : data_(which, std::forward<U>(payload)) {}

        std::variant<T, E>& checked(const std::size_t expected) {
            if (data_.index() != expected) {
                throw std::logic_error(expected == kValue ? "Result::value() on an error"
                                                          : "Result::error() on a success");
            }
            return data_;
        }

        const std::variant<T, E>& checked(const std::size_t expected) const {
            return const_cast<Result*>(this)->checked(expected);
        }

        std::variant<T, E> data_;
    };

    /**
     * Result of an operation that only succeeds or fails.
     */
    template<typename E>
    class Result<void, E> {
    public:
        using value_type = void;
        using error_type = E;

        static Result success() { return Result(); }

        static Result failure(E error) {
            Result result;
            result.error_ = std::move(error);
            return result;
        }

        [[nodiscard]] bool is_ok() const noexcept { return !error_; }
        [[nodiscard]] bool is_err() const noexcept { return error_.has_value(); }
        explicit operator bool() const noexcept { return is_ok(); }

        E& error() & {
            ensure_err();
            return *error_;
        }

        const E& error() const& {
            ensure_err();
            return *error_;
        }

        template<typename F>
        auto and_then(F&& f) const& -> std::invoke_result_t<F> {
            using Next = std::invoke_result_t<F>;
            return is_ok() ? std::forward<F>(f)() : Next::failure(*error_);
        }

    private:
        Result() = default;

        void ensure_err() const {
            if (!error_) {
                throw std::logic_error("Result::error() on a success");
            }
        }

        std::optional<E> error_;
    };

}  // namespace aua

#endif //AUA_RESULT_HPP
