#ifndef HQA_RESULT_HPP
#define HQA_RESULT_HPP

/**
 * @file result.hpp
 * @brief Result type for error handling without exceptions.
 *
 * Result<T, E> holds either a success value of type T or an error value of
 * type E. The analysis pipeline returns it from every stage that can fail so
 * that rejections, resource-limit breaches and timeouts stay visible in the
 * type system instead of escaping as exceptions.
 *
 * Usage:
 * @code
 *     auto context = guard.load(path);
 *     if (context.is_err()) {
 *         return Result<Report, Error>::failure(to_error(context.error()));
 *     }
 *     auto units = extractor.extract(context.value().content);
 * @endcode
 */

#include <variant>
#include <optional>
#include <utility>
#include <type_traits>
#include <stdexcept>

namespace hqa {

    struct SuccessTag {};
    struct FailureTag {};

    inline constexpr SuccessTag success_tag{};
    inline constexpr FailureTag failure_tag{};

    /**
     * A value that is either a success T or an error E. Never empty.
     *
     * @tparam T The type of the success value.
     * @tparam E The type of the error value.
     */
    template<typename T, typename E>
    class Result {
    public:
        using value_type = T;
        using error_type = E;

        static Result success(T value) {
            return Result(success_tag, std::move(value));
        }

        static Result failure(E error) {
            return Result(failure_tag, std::move(error));
        }

        Result(SuccessTag, T value) : data_(std::in_place_index<0>, std::move(value)) {}
        Result(FailureTag, E error) : data_(std::in_place_index<1>, std::move(error)) {}

        [[nodiscard]] bool is_ok() const noexcept {
            return data_.index() == 0;
        }

        [[nodiscard]] bool is_err() const noexcept {
            return data_.index() == 1;
        }

        explicit operator bool() const noexcept {
            return is_ok();
        }

        /**
         * Returns the success value.
         * @throws std::logic_error if the Result contains an error.
         */
        T& value() & {
            if (is_err()) {
                throw std::logic_error("Result::value() called on error result");
            }
            return std::get<0>(data_);
        }

        const T& value() const& {
            if (is_err()) {
                throw std::logic_error("Result::value() called on error result");
            }
            return std::get<0>(data_);
        }

        T&& value() && {
            if (is_err()) {
                throw std::logic_error("Result::value() called on error result");
            }
            return std::get<0>(std::move(data_));
        }

        /**
         * Returns the error value.
         * @throws std::logic_error if the Result contains a success value.
         */
        E& error() & {
            if (is_ok()) {
                throw std::logic_error("Result::error() called on success result");
            }
            return std::get<1>(data_);
        }

        const E& error() const& {
            if (is_ok()) {
                throw std::logic_error("Result::error() called on success result");
            }
            return std::get<1>(data_);
        }

        T value_or(T default_value) const& {
            if (is_ok()) {
                return std::get<0>(data_);
            }
            return default_value;
        }

        T value_or(T default_value) && {
            if (is_ok()) {
                return std::get<0>(std::move(data_));
            }
            return default_value;
        }

        /**
         * Applies f to the success value; errors pass through unchanged.
         */
        template<typename F>
        auto map(F&& f) const& -> Result<std::invoke_result_t<F, const T&>, E> {
            using U = std::invoke_result_t<F, const T&>;
            if (is_ok()) {
                return Result<U, E>::success(std::forward<F>(f)(std::get<0>(data_)));
            }
            return Result<U, E>::failure(std::get<1>(data_));
        }

        /**
         * Converts the error value with f; success values pass through unchanged.
         */
        template<typename F>
        auto map_error(F&& f) const& -> Result<T, std::invoke_result_t<F, const E&>> {
            using E2 = std::invoke_result_t<F, const E&>;
            if (is_ok()) {
                return Result<T, E2>::success(std::get<0>(data_));
            }
            return Result<T, E2>::failure(std::forward<F>(f)(std::get<1>(data_)));
        }

        /**
         * Chains an operation that may itself fail.
         */
        template<typename F>
        auto and_then(F&& f) const& -> std::invoke_result_t<F, const T&> {
            if (is_ok()) {
                return std::forward<F>(f)(std::get<0>(data_));
            }
            using ResultType = std::invoke_result_t<F, const T&>;
            return ResultType::failure(std::get<1>(data_));
        }

    private:
        std::variant<T, E> data_;
    };

    /**
     * Specialization for operations that report only success or failure.
     */
    template<typename E>
    class Result<void, E> {
    public:
        using value_type = void;
        using error_type = E;

        static Result success() {
            return Result(success_tag);
        }

        static Result failure(E error) {
            return Result(failure_tag, std::move(error));
        }

        explicit Result(SuccessTag) : error_(std::nullopt) {}
        Result(FailureTag, E error) : error_(std::move(error)) {}

        [[nodiscard]] bool is_ok() const noexcept {
            return !error_.has_value();
        }

        [[nodiscard]] bool is_err() const noexcept {
            return error_.has_value();
        }

        explicit operator bool() const noexcept {
            return is_ok();
        }

        const E& error() const& {
            if (is_ok()) {
                throw std::logic_error("Result::error() called on success result");
            }
            return *error_;
        }

    private:
        std::optional<E> error_;
    };

}  // namespace hqa

#endif // HQA_RESULT_HPP
