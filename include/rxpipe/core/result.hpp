#pragma once

/**
 * @file result.hpp
 * @brief Fallible value type carried by every stream
 */

#include <exception>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace rxpipe {

/**
 * @brief Either a success value or an error, never both
 *
 * Results are the unit of data flowing through a stream. They are
 * immutable once constructed and move downstream on emission. Errors
 * are stored as std::exception_ptr so any exception type thrown by a
 * user callback survives the trip to the consumer.
 *
 * @tparam T Success payload type
 */
template<typename T>
class Result {
public:
    using value_type = T;

    /**
     * @brief Construct a success
     */
    static Result ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    /**
     * @brief Construct a failure from a captured exception
     */
    static Result err(std::exception_ptr error) {
        if (!error) {
            error = std::make_exception_ptr(std::logic_error("null error"));
        }
        return Result(std::in_place_index<1>, std::move(error));
    }

    /**
     * @brief Construct a failure from an exception object
     */
    template<typename E,
             typename = std::enable_if_t<std::is_base_of_v<std::exception, std::decay_t<E>>>>
    static Result err(E&& error) {
        return err(std::make_exception_ptr(std::forward<E>(error)));
    }

    [[nodiscard]] bool is_ok() const noexcept { return state_.index() == 0; }
    [[nodiscard]] bool is_err() const noexcept { return state_.index() == 1; }

    /**
     * @brief Get value and error together
     *
     * On failure the value is value-initialized.
     */
    [[nodiscard]] std::pair<T, std::exception_ptr> get() const {
        if (is_ok()) {
            return {std::get<0>(state_), nullptr};
        }
        return {T{}, std::get<1>(state_)};
    }

    /**
     * @brief Get the success value (rethrows the stored error on failure)
     */
    [[nodiscard]] const T& value() const& {
        if (is_err()) {
            std::rethrow_exception(std::get<1>(state_));
        }
        return std::get<0>(state_);
    }

    [[nodiscard]] T value() && {
        if (is_err()) {
            std::rethrow_exception(std::get<1>(state_));
        }
        return std::get<0>(std::move(state_));
    }

    /**
     * @brief Get the error, or nullptr on success
     */
    [[nodiscard]] std::exception_ptr error() const noexcept {
        if (is_ok()) {
            return nullptr;
        }
        return std::get<1>(state_);
    }

    /**
     * @brief what() of the stored error, empty on success
     */
    [[nodiscard]] std::string error_message() const {
        if (is_ok()) {
            return {};
        }
        try {
            std::rethrow_exception(std::get<1>(state_));
        } catch (const std::exception& e) {
            return e.what();
        } catch (...) {
            return "unknown error";
        }
    }

    [[nodiscard]] T unwrap_or(T default_value) const {
        if (is_ok()) {
            return std::get<0>(state_);
        }
        return default_value;
    }

    /**
     * @brief Success value, or fallback(error) on failure
     */
    template<typename Func>
    [[nodiscard]] T unwrap_or_else(Func&& fallback) const {
        if (is_ok()) {
            return std::get<0>(state_);
        }
        return std::forward<Func>(fallback)(std::get<1>(state_));
    }

    /**
     * @brief Re-type a failure as Result<U>
     */
    template<typename U>
    [[nodiscard]] Result<U> forward_error() const {
        return Result<U>::err(error());
    }

private:
    template<std::size_t I, typename Arg>
    Result(std::in_place_index_t<I> tag, Arg&& arg)
        : state_(tag, std::forward<Arg>(arg)) {}

    std::variant<T, std::exception_ptr> state_;
};

/**
 * @brief Check whether a type is a Result specialization
 */
template<typename T>
struct is_result : std::false_type {};

template<typename T>
struct is_result<Result<T>> : std::true_type {};

template<typename T>
inline constexpr bool is_result_v = is_result<T>::value;

} // namespace rxpipe
