#pragma once

#include <cassert>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "error.hpp"

namespace scanpool {

    /// @brief Either a value of type T or an Error.
    /// @note Pool, transport and batch boundaries report failures through
    /// this type instead of throwing.
    template <typename T>
    class [[nodiscard]] Result {
       public:
        template <typename... Args, typename = std::enable_if_t<
                                        std::is_constructible_v<T, Args&&...>>>
        static Result ok(Args&&... args) {
            return Result(std::in_place_index<0>, std::forward<Args>(args)...);
        }

        static Result err(Error error) {
            return Result(std::in_place_index<1>, std::move(error));
        }

        static Result err(Error::Code code, std::string message) {
            return err(Error{code, std::move(message)});
        }

        explicit operator bool() const noexcept { return has_value(); }

        bool has_value() const noexcept { return state_.index() == 0; }
        bool has_error() const noexcept { return state_.index() == 1; }

        const T& value() const& {
            assert(has_value() && "value() on a failed Result");
            return std::get<0>(state_);
        }

        T& value() & {
            assert(has_value() && "value() on a failed Result");
            return std::get<0>(state_);
        }

        T&& value() && {
            assert(has_value() && "value() on a failed Result");
            return std::get<0>(std::move(state_));
        }

        const Error& error() const& {
            assert(has_error() && "error() on a successful Result");
            return std::get<1>(state_);
        }

        Error&& error() && {
            assert(has_error() && "error() on a successful Result");
            return std::get<1>(std::move(state_));
        }

       private:
        template <std::size_t I, typename... Args>
        explicit Result(std::in_place_index_t<I> tag, Args&&... args)
            : state_(tag, std::forward<Args>(args)...) {}

        std::variant<T, Error> state_;
    };

    /// @brief Success or an Error, nothing else. Units of work return this
    /// so that quit and skip requests travel as error codes.
    template <>
    class [[nodiscard]] Result<void> {
       public:
        static Result ok() noexcept { return Result(); }

        static Result err(Error error) { return Result(std::move(error)); }

        static Result err(Error::Code code, std::string message) {
            return Result(Error{code, std::move(message)});
        }

        explicit operator bool() const noexcept { return has_value(); }

        bool has_value() const noexcept { return !error_.has_value(); }
        bool has_error() const noexcept { return error_.has_value(); }

        const Error& error() const& {
            assert(error_ && "error() on a successful Status");
            return *error_;
        }

        Error&& error() && {
            assert(error_ && "error() on a successful Status");
            return std::move(*error_);
        }

       private:
        Result() = default;
        explicit Result(Error error) : error_(std::move(error)) {}

        std::optional<Error> error_;
    };

    using Status = Result<void>;

}  // namespace scanpool
