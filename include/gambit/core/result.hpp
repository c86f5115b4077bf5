#pragma once
#include <cstddef>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace gambit {

/// Value type for operations that succeed without producing anything.
struct Unit {
    constexpr bool operator==(const Unit&) const noexcept = default;
};

inline constexpr Unit unit{};

/**
 * Either a value or an error, never both.
 *
 * Every fallible call in the library returns one of these; nothing throws
 * across the public API. Unwrap()/UnwrapErr() on the wrong alternative is a
 * programming error and throws std::logic_error.
 */
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    static Result Ok(T value) {
        return Result(std::in_place_index<kOk>, std::move(value));
    }

    static Result Err(E error) {
        return Result(std::in_place_index<kErr>, std::move(error));
    }

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == kOk; }
    [[nodiscard]] bool IsErr() const noexcept { return storage_.index() == kErr; }

    [[nodiscard]] T& Unwrap() & {
        RequireOk();
        return std::get<kOk>(storage_);
    }
    [[nodiscard]] const T& Unwrap() const& {
        RequireOk();
        return std::get<kOk>(storage_);
    }
    [[nodiscard]] T&& Unwrap() && {
        RequireOk();
        return std::get<kOk>(std::move(storage_));
    }

    [[nodiscard]] E& UnwrapErr() & {
        RequireErr();
        return std::get<kErr>(storage_);
    }
    [[nodiscard]] const E& UnwrapErr() const& {
        RequireErr();
        return std::get<kErr>(storage_);
    }
    [[nodiscard]] E&& UnwrapErr() && {
        RequireErr();
        return std::get<kErr>(std::move(storage_));
    }

    [[nodiscard]] T UnwrapOr(T fallback) && {
        return IsOk() ? std::get<kOk>(std::move(storage_)) : std::move(fallback);
    }

    template<typename F>
    [[nodiscard]] auto Map(F&& func) && -> Result<std::invoke_result_t<F, T>, E> {
        using Mapped = Result<std::invoke_result_t<F, T>, E>;
        if (IsErr()) {
            return Mapped::Err(std::get<kErr>(std::move(storage_)));
        }
        return Mapped::Ok(std::forward<F>(func)(std::get<kOk>(std::move(storage_))));
    }

    template<typename F>
    [[nodiscard]] auto MapErr(F&& func) && -> Result<T, std::invoke_result_t<F, E>> {
        using Mapped = Result<T, std::invoke_result_t<F, E>>;
        if (IsOk()) {
            return Mapped::Ok(std::get<kOk>(std::move(storage_)));
        }
        return Mapped::Err(std::forward<F>(func)(std::get<kErr>(std::move(storage_))));
    }

    /// Chains a fallible step; `func` must return a Result with the same error type.
    template<typename F>
    [[nodiscard]] auto Bind(F&& func) && -> std::invoke_result_t<F, T> {
        using Next = std::invoke_result_t<F, T>;
        static_assert(std::is_same_v<typename Next::error_type, E>,
                      "Bind requires the same error type");
        if (IsErr()) {
            return Next::Err(std::get<kErr>(std::move(storage_)));
        }
        return std::forward<F>(func)(std::get<kOk>(std::move(storage_)));
    }

private:
    static constexpr std::size_t kOk = 0;
    static constexpr std::size_t kErr = 1;

    template<std::size_t I, typename V>
    Result(std::in_place_index_t<I> index, V&& value)
        : storage_(index, std::forward<V>(value)) {}

    void RequireOk() const {
        if (IsErr()) {
            throw std::logic_error("Unwrap() called on an error result");
        }
    }

    void RequireErr() const {
        if (IsOk()) {
            throw std::logic_error("UnwrapErr() called on a successful result");
        }
    }

    std::variant<T, E> storage_;
};

}
