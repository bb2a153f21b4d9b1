// ============================================================================
// convq/core/result.hpp - Result Type for Error Handling
// ============================================================================
//
// Result<T, E> holds either a success value or an error. Every fallible
// engine operation returns one; nothing in convq throws across a component
// boundary.
//
// USAGE:
// ------
//   Result<ConversionTask, EngineError> Lookup(const TaskId& id) {
//       if (!Known(id)) return Err(EngineError::NotFound(id));
//       return Ok(task);
//   }
//
//   auto task = registry.Get(id);
//   if (task.IsErr()) {
//       CONVQ_LOG_WARN("api", task.Error().message);
//   }
//
// ============================================================================

#pragma once

#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace convq {

template <typename T, typename E>
class Result;

// ============================================================================
// Ok and Err Tag Types
// ============================================================================

template <typename T>
struct OkTag {
    T value;

    template <typename U>
    explicit OkTag(U&& v) : value(std::forward<U>(v)) {}
};

template <typename E>
struct ErrTag {
    E error;

    template <typename U>
    explicit ErrTag(U&& e) : error(std::forward<U>(e)) {}
};

template <typename T>
OkTag<std::decay_t<T>> Ok(T&& value) {
    return OkTag<std::decay_t<T>>(std::forward<T>(value));
}

template <typename E>
ErrTag<std::decay_t<E>> Err(E&& error) {
    return ErrTag<std::decay_t<E>>(std::forward<E>(error));
}

// Unit type for Result<void, E>
struct Unit {};

inline OkTag<Unit> Ok() {
    return OkTag<Unit>(Unit{});
}

// ============================================================================
// Result<T, E> - Success or Error
// ============================================================================
template <typename T, typename E>
class Result {
   public:
    template <typename U>
    Result(OkTag<U>&& ok) : data_(std::in_place_index<0>, std::move(ok.value)) {}

    template <typename U>
    Result(ErrTag<U>&& err) : data_(std::in_place_index<1>, std::move(err.error)) {}

    Result(const Result&) = default;
    Result(Result&&) = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) = default;

    bool IsOk() const noexcept { return data_.index() == 0; }
    bool IsErr() const noexcept { return data_.index() == 1; }

    explicit operator bool() const noexcept { return IsOk(); }

    // Undefined behavior if IsErr()
    T& Value() & { return std::get<0>(data_); }
    const T& Value() const& { return std::get<0>(data_); }
    T&& Value() && { return std::get<0>(std::move(data_)); }

    // Undefined behavior if IsOk()
    E& Error() & { return std::get<1>(data_); }
    const E& Error() const& { return std::get<1>(data_); }
    E&& Error() && { return std::get<1>(std::move(data_)); }

    T ValueOr(T default_value) const {
        if (IsOk()) return std::get<0>(data_);
        return default_value;
    }

    // Transform the success value, forwarding errors unchanged
    template <typename F>
    auto Map(F&& func) && -> Result<std::invoke_result_t<F, T&&>, E> {
        if (IsOk()) {
            return Ok(func(std::move(*this).Value()));
        }
        return Err(std::move(*this).Error());
    }

   private:
    std::variant<T, E> data_;
};

// ============================================================================
// Result<void, E> Specialization
// ============================================================================

template <typename E>
class Result<void, E> {
   public:
    Result(OkTag<Unit>&&) : error_(std::nullopt) {}

    template <typename U>
    Result(ErrTag<U>&& err) : error_(std::move(err.error)) {}

    bool IsOk() const noexcept { return !error_.has_value(); }
    bool IsErr() const noexcept { return error_.has_value(); }

    explicit operator bool() const noexcept { return IsOk(); }

    E& Error() & { return *error_; }
    const E& Error() const& { return *error_; }
    E&& Error() && { return std::move(*error_); }

   private:
    std::optional<E> error_;
};

}  // namespace convq
