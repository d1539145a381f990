#pragma once

#include <optional>
#include <utility>

namespace routecore {
namespace common {

// Value-or-error return for operations whose failures are expected outcomes
// (no deployment available, pool exhausted, ...). E is a small error enum.
template <typename T, typename E>
class Result {
public:
    static Result Ok(T value) {
        Result r;
        r.value_.emplace(std::move(value));
        return r;
    }

    static Result Err(E error) {
        Result r;
        r.error_ = error;
        return r;
    }

    bool ok() const { return value_.has_value(); }
    explicit operator bool() const { return ok(); }

    // Throws std::bad_optional_access when called on an error.
    T& value() { return value_.value(); }
    const T& value() const { return value_.value(); }
    T* operator->() { return &value_.value(); }
    const T* operator->() const { return &value_.value(); }

    // Meaningful only when !ok().
    E error() const { return error_; }

private:
    Result() = default;

    std::optional<T> value_;
    E error_{};
};

// Result without a value.
template <typename E>
class Status {
public:
    static Status Ok() { return Status(); }

    static Status Err(E error) {
        Status s;
        s.error_ = error;
        return s;
    }

    bool ok() const { return !error_.has_value(); }
    explicit operator bool() const { return ok(); }

    E error() const { return error_.value_or(E{}); }

private:
    Status() = default;

    std::optional<E> error_;
};

} // namespace common
} // namespace routecore
