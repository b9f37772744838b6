#pragma once

#include <vkfg/error.hpp>

#include <cassert>
#include <optional>
#include <utility>
#include <variant>

namespace vkfg {

// Result<T> holds either a value or an Error. Check, then unwrap.
// Frame-level calls chain through early returns:
//     auto r = cache.get(ctx, desc);
//     if (!r.ok()) return r.error();
template <typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}             // NOLINT implicit
    Result(Error error) : data_(std::move(error)) {}         // NOLINT implicit

    [[nodiscard]] bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    [[nodiscard]] T& value() & {
        assert(ok() && "value() on error Result");
        return std::get<T>(data_);
    }

    [[nodiscard]] const T& value() const& {
        assert(ok() && "value() on error Result");
        return std::get<T>(data_);
    }

    [[nodiscard]] T value() && {
        assert(ok() && "value() on error Result");
        return std::move(std::get<T>(data_));
    }

    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] Error& error() & {
        assert(!ok() && "error() on ok Result");
        return std::get<Error>(data_);
    }

    [[nodiscard]] const Error& error() const& {
        assert(!ok() && "error() on ok Result");
        return std::get<Error>(data_);
    }

    [[nodiscard]] Error error() && {
        assert(!ok() && "error() on ok Result");
        return std::move(std::get<Error>(data_));
    }

    // Value, or the fallback when this holds an error.
    [[nodiscard]] T valueOr(T fallback) const& {
        return ok() ? std::get<T>(data_) : std::move(fallback);
    }

    [[nodiscard]] T orThrow() && {
        if (!ok()) throwError(error());
        return std::move(std::get<T>(data_));
    }

private:
    std::variant<T, Error> data_;
};

// Success carries no value.
template <>
class Result<void> {
public:
    Result() : error_{} {}
    Result(Error error) : error_(std::move(error)) {}           // NOLINT implicit

    [[nodiscard]] bool ok() const { return !error_.has_value(); }
    explicit operator bool() const { return ok(); }

    [[nodiscard]] Error& error() & {
        assert(!ok() && "error() on ok Result<void>");
        return *error_;
    }

    [[nodiscard]] const Error& error() const& {
        assert(!ok() && "error() on ok Result<void>");
        return *error_;
    }

    void orThrow() && {
        if (!ok()) throwError(error());
    }

private:
    std::optional<Error> error_;
};

} // namespace vkfg
