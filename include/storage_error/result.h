//include/storage_error/result.h
#pragma once

#include "storage_error.h" // Needs StorageError
#include <optional>
#include <utility>   // For std::move

namespace storage {

/**
 * @brief Either a value or the StorageError that prevented producing it.
 * Used for internal steps whose failure the caller decides how to handle
 * (for example a stored document holding a type the codecs do not map).
 */
template<typename T>
class Result {
private:
    std::optional<T> value_;
    std::optional<StorageError> error_;

public:
    Result(T val) : value_(std::move(val)) {}
    Result(StorageError err) : error_(std::move(err)) {}

    bool hasValue() const { return value_.has_value(); }
    bool hasError() const { return error_.has_value(); }
    bool isOk() const { return hasValue(); }
    explicit operator bool() const { return isOk(); }

    // Accessing the wrong side rethrows the held error, or INTERNAL_ERROR.
    const T& value() const& {
        if (!hasValue()) throw error_.value_or(StorageError(ErrorCode::INTERNAL_ERROR, "Result has no value"));
        return *value_;
    }
    T& value() & {
        if (!hasValue()) throw error_.value_or(StorageError(ErrorCode::INTERNAL_ERROR, "Result has no value"));
        return *value_;
    }
    T&& value() && {
        if (!hasValue()) throw error_.value_or(StorageError(ErrorCode::INTERNAL_ERROR, "Result has no value"));
        return std::move(*value_);
    }

    const T* operator->() const { return &value(); }
    T* operator->() { return &value(); }

    const StorageError& error() const& {
        if (!hasError()) throw StorageError(ErrorCode::INTERNAL_ERROR, "Result has no error");
        return *error_;
    }
    StorageError& error() & {
        if (!hasError()) throw StorageError(ErrorCode::INTERNAL_ERROR, "Result has no error");
        return *error_;
    }

    T valueOr(T default_value) const& {
        return hasValue() ? *value_ : std::move(default_value);
    }
};

template<>
class Result<void> {
private:
    std::optional<StorageError> error_;

public:
    Result() = default; // Represents success
    Result(StorageError err) : error_(std::move(err)) {}

    bool hasError() const { return error_.has_value(); }
    bool isOk() const { return !hasError(); }
    explicit operator bool() const { return isOk(); }

    const StorageError& error() const& {
        if (!hasError()) throw StorageError(ErrorCode::INTERNAL_ERROR, "Result<void> has no error");
        return *error_;
    }
    StorageError& error() & {
        if (!hasError()) throw StorageError(ErrorCode::INTERNAL_ERROR, "Result<void> has no error");
        return *error_;
    }
};

using Status = Result<void>;

} // namespace storage
