//include/storage_error/storage_error.h

#pragma once

#include "error_codes.h" // Needs ErrorCode, ErrorSeverity, ErrorCategory
#include <string>
#include <optional>
#include <chrono>
#include <exception>
#include <unordered_map> // For context map

namespace storage {

/**
 * @brief Detailed error information with context.
 * Thrown directly or through one of the typed subclasses below; every
 * datastore failure carries a "kind", "key" or "query" context entry
 * naming the operation that raised it.
 */
class StorageError : public std::exception {
public:
    ErrorCode code;
    ErrorSeverity severity; // Will be set based on code
    ErrorCategory category; // Will be set based on code
    std::string message;
    std::string details;
    std::string suggested_action;
    std::optional<std::string> file_path;
    std::optional<size_t> line_number;
    std::optional<std::string> function_name;
    std::chrono::system_clock::time_point timestamp;
    std::optional<ErrorCode> underlying_error;
    std::unordered_map<std::string, std::string> context;

    // Constructors
    StorageError(ErrorCode code, const std::string& message = "");
    StorageError(ErrorCode code, const std::string& message, const std::string& details);

    // Builder pattern for detailed error construction
    StorageError& withDetails(const std::string& details);
    StorageError& withSuggestedAction(const std::string& action);
    StorageError& withLocation(const std::string& file, size_t line, const std::string& function);
    StorageError& withUnderlyingError(ErrorCode underlying);
    StorageError& withContext(const std::string& key, const std::string& value);
    StorageError& withFilePath(const std::string& path);

    const char* what() const noexcept override;

    // Utility methods
    bool isRecoverable() const;
    std::string toString() const;
    std::string toDetailedString() const;
    std::string toJson() const;
    std::optional<std::string> contextValue(const std::string& key) const;

    // Static factory methods for common errors
    static StorageError invalidKey(const std::string& key_text, const std::string& reason);
    static StorageError invalidCursor(const std::string& query_text, const std::string& reason);

private:
    void refreshWhat();
    std::string what_;
};

/** A property value the codec cannot represent. */
class UnsupportedTypeError : public StorageError {
public:
    UnsupportedTypeError(const std::string& property, const std::string& type_description);
};

/** A query shape the translator refuses to run. */
class UnsupportedQueryError : public StorageError {
public:
    UnsupportedQueryError(const std::string& query_text, const std::string& reason);
};

/** Strict index mode found no index serving the query. */
class IndexMissingError : public StorageError {
public:
    IndexMissingError(const std::string& query_text, const std::string& required_index);
    std::string required_index;
};

/** A transaction touched a second entity group. */
class CrossGroupError : public StorageError {
public:
    CrossGroupError(const std::string& key_text, const std::string& transaction_group);
};

/**
 * @brief Commit of an emulated transaction failed part way through.
 * Operations before failed_index were applied and stay applied.
 */
class PartialCommitError : public StorageError {
public:
    PartialCommitError(size_t failed_index, size_t total_operations, const std::string& failed_key,
                       const std::string& cause);
    size_t failed_index;
    size_t total_operations;
};

/** Connection failure or timeout talking to the document backend. */
class BackendUnavailableError : public StorageError {
public:
    BackendUnavailableError(const std::string& operation, const std::string& reason,
                            ErrorCode underlying = ErrorCode::BACKEND_UNAVAILABLE);
};

} // namespace storage
