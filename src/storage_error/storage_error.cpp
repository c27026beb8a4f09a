// src/storage_error/storage_error.cpp
#include "../../include/storage_error/storage_error.h"
#include "../../include/storage_error/error_utils.h"
#include <nlohmann/json.hpp>
#include <sstream>
#include <iomanip> // For std::put_time
#include <chrono>

namespace storage {

StorageError::StorageError(ErrorCode code, const std::string& message)
    : code(code)
    , severity(error_utils::getErrorSeverity(code))
    , category(error_utils::getErrorCategory(code))
    , message(message.empty() ? std::string(error_utils::errorCodeToString(code)) : message)
    , timestamp(std::chrono::system_clock::now()) {
    refreshWhat();
}

StorageError::StorageError(ErrorCode code, const std::string& message, const std::string& details)
    : StorageError(code, message) {
    this->details = details;
    refreshWhat();
}

StorageError& StorageError::withDetails(const std::string& details_param) {
    this->details = details_param;
    refreshWhat();
    return *this;
}

StorageError& StorageError::withSuggestedAction(const std::string& action) {
    this->suggested_action = action;
    return *this;
}

StorageError& StorageError::withLocation(const std::string& file, size_t line, const std::string& function) {
    this->file_path = file;
    this->line_number = line;
    this->function_name = function;
    return *this;
}

StorageError& StorageError::withUnderlyingError(ErrorCode underlying) {
    this->underlying_error = underlying;
    return *this;
}

StorageError& StorageError::withContext(const std::string& key, const std::string& value) {
    this->context[key] = value;
    return *this;
}

StorageError& StorageError::withFilePath(const std::string& path) {
    this->file_path = path;
    return *this;
}

const char* StorageError::what() const noexcept {
    return what_.c_str();
}

void StorageError::refreshWhat() {
    what_ = toString();
    if (!details.empty()) {
        what_ += " (" + details + ")";
    }
}

bool StorageError::isRecoverable() const {
    return severity != ErrorSeverity::FATAL && severity != ErrorSeverity::CRITICAL;
}

std::optional<std::string> StorageError::contextValue(const std::string& key) const {
    auto it = context.find(key);
    if (it == context.end()) return std::nullopt;
    return it->second;
}

std::string StorageError::toString() const {
    std::ostringstream oss;
    oss << "[" << error_utils::severityToString(severity) << "] "
        << error_utils::errorCodeToString(code) << " (" << static_cast<int>(code) << "): "
        << message;
    return oss.str();
}

std::string StorageError::toDetailedString() const {
    std::ostringstream oss;

    oss << "Error Details:\n";
    oss << "  Code: " << error_utils::errorCodeToString(code)
        << " (" << static_cast<int>(code) << ")\n";
    oss << "  Severity: " << error_utils::severityToString(severity) << "\n";
    oss << "  Category: " << error_utils::categoryToString(category) << "\n";
    oss << "  Message: " << message << "\n";

    if (!details.empty()) {
        oss << "  Details: " << details << "\n";
    }
    if (!suggested_action.empty()) {
        oss << "  Suggested Action: " << suggested_action << "\n";
    }
    if (file_path && line_number && function_name) {
        oss << "  Location: " << *function_name << " at " << *file_path << ":" << *line_number << "\n";
    } else if (file_path) {
        oss << "  File Path: " << *file_path << "\n";
    }
    if (underlying_error) {
        oss << "  Underlying Error: " << error_utils::errorCodeToString(*underlying_error)
            << " (" << static_cast<int>(*underlying_error) << ")\n";
    }
    if (!context.empty()) {
        oss << "  Context:\n";
        for (const auto& [key, value] : context) {
            oss << "    " << key << ": " << value << "\n";
        }
    }

    auto time_t_val = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm_buf{};
    localtime_r(&time_t_val, &tm_buf);
    oss << "  Timestamp: " << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << "\n";

    return oss.str();
}

std::string StorageError::toJson() const {
    nlohmann::json j;
    j["code"] = static_cast<int>(code);
    j["code_name"] = std::string(error_utils::errorCodeToString(code));
    j["severity"] = std::string(error_utils::severityToString(severity));
    j["category"] = std::string(error_utils::categoryToString(category));
    j["message"] = message;
    if (!details.empty()) j["details"] = details;
    if (!suggested_action.empty()) j["suggested_action"] = suggested_action;
    if (file_path && line_number && function_name) {
        j["location"] = {{"file", *file_path}, {"line", *line_number}, {"function", *function_name}};
    } else if (file_path) {
        j["file_path"] = *file_path;
    }
    if (underlying_error) {
        j["underlying_error_code"] = static_cast<int>(*underlying_error);
        j["underlying_error_name"] = std::string(error_utils::errorCodeToString(*underlying_error));
    }
    if (!context.empty()) {
        j["context"] = context;
    }
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch());
    j["timestamp_ms"] = ms.count();
    // Keys and blobs in messages may hold raw bytes.
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// Static factory methods
StorageError StorageError::invalidKey(const std::string& key_text, const std::string& reason) {
    return StorageError(ErrorCode::INVALID_KEY, "Invalid key")
        .withDetails(reason)
        .withContext("key", key_text);
}

StorageError StorageError::invalidCursor(const std::string& query_text, const std::string& reason) {
    return StorageError(ErrorCode::INVALID_CURSOR, "Cursor cannot resume this query")
        .withDetails(reason)
        .withContext("query", query_text)
        .withSuggestedAction("Restart the query without a cursor");
}

// Typed errors

UnsupportedTypeError::UnsupportedTypeError(const std::string& property, const std::string& type_description)
    : StorageError(ErrorCode::UNSUPPORTED_TYPE, "Property value type is not supported") {
    withDetails("Property '" + property + "': " + type_description);
    withContext("property", property);
}

UnsupportedQueryError::UnsupportedQueryError(const std::string& query_text, const std::string& reason)
    : StorageError(ErrorCode::UNSUPPORTED_QUERY, "Query shape is not supported") {
    withDetails(reason);
    withContext("query", query_text);
}

IndexMissingError::IndexMissingError(const std::string& query_text, const std::string& required)
    : StorageError(ErrorCode::INDEX_MISSING, "No matching index for query"), required_index(required) {
    withDetails("Required index: " + required);
    withContext("query", query_text);
    withSuggestedAction("Declare the index and restart, or disable require_indexes");
}

CrossGroupError::CrossGroupError(const std::string& key_text, const std::string& transaction_group)
    : StorageError(ErrorCode::CROSS_GROUP, "Operation crosses entity groups inside a transaction") {
    withDetails("Transaction is bound to entity group " + transaction_group);
    withContext("key", key_text);
}

PartialCommitError::PartialCommitError(size_t failed_index_param, size_t total_operations_param,
                                       const std::string& failed_key, const std::string& cause)
    : StorageError(ErrorCode::PARTIAL_COMMIT, "Transaction commit applied only partially"),
      failed_index(failed_index_param), total_operations(total_operations_param) {
    withDetails("Operation " + std::to_string(failed_index) + " of " + std::to_string(total_operations) +
                " failed: " + cause + ". Operations before it remain applied.");
    withContext("key", failed_key);
    withContext("failed_index", std::to_string(failed_index));
    withSuggestedAction("Reconcile the applied operations manually");
}

BackendUnavailableError::BackendUnavailableError(const std::string& operation, const std::string& reason,
                                                 ErrorCode underlying)
    : StorageError(ErrorCode::BACKEND_UNAVAILABLE, "Document backend unavailable") {
    withDetails(operation + ": " + reason);
    withContext("operation", operation);
    if (underlying != ErrorCode::BACKEND_UNAVAILABLE) {
        withUnderlyingError(underlying);
    }
}

} // namespace storage
