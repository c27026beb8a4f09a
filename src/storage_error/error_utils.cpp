//src/storage_error/error_utils.cpp

#include "../../include/storage_error/error_utils.h"

namespace storage {
namespace error_utils {

std::string_view errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";

        // Codec Errors
        case ErrorCode::UNSUPPORTED_TYPE: return "UNSUPPORTED_TYPE";
        case ErrorCode::INVALID_KEY: return "INVALID_KEY";
        case ErrorCode::INVALID_DATA_FORMAT: return "INVALID_DATA_FORMAT";

        // Query Errors
        case ErrorCode::UNSUPPORTED_QUERY: return "UNSUPPORTED_QUERY";
        case ErrorCode::INVALID_CURSOR: return "INVALID_CURSOR";
        case ErrorCode::INVALID_QUERY: return "INVALID_QUERY";

        // Index Errors
        case ErrorCode::INDEX_MISSING: return "INDEX_MISSING";
        case ErrorCode::INDEX_NOT_FOUND: return "INDEX_NOT_FOUND";
        case ErrorCode::INDEX_STATE_TRANSITION: return "INDEX_STATE_TRANSITION";
        case ErrorCode::INDEX_DECLARATION_ERROR: return "INDEX_DECLARATION_ERROR";
        case ErrorCode::INDEX_ALREADY_EXISTS: return "INDEX_ALREADY_EXISTS";

        // Transaction Errors
        case ErrorCode::CROSS_GROUP: return "CROSS_GROUP";
        case ErrorCode::PARTIAL_COMMIT: return "PARTIAL_COMMIT";
        case ErrorCode::TRANSACTION_NOT_ACTIVE: return "TRANSACTION_NOT_ACTIVE";
        case ErrorCode::NON_ATOMIC_COMMIT: return "NON_ATOMIC_COMMIT";

        // Backend Errors
        case ErrorCode::BACKEND_UNAVAILABLE: return "BACKEND_UNAVAILABLE";
        case ErrorCode::BACKEND_TIMEOUT: return "BACKEND_TIMEOUT";
        case ErrorCode::BACKEND_OPERATION_FAILED: return "BACKEND_OPERATION_FAILED";
        case ErrorCode::ID_ALLOCATION_FAILED: return "ID_ALLOCATION_FAILED";

        // Configuration Errors
        case ErrorCode::INVALID_CONFIGURATION: return "INVALID_CONFIGURATION";
        case ErrorCode::MISSING_REQUIRED_OPTION: return "MISSING_REQUIRED_OPTION";
        case ErrorCode::OPTION_OUT_OF_RANGE: return "OPTION_OUT_OF_RANGE";

        // Generic Errors
        case ErrorCode::INTERNAL_ERROR: return "INTERNAL_ERROR";
    }
    return "UNRECOGNIZED_ERROR_CODE";
}

std::string_view severityToString(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::INFO: return "INFO";
        case ErrorSeverity::WARNING: return "WARNING";
        case ErrorSeverity::ERROR: return "ERROR";
        case ErrorSeverity::CRITICAL: return "CRITICAL";
        case ErrorSeverity::FATAL: return "FATAL";
    }
    return "UNKNOWN_SEVERITY";
}

std::string_view categoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::CODEC: return "CODEC";
        case ErrorCategory::QUERY: return "QUERY";
        case ErrorCategory::INDEX: return "INDEX";
        case ErrorCategory::TRANSACTION: return "TRANSACTION";
        case ErrorCategory::BACKEND: return "BACKEND";
        case ErrorCategory::CONFIGURATION: return "CONFIGURATION";
        case ErrorCategory::GENERIC: return "GENERIC";
    }
    return "UNKNOWN_CATEGORY";
}

ErrorSeverity getErrorSeverity(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:
            return ErrorSeverity::INFO;

        case ErrorCode::PARTIAL_COMMIT:
        case ErrorCode::INTERNAL_ERROR:
            return ErrorSeverity::CRITICAL;

        case ErrorCode::NON_ATOMIC_COMMIT:
            return ErrorSeverity::WARNING;

        default: // For any other codes not explicitly listed, default to ERROR
            return ErrorSeverity::ERROR;
    }
}

ErrorCategory getErrorCategory(ErrorCode code) {
    int code_value = static_cast<int>(code);

    if (code_value >= 1000 && code_value < 2000) {
        return ErrorCategory::CODEC;
    } else if (code_value >= 2000 && code_value < 3000) {
        return ErrorCategory::QUERY;
    } else if (code_value >= 3000 && code_value < 4000) {
        return ErrorCategory::INDEX;
    } else if (code_value >= 4000 && code_value < 5000) {
        return ErrorCategory::TRANSACTION;
    } else if (code_value >= 5000 && code_value < 6000) {
        return ErrorCategory::BACKEND;
    } else if (code_value >= 8000 && code_value < 9000) {
        return ErrorCategory::CONFIGURATION;
    } else {
        return ErrorCategory::GENERIC;
    }
}

// Predicates
bool isBackendError(ErrorCode code) { return getErrorCategory(code) == ErrorCategory::BACKEND; }
bool isCallerError(ErrorCode code) {
    switch (getErrorCategory(code)) {
        case ErrorCategory::CODEC:
        case ErrorCategory::QUERY:
        case ErrorCategory::CONFIGURATION:
            return true;
        case ErrorCategory::INDEX:
            return code != ErrorCode::INDEX_MISSING;
        default:
            return false;
    }
}
bool isCritical(ErrorCode code) {
    ErrorSeverity severity = getErrorSeverity(code);
    return severity == ErrorSeverity::CRITICAL || severity == ErrorSeverity::FATAL;
}

} // namespace error_utils
} // namespace storage
