// include/storage_error/error_codes.h
#pragma once

namespace storage {

/**
 * @brief Error codes for the datastore mapping layer and its document backend
 */
enum class ErrorCode : int {
    // Success
    OK = 0,

    // Codec Errors (1000-1999)
    UNSUPPORTED_TYPE = 1001,
    INVALID_KEY = 1002,
    INVALID_DATA_FORMAT = 1003,

    // Query Errors (2000-2999)
    UNSUPPORTED_QUERY = 2001,
    INVALID_CURSOR = 2002,
    INVALID_QUERY = 2003,

    // Index Errors (3000-3999)
    INDEX_MISSING = 3001,
    INDEX_NOT_FOUND = 3002,
    INDEX_STATE_TRANSITION = 3003,
    INDEX_DECLARATION_ERROR = 3004,
    INDEX_ALREADY_EXISTS = 3005,

    // Transaction Errors (4000-4999)
    CROSS_GROUP = 4001,
    PARTIAL_COMMIT = 4002,
    TRANSACTION_NOT_ACTIVE = 4003,
    NON_ATOMIC_COMMIT = 4004,

    // Backend Errors (5000-5999)
    BACKEND_UNAVAILABLE = 5001,
    BACKEND_TIMEOUT = 5002,
    BACKEND_OPERATION_FAILED = 5003,
    ID_ALLOCATION_FAILED = 5004,

    // Configuration Errors (8000-8999)
    INVALID_CONFIGURATION = 8001,
    MISSING_REQUIRED_OPTION = 8002,
    OPTION_OUT_OF_RANGE = 8003,

    // Generic Errors (10000+)
    INTERNAL_ERROR = 10001
};

/**
 * @brief Error severity levels
 */
enum class ErrorSeverity {
    INFO,       // Informational, operation can continue
    WARNING,    // Operation succeeded but with weakened guarantees
    ERROR,      // Operation failed, datastore is still usable
    CRITICAL,   // Backend state may be compromised
    FATAL       // Datastore must be reopened
};

/**
 * @brief Error categories for grouping related errors
 */
enum class ErrorCategory {
    CODEC,
    QUERY,
    INDEX,
    TRANSACTION,
    BACKEND,
    CONFIGURATION,
    GENERIC
};

} // namespace storage
