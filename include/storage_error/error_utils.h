//include/storage_error/error_utils.h
#pragma once

#include "error_codes.h" // Needs ErrorCode, ErrorSeverity, ErrorCategory
#include "storage_error.h" // Needed for STORAGE_ERROR macros
#include "result.h"        // Needed for RETURN_IF_ERROR macros

#include <string>
#include <string_view>

namespace storage {
namespace error_utils {
    
    // Convert error code to string
    std::string_view errorCodeToString(ErrorCode code);
    std::string_view severityToString(ErrorSeverity severity);
    std::string_view categoryToString(ErrorCategory category);
    
    // Get error metadata
    ErrorSeverity getErrorSeverity(ErrorCode code);
    ErrorCategory getErrorCategory(ErrorCode code);
    
    // Failures of the document backend itself (lock, timeout, I/O, log damage).
    bool isBackendError(ErrorCode code);
    // Errors raised for caller input (keys, values, query shapes, config);
    // retrying the same call cannot succeed.
    bool isCallerError(ErrorCode code);
    // Severity CRITICAL or FATAL: backend state may need manual attention.
    bool isCritical(ErrorCode code);

} // namespace error_utils

// Helper macros for error reporting with location info
// These must be in the header.
#define STORAGE_ERROR(code, message) \
    storage::StorageError(code, message).withLocation(__FILE__, __LINE__, __FUNCTION__)

#define STORAGE_ERROR_WITH_DETAILS(code, message, details) \
    storage::StorageError(code, message, details).withLocation(__FILE__, __LINE__, __FUNCTION__)

// Propagates the error of a Result<T> to the enclosing function, otherwise
// moves its value into the already declared `var`.
#define ASSIGN_OR_RETURN(var, result_expression) \
    do { \
        auto&& _tmp_assign_macro_result = (result_expression); \
        if (!_tmp_assign_macro_result.isOk()) { \
            return std::move(_tmp_assign_macro_result.error()); \
        } \
        var = std::move(_tmp_assign_macro_result.value()); \
    } while(0)

} // namespace storage