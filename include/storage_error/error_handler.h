//include/storage_error/error_handler.h
#pragma once

#include "storage_error.h" // Needs StorageError

namespace storage {

/**
 * @brief Receives the events an ErrorContext reports. Install one to route
 * datastore warnings and failures to an application's own logging.
 */
class ErrorHandler {
public:
    virtual ~ErrorHandler() = default;
    virtual void handleError(const StorageError& error) = 0;
    virtual void handleCriticalError(const StorageError& error) = 0;

    // WARNING severity, such as a commit applied without atomicity.
    virtual void handleWarning(const StorageError& error) { handleError(error); }
};

} // namespace storage
