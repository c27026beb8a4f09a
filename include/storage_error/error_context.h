//include/storage_error/error_context.h
#pragma once

#include "storage_error.h" // Needs StorageError
#include <memory>          // For std::shared_ptr
#include <vector>
#include <unordered_map>
#include <mutex>

namespace storage {

class ErrorHandler;

/**
 * @brief Event sink for warnings and failures the datastore reports on its own
 * (non-atomic commits, id allocation failures). Each report is written to the
 * log at a level matching its severity and forwarded to the installed handler.
 */
class ErrorContext {
private:
    std::shared_ptr<ErrorHandler> handler_;
    std::vector<StorageError> recent_errors_;
    std::unordered_map<ErrorCode, size_t> error_counts_;
    mutable std::mutex mutex_;

    static constexpr size_t MAX_RECENT_ERRORS = 100;

public:
    ErrorContext(std::shared_ptr<ErrorHandler> handler = nullptr);

    void setErrorHandler(std::shared_ptr<ErrorHandler> handler);
    void reportError(const StorageError& error);
    void reportError(ErrorCode code, const std::string& message);

    size_t getErrorCount(ErrorCode code) const;
    size_t getTotalErrorCount() const;
    std::vector<StorageError> getRecentErrors(size_t count = 10) const;

    bool hasRepeatedErrors(ErrorCode code, size_t threshold = 5) const;

    void clearErrors();
};

} // namespace storage
