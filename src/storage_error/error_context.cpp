//src/storage_error/error_context.cpp

#include "../../include/storage_error/error_context.h"
#include "../../include/storage_error/error_handler.h"
#include "../../include/debug_utils.h"
#include <algorithm> // For std::min

namespace storage {

ErrorContext::ErrorContext(std::shared_ptr<ErrorHandler> handler)
    : handler_(std::move(handler)) {
}

void ErrorContext::setErrorHandler(std::shared_ptr<ErrorHandler> handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handler_ = std::move(handler);
}

void ErrorContext::reportError(const StorageError& error) {
    switch (error.severity) {
        case ErrorSeverity::INFO:
            LOG_INFO(error.toString(), error.details.empty() ? "" : " - ", error.details);
            break;
        case ErrorSeverity::WARNING:
            LOG_WARN(error.toString(), error.details.empty() ? "" : " - ", error.details);
            break;
        case ErrorSeverity::ERROR:
            LOG_ERROR(error.toString(), error.details.empty() ? "" : " - ", error.details);
            break;
        case ErrorSeverity::CRITICAL:
        case ErrorSeverity::FATAL:
            LOG_FATAL(error.toDetailedString());
            break;
    }

    std::shared_ptr<ErrorHandler> handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        error_counts_[error.code]++;
        recent_errors_.push_back(error);
        if (recent_errors_.size() > MAX_RECENT_ERRORS) {
            recent_errors_.erase(recent_errors_.begin());
        }
        handler = handler_;
    }

    // Handler runs unlocked so it may query this context.
    if (handler) {
        switch (error.severity) {
            case ErrorSeverity::CRITICAL:
            case ErrorSeverity::FATAL:
                handler->handleCriticalError(error);
                break;
            case ErrorSeverity::WARNING:
                handler->handleWarning(error);
                break;
            default:
                handler->handleError(error);
                break;
        }
    }
}

void ErrorContext::reportError(ErrorCode code, const std::string& message) {
    reportError(StorageError(code, message));
}

size_t ErrorContext::getErrorCount(ErrorCode code) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = error_counts_.find(code);
    return it != error_counts_.end() ? it->second : 0;
}

size_t ErrorContext::getTotalErrorCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t total = 0;
    for (const auto& [code, count] : error_counts_) {
        (void)code;
        total += count;
    }
    return total;
}

std::vector<StorageError> ErrorContext::getRecentErrors(size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t actual_count = std::min(count, recent_errors_.size());
    if (actual_count == 0) {
        return {};
    }
    return std::vector<StorageError>(recent_errors_.end() - actual_count, recent_errors_.end());
}

bool ErrorContext::hasRepeatedErrors(ErrorCode code, size_t threshold) const {
    return getErrorCount(code) >= threshold;
}

void ErrorContext::clearErrors() {
    std::lock_guard<std::mutex> lock(mutex_);
    recent_errors_.clear();
    error_counts_.clear();
}

} // namespace storage
