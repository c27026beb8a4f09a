// @src/id_allocator.cpp
#include "../include/id_allocator.h"
#include "../include/debug_utils.h"
#include "../include/storage_error/storage_error.h"

namespace engine {
namespace datastore {

IdAllocator::IdAllocator(std::shared_ptr<backend::DocumentBackend> backend,
                         std::shared_ptr<storage::ErrorContext> error_context)
    : backend_(std::move(backend)), error_context_(std::move(error_context)) {
    if (!backend_) {
        throw storage::StorageError(storage::ErrorCode::INTERNAL_ERROR, "IdAllocator requires a backend");
    }
}

int64_t IdAllocator::allocate(const std::string& kind) {
    return allocateRange(kind, 1).first;
}

std::pair<int64_t, int64_t> IdAllocator::allocateRange(const std::string& kind, int64_t count) {
    if (count <= 0) {
        throw storage::StorageError(storage::ErrorCode::OPTION_OUT_OF_RANGE, "Id range size must be positive")
            .withContext("kind", kind);
    }
    if (kind.empty()) {
        throw storage::StorageError::invalidKey("<empty kind>", "Cannot allocate ids for an empty kind");
    }

    int64_t last;
    try {
        last = backend_->incrementCounter(COUNTER_COLLECTION, kind, LAST_FIELD, count);
    } catch (storage::StorageError& e) {
        e.withContext("kind", kind);
        storage::StorageError event(storage::ErrorCode::ID_ALLOCATION_FAILED, "Id allocation failed for kind " + kind);
        event.withDetails(e.toString() + (e.details.empty() ? "" : " - " + e.details));
        event.withUnderlyingError(e.code);
        event.withContext("kind", kind);
        if (error_context_) {
            error_context_->reportError(event);
        } else {
            LOG_ERROR("[IdAllocator] ", event.message, ": ", event.details);
        }
        throw;
    }

    LOG_DEBUG(2, "[IdAllocator] kind '", kind, "' allocated [", last - count + 1, ", ", last, "]");
    return {last - count + 1, last};
}

int64_t IdAllocator::peekLastAllocated(const std::string& kind) const {
    auto counter = backend_->findById(COUNTER_COLLECTION, kind);
    if (!counter || !counter->contains(LAST_FIELD)) {
        return 0;
    }
    return (*counter)[LAST_FIELD].get<int64_t>();
}

} // namespace datastore
} // namespace engine
