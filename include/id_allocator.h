// @include/id_allocator.h
#pragma once

#include "backend/document_backend.h"
#include "storage_error/error_context.h"

#include <cstdint>
#include <memory>
#include <string>
#include <utility>

namespace engine {
namespace datastore {

/**
 * @brief Mints numeric entity ids per kind from a durable counter document.
 *
 * Counter documents live in COUNTER_COLLECTION, one per kind, keyed by the
 * kind name and holding the last allocated value in LAST_FIELD. Each call is
 * a single atomic backend increment, so concurrent allocators (threads or
 * processes) never receive the same value and ids are never reused.
 */
class IdAllocator {
public:
    static constexpr const char* COUNTER_COLLECTION = "__counters__";
    static constexpr const char* LAST_FIELD = "last";

    IdAllocator(std::shared_ptr<backend::DocumentBackend> backend,
                std::shared_ptr<storage::ErrorContext> error_context = nullptr);

    int64_t allocate(const std::string& kind);

    // Reserves `count` consecutive ids; returns the inclusive [first, last] range.
    std::pair<int64_t, int64_t> allocateRange(const std::string& kind, int64_t count);

    // Last value handed out for `kind`, 0 when none.
    int64_t peekLastAllocated(const std::string& kind) const;

private:
    std::shared_ptr<backend::DocumentBackend> backend_;
    std::shared_ptr<storage::ErrorContext> error_context_;
};

} // namespace datastore
} // namespace engine
