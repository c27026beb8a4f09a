// @include/index_manager.h
#pragma once

#include "types.h"
#include "backend/document_backend.h"
#include "id_allocator.h"

#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

enum class CreateIndexResult {
    CREATED,
    ALREADY_EXISTS,
    SKIPPED     // strict index checking is off
};

/**
 * @brief Reconciles declared composite indexes with backend index metadata
 * and answers, before a query runs, whether an index serves it.
 *
 * With strict checking on, declared indexes are created at startup and a
 * query needing an index that is not serving fails with IndexMissingError
 * without reaching the backend. With it off, ensureIndex does nothing and
 * queries run unindexed.
 */
class IndexManager {
private:
    std::shared_ptr<engine::backend::DocumentBackend> backend_;
    std::shared_ptr<engine::datastore::IdAllocator> id_allocator_;
    bool strict_;

    std::vector<IndexDescriptor> declared_;
    std::map<int64_t, CompositeIndex> indexes_;
    mutable std::shared_mutex mutex_;

    std::optional<int64_t> findByShape(const IndexDescriptor& descriptor) const;   // lock held
    int64_t registerIndex(const IndexDescriptor& descriptor, IndexState state);    // unique lock held
    void transition(CompositeIndex& index, IndexState new_state);                 // unique lock held
    // Creates the physical index unless the backend already has it; true when created.
    bool buildPhysicalIndex(const IndexDescriptor& descriptor);
    // Registers a physical index found in the backend but unknown to this process.
    bool adoptPhysicalIndex(const IndexDescriptor& descriptor);
    static engine::backend::BackendIndexSpec toBackendSpec(const IndexDescriptor& descriptor);
    static void validateDescriptor(const IndexDescriptor& descriptor);

public:
    static constexpr const char* INDEX_ID_KIND = "__index__";

    IndexManager(std::shared_ptr<engine::backend::DocumentBackend> backend,
                 std::shared_ptr<engine::datastore::IdAllocator> id_allocator, bool strict);

    bool isStrict() const { return strict_; }

    // --- Declarations ---
    void declareIndex(const IndexDescriptor& descriptor);
    // Loads {"indexes": [...]} from a JSON file; returns the number of descriptors declared.
    size_t loadDeclarations(const std::string& path);
    static std::vector<IndexDescriptor> parseDeclarations(const nlohmann::json& document);
    std::vector<IndexDescriptor> declaredIndexes() const;

    // Ensures every declared index; returns how many were created.
    size_t reconcile();

    CreateIndexResult ensureIndex(const IndexDescriptor& descriptor);

    /**
     * Strict mode only: throws storage::IndexMissingError unless `required` is serving.
     * An index this process has not seen is looked up in the backend's index
     * metadata, so indexes built by an earlier process keep serving.
     */
    void requireIndex(const IndexDescriptor& required, const std::string& query_text);

    // Declared, or serving reads (including indexes only the backend knows about).
    bool hasIndex(const IndexDescriptor& descriptor);

    // --- Administration ---
    // Builds the index, leaving it in `initial_state` (READ_WRITE or WRITE_ONLY).
    // Throws StorageError(INDEX_ALREADY_EXISTS) when an index of the same shape is registered.
    int64_t createIndex(const IndexDescriptor& descriptor, IndexState initial_state = IndexState::READ_WRITE);
    std::vector<CompositeIndex> listIndexes(const std::optional<std::string>& kind = std::nullopt) const;
    std::optional<CompositeIndex> getIndex(int64_t id) const;
    // WRITE_ONLY -> READ_WRITE|DELETED|ERROR, READ_WRITE -> DELETED, ERROR -> DELETED, DELETED -> ERROR.
    // Moving to DELETED drops the physical index.
    void updateIndexState(int64_t id, IndexState new_state);
    static bool isAllowedTransition(IndexState from, IndexState to);
    bool deleteIndex(int64_t id);
};

void to_json(nlohmann::json& j, const IndexDescriptor& descriptor);
void from_json(const nlohmann::json& j, IndexDescriptor& descriptor);
