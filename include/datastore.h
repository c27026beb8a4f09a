// @include/datastore.h
#pragma once

#include "types.h"
#include "kindred.h"
#include "index_manager.h"
#include "id_allocator.h"
#include "query_translator.h"
#include "backend/document_backend.h"
#include "storage_error/error_context.h"
#include "storage_error/error_handler.h"

#include <nlohmann/json.hpp>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

/**
 * @brief Datastore configuration. Every field has a usable default except
 * app_id, which names the backend database and so is limited to letters,
 * digits, '-' and '_'.
 *
 * JSON form (all keys optional but "app_id"):
 *   {"app_id": "...", "require_indexes": false, "max_query_offset": 1000,
 *    "max_query_components": 100, "index_declaration_path": "...",
 *    "backend": {"host": "...", "port": 27017, "operation_timeout_ms": 5000}}
 */
struct DatastoreConfig {
    static constexpr size_t MAX_APP_ID_LENGTH = 63;

    std::string app_id;
    engine::backend::BackendConfig backend;
    bool require_indexes = false;
    size_t max_query_offset = 1000;
    size_t max_query_components = 100;
    std::optional<std::string> index_declaration_path;

    static DatastoreConfig fromJson(const nlohmann::json& j);
    static DatastoreConfig fromJsonFile(const std::string& path);

    // Throws StorageError(INVALID_CONFIGURATION) naming the offending option.
    void validate() const;

    engine::datastore::QueryLimits queryLimits() const {
        engine::datastore::QueryLimits limits;
        limits.max_offset = max_query_offset;
        limits.max_components = max_query_components;
        return limits;
    }
};

/**
 * @brief Entry point: entity reads and writes, queries, id allocation and
 * emulated transactions over one document backend.
 *
 * Holds no cache; every call is a direct backend round trip and may be
 * issued concurrently from many threads.
 */
class Datastore {
private:
    DatastoreConfig config_;
    std::shared_ptr<storage::ErrorContext> error_context_;
    std::shared_ptr<engine::backend::DocumentBackend> backend_;
    std::shared_ptr<engine::datastore::IdAllocator> id_allocator_;
    std::unique_ptr<IndexManager> index_manager_;
    engine::datastore::QueryTranslator translator_;

    std::atomic<TxnId> next_txn_id_{1};

    std::map<std::string, size_t> query_history_;
    mutable std::mutex history_mutex_;

    Key completeKey(const Key& key);
    // Writes an entity whose key is already complete.
    void writeEntity(const Entity& entity);
    bool deleteEntity(const Key& key);
    std::optional<Entity> readEntity(const Key& key);
    void recordQuery(const Query& query);

    friend class Transaction;

public:
    // Connects a MongoDocumentBackend to config.backend when `backend` is null.
    explicit Datastore(DatastoreConfig config,
                       std::shared_ptr<engine::backend::DocumentBackend> backend = nullptr,
                       std::shared_ptr<storage::ErrorHandler> error_handler = nullptr);
    ~Datastore();

    Datastore(const Datastore&) = delete;
    Datastore& operator=(const Datastore&) = delete;

    // --- Entities ---
    // Returns the stored key; an incomplete key is completed with a newly allocated id.
    Key put(const Entity& entity);
    std::vector<Key> putMulti(const std::vector<Entity>& entities);
    std::optional<Entity> get(const Key& key);
    std::vector<std::optional<Entity>> getMulti(const std::vector<Key>& keys);
    bool remove(const Key& key);
    size_t removeMulti(const std::vector<Key>& keys);

    // Reserves `count` ids of the key's kind; returns complete keys under the key's parent.
    std::vector<Key> allocateIds(const Key& incomplete_key, size_t count);

    // --- Queries ---
    PaginatedQueryResult<Entity> runQuery(const Query& query);
    size_t count(const Query& query);

    // Executions per query shape since startup.
    std::map<std::string, size_t> queryHistory() const;

    // --- Transactions ---
    std::unique_ptr<Transaction> beginTransaction(const std::optional<Key>& group_root = std::nullopt);

    // --- Components ---
    IndexManager& indexManager() { return *index_manager_; }
    engine::datastore::IdAllocator& idAllocator() { return *id_allocator_; }
    storage::ErrorContext& errorContext() { return *error_context_; }
    engine::backend::DocumentBackend& backend() { return *backend_; }
    const DatastoreConfig& config() const { return config_; }
};

/**
 * Runs `fn(Transaction&)` in a new transaction and commits it. If `fn`
 * throws, the transaction is rolled back and the exception rethrown.
 */
template<typename Fn>
auto runInTransaction(Datastore& store, Fn&& fn, const std::optional<Key>& group_root = std::nullopt)
    -> decltype(fn(std::declval<Transaction&>())) {
    auto txn = store.beginTransaction(group_root);
    try {
        if constexpr (std::is_void_v<decltype(fn(*txn))>) {
            fn(*txn);
            txn->commit();
        } else {
            auto result = fn(*txn);
            txn->commit();
            return result;
        }
    } catch (...) {
        if (txn->canModify()) {
            txn->rollback();
        }
        throw;
    }
}
