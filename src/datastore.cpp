// @src/datastore.cpp
#include "../include/datastore.h"
#include "../include/entity_codec.h"
#include "../include/key_codec.h"
#include "../include/debug_utils.h"
#include "../include/backend/mongo_backend.h"
#include "../include/storage_error/storage_error.h"
#include "../include/storage_error/error_utils.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>

using json = nlohmann::json;
using engine::datastore::EntityCodec;
using engine::datastore::KeyCodec;

namespace {
    // Adds the identifying context entry unless a deeper layer already set it.
    // Failures not caused by the caller's input are logged here once.
    void annotate(storage::StorageError& e, const std::string& key, const std::string& value) {
        if (!e.contextValue(key)) {
            e.withContext(key, value);
        }
        if (!storage::error_utils::isCallerError(e.code)) {
            LOG_ERROR("[Datastore] ", key, " ", value, ": ", e.what());
        }
    }

    storage::StorageError configError(const std::string& option, const std::string& reason) {
        storage::StorageError err(storage::ErrorCode::INVALID_CONFIGURATION, "Invalid datastore configuration");
        err.withDetails(option + ": " + reason);
        err.withContext("option", option);
        return err;
    }
} // anonymous namespace

// --- DatastoreConfig ---

DatastoreConfig DatastoreConfig::fromJson(const json& j) {
    if (!j.is_object()) {
        throw configError("<root>", "configuration must be a JSON object");
    }
    DatastoreConfig config;
    try {
        config.app_id = j.value("app_id", std::string());
        config.require_indexes = j.value("require_indexes", config.require_indexes);
        config.max_query_offset = j.value("max_query_offset", config.max_query_offset);
        config.max_query_components = j.value("max_query_components", config.max_query_components);
        if (j.contains("index_declaration_path") && !j["index_declaration_path"].is_null()) {
            config.index_declaration_path = j["index_declaration_path"].get<std::string>();
        }
        if (j.contains("backend")) {
            const json& b = j.at("backend");
            config.backend.endpoint.host = b.value("host", config.backend.endpoint.host);
            config.backend.endpoint.port = b.value("port", config.backend.endpoint.port);
            int64_t timeout_ms = b.value("operation_timeout_ms",
                                         static_cast<int64_t>(config.backend.operation_timeout.count()));
            if (timeout_ms <= 0) {
                throw configError("backend.operation_timeout_ms", "must be positive");
            }
            config.backend.operation_timeout = std::chrono::milliseconds(timeout_ms);
        }
    } catch (const json::exception& e) {
        throw configError("<json>", e.what());
    }
    config.validate();
    return config;
}

DatastoreConfig DatastoreConfig::fromJsonFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw storage::StorageError(storage::ErrorCode::INVALID_CONFIGURATION, "Cannot open configuration file")
            .withFilePath(path);
    }
    json j = json::parse(file, nullptr, false);
    if (j.is_discarded()) {
        throw storage::StorageError(storage::ErrorCode::INVALID_CONFIGURATION, "Configuration file is not valid JSON")
            .withFilePath(path);
    }
    return fromJson(j);
}

void DatastoreConfig::validate() const {
    if (app_id.empty()) {
        throw configError("app_id", "required");
    }
    bool safe = std::all_of(app_id.begin(), app_id.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '-' || c == '_';
    });
    if (!safe) {
        throw configError("app_id", "'" + app_id + "' may only contain letters, digits, '-' and '_'");
    }
    if (app_id.size() > MAX_APP_ID_LENGTH) {
        throw configError("app_id", "longer than " + std::to_string(MAX_APP_ID_LENGTH) + " characters");
    }
    if (backend.endpoint.host.empty()) {
        throw configError("backend.host", "must not be empty");
    }
    if (backend.endpoint.port == 0) {
        throw configError("backend.port", "must be between 1 and 65535");
    }
    if (backend.operation_timeout.count() <= 0) {
        throw configError("backend.operation_timeout_ms", "must be positive");
    }
    if (max_query_components == 0) {
        throw configError("max_query_components", "must be positive");
    }
    if (index_declaration_path && index_declaration_path->empty()) {
        throw configError("index_declaration_path", "must not be empty when set");
    }
}

// --- Datastore ---

Datastore::Datastore(DatastoreConfig config,
                     std::shared_ptr<engine::backend::DocumentBackend> backend,
                     std::shared_ptr<storage::ErrorHandler> error_handler)
    : config_(std::move(config)),
      error_context_(std::make_shared<storage::ErrorContext>(std::move(error_handler))),
      backend_(std::move(backend)),
      translator_(config_.queryLimits(), [this](const IndexDescriptor& descriptor) {
          return index_manager_ && index_manager_->hasIndex(descriptor);
      }) {
    config_.validate();

    if (!backend_) {
        engine::backend::BackendConfig backend_config = config_.backend;
        backend_config.database = config_.app_id;
        backend_ = std::make_shared<engine::backend::MongoDocumentBackend>(backend_config);
    }

    id_allocator_ = std::make_shared<engine::datastore::IdAllocator>(backend_, error_context_);
    index_manager_ = std::make_unique<IndexManager>(backend_, id_allocator_, config_.require_indexes);

    if (config_.index_declaration_path) {
        index_manager_->loadDeclarations(*config_.index_declaration_path);
    }
    index_manager_->reconcile();

    LOG_INFO("[Datastore] App '", config_.app_id, "' on ", backend_->describe(),
             config_.require_indexes ? " (strict indexes)" : "");
}

Datastore::~Datastore() {
    LOG_TRACE("[Datastore] Closing app '", config_.app_id, "'");
}

Key Datastore::completeKey(const Key& key) {
    if (key.isComplete()) return key;
    return key.completedWith(id_allocator_->allocate(key.kind()));
}

void Datastore::writeEntity(const Entity& entity) {
    json document = EntityCodec::entityToDocument(entity);
    backend_->upsert(EntityCodec::collectionForKind(entity.kind()), document);
    LOG_TRACE("[Datastore] put ", format_key_for_print(document[EntityCodec::ID_FIELD].get<std::string>()));
}

bool Datastore::deleteEntity(const Key& key) {
    return backend_->removeById(EntityCodec::collectionForKind(key.kind()), KeyCodec::encode(key));
}

std::optional<Entity> Datastore::readEntity(const Key& key) {
    try {
        KeyCodec::validate(key, true);
        auto document = backend_->findById(EntityCodec::collectionForKind(key.kind()), KeyCodec::encode(key));
        if (!document) return std::nullopt;
        return EntityCodec::documentToEntity(*document, key.kind());
    } catch (storage::StorageError& e) {
        annotate(e, "key", key.toString());
        throw;
    }
}

// --- Entities ---

Key Datastore::put(const Entity& entity) {
    try {
        KeyCodec::validate(entity.key, false);
        Entity stored = entity;
        stored.key = completeKey(entity.key);
        writeEntity(stored);
        return stored.key;
    } catch (storage::StorageError& e) {
        annotate(e, "key", entity.key.toString());
        throw;
    }
}

std::vector<Key> Datastore::putMulti(const std::vector<Entity>& entities) {
    std::vector<Key> keys;
    keys.reserve(entities.size());
    for (const auto& entity : entities) {
        keys.push_back(put(entity));
    }
    return keys;
}

std::optional<Entity> Datastore::get(const Key& key) {
    return readEntity(key);
}

std::vector<std::optional<Entity>> Datastore::getMulti(const std::vector<Key>& keys) {
    std::vector<std::optional<Entity>> results;
    results.reserve(keys.size());
    for (const auto& key : keys) {
        results.push_back(readEntity(key));
    }
    return results;
}

bool Datastore::remove(const Key& key) {
    try {
        KeyCodec::validate(key, true);
        return deleteEntity(key);
    } catch (storage::StorageError& e) {
        annotate(e, "key", key.toString());
        throw;
    }
}

size_t Datastore::removeMulti(const std::vector<Key>& keys) {
    size_t removed = 0;
    for (const auto& key : keys) {
        if (remove(key)) ++removed;
    }
    return removed;
}

std::vector<Key> Datastore::allocateIds(const Key& incomplete_key, size_t count) {
    try {
        KeyCodec::validate(incomplete_key, false);
        if (incomplete_key.isComplete()) {
            throw storage::StorageError::invalidKey(incomplete_key.toString(), "allocateIds needs an incomplete key");
        }
        std::vector<Key> keys;
        if (count == 0) return keys;
        auto range = id_allocator_->allocateRange(incomplete_key.kind(), static_cast<int64_t>(count));
        keys.reserve(count);
        for (int64_t id = range.first; id <= range.second; ++id) {
            keys.push_back(incomplete_key.completedWith(id));
        }
        return keys;
    } catch (storage::StorageError& e) {
        annotate(e, "key", incomplete_key.toString());
        throw;
    }
}

// --- Queries ---

void Datastore::recordQuery(const Query& query) {
    std::lock_guard<std::mutex> lock(history_mutex_);
    query_history_[query.shape()]++;
}

std::map<std::string, size_t> Datastore::queryHistory() const {
    std::lock_guard<std::mutex> lock(history_mutex_);
    return query_history_;
}

PaginatedQueryResult<Entity> Datastore::runQuery(const Query& query) {
    const std::string text = query.toString();
    try {
        auto translated = translator_.translate(query);
        if (auto required = engine::datastore::QueryTranslator::requiredIndex(query)) {
            index_manager_->requireIndex(*required, text);
        }
        recordQuery(query);

        engine::backend::BackendQuery fetch = translated.backend_query;
        if (query.limit) {
            // One extra row answers hasNextPage.
            fetch.limit = *query.limit == std::numeric_limits<size_t>::max() ? *query.limit : *query.limit + 1;
        }
        std::vector<json> documents = backend_->find(fetch);

        PaginatedQueryResult<Entity> result;
        if (query.limit && documents.size() > *query.limit) {
            result.hasNextPage = true;
            documents.resize(*query.limit);
        }
        result.docs.reserve(documents.size());
        for (const auto& document : documents) {
            result.docs.push_back(EntityCodec::documentToEntity(document, query.kind));
        }
        if (!documents.empty()) {
            result.endCursor = translator_.makeCursor(translated, documents.back());
        }
        LOG_DEBUG(1, "[Datastore] ", text, " returned ", result.docs.size(), " entities",
                  result.hasNextPage ? " (more)" : "");
        return result;
    } catch (storage::StorageError& e) {
        annotate(e, "query", text);
        throw;
    }
}

size_t Datastore::count(const Query& query) {
    const std::string text = query.toString();
    try {
        auto translated = translator_.translate(query);
        if (auto required = engine::datastore::QueryTranslator::requiredIndex(query)) {
            index_manager_->requireIndex(*required, text);
        }
        recordQuery(query);
        return backend_->count(translated.backend_query);
    } catch (storage::StorageError& e) {
        annotate(e, "query", text);
        throw;
    }
}

// --- Transactions ---

std::unique_ptr<Transaction> Datastore::beginTransaction(const std::optional<Key>& group_root) {
    return std::make_unique<Transaction>(next_txn_id_.fetch_add(1), *this, group_root);
}
