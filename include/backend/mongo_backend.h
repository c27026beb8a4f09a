// @include/backend/mongo_backend.h
#pragma once

#include "document_backend.h"

#include <mongocxx/database.hpp>
#include <mongocxx/pool.hpp>

#include <memory>
#include <string>
#include <vector>

namespace engine {
namespace backend {

/**
 * @brief DocumentBackend over a MongoDB server at config.endpoint.
 *
 * One database per application, one collection per kind. Connections come
 * from a thread-safe pool; operation_timeout bounds connecting, server
 * selection and every socket round trip. The constructor pings the server
 * so an unreachable endpoint fails at open time.
 *
 * Unreachable server or timeout -> storage::BackendUnavailableError.
 * Server rejected the request -> StorageError(BACKEND_OPERATION_FAILED).
 */
class MongoDocumentBackend : public DocumentBackend {
public:
    explicit MongoDocumentBackend(BackendConfig config);
    ~MongoDocumentBackend() override;

    MongoDocumentBackend(const MongoDocumentBackend&) = delete;
    MongoDocumentBackend& operator=(const MongoDocumentBackend&) = delete;

    void upsert(const std::string& collection, const nlohmann::json& document) override;
    std::optional<nlohmann::json> findById(const std::string& collection, const std::string& id) override;
    bool removeById(const std::string& collection, const std::string& id) override;

    std::vector<nlohmann::json> find(const BackendQuery& query) override;
    size_t count(const BackendQuery& query) override;

    int64_t incrementCounter(const std::string& collection, const std::string& id,
                             const std::string& field, int64_t delta) override;

    std::vector<BackendIndexSpec> listIndexes(const std::string& collection) override;
    void createIndex(const std::string& collection, const BackendIndexSpec& spec) override;
    bool dropIndex(const std::string& collection, const std::string& name) override;

    std::string describe() const override;

    void ping();

    // Connection string for an endpoint, carrying the configured timeouts.
    static std::string connectionUri(const BackendConfig& config);

private:
    // Runs fn against a pooled connection, translating driver exceptions.
    template<typename Fn>
    auto withDatabase(const char* operation, const std::string& collection, Fn&& fn)
        -> decltype(fn(std::declval<mongocxx::database&>()));

    BackendConfig config_;
    std::unique_ptr<mongocxx::pool> pool_;
};

} // namespace backend
} // namespace engine
