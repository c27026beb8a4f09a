// @src/test/memory_backend.h
#pragma once

#include "../../include/backend/document_backend.h"

#include <map>
#include <mutex>
#include <string>
#include <vector>

/**
 * In-process DocumentBackend for tests. Evaluates the MongoDB filter subset
 * the translator emits (type bracketing, element-wise array matching,
 * anchored literal $regex, $type aliases) and sorts missing values as null.
 * One instance shared by several Datastores stands in for a restarted
 * process talking to the same server.
 */
class MemoryDocumentBackend : public engine::backend::DocumentBackend {
public:
    void upsert(const std::string& collection, const nlohmann::json& document) override;
    std::optional<nlohmann::json> findById(const std::string& collection, const std::string& id) override;
    bool removeById(const std::string& collection, const std::string& id) override;

    std::vector<nlohmann::json> find(const engine::backend::BackendQuery& query) override;
    size_t count(const engine::backend::BackendQuery& query) override;

    int64_t incrementCounter(const std::string& collection, const std::string& id,
                             const std::string& field, int64_t delta) override;

    std::vector<engine::backend::BackendIndexSpec> listIndexes(const std::string& collection) override;
    void createIndex(const std::string& collection, const engine::backend::BackendIndexSpec& spec) override;
    bool dropIndex(const std::string& collection, const std::string& name) override;

    std::string describe() const override { return "memory"; }

    size_t documentCount(const std::string& collection) const;

    // Throws StorageError(INVALID_QUERY) for operators outside the supported subset.
    static bool matches(const nlohmann::json& document, const nlohmann::json& filter);

private:
    std::vector<nlohmann::json> select(const engine::backend::BackendQuery& query) const;   // lock held

    mutable std::mutex mutex_;
    std::map<std::string, std::map<std::string, nlohmann::json>> collections_;
    std::map<std::string, std::vector<engine::backend::BackendIndexSpec>> indexes_;
};
