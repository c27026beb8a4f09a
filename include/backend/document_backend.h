// @include/backend/document_backend.h
#pragma once

#include "../types.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace engine {
namespace backend {

/** Location of the single backend instance. */
struct BackendEndpoint {
    std::string host = "127.0.0.1";
    uint16_t port = 27017;

    std::string toString() const { return host + ":" + std::to_string(port); }
};

struct BackendConfig {
    BackendEndpoint endpoint;
    std::string database;   // one database per application id
    // Bounds connecting, server selection and each socket round trip.
    std::chrono::milliseconds operation_timeout{5000};
};

struct SortField {
    std::string path;   // dotted field path
    IndexSortOrder direction = IndexSortOrder::ASCENDING;
};

/**
 * @brief A query in the backend's own language.
 *
 * filter is a MongoDB query document restricted to: $and, $or and
 * {<dotted path>: {<op>: <operand>, ...}} with ops $eq $ne $lt $lte $gt $gte
 * $in $exists $type (alias name or array of names) and $regex (anchored
 * literal prefix only). Comparison operators follow MongoDB type bracketing
 * and match array fields element-wise. Skip applies after filtering and
 * sorting.
 */
struct BackendQuery {
    std::string collection;
    nlohmann::json filter = nlohmann::json::object();
    std::vector<SortField> sort;
    size_t skip = 0;
    std::optional<size_t> limit;
};

/** Physical index metadata as the backend stores it. */
struct BackendIndexSpec {
    std::string name;
    std::vector<SortField> fields;
};

/**
 * @brief Document store seam. Every call is a direct round trip; single
 * document writes are atomic. Failures to reach the store or timeouts raise
 * storage::BackendUnavailableError; requests the store rejects raise
 * storage::StorageError(BACKEND_OPERATION_FAILED).
 */
class DocumentBackend {
public:
    virtual ~DocumentBackend() = default;

    // Inserts or replaces the document with the same "_id".
    virtual void upsert(const std::string& collection, const nlohmann::json& document) = 0;
    virtual std::optional<nlohmann::json> findById(const std::string& collection, const std::string& id) = 0;
    // Returns false when no document had that id.
    virtual bool removeById(const std::string& collection, const std::string& id) = 0;

    virtual std::vector<nlohmann::json> find(const BackendQuery& query) = 0;
    virtual size_t count(const BackendQuery& query) = 0;

    /**
     * Atomically adds `delta` to integer `field` of document `id`, creating
     * the document at zero first, and returns the new value. The result is
     * durable before this returns.
     */
    virtual int64_t incrementCounter(const std::string& collection, const std::string& id,
                                     const std::string& field, int64_t delta) = 0;

    virtual std::vector<BackendIndexSpec> listIndexes(const std::string& collection) = 0;
    // No-op when an index of that name exists.
    virtual void createIndex(const std::string& collection, const BackendIndexSpec& spec) = 0;
    virtual bool dropIndex(const std::string& collection, const std::string& name) = 0;

    virtual std::string describe() const = 0;
};

} // namespace backend
} // namespace engine
