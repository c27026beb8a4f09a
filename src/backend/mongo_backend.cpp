// @src/backend/mongo_backend.cpp
#include "../../include/backend/mongo_backend.h"
#include "../../include/backend/bson_codec.h"
#include "../../include/debug_utils.h"
#include "../../include/storage_error/storage_error.h"

#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <bsoncxx/builder/core.hpp>
#include <bsoncxx/types.hpp>
#include <mongocxx/client.hpp>
#include <mongocxx/cursor.hpp>
#include <mongocxx/exception/exception.hpp>
#include <mongocxx/exception/operation_exception.hpp>
#include <mongocxx/instance.hpp>
#include <mongocxx/options/count.hpp>
#include <mongocxx/options/find.hpp>
#include <mongocxx/options/find_one_and_update.hpp>
#include <mongocxx/options/replace.hpp>
#include <mongocxx/uri.hpp>
#include <mongocxx/write_concern.hpp>

#include <algorithm>
#include <limits>

namespace engine {
namespace backend {

using nlohmann::json;
using bsoncxx::builder::basic::kvp;
using bsoncxx::builder::basic::make_document;

namespace {
    // Server error code for a collection that does not exist yet.
    constexpr int NAMESPACE_NOT_FOUND = 26;
    const char* const ID_INDEX_NAME = "_id_";

    mongocxx::instance& driverInstance() {
        static mongocxx::instance instance{};
        return instance;
    }

    std::int64_t clampToInt64(size_t value) {
        return static_cast<std::int64_t>(std::min<size_t>(value, static_cast<size_t>(std::numeric_limits<std::int64_t>::max())));
    }

    bool looksLikeTimeout(const std::string& message) {
        return message.find("timed out") != std::string::npos || message.find("timeout") != std::string::npos;
    }

    storage::BackendUnavailableError unavailable(const char* operation, const std::string& collection,
                                                 const mongocxx::exception& e) {
        std::string reason = e.what();
        storage::BackendUnavailableError err(operation, reason,
            looksLikeTimeout(reason) ? storage::ErrorCode::BACKEND_TIMEOUT : storage::ErrorCode::BACKEND_UNAVAILABLE);
        if (!collection.empty()) err.withContext("collection", collection);
        return err;
    }

    const std::string& requireId(const json& document) {
        auto it = document.find("_id");
        if (it == document.end() || !it->is_string()) {
            throw storage::StorageError(storage::ErrorCode::INVALID_DATA_FORMAT, "Document has no string _id");
        }
        return it->get_ref<const std::string&>();
    }

    json decodeDocument(bsoncxx::document::view view, const std::string& collection) {
        storage::Result<json> converted = BsonCodec::toJson(view);
        if (!converted) {
            storage::StorageError err = converted.error();
            err.withContext("collection", collection);
            throw err;
        }
        return std::move(converted).value();
    }

    bsoncxx::document::value sortDocument(const std::vector<SortField>& fields) {
        bsoncxx::builder::core builder{false};
        for (const auto& field : fields) {
            builder.key_owned(field.path);
            builder.append(field.direction == IndexSortOrder::ASCENDING ? std::int32_t{1} : std::int32_t{-1});
        }
        return builder.extract_document();
    }

    std::string elementKey(const bsoncxx::document::element& element) {
        auto key = element.key();
        return std::string(key.data(), key.size());
    }
} // anonymous namespace

MongoDocumentBackend::MongoDocumentBackend(BackendConfig config) : config_(std::move(config)) {
    if (config_.database.empty()) {
        throw storage::StorageError(storage::ErrorCode::MISSING_REQUIRED_OPTION, "Backend database name is required")
            .withContext("option", "backend.database");
    }
    driverInstance();
    try {
        pool_ = std::make_unique<mongocxx::pool>(mongocxx::uri{connectionUri(config_)});
    } catch (const mongocxx::exception& e) {
        throw storage::StorageError(storage::ErrorCode::INVALID_CONFIGURATION,
                                    "Backend endpoint is not a valid connection string", e.what())
            .withContext("endpoint", config_.endpoint.toString());
    }
    ping();
    LOG_INFO("[MongoBackend] Connected to ", describe());
}

MongoDocumentBackend::~MongoDocumentBackend() = default;

std::string MongoDocumentBackend::connectionUri(const BackendConfig& config) {
    const std::string& host = config.endpoint.host;
    // IPv6 literals need brackets in a connection string.
    std::string authority = host.find(':') != std::string::npos && host.front() != '[' ? "[" + host + "]" : host;
    std::string timeout = std::to_string(config.operation_timeout.count());
    return "mongodb://" + authority + ":" + std::to_string(config.endpoint.port) +
           "/?connectTimeoutMS=" + timeout + "&serverSelectionTimeoutMS=" + timeout + "&socketTimeoutMS=" + timeout;
}

template<typename Fn>
auto MongoDocumentBackend::withDatabase(const char* operation, const std::string& collection, Fn&& fn)
    -> decltype(fn(std::declval<mongocxx::database&>())) {
    try {
        auto client = pool_->acquire();
        mongocxx::database database = (*client)[config_.database];
        return fn(database);
    } catch (const mongocxx::operation_exception& e) {
        if (!e.raw_server_error()) {
            throw unavailable(operation, collection, e);
        }
        storage::StorageError err(storage::ErrorCode::BACKEND_OPERATION_FAILED, "Document backend rejected the request",
                                  std::string(operation) + ": " + e.what());
        err.withContext("operation", operation);
        if (!collection.empty()) err.withContext("collection", collection);
        throw err;
    } catch (const mongocxx::exception& e) {
        throw unavailable(operation, collection, e);
    }
}

void MongoDocumentBackend::ping() {
    withDatabase("ping", "", [](mongocxx::database& database) {
        database.run_command(make_document(kvp("ping", 1)));
    });
}

void MongoDocumentBackend::upsert(const std::string& collection, const json& document) {
    const std::string& id = requireId(document);
    bsoncxx::document::value body = BsonCodec::toBson(document);
    withDatabase("upsert", collection, [&](mongocxx::database& database) {
        mongocxx::options::replace options;
        options.upsert(true);
        database[collection].replace_one(make_document(kvp("_id", id)), body.view(), options);
    });
}

std::optional<json> MongoDocumentBackend::findById(const std::string& collection, const std::string& id) {
    return withDatabase("findById", collection, [&](mongocxx::database& database) -> std::optional<json> {
        auto found = database[collection].find_one(make_document(kvp("_id", id)));
        if (!found) return std::nullopt;
        return decodeDocument(found->view(), collection);
    });
}

bool MongoDocumentBackend::removeById(const std::string& collection, const std::string& id) {
    return withDatabase("removeById", collection, [&](mongocxx::database& database) {
        auto result = database[collection].delete_one(make_document(kvp("_id", id)));
        return result && result->deleted_count() > 0;
    });
}

std::vector<json> MongoDocumentBackend::find(const BackendQuery& query) {
    // The server reads a zero limit as "no limit".
    if (query.limit && *query.limit == 0) return {};
    bsoncxx::document::value filter = BsonCodec::toBson(query.filter);
    return withDatabase("find", query.collection, [&](mongocxx::database& database) {
        mongocxx::options::find options;
        if (!query.sort.empty()) options.sort(sortDocument(query.sort));
        if (query.skip > 0) options.skip(clampToInt64(query.skip));
        if (query.limit) options.limit(clampToInt64(*query.limit));

        std::vector<json> documents;
        mongocxx::cursor cursor = database[query.collection].find(filter.view(), options);
        for (bsoncxx::document::view view : cursor) {
            documents.push_back(decodeDocument(view, query.collection));
        }
        return documents;
    });
}

size_t MongoDocumentBackend::count(const BackendQuery& query) {
    if (query.limit && *query.limit == 0) return 0;
    bsoncxx::document::value filter = BsonCodec::toBson(query.filter);
    return withDatabase("count", query.collection, [&](mongocxx::database& database) {
        mongocxx::options::count options;
        if (query.skip > 0) options.skip(clampToInt64(query.skip));
        if (query.limit) options.limit(clampToInt64(*query.limit));
        return static_cast<size_t>(database[query.collection].count_documents(filter.view(), options));
    });
}

int64_t MongoDocumentBackend::incrementCounter(const std::string& collection, const std::string& id,
                                               const std::string& field, int64_t delta) {
    return withDatabase("incrementCounter", collection, [&](mongocxx::database& database) -> int64_t {
        mongocxx::write_concern journaled;
        journaled.journal(true);
        mongocxx::options::find_one_and_update options;
        options.upsert(true);
        options.return_document(mongocxx::options::return_document::k_after);
        options.write_concern(journaled);

        auto updated = database[collection].find_one_and_update(
            make_document(kvp("_id", id)), make_document(kvp("$inc", make_document(kvp(field, delta)))), options);
        if (!updated) {
            throw storage::StorageError(storage::ErrorCode::INTERNAL_ERROR, "Counter upsert returned no document")
                .withContext("collection", collection);
        }
        bsoncxx::document::element value = updated->view()[field];
        if (value && value.type() == bsoncxx::type::k_int64) return value.get_int64().value;
        if (value && value.type() == bsoncxx::type::k_int32) return value.get_int32().value;
        throw storage::StorageError(storage::ErrorCode::INVALID_DATA_FORMAT, "Counter field is not an integer")
            .withContext("collection", collection)
            .withContext("field", field);
    });
}

std::vector<BackendIndexSpec> MongoDocumentBackend::listIndexes(const std::string& collection) {
    return withDatabase("listIndexes", collection, [&](mongocxx::database& database) {
        std::vector<BackendIndexSpec> specs;
        try {
            mongocxx::cursor cursor = database[collection].list_indexes();
            for (bsoncxx::document::view index : cursor) {
                bsoncxx::document::element name = index["name"];
                bsoncxx::document::element keys = index["key"];
                if (!name || name.type() != bsoncxx::type::k_string || !keys || keys.type() != bsoncxx::type::k_document) {
                    continue;
                }
                auto raw_name = name.get_string().value;
                BackendIndexSpec spec;
                spec.name = std::string(raw_name.data(), raw_name.size());
                if (spec.name == ID_INDEX_NAME) continue;
                for (const bsoncxx::document::element& key : keys.get_document().value) {
                    bool descending = (key.type() == bsoncxx::type::k_int32 && key.get_int32().value < 0) ||
                                      (key.type() == bsoncxx::type::k_int64 && key.get_int64().value < 0) ||
                                      (key.type() == bsoncxx::type::k_double && key.get_double().value < 0);
                    spec.fields.push_back(SortField{elementKey(key),
                        descending ? IndexSortOrder::DESCENDING : IndexSortOrder::ASCENDING});
                }
                specs.push_back(std::move(spec));
            }
        } catch (const mongocxx::operation_exception& e) {
            if (e.code().value() != NAMESPACE_NOT_FOUND) throw;
        }
        return specs;
    });
}

void MongoDocumentBackend::createIndex(const std::string& collection, const BackendIndexSpec& spec) {
    for (const auto& existing : listIndexes(collection)) {
        if (existing.name == spec.name) return;
    }
    bsoncxx::document::value keys = sortDocument(spec.fields);
    withDatabase("createIndex", collection, [&](mongocxx::database& database) {
        database[collection].create_index(keys.view(), make_document(kvp("name", spec.name)));
    });
    LOG_INFO("[MongoBackend] Created index '", spec.name, "' on ", collection);
}

bool MongoDocumentBackend::dropIndex(const std::string& collection, const std::string& name) {
    auto existing = listIndexes(collection);
    bool present = std::any_of(existing.begin(), existing.end(),
                               [&name](const BackendIndexSpec& spec) { return spec.name == name; });
    if (!present) return false;
    withDatabase("dropIndex", collection, [&](mongocxx::database& database) {
        database[collection].indexes().drop_one(name);
    });
    return true;
}

std::string MongoDocumentBackend::describe() const {
    return "mongodb://" + config_.endpoint.toString() + "/" + config_.database;
}

} // namespace backend
} // namespace engine
