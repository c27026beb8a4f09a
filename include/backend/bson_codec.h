// @include/backend/bson_codec.h
#pragma once

#include "../storage_error/result.h"

#include <bsoncxx/document/value.hpp>
#include <bsoncxx/document/view.hpp>
#include <nlohmann/json.hpp>

namespace engine {
namespace backend {

/**
 * @brief Converts between the JSON documents the mapping layer builds and BSON.
 *
 * Integers become int64, floats double, binaries generic binary subtype.
 * Only the BSON types this mapping produces are read back; anything else
 * (ObjectId, dates, decimals, ...) is INVALID_DATA_FORMAT.
 */
class BsonCodec {
public:
    // Throws storage::StorageError(INVALID_DATA_FORMAT) when `document` is not an object
    // or holds an integer outside int64.
    static bsoncxx::document::value toBson(const nlohmann::json& document);

    static storage::Result<nlohmann::json> toJson(bsoncxx::document::view document);
};

} // namespace backend
} // namespace engine
