// @src/query_cursor.cpp
#include "../include/query_cursor.h"
#include "../include/encoding_utils.h"
#include "../include/storage_error/storage_error.h"

namespace engine {
namespace datastore {

using nlohmann::json;

std::string CursorCodec::encode(const QueryCursor& cursor) {
    json j;
    j["v"] = FORMAT_VERSION;
    j["k"] = cursor.last_key;
    j["s"] = cursor.sort_values;
    j["h"] = cursor.shape_checksum;
    return Kindred::encodeBase64Url(json::to_cbor(j));
}

QueryCursor CursorCodec::decode(const std::string& token, const std::string& query_text) {
    auto bytes = Kindred::decodeBase64Url(token);
    if (!bytes) {
        throw storage::StorageError::invalidCursor(query_text, "token is not valid base64");
    }
    json j = json::from_cbor(*bytes, true, false);
    if (j.is_discarded() || !j.is_object()) {
        throw storage::StorageError::invalidCursor(query_text, "token payload is not a cursor");
    }
    if (!j.contains("v") || !j["v"].is_number_integer() || j["v"].get<int>() != FORMAT_VERSION) {
        throw storage::StorageError::invalidCursor(query_text, "unsupported cursor version");
    }
    if (!j.contains("k") || !j["k"].is_string() || !j.contains("s") || !j["s"].is_array() ||
        !j.contains("h") || !j["h"].is_number_unsigned()) {
        throw storage::StorageError::invalidCursor(query_text, "cursor fields missing");
    }

    QueryCursor cursor;
    cursor.last_key = j["k"].get<std::string>();
    for (const auto& v : j["s"]) {
        cursor.sort_values.push_back(v);
    }
    cursor.shape_checksum = j["h"].get<uint32_t>();
    return cursor;
}

uint32_t CursorCodec::shapeChecksum(const Query& query) {
    return Kindred::calculate_payload_checksum(query.shape());
}

} // namespace datastore
} // namespace engine
