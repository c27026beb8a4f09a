// @include/query_cursor.h
#pragma once

#include "types.h"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace engine {
namespace datastore {

/**
 * @brief Position after the last entity of a page.
 * sort_values holds that entity's sort key for each effective order of the
 * query (the key tie-breaker included), in order.
 */
struct QueryCursor {
    std::string last_key;                      // encoded document id
    std::vector<nlohmann::json> sort_values;
    uint32_t shape_checksum = 0;
};

/**
 * Tokens are URL-safe base64 of the CBOR form {"v":1,"k":..,"s":[..],"h":..}.
 * The checksum binds a cursor to the query shape it was issued for.
 */
class CursorCodec {
public:
    static constexpr int FORMAT_VERSION = 1;

    static std::string encode(const QueryCursor& cursor);
    // Throws StorageError(INVALID_CURSOR) naming `query_text` for any malformed token.
    static QueryCursor decode(const std::string& token, const std::string& query_text);

    static uint32_t shapeChecksum(const Query& query);
};

} // namespace datastore
} // namespace engine
