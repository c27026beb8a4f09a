// @include/entity_codec.h
#pragma once

#include "types.h"
#include <nlohmann/json.hpp>
#include <string>

namespace engine {
namespace datastore {

/**
 * @brief Converts whole entities to documents and back.
 *
 * Document shape:
 *   {"_id": <encoded key>,
 *    "p": {<stored name>: <encoded value>, ...},
 *    "s": {<stored name>: {"a": <ascending sort key>, "d": <descending sort key>}, ...}}
 *
 * "s" holds one entry per orderable property. A scalar sorts by itself; a
 * list sorts by its smallest element ascending and its largest descending.
 * Blobs, text and empty lists get no entry, which keeps them out of sorts.
 * Each kind is stored in its own collection named after the kind.
 */
class EntityCodec {
public:
    static constexpr const char* ID_FIELD = "_id";
    static constexpr const char* PROPERTIES_FIELD = "p";
    static constexpr const char* SORT_KEYS_FIELD = "s";
    static constexpr const char* ASCENDING_SORT_KEY = "a";
    static constexpr const char* DESCENDING_SORT_KEY = "d";

    static nlohmann::json entityToDocument(const Entity& entity);
    // kind_hint must match the kind decoded from the document identifier.
    static Entity documentToEntity(const nlohmann::json& document, const std::string& kind_hint);

    static std::string collectionForKind(const std::string& kind) { return kind; }

    // Field name a property is stored under; '%', '.' and '$' are percent-escaped.
    static std::string storedName(const std::string& property);
    static std::string propertyName(const std::string& stored_name);

    // Dotted path of a property's value (or "_id" for "__key__").
    static std::string fieldPath(const std::string& property);
    // Dotted path of the sort key a property orders by in the given direction.
    static std::string sortPath(const std::string& property, IndexSortOrder direction);

    static void validatePropertyName(const std::string& property);
};

} // namespace datastore
} // namespace engine
