// @src/entity_codec.cpp
#include "../include/entity_codec.h"
#include "../include/key_codec.h"
#include "../include/value_codec.h"
#include "../include/debug_utils.h"
#include "../include/storage_error/storage_error.h"

namespace engine {
namespace datastore {

using nlohmann::json;

namespace {
    int hexValue(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        return -1;
    }

    // Smallest and largest orderable element, or nothing when no element sorts.
    bool sortKeysFor(const PropertyValue& value, const json& encoded, json& ascending, json& descending) {
        if (!value.isList()) {
            if (!ValueCodec::isOrderable(value)) return false;
            ascending = encoded;
            descending = encoded;
            return true;
        }
        const auto& list = value.as<PropertyList>();
        bool found = false;
        for (size_t i = 0; i < list.size(); ++i) {
            if (!ValueCodec::isOrderable(list[i])) continue;
            const json& element = encoded[i];
            if (!found || ValueCodec::compareStored(element, ascending) < 0) ascending = element;
            if (!found || ValueCodec::compareStored(element, descending) > 0) descending = element;
            found = true;
        }
        return found;
    }
} // anonymous namespace

void EntityCodec::validatePropertyName(const std::string& property) {
    if (property.empty() || KeyCodec::isReservedKind(property) || property.find('\0') != std::string::npos) {
        storage::StorageError err(storage::ErrorCode::INVALID_DATA_FORMAT, "Invalid property name");
        err.withDetails("Property names must be non-empty, free of NUL and not of the form __name__");
        err.withContext("property", format_key_for_print(property));
        throw err;
    }
    if (!isValidUtf8(property)) {
        throw storage::UnsupportedTypeError(format_key_for_print(property), "property name is not valid UTF-8");
    }
}

std::string EntityCodec::storedName(const std::string& property) {
    std::string out;
    out.reserve(property.size());
    for (char c : property) {
        if (c == '%') out += "%25";
        else if (c == '.') out += "%2E";
        else if (c == '$') out += "%24";
        else out.push_back(c);
    }
    return out;
}

std::string EntityCodec::propertyName(const std::string& stored_name) {
    std::string out;
    out.reserve(stored_name.size());
    for (size_t i = 0; i < stored_name.size(); ++i) {
        if (stored_name[i] == '%' && i + 2 < stored_name.size()) {
            int hi = hexValue(stored_name[i + 1]);
            int lo = hexValue(stored_name[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        if (stored_name[i] == '%') {
            storage::StorageError err(storage::ErrorCode::INVALID_DATA_FORMAT, "Malformed stored property name");
            err.withContext("property", stored_name);
            throw err;
        }
        out.push_back(stored_name[i]);
    }
    return out;
}

json EntityCodec::entityToDocument(const Entity& entity) {
    json properties = json::object();
    json sort_keys = json::object();
    for (const auto& [name, value] : entity.properties) {
        validatePropertyName(name);
        const std::string stored = storedName(name);
        try {
            properties[stored] = ValueCodec::encode(value, name);
        } catch (storage::StorageError& e) {
            e.withContext("key", entity.key.toString());
            throw;
        }
        json ascending;
        json descending;
        if (sortKeysFor(value, properties[stored], ascending, descending)) {
            sort_keys[stored] = json{{ASCENDING_SORT_KEY, std::move(ascending)}, {DESCENDING_SORT_KEY, std::move(descending)}};
        }
    }
    json document = json::object();
    document[ID_FIELD] = KeyCodec::encode(entity.key);
    document[PROPERTIES_FIELD] = std::move(properties);
    document[SORT_KEYS_FIELD] = std::move(sort_keys);
    return document;
}

Entity EntityCodec::documentToEntity(const json& document, const std::string& kind_hint) {
    auto fail = [&kind_hint](const std::string& reason) {
        storage::StorageError err(storage::ErrorCode::INVALID_DATA_FORMAT, "Document is not a stored entity");
        err.withDetails(reason);
        err.withContext("kind", kind_hint);
        return err;
    };
    if (!document.is_object()) {
        throw fail("document is not an object");
    }
    auto id_it = document.find(ID_FIELD);
    if (id_it == document.end() || !id_it->is_string()) {
        throw fail("missing string _id");
    }

    Entity entity(KeyCodec::decode(id_it->get<std::string>()));
    if (!kind_hint.empty() && entity.kind() != kind_hint) {
        throw fail("document key " + entity.key.toString() + " is not of kind " + kind_hint);
    }

    // Sort keys are derived data and are not read back.
    auto props_it = document.find(PROPERTIES_FIELD);
    if (props_it == document.end()) {
        return entity;
    }
    if (!props_it->is_object()) {
        throw fail("property bag is not an object");
    }
    for (auto it = props_it->begin(); it != props_it->end(); ++it) {
        try {
            std::string name = propertyName(it.key());
            entity.properties.emplace(name, ValueCodec::decode(it.value(), name));
        } catch (storage::StorageError& e) {
            e.withContext("key", entity.key.toString());
            throw;
        }
    }
    return entity;
}

std::string EntityCodec::fieldPath(const std::string& property) {
    if (property == KEY_PROPERTY_NAME) {
        return ID_FIELD;
    }
    return std::string(PROPERTIES_FIELD) + "." + storedName(property);
}

std::string EntityCodec::sortPath(const std::string& property, IndexSortOrder direction) {
    if (property == KEY_PROPERTY_NAME) {
        return ID_FIELD;
    }
    return std::string(SORT_KEYS_FIELD) + "." + storedName(property) + "." +
           (direction == IndexSortOrder::ASCENDING ? ASCENDING_SORT_KEY : DESCENDING_SORT_KEY);
}

} // namespace datastore
} // namespace engine
