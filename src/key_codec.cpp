// @src/key_codec.cpp
#include "../include/key_codec.h"
#include "../include/value_codec.h"
#include "../include/encoding_utils.h"
#include "../include/debug_utils.h"
#include "../include/storage_error/storage_error.h"

namespace engine {
namespace datastore {

using namespace Kindred;

bool KeyCodec::isReservedKind(const std::string& kind) {
    return kind.size() >= 4 && kind.compare(0, 2, "__") == 0 && kind.compare(kind.size() - 2, 2, "__") == 0;
}

void KeyCodec::validate(const Key& key, bool require_complete) {
    if (key.path.empty()) {
        throw storage::StorageError::invalidKey(key.toString(), "Key has no path elements");
    }
    for (size_t i = 0; i < key.path.size(); ++i) {
        const PathElement& element = key.path[i];
        if (element.kind.empty()) {
            throw storage::StorageError::invalidKey(key.toString(), "Empty kind at path position " + std::to_string(i));
        }
        if (!isValidUtf8(element.kind) || (element.name && !isValidUtf8(*element.name))) {
            throw storage::StorageError::invalidKey(format_key_for_print(key.toString()), "Kinds and names must be valid UTF-8");
        }
        if (isReservedKind(element.kind)) {
            throw storage::StorageError::invalidKey(key.toString(), "Kind '" + element.kind + "' is reserved");
        }
        if (element.id && element.name) {
            throw storage::StorageError::invalidKey(key.toString(), "Path element has both id and name");
        }
        if (element.id && *element.id <= 0) {
            throw storage::StorageError::invalidKey(key.toString(), "Numeric ids must be positive");
        }
        if (element.name && element.name->empty()) {
            throw storage::StorageError::invalidKey(key.toString(), "Key names must be non-empty");
        }
        bool is_last = (i + 1 == key.path.size());
        if (!element.isComplete() && (require_complete || !is_last)) {
            throw storage::StorageError::invalidKey(key.toString(),
                is_last ? "Key is incomplete" : "Ancestor path element is incomplete");
        }
    }
}

std::string KeyCodec::encode(const Key& key) {
    validate(key, true);
    std::string encoded;
    for (size_t i = 0; i < key.path.size(); ++i) {
        const PathElement& element = key.path[i];
        if (i > 0) encoded.push_back(PATH_SEPARATOR);
        encoded += escapeKeyComponent(element.kind);
        encoded.push_back(KIND_SEPARATOR);
        if (element.id) {
            encoded.push_back(ID_MARKER);
            encoded += encodeIdOrderPreserving(*element.id);
        } else {
            encoded.push_back(NAME_MARKER);
            encoded += escapeKeyComponent(*element.name);
        }
    }
    return encoded;
}

Key KeyCodec::decode(const std::string& encoded) {
    auto fail = [&encoded](const std::string& reason) {
        return storage::StorageError::invalidKey(format_key_for_print(encoded), reason);
    };
    if (encoded.empty()) {
        throw fail("Encoded key is empty");
    }

    Key key;
    size_t start = 0;
    while (start <= encoded.size()) {
        size_t end = encoded.find(PATH_SEPARATOR, start);
        if (end == std::string::npos) end = encoded.size();
        const std::string segment = encoded.substr(start, end - start);

        size_t kind_end = segment.find(KIND_SEPARATOR);
        if (kind_end == std::string::npos || kind_end + 1 >= segment.size()) {
            throw fail("Path element without identifier");
        }
        auto kind = unescapeKeyComponent(segment.substr(0, kind_end));
        if (!kind || kind->empty()) {
            throw fail("Malformed kind");
        }
        char marker = segment[kind_end + 1];
        std::string payload = segment.substr(kind_end + 2);
        if (marker == ID_MARKER) {
            auto id = decodeIdOrderPreserving(payload);
            if (!id || *id <= 0) {
                throw fail("Malformed numeric id");
            }
            key.path.emplace_back(*kind, *id);
        } else if (marker == NAME_MARKER) {
            auto name = unescapeKeyComponent(payload);
            if (!name || name->empty()) {
                throw fail("Malformed key name");
            }
            key.path.emplace_back(*kind, *name);
        } else {
            throw fail("Unknown identifier marker");
        }

        if (end == encoded.size()) break;
        start = end + 1;
    }
    return key;
}

std::string KeyCodec::ancestorPrefix(const Key& ancestor) {
    std::string prefix = encode(ancestor);
    prefix.push_back(PATH_SEPARATOR);
    return prefix;
}

} // namespace datastore
} // namespace engine
