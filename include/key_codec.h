// @include/key_codec.h
#pragma once

#include "types.h"
#include <string>

namespace engine {
namespace datastore {

/**
 * @brief Encodes hierarchical keys as document identifiers.
 *
 * Layout per path element: escaped kind, KIND_SEPARATOR, then either
 * ID_MARKER + 20-digit id or NAME_MARKER + escaped name. Elements are joined
 * with PATH_SEPARATOR. Byte order of encoded keys equals key order: parents
 * before children, ids before names, ids numerically, names lexicographically.
 * An ancestor's descendants are exactly the identifiers starting with
 * ancestorPrefix(ancestor).
 */
class KeyCodec {
public:
    // Throws StorageError(INVALID_KEY) for incomplete or malformed keys.
    static std::string encode(const Key& key);
    static Key decode(const std::string& encoded);

    static std::string ancestorPrefix(const Key& ancestor);

    // Rejects empty paths, empty or reserved kinds (__name__), non-positive ids and empty names.
    static void validate(const Key& key, bool require_complete = true);
    static bool isReservedKind(const std::string& kind);
};

} // namespace datastore
} // namespace engine
