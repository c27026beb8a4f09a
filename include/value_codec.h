// @include/value_codec.h
#pragma once

#include "types.h"
#include <nlohmann/json.hpp>
#include <string>

namespace engine {
namespace datastore {

/**
 * @brief Maps property values to document values and back.
 *
 * Scalars whose JSON form is unambiguous are stored natively (null, bool,
 * integer, float, string, binary). Values that would otherwise collide with
 * a native type carry a "_t" tag object:
 *   timestamp -> {"_t":"ts","ms":<int64>}
 *   key       -> {"_t":"key","path":<encoded key>}
 *   geopt     -> {"_t":"geo","lat":<double>,"lon":<double>}
 *   text      -> {"_t":"text","v":<string>}
 *   user      -> {"_t":"user","email":<string>}
 *   im        -> {"_t":"im","protocol":<string>,"address":<string>}
 *   rating    -> {"_t":"rating","v":<int64>}
 * and likewise {"_t":<tag>,"v":<string>} for email, link, category, phone
 * and postal. Lists become JSON arrays, so an empty list is distinct from
 * null and from an absent property.
 */
class ValueCodec {
public:
    static constexpr const char* TAG_FIELD = "_t";
    static constexpr const char* TAG_TIMESTAMP = "ts";
    static constexpr const char* TAG_KEY = "key";
    static constexpr const char* TAG_GEOPT = "geo";
    static constexpr const char* TAG_TEXT = "text";
    static constexpr const char* TAG_USER = "user";
    static constexpr const char* TAG_EMAIL = "email";
    static constexpr const char* TAG_LINK = "link";
    static constexpr const char* TAG_CATEGORY = "category";
    static constexpr const char* TAG_PHONE = "phone";
    static constexpr const char* TAG_POSTAL = "postal";
    static constexpr const char* TAG_IM = "im";
    static constexpr const char* TAG_RATING = "rating";

    // Throws storage::UnsupportedTypeError naming `property` for values with no representation.
    static nlohmann::json encode(const PropertyValue& value, const std::string& property = "");

    // Throws storage::StorageError(INVALID_DATA_FORMAT) when `stored` was not produced by encode().
    static PropertyValue decode(const nlohmann::json& stored, const std::string& property = "");

    // True when `value` may appear in a sort order or range filter; blobs and text have no defined order.
    static bool isOrderable(const PropertyValue& value);

    // Type tag of an encoded tagged value, or nullptr for natively stored values.
    static const char* tagOf(const nlohmann::json& stored);

    /**
     * Three-way comparison of encoded values in the document store's order:
     * null < numbers < strings < objects < arrays < binary < booleans, numbers
     * compared by value across int and double, objects field by field.
     */
    static int compareStored(const nlohmann::json& a, const nlohmann::json& b);
    // Position of the value's type in the order above.
    static int storedTypeRank(const nlohmann::json& stored);

private:
    static nlohmann::json encodeScalar(const PropertyValue& value, const std::string& property);
    static PropertyValue decodeTagged(const nlohmann::json& stored, const std::string& property);
    static nlohmann::json encodeText(const char* tag, const std::string& text, const std::string& property);
};

bool isValidUtf8(const std::string& text);

} // namespace datastore
} // namespace engine
