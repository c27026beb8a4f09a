// @src/value_codec.cpp
#include "../include/value_codec.h"
#include "../include/key_codec.h"
#include "../include/storage_error/storage_error.h"

#include <algorithm>
#include <cmath>

namespace engine {
namespace datastore {

using nlohmann::json;

namespace {
    storage::StorageError malformed(const std::string& property, const std::string& reason) {
        storage::StorageError err(storage::ErrorCode::INVALID_DATA_FORMAT, "Stored value cannot be decoded");
        err.withDetails(reason);
        if (!property.empty()) err.withContext("property", property);
        return err;
    }
} // anonymous namespace

bool isValidUtf8(const std::string& text) {
    size_t i = 0;
    const size_t n = text.size();
    while (i < n) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        size_t extra;
        uint32_t cp;
        if (c < 0x80) { ++i; continue; }
        else if ((c & 0xE0) == 0xC0) { extra = 1; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { extra = 2; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { extra = 3; cp = c & 0x07; }
        else return false;
        if (i + extra >= n) return false;
        for (size_t k = 1; k <= extra; ++k) {
            unsigned char cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // Overlong forms, surrogates and out-of-range code points.
        if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) || (extra == 3 && cp < 0x10000)) return false;
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += extra + 1;
    }
    return true;
}

json ValueCodec::encode(const PropertyValue& value, const std::string& property) {
    if (const auto* list = std::get_if<PropertyList>(&value.data)) {
        json array = json::array();
        for (const auto& element : *list) {
            if (element.isList()) {
                throw storage::UnsupportedTypeError(property, "lists may not contain lists");
            }
            array.push_back(encodeScalar(element, property));
        }
        return array;
    }
    return encodeScalar(value, property);
}

json ValueCodec::encodeScalar(const PropertyValue& value, const std::string& property) {
    return std::visit([&property](auto&& arg) -> json {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return json(nullptr);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return json(arg);
        } else if constexpr (std::is_same_v<T, double>) {
            if (!std::isfinite(arg)) {
                throw storage::UnsupportedTypeError(property, "non-finite double");
            }
            return json(arg);
        } else if constexpr (std::is_same_v<T, bool>) {
            return json(arg);
        } else if constexpr (std::is_same_v<T, std::string>) {
            if (!isValidUtf8(arg)) {
                throw storage::UnsupportedTypeError(property, "text is not valid UTF-8; store raw bytes as a blob");
            }
            return json(arg);
        } else if constexpr (std::is_same_v<T, Blob>) {
            return json::binary(arg);
        } else if constexpr (std::is_same_v<T, Timestamp>) {
            return json{{TAG_FIELD, TAG_TIMESTAMP}, {"ms", arg.millis()}};
        } else if constexpr (std::is_same_v<T, GeoPt>) {
            if (!std::isfinite(arg.latitude) || !std::isfinite(arg.longitude) ||
                arg.latitude < -90.0 || arg.latitude > 90.0 || arg.longitude < -180.0 || arg.longitude > 180.0) {
                throw storage::UnsupportedTypeError(property, "geopt out of range");
            }
            return json{{TAG_FIELD, TAG_GEOPT}, {"lat", arg.latitude}, {"lon", arg.longitude}};
        } else if constexpr (std::is_same_v<T, Key>) {
            if (!arg.isComplete()) {
                throw storage::UnsupportedTypeError(property, "key reference " + arg.toString() + " is incomplete");
            }
            return json{{TAG_FIELD, TAG_KEY}, {"path", KeyCodec::encode(arg)}};
        } else if constexpr (std::is_same_v<T, Text>) {
            return encodeText(TAG_TEXT, arg.value, property);
        } else if constexpr (std::is_same_v<T, User>) {
            if (arg.email.empty() || !isValidUtf8(arg.email)) {
                throw storage::UnsupportedTypeError(property, "user email must be non-empty UTF-8");
            }
            return json{{TAG_FIELD, TAG_USER}, {"email", arg.email}};
        } else if constexpr (std::is_same_v<T, Email>) {
            return encodeText(TAG_EMAIL, arg.value, property);
        } else if constexpr (std::is_same_v<T, Link>) {
            return encodeText(TAG_LINK, arg.value, property);
        } else if constexpr (std::is_same_v<T, Category>) {
            return encodeText(TAG_CATEGORY, arg.value, property);
        } else if constexpr (std::is_same_v<T, PhoneNumber>) {
            return encodeText(TAG_PHONE, arg.value, property);
        } else if constexpr (std::is_same_v<T, PostalAddress>) {
            return encodeText(TAG_POSTAL, arg.value, property);
        } else if constexpr (std::is_same_v<T, IM>) {
            if (!isValidUtf8(arg.protocol) || !isValidUtf8(arg.address)) {
                throw storage::UnsupportedTypeError(property, "im handle is not valid UTF-8");
            }
            return json{{TAG_FIELD, TAG_IM}, {"protocol", arg.protocol}, {"address", arg.address}};
        } else if constexpr (std::is_same_v<T, Rating>) {
            if (arg.value < Rating::MIN_RATING || arg.value > Rating::MAX_RATING) {
                throw storage::UnsupportedTypeError(property, "rating " + std::to_string(arg.value) + " out of range");
            }
            return json{{TAG_FIELD, TAG_RATING}, {"v", arg.value}};
        } else {
            throw storage::UnsupportedTypeError(property, "unhandled value alternative");
        }
    }, value.data);
}

json ValueCodec::encodeText(const char* tag, const std::string& text, const std::string& property) {
    if (!isValidUtf8(text)) {
        throw storage::UnsupportedTypeError(property, std::string(tag) + " is not valid UTF-8");
    }
    return json{{TAG_FIELD, tag}, {"v", text}};
}

PropertyValue ValueCodec::decode(const json& stored, const std::string& property) {
    switch (stored.type()) {
        case json::value_t::null:
            return PropertyValue();
        case json::value_t::boolean:
            return PropertyValue(stored.get<bool>());
        case json::value_t::number_integer:
            return PropertyValue(stored.get<int64_t>());
        case json::value_t::number_unsigned: {
            // Binary decoders hand back non-negative integers as unsigned.
            uint64_t raw = stored.get<uint64_t>();
            if (raw > static_cast<uint64_t>(INT64_MAX)) {
                throw malformed(property, "integer exceeds int64 range");
            }
            return PropertyValue(static_cast<int64_t>(raw));
        }
        case json::value_t::number_float:
            return PropertyValue(stored.get<double>());
        case json::value_t::string:
            return PropertyValue(stored.get<std::string>());
        case json::value_t::binary: {
            const auto& bytes = stored.get_binary();
            return PropertyValue(Blob(bytes.begin(), bytes.end()));
        }
        case json::value_t::array: {
            PropertyList list;
            list.reserve(stored.size());
            for (const auto& element : stored) {
                if (element.is_array()) {
                    throw malformed(property, "nested array");
                }
                list.push_back(decode(element, property));
            }
            return PropertyValue(std::move(list));
        }
        case json::value_t::object:
            return decodeTagged(stored, property);
        default:
            throw malformed(property, std::string("unexpected JSON type ") + stored.type_name());
    }
}

PropertyValue ValueCodec::decodeTagged(const json& stored, const std::string& property) {
    auto tag_it = stored.find(TAG_FIELD);
    if (tag_it == stored.end() || !tag_it->is_string()) {
        throw malformed(property, "object without type tag");
    }
    const std::string tag = tag_it->get<std::string>();

    try {
        if (tag == TAG_TIMESTAMP) {
            return PropertyValue(Timestamp::fromMillis(stored.at("ms").get<int64_t>()));
        }
        if (tag == TAG_GEOPT) {
            return PropertyValue(GeoPt{stored.at("lat").get<double>(), stored.at("lon").get<double>()});
        }
        if (tag == TAG_KEY) {
            return PropertyValue(KeyCodec::decode(stored.at("path").get<std::string>()));
        }
        if (tag == TAG_TEXT) return PropertyValue(Text{stored.at("v").get<std::string>()});
        if (tag == TAG_USER) return PropertyValue(User{stored.at("email").get<std::string>()});
        if (tag == TAG_EMAIL) return PropertyValue(Email{stored.at("v").get<std::string>()});
        if (tag == TAG_LINK) return PropertyValue(Link{stored.at("v").get<std::string>()});
        if (tag == TAG_CATEGORY) return PropertyValue(Category{stored.at("v").get<std::string>()});
        if (tag == TAG_PHONE) return PropertyValue(PhoneNumber{stored.at("v").get<std::string>()});
        if (tag == TAG_POSTAL) return PropertyValue(PostalAddress{stored.at("v").get<std::string>()});
        if (tag == TAG_IM) {
            return PropertyValue(IM{stored.at("protocol").get<std::string>(), stored.at("address").get<std::string>()});
        }
        if (tag == TAG_RATING) return PropertyValue(Rating{stored.at("v").get<int64_t>()});
    } catch (const json::exception& e) {
        throw malformed(property, "tagged '" + tag + "' value: " + e.what());
    }
    throw malformed(property, "unknown type tag '" + tag + "'");
}

bool ValueCodec::isOrderable(const PropertyValue& value) {
    return !value.is<Blob>() && !value.is<Text>();
}

const char* ValueCodec::tagOf(const json& stored) {
    if (!stored.is_object()) return nullptr;
    auto it = stored.find(TAG_FIELD);
    if (it == stored.end() || !it->is_string()) return nullptr;
    static const char* const known[] = {TAG_TIMESTAMP, TAG_KEY, TAG_GEOPT, TAG_TEXT, TAG_USER, TAG_EMAIL,
                                        TAG_LINK, TAG_CATEGORY, TAG_PHONE, TAG_POSTAL, TAG_IM, TAG_RATING};
    const std::string& tag = it->get_ref<const std::string&>();
    for (const char* candidate : known) {
        if (tag == candidate) return candidate;
    }
    return nullptr;
}

int ValueCodec::storedTypeRank(const json& stored) {
    switch (stored.type()) {
        case json::value_t::null: return 0;
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
        case json::value_t::number_float: return 1;
        case json::value_t::string: return 2;
        case json::value_t::object: return 3;
        case json::value_t::array: return 4;
        case json::value_t::binary: return 5;
        case json::value_t::boolean: return 6;
        default: return 7;
    }
}

int ValueCodec::compareStored(const json& a, const json& b) {
    int ra = storedTypeRank(a);
    int rb = storedTypeRank(b);
    if (ra != rb) return ra < rb ? -1 : 1;

    switch (a.type()) {
        case json::value_t::null:
            return 0;
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
        case json::value_t::number_float: {
            if (!a.is_number_float() && !b.is_number_float()) {
                int64_t x = a.get<int64_t>();
                int64_t y = b.get<int64_t>();
                return x < y ? -1 : (x > y ? 1 : 0);
            }
            double x = a.get<double>();
            double y = b.get<double>();
            return x < y ? -1 : (x > y ? 1 : 0);
        }
        case json::value_t::string: {
            int c = a.get_ref<const std::string&>().compare(b.get_ref<const std::string&>());
            return c < 0 ? -1 : (c > 0 ? 1 : 0);
        }
        case json::value_t::boolean: {
            bool x = a.get<bool>();
            bool y = b.get<bool>();
            return x == y ? 0 : (x ? 1 : -1);
        }
        case json::value_t::binary: {
            const auto& x = a.get_binary();
            const auto& y = b.get_binary();
            if (x.size() != y.size()) return x.size() < y.size() ? -1 : 1;
            for (size_t i = 0; i < x.size(); ++i) {
                if (x[i] != y[i]) return x[i] < y[i] ? -1 : 1;
            }
            return 0;
        }
        case json::value_t::object: {
            // Field by field: value type, then field name, then value.
            auto ia = a.begin();
            auto ib = b.begin();
            for (; ia != a.end() && ib != b.end(); ++ia, ++ib) {
                int ta = storedTypeRank(ia.value());
                int tb = storedTypeRank(ib.value());
                if (ta != tb) return ta < tb ? -1 : 1;
                int names = ia.key().compare(ib.key());
                if (names != 0) return names < 0 ? -1 : 1;
                int values = compareStored(ia.value(), ib.value());
                if (values != 0) return values;
            }
            if (ia == a.end() && ib == b.end()) return 0;
            return ia == a.end() ? -1 : 1;
        }
        case json::value_t::array: {
            size_t n = std::min(a.size(), b.size());
            for (size_t i = 0; i < n; ++i) {
                int c = compareStored(a[i], b[i]);
                if (c != 0) return c;
            }
            if (a.size() == b.size()) return 0;
            return a.size() < b.size() ? -1 : 1;
        }
        default:
            return 0;
    }
}

} // namespace datastore
} // namespace engine
