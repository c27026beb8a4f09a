// @src/backend/bson_codec.cpp
#include "../../include/backend/bson_codec.h"
#include "../../include/storage_error/error_utils.h"

#include <bsoncxx/array/view.hpp>
#include <bsoncxx/builder/core.hpp>
#include <bsoncxx/types.hpp>

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace engine {
namespace backend {

using nlohmann::json;

namespace {
    storage::StorageError unmappable(const std::string& reason) {
        return storage::StorageError(storage::ErrorCode::INVALID_DATA_FORMAT, "Value has no BSON mapping", reason);
    }

    void appendValue(bsoncxx::builder::core& builder, const json& value) {
        switch (value.type()) {
            case json::value_t::null:
                builder.append(bsoncxx::types::b_null{});
                break;
            case json::value_t::boolean:
                builder.append(value.get<bool>());
                break;
            case json::value_t::number_integer:
                builder.append(value.get<std::int64_t>());
                break;
            case json::value_t::number_unsigned: {
                // CBOR-decoded cursors hand back non-negative integers as unsigned.
                std::uint64_t raw = value.get<std::uint64_t>();
                if (raw > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                    throw unmappable("integer " + std::to_string(raw) + " exceeds int64");
                }
                builder.append(static_cast<std::int64_t>(raw));
                break;
            }
            case json::value_t::number_float:
                builder.append(value.get<double>());
                break;
            case json::value_t::string:
                builder.append(value.get<std::string>());
                break;
            case json::value_t::binary: {
                const auto& bytes = value.get_binary();
                builder.append(bsoncxx::types::b_binary{bsoncxx::binary_sub_type::k_binary,
                                                        static_cast<std::uint32_t>(bytes.size()), bytes.data()});
                break;
            }
            case json::value_t::object:
                builder.open_document();
                for (auto it = value.begin(); it != value.end(); ++it) {
                    builder.key_owned(it.key());
                    appendValue(builder, it.value());
                }
                builder.close_document();
                break;
            case json::value_t::array:
                builder.open_array();
                for (const auto& element : value) {
                    appendValue(builder, element);
                }
                builder.close_array();
                break;
            default:
                throw unmappable(std::string("JSON type ") + value.type_name());
        }
    }

    storage::Result<json> elementToJson(const bsoncxx::document::element& element);

    storage::Result<json> arrayToJson(bsoncxx::array::view array) {
        json out = json::array();
        for (const bsoncxx::array::element& element : array) {
            json converted;
            ASSIGN_OR_RETURN(converted, elementToJson(element));
            out.push_back(std::move(converted));
        }
        return out;
    }

    storage::Result<json> documentToJson(bsoncxx::document::view document) {
        json out = json::object();
        for (const bsoncxx::document::element& element : document) {
            json converted;
            ASSIGN_OR_RETURN(converted, elementToJson(element));
            auto key = element.key();
            out[std::string(key.data(), key.size())] = std::move(converted);
        }
        return out;
    }

    storage::Result<json> elementToJson(const bsoncxx::document::element& element) {
        switch (element.type()) {
            case bsoncxx::type::k_null:
                return json(nullptr);
            case bsoncxx::type::k_bool:
                return json(element.get_bool().value);
            case bsoncxx::type::k_int32:
                return json(static_cast<std::int64_t>(element.get_int32().value));
            case bsoncxx::type::k_int64:
                return json(element.get_int64().value);
            case bsoncxx::type::k_double:
                return json(element.get_double().value);
            case bsoncxx::type::k_string: {
                auto text = element.get_string().value;
                return json(std::string(text.data(), text.size()));
            }
            case bsoncxx::type::k_binary: {
                auto binary = element.get_binary();
                return json::binary(std::vector<std::uint8_t>(binary.bytes, binary.bytes + binary.size));
            }
            case bsoncxx::type::k_document:
                return documentToJson(element.get_document().value);
            case bsoncxx::type::k_array:
                return arrayToJson(element.get_array().value);
            default: {
                auto key = element.key();
                return unmappable("field '" + std::string(key.data(), key.size()) + "' has BSON type " +
                                  bsoncxx::to_string(element.type()));
            }
        }
    }
} // anonymous namespace

bsoncxx::document::value BsonCodec::toBson(const json& document) {
    if (!document.is_object()) {
        throw unmappable("top-level value is not an object");
    }
    bsoncxx::builder::core builder{false};
    for (auto it = document.begin(); it != document.end(); ++it) {
        builder.key_owned(it.key());
        appendValue(builder, it.value());
    }
    return builder.extract_document();
}

storage::Result<json> BsonCodec::toJson(bsoncxx::document::view document) {
    return documentToJson(document);
}

} // namespace backend
} // namespace engine
