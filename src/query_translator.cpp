// @src/query_translator.cpp
#include "../include/query_translator.h"
#include "../include/entity_codec.h"
#include "../include/key_codec.h"
#include "../include/value_codec.h"
#include "../include/debug_utils.h"
#include "../include/storage_error/storage_error.h"

#include <magic_enum.hpp>
#include <algorithm>
#include <set>

namespace engine {
namespace datastore {

using nlohmann::json;

namespace {
    // Store type ranks a sort key can have, with their $type aliases.
    struct SortKeyType {
        int rank;
        std::vector<const char*> aliases;
    };

    const std::vector<SortKeyType>& sortKeyTypes() {
        static const std::vector<SortKeyType> types = {
            {0, {"null"}},
            {1, {"double", "int", "long", "decimal"}},
            {2, {"string"}},
            {3, {"object"}},
            {6, {"bool"}},
        };
        return types;
    }

    // $type aliases of sort keys ordered strictly after `value` in `direction`.
    json typesAfter(const json& value, IndexSortOrder direction) {
        int rank = ValueCodec::storedTypeRank(value);
        json aliases = json::array();
        for (const auto& type : sortKeyTypes()) {
            bool after = direction == IndexSortOrder::ASCENDING ? type.rank > rank : type.rank < rank;
            if (!after) continue;
            for (const char* alias : type.aliases) aliases.push_back(alias);
        }
        return aliases;
    }

    std::string escapeRegex(const std::string& literal) {
        static const std::string special = "\\^$.|?*+()[]{}";
        std::string out;
        out.reserve(literal.size() * 2);
        for (char c : literal) {
            if (special.find(c) != std::string::npos) out.push_back('\\');
            out.push_back(c);
        }
        return out;
    }

    bool isKeyProperty(const std::string& field) {
        return field == KEY_PROPERTY_NAME;
    }

    bool isEqualityLike(FilterOperator op) {
        return op == FilterOperator::EQUAL || op == FilterOperator::IN;
    }

    void appendUnique(std::vector<std::string>& names, const std::string& name) {
        if (std::find(names.begin(), names.end(), name) == names.end()) names.push_back(name);
    }
} // anonymous namespace

QueryTranslator::QueryTranslator(QueryLimits limits, IndexLookup has_composite_index)
    : limits_(limits), has_composite_index_(std::move(has_composite_index)) {}

std::vector<std::string> QueryTranslator::inequalityProperties(const Query& query) {
    std::vector<std::string> props;
    for (const auto& f : query.filters) {
        if (f.isInequality()) appendUnique(props, f.field);
    }
    return props;
}

std::optional<IndexDescriptor> QueryTranslator::requiredIndex(const Query& query) {
    std::vector<std::string> equality_props;
    std::vector<std::string> inequality_props;
    std::set<std::string> touched;
    for (const auto& f : query.filters) {
        if (isKeyProperty(f.field)) continue;
        touched.insert(f.field);
        if (isEqualityLike(f.op)) appendUnique(equality_props, f.field);
        else appendUnique(inequality_props, f.field);
    }

    std::vector<OrderByClause> orders;
    for (const auto& o : query.orders) {
        if (isKeyProperty(o.field)) {
            // A trailing ascending key order is implied by every index.
            if (&o == &query.orders.back() && o.direction == IndexSortOrder::ASCENDING) continue;
        } else {
            touched.insert(o.field);
        }
        orders.push_back(o);
    }

    if (touched.empty()) {
        return std::nullopt; // kind-only, ancestor-only or key-only
    }
    if (!query.ancestor && inequality_props.empty() && orders.empty()) {
        return std::nullopt; // equality-only, served by merging single-property indexes
    }
    if (!query.ancestor && touched.size() == 1 &&
        std::all_of(orders.begin(), orders.end(), [](const OrderByClause& o) { return !isKeyProperty(o.field); })) {
        return std::nullopt; // one property, served by its built-in index
    }

    IndexDescriptor descriptor;
    descriptor.kind = query.kind;
    descriptor.ancestor = query.ancestor.has_value();
    std::sort(equality_props.begin(), equality_props.end());
    std::set<std::string> placed;
    for (const auto& name : equality_props) {
        if (placed.insert(name).second) descriptor.properties.emplace_back(name, IndexSortOrder::ASCENDING);
    }
    for (const auto& name : inequality_props) {
        if (placed.count(name)) continue;
        IndexSortOrder direction = IndexSortOrder::ASCENDING;
        if (!orders.empty() && orders.front().field == name) direction = orders.front().direction;
        descriptor.properties.emplace_back(name, direction);
        placed.insert(name);
    }
    for (const auto& o : orders) {
        if (placed.count(o.field)) continue;
        descriptor.properties.emplace_back(o.field, o.direction);
        placed.insert(o.field);
    }
    return descriptor;
}

void QueryTranslator::validateShape(const Query& query) const {
    const std::string text = query.toString();
    if (query.kind.empty()) {
        throw storage::StorageError(storage::ErrorCode::INVALID_QUERY, "Query has no kind")
            .withContext("query", text);
    }
    size_t components = query.filters.size() + query.orders.size() + (query.ancestor ? 1 : 0);
    if (components > limits_.max_components) {
        throw storage::UnsupportedQueryError(text, "query has more than " + std::to_string(limits_.max_components) +
                                                   " filters, sort orders and ancestors");
    }
    if (query.offset > limits_.max_offset) {
        throw storage::UnsupportedQueryError(text, "offset " + std::to_string(query.offset) + " exceeds maximum " +
                                                   std::to_string(limits_.max_offset));
    }
    if (query.ancestor) {
        KeyCodec::validate(*query.ancestor, true);
    }

    const auto inequality_props = inequalityProperties(query);
    if (inequality_props.size() > 1) {
        auto required = requiredIndex(query);
        bool covered = required && has_composite_index_ && has_composite_index_(*required);
        if (!covered) {
            std::string names;
            for (const auto& n : inequality_props) names += (names.empty() ? "" : ", ") + n;
            throw storage::UnsupportedQueryError(text, "inequality filters on more than one property (" + names +
                                                       ") need a composite index covering " +
                                                       (required ? required->toString() : std::string("the query")));
        }
    } else if (inequality_props.size() == 1 && !query.orders.empty() &&
               query.orders.front().field != inequality_props.front()) {
        throw storage::UnsupportedQueryError(text, "the first sort order must be on the inequality property '" +
                                                   inequality_props.front() + "'");
    }
}

std::vector<OrderByClause> QueryTranslator::effectiveOrders(const Query& query) const {
    std::vector<OrderByClause> orders = query.orders;
    if (orders.empty()) {
        for (const auto& name : inequalityProperties(query)) {
            orders.push_back({name, IndexSortOrder::ASCENDING});
        }
    }
    if (orders.empty() || !isKeyProperty(orders.back().field)) {
        orders.push_back({KEY_PROPERTY_NAME, IndexSortOrder::ASCENDING});
    }
    return orders;
}

json QueryTranslator::filterClause(const Query& query, const FilterCondition& filter) const {
    const std::string path = EntityCodec::fieldPath(filter.field);

    auto encodeOperand = [&](const PropertyValue& value) -> json {
        if (isKeyProperty(filter.field)) {
            if (!value.is<Key>()) {
                throw storage::UnsupportedQueryError(query.toString(), "__key__ filters take key values, got " +
                                                                       value.typeName());
            }
            return json(KeyCodec::encode(value.as<Key>()));
        }
        if (value.isList()) {
            throw storage::UnsupportedQueryError(query.toString(), "filter on '" + filter.field +
                                                                   "' compares against a list; use IN");
        }
        return ValueCodec::encode(value, filter.field);
    };

    if (filter.op == FilterOperator::IN) {
        const auto* values = std::get_if<std::vector<PropertyValue>>(&filter.value);
        if (!values) {
            throw storage::UnsupportedQueryError(query.toString(), "IN on '" + filter.field + "' needs a value list");
        }
        if (values->empty()) {
            throw storage::UnsupportedQueryError(query.toString(), "IN on '" + filter.field + "' has no values");
        }
        json operands = json::array();
        for (const auto& v : *values) operands.push_back(encodeOperand(v));
        return json{{path, {{"$in", operands}}}};
    }

    const auto* single = std::get_if<PropertyValue>(&filter.value);
    if (!single) {
        throw storage::UnsupportedQueryError(query.toString(), std::string(magic_enum::enum_name(filter.op)) +
                                                               " on '" + filter.field + "' takes a single value");
    }
    json operand = encodeOperand(*single);

    switch (filter.op) {
        case FilterOperator::EQUAL:
            return json{{path, {{"$eq", operand}}}};
        case FilterOperator::NOT_EQUAL:
            return json{{path, {{"$exists", true}, {"$ne", operand}}}};
        default:
            break;
    }

    if (!isKeyProperty(filter.field) && !ValueCodec::isOrderable(*single)) {
        throw storage::UnsupportedQueryError(query.toString(), single->typeName() + " values on '" + filter.field +
                                                               "' cannot be range filtered");
    }
    const char* op = "$eq";
    switch (filter.op) {
        case FilterOperator::LESS_THAN: op = "$lt"; break;
        case FilterOperator::LESS_THAN_OR_EQUAL: op = "$lte"; break;
        case FilterOperator::GREATER_THAN: op = "$gt"; break;
        case FilterOperator::GREATER_THAN_OR_EQUAL: op = "$gte"; break;
        default: break;
    }
    // Type bracketing keeps range filters within the operand's type, but every
    // tagged value is an object, so bound those by tag as well.
    json clause = json{{path, {{op, operand}}}};
    if (const char* tag = ValueCodec::tagOf(operand)) {
        json same_tag = json{{path + "." + ValueCodec::TAG_FIELD, {{"$eq", tag}}}};
        return json{{"$and", json::array({clause, same_tag})}};
    }
    return clause;
}

json QueryTranslator::cursorClause(const Query& query, const std::vector<OrderByClause>& orders,
                                   const QueryCursor& cursor) const {
    if (cursor.sort_values.size() != orders.size()) {
        throw storage::StorageError::invalidCursor(query.toString(), "cursor does not match the query's sort orders");
    }
    // (o1 after v1) or (o1 = v1 and o2 after v2) or ...
    json alternatives = json::array();
    for (size_t i = 0; i < orders.size(); ++i) {
        json conjunction = json::array();
        for (size_t j = 0; j < i; ++j) {
            conjunction.push_back(json{{EntityCodec::sortPath(orders[j].field, orders[j].direction),
                                        {{"$eq", cursor.sort_values[j]}}}});
        }
        const std::string path = EntityCodec::sortPath(orders[i].field, orders[i].direction);
        const json& value = cursor.sort_values[i];
        const char* op = orders[i].direction == IndexSortOrder::ASCENDING ? "$gt" : "$lt";
        json after = json{{path, {{op, value}}}};
        // Comparison operators stay within one type; later types need their own branch.
        json later_types = isKeyProperty(orders[i].field) ? json::array() : typesAfter(value, orders[i].direction);
        if (!later_types.empty()) {
            after = json{{"$or", json::array({after, json{{path, {{"$type", later_types}}}}})}};
        }
        conjunction.push_back(after);
        alternatives.push_back(json{{"$and", conjunction}});
    }
    return json{{"$or", alternatives}};
}

TranslatedQuery QueryTranslator::translate(const Query& query) const {
    validateShape(query);

    TranslatedQuery translated;
    translated.effective_orders = effectiveOrders(query);
    translated.shape_checksum = CursorCodec::shapeChecksum(query);

    json clauses = json::array();
    const std::string id_path = EntityCodec::fieldPath(KEY_PROPERTY_NAME);

    if (query.ancestor) {
        const std::string ancestor_id = KeyCodec::encode(*query.ancestor);
        clauses.push_back(json{{"$or", json::array({
            json{{id_path, {{"$eq", ancestor_id}}}},
            json{{id_path, {{"$regex", "^" + escapeRegex(KeyCodec::ancestorPrefix(*query.ancestor))}}}}
        })}});
    }

    for (const auto& filter : query.filters) {
        clauses.push_back(filterClause(query, filter));
    }

    for (const auto& order : translated.effective_orders) {
        if (isKeyProperty(order.field)) continue;
        // Entities without a sort key for the property (absent, blob, text, empty list) drop out.
        clauses.push_back(json{{EntityCodec::sortPath(order.field, order.direction), {{"$exists", true}}}});
    }

    if (query.cursor) {
        QueryCursor cursor = CursorCodec::decode(*query.cursor, query.toString());
        if (cursor.shape_checksum != translated.shape_checksum) {
            throw storage::StorageError::invalidCursor(query.toString(), "cursor was issued for a different query");
        }
        clauses.push_back(cursorClause(query, translated.effective_orders, cursor));
    }

    auto& bq = translated.backend_query;
    bq.collection = EntityCodec::collectionForKind(query.kind);
    bq.filter = clauses.empty() ? json::object() : json{{"$and", clauses}};
    for (const auto& order : translated.effective_orders) {
        bq.sort.push_back({EntityCodec::sortPath(order.field, order.direction), order.direction});
    }
    bq.skip = query.offset;
    bq.limit = query.limit;

    LOG_DEBUG(2, "[QueryTranslator] ", query.toString(), " -> ", bq.filter.dump(-1, ' ', false, json::error_handler_t::replace));
    return translated;
}

std::string QueryTranslator::makeCursor(const TranslatedQuery& translated, const json& last_document) const {
    QueryCursor cursor;
    cursor.shape_checksum = translated.shape_checksum;
    cursor.last_key = last_document.at(EntityCodec::ID_FIELD).get<std::string>();
    for (const auto& order : translated.effective_orders) {
        if (isKeyProperty(order.field)) {
            cursor.sort_values.push_back(cursor.last_key);
            continue;
        }
        json value = nullptr;
        auto keys = last_document.find(EntityCodec::SORT_KEYS_FIELD);
        if (keys != last_document.end() && keys->is_object()) {
            auto entry = keys->find(EntityCodec::storedName(order.field));
            const char* which = order.direction == IndexSortOrder::ASCENDING ? EntityCodec::ASCENDING_SORT_KEY
                                                                            : EntityCodec::DESCENDING_SORT_KEY;
            if (entry != keys->end() && entry->is_object() && entry->contains(which)) value = (*entry)[which];
        }
        cursor.sort_values.push_back(std::move(value));
    }
    return CursorCodec::encode(cursor);
}

} // namespace datastore
} // namespace engine
