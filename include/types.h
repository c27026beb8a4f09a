// @include/types.h

#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <variant>    // For std::variant, std::monostate, std::holds_alternative
#include <chrono>
#include <cstdint>
#include <utility>

// --- Foundational Data Types ---
using TxnId = uint64_t;

// --- Indexing Enums ---
enum class IndexSortOrder {
    ASCENDING,
    DESCENDING
};

// Reserved property name addressing an entity's key in filters and sort orders.
static constexpr const char* KEY_PROPERTY_NAME = "__key__";

// --- Keys ---

/** One (kind, identifier) step of a key path. Identifier is a numeric id or a name, never both. */
struct PathElement {
    std::string kind;
    std::optional<int64_t> id;
    std::optional<std::string> name;

    PathElement() = default;
    PathElement(std::string k, int64_t numeric_id) : kind(std::move(k)), id(numeric_id) {}
    PathElement(std::string k, std::string key_name) : kind(std::move(k)), name(std::move(key_name)) {}

    bool isComplete() const { return id.has_value() || name.has_value(); }
    bool operator==(const PathElement& other) const {
        return kind == other.kind && id == other.id && name == other.name;
    }
    bool operator!=(const PathElement& other) const { return !(*this == other); }
};

/**
 * @brief Hierarchical entity key: ancestor path plus a final (kind, identifier).
 * The last element may be incomplete (no identifier) until the entity is first put.
 */
struct Key {
    std::vector<PathElement> path;

    Key() = default;
    explicit Key(std::vector<PathElement> elements) : path(std::move(elements)) {}

    // Incomplete key of the given kind, optionally under a parent.
    static Key incomplete(const std::string& kind, const std::optional<Key>& parent = std::nullopt);
    static Key withId(const std::string& kind, int64_t id, const std::optional<Key>& parent = std::nullopt);
    static Key withName(const std::string& kind, const std::string& name, const std::optional<Key>& parent = std::nullopt);

    const std::string& kind() const;
    std::optional<int64_t> id() const;
    std::optional<std::string> name() const;
    bool isComplete() const;
    bool empty() const { return path.empty(); }
    std::optional<Key> parent() const;
    // Root element of the path, identifying the entity group.
    Key root() const;
    // Copy of this key with its final element completed by id.
    Key completedWith(int64_t id) const;
    bool isAncestorOf(const Key& other) const;

    std::string toString() const;
    bool operator==(const Key& other) const { return path == other.path; }
    bool operator!=(const Key& other) const { return !(*this == other); }
};

// --- Property Values ---

/** Point in time, microsecond resolution on input. Persisted at millisecond resolution. */
struct Timestamp {
    int64_t micros_since_epoch = 0;

    static Timestamp fromMillis(int64_t ms) { return Timestamp{ms * 1000}; }
    static Timestamp fromTimePoint(std::chrono::system_clock::time_point tp);
    static Timestamp now() { return fromTimePoint(std::chrono::system_clock::now()); }
    int64_t millis() const;
    bool operator==(const Timestamp& other) const { return micros_since_epoch == other.micros_since_epoch; }
    bool operator!=(const Timestamp& other) const { return !(*this == other); }
};

struct GeoPt {
    double latitude = 0.0;
    double longitude = 0.0;
    bool operator==(const GeoPt& other) const { return latitude == other.latitude && longitude == other.longitude; }
    bool operator!=(const GeoPt& other) const { return !(*this == other); }
};

using Blob = std::vector<uint8_t>;

/** Long text. Stored but never indexed, so it cannot be sorted or range filtered. */
struct Text {
    std::string value;
    bool operator==(const Text& other) const { return value == other.value; }
    bool operator!=(const Text& other) const { return !(*this == other); }
};

struct User {
    std::string email;
    bool operator==(const User& other) const { return email == other.email; }
    bool operator!=(const User& other) const { return !(*this == other); }
};

struct Email {
    std::string value;
    bool operator==(const Email& other) const { return value == other.value; }
    bool operator!=(const Email& other) const { return !(*this == other); }
};

struct Link {
    std::string value;
    bool operator==(const Link& other) const { return value == other.value; }
    bool operator!=(const Link& other) const { return !(*this == other); }
};

struct Category {
    std::string value;
    bool operator==(const Category& other) const { return value == other.value; }
    bool operator!=(const Category& other) const { return !(*this == other); }
};

struct PhoneNumber {
    std::string value;
    bool operator==(const PhoneNumber& other) const { return value == other.value; }
    bool operator!=(const PhoneNumber& other) const { return !(*this == other); }
};

struct PostalAddress {
    std::string value;
    bool operator==(const PostalAddress& other) const { return value == other.value; }
    bool operator!=(const PostalAddress& other) const { return !(*this == other); }
};

/** Instant messaging handle, e.g. {"xmpp", "someone@example.com"}. */
struct IM {
    std::string protocol;
    std::string address;
    bool operator==(const IM& other) const { return protocol == other.protocol && address == other.address; }
    bool operator!=(const IM& other) const { return !(*this == other); }
};

// User rating in [MIN_RATING, MAX_RATING].
struct Rating {
    static constexpr int64_t MIN_RATING = 0;
    static constexpr int64_t MAX_RATING = 100;
    int64_t value = 0;
    bool operator==(const Rating& other) const { return value == other.value; }
    bool operator!=(const Rating& other) const { return !(*this == other); }
};

struct PropertyValue;
using PropertyList = std::vector<PropertyValue>;

/**
 * @brief Tagged union of every value an entity property may hold.
 * A list may hold any alternative except another list.
 */
struct PropertyValue {
    using Variant = std::variant<
        std::monostate,     // index 0 (null)
        int64_t,            // index 1
        double,             // index 2
        bool,               // index 3
        std::string,        // index 4 (UTF-8 text)
        Blob,               // index 5
        Timestamp,          // index 6
        GeoPt,              // index 7
        Key,                // index 8 (reference to another entity)
        Text,               // index 9
        User,               // index 10
        Email,              // index 11
        Link,               // index 12
        Category,           // index 13
        PhoneNumber,        // index 14
        PostalAddress,      // index 15
        IM,                 // index 16
        Rating,             // index 17
        PropertyList        // index 18
    >;

    Variant data;

    PropertyValue() = default;
    PropertyValue(std::monostate) {}
    PropertyValue(int64_t v) : data(v) {}
    PropertyValue(int v) : data(static_cast<int64_t>(v)) {}
    PropertyValue(double v) : data(v) {}
    PropertyValue(bool v) : data(v) {}
    PropertyValue(std::string v) : data(std::move(v)) {}
    PropertyValue(const char* v) : data(std::string(v)) {}
    PropertyValue(Blob v) : data(std::move(v)) {}
    PropertyValue(Timestamp v) : data(v) {}
    PropertyValue(GeoPt v) : data(v) {}
    PropertyValue(Key v) : data(std::move(v)) {}
    PropertyValue(Text v) : data(std::move(v)) {}
    PropertyValue(User v) : data(std::move(v)) {}
    PropertyValue(Email v) : data(std::move(v)) {}
    PropertyValue(Link v) : data(std::move(v)) {}
    PropertyValue(Category v) : data(std::move(v)) {}
    PropertyValue(PhoneNumber v) : data(std::move(v)) {}
    PropertyValue(PostalAddress v) : data(std::move(v)) {}
    PropertyValue(IM v) : data(std::move(v)) {}
    PropertyValue(Rating v) : data(v) {}
    PropertyValue(PropertyList v) : data(std::move(v)) {}

    template<typename T> bool is() const { return std::holds_alternative<T>(data); }
    template<typename T> const T& as() const { return std::get<T>(data); }
    bool isNull() const { return is<std::monostate>(); }
    bool isList() const { return is<PropertyList>(); }

    // Short type name used in error messages ("int64", "timestamp", ...).
    std::string typeName() const;
    std::string toString() const;

    bool operator==(const PropertyValue& other) const { return data == other.data; }
    bool operator!=(const PropertyValue& other) const { return !(*this == other); }
};

/** A key plus its property bag. Property order carries no meaning. */
struct Entity {
    Key key;
    std::map<std::string, PropertyValue> properties;

    Entity() = default;
    explicit Entity(Key k) : key(std::move(k)) {}

    const std::string& kind() const { return key.kind(); }
    bool has(const std::string& property) const { return properties.count(property) > 0; }
    const PropertyValue& get(const std::string& property) const { return properties.at(property); }
    Entity& set(const std::string& property, PropertyValue value) {
        properties[property] = std::move(value);
        return *this;
    }
    bool operator==(const Entity& other) const { return key == other.key && properties == other.properties; }
};

// --- Indexing Structures ---
struct IndexField {
    std::string name;
    IndexSortOrder order = IndexSortOrder::ASCENDING;
    IndexField(std::string n = "", IndexSortOrder o = IndexSortOrder::ASCENDING) : name(std::move(n)), order(o) {}
    bool operator==(const IndexField& other) const { return name == other.name && order == other.order; }
    bool operator!=(const IndexField& other) const { return !(*this == other); }
};

/**
 * @brief A query shape that should be servable efficiently: kind plus ordered
 * (property, direction) list, optionally constrained by ancestor.
 */
struct IndexDescriptor {
    std::string kind;
    bool ancestor = false;
    std::vector<IndexField> properties;

    // Physical index name, unique per (kind, property sequence); the ancestor flag is not part of it.
    std::string physicalName() const;
    std::string toString() const;
    // Same kind and property sequence, ancestor flag ignored.
    bool sameShape(const IndexDescriptor& other) const;
    bool operator==(const IndexDescriptor& other) const {
        return kind == other.kind && ancestor == other.ancestor && properties == other.properties;
    }
};

enum class IndexState {
    WRITE_ONLY,
    READ_WRITE,
    ERROR,
    DELETED
};

struct CompositeIndex {
    int64_t id = 0;
    IndexDescriptor descriptor;
    IndexState state = IndexState::WRITE_ONLY;
};

// --- Queries ---

enum class FilterOperator {
    EQUAL,
    NOT_EQUAL,
    LESS_THAN,
    LESS_THAN_OR_EQUAL,
    GREATER_THAN,
    GREATER_THAN_OR_EQUAL,
    IN
};

struct FilterCondition {
    std::string field;
    FilterOperator op;
    // IN takes the vector; every other operator a single value.
    std::variant<PropertyValue, std::vector<PropertyValue>> value;

    bool isInequality() const {
        return op == FilterOperator::LESS_THAN || op == FilterOperator::LESS_THAN_OR_EQUAL ||
               op == FilterOperator::GREATER_THAN || op == FilterOperator::GREATER_THAN_OR_EQUAL ||
               op == FilterOperator::NOT_EQUAL;
    }
};

struct OrderByClause {
    std::string field;
    IndexSortOrder direction = IndexSortOrder::ASCENDING;
};

struct Query {
    std::string kind;
    std::vector<FilterCondition> filters;
    std::vector<OrderByClause> orders;
    std::optional<Key> ancestor;
    std::optional<std::string> cursor;
    std::optional<size_t> limit;
    size_t offset = 0;

    Query() = default;
    explicit Query(std::string k) : kind(std::move(k)) {}

    Query& filter(const std::string& field, FilterOperator op, PropertyValue value) {
        filters.push_back({field, op, std::move(value)});
        return *this;
    }
    Query& filterIn(const std::string& field, std::vector<PropertyValue> values) {
        filters.push_back({field, FilterOperator::IN, std::move(values)});
        return *this;
    }
    Query& order(const std::string& field, IndexSortOrder direction = IndexSortOrder::ASCENDING) {
        orders.push_back({field, direction});
        return *this;
    }
    Query& hasAncestor(Key k) { ancestor = std::move(k); return *this; }
    Query& startAfter(std::string token) { cursor = std::move(token); return *this; }
    Query& withLimit(size_t n) { limit = n; return *this; }
    Query& withOffset(size_t n) { offset = n; return *this; }

    // Shape of the query without cursor, limit or offset; used for query history and cursor checks.
    std::string shape() const;
    std::string toString() const;
};

template<typename T>
struct PaginatedQueryResult {
    std::vector<T> docs;
    bool hasNextPage = false;
    std::optional<std::string> endCursor;
};
