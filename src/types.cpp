// @src/types.cpp
#include "../include/types.h"
#include "../include/storage_error/storage_error.h"

#include <magic_enum.hpp>
#include <sstream>
#include <iomanip>

namespace {
    std::string elementToString(const PathElement& element) {
        std::ostringstream oss;
        oss << element.kind << ":";
        if (element.id) {
            oss << *element.id;
        } else if (element.name) {
            oss << "'" << *element.name << "'";
        } else {
            oss << "?";
        }
        return oss.str();
    }

    const char* directionSuffix(IndexSortOrder order) {
        return order == IndexSortOrder::ASCENDING ? "asc" : "desc";
    }

    // Percent-escapes the index name delimiters so distinct shapes never share a name.
    std::string escapeIndexComponent(const std::string& raw) {
        std::string out;
        out.reserve(raw.size());
        for (char c : raw) {
            if (c == '%') out += "%25";
            else if (c == '.') out += "%2E";
            else out.push_back(c);
        }
        return out;
    }

    std::string operatorSymbol(FilterOperator op) {
        switch (op) {
            case FilterOperator::EQUAL: return "=";
            case FilterOperator::NOT_EQUAL: return "!=";
            case FilterOperator::LESS_THAN: return "<";
            case FilterOperator::LESS_THAN_OR_EQUAL: return "<=";
            case FilterOperator::GREATER_THAN: return ">";
            case FilterOperator::GREATER_THAN_OR_EQUAL: return ">=";
            case FilterOperator::IN: return "IN";
        }
        return std::string(magic_enum::enum_name(op));
    }
} // anonymous namespace

// --- Key ---

Key Key::incomplete(const std::string& kind, const std::optional<Key>& parent) {
    Key key = parent.value_or(Key());
    PathElement element;
    element.kind = kind;
    key.path.push_back(std::move(element));
    return key;
}

Key Key::withId(const std::string& kind, int64_t id, const std::optional<Key>& parent) {
    Key key = parent.value_or(Key());
    key.path.emplace_back(kind, id);
    return key;
}

Key Key::withName(const std::string& kind, const std::string& name, const std::optional<Key>& parent) {
    Key key = parent.value_or(Key());
    key.path.emplace_back(kind, name);
    return key;
}

const std::string& Key::kind() const {
    if (path.empty()) {
        throw storage::StorageError::invalidKey("<empty>", "Key has no path elements");
    }
    return path.back().kind;
}

std::optional<int64_t> Key::id() const {
    return path.empty() ? std::nullopt : path.back().id;
}

std::optional<std::string> Key::name() const {
    return path.empty() ? std::nullopt : path.back().name;
}

bool Key::isComplete() const {
    if (path.empty()) return false;
    for (const auto& element : path) {
        if (!element.isComplete()) return false;
    }
    return true;
}

std::optional<Key> Key::parent() const {
    if (path.size() < 2) return std::nullopt;
    return Key(std::vector<PathElement>(path.begin(), path.end() - 1));
}

Key Key::root() const {
    if (path.empty()) {
        throw storage::StorageError::invalidKey("<empty>", "Key has no root element");
    }
    return Key(std::vector<PathElement>{path.front()});
}

Key Key::completedWith(int64_t new_id) const {
    Key completed = *this;
    completed.path.back().id = new_id;
    completed.path.back().name.reset();
    return completed;
}

bool Key::isAncestorOf(const Key& other) const {
    if (path.size() >= other.path.size()) return false;
    for (size_t i = 0; i < path.size(); ++i) {
        if (path[i] != other.path[i]) return false;
    }
    return true;
}

std::string Key::toString() const {
    if (path.empty()) return "Key()";
    std::ostringstream oss;
    oss << "Key(";
    for (size_t i = 0; i < path.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << elementToString(path[i]);
    }
    oss << ")";
    return oss.str();
}

// --- Timestamp ---

Timestamp Timestamp::fromTimePoint(std::chrono::system_clock::time_point tp) {
    return Timestamp{std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count()};
}

int64_t Timestamp::millis() const {
    // Floor so pre-epoch instants truncate toward the earlier millisecond.
    int64_t ms = micros_since_epoch / 1000;
    if (micros_since_epoch % 1000 < 0) --ms;
    return ms;
}

// --- PropertyValue ---

std::string PropertyValue::typeName() const {
    switch (data.index()) {
        case 0: return "null";
        case 1: return "int64";
        case 2: return "double";
        case 3: return "bool";
        case 4: return "string";
        case 5: return "blob";
        case 6: return "timestamp";
        case 7: return "geopt";
        case 8: return "key";
        case 9: return "text";
        case 10: return "user";
        case 11: return "email";
        case 12: return "link";
        case 13: return "category";
        case 14: return "phone";
        case 15: return "postal";
        case 16: return "im";
        case 17: return "rating";
        case 18: return "list";
        default: return "unknown";
    }
}

std::string PropertyValue::toString() const {
    return std::visit([](auto&& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        std::ostringstream oss;
        if constexpr (std::is_same_v<T, std::monostate>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            oss << arg;
        } else if constexpr (std::is_same_v<T, double>) {
            oss << std::setprecision(17) << arg;
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (arg ? "true" : "false");
        } else if constexpr (std::is_same_v<T, std::string>) {
            oss << "\"" << arg << "\"";
        } else if constexpr (std::is_same_v<T, Blob>) {
            oss << "blob(" << arg.size() << " bytes)";
        } else if constexpr (std::is_same_v<T, Timestamp>) {
            oss << "timestamp(" << arg.micros_since_epoch << "us)";
        } else if constexpr (std::is_same_v<T, GeoPt>) {
            oss << "geopt(" << arg.latitude << "," << arg.longitude << ")";
        } else if constexpr (std::is_same_v<T, Key>) {
            oss << arg.toString();
        } else if constexpr (std::is_same_v<T, Text>) {
            oss << "text(" << arg.value.size() << " bytes)";
        } else if constexpr (std::is_same_v<T, User>) {
            oss << "user(" << arg.email << ")";
        } else if constexpr (std::is_same_v<T, Email>) {
            oss << "email(" << arg.value << ")";
        } else if constexpr (std::is_same_v<T, Link>) {
            oss << "link(" << arg.value << ")";
        } else if constexpr (std::is_same_v<T, Category>) {
            oss << "category(" << arg.value << ")";
        } else if constexpr (std::is_same_v<T, PhoneNumber>) {
            oss << "phone(" << arg.value << ")";
        } else if constexpr (std::is_same_v<T, PostalAddress>) {
            oss << "postal(" << arg.value << ")";
        } else if constexpr (std::is_same_v<T, IM>) {
            oss << "im(" << arg.protocol << " " << arg.address << ")";
        } else if constexpr (std::is_same_v<T, Rating>) {
            oss << "rating(" << arg.value << ")";
        } else if constexpr (std::is_same_v<T, PropertyList>) {
            oss << "[";
            for (size_t i = 0; i < arg.size(); ++i) {
                if (i > 0) oss << ", ";
                oss << arg[i].toString();
            }
            oss << "]";
        }
        return oss.str();
    }, data);
}

// --- IndexDescriptor ---

std::string IndexDescriptor::physicalName() const {
    // kind.prop_1.other_-1, in the style of the backend's default index names.
    std::string name = escapeIndexComponent(kind);
    for (const auto& field : properties) {
        name += "." + escapeIndexComponent(field.name) + (field.order == IndexSortOrder::ASCENDING ? "_1" : "_-1");
    }
    return name;
}

std::string IndexDescriptor::toString() const {
    std::ostringstream oss;
    oss << "Index(kind=" << kind;
    if (ancestor) oss << ", ancestor";
    oss << ", [";
    for (size_t i = 0; i < properties.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << properties[i].name << " " << directionSuffix(properties[i].order);
    }
    oss << "])";
    return oss.str();
}

bool IndexDescriptor::sameShape(const IndexDescriptor& other) const {
    return kind == other.kind && properties == other.properties;
}

// --- Query ---

std::string Query::shape() const {
    std::ostringstream oss;
    oss << "kind=" << kind;
    if (ancestor) oss << " ancestor";
    for (const auto& f : filters) {
        oss << " filter(" << f.field << " " << operatorSymbol(f.op) << ")";
    }
    for (const auto& o : orders) {
        oss << " order(" << o.field << " " << directionSuffix(o.direction) << ")";
    }
    return oss.str();
}

std::string Query::toString() const {
    std::ostringstream oss;
    oss << "Query(kind=" << kind;
    if (ancestor) oss << ", ancestor=" << ancestor->toString();
    for (const auto& f : filters) {
        oss << ", " << f.field << " " << operatorSymbol(f.op) << " ";
        if (const auto* single = std::get_if<PropertyValue>(&f.value)) {
            oss << single->toString();
        } else {
            const auto& many = std::get<std::vector<PropertyValue>>(f.value);
            oss << PropertyValue(PropertyList(many.begin(), many.end())).toString();
        }
    }
    for (const auto& o : orders) {
        oss << ", order " << o.field << " " << directionSuffix(o.direction);
    }
    if (limit) oss << ", limit=" << *limit;
    if (offset) oss << ", offset=" << offset;
    if (cursor) oss << ", cursor";
    oss << ")";
    return oss.str();
}
