// @include/query_translator.h
#pragma once

#include "types.h"
#include "query_cursor.h"
#include "backend/document_backend.h"

#include <nlohmann/json.hpp>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace engine {
namespace datastore {

struct QueryLimits {
    size_t max_offset = 1000;
    size_t max_components = 100;   // filters, sort orders and the ancestor
};

/** Backend form of a datastore query plus what is needed to cut cursors from its results. */
struct TranslatedQuery {
    backend::BackendQuery backend_query;
    // Sort orders actually applied: explicit, implicit inequality order, then the key tie-breaker.
    std::vector<OrderByClause> effective_orders;
    uint32_t shape_checksum = 0;
};

/**
 * @brief Converts datastore queries into backend queries.
 *
 * Filters become one $and clause each on the property's document path,
 * an ancestor an anchored $regex on the document id, and sort orders a
 * backend sort on the stored sort keys followed by an ascending key order
 * so every result order is total. A cursor adds the "strictly after this
 * tuple" $or over the effective orders; offset is applied after it.
 */
class QueryTranslator {
public:
    using IndexLookup = std::function<bool(const IndexDescriptor&)>;

    explicit QueryTranslator(QueryLimits limits = QueryLimits(), IndexLookup has_composite_index = nullptr);

    // Throws UnsupportedQueryError, UnsupportedTypeError, or StorageError(INVALID_CURSOR / INVALID_QUERY).
    TranslatedQuery translate(const Query& query) const;

    // Cursor positioned after `last_document`, one of this query's results.
    std::string makeCursor(const TranslatedQuery& translated, const nlohmann::json& last_document) const;

    /**
     * Composite index the query needs, or nullopt when built-in single
     * property and key indexes serve it: kind-only, ancestor-only,
     * equality-only, single-property and key-only queries.
     */
    static std::optional<IndexDescriptor> requiredIndex(const Query& query);

    static std::vector<std::string> inequalityProperties(const Query& query);

    const QueryLimits& limits() const { return limits_; }

private:
    void validateShape(const Query& query) const;
    std::vector<OrderByClause> effectiveOrders(const Query& query) const;
    nlohmann::json filterClause(const Query& query, const FilterCondition& filter) const;
    nlohmann::json cursorClause(const Query& query, const std::vector<OrderByClause>& orders,
                                const QueryCursor& cursor) const;

    QueryLimits limits_;
    IndexLookup has_composite_index_;
};

} // namespace datastore
} // namespace engine
