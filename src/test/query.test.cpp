// @src/test/query.test.cpp
#include "test_utils.h"
#include "../../include/datastore.h"
#include "memory_backend.h"

#include <algorithm>
#include <tuple>

class QueryTest : public ::testing::Test {
protected:
    std::unique_ptr<Datastore> db;
    std::shared_ptr<FaultInjectingBackend> backend;

    void SetUp() override {
        DatastoreConfig config;
        config.app_id = "query_test";
        backend = std::make_shared<FaultInjectingBackend>(std::make_shared<MemoryDocumentBackend>());
        db = std::make_unique<Datastore>(config, backend);
    }

    void TearDown() override {
        db.reset();
        backend.reset();
    }

    // Follows endCursor until hasNextPage is false; returns keys in visit order.
    std::vector<Key> paginate(Query base, size_t page_size) {
        std::vector<Key> visited;
        base.withLimit(page_size);
        std::optional<std::string> cursor;
        for (int guard = 0; guard < 1000; ++guard) {
            Query page_query = base;
            if (cursor) page_query.startAfter(*cursor);
            auto page = db->runQuery(page_query);
            EXPECT_LE(page.docs.size(), page_size);
            for (const auto& e : page.docs) visited.push_back(e.key);
            if (!page.hasNextPage) break;
            EXPECT_TRUE(page.endCursor.has_value());
            cursor = page.endCursor;
        }
        return visited;
    }

    // 30 entities; score = id % 7 so sort values tie heavily.
    void seedScores() {
        for (int64_t id = 1; id <= 30; ++id) {
            Entity e(Key::withId("Score", id));
            e.set("score", id % 7);
            e.set("vals", PropertyList{PropertyValue(id % 5), PropertyValue(10 + id % 3)});
            db->put(e);
        }
    }
};

TEST_F(QueryTest, CursorPaginationVisitsEveryEntityOnceInOrder) {
    seedScores();
    std::vector<std::pair<int64_t, int64_t>> expected;   // (score, id)
    for (int64_t id = 1; id <= 30; ++id) expected.emplace_back(id % 7, id);
    std::sort(expected.begin(), expected.end());

    Query q("Score");
    q.order("score");
    for (size_t page_size : {1u, 2u, 3u, 7u, 29u, 30u, 31u}) {
        auto visited = paginate(q, page_size);
        ASSERT_EQ(visited.size(), expected.size()) << "page size " << page_size;
        for (size_t i = 0; i < expected.size(); ++i) {
            EXPECT_EQ(visited[i].id(), std::optional<int64_t>(expected[i].second))
                << "page size " << page_size << " position " << i;
        }
    }
}

TEST_F(QueryTest, DescendingPaginationBreaksTiesByKey) {
    seedScores();
    std::vector<std::pair<int64_t, int64_t>> expected;
    for (int64_t id = 1; id <= 30; ++id) expected.emplace_back(-(id % 7), id);
    std::sort(expected.begin(), expected.end());

    Query q("Score");
    q.order("score", IndexSortOrder::DESCENDING);
    for (size_t page_size : {1u, 4u, 6u}) {
        auto visited = paginate(q, page_size);
        ASSERT_EQ(visited.size(), expected.size());
        for (size_t i = 0; i < expected.size(); ++i) {
            EXPECT_EQ(visited[i].id(), std::optional<int64_t>(expected[i].second)) << "position " << i;
        }
    }
}

TEST_F(QueryTest, ListPropertySortsByExtremeElement) {
    seedScores();
    // Ascending uses the smallest element, descending the largest.
    std::vector<std::pair<int64_t, int64_t>> asc, desc;
    for (int64_t id = 1; id <= 30; ++id) {
        asc.emplace_back(std::min(id % 5, 10 + id % 3), id);
        desc.emplace_back(-std::max(id % 5, 10 + id % 3), id);
    }
    std::sort(asc.begin(), asc.end());
    std::sort(desc.begin(), desc.end());

    Query qa("Score");
    qa.order("vals");
    Query qd("Score");
    qd.order("vals", IndexSortOrder::DESCENDING);
    for (size_t page_size : {1u, 5u, 8u}) {
        auto va = paginate(qa, page_size);
        auto vd = paginate(qd, page_size);
        ASSERT_EQ(va.size(), 30u);
        ASSERT_EQ(vd.size(), 30u);
        for (size_t i = 0; i < 30; ++i) {
            EXPECT_EQ(va[i].id(), std::optional<int64_t>(asc[i].second)) << "asc position " << i;
            EXPECT_EQ(vd[i].id(), std::optional<int64_t>(desc[i].second)) << "desc position " << i;
        }
    }
}

TEST_F(QueryTest, InequalityWithImplicitOrderPaginates) {
    seedScores();
    std::vector<std::pair<int64_t, int64_t>> expected;
    for (int64_t id = 1; id <= 30; ++id) {
        if (id % 7 >= 4) expected.emplace_back(id % 7, id);
    }
    std::sort(expected.begin(), expected.end());

    Query q("Score");
    q.filter("score", FilterOperator::GREATER_THAN_OR_EQUAL, 4);
    auto visited = paginate(q, 3);
    ASSERT_EQ(visited.size(), expected.size());
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(visited[i].id(), std::optional<int64_t>(expected[i].second));
    }
    EXPECT_EQ(db->count(q), expected.size());
}

TEST_F(QueryTest, OffsetAppliesAfterCursor) {
    seedScores();
    Query q("Score");
    q.order(KEY_PROPERTY_NAME).withLimit(5);
    auto first = db->runQuery(q);
    ASSERT_EQ(first.docs.size(), 5u);
    EXPECT_TRUE(first.hasNextPage);

    Query next = q;
    next.startAfter(*first.endCursor).withOffset(2);
    auto second = db->runQuery(next);
    ASSERT_EQ(second.docs.size(), 5u);
    EXPECT_EQ(second.docs[0].key.id(), std::optional<int64_t>(8));
}

TEST_F(QueryTest, KeyFiltersAndDescendingKeyOrder) {
    seedScores();
    Query q("Score");
    q.filter(KEY_PROPERTY_NAME, FilterOperator::GREATER_THAN, Key::withId("Score", 25))
     .order(KEY_PROPERTY_NAME, IndexSortOrder::DESCENDING);
    auto page = db->runQuery(q);
    ASSERT_EQ(page.docs.size(), 5u);
    EXPECT_EQ(page.docs.front().key.id(), std::optional<int64_t>(30));
    EXPECT_EQ(page.docs.back().key.id(), std::optional<int64_t>(26));
    EXPECT_FALSE(page.hasNextPage);

    Query wrong("Score");
    wrong.filter(KEY_PROPERTY_NAME, FilterOperator::EQUAL, 5);
    EXPECT_THROW(db->runQuery(wrong), storage::UnsupportedQueryError);
}

TEST_F(QueryTest, EqualityNotEqualAndInFilters) {
    db->put(Entity(Key::withId("Task", 1)).set("tags", PropertyList{PropertyValue("red"), PropertyValue("blue")})
                                         .set("owner", "ann"));
    db->put(Entity(Key::withId("Task", 2)).set("tags", PropertyList{PropertyValue("green")}).set("owner", "bob"));
    db->put(Entity(Key::withId("Task", 3)).set("tags", PropertyList{}).set("owner", PropertyValue()));
    db->put(Entity(Key::withId("Task", 4)).set("tags", "red"));

    auto ids = [this](const Query& q) {
        std::vector<int64_t> out;
        for (const auto& e : db->runQuery(q).docs) out.push_back(*e.key.id());
        return out;
    };

    Query red("Task");
    red.filter("tags", FilterOperator::EQUAL, "red");
    EXPECT_EQ(ids(red), (std::vector<int64_t>{1, 4}));

    Query not_ann("Task");
    not_ann.filter("owner", FilterOperator::NOT_EQUAL, "ann");
    EXPECT_EQ(ids(not_ann), (std::vector<int64_t>{3, 2}));   // null sorts before text; Task 4 has no owner

    Query in_set("Task");
    in_set.filterIn("tags", {PropertyValue("green"), PropertyValue("blue")});
    EXPECT_EQ(ids(in_set), (std::vector<int64_t>{1, 2}));

    Query null_owner("Task");
    null_owner.filter("owner", FilterOperator::EQUAL, PropertyValue());
    EXPECT_EQ(ids(null_owner), (std::vector<int64_t>{3}));
}

TEST_F(QueryTest, SortExcludesMissingAndBlobValues) {
    db->put(Entity(Key::withId("Item", 1)).set("rank", 2));
    db->put(Entity(Key::withId("Item", 2)));
    db->put(Entity(Key::withId("Item", 3)).set("rank", Blob{1, 2, 3}));
    db->put(Entity(Key::withId("Item", 4)).set("rank", 1));

    EXPECT_EQ(db->count(Query("Item")), 4u);

    Query sorted("Item");
    sorted.order("rank");
    auto page = db->runQuery(sorted);
    ASSERT_EQ(page.docs.size(), 2u);
    EXPECT_EQ(page.docs[0].key.id(), std::optional<int64_t>(4));
    EXPECT_EQ(page.docs[1].key.id(), std::optional<int64_t>(1));
}

TEST_F(QueryTest, RangeFiltersMatchOperandTypeOnly) {
    db->put(Entity(Key::withId("Item", 1)).set("v", 5));
    db->put(Entity(Key::withId("Item", 2)).set("v", "text"));
    db->put(Entity(Key::withId("Item", 3)).set("v", true));
    db->put(Entity(Key::withId("Item", 4)).set("v", 2.5));
    db->put(Entity(Key::withId("Item", 5)).set("v", Timestamp::fromMillis(10)));
    db->put(Entity(Key::withId("Item", 6)).set("v", GeoPt{1.0, 1.0}));

    Query numbers("Item");
    numbers.filter("v", FilterOperator::GREATER_THAN, 0);
    auto page = db->runQuery(numbers);
    ASSERT_EQ(page.docs.size(), 2u);
    EXPECT_EQ(page.docs[0].key.id(), std::optional<int64_t>(4));   // 2.5 before 5
    EXPECT_EQ(page.docs[1].key.id(), std::optional<int64_t>(1));

    Query times("Item");
    times.filter("v", FilterOperator::LESS_THAN, Timestamp::fromMillis(11));
    page = db->runQuery(times);
    ASSERT_EQ(page.docs.size(), 1u);
    EXPECT_EQ(page.docs[0].key.id(), std::optional<int64_t>(5));
}

TEST_F(QueryTest, TextIsNeitherSortedNorRangeFiltered) {
    db->put(Entity(Key::withId("Note", 1)).set("body", Text{"zebra"}));
    db->put(Entity(Key::withId("Note", 2)).set("body", "apple"));
    db->put(Entity(Key::withId("Note", 3)).set("body", Text{"mango"}));

    Query sorted("Note");
    sorted.order("body");
    auto page = db->runQuery(sorted);
    ASSERT_EQ(page.docs.size(), 1u);
    EXPECT_EQ(page.docs[0].key.id(), std::optional<int64_t>(2));

    Query exact("Note");
    exact.filter("body", FilterOperator::EQUAL, Text{"mango"});
    page = db->runQuery(exact);
    ASSERT_EQ(page.docs.size(), 1u);
    EXPECT_EQ(page.docs[0].key.id(), std::optional<int64_t>(3));

    Query range("Note");
    range.filter("body", FilterOperator::LESS_THAN, Text{"n"});
    EXPECT_THROW(db->runQuery(range), storage::UnsupportedQueryError);
}

TEST_F(QueryTest, TaggedRangeStaysWithinItsTag) {
    db->put(Entity(Key::withId("Review", 1)).set("stars", Rating{40}));
    db->put(Entity(Key::withId("Review", 2)).set("stars", Rating{95}));
    db->put(Entity(Key::withId("Review", 3)).set("stars", Category{"zzz"}));
    db->put(Entity(Key::withId("Review", 4)).set("stars", Rating{70}));

    Query q("Review");
    q.filter("stars", FilterOperator::GREATER_THAN_OR_EQUAL, Rating{50});
    auto page = db->runQuery(q);
    ASSERT_EQ(page.docs.size(), 2u);
    EXPECT_EQ(page.docs[0].key.id(), std::optional<int64_t>(4));
    EXPECT_EQ(page.docs[1].key.id(), std::optional<int64_t>(2));
}

TEST_F(QueryTest, AncestorTakesAComponentSlot) {
    DatastoreConfig config;
    config.app_id = "query_test";
    config.max_query_components = 1;
    Datastore narrow(config, backend);

    Query filtered("Task");
    filtered.filter("done", FilterOperator::EQUAL, false);
    EXPECT_NO_THROW(narrow.runQuery(filtered));

    Query with_ancestor = filtered;
    with_ancestor.hasAncestor(Key::withId("List", 1));
    EXPECT_THROW(narrow.runQuery(with_ancestor), storage::UnsupportedQueryError);
}

TEST_F(QueryTest, CountHonorsOffsetAndLimit) {
    seedScores();
    Query q("Score");
    EXPECT_EQ(db->count(q), 30u);
    q.withOffset(25);
    EXPECT_EQ(db->count(q), 5u);
    q.withOffset(10).withLimit(4);
    EXPECT_EQ(db->count(q), 4u);
}

TEST_F(QueryTest, UnsupportedQueriesNeverReachTheBackend) {
    seedScores();
    size_t finds_before = backend->find_calls;

    Query two("Score");
    two.filter("score", FilterOperator::GREATER_THAN, 1).filter("vals", FilterOperator::LESS_THAN, 3);
    try {
        db->runQuery(two);
        FAIL() << "expected UnsupportedQueryError";
    } catch (const storage::UnsupportedQueryError& e) {
        EXPECT_EQ(e.code, storage::ErrorCode::UNSUPPORTED_QUERY);
        EXPECT_EQ(e.contextValue("query").value_or(""), two.toString());
    }

    Query offset("Score");
    offset.withOffset(1001);
    EXPECT_THROW(db->runQuery(offset), storage::UnsupportedQueryError);
    EXPECT_EQ(backend->find_calls, finds_before);

    // A declared composite index makes the multi-inequality query runnable.
    IndexDescriptor composite;
    composite.kind = "Score";
    composite.properties = {IndexField("score"), IndexField("vals")};
    db->indexManager().declareIndex(composite);
    auto page = db->runQuery(two);
    for (const auto& e : page.docs) {
        EXPECT_GT(e.get("score").as<int64_t>(), 1);
    }
    EXPECT_FALSE(page.docs.empty());
}

TEST_F(QueryTest, QueryHistoryCountsShapes) {
    seedScores();
    Query q("Score");
    q.filter("score", FilterOperator::EQUAL, 3);
    db->runQuery(q);
    q.withLimit(2);
    db->runQuery(q);
    db->count(Query("Score"));

    auto history = db->queryHistory();
    EXPECT_EQ(history[q.shape()], 2u);
    EXPECT_EQ(history[Query("Score").shape()], 1u);
}

TEST_F(QueryTest, TamperedCursorRejected) {
    seedScores();
    Query q("Score");
    q.order("score").withLimit(3);
    auto page = db->runQuery(q);
    ASSERT_TRUE(page.endCursor.has_value());

    Query bad = q;
    bad.startAfter("AAAA" + *page.endCursor);
    try {
        db->runQuery(bad);
        FAIL() << "expected INVALID_CURSOR";
    } catch (const storage::StorageError& e) {
        EXPECT_EQ(e.code, storage::ErrorCode::INVALID_CURSOR);
        EXPECT_TRUE(e.contextValue("query").has_value());
    }
}
