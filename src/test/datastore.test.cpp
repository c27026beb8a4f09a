// @src/test/datastore.test.cpp
#include "test_utils.h"
#include "../../include/datastore.h"
#include "memory_backend.h"

#include <fstream>
#include <limits>

class DatastoreTest : public ::testing::Test {
protected:
    std::shared_ptr<MemoryDocumentBackend> backend;
    std::unique_ptr<Datastore> db;

    DatastoreConfig makeConfig() {
        DatastoreConfig config;
        config.app_id = "datastore_test";
        return config;
    }

    // A second Datastore over the same backend behaves like a restarted process.
    void reopen() {
        db.reset();
        db = std::make_unique<Datastore>(makeConfig(), backend);
    }

    void SetUp() override {
        backend = std::make_shared<MemoryDocumentBackend>();
        db = std::make_unique<Datastore>(makeConfig(), backend);
    }

    void TearDown() override {
        db.reset();
    }
};

TEST_F(DatastoreTest, TaskScenarioAllocatesSequentialIds) {
    Entity first(Key::incomplete("Task"));
    first.set("title", "a").set("done", false);

    Key k1 = db->put(first);
    ASSERT_TRUE(k1.isComplete());
    EXPECT_EQ(k1.id(), std::optional<int64_t>(1));

    auto loaded = db->get(k1);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->properties.size(), 2u);
    EXPECT_EQ(loaded->get("title"), PropertyValue("a"));
    EXPECT_EQ(loaded->get("done"), PropertyValue(false));

    Key k2 = db->put(first);
    EXPECT_EQ(k2.id(), std::optional<int64_t>(2));
    EXPECT_NE(k1, k2);
}

TEST_F(DatastoreTest, IdsStayMonotonicAfterDeleteAndReopen) {
    Key k1 = db->put(Entity(Key::incomplete("Task")));
    Key k2 = db->put(Entity(Key::incomplete("Task")));
    EXPECT_TRUE(db->remove(k2));

    reopen();

    EXPECT_TRUE(db->get(k1).has_value());
    EXPECT_FALSE(db->get(k2).has_value());
    Key k3 = db->put(Entity(Key::incomplete("Task")));
    EXPECT_EQ(k3.id(), std::optional<int64_t>(3));
}

TEST_F(DatastoreTest, PutOverwritesWholeEntity) {
    Key key = Key::withName("Profile", "alice");
    Entity v1(key);
    v1.set("age", 30).set("city", "Accra");
    db->put(v1);

    Entity v2(key);
    v2.set("age", 31);
    db->put(v2);

    auto loaded = db->get(key);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, v2);
    EXPECT_FALSE(loaded->has("city"));
}

TEST_F(DatastoreTest, AncestorIsolation) {
    Key left = Key::withId("Item", 1, Key::withName("Box", "left"));
    Key right = Key::withId("Item", 1, Key::withName("Box", "right"));
    db->put(Entity(left).set("side", "L"));
    db->put(Entity(right).set("side", "R"));

    EXPECT_EQ(db->get(left)->get("side"), PropertyValue("L"));
    EXPECT_EQ(db->get(right)->get("side"), PropertyValue("R"));

    Query q("Item");
    q.hasAncestor(Key::withName("Box", "left"));
    auto page = db->runQuery(q);
    ASSERT_EQ(page.docs.size(), 1u);
    EXPECT_EQ(page.docs[0].key, left);
}

TEST_F(DatastoreTest, AllTypesSurviveRestart) {
    Entity e(Key::withName("Sample", "all"));
    e.set("null", PropertyValue())
     .set("int", int64_t{-7})
     .set("double", 2.0)
     .set("bool", true)
     .set("text", "héllo")
     .set("blob", Blob{0, 1, 2, 255})
     .set("when", Timestamp::fromMillis(1234567))
     .set("where", GeoPt{-33.9, 18.4})
     .set("ref", Key::withId("Other", 9, Key::withName("Root", "r")))
     .set("empty", PropertyList{})
     .set("mixed", PropertyList{PropertyValue(1), PropertyValue("x"), PropertyValue(Timestamp::fromMillis(2))});
    db->put(e);

    reopen();

    auto loaded = db->get(e.key);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, e);
}

TEST_F(DatastoreTest, BatchOperations) {
    std::vector<Entity> entities;
    for (int i = 0; i < 5; ++i) {
        entities.push_back(Entity(Key::incomplete("Note")).set("n", i));
    }
    std::vector<Key> keys = db->putMulti(entities);
    ASSERT_EQ(keys.size(), 5u);

    std::vector<Key> lookup = {keys[0], Key::withId("Note", 999), keys[4]};
    auto found = db->getMulti(lookup);
    ASSERT_EQ(found.size(), 3u);
    EXPECT_TRUE(found[0].has_value());
    EXPECT_FALSE(found[1].has_value());
    EXPECT_EQ(found[2]->get("n"), PropertyValue(4));

    EXPECT_EQ(db->removeMulti({keys[0], keys[1], Key::withId("Note", 999)}), 2u);
    EXPECT_EQ(db->count(Query("Note")), 3u);
}

TEST_F(DatastoreTest, AllocateIdsReservesRange) {
    Key parent = Key::withName("Org", "acme");
    auto keys = db->allocateIds(Key::incomplete("Member", parent), 3);
    ASSERT_EQ(keys.size(), 3u);
    EXPECT_EQ(keys[0].id(), std::optional<int64_t>(1));
    EXPECT_EQ(keys[2].id(), std::optional<int64_t>(3));
    EXPECT_EQ(keys[1].parent(), std::optional<Key>(parent));

    Key next = db->put(Entity(Key::incomplete("Member", parent)));
    EXPECT_EQ(next.id(), std::optional<int64_t>(4));

    EXPECT_THROW(db->allocateIds(Key::withId("Member", 1), 2), storage::StorageError);
    EXPECT_TRUE(db->allocateIds(Key::incomplete("Member"), 0).empty());
}

TEST_F(DatastoreTest, FailuresNameTheOperation) {
    Entity bad(Key::withName("Task", "t1"));
    PropertyList inner = {PropertyValue(1)};
    bad.set("nested", PropertyList{PropertyValue(inner)});
    try {
        db->put(bad);
        FAIL() << "expected UnsupportedTypeError";
    } catch (const storage::UnsupportedTypeError& e) {
        EXPECT_EQ(e.contextValue("key").value_or(""), bad.key.toString());
        EXPECT_EQ(e.contextValue("property").value_or(""), "nested");
    }

    try {
        db->get(Key::withId("__Internal__", 1));
        FAIL() << "expected INVALID_KEY";
    } catch (const storage::StorageError& e) {
        EXPECT_EQ(e.code, storage::ErrorCode::INVALID_KEY);
        EXPECT_TRUE(e.contextValue("key").has_value());
    }

    EXPECT_THROW(db->put(Entity(Key::withId("Child", 1, Key::incomplete("Parent")))), storage::StorageError);
}

TEST_F(DatastoreTest, UnboundedLimitReturnsEverything) {
    for (int i = 0; i < 4; ++i) db->put(Entity(Key::incomplete("Task")).set("n", i));

    Query q("Task");
    q.withLimit(std::numeric_limits<size_t>::max());
    auto page = db->runQuery(q);
    EXPECT_EQ(page.docs.size(), 4u);
    EXPECT_FALSE(page.hasNextPage);

    Query bounded("Task");
    bounded.withLimit(3);
    auto first = db->runQuery(bounded);
    EXPECT_EQ(first.docs.size(), 3u);
    EXPECT_TRUE(first.hasNextPage);
}

TEST(DatastoreConfigTest, ParsesAndValidates) {
    nlohmann::json j = {
        {"app_id", "shop"},
        {"require_indexes", true},
        {"max_query_offset", 50},
        {"backend", {{"host", "db.internal"}, {"port", 27018}, {"operation_timeout_ms", 250}}}
    };
    DatastoreConfig config = DatastoreConfig::fromJson(j);
    EXPECT_EQ(config.app_id, "shop");
    EXPECT_TRUE(config.require_indexes);
    EXPECT_EQ(config.max_query_offset, 50u);
    EXPECT_EQ(config.max_query_components, 100u);
    EXPECT_EQ(config.backend.endpoint.host, "db.internal");
    EXPECT_EQ(config.backend.endpoint.port, 27018);
    EXPECT_EQ(config.backend.operation_timeout.count(), 250);
    EXPECT_FALSE(config.index_declaration_path.has_value());
    EXPECT_EQ(config.queryLimits().max_offset, 50u);

    auto expectInvalid = [](const nlohmann::json& bad) {
        try {
            DatastoreConfig::fromJson(bad);
            ADD_FAILURE() << "accepted " << bad.dump();
        } catch (const storage::StorageError& e) {
            EXPECT_EQ(e.code, storage::ErrorCode::INVALID_CONFIGURATION) << bad.dump();
        }
    };
    expectInvalid(nlohmann::json::object());
    expectInvalid({{"app_id", "../escape"}});
    expectInvalid({{"app_id", "shop.eu"}});
    expectInvalid({{"app_id", "has space"}});
    expectInvalid({{"app_id", std::string(DatastoreConfig::MAX_APP_ID_LENGTH + 1, 'a')}});
    expectInvalid({{"app_id", "ok"}, {"backend", {{"port", 0}}}});
    expectInvalid({{"app_id", "ok"}, {"backend", {{"operation_timeout_ms", -1}}}});
    expectInvalid({{"app_id", "ok"}, {"max_query_components", 0}});
    expectInvalid({{"app_id", 12}});
    expectInvalid(nlohmann::json::array());
}

TEST(DatastoreConfigTest, LoadsFromFile) {
    std::string dir = makeTestDir("config");
    std::string path = dir + "/kindred.json";
    {
        std::ofstream out(path);
        out << R"({"app_id": "from_file", "backend": {"host": "mongo-1", "port": 27019}})";
    }
    DatastoreConfig config = DatastoreConfig::fromJsonFile(path);
    EXPECT_EQ(config.app_id, "from_file");
    EXPECT_EQ(config.backend.endpoint.host, "mongo-1");
    EXPECT_EQ(config.backend.endpoint.port, 27019);

    EXPECT_THROW(DatastoreConfig::fromJsonFile(dir + "/missing.json"), storage::StorageError);
    {
        std::ofstream out(path, std::ios::trunc);
        out << "{ not json";
    }
    EXPECT_THROW(DatastoreConfig::fromJsonFile(path), storage::StorageError);
    removeTestDir(dir);
}
