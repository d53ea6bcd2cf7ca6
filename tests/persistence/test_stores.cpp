/**
 * @file test_stores.cpp
 * @brief Unit tests for the durable key/value stores
 */

#include <gtest/gtest.h>

#include "persistence/JsonFileStore.hpp"
#include "persistence/MemoryStore.hpp"
#include "persistence/SQLiteStore.hpp"

#include "utils/TestHelpers.hpp"

#include <fstream>
#include <memory>

using namespace Tether;
using namespace Tether::Test;

// =============================================================================
// Contract tests shared by every backend
// =============================================================================

enum class Backend { Memory, JsonFile, SQLite };

std::string BackendName(const ::testing::TestParamInfo<Backend>& info) {
    switch (info.param) {
        case Backend::Memory:   return "Memory";
        case Backend::JsonFile: return "JsonFile";
        case Backend::SQLite:   return "SQLite";
    }
    return "Unknown";
}

class DurableStoreContractTest : public ::testing::TestWithParam<Backend> {
protected:
    void SetUp() override {
        m_path = std::make_unique<TempPath>("store");

        switch (GetParam()) {
            case Backend::Memory:
                m_store = std::make_unique<MemoryStore>();
                break;
            case Backend::JsonFile: {
                auto store = std::make_unique<JsonFileStore>(m_path->Get());
                ASSERT_TRUE(store->Open().has_value());
                m_store = std::move(store);
                break;
            }
            case Backend::SQLite: {
                SQLiteStore::Config config;
                config.databasePath = m_path->Get().string();
                auto store = std::make_unique<SQLiteStore>(config);
                ASSERT_TRUE(store->Open().has_value());
                m_store = std::move(store);
                break;
            }
        }
    }

    void TearDown() override {
        m_store.reset();
        m_path.reset();
    }

    IDurableStore& Store() { return *m_store; }

private:
    std::unique_ptr<TempPath> m_path;
    std::unique_ptr<IDurableStore> m_store;
};

TEST_P(DurableStoreContractTest, MissingKeyIsNullopt) {
    EXPECT_FALSE(Store().Get("absent").has_value());
}

TEST_P(DurableStoreContractTest, SetThenGet) {
    ASSERT_TRUE(Store().Set("autosave_doc_backup", R"({"data":1})"));

    auto value = Store().Get("autosave_doc_backup");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(R"({"data":1})", *value);
}

TEST_P(DurableStoreContractTest, SetOverwrites) {
    ASSERT_TRUE(Store().Set("key", "first"));
    ASSERT_TRUE(Store().Set("key", "second"));

    EXPECT_EQ("second", Store().Get("key").value_or(""));
}

TEST_P(DurableStoreContractTest, RemoveDeletesAndToleratesMissingKeys) {
    ASSERT_TRUE(Store().Set("key", "value"));

    EXPECT_TRUE(Store().Remove("key"));
    EXPECT_FALSE(Store().Get("key").has_value());
    EXPECT_TRUE(Store().Remove("key"));
}

TEST_P(DurableStoreContractTest, KeysFiltersByPrefix) {
    ASSERT_TRUE(Store().Set("autosave_a_backup", "1"));
    ASSERT_TRUE(Store().Set("autosave_a_queue", "2"));
    ASSERT_TRUE(Store().Set("autosave_b_backup", "3"));
    ASSERT_TRUE(Store().Set("other", "4"));

    EXPECT_EQ((std::vector<std::string>{"autosave_a_backup", "autosave_a_queue"}), Store().Keys("autosave_a_"));
    EXPECT_EQ(4u, Store().Keys().size());
}

TEST_P(DurableStoreContractTest, KeysTreatsPrefixLiterally) {
    ASSERT_TRUE(Store().Set("50%_off", "1"));
    ASSERT_TRUE(Store().Set("50x_off", "2"));

    EXPECT_EQ((std::vector<std::string>{"50%_off"}), Store().Keys("50%"));
}

INSTANTIATE_TEST_SUITE_P(Backends, DurableStoreContractTest,
                         ::testing::Values(Backend::Memory, Backend::JsonFile, Backend::SQLite),
                         BackendName);

// =============================================================================
// MemoryStore
// =============================================================================

TEST(MemoryStoreTest, FailWritesLeavesContentsUntouched) {
    MemoryStore store;
    ASSERT_TRUE(store.Set("key", "value"));

    store.SetFailWrites(true);
    EXPECT_FALSE(store.Set("key", "changed"));
    EXPECT_FALSE(store.Remove("key"));
    EXPECT_EQ("value", store.Get("key").value_or(""));

    store.SetFailWrites(false);
    EXPECT_TRUE(store.Set("key", "changed"));
    EXPECT_EQ(1u, store.Size());
}

// =============================================================================
// JsonFileStore
// =============================================================================

TEST(JsonFileStoreTest, ValuesSurviveReopen) {
    TempPath path("store.json");
    {
        JsonFileStore store(path.Get());
        ASSERT_TRUE(store.Open().has_value());
        ASSERT_TRUE(store.Set("autosave_doc_backup", R"({"data":{"name":"Ada"}})"));
    }

    JsonFileStore reopened(path.Get());
    ASSERT_TRUE(reopened.Open().has_value());
    EXPECT_EQ(R"({"data":{"name":"Ada"}})", reopened.Get("autosave_doc_backup").value_or(""));
}

TEST(JsonFileStoreTest, CorruptedFileIsReported) {
    TempPath path("corrupt.json");
    {
        std::ofstream file(path.Get());
        file << "[1, 2, 3]";
    }

    JsonFileStore store(path.Get());
    auto result = store.Open();

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(StoreError::Corrupted, result.error());
    EXPECT_FALSE(store.Set("key", "value"));
}

TEST(JsonFileStoreTest, WritesBeforeOpenFail) {
    TempPath path("unopened.json");
    JsonFileStore store(path.Get());

    EXPECT_FALSE(store.Set("key", "value"));
}

// =============================================================================
// SQLiteStore
// =============================================================================

TEST(SQLiteStoreTest, ValuesSurviveReopen) {
    TempPath path("store.db");
    SQLiteStore::Config config;
    config.databasePath = path.Get().string();
    {
        SQLiteStore store(config);
        ASSERT_TRUE(store.Open().has_value());
        ASSERT_TRUE(store.Set("autosave_doc_queue", "[]"));
    }

    SQLiteStore reopened(config);
    ASSERT_TRUE(reopened.Open().has_value());
    EXPECT_TRUE(reopened.IsOpen());
    EXPECT_EQ("[]", reopened.Get("autosave_doc_queue").value_or(""));
}

TEST(SQLiteStoreTest, OperationsFailWhenClosed) {
    TempPath path("closed.db");
    SQLiteStore::Config config;
    config.databasePath = path.Get().string();
    SQLiteStore store(config);

    EXPECT_FALSE(store.IsOpen());
    EXPECT_FALSE(store.Set("key", "value"));
    EXPECT_FALSE(store.Get("key").has_value());
    EXPECT_TRUE(store.Keys().empty());
}

TEST(SQLiteStoreTest, OpenTwiceIsHarmless) {
    TempPath path("twice.db");
    SQLiteStore::Config config;
    config.databasePath = path.Get().string();
    SQLiteStore store(config);

    ASSERT_TRUE(store.Open().has_value());
    EXPECT_TRUE(store.Open().has_value());
    store.Close();
    store.Close();
    EXPECT_FALSE(store.IsOpen());
}
