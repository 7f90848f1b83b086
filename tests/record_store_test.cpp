#include <gtest/gtest.h>
#include "provmark/crypto.hpp"
#include "provmark/encoding.hpp"
#include "provmark/errors.hpp"
#include "provmark/record_store.hpp"
#include "test_records.hpp"
#include <nlohmann/json.hpp>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <string>

class RecordStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(ProvMark::Crypto::init(), 0);
        keys_ = ProvMark::IdentityKeyManager::generate_keypair();
    }

    ProvMark::ProvenanceRecord record(const std::string& content, const std::string& signed_at) {
        return ProvMark::test::signed_record(keys_, content, signed_at);
    }

    ProvMark::KeyPairHex keys_;
};

TEST_F(RecordStoreTest, CreateAssignsIdAndCreatedAt) {
    ProvMark::InMemoryRecordStore store;
    std::string id = store.create(record("a", "2024-01-01T00:00:00.000Z"));

    ASSERT_TRUE(ProvMark::Encoding::is_lower_hex(id, 32));
    auto stored = store.find_by_id(id);
    ASSERT_TRUE(stored.has_value());
    ASSERT_EQ(stored->id, id);
    ASSERT_FALSE(stored->created_at.empty());
    ASSERT_EQ(store.count(), 1u);
    ASSERT_FALSE(store.find_by_id("missing").has_value());
}

TEST_F(RecordStoreTest, DuplicateIdAndBadTimestampAreRejected) {
    ProvMark::InMemoryRecordStore store;
    ProvMark::ProvenanceRecord r = record("a", "2024-01-01T00:00:00.000Z");
    r.id = "fixed";
    ASSERT_EQ(store.create(r), "fixed");
    ASSERT_THROW(store.create(r), ProvMark::LogicError);

    ProvMark::ProvenanceRecord bad = record("b", "2024-01-01T00:00:00.000Z");
    bad.signed_at = "yesterday";
    ASSERT_THROW(store.create(bad), ProvMark::MalformedInput);
    ASSERT_EQ(store.count(), 1u);
}

TEST_F(RecordStoreTest, FindByContentHashIsEarliestFirst) {
    ProvMark::InMemoryRecordStore store;
    std::string late = store.create(record("same", "2024-03-01T00:00:00.000Z"));
    std::string early = store.create(record("same", "2024-01-01T00:00:00.000Z"));
    store.create(record("other", "2024-02-01T00:00:00.000Z"));

    auto hits = store.find_by_content_hash(record("same", "2024-01-01T00:00:00.000Z").content_hash);
    ASSERT_EQ(hits.size(), 2u);
    ASSERT_EQ(hits[0].id, early);
    ASSERT_EQ(hits[1].id, late);
}

TEST_F(RecordStoreTest, ListRecentIsNewestFirstAndLimited) {
    ProvMark::InMemoryRecordStore store;
    store.create(record("1", "2024-01-01T00:00:00.000Z"));
    std::string newest = store.create(record("3", "2024-03-01T00:00:00.000Z"));
    std::string middle = store.create(record("2", "2024-02-01T00:00:00.000Z"));

    auto recent = store.list_recent(2);
    ASSERT_EQ(recent.size(), 2u);
    ASSERT_EQ(recent[0].id, newest);
    ASSERT_EQ(recent[1].id, middle);
    ASSERT_EQ(store.list_recent(50).size(), 3u);
}

TEST_F(RecordStoreTest, PerceptualCandidatesAndRemove) {
    ProvMark::InMemoryRecordStore store;
    std::string with_hash =
        store.create(ProvMark::test::signed_record(keys_, "img", "2024-01-01T00:00:00.000Z", "0123456789abcdef"));
    store.create(record("text", "2024-01-01T00:00:00.000Z"));

    auto candidates = store.find_all_with_perceptual_hash();
    ASSERT_EQ(candidates.size(), 1u);
    ASSERT_EQ(candidates[0].id, with_hash);

    ASSERT_TRUE(store.remove(with_hash));
    ASSERT_FALSE(store.remove(with_hash));
    ASSERT_TRUE(store.find_all_with_perceptual_hash().empty());
    ASSERT_EQ(store.count(), 1u);
}

TEST_F(RecordStoreTest, JsonFileStorePersistsAcrossInstances) {
    std::string path = ::testing::TempDir() + "provmark_store_test.json";
    std::remove(path.c_str());

    std::string kept;
    {
        ProvMark::JsonFileRecordStore store(path);
        ASSERT_EQ(store.count(), 0u);
        kept = store.create(record("keep", "2024-01-01T00:00:00.000Z"));
        std::string dropped = store.create(record("drop", "2024-01-02T00:00:00.000Z"));
        ASSERT_TRUE(store.remove(dropped));
    }

    ProvMark::JsonFileRecordStore reopened(path);
    ASSERT_EQ(reopened.count(), 1u);
    auto stored = reopened.find_by_id(kept);
    ASSERT_TRUE(stored.has_value());
    ASSERT_EQ(stored->content_hash, record("keep", "2024-01-01T00:00:00.000Z").content_hash);
    std::remove(path.c_str());
}

TEST_F(RecordStoreTest, CorruptFileIsStoreError) {
    std::string path = ::testing::TempDir() + "provmark_corrupt_store.json";
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    ASSERT_THROW(ProvMark::JsonFileRecordStore store(path), ProvMark::StoreError);

    {
        std::ofstream out(path, std::ios::trunc);
        out << "{\"records\": [{\"title\": \"no other fields\"}]}";
    }
    ASSERT_THROW(ProvMark::JsonFileRecordStore store(path), ProvMark::StoreError);
    std::remove(path.c_str());
}

TEST_F(RecordStoreTest, DuplicateIdInFileIsStoreError) {
    std::string path = ::testing::TempDir() + "provmark_duplicate_store.json";

    // 1. Two different records under the same id
    ProvMark::ProvenanceRecord first = record("first", "2024-01-01T00:00:00.000Z");
    ProvMark::ProvenanceRecord second = record("second", "2024-01-02T00:00:00.000Z");
    first.id = "shared";
    second.id = "shared";
    nlohmann::json doc{{"records", nlohmann::json::array({first, second})}};
    const std::string contents = doc.dump();
    {
        std::ofstream out(path, std::ios::trunc);
        out << contents;
    }

    // 2. Loading refuses instead of dropping one of them
    ASSERT_THROW(ProvMark::JsonFileRecordStore store(path), ProvMark::StoreError);

    // 3. The file is untouched
    std::ifstream in(path);
    std::string on_disk((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    ASSERT_EQ(on_disk, contents);
    std::remove(path.c_str());
}

TEST_F(RecordStoreTest, FailedPersistRollsBack) {
    ProvMark::JsonFileRecordStore store("/nonexistent-provmark-dir/records.json");
    ASSERT_THROW(store.create(record("a", "2024-01-01T00:00:00.000Z")), ProvMark::StoreError);
    ASSERT_EQ(store.count(), 0u);
}
