#include <gtest/gtest.h>
#include "provmark/crypto.hpp"
#include "provmark/errors.hpp"
#include "provmark/match_resolver.hpp"
#include "provmark/record_store.hpp"
#include "test_records.hpp"
#include <string>

namespace {

const std::string BASE_PHASH = "0000000000000000";

// Flips the lowest `bits` bits of the first nibbles.
std::string phash_at_distance(int bits) {
    std::string hash = BASE_PHASH;
    for (int i = 0; i < bits; ++i) {
        int nibble = i / 4;
        int value = std::stoi(hash.substr(nibble, 1), nullptr, 16) | (1 << (i % 4));
        hash[nibble] = "0123456789abcdef"[value];
    }
    return hash;
}

}  // namespace

class MatchResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(ProvMark::Crypto::init(), 0);
        keys_ = ProvMark::IdentityKeyManager::generate_keypair();
    }

    std::string add(const std::string& content, const std::optional<std::string>& phash = std::nullopt,
                    const std::string& signed_at = "2024-01-01T00:00:00.000Z") {
        return store_.create(ProvMark::test::signed_record(keys_, content, signed_at, phash));
    }

    std::string hash_of(const std::string& content) {
        return ProvMark::test::signed_record(keys_, content, "2024-01-01T00:00:00.000Z").content_hash;
    }

    ProvMark::KeyPairHex keys_;
    ProvMark::InMemoryRecordStore store_;
};

TEST_F(MatchResolverTest, ExactMatchWinsOverPerceptual) {
    std::string id = add("exact", phash_at_distance(0));
    add("similar", phash_at_distance(1));

    ProvMark::MatchResolver resolver(store_);
    ProvMark::MatchResult result = resolver.resolve(hash_of("exact"), BASE_PHASH);
    ASSERT_EQ(result.status, ProvMark::MatchStatus::FOUND);
    ASSERT_EQ(result.matches.size(), 1u);
    ASSERT_EQ(result.matches[0].record.id, id);
    ASSERT_FALSE(result.matches[0].distance.has_value());
}

TEST_F(MatchResolverTest, PerceptualFallbackRanksByDistance) {
    std::string far = add("far", phash_at_distance(9));
    std::string near = add("near", phash_at_distance(2));
    std::string same = add("same", phash_at_distance(0));
    add("too-far", phash_at_distance(11));
    add("no-phash");

    ProvMark::MatchResolver resolver(store_);
    ProvMark::MatchResult result = resolver.resolve(hash_of("query"), BASE_PHASH);
    ASSERT_EQ(result.status, ProvMark::MatchStatus::PERCEPTUAL_MATCH);
    ASSERT_EQ(result.matches.size(), 3u);
    ASSERT_EQ(result.matches[0].record.id, same);
    ASSERT_EQ(*result.matches[0].distance, 0);
    ASSERT_EQ(result.matches[1].record.id, near);
    ASSERT_EQ(*result.matches[1].distance, 2);
    ASSERT_EQ(result.matches[2].record.id, far);
    ASSERT_EQ(*result.matches[2].distance, 9);
}

TEST_F(MatchResolverTest, ThresholdIsInclusive) {
    add("edge", phash_at_distance(10));
    ProvMark::MatchResolver resolver(store_);
    ASSERT_EQ(resolver.resolve(hash_of("query"), BASE_PHASH).status, ProvMark::MatchStatus::PERCEPTUAL_MATCH);

    ProvMark::MatchResolver strict(store_, 9);
    ASSERT_EQ(strict.resolve(hash_of("query"), BASE_PHASH).status, ProvMark::MatchStatus::NOT_FOUND);
}

TEST_F(MatchResolverTest, NotFoundWithoutPerceptualHash) {
    add("stored", phash_at_distance(0));
    ProvMark::MatchResolver resolver(store_);
    ProvMark::MatchResult result = resolver.resolve(hash_of("query"));
    ASSERT_EQ(result.status, ProvMark::MatchStatus::NOT_FOUND);
    ASSERT_TRUE(result.matches.empty());
}

TEST_F(MatchResolverTest, MalformedHashesAreRejected) {
    ProvMark::MatchResolver resolver(store_);
    ASSERT_THROW(resolver.resolve("abc"), ProvMark::MalformedInput);
    ASSERT_THROW(resolver.resolve(std::string(64, 'A')), ProvMark::MalformedInput);
    ASSERT_THROW(resolver.resolve(hash_of("q"), std::string("123")), ProvMark::MalformedInput);
}

TEST_F(MatchResolverTest, IncomparableCandidatesAreSkipped) {
    ProvMark::MatchResolver resolver(store_);
    std::vector<ProvMark::ProvenanceRecord> candidates(3);
    candidates[0].perceptual_hash = "00000000";           // wrong length
    candidates[1].perceptual_hash = "zzzzzzzzzzzzzzzz";   // not hex
    candidates[2].perceptual_hash = phash_at_distance(3);
    candidates[2].id = "ok";

    auto matches = resolver.rank_perceptual(BASE_PHASH, candidates);
    ASSERT_EQ(matches.size(), 1u);
    ASSERT_EQ(matches[0].record.id, "ok");
}

TEST_F(MatchResolverTest, LargeCandidateSetsMatchSequentialRanking) {
    ProvMark::MatchResolver resolver(store_);
    const size_t count = ProvMark::MatchResolver::PARALLEL_MIN_CANDIDATES * 2 + 7;
    std::vector<ProvMark::ProvenanceRecord> candidates(count);
    for (size_t i = 0; i < count; ++i) {
        candidates[i].id = std::to_string(i);
        candidates[i].perceptual_hash = phash_at_distance(static_cast<int>(i % 16));
    }

    auto matches = resolver.rank_perceptual(BASE_PHASH, candidates);

    size_t expected = 0;
    for (size_t i = 0; i < count; ++i) {
        if (i % 16 <= 10) {
            ++expected;
        }
    }
    ASSERT_EQ(matches.size(), expected);
    for (size_t i = 1; i < matches.size(); ++i) {
        ASSERT_LE(*matches[i - 1].distance, *matches[i].distance);
    }
    // Stable: equal distances keep store order.
    ASSERT_EQ(matches[0].record.id, "0");
    ASSERT_EQ(matches[1].record.id, "16");
}

TEST(MatchStatusTest, NamesRoundTrip) {
    ASSERT_EQ(ProvMark::parse_match_status("PERCEPTUAL_MATCH"), ProvMark::MatchStatus::PERCEPTUAL_MATCH);
    ASSERT_STREQ(ProvMark::to_string(ProvMark::MatchStatus::HASH_MISMATCH), "HASH_MISMATCH");
    ASSERT_THROW(ProvMark::parse_match_status("found"), ProvMark::MalformedInput);
}
