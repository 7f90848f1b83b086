#include <gtest/gtest.h>
#include "provmark/crypto.hpp"
#include "provmark/errors.hpp"
#include "provmark/fingerprint.hpp"
#include <cstdio>
#include <fstream>
#include <string>

namespace {

int bit_difference(const std::string& a, const std::string& b) {
    int bits = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        int x = std::stoi(a.substr(i, 1), nullptr, 16) ^ std::stoi(b.substr(i, 1), nullptr, 16);
        bits += __builtin_popcount(static_cast<unsigned>(x));
    }
    return bits;
}

}  // namespace

TEST(FingerprintTest, HashIsSha256Hex) {
    ASSERT_EQ(ProvMark::Crypto::init(), 0);
    std::string text = "abc";
    std::string hash = ProvMark::ContentFingerprint::hash(ProvMark::byte_vector(text.begin(), text.end()));
    ASSERT_EQ(hash, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    ASSERT_TRUE(ProvMark::ContentFingerprint::is_valid(hash));
}

TEST(FingerprintTest, SingleByteFlipAvalanches) {
    ASSERT_EQ(ProvMark::Crypto::init(), 0);
    ProvMark::byte_vector content(4096);
    for (size_t i = 0; i < content.size(); ++i) {
        content[i] = static_cast<uint8_t>(i * 31 + 7);
    }

    std::string original = ProvMark::ContentFingerprint::hash(content);
    int total = 0;
    const int trials = 16;
    for (int t = 0; t < trials; ++t) {
        ProvMark::byte_vector flipped = content;
        flipped[t * 251 % content.size()] ^= 0x01;
        std::string changed = ProvMark::ContentFingerprint::hash(flipped);
        ASSERT_NE(changed, original);
        total += bit_difference(original, changed);
    }
    // Expect about half of the 256 bits to change; require more than a quarter on average.
    ASSERT_GT(total / trials, 64);
}

TEST(FingerprintTest, HashFileMatchesInMemoryHash) {
    ASSERT_EQ(ProvMark::Crypto::init(), 0);

    // Larger than one read chunk.
    ProvMark::byte_vector content(200 * 1024);
    for (size_t i = 0; i < content.size(); ++i) {
        content[i] = static_cast<uint8_t>(i % 251);
    }
    std::string path = ::testing::TempDir() + "provmark_fingerprint_test.bin";
    {
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(content.data()), static_cast<std::streamsize>(content.size()));
    }

    ASSERT_EQ(ProvMark::ContentFingerprint::hash_file(path), ProvMark::ContentFingerprint::hash(content));
    ASSERT_EQ(ProvMark::ContentFingerprint::read_file(path), content);
    std::remove(path.c_str());
}

TEST(FingerprintTest, MissingFileThrows) {
    ASSERT_THROW(ProvMark::ContentFingerprint::hash_file("/nonexistent/provmark/file"), ProvMark::RuntimeError);
    ASSERT_THROW(ProvMark::ContentFingerprint::read_file("/nonexistent/provmark/file"), ProvMark::RuntimeError);
}

TEST(FingerprintTest, IsValid) {
    ASSERT_TRUE(ProvMark::ContentFingerprint::is_valid(std::string(64, 'f')));
    ASSERT_FALSE(ProvMark::ContentFingerprint::is_valid(std::string(64, 'F')));
    ASSERT_FALSE(ProvMark::ContentFingerprint::is_valid(std::string(63, 'f')));
}
