#include <gtest/gtest.h>
#include "provmark/crypto.hpp"
#include "provmark/encoding.hpp"
#include "provmark/errors.hpp"
#include "provmark/identity.hpp"
#include <string>

TEST(IdentityTest, GenerateKeypairHex) {
    ASSERT_EQ(ProvMark::Crypto::init(), 0);

    ProvMark::KeyPairHex keys = ProvMark::IdentityKeyManager::generate_keypair();
    ASSERT_TRUE(ProvMark::Encoding::is_lower_hex(keys.private_key, 64));
    ASSERT_TRUE(ProvMark::Encoding::is_lower_hex(keys.public_key, 64));
    ASSERT_EQ(ProvMark::IdentityKeyManager::public_key_from_private(keys.private_key), keys.public_key);

    ProvMark::KeyPairHex other = ProvMark::IdentityKeyManager::generate_keypair();
    ASSERT_NE(keys.private_key, other.private_key);
}

TEST(IdentityTest, DidKeyFormat) {
    ASSERT_EQ(ProvMark::Crypto::init(), 0);
    ProvMark::KeyPairHex keys = ProvMark::IdentityKeyManager::generate_keypair();

    std::string did = ProvMark::IdentityKeyManager::derive_did(keys.public_key);

    // The Ed25519 multicodec prefix always encodes to "6Mk" in base58btc.
    ASSERT_EQ(did.rfind("did:key:z6Mk", 0), 0u);
    ASSERT_EQ(did, ProvMark::IdentityKeyManager::derive_did(keys.public_key));
    ASSERT_EQ(ProvMark::IdentityKeyManager::public_key_from_did(did), keys.public_key);
}

TEST(IdentityTest, DistinctKeysGiveDistinctDids) {
    ASSERT_EQ(ProvMark::Crypto::init(), 0);
    ProvMark::KeyPairHex a = ProvMark::IdentityKeyManager::generate_keypair();
    ProvMark::KeyPairHex b = ProvMark::IdentityKeyManager::generate_keypair();
    ASSERT_NE(ProvMark::IdentityKeyManager::derive_did(a.public_key),
              ProvMark::IdentityKeyManager::derive_did(b.public_key));
}

TEST(IdentityTest, MalformedKeysAreRejected) {
    ASSERT_THROW(ProvMark::IdentityKeyManager::derive_did("abcd"), ProvMark::MalformedInput);
    ASSERT_THROW(ProvMark::IdentityKeyManager::derive_did(std::string(64, 'x')), ProvMark::MalformedInput);
    ASSERT_THROW(ProvMark::IdentityKeyManager::public_key_from_private(std::string(62, 'a')),
                 ProvMark::MalformedInput);
}

TEST(IdentityTest, MalformedDidsAreRejected) {
    ASSERT_THROW(ProvMark::IdentityKeyManager::public_key_from_did("did:web:example.com"), ProvMark::MalformedInput);
    ASSERT_THROW(ProvMark::IdentityKeyManager::public_key_from_did("did:key:z0OIl"), ProvMark::MalformedInput);
    // Valid base58 but not an Ed25519 multicodec key.
    ASSERT_THROW(ProvMark::IdentityKeyManager::public_key_from_did("did:key:z2NEpo7TZRRrLZSi2U"),
                 ProvMark::MalformedInput);
}
