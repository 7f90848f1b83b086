#include "provmark/identity.hpp"

#include <sodium.h>

#include <cstring>
#include <iterator>

#include "provmark/crypto.hpp"
#include "provmark/encoding.hpp"
#include "provmark/errors.hpp"

namespace ProvMark {

KeyPairHex IdentityKeyManager::generate_keypair() {
    KeyPair kp = Crypto::generate_sign_keypair();

    KeyPairHex out;
    out.private_key = Encoding::to_hex(kp.privateKey.data);
    out.public_key = Encoding::to_hex(kp.publicKey.data);
    sodium_memzero(kp.privateKey.data.data(), kp.privateKey.data.size());
    return out;
}

std::string IdentityKeyManager::public_key_from_private(const std::string& private_key_hex) {
    PrivateKey sk = parse_private_key(private_key_hex);
    PublicKey pk = Crypto::public_key_from_private(sk);
    sodium_memzero(sk.data.data(), sk.data.size());
    return Encoding::to_hex(pk.data);
}

std::string IdentityKeyManager::derive_did(const std::string& public_key_hex) {
    PublicKey pk = parse_public_key(public_key_hex);

    byte_vector tagged;
    tagged.reserve(sizeof(ED25519_MULTICODEC) + pk.data.size());
    tagged.insert(tagged.end(), std::begin(ED25519_MULTICODEC), std::end(ED25519_MULTICODEC));
    tagged.insert(tagged.end(), pk.data.begin(), pk.data.end());

    return std::string(DID_KEY_PREFIX) + Encoding::to_base58(tagged);
}

std::string IdentityKeyManager::public_key_from_did(const std::string& did) {
    const size_t prefix_len = std::strlen(DID_KEY_PREFIX);
    if (did.compare(0, prefix_len, DID_KEY_PREFIX) != 0) {
        throw MalformedInput("Not a base58btc did:key identifier.");
    }

    byte_vector tagged = Encoding::from_base58(did.substr(prefix_len));
    if (tagged.size() != sizeof(ED25519_MULTICODEC) + PUBLIC_KEY_BYTES ||
        tagged[0] != ED25519_MULTICODEC[0] || tagged[1] != ED25519_MULTICODEC[1]) {
        throw MalformedInput("did:key does not carry an Ed25519 public key.");
    }

    return Encoding::to_hex(byte_vector(tagged.begin() + sizeof(ED25519_MULTICODEC), tagged.end()));
}

PublicKey IdentityKeyManager::parse_public_key(const std::string& public_key_hex) {
    PublicKey pk;
    pk.data = Encoding::from_hex(public_key_hex, PUBLIC_KEY_BYTES);
    return pk;
}

PrivateKey IdentityKeyManager::parse_private_key(const std::string& private_key_hex) {
    PrivateKey sk;
    sk.data = Encoding::from_hex(private_key_hex, PRIVATE_KEY_BYTES);
    return sk;
}

} // namespace ProvMark
