#ifndef PROVMARK_KEYS_HPP
#define PROVMARK_KEYS_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ProvMark {

    using byte_vector = std::vector<uint8_t>;

    constexpr size_t PUBLIC_KEY_BYTES = 32;
    constexpr size_t PRIVATE_KEY_BYTES = 32;  // Ed25519 seed
    constexpr size_t SIGNATURE_BYTES = 64;

    // An Ed25519 public key (32 bytes).
    struct PublicKey {
        byte_vector data;
    };

    // An Ed25519 private key, held as its 32-byte seed.
    struct PrivateKey {
        byte_vector data;
    };

    // A key pair consisting of a public and a private key.
    struct KeyPair {
        PublicKey publicKey;
        PrivateKey privateKey;
    };

    // A detached Ed25519 signature (64 bytes).
    struct Signature {
        byte_vector data;
    };

    // Key pair in its external form: lowercase hex for both halves.
    struct KeyPairHex {
        std::string private_key;
        std::string public_key;
    };

} // namespace ProvMark

#endif // PROVMARK_KEYS_HPP
