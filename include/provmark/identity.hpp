#ifndef PROVMARK_IDENTITY_HPP
#define PROVMARK_IDENTITY_HPP

#include "keys.hpp"

#include <string>

namespace ProvMark {

    // Multicodec tag for an Ed25519 public key (varint 0xed).
    constexpr uint8_t ED25519_MULTICODEC[2] = {0xed, 0x01};

    // "did:key:" scheme plus the multibase marker for base58btc.
    constexpr char DID_KEY_PREFIX[] = "did:key:z";

    /**
     * @brief Key pair creation and did:key identity derivation.
     *
     * The identity string is a pure function of the public key, so two
     * callers holding the same key always arrive at the same DID without
     * any registry.
     */
    class IdentityKeyManager {
    public:
        /**
         * @brief Generates a fresh Ed25519 key pair.
         * @return Both halves as lowercase hex (64 characters each).
         * @throws ProvMark::RandomSourceUnavailable if no secure randomness is available.
         */
        static KeyPairHex generate_keypair();

        /**
         * @brief Re-derives the public key for a hex private key.
         * @throws ProvMark::MalformedInput if the key is not 64 hex characters.
         */
        static std::string public_key_from_private(const std::string& private_key_hex);

        /**
         * @brief did:key:z<base58btc(0xed 0x01 || public key)>.
         * @throws ProvMark::MalformedInput if the key is not 64 hex characters.
         */
        static std::string derive_did(const std::string& public_key_hex);

        /**
         * @brief Recovers the hex public key embedded in a did:key identity.
         * @throws ProvMark::MalformedInput if the DID is not an Ed25519 did:key.
         */
        static std::string public_key_from_did(const std::string& did);

        static PublicKey parse_public_key(const std::string& public_key_hex);
        static PrivateKey parse_private_key(const std::string& private_key_hex);
    };

} // namespace ProvMark

#endif // PROVMARK_IDENTITY_HPP
