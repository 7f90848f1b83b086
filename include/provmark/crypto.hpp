#ifndef PROVMARK_CRYPTO_HPP
#define PROVMARK_CRYPTO_HPP

#include "keys.hpp"

#include <string>

namespace ProvMark {

    constexpr size_t SHA256_BYTES = 32;

    /**
     * @brief Thin wrapper over the libsodium primitives the protocol needs:
     *        Ed25519, SHA-256 and the system CSPRNG.
     *
     * All functions are stateless apart from the one-time library
     * initialisation and are safe to call from any thread.
     */
    class Crypto {
    public:
        /**
         * @brief Initializes the cryptographic library. Safe to call repeatedly.
         * @return 0 on success, -1 on error.
         */
        static int init();

        /**
         * @brief Generates a fresh Ed25519 key pair from 32 bytes of secure randomness.
         * @return A KeyPair whose private half is the 32-byte seed.
         * @throws ProvMark::RandomSourceUnavailable if the library could not be initialised.
         */
        static KeyPair generate_sign_keypair();

        /**
         * @brief Derives the Ed25519 public key belonging to a 32-byte seed.
         * @throws ProvMark::MalformedInput if the private key has the wrong size.
         */
        static PublicKey public_key_from_private(const PrivateKey& private_key);

        /**
         * @brief Creates a detached Ed25519 signature.
         * @param message The data to sign.
         * @param private_key The signer's 32-byte seed.
         * @return A 64-byte Signature.
         * @throws ProvMark::MalformedInput if the private key has the wrong size.
         */
        static Signature sign(const byte_vector& message, const PrivateKey& private_key);

        /**
         * @brief Verifies a detached Ed25519 signature.
         * @return True if the signature is valid, false otherwise (including bad sizes).
         */
        static bool verify(const Signature& signature, const byte_vector& message, const PublicKey& public_key);

        /**
         * @brief SHA-256 of a byte sequence.
         */
        static byte_vector sha256(const byte_vector& data);

        /**
         * @brief SHA-256 of the bytes of a string.
         */
        static byte_vector sha256(const std::string& data);

        /**
         * @brief Fills a buffer from the secure random source.
         * @throws ProvMark::RandomSourceUnavailable if the library could not be initialised.
         */
        static byte_vector random_bytes(size_t count);
    };

} // namespace ProvMark

#endif // PROVMARK_CRYPTO_HPP
