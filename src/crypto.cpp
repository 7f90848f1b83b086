#include "provmark/crypto.hpp"

#include <sodium.h>

#include <atomic>

#include "provmark/errors.hpp"

namespace ProvMark {

    static std::atomic<bool> g_sodium_initialized{false};

    static void require_random_source() {
        if (Crypto::init() != 0) {
            throw RandomSourceUnavailable("Secure random source is unavailable.");
        }
    }

    int Crypto::init() {
        if (g_sodium_initialized) {
            return 0;  // Already successfully initialized
        }

        // sodium_init() is itself thread-safe and returns 1 when already done.
        if (sodium_init() < 0) {
            return -1;
        }

        g_sodium_initialized = true;
        return 0;
    }

    KeyPair Crypto::generate_sign_keypair() {
        require_random_source();

        KeyPair kp;
        kp.privateKey.data.resize(crypto_sign_SEEDBYTES);
        kp.publicKey.data.resize(crypto_sign_PUBLICKEYBYTES);
        randombytes_buf(kp.privateKey.data.data(), kp.privateKey.data.size());

        unsigned char sk[crypto_sign_SECRETKEYBYTES];
        if (crypto_sign_seed_keypair(kp.publicKey.data.data(), sk, kp.privateKey.data.data()) != 0) {
            sodium_memzero(sk, sizeof(sk));
            throw RuntimeError("Failed to derive Ed25519 key pair.");
        }
        sodium_memzero(sk, sizeof(sk));
        return kp;
    }

    PublicKey Crypto::public_key_from_private(const PrivateKey& private_key) {
        if (private_key.data.size() != crypto_sign_SEEDBYTES) {
            throw MalformedInput("Invalid private key size.");
        }

        PublicKey pk;
        pk.data.resize(crypto_sign_PUBLICKEYBYTES);
        unsigned char sk[crypto_sign_SECRETKEYBYTES];
        if (crypto_sign_seed_keypair(pk.data.data(), sk, private_key.data.data()) != 0) {
            sodium_memzero(sk, sizeof(sk));
            throw RuntimeError("Failed to derive Ed25519 public key.");
        }
        sodium_memzero(sk, sizeof(sk));
        return pk;
    }

    Signature Crypto::sign(const byte_vector& message, const PrivateKey& private_key) {
        if (private_key.data.size() != crypto_sign_SEEDBYTES) {
            throw MalformedInput("Invalid private key size for signing.");
        }

        // libsodium signs with the expanded 64-byte secret key (seed || public key).
        unsigned char pk[crypto_sign_PUBLICKEYBYTES];
        unsigned char sk[crypto_sign_SECRETKEYBYTES];
        if (crypto_sign_seed_keypair(pk, sk, private_key.data.data()) != 0) {
            sodium_memzero(sk, sizeof(sk));
            throw RuntimeError("Failed to expand Ed25519 private key.");
        }

        Signature sig;
        sig.data.resize(crypto_sign_BYTES);
        crypto_sign_detached(sig.data.data(), nullptr, message.data(), message.size(), sk);
        sodium_memzero(sk, sizeof(sk));
        return sig;
    }

    bool Crypto::verify(const Signature& signature, const byte_vector& message, const PublicKey& public_key) {
        if (signature.data.size() != crypto_sign_BYTES || public_key.data.size() != crypto_sign_PUBLICKEYBYTES) {
            return false;  // Invalid sizes
        }
        return crypto_sign_verify_detached(
                   signature.data.data(), message.data(), message.size(), public_key.data.data()) == 0;
    }

    byte_vector Crypto::sha256(const byte_vector& data) {
        byte_vector digest(crypto_hash_sha256_BYTES);
        crypto_hash_sha256(digest.data(), data.data(), data.size());
        return digest;
    }

    byte_vector Crypto::sha256(const std::string& data) {
        byte_vector digest(crypto_hash_sha256_BYTES);
        crypto_hash_sha256(digest.data(), reinterpret_cast<const unsigned char*>(data.data()), data.size());
        return digest;
    }

    byte_vector Crypto::random_bytes(size_t count) {
        require_random_source();
        byte_vector out(count);
        randombytes_buf(out.data(), out.size());
        return out;
    }

} // namespace ProvMark
