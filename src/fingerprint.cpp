#include "provmark/fingerprint.hpp"

#include <sodium.h>

#include <fstream>
#include <iterator>

#include "provmark/crypto.hpp"
#include "provmark/encoding.hpp"
#include "provmark/errors.hpp"

namespace ProvMark {

std::string ContentFingerprint::hash(const byte_vector& bytes) {
    return Encoding::to_hex(Crypto::sha256(bytes));
}

std::string ContentFingerprint::hash_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw RuntimeError("Cannot open file: " + path);
    }

    crypto_hash_sha256_state state;
    crypto_hash_sha256_init(&state);

    char buffer[64 * 1024];
    while (in) {
        in.read(buffer, sizeof(buffer));
        const std::streamsize got = in.gcount();
        if (got > 0) {
            crypto_hash_sha256_update(&state, reinterpret_cast<const unsigned char*>(buffer),
                                      static_cast<unsigned long long>(got));
        }
    }
    if (in.bad()) {
        throw RuntimeError("Error while reading file: " + path);
    }

    byte_vector digest(crypto_hash_sha256_BYTES);
    crypto_hash_sha256_final(&state, digest.data());
    return Encoding::to_hex(digest);
}

byte_vector ContentFingerprint::read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw RuntimeError("Cannot open file: " + path);
    }
    byte_vector bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw RuntimeError("Error while reading file: " + path);
    }
    return bytes;
}

bool ContentFingerprint::is_valid(const std::string& fingerprint) {
    return Encoding::is_lower_hex(fingerprint, CONTENT_HASH_HEX_LENGTH);
}

} // namespace ProvMark
