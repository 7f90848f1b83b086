#include "provmark/signer.hpp"

#include <sodium.h>

#include "provmark/crypto.hpp"
#include "provmark/encoding.hpp"
#include "provmark/errors.hpp"
#include "provmark/identity.hpp"

namespace ProvMark {

std::string Signer::sign(const std::string& payload, const std::string& private_key_hex) {
    PrivateKey sk = IdentityKeyManager::parse_private_key(private_key_hex);
    Signature sig = Crypto::sign(byte_vector(payload.begin(), payload.end()), sk);
    sodium_memzero(sk.data.data(), sk.data.size());
    return Encoding::to_base64(sig.data);
}

bool Signer::verify(const std::string& payload, const std::string& signature_base64,
                    const std::string& public_key_hex) noexcept {
    try {
        PublicKey pk = IdentityKeyManager::parse_public_key(public_key_hex);
        Signature sig;
        sig.data = Encoding::from_base64(signature_base64);
        return Crypto::verify(sig, byte_vector(payload.begin(), payload.end()), pk);
    } catch (const MalformedInput&) {
        return false;
    }
}

bool Signer::verify_record(const ProvenanceRecord& record) noexcept {
    std::string payload;
    try {
        payload = CanonicalPayloadBuilder::build(record.payload_fields());
    } catch (const MalformedInput&) {
        return false;
    }
    return verify(payload, record.signature, record.public_key);
}

} // namespace ProvMark
