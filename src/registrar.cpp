#include "provmark/registrar.hpp"

#include "provmark/errors.hpp"
#include "provmark/fingerprint.hpp"
#include "provmark/identity.hpp"
#include "provmark/signer.hpp"
#include "provmark/timestamp.hpp"

namespace ProvMark {

Registrar::Registrar(const ImageDecoder* decoder) : decoder_(decoder) {}

ProvenanceRecord Registrar::register_content(const byte_vector& content, const RegistrationRequest& request,
                                             const KeyPairHex& keys, const std::string& signed_at) const {
    if (request.title.empty()) {
        throw MalformedInput("Title is required.");
    }
    if (request.display_name.empty()) {
        throw MalformedInput("Display name is required.");
    }
    if (request.usage_policy.license.empty()) {
        throw MalformedInput("License is required.");
    }

    const std::string public_key = IdentityKeyManager::public_key_from_private(keys.private_key);
    if (!keys.public_key.empty() && keys.public_key != public_key) {
        throw MalformedInput("Public key does not belong to the private key.");
    }

    ProvenanceRecord record;
    record.title = request.title;
    record.description = request.description;
    record.file_name = request.file_name.empty() ? request.title : request.file_name;
    record.file_size = content.size();
    record.content_type = request.content_type.empty() ? "application/octet-stream" : request.content_type;
    record.content_hash = ContentFingerprint::hash(content);
    record.display_name = request.display_name;
    record.public_key = public_key;
    record.creator_id = IdentityKeyManager::derive_did(public_key);
    record.usage_policy = request.usage_policy;

    if (request.include_perceptual_hash && PerceptualFingerprint::is_image_type(record.content_type)) {
        if (decoder_ == nullptr) {
            throw LogicError("Perceptual hash requested but no image decoder configured.");
        }
        record.perceptual_hash = PerceptualFingerprint::compute(content, *decoder_);
    }

    if (signed_at.empty()) {
        record.signed_at = Timestamp::now_iso8601();
    } else {
        Timestamp::parse_iso8601_millis(signed_at);
        record.signed_at = signed_at;
    }

    const std::string payload = CanonicalPayloadBuilder::build(record.payload_fields());
    record.signature = Signer::sign(payload, keys.private_key);
    record.signed_payload_hash = CanonicalPayloadBuilder::payload_hash(payload);
    record.policy_hash = CanonicalPayloadBuilder::policy_hash(record.usage_policy);
    return record;
}

} // namespace ProvMark
