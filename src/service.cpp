#include "provmark/service.hpp"

#include "provmark/encoding.hpp"
#include "provmark/fingerprint.hpp"
#include "provmark/identity.hpp"
#include "provmark/signer.hpp"
#include "provmark/timestamp.hpp"

namespace ProvMark {

const char* to_string(DeleteOutcome outcome) {
    switch (outcome) {
        case DeleteOutcome::VERIFIED:
            return "VERIFIED";
        case DeleteOutcome::DELETED:
            return "DELETED";
        case DeleteOutcome::EXPIRED:
            return "EXPIRED";
        case DeleteOutcome::NOT_FOUND:
            return "NOT_FOUND";
        case DeleteOutcome::SIGNATURE_INVALID:
            return "SIGNATURE_INVALID";
        case DeleteOutcome::MALFORMED:
            return "MALFORMED";
    }
    return "UNKNOWN";
}

ErrorCode to_error_code(DeleteOutcome outcome) {
    switch (outcome) {
        case DeleteOutcome::VERIFIED:
        case DeleteOutcome::DELETED:
            return ErrorCode::OK;
        case DeleteOutcome::EXPIRED:
            return ErrorCode::ACTION_EXPIRED;
        case DeleteOutcome::NOT_FOUND:
            return ErrorCode::NOT_FOUND;
        case DeleteOutcome::SIGNATURE_INVALID:
            return ErrorCode::SIGNATURE_INVALID;
        case DeleteOutcome::MALFORMED:
            return ErrorCode::MALFORMED_INPUT;
    }
    return ErrorCode::INTERNAL;
}

ProvenanceService::ProvenanceService(RecordStore& store, ServiceOptions options, ActionAuthorizer::Clock clock)
    : store_(store),
      options_(options),
      resolver_(store, options.similarity_threshold),
      authorizer_(options.action_window_millis, std::move(clock)) {}

void ProvenanceService::validate_submission(const ProvenanceRecord& record) const {
    if (!ContentFingerprint::is_valid(record.content_hash)) {
        throw MalformedInput("contentHash must be 64 lowercase hex characters.");
    }
    if (!Encoding::is_lower_hex(record.public_key, PUBLIC_KEY_BYTES * 2)) {
        throw MalformedInput("publicKey must be 64 lowercase hex characters.");
    }
    if (record.signature_algorithm != SIGNATURE_ALGORITHM) {
        throw MalformedInput("Unsupported signature algorithm: " + record.signature_algorithm);
    }
    if (record.creator_id != IdentityKeyManager::derive_did(record.public_key)) {
        throw MalformedInput("creatorId is not the did:key of publicKey.");
    }
    Timestamp::parse_iso8601_millis(record.signed_at);

    if (record.perceptual_hash) {
        if (!PerceptualFingerprint::is_image_type(record.content_type)) {
            throw MalformedInput("perceptualHash is only accepted for image content types.");
        }
        if (!PerceptualFingerprint::is_valid(*record.perceptual_hash)) {
            throw MalformedInput("perceptualHash must be 16 lowercase hex characters.");
        }
    }

    const std::string payload = CanonicalPayloadBuilder::build(record.payload_fields());
    if (record.signed_payload_hash != CanonicalPayloadBuilder::payload_hash(payload)) {
        throw MalformedInput("signedPayloadHash does not match the canonical payload.");
    }
    if (record.policy_hash != CanonicalPayloadBuilder::policy_hash(record.usage_policy)) {
        throw MalformedInput("policyHash does not match the usage policy.");
    }
}

SubmitResult ProvenanceService::submit(ProvenanceRecord record) {
    validate_submission(record);

    SubmitResult result;
    if (!Signer::verify_record(record)) {
        result.code = ErrorCode::SIGNATURE_INVALID;
        result.message = "Signature does not match the canonical payload and public key.";
        return result;
    }

    record.id.clear();
    record.created_at.clear();
    result.id = store_.create(std::move(record));
    result.message = "Record created";
    return result;
}

std::optional<ProvenanceRecord> ProvenanceService::get(const std::string& id) const {
    return store_.find_by_id(id);
}

std::vector<RecordSummary> ProvenanceService::list_recent() const {
    std::vector<RecordSummary> out;
    for (const auto& record : store_.list_recent(options_.list_limit)) {
        out.push_back(summarize(record));
    }
    return out;
}

std::vector<ProvenanceRecord> ProvenanceService::find_by_hash(const std::string& content_hash) const {
    if (!ContentFingerprint::is_valid(content_hash)) {
        throw MalformedInput("Content hash must be 64 lowercase hex characters.");
    }
    return store_.find_by_content_hash(content_hash);
}

LookupResult ProvenanceService::lookup(const LookupRequest& request) const {
    LookupResult result;

    if (request.record_id) {
        if (!ContentFingerprint::is_valid(request.content_hash)) {
            throw MalformedInput("Content hash must be 64 lowercase hex characters.");
        }
        std::optional<ProvenanceRecord> record = store_.find_by_id(*request.record_id);
        if (!record) {
            result.match.status = MatchStatus::NOT_FOUND;
            result.message = "Record not found";
            return result;
        }
        if (record->content_hash == request.content_hash) {
            result.match.status = MatchStatus::HASH_MATCH;
            result.match.matches.push_back(Match{std::move(*record), std::nullopt});
            result.message = "File hash matches the registered record. Verify the signature to complete verification.";
        } else {
            result.match.status = MatchStatus::HASH_MISMATCH;
            result.message = "File hash does not match. The file may have been modified.";
        }
        return result;
    }

    result.match = resolver_.resolve(request.content_hash, request.perceptual_hash);
    switch (result.match.status) {
        case MatchStatus::FOUND:
            result.message = "Found " + std::to_string(result.match.matches.size()) +
                             " provenance record(s). Verify signatures to complete verification.";
            break;
        case MatchStatus::PERCEPTUAL_MATCH:
            result.message = "Found " + std::to_string(result.match.matches.size()) +
                             " visually similar record(s). Verify signatures before trusting them.";
            break;
        default:
            result.message = "No provenance records found for this file.";
            break;
    }
    return result;
}

DeleteOutcome ProvenanceService::delete_record(const DeleteRequest& request) {
    if (request.id.empty() || request.signature.empty() || request.timestamp_millis <= 0) {
        return DeleteOutcome::MALFORMED;
    }
    if (!authorizer_.is_fresh(request.timestamp_millis)) {
        return DeleteOutcome::EXPIRED;
    }

    std::optional<ProvenanceRecord> record = store_.find_by_id(request.id);
    if (!record) {
        return DeleteOutcome::NOT_FOUND;
    }

    ActionRequest action;
    action.action = DELETE_ACTION;
    action.resource_id = request.id;
    action.timestamp_millis = request.timestamp_millis;
    action.signature = request.signature;

    switch (authorizer_.check(action, record->public_key)) {
        case AuthorizationResult::AUTHORIZED:
            break;
        case AuthorizationResult::EXPIRED:
            return DeleteOutcome::EXPIRED;
        case AuthorizationResult::MALFORMED:
            return DeleteOutcome::MALFORMED;
        case AuthorizationResult::SIGNATURE_INVALID:
            return DeleteOutcome::SIGNATURE_INVALID;
    }

    if (request.verify_only) {
        return DeleteOutcome::VERIFIED;
    }
    return store_.remove(request.id) ? DeleteOutcome::DELETED : DeleteOutcome::NOT_FOUND;
}

} // namespace ProvMark
