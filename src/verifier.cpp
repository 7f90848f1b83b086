#include "provmark/verifier.hpp"

#include "provmark/errors.hpp"
#include "provmark/fingerprint.hpp"
#include "provmark/signer.hpp"

namespace ProvMark {

const char* to_string(VerificationStatus status) {
    switch (status) {
        case VerificationStatus::VERIFIED:
            return "VERIFIED";
        case VerificationStatus::HASH_MISMATCH:
            return "HASH_MISMATCH";
        case VerificationStatus::SIGNATURE_INVALID:
            return "SIGNATURE_INVALID";
        case VerificationStatus::PERCEPTUAL_MATCH:
            return "PERCEPTUAL_MATCH";
        case VerificationStatus::NOT_FOUND:
            return "NOT_FOUND";
    }
    return "UNKNOWN";
}

Verifier::Verifier(LookupFn lookup, const ImageDecoder* decoder) : lookup_(std::move(lookup)), decoder_(decoder) {}

Verifier::Verifier(const MatchResolver& resolver, const ImageDecoder* decoder)
    : lookup_([&resolver](const std::string& content_hash, const std::optional<std::string>& perceptual_hash) {
          return resolver.resolve(content_hash, perceptual_hash);
      }),
      decoder_(decoder) {}

VerificationReport Verifier::verify_content(const byte_vector& content, const std::string& content_type) const {
    VerificationReport report;
    report.content_hash = ContentFingerprint::hash(content);

    MatchResult exact = lookup_(report.content_hash, std::nullopt);
    if (exact.status == MatchStatus::FOUND && !exact.matches.empty()) {
        // The earliest registration is the presumptive original.
        const ProvenanceRecord& record = exact.matches.front().record;
        report.record = record;
        if (Signer::verify_record(record)) {
            report.status = VerificationStatus::VERIFIED;
            report.message = "Signature verified. This file has a valid provenance record.";
        } else {
            report.status = VerificationStatus::SIGNATURE_INVALID;
            report.message = "Hash matched but signature verification failed. The record may have been tampered with.";
        }
        return report;
    }

    if (decoder_ != nullptr && PerceptualFingerprint::is_image_type(content_type)) {
        try {
            report.perceptual_hash = PerceptualFingerprint::compute(content, *decoder_);
        } catch (const MalformedInput&) {
            // Not decodable as an image: only the exact lookup applies.
        }
    }

    if (report.perceptual_hash) {
        MatchResult similar = lookup_(report.content_hash, report.perceptual_hash);
        if (similar.status == MatchStatus::PERCEPTUAL_MATCH && !similar.matches.empty()) {
            // Closest candidate whose own signature still holds.
            for (const Match& match : similar.matches) {
                if (Signer::verify_record(match.record)) {
                    report.status = VerificationStatus::PERCEPTUAL_MATCH;
                    report.record = match.record;
                    report.distance = match.distance;
                    report.message = "No exact file match, but a visually similar image was found (Hamming distance: " +
                                     std::to_string(match.distance.value_or(-1)) +
                                     "). The signature on the original record is valid.";
                    return report;
                }
            }
            report.status = VerificationStatus::SIGNATURE_INVALID;
            report.record = similar.matches.front().record;
            report.distance = similar.matches.front().distance;
            report.message = "Visually similar records were found but none carries a valid signature.";
            return report;
        }
    }

    report.status = VerificationStatus::NOT_FOUND;
    report.message = "No provenance records found for this file.";
    return report;
}

VerificationReport Verifier::verify_against_record(const byte_vector& content, const ProvenanceRecord& record) {
    VerificationReport report;
    report.content_hash = ContentFingerprint::hash(content);
    report.record = record;

    if (report.content_hash != record.content_hash) {
        report.status = VerificationStatus::HASH_MISMATCH;
        report.message = "File hash does not match. The file may have been modified.";
    } else if (!Signer::verify_record(record)) {
        report.status = VerificationStatus::SIGNATURE_INVALID;
        report.message = "Hash matched but signature verification failed. The record may have been tampered with.";
    } else {
        report.status = VerificationStatus::VERIFIED;
        report.message = "Signature verified. This file has a valid provenance record.";
    }
    return report;
}

} // namespace ProvMark
