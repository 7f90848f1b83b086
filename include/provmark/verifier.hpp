#ifndef PROVMARK_VERIFIER_HPP
#define PROVMARK_VERIFIER_HPP

#include "match_resolver.hpp"
#include "perceptual.hpp"

#include <functional>
#include <optional>
#include <string>

namespace ProvMark {

    enum class VerificationStatus {
        VERIFIED,
        HASH_MISMATCH,
        SIGNATURE_INVALID,
        PERCEPTUAL_MATCH,
        NOT_FOUND
    };

    const char* to_string(VerificationStatus status);

    struct VerificationReport {
        VerificationStatus status = VerificationStatus::NOT_FOUND;
        std::string content_hash;
        std::optional<std::string> perceptual_hash;
        std::optional<ProvenanceRecord> record;
        std::optional<int> distance;
        std::string message;
    };

    /**
     * @brief Checks a candidate file against the registry, end to end.
     *
     * The lookup itself may be local (a MatchResolver) or remote; either way
     * every record it returns has its signature re-checked here.
     */
    class Verifier {
    public:
        using LookupFn = std::function<MatchResult(const std::string& content_hash,
                                                   const std::optional<std::string>& perceptual_hash)>;

        /**
         * @param decoder Used for the perceptual fallback on image content. May be null.
         */
        explicit Verifier(LookupFn lookup, const ImageDecoder* decoder = nullptr);

        /**
         * @brief Local convenience: look up through a MatchResolver.
         */
        explicit Verifier(const MatchResolver& resolver, const ImageDecoder* decoder = nullptr);

        /**
         * @brief Exact lookup, then signature check of the earliest record.
         *        Falls back to the perceptual hash for images.
         */
        VerificationReport verify_content(const byte_vector& content, const std::string& content_type) const;

        /**
         * @brief Checks content against one specific record.
         */
        static VerificationReport verify_against_record(const byte_vector& content, const ProvenanceRecord& record);

    private:
        LookupFn lookup_;
        const ImageDecoder* decoder_;
    };

} // namespace ProvMark

#endif // PROVMARK_VERIFIER_HPP
