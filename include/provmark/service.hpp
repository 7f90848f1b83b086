#ifndef PROVMARK_SERVICE_HPP
#define PROVMARK_SERVICE_HPP

#include "authorization.hpp"
#include "errors.hpp"
#include "match_resolver.hpp"
#include "record_store.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ProvMark {

    struct ServiceOptions {
        int similarity_threshold = DEFAULT_SIMILARITY_THRESHOLD;
        int64_t action_window_millis = ACTION_WINDOW_MILLIS;
        size_t list_limit = 50;
    };

    struct SubmitResult {
        ErrorCode code = ErrorCode::OK;
        std::string id;
        std::string message;
    };

    struct LookupRequest {
        std::string content_hash;
        std::optional<std::string> record_id;
        std::optional<std::string> perceptual_hash;
    };

    struct LookupResult {
        MatchResult match;
        std::string message;
    };

    struct DeleteRequest {
        std::string id;
        int64_t timestamp_millis = 0;
        std::string signature;
        bool verify_only = false;
    };

    enum class DeleteOutcome {
        VERIFIED,  // verify-only: authorised, nothing deleted
        DELETED,
        EXPIRED,
        NOT_FOUND,
        SIGNATURE_INVALID,
        MALFORMED
    };

    const char* to_string(DeleteOutcome outcome);
    ErrorCode to_error_code(DeleteOutcome outcome);

    /**
     * @brief Registry operations over an injected RecordStore.
     *
     * Holds no record state of its own; all operations are safe to call
     * concurrently as long as the store is.
     */
    class ProvenanceService {
    public:
        explicit ProvenanceService(RecordStore& store, ServiceOptions options = ServiceOptions(),
                                   ActionAuthorizer::Clock clock = nullptr);

        /**
         * @brief Validates and stores a signed record. Any client-supplied id
         *        and created_at are replaced.
         * @return OK with the new id, or SIGNATURE_INVALID (record refused).
         * @throws ProvMark::MalformedInput if fields are missing or inconsistent.
         */
        SubmitResult submit(ProvenanceRecord record);

        std::optional<ProvenanceRecord> get(const std::string& id) const;

        // The most recent records, up to the configured list limit.
        std::vector<RecordSummary> list_recent() const;

        // Exact content hash matches, earliest first.
        std::vector<ProvenanceRecord> find_by_hash(const std::string& content_hash) const;

        /**
         * @brief With a record id: HASH_MATCH / HASH_MISMATCH / NOT_FOUND for
         *        that record. Without: the two-tier MatchResolver search.
         * @throws ProvMark::MalformedInput for malformed hashes.
         */
        LookupResult lookup(const LookupRequest& request) const;

        /**
         * @brief Signature-authorised deletion (see ActionAuthorizer).
         *        With verify_only the checks run but nothing is removed.
         */
        DeleteOutcome delete_record(const DeleteRequest& request);

        const MatchResolver& resolver() const { return resolver_; }
        const ServiceOptions& options() const { return options_; }

    private:
        void validate_submission(const ProvenanceRecord& record) const;

        RecordStore& store_;
        ServiceOptions options_;
        MatchResolver resolver_;
        ActionAuthorizer authorizer_;
    };

} // namespace ProvMark

#endif // PROVMARK_SERVICE_HPP
