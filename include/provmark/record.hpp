#ifndef PROVMARK_RECORD_HPP
#define PROVMARK_RECORD_HPP

#include "canonical.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace ProvMark {

    constexpr char RECORD_SCHEMA_VERSION[] = "1.0";
    constexpr char SIGNATURE_ALGORITHM[] = "Ed25519";

    /**
     * @brief A signed claim of authorship as kept by the record store.
     *
     * Created once, never updated; the only lifecycle event after creation
     * is an authorised deletion.
     */
    struct ProvenanceRecord {
        std::string id;
        std::string schema_version = RECORD_SCHEMA_VERSION;
        std::string title;
        std::optional<std::string> description;
        std::string file_name;
        uint64_t file_size = 0;
        std::string content_type;
        std::string content_hash;
        std::string created_at;
        std::string display_name;
        std::string creator_id;
        std::string public_key;
        std::string signature_algorithm = SIGNATURE_ALGORITHM;
        std::string signed_payload_hash;
        std::string signature;
        std::string signed_at;
        UsagePolicy usage_policy;
        std::string policy_hash;
        std::optional<std::string> perceptual_hash;

        /**
         * @brief The field set the signature was computed over.
         */
        SignedPayloadFields payload_fields() const;
    };

    // Reduced view used for listings.
    struct RecordSummary {
        std::string id;
        std::string title;
        std::string display_name;
        std::string content_hash;
        std::string signed_at;
        std::string license;
        Permission ai_training = Permission::DENIED;
    };

    RecordSummary summarize(const ProvenanceRecord& record);

    // JSON uses the camelCase field names of the public API.
    void to_json(nlohmann::json& j, const ProvenanceRecord& record);

    /**
     * @throws ProvMark::MalformedInput if a required field is missing or has the wrong type.
     */
    void from_json(const nlohmann::json& j, ProvenanceRecord& record);

    void to_json(nlohmann::json& j, const RecordSummary& summary);

} // namespace ProvMark

#endif // PROVMARK_RECORD_HPP
