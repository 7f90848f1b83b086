#include "provmark/record.hpp"

#include "provmark/errors.hpp"

namespace ProvMark {

namespace {

const nlohmann::json& require(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        throw MalformedInput(std::string("Missing required field: ") + key);
    }
    return *it;
}

std::string require_string(const nlohmann::json& j, const char* key) {
    const nlohmann::json& value = require(j, key);
    if (!value.is_string()) {
        throw MalformedInput(std::string("Field must be a string: ") + key);
    }
    std::string s = value.get<std::string>();
    if (s.empty()) {
        throw MalformedInput(std::string("Missing required field: ") + key);
    }
    return s;
}

std::optional<std::string> optional_string(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw MalformedInput(std::string("Field must be a string: ") + key);
    }
    std::string s = it->get<std::string>();
    if (s.empty()) {
        return std::nullopt;
    }
    return s;
}

nlohmann::json nullable(const std::optional<std::string>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

} // namespace

SignedPayloadFields ProvenanceRecord::payload_fields() const {
    SignedPayloadFields fields;
    fields.content_hash = content_hash;
    fields.title = title;
    fields.content_type = content_type;
    fields.creator_id = creator_id;
    fields.usage_policy = usage_policy;
    fields.signed_at = signed_at;
    return fields;
}

RecordSummary summarize(const ProvenanceRecord& record) {
    RecordSummary summary;
    summary.id = record.id;
    summary.title = record.title;
    summary.display_name = record.display_name;
    summary.content_hash = record.content_hash;
    summary.signed_at = record.signed_at;
    summary.license = record.usage_policy.license;
    summary.ai_training = record.usage_policy.ai_training;
    return summary;
}

void to_json(nlohmann::json& j, const ProvenanceRecord& record) {
    const UsagePolicy& policy = record.usage_policy;
    j = nlohmann::json{
        {"id", record.id},
        {"schemaVersion", record.schema_version},
        {"title", record.title},
        {"description", nullable(record.description)},
        {"fileName", record.file_name},
        {"fileSize", record.file_size},
        {"contentType", record.content_type},
        {"contentHash", record.content_hash},
        {"createdAt", record.created_at},
        {"displayName", record.display_name},
        {"creatorId", record.creator_id},
        {"publicKey", record.public_key},
        {"signatureAlgorithm", record.signature_algorithm},
        {"signedPayloadHash", record.signed_payload_hash},
        {"signature", record.signature},
        {"signedAt", record.signed_at},
        {"license", policy.license},
        {"aiTraining", to_string(policy.ai_training)},
        {"aiDerivativeGeneration", to_string(policy.ai_derivative_generation)},
        {"commercialUse", to_string(policy.commercial_use)},
        {"attributionRequired", policy.attribution_required},
        {"policyNote", policy.policy_note.empty() ? nlohmann::json(nullptr) : nlohmann::json(policy.policy_note)},
        {"policyHash", record.policy_hash},
        {"perceptualHash", nullable(record.perceptual_hash)},
    };
}

void from_json(const nlohmann::json& j, ProvenanceRecord& record) {
    if (!j.is_object()) {
        throw MalformedInput("Record must be a JSON object.");
    }

    ProvenanceRecord r;
    r.id = optional_string(j, "id").value_or("");
    r.schema_version = optional_string(j, "schemaVersion").value_or(RECORD_SCHEMA_VERSION);
    r.title = require_string(j, "title");
    r.description = optional_string(j, "description");
    r.file_name = require_string(j, "fileName");

    auto size_it = j.find("fileSize");
    if (size_it != j.end() && !size_it->is_null()) {
        if (!size_it->is_number_unsigned() && !(size_it->is_number_integer() && size_it->get<int64_t>() >= 0)) {
            throw MalformedInput("Field must be a non-negative integer: fileSize");
        }
        r.file_size = size_it->get<uint64_t>();
    }

    r.content_type = optional_string(j, "contentType").value_or("application/octet-stream");
    r.content_hash = require_string(j, "contentHash");
    r.created_at = optional_string(j, "createdAt").value_or("");
    r.display_name = require_string(j, "displayName");
    r.creator_id = require_string(j, "creatorId");
    r.public_key = require_string(j, "publicKey");
    r.signature_algorithm = optional_string(j, "signatureAlgorithm").value_or(SIGNATURE_ALGORITHM);
    r.signed_payload_hash = require_string(j, "signedPayloadHash");
    r.signature = require_string(j, "signature");
    r.signed_at = require_string(j, "signedAt");

    r.usage_policy.license = require_string(j, "license");
    r.usage_policy.ai_training = parse_permission(require_string(j, "aiTraining"));
    r.usage_policy.ai_derivative_generation = parse_permission(require_string(j, "aiDerivativeGeneration"));
    r.usage_policy.commercial_use = parse_permission(require_string(j, "commercialUse"));
    const nlohmann::json& attribution = require(j, "attributionRequired");
    if (!attribution.is_boolean()) {
        throw MalformedInput("Field must be a boolean: attributionRequired");
    }
    r.usage_policy.attribution_required = attribution.get<bool>();
    r.usage_policy.policy_note = optional_string(j, "policyNote").value_or("");

    r.policy_hash = require_string(j, "policyHash");
    r.perceptual_hash = optional_string(j, "perceptualHash");

    record = std::move(r);
}

void to_json(nlohmann::json& j, const RecordSummary& summary) {
    j = nlohmann::json{
        {"id", summary.id},
        {"title", summary.title},
        {"displayName", summary.display_name},
        {"contentHash", summary.content_hash},
        {"signedAt", summary.signed_at},
        {"license", summary.license},
        {"aiTraining", to_string(summary.ai_training)},
    };
}

} // namespace ProvMark
