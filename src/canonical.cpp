#include "provmark/canonical.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>

#include "provmark/crypto.hpp"
#include "provmark/encoding.hpp"
#include "provmark/errors.hpp"

namespace ProvMark {

namespace {

void append_json_string(std::string& out, const std::string& value) {
    try {
        out += nlohmann::json(value).dump(-1, ' ', false, nlohmann::json::error_handler_t::strict);
    } catch (const nlohmann::json::type_error& e) {
        throw MalformedInput(std::string("String is not valid UTF-8: ") + e.what());
    }
}

} // namespace

// --- CanonicalValue ---

CanonicalValue::CanonicalValue(std::string value) : value_(std::move(value)) {}

CanonicalValue::CanonicalValue(const char* value) : value_(std::string(value)) {}

CanonicalValue::CanonicalValue(int64_t value) : value_(value) {}

CanonicalValue::CanonicalValue(int value) : value_(static_cast<int64_t>(value)) {}

CanonicalValue::CanonicalValue(bool value) : value_(value) {}

CanonicalValue::CanonicalValue(ObjectTag) : value_(Members{}) {}

CanonicalValue CanonicalValue::object() {
    return CanonicalValue(ObjectTag{});
}

CanonicalValue& CanonicalValue::set(const std::string& key, CanonicalValue value) {
    Members* members = std::get_if<Members>(&value_);
    if (members == nullptr) {
        throw LogicError("CanonicalValue::set called on a non-object value.");
    }

    auto it = std::lower_bound(members->begin(), members->end(), key,
                               [](const Member& member, const std::string& k) { return member.first < k; });
    if (it != members->end() && it->first == key) {
        it->second = std::move(value);
    } else {
        members->emplace(it, key, std::move(value));
    }
    return *this;
}

CanonicalValue::Kind CanonicalValue::kind() const {
    switch (value_.index()) {
        case 0:
            return Kind::STRING;
        case 1:
            return Kind::INTEGER;
        case 2:
            return Kind::BOOLEAN;
        default:
            return Kind::OBJECT;
    }
}

const CanonicalValue::Members& CanonicalValue::members() const {
    const Members* members = std::get_if<Members>(&value_);
    if (members == nullptr) {
        throw LogicError("CanonicalValue is not an object.");
    }
    return *members;
}

std::string CanonicalValue::serialize() const {
    std::string out;
    serialize_to(out);
    return out;
}

void CanonicalValue::serialize_to(std::string& out) const {
    if (const auto* s = std::get_if<std::string>(&value_)) {
        append_json_string(out, *s);
    } else if (const auto* i = std::get_if<int64_t>(&value_)) {
        out += std::to_string(*i);
    } else if (const auto* b = std::get_if<bool>(&value_)) {
        out += *b ? "true" : "false";
    } else {
        const auto& members = std::get<Members>(value_);
        out += '{';
        for (size_t i = 0; i < members.size(); ++i) {
            if (i != 0) {
                out += ',';
            }
            append_json_string(out, members[i].first);
            out += ':';
            members[i].second.serialize_to(out);
        }
        out += '}';
    }
}

// --- Policy ---

const char* to_string(Permission permission) {
    return permission == Permission::ALLOWED ? "ALLOWED" : "DENIED";
}

Permission parse_permission(const std::string& text) {
    if (text == "ALLOWED") {
        return Permission::ALLOWED;
    }
    if (text == "DENIED") {
        return Permission::DENIED;
    }
    throw MalformedInput("Permission must be ALLOWED or DENIED, got '" + text + "'.");
}

CanonicalValue UsagePolicy::to_canonical() const {
    CanonicalValue value = CanonicalValue::object();
    value.set("license", license)
        .set("ai_training", to_string(ai_training))
        .set("ai_derivative_generation", to_string(ai_derivative_generation))
        .set("commercial_use", to_string(commercial_use))
        .set("attribution_required", attribution_required)
        .set("policy_note", policy_note);
    return value;
}

bool operator==(const UsagePolicy& a, const UsagePolicy& b) {
    return a.license == b.license && a.ai_training == b.ai_training &&
           a.ai_derivative_generation == b.ai_derivative_generation && a.commercial_use == b.commercial_use &&
           a.attribution_required == b.attribution_required && a.policy_note == b.policy_note;
}

CanonicalValue SignedPayloadFields::to_canonical() const {
    CanonicalValue value = CanonicalValue::object();
    value.set("content_hash", content_hash)
        .set("title", title)
        .set("content_type", content_type)
        .set("creator_id", creator_id)
        .set("usage_policy", usage_policy.to_canonical())
        .set("signed_at", signed_at);
    return value;
}

// --- CanonicalPayloadBuilder ---

std::string CanonicalPayloadBuilder::build(const SignedPayloadFields& fields) {
    return fields.to_canonical().serialize();
}

std::string CanonicalPayloadBuilder::canonical_policy(const UsagePolicy& policy) {
    return policy.to_canonical().serialize();
}

std::string CanonicalPayloadBuilder::policy_hash(const UsagePolicy& policy) {
    return Encoding::to_hex(Crypto::sha256(canonical_policy(policy)));
}

std::string CanonicalPayloadBuilder::payload_hash(const std::string& canonical_payload) {
    return Encoding::to_hex(Crypto::sha256(canonical_payload));
}

} // namespace ProvMark
