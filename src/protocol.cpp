#include "provmark/protocol.hpp"

namespace ProvMark {

namespace {

nlohmann::json parse_body(const std::string& text) {
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw MalformedInput(std::string("Message body is not valid JSON: ") + e.what());
    }
}

std::string require_string(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        throw MalformedInput(std::string("Missing or non-string field: ") + key);
    }
    return it->get<std::string>();
}

std::optional<std::string> optional_string(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw MalformedInput(std::string("Non-string field: ") + key);
    }
    return it->get<std::string>();
}

} // namespace

// --- Request ---

byte_vector Request::encode() const {
    return MessageBuilder(op_code).add_param(request_id).add_param(body.dump()).build().serialize();
}

Request Request::decode(const byte_vector& data) {
    Message message = Message::deserialize(data);
    if (message.op_code == Ops::RESPONSE) {
        throw RuntimeError("Expected a request, received a response frame.");
    }
    MessageReader reader(message);

    Request request;
    request.op_code = message.op_code;
    request.request_id = reader.read_param<uint32_t>();
    request.body = parse_body(reader.read_param<std::string>());
    return request;
}

// --- Response ---

byte_vector Response::encode() const {
    return MessageBuilder(Ops::RESPONSE)
        .add_param(request_id)
        .add_param(static_cast<uint16_t>(code))
        .add_param(body.dump())
        .build()
        .serialize();
}

Response Response::decode(const byte_vector& data) {
    Message message = Message::deserialize(data);
    if (message.op_code != Ops::RESPONSE) {
        throw RuntimeError("Expected a response frame.");
    }
    MessageReader reader(message);

    Response response;
    response.request_id = reader.read_param<uint32_t>();
    uint16_t code = reader.read_param<uint16_t>();
    if (code > static_cast<uint16_t>(ErrorCode::INTERNAL)) {
        throw RuntimeError("Unknown error code in response: " + std::to_string(code));
    }
    response.code = static_cast<ErrorCode>(code);
    response.body = parse_body(reader.read_param<std::string>());
    return response;
}

Response Response::failure(uint32_t request_id, ErrorCode code, const std::string& message) {
    Response response;
    response.request_id = request_id;
    response.code = code;
    response.body = {{"error", message}};
    return response;
}

// --- LookupRequest ---

void to_json(nlohmann::json& j, const LookupRequest& request) {
    j = nlohmann::json::object();
    j["contentHash"] = request.content_hash;
    if (request.record_id) {
        j["recordId"] = *request.record_id;
    }
    if (request.perceptual_hash) {
        j["perceptualHash"] = *request.perceptual_hash;
    }
}

void from_json(const nlohmann::json& j, LookupRequest& request) {
    if (!j.is_object()) {
        throw MalformedInput("Lookup request must be a JSON object.");
    }
    request.content_hash = require_string(j, "contentHash");
    request.record_id = optional_string(j, "recordId");
    request.perceptual_hash = optional_string(j, "perceptualHash");
}

// --- LookupResult ---

void to_json(nlohmann::json& j, const LookupResult& result) {
    nlohmann::json records = nlohmann::json::array();
    for (const auto& match : result.match.matches) {
        nlohmann::json entry = match.record;
        if (match.distance) {
            entry["hammingDistance"] = *match.distance;
        }
        records.push_back(std::move(entry));
    }
    j = nlohmann::json{{"status", to_string(result.match.status)},
                       {"message", result.message},
                       {"records", std::move(records)}};
}

void from_json(const nlohmann::json& j, LookupResult& result) {
    if (!j.is_object()) {
        throw MalformedInput("Lookup result must be a JSON object.");
    }
    result.match.status = parse_match_status(require_string(j, "status"));
    result.message = optional_string(j, "message").value_or("");
    result.match.matches.clear();

    auto it = j.find("records");
    if (it == j.end()) {
        return;
    }
    if (!it->is_array()) {
        throw MalformedInput("Field 'records' must be an array.");
    }
    for (const auto& entry : *it) {
        Match match;
        match.record = entry.get<ProvenanceRecord>();
        auto distance = entry.find("hammingDistance");
        if (distance != entry.end() && distance->is_number_integer()) {
            match.distance = distance->get<int>();
        }
        result.match.matches.push_back(std::move(match));
    }
}

// --- DeleteRequest ---

void to_json(nlohmann::json& j, const DeleteRequest& request) {
    j = nlohmann::json{{"id", request.id},
                       {"timestamp", request.timestamp_millis},
                       {"signature", request.signature},
                       {"verify_only", request.verify_only}};
}

void from_json(const nlohmann::json& j, DeleteRequest& request) {
    if (!j.is_object()) {
        throw MalformedInput("Delete request must be a JSON object.");
    }
    // Missing fields are left empty so the service reports them as MALFORMED
    // in its own check order.
    request.id = optional_string(j, "id").value_or("");
    request.signature = optional_string(j, "signature").value_or("");
    request.timestamp_millis = 0;
    auto ts = j.find("timestamp");
    if (ts != j.end() && !ts->is_null()) {
        if (!ts->is_number_integer()) {
            throw MalformedInput("Field 'timestamp' must be an integer (Unix milliseconds).");
        }
        request.timestamp_millis = ts->get<int64_t>();
    }
    auto verify_only = j.find("verify_only");
    request.verify_only = verify_only != j.end() && verify_only->is_boolean() && verify_only->get<bool>();
}

// --- SubmitResult ---

void to_json(nlohmann::json& j, const SubmitResult& result) {
    j = nlohmann::json{{"message", result.message}};
    if (!result.id.empty()) {
        j["id"] = result.id;
    }
}

// The code is not part of the body; callers take it from the response envelope.
void from_json(const nlohmann::json& j, SubmitResult& result) {
    if (!j.is_object()) {
        throw MalformedInput("Submit result must be a JSON object.");
    }
    result.id = optional_string(j, "id").value_or("");
    result.message = optional_string(j, "message").value_or("");
}

} // namespace ProvMark
