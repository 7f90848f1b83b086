#include "provmark/authorization.hpp"

#include "provmark/signer.hpp"
#include "provmark/timestamp.hpp"

namespace ProvMark {

const char* to_string(AuthorizationResult result) {
    switch (result) {
        case AuthorizationResult::AUTHORIZED:
            return "AUTHORIZED";
        case AuthorizationResult::SIGNATURE_INVALID:
            return "SIGNATURE_INVALID";
        case AuthorizationResult::EXPIRED:
            return "EXPIRED";
        case AuthorizationResult::MALFORMED:
            return "MALFORMED";
    }
    return "UNKNOWN";
}

ActionAuthorizer::ActionAuthorizer(int64_t window_millis, Clock clock)
    : window_millis_(window_millis), clock_(clock ? std::move(clock) : Clock(&Timestamp::now_unix_millis)) {}

std::string ActionAuthorizer::action_message(const std::string& action, const std::string& resource_id,
                                             int64_t timestamp_millis) {
    return action + ":" + resource_id + ":" + std::to_string(timestamp_millis);
}

std::string ActionAuthorizer::sign_action(const std::string& action, const std::string& resource_id,
                                          int64_t timestamp_millis, const std::string& private_key_hex) {
    return Signer::sign(action_message(action, resource_id, timestamp_millis), private_key_hex);
}

int64_t ActionAuthorizer::now() const {
    return clock_();
}

bool ActionAuthorizer::is_fresh(int64_t timestamp_millis) const {
    const int64_t delta = now() - timestamp_millis;
    return (delta < 0 ? -delta : delta) <= window_millis_;
}

AuthorizationResult ActionAuthorizer::check(const ActionRequest& request, const std::string& public_key_hex) const {
    if (request.action.empty() || request.resource_id.empty() || request.signature.empty() ||
        request.timestamp_millis <= 0) {
        return AuthorizationResult::MALFORMED;
    }
    if (!is_fresh(request.timestamp_millis)) {
        return AuthorizationResult::EXPIRED;
    }

    const std::string message = action_message(request.action, request.resource_id, request.timestamp_millis);
    if (!Signer::verify(message, request.signature, public_key_hex)) {
        return AuthorizationResult::SIGNATURE_INVALID;
    }
    return AuthorizationResult::AUTHORIZED;
}

} // namespace ProvMark
