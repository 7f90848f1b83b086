#ifndef PROVMARK_AUTHORIZATION_HPP
#define PROVMARK_AUTHORIZATION_HPP

#include <cstdint>
#include <functional>
#include <string>

namespace ProvMark {

    constexpr int64_t ACTION_WINDOW_MILLIS = 5 * 60 * 1000;
    constexpr char DELETE_ACTION[] = "delete";

    enum class AuthorizationResult {
        AUTHORIZED,
        SIGNATURE_INVALID,
        EXPIRED,
        MALFORMED
    };

    const char* to_string(AuthorizationResult result);

    // What the caller claims: "I intend <action> on <resource_id> at <timestamp>".
    struct ActionRequest {
        std::string action;
        std::string resource_id;
        int64_t timestamp_millis = 0;
        std::string signature;  // base64
    };

    /**
     * @brief Short-lived, signature-backed authorisation of destructive actions.
     *
     * The signed message is "<action>:<resourceId>:<unixTimeMillis>". The
     * verifier rebuilds it from the claimed values, so a signature cannot be
     * moved to another resource or action. There is no record of used
     * timestamps: a captured request stays valid until the window closes.
     */
    class ActionAuthorizer {
    public:
        using Clock = std::function<int64_t()>;

        explicit ActionAuthorizer(int64_t window_millis = ACTION_WINDOW_MILLIS, Clock clock = nullptr);

        static std::string action_message(const std::string& action, const std::string& resource_id,
                                          int64_t timestamp_millis);

        /**
         * @brief Client side: signs the action message.
         * @throws ProvMark::MalformedInput if the private key is malformed.
         */
        static std::string sign_action(const std::string& action, const std::string& resource_id,
                                       int64_t timestamp_millis, const std::string& private_key_hex);

        /**
         * @brief True if the claimed timestamp is within the window of now.
         */
        bool is_fresh(int64_t timestamp_millis) const;

        /**
         * @brief Full check: well-formedness, freshness, then signature.
         * @param public_key_hex The key stored for the resource.
         */
        AuthorizationResult check(const ActionRequest& request, const std::string& public_key_hex) const;

        int64_t now() const;
        int64_t window_millis() const { return window_millis_; }

    private:
        int64_t window_millis_;
        Clock clock_;
    };

} // namespace ProvMark

#endif // PROVMARK_AUTHORIZATION_HPP
