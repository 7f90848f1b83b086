#ifndef PROVMARK_CANONICAL_HPP
#define PROVMARK_CANONICAL_HPP

#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace ProvMark {

    /**
     * @brief A value that has exactly one textual form.
     *
     * Objects keep their members sorted by key at all times, so the
     * serialized text depends only on the logical contents and never on
     * the order in which members were added. Floating point is not
     * representable on purpose.
     */
    class CanonicalValue {
    public:
        enum class Kind {
            STRING,
            INTEGER,
            BOOLEAN,
            OBJECT
        };

        using Member = std::pair<std::string, CanonicalValue>;
        using Members = std::vector<Member>;

        CanonicalValue(std::string value);
        CanonicalValue(const char* value);
        CanonicalValue(int64_t value);
        CanonicalValue(int value);
        CanonicalValue(bool value);

        /**
         * @brief An empty object.
         */
        static CanonicalValue object();

        /**
         * @brief Inserts or replaces a member, keeping keys in byte order.
         * @throws ProvMark::LogicError if this value is not an object.
         */
        CanonicalValue& set(const std::string& key, CanonicalValue value);

        Kind kind() const;
        const Members& members() const;

        /**
         * @brief JSON text with sorted keys and no whitespace.
         * @throws ProvMark::MalformedInput if a string is not valid UTF-8.
         */
        std::string serialize() const;

    private:
        struct ObjectTag {};
        explicit CanonicalValue(ObjectTag);

        void serialize_to(std::string& out) const;

        std::variant<std::string, int64_t, bool, Members> value_;
    };

    enum class Permission {
        ALLOWED,
        DENIED
    };

    const char* to_string(Permission permission);

    /**
     * @throws ProvMark::MalformedInput unless the text is "ALLOWED" or "DENIED".
     */
    Permission parse_permission(const std::string& text);

    // How the creator allows the content to be used. Embedded by value in a record.
    struct UsagePolicy {
        std::string license;
        Permission ai_training = Permission::DENIED;
        Permission ai_derivative_generation = Permission::DENIED;
        Permission commercial_use = Permission::DENIED;
        bool attribution_required = true;
        std::string policy_note;

        CanonicalValue to_canonical() const;
    };

    bool operator==(const UsagePolicy& a, const UsagePolicy& b);

    // Exactly the fields covered by a record signature.
    struct SignedPayloadFields {
        std::string content_hash;
        std::string title;
        std::string content_type;
        std::string creator_id;
        UsagePolicy usage_policy;
        std::string signed_at;

        CanonicalValue to_canonical() const;
    };

    class CanonicalPayloadBuilder {
    public:
        /**
         * @brief The signable string for a record.
         */
        static std::string build(const SignedPayloadFields& fields);

        /**
         * @brief Canonical text of the usage policy on its own.
         */
        static std::string canonical_policy(const UsagePolicy& policy);

        /**
         * @brief Hex SHA-256 of canonical_policy().
         */
        static std::string policy_hash(const UsagePolicy& policy);

        /**
         * @brief Hex SHA-256 of a canonical payload string.
         */
        static std::string payload_hash(const std::string& canonical_payload);
    };

} // namespace ProvMark

#endif // PROVMARK_CANONICAL_HPP
