#ifndef PROVMARK_SIGNER_HPP
#define PROVMARK_SIGNER_HPP

#include "record.hpp"

#include <string>

namespace ProvMark {

    /**
     * @brief Signs and checks canonical payloads in their external encodings
     *        (hex keys, base64 signatures).
     */
    class Signer {
    public:
        /**
         * @brief Signs the UTF-8 bytes of a payload.
         * @param payload The canonical payload (or action message).
         * @param private_key_hex 64 hex characters.
         * @return Standard base64 of the 64-byte signature.
         * @throws ProvMark::MalformedInput if the private key is malformed.
         */
        static std::string sign(const std::string& payload, const std::string& private_key_hex);

        /**
         * @brief Checks a signature. Never throws: malformed keys or
         *        signatures simply do not verify.
         */
        static bool verify(const std::string& payload, const std::string& signature_base64,
                           const std::string& public_key_hex) noexcept;

        /**
         * @brief Rebuilds the canonical payload from a stored record and
         *        checks the record's signature over it with the record's key.
         */
        static bool verify_record(const ProvenanceRecord& record) noexcept;
    };

} // namespace ProvMark

#endif // PROVMARK_SIGNER_HPP
