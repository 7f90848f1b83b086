#ifndef PROVMARK_REGISTRAR_HPP
#define PROVMARK_REGISTRAR_HPP

#include "perceptual.hpp"
#include "record.hpp"

#include <optional>
#include <string>

namespace ProvMark {

    // Creator-supplied metadata for a new registration.
    struct RegistrationRequest {
        std::string title;
        std::optional<std::string> description;
        std::string file_name;
        std::string content_type = "application/octet-stream";
        std::string display_name;
        UsagePolicy usage_policy;
        bool include_perceptual_hash = false;
    };

    /**
     * @brief Builds a signed, not yet stored, ProvenanceRecord from local bytes.
     *
     * Runs entirely on the creator's side; the private key never leaves it.
     */
    class Registrar {
    public:
        /**
         * @param decoder Used only when a perceptual hash is requested for an
         *                image. May be null if no perceptual hashes are wanted.
         */
        explicit Registrar(const ImageDecoder* decoder = nullptr);

        /**
         * @param content The raw file bytes.
         * @param request Metadata and policy.
         * @param keys The creator's key pair. An empty public key is derived from the private key.
         * @param signed_at Signing time; now when empty.
         * @throws ProvMark::MalformedInput for bad keys, missing title/name, or an undecodable image.
         * @throws ProvMark::LogicError if a perceptual hash is requested without a decoder.
         */
        ProvenanceRecord register_content(const byte_vector& content, const RegistrationRequest& request,
                                          const KeyPairHex& keys, const std::string& signed_at = "") const;

    private:
        const ImageDecoder* decoder_;
    };

} // namespace ProvMark

#endif // PROVMARK_REGISTRAR_HPP
