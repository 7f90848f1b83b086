#ifndef PROVMARK_TEST_RECORDS_HPP
#define PROVMARK_TEST_RECORDS_HPP

#include <optional>
#include <string>

#include "provmark/identity.hpp"
#include "provmark/record.hpp"
#include "provmark/registrar.hpp"

namespace ProvMark {
namespace test {

    inline byte_vector bytes_of(const std::string& text) {
        return byte_vector(text.begin(), text.end());
    }

    inline RegistrationRequest text_request(const std::string& title) {
        RegistrationRequest request;
        request.title = title;
        request.file_name = title + ".txt";
        request.content_type = "text/plain";
        request.display_name = "Test Author";
        request.usage_policy.license = "CC0";
        request.usage_policy.ai_training = Permission::DENIED;
        request.usage_policy.ai_derivative_generation = Permission::DENIED;
        request.usage_policy.commercial_use = Permission::ALLOWED;
        return request;
    }

    /**
     * @brief A fully signed text record. `perceptual_hash` is attached after
     *        signing (it is not part of the payload) and switches the content
     *        type to image/png so the record is a valid image record.
     */
    inline ProvenanceRecord signed_record(const KeyPairHex& keys, const std::string& content,
                                          const std::string& signed_at,
                                          const std::optional<std::string>& perceptual_hash = std::nullopt) {
        RegistrationRequest request = text_request("Record " + content);
        if (perceptual_hash) {
            request.content_type = "image/png";
        }
        Registrar registrar;
        ProvenanceRecord record = registrar.register_content(bytes_of(content), request, keys, signed_at);
        record.perceptual_hash = perceptual_hash;
        return record;
    }

} // namespace test
} // namespace ProvMark

#endif // PROVMARK_TEST_RECORDS_HPP
