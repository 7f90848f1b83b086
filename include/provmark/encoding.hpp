#ifndef PROVMARK_ENCODING_HPP
#define PROVMARK_ENCODING_HPP

#include "keys.hpp"

#include <string>

namespace ProvMark {
namespace Encoding {

    /**
     * @brief Encodes bytes as lowercase hex.
     */
    std::string to_hex(const byte_vector& bytes);

    /**
     * @brief Decodes a hex string.
     * @param hex The hex text. Must have even length and contain only hex digits.
     * @param expected_size If non-zero, the decoded length must equal this.
     * @throws ProvMark::MalformedInput on any violation.
     */
    byte_vector from_hex(const std::string& hex, size_t expected_size = 0);

    /**
     * @brief True if the string is exactly `length` lowercase hex characters.
     */
    bool is_lower_hex(const std::string& text, size_t length);

    /**
     * @brief Standard (padded) base64.
     */
    std::string to_base64(const byte_vector& bytes);

    /**
     * @brief Decodes standard padded base64.
     * @throws ProvMark::MalformedInput if the text is not valid base64.
     */
    byte_vector from_base64(const std::string& text);

    /**
     * @brief base58btc with the Bitcoin alphabet. Leading zero bytes map to '1'.
     */
    std::string to_base58(const byte_vector& bytes);

    /**
     * @brief Inverse of to_base58.
     * @throws ProvMark::MalformedInput on characters outside the alphabet.
     */
    byte_vector from_base58(const std::string& text);

} // namespace Encoding
} // namespace ProvMark

#endif // PROVMARK_ENCODING_HPP
