#ifndef PROVMARK_FINGERPRINT_HPP
#define PROVMARK_FINGERPRINT_HPP

#include "keys.hpp"

#include <string>

namespace ProvMark {

    constexpr size_t CONTENT_HASH_HEX_LENGTH = 64;

    /**
     * @brief Exact identity of a byte sequence: lowercase hex SHA-256.
     */
    class ContentFingerprint {
    public:
        static std::string hash(const byte_vector& bytes);

        /**
         * @brief Hashes a file in fixed-size chunks.
         * @throws ProvMark::RuntimeError if the file cannot be read.
         */
        static std::string hash_file(const std::string& path);

        /**
         * @brief Reads a whole file into memory.
         * @throws ProvMark::RuntimeError if the file cannot be read.
         */
        static byte_vector read_file(const std::string& path);

        /**
         * @brief True for a well-formed fingerprint (64 lowercase hex characters).
         */
        static bool is_valid(const std::string& fingerprint);
    };

} // namespace ProvMark

#endif // PROVMARK_FINGERPRINT_HPP
