#include "provmark/encoding.hpp"

#include <sodium.h>

#include <algorithm>

#include "provmark/errors.hpp"

namespace ProvMark {
namespace Encoding {

    namespace {
        constexpr char BASE58_ALPHABET[] = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

        int base58_index(char c) {
            const char* end = BASE58_ALPHABET + 58;
            const char* pos = std::find(BASE58_ALPHABET, end, c);
            return pos == end ? -1 : static_cast<int>(pos - BASE58_ALPHABET);
        }
    }

    std::string to_hex(const byte_vector& bytes) {
        std::string hex(bytes.size() * 2 + 1, '\0');
        sodium_bin2hex(&hex[0], hex.size(), bytes.data(), bytes.size());
        hex.resize(bytes.size() * 2);
        return hex;
    }

    byte_vector from_hex(const std::string& hex, size_t expected_size) {
        if (hex.size() % 2 != 0) {
            throw MalformedInput("Hex string has odd length.");
        }
        if (expected_size != 0 && hex.size() != expected_size * 2) {
            throw MalformedInput("Hex string has wrong length: expected " + std::to_string(expected_size * 2) +
                                 " characters, got " + std::to_string(hex.size()) + ".");
        }

        byte_vector bytes(hex.size() / 2);
        size_t bin_len = 0;
        const char* hex_end = nullptr;
        if (sodium_hex2bin(bytes.data(), bytes.size(), hex.data(), hex.size(), nullptr, &bin_len, &hex_end) != 0 ||
            bin_len != bytes.size() || hex_end != hex.data() + hex.size()) {
            throw MalformedInput("Invalid hex string.");
        }
        return bytes;
    }

    bool is_lower_hex(const std::string& text, size_t length) {
        if (text.size() != length) {
            return false;
        }
        return std::all_of(text.begin(), text.end(), [](char c) {
            return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
        });
    }

    std::string to_base64(const byte_vector& bytes) {
        const size_t encoded_len = sodium_base64_ENCODED_LEN(bytes.size(), sodium_base64_VARIANT_ORIGINAL);
        std::string out(encoded_len, '\0');
        sodium_bin2base64(&out[0], encoded_len, bytes.data(), bytes.size(), sodium_base64_VARIANT_ORIGINAL);
        out.resize(encoded_len - 1);  // drop the terminating NUL
        return out;
    }

    byte_vector from_base64(const std::string& text) {
        byte_vector bytes(text.size() / 4 * 3 + 3);
        size_t bin_len = 0;
        const char* b64_end = nullptr;
        if (sodium_base642bin(bytes.data(), bytes.size(), text.data(), text.size(), nullptr, &bin_len, &b64_end,
                              sodium_base64_VARIANT_ORIGINAL) != 0 ||
            b64_end != text.data() + text.size()) {
            throw MalformedInput("Invalid base64 string.");
        }
        bytes.resize(bin_len);
        return bytes;
    }

    std::string to_base58(const byte_vector& bytes) {
        // Base-58 digits, least significant first.
        std::vector<uint8_t> digits;
        digits.reserve(bytes.size() * 138 / 100 + 1);

        for (uint8_t byte : bytes) {
            uint32_t carry = byte;
            for (auto& digit : digits) {
                carry += static_cast<uint32_t>(digit) << 8;
                digit = static_cast<uint8_t>(carry % 58);
                carry /= 58;
            }
            while (carry > 0) {
                digits.push_back(static_cast<uint8_t>(carry % 58));
                carry /= 58;
            }
        }

        std::string result;
        for (uint8_t byte : bytes) {
            if (byte != 0) {
                break;
            }
            result += BASE58_ALPHABET[0];
        }
        for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
            result += BASE58_ALPHABET[*it];
        }
        return result;
    }

    byte_vector from_base58(const std::string& text) {
        // Bytes, least significant first.
        byte_vector bytes;
        bytes.reserve(text.size() * 733 / 1000 + 1);

        for (char c : text) {
            int value = base58_index(c);
            if (value < 0) {
                throw MalformedInput(std::string("Invalid base58 character: '") + c + "'.");
            }
            uint32_t carry = static_cast<uint32_t>(value);
            for (auto& byte : bytes) {
                carry += static_cast<uint32_t>(byte) * 58;
                byte = static_cast<uint8_t>(carry & 0xFF);
                carry >>= 8;
            }
            while (carry > 0) {
                bytes.push_back(static_cast<uint8_t>(carry & 0xFF));
                carry >>= 8;
            }
        }

        byte_vector result;
        for (char c : text) {
            if (c != BASE58_ALPHABET[0]) {
                break;
            }
            result.push_back(0);
        }
        result.insert(result.end(), bytes.rbegin(), bytes.rend());
        return result;
    }

} // namespace Encoding
} // namespace ProvMark
