#ifndef PROVMARK_WIRE_HPP
#define PROVMARK_WIRE_HPP

#include "errors.hpp"
#include "keys.hpp"

#include <arpa/inet.h>

#include <algorithm>
#include <cstdint>
#include <string>
#include <type_traits>

namespace ProvMark {

    namespace detail {
        #if __BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__
        inline uint64_t htonll_local(uint64_t val) {
            return (((uint64_t)htonl(val)) << 32) + htonl(val >> 32);
        }
        inline uint64_t ntohll_local(uint64_t val) {
            return (((uint64_t)ntohl(val)) << 32) + ntohl(val >> 32);
        }
        #else
        inline uint64_t htonll_local(uint64_t val) { return val; }
        inline uint64_t ntohll_local(uint64_t val) { return val; }
        #endif
    }

    // Largest single parameter accepted on the wire.
    constexpr uint32_t MAX_PARAM_BYTES = 16 * 1024 * 1024;

    /**
     * @brief One binary frame.
     * Format: [OpCode (2, BE)] + N x ([Length (4, BE)] + [Bytes])
     */
    class Message {
    public:
        using OpCode = uint16_t;

        OpCode op_code = 0;
        byte_vector parameters;

        byte_vector serialize() const;

        /**
         * @throws ProvMark::RuntimeError if the data is too small.
         */
        static Message deserialize(const byte_vector& data);
    };

    namespace Ops {
        constexpr Message::OpCode SUBMIT_RECORD = 0x0101;
        constexpr Message::OpCode GET_RECORD = 0x0102;
        constexpr Message::OpCode LIST_RECORDS = 0x0103;
        constexpr Message::OpCode FIND_BY_HASH = 0x0104;
        constexpr Message::OpCode LOOKUP = 0x0105;
        constexpr Message::OpCode DELETE_RECORD = 0x0106;

        constexpr Message::OpCode RESPONSE = 0xFFFF;
    }

    /**
     * @brief A helper class to build a Message with parameters.
     */
    class MessageBuilder {
    public:
        explicit MessageBuilder(Message::OpCode op_code);

        MessageBuilder& add_param(const byte_vector& param);
        MessageBuilder& add_param(const std::string& param);
        MessageBuilder& add_param(const char* param);

        MessageBuilder& add_param(bool param);
        MessageBuilder& add_param(uint16_t param);
        MessageBuilder& add_param(uint32_t param);
        MessageBuilder& add_param(uint64_t param);

        Message build();

    private:
        Message message_;
    };

    /**
     * @brief A helper class to parse parameters from a Message.
     */
    class MessageReader {
    public:
        explicit MessageReader(const Message& message);

        template<typename T>
        T read_param() {
            byte_vector vec = read_param_bytes();
            if (vec.size() != sizeof(T)) {
                throw RuntimeError("Invalid message data: parameter size mismatch for the requested type.");
            }
            T val;
            std::copy(vec.begin(), vec.end(), reinterpret_cast<uint8_t*>(&val));

            if constexpr (std::is_integral_v<T> && sizeof(T) == 2) {
                return ntohs(val);
            } else if constexpr (std::is_integral_v<T> && sizeof(T) == 4) {
                return ntohl(val);
            } else if constexpr (std::is_integral_v<T> && sizeof(T) == 8) {
                return detail::ntohll_local(val);
            } else {
                return val;
            }
        }

        bool has_more() const;

    private:
        byte_vector read_param_bytes();
        const byte_vector& params_data_;
        size_t offset_ = 0;
    };

    template<>
    inline std::string MessageReader::read_param<std::string>() {
        byte_vector vec = read_param_bytes();
        return std::string(vec.begin(), vec.end());
    }

    template<>
    inline byte_vector MessageReader::read_param<byte_vector>() {
        return read_param_bytes();
    }

    template<>
    inline bool MessageReader::read_param<bool>() {
        byte_vector vec = read_param_bytes();
        if (vec.size() != 1) {
            throw RuntimeError("Invalid message data: parameter size mismatch for bool.");
        }
        return vec[0] != 0;
    }

} // namespace ProvMark

#endif // PROVMARK_WIRE_HPP
