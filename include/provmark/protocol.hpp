#ifndef PROVMARK_PROTOCOL_HPP
#define PROVMARK_PROTOCOL_HPP

#include "errors.hpp"
#include "service.hpp"
#include "wire.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>

namespace ProvMark {

    /**
     * @brief A client request: [request_id u32][json body].
     */
    struct Request {
        Message::OpCode op_code = 0;
        uint32_t request_id = 0;
        nlohmann::json body = nlohmann::json::object();

        byte_vector encode() const;

        /**
         * @throws ProvMark::RuntimeError for truncated frames or a response op code.
         * @throws ProvMark::MalformedInput if the body is not JSON.
         */
        static Request decode(const byte_vector& data);
    };

    /**
     * @brief A server response: op code RESPONSE, [request_id u32][ErrorCode u16][json body].
     */
    struct Response {
        uint32_t request_id = 0;
        ErrorCode code = ErrorCode::OK;
        nlohmann::json body = nlohmann::json::object();

        byte_vector encode() const;
        static Response decode(const byte_vector& data);

        // Convenience for error responses: {"error": message}.
        static Response failure(uint32_t request_id, ErrorCode code, const std::string& message);
    };

    // Request and result bodies. Key names follow the record JSON (camelCase).
    void to_json(nlohmann::json& j, const LookupRequest& request);
    void from_json(const nlohmann::json& j, LookupRequest& request);

    // {"status", "message", "records": [record + "hammingDistance"?]}
    void to_json(nlohmann::json& j, const LookupResult& result);
    void from_json(const nlohmann::json& j, LookupResult& result);

    // {"id", "timestamp", "signature", "verify_only"}
    void to_json(nlohmann::json& j, const DeleteRequest& request);
    void from_json(const nlohmann::json& j, DeleteRequest& request);

    void to_json(nlohmann::json& j, const SubmitResult& result);
    void from_json(const nlohmann::json& j, SubmitResult& result);

} // namespace ProvMark

#endif // PROVMARK_PROTOCOL_HPP
