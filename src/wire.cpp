#include "provmark/wire.hpp"

namespace ProvMark {

namespace {

template<typename T>
byte_vector to_bytes(T be_value) {
    byte_vector vec(sizeof(be_value));
    std::copy(reinterpret_cast<uint8_t*>(&be_value), reinterpret_cast<uint8_t*>(&be_value) + sizeof(be_value),
              vec.begin());
    return vec;
}

} // namespace

// --- Message ---

byte_vector Message::serialize() const {
    byte_vector buffer;
    buffer.reserve(sizeof(op_code) + parameters.size());

    uint16_t be_op_code = htons(op_code);
    buffer.insert(buffer.end(), reinterpret_cast<const uint8_t*>(&be_op_code),
                  reinterpret_cast<const uint8_t*>(&be_op_code) + sizeof(be_op_code));
    buffer.insert(buffer.end(), parameters.begin(), parameters.end());

    return buffer;
}

Message Message::deserialize(const byte_vector& data) {
    if (data.size() < sizeof(OpCode)) {
        throw RuntimeError("Data too small to be a valid message.");
    }

    Message message;
    uint16_t be_op_code;
    std::copy(data.begin(), data.begin() + sizeof(OpCode), reinterpret_cast<uint8_t*>(&be_op_code));
    message.op_code = ntohs(be_op_code);

    message.parameters.assign(data.begin() + sizeof(OpCode), data.end());

    return message;
}

// --- MessageBuilder ---

MessageBuilder::MessageBuilder(Message::OpCode op_code) {
    message_.op_code = op_code;
}

MessageBuilder& MessageBuilder::add_param(const byte_vector& param) {
    if (param.size() > MAX_PARAM_BYTES) {
        throw RuntimeError("Parameter size exceeds maximum of " + std::to_string(MAX_PARAM_BYTES) + " bytes.");
    }
    uint32_t be_len = htonl(static_cast<uint32_t>(param.size()));

    message_.parameters.insert(message_.parameters.end(), reinterpret_cast<uint8_t*>(&be_len),
                               reinterpret_cast<uint8_t*>(&be_len) + sizeof(be_len));
    message_.parameters.insert(message_.parameters.end(), param.begin(), param.end());
    return *this;
}

MessageBuilder& MessageBuilder::add_param(const std::string& param) {
    return add_param(byte_vector(param.begin(), param.end()));
}

MessageBuilder& MessageBuilder::add_param(const char* param) {
    return add_param(std::string(param));
}

MessageBuilder& MessageBuilder::add_param(bool param) {
    return add_param(byte_vector{static_cast<uint8_t>(param ? 1 : 0)});
}

MessageBuilder& MessageBuilder::add_param(uint16_t param) {
    return add_param(to_bytes(htons(param)));
}

MessageBuilder& MessageBuilder::add_param(uint32_t param) {
    return add_param(to_bytes(htonl(param)));
}

MessageBuilder& MessageBuilder::add_param(uint64_t param) {
    return add_param(to_bytes(detail::htonll_local(param)));
}

Message MessageBuilder::build() {
    return std::move(message_);
}

// --- MessageReader ---

MessageReader::MessageReader(const Message& message) : params_data_(message.parameters) {}

bool MessageReader::has_more() const {
    return offset_ < params_data_.size();
}

byte_vector MessageReader::read_param_bytes() {
    if (offset_ + sizeof(uint32_t) > params_data_.size()) {
        throw RuntimeError("Invalid message data: not enough data for parameter length.");
    }

    uint32_t be_len;
    std::copy(params_data_.begin() + offset_, params_data_.begin() + offset_ + sizeof(uint32_t),
              reinterpret_cast<uint8_t*>(&be_len));
    uint32_t len = ntohl(be_len);
    offset_ += sizeof(uint32_t);

    if (len > MAX_PARAM_BYTES || offset_ + len > params_data_.size()) {
        offset_ = params_data_.size(); // Prevent further reads
        throw RuntimeError("Invalid message data: not enough data for parameter content.");
    }

    byte_vector out_param(params_data_.begin() + offset_, params_data_.begin() + offset_ + len);
    offset_ += len;
    return out_param;
}

} // namespace ProvMark
