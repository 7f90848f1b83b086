#include "provmark/errors.hpp"

namespace ProvMark {

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:
            return "OK";
        case ErrorCode::MALFORMED_INPUT:
            return "MALFORMED_INPUT";
        case ErrorCode::HASH_MISMATCH:
            return "HASH_MISMATCH";
        case ErrorCode::SIGNATURE_INVALID:
            return "SIGNATURE_INVALID";
        case ErrorCode::ACTION_EXPIRED:
            return "ACTION_EXPIRED";
        case ErrorCode::NOT_FOUND:
            return "NOT_FOUND";
        case ErrorCode::INTERNAL:
            return "INTERNAL";
    }
    return "UNKNOWN";
}

} // namespace ProvMark
