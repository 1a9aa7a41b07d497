#include <secbuf/error.h>
#include <unordered_map>

namespace secbuf {

std::string SecbufErrorCategory::message(int ev) const {
    SecbufError error = static_cast<SecbufError>(ev);

    static const std::unordered_map<SecbufError, std::string> error_messages = {
        {SecbufError::SUCCESS, "Success"},
        {SecbufError::INVALID_PARAMETER, "Invalid parameter provided"},
        {SecbufError::OUT_OF_MEMORY, "Memory allocation failed"},
        {SecbufError::NOT_INITIALIZED, "Buffer slot not initialized"},
        {SecbufError::INTERNAL_ERROR, "Internal implementation error"},

        {SecbufError::CAPACITY_EXCEEDED, "Write would exceed buffer capacity"},
        {SecbufError::UNDERFLOW_ERROR, "Read requests more bytes than available"},
        {SecbufError::MALFORMED_LENGTH, "Length prefix exceeds remaining bytes"},
        {SecbufError::OUT_OF_RANGE, "Position outside buffer length"},

        {SecbufError::BUFFER_FULL, "Ring buffer has insufficient free space"},
        {SecbufError::QUEUE_FULL, "Packet queue bound reached"},

        {SecbufError::INVALID_CONFIGURATION, "Invalid configuration"},

        {SecbufError::RATE_LIMITED, "Report rate limit exceeded"}
    };

    auto it = error_messages.find(error);
    if (it != error_messages.end()) {
        return it->second;
    }

    return "Unknown secbuf error (" + std::to_string(ev) + ")";
}

std::string error_message(SecbufError error) {
    return SecbufErrorCategory::instance().message(static_cast<int>(error));
}

bool is_retryable_error(SecbufError error) noexcept {
    switch (error) {
        case SecbufError::BUFFER_FULL:
        case SecbufError::QUEUE_FULL:
        case SecbufError::RATE_LIMITED:
            return true;
        default:
            return false;
    }
}

bool is_protocol_error(SecbufError error) noexcept {
    return error == SecbufError::MALFORMED_LENGTH;
}

} // namespace secbuf
