#include "signet/handles/call_adapter.hpp"
#include "signet/debug/handle_logger.hpp"

#include <string>

namespace signet::protocol::handles {

NativeErrorSlot::~NativeErrorSlot() {
    signet_error_free(&error_);
}

HandleFailure NativeErrorSlot::ToFailure(
    const std::string_view operation,
    const SignetErrorCode code,
    const NativeFailureKind kind) const {
    std::string message(operation);
    message += ": ";
    message += error_.message ? error_.message : signet_error_string(code);

    debug::LogNativeFailure(operation, static_cast<int32_t>(code), message);

    if (kind == NativeFailureKind::Deserialization) {
        return HandleFailure::Deserialization(static_cast<int32_t>(code), std::move(message));
    }
    return HandleFailure::NativeOperation(static_cast<int32_t>(code), std::move(message));
}

OwnedBuffer::~OwnedBuffer() {
    signet_buffer_free(&buffer_);
}

std::vector<uint8_t> OwnedBuffer::CopyOut() const {
    if (!buffer_.data || buffer_.length == 0) {
        return {};
    }
    return std::vector<uint8_t>(buffer_.data, buffer_.data + buffer_.length);
}

} // namespace signet::protocol::handles
