#pragma once
#include <cstdint>
#include <string>
#include <string_view>
namespace signet::protocol {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    SecureWipeFailed,
    AllocationFailed,
    WriteOperationFailed,
    ReadOperationFailed,
    ComparisonFailed,
    InvalidOperation
};
enum class ProtocolFailureType {
    Generic,
    KeyGeneration,
    DeriveKey,
    InvalidInput,
    InvalidKey,
    Decode,
    Encode,
    Signature,
    OutOfMemory,
    InvalidState,
    NullPointer
};
enum class HandleFailureType {
    NativeOperation,
    Deserialization,
    InvalidState,
    InvalidArgument
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure SecureWipeFailed(std::string msg) {
        return {SodiumFailureType::SecureWipeFailed, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure WriteOperationFailed(std::string msg) {
        return {SodiumFailureType::WriteOperationFailed, std::move(msg)};
    }
    static SodiumFailure ReadOperationFailed(std::string msg) {
        return {SodiumFailureType::ReadOperationFailed, std::move(msg)};
    }
    static SodiumFailure ComparisonFailed(std::string msg) {
        return {SodiumFailureType::ComparisonFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};
class ProtocolFailure {
public:
    ProtocolFailureType type;
    std::string message;
    ProtocolFailure(const ProtocolFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static ProtocolFailure Generic(std::string msg) {
        return {ProtocolFailureType::Generic, std::move(msg)};
    }
    static ProtocolFailure KeyGeneration(std::string msg) {
        return {ProtocolFailureType::KeyGeneration, std::move(msg)};
    }
    static ProtocolFailure DeriveKey(std::string msg) {
        return {ProtocolFailureType::DeriveKey, std::move(msg)};
    }
    static ProtocolFailure InvalidInput(std::string msg) {
        return {ProtocolFailureType::InvalidInput, std::move(msg)};
    }
    static ProtocolFailure InvalidKey(std::string msg) {
        return {ProtocolFailureType::InvalidKey, std::move(msg)};
    }
    static ProtocolFailure Decode(std::string msg) {
        return {ProtocolFailureType::Decode, std::move(msg)};
    }
    static ProtocolFailure Encode(std::string msg) {
        return {ProtocolFailureType::Encode, std::move(msg)};
    }
    static ProtocolFailure Signature(std::string msg) {
        return {ProtocolFailureType::Signature, std::move(msg)};
    }
    static ProtocolFailure OutOfMemory(std::string msg) {
        return {ProtocolFailureType::OutOfMemory, std::move(msg)};
    }
    static ProtocolFailure InvalidState(std::string msg) {
        return {ProtocolFailureType::InvalidState, std::move(msg)};
    }
    static ProtocolFailure NullPointer(std::string msg) {
        return {ProtocolFailureType::NullPointer, std::move(msg)};
    }
    static ProtocolFailure FromSodiumFailure(const SodiumFailure& sf) {
        if (sf.type == SodiumFailureType::AllocationFailed) {
            return OutOfMemory(sf.message);
        }
        return Generic(sf.message);
    }
};
/**
 * @brief Failure surfaced by the safe handle layer
 *
 * native_code carries the SignetErrorCode reported by the native library,
 * or 0 when the failure was raised before any native call.
 */
class HandleFailure {
public:
    HandleFailureType type;
    int32_t native_code;
    std::string message;
    HandleFailure(const HandleFailureType t, const int32_t code, std::string msg)
        : type(t), native_code(code), message(std::move(msg)) {}
    static HandleFailure NativeOperation(int32_t code, std::string msg) {
        return {HandleFailureType::NativeOperation, code, std::move(msg)};
    }
    static HandleFailure Deserialization(int32_t code, std::string msg) {
        return {HandleFailureType::Deserialization, code, std::move(msg)};
    }
    static HandleFailure InvalidState(std::string msg) {
        return {HandleFailureType::InvalidState, 0, std::move(msg)};
    }
    static HandleFailure InvalidArgument(std::string msg) {
        return {HandleFailureType::InvalidArgument, 0, std::move(msg)};
    }
    [[nodiscard]] bool IsNativeOperation() const noexcept {
        return type == HandleFailureType::NativeOperation ||
               type == HandleFailureType::Deserialization;
    }
    [[nodiscard]] bool IsDeserialization() const noexcept {
        return type == HandleFailureType::Deserialization;
    }
    [[nodiscard]] bool IsInvalidState() const noexcept {
        return type == HandleFailureType::InvalidState;
    }
};
}
