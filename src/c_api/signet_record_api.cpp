/**
 * @file signet_record_api.cpp
 * @brief C API for signed pre-key records
 */

#include "signet/c_api/signet_api.h"
#include "signet_internal.hpp"
#include "signet/debug/handle_logger.hpp"
#include "signet/core/constants.hpp"
#include <memory>
#include <new>
#include <span>
#include <string>

using namespace signet::protocol;
using namespace signet::internal;

namespace {

SignetErrorCode wrap_record(
    SignedPreKeyMaterial material,
    SignetSignedPreKeyRecord** out_record,
    SignetError* out_error) {
    auto* record = new(std::nothrow) SignetSignedPreKeyRecord{};
    if (!record) {
        fill_error(out_error, SIGNET_ERROR_OUT_OF_MEMORY, "Failed to allocate signed pre-key record");
        return SIGNET_ERROR_OUT_OF_MEMORY;
    }
    record->material = std::make_unique<SignedPreKeyMaterial>(std::move(material));
    signet::debug::LogRecordCreated(
        record->material->GetId(),
        record->material->GetTimestampMs(),
        record->material->GetPublicKey(),
        record->material->GetSignature());
    *out_record = record;
    return SIGNET_SUCCESS;
}

bool validate_record(const SignetSignedPreKeyRecord* record, SignetError* out_error) {
    return validate_input_handle(record, "Signed pre-key record", out_error);
}

} // namespace

extern "C" {

SignetErrorCode signet_signed_pre_key_record_new(
    SignetSignedPreKeyRecord** out_record,
    const uint32_t id,
    const uint64_t timestamp_ms,
    const SignetPublicKey* public_key,
    const SignetPrivateKey* private_key,
    const uint8_t* signature,
    const size_t signature_length,
    SignetError* out_error) {
    if (const auto err = EnsureInitialized(); err != SIGNET_SUCCESS) {
        fill_error(out_error, err, std::string(ErrorMessages::SODIUM_INIT_FAILED));
        return err;
    }
    if (!validate_output_handle(out_record, out_error)) {
        return SIGNET_ERROR_NULL_POINTER;
    }
    if (!validate_input_handle(public_key, "Public key", out_error) ||
        !validate_input_handle(private_key, "Private key", out_error)) {
        return SIGNET_ERROR_NULL_POINTER;
    }
    if (!validate_buffer_param(signature, signature_length, out_error)) {
        return SIGNET_ERROR_NULL_POINTER;
    }

    auto material_result = SignedPreKeyMaterial::Create(
        id,
        timestamp_ms,
        public_key->key,
        *private_key->key_pair,
        std::span(signature, signature_length),
        CurrentConfig());
    if (material_result.IsErr()) {
        return fill_error_from_failure(out_error, material_result.UnwrapErr());
    }
    return wrap_record(std::move(material_result).Unwrap(), out_record, out_error);
}

SignetErrorCode signet_signed_pre_key_record_deserialize(
    SignetSignedPreKeyRecord** out_record,
    const uint8_t* data,
    const size_t data_length,
    SignetError* out_error) {
    if (const auto err = EnsureInitialized(); err != SIGNET_SUCCESS) {
        fill_error(out_error, err, std::string(ErrorMessages::SODIUM_INIT_FAILED));
        return err;
    }
    if (!validate_output_handle(out_record, out_error)) {
        return SIGNET_ERROR_NULL_POINTER;
    }
    if (!validate_buffer_param(data, data_length, out_error)) {
        return SIGNET_ERROR_NULL_POINTER;
    }

    auto material_result = SignedPreKeyMaterial::Deserialize(
        std::span(data, data_length),
        CurrentConfig());
    if (material_result.IsErr()) {
        return fill_error_from_failure(out_error, material_result.UnwrapErr());
    }
    return wrap_record(std::move(material_result).Unwrap(), out_record, out_error);
}

SignetErrorCode signet_signed_pre_key_record_clone(
    SignetSignedPreKeyRecord** out_record,
    const SignetSignedPreKeyRecord* record,
    SignetError* out_error) {
    if (!validate_output_handle(out_record, out_error)) {
        return SIGNET_ERROR_NULL_POINTER;
    }
    if (!validate_record(record, out_error)) {
        return SIGNET_ERROR_NULL_POINTER;
    }
    auto clone_result = record->material->Clone();
    if (clone_result.IsErr()) {
        return fill_error_from_failure(out_error, clone_result.UnwrapErr());
    }
    return wrap_record(std::move(clone_result).Unwrap(), out_record, out_error);
}

SignetErrorCode signet_signed_pre_key_record_destroy(SignetSignedPreKeyRecord* record) {
    delete record;
    return SIGNET_SUCCESS;
}

SignetErrorCode signet_signed_pre_key_record_serialize(
    SignetBuffer* out_buffer,
    const SignetSignedPreKeyRecord* record,
    SignetError* out_error) {
    if (!validate_output_handle(out_buffer, out_error)) {
        return SIGNET_ERROR_NULL_POINTER;
    }
    if (!validate_record(record, out_error)) {
        return SIGNET_ERROR_NULL_POINTER;
    }
    auto serialize_result = record->material->Serialize();
    if (serialize_result.IsErr()) {
        return fill_error_from_failure(out_error, serialize_result.UnwrapErr());
    }
    if (!copy_to_buffer(serialize_result.Unwrap(), out_buffer, out_error)) {
        return SIGNET_ERROR_OUT_OF_MEMORY;
    }
    return SIGNET_SUCCESS;
}

SignetErrorCode signet_signed_pre_key_record_get_signature(
    SignetBuffer* out_signature,
    const SignetSignedPreKeyRecord* record,
    SignetError* out_error) {
    if (!validate_output_handle(out_signature, out_error)) {
        return SIGNET_ERROR_NULL_POINTER;
    }
    if (!validate_record(record, out_error)) {
        return SIGNET_ERROR_NULL_POINTER;
    }
    if (!copy_to_buffer(record->material->GetSignature(), out_signature, out_error)) {
        return SIGNET_ERROR_OUT_OF_MEMORY;
    }
    return SIGNET_SUCCESS;
}

SignetErrorCode signet_signed_pre_key_record_get_id(
    uint32_t* out_id,
    const SignetSignedPreKeyRecord* record,
    SignetError* out_error) {
    if (!validate_output_handle(out_id, out_error)) {
        return SIGNET_ERROR_NULL_POINTER;
    }
    if (!validate_record(record, out_error)) {
        return SIGNET_ERROR_NULL_POINTER;
    }
    *out_id = record->material->GetId();
    return SIGNET_SUCCESS;
}

SignetErrorCode signet_signed_pre_key_record_get_timestamp(
    uint64_t* out_timestamp_ms,
    const SignetSignedPreKeyRecord* record,
    SignetError* out_error) {
    if (!validate_output_handle(out_timestamp_ms, out_error)) {
        return SIGNET_ERROR_NULL_POINTER;
    }
    if (!validate_record(record, out_error)) {
        return SIGNET_ERROR_NULL_POINTER;
    }
    *out_timestamp_ms = record->material->GetTimestampMs();
    return SIGNET_SUCCESS;
}

SignetErrorCode signet_signed_pre_key_record_get_public_key(
    SignetPublicKey** out_key,
    const SignetSignedPreKeyRecord* record,
    SignetError* out_error) {
    if (!validate_output_handle(out_key, out_error)) {
        return SIGNET_ERROR_NULL_POINTER;
    }
    if (!validate_record(record, out_error)) {
        return SIGNET_ERROR_NULL_POINTER;
    }
    return make_public_key(record->material->GetPublicKey(), out_key, out_error);
}

SignetErrorCode signet_signed_pre_key_record_get_private_key(
    SignetPrivateKey** out_key,
    const SignetSignedPreKeyRecord* record,
    SignetError* out_error) {
    if (!validate_output_handle(out_key, out_error)) {
        return SIGNET_ERROR_NULL_POINTER;
    }
    if (!validate_record(record, out_error)) {
        return SIGNET_ERROR_NULL_POINTER;
    }
    auto clone_result = record->material->GetKeyPair().Clone();
    if (clone_result.IsErr()) {
        return fill_error_from_failure(out_error, clone_result.UnwrapErr());
    }
    return make_private_key(std::move(clone_result).Unwrap(), out_key, out_error);
}

} // extern "C"
