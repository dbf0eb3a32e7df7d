#include "signet/handles/library.hpp"
#include "signet/handles/call_adapter.hpp"

namespace signet::protocol::handles {

Result<Unit, HandleFailure> Library::Initialize(const configuration::RecordConfig& config) {
    const SignetConfig native_config{
        config.GetMaxSignatureLength(),
        config.GetMaxSerializedLength(),
        config.VerifiesKeyPair()};
    return InvokeNative("Library::Initialize", [&native_config](SignetError* error) {
        return signet_init_with_config(&native_config, error);
    });
}

std::string_view Library::Version() noexcept {
    return signet_version();
}

uint64_t Library::LiveObjectCount(const SignetObjectKind kind) noexcept {
    return signet_live_object_count(kind);
}

} // namespace signet::protocol::handles
