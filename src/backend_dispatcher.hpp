#pragma once
#include <memory>
#include <vector>
#include "config_loader.hpp"
#include "printer_backend.hpp"
#include "protocol_client.hpp"
#include "result.hpp"

namespace printerhub {

// =============================================================================
// BackendDispatcher: picks the family for a device and builds its backend
// =============================================================================
// Stateless apart from the injected ClientFactory and the queue section of
// the config (concurrency classes). Every BackendInstance it returns is owned
// by exactly one context.
class BackendDispatcher {
public:
    BackendDispatcher(ClientFactory& factory, const config::QueueConfig& queue);

    // force_legacy_api wins; otherwise the reported model name decides
    static ModelType detectModelType(const DeviceDetails& details);
    static const BackendDescriptor& descriptorFor(ModelType model);
    static const std::vector<BackendDescriptor>& descriptors();
    static const char* modelTypeName(ModelType model) { return descriptorFor(model).model_name; }

    // legacy -> 1, dual-protocol / multi-material -> configured modern limit
    int concurrencyLimit(BackendFamily family) const;

    // Opens the channels the family needs through the factory.
    // Connection errors from the factory are passed through unchanged.
    Result<std::unique_ptr<BackendInstance>> createBackend(const DeviceDetails& details);

private:
    ClientFactory& factory_;
    const config::QueueConfig queue_;
};

} // namespace printerhub
