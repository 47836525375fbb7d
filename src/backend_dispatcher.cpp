#include "backend_dispatcher.hpp"
#include "printerhub_log.hpp"
#include <algorithm>
#include <cctype>

namespace printerhub {

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

const std::vector<BackendDescriptor>& BackendDispatcher::descriptors() {
    //                                  camera led   filtr gcode status job  thumbs material
    static const std::vector<BackendDescriptor> table = {
        {ModelType::GenericLegacy, "generic-legacy", "Generic Legacy", BackendFamily::Legacy,
            FeatureSet{false, false, false, true, true, true, true, false}},
        {ModelType::Adventurer5M, "adventurer-5m", "Adventurer 5M", BackendFamily::DualProtocol,
            FeatureSet{false, true, false, true, true, true, true, false}},
        {ModelType::Adventurer5MPro, "adventurer-5m-pro", "Adventurer 5M Pro", BackendFamily::DualProtocol,
            FeatureSet{true, true, true, true, true, true, true, false}},
        {ModelType::AD5X, "ad5x", "AD5X", BackendFamily::MultiMaterial,
            FeatureSet{false, true, false, true, true, true, true, true}},
    };
    return table;
}

const BackendDescriptor& BackendDispatcher::descriptorFor(ModelType model) {
    for (const auto& d : descriptors()) {
        if (d.model == model) return d;
    }
    return descriptors().front();
}

ModelType BackendDispatcher::detectModelType(const DeviceDetails& details) {
    if (details.force_legacy_api) return ModelType::GenericLegacy;

    const std::string model = lowercase(details.model);
    // "5m pro" must be tested before the plain "5m"
    if (model.find("5m pro") != std::string::npos) return ModelType::Adventurer5MPro;
    if (model.find("5m") != std::string::npos) return ModelType::Adventurer5M;
    if (model.find("ad5x") != std::string::npos) return ModelType::AD5X;
    return ModelType::GenericLegacy;
}

BackendDispatcher::BackendDispatcher(ClientFactory& factory, const config::QueueConfig& queue)
    : factory_(factory), queue_(queue) {}

int BackendDispatcher::concurrencyLimit(BackendFamily family) const {
    return family == BackendFamily::Legacy ? queue_.legacy_concurrency : queue_.modern_concurrency;
}

Result<std::unique_ptr<BackendInstance>> BackendDispatcher::createBackend(const DeviceDetails& details) {
    const BackendDescriptor& desc = descriptorFor(detectModelType(details));
    const int limit = concurrencyLimit(desc.family);

    auto legacy = factory_.openLegacy(details);
    if (legacy.is_err()) {
        PHLOG_WARN("Backend", "Legacy channel to %s failed: %s",
                   details.ip_address.c_str(), legacy.error().describe().c_str());
        return legacy.error();
    }

    if (desc.family == BackendFamily::Legacy) {
        PHLOG_INFO("Backend", "Created %s backend for %s (limit %d)",
                   desc.model_name, details.ip_address.c_str(), limit);
        return std::make_unique<BackendInstance>(
            desc, BackendInstance::Variant(std::in_place_type<LegacyBackend>,
                                           std::move(legacy).value()),
            limit);
    }

    auto modern = factory_.openModern(details);
    if (modern.is_err()) {
        PHLOG_WARN("Backend", "Modern API channel to %s failed: %s",
                   details.ip_address.c_str(), modern.error().describe().c_str());
        legacy.value()->close();
        return modern.error();
    }

    std::unique_ptr<BackendInstance> instance;
    if (desc.family == BackendFamily::MultiMaterial) {
        instance = std::make_unique<BackendInstance>(
            desc, BackendInstance::Variant(std::in_place_type<MultiMaterialBackend>,
                                           std::move(modern).value(), std::move(legacy).value()),
            limit);
    } else {
        instance = std::make_unique<BackendInstance>(
            desc, BackendInstance::Variant(std::in_place_type<DualProtocolBackend>,
                                           std::move(modern).value(), std::move(legacy).value()),
            limit);
    }
    PHLOG_INFO("Backend", "Created %s backend for %s (limit %d)",
               desc.model_name, details.ip_address.c_str(), limit);
    return std::move(instance);
}

} // namespace printerhub
