#pragma once
// =============================================================================
// PrinterHub - Printer Backends
// =============================================================================
// One backend per context, chosen once from the device's model. Each family is
// a plain class; the model's static descriptor says which operations it has.
// BackendInstance holds exactly one family in a std::variant and routes
// operations with std::visit.
//
//   LegacyBackend        generic-legacy      legacy channel only
//   DualProtocolBackend  adventurer-5m(pro)  modern API + legacy G-code channel
//   MultiMaterialBackend ad5x                dual protocol + material station
// =============================================================================

#include <memory>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>
#include "printer_types.hpp"
#include "protocol_client.hpp"
#include "result.hpp"

namespace printerhub {

enum class BackendFamily : uint8_t { Legacy = 0, DualProtocol, MultiMaterial };

enum class ModelType : uint8_t { GenericLegacy = 0, Adventurer5M, Adventurer5MPro, AD5X };

const char* backendFamilyName(BackendFamily f);

struct FeatureSet {
    bool camera = false;            // built-in camera stream
    bool led_control = false;
    bool filtration = false;
    bool gcode_commands = false;
    bool status_monitoring = false;
    bool job_control = false;       // start / pause / resume / cancel
    bool thumbnails = false;
    bool material_station = false;
};

struct BackendDescriptor {
    ModelType model;
    const char* model_name;         // "adventurer-5m-pro"
    const char* display_name;       // "Adventurer 5M Pro"
    BackendFamily family;
    FeatureSet features;
};

struct BackendCapabilities {
    ModelType model = ModelType::GenericLegacy;
    std::string model_name;
    std::string display_name;
    BackendFamily family = BackendFamily::Legacy;
    FeatureSet features;
    int max_concurrent_requests = 1;
};

void to_json(nlohmann::json& j, const BackendCapabilities& c);

enum class Operation : uint8_t {
    SendCommand = 0,
    GetStatus,
    StartJob,
    PauseJob,
    ResumeJob,
    CancelJob,
    QueryMaterialSlots,
    GetThumbnail,
    SetLed,
};

const char* operationName(Operation op);
bool featureSupports(const FeatureSet& features, Operation op);

enum class JobAction : uint8_t { Pause, Resume, Cancel };

// Response normalization (exposed for tests)
Result<PrinterStatus> parseLegacyStatus(const nlohmann::json& j);
Result<PrinterStatus> parseModernStatus(const nlohmann::json& j);
Result<MaterialStationStatus> parseMaterialStation(const nlohmann::json& j);

// =============================================================================
// Family implementations
// =============================================================================

class LegacyBackend {
public:
    explicit LegacyBackend(std::unique_ptr<ProtocolClient> legacy);

    void getStatus(Completion<PrinterStatus> done);
    void sendCommand(const std::string& command, Completion<std::string> done);
    void startJob(const JobStartParams& params, Completion<void> done);
    void jobControl(JobAction action, Completion<void> done);
    void getThumbnail(const std::string& file_name, Completion<std::string> done);
    void close();

private:
    std::unique_ptr<ProtocolClient> legacy_;
};

class DualProtocolBackend {
public:
    DualProtocolBackend(std::unique_ptr<ProtocolClient> modern,
                        std::unique_ptr<ProtocolClient> legacy);

    void getStatus(Completion<PrinterStatus> done);
    void sendCommand(const std::string& command, Completion<std::string> done);
    void startJob(const JobStartParams& params, Completion<void> done);
    void jobControl(JobAction action, Completion<void> done);
    void getThumbnail(const std::string& file_name, Completion<std::string> done);
    void setLed(bool on, Completion<void> done);
    void close();

    ProtocolClient& modernClient() { return *modern_; }

private:
    std::unique_ptr<ProtocolClient> modern_;
    std::unique_ptr<ProtocolClient> legacy_;
};

// AD5X: the 5M dual protocol plus the four-slot material station
class MultiMaterialBackend {
public:
    MultiMaterialBackend(std::unique_ptr<ProtocolClient> modern,
                         std::unique_ptr<ProtocolClient> legacy);

    void getStatus(Completion<PrinterStatus> done) { dual_.getStatus(std::move(done)); }
    void sendCommand(const std::string& command, Completion<std::string> done) {
        dual_.sendCommand(command, std::move(done));
    }
    void startJob(const JobStartParams& params, Completion<void> done);
    void jobControl(JobAction action, Completion<void> done) { dual_.jobControl(action, std::move(done)); }
    void getThumbnail(const std::string& file_name, Completion<std::string> done) {
        dual_.getThumbnail(file_name, std::move(done));
    }
    void setLed(bool on, Completion<void> done) { dual_.setLed(on, std::move(done)); }
    void queryMaterialSlots(Completion<MaterialStationStatus> done);
    void close() { dual_.close(); }

private:
    DualProtocolBackend dual_;
};

// =============================================================================
// BackendInstance: exclusively owned by one context
// =============================================================================

class BackendInstance {
public:
    using Variant = std::variant<LegacyBackend, DualProtocolBackend, MultiMaterialBackend>;

    BackendInstance(const BackendDescriptor& descriptor, Variant impl, int max_concurrent_requests);
    ~BackendInstance();

    BackendInstance(const BackendInstance&) = delete;
    BackendInstance& operator=(const BackendInstance&) = delete;

    const BackendDescriptor& descriptor() const { return descriptor_; }
    BackendFamily family() const { return descriptor_.family; }
    BackendCapabilities capabilities() const;
    bool supports(Operation op) const { return featureSupports(descriptor_.features, op); }

    // Unsupported operations complete immediately with UnsupportedOperation
    void getStatus(Completion<PrinterStatus> done);
    void sendCommand(const std::string& command, Completion<std::string> done);
    void startJob(const JobStartParams& params, Completion<void> done);
    void pauseJob(Completion<void> done);
    void resumeJob(Completion<void> done);
    void cancelJob(Completion<void> done);
    void queryMaterialSlots(Completion<MaterialStationStatus> done);
    void getThumbnail(const std::string& file_name, Completion<std::string> done);
    void setLed(bool on, Completion<void> done);

    void close();

private:
    Error unsupported(Operation op) const;
    void jobControl(Operation op, JobAction action, Completion<void> done);

    const BackendDescriptor& descriptor_;
    Variant impl_;
    int max_concurrent_requests_;
    bool closed_ = false;
};

} // namespace printerhub
