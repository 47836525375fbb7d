#include "printer_backend.hpp"
#include "printerhub_log.hpp"

namespace printerhub {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

using nlohmann::json;

const char* backendFamilyName(BackendFamily f) {
    switch (f) {
    case BackendFamily::Legacy:        return "legacy";
    case BackendFamily::DualProtocol:  return "dual-protocol";
    case BackendFamily::MultiMaterial: return "multi-material";
    }
    return "?";
}

const char* operationName(Operation op) {
    switch (op) {
    case Operation::SendCommand:        return "sendCommand";
    case Operation::GetStatus:          return "getStatus";
    case Operation::StartJob:           return "startJob";
    case Operation::PauseJob:           return "pauseJob";
    case Operation::ResumeJob:          return "resumeJob";
    case Operation::CancelJob:          return "cancelJob";
    case Operation::QueryMaterialSlots: return "queryMaterialSlots";
    case Operation::GetThumbnail:       return "getThumbnail";
    case Operation::SetLed:             return "setLed";
    }
    return "?";
}

bool featureSupports(const FeatureSet& f, Operation op) {
    switch (op) {
    case Operation::SendCommand:        return f.gcode_commands;
    case Operation::GetStatus:          return f.status_monitoring;
    case Operation::StartJob:
    case Operation::PauseJob:
    case Operation::ResumeJob:
    case Operation::CancelJob:          return f.job_control;
    case Operation::QueryMaterialSlots: return f.material_station;
    case Operation::GetThumbnail:       return f.thumbnails;
    case Operation::SetLed:             return f.led_control;
    }
    return false;
}

void to_json(json& j, const BackendCapabilities& c) {
    j = json{
        {"modelType", c.model_name},
        {"displayName", c.display_name},
        {"family", backendFamilyName(c.family)},
        {"maxConcurrentRequests", c.max_concurrent_requests},
        {"features", {
            {"camera", c.features.camera},
            {"ledControl", c.features.led_control},
            {"filtration", c.features.filtration},
            {"gcodeCommands", c.features.gcode_commands},
            {"statusMonitoring", c.features.status_monitoring},
            {"jobControl", c.features.job_control},
            {"thumbnails", c.features.thumbnails},
            {"materialStation", c.features.material_station},
        }},
    };
}

// =============================================================================
// Response normalization
// =============================================================================

namespace {

Error malformed(const char* what, const std::exception& e) {
    return Error(ErrorKind::ExecutionFailed, std::string("malformed ") + what + " response: " + e.what());
}

// Modern API replies carry {"code": 0, "message": "Success"}; non-zero is a rejection
std::optional<Error> rejection(const json& reply) {
    if (reply.is_object() && reply.contains("code") && reply["code"].is_number_integer()) {
        int code = reply["code"].get<int>();
        if (code != 0) {
            const auto msg = reply.find("message");
            return Error(ErrorKind::ExecutionFailed,
                         msg != reply.end() && msg->is_string() ? msg->get<std::string>()
                                                                : std::string("printer rejected request"),
                         code);
        }
    }
    return std::nullopt;
}

Completion<json> ackHandler(Completion<void> done) {
    return [done = std::move(done)](Result<json> r) {
        if (r.is_err()) { done(r.error()); return; }
        if (auto err = rejection(r.value())) { done(*err); return; }
        done(Ok());
    };
}

Completion<json> thumbnailHandler(std::string file_name, Completion<std::string> done) {
    return [file_name = std::move(file_name), done = std::move(done)](Result<json> r) {
        if (r.is_err()) { done(r.error()); return; }
        const json& reply = r.value();
        if (auto err = rejection(reply)) { done(*err); return; }
        std::string data;
        if (reply.is_object() && reply.contains("data") && reply["data"].is_string()) {
            data = reply["data"].get<std::string>();
        }
        if (data.empty()) {
            done(Error(ErrorKind::ExecutionFailed, "no thumbnail for " + file_name));
            return;
        }
        done(std::move(data));
    };
}

// G-code replies are {"response": "..."} or the bare echo string
Completion<json> commandHandler(Completion<std::string> done) {
    return [done = std::move(done)](Result<json> r) {
        if (r.is_err()) { done(r.error()); return; }
        const json& reply = r.value();
        if (reply.is_string()) { done(reply.get<std::string>()); return; }
        if (reply.is_object()) {
            if (auto err = rejection(reply)) { done(*err); return; }
            auto it = reply.find("response");
            if (it == reply.end()) { done(std::string("ok")); return; }
            if (it->is_string()) { done(it->get<std::string>()); return; }
        }
        done(Error(ErrorKind::ExecutionFailed, std::string("unexpected command reply: ") + reply.type_name()));
    };
}

bool jobVisible(MachineState s) {
    return s == MachineState::Printing || s == MachineState::Paused ||
           s == MachineState::Pausing || s == MachineState::Heating ||
           s == MachineState::Completed;
}

} // namespace

Result<PrinterStatus> parseLegacyStatus(const json& j) {
    try {
        PrinterStatus s;
        s.state = parseMachineState(j.value("MachineStatus", std::string("READY")));
        s.bed.current = j.value("BedTemperature", 0.0);
        s.bed.target = j.value("BedTargetTemperature", 0.0);
        s.extruder.current = j.value("NozzleTemperature", 0.0);
        s.extruder.target = j.value("NozzleTargetTemperature", 0.0);

        std::string file = j.value("CurrentFile", std::string());
        if (!file.empty() && jobVisible(s.state)) {
            JobProgress job;
            job.file_name = file;
            job.percentage = j.value("Progress", 0.0);
            job.current_layer = j.value("CurrentPrintLayer", 0);
            job.total_layers = j.value("TotalPrintLayers", 0);
            s.job = job;
        }
        s.connected = true;
        s.last_update = WallClock::now();
        return s;
    } catch (const json::exception& e) {
        return malformed("legacy status", e);
    }
}

Result<MaterialStationStatus> parseMaterialStation(const json& j) {
    try {
        MaterialStationStatus m;
        m.connected = true;
        m.active_slot = j.value("currentSlot", 0);
        if (j.contains("slotInfos")) {
            for (const auto& info : j.at("slotInfos")) {
                MaterialSlot slot;
                slot.slot_id = info.at("slotId").get<int>();
                slot.is_empty = !info.value("hasFilament", false);
                if (!slot.is_empty) {
                    slot.material_type = info.value("materialName", std::string());
                    slot.material_color = info.value("materialColor", std::string());
                }
                slot.is_active = (slot.slot_id == m.active_slot);
                m.slots.push_back(std::move(slot));
            }
        }
        return m;
    } catch (const json::exception& e) {
        return malformed("material station", e);
    }
}

Result<PrinterStatus> parseModernStatus(const json& j) {
    if (auto err = rejection(j)) return *err;
    try {
        PrinterStatus s;
        s.state = parseMachineState(j.value("MachineState", std::string("ready")));
        if (j.contains("PrintBed")) {
            s.bed.current = j["PrintBed"].value("current", 0.0);
            s.bed.target = j["PrintBed"].value("set", 0.0);
        }
        if (j.contains("Extruder")) {
            s.extruder.current = j["Extruder"].value("current", 0.0);
            s.extruder.target = j["Extruder"].value("set", 0.0);
        }

        std::string file = j.value("PrintFileName", std::string());
        if (!file.empty() && jobVisible(s.state)) {
            JobProgress job;
            job.file_name = file;
            // modern API reports progress as a 0-1 fraction
            job.percentage = j.value("PrintProgress", 0.0) * 100.0;
            job.current_layer = j.value("CurrentPrintLayer", 0);
            job.total_layers = j.value("TotalPrintLayers", 0);
            job.elapsed_seconds = j.value("PrintDuration", 0);
            s.job = job;
        }

        if (j.contains("MatlStationInfo") && j["MatlStationInfo"].is_object()) {
            auto station = parseMaterialStation(j["MatlStationInfo"]);
            if (station.is_err()) return station.error();
            s.material_station = std::move(station).value();
        }
        s.connected = true;
        s.last_update = WallClock::now();
        return s;
    } catch (const json::exception& e) {
        return malformed("machine info", e);
    }
}

// =============================================================================
// LegacyBackend
// =============================================================================

LegacyBackend::LegacyBackend(std::unique_ptr<ProtocolClient> legacy)
    : legacy_(std::move(legacy)) {}

void LegacyBackend::getStatus(Completion<PrinterStatus> done) {
    legacy_->call("status", json::object(), [done = std::move(done)](Result<json> r) {
        if (r.is_err()) { done(r.error()); return; }
        done(parseLegacyStatus(r.value()));
    });
}

void LegacyBackend::sendCommand(const std::string& command, Completion<std::string> done) {
    legacy_->call("gcode", json{{"command", command}}, commandHandler(std::move(done)));
}

void LegacyBackend::startJob(const JobStartParams& params, Completion<void> done) {
    legacy_->call("print.start", json{{"file", params.file_name}}, ackHandler(std::move(done)));
}

void LegacyBackend::jobControl(JobAction action, Completion<void> done) {
    const char* method = action == JobAction::Pause ? "print.pause"
                       : action == JobAction::Resume ? "print.resume" : "print.cancel";
    legacy_->call(method, json::object(), ackHandler(std::move(done)));
}

void LegacyBackend::getThumbnail(const std::string& file_name, Completion<std::string> done) {
    legacy_->call("thumbnail", json{{"file", file_name}},
                  thumbnailHandler(file_name, std::move(done)));
}

void LegacyBackend::close() {
    if (legacy_) legacy_->close();
}

// =============================================================================
// DualProtocolBackend
// =============================================================================

DualProtocolBackend::DualProtocolBackend(std::unique_ptr<ProtocolClient> modern,
                                         std::unique_ptr<ProtocolClient> legacy)
    : modern_(std::move(modern)), legacy_(std::move(legacy)) {}

void DualProtocolBackend::getStatus(Completion<PrinterStatus> done) {
    modern_->call("machine.info", json::object(), [done = std::move(done)](Result<json> r) {
        if (r.is_err()) { done(r.error()); return; }
        done(parseModernStatus(r.value()));
    });
}

// Raw G-code only travels over the legacy channel
void DualProtocolBackend::sendCommand(const std::string& command, Completion<std::string> done) {
    legacy_->call("gcode", json{{"command", command}}, commandHandler(std::move(done)));
}

void DualProtocolBackend::startJob(const JobStartParams& params, Completion<void> done) {
    json body{
        {"fileName", params.file_name},
        {"levelingBeforePrint", params.leveling_before_print},
        {"startNow", params.start_now},
    };
    modern_->call("job.start", body, ackHandler(std::move(done)));
}

void DualProtocolBackend::jobControl(JobAction action, Completion<void> done) {
    const char* verb = action == JobAction::Pause ? "pause"
                     : action == JobAction::Resume ? "continue" : "cancel";
    modern_->call("job.control", json{{"action", verb}}, ackHandler(std::move(done)));
}

void DualProtocolBackend::getThumbnail(const std::string& file_name, Completion<std::string> done) {
    modern_->call("job.thumbnail", json{{"fileName", file_name}},
                  thumbnailHandler(file_name, std::move(done)));
}

void DualProtocolBackend::setLed(bool on, Completion<void> done) {
    modern_->call("control.light", json{{"status", on ? "open" : "close"}}, ackHandler(std::move(done)));
}

void DualProtocolBackend::close() {
    if (modern_) modern_->close();
    if (legacy_) legacy_->close();
}

// =============================================================================
// MultiMaterialBackend
// =============================================================================

MultiMaterialBackend::MultiMaterialBackend(std::unique_ptr<ProtocolClient> modern,
                                           std::unique_ptr<ProtocolClient> legacy)
    : dual_(std::move(modern), std::move(legacy)) {}

void MultiMaterialBackend::startJob(const JobStartParams& params, Completion<void> done) {
    json mappings = json::array();
    for (const auto& [tool, slot] : params.material_mappings) {
        mappings.push_back(json{{"toolId", tool}, {"slotId", slot}});
    }
    json body{
        {"fileName", params.file_name},
        {"levelingBeforePrint", params.leveling_before_print},
        {"startNow", params.start_now},
        {"useMatlStation", !params.material_mappings.empty()},
        {"materialMappings", mappings},
    };
    dual_.modernClient().call("job.start", body, ackHandler(std::move(done)));
}

void MultiMaterialBackend::queryMaterialSlots(Completion<MaterialStationStatus> done) {
    dual_.modernClient().call("material.info", json::object(), [done = std::move(done)](Result<json> r) {
        if (r.is_err()) { done(r.error()); return; }
        if (auto err = rejection(r.value())) { done(*err); return; }
        done(parseMaterialStation(r.value()));
    });
}

// =============================================================================
// BackendInstance
// =============================================================================

BackendInstance::BackendInstance(const BackendDescriptor& descriptor, Variant impl,
                                 int max_concurrent_requests)
    : descriptor_(descriptor), impl_(std::move(impl)),
      max_concurrent_requests_(max_concurrent_requests) {}

BackendInstance::~BackendInstance() {
    close();
}

BackendCapabilities BackendInstance::capabilities() const {
    BackendCapabilities c;
    c.model = descriptor_.model;
    c.model_name = descriptor_.model_name;
    c.display_name = descriptor_.display_name;
    c.family = descriptor_.family;
    c.features = descriptor_.features;
    c.max_concurrent_requests = max_concurrent_requests_;
    return c;
}

Error BackendInstance::unsupported(Operation op) const {
    return Error(ErrorKind::UnsupportedOperation,
                 std::string(operationName(op)) + " is not supported by " + descriptor_.display_name);
}

void BackendInstance::getStatus(Completion<PrinterStatus> done) {
    if (!supports(Operation::GetStatus)) { done(unsupported(Operation::GetStatus)); return; }
    if (closed_) { done(Error(ErrorKind::Connection, "backend closed")); return; }
    std::visit([&](auto& b) { b.getStatus(std::move(done)); }, impl_);
}

void BackendInstance::sendCommand(const std::string& command, Completion<std::string> done) {
    if (!supports(Operation::SendCommand)) { done(unsupported(Operation::SendCommand)); return; }
    if (closed_) { done(Error(ErrorKind::Connection, "backend closed")); return; }
    if (command.empty()) { done(Error(ErrorKind::InvalidArgument, "empty command")); return; }
    std::visit([&](auto& b) { b.sendCommand(command, std::move(done)); }, impl_);
}

void BackendInstance::startJob(const JobStartParams& params, Completion<void> done) {
    if (!supports(Operation::StartJob)) { done(unsupported(Operation::StartJob)); return; }
    if (closed_) { done(Error(ErrorKind::Connection, "backend closed")); return; }
    if (params.file_name.empty()) { done(Error(ErrorKind::InvalidArgument, "no file name")); return; }
    if (!params.material_mappings.empty() && !descriptor_.features.material_station) {
        done(Error(ErrorKind::UnsupportedOperation,
                   std::string("material mappings need a material station; ") +
                   descriptor_.display_name + " has none"));
        return;
    }
    std::visit([&](auto& b) { b.startJob(params, std::move(done)); }, impl_);
}

void BackendInstance::jobControl(Operation op, JobAction action, Completion<void> done) {
    if (!supports(op)) { done(unsupported(op)); return; }
    if (closed_) { done(Error(ErrorKind::Connection, "backend closed")); return; }
    std::visit([&](auto& b) { b.jobControl(action, std::move(done)); }, impl_);
}

void BackendInstance::pauseJob(Completion<void> done) {
    jobControl(Operation::PauseJob, JobAction::Pause, std::move(done));
}

void BackendInstance::resumeJob(Completion<void> done) {
    jobControl(Operation::ResumeJob, JobAction::Resume, std::move(done));
}

void BackendInstance::cancelJob(Completion<void> done) {
    jobControl(Operation::CancelJob, JobAction::Cancel, std::move(done));
}

void BackendInstance::queryMaterialSlots(Completion<MaterialStationStatus> done) {
    if (!supports(Operation::QueryMaterialSlots)) { done(unsupported(Operation::QueryMaterialSlots)); return; }
    if (closed_) { done(Error(ErrorKind::Connection, "backend closed")); return; }
    std::visit(overloaded{
        [&](MultiMaterialBackend& b) { b.queryMaterialSlots(std::move(done)); },
        [&](auto&) { done(unsupported(Operation::QueryMaterialSlots)); },
    }, impl_);
}

void BackendInstance::getThumbnail(const std::string& file_name, Completion<std::string> done) {
    if (!supports(Operation::GetThumbnail)) { done(unsupported(Operation::GetThumbnail)); return; }
    if (closed_) { done(Error(ErrorKind::Connection, "backend closed")); return; }
    std::visit([&](auto& b) { b.getThumbnail(file_name, std::move(done)); }, impl_);
}

void BackendInstance::setLed(bool on, Completion<void> done) {
    if (!supports(Operation::SetLed)) { done(unsupported(Operation::SetLed)); return; }
    if (closed_) { done(Error(ErrorKind::Connection, "backend closed")); return; }
    std::visit(overloaded{
        [&](LegacyBackend&) { done(unsupported(Operation::SetLed)); },
        [&](auto& b) { b.setLed(on, std::move(done)); },
    }, impl_);
}

void BackendInstance::close() {
    if (closed_) return;
    closed_ = true;
    std::visit([](auto& b) { b.close(); }, impl_);
    PHLOG_DEBUG("Backend", "Closed %s backend", descriptor_.model_name);
}

} // namespace printerhub
