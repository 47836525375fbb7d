#include "sim_printer.hpp"
#include "printerhub_log.hpp"
#include <algorithm>
#include <cctype>
#include <functional>

namespace printerhub {
namespace sim {

using nlohmann::json;

namespace {

const char* legacyStateWord(MachineState s) {
    switch (s) {
    case MachineState::Printing:  return "BUILDING_FROM_SD";
    case MachineState::Paused:    return "PAUSED";
    case MachineState::Completed: return "COMPLETED";
    case MachineState::Error:     return "ERROR";
    case MachineState::Busy:      return "BUSY";
    default:                      return "READY";
    }
}

void approach(Temperature& t, double ambient) {
    const double goal = t.target > 0.0 ? t.target : ambient;
    const double step = 15.0;
    if (t.current < goal) t.current = std::min(goal, t.current + step);
    else t.current = std::max(goal, t.current - step);
}

json rejected(const std::string& message) {
    return json{{"code", 1}, {"message", message}};
}

json accepted() {
    return json{{"code", 0}, {"message", "Success"}};
}

} // namespace

// =============================================================================
// SimulatedPrinter
// =============================================================================

SimulatedPrinter::SimulatedPrinter(DeviceDetails details, bool material_station)
    : details_(std::move(details)), has_station_(material_station) {
    if (has_station_) {
        const char* types[] = {"PLA", "PLA", "PETG", ""};
        const char* colors[] = {"#FFFFFF", "#000000", "#FF6A13", ""};
        for (int i = 0; i < 4; i++) {
            MaterialSlot slot;
            slot.slot_id = i + 1;
            slot.is_empty = types[i][0] == '\0';
            slot.material_type = types[i];
            slot.material_color = colors[i];
            slots_.push_back(slot);
        }
    }
}

Result<json> SimulatedPrinter::handle(Channel channel, const std::string& method, const json& params) {
    calls_++;
    if (!online_) {
        return Err<json>(ErrorKind::Connection, "printer " + details_.ip_address + " unreachable");
    }
    try {
        return channel == Channel::Legacy ? handleLegacy(method, params) : handleModern(method, params);
    } catch (const json::exception& e) {
        return Err<json>(ErrorKind::ExecutionFailed, std::string("bad request: ") + e.what());
    }
}

void SimulatedPrinter::advance() {
    if (state_ == MachineState::Printing) {
        progress_ = std::min(100.0, progress_ + progress_step_);
        elapsed_s_ += 10;
        if (progress_ >= 100.0) {
            state_ = MachineState::Completed;
            bed_.target = 0.0;
            nozzle_.target = 0.0;
        }
    }
    approach(bed_, 22.0);
    approach(nozzle_, 24.0);
}

Result<void> SimulatedPrinter::begin(const std::string& file_name) {
    if (state_ == MachineState::Printing || state_ == MachineState::Paused) {
        return Result<void>(Error(ErrorKind::ExecutionFailed, "printer busy with " + file_));
    }
    state_ = MachineState::Printing;
    file_ = file_name;
    progress_ = 0.0;
    elapsed_s_ = 0;
    bed_.target = 60.0;
    nozzle_.target = 210.0;
    PHLOG_DEBUG("sim", "%s printing %s", details_.name.c_str(), file_name.c_str());
    return Ok();
}

Result<void> SimulatedPrinter::control(const std::string& action) {
    if (action == "pause") {
        if (state_ != MachineState::Printing) {
            return Result<void>(Error(ErrorKind::ExecutionFailed, "not printing"));
        }
        state_ = MachineState::Paused;
    } else if (action == "resume" || action == "continue") {
        if (state_ != MachineState::Paused) {
            return Result<void>(Error(ErrorKind::ExecutionFailed, "not paused"));
        }
        state_ = MachineState::Printing;
    } else if (action == "cancel") {
        if (state_ != MachineState::Printing && state_ != MachineState::Paused) {
            return Result<void>(Error(ErrorKind::ExecutionFailed, "no job to cancel"));
        }
        state_ = MachineState::Ready;
        file_.clear();
        progress_ = 0.0;
        bed_.target = 0.0;
        nozzle_.target = 0.0;
    } else {
        return Result<void>(Error(ErrorKind::ExecutionFailed, "unknown action " + action));
    }
    return Ok();
}

json SimulatedPrinter::stationInfo() const {
    json infos = json::array();
    for (const auto& slot : slots_) {
        infos.push_back(json{
            {"slotId", slot.slot_id},
            {"hasFilament", !slot.is_empty},
            {"materialName", slot.material_type},
            {"materialColor", slot.material_color},
        });
    }
    return json{{"currentSlot", active_slot_}, {"slotCnt", slots_.size()}, {"slotInfos", infos}};
}

std::string SimulatedPrinter::thumbnailFor(const std::string& file_name) const {
    return "png:" + std::to_string(std::hash<std::string>{}(file_name) % 1000000) + ":" + file_name;
}

Result<json> SimulatedPrinter::handleLegacy(const std::string& method, const json& params) {
    if (method == "status") {
        advance();
        const bool has_job = state_ == MachineState::Printing || state_ == MachineState::Paused ||
                             state_ == MachineState::Completed;
        return json{
            {"MachineStatus", legacyStateWord(state_)},
            {"BedTemperature", bed_.current},
            {"BedTargetTemperature", bed_.target},
            {"NozzleTemperature", nozzle_.current},
            {"NozzleTargetTemperature", nozzle_.target},
            {"Progress", progress_},
            {"CurrentPrintLayer", static_cast<int>(total_layers_ * progress_ / 100.0)},
            {"TotalPrintLayers", has_job ? total_layers_ : 0},
            {"CurrentFile", has_job ? file_ : std::string()},
        };
    }
    if (method == "gcode") {
        std::string command = params.at("command").get<std::string>();
        if (command.rfind("M146", 0) == 0 || command.rfind("~M146", 0) == 0) {
            led_on_ = command.find("r255") != std::string::npos;
        }
        return json{{"response", "CMD " + command + " Received.\nok"}};
    }
    if (method == "print.start") {
        auto r = begin(params.at("file").get<std::string>());
        if (r.is_err()) return r.error();
        return json{{"response", "ok"}};
    }
    if (method == "print.pause" || method == "print.resume" || method == "print.cancel") {
        auto r = control(method.substr(6));
        if (r.is_err()) return r.error();
        return json{{"response", "ok"}};
    }
    if (method == "thumbnail") {
        return json{{"data", thumbnailFor(params.at("file").get<std::string>())}};
    }
    return Err<json>(ErrorKind::ExecutionFailed, "unknown legacy command " + method);
}

Result<json> SimulatedPrinter::handleModern(const std::string& method, const json& params) {
    if (method == "machine.info") {
        advance();
        json info = accepted();
        std::string word = machineStateName(state_);
        std::transform(word.begin(), word.end(), word.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        info["MachineState"] = word;
        info["PrintBed"] = {{"current", bed_.current}, {"set", bed_.target}};
        info["Extruder"] = {{"current", nozzle_.current}, {"set", nozzle_.target}};
        info["PrintProgress"] = progress_ / 100.0;
        info["CurrentPrintLayer"] = static_cast<int>(total_layers_ * progress_ / 100.0);
        info["TotalPrintLayers"] = total_layers_;
        info["PrintFileName"] = file_;
        info["PrintDuration"] = elapsed_s_;
        if (has_station_) info["MatlStationInfo"] = stationInfo();
        return info;
    }
    if (method == "job.start") {
        const json mappings = params.value("materialMappings", json::array());
        if (!mappings.empty()) {
            if (!has_station_) return rejected("no material station");
            active_slot_ = mappings.front().at("slotId").get<int>();
            for (auto& slot : slots_) slot.is_active = (slot.slot_id == active_slot_);
        }
        auto r = begin(params.at("fileName").get<std::string>());
        if (r.is_err()) return rejected(r.error().message);
        return accepted();
    }
    if (method == "job.control") {
        auto r = control(params.at("action").get<std::string>());
        if (r.is_err()) return rejected(r.error().message);
        return accepted();
    }
    if (method == "job.thumbnail") {
        json reply = accepted();
        reply["data"] = thumbnailFor(params.at("fileName").get<std::string>());
        return reply;
    }
    if (method == "control.light") {
        led_on_ = params.at("status").get<std::string>() == "open";
        return accepted();
    }
    if (method == "material.info") {
        if (!has_station_) return rejected("no material station");
        json reply = stationInfo();
        reply["code"] = 0;
        return reply;
    }
    return Err<json>(ErrorKind::ExecutionFailed, "unknown API route " + method);
}

// =============================================================================
// SimulatedClient
// =============================================================================

SimulatedClient::SimulatedClient(Scheduler& scheduler, std::shared_ptr<SimulatedPrinter> printer,
                                 Channel channel, int latency_ms)
    : scheduler_(scheduler), printer_(std::move(printer)), channel_(channel), latency_ms_(latency_ms) {}

SimulatedClient::~SimulatedClient() {
    close();
}

// The printer answers when the reply "arrives", so state changes made by
// earlier calls are visible.
void SimulatedClient::call(const std::string& method, const json& params, Completion<json> done) {
    if (closed_) {
        scheduler_.post([done = std::move(done)] {
            done(Error(ErrorKind::Connection, "channel closed"));
        });
        return;
    }
    const uint64_t call_id = next_call_++;
    auto timer = scheduler_.schedule(Scheduler::Duration(latency_ms_), [this, call_id, method, params] {
        auto it = outstanding_.find(call_id);
        if (it == outstanding_.end()) return;
        Completion<json> completion = std::move(it->second.done);
        outstanding_.erase(it);
        completion(printer_->handle(channel_, method, params));
    });
    outstanding_.emplace(call_id, Outstanding{timer, std::move(done)});
}

void SimulatedClient::close() {
    if (closed_) return;
    closed_ = true;
    for (auto& [id, pending] : outstanding_) {
        scheduler_.cancel(pending.timer);
        scheduler_.post([done = std::move(pending.done)] {
            done(Error(ErrorKind::Connection, "channel closed"));
        });
    }
    outstanding_.clear();
}

std::string SimulatedClient::describe() const {
    return std::string(channel_ == Channel::Legacy ? "legacy" : "modern") + "://" +
           printer_->details().ip_address;
}

// =============================================================================
// SimulatedClientFactory
// =============================================================================

SimulatedClientFactory::SimulatedClientFactory(Scheduler& scheduler, int latency_ms)
    : scheduler_(scheduler), latency_ms_(latency_ms) {}

std::shared_ptr<SimulatedPrinter> SimulatedClientFactory::addPrinter(const DeviceDetails& details,
                                                                     bool material_station) {
    auto printer = std::make_shared<SimulatedPrinter>(details, material_station);
    printers_[details.ip_address] = printer;
    return printer;
}

std::shared_ptr<SimulatedPrinter> SimulatedClientFactory::printer(const std::string& ip_address) const {
    auto it = printers_.find(ip_address);
    return it != printers_.end() ? it->second : nullptr;
}

Result<std::unique_ptr<ProtocolClient>> SimulatedClientFactory::open(const DeviceDetails& details,
                                                                     Channel channel) {
    auto it = printers_.find(details.ip_address);
    if (it == printers_.end() || !it->second->online()) {
        return Err<std::unique_ptr<ProtocolClient>>(ErrorKind::Connection,
                                                    "no printer answering at " + details.ip_address);
    }
    const auto& expected = it->second->details().check_code;
    if (channel == Channel::Modern && !expected.empty() && expected != details.check_code) {
        return Err<std::unique_ptr<ProtocolClient>>(ErrorKind::Connection, "check code rejected", 401);
    }
    std::unique_ptr<ProtocolClient> client =
        std::make_unique<SimulatedClient>(scheduler_, it->second, channel, latency_ms_);
    return std::move(client);
}

Result<std::unique_ptr<ProtocolClient>> SimulatedClientFactory::openLegacy(const DeviceDetails& details) {
    return open(details, Channel::Legacy);
}

Result<std::unique_ptr<ProtocolClient>> SimulatedClientFactory::openModern(const DeviceDetails& details) {
    return open(details, Channel::Modern);
}

} // namespace sim
} // namespace printerhub
