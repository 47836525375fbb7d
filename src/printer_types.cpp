#include "printer_types.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <cstdio>

namespace printerhub {

const char* machineStateName(MachineState s) {
    switch (s) {
    case MachineState::Ready:       return "Ready";
    case MachineState::Printing:    return "Printing";
    case MachineState::Paused:      return "Paused";
    case MachineState::Completed:   return "Completed";
    case MachineState::Error:       return "Error";
    case MachineState::Busy:        return "Busy";
    case MachineState::Calibrating: return "Calibrating";
    case MachineState::Heating:     return "Heating";
    case MachineState::Pausing:     return "Pausing";
    case MachineState::Cancelled:   return "Cancelled";
    }
    return "Ready";
}

MachineState parseMachineState(const std::string& text) {
    std::string s = text;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (s == "ready" || s == "idle") return MachineState::Ready;
    if (s == "printing" || s.rfind("building", 0) == 0) return MachineState::Printing;
    if (s == "paused") return MachineState::Paused;
    if (s == "pausing") return MachineState::Pausing;
    if (s == "completed" || s == "complete") return MachineState::Completed;
    if (s == "error") return MachineState::Error;
    if (s == "busy") return MachineState::Busy;
    if (s == "calibrating" || s == "calibrate_doing") return MachineState::Calibrating;
    if (s == "heating") return MachineState::Heating;
    if (s == "cancelled" || s == "canceled" || s == "cancel") return MachineState::Cancelled;
    return MachineState::Busy;
}

std::string formatIsoTime(WallClock::time_point tp) {
    auto t = WallClock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;
    struct tm tm_buf;
    gmtime_r(&t, &tm_buf);
    char buf[40];
    snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
             tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
             tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, (int)ms.count());
    return buf;
}

// Credentials (check_code) never leave the engine
void to_json(nlohmann::json& j, const DeviceDetails& d) {
    j = nlohmann::json{
        {"name", d.name},
        {"ip", d.ip_address},
        {"serialNumber", d.serial_number},
        {"model", d.model},
        {"clientType", d.client_type},
        {"forceLegacyApi", d.force_legacy_api},
        {"hasCamera", d.has_camera},
    };
    if (!d.custom_camera_url.empty()) j["customCameraUrl"] = d.custom_camera_url;
}

void to_json(nlohmann::json& j, const Temperature& t) {
    j = nlohmann::json{{"current", t.current}, {"target", t.target}, {"isHeating", t.isHeating()}};
}

void to_json(nlohmann::json& j, const JobProgress& p) {
    j = nlohmann::json{
        {"fileName", p.file_name},
        {"percentage", p.percentage},
        {"currentLayer", p.current_layer},
        {"totalLayers", p.total_layers},
        {"elapsedSeconds", p.elapsed_seconds},
    };
}

void to_json(nlohmann::json& j, const MaterialSlot& s) {
    j = nlohmann::json{
        {"slotId", s.slot_id},
        {"isEmpty", s.is_empty},
        {"materialType", s.material_type},
        {"materialColor", s.material_color},
        {"isActive", s.is_active},
    };
}

void to_json(nlohmann::json& j, const MaterialStationStatus& m) {
    j = nlohmann::json{{"connected", m.connected}, {"slots", m.slots}};
    if (m.active_slot > 0) j["activeSlot"] = m.active_slot;
    else j["activeSlot"] = nullptr;
}

void to_json(nlohmann::json& j, const PrinterStatus& s) {
    j = nlohmann::json{
        {"state", machineStateName(s.state)},
        {"temperatures", {{"bed", s.bed}, {"extruder", s.extruder}}},
        {"connected", s.connected},
        {"lastUpdate", formatIsoTime(s.last_update)},
    };
    j["currentJob"] = s.job ? nlohmann::json(*s.job) : nlohmann::json(nullptr);
    if (s.material_station) j["materialStation"] = *s.material_station;
}

} // namespace printerhub
