// =============================================================================
// PrinterHub - Printer Data Types
// =============================================================================
// Plain data shared by the dispatcher, context manager and polling loops.
// =============================================================================
#pragma once
#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace printerhub {

using Clock = std::chrono::steady_clock;
using WallClock = std::chrono::system_clock;

// =============================================================================
// DeviceDetails: connection request from the connection flow
// =============================================================================
struct DeviceDetails {
    std::string name;               // "Adventurer 5M Pro"
    std::string ip_address;         // "192.168.1.50"
    std::string serial_number;      // physical identity (may be empty on legacy)
    std::string check_code;         // pairing credential for modern API
    std::string model;              // typeName reported by the printer
    std::string client_type;        // "legacy" / "new" hint from discovery
    bool force_legacy_api = false;  // user override: talk legacy only
    bool has_camera = false;        // device exposes a live stream
    std::string custom_camera_url;  // overrides built-in camera (optional)

    // Identity used for duplicate detection
    std::string identityKey() const {
        return !serial_number.empty() ? "sn:" + serial_number : "ip:" + ip_address;
    }
};

// =============================================================================
// Status snapshot
// =============================================================================
enum class MachineState : uint8_t {
    Ready = 0,
    Printing,
    Paused,
    Completed,
    Error,
    Busy,
    Calibrating,
    Heating,
    Pausing,
    Cancelled,
};

const char* machineStateName(MachineState s);
// Accepts both the engine's names and the raw firmware words ("BUILDING", "READY", ...)
MachineState parseMachineState(const std::string& text);

struct Temperature {
    double current = 0.0;
    double target = 0.0;
    bool isHeating() const { return target > 0.0 && current + 2.0 < target; }
};

struct JobProgress {
    std::string file_name;
    double percentage = 0.0;   // 0-100
    int current_layer = 0;
    int total_layers = 0;
    int elapsed_seconds = 0;
};

struct MaterialSlot {
    int slot_id = 0;            // 1-4
    bool is_empty = true;
    std::string material_type;  // "PLA"
    std::string material_color; // "#FFFFFF"
    bool is_active = false;
};

struct MaterialStationStatus {
    bool connected = false;
    std::vector<MaterialSlot> slots;
    int active_slot = 0;        // 0 = none
};

struct PrinterStatus {
    MachineState state = MachineState::Ready;
    Temperature bed;
    Temperature extruder;
    std::optional<JobProgress> job;
    std::optional<MaterialStationStatus> material_station;
    bool connected = true;
    WallClock::time_point last_update{};
};

struct JobStartParams {
    std::string file_name;
    bool leveling_before_print = false;
    bool start_now = true;
    // Multi-material only: tool -> slot mapping
    std::vector<std::pair<int, int>> material_mappings;
};

// =============================================================================
// JSON conversions (ContextInfo payloads, context-updated patches, clients)
// =============================================================================
void to_json(nlohmann::json& j, const DeviceDetails& d);
void to_json(nlohmann::json& j, const Temperature& t);
void to_json(nlohmann::json& j, const JobProgress& p);
void to_json(nlohmann::json& j, const MaterialSlot& s);
void to_json(nlohmann::json& j, const MaterialStationStatus& m);
void to_json(nlohmann::json& j, const PrinterStatus& s);

std::string formatIsoTime(WallClock::time_point tp);

} // namespace printerhub
