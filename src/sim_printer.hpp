#pragma once
// =============================================================================
// PrinterHub - Simulated Printers
// =============================================================================
// In-process stand-ins for real printers, used by printerhub_sim and by the
// end-to-end tests. A SimulatedPrinter keeps machine state and answers both
// protocol vocabularies; SimulatedClient delivers the replies through the
// scheduler after a fixed latency, like a network round trip would.
// =============================================================================

#include <map>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "printer_types.hpp"
#include "protocol_client.hpp"
#include "result.hpp"
#include "scheduler.hpp"

namespace printerhub {
namespace sim {

enum class Channel { Legacy, Modern };

class SimulatedPrinter {
public:
    explicit SimulatedPrinter(DeviceDetails details, bool material_station = false);

    const DeviceDetails& details() const { return details_; }

    // Unreachable printers fail every call (and every open) with Connection
    void setOnline(bool online) { online_ = online; }
    bool online() const { return online_; }

    // Progress added by each status read while printing
    void setProgressStep(double percent) { progress_step_ = percent; }

    Result<nlohmann::json> handle(Channel channel, const std::string& method, const nlohmann::json& params);

    MachineState state() const { return state_; }
    double progress() const { return progress_; }
    bool ledOn() const { return led_on_; }
    uint64_t callCount() const { return calls_; }

private:
    Result<nlohmann::json> handleLegacy(const std::string& method, const nlohmann::json& params);
    Result<nlohmann::json> handleModern(const std::string& method, const nlohmann::json& params);
    Result<void> begin(const std::string& file_name);
    Result<void> control(const std::string& action);
    void advance();
    nlohmann::json stationInfo() const;
    std::string thumbnailFor(const std::string& file_name) const;

    DeviceDetails details_;
    bool has_station_;
    bool online_ = true;
    bool led_on_ = false;

    MachineState state_ = MachineState::Ready;
    std::string file_;
    double progress_ = 0.0;
    double progress_step_ = 2.5;
    int total_layers_ = 200;
    int elapsed_s_ = 0;
    Temperature bed_{22.0, 0.0};
    Temperature nozzle_{24.0, 0.0};
    std::vector<MaterialSlot> slots_;
    int active_slot_ = 0;
    uint64_t calls_ = 0;
};

class SimulatedClient : public ProtocolClient {
public:
    SimulatedClient(Scheduler& scheduler, std::shared_ptr<SimulatedPrinter> printer, Channel channel,
                    int latency_ms);
    ~SimulatedClient() override;

    void call(const std::string& method, const nlohmann::json& params,
              Completion<nlohmann::json> done) override;
    void close() override;
    std::string describe() const override;

private:
    struct Outstanding {
        Scheduler::TimerId timer;
        Completion<nlohmann::json> done;
    };

    Scheduler& scheduler_;
    std::shared_ptr<SimulatedPrinter> printer_;
    const Channel channel_;
    const int latency_ms_;
    bool closed_ = false;
    uint64_t next_call_ = 1;
    std::map<uint64_t, Outstanding> outstanding_;
};

class SimulatedClientFactory : public ClientFactory {
public:
    SimulatedClientFactory(Scheduler& scheduler, int latency_ms = 40);

    std::shared_ptr<SimulatedPrinter> addPrinter(const DeviceDetails& details, bool material_station = false);
    std::shared_ptr<SimulatedPrinter> printer(const std::string& ip_address) const;

    Result<std::unique_ptr<ProtocolClient>> openLegacy(const DeviceDetails& details) override;
    Result<std::unique_ptr<ProtocolClient>> openModern(const DeviceDetails& details) override;

private:
    Result<std::unique_ptr<ProtocolClient>> open(const DeviceDetails& details, Channel channel);

    Scheduler& scheduler_;
    const int latency_ms_;
    std::map<std::string, std::shared_ptr<SimulatedPrinter>> printers_;  // by IP
};

} // namespace sim
} // namespace printerhub
