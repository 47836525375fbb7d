// =============================================================================
// PrinterHub - Engine Facade
// =============================================================================
// Owns every process-wide component and wires them together:
//
//   EventBus <- ContextManager -> BackendDispatcher -> ClientFactory
//                    |    \-> PortAllocator
//                    v
//   PollingCoordinator, RequestQueue (subscribe to context lifecycle)
//
// One instance per process through hub(); tests construct their own.
// Components exist between initialize() and shutdown(); calling an operation
// outside that window fails with InvalidState.
//
// Device operations take an optional context id and default to the active
// context (NotFound when there is none).
// =============================================================================
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "backend_dispatcher.hpp"
#include "config_loader.hpp"
#include "context_manager.hpp"
#include "event_bus.hpp"
#include "polling_coordinator.hpp"
#include "port_allocator.hpp"
#include "printer_types.hpp"
#include "protocol_client.hpp"
#include "request_queue.hpp"
#include "result.hpp"
#include "scheduler.hpp"

namespace printerhub {

using OptionalContextId = std::optional<std::string>;

class PrinterHub {
public:
    PrinterHub();
    ~PrinterHub();

    PrinterHub(const PrinterHub&) = delete;
    PrinterHub& operator=(const PrinterHub&) = delete;

    // Lifecycle. scheduler and factory must outlive shutdown().
    Result<void> initialize(const config::EngineConfig& config, Scheduler& scheduler, ClientFactory& factory);
    void shutdown();
    bool initialized() const { return initialized_; }

    // Components (valid while initialized)
    EventBus& events() { return *bus_; }
    ContextManager& contexts() { return *contexts_; }
    PollingCoordinator& polling() { return *polling_; }
    RequestQueue& requests() { return *queue_; }
    PortAllocator& ports() { return *ports_; }
    BackendDispatcher& dispatcher() { return *dispatcher_; }
    const config::EngineConfig& config() const { return config_; }

    // --- Contexts ---
    Result<std::string> createContext(const DeviceDetails& details, const CreateOptions& options = {});
    Result<void> switchContext(const std::string& context_id);
    Result<void> removeContext(const std::string& context_id);
    std::vector<ContextInfo> listContexts() const;
    std::optional<ContextInfo> getActiveContext() const;

    // --- Queued requests ---
    Result<RequestQueue::Enqueued> enqueueRequest(const std::string& key, int priority,
                                                  RequestQueue::Work work,
                                                  Completion<RequestQueue::Payload> done,
                                                  const OptionalContextId& context_id = std::nullopt);
    size_t cancelRequests(const OptionalContextId& context_id = std::nullopt);
    // Thumbnail fetch through the request queue, deduplicated per file
    void getJobThumbnail(const std::string& file_name, Completion<std::string> done,
                         int priority = 0, const OptionalContextId& context_id = std::nullopt);

    // --- Device operations ---
    void sendCommand(const std::string& command, Completion<std::string> done,
                     const OptionalContextId& context_id = std::nullopt);
    void getStatus(Completion<PrinterStatus> done, const OptionalContextId& context_id = std::nullopt);
    void startJob(const JobStartParams& params, Completion<void> done,
                  const OptionalContextId& context_id = std::nullopt);
    void pauseJob(Completion<void> done, const OptionalContextId& context_id = std::nullopt);
    void resumeJob(Completion<void> done, const OptionalContextId& context_id = std::nullopt);
    void cancelJob(Completion<void> done, const OptionalContextId& context_id = std::nullopt);
    void queryMaterialSlots(Completion<MaterialStationStatus> done,
                            const OptionalContextId& context_id = std::nullopt);
    void setLed(bool on, Completion<void> done, const OptionalContextId& context_id = std::nullopt);
    Result<BackendCapabilities> getCapabilities(const OptionalContextId& context_id = std::nullopt);

private:
    Result<PrinterContext*> resolve(const OptionalContextId& context_id);
    Error notInitialized() const;

    config::EngineConfig config_;
    Scheduler* scheduler_ = nullptr;
    ClientFactory* factory_ = nullptr;
    bool initialized_ = false;

    // Destroyed bottom-up
    std::unique_ptr<EventBus> bus_;
    std::unique_ptr<PortAllocator> ports_;
    std::unique_ptr<BackendDispatcher> dispatcher_;
    std::unique_ptr<ContextManager> contexts_;
    std::unique_ptr<PollingCoordinator> polling_;
    std::unique_ptr<RequestQueue> queue_;
};

// Process-wide instance
PrinterHub& hub();

} // namespace printerhub
