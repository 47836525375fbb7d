#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "backend_dispatcher.hpp"
#include "config_loader.hpp"
#include "event_bus.hpp"
#include "port_allocator.hpp"
#include "printer_types.hpp"
#include "result.hpp"

namespace printerhub {

enum class ConnectionState : uint8_t { Connecting = 0, Connected, Disconnected, Error };

const char* connectionStateName(ConnectionState s);

// =============================================================================
// PrinterContext: everything the engine holds for one connected printer
// =============================================================================
struct PrinterContext {
    // --- identity ---
    std::string id;                 // "context-3-1760781234567"
    std::string display_name;
    DeviceDetails details;
    ModelType model = ModelType::GenericLegacy;

    // --- owned resources ---
    std::unique_ptr<BackendInstance> backend;
    std::optional<int> stream_port;
    std::optional<std::string> camera_url;  // http://localhost:<port>/stream

    // --- state ---
    ConnectionState connection_state = ConnectionState::Connecting;
    bool is_active = false;
    std::optional<PrinterStatus> last_status;

    WallClock::time_point created_at{};
    WallClock::time_point last_activity{};
};

// Serializable view of a context (no backend, no credentials)
struct ContextInfo {
    std::string id;
    std::string name;
    std::string model_type;
    std::string ip_address;
    std::string serial_number;
    ConnectionState connection_state = ConnectionState::Connecting;
    bool is_active = false;
    std::optional<int> stream_port;
    std::optional<std::string> camera_url;
    std::optional<PrinterStatus> last_status;
    WallClock::time_point created_at{};
    WallClock::time_point last_activity{};
};

void to_json(nlohmann::json& j, const ContextInfo& info);

struct CreateOptions {
    // Fail with ResourceExhausted instead of creating a stream-less context
    bool require_stream = false;
};

// =============================================================================
// ContextManager: the map of live contexts and the single active pointer
// =============================================================================
// Mutating operations (create/switch/remove/reset/updateDeviceDetails) are not
// reentrant: one called while another is still running, including from an
// event handler it triggered, fails with InvalidState.
//
// Events are published after the map is consistent. The pointers returned by
// getContext()/getActiveContext() are valid until the context is removed and
// must only be used on the scheduler thread.
class ContextManager {
public:
    ContextManager(EventBus& bus, BackendDispatcher& dispatcher, PortAllocator& ports,
                   const config::ContextConfig& config);
    ~ContextManager();

    ContextManager(const ContextManager&) = delete;
    ContextManager& operator=(const ContextManager&) = delete;

    // --- lifecycle ---
    Result<std::string> createContext(const DeviceDetails& details, const CreateOptions& options = {});
    Result<void> switchContext(const std::string& context_id);
    // Unknown ids are a no-op
    Result<void> removeContext(const std::string& context_id);
    Result<void> reset();

    // --- lookup ---
    PrinterContext* getActiveContext();
    const PrinterContext* getActiveContext() const;
    std::optional<std::string> getActiveContextId() const;
    PrinterContext* getContext(const std::string& context_id);
    const PrinterContext* getContext(const std::string& context_id) const;
    bool hasContext(const std::string& context_id) const;
    size_t contextCount() const;
    std::vector<ContextInfo> listContexts() const;  // creation order
    std::optional<ContextInfo> getContextInfo(const std::string& context_id) const;

    // --- updates ---
    Result<void> updateConnectionState(const std::string& context_id, ConnectionState state);
    // Identity and model are fixed for the life of a context
    Result<void> updateDeviceDetails(const std::string& context_id, const DeviceDetails& details);
    // Latest polled snapshot; no event (polling-data already carries it)
    Result<void> recordStatus(const std::string& context_id, const PrinterStatus& status);

private:
    class MutationGuard;
    Result<void> lifecycleBusy(const MutationGuard& guard) const;

    std::string nextContextId();
    PrinterContext* findByIdentity(const std::string& identity_key);
    void removeInternal(const std::string& context_id);
    void publishUpdate(const std::string& context_id, nlohmann::json patch);
    static ContextInfo makeInfo(const PrinterContext& ctx);

    EventBus& bus_;
    BackendDispatcher& dispatcher_;
    PortAllocator& ports_;
    const config::ContextConfig config_;

    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<PrinterContext>> contexts_;
    std::vector<std::string> order_;            // creation order for listContexts
    std::optional<std::string> active_id_;
    uint64_t counter_ = 0;
    bool mutating_ = false;
};

} // namespace printerhub
