#include "context_manager.hpp"
#include "printerhub_log.hpp"
#include <algorithm>

namespace printerhub {

const char* connectionStateName(ConnectionState s) {
    switch (s) {
    case ConnectionState::Connecting:   return "connecting";
    case ConnectionState::Connected:    return "connected";
    case ConnectionState::Disconnected: return "disconnected";
    case ConnectionState::Error:        return "error";
    }
    return "?";
}

void to_json(nlohmann::json& j, const ContextInfo& info) {
    j = nlohmann::json{
        {"id", info.id},
        {"name", info.name},
        {"modelType", info.model_type},
        {"ipAddress", info.ip_address},
        {"serialNumber", info.serial_number},
        {"connectionState", connectionStateName(info.connection_state)},
        {"isActive", info.is_active},
        {"createdAt", formatIsoTime(info.created_at)},
        {"lastActivity", formatIsoTime(info.last_activity)},
    };
    j["streamPort"] = info.stream_port ? nlohmann::json(*info.stream_port) : nlohmann::json(nullptr);
    j["cameraUrl"] = info.camera_url ? nlohmann::json(*info.camera_url) : nlohmann::json(nullptr);
    j["status"] = info.last_status ? nlohmann::json(*info.last_status) : nlohmann::json(nullptr);
}

// Sets the non-reentrancy flag for the duration of one mutating call
class ContextManager::MutationGuard {
public:
    explicit MutationGuard(bool& flag) : flag_(flag), owner_(!flag) {
        if (owner_) flag_ = true;
    }
    ~MutationGuard() {
        if (owner_) flag_ = false;
    }
    MutationGuard(const MutationGuard&) = delete;
    MutationGuard& operator=(const MutationGuard&) = delete;

    bool acquired() const { return owner_; }

private:
    bool& flag_;
    const bool owner_;
};

// Lifecycle events must reach every subscriber before the call returns, which a
// publish nested inside another dispatch cannot do
Result<void> ContextManager::lifecycleBusy(const MutationGuard& guard) const {
    if (!guard.acquired()) {
        return Result<void>(Error(ErrorKind::InvalidState, "context manager is busy"));
    }
    if (bus_.dispatching()) {
        return Result<void>(Error(ErrorKind::InvalidState, "contexts cannot change inside an event handler"));
    }
    return Ok();
}

ContextManager::ContextManager(EventBus& bus, BackendDispatcher& dispatcher, PortAllocator& ports,
                               const config::ContextConfig& config)
    : bus_(bus), dispatcher_(dispatcher), ports_(ports), config_(config) {}

// Teardown without events: subscribers may already be gone
ContextManager::~ContextManager() {
    std::map<std::string, std::unique_ptr<PrinterContext>> remaining;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        remaining.swap(contexts_);
        order_.clear();
        active_id_.reset();
    }
    for (auto& [id, ctx] : remaining) {
        if (ctx->stream_port) ports_.release(*ctx->stream_port);
        if (ctx->backend) ctx->backend->close();
    }
}

std::string ContextManager::nextContextId() {
    auto epoch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        WallClock::now().time_since_epoch()).count();
    return "context-" + std::to_string(++counter_) + "-" + std::to_string(epoch_ms);
}

PrinterContext* ContextManager::findByIdentity(const std::string& identity_key) {
    for (auto& [id, ctx] : contexts_) {
        if (ctx->details.identityKey() == identity_key) return ctx.get();
    }
    return nullptr;
}

ContextInfo ContextManager::makeInfo(const PrinterContext& ctx) {
    ContextInfo info;
    info.id = ctx.id;
    info.name = ctx.display_name;
    info.model_type = BackendDispatcher::modelTypeName(ctx.model);
    info.ip_address = ctx.details.ip_address;
    info.serial_number = ctx.details.serial_number;
    info.connection_state = ctx.connection_state;
    info.is_active = ctx.is_active;
    info.stream_port = ctx.stream_port;
    info.camera_url = ctx.camera_url;
    info.last_status = ctx.last_status;
    info.created_at = ctx.created_at;
    info.last_activity = ctx.last_activity;
    return info;
}

// =============================================================================
// Lifecycle
// =============================================================================

Result<std::string> ContextManager::createContext(const DeviceDetails& details,
                                                  const CreateOptions& options) {
    MutationGuard guard(mutating_);
    if (auto busy = lifecycleBusy(guard); busy.is_err()) return busy.error();
    if (details.ip_address.empty()) {
        return Err<std::string>(ErrorKind::InvalidArgument, "device has no IP address");
    }

    const std::string identity = details.identityKey();
    std::string existing_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto* existing = findByIdentity(identity)) existing_id = existing->id;
    }
    if (!existing_id.empty()) {
        if (config_.reconnect_policy == config::ReconnectPolicy::Reject) {
            PHLOG_WARN("CtxMgr", "Rejecting %s: already connected as %s",
                       identity.c_str(), existing_id.c_str());
            return Err<std::string>(ErrorKind::DuplicateDevice,
                                    "device " + identity + " is already connected as " + existing_id);
        }
        PHLOG_INFO("CtxMgr", "Replacing %s for reconnect of %s", existing_id.c_str(), identity.c_str());
        removeInternal(existing_id);
    }

    auto backend = dispatcher_.createBackend(details);
    if (backend.is_err()) {
        PHLOG_ERROR("CtxMgr", "Backend creation failed for %s: %s",
                    details.ip_address.c_str(), backend.error().describe().c_str());
        return backend.error();
    }

    auto ctx = std::make_unique<PrinterContext>();
    ctx->details = details;
    ctx->display_name = details.name.empty() ? details.ip_address : details.name;
    ctx->backend = std::move(backend).value();
    ctx->model = ctx->backend->descriptor().model;

    const bool wants_stream = details.has_camera || !details.custom_camera_url.empty() ||
                              ctx->backend->descriptor().features.camera;
    if (wants_stream) {
        auto port = ports_.allocate();
        if (port.is_ok()) {
            ctx->stream_port = port.value();
            ctx->camera_url = "http://localhost:" + std::to_string(port.value()) + "/stream";
        } else if (options.require_stream) {
            PHLOG_ERROR("CtxMgr", "No stream port for %s: %s",
                        ctx->display_name.c_str(), port.error().message.c_str());
            return port.error();
        } else {
            PHLOG_WARN("CtxMgr", "No stream port for %s, continuing without camera: %s",
                       ctx->display_name.c_str(), port.error().message.c_str());
        }
    }

    ctx->id = nextContextId();
    ctx->connection_state = ConnectionState::Connected;
    ctx->created_at = WallClock::now();
    ctx->last_activity = ctx->created_at;

    const std::string id = ctx->id;
    ContextCreatedEvent created;
    created.context_id = id;
    created.display_name = ctx->display_name;
    created.model_type = BackendDispatcher::modelTypeName(ctx->model);

    bool activated = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (config_.auto_activate_first && !active_id_) {
            ctx->is_active = true;
            active_id_ = id;
            activated = true;
        }
        contexts_.emplace(id, std::move(ctx));
        order_.push_back(id);
    }

    PHLOG_INFO("CtxMgr", "Created %s (%s, %s)%s", id.c_str(), created.display_name.c_str(),
               created.model_type.c_str(), activated ? " [active]" : "");

    bus_.publish(created);
    if (activated) {
        ContextSwitchedEvent switched;
        switched.context_id = id;
        bus_.publish(switched);
    }
    return id;
}

Result<void> ContextManager::switchContext(const std::string& context_id) {
    MutationGuard guard(mutating_);
    if (auto busy = lifecycleBusy(guard); busy.is_err()) return busy;

    ContextSwitchedEvent event;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = contexts_.find(context_id);
        if (it == contexts_.end()) {
            return Result<void>(Error(ErrorKind::NotFound, "no context " + context_id));
        }
        if (active_id_ == context_id) return Ok();

        event.previous_id = active_id_;
        if (active_id_) {
            auto prev = contexts_.find(*active_id_);
            if (prev != contexts_.end()) prev->second->is_active = false;
        }
        it->second->is_active = true;
        it->second->last_activity = WallClock::now();
        active_id_ = context_id;
    }
    event.context_id = context_id;

    PHLOG_INFO("CtxMgr", "Switched %s -> %s",
               event.previous_id ? event.previous_id->c_str() : "(none)", context_id.c_str());
    bus_.publish(event);
    return Ok();
}

Result<void> ContextManager::removeContext(const std::string& context_id) {
    MutationGuard guard(mutating_);
    if (auto busy = lifecycleBusy(guard); busy.is_err()) return busy;
    if (!hasContext(context_id)) {
        PHLOG_DEBUG("CtxMgr", "Remove of unknown context %s ignored", context_id.c_str());
        return Ok();
    }
    removeInternal(context_id);
    return Ok();
}

// Port and backend go with the map entry. The removed event is published
// before the backend is closed so that listeners stop using it first.
void ContextManager::removeInternal(const std::string& context_id) {
    std::unique_ptr<PrinterContext> ctx;
    bool was_active = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = contexts_.find(context_id);
        if (it == contexts_.end()) return;
        ctx = std::move(it->second);
        contexts_.erase(it);
        order_.erase(std::remove(order_.begin(), order_.end(), context_id), order_.end());
        was_active = (active_id_ == context_id);
        if (was_active) active_id_.reset();
    }

    if (ctx->stream_port) ports_.release(*ctx->stream_port);
    PHLOG_INFO("CtxMgr", "Removed %s%s", context_id.c_str(), was_active ? " (was active)" : "");

    ContextRemovedEvent event;
    event.context_id = context_id;
    event.was_active = was_active;
    bus_.publish(event);

    if (ctx->backend) ctx->backend->close();
}

Result<void> ContextManager::reset() {
    MutationGuard guard(mutating_);
    if (auto busy = lifecycleBusy(guard); busy.is_err()) return busy;
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ids = order_;
    }
    for (const auto& id : ids) removeInternal(id);
    return Ok();
}

// =============================================================================
// Lookup
// =============================================================================

PrinterContext* ContextManager::getActiveContext() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!active_id_) return nullptr;
    auto it = contexts_.find(*active_id_);
    return it != contexts_.end() ? it->second.get() : nullptr;
}

const PrinterContext* ContextManager::getActiveContext() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!active_id_) return nullptr;
    auto it = contexts_.find(*active_id_);
    return it != contexts_.end() ? it->second.get() : nullptr;
}

std::optional<std::string> ContextManager::getActiveContextId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_id_;
}

PrinterContext* ContextManager::getContext(const std::string& context_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = contexts_.find(context_id);
    return it != contexts_.end() ? it->second.get() : nullptr;
}

const PrinterContext* ContextManager::getContext(const std::string& context_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = contexts_.find(context_id);
    return it != contexts_.end() ? it->second.get() : nullptr;
}

bool ContextManager::hasContext(const std::string& context_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return contexts_.count(context_id) > 0;
}

size_t ContextManager::contextCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return contexts_.size();
}

std::vector<ContextInfo> ContextManager::listContexts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ContextInfo> result;
    result.reserve(order_.size());
    for (const auto& id : order_) {
        auto it = contexts_.find(id);
        if (it != contexts_.end()) result.push_back(makeInfo(*it->second));
    }
    return result;
}

std::optional<ContextInfo> ContextManager::getContextInfo(const std::string& context_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = contexts_.find(context_id);
    if (it == contexts_.end()) return std::nullopt;
    return makeInfo(*it->second);
}

// =============================================================================
// Updates
// =============================================================================

void ContextManager::publishUpdate(const std::string& context_id, nlohmann::json patch) {
    ContextUpdatedEvent event;
    event.context_id = context_id;
    event.patch = std::move(patch);
    bus_.publish(event);
}

Result<void> ContextManager::updateConnectionState(const std::string& context_id, ConnectionState state) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = contexts_.find(context_id);
        if (it == contexts_.end()) {
            return Result<void>(Error(ErrorKind::NotFound, "no context " + context_id));
        }
        if (it->second->connection_state == state) return Ok();
        it->second->connection_state = state;
        it->second->last_activity = WallClock::now();
    }
    PHLOG_DEBUG("CtxMgr", "%s is %s", context_id.c_str(), connectionStateName(state));
    publishUpdate(context_id, nlohmann::json{{"connectionState", connectionStateName(state)}});
    return Ok();
}

Result<void> ContextManager::updateDeviceDetails(const std::string& context_id, const DeviceDetails& details) {
    MutationGuard guard(mutating_);
    if (!guard.acquired()) {
        return Result<void>(Error(ErrorKind::InvalidState, "context manager is busy"));
    }

    nlohmann::json patch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = contexts_.find(context_id);
        if (it == contexts_.end()) {
            return Result<void>(Error(ErrorKind::NotFound, "no context " + context_id));
        }
        PrinterContext& ctx = *it->second;
        if (details.identityKey() != ctx.details.identityKey()) {
            return Result<void>(Error(ErrorKind::InvalidArgument,
                                      "device identity cannot change (" + ctx.details.identityKey() + ")"));
        }
        if (BackendDispatcher::detectModelType(details) != ctx.model) {
            return Result<void>(Error(ErrorKind::InvalidArgument,
                                      "model type cannot change for an existing context"));
        }
        ctx.details = details;
        if (!details.name.empty() && details.name != ctx.display_name) {
            ctx.display_name = details.name;
            patch["name"] = details.name;
        }
        patch["device"] = details;
        ctx.last_activity = WallClock::now();
    }
    publishUpdate(context_id, std::move(patch));
    return Ok();
}

Result<void> ContextManager::recordStatus(const std::string& context_id, const PrinterStatus& status) {
    bool reconnected = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = contexts_.find(context_id);
        if (it == contexts_.end()) {
            return Result<void>(Error(ErrorKind::NotFound, "no context " + context_id));
        }
        PrinterContext& ctx = *it->second;
        ctx.last_status = status;
        ctx.last_activity = WallClock::now();
        if (status.connected && ctx.connection_state != ConnectionState::Connected) {
            ctx.connection_state = ConnectionState::Connected;
            reconnected = true;
        }
    }
    if (reconnected) {
        publishUpdate(context_id, nlohmann::json{{"connectionState", connectionStateName(ConnectionState::Connected)}});
    }
    return Ok();
}

} // namespace printerhub
