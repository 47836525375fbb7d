// =============================================================================
// PrinterHub - Engine Facade Implementation
// =============================================================================
#include "printer_hub.hpp"
#include "printerhub_log.hpp"

namespace printerhub {

PrinterHub::PrinterHub() = default;

PrinterHub::~PrinterHub() {
    shutdown();
}

Error PrinterHub::notInitialized() const {
    return Error(ErrorKind::InvalidState, "printer hub is not initialized");
}

Result<void> PrinterHub::initialize(const config::EngineConfig& config, Scheduler& scheduler,
                                    ClientFactory& factory) {
    if (initialized_) {
        return Result<void>(Error(ErrorKind::InvalidState, "printer hub is already initialized"));
    }
    auto valid = config::validateConfig(config);
    if (valid.is_err()) return valid;

    config_ = config;
    scheduler_ = &scheduler;
    factory_ = &factory;

    bus_ = std::make_unique<EventBus>();
    ports_ = std::make_unique<PortAllocator>(config_.ports.start_port, config_.ports.end_port);
    dispatcher_ = std::make_unique<BackendDispatcher>(factory, config_.queue);
    contexts_ = std::make_unique<ContextManager>(*bus_, *dispatcher_, *ports_, config_.contexts);
    polling_ = std::make_unique<PollingCoordinator>(scheduler, *bus_, *contexts_, config_.polling);

    ContextManager* contexts = contexts_.get();
    queue_ = std::make_unique<RequestQueue>(scheduler, *bus_, config_.queue,
        [contexts](const std::string& context_id) -> std::optional<int> {
            const PrinterContext* ctx = contexts->getContext(context_id);
            if (!ctx || !ctx->backend) return std::nullopt;
            return ctx->backend->capabilities().max_concurrent_requests;
        });

    initialized_ = true;
    PHLOG_INFO("hub", "Initialized: ports %d-%d, polling %d/%dms, reconnect=%s",
               config_.ports.start_port, config_.ports.end_port,
               config_.polling.active_interval_ms, config_.polling.inactive_interval_ms,
               config::reconnectPolicyName(config_.contexts.reconnect_policy));
    return Ok();
}

void PrinterHub::shutdown() {
    if (!initialized_) return;
    PHLOG_INFO("hub", "Shutting down (%zu contexts)", contexts_->contextCount());

    bus_->publish(ShutdownEvent{});
    polling_->stopAllPolling();
    auto reset = contexts_->reset();
    if (reset.is_err()) {
        PHLOG_WARN("hub", "Context reset during shutdown: %s", reset.error().describe().c_str());
    }

    queue_.reset();
    polling_.reset();
    contexts_.reset();
    dispatcher_.reset();
    ports_.reset();
    bus_.reset();
    scheduler_ = nullptr;
    factory_ = nullptr;
    initialized_ = false;
}

// =============================================================================
// Contexts
// =============================================================================

Result<std::string> PrinterHub::createContext(const DeviceDetails& details, const CreateOptions& options) {
    if (!initialized_) return notInitialized();
    return contexts_->createContext(details, options);
}

Result<void> PrinterHub::switchContext(const std::string& context_id) {
    if (!initialized_) return notInitialized();
    return contexts_->switchContext(context_id);
}

Result<void> PrinterHub::removeContext(const std::string& context_id) {
    if (!initialized_) return notInitialized();
    return contexts_->removeContext(context_id);
}

std::vector<ContextInfo> PrinterHub::listContexts() const {
    if (!initialized_) return {};
    return contexts_->listContexts();
}

std::optional<ContextInfo> PrinterHub::getActiveContext() const {
    if (!initialized_) return std::nullopt;
    auto id = contexts_->getActiveContextId();
    if (!id) return std::nullopt;
    return contexts_->getContextInfo(*id);
}

Result<PrinterContext*> PrinterHub::resolve(const OptionalContextId& context_id) {
    if (!initialized_) return notInitialized();
    PrinterContext* ctx = context_id ? contexts_->getContext(*context_id) : contexts_->getActiveContext();
    if (!ctx) {
        return Err<PrinterContext*>(ErrorKind::NotFound,
                                    context_id ? "no context " + *context_id : std::string("no active context"));
    }
    if (!ctx->backend) {
        return Err<PrinterContext*>(ErrorKind::InvalidState, ctx->id + " has no backend");
    }
    return ctx;
}

// =============================================================================
// Queued requests
// =============================================================================

Result<RequestQueue::Enqueued> PrinterHub::enqueueRequest(const std::string& key, int priority,
                                                          RequestQueue::Work work,
                                                          Completion<RequestQueue::Payload> done,
                                                          const OptionalContextId& context_id) {
    auto ctx = resolve(context_id);
    if (ctx.is_err()) return ctx.error();
    return queue_->enqueue(ctx.value()->id, key, priority, std::move(work), std::move(done));
}

size_t PrinterHub::cancelRequests(const OptionalContextId& context_id) {
    auto ctx = resolve(context_id);
    if (ctx.is_err()) return 0;
    return queue_->cancelAll(ctx.value()->id);
}

void PrinterHub::getJobThumbnail(const std::string& file_name, Completion<std::string> done,
                                 int priority, const OptionalContextId& context_id) {
    auto ctx = resolve(context_id);
    if (ctx.is_err()) { done(ctx.error()); return; }
    const std::string id = ctx.value()->id;

    // Looked up again at start: the context may be gone by the time a slot frees
    ContextManager* contexts = contexts_.get();
    RequestQueue::Work work = [contexts, id, file_name](Completion<RequestQueue::Payload> finish) {
        PrinterContext* target = contexts->getContext(id);
        if (!target || !target->backend) {
            finish(Error(ErrorKind::NotFound, "no context " + id));
            return;
        }
        target->backend->getThumbnail(file_name, [finish](Result<std::string> r) {
            if (r.is_err()) { finish(r.error()); return; }
            finish(RequestQueue::Payload(std::move(r).value()));
        });
    };

    auto queued = queue_->enqueue(id, "thumbnail:" + file_name, priority, std::move(work),
        [done](Result<RequestQueue::Payload> r) {
            if (r.is_err()) { done(r.error()); return; }
            if (!r.value().is_string()) {
                done(Error(ErrorKind::ExecutionFailed, "thumbnail payload is not a string"));
                return;
            }
            done(r.value().get<std::string>());
        });
    if (queued.is_err()) done(queued.error());
}

// =============================================================================
// Device operations
// =============================================================================

void PrinterHub::sendCommand(const std::string& command, Completion<std::string> done,
                             const OptionalContextId& context_id) {
    auto ctx = resolve(context_id);
    if (ctx.is_err()) { done(ctx.error()); return; }
    ctx.value()->backend->sendCommand(command, std::move(done));
}

void PrinterHub::getStatus(Completion<PrinterStatus> done, const OptionalContextId& context_id) {
    auto ctx = resolve(context_id);
    if (ctx.is_err()) { done(ctx.error()); return; }
    ctx.value()->backend->getStatus(std::move(done));
}

void PrinterHub::startJob(const JobStartParams& params, Completion<void> done,
                          const OptionalContextId& context_id) {
    auto ctx = resolve(context_id);
    if (ctx.is_err()) { done(ctx.error()); return; }
    PHLOG_INFO("hub", "Starting %s on %s", params.file_name.c_str(), ctx.value()->id.c_str());
    ctx.value()->backend->startJob(params, std::move(done));
}

void PrinterHub::pauseJob(Completion<void> done, const OptionalContextId& context_id) {
    auto ctx = resolve(context_id);
    if (ctx.is_err()) { done(ctx.error()); return; }
    ctx.value()->backend->pauseJob(std::move(done));
}

void PrinterHub::resumeJob(Completion<void> done, const OptionalContextId& context_id) {
    auto ctx = resolve(context_id);
    if (ctx.is_err()) { done(ctx.error()); return; }
    ctx.value()->backend->resumeJob(std::move(done));
}

void PrinterHub::cancelJob(Completion<void> done, const OptionalContextId& context_id) {
    auto ctx = resolve(context_id);
    if (ctx.is_err()) { done(ctx.error()); return; }
    ctx.value()->backend->cancelJob(std::move(done));
}

void PrinterHub::queryMaterialSlots(Completion<MaterialStationStatus> done,
                                    const OptionalContextId& context_id) {
    auto ctx = resolve(context_id);
    if (ctx.is_err()) { done(ctx.error()); return; }
    ctx.value()->backend->queryMaterialSlots(std::move(done));
}

void PrinterHub::setLed(bool on, Completion<void> done, const OptionalContextId& context_id) {
    auto ctx = resolve(context_id);
    if (ctx.is_err()) { done(ctx.error()); return; }
    ctx.value()->backend->setLed(on, std::move(done));
}

Result<BackendCapabilities> PrinterHub::getCapabilities(const OptionalContextId& context_id) {
    auto ctx = resolve(context_id);
    if (ctx.is_err()) return ctx.error();
    return ctx.value()->backend->capabilities();
}

PrinterHub& hub() {
    static PrinterHub instance;
    return instance;
}

} // namespace printerhub
