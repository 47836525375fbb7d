#include "polling_coordinator.hpp"
#include "printerhub_log.hpp"
#include <algorithm>
#include <cstdint>
#include <limits>

namespace printerhub {

const char* pollingStateName(PollingState s) {
    switch (s) {
    case PollingState::Stopped:         return "stopped";
    case PollingState::ActivePolling:   return "active";
    case PollingState::InactivePolling: return "inactive";
    }
    return "?";
}

PollingCoordinator::PollingCoordinator(Scheduler& scheduler, EventBus& bus, ContextManager& contexts,
                                       const config::PollingConfig& config)
    : scheduler_(scheduler), bus_(bus), contexts_(contexts), config_(config) {
    sub_created_ = bus_.subscribe<ContextCreatedEvent>(
        [this](const ContextCreatedEvent& e) { handleCreated(e); });
    sub_switched_ = bus_.subscribe<ContextSwitchedEvent>(
        [this](const ContextSwitchedEvent& e) { handleSwitched(e); });
    sub_removed_ = bus_.subscribe<ContextRemovedEvent>(
        [this](const ContextRemovedEvent& e) { handleRemoved(e); });
}

PollingCoordinator::~PollingCoordinator() {
    *alive_ = false;
    for (auto& [id, loop] : loops_) {
        if (loop.timer) scheduler_.cancel(loop.timer);
    }
    loops_.clear();
}

// =============================================================================
// Lifecycle events
// =============================================================================

void PollingCoordinator::handleCreated(const ContextCreatedEvent& e) {
    if (!config_.auto_start) return;
    auto r = startPollingForContext(e.context_id);
    if (r.is_err()) {
        PHLOG_WARN("Polling", "Auto-start for %s failed: %s",
                   e.context_id.c_str(), r.error().describe().c_str());
    }
}

void PollingCoordinator::handleSwitched(const ContextSwitchedEvent& e) {
    if (e.previous_id) reclassify(*e.previous_id, PollingState::InactivePolling);
    reclassify(e.context_id, PollingState::ActivePolling);
}

void PollingCoordinator::handleRemoved(const ContextRemovedEvent& e) {
    stopPollingForContext(e.context_id);
}

// =============================================================================
// Control
// =============================================================================

Result<void> PollingCoordinator::startPollingForContext(const std::string& context_id) {
    const PrinterContext* ctx = contexts_.getContext(context_id);
    if (!ctx) {
        return Result<void>(Error(ErrorKind::NotFound, "no context " + context_id));
    }
    if (loops_.count(context_id)) return Ok();

    Loop loop;
    loop.context_id = context_id;
    loop.generation = next_generation_++;
    loop.state = ctx->is_active ? PollingState::ActivePolling : PollingState::InactivePolling;
    loop.interval_ms = intervalFor(loop, loop.state);
    loop.stats.state = loop.state;
    loop.stats.interval_ms = loop.interval_ms;
    loop.last_tick_start = scheduler_.now();

    auto& stored = loops_.emplace(context_id, std::move(loop)).first->second;
    const uint64_t gen = stored.generation;
    stored.timer = scheduler_.schedule(Scheduler::Duration(0),
                                       [this, context_id, gen] { onTick(context_id, gen); });

    PHLOG_INFO("Polling", "Started %s (%s, %dms)", context_id.c_str(),
               pollingStateName(stored.state), stored.interval_ms);

    PollingStartedEvent event;
    event.context_id = context_id;
    event.interval_ms = stored.interval_ms;
    bus_.publish(event);
    return Ok();
}

void PollingCoordinator::eraseLoop(std::string context_id, bool announce) {
    auto it = loops_.find(context_id);
    if (it == loops_.end()) return;
    if (it->second.timer) scheduler_.cancel(it->second.timer);
    loops_.erase(it);
    PHLOG_INFO("Polling", "Stopped %s", context_id.c_str());

    if (announce) {
        PollingStoppedEvent event;
        event.context_id = context_id;
        bus_.publish(event);
    }
}

void PollingCoordinator::stopPollingForContext(const std::string& context_id) {
    eraseLoop(context_id, true);
}

void PollingCoordinator::stopAllPolling() {
    std::vector<std::string> ids;
    for (const auto& [id, loop] : loops_) ids.push_back(id);
    for (const auto& id : ids) eraseLoop(id, true);
}

Result<void> PollingCoordinator::pausePolling(const std::string& context_id) {
    auto it = loops_.find(context_id);
    if (it == loops_.end()) {
        return Result<void>(Error(ErrorKind::NotFound, "not polling " + context_id));
    }
    it->second.paused = true;
    it->second.stats.paused = true;
    PHLOG_DEBUG("Polling", "Paused %s", context_id.c_str());
    return Ok();
}

Result<void> PollingCoordinator::resumePolling(const std::string& context_id) {
    auto it = loops_.find(context_id);
    if (it == loops_.end()) {
        return Result<void>(Error(ErrorKind::NotFound, "not polling " + context_id));
    }
    it->second.paused = false;
    it->second.stats.paused = false;
    PHLOG_DEBUG("Polling", "Resumed %s", context_id.c_str());
    return Ok();
}

void PollingCoordinator::pauseAll() {
    for (auto& [id, loop] : loops_) {
        loop.paused = true;
        loop.stats.paused = true;
    }
}

void PollingCoordinator::resumeAll() {
    for (auto& [id, loop] : loops_) {
        loop.paused = false;
        loop.stats.paused = false;
    }
}

Result<void> PollingCoordinator::updatePollingConfigForContext(const std::string& context_id,
                                                               const PollingOverride& o) {
    auto it = loops_.find(context_id);
    if (it == loops_.end()) {
        return Result<void>(Error(ErrorKind::NotFound, "not polling " + context_id));
    }
    if ((o.interval_ms && *o.interval_ms <= 0) || (o.max_retries && *o.max_retries < 0) ||
        (o.retry_delay_ms && *o.retry_delay_ms < 0)) {
        return Result<void>(Error(ErrorKind::InvalidArgument, "invalid polling override for " + context_id));
    }

    Loop& loop = it->second;
    loop.overrides = o;
    applyInterval(loop);
    PHLOG_DEBUG("Polling", "%s override: interval %dms, retries %d x %dms", context_id.c_str(),
                loop.interval_ms, maxRetriesFor(loop), retryDelayFor(loop));
    return Ok();
}

// =============================================================================
// Queries
// =============================================================================

bool PollingCoordinator::isPollingForContext(const std::string& context_id) const {
    return loops_.count(context_id) > 0;
}

PollingState PollingCoordinator::stateForContext(const std::string& context_id) const {
    auto it = loops_.find(context_id);
    return it != loops_.end() ? it->second.state : PollingState::Stopped;
}

std::optional<PrinterStatus> PollingCoordinator::getPollingDataForContext(const std::string& context_id) const {
    auto it = loops_.find(context_id);
    if (it == loops_.end()) return std::nullopt;
    return it->second.last_data;
}

std::optional<PollingStats> PollingCoordinator::getPollingStatsForContext(const std::string& context_id) const {
    auto it = loops_.find(context_id);
    if (it == loops_.end()) return std::nullopt;
    return it->second.stats;
}

std::vector<std::string> PollingCoordinator::activePollingContexts() const {
    std::vector<std::string> ids;
    for (const auto& [id, loop] : loops_) ids.push_back(id);
    return ids;
}

std::map<std::string, PollingStats> PollingCoordinator::getAllPollingStats() const {
    std::map<std::string, PollingStats> all;
    for (const auto& [id, loop] : loops_) all.emplace(id, loop.stats);
    return all;
}

// =============================================================================
// Loop mechanics
// =============================================================================

PollingCoordinator::Loop* PollingCoordinator::findLoop(const std::string& context_id, uint64_t generation) {
    auto it = loops_.find(context_id);
    if (it == loops_.end() || it->second.generation != generation) return nullptr;
    return &it->second;
}

int PollingCoordinator::intervalFor(const Loop& loop, PollingState state) const {
    if (loop.overrides.interval_ms) return *loop.overrides.interval_ms;
    return state == PollingState::ActivePolling ? config_.active_interval_ms
                                                : config_.inactive_interval_ms;
}

int PollingCoordinator::maxRetriesFor(const Loop& loop) const {
    return loop.overrides.max_retries.value_or(config_.max_retries);
}

int PollingCoordinator::retryDelayFor(const Loop& loop) const {
    return loop.overrides.retry_delay_ms.value_or(config_.retry_delay_ms);
}

// Next tick is one interval after the start of the previous one; a deadline
// already in the past fires on the next scheduler step.
void PollingCoordinator::armNext(Loop& loop) {
    auto due = loop.last_tick_start + Scheduler::Duration(loop.interval_ms);
    auto now = scheduler_.now();
    if (due < now) due = now;
    const std::string id = loop.context_id;
    const uint64_t gen = loop.generation;
    loop.timer = scheduler_.scheduleAt(due, [this, id, gen] { onTick(id, gen); });
}

// Waiting on the cadence timer: move the deadline. A fetch or retry in
// progress picks the new interval up when it finishes.
void PollingCoordinator::applyInterval(Loop& loop) {
    const int interval = intervalFor(loop, loop.state);
    loop.stats.interval_ms = interval;
    if (interval == loop.interval_ms) return;
    loop.interval_ms = interval;
    if (loop.has_ticked && !loop.in_flight && !loop.retry_pending && loop.timer) {
        scheduler_.cancel(loop.timer);
        loop.timer = 0;
        armNext(loop);
    }
}

void PollingCoordinator::reclassify(const std::string& context_id, PollingState state) {
    auto it = loops_.find(context_id);
    if (it == loops_.end()) return;
    Loop& loop = it->second;

    const bool changed = loop.state != state;
    loop.state = state;
    loop.stats.state = state;
    if (changed) {
        applyInterval(loop);
        PHLOG_DEBUG("Polling", "%s -> %s (%dms)", context_id.c_str(),
                    pollingStateName(state), loop.interval_ms);
    }

    if (state == PollingState::ActivePolling && config_.emit_cached_on_promote && loop.last_data) {
        PollingDataEvent cached;
        cached.context_id = context_id;
        cached.status = *loop.last_data;
        cached.cached = true;
        bus_.publish(cached);
    }
}

void PollingCoordinator::onTick(const std::string& context_id, uint64_t generation) {
    Loop* loop = findLoop(context_id, generation);
    if (!loop) return;
    loop->timer = 0;
    loop->has_ticked = true;
    loop->last_tick_start = scheduler_.now();

    if (loop->paused) {
        armNext(*loop);
        return;
    }
    loop->attempt = 0;
    loop->stats.ticks++;
    fetch(*loop);
}

// The completion may run before getStatus() returns, so nothing touches
// `loop` after the call.
void PollingCoordinator::fetch(Loop& loop) {
    PrinterContext* ctx = contexts_.getContext(loop.context_id);
    if (!ctx || !ctx->backend) {
        PHLOG_DEBUG("Polling", "%s has no backend, dropping loop", loop.context_id.c_str());
        eraseLoop(loop.context_id, false);
        return;
    }

    loop.in_flight = true;
    loop.retry_pending = false;
    const std::string id = loop.context_id;
    const uint64_t gen = loop.generation;
    std::weak_ptr<bool> alive = alive_;
    ctx->backend->getStatus([this, alive, id, gen](Result<PrinterStatus> result) {
        if (alive.expired()) return;
        onStatus(id, gen, std::move(result));
    });
}

void PollingCoordinator::onStatus(const std::string& context_id, uint64_t generation,
                                  Result<PrinterStatus> result) {
    Loop* loop = findLoop(context_id, generation);
    if (!loop) return;  // stopped while in flight
    loop->in_flight = false;

    if (!contexts_.hasContext(context_id)) {
        eraseLoop(context_id, false);
        return;
    }

    if (result.is_ok()) {
        PrinterStatus status = std::move(result).value();
        loop->last_data = status;
        loop->stats.successes++;
        loop->stats.consecutive_failures = 0;
        loop->stats.last_success = WallClock::now();
        armNext(*loop);

        // Handlers below may stop this loop; `loop` is not used past here
        auto recorded = contexts_.recordStatus(context_id, status);
        if (recorded.is_err()) {
            PHLOG_DEBUG("Polling", "%s", recorded.error().message.c_str());
        }
        PollingDataEvent event;
        event.context_id = context_id;
        event.status = std::move(status);
        bus_.publish(event);
        return;
    }

    const Error& error = result.error();
    if (error.retryable() && loop->attempt < maxRetriesFor(*loop)) {
        loop->attempt++;
        loop->stats.retries++;
        loop->retry_pending = true;
        const int delay = static_cast<int>(std::min<int64_t>(
            static_cast<int64_t>(retryDelayFor(*loop)) * loop->attempt, std::numeric_limits<int>::max()));
        PHLOG_DEBUG("Polling", "%s fetch failed (%s), retry %d in %dms", context_id.c_str(),
                    error.describe().c_str(), loop->attempt, delay);
        loop->timer = scheduler_.schedule(Scheduler::Duration(delay), [this, context_id, generation] {
            Loop* l = findLoop(context_id, generation);
            if (!l) return;
            l->timer = 0;
            fetch(*l);
        });
        return;
    }

    const int attempts = loop->attempt + 1;
    loop->stats.failures++;
    loop->stats.consecutive_failures++;
    armNext(*loop);

    PHLOG_WARN("Polling", "%s status failed after %d attempt(s): %s",
               context_id.c_str(), attempts, error.describe().c_str());
    if (error.kind == ErrorKind::Connection) {
        auto updated = contexts_.updateConnectionState(context_id, ConnectionState::Disconnected);
        if (updated.is_err()) {
            PHLOG_DEBUG("Polling", "%s", updated.error().message.c_str());
        }
    }
    PollingErrorEvent event;
    event.context_id = context_id;
    event.error = error.describe();
    event.attempts = attempts;
    bus_.publish(event);
}

} // namespace printerhub
