#pragma once
// =============================================================================
// PrinterHub - Polling Coordinator
// =============================================================================
// One adaptive status loop per context:
//
//   Stopped -> ActivePolling <-> InactivePolling -> Stopped
//
// The active context polls at polling.active_interval_ms, every other context
// at polling.inactive_interval_ms. Each loop owns exactly one pending timer or
// one fetch in flight, never both, so reclassification on context-switched
// only moves the next deadline: nothing is skipped and nothing runs twice.
//
// A failed fetch is retried inside the same tick (retry_delay_ms x attempt)
// up to max_retries, then reported as polling-error; the loop keeps going.
//
// Runs on the scheduler thread only.
// =============================================================================

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "config_loader.hpp"
#include "context_manager.hpp"
#include "event_bus.hpp"
#include "printer_types.hpp"
#include "result.hpp"
#include "scheduler.hpp"

namespace printerhub {

enum class PollingState : uint8_t { Stopped = 0, ActivePolling, InactivePolling };

const char* pollingStateName(PollingState s);

struct PollingStats {
    PollingState state = PollingState::Stopped;
    bool paused = false;
    int interval_ms = 0;
    uint64_t ticks = 0;             // fetches started by the cadence (retries excluded)
    uint64_t successes = 0;
    uint64_t failures = 0;          // ticks that gave up after retries
    uint64_t retries = 0;
    int consecutive_failures = 0;
    std::optional<WallClock::time_point> last_success;
};

// Per-context settings layered over the config; unset fields fall back to it.
// An interval override holds in both active and inactive state.
struct PollingOverride {
    std::optional<int> interval_ms;
    std::optional<int> max_retries;
    std::optional<int> retry_delay_ms;
};

class PollingCoordinator {
public:
    PollingCoordinator(Scheduler& scheduler, EventBus& bus, ContextManager& contexts,
                       const config::PollingConfig& config);
    ~PollingCoordinator();

    PollingCoordinator(const PollingCoordinator&) = delete;
    PollingCoordinator& operator=(const PollingCoordinator&) = delete;

    // NotFound for unknown contexts; starting a running loop is a no-op.
    // The first fetch is issued on the next scheduler step.
    Result<void> startPollingForContext(const std::string& context_id);
    void stopPollingForContext(const std::string& context_id);
    void stopAllPolling();

    // Paused loops keep their cadence but skip the fetch
    Result<void> pausePolling(const std::string& context_id);
    Result<void> resumePolling(const std::string& context_id);
    void pauseAll();
    void resumeAll();

    // Replaces the context's override; an empty one restores the config.
    // A loop waiting on its cadence timer is re-armed with the new interval.
    Result<void> updatePollingConfigForContext(const std::string& context_id, const PollingOverride& o);

    bool isPollingForContext(const std::string& context_id) const;
    PollingState stateForContext(const std::string& context_id) const;
    std::optional<PrinterStatus> getPollingDataForContext(const std::string& context_id) const;
    std::optional<PollingStats> getPollingStatsForContext(const std::string& context_id) const;
    std::vector<std::string> activePollingContexts() const;
    std::map<std::string, PollingStats> getAllPollingStats() const;

private:
    struct Loop {
        std::string context_id;
        uint64_t generation = 0;
        PollingState state = PollingState::InactivePolling;
        int interval_ms = 0;
        bool paused = false;

        // exactly one of these describes what the loop is waiting on
        bool in_flight = false;             // fetch issued, completion pending
        bool retry_pending = false;         // retry timer armed within a tick
        Scheduler::TimerId timer = 0;       // cadence or retry timer (0 = none)

        Scheduler::TimePoint last_tick_start{};
        bool has_ticked = false;            // first tick runs immediately
        int attempt = 0;
        std::optional<PrinterStatus> last_data;
        PollingOverride overrides;
        PollingStats stats;
    };

    Loop* findLoop(const std::string& context_id, uint64_t generation);
    int intervalFor(const Loop& loop, PollingState state) const;
    int maxRetriesFor(const Loop& loop) const;
    int retryDelayFor(const Loop& loop) const;
    void armNext(Loop& loop);
    void applyInterval(Loop& loop);
    void onTick(const std::string& context_id, uint64_t generation);
    void fetch(Loop& loop);
    void onStatus(const std::string& context_id, uint64_t generation, Result<PrinterStatus> result);
    void reclassify(const std::string& context_id, PollingState state);
    void eraseLoop(std::string context_id, bool announce);

    void handleCreated(const ContextCreatedEvent& e);
    void handleSwitched(const ContextSwitchedEvent& e);
    void handleRemoved(const ContextRemovedEvent& e);

    Scheduler& scheduler_;
    EventBus& bus_;
    ContextManager& contexts_;
    const config::PollingConfig config_;

    std::map<std::string, Loop> loops_;
    uint64_t next_generation_ = 1;
    // Completions that arrive after destruction see an expired token
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);

    SubscriptionHandle sub_created_;
    SubscriptionHandle sub_switched_;
    SubscriptionHandle sub_removed_;
};

} // namespace printerhub
