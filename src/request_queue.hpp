#pragma once
// =============================================================================
// PrinterHub - Bounded Request Queue
// =============================================================================
// Per-context lanes for expensive auxiliary requests (thumbnails, material
// queries). Each lane runs at most `concurrency` requests at once: 1 for the
// legacy channel, queue.modern_concurrency for the modern API.
//
//   enqueue(ctx, key, prio, work, done)
//       same (ctx, key) while the first is still live -> joins it, one work()
//       call, every waiter gets the same result
//   cancelAll(ctx)
//       pending and in-flight waiters resolve Cancelled at once; a request
//       already on the wire keeps its slot until it settles or times out and
//       its result is dropped
//
// Failed attempts are retried with exponential backoff
// (retry_base_delay_ms * 2^(attempt-1)); UnsupportedOperation and other
// non-transient errors are not. An attempt with no completion after
// request_timeout_ms fails with ExecutionFailed and frees its slot.
//
// Runs on the scheduler thread only.
// =============================================================================

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "config_loader.hpp"
#include "event_bus.hpp"
#include "protocol_client.hpp"
#include "result.hpp"
#include "scheduler.hpp"

namespace printerhub {

class RequestQueue {
public:
    using Payload = nlohmann::json;
    using Work = std::function<void(Completion<Payload>)>;
    // Concurrency class of a context's backend; nullopt for unknown contexts
    using ConcurrencyResolver = std::function<std::optional<int>(const std::string& context_id)>;

    enum class Enqueued { Started, Queued, Joined };

    struct Stats {
        uint64_t enqueued = 0;
        uint64_t deduplicated = 0;
        uint64_t attempts = 0;
        uint64_t succeeded = 0;
        uint64_t failed = 0;
        uint64_t retried = 0;
        uint64_t timed_out = 0;
        uint64_t cancelled = 0;
    };

    RequestQueue(Scheduler& scheduler, EventBus& bus, const config::QueueConfig& config,
                 ConcurrencyResolver resolver);
    ~RequestQueue();

    RequestQueue(const RequestQueue&) = delete;
    RequestQueue& operator=(const RequestQueue&) = delete;

    // NotFound when the resolver does not know the context,
    // QueueOverflow when the lane already holds max_pending_per_context keys.
    // `done` is only kept when the call succeeds.
    Result<Enqueued> enqueue(const std::string& context_id, const std::string& key, int priority,
                             Work work, Completion<Payload> done);

    // Returns the number of requests whose waiters were cancelled
    size_t cancelAll(const std::string& context_id);
    // cancelAll + forget the lane (context removed)
    void dropContext(const std::string& context_id);

    int inFlightCount(const std::string& context_id) const;
    size_t pendingCount(const std::string& context_id) const;
    int concurrencyFor(const std::string& context_id) const;  // 0 if no lane
    bool hasLane(const std::string& context_id) const;
    const Stats& stats() const { return stats_; }

private:
    struct Entry {
        uint64_t seq = 0;
        std::string key;
        int priority = 0;
        Work work;
        std::vector<Completion<Payload>> waiters;

        int attempt = 0;
        bool holds_slot = false;
        bool cancelled = false;
        uint64_t token = 0;                 // current attempt; 0 = none outstanding
        Scheduler::TimerId timeout_timer = 0;
        Scheduler::TimerId retry_timer = 0;
    };
    using EntryPtr = std::shared_ptr<Entry>;

    // higher priority first, then FIFO
    struct PendingOrder {
        bool operator()(const EntryPtr& a, const EntryPtr& b) const {
            if (a->priority != b->priority) return a->priority > b->priority;
            return a->seq < b->seq;
        }
    };

    struct Lane {
        std::string context_id;
        uint64_t epoch = 0;
        int concurrency = 1;
        int in_flight = 0;                  // held slots
        std::map<std::string, EntryPtr> live;   // by key: queued, retry-waiting, running
        std::set<EntryPtr, PendingOrder> pending;
    };

    Lane* findLane(const std::string& context_id, uint64_t epoch);
    void pump(std::string context_id, uint64_t epoch);
    void start(Lane& lane, const EntryPtr& entry);
    void onAttemptDone(std::string context_id, uint64_t epoch, EntryPtr entry,
                       uint64_t token, Result<Payload> result, bool timed_out);
    void deliver(std::vector<Completion<Payload>>& waiters, const Result<Payload>& result);
    void releaseSlot(Lane& lane, Entry& entry);
    void finish(Lane& lane, const EntryPtr& entry, Result<Payload> result);
    int backoffMs(int attempt) const;

    Scheduler& scheduler_;
    const config::QueueConfig config_;
    ConcurrencyResolver resolver_;

    std::map<std::string, Lane> lanes_;
    uint64_t next_epoch_ = 1;
    uint64_t next_seq_ = 1;
    uint64_t next_token_ = 1;
    Stats stats_;
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);

    SubscriptionHandle sub_removed_;
};

} // namespace printerhub
