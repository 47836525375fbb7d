#include "request_queue.hpp"
#include "printerhub_log.hpp"
#include <algorithm>
#include <cstdint>
#include <limits>

namespace printerhub {

RequestQueue::RequestQueue(Scheduler& scheduler, EventBus& bus, const config::QueueConfig& config,
                           ConcurrencyResolver resolver)
    : scheduler_(scheduler), config_(config), resolver_(std::move(resolver)) {
    sub_removed_ = bus.subscribe<ContextRemovedEvent>(
        [this](const ContextRemovedEvent& e) { dropContext(e.context_id); });
}

// Outstanding waiters are dropped without a callback
RequestQueue::~RequestQueue() {
    *alive_ = false;
    for (auto& [id, lane] : lanes_) {
        for (auto& [key, entry] : lane.live) {
            if (entry->timeout_timer) scheduler_.cancel(entry->timeout_timer);
            if (entry->retry_timer) scheduler_.cancel(entry->retry_timer);
        }
    }
    lanes_.clear();
}

RequestQueue::Lane* RequestQueue::findLane(const std::string& context_id, uint64_t epoch) {
    auto it = lanes_.find(context_id);
    if (it == lanes_.end() || it->second.epoch != epoch) return nullptr;
    return &it->second;
}

// base * 2^(attempt-1), saturating at INT_MAX
int RequestQueue::backoffMs(int attempt) const {
    const int shift = std::min(std::max(attempt - 1, 0), 30);
    const int64_t delay = static_cast<int64_t>(config_.retry_base_delay_ms) << shift;
    return static_cast<int>(std::min<int64_t>(delay, std::numeric_limits<int>::max()));
}

// =============================================================================
// Enqueue / cancel
// =============================================================================

Result<RequestQueue::Enqueued> RequestQueue::enqueue(const std::string& context_id, const std::string& key,
                                                     int priority, Work work, Completion<Payload> done) {
    if (!work || !done) {
        return Err<Enqueued>(ErrorKind::InvalidArgument, "work and completion are required");
    }

    auto it = lanes_.find(context_id);
    if (it == lanes_.end()) {
        std::optional<int> concurrency = resolver_ ? resolver_(context_id) : std::nullopt;
        if (!concurrency) {
            return Err<Enqueued>(ErrorKind::NotFound, "no context " + context_id);
        }
        Lane lane;
        lane.context_id = context_id;
        lane.epoch = next_epoch_++;
        lane.concurrency = std::max(1, *concurrency);
        it = lanes_.emplace(context_id, std::move(lane)).first;
        PHLOG_DEBUG("ReqQueue", "Lane %s opened (concurrency %d)", context_id.c_str(), it->second.concurrency);
    }
    Lane& lane = it->second;

    auto live = lane.live.find(key);
    if (live != lane.live.end()) {
        EntryPtr entry = live->second;
        entry->waiters.push_back(std::move(done));
        stats_.deduplicated++;
        if (priority > entry->priority) {
            // re-sort if it is still waiting for a slot
            auto p = lane.pending.find(entry);
            if (p != lane.pending.end()) {
                lane.pending.erase(p);
                entry->priority = priority;
                lane.pending.insert(entry);
            } else {
                entry->priority = priority;
            }
        }
        PHLOG_TRACE("ReqQueue", "%s/%s joined (%zu waiters)", context_id.c_str(), key.c_str(),
                    entry->waiters.size());
        return Enqueued::Joined;
    }

    if (static_cast<int>(lane.live.size()) >= config_.max_pending_per_context) {
        PHLOG_WARN("ReqQueue", "%s overflow at %zu requests", context_id.c_str(), lane.live.size());
        return Err<Enqueued>(ErrorKind::QueueOverflow,
                             "too many requests queued for " + context_id);
    }

    auto entry = std::make_shared<Entry>();
    entry->seq = next_seq_++;
    entry->key = key;
    entry->priority = priority;
    entry->work = std::move(work);
    entry->waiters.push_back(std::move(done));
    lane.live.emplace(key, entry);
    lane.pending.insert(entry);
    stats_.enqueued++;

    pump(context_id, lane.epoch);
    return entry->attempt > 0 ? Enqueued::Started : Enqueued::Queued;
}

void RequestQueue::deliver(std::vector<Completion<Payload>>& waiters, const Result<Payload>& result) {
    for (auto& waiter : waiters) {
        try {
            waiter(result);
        } catch (const std::exception& e) {
            PHLOG_ERROR("ReqQueue", "Waiter threw: %s", e.what());
        }
    }
}

size_t RequestQueue::cancelAll(const std::string& context_id) {
    auto it = lanes_.find(context_id);
    if (it == lanes_.end()) return 0;
    Lane& lane = it->second;

    std::vector<Completion<Payload>> waiters;
    const size_t count = lane.live.size();
    int abandoned = 0;
    for (auto& [key, entry] : lane.live) {
        entry->cancelled = true;
        if (entry->retry_timer) {
            scheduler_.cancel(entry->retry_timer);
            entry->retry_timer = 0;
        }
        if (entry->holds_slot) {
            // A late reply no longer matches the token and is ignored
            entry->token = 0;
            if (entry->timeout_timer) {
                scheduler_.cancel(entry->timeout_timer);
                entry->timeout_timer = 0;
            }
            releaseSlot(lane, *entry);
            abandoned++;
        }
        for (auto& w : entry->waiters) waiters.push_back(std::move(w));
        entry->waiters.clear();
    }
    lane.live.clear();
    lane.pending.clear();
    stats_.cancelled += count;

    if (count > 0) {
        PHLOG_INFO("ReqQueue", "Cancelled %zu request(s) for %s (%d abandoned on the wire)",
                   count, context_id.c_str(), abandoned);
    }
    Result<Payload> cancelled = Error(ErrorKind::Cancelled, "requests for " + context_id + " were cancelled");
    deliver(waiters, cancelled);
    return count;
}

void RequestQueue::dropContext(const std::string& context_id) {
    const std::string id = context_id;
    cancelAll(id);
    if (lanes_.erase(id) > 0) {
        PHLOG_DEBUG("ReqQueue", "Lane %s dropped", id.c_str());
    }
}

// =============================================================================
// Execution
// =============================================================================

void RequestQueue::pump(std::string context_id, uint64_t epoch) {
    for (;;) {
        Lane* lane = findLane(context_id, epoch);
        if (!lane || lane->pending.empty() || lane->in_flight >= lane->concurrency) return;
        EntryPtr entry = *lane->pending.begin();
        lane->pending.erase(lane->pending.begin());
        start(*lane, entry);
    }
}

// work() may complete synchronously; `lane` is not touched after it is called
void RequestQueue::start(Lane& lane, const EntryPtr& entry) {
    entry->attempt++;
    entry->holds_slot = true;
    const uint64_t token = next_token_++;
    entry->token = token;
    lane.in_flight++;
    stats_.attempts++;

    const std::string id = lane.context_id;
    const uint64_t epoch = lane.epoch;
    std::weak_ptr<bool> alive = alive_;

    PHLOG_TRACE("ReqQueue", "%s/%s attempt %d (%d/%d in flight)", id.c_str(), entry->key.c_str(),
                entry->attempt, lane.in_flight, lane.concurrency);

    entry->timeout_timer = scheduler_.schedule(
        Scheduler::Duration(config_.request_timeout_ms), [this, alive, id, epoch, entry, token] {
            if (alive.expired()) return;
            entry->timeout_timer = 0;
            onAttemptDone(id, epoch, entry, token,
                          Error(ErrorKind::ExecutionFailed,
                                "request timed out after " + std::to_string(config_.request_timeout_ms) + "ms"),
                          true);
        });

    Completion<Payload> completion = [this, alive, id, epoch, entry, token](Result<Payload> result) {
        if (alive.expired()) return;
        onAttemptDone(id, epoch, entry, token, std::move(result), false);
    };

    try {
        entry->work(std::move(completion));
    } catch (const std::exception& e) {
        PHLOG_ERROR("ReqQueue", "%s/%s threw: %s", id.c_str(), entry->key.c_str(), e.what());
        onAttemptDone(id, epoch, entry, token, Error(ErrorKind::ExecutionFailed, e.what()), false);
    }
}

void RequestQueue::releaseSlot(Lane& lane, Entry& entry) {
    if (!entry.holds_slot) return;
    entry.holds_slot = false;
    lane.in_flight--;
}

void RequestQueue::onAttemptDone(std::string context_id, uint64_t epoch, EntryPtr entry,
                                 uint64_t token, Result<Payload> result, bool timed_out) {
    Lane* lane = findLane(context_id, epoch);
    if (!lane) return;                      // context gone
    if (entry->token != token) return;      // attempt already settled (late reply after timeout)
    entry->token = 0;
    if (entry->timeout_timer) {
        scheduler_.cancel(entry->timeout_timer);
        entry->timeout_timer = 0;
    }
    releaseSlot(*lane, *entry);

    if (timed_out) {
        stats_.timed_out++;
        PHLOG_WARN("ReqQueue", "%s/%s timed out on attempt %d", context_id.c_str(),
                   entry->key.c_str(), entry->attempt);
    }

    if (entry->cancelled) {
        PHLOG_TRACE("ReqQueue", "%s/%s settled after cancel, result dropped",
                    context_id.c_str(), entry->key.c_str());
        pump(context_id, epoch);
        return;
    }

    if (result.is_err() && result.error().retryable() && entry->attempt <= config_.max_retries) {
        const int delay = backoffMs(entry->attempt);
        stats_.retried++;
        PHLOG_DEBUG("ReqQueue", "%s/%s failed (%s), retry in %dms", context_id.c_str(),
                    entry->key.c_str(), result.error().describe().c_str(), delay);

        std::weak_ptr<bool> alive = alive_;
        entry->retry_timer = scheduler_.schedule(
            Scheduler::Duration(delay), [this, alive, context_id, epoch, entry] {
                if (alive.expired()) return;
                entry->retry_timer = 0;
                Lane* l = findLane(context_id, epoch);
                if (!l || entry->cancelled) return;
                l->pending.insert(entry);
                pump(context_id, epoch);
            });
        pump(context_id, epoch);
        return;
    }

    finish(*lane, entry, std::move(result));
}

void RequestQueue::finish(Lane& lane, const EntryPtr& entry, Result<Payload> result) {
    auto live = lane.live.find(entry->key);
    if (live != lane.live.end() && live->second == entry) lane.live.erase(live);

    if (result.is_ok()) {
        stats_.succeeded++;
    } else {
        stats_.failed++;
        PHLOG_WARN("ReqQueue", "%s/%s failed after %d attempt(s): %s", lane.context_id.c_str(),
                   entry->key.c_str(), entry->attempt, result.error().describe().c_str());
    }

    std::vector<Completion<Payload>> waiters = std::move(entry->waiters);
    entry->waiters.clear();
    const std::string id = lane.context_id;
    const uint64_t epoch = lane.epoch;

    pump(id, epoch);
    deliver(waiters, result);
}

// =============================================================================
// Queries
// =============================================================================

int RequestQueue::inFlightCount(const std::string& context_id) const {
    auto it = lanes_.find(context_id);
    return it != lanes_.end() ? it->second.in_flight : 0;
}

size_t RequestQueue::pendingCount(const std::string& context_id) const {
    auto it = lanes_.find(context_id);
    if (it == lanes_.end()) return 0;
    return static_cast<size_t>(std::count_if(it->second.live.begin(), it->second.live.end(),
        [](const auto& kv) { return !kv.second->holds_slot; }));
}

int RequestQueue::concurrencyFor(const std::string& context_id) const {
    auto it = lanes_.find(context_id);
    return it != lanes_.end() ? it->second.concurrency : 0;
}

bool RequestQueue::hasLane(const std::string& context_id) const {
    return lanes_.count(context_id) > 0;
}

} // namespace printerhub
