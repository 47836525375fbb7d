// =============================================================================
// PrinterHub - Event Bus
// =============================================================================
// Type-erased publish/subscribe between the context manager, the polling
// coordinator, the request queue and UI-facing collaborators.
// Usage:
//   auto sub = bus.subscribe<ContextSwitchedEvent>([](const auto& e) { ... });
//   bus.publish(ContextSwitchedEvent{...});
//
// Delivery contract:
//   - publish() delivers synchronously; when it returns, every subscriber has
//     seen the event (unless publish was itself called from inside a handler).
//   - Events are delivered in the order they were published. A publish made
//     from inside a handler is queued and delivered after the current event
//     has reached all of its subscribers.
//   - A handler that throws is logged and skipped; other handlers still run.
//   - The bus must outlive every SubscriptionHandle it hands out.
// =============================================================================
#pragma once
#include <functional>
#include <mutex>
#include <vector>
#include <deque>
#include <unordered_map>
#include <typeindex>
#include <memory>
#include <string>
#include <optional>
#include <cstdint>
#include <atomic>
#include <algorithm>
#include <nlohmann/json.hpp>
#include "printerhub_log.hpp"
#include "printer_types.hpp"

namespace printerhub {

// =============================================================================
// Event Types
// =============================================================================

struct Event {
    virtual ~Event() = default;
};

// Context lifecycle
struct ContextCreatedEvent : Event {
    std::string context_id;
    std::string display_name;
    std::string model_type;   // "generic-legacy", "adventurer-5m", ...
};

struct ContextSwitchedEvent : Event {
    std::string context_id;                  // newly active
    std::optional<std::string> previous_id;  // nullopt if nothing was active
};

struct ContextRemovedEvent : Event {
    std::string context_id;
    bool was_active = false;
};

struct ContextUpdatedEvent : Event {
    std::string context_id;
    nlohmann::json patch;     // changed ContextInfo fields only
};

// Polling
struct PollingDataEvent : Event {
    std::string context_id;
    PrinterStatus status;
    bool cached = false;      // replay of last snapshot after promotion
};

struct PollingErrorEvent : Event {
    std::string context_id;
    std::string error;
    int attempts = 0;
};

struct PollingStartedEvent : Event {
    std::string context_id;
    int interval_ms = 0;
};

struct PollingStoppedEvent : Event {
    std::string context_id;
};

// System
struct ShutdownEvent : Event {};

// =============================================================================
// SubscriptionHandle - RAII unsubscribe
// =============================================================================

class SubscriptionHandle {
public:
    SubscriptionHandle() = default;
    explicit SubscriptionHandle(std::function<void()> unsub) : unsub_(std::move(unsub)) {}
    ~SubscriptionHandle() { if (unsub_) unsub_(); }

    SubscriptionHandle(SubscriptionHandle&& o) noexcept : unsub_(std::move(o.unsub_)) { o.unsub_ = nullptr; }
    SubscriptionHandle& operator=(SubscriptionHandle&& o) noexcept {
        if (unsub_) unsub_();
        unsub_ = std::move(o.unsub_);
        o.unsub_ = nullptr;
        return *this;
    }
    SubscriptionHandle(const SubscriptionHandle&) = delete;
    SubscriptionHandle& operator=(const SubscriptionHandle&) = delete;

    void reset() {
        if (unsub_) unsub_();
        unsub_ = nullptr;
    }

private:
    std::function<void()> unsub_;
};

// =============================================================================
// EventBus
// =============================================================================

class EventBus {
public:
    using HandlerId = uint64_t;

    EventBus() = default;
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    template<typename T>
    SubscriptionHandle subscribe(std::function<void(const T&)> handler) {
        static_assert(std::is_base_of_v<Event, T>, "T must derive from Event");

        std::lock_guard<std::mutex> lock(mutex_);
        auto id = next_id_++;
        auto key = std::type_index(typeid(T));
        auto alive = std::make_shared<std::atomic<bool>>(true);

        handlers_[key].push_back({id, alive, [handler](const Event& e) {
            handler(static_cast<const T&>(e));
        }});

        PHLOG_TRACE("eventbus", "Subscribed handler %llu for %s",
                    (unsigned long long)id, typeid(T).name());

        std::weak_ptr<char> bus_alive = token_;
        return SubscriptionHandle([this, bus_alive, key, id, alive]() {
            alive->store(false);
            if (bus_alive.expired()) return;  // bus already destroyed
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = handlers_.find(key);
            if (it != handlers_.end()) {
                auto& vec = it->second;
                vec.erase(std::remove_if(vec.begin(), vec.end(),
                    [id](const HandlerEntry& h) { return h.id == id; }), vec.end());
            }
        });
    }

    template<typename T>
    void publish(const T& event) {
        static_assert(std::is_base_of_v<Event, T>, "T must derive from Event");

        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending_.push_back({std::type_index(typeid(T)), std::make_shared<T>(event)});
            if (dispatching_) return;  // outer publish drains it in order
            dispatching_ = true;
        }
        drain();
    }

    template<typename T>
    bool has_subscribers() const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(T)));
        return it != handlers_.end() && !it->second.empty();
    }

    // True while handlers run; a publish made now is delivered after they return
    bool dispatching() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dispatching_;
    }

private:
    struct HandlerEntry {
        HandlerId id;
        std::shared_ptr<std::atomic<bool>> alive;
        std::function<void(const Event&)> fn;
    };

    struct PendingEvent {
        std::type_index key;
        std::shared_ptr<const Event> event;
    };

    void drain() {
        for (;;) {
            std::shared_ptr<const Event> event;
            std::vector<HandlerEntry> snapshot;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (pending_.empty()) {
                    dispatching_ = false;
                    return;
                }
                PendingEvent next = std::move(pending_.front());
                pending_.pop_front();
                event = std::move(next.event);
                auto it = handlers_.find(next.key);
                if (it != handlers_.end()) snapshot = it->second;
            }

            for (auto& entry : snapshot) {
                // Unsubscribed by an earlier handler of this same event
                if (!entry.alive->load()) continue;
                try {
                    entry.fn(*event);
                } catch (const std::exception& e) {
                    PHLOG_ERROR("eventbus", "Handler %llu threw: %s",
                                (unsigned long long)entry.id, e.what());
                }
            }
        }
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::type_index, std::vector<HandlerEntry>> handlers_;
    std::deque<PendingEvent> pending_;
    bool dispatching_ = false;
    HandlerId next_id_ = 1;
    // Handles that outlive the bus see an expired token
    std::shared_ptr<char> token_ = std::make_shared<char>(0);
};

} // namespace printerhub
