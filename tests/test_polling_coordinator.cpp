// =============================================================================
// Unit tests for PollingCoordinator (src/polling_coordinator.hpp)
// =============================================================================
#include <gtest/gtest.h>
#include <limits>
#include <memory>
#include <string>
#include <vector>
#include "polling_coordinator.hpp"
#include "test_support.hpp"

using namespace printerhub;
using namespace printerhub::fakes;
using std::chrono::milliseconds;

namespace {

class PollingCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        cfg.active_interval_ms = 3000;
        cfg.inactive_interval_ms = 30000;
        cfg.max_retries = 3;
        cfg.retry_delay_ms = 1000;
        makePolling();

        subs.push_back(bus.subscribe<PollingDataEvent>([this](const PollingDataEvent& e) {
            data.push_back(e);
        }));
        subs.push_back(bus.subscribe<PollingErrorEvent>([this](const PollingErrorEvent& e) {
            errors.push_back(e);
        }));
        subs.push_back(bus.subscribe<PollingStoppedEvent>([this](const PollingStoppedEvent& e) {
            stopped.push_back(e.context_id);
        }));
    }

    void makePolling() {
        polling.reset();
        polling = std::make_unique<PollingCoordinator>(sched, bus, contexts, cfg);
    }

    std::string create(const std::string& ip) {
        auto r = contexts.createContext(legacyDevice(ip));
        EXPECT_TRUE(r.is_ok());
        return r.is_ok() ? r.value() : std::string();
    }

    int polls(const std::string& ip) { return factory.legacy(ip)->count("status"); }

    size_t cachedCount(const std::string& id) const {
        size_t n = 0;
        for (const auto& e : data) {
            if (e.context_id == id && e.cached) n++;
        }
        return n;
    }

    Scheduler sched{Scheduler::Mode::Manual};
    EventBus bus;
    FakeClientFactory factory;
    config::QueueConfig queue;
    BackendDispatcher dispatcher{factory, queue};
    PortAllocator ports{8181, 8191};
    ContextManager contexts{bus, dispatcher, ports, config::ContextConfig{}};
    config::PollingConfig cfg;
    std::unique_ptr<PollingCoordinator> polling;

    std::vector<SubscriptionHandle> subs;
    std::vector<PollingDataEvent> data;
    std::vector<PollingErrorEvent> errors;
    std::vector<std::string> stopped;
};

FakeChannel::Responder failingResponder(int* remaining_failures) {
    return [remaining_failures](const std::string& method, const json&) -> std::optional<Result<json>> {
        if (method == "status" && *remaining_failures != 0) {
            if (*remaining_failures > 0) (*remaining_failures)--;
            return Result<json>(Error(ErrorKind::Connection, "connection refused"));
        }
        return Result<json>(legacyStatusReply());
    };
}

} // namespace

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------
TEST_F(PollingCoordinatorTest, StartsOnContextCreation) {
    std::string a = create("10.0.0.1");

    EXPECT_TRUE(polling->isPollingForContext(a));
    EXPECT_EQ(polling->stateForContext(a), PollingState::ActivePolling);

    // First fetch is immediate
    sched.runPending();
    EXPECT_EQ(polls("10.0.0.1"), 1);
    ASSERT_EQ(data.size(), 1u);
    EXPECT_EQ(data[0].context_id, a);
    EXPECT_FALSE(data[0].cached);
    ASSERT_TRUE(polling->getPollingDataForContext(a).has_value());
}

TEST_F(PollingCoordinatorTest, NoAutoStartWhenDisabled) {
    cfg.auto_start = false;
    makePolling();

    std::string a = create("10.0.0.1");
    EXPECT_FALSE(polling->isPollingForContext(a));
    EXPECT_EQ(polling->stateForContext(a), PollingState::Stopped);

    ASSERT_TRUE(polling->startPollingForContext(a).is_ok());
    EXPECT_TRUE(polling->startPollingForContext(a).is_ok());  // already running
    sched.runPending();
    EXPECT_EQ(polls("10.0.0.1"), 1);
}

TEST_F(PollingCoordinatorTest, StartUnknownContextFails) {
    auto r = polling->startPollingForContext("context-404-0");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::NotFound);
}

TEST_F(PollingCoordinatorTest, StopsWhenContextRemoved) {
    std::string a = create("10.0.0.1");
    sched.runPending();
    auto channel = factory.legacy("10.0.0.1");

    ASSERT_TRUE(contexts.removeContext(a).is_ok());

    EXPECT_FALSE(polling->isPollingForContext(a));
    ASSERT_EQ(stopped.size(), 1u);
    EXPECT_EQ(stopped[0], a);
    sched.advance(milliseconds(60000));
    EXPECT_EQ(channel->count("status"), 1);
    EXPECT_EQ(sched.timerCount(), 0u);
}

TEST_F(PollingCoordinatorTest, StopAllPolling) {
    create("10.0.0.1");
    create("10.0.0.2");
    EXPECT_EQ(polling->activePollingContexts().size(), 2u);

    polling->stopAllPolling();
    EXPECT_TRUE(polling->activePollingContexts().empty());
    EXPECT_EQ(stopped.size(), 2u);
    sched.advance(milliseconds(10000));
    EXPECT_EQ(polls("10.0.0.1"), 0);
    EXPECT_EQ(polls("10.0.0.2"), 0);
}

// ---------------------------------------------------------------------------
// Cadence
// ---------------------------------------------------------------------------
TEST_F(PollingCoordinatorTest, ActiveAndInactiveIntervals) {
    std::string a = create("10.0.0.1");
    std::string b = create("10.0.0.2");
    EXPECT_EQ(polling->stateForContext(a), PollingState::ActivePolling);
    EXPECT_EQ(polling->stateForContext(b), PollingState::InactivePolling);

    sched.advance(milliseconds(9000));
    EXPECT_EQ(polls("10.0.0.1"), 4);   // 0, 3000, 6000, 9000
    EXPECT_EQ(polls("10.0.0.2"), 1);   // 0

    sched.advance(milliseconds(21000));
    EXPECT_EQ(polls("10.0.0.2"), 2);   // 30000

    auto stats = polling->getPollingStatsForContext(a);
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->interval_ms, 3000);
    EXPECT_EQ(stats->successes, stats->ticks);
}

TEST_F(PollingCoordinatorTest, SwitchInvertsFrequencies) {
    std::string a = create("10.0.0.1");
    std::string b = create("10.0.0.2");
    sched.advance(milliseconds(10000));
    ASSERT_EQ(polls("10.0.0.1"), 4);
    ASSERT_EQ(polls("10.0.0.2"), 1);

    ASSERT_TRUE(contexts.switchContext(b).is_ok());
    EXPECT_EQ(polling->stateForContext(a), PollingState::InactivePolling);
    EXPECT_EQ(polling->stateForContext(b), PollingState::ActivePolling);

    // B was overdue for the short interval and polls right away
    sched.runPending();
    EXPECT_EQ(polls("10.0.0.2"), 2);

    sched.advance(milliseconds(20000));  // t = 30000
    EXPECT_EQ(polls("10.0.0.2"), 8);     // + 13000 .. 28000
    EXPECT_EQ(polls("10.0.0.1"), 4);     // next at 9000 + 30000

    sched.advance(milliseconds(10000));  // t = 40000
    EXPECT_EQ(polls("10.0.0.1"), 5);
    EXPECT_EQ(polls("10.0.0.2"), 12);
}

TEST_F(PollingCoordinatorTest, PromotionReplaysCachedData) {
    std::string a = create("10.0.0.1");
    std::string b = create("10.0.0.2");
    sched.runPending();
    EXPECT_EQ(cachedCount(b), 0u);

    ASSERT_TRUE(contexts.switchContext(b).is_ok());
    EXPECT_EQ(cachedCount(b), 1u);
    EXPECT_EQ(cachedCount(a), 0u);
}

TEST_F(PollingCoordinatorTest, NoReplayWhenDisabled) {
    cfg.emit_cached_on_promote = false;
    makePolling();
    create("10.0.0.1");
    std::string b = create("10.0.0.2");
    sched.runPending();

    ASSERT_TRUE(contexts.switchContext(b).is_ok());
    EXPECT_EQ(cachedCount(b), 0u);
}

TEST_F(PollingCoordinatorTest, SwitchDuringFetchKeepsSingleTick) {
    factory.legacy_responder = holdingResponder();
    create("10.0.0.1");
    std::string b = create("10.0.0.2");
    sched.runPending();
    auto ch_b = factory.legacy("10.0.0.2");
    ASSERT_EQ(ch_b->held.size(), 1u);

    // Promote B while its first fetch is still outstanding
    ASSERT_TRUE(contexts.switchContext(b).is_ok());
    sched.runPending();
    EXPECT_EQ(ch_b->count("status"), 1);

    sched.advance(milliseconds(1000));
    ASSERT_TRUE(ch_b->replyNext(Result<json>(legacyStatusReply())));
    // Next tick uses the active interval from the start of the last one
    sched.advance(milliseconds(1999));
    EXPECT_EQ(ch_b->count("status"), 1);
    sched.advance(milliseconds(1));
    EXPECT_EQ(ch_b->count("status"), 2);
}

// ---------------------------------------------------------------------------
// Per-context overrides
// ---------------------------------------------------------------------------
TEST_F(PollingCoordinatorTest, IntervalOverrideSurvivesSwitch) {
    std::string a = create("10.0.0.1");
    std::string b = create("10.0.0.2");
    sched.runPending();
    ASSERT_EQ(polls("10.0.0.1"), 1);

    PollingOverride slow;
    slow.interval_ms = 10000;
    ASSERT_TRUE(polling->updatePollingConfigForContext(a, slow).is_ok());
    EXPECT_EQ(polling->getPollingStatsForContext(a)->interval_ms, 10000);
    sched.advance(milliseconds(9999));
    EXPECT_EQ(polls("10.0.0.1"), 1);
    sched.advance(milliseconds(1));
    EXPECT_EQ(polls("10.0.0.1"), 2);

    // Demotion keeps the pinned interval
    ASSERT_TRUE(contexts.switchContext(b).is_ok());
    EXPECT_EQ(polling->stateForContext(a), PollingState::InactivePolling);
    EXPECT_EQ(polling->getPollingStatsForContext(a)->interval_ms, 10000);
    sched.advance(milliseconds(10000));
    EXPECT_EQ(polls("10.0.0.1"), 3);

    // Clearing it restores the inactive cadence from the last tick
    ASSERT_TRUE(polling->updatePollingConfigForContext(a, PollingOverride{}).is_ok());
    EXPECT_EQ(polling->getPollingStatsForContext(a)->interval_ms, 30000);
    sched.advance(milliseconds(29999));
    EXPECT_EQ(polls("10.0.0.1"), 3);
    sched.advance(milliseconds(1));
    EXPECT_EQ(polls("10.0.0.1"), 4);

    auto all = polling->getAllPollingStats();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all.at(b).state, PollingState::ActivePolling);
    EXPECT_EQ(all.at(a).ticks, 4u);
}

TEST_F(PollingCoordinatorTest, RetryOverrideAndValidation) {
    int failures = -1;
    factory.legacy_responder = failingResponder(&failures);
    std::string a = create("10.0.0.1");

    PollingOverride once;
    once.max_retries = 0;
    ASSERT_TRUE(polling->updatePollingConfigForContext(a, once).is_ok());
    sched.runPending();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].attempts, 1);

    PollingOverride bad;
    bad.interval_ms = 0;
    EXPECT_EQ(polling->updatePollingConfigForContext(a, bad).error().kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(polling->updatePollingConfigForContext("context-404-0", once).error().kind,
              ErrorKind::NotFound);
}

// ---------------------------------------------------------------------------
// Failures
// ---------------------------------------------------------------------------
TEST_F(PollingCoordinatorTest, TransientFailureIsRetriedQuietly) {
    int failures = 2;
    factory.legacy_responder = failingResponder(&failures);
    std::string a = create("10.0.0.1");

    sched.runPending();                      // attempt 1 fails
    sched.advance(milliseconds(1000));       // retry 1 fails
    EXPECT_TRUE(data.empty());
    sched.advance(milliseconds(2000));       // retry 2 succeeds

    EXPECT_TRUE(errors.empty());
    EXPECT_FALSE(data.empty());
    auto stats = polling->getPollingStatsForContext(a);
    EXPECT_EQ(stats->retries, 2u);
    EXPECT_EQ(stats->failures, 0u);
    EXPECT_EQ(stats->consecutive_failures, 0);
    EXPECT_EQ(contexts.getContext(a)->connection_state, ConnectionState::Connected);
}

TEST_F(PollingCoordinatorTest, ExhaustedRetriesReportErrorAndKeepPolling) {
    int failures = -1;  // fail forever
    factory.legacy_responder = failingResponder(&failures);
    std::string a = create("10.0.0.1");

    sched.runPending();
    sched.advance(milliseconds(5999));
    EXPECT_TRUE(errors.empty());
    sched.advance(milliseconds(1));          // retries at 1000, 3000, 6000

    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].context_id, a);
    EXPECT_EQ(errors[0].attempts, 4);
    EXPECT_NE(errors[0].error.find("ConnectionError"), std::string::npos);
    EXPECT_EQ(contexts.getContext(a)->connection_state, ConnectionState::Disconnected);
    EXPECT_TRUE(polling->isPollingForContext(a));

    // Printer comes back: the loop recovers on its own
    factory.legacy("10.0.0.1")->responder = legacyResponder();
    sched.advance(milliseconds(1000));
    EXPECT_FALSE(data.empty());
    EXPECT_EQ(contexts.getContext(a)->connection_state, ConnectionState::Connected);
    EXPECT_EQ(polling->getPollingStatsForContext(a)->consecutive_failures, 0);
}

TEST_F(PollingCoordinatorTest, RetryDelaySaturatesForLargeSettings) {
    cfg.retry_delay_ms = 1 << 30;
    makePolling();
    int failures = -1;
    factory.legacy_responder = failingResponder(&failures);
    create("10.0.0.1");

    sched.runPending();
    EXPECT_EQ(polls("10.0.0.1"), 1);
    sched.advance(milliseconds((1 << 30) - 1));
    EXPECT_EQ(polls("10.0.0.1"), 1);
    sched.advance(milliseconds(1));
    EXPECT_EQ(polls("10.0.0.1"), 2);

    // 2 * 2^30 clamps to INT_MAX
    const int64_t saturated = std::numeric_limits<int>::max();
    sched.advance(milliseconds(saturated - 1));
    EXPECT_EQ(polls("10.0.0.1"), 2);
    sched.advance(milliseconds(1));
    EXPECT_EQ(polls("10.0.0.1"), 3);
    EXPECT_TRUE(errors.empty());
}

TEST_F(PollingCoordinatorTest, NoRetriesWhenDisabled) {
    cfg.max_retries = 0;
    makePolling();
    int failures = 1;
    factory.legacy_responder = failingResponder(&failures);
    create("10.0.0.1");

    sched.runPending();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].attempts, 1);
}

// ---------------------------------------------------------------------------
// Pause / resume
// ---------------------------------------------------------------------------
TEST_F(PollingCoordinatorTest, PausedLoopSkipsFetches) {
    std::string a = create("10.0.0.1");
    sched.runPending();
    ASSERT_EQ(polls("10.0.0.1"), 1);

    ASSERT_TRUE(polling->pausePolling(a).is_ok());
    EXPECT_TRUE(polling->getPollingStatsForContext(a)->paused);
    sched.advance(milliseconds(9000));
    EXPECT_EQ(polls("10.0.0.1"), 1);
    EXPECT_TRUE(polling->isPollingForContext(a));

    ASSERT_TRUE(polling->resumePolling(a).is_ok());
    sched.advance(milliseconds(3000));
    EXPECT_EQ(polls("10.0.0.1"), 2);

    EXPECT_EQ(polling->pausePolling("context-404-0").error().kind, ErrorKind::NotFound);
}

TEST_F(PollingCoordinatorTest, PauseAllAndResumeAll) {
    create("10.0.0.1");
    create("10.0.0.2");
    sched.runPending();

    polling->pauseAll();
    sched.advance(milliseconds(60000));
    EXPECT_EQ(polls("10.0.0.1"), 1);
    EXPECT_EQ(polls("10.0.0.2"), 1);

    polling->resumeAll();
    sched.advance(milliseconds(30000));
    EXPECT_GT(polls("10.0.0.1"), 1);
    EXPECT_GT(polls("10.0.0.2"), 1);
}

// ---------------------------------------------------------------------------
// Stale completions
// ---------------------------------------------------------------------------
TEST_F(PollingCoordinatorTest, ReplyAfterRestartIsIgnored) {
    factory.legacy_responder = holdingResponder();
    std::string a = create("10.0.0.1");
    sched.runPending();
    auto channel = factory.legacy("10.0.0.1");
    ASSERT_EQ(channel->held.size(), 1u);

    polling->stopPollingForContext(a);
    ASSERT_TRUE(polling->startPollingForContext(a).is_ok());
    sched.runPending();
    ASSERT_EQ(channel->held.size(), 2u);

    // Reply to the first (stale) fetch
    ASSERT_TRUE(channel->replyNext(Result<json>(legacyStatusReply())));
    EXPECT_TRUE(data.empty());

    ASSERT_TRUE(channel->replyNext(Result<json>(legacyStatusReply())));
    EXPECT_EQ(data.size(), 1u);
}

TEST_F(PollingCoordinatorTest, ReplyAfterDestructionIsIgnored) {
    factory.legacy_responder = holdingResponder();
    create("10.0.0.1");
    sched.runPending();
    auto channel = factory.legacy("10.0.0.1");

    polling.reset();
    EXPECT_TRUE(channel->replyNext(Result<json>(legacyStatusReply())));
    EXPECT_TRUE(data.empty());
}
