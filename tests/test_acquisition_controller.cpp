#include <gtest/gtest.h>
#include <algorithm>
#include "steward/acquisition_controller.h"
#include "steward/error_types.h"
#include "steward/model_registry.h"
#include "test_fakes.h"

using namespace steward;
using steward::testing::FakeProvider;
using steward::testing::FakeTransport;
using steward::testing::PullScript;
using steward::testing::make_record;

namespace {

// Records requested sleeps instead of sleeping
struct RecordingSleep {
    std::vector<std::chrono::milliseconds> sleeps;

    SleepFunction function() {
        return [this](std::chrono::milliseconds duration, const CancellationToken&) {
            sleeps.push_back(duration);
        };
    }
};

PullScript failing_attempt(const std::string& reason) {
    PullScript script;
    script.records = {make_record("pulling abc", "sha256:abc", 50, 100)};
    script.result = TransportResult::error(reason);
    return script;
}

PullScript succeeding_attempt() {
    PullScript script;
    script.records = {
        make_record("pulling manifest", "", 0, 0, false),
        make_record("pulling abc", "sha256:abc", 10, 100),
        make_record("pulling abc", "sha256:abc", 100, 100),
        make_record("verifying sha256 digest", "", 0, 0, false),
        make_record("success", "", 0, 0, false)
    };
    script.result = TransportResult::completed(0);
    return script;
}

} // namespace

// Two failures then success: two cleanups and backoffs of 2s then 4s
TEST(AcquisitionControllerTest, RetriesWithExponentialBackoff) {
    FakeTransport transport;
    transport.scripts = {failing_attempt("connection reset"),
                         failing_attempt("connection reset"),
                         succeeding_attempt()};
    FakeProvider provider;
    RecordingSleep sleep;

    AcquisitionController controller(transport, provider, nullptr, AcquisitionOptions(), sleep.function());

    std::vector<AcquisitionProgress> updates;
    CancellationToken token;
    controller.acquire("llama3", [&](const AcquisitionProgress& p) { updates.push_back(p); }, token);

    EXPECT_EQ(transport.calls, 3);
    ASSERT_EQ(provider.deleted.size(), 2u);
    EXPECT_EQ(provider.deleted[0], "llama3");

    ASSERT_EQ(sleep.sleeps.size(), 2u);
    EXPECT_EQ(sleep.sleeps[0], std::chrono::milliseconds(2000));
    EXPECT_EQ(sleep.sleeps[1], std::chrono::milliseconds(4000));

    ASSERT_FALSE(updates.empty());
    EXPECT_EQ(updates.back().percent, 100);
    EXPECT_EQ(updates.back().attempt, 3);
    EXPECT_EQ(updates.back().max_attempts, 3);
    EXPECT_FALSE(controller.is_acquiring("llama3"));
}

// Retry notices announce the next attempt
TEST(AcquisitionControllerTest, EmitsRetryNotice) {
    FakeTransport transport;
    transport.scripts = {failing_attempt("timeout"), succeeding_attempt()};
    FakeProvider provider;
    RecordingSleep sleep;
    AcquisitionController controller(transport, provider, nullptr, AcquisitionOptions(), sleep.function());

    std::vector<std::string> statuses;
    CancellationToken token;
    controller.acquire("llama3", [&](const AcquisitionProgress& p) { statuses.push_back(p.status); }, token);

    EXPECT_NE(std::find(statuses.begin(), statuses.end(),
                        "Download failed/stalled. Retrying (Attempt 2)..."),
              statuses.end());
}

// Progress restarts from zero on a retried attempt
TEST(AcquisitionControllerTest, ProgressResetsPerAttempt) {
    FakeTransport transport;
    transport.scripts = {failing_attempt("reset"), succeeding_attempt()};
    FakeProvider provider;
    RecordingSleep sleep;
    AcquisitionController controller(transport, provider, nullptr, AcquisitionOptions(), sleep.function());

    std::vector<AcquisitionProgress> updates;
    CancellationToken token;
    controller.acquire("llama3", [&](const AcquisitionProgress& p) { updates.push_back(p); }, token);

    // First attempt reached 50%; the first byte record of attempt 2 reports 10%
    bool seen_fifty = false;
    bool seen_ten_after = false;
    for (const auto& p : updates) {
        if (p.attempt == 1 && p.percent == 50) {
            seen_fifty = true;
        }
        if (p.attempt == 2 && p.layer_completed == 10) {
            seen_ten_after = seen_fifty && p.percent == 10;
        }
    }
    EXPECT_TRUE(seen_fifty);
    EXPECT_TRUE(seen_ten_after);
}

// Stalls are retried like transport errors
TEST(AcquisitionControllerTest, StallIsRetried) {
    FakeTransport transport;
    PullScript stalled;
    stalled.result = TransportResult::stalled(std::chrono::milliseconds(30000));
    transport.scripts = {stalled, succeeding_attempt()};
    FakeProvider provider;
    RecordingSleep sleep;

    AcquisitionOptions options;
    options.stall_timeout = std::chrono::milliseconds(1234);
    AcquisitionController controller(transport, provider, nullptr, options, sleep.function());

    CancellationToken token;
    controller.acquire("mistral", nullptr, token);

    EXPECT_EQ(transport.calls, 2);
    EXPECT_EQ(provider.deleted.size(), 1u);
    EXPECT_EQ(transport.stall_timeouts[0], std::chrono::milliseconds(1234));
}

// Cancelling mid-stream stops at once: no retry, no cleanup
TEST(AcquisitionControllerTest, CancelMidStreamDoesNotRetry) {
    FakeTransport transport;
    PullScript script = succeeding_attempt();
    script.hook_after = 1;
    script.hook = [](CancellationToken& token) { token.cancel(); };
    transport.scripts = {script, succeeding_attempt()};
    FakeProvider provider;
    RecordingSleep sleep;
    AcquisitionController controller(transport, provider, nullptr, AcquisitionOptions(), sleep.function());

    CancellationToken token;
    EXPECT_THROW(controller.acquire("llama3", nullptr, token), DownloadCancelledException);

    EXPECT_EQ(transport.calls, 1);
    EXPECT_TRUE(provider.deleted.empty());
    EXPECT_TRUE(sleep.sleeps.empty());
    EXPECT_FALSE(controller.is_acquiring("llama3"));
}

// A cancel during backoff ends the acquisition without another attempt
TEST(AcquisitionControllerTest, CancelDuringBackoff) {
    FakeTransport transport;
    transport.scripts = {failing_attempt("reset"), succeeding_attempt()};
    FakeProvider provider;

    CancellationToken token;
    SleepFunction sleep = [&token](std::chrono::milliseconds, const CancellationToken&) {
        token.cancel();
    };
    AcquisitionController controller(transport, provider, nullptr, AcquisitionOptions(), sleep);

    EXPECT_THROW(controller.acquire("llama3", nullptr, token), DownloadCancelledException);
    EXPECT_EQ(transport.calls, 1);
}

// After max attempts the last reason is reported
TEST(AcquisitionControllerTest, RetriesExhausted) {
    FakeTransport transport;
    transport.scripts = {failing_attempt("first"), failing_attempt("second"), failing_attempt("third")};
    FakeProvider provider;
    RecordingSleep sleep;
    AcquisitionController controller(transport, provider, nullptr, AcquisitionOptions(), sleep.function());

    CancellationToken token;
    try {
        controller.acquire("phi3", nullptr, token);
        FAIL() << "expected RetriesExhaustedException";
    } catch (const RetriesExhaustedException& e) {
        EXPECT_EQ(e.attempts(), 3);
        EXPECT_EQ(e.last_reason(), "third");
        EXPECT_NE(std::string(e.what()).find("after 3 attempts"), std::string::npos);
    }

    EXPECT_EQ(transport.calls, 3);
    // No cleanup or sleep after the final attempt
    EXPECT_EQ(provider.deleted.size(), 2u);
    EXPECT_EQ(sleep.sleeps.size(), 2u);
}

// Cleanup failures are logged and do not stop the retry loop
TEST(AcquisitionControllerTest, CleanupFailureIsIgnored) {
    FakeTransport transport;
    transport.scripts = {failing_attempt("reset"), succeeding_attempt()};
    FakeProvider provider;
    provider.delete_throws = true;
    RecordingSleep sleep;
    AcquisitionController controller(transport, provider, nullptr, AcquisitionOptions(), sleep.function());

    CancellationToken token;
    EXPECT_NO_THROW(controller.acquire("llama3", nullptr, token));
    EXPECT_EQ(transport.calls, 2);
}

// A second acquire for the same model is rejected while the first runs
TEST(AcquisitionControllerTest, RejectsDuplicateAcquire) {
    FakeTransport transport;
    FakeProvider provider;
    RecordingSleep sleep;
    AcquisitionController controller(transport, provider, nullptr, AcquisitionOptions(), sleep.function());

    bool duplicate_rejected = false;
    PullScript script = succeeding_attempt();
    script.hook_after = 0;
    script.hook = [&](CancellationToken&) {
        EXPECT_TRUE(controller.is_acquiring("llama3:latest"));
        CancellationToken other;
        try {
            controller.acquire("llama3:latest", nullptr, other);
        } catch (const DownloadInProgressException&) {
            duplicate_rejected = true;
        }
    };
    transport.scripts = {script};

    CancellationToken token;
    controller.acquire("llama3", nullptr, token);

    EXPECT_TRUE(duplicate_rejected);
    EXPECT_EQ(transport.calls, 1);
}

// Different models download side by side
TEST(AcquisitionControllerTest, DifferentModelsOverlap) {
    FakeTransport transport;
    FakeProvider provider;
    ModelRegistry registry(&provider);
    RecordingSleep sleep;
    AcquisitionController controller(transport, provider, &registry, AcquisitionOptions(), sleep.function());

    bool inner_done = false;
    PullScript outer = succeeding_attempt();
    outer.hook_after = 1;
    outer.hook = [&](CancellationToken&) {
        EXPECT_TRUE(controller.is_acquiring("a"));
        EXPECT_FALSE(controller.is_acquiring("b"));
        CancellationToken other;
        controller.acquire("b", nullptr, other);
        inner_done = true;
        EXPECT_TRUE(controller.is_acquiring("a"));
        EXPECT_FALSE(controller.is_acquiring("b"));
    };
    transport.scripts = {outer, succeeding_attempt()};

    CancellationToken token;
    controller.acquire("a", nullptr, token);

    EXPECT_TRUE(inner_done);
    EXPECT_EQ(transport.calls, 2);
    EXPECT_FALSE(controller.is_acquiring("a"));
    EXPECT_TRUE(registry.is_installed("a"));
    EXPECT_TRUE(registry.is_installed("b"));
}

// Success is reported to the registry
TEST(AcquisitionControllerTest, MarksRegistryInstalled) {
    FakeTransport transport;
    transport.scripts = {succeeding_attempt()};
    FakeProvider provider;
    ModelRegistry registry(&provider);
    RecordingSleep sleep;
    AcquisitionController controller(transport, provider, &registry, AcquisitionOptions(), sleep.function());

    EXPECT_FALSE(registry.is_installed("phi3"));
    CancellationToken token;
    controller.acquire("phi3", nullptr, token);
    EXPECT_TRUE(registry.is_installed("phi3"));
}

TEST(RetryPolicyTest, BackoffDoubles) {
    RetryPolicy policy(5, std::chrono::seconds(1));
    EXPECT_EQ(policy.backoff_after(1), std::chrono::milliseconds(2000));
    EXPECT_EQ(policy.backoff_after(2), std::chrono::milliseconds(4000));
    EXPECT_EQ(policy.backoff_after(3), std::chrono::milliseconds(8000));

    EXPECT_TRUE(policy.should_retry(TransportResult::error("x"), 4));
    EXPECT_FALSE(policy.should_retry(TransportResult::error("x"), 5));
    EXPECT_FALSE(policy.should_retry(TransportResult::cancelled(), 1));
}

// Large attempt numbers stay at the cap instead of overflowing
TEST(RetryPolicyTest, BackoffIsCapped) {
    RetryPolicy policy(1000, std::chrono::seconds(1));
    EXPECT_EQ(policy.backoff_after(5), std::chrono::milliseconds(32000));
    EXPECT_EQ(policy.backoff_after(6), RetryPolicy::MAX_BACKOFF);
    EXPECT_EQ(policy.backoff_after(54), RetryPolicy::MAX_BACKOFF);
    EXPECT_EQ(policy.backoff_after(64), RetryPolicy::MAX_BACKOFF);
    EXPECT_EQ(policy.backoff_after(1000), RetryPolicy::MAX_BACKOFF);

    std::chrono::milliseconds previous(0);
    for (int attempt = 0; attempt < 200; ++attempt) {
        auto backoff = policy.backoff_after(attempt);
        EXPECT_GE(backoff, previous) << "attempt " << attempt;
        EXPECT_LE(backoff, RetryPolicy::MAX_BACKOFF) << "attempt " << attempt;
        previous = backoff;
    }

    // A short unit reaches the exponent clamp before the cap
    RetryPolicy fast(1000, std::chrono::milliseconds(10));
    EXPECT_EQ(fast.backoff_after(6), std::chrono::milliseconds(640));
    EXPECT_EQ(fast.backoff_after(500), std::chrono::milliseconds(640));
}
