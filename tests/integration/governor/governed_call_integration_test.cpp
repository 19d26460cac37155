/// @file governed_call_integration_test.cpp
/// @brief Collaborator-style use of the governor: tickets and callOrFallback.

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <new>
#include <optional>
#include <string>
#include <type_traits>

#include "sgov/foundation/clock.hpp"
#include "sgov/foundation/governor_error.hpp"
#include "sgov/foundation/logger_adapter.hpp"
#include "sgov/governor/admission_ticket.hpp"
#include "sgov/governor/source_config.hpp"
#include "sgov/governor/source_governor.hpp"

#include "../../support/mock_logger.hpp"

using namespace sgov::governor;
using namespace sgov::foundation;
using namespace std::chrono_literals;
using kcenon::common::interfaces::GlobalLoggerRegistry;
using sgov::test::MockLogger;

namespace {

GovernorResult<double> okScore(double v) {
    return GovernorResult<double>::ok(v);
}

GovernorResult<double> failedScore(int status) {
    return GovernorResult<double>::err(
        GovernorError(ErrorCode::UpstreamFailure, "upstream error", status));
}

/// Fails to allocate for the abandon warning only.
class AllocFailingLogger : public MockLogger {
public:
    using MockLogger::log;

    kcenon::common::VoidResult log(log_level level, const std::string& message) override {
        if (message.find("admission dropped") != std::string::npos) {
            throw std::bad_alloc();
        }
        return MockLogger::log(level, message);
    }
};

} // namespace

static_assert(std::is_nothrow_destructible_v<AdmissionTicket>);
static_assert(std::is_nothrow_move_assignable_v<AdmissionTicket>);

class GovernedCallTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& registry = GlobalLoggerRegistry::instance();
        registry.clear();
        mockLogger_ = std::make_shared<MockLogger>();
        registry.set_default_logger(mockLogger_);
    }

    void TearDown() override {
        GlobalLoggerRegistry::instance().clear();
    }

    SourceSnapshot snap(std::string_view source) {
        auto result = governor_.snapshot(source);
        EXPECT_TRUE(result.hasValue());
        return result.hasValue() ? result.value() : SourceSnapshot{};
    }

    std::shared_ptr<ManualClock> clock_ = std::make_shared<ManualClock>();
    SourceGovernor governor_{defaultSourceTable(), {}, clock_};
    std::shared_ptr<MockLogger> mockLogger_;
};

// ===========================================================================
// AdmissionTicket
// ===========================================================================

TEST_F(GovernedCallTest, TicketSucceedReleasesSlot) {
    auto ticket = governor_.admit("helius");
    ASSERT_TRUE(ticket.hasValue());
    EXPECT_TRUE(ticket.value().pending());
    EXPECT_EQ(ticket.value().source(), "helius");
    EXPECT_EQ(snap("helius").inFlight, 1u);

    ticket.value().succeed();
    EXPECT_FALSE(ticket.value().pending());
    EXPECT_EQ(snap("helius").inFlight, 0u);

    // A second report is ignored.
    ticket.value().fail(500);
    EXPECT_EQ(snap("helius").consecutiveFailures, 0u);
}

TEST_F(GovernedCallTest, TicketFailCarriesStatus) {
    auto ticket = governor_.admit("goplus");
    ASSERT_TRUE(ticket.hasValue());
    ticket.value().fail(429);

    auto s = snap("goplus");
    EXPECT_EQ(s.inFlight, 0u);
    EXPECT_EQ(s.consecutiveFailures, 1u);
    EXPECT_EQ(s.backoffRemaining, 3000ms);
}

TEST_F(GovernedCallTest, DroppedTicketCountsAsFailure) {
    {
        auto ticket = governor_.admit("jupiter");
        ASSERT_TRUE(ticket.hasValue());
    }

    auto s = snap("jupiter");
    EXPECT_EQ(s.inFlight, 0u);
    EXPECT_EQ(s.consecutiveFailures, 1u);
    EXPECT_EQ(mockLogger_->countContaining("admission dropped without a report"), 1u);
}

TEST_F(GovernedCallTest, DroppedTicketReleasesSlotWhenWarningCannotBeLogged) {
    auto failing = std::make_shared<AllocFailingLogger>();
    GlobalLoggerRegistry::instance().set_default_logger(failing);

    {
        auto ticket = governor_.admit("jupiter");
        ASSERT_TRUE(ticket.hasValue());
    }

    auto s = snap("jupiter");
    EXPECT_EQ(s.inFlight, 0u);
    EXPECT_EQ(s.consecutiveFailures, 1u);
    EXPECT_EQ(failing->countContaining("Upstream failure reported"), 1u);
    EXPECT_EQ(failing->countContaining("admission dropped"), 0u);
}

TEST_F(GovernedCallTest, MovedTicketReportsOnce) {
    auto admitted = governor_.admit("reddit");
    ASSERT_TRUE(admitted.hasValue());

    AdmissionTicket moved = std::move(admitted).value();
    EXPECT_TRUE(moved.pending());
    moved.succeed();

    auto s = snap("reddit");
    EXPECT_EQ(s.inFlight, 0u);
    EXPECT_EQ(s.consecutiveFailures, 0u);
    EXPECT_EQ(mockLogger_->countContaining("admission dropped"), 0u);
}

TEST_F(GovernedCallTest, MoveAssignmentAbandonsOverwrittenTicket) {
    auto first = governor_.admit("telegram");
    auto second = governor_.admit("telegram");
    ASSERT_TRUE(first.hasValue());
    ASSERT_TRUE(second.hasValue());
    EXPECT_EQ(snap("telegram").inFlight, 2u);

    first.value() = std::move(second).value();
    EXPECT_EQ(snap("telegram").inFlight, 1u);
    EXPECT_EQ(snap("telegram").consecutiveFailures, 1u);

    first.value().succeed();
    EXPECT_EQ(snap("telegram").inFlight, 0u);
}

TEST_F(GovernedCallTest, AdmitWhileOpenFailsFast) {
    for (int i = 0; i < 5; ++i) {
        auto ticket = governor_.admit("pumpfun");
        ASSERT_TRUE(ticket.hasValue());
        ticket.value().fail(503);
        clock_->advance(5min);
    }

    auto ticket = governor_.admit("pumpfun");
    ASSERT_TRUE(ticket.hasError());
    EXPECT_EQ(ticket.error().code(), ErrorCode::SourceUnavailable);
}

TEST_F(GovernedCallTest, UnconfiguredTicketIsHarmless) {
    auto ticket = governor_.admit("twitter");
    ASSERT_TRUE(ticket.hasValue());
    ticket.value().fail(429);
    EXPECT_FALSE(governor_.isUnavailable("twitter"));
}

// ===========================================================================
// callOrFallback
// ===========================================================================

TEST_F(GovernedCallTest, CallOrFallbackReturnsValueOnSuccess) {
    double score = callOrFallback(governor_, "dexscreener", [] { return okScore(0.8); }, 0.5);
    EXPECT_DOUBLE_EQ(score, 0.8);

    auto s = snap("dexscreener");
    EXPECT_EQ(s.inFlight, 0u);
    EXPECT_EQ(s.totalAdmitted, 1u);
}

TEST_F(GovernedCallTest, CallOrFallbackFoldsFailureAndUsesStatus) {
    double score = callOrFallback(governor_, "goplus", [] { return failedScore(429); }, 0.5);
    EXPECT_DOUBLE_EQ(score, 0.5);

    auto s = snap("goplus");
    EXPECT_EQ(s.consecutiveFailures, 1u);
    EXPECT_EQ(s.backoffRemaining, 3000ms);
}

TEST_F(GovernedCallTest, CallOrFallbackWithoutStatusUsesPlainBackoff) {
    double score = callOrFallback(governor_, "goplus", [] {
        return GovernorResult<double>::err(GovernorError(ErrorCode::UpstreamFailure));
    }, 0.5);
    EXPECT_DOUBLE_EQ(score, 0.5);
    EXPECT_EQ(snap("goplus").backoffRemaining, 1000ms);
}

TEST_F(GovernedCallTest, OpenBreakerSkipsTheCall) {
    for (int i = 0; i < 5; ++i) {
        (void)callOrFallback(governor_, "googletrends", [] { return failedScore(500); }, 0.0);
        clock_->advance(5min);
    }
    ASSERT_TRUE(governor_.isUnavailable("googletrends"));

    int invoked = 0;
    double score = callOrFallback(governor_, "googletrends", [&] {
        ++invoked;
        return okScore(1.0);
    }, 0.25);
    EXPECT_DOUBLE_EQ(score, 0.25);
    EXPECT_EQ(invoked, 0);

    // Other sources keep working.
    EXPECT_DOUBLE_EQ(
        callOrFallback(governor_, "reddit", [] { return okScore(0.9); }, 0.0), 0.9);
}

TEST_F(GovernedCallTest, CallOrFallbackSupportsNonTrivialValues) {
    auto tokens = callOrFallback(governor_, "jupitertrending", [] {
        return GovernorResult<std::string>::ok("SOL,BONK");
    }, std::string());
    EXPECT_EQ(tokens, "SOL,BONK");
}
