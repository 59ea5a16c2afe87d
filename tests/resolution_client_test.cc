// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>

#include <chrono>
#include <limits>
#include <optional>
#include <stop_token>
#include <vector>

#include "src/client/local_transport.hpp"
#include "src/client/resolution_client.hpp"
#include "tests/common/coefficient_fixtures.hpp"

using namespace sash;
using namespace std::chrono_literals;

namespace {

/// Transport that holds every call until the test answers it
class ScriptedTransport final : public Transport {
public:
    struct Call {
        ResolutionRequest request;
        std::stop_token token;
        TransportCompletion completion;
    };

    void send(const ResolutionRequest& request,
              std::stop_token token,
              TransportCompletion completion) override {
        calls.push_back(Call{request, token, std::move(completion)});
    }

    /// Answer call `index` unless its caller stopped it
    void answer(size_t index, TransportOutcome outcome) {
        Call& call = calls.at(index);
        if (call.token.stop_requested()) return;
        call.completion(std::move(outcome));
    }

    /// Answer while ignoring the stop token, as a late network reply would
    void answer_late(size_t index, TransportOutcome outcome) {
        calls.at(index).completion(std::move(outcome));
    }

    std::vector<Call> calls;
};

ResolutionResult result_with(double coefficient) {
    ResolutionResult result;
    result.coefficient = coefficient;
    return result;
}

ResolutionRequest request(double width, double height = 1.0) {
    return ResolutionRequest{"uni1_zebra", "E", width, height};
}

struct Recorder {
    std::vector<double> successes;
    std::vector<ClientError> errors;

    SuccessCallback on_success() {
        return [this](const ResolutionResult& r) { successes.push_back(r.coefficient); };
    }
    ErrorCallback on_error() {
        return [this](const ClientError& e) { errors.push_back(e); };
    }
};

}  // namespace

class ResolutionClientTest : public ::testing::Test {
protected:
    ManualScheduler scheduler_;
    ScriptedTransport transport_;
    ResolutionClient client_{scheduler_, transport_};
    Recorder recorder_;
};

// ===========================================================================
// Debounce and delivery
// ===========================================================================

TEST_F(ResolutionClientTest, WaitsForDebounceWindow) {
    client_.request_resolution(1, request(1.5), recorder_.on_success(), recorder_.on_error());
    EXPECT_TRUE(client_.is_pending(1));

    scheduler_.advance(499ms);
    EXPECT_TRUE(transport_.calls.empty());

    scheduler_.advance(1ms);
    ASSERT_EQ(transport_.calls.size(), 1u);
    EXPECT_EQ(transport_.calls[0].request, request(1.5));
    EXPECT_TRUE(client_.is_pending(1));

    transport_.answer(0, result_with(20.0));
    EXPECT_EQ(recorder_.successes, (std::vector<double>{20.0}));
    EXPECT_FALSE(client_.is_pending(1));
    EXPECT_TRUE(client_.is_tracked(1));
}

TEST_F(ResolutionClientTest, PerCallDebounceOverride) {
    client_.request_resolution(1, request(1.5), recorder_.on_success(), {}, 0ms);
    scheduler_.run_ready();
    EXPECT_EQ(transport_.calls.size(), 1u);

    client_.request_resolution(2, request(2.5), recorder_.on_success(), {}, -10ms);
    scheduler_.run_ready();
    EXPECT_EQ(transport_.calls.size(), 2u);
}

TEST_F(ResolutionClientTest, ZeroCoefficientIsDelivered) {
    client_.request_resolution(1, request(1.5), recorder_.on_success());
    scheduler_.advance(500ms);
    transport_.answer(0, result_with(0.0));
    EXPECT_EQ(recorder_.successes, (std::vector<double>{0.0}));
}

// ===========================================================================
// Supersede
// ===========================================================================

TEST_F(ResolutionClientTest, SecondRequestInsideWindowWins) {
    client_.request_resolution(1, request(1.5), recorder_.on_success(), recorder_.on_error());
    scheduler_.advance(200ms);
    client_.request_resolution(1, request(2.5), recorder_.on_success(), recorder_.on_error());

    scheduler_.advance(2s);
    ASSERT_EQ(transport_.calls.size(), 1u);
    EXPECT_EQ(transport_.calls[0].request, request(2.5));

    transport_.answer(0, result_with(30.0));
    EXPECT_EQ(recorder_.successes, (std::vector<double>{30.0}));
    EXPECT_TRUE(recorder_.errors.empty());
}

TEST_F(ResolutionClientTest, NewerRequestAbortsInFlightCall) {
    client_.request_resolution(1, request(1.5), recorder_.on_success(), recorder_.on_error());
    scheduler_.advance(500ms);
    ASSERT_EQ(transport_.calls.size(), 1u);

    client_.request_resolution(1, request(2.5), recorder_.on_success(), recorder_.on_error());
    EXPECT_TRUE(transport_.calls[0].token.stop_requested());

    // A late reply to the first call must be discarded even if delivered
    transport_.answer_late(0, result_with(20.0));
    transport_.answer_late(0, std::unexpected(ClientError{ClientErrorCode::TransportFailure, "reset"}));
    EXPECT_TRUE(recorder_.successes.empty());
    EXPECT_TRUE(recorder_.errors.empty());

    scheduler_.advance(500ms);
    ASSERT_EQ(transport_.calls.size(), 2u);
    transport_.answer(1, result_with(30.0));
    EXPECT_EQ(recorder_.successes, (std::vector<double>{30.0}));
}

TEST_F(ResolutionClientTest, SashesAreIndependent) {
    client_.request_resolution(1, request(1.5), recorder_.on_success());
    client_.request_resolution(2, request(2.5), recorder_.on_success());
    scheduler_.advance(500ms);
    ASSERT_EQ(transport_.calls.size(), 2u);

    transport_.answer(1, result_with(30.0));
    transport_.answer(0, result_with(20.0));
    EXPECT_EQ(recorder_.successes, (std::vector<double>{30.0, 20.0}));
}

// ===========================================================================
// Cache
// ===========================================================================

TEST_F(ResolutionClientTest, CacheHitSkipsTransport) {
    client_.request_resolution(1, request(1.5), recorder_.on_success());
    scheduler_.advance(500ms);
    transport_.answer(0, result_with(20.0));
    EXPECT_EQ(client_.cache().size(), 1u);

    // Same fingerprint, other sash: synchronous, no timer, no call
    client_.request_resolution(2, request(1.5), recorder_.on_success());
    EXPECT_EQ(recorder_.successes, (std::vector<double>{20.0, 20.0}));
    EXPECT_EQ(scheduler_.pending(), 0u);
    scheduler_.advance(1s);
    EXPECT_EQ(transport_.calls.size(), 1u);
}

TEST_F(ResolutionClientTest, CacheHitSupersedesPendingWork) {
    client_.request_resolution(1, request(1.5), recorder_.on_success());
    scheduler_.advance(500ms);
    transport_.answer(0, result_with(20.0));

    client_.request_resolution(1, request(2.5), recorder_.on_success());
    scheduler_.advance(500ms);
    ASSERT_EQ(transport_.calls.size(), 2u);

    // User goes back to the cached size while the 2.5 call is in flight
    client_.request_resolution(1, request(1.5), recorder_.on_success());
    EXPECT_TRUE(transport_.calls[1].token.stop_requested());
    EXPECT_FALSE(client_.is_pending(1));

    transport_.answer_late(1, result_with(30.0));
    EXPECT_EQ(recorder_.successes, (std::vector<double>{20.0, 20.0}));
}

TEST_F(ResolutionClientTest, FailuresAreNotCached) {
    client_.request_resolution(1, request(1.5), recorder_.on_success(), recorder_.on_error());
    scheduler_.advance(500ms);
    transport_.answer(0, std::unexpected(ClientError{ClientErrorCode::TransportFailure, "timeout"}));

    ASSERT_EQ(recorder_.errors.size(), 1u);
    EXPECT_EQ(recorder_.errors[0].code, ClientErrorCode::TransportFailure);
    EXPECT_TRUE(client_.cache().empty());

    // Retrying is the caller's decision and goes back to the transport
    client_.request_resolution(1, request(1.5), recorder_.on_success(), recorder_.on_error());
    scheduler_.advance(500ms);
    EXPECT_EQ(transport_.calls.size(), 2u);
}

TEST_F(ResolutionClientTest, MissingErrorCallbackIsAllowed) {
    client_.request_resolution(1, request(1.5), recorder_.on_success());
    scheduler_.advance(500ms);
    transport_.answer(0, std::unexpected(ClientError{ClientErrorCode::UnknownSystem, ""}));
    EXPECT_TRUE(recorder_.successes.empty());
    EXPECT_FALSE(client_.is_pending(1));
}

// ===========================================================================
// Release and reset
// ===========================================================================

TEST_F(ResolutionClientTest, ReleaseDuringDebounce) {
    client_.request_resolution(1, request(1.5), recorder_.on_success());
    client_.release_sash(1);
    EXPECT_FALSE(client_.is_tracked(1));

    scheduler_.advance(1s);
    EXPECT_TRUE(transport_.calls.empty());
    EXPECT_TRUE(recorder_.successes.empty());
}

TEST_F(ResolutionClientTest, ReleaseDuringInFlightCall) {
    client_.request_resolution(1, request(1.5), recorder_.on_success(), recorder_.on_error());
    scheduler_.advance(500ms);
    ASSERT_EQ(transport_.calls.size(), 1u);

    client_.release_sash(1);
    EXPECT_TRUE(transport_.calls[0].token.stop_requested());

    transport_.answer_late(0, result_with(20.0));
    EXPECT_TRUE(recorder_.successes.empty());
    EXPECT_TRUE(recorder_.errors.empty());
    EXPECT_TRUE(client_.cache().empty());
}

TEST_F(ResolutionClientTest, ReleaseUnknownSashIsNoOp) {
    client_.release_sash(42);
    EXPECT_EQ(client_.tracked_sashes(), 0u);
}

TEST_F(ResolutionClientTest, CallbackMayReleaseItsOwnSash) {
    client_.request_resolution(
        1, request(1.5),
        [&](const ResolutionResult&) { client_.release_sash(1); });
    scheduler_.advance(500ms);
    transport_.answer(0, result_with(20.0));
    EXPECT_FALSE(client_.is_tracked(1));
}

TEST_F(ResolutionClientTest, ResetAllReleasesEverything) {
    client_.request_resolution(1, request(1.5), recorder_.on_success());
    scheduler_.advance(500ms);
    transport_.answer(0, result_with(20.0));

    client_.request_resolution(2, request(2.5), recorder_.on_success());
    client_.request_resolution(3, request(2.0), recorder_.on_success());
    scheduler_.advance(500ms);
    client_.request_resolution(4, request(1.2), recorder_.on_success());

    client_.reset_all();
    EXPECT_EQ(client_.tracked_sashes(), 0u);
    EXPECT_TRUE(client_.cache().empty());
    EXPECT_EQ(scheduler_.pending(), 0u);
    EXPECT_TRUE(transport_.calls[1].token.stop_requested());
    EXPECT_TRUE(transport_.calls[2].token.stop_requested());

    transport_.answer(1, result_with(30.0));
    scheduler_.advance(1s);
    EXPECT_EQ(recorder_.successes, (std::vector<double>{20.0}));

    // Cache was dropped: the same request goes back to the transport
    client_.request_resolution(1, request(1.5), recorder_.on_success());
    scheduler_.advance(500ms);
    EXPECT_EQ(transport_.calls.size(), 4u);
}

TEST_F(ResolutionClientTest, DestructionStopsOutstandingCalls) {
    ManualScheduler scheduler;
    ScriptedTransport transport;
    {
        ResolutionClient client(scheduler, transport);
        client.request_resolution(1, request(1.5), recorder_.on_success());
        client.request_resolution(2, request(2.5), recorder_.on_success());
        scheduler.advance(500ms);
        client.request_resolution(3, request(2.0), recorder_.on_success());
    }
    ASSERT_EQ(transport.calls.size(), 2u);
    EXPECT_TRUE(transport.calls[0].token.stop_requested());
    EXPECT_TRUE(transport.calls[1].token.stop_requested());
    EXPECT_EQ(scheduler.pending(), 0u);
}

TEST_F(ResolutionClientTest, InvalidDimensionsFailWithoutTransport) {
    client_.request_resolution(1, request(0.0), recorder_.on_success(), recorder_.on_error());
    client_.request_resolution(1, request(1.5, -2.0), recorder_.on_success(), recorder_.on_error());
    ASSERT_EQ(recorder_.errors.size(), 2u);
    EXPECT_EQ(recorder_.errors[0].code, ClientErrorCode::InvalidDimensions);
    EXPECT_EQ(recorder_.errors[1].code, ClientErrorCode::InvalidDimensions);

    scheduler_.advance(2s);
    EXPECT_TRUE(transport_.calls.empty());
    EXPECT_TRUE(recorder_.successes.empty());
    EXPECT_TRUE(client_.cache().empty());
}

TEST_F(ResolutionClientTest, InvalidDimensionsSupersedePendingWork) {
    client_.request_resolution(1, request(1.5), recorder_.on_success(), recorder_.on_error());
    scheduler_.advance(500ms);
    ASSERT_EQ(transport_.calls.size(), 1u);

    client_.request_resolution(1, request(std::numeric_limits<double>::infinity()),
                               recorder_.on_success(), recorder_.on_error());
    EXPECT_TRUE(transport_.calls[0].token.stop_requested());
    EXPECT_FALSE(client_.is_pending(1));

    transport_.answer_late(0, result_with(20.0));
    EXPECT_TRUE(recorder_.successes.empty());
    ASSERT_EQ(recorder_.errors.size(), 1u);
    EXPECT_EQ(recorder_.errors[0].code, ClientErrorCode::InvalidDimensions);
}

// ===========================================================================
// End to end over the loopback transport
// ===========================================================================

TEST(ResolutionClientLoopbackTest, ExactlyOneCallForRapidEdits) {
    auto resolver = Resolver::create(sash::testing::sample_table());
    ASSERT_TRUE(resolver.has_value());
    ResolutionService service(std::move(*resolver));

    ManualScheduler scheduler;
    LocalTransport transport(scheduler, service, {.latency = 120ms});
    ResolutionClient client(scheduler, transport, {.debounce = 300ms});

    std::vector<ResolutionResult> delivered;
    std::vector<ClientError> errors;
    auto on_success = [&](const ResolutionResult& r) { delivered.push_back(r); };
    auto on_error = [&](const ClientError& e) { errors.push_back(e); };

    // Typing "1", "1.", "1.5" into the width field
    client.request_resolution(7, request(1.0), on_success, on_error);
    scheduler.advance(100ms);
    client.request_resolution(7, request(1.2), on_success, on_error);
    scheduler.advance(100ms);
    client.request_resolution(7, request(1.5), on_success, on_error);
    scheduler.advance(1s);

    EXPECT_EQ(transport.calls_sent(), 1u);
    ASSERT_EQ(delivered.size(), 1u);
    EXPECT_DOUBLE_EQ(delivered[0].coefficient, 20.0);
    EXPECT_TRUE(errors.empty());

    // Edit while in flight: the first exchange never reaches the service
    client.request_resolution(7, request(2.5), on_success, on_error);
    scheduler.advance(350ms);
    client.request_resolution(7, request(5.0), on_success, on_error);
    scheduler.advance(1s);

    EXPECT_EQ(transport.calls_aborted(), 1u);
    EXPECT_EQ(transport.calls_served(), 2u);
    ASSERT_EQ(delivered.size(), 2u);
    EXPECT_DOUBLE_EQ(delivered[1].coefficient, 30.0);
    EXPECT_TRUE(delivered[1].warning.has_value());
}

TEST(ResolutionClientLoopbackTest, UnknownSystemReachesErrorCallback) {
    auto resolver = Resolver::create(sash::testing::sample_table());
    ASSERT_TRUE(resolver.has_value());
    ResolutionService service(std::move(*resolver));

    ManualScheduler scheduler;
    LocalTransport transport(scheduler, service);
    ResolutionClient client(scheduler, transport);

    std::optional<ClientError> error;
    client.request_resolution(
        1, {"no_such_system", "E", 1.0, 1.0},
        [](const ResolutionResult&) { FAIL() << "unexpected success"; },
        [&](const ClientError& e) { error = e; });
    scheduler.advance(500ms);

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->code, ClientErrorCode::UnknownSystem);
}

TEST(ResolutionClientLoopbackTest, NonFiniteOrZeroWidthIsInvalidDimensions) {
    auto resolver = Resolver::create(sash::testing::sample_table());
    ASSERT_TRUE(resolver.has_value());
    ResolutionService service(std::move(*resolver));

    ManualScheduler scheduler;
    LocalTransport transport(scheduler, service);
    ResolutionClient client(scheduler, transport);

    std::vector<ClientError> errors;
    const double widths[] = {
        std::numeric_limits<double>::quiet_NaN(),
        std::numeric_limits<double>::infinity(),
        -std::numeric_limits<double>::infinity(),
        0.0,
    };
    SashId id = 1;
    for (double width : widths) {
        client.request_resolution(
            id++, request(width),
            [](const ResolutionResult&) { FAIL() << "unexpected success"; },
            [&](const ClientError& e) { errors.push_back(e); });
    }
    scheduler.advance(1s);

    ASSERT_EQ(errors.size(), 4u);
    for (const auto& e : errors) {
        EXPECT_EQ(e.code, ClientErrorCode::InvalidDimensions) << e.message;
    }
    EXPECT_EQ(transport.calls_sent(), 0u);
}
