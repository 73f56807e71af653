#include <graph_client/pending_requests.hpp>
#include <gtest/gtest.h>

using graph_client::PendingRequests;
using graph_client::TransportResponse;

TEST(PendingRequests, TakeReturnsCompletionOnce) {
    PendingRequests pending;
    int delivered = 0;
    const auto id = pending.add([&](TransportResponse) { ++delivered; });

    auto done = pending.take(id);
    ASSERT_TRUE(done);
    done(TransportResponse{});
    EXPECT_EQ(delivered, 1);
    EXPECT_FALSE(pending.take(id));
    EXPECT_EQ(pending.size(), 0u);
}

TEST(PendingRequests, CancelRaisesAbortFlagAndDropsCompletion) {
    PendingRequests pending;
    bool abort_flag = false;
    int delivered = 0;
    const auto id = pending.add([&](TransportResponse) { ++delivered; });
    pending.set_abort(id, [&] { abort_flag = true; });

    EXPECT_TRUE(pending.cancel(id));
    EXPECT_TRUE(abort_flag);

    // The worker reports back after the abort; nothing reaches the caller.
    EXPECT_FALSE(pending.take(id));
    EXPECT_EQ(delivered, 0);
}

TEST(PendingRequests, CancelAfterCompletionDoesNotAbort) {
    PendingRequests pending;
    bool abort_flag = false;
    const auto id = pending.add([](TransportResponse) {});
    pending.set_abort(id, [&] { abort_flag = true; });

    ASSERT_TRUE(pending.take(id));
    EXPECT_FALSE(pending.cancel(id));
    EXPECT_FALSE(abort_flag);
}

TEST(PendingRequests, CancelOnlyTouchesTheNamedRequest) {
    PendingRequests pending;
    bool first_aborted = false;
    bool second_aborted = false;
    const auto first = pending.add([](TransportResponse) {});
    const auto second = pending.add([](TransportResponse) {});
    EXPECT_NE(first, second);
    pending.set_abort(first, [&] { first_aborted = true; });
    pending.set_abort(second, [&] { second_aborted = true; });

    pending.cancel(first);
    EXPECT_TRUE(first_aborted);
    EXPECT_FALSE(second_aborted);
    EXPECT_TRUE(pending.take(second));
}

TEST(PendingRequests, ClearAbortsEverythingStillQueued) {
    PendingRequests pending;
    int aborted = 0;
    for (int i = 0; i < 3; ++i) {
        const auto id = pending.add([](TransportResponse) {});
        pending.set_abort(id, [&] { ++aborted; });
    }
    pending.clear();
    EXPECT_EQ(aborted, 3);
    EXPECT_EQ(pending.size(), 0u);
}
