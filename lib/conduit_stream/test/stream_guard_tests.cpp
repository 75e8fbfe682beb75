#include <atomic>
#include <vector>

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <uv.h>

#include <conduit_stream/handoff_channel.h>
#include <conduit_stream/stream_guard.h>

#include "test_mocks.h"

TEST(StreamGuard, GuardIsInitiallyOpen)
{
    MockChannel channel;
    EXPECT_CALL (channel, close()).Times(0);

    conduit_stream::StreamGuard guard(&channel);
    ASSERT_FALSE (guard.isClosed());
}

TEST(StreamGuard, CloseClosesChannelOnce)
{
    MockChannel channel;
    EXPECT_CALL (channel, close())
        .Times(1)
        .WillOnce(::testing::Return(tempo_utils::Status{}));

    conduit_stream::StreamGuard guard(&channel);
    ASSERT_TRUE (guard.close());
    ASSERT_TRUE (guard.isClosed());
    ASSERT_FALSE (guard.close());
    ASSERT_FALSE (guard.close());
    ASSERT_TRUE (guard.isClosed());
}

struct CloseContext {
    conduit_stream::StreamGuard *guard;
    std::atomic<int> *effectiveCloses;
};

static void close_thread(void *ptr)
{
    auto *ctx = static_cast<CloseContext *>(ptr);
    if (ctx->guard->close()) {
        ctx->effectiveCloses->fetch_add(1);
    }
}

TEST(StreamGuard, ConcurrentCloseIsEffectiveExactlyOnce)
{
    MockChannel channel;
    EXPECT_CALL (channel, close())
        .Times(1)
        .WillOnce(::testing::Return(tempo_utils::Status{}));

    conduit_stream::StreamGuard guard(&channel);
    std::atomic<int> effectiveCloses(0);
    CloseContext ctx{&guard, &effectiveCloses};

    std::vector<uv_thread_t> tids(16);
    for (auto &tid : tids) {
        uv_thread_create(&tid, close_thread, &ctx);
    }
    for (auto &tid : tids) {
        uv_thread_join(&tid);
    }

    ASSERT_EQ (1, effectiveCloses.load());
    ASSERT_TRUE (guard.isClosed());
}

TEST(StreamGuard, ConcurrentCloseNeverDoubleClosesRealChannel)
{
    conduit_stream::HandoffChannel<int> channel;
    conduit_stream::StreamGuard guard(&channel);
    std::atomic<int> effectiveCloses(0);
    CloseContext ctx{&guard, &effectiveCloses};

    std::vector<uv_thread_t> tids(16);
    for (auto &tid : tids) {
        uv_thread_create(&tid, close_thread, &ctx);
    }
    for (auto &tid : tids) {
        uv_thread_join(&tid);
    }

    ASSERT_EQ (1, effectiveCloses.load());
    ASSERT_TRUE (channel.isClosed());
    ASSERT_TRUE (guard.isClosed());
}
