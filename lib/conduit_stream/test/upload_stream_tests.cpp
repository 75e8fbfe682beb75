#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <uv.h>

#include <conduit_stream/upload_stream.h>
#include <tempo_test/tempo_test.h>
#include <tempo_utils/status.h>

using Endpoints = conduit_stream::UploadEndpoints<std::string,std::string>;

class UploadStream : public ::testing::Test {
protected:
    Endpoints endpoints;
    void SetUp() override {
        endpoints = conduit_stream::open_upload_stream<std::string,std::string>();
    }
};

static std::shared_ptr<const std::string> chunk(const char *data)
{
    return std::make_shared<const std::string>(data);
}

struct ReaderContext {
    conduit_stream::UploadServer<std::string,std::string> *server;
    std::vector<std::string> received;
    bool sawEndOfStream;
    bool abandon;
    tempo_utils::Status completeStatus;
};

static void reader_thread(void *ptr)
{
    auto *ctx = static_cast<ReaderContext *>(ptr);
    for (;;) {
        auto message = ctx->server->receive();
        if (message.isEndOfStream()) {
            ctx->sawEndOfStream = true;
            break;
        }
        ctx->received.push_back(*message.getPayload());
        if (ctx->abandon)
            break;
    }
    if (ctx->abandon) {
        ctx->server->abandon();
        return;
    }
    std::string joined;
    for (const auto &data : ctx->received) {
        joined.append(data);
    }
    ctx->completeStatus = ctx->server->completeWithResult(std::make_shared<const std::string>(joined));
}

TEST_F(UploadStream, StreamIsInitiallyOpen)
{
    ASSERT_FALSE (endpoints.client->isClosed());
    ASSERT_FALSE (endpoints.server->isClosed());
}

TEST_F(UploadStream, SendRequestsThenAwaitResult)
{
    ReaderContext ctx{endpoints.server.get(), {}, false, false, {}};

    uv_thread_t tid;
    uv_thread_create(&tid, reader_thread, &ctx);

    ASSERT_THAT (endpoints.client->send(chunk("x")), tempo_test::IsOk());
    ASSERT_THAT (endpoints.client->send(chunk("y")), tempo_test::IsOk());
    ASSERT_THAT (endpoints.client->halfClose(), tempo_test::IsOk());

    auto result = endpoints.client->awaitResult();
    ASSERT_TRUE (result.hasPayload());
    ASSERT_EQ ("xy", *result.getPayload());

    uv_thread_join(&tid);
    ASSERT_EQ (std::vector<std::string>({"x", "y"}), ctx.received);
    ASSERT_TRUE (ctx.sawEndOfStream);
    ASSERT_THAT (ctx.completeStatus, tempo_test::IsOk());
    ASSERT_TRUE (endpoints.server->isClosed());
}

TEST_F(UploadStream, AwaitResultHalfClosesRequests)
{
    ReaderContext ctx{endpoints.server.get(), {}, false, false, {}};

    uv_thread_t tid;
    uv_thread_create(&tid, reader_thread, &ctx);

    ASSERT_THAT (endpoints.client->send(chunk("x")), tempo_test::IsOk());
    auto result = endpoints.client->awaitResult();
    ASSERT_TRUE (result.hasPayload());
    ASSERT_EQ ("x", *result.getPayload());

    uv_thread_join(&tid);
    ASSERT_TRUE (ctx.sawEndOfStream);
    ASSERT_TRUE (endpoints.client->isClosed());
}

TEST_F(UploadStream, AbandonedResponseYieldsEndOfStream)
{
    ReaderContext ctx{endpoints.server.get(), {}, false, true, {}};

    uv_thread_t tid;
    uv_thread_create(&tid, reader_thread, &ctx);

    ASSERT_THAT (endpoints.client->send(chunk("x")), tempo_test::IsOk());
    auto result = endpoints.client->awaitResult();
    ASSERT_TRUE (result.isEndOfStream());
    ASSERT_FALSE (result.isError());

    uv_thread_join(&tid);
    ASSERT_EQ (std::vector<std::string>({"x"}), ctx.received);
    ASSERT_TRUE (endpoints.server->isClosed());
}

struct ErrorContext {
    conduit_stream::UploadServer<std::string,std::string> *server;
    tempo_utils::Status error;
    tempo_utils::Status status;
};

static void complete_with_error_thread(void *ptr)
{
    auto *ctx = static_cast<ErrorContext *>(ptr);
    ctx->status = ctx->server->completeWithError(ctx->error);
}

TEST_F(UploadStream, CompleteWithErrorClosesResponseHalf)
{
    auto error = conduit_stream::StreamStatus::forCondition(
        conduit_stream::StreamCondition::kUnexpectedTermination, "object rejected");
    ErrorContext ctx{endpoints.server.get(), error, {}};

    uv_thread_t tid;
    uv_thread_create(&tid, complete_with_error_thread, &ctx);

    auto result = endpoints.client->awaitResult();
    ASSERT_TRUE (result.isError());
    ASSERT_EQ ("object rejected", result.getError().getMessage());

    uv_thread_join(&tid);
    ASSERT_THAT (ctx.status, tempo_test::IsOk());
    ASSERT_TRUE (endpoints.server->isClosed());

    auto status = endpoints.server->completeWithError(error);
    ASSERT_TRUE (status.matchesCondition(conduit_stream::StreamCondition::kAlreadyClosed));
    status = endpoints.server->completeWithResult(chunk("late"));
    ASSERT_TRUE (status.matchesCondition(conduit_stream::StreamCondition::kAlreadyClosed));
}

TEST_F(UploadStream, NilPayloadsFailWithoutClosing)
{
    auto status = endpoints.client->send({});
    ASSERT_TRUE (status.matchesCondition(conduit_stream::StreamCondition::kInvalidArgument));
    ASSERT_FALSE (endpoints.client->isClosed());

    status = endpoints.server->completeWithResult({});
    ASSERT_TRUE (status.matchesCondition(conduit_stream::StreamCondition::kInvalidArgument));
    ASSERT_FALSE (endpoints.server->isClosed());

    status = endpoints.server->completeWithError(tempo_utils::Status{});
    ASSERT_TRUE (status.matchesCondition(conduit_stream::StreamCondition::kInvalidArgument));
    ASSERT_FALSE (endpoints.server->isClosed());
}

TEST_F(UploadStream, SendFailsAfterHalfClose)
{
    ASSERT_THAT (endpoints.client->halfClose(), tempo_test::IsOk());
    auto status = endpoints.client->send(chunk("x"));
    ASSERT_TRUE (status.matchesCondition(conduit_stream::StreamCondition::kAlreadyClosed));

    status = endpoints.client->halfClose();
    ASSERT_TRUE (status.matchesCondition(conduit_stream::StreamCondition::kAlreadyClosed));

    ASSERT_TRUE (endpoints.server->receive().isEndOfStream());
    ASSERT_FALSE (endpoints.server->isClosed());
}

TEST_F(UploadStream, HalvesCloseIndependently)
{
    endpoints.server->abandon();
    ASSERT_TRUE (endpoints.server->isClosed());
    ASSERT_FALSE (endpoints.client->isClosed());

    // the request half still accepts a hand-off once the response half is gone
    ReaderContext ctx{endpoints.server.get(), {}, false, true, {}};
    uv_thread_t tid;
    uv_thread_create(&tid, reader_thread, &ctx);
    ASSERT_THAT (endpoints.client->send(chunk("x")), tempo_test::IsOk());
    uv_thread_join(&tid);

    ASSERT_EQ (std::vector<std::string>({"x"}), ctx.received);
}

TEST_F(UploadStream, ServerObservesClientHalfClose)
{
    ASSERT_FALSE (endpoints.server->isRequestsClosed());
    ASSERT_THAT (endpoints.client->halfClose(), tempo_test::IsOk());

    ASSERT_TRUE (endpoints.server->isRequestsClosed());
    ASSERT_FALSE (endpoints.server->isClosed());
    ASSERT_TRUE (endpoints.server->receive().isEndOfStream());
}

static void cancel_thread(void *ptr)
{
    auto *client = static_cast<conduit_stream::UploadClient<std::string,std::string> *>(ptr);
    uv_sleep(100);
    client->cancel();
}

TEST_F(UploadStream, CancelReleasesBlockedReader)
{
    uv_thread_t tid;
    uv_thread_create(&tid, cancel_thread, endpoints.client.get());

    auto message = endpoints.server->receive();
    ASSERT_TRUE (message.isEndOfStream());

    uv_thread_join(&tid);
    ASSERT_TRUE (endpoints.client->isClosed());
    ASSERT_TRUE (endpoints.server->isClosed());
    ASSERT_TRUE (endpoints.client->awaitResult().isEndOfStream());
}

static void close_requests_thread(void *ptr)
{
    auto *server = static_cast<conduit_stream::UploadServer<std::string,std::string> *>(ptr);
    uv_sleep(100);
    server->closeRequests();
}

TEST_F(UploadStream, CloseRequestsReleasesBlockedSender)
{
    uv_thread_t tid;
    uv_thread_create(&tid, close_requests_thread, endpoints.server.get());

    auto status = endpoints.client->send(chunk("x"));
    ASSERT_TRUE (status.matchesCondition(conduit_stream::StreamCondition::kAlreadyClosed));

    uv_thread_join(&tid);
    ASSERT_TRUE (endpoints.client->isClosed());
    ASSERT_FALSE (endpoints.server->isClosed());
}

TEST_F(UploadStream, GenericMessagesMatchTypedPaths)
{
    auto status = endpoints.client->sendMessage(conduit_stream::StreamMessage<std::string>());
    ASSERT_TRUE (status.matchesCondition(conduit_stream::StreamCondition::kInvalidArgument));

    auto error = conduit_stream::StreamStatus::forCondition(
        conduit_stream::StreamCondition::kUnexpectedTermination, "client error");
    status = endpoints.client->sendMessage(conduit_stream::StreamMessage<std::string>::forError(error));
    ASSERT_TRUE (status.matchesCondition(conduit_stream::StreamCondition::kInvalidArgument));

    status = endpoints.server->sendMessage(conduit_stream::StreamMessage<std::string>());
    ASSERT_TRUE (status.matchesCondition(conduit_stream::StreamCondition::kInvalidArgument));
    ASSERT_FALSE (endpoints.server->isClosed());

    endpoints.server->abandon();
    status = endpoints.server->sendMessage(
        conduit_stream::StreamMessage<std::string>::forPayload(chunk("result")));
    ASSERT_TRUE (status.matchesCondition(conduit_stream::StreamCondition::kAlreadyClosed));
    ASSERT_TRUE (endpoints.client->receiveMessage().isEndOfStream());

    ASSERT_TRUE (endpoints.client->header().empty());
    ASSERT_THAT (endpoints.server->sendHeader({}), tempo_test::IsOk());
    ASSERT_FALSE (endpoints.server->scope().isCancelled());
}
