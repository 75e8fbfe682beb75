#include <gtest/gtest.h>

#include <grpcpp/server.h>
#include <grpcpp/server_builder.h>
#include <grpcpp/support/channel_arguments.h>

#include <conduit_plugin/grpc_storage_client.h>
#include <conduit_plugin/loopback_storage_client.h>
#include <conduit_plugin/loopback_storage_plugin.h>
#include <conduit_plugin/object_transfer.h>
#include <conduit_plugin/storage_plugin_service.h>
#include <tempo_test/tempo_test.h>

enum class TransportType {
    Loopback,
    InProcessGrpc,
};

/**
 * Runs each transfer against the same plugin twice: once over loopback streams and once over
 * a real gRPC server reached through an in-process channel. Both transports must behave
 * the same.
 */
class StorageTransfer : public ::testing::TestWithParam<TransportType> {
protected:
    std::shared_ptr<conduit_plugin::LoopbackStoragePlugin> plugin;
    std::unique_ptr<conduit_plugin::StoragePluginService> service;
    std::unique_ptr<grpc::Server> server;
    std::unique_ptr<conduit_plugin::AbstractStorageClient> client;

    void SetUp() override {
        conduit_plugin::LoopbackConfig config;
        config.downloadChunkSize = 4;
        config.buckets = {"recordings"};
        plugin = std::make_shared<conduit_plugin::LoopbackStoragePlugin>(config);

        switch (GetParam()) {
            case TransportType::Loopback:
                client = std::make_unique<conduit_plugin::LoopbackStorageClient>(plugin);
                break;
            case TransportType::InProcessGrpc: {
                service = std::make_unique<conduit_plugin::StoragePluginService>(plugin);
                grpc::ServerBuilder builder;
                builder.RegisterService(service.get());
                server = builder.BuildAndStart();
                ASSERT_TRUE (server != nullptr);
                client = std::make_unique<conduit_plugin::GrpcStorageClient>(
                    server->InProcessChannel(grpc::ChannelArguments()));
                break;
            }
        }
    }

    void TearDown() override {
        client.reset();
        if (server != nullptr) {
            server->Shutdown();
            server->Wait();
        }
    }
};

TEST_P(StorageTransfer, UploadThenDownload)
{
    auto uploadResult = conduit_plugin::upload_object(client.get(), "recordings", "session1", "hello, world!", 5);
    ASSERT_THAT (uploadResult, tempo_test::IsResult());
    ASSERT_EQ (13, uploadResult.getResult());
    ASSERT_TRUE (plugin->hasObject("recordings", "session1"));

    auto downloadResult = conduit_plugin::download_object(client.get(), "recordings", "session1");
    ASSERT_THAT (downloadResult, tempo_test::IsResult());
    ASSERT_EQ ("hello, world!", downloadResult.getResult());
}

TEST_P(StorageTransfer, DownloadIsChunked)
{
    ASSERT_THAT (conduit_plugin::upload_object(client.get(), "recordings", "session1", "abcdefghij", 10),
        tempo_test::IsResult());

    grpc::ClientContext context;
    conduit_storage::GetObjectRequest request;
    request.set_bucket("recordings");
    request.set_key("session1");
    auto reader = client->getObject(&context, request);

    std::vector<std::string> chunks;
    conduit_storage::GetObjectResponse response;
    while (reader->Read(&response)) {
        chunks.push_back(response.file_chunk());
    }
    ASSERT_TRUE (reader->Finish().ok());
    ASSERT_EQ (std::vector<std::string>({"abcd", "efgh", "ij"}), chunks);
}

TEST_P(StorageTransfer, EmptyObject)
{
    auto uploadResult = conduit_plugin::upload_object(client.get(), "recordings", "empty", "", 4);
    ASSERT_THAT (uploadResult, tempo_test::IsResult());
    ASSERT_EQ (0, uploadResult.getResult());

    auto downloadResult = conduit_plugin::download_object(client.get(), "recordings", "empty");
    ASSERT_THAT (downloadResult, tempo_test::IsResult());
    ASSERT_TRUE (downloadResult.getResult().empty());
}

TEST_P(StorageTransfer, DownloadMissingObjectFails)
{
    auto downloadResult = conduit_plugin::download_object(client.get(), "recordings", "missing");
    ASSERT_TRUE (downloadResult.isStatus());
    auto status = downloadResult.getStatus();
    ASSERT_EQ (tempo_utils::StatusCode::kNotFound, status.getStatusCode());
    ASSERT_EQ ("object 'missing' does not exist in bucket 'recordings'", status.getMessage());
}

TEST_P(StorageTransfer, UploadToMissingBucketFails)
{
    auto uploadResult = conduit_plugin::upload_object(client.get(), "archive", "session1", "abcdefghij", 2);
    ASSERT_TRUE (uploadResult.isStatus());
    auto status = uploadResult.getStatus();
    ASSERT_EQ (tempo_utils::StatusCode::kNotFound, status.getStatusCode());
    ASSERT_EQ ("bucket 'archive' does not exist", status.getMessage());
    ASSERT_FALSE (plugin->hasObject("archive", "session1"));
}

TEST_P(StorageTransfer, UploadWithoutDestinationFails)
{
    auto uploadResult = conduit_plugin::upload_object(client.get(), "recordings", "", "abc", 4);
    ASSERT_TRUE (uploadResult.isStatus());
    ASSERT_EQ (tempo_utils::StatusCode::kInvalidArgument, uploadResult.getStatus().getStatusCode());
}

TEST_P(StorageTransfer, UploadReplacesObject)
{
    ASSERT_THAT (conduit_plugin::upload_object(client.get(), "recordings", "session1", "first", 4),
        tempo_test::IsResult());
    ASSERT_THAT (conduit_plugin::upload_object(client.get(), "recordings", "session1", "second!", 4),
        tempo_test::IsResult());

    auto getSizeResult = plugin->getObjectSize("recordings", "session1");
    ASSERT_THAT (getSizeResult, tempo_test::IsResult());
    ASSERT_EQ (7, getSizeResult.getResult());

    auto downloadResult = conduit_plugin::download_object(client.get(), "recordings", "session1");
    ASSERT_THAT (downloadResult, tempo_test::IsResult());
    ASSERT_EQ ("second!", downloadResult.getResult());
}

INSTANTIATE_TEST_SUITE_P(Transports, StorageTransfer,
    ::testing::Values(TransportType::Loopback, TransportType::InProcessGrpc),
    [](const ::testing::TestParamInfo<TransportType> &info) -> std::string {
        switch (info.param) {
            case TransportType::Loopback:
                return "Loopback";
            case TransportType::InProcessGrpc:
                return "InProcessGrpc";
        }
        return "Unknown";
    });
