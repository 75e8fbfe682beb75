#ifndef CONDUIT_PLUGIN_LOOPBACK_STREAM_ADAPTERS_H
#define CONDUIT_PLUGIN_LOOPBACK_STREAM_ADAPTERS_H

#include <memory>

#include <grpcpp/support/sync_stream.h>

#include <conduit_storage/storage_plugin.grpc.pb.h>
#include <conduit_stream/download_stream.h>
#include <conduit_stream/upload_stream.h>

namespace conduit_plugin {

    using ObjectDownloadClient = conduit_stream::DownloadClient<conduit_storage::GetObjectResponse>;
    using ObjectDownloadServer = conduit_stream::DownloadServer<conduit_storage::GetObjectResponse>;
    using ObjectUploadClient = conduit_stream::UploadClient<
        conduit_storage::PutObjectRequest,
        conduit_storage::PutObjectResponse>;
    using ObjectUploadServer = conduit_stream::UploadServer<
        conduit_storage::PutObjectRequest,
        conduit_storage::PutObjectResponse>;

    /**
     * Host side of a loopback GetObject call. Reads chunks from the download stream until the
     * plugin finishes or fails. A carried error ends the reads and is reported by Finish().
     * Destroying the reader before the download completes abandons the download.
     */
    class LoopbackObjectReader : public grpc::ClientReaderInterface<conduit_storage::GetObjectResponse> {
    public:
        explicit LoopbackObjectReader(std::unique_ptr<ObjectDownloadClient> client);
        ~LoopbackObjectReader() override;

        void WaitForInitialMetadata() override;
        bool NextMessageSize(uint32_t *sz) override;
        bool Read(conduit_storage::GetObjectResponse *msg) override;
        grpc::Status Finish() override;

    private:
        std::unique_ptr<ObjectDownloadClient> m_client;
        bool m_done;
        grpc::Status m_status;
    };

    /**
     * Plugin side of a loopback GetObject call. Each Write() blocks until the host has read
     * the chunk, and fails once the host has abandoned the download.
     */
    class LoopbackObjectWriter : public grpc::ServerWriterInterface<conduit_storage::GetObjectResponse> {
    public:
        explicit LoopbackObjectWriter(ObjectDownloadServer *server);

        void SendInitialMetadata() override;
        using grpc::internal::WriterInterface<conduit_storage::GetObjectResponse>::Write;
        bool Write(const conduit_storage::GetObjectResponse &msg, grpc::WriteOptions options) override;

    private:
        ObjectDownloadServer *m_server;
    };

    /**
     * Host side of a loopback PutObject call. WritesDone() ends the upload and Finish() waits
     * for the single response from the plugin. Destroying the writer cancels both halves of
     * the upload.
     */
    class LoopbackUploadWriter : public grpc::ClientWriterInterface<conduit_storage::PutObjectRequest> {
    public:
        LoopbackUploadWriter(std::unique_ptr<ObjectUploadClient> client, conduit_storage::PutObjectResponse *response);
        ~LoopbackUploadWriter() override;

        using grpc::internal::WriterInterface<conduit_storage::PutObjectRequest>::Write;
        bool Write(const conduit_storage::PutObjectRequest &msg, grpc::WriteOptions options) override;
        bool WritesDone() override;
        grpc::Status Finish() override;

    private:
        std::unique_ptr<ObjectUploadClient> m_client;
        conduit_storage::PutObjectResponse *m_response;
        bool m_done;
        grpc::Status m_status;
    };

    /**
     * Plugin side of a loopback PutObject call. Read() returns false once the host has
     * finished writing or has gone away.
     */
    class LoopbackUploadReader : public grpc::ServerReaderInterface<conduit_storage::PutObjectRequest> {
    public:
        explicit LoopbackUploadReader(ObjectUploadServer *server);

        void SendInitialMetadata() override;
        bool NextMessageSize(uint32_t *sz) override;
        bool Read(conduit_storage::PutObjectRequest *msg) override;

    private:
        ObjectUploadServer *m_server;
    };
}

#endif // CONDUIT_PLUGIN_LOOPBACK_STREAM_ADAPTERS_H
