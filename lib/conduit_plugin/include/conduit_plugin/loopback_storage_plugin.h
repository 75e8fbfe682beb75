#ifndef CONDUIT_PLUGIN_LOOPBACK_STORAGE_PLUGIN_H
#define CONDUIT_PLUGIN_LOOPBACK_STORAGE_PLUGIN_H

#include <memory>
#include <string>

#include <absl/container/flat_hash_map.h>
#include <absl/synchronization/mutex.h>

#include <tempo_utils/integer_types.h>
#include <tempo_utils/result.h>

#include "abstract_storage_plugin.h"
#include "loopback_config.h"

namespace conduit_plugin {

    /**
     * An in-memory storage backend. Objects are stored whole per bucket and key, and are
     * streamed back in chunks of the configured download chunk size.
     */
    class LoopbackStoragePlugin : public AbstractStoragePlugin {
    public:
        explicit LoopbackStoragePlugin(const LoopbackConfig &config);

        tempo_utils::Status getObject(
            const conduit_storage::GetObjectRequest &request,
            grpc::ServerWriterInterface<conduit_storage::GetObjectResponse> *writer) override;

        tempo_utils::Status putObject(
            grpc::ServerReaderInterface<conduit_storage::PutObjectRequest> *reader,
            conduit_storage::PutObjectResponse *response) override;

        tempo_utils::Status createBucket(const std::string &bucket);
        bool hasBucket(const std::string &bucket) const;
        bool hasObject(const std::string &bucket, const std::string &key) const;
        tempo_utils::Result<tu_uint64> getObjectSize(const std::string &bucket, const std::string &key) const;

    private:
        LoopbackConfig m_config;

        using Bucket = absl::flat_hash_map<std::string,std::shared_ptr<const std::string>>;

        mutable absl::Mutex m_lock;
        absl::flat_hash_map<std::string,Bucket> m_buckets ABSL_GUARDED_BY(m_lock);

        tempo_utils::Result<std::shared_ptr<const std::string>> findObject(
            const std::string &bucket,
            const std::string &key) const;
    };
}

#endif // CONDUIT_PLUGIN_LOOPBACK_STORAGE_PLUGIN_H
