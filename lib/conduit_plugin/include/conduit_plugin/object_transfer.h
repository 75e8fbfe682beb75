#ifndef CONDUIT_PLUGIN_OBJECT_TRANSFER_H
#define CONDUIT_PLUGIN_OBJECT_TRANSFER_H

#include <string>
#include <string_view>

#include <tempo_utils/integer_types.h>
#include <tempo_utils/result.h>

#include "abstract_storage_client.h"

namespace conduit_plugin {

    /**
     * Read the whole object from the plugin into memory.
     */
    tempo_utils::Result<std::string> download_object(
        AbstractStorageClient *client,
        const std::string &bucket,
        const std::string &key);

    /**
     * Write the object to the plugin in chunks of at most chunkSize bytes. The first chunk
     * carries the bucket and key. An empty object is sent as a single request with an empty
     * chunk.
     *
     * @return the size of the object as reported by the plugin.
     */
    tempo_utils::Result<tu_uint64> upload_object(
        AbstractStorageClient *client,
        const std::string &bucket,
        const std::string &key,
        std::string_view data,
        tu_uint32 chunkSize);
}

#endif // CONDUIT_PLUGIN_OBJECT_TRANSFER_H
