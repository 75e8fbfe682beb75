#ifndef CONDUIT_PLUGIN_LOOPBACK_CONFIG_H
#define CONDUIT_PLUGIN_LOOPBACK_CONFIG_H

#include <string>
#include <vector>

#include <tempo_config/abstract_converter.h>
#include <tempo_config/config_types.h>
#include <tempo_utils/integer_types.h>

namespace conduit_plugin {

    constexpr tu_uint32 kDefaultDownloadChunkSize = 65536;

    struct LoopbackConfig {
        tu_uint32 downloadChunkSize = kDefaultDownloadChunkSize;
        std::vector<std::string> buckets;
    };

    class LoopbackConfigParser : public tempo_config::AbstractConverter<LoopbackConfig> {
    public:
        tempo_utils::Status convertValue(
            const tempo_config::ConfigNode &node,
            LoopbackConfig &loopbackConfig) const override;
    };
}

#endif // CONDUIT_PLUGIN_LOOPBACK_CONFIG_H
