#ifndef NODE_CONFIG_HPP
#define NODE_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>

struct NodeConfig {
    size_t maxChunkSize{20};        // Page size cap per fetch
    size_t logCapacity{1000};       // Batches retained for diffs
    std::chrono::milliseconds fetchPeriod{std::chrono::milliseconds(1000)};

    // Remote calls made by the bootstrap driver
    std::chrono::milliseconds rpcTimeout{std::chrono::milliseconds(2000)};
    uint32_t maxRetries{5};
    std::chrono::milliseconds retryBackoff{std::chrono::milliseconds(500)};
    std::chrono::milliseconds maxRetryBackoff{std::chrono::milliseconds(8000)};

    // Throws std::invalid_argument on values the node cannot run with
    void validate() const;

    // Defaults overlaid with KVSYNC_* environment variables
    static NodeConfig fromEnvironment();
};

#endif // NODE_CONFIG_HPP
