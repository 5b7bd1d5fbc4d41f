#include "replication/NodeConfig.hpp"
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>

namespace {

// Unset variables leave the default untouched
bool readUnsigned(const char* name, uint64_t maxValue, uint64_t& out) {
    const char* env = std::getenv(name);
    if (env == nullptr) {
        return false;
    }

    std::string text(env);
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument(std::string(name) + " must be a non-negative integer, got '" + text + "'");
    }

    uint64_t value = 0;
    try {
        value = std::stoull(text);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(std::string(name) + " is out of range: " + text);
    }
    if (value > maxValue) {
        throw std::invalid_argument(std::string(name) + " is out of range: " + text);
    }

    out = value;
    return true;
}

void readMillis(const char* name, std::chrono::milliseconds& out) {
    uint64_t value = 0;
    if (readUnsigned(name, static_cast<uint64_t>(std::numeric_limits<int32_t>::max()), value)) {
        out = std::chrono::milliseconds(value);
    }
}

}

void NodeConfig::validate() const {
    if (maxChunkSize == 0) {
        throw std::invalid_argument("maxChunkSize must be positive");
    }
    if (logCapacity == 0) {
        throw std::invalid_argument("logCapacity must be positive");
    }
    if (rpcTimeout.count() <= 0) {
        throw std::invalid_argument("rpcTimeout must be positive");
    }
    if (retryBackoff > maxRetryBackoff) {
        throw std::invalid_argument("retryBackoff must not exceed maxRetryBackoff");
    }
}

NodeConfig NodeConfig::fromEnvironment() {
    NodeConfig config;
    uint64_t value = 0;

    if (readUnsigned("KVSYNC_MAX_CHUNK_SIZE", std::numeric_limits<uint32_t>::max(), value)) {
        config.maxChunkSize = static_cast<size_t>(value);
    }
    if (readUnsigned("KVSYNC_LOG_CAPACITY", std::numeric_limits<uint32_t>::max(), value)) {
        config.logCapacity = static_cast<size_t>(value);
    }
    if (readUnsigned("KVSYNC_MAX_RETRIES", std::numeric_limits<uint32_t>::max(), value)) {
        config.maxRetries = static_cast<uint32_t>(value);
    }
    readMillis("KVSYNC_FETCH_PERIOD_MS", config.fetchPeriod);
    readMillis("KVSYNC_RPC_TIMEOUT_MS", config.rpcTimeout);
    readMillis("KVSYNC_RETRY_BACKOFF_MS", config.retryBackoff);
    if (config.retryBackoff > config.maxRetryBackoff) {
        config.maxRetryBackoff = config.retryBackoff;
    }

    config.validate();
    return config;
}
