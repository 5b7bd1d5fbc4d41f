#ifndef KVNODE_HPP
#define KVNODE_HPP
#include "kvstore/KVStore.hpp"
#include "kvstore/Modification.hpp"
#include "NodeConfig.hpp"

#include "ModificationLog.hpp"
#include <cstdint>
#include <cstddef>
#include <vector>
#include <mutex>
#include <ostream>

// Reply Structures

struct NodeInfo {
    Head head;               // Head of the newest batch
    uint64_t size;           // Number of live keys
};

struct FetchResult {
    Head head;                          // Current head when the page was cut
    std::vector<Modification> entries;  // Snapshot page, as Updates
    std::vector<Modification> diff;     // Batches newer than the requested head
};


// KVNode Class

// Owns the store and the modification log. Every public operation is a
// single critical section over both.
class KVNode {
public:
    explicit KVNode(const NodeConfig& config = NodeConfig());

    KVNode(const KVNode&) = delete;
    KVNode& operator=(const KVNode&) = delete;

    // Applies the whole batch to the store, then records it in the log.
    // Returns the head produced by the batch.
    Head append(const std::vector<Modification>& modifications);

    NodeInfo info() const;

    // Page of at most maxChunkSize entries starting at `begin`, plus the
    // diff since `head`. Throws std::invalid_argument when end < begin.
    FetchResult fetch(uint64_t begin, uint64_t end, Head head) const;

    // Writes every entry as "key - value", one per line
    void dump(std::ostream& out) const;

    // State Query Methods
    std::optional<std::string> get(const std::string& key) const;
    size_t getLogSize() const;

private:
    const NodeConfig config;

    // Concurrency
    mutable std::mutex stateMutex;    // Protects store and log
    KVStore store;
    ModificationLog log;
};

#endif // KVNODE_HPP
