#ifndef IN_MEMORY_RPC_HPP
#define IN_MEMORY_RPC_HPP

#include "NodeRPC.hpp"
#include "KVNode.hpp"
#include <memory>
#include <mutex>
#include <vector>


// In-memory RPC implementation for testing
// The remote node lives in the same process
class InMemoryRPC : public NodeRPC {
public:
    explicit InMemoryRPC(std::shared_ptr<KVNode> remote);

    // Simulate the remote going away / coming back
    void setReachable(bool reachable);

    // Make the next `count` calls fail before reaching the node
    void failNextCalls(int count);

    // Begin offsets of every fetch that reached the node, in call order
    std::vector<uint64_t> getFetchOffsets() const;
    int getCallCount() const;

    // NodeRPC Method implementation
    Head sendInsert(
        const std::vector<Modification>& modifications,
        std::chrono::milliseconds timeout
    ) override;

    NodeInfo sendInfo(
        std::chrono::milliseconds timeout
    ) override;

    FetchResult sendFetch(
        uint64_t begin,
        uint64_t end,
        Head head,
        std::chrono::milliseconds timeout
    ) override;

private:
    std::shared_ptr<KVNode> remote;
    bool reachable;
    int pendingFailures;
    int callCount;
    std::vector<uint64_t> fetchOffsets;
    mutable std::mutex rpcMutex;

    // Counts the call and throws RemoteError if it must fail
    void checkReachable(const char* method);
};

#endif // IN_MEMORY_RPC_HPP
