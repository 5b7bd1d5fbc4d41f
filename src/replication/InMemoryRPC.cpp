#include "replication/InMemoryRPC.hpp"
#include <stdexcept>
#include <string>
#include <utility>

namespace {
// Same values as grpc::StatusCode
constexpr int kInvalidArgument = 3;
constexpr int kUnavailable = 14;
}

InMemoryRPC::InMemoryRPC(std::shared_ptr<KVNode> remote)
    : remote(std::move(remote)),
      reachable(true),
      pendingFailures(0),
      callCount(0) {
    if (!this->remote) {
        throw std::invalid_argument("InMemoryRPC requires a remote node");
    }
}

void InMemoryRPC::setReachable(bool reachable) {
    std::lock_guard<std::mutex> lock(rpcMutex);
    this->reachable = reachable;
}

void InMemoryRPC::failNextCalls(int count) {
    std::lock_guard<std::mutex> lock(rpcMutex);
    pendingFailures = count;
}

std::vector<uint64_t> InMemoryRPC::getFetchOffsets() const {
    std::lock_guard<std::mutex> lock(rpcMutex);
    return fetchOffsets;
}

int InMemoryRPC::getCallCount() const {
    std::lock_guard<std::mutex> lock(rpcMutex);
    return callCount;
}

void InMemoryRPC::checkReachable(const char* method) {
    std::lock_guard<std::mutex> lock(rpcMutex);
    ++callCount;

    if (!reachable) {
        throw RemoteError(kUnavailable, std::string(method) + ": remote node unreachable");
    }
    if (pendingFailures > 0) {
        --pendingFailures;
        throw RemoteError(kUnavailable, std::string(method) + ": injected failure");
    }
}

Head InMemoryRPC::sendInsert(
    const std::vector<Modification>& modifications,
    std::chrono::milliseconds timeout
) {
    checkReachable("Insert");

    // Call the node directly (in-memory)
    return remote->append(modifications);
}

NodeInfo InMemoryRPC::sendInfo(
    std::chrono::milliseconds timeout
) {
    checkReachable("Info");
    return remote->info();
}

FetchResult InMemoryRPC::sendFetch(
    uint64_t begin,
    uint64_t end,
    Head head,
    std::chrono::milliseconds timeout
) {
    checkReachable("Fetch");
    {
        std::lock_guard<std::mutex> lock(rpcMutex);
        fetchOffsets.push_back(begin);
    }

    try {
        return remote->fetch(begin, end, head);
    } catch (const std::invalid_argument& e) {
        throw RemoteError(kInvalidArgument, std::string("Fetch: ") + e.what());
    }
}
