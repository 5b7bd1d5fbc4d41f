#ifndef GRPC_NODE_CLIENT_HPP
#define GRPC_NODE_CLIENT_HPP

#include "NodeRPC.hpp"
#include "KVNode.hpp"
#include "kvsync.pb.h"
#include "kvsync.grpc.pb.h"

#include <grpcpp/grpcpp.h>
#include <memory>
#include <string>

// Client for one remote node. Failed calls throw RemoteError carrying
// the grpc::StatusCode.
class GrpcNodeClient : public NodeRPC {
public:
    explicit GrpcNodeClient(const std::string& address);

    // NodeRPC Methods implementation
    Head sendInsert(
        const std::vector<Modification>& modifications,
        std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)
    ) override;

    NodeInfo sendInfo(
        std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)
    ) override;

    FetchResult sendFetch(
        uint64_t begin,
        uint64_t end,
        Head head,
        std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)
    ) override;

private:
    std::string address;
    std::unique_ptr<kvsync::NodeService::Stub> stub;

    // Helpers
    std::chrono::system_clock::time_point
    createDeadline(std::chrono::milliseconds timeout);

    [[noreturn]] void throwRemoteError(const char* method, const grpc::Status& status);
};

#endif // GRPC_NODE_CLIENT_HPP
