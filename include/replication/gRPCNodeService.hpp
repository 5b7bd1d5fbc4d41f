#ifndef GRPC_NODE_SERVICE_HPP
#define GRPC_NODE_SERVICE_HPP

#include "KVNode.hpp"
#include "kvsync.grpc.pb.h"
#include <grpcpp/grpcpp.h>
#include <functional>
#include <memory>
#include <string>

// Runs a handler body. std::invalid_argument becomes INVALID_ARGUMENT,
// any other std::exception becomes INTERNAL.
grpc::Status guardHandler(const char* method, const std::function<void()>& body);

class GrpcNodeService final : public kvsync::NodeService::Service {
public:
    explicit GrpcNodeService(std::shared_ptr<KVNode> node);

    grpc::Status Insert(
        grpc::ServerContext* context,
        const kvsync::InsertRequest* request,
        kvsync::InsertResponse* response) override;

    grpc::Status Info(
        grpc::ServerContext* context,
        const kvsync::InfoRequest* request,
        kvsync::InfoResponse* response) override;

    grpc::Status Fetch(
        grpc::ServerContext* context,
        const kvsync::FetchRequest* request,
        kvsync::FetchResponse* response) override;

private:
    std::shared_ptr<KVNode> node;
};

// Server
class GrpcNodeServer {
public:
    // Binds and starts serving; throws std::runtime_error if the address
    // cannot be bound. Port 0 picks a free port, see getPort().
    GrpcNodeServer(std::shared_ptr<KVNode> node, const std::string& address);
    ~GrpcNodeServer();

    // Stops accepting calls and waits for in-flight ones to finish
    void stop();

    int getPort() const { return selectedPort; }

private:
    std::unique_ptr<GrpcNodeService> service;
    std::unique_ptr<grpc::Server> server;
    int selectedPort;
};

#endif // GRPC_NODE_SERVICE_HPP
