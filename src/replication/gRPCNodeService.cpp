#include "replication/gRPCNodeService.hpp"
#include "replication/ProtoConvert.hpp"
#include <iostream>
#include <stdexcept>
#include <utility>

grpc::Status guardHandler(const char* method, const std::function<void()>& body) {
    try {
        body();
    } catch (const std::invalid_argument& e) {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, e.what());
    } catch (const std::exception& e) {
        std::cerr << "Server: " << method << " failed: " << e.what() << std::endl;
        return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
    }
    return grpc::Status::OK;
}

GrpcNodeService::GrpcNodeService(std::shared_ptr<KVNode> node) : node(std::move(node)) {}

grpc::Status GrpcNodeService::Insert(
    grpc::ServerContext* context,
    const kvsync::InsertRequest* request,
    kvsync::InsertResponse* response) {

    return guardHandler("Insert", [this, request, response]() {
        // Convert the whole batch first so a bad entry leaves the node untouched
        std::vector<Modification> modifications = fromProto(request->modifications());
        response->set_head(node->append(modifications));
    });
}

grpc::Status GrpcNodeService::Info(
    grpc::ServerContext* context,
    const kvsync::InfoRequest* request,
    kvsync::InfoResponse* response) {

    return guardHandler("Info", [this, response]() {
        NodeInfo info = node->info();
        response->set_head(info.head);
        response->set_size(info.size);
    });
}

grpc::Status GrpcNodeService::Fetch(
    grpc::ServerContext* context,
    const kvsync::FetchRequest* request,
    kvsync::FetchResponse* response) {

    return guardHandler("Fetch", [this, request, response]() {
        FetchResult result = node->fetch(request->begin(), request->end(), request->head());

        // Convert back to protobuf
        response->set_head(result.head);
        toProto(result.entries, response->mutable_entries());
        toProto(result.diff, response->mutable_diff());
    });
}

// Server implementation
GrpcNodeServer::GrpcNodeServer(std::shared_ptr<KVNode> node, const std::string& address)
    : selectedPort(0) {
    service = std::make_unique<GrpcNodeService>(std::move(node));

    grpc::ServerBuilder builder;
    builder.AddListeningPort(address, grpc::InsecureServerCredentials(), &selectedPort);
    builder.RegisterService(service.get());

    server = builder.BuildAndStart();
    if (!server || selectedPort == 0) {
        throw std::runtime_error("Failed to listen on " + address);
    }
}

GrpcNodeServer::~GrpcNodeServer() {
    stop();
}

void GrpcNodeServer::stop() {
    if (server) {
        server->Shutdown();
        server->Wait();
        server.reset();
    }
}
