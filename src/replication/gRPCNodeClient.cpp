#include "replication/gRPCNodeClient.hpp"
#include "replication/ProtoConvert.hpp"
#include <stdexcept>
#include <string>

GrpcNodeClient::GrpcNodeClient(const std::string& address)
    : address(address) {
    auto channel = grpc::CreateChannel(address, grpc::InsecureChannelCredentials());
    stub = kvsync::NodeService::NewStub(channel);
}

std::chrono::system_clock::time_point
GrpcNodeClient::createDeadline(std::chrono::milliseconds timeout) {
    return std::chrono::system_clock::now() + timeout;
}

void GrpcNodeClient::throwRemoteError(const char* method, const grpc::Status& status) {
    throw RemoteError(
        static_cast<int>(status.error_code()),
        std::string(method) + " RPC to " + address + " failed: " + status.error_message()
    );
}

Head GrpcNodeClient::sendInsert(
    const std::vector<Modification>& modifications,
    std::chrono::milliseconds timeout) {

    // Convert C++ structs to protobuf
    kvsync::InsertRequest request;
    toProto(modifications, request.mutable_modifications());

    kvsync::InsertResponse response;
    grpc::ClientContext context;
    context.set_deadline(createDeadline(timeout));

    // Make RPC call
    grpc::Status status = stub->Insert(&context, request, &response);

    if (!status.ok()) {
        throwRemoteError("Insert", status);
    }
    return response.head();
}

NodeInfo GrpcNodeClient::sendInfo(std::chrono::milliseconds timeout) {
    kvsync::InfoRequest request;
    kvsync::InfoResponse response;
    grpc::ClientContext context;
    context.set_deadline(createDeadline(timeout));

    grpc::Status status = stub->Info(&context, request, &response);

    if (!status.ok()) {
        throwRemoteError("Info", status);
    }

    NodeInfo reply;
    reply.head = response.head();
    reply.size = response.size();
    return reply;
}

FetchResult GrpcNodeClient::sendFetch(
    uint64_t begin,
    uint64_t end,
    Head head,
    std::chrono::milliseconds timeout) {

    kvsync::FetchRequest request;
    request.set_begin(begin);
    request.set_end(end);
    request.set_head(head);

    kvsync::FetchResponse response;
    grpc::ClientContext context;
    context.set_deadline(createDeadline(timeout));

    grpc::Status status = stub->Fetch(&context, request, &response);

    if (!status.ok()) {
        throwRemoteError("Fetch", status);
    }

    // Convert protobuf back to C++ struct
    FetchResult result;
    result.head = response.head();
    try {
        result.entries = fromProto(response.entries());
        result.diff = fromProto(response.diff());
    } catch (const std::invalid_argument& e) {
        throw RemoteError(
            static_cast<int>(grpc::StatusCode::DATA_LOSS),
            "Malformed Fetch response from " + address + ": " + e.what()
        );
    }
    return result;
}
