#ifndef NODE_RPC_HPP
#define NODE_RPC_HPP

#include "kvstore/Modification.hpp"
#include "ModificationLog.hpp"

#include <memory>
#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

struct NodeInfo;
struct FetchResult;

// Remote call failed: peer unreachable, deadline exceeded, or the peer
// rejected the request. `code` carries the transport status code.
class RemoteError : public std::runtime_error {
public:
    RemoteError(int code, const std::string& message)
        : std::runtime_error(message), code(code) {}

    int getCode() const { return code; }

private:
    int code;
};

// Abstract client interface to one remote node.
// Implementations throw RemoteError on failure.
class NodeRPC {
public:
    virtual ~NodeRPC() = default;

    virtual Head sendInsert(
        const std::vector<Modification>& modifications,
        std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)
    ) = 0;

    virtual NodeInfo sendInfo(
        std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)
    ) = 0;

    virtual FetchResult sendFetch(
        uint64_t begin,
        uint64_t end,
        Head head,
        std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)
    ) = 0;
};

#endif // NODE_RPC_HPP
