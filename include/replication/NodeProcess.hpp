#ifndef NODE_PROCESS_HPP
#define NODE_PROCESS_HPP

#include <cstdint>
#include <optional>
#include <string>

// Positional arguments of kvsync_node
struct NodeArgs {
    std::string listenAddress;
    std::optional<std::string> bootstrapPeer;
};

// 1..65535, decimal digits only
std::optional<uint16_t> parseListenPort(const std::string& text);

// host:port, or a bare port meaning 127.0.0.1:<port>
std::optional<std::string> parsePeerAddress(const std::string& text);

// Expects <program> <listen_port> [bootstrap_peer]. Throws
// std::invalid_argument describing the usage error.
NodeArgs parseNodeArgs(int argc, const char* const argv[]);

// SIGINT and SIGTERM set a flag polled by the main loop
void installShutdownHandlers();
bool shutdownRequested();

#endif // NODE_PROCESS_HPP
