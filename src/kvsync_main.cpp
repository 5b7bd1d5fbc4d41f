#include "replication/KVNode.hpp"
#include "replication/BootstrapDriver.hpp"
#include "replication/NodeProcess.hpp"
#include "replication/gRPCNodeClient.hpp"
#include "replication/gRPCNodeService.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

namespace {

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " <listen_port> [bootstrap_peer]" << std::endl;
    std::cerr << "  bootstrap_peer is host:port, or a bare port on 127.0.0.1" << std::endl;
    std::cerr << "Example: " << program << " 5002 5001" << std::endl;
}

}

int main(int argc, char** argv) {
    // Parse arguments
    NodeArgs args;
    try {
        args = parseNodeArgs(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        printUsage(argv[0]);
        return 1;
    }
    const std::string& listenAddress = args.listenAddress;

    NodeConfig config;
    try {
        config = NodeConfig::fromEnvironment();
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    // Installed before serving so an early signal still ends in the dump
    installShutdownHandlers();

    std::cout << "=== Starting kvsync node ===" << std::endl;
    std::cout << "Listen Address: " << listenAddress << std::endl;
    std::cout << "Max chunk size: " << config.maxChunkSize
              << " | Log capacity: " << config.logCapacity
              << " | Fetch period: " << config.fetchPeriod.count() << "ms" << std::endl;

    // Components
    auto node = std::make_shared<KVNode>(config);

    std::unique_ptr<GrpcNodeServer> server;
    try {
        server = std::make_unique<GrpcNodeServer>(node, listenAddress);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "Node is running on " << listenAddress << std::endl;
    std::cout << "Example insertion:" << std::endl;
    std::cout << "  kvsync_client " << listenAddress << " insert key value" << std::endl;
    std::cout << "Press Ctrl+C to stop" << std::endl;

    std::unique_ptr<BootstrapDriver> bootstrap;
    if (args.bootstrapPeer) {
        const std::string& peer = *args.bootstrapPeer;
        std::cout << "Bootstrapping from " << peer << std::endl;
        auto rpcClient = std::make_shared<GrpcNodeClient>(peer);
        bootstrap = std::make_unique<BootstrapDriver>(node, rpcClient, config, peer);
        bootstrap->start();
    }

    int ticks = 0;
    while (!shutdownRequested()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        // Print status every 5 seconds
        if (++ticks % 50 == 0) {
            NodeInfo info = node->info();
            std::cout << "Node " << listenAddress
                      << " | Head: " << info.head
                      << " | Size: " << info.size
                      << " | Log: " << node->getLogSize() << "/" << config.logCapacity;
            if (bootstrap) {
                std::cout << " | Bootstrap: " << toString(bootstrap->getState());
                if (!bootstrap->isFinished()) {
                    std::cout << " " << std::min(bootstrap->getIndex(), bootstrap->getTarget())
                              << "/" << bootstrap->getTarget();
                }
            }
            std::cout << std::endl;
        }
    }

    std::cout << "\nShutting down..." << std::endl;
    if (bootstrap) {
        bootstrap->cancel();
        bootstrap->join();
    }
    server->stop();

    std::cout << "Shutdown... dump entries:\n" << std::endl;
    node->dump(std::cout);

    return 0;
}
