#include "replication/NodeProcess.hpp"
#include <csignal>
#include <stdexcept>

namespace {

volatile std::sig_atomic_t shutdownFlag = 0;

void signalHandler(int signal) {
    shutdownFlag = 1;
}

}

std::optional<uint16_t> parseListenPort(const std::string& text) {
    if (text.empty() || text.size() > 5 ||
        text.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    unsigned long port = std::stoul(text);
    if (port == 0 || port > 65535) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(port);
}

std::optional<std::string> parsePeerAddress(const std::string& text) {
    if (auto port = parseListenPort(text)) {
        return "127.0.0.1:" + std::to_string(*port);
    }
    auto colon = text.rfind(':');
    if (colon == std::string::npos || colon == 0 || !parseListenPort(text.substr(colon + 1))) {
        return std::nullopt;
    }
    return text;
}

NodeArgs parseNodeArgs(int argc, const char* const argv[]) {
    if (argc != 2 && argc != 3) {
        throw std::invalid_argument("expected <listen_port> [bootstrap_peer]");
    }

    auto port = parseListenPort(argv[1]);
    if (!port) {
        throw std::invalid_argument("invalid listen port '" + std::string(argv[1]) + "'");
    }

    NodeArgs args;
    args.listenAddress = "127.0.0.1:" + std::to_string(*port);
    if (argc == 3) {
        args.bootstrapPeer = parsePeerAddress(argv[2]);
        if (!args.bootstrapPeer) {
            throw std::invalid_argument("invalid bootstrap peer '" + std::string(argv[2]) + "'");
        }
    }
    return args;
}

void installShutdownHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

bool shutdownRequested() {
    return shutdownFlag != 0;
}
