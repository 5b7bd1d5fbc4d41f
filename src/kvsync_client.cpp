#include "replication/gRPCNodeClient.hpp"
#include "kvstore/Modification.hpp"
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace {

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " <node_address> <command> [args]" << std::endl;
    std::cerr << "Commands:" << std::endl;
    std::cerr << "  insert <key> <value>" << std::endl;
    std::cerr << "  delete <key>" << std::endl;
    std::cerr << "  info" << std::endl;
    std::cerr << "  fetch <begin> <end> [head]" << std::endl;
    std::cerr << "Example: " << program << " 127.0.0.1:5001 insert mykey myvalue" << std::endl;
}

bool parseNumber(const std::string& text, uint64_t& out) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    try {
        out = std::stoull(text);
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

void printModifications(const char* label, const std::vector<Modification>& modifications) {
    std::cout << label << " (" << modifications.size() << "):" << std::endl;
    for (const auto& modification : modifications) {
        std::cout << "  " << describe(modification) << std::endl;
    }
}

}

int main(int argc, char** argv) {
    if (argc < 3) {
        printUsage(argv[0]);
        return 1;
    }

    std::string address = argv[1];
    std::string command = argv[2];
    std::vector<std::string> args(argv + 3, argv + argc);

    GrpcNodeClient client(address);

    try {
        if (command == "insert" && args.size() == 2) {
            Head head = client.sendInsert({UpdateModification{args[0], args[1]}});
            std::cout << "OK head=" << head << std::endl;
        } else if (command == "delete" && args.size() == 1) {
            Head head = client.sendInsert({DeleteModification{args[0]}});
            std::cout << "OK head=" << head << std::endl;
        } else if (command == "info" && args.empty()) {
            NodeInfo info = client.sendInfo();
            std::cout << "head=" << info.head << " size=" << info.size << std::endl;
        } else if (command == "fetch" && (args.size() == 2 || args.size() == 3)) {
            uint64_t begin = 0;
            uint64_t end = 0;
            uint64_t head = 0;
            if (!parseNumber(args[0], begin) || !parseNumber(args[1], end) ||
                (args.size() == 3 && (!parseNumber(args[2], head) || head > UINT32_MAX))) {
                std::cerr << "Error: fetch arguments must be non-negative integers" << std::endl;
                return 1;
            }
            FetchResult result = client.sendFetch(begin, end, static_cast<Head>(head));
            std::cout << "head=" << result.head << std::endl;
            printModifications("entries", result.entries);
            printModifications("diff", result.diff);
        } else {
            std::cerr << "Error: unknown command or wrong arguments: " << command << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    } catch (const RemoteError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
