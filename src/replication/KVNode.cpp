#include "replication/KVNode.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>


KVNode::KVNode(const NodeConfig& config)
    : config(config),
      store(),
      log(config.logCapacity) {
    config.validate();
}

Head KVNode::append(const std::vector<Modification>& modifications) {
    std::lock_guard<std::mutex> lock(stateMutex);

    for (const auto& modification : modifications) {
        store.apply(modification);
    }
    return log.record(modifications);
}

NodeInfo KVNode::info() const {
    std::lock_guard<std::mutex> lock(stateMutex);

    NodeInfo reply;
    reply.head = log.getCurrentHead();
    reply.size = store.size();
    return reply;
}

FetchResult KVNode::fetch(uint64_t begin, uint64_t end, Head head) const {
    if (end < begin) {
        throw std::invalid_argument(
            "Invalid fetch range: end " + std::to_string(end) +
            " is before begin " + std::to_string(begin)
        );
    }
    uint64_t pageSize = std::min<uint64_t>(config.maxChunkSize, end - begin);

    std::lock_guard<std::mutex> lock(stateMutex);

    FetchResult result;
    result.head = log.getCurrentHead();
    result.entries = store.page(static_cast<size_t>(begin), static_cast<size_t>(pageSize));
    result.diff = log.diffSince(head);
    return result;
}

void KVNode::dump(std::ostream& out) const {
    std::lock_guard<std::mutex> lock(stateMutex);

    store.forEach([&out](const std::string& key, const std::string& value) {
        out << key << " - " << value << "\n";
    });
    out.flush();
}

std::optional<std::string> KVNode::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return store.get(key);
}

size_t KVNode::getLogSize() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return log.size();
}
