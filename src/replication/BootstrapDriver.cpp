#include "replication/BootstrapDriver.hpp"
#include <algorithm>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

const char* toString(BootstrapState state) {
    switch (state) {
        case BootstrapState::INIT:      return "INIT";
        case BootstrapState::FETCHING:  return "FETCHING";
        case BootstrapState::CAUGHT_UP: return "CAUGHT_UP";
        case BootstrapState::CANCELLED: return "CANCELLED";
        case BootstrapState::FAILED:    return "FAILED";
    }
    return "UNKNOWN";
}

BootstrapDriver::BootstrapDriver(std::shared_ptr<KVNode> local,
                                 std::shared_ptr<NodeRPC> remote,
                                 const NodeConfig& config,
                                 std::string peerName)
    : localNode(std::move(local)),
      rpcClient(std::move(remote)),
      config(config),
      peerName(std::move(peerName)),
      state(BootstrapState::INIT),
      index(0),
      target(0),
      trackedHead(0),
      roundsCompleted(0),
      cancelRequested(false) {

    if (!localNode || !rpcClient) {
        throw std::invalid_argument("BootstrapDriver requires a local node and a remote client");
    }
    config.validate();
}

BootstrapDriver::~BootstrapDriver() {
    cancel();
    join();
}

void BootstrapDriver::start() {
    if (worker.joinable()) {
        throw std::logic_error("Bootstrap already started");
    }
    worker = std::thread([this]() { run(); });
}

BootstrapState BootstrapDriver::run() {
    BootstrapState terminal;
    try {
        terminal = runStateMachine();
    } catch (const std::exception& e) {
        // Not retried; the node keeps serving.
        std::cerr << "Bootstrap from " << peerName << " aborted: " << e.what() << std::endl;
        terminal = BootstrapState::FAILED;
    }
    finish(terminal);
    return terminal;
}

void BootstrapDriver::cancel() {
    {
        std::lock_guard<std::mutex> lock(waitMutex);
        cancelRequested = true;
    }
    waitCondition.notify_all();
}

void BootstrapDriver::join() {
    if (worker.joinable()) {
        worker.join();
    }
}

bool BootstrapDriver::isFinished() const {
    BootstrapState current = state.load();
    return current == BootstrapState::CAUGHT_UP ||
           current == BootstrapState::CANCELLED ||
           current == BootstrapState::FAILED;
}

bool BootstrapDriver::waitOrCancelled(std::chrono::milliseconds period) {
    std::unique_lock<std::mutex> lock(waitMutex);
    return waitCondition.wait_for(lock, period, [this]() { return cancelRequested; });
}

void BootstrapDriver::finish(BootstrapState terminal) {
    state = terminal;
    std::cout << "Bootstrap from " << peerName << " finished: " << toString(terminal)
              << " (index=" << index.load() << " target=" << target.load()
              << " head=" << trackedHead.load() << " rounds=" << roundsCompleted.load() << ")" << std::endl;
}

template <typename Call>
auto BootstrapDriver::callRemote(const char* what, Call&& call) -> std::optional<decltype(call())> {
    std::chrono::milliseconds backoff = config.retryBackoff;

    for (uint32_t attempt = 0; ; ++attempt) {
        try {
            return call();
        } catch (const std::exception& e) {
            std::cerr << "Bootstrap from " << peerName << ": " << what << " failed (attempt "
                      << (attempt + 1) << "/" << (config.maxRetries + 1) << "): "
                      << e.what() << std::endl;
        }

        if (attempt >= config.maxRetries) {
            state = BootstrapState::FAILED;
            return std::nullopt;
        }
        if (waitOrCancelled(backoff)) {
            state = BootstrapState::CANCELLED;
            return std::nullopt;
        }
        backoff = std::min(backoff * 2, config.maxRetryBackoff);
    }
}

BootstrapState BootstrapDriver::runStateMachine() {
    state = BootstrapState::INIT;
    {
        std::lock_guard<std::mutex> lock(waitMutex);
        if (cancelRequested) {
            return BootstrapState::CANCELLED;
        }
    }

    auto info = callRemote("info", [this]() {
        return rpcClient->sendInfo(config.rpcTimeout);
    });
    if (!info) {
        return state.load();
    }

    index = 0;
    target = info->size;
    trackedHead = info->head;
    std::cout << "Bootstrap from " << peerName << ": remote head=" << info->head
              << " size=" << info->size << std::endl;

    state = BootstrapState::FETCHING;
    while (index < target) {
        uint64_t begin = index;
        uint64_t end = std::min<uint64_t>(begin + config.maxChunkSize, target);
        Head since = trackedHead;

        auto chunk = callRemote("fetch", [this, begin, end, since]() {
            return rpcClient->sendFetch(begin, end, since, config.rpcTimeout);
        });
        if (!chunk) {
            return state.load();
        }

        if (chunk->entries.size() > end - begin) {
            throw std::runtime_error("remote returned " + std::to_string(chunk->entries.size()) +
                                     " entries for a page of " + std::to_string(end - begin));
        }
        trackedHead = chunk->head;

        // Page first, then the changes made since the previous round
        std::vector<Modification> batch = std::move(chunk->entries);
        batch.insert(batch.end(),
                     std::make_move_iterator(chunk->diff.begin()),
                     std::make_move_iterator(chunk->diff.end()));
        localNode->append(batch);

        index += config.maxChunkSize;
        ++roundsCompleted;

        std::cout << "Bootstrap from " << peerName << ": round " << roundsCompleted.load()
                  << " applied " << batch.size() << " modifications, progress "
                  << std::min<uint64_t>(index.load(), target.load()) << "/" << target.load()
                  << ", remote head " << trackedHead.load() << std::endl;

        if (index < target && waitOrCancelled(config.fetchPeriod)) {
            return BootstrapState::CANCELLED;
        }
    }

    return BootstrapState::CAUGHT_UP;
}
