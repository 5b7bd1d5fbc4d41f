#ifndef BOOTSTRAP_DRIVER_HPP
#define BOOTSTRAP_DRIVER_HPP

#include "KVNode.hpp"
#include "NodeRPC.hpp"
#include "NodeConfig.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

enum class BootstrapState : uint8_t {
    INIT,
    FETCHING,
    CAUGHT_UP,
    CANCELLED,
    FAILED
};

const char* toString(BootstrapState state);

// One-shot pull of a remote node into a local one: paginated snapshot
// chunks, each followed by the diff of everything the remote appended
// since the previous chunk.
//
// The cursor advances by maxChunkSize per round whatever the remote
// returned, so keys can be skipped if the remote shrinks mid-transfer.
class BootstrapDriver {
public:
    BootstrapDriver(std::shared_ptr<KVNode> local,
                    std::shared_ptr<NodeRPC> remote,
                    const NodeConfig& config = NodeConfig(),
                    std::string peerName = "remote");

    ~BootstrapDriver();

    BootstrapDriver(const BootstrapDriver&) = delete;
    BootstrapDriver& operator=(const BootstrapDriver&) = delete;

    // Runs the state machine on a background thread
    void start();

    // Runs the state machine on the calling thread until it reaches a
    // terminal state, which is returned. A local failure or a page larger
    // than requested ends in FAILED without retrying.
    BootstrapState run();

    // Observed at the next wait; an in-flight fetch completes first.
    void cancel();
    void join();

    // State Query Methods
    BootstrapState getState() const { return state.load(); }
    bool isFinished() const;
    uint64_t getIndex() const { return index.load(); }
    uint64_t getTarget() const { return target.load(); }
    Head getTrackedHead() const { return trackedHead.load(); }
    uint64_t getRoundsCompleted() const { return roundsCompleted.load(); }

private:
    std::shared_ptr<KVNode> localNode;
    std::shared_ptr<NodeRPC> rpcClient;
    const NodeConfig config;
    const std::string peerName;

    std::atomic<BootstrapState> state;
    std::atomic<uint64_t> index;
    std::atomic<uint64_t> target;
    std::atomic<Head> trackedHead;
    std::atomic<uint64_t> roundsCompleted;

    // Cancellation
    std::mutex waitMutex;
    std::condition_variable waitCondition;
    bool cancelRequested;

    std::thread worker;

    // Returns true if cancelled before the period elapsed
    bool waitOrCancelled(std::chrono::milliseconds period);

    // Retries a remote call with exponential backoff. Returns nullopt after
    // moving to CANCELLED or FAILED.
    template <typename Call>
    auto callRemote(const char* what, Call&& call) -> std::optional<decltype(call())>;

    BootstrapState runStateMachine();
    void finish(BootstrapState terminal);
};

#endif // BOOTSTRAP_DRIVER_HPP
