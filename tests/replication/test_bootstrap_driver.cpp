#include <gtest/gtest.h>
#include "replication/BootstrapDriver.hpp"
#include "replication/InMemoryRPC.hpp"
#include "replication/KVNode.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace {

std::string keyName(int i) {
    return (i < 10 ? "key0" : "key") + std::to_string(i);
}

std::string dumpOf(const KVNode& node) {
    std::ostringstream out;
    node.dump(out);
    return out.str();
}

// Forwards to an InMemoryRPC and runs a hook after every fetch, so tests
// can change the remote between two rounds.
class HookedRPC : public NodeRPC {
public:
    HookedRPC(std::shared_ptr<InMemoryRPC> inner, std::function<void(int)> afterFetch)
        : inner(std::move(inner)), afterFetch(std::move(afterFetch)) {}

    Head sendInsert(const std::vector<Modification>& modifications,
                    std::chrono::milliseconds timeout) override {
        return inner->sendInsert(modifications, timeout);
    }

    NodeInfo sendInfo(std::chrono::milliseconds timeout) override {
        return inner->sendInfo(timeout);
    }

    FetchResult sendFetch(uint64_t begin, uint64_t end, Head head,
                          std::chrono::milliseconds timeout) override {
        FetchResult result = inner->sendFetch(begin, end, head, timeout);
        fetchEnds.push_back(end);
        afterFetch(static_cast<int>(fetchEnds.size()));
        return result;
    }

    std::vector<uint64_t> fetchEnds;

private:
    std::shared_ptr<InMemoryRPC> inner;
    std::function<void(int)> afterFetch;
};

// Answers every fetch with one entry more than the requested range
class OversizedPageRPC : public NodeRPC {
public:
    explicit OversizedPageRPC(std::shared_ptr<InMemoryRPC> inner) : inner(std::move(inner)) {}

    Head sendInsert(const std::vector<Modification>& modifications,
                    std::chrono::milliseconds timeout) override {
        return inner->sendInsert(modifications, timeout);
    }

    NodeInfo sendInfo(std::chrono::milliseconds timeout) override {
        return inner->sendInfo(timeout);
    }

    FetchResult sendFetch(uint64_t begin, uint64_t end, Head head,
                          std::chrono::milliseconds timeout) override {
        FetchResult result = inner->sendFetch(begin, end, head, timeout);
        result.entries.push_back(UpdateModification{"extra", "x"});
        return result;
    }

private:
    std::shared_ptr<InMemoryRPC> inner;
};

}

class BootstrapDriverTest : public ::testing::Test {
protected:
    NodeConfig config;
    std::shared_ptr<KVNode> remote;
    std::shared_ptr<KVNode> local;
    std::shared_ptr<InMemoryRPC> rpc;

    void SetUp() override {
        config.fetchPeriod = std::chrono::milliseconds(0);
        config.retryBackoff = std::chrono::milliseconds(1);
        config.maxRetryBackoff = std::chrono::milliseconds(4);
        config.maxRetries = 2;

        remote = std::make_shared<KVNode>(config);
        local = std::make_shared<KVNode>(config);
        rpc = std::make_shared<InMemoryRPC>(remote);
    }

    void fillRemote(int count) {
        for (int i = 0; i < count; i++) {
            remote->append({UpdateModification{keyName(i), "value" + std::to_string(i)}});
        }
    }

    // Waits up to two seconds for the condition
    bool eventually(const std::function<bool()>& condition) {
        for (int i = 0; i < 200; i++) {
            if (condition()) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return condition();
    }
};

TEST_F(BootstrapDriverTest, FetchRoundsAdvanceByFixedStride) {
    fillRemote(45);
    auto hooked = std::make_shared<HookedRPC>(rpc, [](int) {});
    BootstrapDriver driver(local, hooked, config);

    EXPECT_EQ(driver.run(), BootstrapState::CAUGHT_UP);

    EXPECT_EQ(rpc->getFetchOffsets(), (std::vector<uint64_t>{0, 20, 40}));
    EXPECT_EQ(hooked->fetchEnds, (std::vector<uint64_t>{20, 40, 45}));
    EXPECT_EQ(driver.getIndex(), 60);
    EXPECT_EQ(driver.getTarget(), 45);
    EXPECT_EQ(driver.getRoundsCompleted(), 3);
}

TEST_F(BootstrapDriverTest, CopiesRemoteContents) {
    fillRemote(45);
    BootstrapDriver driver(local, rpc, config);

    EXPECT_EQ(driver.run(), BootstrapState::CAUGHT_UP);

    EXPECT_EQ(local->info().size, 45);
    EXPECT_EQ(dumpOf(*local), dumpOf(*remote));
    EXPECT_EQ(driver.getTrackedHead(), remote->info().head);
}

TEST_F(BootstrapDriverTest, EmptyRemoteCatchesUpWithoutFetching) {
    BootstrapDriver driver(local, rpc, config);

    EXPECT_EQ(driver.run(), BootstrapState::CAUGHT_UP);

    EXPECT_TRUE(rpc->getFetchOffsets().empty());
    EXPECT_EQ(driver.getIndex(), 0);
    EXPECT_EQ(local->info().size, 0);
}

TEST_F(BootstrapDriverTest, RemoteWritesDuringTransferArriveThroughDiff) {
    fillRemote(45);
    auto hooked = std::make_shared<HookedRPC>(rpc, [this](int round) {
        if (round == 1) {
            // key05 goes away and key05b takes its place in key order,
            // so later ordinals do not move.
            remote->append({UpdateModification{"key01", "changed"},
                            DeleteModification{"key05"},
                            UpdateModification{"key05b", "inserted"}});
        }
        if (round == 2) {
            remote->append({UpdateModification{"zzz", "beyond the target"}});
            remote->append({UpdateModification{"zzz", "latest"}});
        }
    });
    BootstrapDriver driver(local, hooked, config);

    EXPECT_EQ(driver.run(), BootstrapState::CAUGHT_UP);

    EXPECT_EQ(local->get("key01"), std::optional<std::string>("changed"));
    EXPECT_FALSE(local->get("key05").has_value());
    EXPECT_EQ(local->get("key05b"), std::optional<std::string>("inserted"));
    EXPECT_EQ(local->get("zzz"), std::optional<std::string>("latest"));
    EXPECT_EQ(dumpOf(*local), dumpOf(*remote));
}

TEST_F(BootstrapDriverTest, ShrinkingRemoteCanSkipEntries) {
    fillRemote(45);
    auto hooked = std::make_shared<HookedRPC>(rpc, [this](int round) {
        if (round == 1) {
            // Removes an already transferred key: key20 moves to ordinal 19,
            // which the next page no longer covers.
            remote->append({DeleteModification{keyName(0)}});
        }
    });
    BootstrapDriver driver(local, hooked, config);

    EXPECT_EQ(driver.run(), BootstrapState::CAUGHT_UP);

    EXPECT_FALSE(local->get(keyName(0)).has_value());
    EXPECT_FALSE(local->get(keyName(20)).has_value());
    EXPECT_EQ(local->info().size, remote->info().size - 1);
}

TEST_F(BootstrapDriverTest, UnreachableRemoteFailsAfterRetries) {
    fillRemote(5);
    rpc->setReachable(false);
    BootstrapDriver driver(local, rpc, config);

    EXPECT_EQ(driver.run(), BootstrapState::FAILED);

    EXPECT_EQ(rpc->getCallCount(), 3);

    // The local node keeps serving
    local->append({UpdateModification{"a", "1"}});
    EXPECT_EQ(local->info().size, 1);
}

TEST_F(BootstrapDriverTest, TransientFailuresAreRetried) {
    fillRemote(25);
    rpc->failNextCalls(2);
    BootstrapDriver driver(local, rpc, config);

    EXPECT_EQ(driver.run(), BootstrapState::CAUGHT_UP);
    EXPECT_EQ(dumpOf(*local), dumpOf(*remote));
}

TEST_F(BootstrapDriverTest, FailureMidTransferKeepsAppliedChunks) {
    fillRemote(45);
    auto hooked = std::make_shared<HookedRPC>(rpc, [this](int round) {
        if (round == 1) {
            rpc->setReachable(false);
        }
    });
    BootstrapDriver driver(local, hooked, config);

    EXPECT_EQ(driver.run(), BootstrapState::FAILED);

    EXPECT_EQ(driver.getIndex(), 20);
    EXPECT_EQ(local->info().size, 20);
}

TEST_F(BootstrapDriverTest, OversizedPageFailsWithoutRetry) {
    fillRemote(5);
    BootstrapDriver driver(local, std::make_shared<OversizedPageRPC>(rpc), config);

    EXPECT_EQ(driver.run(), BootstrapState::FAILED);

    EXPECT_EQ(driver.getState(), BootstrapState::FAILED);
    EXPECT_TRUE(driver.isFinished());
    EXPECT_EQ(rpc->getCallCount(), 2);
    EXPECT_EQ(local->info().size, 0);
    EXPECT_FALSE(local->get("extra").has_value());
}

TEST_F(BootstrapDriverTest, CancelDuringFetchWait) {
    fillRemote(45);
    config.fetchPeriod = std::chrono::seconds(30);
    BootstrapDriver driver(local, rpc, config);

    driver.start();
    ASSERT_TRUE(eventually([&driver]() { return driver.getRoundsCompleted() >= 1; }));
    EXPECT_FALSE(driver.isFinished());

    driver.cancel();
    driver.join();

    EXPECT_EQ(driver.getState(), BootstrapState::CANCELLED);
    EXPECT_TRUE(driver.isFinished());
    EXPECT_EQ(driver.getRoundsCompleted(), 1);
    EXPECT_EQ(local->info().size, 20);
}

TEST_F(BootstrapDriverTest, CancelDuringRetryBackoff) {
    rpc->setReachable(false);
    config.retryBackoff = std::chrono::seconds(30);
    config.maxRetryBackoff = std::chrono::seconds(30);
    BootstrapDriver driver(local, rpc, config);

    driver.start();
    ASSERT_TRUE(eventually([this]() { return rpc->getCallCount() >= 1; }));

    driver.cancel();
    driver.join();

    EXPECT_EQ(driver.getState(), BootstrapState::CANCELLED);
}

TEST_F(BootstrapDriverTest, CancelBeforeRunDoesNothing) {
    fillRemote(5);
    BootstrapDriver driver(local, rpc, config);

    driver.cancel();

    EXPECT_EQ(driver.run(), BootstrapState::CANCELLED);
    EXPECT_EQ(rpc->getCallCount(), 0);
    EXPECT_EQ(local->info().size, 0);
}

TEST_F(BootstrapDriverTest, DestructorStopsRunningDriver) {
    fillRemote(45);
    config.fetchPeriod = std::chrono::seconds(30);
    auto start = std::chrono::steady_clock::now();
    {
        BootstrapDriver driver(local, rpc, config);
        driver.start();
        ASSERT_TRUE(eventually([&driver]() { return driver.getRoundsCompleted() >= 1; }));
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));
}

TEST_F(BootstrapDriverTest, LocalWritesInterleaveWithBootstrap) {
    fillRemote(45);
    config.fetchPeriod = std::chrono::milliseconds(5);
    BootstrapDriver driver(local, rpc, config);

    driver.start();
    for (int i = 0; i < 20; i++) {
        local->append({UpdateModification{"local" + std::to_string(i), "x"}});
    }
    driver.join();

    EXPECT_EQ(driver.getState(), BootstrapState::CAUGHT_UP);
    EXPECT_EQ(local->info().size, 65);
}
