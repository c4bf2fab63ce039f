#include <gtest/gtest.h>
#include <atomic>
#include <mutex>
#include <stdexcept>
#include "landledger/node/sync_scheduler.hpp"
#include "fake_peer_client.hpp"
#include "test_util.hpp"

using namespace std::chrono_literals;
using landledger::node::ConsensusResolver;
using landledger::node::MempoolSynchronizer;
using landledger::node::Node;
using landledger::node::SyncScheduler;
using landledger::test::FakePeerClient;
using landledger::test::node_config;
using landledger::test::wait_until;

namespace {
  struct ErrorLog {
    std::mutex mutex;
    std::vector<std::pair<std::string, std::string>> entries;

    SyncScheduler::ErrorCallback callback() {
      return [this](const std::string& phase, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex);
        entries.emplace_back(phase, message);
      };
    }

    size_t size() {
      std::lock_guard<std::mutex> lock(mutex);
      return entries.size();
    }
  };

  // Throws something the resolver does not treat as a per-peer failure.
  class BrokenPeerClient : public FakePeerClient {
    public:
      std::vector<landledger::core::Block> fetch_chain(const std::string&) override {
        throw std::logic_error("peer client bug");
      }
  };
}

TEST(SyncScheduler, RunCycleRunsResolveThenMempool) {
  std::vector<std::string> order;
  SyncScheduler scheduler([&] { order.push_back("resolve"); }, [&] { order.push_back("mempool"); }, 1h);
  scheduler.run_cycle();
  scheduler.run_cycle();
  EXPECT_EQ(order, (std::vector<std::string>{"resolve", "mempool", "resolve", "mempool"}));
  EXPECT_EQ(scheduler.cycles(), 2u);
}

TEST(SyncScheduler, SurvivesThrowingPhaseAndReportsIt) {
  ErrorLog errors;
  std::atomic<int> mempool_runs{0};
  SyncScheduler scheduler([] { throw std::runtime_error("boom"); }, [&] { ++mempool_runs; }, 5ms,
                          errors.callback());

  scheduler.start();
  EXPECT_TRUE(wait_until([&] { return mempool_runs.load() >= 3; }));
  scheduler.stop();

  // The throwing phase does not stop the other phase or later cycles
  EXPECT_GE(errors.size(), 3u);
  std::lock_guard<std::mutex> lock(errors.mutex);
  EXPECT_EQ(errors.entries[0].first, "resolve");
  EXPECT_EQ(errors.entries[0].second, "boom");
}

TEST(SyncScheduler, StopWakesSleepingWorker) {
  SyncScheduler scheduler([] {}, [] {}, 1h);
  scheduler.start();
  EXPECT_TRUE(scheduler.running());
  ASSERT_TRUE(wait_until([&] { return scheduler.cycles() >= 1; }));

  auto started = std::chrono::steady_clock::now();
  scheduler.stop();
  EXPECT_LT(std::chrono::steady_clock::now() - started, 2s);
  EXPECT_FALSE(scheduler.running());
  EXPECT_EQ(scheduler.cycles(), 1u);
}

TEST(SyncScheduler, ConvergesNodeWithPeers) {
  Node node(node_config("scheduler_converge"));
  FakePeerClient client;
  node.peers().register_peer("localhost:5001");

  landledger::core::Chain peer(node.config().chain);
  landledger::test::grow(peer, 2, "bg");
  client.chains["localhost:5001"] = peer.blocks();
  client.mempools["localhost:5001"] = {landledger::test::certificate("pending")};

  ConsensusResolver resolver(node, client);
  MempoolSynchronizer synchronizer(node, client);
  SyncScheduler scheduler(resolver, synchronizer, 10ms);
  scheduler.start();
  EXPECT_TRUE(wait_until([&] { return node.chain_length() == 3 && node.mempool_size() == 1; }));
  scheduler.stop();
}

TEST(SyncScheduler, ReportsUnexpectedResolverFailure) {
  Node node(node_config("scheduler_broken"));
  BrokenPeerClient client;
  node.peers().register_peer("localhost:5001");
  client.mempools["localhost:5001"] = {landledger::test::certificate("still-synced")};

  ErrorLog errors;
  ConsensusResolver resolver(node, client);
  MempoolSynchronizer synchronizer(node, client);
  SyncScheduler scheduler(resolver, synchronizer, 1h, errors.callback());

  scheduler.run_cycle();
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors.entries[0].first, "resolve");
  EXPECT_EQ(errors.entries[0].second, "peer client bug");
  EXPECT_EQ(node.mempool_size(), 1u);
}
