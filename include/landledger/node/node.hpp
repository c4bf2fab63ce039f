#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "landledger/core/chain.hpp"
#include "landledger/core/mempool.hpp"
#include "landledger/node/peer_registry.hpp"
#include "landledger/storage/block_store.hpp"
#include "landledger/storage/mempool_store.hpp"

namespace landledger::node {

  struct NodeConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 5000;
    std::filesystem::path data_dir = "data";
    core::ChainConfig chain{};
    std::vector<std::string> peers;
    std::chrono::milliseconds sync_interval{5000};
    std::chrono::milliseconds peer_timeout{3000};
    uint64_t peer_body_limit = 64ULL * 1024 * 1024;
  };

  // Head snapshot plus the transactions to seal, taken under the node lock
  // so the proof search can run without it.
  struct MiningJob {
    uint64_t index = 0;
    uint64_t last_proof = 0;
    std::string previous_hash;
    std::vector<core::Transaction> transactions;
  };

  enum class MineStatus {
    Mined,
    EmptyMempool,
    Stale,
  };

  struct MineOutcome {
    MineStatus status;
    core::Block block;
    core::ValidationResult validation{true, core::ValidationError::None, 0};
  };

  /**
   * Node context: the one owner of the chain, the pending pool, the peer set
   * and their durable stores. The HTTP layer and the sync scheduler share a
   * reference to it; every read-modify-write goes through its methods under a
   * single mutex. Peer I/O and proof search never run under that mutex.
   *
   * Persistence failures propagate as StoreError / std::system_error after the
   * in-memory state has been updated; the next write of the chain log is then
   * a full rewrite.
   */
  class Node {
    public:
      explicit Node(NodeConfig config);

      Node(const Node&) = delete;
      Node& operator=(const Node&) = delete;

      const NodeConfig& config() const { return config_; }
      uint32_t difficulty() const { return config_.chain.difficulty; }

      std::vector<core::Block> chain_snapshot() const;
      size_t chain_length() const;
      core::Block head() const;
      std::vector<core::Transaction> mempool_snapshot() const;
      size_t mempool_size() const;

      core::Transaction submit_transaction(core::CertificateFields fields);

      std::optional<MiningJob> prepare_mining() const;

      // Seal `job` with `proof` and append it against the current head.
      // A head that moved since prepare_mining() yields a linkage error.
      core::ValidationResult commit_mined(const MiningJob& job, uint64_t proof, core::Block* mined = nullptr);

      // prepare_mining + proof_of_work + commit_mined.
      MineOutcome mine();

      // Replace the chain if `candidate` is valid and strictly longer than the
      // current one, then drop its transactions from the pool.
      bool adopt_chain(std::vector<core::Block> candidate);

      // Merge remote pending transactions, ignoring ones already on chain.
      size_t merge_mempool(const std::vector<core::Transaction>& remote);

      PeerRegistry& peers() { return peers_; }
      const PeerRegistry& peers() const { return peers_; }

    private:
      void load_from_durable();
      void persist_chain_locked(const core::Block* appended);

      NodeConfig config_;
      mutable std::mutex mutex_;
      storage::BlockStore block_store_;
      storage::MempoolStore mempool_store_;
      core::Chain chain_;
      core::TransactionPool mempool_;
      PeerRegistry peers_;
      bool chain_dirty_ = false;
  };
}
