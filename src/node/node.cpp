#include "landledger/node/node.hpp"
#include "landledger/core/miner.hpp"

#include <exception>
#include <unordered_set>

#include <spdlog/spdlog.h>

using namespace landledger::core;

namespace landledger::node {

  namespace {
    std::unordered_set<std::string> txids_of(const Block& block) {
      std::unordered_set<std::string> out;
      for (const auto& tx : block.transactions) out.insert(tx.txid);
      return out;
    }
  }

  Node::Node(NodeConfig config)
    : config_(std::move(config)),
      block_store_(config_.data_dir, config_.port),
      mempool_store_(config_.data_dir, config_.port),
      chain_(config_.chain),
      mempool_(&mempool_store_) {
    load_from_durable();
    for (const auto& peer : config_.peers) peers_.register_peer(peer);
  }

  void Node::load_from_durable() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!chain_.restore_from_store(block_store_)) {
      spdlog::warn("chain log {} missing or damaged, rewriting {} block(s)",
                   block_store_.log_path().string(), chain_.length());
      chain_dirty_ = true;
      persist_chain_locked(nullptr);
    }
    mempool_.restore_from_store();
    auto stale = mempool_.commit(chain_.txids());
    spdlog::info("loaded chain of {} block(s), {} pending transaction(s) ({} already on chain)",
                 chain_.length(), mempool_.size(), stale);
  }

  void Node::persist_chain_locked(const Block* appended) {
    try {
      if (appended && !chain_dirty_) {
        block_store_.append_block(*appended);
      } else {
        block_store_.rewrite(chain_.blocks());
      }
      chain_dirty_ = false;
    } catch (...) {
      chain_dirty_ = true;
      throw;
    }
  }

  std::vector<Block> Node::chain_snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chain_.blocks();
  }

  size_t Node::chain_length() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chain_.length();
  }

  Block Node::head() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chain_.head();
  }

  std::vector<Transaction> Node::mempool_snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return mempool_.snapshot();
  }

  size_t Node::mempool_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return mempool_.size();
  }

  Transaction Node::submit_transaction(CertificateFields fields) {
    auto tx = make_transaction(std::move(fields), unix_now());
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& stored = mempool_.add(std::move(tx));
    spdlog::info("accepted transaction {} (sertifikat {})", stored.txid, stored.nomor_sertifikat);
    return stored;
  }

  std::optional<MiningJob> Node::prepare_mining() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (mempool_.empty()) return std::nullopt;

    const auto& head = chain_.head();
    MiningJob job;
    job.index = head.index + 1;
    job.last_proof = head.proof;
    job.previous_hash = head.hash;
    job.transactions = mempool_.snapshot();
    return job;
  }

  ValidationResult Node::commit_mined(const MiningJob& job, uint64_t proof, Block* mined) {
    auto block = make_block(job.index, unix_now(), job.transactions, proof, job.previous_hash);

    std::lock_guard<std::mutex> lock(mutex_);
    auto validation_result = chain_.append_block(block);
    if (!validation_result.is_valid) {
      spdlog::warn("discarding mined block {}: {}", block.index, to_string(validation_result.error));
      return validation_result;
    }
    if (mined) *mined = block;

    std::exception_ptr write_failure;
    try {
      persist_chain_locked(&block);
    } catch (const std::exception& e) {
      spdlog::error("failed to persist block {}: {}", block.index, e.what());
      write_failure = std::current_exception();
    }
    mempool_.commit(txids_of(block));
    spdlog::info("mined block {} with {} transaction(s), proof {}", block.index, block.transactions.size(), block.proof);
    if (write_failure) std::rethrow_exception(write_failure);
    return validation_result;
  }

  MineOutcome Node::mine() {
    auto job = prepare_mining();
    if (!job) return {MineStatus::EmptyMempool, {}, {false, ValidationError::None, 0}};

    auto on_progress = [](uint64_t attempts, uint32_t leading_zeros, const std::string& hash_hex) {
      spdlog::debug("mining: attempts={} lz={} hash={}...", attempts, leading_zeros, hash_hex.substr(0, 10));
    };
    auto proof = proof_of_work(job->last_proof, difficulty(), on_progress);

    MineOutcome outcome{MineStatus::Mined, {}};
    outcome.validation = commit_mined(*job, proof, &outcome.block);
    if (!outcome.validation.is_valid) outcome.status = MineStatus::Stale;
    return outcome;
  }

  bool Node::adopt_chain(std::vector<Block> candidate) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (candidate.size() <= chain_.length()) return false;

    auto candidate_length = candidate.size();
    auto validation_result = chain_.replace_blocks(std::move(candidate));
    if (!validation_result.is_valid) {
      spdlog::warn("rejected candidate chain at block {}: {}", validation_result.block_index,
                   to_string(validation_result.error));
      return false;
    }

    std::exception_ptr write_failure;
    try {
      persist_chain_locked(nullptr);
    } catch (const std::exception& e) {
      spdlog::error("failed to persist adopted chain: {}", e.what());
      write_failure = std::current_exception();
    }
    auto reconciled = mempool_.commit(chain_.txids());
    spdlog::info("adopted chain of length {}, {} pending transaction(s) already included", candidate_length, reconciled);
    if (write_failure) std::rethrow_exception(write_failure);
    return true;
  }

  size_t Node::merge_mempool(const std::vector<Transaction>& remote) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto committed = chain_.txids();
    std::vector<Transaction> fresh;
    fresh.reserve(remote.size());
    for (const auto& tx : remote) {
      if (!committed.count(tx.txid)) fresh.push_back(tx);
    }
    return mempool_.merge(fresh);
  }
}
