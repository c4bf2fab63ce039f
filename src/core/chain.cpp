#include "landledger/core/chain.hpp"
#include "landledger/core/block.hpp"
#include "landledger/core/pow.hpp"
#include "landledger/storage/block_store.hpp"
#include <cstdint>

namespace landledger::core {

  const char* to_string(ValidationError error) {
    switch (error) {
      case ValidationError::None: return "ok";
      case ValidationError::EmptyChain: return "empty chain";
      case ValidationError::BadGenesis: return "bad genesis";
      case ValidationError::BadIndex: return "bad index";
      case ValidationError::BadPrevLink: return "previous hash mismatch";
      case ValidationError::HashMismatch: return "hash does not match content";
      case ValidationError::InsufficientPOW: return "insufficient proof of work";
    }
    return "unknown";
  }

  ValidationResult validate_genesis(const Block& genesis) {
    if (genesis.index != GENESIS_INDEX || genesis.previous_hash != GENESIS_PREV_HASH) {
      return {false, ValidationError::BadGenesis, genesis.index};
    }
    if (genesis.hash != genesis.compute_hash()) {
      return {false, ValidationError::HashMismatch, genesis.index};
    }
    return {true, ValidationError::None, 0};
  }

  ValidationResult validate_link(const Block& prev, const Block& curr, uint32_t difficulty) {
    if (curr.index != prev.index + 1) {
      return {false, ValidationError::BadIndex, curr.index};
    }
    if (curr.previous_hash != prev.hash) {
      return {false, ValidationError::BadPrevLink, curr.index};
    }
    if (curr.hash != curr.compute_hash()) {
      return {false, ValidationError::HashMismatch, curr.index};
    }
    if (!pow::valid_proof(prev.proof, curr.proof, difficulty)) {
      return {false, ValidationError::InsufficientPOW, curr.index};
    }
    return {true, ValidationError::None, 0};
  }

  ValidationResult validate_chain(const std::vector<Block>& blocks, uint32_t difficulty) {
    if (blocks.empty()) return {false, ValidationError::EmptyChain, 0};

    auto genesis_result = validate_genesis(blocks.front());
    if (!genesis_result.is_valid) return genesis_result;

    for (size_t i = 1; i < blocks.size(); ++i) {
      auto link_result = validate_link(blocks[i - 1], blocks[i], difficulty);
      if (!link_result.is_valid) return link_result;
    }
    return {true, ValidationError::None, 0};
  }

  std::vector<ValidationResult> audit_chain(const std::vector<Block>& blocks, uint32_t difficulty) {
    std::vector<ValidationResult> report;
    report.reserve(blocks.size());
    for (size_t i = 0; i < blocks.size(); ++i) {
      auto result = (i == 0) ? validate_genesis(blocks[i]) : validate_link(blocks[i - 1], blocks[i], difficulty);
      if (result.is_valid) result.block_index = blocks[i].index;
      report.push_back(result);
    }
    return report;
  }

  Chain::Chain(ChainConfig config) : config_(config) {
    blocks_.push_back(make_genesis_block(config_.genesis_timestamp));
  }

  const Block* Chain::block_at_index(uint64_t index) const {
    if (index < GENESIS_INDEX || index - GENESIS_INDEX >= blocks_.size()) return nullptr;
    return &blocks_[index - GENESIS_INDEX];
  }

  ValidationResult Chain::validate_block(const Block& block) const {
    return validate_link(head(), block, config_.difficulty);
  }

  ValidationResult Chain::append_block(const Block& block) {
    auto validation_result = validate_block(block);
    if (!validation_result.is_valid) return validation_result;
    blocks_.push_back(block);
    return validation_result;
  }

  Block Chain::build_block(std::vector<Transaction> transactions, uint64_t proof, uint64_t timestamp) const {
    return make_block(head().index + 1, timestamp, std::move(transactions), proof, head().hash);
  }

  ValidationResult Chain::replace_blocks(std::vector<Block> blocks) {
    auto validation_result = validate_chain(blocks, config_.difficulty);
    if (!validation_result.is_valid) return validation_result;
    blocks_ = std::move(blocks);
    return validation_result;
  }

  bool Chain::restore_from_store(landledger::storage::BlockStore& store) {
    auto stored_blocks = store.load_all_blocks();
    if (stored_blocks.empty() || !validate_genesis(stored_blocks.front()).is_valid) {
      blocks_.assign(1, make_genesis_block(config_.genesis_timestamp));
      return false;
    }

    blocks_.assign(1, stored_blocks.front());
    for (size_t i = 1; i < stored_blocks.size(); ++i) {
      auto validation_result = append_block(stored_blocks[i]);
      if (!validation_result.is_valid) return false;
    }
    return true;
  }

  std::unordered_set<std::string> Chain::txids() const {
    std::unordered_set<std::string> out;
    for (const auto& block : blocks_) {
      for (const auto& tx : block.transactions) out.insert(tx.txid);
    }
    return out;
  }
}
