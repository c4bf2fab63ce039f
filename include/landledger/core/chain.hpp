#pragma once
#include <cstdint>
#include <string>
#include <unordered_set>
#include <vector>
#include "landledger/core/block.hpp"
#include "landledger/core/transaction.hpp"

namespace landledger { namespace storage { class BlockStore; } }

namespace landledger::core {

  enum class ValidationError {
    None = 0,
    EmptyChain,
    BadGenesis,
    BadIndex,
    BadPrevLink,
    HashMismatch,
    InsufficientPOW,
  };

  struct ValidationResult {
    bool is_valid;
    ValidationError error;
    // Index (genesis = 1) of the offending block, 0 when not block specific.
    uint64_t block_index = 0;
  };

  const char* to_string(ValidationError error);

  // BadIndex / BadPrevLink: the block was built on a head that is no longer current.
  inline bool is_linkage_error(ValidationError error) {
    return error == ValidationError::BadIndex || error == ValidationError::BadPrevLink;
  }

  struct ChainConfig {
    uint32_t difficulty = 3;
    uint64_t genesis_timestamp = 1700000000ULL;
  };

  // Checks `curr` against its predecessor: index step, prev-hash link,
  // recorded hash vs content, and PoW over (prev.proof, curr.proof).
  ValidationResult validate_link(const Block& prev, const Block& curr, uint32_t difficulty);

  ValidationResult validate_genesis(const Block& genesis);

  // First failure in `blocks`, or valid.
  ValidationResult validate_chain(const std::vector<Block>& blocks, uint32_t difficulty);

  // One result per block, in order; each block is judged only on its own
  // content and its link to the recorded hash of its predecessor.
  std::vector<ValidationResult> audit_chain(const std::vector<Block>& blocks, uint32_t difficulty);

  class Chain {
    public:
      explicit Chain(ChainConfig config = {});

      const ChainConfig& config() const { return config_; }
      size_t length() const { return blocks_.size(); }

      const Block& genesis() const { return blocks_.front(); }
      const Block& head() const { return blocks_.back(); }
      const Block* block_at_index(uint64_t index) const;

      ValidationResult validate_block(const Block& block) const;

      ValidationResult append_block(const Block& block);

      Block build_block(std::vector<Transaction> transactions, uint64_t proof, uint64_t timestamp) const;

      // Whole-chain replacement; `blocks` must pass validate_chain.
      ValidationResult replace_blocks(std::vector<Block> blocks);

      // Load blocks from the block store, keeping the longest valid prefix.
      // Falls back to a fresh genesis if the store holds no valid genesis.
      // Returns false when the store held records that were not kept, or
      // nothing at all (the caller should rewrite it).
      bool restore_from_store(landledger::storage::BlockStore& store);

      std::unordered_set<std::string> txids() const;

      const std::vector<Block>& blocks() const { return blocks_; }

    private:
      ChainConfig config_{};
      std::vector<Block> blocks_;
  };
}
