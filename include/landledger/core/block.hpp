#pragma once
#include <cstdint>
#include <vector>
#include <span>
#include <string>
#include "landledger/core/hash.hpp"
#include "landledger/core/transaction.hpp"

namespace landledger::core {
  inline constexpr const char* GENESIS_PREV_HASH = "0";
  inline constexpr uint64_t GENESIS_INDEX = 1;

  struct Block {
    uint64_t index = 0;
    uint64_t timestamp = 0;
    std::vector<Transaction> transactions;
    uint64_t proof = 0;
    std::string previous_hash;
    // Recorded digest; only trusted after compute_hash() agrees with it.
    std::string hash;

    // Canonical content: index, timestamp, txs, previous_hash, proof.
    std::vector<uint8_t> serialize_content() const;

    std::string compute_hash() const;

    void seal() { hash = compute_hash(); }

    // Serialize block as: content bytes + recorded hash (durable log format)
    std::vector<uint8_t> serialize() const;
    static Block deserialize(std::span<const uint8_t> bytes);

    bool operator==(const Block&) const = default;
  };

  // ------- Utilities -------
  Block make_genesis_block(uint64_t unix_time);

  Block make_block(uint64_t index, uint64_t timestamp, std::vector<Transaction> transactions,
                   uint64_t proof, std::string previous_hash);
}
