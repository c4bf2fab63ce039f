#pragma once
#include <cstdint>
#include "landledger/core/hash.hpp"

namespace landledger::core::pow {
  // Number of leading '0' characters in the hex rendering of `hash`.
  uint32_t leading_zero_nibbles(const Hash256& hash);

  inline bool meets_difficulty(uint32_t difficulty, const Hash256& hash) {
    return leading_zero_nibbles(hash) >= difficulty;
  }

  // sha256 of the decimal concatenation "{last_proof}{proof}".
  Hash256 proof_hash(uint64_t last_proof, uint64_t proof);

  inline bool valid_proof(uint64_t last_proof, uint64_t proof, uint32_t difficulty) {
    return meets_difficulty(difficulty, proof_hash(last_proof, proof));
  }
}
