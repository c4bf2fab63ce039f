#include "landledger/core/pow.hpp"
#include <string>

namespace landledger::core::pow {

  uint32_t leading_zero_nibbles(const Hash256& hash) {
    uint32_t z = 0;
    for (size_t i = 0; i < hash.size(); ++i) {
      if (hash[i] == 0) { z += 2; continue; }
      if ((hash[i] & 0xF0) == 0) z += 1;
      break;
    }
    return z;
  }

  Hash256 proof_hash(uint64_t last_proof, uint64_t proof) {
    return sha256(std::to_string(last_proof) + std::to_string(proof));
  }
}
