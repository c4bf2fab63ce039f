#include "landledger/core/miner.hpp"
#include "landledger/core/pow.hpp"
#include "landledger/core/hash.hpp"
#include <span>

namespace landledger::core {

  uint64_t proof_of_work(uint64_t last_proof, uint32_t difficulty,
                         MinerProgressCallback on_progress, uint64_t tick_every) {
    uint64_t attempts = 0;
    for (uint64_t proof = 0; ; ++proof) {
      auto hash = pow::proof_hash(last_proof, proof);
      auto leading_zeros = pow::leading_zero_nibbles(hash);

      if (leading_zeros >= difficulty) {
        return proof;
      }

      if (on_progress && tick_every > 0 && (++attempts % tick_every == 0)) {
        on_progress(attempts, leading_zeros, to_hex(std::span<const uint8_t>(hash.data(), hash.size())));
      }
    }
  }
}
