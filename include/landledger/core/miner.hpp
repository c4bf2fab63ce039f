#pragma once
#include <cstdint>
#include <functional>
#include <string>

namespace landledger::core {
  using MinerProgressCallback = std::function<void(uint64_t, uint32_t, const std::string&)>;

// Brute-force search for the smallest proof p such that
// sha256("{last_proof}{p}") starts with `difficulty` zero hex digits.
// Blocks the calling thread until found; there is no cancellation. Callers
// that need to give up must run it on a worker and discard the result.
  uint64_t proof_of_work(uint64_t last_proof, uint32_t difficulty,
                         MinerProgressCallback on_progress = nullptr, uint64_t tick_every = 100000);
}
