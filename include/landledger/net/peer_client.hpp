#pragma once
#include <stdexcept>
#include <string>
#include <vector>

#include "landledger/core/block.hpp"
#include "landledger/core/transaction.hpp"

namespace landledger::net {

  // Peer unreachable, timed out, or answered with a non-200 status.
  struct PeerError : std::runtime_error {
    using std::runtime_error::runtime_error;
  };

  /**
   * Fetches replicated state from another node. Implementations bound every
   * call by a timeout and throw PeerError (transport) or CodecError (body).
   * Called without any node lock held.
   */
  class PeerClient {
    public:
      virtual ~PeerClient() = default;

      virtual std::vector<core::Block> fetch_chain(const std::string& peer) = 0;

      virtual std::vector<core::Transaction> fetch_mempool(const std::string& peer) = 0;
  };
}
