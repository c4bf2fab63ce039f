#pragma once
#include <cstddef>

#include "landledger/net/peer_client.hpp"
#include "landledger/node/node.hpp"

namespace landledger::node {

  // Pulls every peer's pending pool into ours; unreachable peers are skipped.
  class MempoolSynchronizer {
    public:
      MempoolSynchronizer(Node& node, net::PeerClient& client);

      // Number of transactions added to the local pool.
      size_t synchronize();

    private:
      Node& node_;
      net::PeerClient& client_;
  };
}
