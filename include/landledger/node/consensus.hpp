#pragma once
#include <string>

#include "landledger/net/peer_client.hpp"
#include "landledger/node/node.hpp"

namespace landledger::node {

  /**
   * Longest valid chain rule. Every registered peer is asked for its chain;
   * unreachable peers and undecodable bodies are skipped. The first validated
   * candidate strictly longer than everything seen so far (local chain
   * included) is handed to Node::adopt_chain, which re-checks the length
   * under the node lock.
   */
  class ConsensusResolver {
    public:
      ConsensusResolver(Node& node, net::PeerClient& client);

      // True when the local chain was replaced.
      bool resolve();

    private:
      Node& node_;
      net::PeerClient& client_;
  };
}
