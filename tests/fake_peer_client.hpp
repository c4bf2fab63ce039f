#pragma once
#include <atomic>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "landledger/net/peer_client.hpp"

namespace landledger::test {

  // In-memory peers keyed by canonical address; anything unknown is unreachable.
  class FakePeerClient : public net::PeerClient {
    public:
      std::map<std::string, std::vector<core::Block>> chains;
      std::map<std::string, std::vector<core::Transaction>> mempools;
      std::set<std::string> unreachable;
      std::atomic<int> chain_calls{0};
      std::atomic<int> mempool_calls{0};

      std::vector<core::Block> fetch_chain(const std::string& peer) override {
        ++chain_calls;
        if (unreachable.count(peer)) throw net::PeerError("connection refused: " + peer);
        auto it = chains.find(peer);
        if (it == chains.end()) throw net::PeerError("no chain at " + peer);
        return it->second;
      }

      std::vector<core::Transaction> fetch_mempool(const std::string& peer) override {
        ++mempool_calls;
        if (unreachable.count(peer)) throw net::PeerError("connection refused: " + peer);
        auto it = mempools.find(peer);
        if (it == mempools.end()) throw net::PeerError("no mempool at " + peer);
        return it->second;
      }
  };
}
