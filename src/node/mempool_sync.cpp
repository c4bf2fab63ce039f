#include "landledger/node/mempool_sync.hpp"
#include "landledger/net/json_codec.hpp"

#include <spdlog/spdlog.h>

namespace landledger::node {

  MempoolSynchronizer::MempoolSynchronizer(Node& node, net::PeerClient& client)
    : node_(node), client_(client) {}

  size_t MempoolSynchronizer::synchronize() {
    size_t added = 0;
    for (const auto& peer : node_.peers().list()) {
      std::vector<core::Transaction> remote;
      try {
        remote = client_.fetch_mempool(peer);
      } catch (const net::PeerError& e) {
        spdlog::warn("skipping peer {}: {}", peer, e.what());
        continue;
      } catch (const net::CodecError& e) {
        spdlog::warn("skipping peer {}: bad mempool body: {}", peer, e.what());
        continue;
      }

      auto merged = node_.merge_mempool(remote);
      if (merged) spdlog::info("merged {} transaction(s) from {}", merged, peer);
      added += merged;
    }
    return added;
  }
}
