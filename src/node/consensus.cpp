#include "landledger/node/consensus.hpp"
#include "landledger/net/json_codec.hpp"

#include <optional>

#include <spdlog/spdlog.h>

using namespace landledger::core;

namespace landledger::node {

  ConsensusResolver::ConsensusResolver(Node& node, net::PeerClient& client)
    : node_(node), client_(client) {}

  bool ConsensusResolver::resolve() {
    auto peers = node_.peers().list();
    auto max_length = node_.chain_length();

    std::optional<std::vector<Block>> best;
    std::string best_peer;

    for (const auto& peer : peers) {
      std::vector<Block> candidate;
      try {
        candidate = client_.fetch_chain(peer);
      } catch (const net::PeerError& e) {
        spdlog::warn("skipping peer {}: {}", peer, e.what());
        continue;
      } catch (const net::CodecError& e) {
        spdlog::warn("skipping peer {}: bad chain body: {}", peer, e.what());
        continue;
      }

      if (candidate.size() <= max_length) {
        spdlog::debug("peer {} chain length {} not longer than {}", peer, candidate.size(), max_length);
        continue;
      }

      auto validation_result = validate_chain(candidate, node_.difficulty());
      if (!validation_result.is_valid) {
        spdlog::warn("peer {} chain invalid at block {}: {}", peer, validation_result.block_index,
                     to_string(validation_result.error));
        continue;
      }

      max_length = candidate.size();
      best = std::move(candidate);
      best_peer = peer;
    }

    if (!best) return false;

    spdlog::info("peer {} has longer valid chain ({} blocks)", best_peer, max_length);
    return node_.adopt_chain(std::move(*best));
  }
}
