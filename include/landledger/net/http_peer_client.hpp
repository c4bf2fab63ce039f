#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <utility>

#include "landledger/net/peer_client.hpp"

namespace landledger::net {

  // Splits "host:port" / "[v6]:port" / "host" (port 80).
  std::pair<std::string, std::string> split_host_port(const std::string& peer);

  // PeerClient over plain HTTP/1.1 (Boost.Beast), one connection per call.
  class HttpPeerClient : public PeerClient {
    public:
      struct Options {
        std::chrono::milliseconds timeout{3000};
        // Largest response body accepted; a whole peer chain must fit.
        std::uint64_t body_limit = 64ULL * 1024 * 1024;
      };

      HttpPeerClient();
      explicit HttpPeerClient(Options options);

      std::vector<core::Block> fetch_chain(const std::string& peer) override;
      std::vector<core::Transaction> fetch_mempool(const std::string& peer) override;

      // GET `target` from `peer`; returns the body of a 200 response.
      std::string get(const std::string& peer, const std::string& target);

    private:
      Options options_;
  };
}
