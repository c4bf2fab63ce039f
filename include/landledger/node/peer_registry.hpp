#pragma once
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace landledger::node {

  struct InvalidAddressError : std::runtime_error {
    using std::runtime_error::runtime_error;
  };

  /**
   * Canonical "host:port" form of a peer address. Accepts "http://host:port/...",
   * "host:port" and "host". Throws InvalidAddressError when no host can be found
   * or the port is not a number in 1..65535.
   */
  std::string normalize_address(const std::string& address);

  class PeerRegistry {
    public:
      // Returns the canonical entry; registering an existing peer is a no-op.
      std::string register_peer(const std::string& address);

      std::vector<std::string> list() const;

      size_t size() const;

    private:
      mutable std::mutex mutex_;
      std::set<std::string> peers_;
  };
}
