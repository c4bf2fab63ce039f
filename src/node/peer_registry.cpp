#include "landledger/node/peer_registry.hpp"
#include <algorithm>
#include <cctype>

#include <spdlog/spdlog.h>

namespace landledger::node {

  namespace {
    bool is_host_char(char c) {
      return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '.' || c == '_';
    }

    bool is_scheme_char(char c) {
      return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
    }

    std::string trim(const std::string& s) {
      auto first = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
      auto last = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
      return first < last ? std::string(first, last) : std::string();
    }

    [[noreturn]] void reject(const std::string& address, const char* why) {
      throw InvalidAddressError("invalid peer address '" + address + "': " + why);
    }
  }

  std::string normalize_address(const std::string& address) {
    std::string rest = trim(address);
    if (rest.empty()) reject(address, "empty");
    if (std::any_of(rest.begin(), rest.end(), [](unsigned char c) { return std::isspace(c); })) {
      reject(address, "contains whitespace");
    }

    auto scheme_end = rest.find("://");
    if (scheme_end != std::string::npos) {
      auto scheme = rest.substr(0, scheme_end);
      if (scheme.empty() || !std::all_of(scheme.begin(), scheme.end(), is_scheme_char)) {
        reject(address, "bad scheme");
      }
      std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                     [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
      if (scheme != "http" && scheme != "https") reject(address, "peers speak http");
      rest = rest.substr(scheme_end + 3);
    }

    auto authority = rest.substr(0, rest.find_first_of("/?#"));
    auto at = authority.rfind('@');
    if (at != std::string::npos) authority = authority.substr(at + 1);

    std::string host;
    std::string port;
    bool has_port = false;
    if (!authority.empty() && authority.front() == '[') {
      auto close = authority.find(']');
      if (close == std::string::npos) reject(address, "unterminated IPv6 literal");
      host = authority.substr(0, close + 1);
      auto tail = authority.substr(close + 1);
      if (!tail.empty()) {
        if (tail.front() != ':') reject(address, "garbage after IPv6 literal");
        has_port = true;
        port = tail.substr(1);
      }
      if (host.size() <= 2) reject(address, "no host");
    } else {
      auto colon = authority.find(':');
      host = authority.substr(0, colon);
      if (colon != std::string::npos) {
        has_port = true;
        port = authority.substr(colon + 1);
      }
      if (host.empty()) reject(address, "no host");
      if (!std::all_of(host.begin(), host.end(), is_host_char)) reject(address, "bad host");
    }

    std::transform(host.begin(), host.end(), host.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (has_port) {
      if (port.empty()) reject(address, "empty port");
      if (port.size() > 5 || !std::all_of(port.begin(), port.end(), [](unsigned char c) { return std::isdigit(c); })) {
        reject(address, "bad port");
      }
      auto value = std::stoul(port);
      if (value == 0 || value > 65535) reject(address, "port out of range");
      return host + ":" + std::to_string(value);
    }
    return host;
  }

  std::string PeerRegistry::register_peer(const std::string& address) {
    auto canonical = normalize_address(address);
    std::lock_guard<std::mutex> lock(mutex_);
    if (peers_.insert(canonical).second) {
      spdlog::info("registered peer {}", canonical);
    }
    return canonical;
  }

  std::vector<std::string> PeerRegistry::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<std::string>(peers_.begin(), peers_.end());
  }

  size_t PeerRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peers_.size();
  }
}
