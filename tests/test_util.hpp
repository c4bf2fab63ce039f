#pragma once
#include <chrono>
#include <filesystem>
#include <functional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "landledger/core/chain.hpp"
#include "landledger/core/miner.hpp"
#include "landledger/node/node.hpp"

namespace landledger::test {

  inline std::filesystem::path tmpdir(const std::string& name) {
    auto p = std::filesystem::temp_directory_path() / ("landledger_" + name);
    std::filesystem::remove_all(p);
    std::filesystem::create_directories(p);
    return p;
  }

  inline core::Transaction certificate(const std::string& tag, const std::string& luas = "100") {
    return core::make_transaction({"Pemilik " + tag, "SHM-" + tag, "Kel. " + tag, luas, std::nullopt},
                                  1700000100ULL);
  }

  // Mines `count` single-transaction blocks on top of `chain`.
  inline void grow(core::Chain& chain, size_t count, const std::string& tag) {
    for (size_t i = 0; i < count; ++i) {
      auto proof = core::proof_of_work(chain.head().proof, chain.config().difficulty);
      auto block = chain.build_block({certificate(tag + std::to_string(i))}, proof, chain.head().timestamp + 60);
      auto result = chain.append_block(block);
      if (!result.is_valid) throw std::runtime_error(std::string("grow: ") + core::to_string(result.error));
    }
  }

  // Fresh node in its own data directory, difficulty 2.
  inline node::NodeConfig node_config(const std::string& name, uint16_t port = 5000) {
    node::NodeConfig config;
    config.port = port;
    config.data_dir = tmpdir(name);
    config.chain.difficulty = 2;
    return config;
  }

  inline bool wait_until(const std::function<bool()>& condition,
                         std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
      if (condition()) return true;
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return condition();
  }
}
