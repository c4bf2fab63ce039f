#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include <landledger/core/chain.hpp>
#include <landledger/core/hash.hpp>
#include <landledger/core/miner.hpp>
#include <landledger/core/pow.hpp>
#include <landledger/net/api.hpp>
#include <landledger/net/http_peer_client.hpp>
#include <landledger/net/http_server.hpp>
#include <landledger/node/consensus.hpp>
#include <landledger/node/mempool_sync.hpp>
#include <landledger/node/node.hpp>
#include <landledger/node/sync_scheduler.hpp>
#include <landledger/storage/block_store.hpp>

using namespace landledger;

static void print_usage() {
  std::printf(
    "LandLedger Node\n\n"
    "Usage:\n"
    "  landledger-node [PORT]\n"
    "  landledger-node serve [--port N] [--host H] [--difficulty D] [--data DIR]\n"
    "                        [--peer ADDR]... [--sync-interval SEC] [--peer-timeout MS]\n"
    "                        [--peer-max-bytes N] [--log-level LEVEL]\n"
    "  landledger-node hash-file PATH\n"
    "  landledger-node verify [--port N] [--data DIR] [--difficulty D]\n"
    "  landledger-node pow [--last-proof N] [--difficulty D]\n\n"
    "Options:\n"
    "  --port           Listening port, also names the data files (default: 5000)\n"
    "  --host           Bind address (default: 0.0.0.0)\n"
    "  --difficulty     Leading zero hex digits required of a proof (default: 3)\n"
    "  --data           Data directory (default: data)\n"
    "  --peer           Peer to register at startup, repeatable\n"
    "  --sync-interval  Seconds between background sync cycles, 0 disables (default: 5)\n"
    "  --peer-timeout   Per-request peer timeout in milliseconds (default: 3000)\n"
    "  --peer-max-bytes Largest peer response body accepted (default: 67108864)\n"
    "  --log-level      trace|debug|info|warn|error|off (default: info)\n"
    "  --last-proof     Previous proof for the pow search (default: 0)\n"
  );
}

// Matches "--name value" and "--name=value"; advances `i` past the value.
static bool take_option(int argc, char** argv, int& i, const char* name, std::string& value) {
  std::string arg = argv[i];
  std::string prefix = std::string(name) + "=";
  if (arg.rfind(prefix, 0) == 0) {
    value = arg.substr(prefix.size());
    return true;
  }
  if (arg == name && i + 1 < argc) {
    value = argv[++i];
    return true;
  }
  return false;
}

static uint16_t parse_port(const std::string& text) {
  auto port = std::stoul(text);
  if (port == 0 || port > 65535) throw std::out_of_range("port out of range: " + text);
  return static_cast<uint16_t>(port);
}

static int run_serve(int argc, char** argv, int first) {
  node::NodeConfig config;
  std::string log_level = "info";

  for (int i = first; i < argc; ++i) {
    std::string arg = argv[i];
    std::string value;
    if (take_option(argc, argv, i, "--port", value)) {
      config.port = parse_port(value);
    } else if (take_option(argc, argv, i, "--host", value)) {
      config.host = value;
    } else if (take_option(argc, argv, i, "--difficulty", value)) {
      config.chain.difficulty = static_cast<uint32_t>(std::stoul(value));
    } else if (take_option(argc, argv, i, "--data", value)) {
      config.data_dir = value;
    } else if (take_option(argc, argv, i, "--peer", value)) {
      config.peers.push_back(value);
    } else if (take_option(argc, argv, i, "--sync-interval", value)) {
      config.sync_interval = std::chrono::seconds(std::stoul(value));
    } else if (take_option(argc, argv, i, "--peer-timeout", value)) {
      config.peer_timeout = std::chrono::milliseconds(std::stoul(value));
    } else if (take_option(argc, argv, i, "--peer-max-bytes", value)) {
      config.peer_body_limit = std::stoull(value);
    } else if (take_option(argc, argv, i, "--log-level", value)) {
      log_level = value;
    } else if (arg == "-h" || arg == "--help") {
      print_usage();
      return 0;
    } else {
      std::fprintf(stderr, "Unknown option: %s\n", arg.c_str());
      print_usage();
      return 1;
    }
  }

  spdlog::set_level(spdlog::level::from_str(log_level));

  node::Node ledger_node(config);
  net::HttpPeerClient peer_client({config.peer_timeout, config.peer_body_limit});
  node::ConsensusResolver resolver(ledger_node, peer_client);
  node::MempoolSynchronizer synchronizer(ledger_node, peer_client);
  node::SyncScheduler scheduler(resolver, synchronizer, config.sync_interval);

  net::Api api(ledger_node, resolver);
  net::HttpServer server(api);
  server.listen(config.host, config.port);

  spdlog::info("node ready: difficulty {}, {} block(s), {} peer(s), data in {}", config.chain.difficulty,
               ledger_node.chain_length(), ledger_node.peers().size(), config.data_dir.string());
  if (config.sync_interval.count() > 0) scheduler.start();

  server.serve_forever();
  return 0;
}

static int run_hash_file(int argc, char** argv) {
  if (argc < 3) {
    print_usage();
    return 1;
  }
  std::ifstream in(argv[2], std::ios::binary);
  if (!in) {
    std::fprintf(stderr, "Cannot open %s\n", argv[2]);
    return 1;
  }
  std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  std::cout << core::sha256_hex(contents) << "  " << argv[2] << "\n";
  return 0;
}

static int run_verify(int argc, char** argv) {
  uint16_t port = 5000;
  std::string data_dir = "data";
  core::ChainConfig chain_config;

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    std::string value;
    if (take_option(argc, argv, i, "--port", value)) {
      port = parse_port(value);
    } else if (take_option(argc, argv, i, "--data", value)) {
      data_dir = value;
    } else if (take_option(argc, argv, i, "--difficulty", value)) {
      chain_config.difficulty = static_cast<uint32_t>(std::stoul(value));
    } else if (arg == "-h" || arg == "--help") {
      print_usage();
      return 0;
    } else {
      std::fprintf(stderr, "Unknown option: %s\n", arg.c_str());
      print_usage();
      return 1;
    }
  }

  storage::BlockStore store(data_dir, port);
  if (!std::filesystem::exists(store.log_path())) {
    std::fprintf(stderr, "No chain log at %s\n", store.log_path().string().c_str());
    return 1;
  }

  auto blocks = store.load_all_blocks();
  if (blocks.empty()) {
    std::fprintf(stderr, "No readable blocks in %s\n", store.log_path().string().c_str());
    return 2;
  }

  auto results = core::audit_chain(blocks, chain_config.difficulty);
  size_t failures = 0;
  for (size_t i = 0; i < blocks.size(); ++i) {
    const auto& block = blocks[i];
    const auto& result = results[i];
    std::cout << "block " << block.index << " txs=" << block.transactions.size()
              << " hash=" << block.hash.substr(0, 16) << "... "
              << (result.is_valid ? "OK" : core::to_string(result.error)) << "\n";
    if (!result.is_valid) ++failures;
  }
  std::cout << blocks.size() << " block(s), " << failures << " invalid\n";
  return failures == 0 ? 0 : 3;
}

static int run_pow(int argc, char** argv) {
  uint64_t last_proof = 0;
  uint32_t difficulty = core::ChainConfig{}.difficulty;

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    std::string value;
    if (take_option(argc, argv, i, "--last-proof", value)) {
      last_proof = std::stoull(value);
    } else if (take_option(argc, argv, i, "--difficulty", value)) {
      difficulty = static_cast<uint32_t>(std::stoul(value));
    } else if (arg == "-h" || arg == "--help") {
      print_usage();
      return 0;
    } else {
      std::fprintf(stderr, "Unknown option: %s\n", arg.c_str());
      print_usage();
      return 1;
    }
  }

  auto time_point0 = std::chrono::steady_clock::now();
  auto on_progress = [&](uint64_t attempts, uint32_t leading_zeros, const std::string& hash_hex) {
    auto delta = std::chrono::duration<double>(std::chrono::steady_clock::now() - time_point0).count();
    double rate = attempts / std::max(delta, 1e-9);
    std::cout << "\r[pow] attempts=" << attempts
              << " lz=" << leading_zeros
              << " rate=" << static_cast<int>(rate / 1000.0) << " KH/s"
              << " hash=" << hash_hex.substr(0, 10) << "..."
              << std::flush;
  };

  auto proof = core::proof_of_work(last_proof, difficulty, on_progress, 25'000);
  auto duration = std::chrono::duration<double>(std::chrono::steady_clock::now() - time_point0).count();
  auto digest = core::pow::proof_hash(last_proof, proof);

  std::cout << "\nproof: " << proof << "\n";
  std::cout << "hash:  " << core::to_hex(std::span<const uint8_t>(digest.data(), digest.size())) << "\n";
  std::cout << "found in " << duration << "s\n";
  return 0;
}

int main(int argc, char** argv) {
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");

  try {
    if (argc < 2) return run_serve(argc, argv, 1);

    const std::string command = argv[1];
    if (command == "serve") return run_serve(argc, argv, 2);
    if (command == "hash-file") return run_hash_file(argc, argv);
    if (command == "verify") return run_verify(argc, argv);
    if (command == "pow") return run_pow(argc, argv);
    if (command == "-h" || command == "--help") {
      print_usage();
      return 0;
    }

    // `landledger-node 5001`
    if (!command.empty() && command.find_first_not_of("0123456789") == std::string::npos) {
      std::string port_flag = "--port=" + command;
      std::vector<char*> args(argv, argv + argc);
      args[1] = port_flag.data();
      return run_serve(argc, args.data(), 1);
    }
  } catch (const std::exception& ex) {
    std::fprintf(stderr, "Error: %s\n", ex.what());
    return 1;
  }

  print_usage();
  return 1;
}
