#include "landledger/storage/block_store.hpp"
#include "landledger/core/serializer.hpp"
#include <string>

namespace fs = std::filesystem;
using namespace landledger::core;

namespace landledger::storage {

  BlockStore::BlockStore(fs::path root_path, uint16_t port)
    : root_path_(std::move(root_path)),
      log_(root_path_ / ("chain_" + std::to_string(port) + ".log"), RecordKind::Block) {}

  void BlockStore::append_block(const Block& block) {
    auto payload = block.serialize();
    log_.append(std::span<const uint8_t>(payload.data(), payload.size()));
  }

  void BlockStore::rewrite(const std::vector<Block>& blocks) {
    std::vector<std::vector<uint8_t>> payloads;
    payloads.reserve(blocks.size());
    for (const auto& block : blocks) payloads.push_back(block.serialize());
    log_.rewrite(payloads);
  }

  std::vector<Block> BlockStore::load_all_blocks() {
    std::vector<Block> out;
    for (const auto& payload : log_.read_all()) {
      try {
        out.push_back(Block::deserialize(std::span<const uint8_t>(payload.data(), payload.size())));
      } catch (const SerializeError&) {
        break;
      }
    }
    return out;
  }
}
