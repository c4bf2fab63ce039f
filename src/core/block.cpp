#include "landledger/core/block.hpp"
#include "landledger/core/serializer.hpp"
#include "landledger/core/hash.hpp"
#include <algorithm>

namespace landledger::core {

  std::vector<uint8_t> Block::serialize_content() const {
    ByteWriter writer;
    writer.write_u64(index);
    writer.write_u64(timestamp);

    writer.write_u32(static_cast<uint32_t>(transactions.size()));
    for (const auto& tx : transactions) {
      auto tx_bytes = tx.serialize();
      writer.write_bytes(std::span<const uint8_t>(tx_bytes.data(), tx_bytes.size()));
    }

    writer.write_string(previous_hash);
    writer.write_u64(proof);
    return writer.take();
  }

  std::string Block::compute_hash() const {
    auto content = serialize_content();
    auto digest = sha256(std::span<const uint8_t>(content.data(), content.size()));
    return to_hex(std::span<const uint8_t>(digest.data(), digest.size()));
  }

  std::vector<uint8_t> Block::serialize() const {
    ByteWriter writer;
    auto content = serialize_content();
    writer.write_bytes(std::span<const uint8_t>(content.data(), content.size()));
    writer.write_string(hash);
    return writer.take();
  }

  Block Block::deserialize(std::span<const uint8_t> bytes) {
    ByteReader outer(bytes);
    auto content = outer.read_bytes();
    Block block;
    block.hash = outer.read_string();
    outer.expect_end();

    ByteReader reader(std::span<const uint8_t>(content.data(), content.size()));
    block.index = reader.read_u64();
    block.timestamp = reader.read_u64();
    auto num_txs = reader.read_u32();
    block.transactions.reserve(std::min<size_t>(num_txs, reader.remaining_bytes() / sizeof(uint32_t)));
    for (uint32_t i = 0; i < num_txs; ++i) {
      auto tx_bytes = reader.read_bytes();
      block.transactions.push_back(Transaction::deserialize(std::span<const uint8_t>(tx_bytes.data(), tx_bytes.size())));
    }
    block.previous_hash = reader.read_string();
    block.proof = reader.read_u64();
    reader.expect_end();
    return block;
  }

  Block make_block(uint64_t index, uint64_t timestamp, std::vector<Transaction> transactions,
                   uint64_t proof, std::string previous_hash) {
    Block block;
    block.index = index;
    block.timestamp = timestamp;
    block.transactions = std::move(transactions);
    block.proof = proof;
    block.previous_hash = std::move(previous_hash);
    block.seal();
    return block;
  }

  Block make_genesis_block(uint64_t unix_time) {
    return make_block(GENESIS_INDEX, unix_time, {}, 0, GENESIS_PREV_HASH);
  }
}
