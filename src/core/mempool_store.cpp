#include "landledger/storage/mempool_store.hpp"
#include "landledger/core/serializer.hpp"
#include <string>

namespace fs = std::filesystem;
using namespace landledger::core;

namespace landledger::storage {

  MempoolStore::MempoolStore(fs::path root_path, uint16_t port)
    : log_(root_path / ("mempool_" + std::to_string(port) + ".log"), RecordKind::Transaction) {}

  void MempoolStore::save(const std::vector<Transaction>& transactions) {
    std::vector<std::vector<uint8_t>> payloads;
    payloads.reserve(transactions.size());
    for (const auto& tx : transactions) payloads.push_back(tx.serialize());
    log_.rewrite(payloads);
  }

  std::vector<Transaction> MempoolStore::load() {
    std::vector<Transaction> out;
    for (const auto& payload : log_.read_all()) {
      try {
        out.push_back(Transaction::deserialize(std::span<const uint8_t>(payload.data(), payload.size())));
      } catch (const SerializeError&) {
        break;
      }
    }
    return out;
  }
}
