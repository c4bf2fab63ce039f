#include "landledger/net/json_codec.hpp"

using json = nlohmann::json;
using namespace landledger::core;

namespace landledger::net {

  namespace {
    template <typename T>
    T field(const json& j, const char* key) {
      try {
        return j.at(key).get<T>();
      } catch (const json::exception& e) {
        throw CodecError(std::string("field '") + key + "': " + e.what());
      }
    }

    void expect_object(const json& j, const char* what) {
      if (!j.is_object()) throw CodecError(std::string(what) + " must be a JSON object");
    }

    // Accepts strings and plain numbers ("luas": 100 and "luas": "100").
    std::string text_field(const json& j, const char* key) {
      auto found = j.find(key);
      if (found == j.end() || found->is_null()) return {};
      if (found->is_string()) return found->get<std::string>();
      if (found->is_number()) return found->dump();
      throw CodecError(std::string("field '") + key + "' must be a string");
    }
  }

  json transaction_to_json(const Transaction& tx) {
    json j;
    j["txid"] = tx.txid;
    j["nama"] = tx.nama;
    j["nomor_sertifikat"] = tx.nomor_sertifikat;
    j["lokasi"] = tx.lokasi;
    j["luas"] = tx.luas;
    j["file_hash"] = tx.file_hash ? json(*tx.file_hash) : json(nullptr);
    j["timestamp"] = tx.timestamp;
    return j;
  }

  Transaction transaction_from_json(const json& j) {
    expect_object(j, "transaction");
    Transaction tx;
    tx.txid = field<std::string>(j, "txid");
    tx.nama = field<std::string>(j, "nama");
    tx.nomor_sertifikat = field<std::string>(j, "nomor_sertifikat");
    tx.lokasi = field<std::string>(j, "lokasi");
    tx.luas = field<std::string>(j, "luas");
    auto file_hash = j.find("file_hash");
    if (file_hash != j.end() && !file_hash->is_null()) {
      if (!file_hash->is_string()) throw CodecError("field 'file_hash' must be a string or null");
      tx.file_hash = file_hash->get<std::string>();
    }
    tx.timestamp = field<uint64_t>(j, "timestamp");
    if (tx.txid.empty()) throw CodecError("field 'txid' must not be empty");
    return tx;
  }

  json block_to_json(const Block& block) {
    json transactions = json::array();
    for (const auto& tx : block.transactions) transactions.push_back(transaction_to_json(tx));

    json j;
    j["index"] = block.index;
    j["timestamp"] = block.timestamp;
    j["transactions"] = std::move(transactions);
    j["proof"] = block.proof;
    j["previous_hash"] = block.previous_hash;
    j["hash"] = block.hash;
    return j;
  }

  Block block_from_json(const json& j) {
    expect_object(j, "block");
    Block block;
    block.index = field<uint64_t>(j, "index");
    block.timestamp = field<uint64_t>(j, "timestamp");
    block.proof = field<uint64_t>(j, "proof");
    block.previous_hash = field<std::string>(j, "previous_hash");
    block.hash = field<std::string>(j, "hash");

    auto transactions = j.find("transactions");
    if (transactions == j.end() || !transactions->is_array()) throw CodecError("field 'transactions' must be an array");
    block.transactions.reserve(transactions->size());
    for (const auto& tx : *transactions) block.transactions.push_back(transaction_from_json(tx));
    return block;
  }

  json chain_to_json(const std::vector<Block>& blocks) {
    json chain = json::array();
    for (const auto& block : blocks) chain.push_back(block_to_json(block));
    return json{{"chain", std::move(chain)}, {"length", blocks.size()}};
  }

  std::vector<Block> chain_from_json(const json& j) {
    expect_object(j, "chain response");
    auto length = field<uint64_t>(j, "length");
    auto chain = j.find("chain");
    if (chain == j.end() || !chain->is_array()) throw CodecError("field 'chain' must be an array");

    std::vector<Block> blocks;
    blocks.reserve(chain->size());
    for (const auto& block : *chain) blocks.push_back(block_from_json(block));
    if (blocks.size() != length) {
      throw CodecError("reported length " + std::to_string(length) + " but carried " +
                       std::to_string(blocks.size()) + " block(s)");
    }
    return blocks;
  }

  json mempool_to_json(const std::vector<Transaction>& transactions) {
    json out = json::array();
    for (const auto& tx : transactions) out.push_back(transaction_to_json(tx));
    return out;
  }

  std::vector<Transaction> mempool_from_json(const json& j) {
    if (!j.is_array()) throw CodecError("mempool must be a JSON array");
    std::vector<Transaction> out;
    out.reserve(j.size());
    for (const auto& tx : j) out.push_back(transaction_from_json(tx));
    return out;
  }

  CertificateFields certificate_fields_from_json(const json& j) {
    expect_object(j, "transaction request");
    CertificateFields fields;
    fields.nama = text_field(j, "nama");
    fields.nomor_sertifikat = text_field(j, "nomor_sertifikat");
    fields.lokasi = text_field(j, "lokasi");
    fields.luas = text_field(j, "luas");
    auto file_hash = text_field(j, "file_hash");
    if (!file_hash.empty()) fields.file_hash = std::move(file_hash);
    return fields;
  }

  json parse_json(const std::string& body) {
    try {
      return json::parse(body);
    } catch (const json::parse_error& e) {
      throw CodecError(std::string("malformed JSON: ") + e.what());
    }
  }
}
